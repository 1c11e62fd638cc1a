#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "error.hpp"
#include "evm_chain.hpp"
#include "gas_price_oracle.hpp"
#include "pending_store.hpp"
#include "nonce_manager.hpp"
#include "confirmation_watcher.hpp"

namespace txgate::config
{
    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;
        std::filesystem::path storage_path;
        std::filesystem::path config_path;
    };

    struct WatcherSettings
    {
        bool enabled = false;
        std::string host = "127.0.0.1";
        std::uint16_t port = 8900;
        txgate::watcher::WatcherConfig protocol;
    };

    struct ChainSettings
    {
        txgate::chain::EvmChainConfig evm;
        txgate::gas::FeePolicy fee_policy;
    };

    struct GatewayConfig
    {
        txgate::nonce::NonceConfig nonce;
        txgate::pending::PendingConfig pending;
        std::chrono::milliseconds purge_interval{std::chrono::minutes(10)};
        txgate::gas::OracleConfig gas;
        WatcherSettings watcher;
        std::vector<ChainSettings> chains;

        std::size_t rpc_threads = 4;
    };

    /**
     * @brief Reads the gateway tunables. Missing keys keep their defaults, wrong types are INVALID_CONFIG.
     */
    Result<GatewayConfig> parseGatewayConfig(const nlohmann::json & document);

    Result<GatewayConfig> loadGatewayConfig(const std::filesystem::path & path);
}
