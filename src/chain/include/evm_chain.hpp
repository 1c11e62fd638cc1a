#pragma once

#include <cstdint>
#include <string>

#include <asio.hpp>
#include <nlohmann/json_fwd.hpp>

#include "chain_interface.hpp"
#include "rpc.hpp"

namespace txgate::chain
{
    struct EvmChainConfig
    {
        std::string chain = "ethereum";
        std::string network = "mainnet";
        std::uint64_t chain_id = 1;
        std::string rpc_url;

        // eth_maxPriorityFeePerGas is not served by every node
        bool query_priority_fee = true;
    };

    class EvmChain final : public IChain
    {
    public:
        /**
         * @param blocking_executor executor the blocking RPC transport runs on
         * @param rpc_call transport override, curl when empty
         */
        EvmChain(EvmChainConfig cfg, asio::any_io_executor blocking_executor, RpcCall rpc_call = {});

        const EvmChainConfig & config() const noexcept;

        const std::string & chainName() const noexcept override;

        const std::string & network() const noexcept override;

        std::uint64_t chainId() const noexcept override;

        asio::awaitable<Result<std::uint64_t>> reportedNonce(const std::string & address) override;

        asio::awaitable<Result<std::uint64_t>> confirmedNonce(const std::string & address) override;

        asio::awaitable<Result<std::string>> submitRaw(const std::string & signed_tx) override;

        asio::awaitable<Result<FeeEstimate>> feeEstimate() override;

        asio::awaitable<Result<TxStatusReport>> txStatus(const std::string & tx_hash) override;

    private:
        asio::awaitable<Result<nlohmann::json>> rpc(std::string method, nlohmann::json params);

        EvmChainConfig _cfg;
        asio::any_io_executor _blocking_executor;
        RpcCall _rpc_call;
    };
}
