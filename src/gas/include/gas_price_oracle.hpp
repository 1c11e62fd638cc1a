#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <asio.hpp>
#include <absl/container/flat_hash_map.h>

#include "error.hpp"
#include "utils.hpp"
#include "chain_interface.hpp"

namespace txgate::gas
{
    using FeeSource = std::function<asio::awaitable<Result<chain::FeeEstimate>>()>;

    /**
     * @brief Chain specific adjustment applied to a fetched fee before caching.
     *
     * Networks known to under-report fees get a multiplier and/or a minimum.
     */
    struct FeePolicy
    {
        bool include_priority_fee = true;
        double min_fee = 0.0;
        double multiplier = 1.0;
    };

    struct GasPriceCache
    {
        double value = 0.0;
        std::chrono::system_clock::time_point fetched_at{};
        std::chrono::milliseconds ttl{0};

        // set when the last refresh failed and this value was served as fallback
        bool stale = false;
    };

    struct OracleConfig
    {
        std::chrono::milliseconds ttl{10'000};
        std::chrono::milliseconds refresh_interval{0};
    };

    double applyPolicy(const chain::FeeEstimate & estimate, const FeePolicy & policy);

    class GasPriceOracle
    {
        public:
            GasPriceOracle(asio::io_context & io_context, OracleConfig cfg, utils::Clock clock = utils::systemClock());

            GasPriceOracle(const GasPriceOracle&) = delete;
            GasPriceOracle& operator=(const GasPriceOracle&) = delete;

            ~GasPriceOracle() = default;

            const OracleConfig & config() const noexcept;

            asio::awaitable<void> registerSource(std::string chain, std::string network, FeeSource source, FeePolicy policy = {});

            /**
             * @brief Cached fee for (chain, network), refreshed when older than the TTL.
             */
            asio::awaitable<Result<double>> current(const std::string & chain, const std::string & network);

            /**
             * @brief Forces a fetch.
             *
             * On failure the previous value is returned and marked stale. Only a failure
             * with no previous successful fetch is propagated.
             */
            asio::awaitable<Result<double>> refresh(const std::string & chain, const std::string & network);

            asio::awaitable<std::optional<GasPriceCache>> snapshot(const std::string & chain, const std::string & network) const;

            /**
             * @brief Refreshes every registered source each `refresh_interval` until stop().
             */
            asio::awaitable<void> runRefreshLoop();

            void stop();

        private:
            using Key = std::pair<std::string, std::string>;

            struct Entry
            {
                FeeSource source;
                FeePolicy policy;
                std::optional<GasPriceCache> cache;
            };

            asio::strand<asio::io_context::executor_type> _strand;
            OracleConfig _cfg;
            utils::Clock _clock;

            absl::flat_hash_map<Key, Entry> _entries;

            asio::steady_timer _refresh_timer;
            bool _stopped = false;
    };
}
