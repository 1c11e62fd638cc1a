#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>
#include <absl/container/flat_hash_map.h>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/spdlog.h>

#include "error.hpp"
#include "utils.hpp"
#include "async_mutex.hpp"
#include "storage.hpp"

namespace txgate::nonce
{
    struct NonceRecord
    {
        std::string address;
        std::string chain;

        // -1 until the first nonce is committed for the address
        std::int64_t last_allocated = -1;
        std::chrono::system_clock::time_point synced_at{};
    };

    nlohmann::json toJson(const NonceRecord & record);

    Result<NonceRecord> nonceRecordFromJson(const nlohmann::json & value);

    struct NonceConfig
    {
        // remote count is trusted for this long; 0 queries the node on every allocation
        std::chrono::milliseconds sync_ttl{0};
    };

    /**
     * @brief Number of transactions the remote node reports for an address, pending included.
     */
    using NonceFetcher = std::function<asio::awaitable<Result<std::uint64_t>>(const std::string & address)>;

    std::uint64_t nextCandidate(std::int64_t last_allocated, std::optional<std::uint64_t> remote_count) noexcept;

    /**
     * @brief Whether a failed action still consumes its nonce.
     *
     * A failure that may have reached the node, or a node that already knows the nonce,
     * commits it. Only failures known to happen before submission leave it free.
     */
    bool commitsNonce(const GatewayError & error) noexcept;

    class NonceManager
    {
        public:
            static constexpr const char * STORE_NAMESPACE = "nonce";

            template<class T>
            using Action = std::function<asio::awaitable<Result<T>>(std::uint64_t nonce)>;

            NonceManager(asio::io_context & io_context, std::string chain, storage::IKeyValueStore & store,
                         NonceFetcher fetcher, NonceConfig cfg = {}, utils::Clock clock = utils::systemClock());

            NonceManager(const NonceManager&) = delete;
            NonceManager& operator=(const NonceManager&) = delete;

            ~NonceManager() = default;

            const std::string & chain() const noexcept;

            bool ready() const noexcept;

            /**
             * @brief Loads persisted records and reconciles each one against the node.
             *
             * Any remote failure leaves the manager not ready and is returned as REMOTE_UNAVAILABLE.
             */
            asio::awaitable<Result<void>> init();

            /**
             * @brief Runs `action` with a nonce.
             *
             * With `explicit_nonce` the action runs directly with it and no state is touched.
             * Otherwise the call queues on the address critical section, picks
             * `max(last_allocated + 1, remote_count)` and commits it according to commitsNonce().
             */
            template<class T>
            asio::awaitable<Result<T>> provide(std::optional<std::uint64_t> explicit_nonce, const std::string & address, Action<T> action)
            {
                if(explicit_nonce)
                {
                    spdlog::debug("[{}] {} uses explicit nonce {}", _chain, address, *explicit_nonce);
                    co_return co_await action(*explicit_nonce);
                }

                const auto candidate = co_await _enter(address);
                if(!candidate)
                {
                    co_return std::unexpected(candidate.error());
                }

                std::optional<Result<T>> res;
                std::exception_ptr exception;
                try
                {
                    res.emplace(co_await action(*candidate));
                }
                catch(...)
                {
                    exception = std::current_exception();
                }

                if(exception)
                {
                    co_await _leave(address, *candidate, true);
                    std::rethrow_exception(exception);
                }

                if(!res->has_value())
                {
                    const GatewayError & error = res->error();
                    if(error.kind == GatewayError::Kind::NONCE_CONFLICT)
                    {
                        spdlog::error("[{}] nonce {} of {} conflicts with the node: {}", _chain, *candidate, address, error.message);
                    }
                    co_await _leave(address, *candidate, commitsNonce(error));
                }
                else
                {
                    co_await _leave(address, *candidate, true);
                }

                co_return std::move(*res);
            }

            asio::awaitable<Result<std::uint64_t>> allocate(const std::string & address);

            asio::awaitable<std::optional<std::int64_t>> lastAllocated(const std::string & address) const;

        private:
            static std::string _storeKey(const std::string & chain, const std::string & address);

            utils::AsyncMutex & _mutexFor(const std::string & address);

            NonceRecord & _recordFor(const std::string & address);

            Result<void> _persist(const NonceRecord & record);

            asio::awaitable<Result<void>> _reconcile(const std::string & address);

            asio::awaitable<Result<std::uint64_t>> _enter(const std::string & address);

            asio::awaitable<void> _leave(const std::string & address, std::uint64_t candidate, bool commit);

            asio::strand<asio::io_context::executor_type> _strand;
            std::string _chain;
            storage::IKeyValueStore & _store;
            NonceFetcher _fetcher;
            NonceConfig _cfg;
            utils::Clock _clock;

            std::atomic<bool> _ready = false;
            bool _loaded = false;

            absl::flat_hash_map<std::string, NonceRecord> _records;
            absl::flat_hash_map<std::string, std::unique_ptr<utils::AsyncMutex>> _mutexes;
    };
}
