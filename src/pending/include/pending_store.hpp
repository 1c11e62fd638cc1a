#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <asio.hpp>
#include <absl/container/flat_hash_map.h>
#include <nlohmann/json_fwd.hpp>

#include "error.hpp"
#include "utils.hpp"
#include "storage.hpp"

namespace txgate::pending
{
    enum class TxStatus : std::uint8_t
    {
        PENDING = 0,
        MEMPOOL_LIKELY_SUCCEED,
        MEMPOOL_LIKELY_FAIL,
        MEMPOOL_UNKNOWN,
        CONFIRMED,
        FAILED
    };

    bool isTerminal(TxStatus status) noexcept;

    std::string toString(TxStatus status);

    std::optional<TxStatus> txStatusFromString(const std::string & value);

    struct PendingTransaction
    {
        std::string tx_hash;
        std::string chain;
        std::uint64_t chain_id = 0;
        std::string address;
        std::uint64_t nonce = 0;
        std::chrono::system_clock::time_point submitted_at{};
        double fee_at_submission = 0.0;
        TxStatus status = TxStatus::PENDING;
    };

    nlohmann::json toJson(const PendingTransaction & tx);

    Result<PendingTransaction> pendingTransactionFromJson(const nlohmann::json & value);

    struct PendingConfig
    {
        std::chrono::milliseconds duration_limit{std::chrono::minutes(3)};
        std::chrono::milliseconds retention{std::chrono::hours(24)};
    };

    /**
     * @brief Likely outcome of a transaction still sitting in the mempool.
     *
     * Fails only when it waited longer than `duration_limit` AND the prevailing fee is
     * now above what it offered. Either condition alone is inconclusive.
     */
    TxStatus classifyMempoolTx(std::chrono::milliseconds elapsed, std::chrono::milliseconds duration_limit,
                               double fee_at_submission, double current_fee) noexcept;

    class PendingTransactionStore
    {
        public:
            static constexpr const char * STORE_NAMESPACE = "pending";

            PendingTransactionStore(asio::io_context & io_context, storage::IKeyValueStore & store, PendingConfig cfg,
                                    utils::Clock clock = utils::systemClock());

            PendingTransactionStore(const PendingTransactionStore&) = delete;
            PendingTransactionStore& operator=(const PendingTransactionStore&) = delete;

            ~PendingTransactionStore() = default;

            const PendingConfig & config() const noexcept;

            /**
             * @brief Reloads entries persisted by a previous run. Corrupted entries are skipped.
             */
            asio::awaitable<Result<std::size_t>> load();

            asio::awaitable<Result<void>> record(PendingTransaction tx);

            asio::awaitable<std::optional<PendingTransaction>> get(const std::string & chain, const std::string & tx_hash) const;

            asio::awaitable<std::optional<PendingTransaction>> findByNonce(const std::string & chain, std::uint64_t chain_id,
                const std::string & address, std::uint64_t nonce) const;

            asio::awaitable<std::vector<PendingTransaction>> list(const std::string & chain) const;

            TxStatus classify(const PendingTransaction & tx, double current_fee) const;

            /**
             * @brief Stores a new status. Terminal statuses evict the entry.
             */
            asio::awaitable<Result<void>> updateStatus(const std::string & chain, const std::string & tx_hash, TxStatus status);

            asio::awaitable<Result<void>> evict(const std::string & chain, const std::string & tx_hash);

            asio::awaitable<std::size_t> purgeExpired();

        private:
            using Key = std::pair<std::string, std::string>;

            static std::string _storeKey(const std::string & chain, const std::string & tx_hash);

            Result<void> _evictLocked(const Key & key);

            asio::strand<asio::io_context::executor_type> _strand;
            storage::IKeyValueStore & _store;
            PendingConfig _cfg;
            utils::Clock _clock;

            absl::flat_hash_map<Key, PendingTransaction> _transactions;
    };
}

template <>
struct std::formatter<txgate::pending::TxStatus> : std::formatter<std::string>
{
    auto format(const txgate::pending::TxStatus & status, format_context & ctx) const
    {
        return formatter<string>::format(txgate::pending::toString(status), ctx);
    }
};
