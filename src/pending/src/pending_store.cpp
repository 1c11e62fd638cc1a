#include "pending_store.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace txgate::pending
{
    using json = nlohmann::json;

    bool isTerminal(const TxStatus status) noexcept
    {
        return status == TxStatus::CONFIRMED || status == TxStatus::FAILED;
    }

    std::string toString(const TxStatus status)
    {
        switch(status)
        {
            case TxStatus::PENDING : return "PENDING";
            case TxStatus::MEMPOOL_LIKELY_SUCCEED : return "MEMPOOL_LIKELY_SUCCEED";
            case TxStatus::MEMPOOL_LIKELY_FAIL : return "MEMPOOL_LIKELY_FAIL";
            case TxStatus::MEMPOOL_UNKNOWN : return "MEMPOOL_UNKNOWN";
            case TxStatus::CONFIRMED : return "CONFIRMED";
            case TxStatus::FAILED : return "FAILED";
            default: return "UNKNOWN";
        }
    }

    std::optional<TxStatus> txStatusFromString(const std::string & value)
    {
        if(value == "PENDING") return TxStatus::PENDING;
        if(value == "MEMPOOL_LIKELY_SUCCEED") return TxStatus::MEMPOOL_LIKELY_SUCCEED;
        if(value == "MEMPOOL_LIKELY_FAIL") return TxStatus::MEMPOOL_LIKELY_FAIL;
        if(value == "MEMPOOL_UNKNOWN") return TxStatus::MEMPOOL_UNKNOWN;
        if(value == "CONFIRMED") return TxStatus::CONFIRMED;
        if(value == "FAILED") return TxStatus::FAILED;
        return std::nullopt;
    }

    json toJson(const PendingTransaction & tx)
    {
        return json{
            {"tx_hash", tx.tx_hash},
            {"chain", tx.chain},
            {"chain_id", tx.chain_id},
            {"address", tx.address},
            {"nonce", tx.nonce},
            {"submitted_at", utils::toUnixMillis(tx.submitted_at)},
            {"fee_at_submission", tx.fee_at_submission},
            {"status", toString(tx.status)}
        };
    }

    Result<PendingTransaction> pendingTransactionFromJson(const json & value)
    {
        if(!value.is_object())
        {
            return makeError(GatewayError::Kind::STORAGE_ERROR, "pending transaction entry is not an object");
        }

        try
        {
            PendingTransaction tx;
            tx.tx_hash = value.at("tx_hash").get<std::string>();
            tx.chain = value.at("chain").get<std::string>();
            tx.chain_id = value.at("chain_id").get<std::uint64_t>();
            tx.address = value.at("address").get<std::string>();
            tx.nonce = value.at("nonce").get<std::uint64_t>();
            tx.submitted_at = utils::fromUnixMillis(value.at("submitted_at").get<std::int64_t>());
            tx.fee_at_submission = value.at("fee_at_submission").get<double>();

            const auto status = txStatusFromString(value.at("status").get<std::string>());
            if(!status)
            {
                return makeError(GatewayError::Kind::STORAGE_ERROR, "unknown pending transaction status");
            }
            tx.status = *status;
            return tx;
        }
        catch(const json::exception & e)
        {
            return makeError(GatewayError::Kind::STORAGE_ERROR, e.what());
        }
    }

    TxStatus classifyMempoolTx(const std::chrono::milliseconds elapsed, const std::chrono::milliseconds duration_limit,
                               const double fee_at_submission, const double current_fee) noexcept
    {
        if(elapsed > duration_limit && current_fee > fee_at_submission)
        {
            return TxStatus::MEMPOOL_LIKELY_FAIL;
        }
        return TxStatus::MEMPOOL_LIKELY_SUCCEED;
    }

    PendingTransactionStore::PendingTransactionStore(asio::io_context & io_context, storage::IKeyValueStore & store, PendingConfig cfg, utils::Clock clock)
    : _strand(asio::make_strand(io_context)),
      _store(store),
      _cfg(std::move(cfg)),
      _clock(std::move(clock))
    {
    }

    const PendingConfig & PendingTransactionStore::config() const noexcept
    {
        return _cfg;
    }

    std::string PendingTransactionStore::_storeKey(const std::string & chain, const std::string & tx_hash)
    {
        return chain + "/" + tx_hash;
    }

    asio::awaitable<Result<std::size_t>> PendingTransactionStore::load()
    {
        co_await utils::ensureOnStrand(_strand);

        const auto entries = _store.entries(STORE_NAMESPACE);
        if(!entries)
        {
            spdlog::error("Failed to load pending transactions: {}", entries.error().message);
            co_return std::unexpected(entries.error());
        }

        std::size_t loaded = 0;
        for(const auto & [key, value] : *entries)
        {
            auto tx = pendingTransactionFromJson(value);
            if(!tx)
            {
                spdlog::warn("Skipping corrupted pending transaction `{}`: {}", key, tx.error().message);
                continue;
            }

            Key map_key{tx->chain, tx->tx_hash};
            _transactions.insert_or_assign(std::move(map_key), std::move(*tx));
            ++loaded;
        }

        spdlog::info("Loaded {} pending transaction(s)", loaded);
        co_return loaded;
    }

    asio::awaitable<Result<void>> PendingTransactionStore::record(PendingTransaction tx)
    {
        if(tx.tx_hash.empty() || tx.chain.empty())
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "pending transaction requires chain and tx_hash");
        }

        co_await utils::ensureOnStrand(_strand);

        Key key{tx.chain, tx.tx_hash};
        if(_transactions.contains(key))
        {
            spdlog::error("Transaction `{}` on {} is already recorded", tx.tx_hash, tx.chain);
            co_return makeError(GatewayError::Kind::INVALID_INPUT, std::format("transaction {} already recorded", tx.tx_hash));
        }

        for(const auto & [other_key, other] : _transactions)
        {
            if(other.chain == tx.chain && other.chain_id == tx.chain_id && other.address == tx.address
                && other.nonce == tx.nonce && !isTerminal(other.status))
            {
                spdlog::error("Nonce {} of {} on {} is already used by pending transaction `{}`",
                    tx.nonce, tx.address, tx.chain, other.tx_hash);
                co_return makeError(GatewayError::Kind::NONCE_CONFLICT,
                    std::format("nonce {} already used by pending transaction {}", tx.nonce, other.tx_hash));
            }
        }

        if(auto res = _store.put(STORE_NAMESPACE, _storeKey(tx.chain, tx.tx_hash), toJson(tx)); !res)
        {
            co_return std::unexpected(res.error());
        }

        spdlog::debug("Recorded pending transaction `{}` (chain={}, nonce={}, fee={})", tx.tx_hash, tx.chain, tx.nonce, tx.fee_at_submission);
        _transactions.try_emplace(std::move(key), std::move(tx));
        co_return Result<void>{};
    }

    asio::awaitable<std::optional<PendingTransaction>> PendingTransactionStore::get(const std::string & chain, const std::string & tx_hash) const
    {
        co_await utils::ensureOnStrand(_strand);

        auto it = _transactions.find(Key{chain, tx_hash});
        if(it == _transactions.end())
        {
            co_return std::nullopt;
        }
        co_return it->second;
    }

    asio::awaitable<std::optional<PendingTransaction>> PendingTransactionStore::findByNonce(const std::string & chain, const std::uint64_t chain_id, const std::string & address, const std::uint64_t nonce) const
    {
        co_await utils::ensureOnStrand(_strand);

        for(const auto & [key, tx] : _transactions)
        {
            if(tx.chain == chain && tx.chain_id == chain_id && tx.address == address && tx.nonce == nonce && !isTerminal(tx.status))
            {
                co_return tx;
            }
        }
        co_return std::nullopt;
    }

    asio::awaitable<std::vector<PendingTransaction>> PendingTransactionStore::list(const std::string & chain) const
    {
        co_await utils::ensureOnStrand(_strand);

        std::vector<PendingTransaction> out;
        for(const auto & [key, tx] : _transactions)
        {
            if(tx.chain == chain)
            {
                out.push_back(tx);
            }
        }

        std::ranges::sort(out, [](const PendingTransaction & a, const PendingTransaction & b)
        {
            if(a.address != b.address)
            {
                return a.address < b.address;
            }
            return a.nonce < b.nonce;
        });
        co_return out;
    }

    TxStatus PendingTransactionStore::classify(const PendingTransaction & tx, const double current_fee) const
    {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(_clock() - tx.submitted_at);
        return classifyMempoolTx(elapsed, _cfg.duration_limit, tx.fee_at_submission, current_fee);
    }

    asio::awaitable<Result<void>> PendingTransactionStore::updateStatus(const std::string & chain, const std::string & tx_hash, const TxStatus status)
    {
        co_await utils::ensureOnStrand(_strand);

        const Key key{chain, tx_hash};
        auto it = _transactions.find(key);
        if(it == _transactions.end())
        {
            co_return makeError(GatewayError::Kind::NOT_FOUND, std::format("transaction {} is not tracked", tx_hash));
        }

        if(isTerminal(status))
        {
            spdlog::info("Transaction `{}` on {} reached {}", tx_hash, chain, toString(status));
            co_return _evictLocked(key);
        }

        if(it->second.status == status)
        {
            co_return Result<void>{};
        }

        PendingTransaction updated = it->second;
        updated.status = status;
        if(auto res = _store.put(STORE_NAMESPACE, _storeKey(chain, tx_hash), toJson(updated)); !res)
        {
            co_return std::unexpected(res.error());
        }

        it->second = std::move(updated);
        co_return Result<void>{};
    }

    asio::awaitable<Result<void>> PendingTransactionStore::evict(const std::string & chain, const std::string & tx_hash)
    {
        co_await utils::ensureOnStrand(_strand);
        co_return _evictLocked(Key{chain, tx_hash});
    }

    Result<void> PendingTransactionStore::_evictLocked(const Key & key)
    {
        if(auto res = _store.erase(STORE_NAMESPACE, _storeKey(key.first, key.second)); !res)
        {
            spdlog::error("Failed to evict `{}` from durable store: {}", key.second, res.error().message);
            return res;
        }

        _transactions.erase(key);
        return {};
    }

    asio::awaitable<std::size_t> PendingTransactionStore::purgeExpired()
    {
        co_await utils::ensureOnStrand(_strand);

        const auto now = _clock();
        std::vector<Key> expired;
        for(const auto & [key, tx] : _transactions)
        {
            if(now - tx.submitted_at > _cfg.retention)
            {
                expired.push_back(key);
            }
        }

        std::size_t purged = 0;
        for(const Key & key : expired)
        {
            if(_evictLocked(key))
            {
                ++purged;
            }
        }

        if(purged > 0)
        {
            spdlog::info("Purged {} expired pending transaction(s)", purged);
        }
        co_return purged;
    }
}
