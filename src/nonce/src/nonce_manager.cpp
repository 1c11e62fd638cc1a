#include "nonce_manager.hpp"

#include <algorithm>
#include <format>
#include <vector>

#include <nlohmann/json.hpp>

namespace txgate::nonce
{
    using json = nlohmann::json;

    json toJson(const NonceRecord & record)
    {
        return json{
            {"address", record.address},
            {"chain", record.chain},
            {"last_allocated", record.last_allocated},
            {"synced_at", utils::toUnixMillis(record.synced_at)}
        };
    }

    Result<NonceRecord> nonceRecordFromJson(const json & value)
    {
        if(!value.is_object())
        {
            return makeError(GatewayError::Kind::STORAGE_ERROR, "nonce record is not an object");
        }

        try
        {
            NonceRecord record;
            record.address = value.at("address").get<std::string>();
            record.chain = value.at("chain").get<std::string>();
            record.last_allocated = value.at("last_allocated").get<std::int64_t>();
            record.synced_at = utils::fromUnixMillis(value.value("synced_at", std::int64_t{0}));

            if(record.last_allocated < -1)
            {
                return makeError(GatewayError::Kind::STORAGE_ERROR, "nonce record has negative last_allocated");
            }
            return record;
        }
        catch(const json::exception & e)
        {
            return makeError(GatewayError::Kind::STORAGE_ERROR, e.what());
        }
    }

    std::uint64_t nextCandidate(const std::int64_t last_allocated, const std::optional<std::uint64_t> remote_count) noexcept
    {
        const std::uint64_t local_next = static_cast<std::uint64_t>(last_allocated + 1);
        if(!remote_count)
        {
            return local_next;
        }
        return std::max(local_next, *remote_count);
    }

    bool commitsNonce(const GatewayError & error) noexcept
    {
        return error.submission_attempted || error.kind == GatewayError::Kind::NONCE_CONFLICT;
    }

    NonceManager::NonceManager(asio::io_context & io_context, std::string chain, storage::IKeyValueStore & store,
                               NonceFetcher fetcher, NonceConfig cfg, utils::Clock clock)
    : _strand(asio::make_strand(io_context)),
      _chain(std::move(chain)),
      _store(store),
      _fetcher(std::move(fetcher)),
      _cfg(std::move(cfg)),
      _clock(std::move(clock))
    {
    }

    const std::string & NonceManager::chain() const noexcept
    {
        return _chain;
    }

    bool NonceManager::ready() const noexcept
    {
        return _ready.load();
    }

    std::string NonceManager::_storeKey(const std::string & chain, const std::string & address)
    {
        return chain + "/" + address;
    }

    utils::AsyncMutex & NonceManager::_mutexFor(const std::string & address)
    {
        auto it = _mutexes.find(address);
        if(it == _mutexes.end())
        {
            it = _mutexes.emplace(address, std::make_unique<utils::AsyncMutex>(_strand)).first;
        }
        return *it->second;
    }

    NonceRecord & NonceManager::_recordFor(const std::string & address)
    {
        auto it = _records.find(address);
        if(it == _records.end())
        {
            it = _records.emplace(address, NonceRecord{
                .address = address,
                .chain = _chain,
                .last_allocated = -1,
                .synced_at = {}
            }).first;
        }
        return it->second;
    }

    Result<void> NonceManager::_persist(const NonceRecord & record)
    {
        auto res = _store.put(STORE_NAMESPACE, _storeKey(record.chain, record.address), toJson(record));
        if(!res)
        {
            spdlog::error("[{}] failed to persist nonce record of {}: {}", _chain, record.address, res.error().message);
        }
        return res;
    }

    asio::awaitable<Result<void>> NonceManager::init()
    {
        co_await utils::ensureOnStrand(_strand);

        _ready = false;

        if(!_loaded)
        {
            const auto entries = _store.entries(STORE_NAMESPACE);
            if(!entries)
            {
                spdlog::error("[{}] failed to load nonce records: {}", _chain, entries.error().message);
                co_return std::unexpected(entries.error());
            }

            for(const auto & [key, value] : *entries)
            {
                auto record = nonceRecordFromJson(value);
                if(!record)
                {
                    spdlog::warn("[{}] skipping corrupted nonce record `{}`: {}", _chain, key, record.error().message);
                    continue;
                }
                if(record->chain != _chain)
                {
                    continue;
                }
                std::string address = record->address;
                _records.insert_or_assign(std::move(address), std::move(*record));
            }
            _loaded = true;
        }

        std::vector<std::string> addresses;
        addresses.reserve(_records.size());
        for(const auto & [address, record] : _records)
        {
            addresses.push_back(address);
        }

        for(const std::string & address : addresses)
        {
            if(auto res = co_await _reconcile(address); !res)
            {
                spdlog::error("[{}] nonce reconciliation failed for {}: {}", _chain, address, res.error().message);
                co_return makeError(GatewayError::Kind::REMOTE_UNAVAILABLE,
                    std::format("nonce reconciliation failed for {}: {}", address, res.error().message));
            }
        }

        _ready = true;
        spdlog::info("[{}] nonce manager ready, {} address(es) reconciled", _chain, addresses.size());
        co_return Result<void>{};
    }

    asio::awaitable<Result<void>> NonceManager::_reconcile(const std::string & address)
    {
        co_await utils::ensureOnStrand(_strand);
        auto guard = co_await _mutexFor(address).scopedLock();

        const auto remote_count = co_await _fetcher(address);
        co_await utils::ensureOnStrand(_strand);

        if(!remote_count)
        {
            co_return std::unexpected(remote_count.error());
        }

        NonceRecord & record = _recordFor(address);
        const std::int64_t remote_last = static_cast<std::int64_t>(*remote_count) - 1;
        if(remote_last > record.last_allocated)
        {
            spdlog::info("[{}] {} lagged behind the node, last nonce {} -> {}", _chain, address, record.last_allocated, remote_last);
            record.last_allocated = remote_last;
        }
        record.synced_at = _clock();

        co_return _persist(record);
    }

    asio::awaitable<Result<std::uint64_t>> NonceManager::_enter(const std::string & address)
    {
        if(address.empty())
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "address must not be empty");
        }

        co_await utils::ensureOnStrand(_strand);

        if(!_ready)
        {
            co_return makeError(GatewayError::Kind::NOT_READY, std::format("nonce manager for {} is not initialized", _chain));
        }

        utils::AsyncMutex & mutex = _mutexFor(address);
        co_await mutex.lock();
        co_await utils::ensureOnStrand(_strand);

        NonceRecord & record = _recordFor(address);

        std::optional<std::uint64_t> remote_count;
        if(_cfg.sync_ttl.count() <= 0 || _clock() - record.synced_at >= _cfg.sync_ttl)
        {
            auto fetched = co_await _fetcher(address);
            co_await utils::ensureOnStrand(_strand);

            if(!fetched)
            {
                spdlog::error("[{}] failed to fetch remote nonce of {}: {}", _chain, address, fetched.error().message);
                mutex.unlock();
                co_return makeError(GatewayError::Kind::REMOTE_UNAVAILABLE, fetched.error().message);
            }
            remote_count = *fetched;
        }

        // the reference may be stale after the suspension above
        NonceRecord & current = _recordFor(address);
        if(remote_count)
        {
            current.synced_at = _clock();
        }

        const std::uint64_t candidate = nextCandidate(current.last_allocated, remote_count);
        spdlog::debug("[{}] {} candidate nonce {} (last={}, remote={})", _chain, address, candidate, current.last_allocated,
            remote_count ? std::to_string(*remote_count) : std::string("cached"));
        co_return candidate;
    }

    asio::awaitable<void> NonceManager::_leave(const std::string & address, const std::uint64_t candidate, const bool commit)
    {
        co_await utils::ensureOnStrand(_strand);

        NonceRecord & record = _recordFor(address);
        if(commit)
        {
            record.last_allocated = std::max(record.last_allocated, static_cast<std::int64_t>(candidate));
            // in-memory state stays authoritative when the write fails; the error is logged
            [[maybe_unused]] const auto persisted = _persist(record);
        }
        else
        {
            spdlog::debug("[{}] nonce {} of {} released unused", _chain, candidate, address);
        }

        _mutexFor(address).unlock();
    }

    asio::awaitable<Result<std::uint64_t>> NonceManager::allocate(const std::string & address)
    {
        co_return co_await provide<std::uint64_t>(std::nullopt, address,
            [](std::uint64_t nonce) -> asio::awaitable<Result<std::uint64_t>>
            {
                co_return nonce;
            });
    }

    asio::awaitable<std::optional<std::int64_t>> NonceManager::lastAllocated(const std::string & address) const
    {
        co_await utils::ensureOnStrand(_strand);

        auto it = _records.find(address);
        if(it == _records.end())
        {
            co_return std::nullopt;
        }
        co_return it->second.last_allocated;
    }
}
