#include "gas_price_oracle.hpp"

#include <algorithm>
#include <format>
#include <vector>

#include <spdlog/spdlog.h>

namespace txgate::gas
{
    double applyPolicy(const chain::FeeEstimate & estimate, const FeePolicy & policy)
    {
        double value = estimate.base_fee;
        if(policy.include_priority_fee && estimate.priority_fee)
        {
            value += *estimate.priority_fee;
        }

        value *= policy.multiplier;
        return std::max(value, policy.min_fee);
    }

    GasPriceOracle::GasPriceOracle(asio::io_context & io_context, OracleConfig cfg, utils::Clock clock)
    : _strand(asio::make_strand(io_context)),
      _cfg(std::move(cfg)),
      _clock(std::move(clock)),
      _refresh_timer(_strand)
    {
    }

    const OracleConfig & GasPriceOracle::config() const noexcept
    {
        return _cfg;
    }

    asio::awaitable<void> GasPriceOracle::registerSource(std::string chain, std::string network, FeeSource source, FeePolicy policy)
    {
        co_await utils::ensureOnStrand(_strand);

        spdlog::debug("Gas price source registered for {}:{} (multiplier={}, min={})", chain, network, policy.multiplier, policy.min_fee);

        _entries.insert_or_assign(Key{std::move(chain), std::move(network)}, Entry{
            .source = std::move(source),
            .policy = policy,
            .cache = std::nullopt
        });
    }

    asio::awaitable<Result<double>> GasPriceOracle::current(const std::string & chain, const std::string & network)
    {
        co_await utils::ensureOnStrand(_strand);

        auto it = _entries.find(Key{chain, network});
        if(it == _entries.end())
        {
            co_return makeError(GatewayError::Kind::NOT_FOUND, std::format("No gas price source for {}:{}", chain, network));
        }

        if(const auto & cache = it->second.cache; cache && !cache->stale)
        {
            if(_clock() - cache->fetched_at < _cfg.ttl)
            {
                co_return cache->value;
            }
        }

        co_return co_await refresh(chain, network);
    }

    asio::awaitable<Result<double>> GasPriceOracle::refresh(const std::string & chain, const std::string & network)
    {
        co_await utils::ensureOnStrand(_strand);

        const Key key{chain, network};
        auto it = _entries.find(key);
        if(it == _entries.end())
        {
            co_return makeError(GatewayError::Kind::NOT_FOUND, std::format("No gas price source for {}:{}", chain, network));
        }

        FeeSource source = it->second.source;
        const FeePolicy policy = it->second.policy;

        const auto estimate = co_await source();

        co_await utils::ensureOnStrand(_strand);

        // the map may have been modified while the fetch was suspended
        it = _entries.find(key);
        if(it == _entries.end())
        {
            co_return makeError(GatewayError::Kind::NOT_FOUND, std::format("Gas price source for {}:{} was removed", chain, network));
        }

        auto & cache = it->second.cache;
        if(!estimate)
        {
            if(!cache)
            {
                spdlog::error("Failed to estimate gas price for {}:{} and no cached value: {}", chain, network, estimate.error().message);
                co_return std::unexpected(estimate.error());
            }

            spdlog::warn("Failed to estimate gas price for {}:{}, serving cached {}: {}", chain, network, cache->value, estimate.error().message);
            cache->stale = true;
            co_return cache->value;
        }

        const double value = applyPolicy(*estimate, policy);
        cache = GasPriceCache{
            .value = value,
            .fetched_at = _clock(),
            .ttl = _cfg.ttl,
            .stale = false
        };

        spdlog::info("[GAS PRICE] {}:{} estimated {}", chain, network, value);
        co_return value;
    }

    asio::awaitable<std::optional<GasPriceCache>> GasPriceOracle::snapshot(const std::string & chain, const std::string & network) const
    {
        co_await utils::ensureOnStrand(_strand);

        auto it = _entries.find(Key{chain, network});
        if(it == _entries.end())
        {
            co_return std::nullopt;
        }
        co_return it->second.cache;
    }

    asio::awaitable<void> GasPriceOracle::runRefreshLoop()
    {
        if(_cfg.refresh_interval.count() <= 0)
        {
            co_return;
        }

        co_await utils::ensureOnStrand(_strand);

        spdlog::debug("Gas price refresh loop started, interval {}ms", _cfg.refresh_interval.count());

        while(!_stopped)
        {
            std::vector<Key> keys;
            keys.reserve(_entries.size());
            for(const auto & [key, entry] : _entries)
            {
                keys.push_back(key);
            }

            for(const Key & key : keys)
            {
                if(_stopped)
                {
                    break;
                }
                // failures are logged inside and never stop the loop
                [[maybe_unused]] const auto res = co_await refresh(key.first, key.second);
            }

            if(_stopped)
            {
                break;
            }

            _refresh_timer.expires_after(_cfg.refresh_interval);
            asio::error_code ec;
            co_await _refresh_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            co_await utils::ensureOnStrand(_strand);
        }

        spdlog::debug("Gas price refresh loop stopped");
    }

    void GasPriceOracle::stop()
    {
        asio::post(_strand, [this]()
        {
            _stopped = true;
            _refresh_timer.cancel();
        });
    }
}
