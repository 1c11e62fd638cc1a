#include "chain_context.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace txgate::gateway
{
    ChainContext::ChainContext(asio::io_context & io_context, std::unique_ptr<chain::IChain> chain, storage::IKeyValueStore & store,
                               gas::GasPriceOracle & oracle, pending::PendingTransactionStore & pending,
                               watcher::ConfirmationWatcher * watcher, nonce::NonceConfig nonce_cfg, utils::Clock clock)
    : _id(makeId(chain->chainName(), chain->network())),
      _chain(std::move(chain)),
      _nonces(io_context, _id, store,
          [chain_ptr = _chain.get()](const std::string & address)
          {
              return chain_ptr->reportedNonce(address);
          },
          std::move(nonce_cfg), clock),
      _coordinator(*_chain, _nonces, pending, oracle, watcher, clock)
    {
    }

    std::string ChainContext::makeId(const std::string & chain, const std::string & network)
    {
        return chain + ":" + network;
    }

    const std::string & ChainContext::id() const noexcept
    {
        return _id;
    }

    chain::IChain & ChainContext::chain() noexcept
    {
        return *_chain;
    }

    nonce::NonceManager & ChainContext::nonces() noexcept
    {
        return _nonces;
    }

    TransactionCoordinator & ChainContext::coordinator() noexcept
    {
        return _coordinator;
    }

    ChainContextRegistry::ChainContextRegistry(asio::io_context & io_context, storage::IKeyValueStore & store, gas::GasPriceOracle & oracle,
                                               pending::PendingTransactionStore & pending, watcher::ConfirmationWatcher * watcher,
                                               nonce::NonceConfig nonce_cfg, utils::Clock clock)
    : _io_context(io_context),
      _strand(asio::make_strand(io_context)),
      _store(store),
      _oracle(oracle),
      _pending(pending),
      _watcher(watcher),
      _nonce_cfg(std::move(nonce_cfg)),
      _clock(std::move(clock))
    {
    }

    asio::awaitable<Result<ChainContext *>> ChainContextRegistry::add(std::unique_ptr<chain::IChain> chain, gas::FeePolicy fee_policy)
    {
        if(!chain)
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "chain adapter must be set");
        }

        co_await utils::ensureOnStrand(_strand);

        Key key{chain->chainName(), chain->network()};
        if(_contexts.contains(key))
        {
            spdlog::error("Chain {}:{} is already registered", key.first, key.second);
            co_return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("chain {}:{} registered twice", key.first, key.second));
        }

        auto context = std::make_unique<ChainContext>(_io_context, std::move(chain), _store, _oracle, _pending, _watcher, _nonce_cfg, _clock);
        ChainContext * context_ptr = context.get();
        _contexts.emplace(key, std::move(context));

        chain::IChain * chain_ptr = &context_ptr->chain();
        co_await _oracle.registerSource(key.first, key.second,
            [chain_ptr]()
            {
                return chain_ptr->feeEstimate();
            },
            fee_policy);

        spdlog::info("Chain context {} (chain id {}) registered", context_ptr->id(), chain_ptr->chainId());
        co_return context_ptr;
    }

    asio::awaitable<ChainContext *> ChainContextRegistry::find(const std::string & chain, const std::string & network) const
    {
        co_await utils::ensureOnStrand(_strand);

        auto it = _contexts.find(Key{chain, network});
        if(it == _contexts.end())
        {
            co_return nullptr;
        }
        co_return it->second.get();
    }

    asio::awaitable<std::vector<ChainContext *>> ChainContextRegistry::contexts() const
    {
        co_await utils::ensureOnStrand(_strand);

        std::vector<ChainContext *> out;
        out.reserve(_contexts.size());
        for(const auto & [key, context] : _contexts)
        {
            out.push_back(context.get());
        }
        co_return out;
    }

    asio::awaitable<Result<void>> ChainContextRegistry::initAll()
    {
        const auto all = co_await contexts();

        Result<void> first_failure{};
        for(ChainContext * context : all)
        {
            auto res = co_await context->nonces().init();
            if(!res)
            {
                spdlog::error("Chain context {} not ready: {}", context->id(), res.error().message);
                if(first_failure)
                {
                    first_failure = std::unexpected(res.error());
                }
            }
        }
        co_return first_failure;
    }
}
