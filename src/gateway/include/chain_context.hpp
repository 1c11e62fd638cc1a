#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <asio.hpp>
#include <absl/container/flat_hash_map.h>

#include "error.hpp"
#include "utils.hpp"
#include "storage.hpp"
#include "chain_interface.hpp"
#include "gas_price_oracle.hpp"
#include "pending_store.hpp"
#include "nonce_manager.hpp"
#include "confirmation_watcher.hpp"
#include "coordinator.hpp"

namespace txgate::gateway
{
    /**
     * @brief Everything bound to one (chain, network) pair.
     */
    class ChainContext
    {
        public:
            ChainContext(asio::io_context & io_context, std::unique_ptr<chain::IChain> chain, storage::IKeyValueStore & store,
                         gas::GasPriceOracle & oracle, pending::PendingTransactionStore & pending,
                         watcher::ConfirmationWatcher * watcher, nonce::NonceConfig nonce_cfg, utils::Clock clock);

            ChainContext(const ChainContext&) = delete;
            ChainContext& operator=(const ChainContext&) = delete;

            static std::string makeId(const std::string & chain, const std::string & network);

            const std::string & id() const noexcept;

            chain::IChain & chain() noexcept;

            nonce::NonceManager & nonces() noexcept;

            TransactionCoordinator & coordinator() noexcept;

        private:
            std::string _id;
            std::unique_ptr<chain::IChain> _chain;
            nonce::NonceManager _nonces;
            TransactionCoordinator _coordinator;
    };

    /**
     * @brief Owns the chain contexts of the process.
     *
     * Contexts are created once and never removed, so the returned pointers stay valid
     * for the registry lifetime.
     */
    class ChainContextRegistry
    {
        public:
            ChainContextRegistry(asio::io_context & io_context, storage::IKeyValueStore & store, gas::GasPriceOracle & oracle,
                                 pending::PendingTransactionStore & pending, watcher::ConfirmationWatcher * watcher,
                                 nonce::NonceConfig nonce_cfg = {}, utils::Clock clock = utils::systemClock());

            ChainContextRegistry(const ChainContextRegistry&) = delete;
            ChainContextRegistry& operator=(const ChainContextRegistry&) = delete;

            ~ChainContextRegistry() = default;

            /**
             * @brief Creates the context of `chain` and registers its fee source with the oracle.
             */
            asio::awaitable<Result<ChainContext *>> add(std::unique_ptr<chain::IChain> chain, gas::FeePolicy fee_policy);

            asio::awaitable<ChainContext *> find(const std::string & chain, const std::string & network) const;

            asio::awaitable<std::vector<ChainContext *>> contexts() const;

            /**
             * @brief Initializes every nonce manager. Returns the first failure after trying all of them.
             */
            asio::awaitable<Result<void>> initAll();

        private:
            using Key = std::pair<std::string, std::string>;

            asio::io_context & _io_context;
            asio::strand<asio::io_context::executor_type> _strand;

            storage::IKeyValueStore & _store;
            gas::GasPriceOracle & _oracle;
            pending::PendingTransactionStore & _pending;
            watcher::ConfirmationWatcher * _watcher;
            nonce::NonceConfig _nonce_cfg;
            utils::Clock _clock;

            absl::flat_hash_map<Key, std::unique_ptr<ChainContext>> _contexts;
    };
}
