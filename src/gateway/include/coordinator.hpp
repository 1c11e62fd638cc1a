#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <asio.hpp>

#include "error.hpp"
#include "utils.hpp"
#include "chain_interface.hpp"
#include "gas_price_oracle.hpp"
#include "pending_store.hpp"
#include "nonce_manager.hpp"
#include "confirmation_watcher.hpp"

namespace txgate::gateway
{
    /**
     * @brief Payload produced by the external signer.
     *
     * `fee` is the fee level actually offered, when it differs from the one passed to the builder.
     */
    struct SignedTransaction
    {
        std::string raw;
        std::optional<double> fee;
    };

    /**
     * @brief Builds and signs a transaction for the given nonce and fee level.
     *
     * Any failure is treated as happening before submission, so the nonce is not consumed.
     */
    using BuildFn = std::function<asio::awaitable<Result<SignedTransaction>>(std::uint64_t nonce, double fee)>;

    struct CancelOutcome
    {
        std::optional<std::string> tx_hash;

        // the stuck transaction confirmed before the cancel could replace it
        bool already_confirmed = false;
    };

    /**
     * @brief Transaction lifecycle of one chain context.
     *
     * Owns no state of its own. Nonces, pending entries and fee levels live in the
     * components it is given.
     */
    class TransactionCoordinator
    {
        public:
            TransactionCoordinator(chain::IChain & chain, nonce::NonceManager & nonces, pending::PendingTransactionStore & pending,
                                   gas::GasPriceOracle & oracle, watcher::ConfirmationWatcher * watcher,
                                   utils::Clock clock = utils::systemClock());

            TransactionCoordinator(const TransactionCoordinator&) = delete;
            TransactionCoordinator& operator=(const TransactionCoordinator&) = delete;

            asio::awaitable<Result<std::uint64_t>> allocateNonce(const std::string & address);

            asio::awaitable<Result<std::string>> submitWithNonce(const std::string & address, BuildFn build);

            /**
             * @brief Replaces the transaction stuck at `nonce` with one built by `build_cancel`.
             *
             * Runs on the explicit nonce path. `bumped_fee` must be strictly above the fee the
             * stuck transaction offered. A failed replacement whose stuck transaction already confirmed is
             * reported as `already_confirmed`, not as an error.
             */
            asio::awaitable<Result<CancelOutcome>> cancelPending(const std::string & address, std::uint64_t nonce, double bumped_fee, BuildFn build_cancel);

            asio::awaitable<Result<pending::PendingTransaction>> getStatus(const std::string & tx_hash);

            asio::awaitable<Result<double>> currentFee();

            asio::awaitable<Result<watcher::WatchResult>> watchConfirmation(const std::string & tx_hash, std::chrono::milliseconds timeout);

        private:
            asio::awaitable<Result<std::string>> _submit(const std::string & address, std::uint64_t nonce, const BuildFn & build,
                                                         std::optional<double> fee_override, std::optional<std::string> replaces);

            asio::awaitable<void> _settle(const std::string & tx_hash, pending::TxStatus status);

            chain::IChain & _chain;
            nonce::NonceManager & _nonces;
            pending::PendingTransactionStore & _pending;
            gas::GasPriceOracle & _oracle;
            watcher::ConfirmationWatcher * _watcher;
            utils::Clock _clock;
    };
}
