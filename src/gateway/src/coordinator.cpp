#include "coordinator.hpp"

#include <format>
#include <utility>

#include <spdlog/spdlog.h>

namespace txgate::gateway
{
    TransactionCoordinator::TransactionCoordinator(chain::IChain & chain, nonce::NonceManager & nonces, pending::PendingTransactionStore & pending,
                                                   gas::GasPriceOracle & oracle, watcher::ConfirmationWatcher * watcher, utils::Clock clock)
    : _chain(chain),
      _nonces(nonces),
      _pending(pending),
      _oracle(oracle),
      _watcher(watcher),
      _clock(std::move(clock))
    {
    }

    asio::awaitable<Result<std::uint64_t>> TransactionCoordinator::allocateNonce(const std::string & address)
    {
        co_return co_await _nonces.allocate(address);
    }

    asio::awaitable<Result<std::string>> TransactionCoordinator::_submit(const std::string & address, const std::uint64_t nonce, const BuildFn & build,
                                                                          std::optional<double> fee_override, std::optional<std::string> replaces)
    {
        double fee = 0.0;
        if(fee_override)
        {
            fee = *fee_override;
        }
        else
        {
            const auto current = co_await _oracle.current(_chain.chainName(), _chain.network());
            if(!current)
            {
                GatewayError error = current.error();
                error.submission_attempted = false;
                co_return std::unexpected(std::move(error));
            }
            fee = *current;
        }

        auto signed_tx = co_await build(nonce, fee);
        if(!signed_tx)
        {
            GatewayError error = signed_tx.error();
            error.submission_attempted = false;
            spdlog::warn("[{}] build failed for {} nonce {}: {}", _chain.chainName(), address, nonce, error.message);
            co_return std::unexpected(std::move(error));
        }

        if(signed_tx->raw.empty())
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "signed transaction must not be empty");
        }

        const auto tx_hash = co_await _chain.submitRaw(signed_tx->raw);
        if(!tx_hash)
        {
            spdlog::warn(std::format("[{}] submission of {} nonce {} failed: {}", _chain.chainName(), address, nonce, tx_hash.error()));
            co_return std::unexpected(tx_hash.error());
        }

        if(replaces)
        {
            if(auto evicted = co_await _pending.evict(_chain.chainName(), *replaces); !evicted)
            {
                spdlog::warn("[{}] replaced transaction {} not evicted: {}", _chain.chainName(), *replaces, evicted.error().message);
            }
        }

        const double fee_at_submission = signed_tx->fee.value_or(fee);
        auto recorded = co_await _pending.record(pending::PendingTransaction{
            .tx_hash = *tx_hash,
            .chain = _chain.chainName(),
            .chain_id = _chain.chainId(),
            .address = address,
            .nonce = nonce,
            .submitted_at = _clock(),
            .fee_at_submission = fee_at_submission,
            .status = pending::TxStatus::PENDING
        });

        // the node has the transaction; losing track of it is not a reason to reuse the nonce
        if(!recorded)
        {
            spdlog::error(std::format("[{}] transaction {} submitted but not tracked: {}", _chain.chainName(), *tx_hash, recorded.error()));
        }

        spdlog::info("[{}] submitted {} (address {}, nonce {}, fee {})", _chain.chainName(), *tx_hash, address, nonce, fee_at_submission);
        co_return *tx_hash;
    }

    asio::awaitable<Result<std::string>> TransactionCoordinator::submitWithNonce(const std::string & address, BuildFn build)
    {
        if(!build)
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "transaction builder must be set");
        }

        co_return co_await _nonces.provide<std::string>(std::nullopt, address,
            [this, &address, &build](std::uint64_t nonce) -> asio::awaitable<Result<std::string>>
            {
                co_return co_await _submit(address, nonce, build, std::nullopt, std::nullopt);
            });
    }

    asio::awaitable<Result<CancelOutcome>> TransactionCoordinator::cancelPending(const std::string & address, const std::uint64_t nonce,
                                                                                 const double bumped_fee, BuildFn build_cancel)
    {
        if(!build_cancel)
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "cancel builder must be set");
        }

        const auto stuck = co_await _pending.findByNonce(_chain.chainName(), _chain.chainId(), address, nonce);
        if(stuck && !(bumped_fee > stuck->fee_at_submission))
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT,
                std::format("cancel fee {} must exceed the stuck transaction fee {}", bumped_fee, stuck->fee_at_submission));
        }
        if(!stuck)
        {
            spdlog::warn("[{}] no tracked transaction of {} at nonce {}, cancelling blind", _chain.chainName(), address, nonce);
        }

        std::optional<std::string> replaces;
        if(stuck)
        {
            replaces = stuck->tx_hash;
        }

        const auto cancelled = co_await _nonces.provide<std::string>(nonce, address,
            [this, &address, &build_cancel, bumped_fee, &replaces](std::uint64_t explicit_nonce) -> asio::awaitable<Result<std::string>>
            {
                co_return co_await _submit(address, explicit_nonce, build_cancel, bumped_fee, replaces);
            });

        if(cancelled)
        {
            spdlog::info("[{}] nonce {} of {} replaced by {}", _chain.chainName(), nonce, address, *cancelled);
            co_return CancelOutcome{
                .tx_hash = *cancelled,
                .already_confirmed = false
            };
        }

        if(stuck)
        {
            const auto report = co_await _chain.txStatus(stuck->tx_hash);
            if(report && report->status == chain::ReceiptStatus::CONFIRMED)
            {
                spdlog::info("[{}] cancel of {} lost the race, stuck transaction already confirmed", _chain.chainName(), stuck->tx_hash);
                co_await _settle(stuck->tx_hash, pending::TxStatus::CONFIRMED);
                co_return CancelOutcome{
                    .tx_hash = std::nullopt,
                    .already_confirmed = true
                };
            }
        }
        else if(cancelled.error().kind == GatewayError::Kind::NONCE_CONFLICT)
        {
            // the stuck entry may already be settled and evicted, ask the node whether the nonce was mined
            const auto mined = co_await _chain.confirmedNonce(address);
            if(mined && *mined > nonce)
            {
                spdlog::info("[{}] cancel of nonce {} for {} lost the race, nonce already mined", _chain.chainName(), nonce, address);
                co_return CancelOutcome{
                    .tx_hash = std::nullopt,
                    .already_confirmed = true
                };
            }
            if(!mined)
            {
                spdlog::warn(std::format("[{}] mined nonce of {} unavailable: {}", _chain.chainName(), address, mined.error()));
            }
        }

        spdlog::error(std::format("[{}] cancel of nonce {} for {} failed: {}", _chain.chainName(), nonce, address, cancelled.error()));
        co_return std::unexpected(cancelled.error());
    }

    asio::awaitable<void> TransactionCoordinator::_settle(const std::string & tx_hash, const pending::TxStatus status)
    {
        auto res = co_await _pending.updateStatus(_chain.chainName(), tx_hash, status);
        if(!res && res.error().kind != GatewayError::Kind::NOT_FOUND)
        {
            spdlog::warn("[{}] status of {} not stored: {}", _chain.chainName(), tx_hash, res.error().message);
        }
    }

    asio::awaitable<Result<pending::PendingTransaction>> TransactionCoordinator::getStatus(const std::string & tx_hash)
    {
        if(tx_hash.empty())
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "transaction hash must not be empty");
        }

        const auto known = co_await _pending.get(_chain.chainName(), tx_hash);

        const auto report = co_await _chain.txStatus(tx_hash);
        if(!report)
        {
            co_return std::unexpected(report.error());
        }

        pending::PendingTransaction view;
        if(known)
        {
            view = *known;
        }
        else
        {
            view.tx_hash = tx_hash;
            view.chain = _chain.chainName();
            view.chain_id = _chain.chainId();
        }

        switch(report->status)
        {
            case chain::ReceiptStatus::CONFIRMED:
            case chain::ReceiptStatus::FAILED:
            {
                view.status = (report->status == chain::ReceiptStatus::CONFIRMED) ? pending::TxStatus::CONFIRMED : pending::TxStatus::FAILED;
                if(known)
                {
                    co_await _settle(tx_hash, view.status);
                }
                break;
            }

            case chain::ReceiptStatus::IN_MEMPOOL:
            {
                if(!known)
                {
                    view.status = pending::TxStatus::PENDING;
                    break;
                }

                const auto fee = co_await _oracle.current(_chain.chainName(), _chain.network());
                if(!fee)
                {
                    spdlog::warn("[{}] no fee level to classify {}: {}", _chain.chainName(), tx_hash, fee.error().message);
                    view.status = pending::TxStatus::PENDING;
                    break;
                }

                view.status = _pending.classify(*known, *fee);
                co_await _settle(tx_hash, view.status);
                break;
            }

            case chain::ReceiptStatus::NOT_FOUND:
            default:
            {
                if(!known)
                {
                    view.status = pending::TxStatus::MEMPOOL_UNKNOWN;
                    break;
                }

                // a fresh submission may not be indexed by the node yet
                const auto elapsed = _clock() - known->submitted_at;
                if(elapsed > _pending.config().duration_limit)
                {
                    spdlog::warn("[{}] {} dropped by the node", _chain.chainName(), tx_hash);
                    view.status = pending::TxStatus::FAILED;
                }
                else
                {
                    view.status = pending::TxStatus::MEMPOOL_UNKNOWN;
                }
                co_await _settle(tx_hash, view.status);
                break;
            }
        }

        co_return view;
    }

    asio::awaitable<Result<double>> TransactionCoordinator::currentFee()
    {
        co_return co_await _oracle.current(_chain.chainName(), _chain.network());
    }

    asio::awaitable<Result<watcher::WatchResult>> TransactionCoordinator::watchConfirmation(const std::string & tx_hash, const std::chrono::milliseconds timeout)
    {
        if(_watcher == nullptr)
        {
            co_return makeError(GatewayError::Kind::NOT_CONNECTED, "live confirmation is disabled, poll getStatus instead");
        }

        auto result = co_await _watcher->watch(tx_hash, timeout);
        if(!result)
        {
            co_return std::unexpected(result.error());
        }

        if(result->confirmed)
        {
            co_await _settle(tx_hash, pending::TxStatus::CONFIRMED);
        }
        else if(!result->data.is_null())
        {
            // notified with an error payload: the transaction landed and failed
            co_await _settle(tx_hash, pending::TxStatus::FAILED);
        }

        co_return result;
    }
}
