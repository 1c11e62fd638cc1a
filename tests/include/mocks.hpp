#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "unit-tests.hpp"

namespace txgate::tests
{
    /**
     * @brief Scriptable chain. Every call suspends once before answering.
     */
    class MockChain final : public chain::IChain
    {
        public:
            MockChain(std::string chain, std::string network, std::uint64_t chain_id)
            : _chain(std::move(chain)), _network(std::move(network)), _chain_id(chain_id)
            {
            }

            const std::string & chainName() const noexcept override { return _chain; }

            const std::string & network() const noexcept override { return _network; }

            std::uint64_t chainId() const noexcept override { return _chain_id; }

            asio::awaitable<Result<std::uint64_t>> reportedNonce(const std::string & address) override
            {
                ++nonce_calls;
                co_await yieldOnce();
                if(nonce_error)
                {
                    co_return std::unexpected(*nonce_error);
                }
                if(auto it = remote_nonces.find(address); it != remote_nonces.end())
                {
                    co_return it->second;
                }
                co_return remote_nonce;
            }

            asio::awaitable<Result<std::uint64_t>> confirmedNonce(const std::string &) override
            {
                co_await yieldOnce();
                if(nonce_error)
                {
                    co_return std::unexpected(*nonce_error);
                }
                co_return confirmed_nonce;
            }

            asio::awaitable<Result<std::string>> submitRaw(const std::string & signed_tx) override
            {
                submitted.push_back(signed_tx);
                co_await yieldOnce();
                if(!submit_results.empty())
                {
                    auto res = submit_results.front();
                    submit_results.pop_front();
                    co_return res;
                }
                co_return std::format("0xhash{}", submitted.size());
            }

            asio::awaitable<Result<chain::FeeEstimate>> feeEstimate() override
            {
                ++fee_calls;
                co_await yieldOnce();
                if(fee_error)
                {
                    co_return std::unexpected(*fee_error);
                }
                co_return chain::FeeEstimate{.base_fee = base_fee, .priority_fee = std::nullopt};
            }

            asio::awaitable<Result<chain::TxStatusReport>> txStatus(const std::string & tx_hash) override
            {
                co_await yieldOnce();
                if(auto it = statuses.find(tx_hash); it != statuses.end())
                {
                    co_return it->second;
                }
                co_return chain::TxStatusReport{};
            }

            std::uint64_t remote_nonce = 0;
            absl::flat_hash_map<std::string, std::uint64_t> remote_nonces;
            std::optional<GatewayError> nonce_error;
            std::uint64_t confirmed_nonce = 0;

            double base_fee = 20.0;
            std::optional<GatewayError> fee_error;

            std::deque<Result<std::string>> submit_results;
            std::vector<std::string> submitted;

            absl::flat_hash_map<std::string, chain::TxStatusReport> statuses;

            std::size_t nonce_calls = 0;
            std::size_t fee_calls = 0;

        private:
            std::string _chain;
            std::string _network;
            std::uint64_t _chain_id;
    };

    /**
     * @brief In-process live channel. Tests push node messages and inspect what was sent.
     */
    class MockLiveChannel final : public watcher::ILiveChannel
    {
        public:
            explicit MockLiveChannel(asio::io_context & io_context)
            : _signal(io_context, asio::steady_timer::time_point::max())
            {
            }

            asio::awaitable<Result<void>> open() override
            {
                ++open_calls;
                if(!open_results.empty())
                {
                    auto res = open_results.front();
                    open_results.pop_front();
                    if(!res)
                    {
                        co_return res;
                    }
                }
                _incoming.clear();
                _open = true;
                co_return Result<void>{};
            }

            asio::awaitable<Result<void>> send(const nlohmann::json & message) override
            {
                if(!_open)
                {
                    co_return makeError(GatewayError::Kind::NOT_CONNECTED, "mock channel closed");
                }
                sent.push_back(message);
                if(on_send)
                {
                    on_send(message);
                }
                co_return Result<void>{};
            }

            asio::awaitable<Result<nlohmann::json>> receive() override
            {
                while(true)
                {
                    if(!_incoming.empty())
                    {
                        auto message = std::move(_incoming.front());
                        _incoming.pop_front();
                        co_return message;
                    }
                    if(!_open)
                    {
                        co_return makeError(GatewayError::Kind::SUBSCRIPTION_LOST, "mock channel closed");
                    }

                    _signal.expires_at(asio::steady_timer::time_point::max());
                    asio::error_code ec;
                    co_await _signal.async_wait(asio::redirect_error(asio::use_awaitable, ec));
                }
            }

            void close() override
            {
                _open = false;
                _signal.cancel();
            }

            bool isOpen() const noexcept override
            {
                return _open;
            }

            void push(nlohmann::json message)
            {
                _incoming.emplace_back(std::move(message));
                _signal.cancel();
            }

            void pushMalformed()
            {
                _incoming.emplace_back(makeError(GatewayError::Kind::RPC_MALFORMED, "not json"));
                _signal.cancel();
            }

            // the remote end goes away; the reader sees the channel closed
            void dropConnection()
            {
                _open = false;
                _signal.cancel();
            }

            std::size_t countSent(const std::string & method) const
            {
                std::size_t count = 0;
                for(const auto & message : sent)
                {
                    if(message.value("method", "") == method)
                    {
                        ++count;
                    }
                }
                return count;
            }

            std::deque<Result<void>> open_results;
            std::size_t open_calls = 0;

            std::vector<nlohmann::json> sent;
            std::function<void(const nlohmann::json &)> on_send;

        private:
            asio::steady_timer _signal;
            std::deque<Result<nlohmann::json>> _incoming;
            bool _open = false;
    };
}
