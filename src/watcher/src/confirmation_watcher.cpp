#include "confirmation_watcher.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace txgate::watcher
{
    using json = nlohmann::json;

    namespace
    {
        bool _carriesError(const json & result)
        {
            if(!result.is_object() || !result.contains("value"))
            {
                return false;
            }
            const json & value = result["value"];
            return value.is_object() && value.contains("err") && !value["err"].is_null();
        }

        std::string _errorText(const json & error)
        {
            if(error.is_object() && error.contains("message") && error["message"].is_string())
            {
                return error["message"].get<std::string>();
            }
            return error.dump();
        }
    }

    ConfirmationWatcher::ConfirmationWatcher(asio::io_context & io_context, std::unique_ptr<ILiveChannel> channel, WatcherConfig cfg)
    : _strand(asio::make_strand(io_context)),
      _channel(std::move(channel)),
      _cfg(std::move(cfg)),
      _reconnect_timer(_strand)
    {
    }

    ConfirmationWatcher::~ConfirmationWatcher()
    {
        if(_channel)
        {
            _channel->close();
        }
    }

    const WatcherConfig & ConfirmationWatcher::config() const noexcept
    {
        return _cfg;
    }

    WatcherState ConfirmationWatcher::state() const noexcept
    {
        return _state.load();
    }

    std::size_t ConfirmationWatcher::reconnectAttempts() const noexcept
    {
        return _reconnect_attempts.load();
    }

    std::chrono::milliseconds ConfirmationWatcher::reconnectDelay(const std::size_t attempt, const std::chrono::milliseconds base, const std::chrono::milliseconds cap)
    {
        if(attempt >= 31)
        {
            return cap;
        }
        const std::chrono::milliseconds delay = base * (std::int64_t{1} << attempt);
        return std::min(delay, cap);
    }

    std::string ConfirmationWatcher::_serverKey(const json & server_id)
    {
        if(server_id.is_string())
        {
            return server_id.get<std::string>();
        }
        return server_id.dump();
    }

    json ConfirmationWatcher::_subscribeRequest(const Subscription & subscription) const
    {
        return json{
            {"jsonrpc", "2.0"},
            {"id", subscription.local_id},
            {"method", subscription.kind == Kind::SIGNATURE ? _cfg.subscribe_method : _cfg.account_subscribe_method},
            {"params", json::array({subscription.target, json{{"commitment", _cfg.commitment}}})}
        };
    }

    void ConfirmationWatcher::_sendDetached(json message)
    {
        asio::co_spawn(_strand, [this, message = std::move(message)]() -> asio::awaitable<void>
        {
            const auto res = co_await _channel->send(message);
            if(!res)
            {
                spdlog::warn("Failed to send {} to live channel: {}", message.value("method", "message"), res.error().message);
            }
        }, asio::detached);
    }

    void ConfirmationWatcher::_sendUnsubscribe(const Kind kind, const json & server_id)
    {
        if(_state != WatcherState::CONNECTED)
        {
            return;
        }

        _sendDetached(json{
            {"jsonrpc", "2.0"},
            {"id", _next_id++},
            {"method", kind == Kind::SIGNATURE ? _cfg.unsubscribe_method : _cfg.account_unsubscribe_method},
            {"params", json::array({server_id})}
        });
    }

    void ConfirmationWatcher::_complete(const SubscriptionPtr & subscription, Result<WatchResult> outcome)
    {
        if(subscription->outcome)
        {
            return;
        }

        subscription->outcome = std::move(outcome);
        if(subscription->timer)
        {
            subscription->timer->cancel();
        }
    }

    void ConfirmationWatcher::_forget(const SubscriptionPtr & subscription)
    {
        if(subscription->server_id)
        {
            if(_by_server.erase(_serverKey(*subscription->server_id)) > 0)
            {
                _sendUnsubscribe(subscription->kind, *subscription->server_id);
            }
            subscription->server_id.reset();
            return;
        }

        if(_by_local.erase(subscription->local_id) > 0)
        {
            _abandoned.insert_or_assign(subscription->local_id, subscription->kind);
        }
    }

    void ConfirmationWatcher::_failAll(const std::string & reason)
    {
        std::size_t failed = 0;
        const auto fail = [&](const SubscriptionPtr & subscription)
        {
            if(subscription->kind == Kind::SIGNATURE)
            {
                _complete(subscription, makeError(GatewayError::Kind::SUBSCRIPTION_LOST,
                    std::format("connection lost while watching {}: {}", subscription->target, reason)));
                ++failed;
            }
        };

        for(const auto & [local_id, subscription] : _by_local)
        {
            fail(subscription);
        }
        for(const auto & [server_key, subscription] : _by_server)
        {
            fail(subscription);
        }

        _by_local.clear();
        _by_server.clear();
        _abandoned.clear();

        for(auto & [local_id, subscription] : _standing)
        {
            subscription->server_id.reset();
        }

        if(failed > 0)
        {
            spdlog::warn("{} pending watch(es) rejected: {}", failed, reason);
        }
    }

    void ConfirmationWatcher::_route(const json & message)
    {
        if(!message.is_object())
        {
            spdlog::warn("Dropping non-object live channel message");
            return;
        }

        if(message.contains("method"))
        {
            _onNotification(message);
        }
        else if(message.contains("error"))
        {
            _onError(message);
        }
        else if(message.contains("id") && message.contains("result"))
        {
            _onAck(message);
        }
        else
        {
            spdlog::warn("Dropping unrecognized live channel message: {}", message.dump());
        }
    }

    void ConfirmationWatcher::_onAck(const json & message)
    {
        const json & id = message["id"];
        if(!id.is_number_unsigned() && !id.is_number_integer())
        {
            spdlog::warn("Dropping acknowledgement with invalid id: {}", message.dump());
            return;
        }

        const std::uint64_t local_id = id.get<std::uint64_t>();
        const json & server_id = message["result"];

        if(server_id.is_boolean())
        {
            spdlog::debug("Unsubscribe request {} acknowledged: {}", local_id, server_id.get<bool>());
            return;
        }

        if(!server_id.is_number_integer() && !server_id.is_string())
        {
            spdlog::warn("Dropping acknowledgement {} with malformed subscription id: {}", local_id, server_id.dump());
            return;
        }

        auto it = _by_local.find(local_id);
        if(it == _by_local.end())
        {
            Kind kind = Kind::SIGNATURE;
            if(auto abandoned = _abandoned.find(local_id); abandoned != _abandoned.end())
            {
                kind = abandoned->second;
                _abandoned.erase(abandoned);
                spdlog::debug("Late acknowledgement of abandoned request {}, unsubscribing {}", local_id, _serverKey(server_id));
            }
            else
            {
                spdlog::warn("Acknowledgement for unknown request {}, unsubscribing {}", local_id, _serverKey(server_id));
            }
            _sendUnsubscribe(kind, server_id);
            return;
        }

        SubscriptionPtr subscription = it->second;
        _by_local.erase(it);

        const std::string server_key = _serverKey(server_id);
        if(_by_server.contains(server_key))
        {
            spdlog::warn("Server subscription id {} reused, replacing previous subscription", server_key);
        }

        subscription->server_id = server_id;
        _by_server.insert_or_assign(server_key, std::move(subscription));
        spdlog::debug("Remapped subscription {} to server id {}", local_id, server_key);
    }

    void ConfirmationWatcher::_onNotification(const json & message)
    {
        if(!message["method"].is_string())
        {
            spdlog::warn("Dropping notification with invalid method");
            return;
        }

        const std::string method = message["method"].get<std::string>();
        if(method != _cfg.notification_method && method != _cfg.account_notification_method)
        {
            spdlog::debug("Ignoring live channel method `{}`", method);
            return;
        }

        if(!message.contains("params") || !message["params"].is_object() || !message["params"].contains("subscription"))
        {
            spdlog::warn("Dropping `{}` without subscription id", method);
            return;
        }

        const json & params = message["params"];
        const std::string server_key = _serverKey(params["subscription"]);

        auto it = _by_server.find(server_key);
        if(it == _by_server.end())
        {
            spdlog::warn("Dropping `{}` for unknown subscription {}", method, server_key);
            return;
        }

        const json result = params.contains("result") ? params["result"] : json(nullptr);
        SubscriptionPtr subscription = it->second;

        if(subscription->kind == Kind::ACCOUNT)
        {
            if(!subscription->callback)
            {
                return;
            }

            try
            {
                subscription->callback(result);
            }
            catch(const std::exception & e)
            {
                spdlog::error("Account callback for {} failed: {}", subscription->target, e.what());
            }
            return;
        }

        _by_server.erase(it);
        _sendUnsubscribe(Kind::SIGNATURE, *subscription->server_id);

        const bool failed = _carriesError(result);
        if(failed)
        {
            spdlog::info("Transaction {} failed: {}", subscription->target, result["value"]["err"].dump());
        }
        else
        {
            spdlog::info("Transaction {} confirmed via live channel", subscription->target);
        }

        _complete(subscription, WatchResult{
            .confirmed = !failed,
            .data = result
        });
    }

    void ConfirmationWatcher::_onError(const json & message)
    {
        const std::string text = _errorText(message["error"]);

        if(!message.contains("id") || (!message["id"].is_number_unsigned() && !message["id"].is_number_integer()))
        {
            spdlog::error("Live channel error: {}", text);
            return;
        }

        const std::uint64_t local_id = message["id"].get<std::uint64_t>();
        auto it = _by_local.find(local_id);
        if(it == _by_local.end())
        {
            _abandoned.erase(local_id);
            spdlog::warn("Live channel error for request {}: {}", local_id, text);
            return;
        }

        SubscriptionPtr subscription = it->second;
        _by_local.erase(it);

        spdlog::error("Subscription {} for {} rejected: {}", local_id, subscription->target, text);

        // standing subscriptions are retried on the next reconnect
        if(subscription->kind == Kind::SIGNATURE)
        {
            _complete(subscription, makeError(GatewayError::Kind::SUBSCRIPTION_ERROR, text));
        }
    }

    void ConfirmationWatcher::_onOpened()
    {
        _state = WatcherState::CONNECTED;
        _reconnect_attempts = 0;
        const std::uint64_t generation = ++_generation;

        asio::co_spawn(_strand, _readLoop(generation), asio::detached);

        for(auto & [local_id, subscription] : _standing)
        {
            subscription->server_id.reset();
            _by_local.insert_or_assign(local_id, subscription);
            _sendDetached(_subscribeRequest(*subscription));
        }

        spdlog::info("Live channel connected, {} standing subscription(s) restored", _standing.size());
    }

    asio::awaitable<Result<void>> ConfirmationWatcher::connect()
    {
        co_await utils::ensureOnStrand(_strand);

        if(_state == WatcherState::CONNECTED)
        {
            co_return Result<void>{};
        }
        if(_state == WatcherState::CONNECTING)
        {
            co_return makeError(GatewayError::Kind::NOT_READY, "live channel connection already in progress");
        }

        _closing = false;
        _state = WatcherState::CONNECTING;
        const std::uint64_t generation = ++_generation;
        _reconnect_timer.cancel();

        const auto opened = co_await _channel->open();
        co_await utils::ensureOnStrand(_strand);

        if(generation != _generation)
        {
            if(opened)
            {
                _channel->close();
            }
            co_return makeError(GatewayError::Kind::NOT_CONNECTED, "connection attempt superseded");
        }

        if(!opened)
        {
            _state = WatcherState::DISCONNECTED;
            spdlog::warn("Failed to open live channel, callers fall back to polling: {}", opened.error().message);
            co_return makeError(GatewayError::Kind::REMOTE_UNAVAILABLE, opened.error().message);
        }

        _onOpened();
        co_return Result<void>{};
    }

    asio::awaitable<void> ConfirmationWatcher::_readLoop(const std::uint64_t generation)
    {
        while(true)
        {
            auto message = co_await _channel->receive();
            co_await utils::ensureOnStrand(_strand);

            if(generation != _generation)
            {
                co_return;
            }

            if(!message)
            {
                if(message.error().kind == GatewayError::Kind::RPC_MALFORMED)
                {
                    spdlog::warn("Dropping malformed live channel message: {}", message.error().message);
                    continue;
                }

                spdlog::warn("Live channel closed: {}", message.error().message);
                _failAll(message.error().message);

                if(_closing)
                {
                    _state = WatcherState::DISCONNECTED;
                    co_return;
                }

                _state = WatcherState::RECONNECTING;
                asio::co_spawn(_strand, _reconnectLoop(++_generation), asio::detached);
                co_return;
            }

            _route(*message);
        }
    }

    asio::awaitable<void> ConfirmationWatcher::_reconnectLoop(const std::uint64_t generation)
    {
        for(std::size_t attempt = 1; attempt <= _cfg.max_attempts; ++attempt)
        {
            _reconnect_attempts = attempt;
            const auto delay = reconnectDelay(attempt, _cfg.base_delay, _cfg.cap_delay);
            spdlog::info("Reconnecting live channel in {}ms ({}/{})", delay.count(), attempt, _cfg.max_attempts);

            _reconnect_timer.expires_after(delay);
            asio::error_code ec;
            co_await _reconnect_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            co_await utils::ensureOnStrand(_strand);

            if(generation != _generation || _closing)
            {
                co_return;
            }

            _state = WatcherState::CONNECTING;
            const auto opened = co_await _channel->open();
            co_await utils::ensureOnStrand(_strand);

            if(generation != _generation || _closing)
            {
                if(opened)
                {
                    _channel->close();
                }
                co_return;
            }

            if(opened)
            {
                _onOpened();
                co_return;
            }

            spdlog::warn("Live channel reconnect {}/{} failed: {}", attempt, _cfg.max_attempts, opened.error().message);
            _state = WatcherState::RECONNECTING;
        }

        spdlog::error("Live channel reconnect gave up after {} attempt(s), watcher disconnected", _cfg.max_attempts);
        _state = WatcherState::DISCONNECTED;
    }

    asio::awaitable<Result<WatchResult>> ConfirmationWatcher::watch(std::string target, const std::chrono::milliseconds timeout)
    {
        if(target.empty())
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "watch target must not be empty");
        }

        co_await utils::ensureOnStrand(_strand);

        if(_state != WatcherState::CONNECTED)
        {
            co_return makeError(GatewayError::Kind::NOT_CONNECTED, std::format("live channel is {}", _state.load()));
        }

        auto subscription = std::make_shared<Subscription>();
        subscription->local_id = _next_id++;
        subscription->target = std::move(target);
        subscription->kind = Kind::SIGNATURE;
        subscription->timer = std::make_unique<asio::steady_timer>(_strand);
        subscription->timer->expires_after(timeout);

        _by_local.emplace(subscription->local_id, subscription);
        spdlog::debug("Watching {} under request {}", subscription->target, subscription->local_id);

        const auto sent = co_await _channel->send(_subscribeRequest(*subscription));
        co_await utils::ensureOnStrand(_strand);

        if(!sent && !subscription->outcome)
        {
            _by_local.erase(subscription->local_id);
            co_return std::unexpected(sent.error());
        }

        if(!subscription->outcome)
        {
            asio::error_code ec;
            co_await subscription->timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));
            co_await utils::ensureOnStrand(_strand);
        }

        if(subscription->outcome)
        {
            co_return std::move(*subscription->outcome);
        }

        spdlog::debug("Watch of {} timed out after {}ms", subscription->target, timeout.count());
        _forget(subscription);
        co_return WatchResult{
            .confirmed = false,
            .data = nullptr
        };
    }

    asio::awaitable<Result<std::uint64_t>> ConfirmationWatcher::subscribeAccount(std::string key, AccountCallback callback)
    {
        if(key.empty())
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "account key must not be empty");
        }

        co_await utils::ensureOnStrand(_strand);

        auto subscription = std::make_shared<Subscription>();
        subscription->local_id = _next_id++;
        subscription->target = std::move(key);
        subscription->kind = Kind::ACCOUNT;
        subscription->callback = std::move(callback);

        const std::uint64_t local_id = subscription->local_id;
        _standing.emplace(local_id, subscription);
        spdlog::info("Standing subscription {} for account {}", local_id, subscription->target);

        if(_state == WatcherState::CONNECTED)
        {
            _by_local.insert_or_assign(local_id, subscription);
            const auto sent = co_await _channel->send(_subscribeRequest(*subscription));
            co_await utils::ensureOnStrand(_strand);
            if(!sent)
            {
                spdlog::warn("Account subscription {} not sent, will be restored on reconnect: {}", local_id, sent.error().message);
            }
        }

        co_return local_id;
    }

    asio::awaitable<Result<void>> ConfirmationWatcher::unsubscribeAccount(const std::uint64_t local_id)
    {
        co_await utils::ensureOnStrand(_strand);

        auto it = _standing.find(local_id);
        if(it == _standing.end())
        {
            co_return makeError(GatewayError::Kind::NOT_FOUND, std::format("no standing subscription {}", local_id));
        }

        SubscriptionPtr subscription = it->second;
        _standing.erase(it);
        _forget(subscription);

        spdlog::info("Standing subscription {} for account {} removed", local_id, subscription->target);
        co_return Result<void>{};
    }

    asio::awaitable<void> ConfirmationWatcher::disconnect()
    {
        co_await utils::ensureOnStrand(_strand);

        _closing = true;
        ++_generation;
        _state = WatcherState::DISCONNECTED;
        _reconnect_timer.cancel();

        _failAll("watcher disconnected");
        _channel->close();

        spdlog::info("Live channel disconnected");
    }

    asio::awaitable<std::size_t> ConfirmationWatcher::pendingCount() const
    {
        co_await utils::ensureOnStrand(_strand);
        co_return _by_local.size() + _by_server.size();
    }
}
