#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>
#include <absl/container/flat_hash_map.h>
#include <nlohmann/json.hpp>

#include "error.hpp"
#include "live_channel.hpp"

namespace txgate::watcher
{
    enum class WatcherState : std::uint8_t
    {
        DISCONNECTED = 0,
        CONNECTING,
        CONNECTED,
        RECONNECTING
    };

    struct WatcherConfig
    {
        std::size_t max_attempts = 5;
        std::chrono::milliseconds base_delay{1000};
        std::chrono::milliseconds cap_delay{30'000};

        std::string commitment = "confirmed";

        std::string subscribe_method = "signatureSubscribe";
        std::string unsubscribe_method = "signatureUnsubscribe";
        std::string notification_method = "signatureNotification";

        std::string account_subscribe_method = "accountSubscribe";
        std::string account_unsubscribe_method = "accountUnsubscribe";
        std::string account_notification_method = "accountNotification";
    };

    struct WatchResult
    {
        bool confirmed = false;
        nlohmann::json data = nullptr;
    };

    using AccountCallback = std::function<void(const nlohmann::json & data)>;

    /**
     * @brief Multiplexes confirmation waits over one live channel.
     *
     * Requests carry a locally generated id until the node acknowledges them with
     * its own subscription id. A subscription is keyed by exactly one of the two at
     * any time. One-shot watches fail with SUBSCRIPTION_LOST when the channel drops;
     * standing account subscriptions are sent again after every reconnect.
     */
    class ConfirmationWatcher
    {
    public:
        ConfirmationWatcher(asio::io_context & io_context, std::unique_ptr<ILiveChannel> channel, WatcherConfig cfg = {});

        ConfirmationWatcher(const ConfirmationWatcher&) = delete;
        ConfirmationWatcher& operator=(const ConfirmationWatcher&) = delete;

        ~ConfirmationWatcher();

        const WatcherConfig & config() const noexcept;

        WatcherState state() const noexcept;

        /**
         * @brief Delay before reconnect attempt `attempt` (counted from 1): min(base * 2^attempt, cap).
         */
        static std::chrono::milliseconds reconnectDelay(std::size_t attempt, std::chrono::milliseconds base, std::chrono::milliseconds cap);

        asio::awaitable<Result<void>> connect();

        /**
         * @brief Waits for a confirmation notification of `target`.
         *
         * Resolves with `confirmed = false` on timeout. Fails with NOT_CONNECTED when the
         * channel is down, SUBSCRIPTION_LOST when it drops mid-wait and SUBSCRIPTION_ERROR
         * when the node rejects the request.
         */
        asio::awaitable<Result<WatchResult>> watch(std::string target, std::chrono::milliseconds timeout);

        asio::awaitable<Result<std::uint64_t>> subscribeAccount(std::string key, AccountCallback callback);

        asio::awaitable<Result<void>> unsubscribeAccount(std::uint64_t local_id);

        /**
         * @brief Closes the channel with no reconnect. Pending watches fail with SUBSCRIPTION_LOST.
         */
        asio::awaitable<void> disconnect();

        // counters for inspection
        asio::awaitable<std::size_t> pendingCount() const;
        std::size_t reconnectAttempts() const noexcept;

    private:
        enum class Kind : std::uint8_t
        {
            SIGNATURE,
            ACCOUNT
        };

        struct Subscription
        {
            std::uint64_t local_id = 0;
            std::optional<nlohmann::json> server_id;
            std::string target;
            Kind kind = Kind::SIGNATURE;

            // one-shot completion; the timer is cancelled once `outcome` is set
            std::unique_ptr<asio::steady_timer> timer;
            std::optional<Result<WatchResult>> outcome;

            AccountCallback callback;
        };

        using SubscriptionPtr = std::shared_ptr<Subscription>;

        static std::string _serverKey(const nlohmann::json & server_id);

        nlohmann::json _subscribeRequest(const Subscription & subscription) const;

        void _sendDetached(nlohmann::json message);

        void _sendUnsubscribe(Kind kind, const nlohmann::json & server_id);

        void _complete(const SubscriptionPtr & subscription, Result<WatchResult> outcome);

        void _forget(const SubscriptionPtr & subscription);

        void _failAll(const std::string & reason);

        void _route(const nlohmann::json & message);

        void _onAck(const nlohmann::json & message);

        void _onNotification(const nlohmann::json & message);

        void _onError(const nlohmann::json & message);

        void _onOpened();

        asio::awaitable<void> _readLoop(std::uint64_t generation);

        asio::awaitable<void> _reconnectLoop(std::uint64_t generation);

        asio::strand<asio::io_context::executor_type> _strand;
        std::unique_ptr<ILiveChannel> _channel;
        WatcherConfig _cfg;

        std::atomic<WatcherState> _state = WatcherState::DISCONNECTED;
        std::atomic<std::size_t> _reconnect_attempts = 0;

        // bumped on every open and close; stale reader and reconnect tasks compare against it
        std::uint64_t _generation = 0;
        bool _closing = false;

        std::uint64_t _next_id = 1;

        absl::flat_hash_map<std::uint64_t, SubscriptionPtr> _by_local;
        absl::flat_hash_map<std::string, SubscriptionPtr> _by_server;

        // removed before the node acknowledged them; the late ack is answered with an unsubscribe
        absl::flat_hash_map<std::uint64_t, Kind> _abandoned;

        absl::flat_hash_map<std::uint64_t, SubscriptionPtr> _standing;

        asio::steady_timer _reconnect_timer;
    };
}

template <>
struct std::formatter<txgate::watcher::WatcherState> : std::formatter<std::string>
{
    auto format(const txgate::watcher::WatcherState & state, format_context & ctx) const
    {
        switch(state)
        {
            case txgate::watcher::WatcherState::DISCONNECTED : return formatter<string>::format("DISCONNECTED", ctx);
            case txgate::watcher::WatcherState::CONNECTING : return formatter<string>::format("CONNECTING", ctx);
            case txgate::watcher::WatcherState::CONNECTED : return formatter<string>::format("CONNECTED", ctx);
            case txgate::watcher::WatcherState::RECONNECTING : return formatter<string>::format("RECONNECTING", ctx);
            default: return formatter<string>::format("UNKNOWN", ctx);
        }
    }
};
