#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "error.hpp"

namespace txgate::watcher
{
    /**
     * @brief Bidirectional message channel to a node's live-update endpoint.
     *
     * receive() is called by a single reader at a time. A failed receive means the
     * channel is closed, except RPC_MALFORMED which only discards one message.
     */
    class ILiveChannel
    {
    public:
        virtual ~ILiveChannel() = default;

        virtual asio::awaitable<Result<void>> open() = 0;

        virtual asio::awaitable<Result<void>> send(const nlohmann::json & message) = 0;

        virtual asio::awaitable<Result<nlohmann::json>> receive() = 0;

        virtual void close() = 0;

        virtual bool isOpen() const noexcept = 0;
    };
}
