#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "error.hpp"
#include "async_mutex.hpp"
#include "live_channel.hpp"

namespace txgate::watcher
{
    /**
     * @brief Newline delimited JSON-RPC over a plain TCP connection.
     */
    class TcpJsonChannel final : public ILiveChannel
    {
    public:
        static constexpr std::size_t MAX_MESSAGE_SIZE = 4 * 1024 * 1024;

        TcpJsonChannel(asio::io_context & io_context, std::string host, std::uint16_t port);

        TcpJsonChannel(const TcpJsonChannel&) = delete;
        TcpJsonChannel& operator=(const TcpJsonChannel&) = delete;

        ~TcpJsonChannel() override;

        asio::awaitable<Result<void>> open() override;

        asio::awaitable<Result<void>> send(const nlohmann::json & message) override;

        asio::awaitable<Result<nlohmann::json>> receive() override;

        void close() override;

        bool isOpen() const noexcept override;

    private:
        void _closeSocket();

        asio::strand<asio::io_context::executor_type> _strand;
        std::string _host;
        std::uint16_t _port;

        asio::ip::tcp::resolver _resolver;
        asio::ip::tcp::socket _socket;
        utils::AsyncMutex _write_mutex;

        std::string _read_buffer;
        std::atomic<bool> _open = false;
    };
}
