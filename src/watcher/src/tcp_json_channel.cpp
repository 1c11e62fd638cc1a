#include "tcp_json_channel.hpp"

#include <format>
#include <utility>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace txgate::watcher
{
    using json = nlohmann::json;

    TcpJsonChannel::TcpJsonChannel(asio::io_context & io_context, std::string host, std::uint16_t port)
    : _strand(asio::make_strand(io_context)),
      _host(std::move(host)),
      _port(port),
      _resolver(_strand),
      _socket(_strand),
      _write_mutex(_strand)
    {
    }

    TcpJsonChannel::~TcpJsonChannel()
    {
        _closeSocket();
    }

    asio::awaitable<Result<void>> TcpJsonChannel::open()
    {
        co_await utils::ensureOnStrand(_strand);

        _closeSocket();
        _read_buffer.clear();

        asio::error_code ec;
        const auto endpoints = co_await _resolver.async_resolve(_host, std::to_string(_port), asio::redirect_error(asio::use_awaitable, ec));
        co_await utils::ensureOnStrand(_strand);
        if(ec)
        {
            co_return makeError(GatewayError::Kind::REMOTE_UNAVAILABLE, std::format("Failed to resolve {}:{}: {}", _host, _port, ec.message()));
        }

        co_await asio::async_connect(_socket, endpoints, asio::redirect_error(asio::use_awaitable, ec));
        co_await utils::ensureOnStrand(_strand);
        if(ec)
        {
            _closeSocket();
            co_return makeError(GatewayError::Kind::REMOTE_UNAVAILABLE, std::format("Failed to connect to {}:{}: {}", _host, _port, ec.message()));
        }

        _socket.set_option(asio::ip::tcp::no_delay(true), ec);
        _open = true;
        spdlog::debug("Live channel connected to {}:{}", _host, _port);
        co_return Result<void>{};
    }

    asio::awaitable<Result<void>> TcpJsonChannel::send(const json & message)
    {
        co_await utils::ensureOnStrand(_strand);

        // one writer at a time, or concurrent async_write calls interleave bytes
        auto guard = co_await _write_mutex.scopedLock();
        co_await utils::ensureOnStrand(_strand);

        if(!_open)
        {
            co_return makeError(GatewayError::Kind::NOT_CONNECTED, "live channel is not open");
        }

        const std::string line = message.dump() + "\n";

        asio::error_code ec;
        co_await asio::async_write(_socket, asio::buffer(line), asio::redirect_error(asio::use_awaitable, ec));
        co_await utils::ensureOnStrand(_strand);
        if(ec)
        {
            _closeSocket();
            co_return makeError(GatewayError::Kind::SUBSCRIPTION_LOST, std::format("write failed: {}", ec.message()));
        }
        co_return Result<void>{};
    }

    asio::awaitable<Result<json>> TcpJsonChannel::receive()
    {
        co_await utils::ensureOnStrand(_strand);

        if(!_open)
        {
            co_return makeError(GatewayError::Kind::NOT_CONNECTED, "live channel is not open");
        }

        asio::error_code ec;
        const std::size_t line_size = co_await asio::async_read_until(_socket,
            asio::dynamic_buffer(_read_buffer, MAX_MESSAGE_SIZE), '\n',
            asio::redirect_error(asio::use_awaitable, ec));
        co_await utils::ensureOnStrand(_strand);

        if(ec)
        {
            _closeSocket();
            co_return makeError(GatewayError::Kind::SUBSCRIPTION_LOST, std::format("read failed: {}", ec.message()));
        }

        const std::string line = _read_buffer.substr(0, line_size - 1);
        _read_buffer.erase(0, line_size);

        json message = json::parse(line, nullptr, false);
        if(message.is_discarded())
        {
            co_return makeError(GatewayError::Kind::RPC_MALFORMED, "live channel received invalid JSON");
        }
        co_return message;
    }

    void TcpJsonChannel::close()
    {
        asio::dispatch(_strand, [this]()
        {
            _closeSocket();
        });
    }

    bool TcpJsonChannel::isOpen() const noexcept
    {
        return _open.load();
    }

    void TcpJsonChannel::_closeSocket()
    {
        _open = false;
        if(_socket.is_open())
        {
            asio::error_code ec;
            _socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            _socket.close(ec);
        }
    }
}
