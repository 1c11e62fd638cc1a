#include "unit-tests.hpp"

using namespace txgate;
using namespace txgate::tests;

namespace
{
    using json = nlohmann::json;

    // echoes the request id back as a subscription ack, then sends one broken line
    asio::awaitable<void> serveOnce(asio::ip::tcp::acceptor & acceptor, std::string & received)
    {
        auto socket = co_await acceptor.async_accept(asio::use_awaitable);

        std::string buffer;
        const std::size_t size = co_await asio::async_read_until(socket, asio::dynamic_buffer(buffer), '\n', asio::use_awaitable);
        received = buffer.substr(0, size - 1);

        const json request = json::parse(received);
        const std::string reply = json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", 42}}.dump() + "\n" + "{oops\n";
        co_await asio::async_write(socket, asio::buffer(reply), asio::use_awaitable);

        asio::error_code ec;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    }
}

TEST_F(UnitTest, TcpJsonChannel_ExchangesNewlineDelimitedJson)
{
    asio::io_context io_context{};
    asio::ip::tcp::acceptor acceptor(io_context, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    const std::uint16_t port = acceptor.local_endpoint().port();

    std::string received;
    asio::co_spawn(io_context, serveOnce(acceptor, received), asio::detached);

    watcher::TcpJsonChannel channel(io_context, "127.0.0.1", port);
    ASSERT_TRUE(runAwaitable(io_context, channel.open()).has_value());
    EXPECT_TRUE(channel.isOpen());

    ASSERT_TRUE(runAwaitable(io_context, channel.send(json{{"jsonrpc", "2.0"}, {"id", 7}, {"method", "signatureSubscribe"}})).has_value());

    const auto ack = runAwaitable(io_context, channel.receive());
    ASSERT_TRUE(ack.has_value());
    EXPECT_EQ((*ack)["id"], 7);
    EXPECT_EQ((*ack)["result"], 42);
    EXPECT_EQ(json::parse(received)["method"], "signatureSubscribe");

    const auto malformed = runAwaitable(io_context, channel.receive());
    ASSERT_FALSE(malformed.has_value());
    EXPECT_EQ(malformed.error().kind, GatewayError::Kind::RPC_MALFORMED);

    const auto closed = runAwaitable(io_context, channel.receive());
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().kind, GatewayError::Kind::SUBSCRIPTION_LOST);
    EXPECT_FALSE(channel.isOpen());
}

TEST_F(UnitTest, TcpJsonChannel_ConnectFailureIsRemoteUnavailable)
{
    asio::io_context io_context{};

    std::uint16_t port = 0;
    {
        // grab a free port and release it so nothing listens there
        asio::ip::tcp::acceptor reserve(io_context, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        port = reserve.local_endpoint().port();
    }

    watcher::TcpJsonChannel channel(io_context, "127.0.0.1", port);
    const auto res = runAwaitable(io_context, channel.open());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, GatewayError::Kind::REMOTE_UNAVAILABLE);

    const auto send = runAwaitable(io_context, channel.send(json::object()));
    ASSERT_FALSE(send.has_value());
    EXPECT_EQ(send.error().kind, GatewayError::Kind::NOT_CONNECTED);
}
