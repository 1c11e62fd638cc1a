#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include <asio.hpp>

namespace txgate::utils
{
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    Clock systemClock();

    std::string loadBuildTimestamp(const std::filesystem::path & path);

    std::string currentTimestamp();

    asio::awaitable<void> ensureOnStrand(const asio::strand<asio::io_context::executor_type> & strand);

    std::string toLower(std::string value);

    std::string withHexPrefix(std::string value);

    /**
     * @brief Parses a JSON-RPC quantity.
     *
     * Accepts `0x` prefixed hex or plain decimal strings.
     * Returns std::nullopt on empty input, invalid digits or overflow.
     */
    std::optional<std::uint64_t> parseHexQuantity(const std::string & value);

    std::int64_t toUnixMillis(std::chrono::system_clock::time_point tp);

    std::chrono::system_clock::time_point fromUnixMillis(std::int64_t ms);
}
