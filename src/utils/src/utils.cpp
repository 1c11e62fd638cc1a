#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <limits>

namespace txgate::utils
{
    Clock systemClock()
    {
        return []() { return std::chrono::system_clock::now(); };
    }

    std::string loadBuildTimestamp(const std::filesystem::path & path)
    {
        std::ifstream file(path);
        if (!file.is_open()) return "Unknown";
        std::string timestamp;
        std::getline(file, timestamp);
        return timestamp;
    }

    std::string currentTimestamp()
    {
        const auto zt{ std::chrono::zoned_time{
            std::chrono::current_zone(),
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())}
            };
        std::string ts = std::format("{:%F-%H_%M_%S}", zt);
        return ts;
    }

    asio::awaitable<void> ensureOnStrand(const asio::strand<asio::io_context::executor_type> & strand)
    {
        if (strand.running_in_this_thread())
        {
            co_return;
        }
        co_return co_await asio::dispatch(strand, asio::use_awaitable);
    }

    std::string toLower(std::string value)
    {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string withHexPrefix(std::string value)
    {
        if(value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0)
        {
            return value;
        }
        return std::string("0x") + value;
    }

    std::optional<std::uint64_t> parseHexQuantity(const std::string & value)
    {
        if(value.empty())
        {
            return std::nullopt;
        }

        const bool is_hex = value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0;
        const std::string digits = is_hex ? value.substr(2) : value;
        if(digits.empty())
        {
            return is_hex ? std::optional<std::uint64_t>(0) : std::nullopt;
        }

        const std::uint64_t base = is_hex ? 16 : 10;
        std::uint64_t out = 0;
        for(const char c : digits)
        {
            std::uint64_t digit = 0;
            if(c >= '0' && c <= '9')
            {
                digit = static_cast<std::uint64_t>(c - '0');
            }
            else if(is_hex && c >= 'a' && c <= 'f')
            {
                digit = static_cast<std::uint64_t>(10 + (c - 'a'));
            }
            else if(is_hex && c >= 'A' && c <= 'F')
            {
                digit = static_cast<std::uint64_t>(10 + (c - 'A'));
            }
            else
            {
                return std::nullopt;
            }

            if(out > (std::numeric_limits<std::uint64_t>::max() - digit) / base)
            {
                return std::nullopt;
            }
            out = out * base + digit;
        }

        return out;
    }

    std::int64_t toUnixMillis(const std::chrono::system_clock::time_point tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    std::chrono::system_clock::time_point fromUnixMillis(const std::int64_t ms)
    {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
    }
}
