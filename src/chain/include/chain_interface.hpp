#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "error.hpp"

namespace txgate::chain
{
    /**
     * @brief Fee level reported by a node, in the chain's display unit (gwei on EVM chains).
     */
    struct FeeEstimate
    {
        double base_fee = 0.0;
        std::optional<double> priority_fee;
    };

    enum class ReceiptStatus : std::uint8_t
    {
        NOT_FOUND = 0,
        IN_MEMPOOL,
        CONFIRMED,
        FAILED
    };

    struct TxStatusReport
    {
        ReceiptStatus status = ReceiptStatus::NOT_FOUND;
        std::optional<std::uint64_t> block_number;
        nlohmann::json data = nullptr;
    };

    /**
     * @brief Capabilities the lifecycle engine needs from a chain.
     *
     * Every call may suspend. Transport failures surface as REMOTE_UNAVAILABLE.
     */
    class IChain
    {
    public:
        virtual ~IChain() = default;

        virtual const std::string & chainName() const noexcept = 0;

        virtual const std::string & network() const noexcept = 0;

        virtual std::uint64_t chainId() const noexcept = 0;

        // number of transactions the node knows for the address, pending included
        virtual asio::awaitable<Result<std::uint64_t>> reportedNonce(const std::string & address) = 0;

        // number of transactions of the address included in blocks
        virtual asio::awaitable<Result<std::uint64_t>> confirmedNonce(const std::string & address) = 0;

        virtual asio::awaitable<Result<std::string>> submitRaw(const std::string & signed_tx) = 0;

        virtual asio::awaitable<Result<FeeEstimate>> feeEstimate() = 0;

        virtual asio::awaitable<Result<TxStatusReport>> txStatus(const std::string & tx_hash) = 0;
    };
}

template <>
struct std::formatter<txgate::chain::ReceiptStatus> : std::formatter<std::string>
{
    auto format(const txgate::chain::ReceiptStatus & status, format_context & ctx) const
    {
        switch(status)
        {
            case txgate::chain::ReceiptStatus::NOT_FOUND : return formatter<string>::format("not found", ctx);
            case txgate::chain::ReceiptStatus::IN_MEMPOOL : return formatter<string>::format("in mempool", ctx);
            case txgate::chain::ReceiptStatus::CONFIRMED : return formatter<string>::format("confirmed", ctx);
            case txgate::chain::ReceiptStatus::FAILED : return formatter<string>::format("failed", ctx);
            default: return formatter<string>::format("unknown", ctx);
        }
    }
};
