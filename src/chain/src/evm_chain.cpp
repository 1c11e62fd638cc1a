#include "evm_chain.hpp"

#include <array>
#include <format>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace txgate::chain
{
    using json = nlohmann::json;

    namespace
    {
        constexpr double WEI_PER_GWEI = 1e9;

        // node messages meaning the nonce is already taken on the node side
        constexpr std::array<const char *, 4> NONCE_CONFLICT_MARKERS{
            "nonce too low",
            "already known",
            "replacement transaction underpriced",
            "nonce has already been used"
        };

        bool _isNonceConflictMessage(const std::string & message)
        {
            const std::string lowered = utils::toLower(message);
            for(const char * marker : NONCE_CONFLICT_MARKERS)
            {
                if(lowered.find(marker) != std::string::npos)
                {
                    return true;
                }
            }
            return false;
        }

        Result<std::uint64_t> _quantityFrom(const json & value, const std::string & what)
        {
            if(!value.is_string())
            {
                return makeError(GatewayError::Kind::RPC_MALFORMED, std::format("{} returned non-string result", what));
            }

            const auto parsed = utils::parseHexQuantity(value.get<std::string>());
            if(!parsed)
            {
                return makeError(GatewayError::Kind::RPC_MALFORMED, std::format("Failed to parse {} quantity", what));
            }
            return *parsed;
        }
    }

    EvmChain::EvmChain(EvmChainConfig cfg, asio::any_io_executor blocking_executor, RpcCall rpc_call)
    : _cfg(std::move(cfg)),
      _blocking_executor(std::move(blocking_executor)),
      _rpc_call(rpc_call ? std::move(rpc_call) : RpcCall{rpcCallWithCurl})
    {
    }

    const EvmChainConfig & EvmChain::config() const noexcept
    {
        return _cfg;
    }

    const std::string & EvmChain::chainName() const noexcept
    {
        return _cfg.chain;
    }

    const std::string & EvmChain::network() const noexcept
    {
        return _cfg.network;
    }

    std::uint64_t EvmChain::chainId() const noexcept
    {
        return _cfg.chain_id;
    }

    asio::awaitable<Result<json>> EvmChain::rpc(std::string method, json params)
    {
        if(_cfg.rpc_url.empty())
        {
            co_return makeError(GatewayError::Kind::INVALID_CONFIG, "rpc_url is empty");
        }

        // the transport blocks; run it off the caller's executor and resume there
        co_return co_await asio::co_spawn(
            _blocking_executor,
            [this, method = std::move(method), params = std::move(params)]() mutable -> asio::awaitable<Result<json>>
            {
                co_return rpcResult(_rpc_call, _cfg.rpc_url, method, std::move(params));
            },
            asio::use_awaitable);
    }

    asio::awaitable<Result<std::uint64_t>> EvmChain::reportedNonce(const std::string & address)
    {
        const auto res = co_await rpc("eth_getTransactionCount", json::array({address, "pending"}));
        if(!res)
        {
            co_return std::unexpected(res.error());
        }
        co_return _quantityFrom(*res, "eth_getTransactionCount");
    }

    asio::awaitable<Result<std::uint64_t>> EvmChain::confirmedNonce(const std::string & address)
    {
        const auto res = co_await rpc("eth_getTransactionCount", json::array({address, "latest"}));
        if(!res)
        {
            co_return std::unexpected(res.error());
        }
        co_return _quantityFrom(*res, "eth_getTransactionCount");
    }

    asio::awaitable<Result<std::string>> EvmChain::submitRaw(const std::string & signed_tx)
    {
        if(signed_tx.empty())
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "signed transaction must not be empty");
        }

        auto res = co_await rpc("eth_sendRawTransaction", json::array({utils::withHexPrefix(signed_tx)}));
        if(!res)
        {
            GatewayError error = res.error();
            if(error.kind == GatewayError::Kind::RPC_ERROR)
            {
                // the node answered and refused the payload
                error.kind = _isNonceConflictMessage(error.message)
                    ? GatewayError::Kind::NONCE_CONFLICT
                    : GatewayError::Kind::SUBMISSION_FAILED;
                error.submission_attempted = false;
            }
            co_return std::unexpected(std::move(error));
        }

        if(!res->is_string())
        {
            co_return makeError(GatewayError::Kind::RPC_MALFORMED, "eth_sendRawTransaction returned non-string result", true);
        }

        const std::string tx_hash = res->get<std::string>();
        spdlog::debug("[{}:{}] submitted {}", _cfg.chain, _cfg.network, tx_hash);
        co_return tx_hash;
    }

    asio::awaitable<Result<FeeEstimate>> EvmChain::feeEstimate()
    {
        const auto gas_price_res = co_await rpc("eth_gasPrice", json::array());
        if(!gas_price_res)
        {
            co_return std::unexpected(gas_price_res.error());
        }

        const auto base_fee = _quantityFrom(*gas_price_res, "eth_gasPrice");
        if(!base_fee)
        {
            co_return std::unexpected(base_fee.error());
        }

        FeeEstimate estimate;
        estimate.base_fee = static_cast<double>(*base_fee) / WEI_PER_GWEI;

        if(_cfg.query_priority_fee)
        {
            const auto priority_res = co_await rpc("eth_maxPriorityFeePerGas", json::array());
            if(priority_res)
            {
                if(const auto priority_fee = _quantityFrom(*priority_res, "eth_maxPriorityFeePerGas"))
                {
                    estimate.priority_fee = static_cast<double>(*priority_fee) / WEI_PER_GWEI;
                }
            }
            else
            {
                spdlog::warn("[{}:{}] eth_maxPriorityFeePerGas unavailable: {}", _cfg.chain, _cfg.network, priority_res.error().message);
            }
        }

        co_return estimate;
    }

    asio::awaitable<Result<TxStatusReport>> EvmChain::txStatus(const std::string & tx_hash)
    {
        const auto receipt_res = co_await rpc("eth_getTransactionReceipt", json::array({tx_hash}));
        if(!receipt_res)
        {
            co_return std::unexpected(receipt_res.error());
        }

        if(receipt_res->is_object())
        {
            TxStatusReport report;
            report.data = *receipt_res;

            if(receipt_res->contains("blockNumber") && (*receipt_res)["blockNumber"].is_string())
            {
                report.block_number = utils::parseHexQuantity((*receipt_res)["blockNumber"].get<std::string>());
            }

            // pre-byzantium receipts carry no status field
            report.status = ReceiptStatus::CONFIRMED;
            if(receipt_res->contains("status"))
            {
                const json & status = (*receipt_res)["status"];
                if(!status.is_string())
                {
                    co_return makeError(GatewayError::Kind::RPC_MALFORMED,
                        std::format("eth_getTransactionReceipt returned status of type {}", status.type_name()));
                }
                if(status.get<std::string>() == "0x0")
                {
                    report.status = ReceiptStatus::FAILED;
                }
            }
            co_return report;
        }

        if(!receipt_res->is_null())
        {
            co_return makeError(GatewayError::Kind::RPC_MALFORMED, "eth_getTransactionReceipt returned non-object result");
        }

        const auto tx_res = co_await rpc("eth_getTransactionByHash", json::array({tx_hash}));
        if(!tx_res)
        {
            co_return std::unexpected(tx_res.error());
        }

        TxStatusReport report;
        if(tx_res->is_object())
        {
            report.status = ReceiptStatus::IN_MEMPOOL;
            report.data = *tx_res;
        }
        co_return report;
    }
}
