#include "rpc.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "native.h"

namespace txgate::chain
{
    using json = nlohmann::json;

    namespace
    {
        // curl exit codes that guarantee the request never left this host
        constexpr int CURL_COULDNT_RESOLVE_HOST = 6;
        constexpr int CURL_COULDNT_CONNECT = 7;

        std::atomic<std::uint64_t> _request_id{1};
    }

    Result<json> rpcCallWithCurl(const std::string & rpc_url, const json & request)
    {
        std::vector<std::string> args{
            "-sS",
            "--max-time", "30",
            "-X", "POST",
            rpc_url,
            "-H", "Content-Type: application/json",
            "--data", request.dump()
        };

        const auto [exit_code, output] = native::runProcess("curl", std::move(args));
        if(exit_code != 0)
        {
            spdlog::error("Chain RPC call failed (exit={}): {}", exit_code, output);
            return makeError(
                GatewayError::Kind::REMOTE_UNAVAILABLE,
                std::format("curl failed with code {}: {}", exit_code, output),
                exit_code != CURL_COULDNT_RESOLVE_HOST && exit_code != CURL_COULDNT_CONNECT);
        }

        json response = json::parse(output, nullptr, false);
        if(response.is_discarded())
        {
            return makeError(GatewayError::Kind::RPC_MALFORMED, std::format("Invalid JSON response: {}", output), true);
        }

        return response;
    }

    Result<json> rpcResult(const RpcCall & rpc_call, const std::string & rpc_url, const std::string & method, json params)
    {
        if(!rpc_call)
        {
            return makeError(GatewayError::Kind::INVALID_CONFIG, "No RPC call provider");
        }

        const json request{
            {"jsonrpc", "2.0"},
            {"id", _request_id.fetch_add(1)},
            {"method", method},
            {"params", std::move(params)}
        };

        auto response = rpc_call(rpc_url, request);
        if(!response)
        {
            return std::unexpected(response.error());
        }

        if(!response->is_object())
        {
            return makeError(GatewayError::Kind::RPC_MALFORMED, std::format("RPC '{}' returned non-object response", method), true);
        }

        if(response->contains("error") && !(*response)["error"].is_null())
        {
            const json & error = (*response)["error"];
            const std::string message = (error.is_object() && error.contains("message") && error["message"].is_string())
                ? error["message"].get<std::string>()
                : error.dump();

            spdlog::debug("Chain RPC error on '{}': {}", method, error.dump());
            return makeError(GatewayError::Kind::RPC_ERROR, message);
        }

        if(!response->contains("result"))
        {
            return makeError(GatewayError::Kind::RPC_MALFORMED, std::format("RPC '{}' response missing result field", method), true);
        }

        return (*response)["result"];
    }
}
