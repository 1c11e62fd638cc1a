#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "error.hpp"

namespace txgate::chain
{
    /**
     * @brief Transport for one JSON-RPC request.
     *
     * Returns the full response document. Transport failures are REMOTE_UNAVAILABLE;
     * `submission_attempted` tells whether the request may have reached the node.
     */
    using RpcCall = std::function<Result<nlohmann::json>(const std::string & rpc_url, const nlohmann::json & request)>;

    Result<nlohmann::json> rpcCallWithCurl(const std::string & rpc_url, const nlohmann::json & request);

    /**
     * @brief Sends `method` and extracts the `result` member.
     *
     * A node `error` member becomes RPC_ERROR carrying the error message,
     * a response without `result` becomes RPC_MALFORMED.
     */
    Result<nlohmann::json> rpcResult(const RpcCall & rpc_call, const std::string & rpc_url, const std::string & method, nlohmann::json params);
}
