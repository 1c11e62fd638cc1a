#pragma once

#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <format>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

using namespace std::chrono_literals;

#include "error.hpp"
#include "utils.hpp"
#include "async_mutex.hpp"
#include "cmd.hpp"
#include "config.hpp"
#include "storage.hpp"
#include "chain_interface.hpp"
#include "evm_chain.hpp"
#include "gas_price_oracle.hpp"
#include "pending_store.hpp"
#include "nonce_manager.hpp"
#include "live_channel.hpp"
#include "tcp_json_channel.hpp"
#include "confirmation_watcher.hpp"
#include "coordinator.hpp"
#include "chain_context.hpp"

namespace txgate
{
    constexpr int MAJOR_VERSION = 0;
    constexpr int MINOR_VERSION = 1;
    constexpr int PATCH_VERSION = 0;
}
