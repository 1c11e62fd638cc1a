#include "txgate.hpp"

static void _configureLogger(const std::filesystem::path& logs_path)
{
    std::filesystem::create_directories(logs_path);

    // Create sinks
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    const std::string log_name = txgate::utils::currentTimestamp() + "-txgated.log";
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (logs_path / log_name).string(), true);

    // set different log levels per sink
    console_sink->set_level(spdlog::level::info);
    file_sink->set_level(spdlog::level::debug);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

    spdlog::logger logger("multi_sink", {console_sink, file_sink});
    logger.set_level(spdlog::level::debug);
    logger.flush_on(spdlog::level::info);

    spdlog::set_default_logger(std::make_shared<spdlog::logger>(logger));
}

static asio::awaitable<void> _purgeLoop(txgate::pending::PendingTransactionStore & pending, asio::steady_timer & timer, std::chrono::milliseconds interval)
{
    if(interval.count() <= 0)
    {
        co_return;
    }

    while(true)
    {
        timer.expires_after(interval);
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if(ec == asio::error::operation_aborted)
        {
            co_return;
        }
        co_await pending.purgeExpired();
    }
}

static asio::awaitable<void> _startGateway(
    const txgate::config::GatewayConfig & gateway_cfg,
    asio::thread_pool & rpc_pool,
    txgate::pending::PendingTransactionStore & pending,
    txgate::gas::GasPriceOracle & oracle,
    txgate::watcher::ConfirmationWatcher * watcher,
    txgate::gateway::ChainContextRegistry & registry,
    asio::steady_timer & purge_timer)
{
    if(const auto loaded = co_await pending.load(); !loaded)
    {
        spdlog::error(std::format("Pending transactions not restored: {}", loaded.error()));
    }

    for(const auto & chain_settings : gateway_cfg.chains)
    {
        auto chain = std::make_unique<txgate::chain::EvmChain>(chain_settings.evm, rpc_pool.get_executor());
        if(const auto added = co_await registry.add(std::move(chain), chain_settings.fee_policy); !added)
        {
            spdlog::error(std::format("Chain {}:{} skipped: {}", chain_settings.evm.chain, chain_settings.evm.network, added.error()));
        }
    }

    // a chain whose node is unreachable stays not ready and rejects allocations
    if(const auto initialized = co_await registry.initAll(); !initialized)
    {
        spdlog::error(std::format("Nonce reconciliation incomplete: {}", initialized.error()));
    }

    asio::co_spawn(co_await asio::this_coro::executor, oracle.runRefreshLoop(), asio::detached);
    asio::co_spawn(co_await asio::this_coro::executor, _purgeLoop(pending, purge_timer, gateway_cfg.purge_interval), asio::detached);

    if(watcher != nullptr)
    {
        if(const auto connected = co_await watcher->connect(); !connected)
        {
            spdlog::warn(std::format("Live confirmation unavailable, status is served by polling: {}", connected.error()));
        }
    }

    spdlog::info("txgated ready, {} chain context(s)", (co_await registry.contexts()).size());
}

static asio::awaitable<void> _stopGateway(
    asio::io_context & io_context,
    txgate::gas::GasPriceOracle & oracle,
    txgate::watcher::ConfirmationWatcher * watcher,
    asio::steady_timer & purge_timer)
{
    oracle.stop();
    purge_timer.cancel();

    if(watcher != nullptr)
    {
        co_await watcher->disconnect();
    }

    io_context.stop();
}

int main(int argc, char* argv[])
{
    txgate::config::Config cfg;
    cfg.bin_path = std::filesystem::path(argv[0]).parent_path();
    cfg.logs_path = cfg.bin_path.parent_path() / "logs";
    cfg.storage_path = cfg.bin_path.parent_path() / "storage";
    cfg.config_path = cfg.bin_path.parent_path() / "config" / "txgated.json";

    txgate::cmd::ArgParser arg_parser;
    arg_parser.addArg("-h", txgate::cmd::CommandLineArgDef::NArgs::Zero, txgate::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--help", txgate::cmd::CommandLineArgDef::NArgs::Zero, txgate::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--version", txgate::cmd::CommandLineArgDef::NArgs::Zero, txgate::cmd::CommandLineArgDef::Type::Bool, "Display version and exit");
    arg_parser.addArg("--config", txgate::cmd::CommandLineArgDef::NArgs::One, txgate::cmd::CommandLineArgDef::Type::String, "Gateway configuration file (JSON)");
    arg_parser.addArg("--storage", txgate::cmd::CommandLineArgDef::NArgs::One, txgate::cmd::CommandLineArgDef::Type::String, "Directory of the durable nonce and pending transaction store");
    arg_parser.addArg("--logs", txgate::cmd::CommandLineArgDef::NArgs::One, txgate::cmd::CommandLineArgDef::Type::String, "Directory of the log files");

    arg_parser.parse(argc, argv);

    if(const auto logs_arg = arg_parser.getArg<std::vector<std::string>>("--logs"))
    {
        cfg.logs_path = logs_arg->at(0);
    }
    if(const auto storage_arg = arg_parser.getArg<std::vector<std::string>>("--storage"))
    {
        cfg.storage_path = storage_arg->at(0);
    }
    if(const auto config_arg = arg_parser.getArg<std::vector<std::string>>("--config"))
    {
        cfg.config_path = config_arg->at(0);
    }

    _configureLogger(cfg.logs_path);

    const std::string build_timestamp = txgate::utils::loadBuildTimestamp(cfg.bin_path / "build_timestamp");
    spdlog::debug("Build timestamp: {}", build_timestamp);
    spdlog::debug("Version: {}.{}.{}", txgate::MAJOR_VERSION, txgate::MINOR_VERSION, txgate::PATCH_VERSION);

    spdlog::debug("txgated started with {} arguments", argc);
    for(int i = 0; i < argc; ++i)
    {
        spdlog::debug("Argument at [{}] : {}", i, argv[i]);
    }

    if(arg_parser.getArg<bool>("--version").value_or(false))
    {
        spdlog::info("txgated build timestamp: {}", build_timestamp);
        spdlog::info("Version: {}.{}.{}", txgate::MAJOR_VERSION, txgate::MINOR_VERSION, txgate::PATCH_VERSION);
        return 0;
    }

    if(arg_parser.getArg<bool>("--help").value_or(false) || arg_parser.getArg<bool>("-h").value_or(false))
    {
        spdlog::info(arg_parser.constructHelpMessage());
        return 0;
    }

    txgate::config::GatewayConfig gateway_cfg;
    if(std::filesystem::exists(cfg.config_path))
    {
        auto loaded = txgate::config::loadGatewayConfig(cfg.config_path);
        if(!loaded)
        {
            spdlog::error(std::format("Invalid configuration: {}", loaded.error()));
            return 1;
        }
        gateway_cfg = std::move(*loaded);
    }
    else
    {
        spdlog::warn("Config file {} not found, running with defaults and no chains", cfg.config_path.string());
    }

    std::filesystem::create_directories(cfg.storage_path);
    spdlog::info("Storage path: {}", cfg.storage_path.string());

    asio::io_context io_context;
    asio::thread_pool rpc_pool(gateway_cfg.rpc_threads);

    txgate::storage::JsonFileStore store(cfg.storage_path);

    txgate::gas::GasPriceOracle oracle(io_context, gateway_cfg.gas);

    txgate::pending::PendingTransactionStore pending(io_context, store, gateway_cfg.pending);

    std::unique_ptr<txgate::watcher::ConfirmationWatcher> watcher;
    if(gateway_cfg.watcher.enabled)
    {
        watcher = std::make_unique<txgate::watcher::ConfirmationWatcher>(io_context,
            std::make_unique<txgate::watcher::TcpJsonChannel>(io_context, gateway_cfg.watcher.host, gateway_cfg.watcher.port),
            gateway_cfg.watcher.protocol);
    }

    txgate::gateway::ChainContextRegistry registry(io_context, store, oracle, pending, watcher.get(), gateway_cfg.nonce);

    asio::steady_timer purge_timer(io_context);

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code & ec, int signal_number)
    {
        if(ec)
        {
            return;
        }
        spdlog::info("Signal {} received, shutting down", signal_number);
        asio::co_spawn(io_context, _stopGateway(io_context, oracle, watcher.get(), purge_timer), asio::detached);
    });

    asio::co_spawn(io_context, _startGateway(gateway_cfg, rpc_pool, pending, oracle, watcher.get(), registry, purge_timer), asio::detached);

    int exit_code = 0;
    try
    {
        io_context.run();
    }
    catch(const std::exception & e)
    {
        spdlog::error("Error: {}", e.what());
        exit_code = 1;
    }

    rpc_pool.join();

    spdlog::debug("Program finished");
    return exit_code;
}
