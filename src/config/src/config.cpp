#include "config.hpp"

#include <format>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace txgate::config
{
    using json = nlohmann::json;

    namespace
    {
        Result<void> _invalid(const std::string & section, const std::string & key, const std::string & expected)
        {
            return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("`{}.{}` must be {}", section, key, expected));
        }

        Result<void> _readMillis(const json & object, const std::string & section, const std::string & key, std::chrono::milliseconds & out)
        {
            if(!object.contains(key))
            {
                return {};
            }
            const json & value = object[key];
            if(!value.is_number_integer() || value.get<std::int64_t>() < 0)
            {
                return _invalid(section, key, "a non-negative integer (milliseconds)");
            }
            out = std::chrono::milliseconds(value.get<std::int64_t>());
            return {};
        }

        Result<void> _readUnsigned(const json & object, const std::string & section, const std::string & key, std::uint64_t & out)
        {
            if(!object.contains(key))
            {
                return {};
            }
            const json & value = object[key];
            if(!value.is_number_unsigned() && !(value.is_number_integer() && value.get<std::int64_t>() >= 0))
            {
                return _invalid(section, key, "a non-negative integer");
            }
            out = value.get<std::uint64_t>();
            return {};
        }

        Result<void> _readDouble(const json & object, const std::string & section, const std::string & key, double & out)
        {
            if(!object.contains(key))
            {
                return {};
            }
            const json & value = object[key];
            if(!value.is_number())
            {
                return _invalid(section, key, "a number");
            }
            out = value.get<double>();
            return {};
        }

        Result<void> _readBool(const json & object, const std::string & section, const std::string & key, bool & out)
        {
            if(!object.contains(key))
            {
                return {};
            }
            const json & value = object[key];
            if(!value.is_boolean())
            {
                return _invalid(section, key, "a boolean");
            }
            out = value.get<bool>();
            return {};
        }

        Result<void> _readString(const json & object, const std::string & section, const std::string & key, std::string & out)
        {
            if(!object.contains(key))
            {
                return {};
            }
            const json & value = object[key];
            if(!value.is_string())
            {
                return _invalid(section, key, "a string");
            }
            out = value.get<std::string>();
            return {};
        }

        Result<const json *> _section(const json & document, const std::string & name)
        {
            if(!document.contains(name))
            {
                return nullptr;
            }
            const json & section = document[name];
            if(!section.is_object())
            {
                return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("`{}` must be an object", name));
            }
            return &section;
        }

        Result<void> _parseWatcher(const json & object, WatcherSettings & settings)
        {
            std::uint64_t port = settings.port;
            std::uint64_t max_attempts = settings.protocol.max_attempts;

            Result<void> res;
            if(!(res = _readBool(object, "watcher", "enabled", settings.enabled))) return res;
            if(!(res = _readString(object, "watcher", "host", settings.host))) return res;
            if(!(res = _readUnsigned(object, "watcher", "port", port))) return res;
            if(!(res = _readUnsigned(object, "watcher", "max_attempts", max_attempts))) return res;
            if(!(res = _readMillis(object, "watcher", "base_delay_ms", settings.protocol.base_delay))) return res;
            if(!(res = _readMillis(object, "watcher", "cap_delay_ms", settings.protocol.cap_delay))) return res;
            if(!(res = _readString(object, "watcher", "commitment", settings.protocol.commitment))) return res;

            if(port == 0 || port > std::numeric_limits<std::uint16_t>::max())
            {
                return _invalid("watcher", "port", "in range 1-65535");
            }
            settings.port = static_cast<std::uint16_t>(port);
            settings.protocol.max_attempts = static_cast<std::size_t>(max_attempts);

            if(object.contains("methods"))
            {
                const json & methods = object["methods"];
                if(!methods.is_object())
                {
                    return _invalid("watcher", "methods", "an object");
                }

                watcher::WatcherConfig & cfg = settings.protocol;
                if(!(res = _readString(methods, "watcher.methods", "subscribe", cfg.subscribe_method))) return res;
                if(!(res = _readString(methods, "watcher.methods", "unsubscribe", cfg.unsubscribe_method))) return res;
                if(!(res = _readString(methods, "watcher.methods", "notification", cfg.notification_method))) return res;
                if(!(res = _readString(methods, "watcher.methods", "account_subscribe", cfg.account_subscribe_method))) return res;
                if(!(res = _readString(methods, "watcher.methods", "account_unsubscribe", cfg.account_unsubscribe_method))) return res;
                if(!(res = _readString(methods, "watcher.methods", "account_notification", cfg.account_notification_method))) return res;
            }

            if(settings.enabled && settings.host.empty())
            {
                return _invalid("watcher", "host", "set when the watcher is enabled");
            }
            return {};
        }

        Result<ChainSettings> _parseChain(const json & object, std::size_t index)
        {
            const std::string section = std::format("chains[{}]", index);
            if(!object.is_object())
            {
                return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("`{}` must be an object", section));
            }

            ChainSettings settings;
            Result<void> res;
            if(!(res = _readString(object, section, "chain", settings.evm.chain))) return std::unexpected(res.error());
            if(!(res = _readString(object, section, "network", settings.evm.network))) return std::unexpected(res.error());
            if(!(res = _readUnsigned(object, section, "chain_id", settings.evm.chain_id))) return std::unexpected(res.error());
            if(!(res = _readString(object, section, "rpc_url", settings.evm.rpc_url))) return std::unexpected(res.error());
            if(!(res = _readBool(object, section, "include_priority_fee", settings.fee_policy.include_priority_fee))) return std::unexpected(res.error());
            if(!(res = _readDouble(object, section, "min_fee", settings.fee_policy.min_fee))) return std::unexpected(res.error());
            if(!(res = _readDouble(object, section, "fee_multiplier", settings.fee_policy.multiplier))) return std::unexpected(res.error());

            settings.evm.query_priority_fee = settings.fee_policy.include_priority_fee;

            if(settings.evm.chain.empty() || settings.evm.network.empty())
            {
                return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("`{}` needs chain and network", section));
            }
            if(settings.evm.rpc_url.empty())
            {
                return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("`{}.rpc_url` must be set", section));
            }
            if(!(settings.fee_policy.multiplier > 0.0))
            {
                return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("`{}.fee_multiplier` must be positive", section));
            }
            if(settings.fee_policy.min_fee < 0.0)
            {
                return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("`{}.min_fee` must not be negative", section));
            }
            return settings;
        }
    }

    Result<GatewayConfig> parseGatewayConfig(const json & document)
    {
        if(!document.is_object())
        {
            return makeError(GatewayError::Kind::INVALID_CONFIG, "configuration root must be an object");
        }

        GatewayConfig cfg;
        Result<void> res;

        const auto nonce_section = _section(document, "nonce");
        if(!nonce_section) return std::unexpected(nonce_section.error());
        if(*nonce_section)
        {
            if(!(res = _readMillis(**nonce_section, "nonce", "sync_ttl_ms", cfg.nonce.sync_ttl))) return std::unexpected(res.error());
        }

        const auto pending_section = _section(document, "pending");
        if(!pending_section) return std::unexpected(pending_section.error());
        if(*pending_section)
        {
            if(!(res = _readMillis(**pending_section, "pending", "duration_limit_ms", cfg.pending.duration_limit))) return std::unexpected(res.error());
            if(!(res = _readMillis(**pending_section, "pending", "retention_ms", cfg.pending.retention))) return std::unexpected(res.error());
            if(!(res = _readMillis(**pending_section, "pending", "purge_interval_ms", cfg.purge_interval))) return std::unexpected(res.error());
        }

        const auto gas_section = _section(document, "gas");
        if(!gas_section) return std::unexpected(gas_section.error());
        if(*gas_section)
        {
            if(!(res = _readMillis(**gas_section, "gas", "ttl_ms", cfg.gas.ttl))) return std::unexpected(res.error());
            if(!(res = _readMillis(**gas_section, "gas", "refresh_interval_ms", cfg.gas.refresh_interval))) return std::unexpected(res.error());
        }

        const auto watcher_section = _section(document, "watcher");
        if(!watcher_section) return std::unexpected(watcher_section.error());
        if(*watcher_section)
        {
            if(!(res = _parseWatcher(**watcher_section, cfg.watcher))) return std::unexpected(res.error());
        }

        if(document.contains("rpc_threads"))
        {
            std::uint64_t rpc_threads = cfg.rpc_threads;
            if(!(res = _readUnsigned(document, "root", "rpc_threads", rpc_threads))) return std::unexpected(res.error());
            if(rpc_threads == 0)
            {
                return makeError(GatewayError::Kind::INVALID_CONFIG, "`rpc_threads` must be positive");
            }
            cfg.rpc_threads = static_cast<std::size_t>(rpc_threads);
        }

        if(document.contains("chains"))
        {
            const json & chains = document["chains"];
            if(!chains.is_array())
            {
                return makeError(GatewayError::Kind::INVALID_CONFIG, "`chains` must be an array");
            }

            for(std::size_t i = 0; i < chains.size(); ++i)
            {
                auto chain_settings = _parseChain(chains[i], i);
                if(!chain_settings)
                {
                    return std::unexpected(chain_settings.error());
                }
                cfg.chains.push_back(std::move(*chain_settings));
            }
        }

        return cfg;
    }

    Result<GatewayConfig> loadGatewayConfig(const std::filesystem::path & path)
    {
        std::ifstream file(path);
        if(!file.is_open())
        {
            return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("Failed to open config file {}", path.string()));
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        const json document = json::parse(buffer.str(), nullptr, false);
        if(document.is_discarded())
        {
            return makeError(GatewayError::Kind::INVALID_CONFIG, std::format("Config file {} is not valid JSON", path.string()));
        }

        auto cfg = parseGatewayConfig(document);
        if(cfg)
        {
            spdlog::debug("Loaded config {} with {} chain(s)", path.string(), cfg->chains.size());
        }
        return cfg;
    }
}
