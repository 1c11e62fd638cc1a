#include "storage.hpp"

#include <format>
#include <fstream>

#include <spdlog/spdlog.h>

namespace txgate::storage
{
    namespace
    {
        std::string _sanitizeName(std::string name)
        {
            for(char & c : name)
            {
                if(c == '\\' || c == '/' || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|')
                {
                    c = '_';
                }
            }
            return name;
        }
    }

    JsonFileStore::JsonFileStore(std::filesystem::path root)
    : _root(std::move(root))
    {
    }

    const std::filesystem::path & JsonFileStore::root() const noexcept
    {
        return _root;
    }

    std::filesystem::path JsonFileStore::_namespacePath(const std::string & ns) const
    {
        return _root / (_sanitizeName(ns) + ".json");
    }

    Result<json *> JsonFileStore::_load(const std::string & ns)
    {
        if(auto it = _documents.find(ns); it != _documents.end())
        {
            return &it->second;
        }

        const auto path = _namespacePath(ns);
        json document = json::object();

        std::error_code ec;
        if(std::filesystem::exists(path, ec))
        {
            std::ifstream input(path);
            if(!input.is_open())
            {
                return makeError(GatewayError::Kind::STORAGE_ERROR, std::format("Failed to open '{}'", path.string()));
            }

            document = json::parse(input, nullptr, false);
            if(document.is_discarded() || !document.is_object())
            {
                return makeError(GatewayError::Kind::STORAGE_ERROR, std::format("Corrupted store file '{}'", path.string()));
            }
            spdlog::debug("Loaded {} entries from '{}'", document.size(), path.string());
        }

        auto [it, inserted] = _documents.try_emplace(ns, std::move(document));
        return &it->second;
    }

    Result<void> JsonFileStore::_flush(const std::string & ns, const json & document) const
    {
        const auto path = _namespacePath(ns);
        auto tmp_path = path;
        tmp_path += ".tmp";

        try
        {
            std::filesystem::create_directories(_root);

            {
                std::ofstream output(tmp_path, std::ios::out | std::ios::trunc);
                if(!output.is_open())
                {
                    return makeError(GatewayError::Kind::STORAGE_ERROR, std::format("Failed to open '{}' for writing", tmp_path.string()));
                }
                output << document.dump(2);
                output.flush();
                if(!output.good())
                {
                    return makeError(GatewayError::Kind::STORAGE_ERROR, std::format("Failed to write '{}'", tmp_path.string()));
                }
            }

            std::filesystem::rename(tmp_path, path);
        }
        catch(const std::exception & e)
        {
            spdlog::error("Failed to write store file '{}': {}", path.string(), e.what());
            return makeError(GatewayError::Kind::STORAGE_ERROR, e.what());
        }

        return {};
    }

    Result<std::optional<json>> JsonFileStore::get(const std::string & ns, const std::string & key)
    {
        std::lock_guard lock(_mutex);

        const auto document = _load(ns);
        if(!document)
        {
            return std::unexpected(document.error());
        }

        const json & doc = **document;
        if(!doc.contains(key))
        {
            return std::optional<json>{};
        }
        return std::optional<json>{doc.at(key)};
    }

    Result<void> JsonFileStore::put(const std::string & ns, const std::string & key, json value)
    {
        std::lock_guard lock(_mutex);

        const auto document = _load(ns);
        if(!document)
        {
            return std::unexpected(document.error());
        }

        json updated = **document;
        updated[key] = std::move(value);

        if(auto res = _flush(ns, updated); !res)
        {
            return res;
        }

        **document = std::move(updated);
        return {};
    }

    Result<void> JsonFileStore::erase(const std::string & ns, const std::string & key)
    {
        std::lock_guard lock(_mutex);

        const auto document = _load(ns);
        if(!document)
        {
            return std::unexpected(document.error());
        }

        if(!(*document)->contains(key))
        {
            return {};
        }

        json updated = **document;
        updated.erase(key);

        if(auto res = _flush(ns, updated); !res)
        {
            return res;
        }

        **document = std::move(updated);
        return {};
    }

    Result<std::vector<std::pair<std::string, json>>> JsonFileStore::entries(const std::string & ns)
    {
        std::lock_guard lock(_mutex);

        const auto document = _load(ns);
        if(!document)
        {
            return std::unexpected(document.error());
        }

        std::vector<std::pair<std::string, json>> out;
        out.reserve((*document)->size());
        for(const auto & [key, value] : (*document)->items())
        {
            out.emplace_back(key, value);
        }
        return out;
    }
}
