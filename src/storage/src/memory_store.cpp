#include "storage.hpp"

namespace txgate::storage
{
    Result<std::optional<json>> MemoryStore::get(const std::string & ns, const std::string & key)
    {
        std::lock_guard lock(_mutex);

        auto ns_it = _data.find(ns);
        if(ns_it == _data.end())
        {
            return std::optional<json>{};
        }

        auto it = ns_it->second.find(key);
        if(it == ns_it->second.end())
        {
            return std::optional<json>{};
        }
        return std::optional<json>{it->second};
    }

    Result<void> MemoryStore::put(const std::string & ns, const std::string & key, json value)
    {
        std::lock_guard lock(_mutex);
        _data[ns][key] = std::move(value);
        return {};
    }

    Result<void> MemoryStore::erase(const std::string & ns, const std::string & key)
    {
        std::lock_guard lock(_mutex);

        if(auto ns_it = _data.find(ns); ns_it != _data.end())
        {
            ns_it->second.erase(key);
        }
        return {};
    }

    Result<std::vector<std::pair<std::string, json>>> MemoryStore::entries(const std::string & ns)
    {
        std::lock_guard lock(_mutex);

        std::vector<std::pair<std::string, json>> out;
        if(auto ns_it = _data.find(ns); ns_it != _data.end())
        {
            out.reserve(ns_it->second.size());
            for(const auto & [key, value] : ns_it->second)
            {
                out.emplace_back(key, value);
            }
        }
        return out;
    }
}
