#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <nlohmann/json.hpp>

#include "error.hpp"

namespace txgate::storage
{
    using json = nlohmann::json;

    /**
     * @brief Durable key-value store used for nonce records and pending transactions.
     *
     * Values are JSON documents grouped by namespace. Every mutation is durable
     * once the call returns successfully.
     */
    class IKeyValueStore
    {
        public:
            virtual ~IKeyValueStore() = default;

            virtual Result<std::optional<json>> get(const std::string & ns, const std::string & key) = 0;

            virtual Result<void> put(const std::string & ns, const std::string & key, json value) = 0;

            virtual Result<void> erase(const std::string & ns, const std::string & key) = 0;

            virtual Result<std::vector<std::pair<std::string, json>>> entries(const std::string & ns) = 0;
    };

    /**
     * @brief One JSON file per namespace under the storage directory.
     *
     * Files are rewritten through a temporary sibling and renamed into place so a crash
     * mid-write leaves the previous version intact.
     */
    class JsonFileStore final : public IKeyValueStore
    {
        public:
            explicit JsonFileStore(std::filesystem::path root);

            JsonFileStore(const JsonFileStore&) = delete;
            JsonFileStore& operator=(const JsonFileStore&) = delete;

            const std::filesystem::path & root() const noexcept;

            Result<std::optional<json>> get(const std::string & ns, const std::string & key) override;

            Result<void> put(const std::string & ns, const std::string & key, json value) override;

            Result<void> erase(const std::string & ns, const std::string & key) override;

            Result<std::vector<std::pair<std::string, json>>> entries(const std::string & ns) override;

        private:
            std::filesystem::path _namespacePath(const std::string & ns) const;

            Result<json *> _load(const std::string & ns);

            Result<void> _flush(const std::string & ns, const json & document) const;

            std::filesystem::path _root;
            std::mutex _mutex;
            absl::flat_hash_map<std::string, json> _documents;
    };

    class MemoryStore final : public IKeyValueStore
    {
        public:
            MemoryStore() = default;

            Result<std::optional<json>> get(const std::string & ns, const std::string & key) override;

            Result<void> put(const std::string & ns, const std::string & key, json value) override;

            Result<void> erase(const std::string & ns, const std::string & key) override;

            Result<std::vector<std::pair<std::string, json>>> entries(const std::string & ns) override;

        private:
            std::mutex _mutex;
            absl::flat_hash_map<std::string, absl::flat_hash_map<std::string, json>> _data;
    };
}
