#include "unit-tests.hpp"

#include <fstream>

using namespace txgate;
using namespace txgate::tests;

TEST_F(UnitTest, JsonFileStore_PersistsAcrossInstances)
{
    const auto storage_path = makeStoragePath("json_store_persist");

    {
        storage::JsonFileStore store(storage_path);
        ASSERT_TRUE(store.put("nonce", "evm:test/0xabc", nlohmann::json{{"last_allocated", 7}}).has_value());
        ASSERT_TRUE(store.put("nonce", "evm:test/0xdef", nlohmann::json{{"last_allocated", 1}}).has_value());
        ASSERT_TRUE(store.erase("nonce", "evm:test/0xdef").has_value());
    }

    EXPECT_TRUE(std::filesystem::exists(storage_path / "nonce.json"));
    EXPECT_FALSE(std::filesystem::exists(storage_path / "nonce.json.tmp"));

    storage::JsonFileStore reopened(storage_path);
    const auto value = reopened.get("nonce", "evm:test/0xabc");
    ASSERT_TRUE(value.has_value());
    ASSERT_TRUE(value->has_value());
    EXPECT_EQ((**value)["last_allocated"], 7);

    const auto removed = reopened.get("nonce", "evm:test/0xdef");
    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(removed->has_value());

    const auto entries = reopened.entries("nonce");
    ASSERT_TRUE(entries.has_value());
    EXPECT_EQ(entries->size(), 1u);
}

TEST_F(UnitTest, JsonFileStore_CorruptedFileIsStorageError)
{
    const auto storage_path = makeStoragePath("json_store_corrupted");
    {
        std::ofstream output(storage_path / "pending.json");
        output << "{ not json";
    }

    storage::JsonFileStore store(storage_path);
    const auto entries = store.entries("pending");
    ASSERT_FALSE(entries.has_value());
    EXPECT_EQ(entries.error().kind, GatewayError::Kind::STORAGE_ERROR);
}

TEST_F(UnitTest, MemoryStore_NamespacesAreIsolated)
{
    storage::MemoryStore store;
    ASSERT_TRUE(store.put("a", "key", 1).has_value());
    ASSERT_TRUE(store.put("b", "key", 2).has_value());

    EXPECT_EQ(**store.get("a", "key"), 1);
    EXPECT_EQ(**store.get("b", "key"), 2);
    EXPECT_TRUE(store.entries("c")->empty());
}
