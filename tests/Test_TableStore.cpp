#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <sqlite3.h>

#include "geomesh/table_codec.hpp"
#include "geomesh/table_store.hpp"

using geomesh::CompressionType;
using geomesh::Error;
using geomesh::SqliteTableStore;
using geomesh::Table;

namespace {

Table make_mixed_table() {
    Table table;
    table.add_column("f64", std::vector<double>{1.5, -2.25, 1e300})
         .add_column("f32", std::vector<float>{0.5f, 1.0f, -3.0f})
         .add_column("u64", std::vector<uint64_t>{0, 1, UINT64_MAX})
         .add_column("i32", std::vector<int32_t>{-1, 0, 7})
         .add_column("label", std::vector<std::string>{"a", "", "sandstone"});
    return table;
}

// Hands out a fixed list of ids so tests can force a taken reference
class ScriptedRefStore : public SqliteTableStore {
public:
    ScriptedRefStore(std::vector<std::string> ids)
        : SqliteTableStore(":memory:"), ids_(std::move(ids)) {}

protected:
    std::string generate_ref() override {
        return next_ < ids_.size() ? ids_[next_++] : ids_.back();
    }

private:
    std::vector<std::string> ids_;
    size_t next_ = 0;
};

} // namespace

// =============================================================================
// Table
// =============================================================================

TEST(Table, RejectsColumnsOfDifferentLength)
{
    Table table;
    table.add_column("a", std::vector<double>{1.0, 2.0});
    EXPECT_THROW(table.add_column("b", std::vector<double>{1.0}), std::invalid_argument);
}

TEST(Table, RejectsDuplicateColumnNames)
{
    Table table;
    table.add_column("a", std::vector<double>{1.0});
    EXPECT_THROW(table.add_column("a", std::vector<int64_t>{1}), std::invalid_argument);
}

// =============================================================================
// Codec
// =============================================================================

TEST(TableCodec, SerializeDeserializeKeepsTypesAndValues)
{
    Table table = make_mixed_table();
    auto raw = geomesh::serialize_table(table);
    auto decoded = geomesh::deserialize_table(raw);
    ASSERT_TRUE(decoded.ok()) << decoded.error().full_message();
    EXPECT_EQ(*decoded, table);
    EXPECT_EQ(decoded->column(2).type(), geomesh::ColumnType::UInt64);
}

TEST(TableCodec, ChecksumIgnoresCompression)
{
    Table table = make_mixed_table();
    auto lz4 = geomesh::encode_table(table, CompressionType::LZ4);
    auto zlib = geomesh::encode_table(table, CompressionType::Zlib);
    auto none = geomesh::encode_table(table, CompressionType::None);
    ASSERT_TRUE(lz4.ok() && zlib.ok() && none.ok());
    EXPECT_EQ(lz4->checksum, zlib->checksum);
    EXPECT_EQ(lz4->checksum, none->checksum);

    for (const auto* encoded : {&*lz4, &*zlib, &*none}) {
        auto decoded = geomesh::decode_table(encoded->blob);
        ASSERT_TRUE(decoded.ok()) << decoded.error().full_message();
        EXPECT_EQ(*decoded, table);
    }
}

TEST(TableCodec, DifferentTablesGetDifferentChecksums)
{
    Table a;
    a.add_column("value", std::vector<double>{1.0, 2.0});
    Table b;
    b.add_column("value", std::vector<double>{2.0, 1.0});
    EXPECT_NE(geomesh::table_checksum(geomesh::serialize_table(a)),
              geomesh::table_checksum(geomesh::serialize_table(b)));
}

TEST(TableCodec, CorruptBlobIsRejected)
{
    auto encoded = geomesh::encode_table(make_mixed_table(), CompressionType::LZ4);
    ASSERT_TRUE(encoded.ok());

    auto bad_magic = encoded->blob;
    bad_magic[0] = 'X';
    EXPECT_FALSE(geomesh::decode_table(bad_magic).ok());

    auto truncated = encoded->blob;
    truncated.resize(truncated.size() / 2);
    EXPECT_FALSE(geomesh::decode_table(truncated).ok());
}

// =============================================================================
// SqliteTableStore
// =============================================================================

class TableStoreTest : public ::testing::TestWithParam<CompressionType> {};

TEST_P(TableStoreTest, SaveThenLoad)
{
    SqliteTableStore store(":memory:", GetParam());
    ASSERT_TRUE(store.open().ok());

    Table table = make_mixed_table();
    auto ref = store.save(table);
    ASSERT_TRUE(ref.ok()) << ref.error().full_message();
    EXPECT_TRUE(store.contains(*ref));

    auto loaded = store.load(*ref);
    ASSERT_TRUE(loaded.ok()) << loaded.error().full_message();
    EXPECT_EQ(*loaded, table);
}

INSTANTIATE_TEST_SUITE_P(Compression, TableStoreTest,
                         ::testing::Values(CompressionType::None, CompressionType::Zlib, CompressionType::LZ4));

TEST(SqliteTableStore, EqualTablesGetFreshReferences)
{
    SqliteTableStore store(":memory:");
    ASSERT_TRUE(store.open().ok());

    auto first = store.save(make_mixed_table());
    auto second = store.save(make_mixed_table());
    ASSERT_TRUE(first.ok() && second.ok());
    EXPECT_NE(*first, *second);
    EXPECT_EQ(first->id.size(), 32u);
    EXPECT_EQ(store.table_count(), 2u);
    EXPECT_GT(store.total_blob_size(), 0u);

    for (const auto& ref : {*first, *second}) {
        auto loaded = store.load(ref);
        ASSERT_TRUE(loaded.ok()) << loaded.error().full_message();
        EXPECT_EQ(*loaded, make_mixed_table());
    }
}

TEST(SqliteTableStore, TakenReferenceIsRetried)
{
    ScriptedRefStore store({"fixed", "fixed", "second"});
    ASSERT_TRUE(store.open().ok());

    Table other;
    other.add_column("value", std::vector<double>{4.0, 2.0});

    auto first = store.save(make_mixed_table());
    ASSERT_TRUE(first.ok()) << first.error().full_message();
    EXPECT_EQ(first->id, "fixed");

    auto second = store.save(other);
    ASSERT_TRUE(second.ok()) << second.error().full_message();
    EXPECT_EQ(second->id, "second");
    EXPECT_EQ(store.table_count(), 2u);

    auto a = store.load(*first);
    auto b = store.load(*second);
    ASSERT_TRUE(a.ok() && b.ok());
    EXPECT_EQ(*a, make_mixed_table());
    EXPECT_EQ(*b, other);
}

TEST(SqliteTableStore, NoFreeReferenceIsDatabaseError)
{
    ScriptedRefStore store({"only"});
    ASSERT_TRUE(store.open().ok());

    ASSERT_TRUE(store.save(make_mixed_table()).ok());
    auto second = store.save(make_mixed_table());
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.code(), Error::Code::DatabaseError);
    EXPECT_EQ(store.table_count(), 1u);
}

TEST(SqliteTableStore, ChecksumMismatchIsInvalidFormat)
{
    auto path = std::filesystem::temp_directory_path() / "geomesh_test_checksum.db";
    std::filesystem::remove(path);

    geomesh::TableRef ref;
    {
        SqliteTableStore store(path);
        ASSERT_TRUE(store.open().ok());
        auto saved = store.save(make_mixed_table());
        ASSERT_TRUE(saved.ok());
        ref = *saved;
    }
    {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(path.string().c_str(), &db), SQLITE_OK);
        EXPECT_EQ(sqlite3_exec(db, "UPDATE tables SET checksum = '0';", nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(db);
    }
    {
        SqliteTableStore store(path);
        ASSERT_TRUE(store.open().ok());
        auto loaded = store.load(ref);
        ASSERT_FALSE(loaded.ok());
        EXPECT_EQ(loaded.code(), Error::Code::InvalidFormat);
        EXPECT_EQ(loaded.error().context, ref.id);
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
}

TEST(SqliteTableStore, UnknownReferenceIsTableNotFound)
{
    SqliteTableStore store(":memory:");
    ASSERT_TRUE(store.open().ok());

    geomesh::TableRef ref{"deadbeefdeadbeef-10"};
    EXPECT_FALSE(store.contains(ref));
    auto loaded = store.load(ref);
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), Error::Code::TableNotFound);
}

TEST(SqliteTableStore, ClosedStoreFails)
{
    SqliteTableStore store(":memory:");
    auto ref = store.save(make_mixed_table());
    ASSERT_FALSE(ref.ok());
    EXPECT_EQ(ref.code(), Error::Code::DatabaseError);
}

TEST(SqliteTableStore, TablesSurviveReopen)
{
    auto path = std::filesystem::temp_directory_path() / "geomesh_test_store.db";
    std::filesystem::remove(path);

    geomesh::TableRef ref;
    {
        SqliteTableStore store(path);
        ASSERT_TRUE(store.open().ok());
        auto saved = store.save(make_mixed_table());
        ASSERT_TRUE(saved.ok());
        ref = *saved;
    }
    {
        SqliteTableStore store(path, CompressionType::Zlib);
        ASSERT_TRUE(store.open().ok());
        auto loaded = store.load(ref);
        ASSERT_TRUE(loaded.ok()) << loaded.error().full_message();
        EXPECT_EQ(*loaded, make_mixed_table());
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
}

TEST(SqliteTableStore, ConcurrentSavesAndLoads)
{
    SqliteTableStore store(":memory:");
    ASSERT_TRUE(store.open().ok());

    constexpr int THREADS = 4;
    constexpr int TABLES_PER_THREAD = 25;
    std::vector<std::thread> workers;
    std::vector<int> failures(THREADS, 0);

    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < TABLES_PER_THREAD; ++i) {
                Table table;
                table.add_column("value", std::vector<int64_t>{t, i});
                auto ref = store.save(table);
                if (!ref.ok()) { failures[t]++; continue; }
                auto loaded = store.load(*ref);
                if (!loaded.ok() || *loaded != table) failures[t]++;
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    for (int t = 0; t < THREADS; ++t) {
        EXPECT_EQ(failures[t], 0) << "thread " << t;
    }
    EXPECT_EQ(store.table_count(), static_cast<size_t>(THREADS * TABLES_PER_THREAD));
}
