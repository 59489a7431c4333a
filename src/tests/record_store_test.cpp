#include <gtest/gtest.h>
#include <fstream>
#include "common/storage_error.hpp"
#include "store/file_record.hpp"
#include "store/path_utils.hpp"
#include "store/record_store.hpp"
#include "test_utils.hpp"

using namespace chunkvault;
using namespace chunkvault::store;

class RecordStoreTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> root;
  std::unique_ptr<YamlRecordStore> records;

  static void SetUpTestSuite() {
    init_test_logging();
  }

  void SetUp() override {
    root = std::make_unique<TempDir>("record_store_test");
    records = std::make_unique<YamlRecordStore>(root->path() / "records");
    records->initialize();
  }

  FileRecord make_record(const std::string& owner, const std::string& created_at) {
    FileRecord record;
    record.id = generate_file_id();
    record.owner = owner;
    record.original_name = "report final.pdf";
    record.stored_name = make_stored_name(record.original_name);
    record.manifest = {codec::ChunkCodec::generate_chunk_id(0), codec::ChunkCodec::generate_chunk_id(1)};
    record.chunk_size = 4;
    record.size = 6;
    record.checksum = "261305762671a58cae5b74990bcfc236c2336fb04a0fbac626166d9491d2884c";
    record.created_at = created_at;
    return record;
  }
};

TEST_F(RecordStoreTest, PutGetRoundTripsEveryField) {
  FileRecord record = make_record("alice", "2024-01-01T00:00:00.000000Z");
  record.synced = true;
  record.backup_locator = "local:///backup/user_alice/files/" + record.stored_name;
  records->put(record);

  auto loaded = records->get(record.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->id, record.id);
  EXPECT_EQ(loaded->owner, "alice");
  EXPECT_EQ(loaded->original_name, "report final.pdf");
  EXPECT_EQ(loaded->stored_name, record.stored_name);
  EXPECT_EQ(loaded->manifest, record.manifest);
  EXPECT_EQ(loaded->chunk_size, 4u);
  EXPECT_EQ(loaded->size, 6u);
  EXPECT_EQ(loaded->checksum, record.checksum);
  EXPECT_TRUE(loaded->synced);
  EXPECT_EQ(loaded->backup_locator, record.backup_locator);
  EXPECT_EQ(loaded->created_at, record.created_at);
  EXPECT_EQ(loaded->chunk_count(), 2u);
}

TEST_F(RecordStoreTest, EmptyFileRecord) {
  FileRecord record = make_record("alice", current_timestamp());
  record.manifest.clear();
  record.size = 0;
  records->put(record);

  auto loaded = records->get(record.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->manifest.empty());
  EXPECT_FALSE(loaded->synced);
  EXPECT_TRUE(loaded->backup_locator.empty());
}

TEST_F(RecordStoreTest, PutReplacesExisting) {
  FileRecord record = make_record("alice", current_timestamp());
  records->put(record);
  record.synced = true;
  record.backup_locator = "local:///somewhere";
  records->put(record);

  auto loaded = records->get(record.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->synced);
  EXPECT_EQ(records->list("alice").size(), 1u);
}

TEST_F(RecordStoreTest, MissingAndMalformedIds) {
  EXPECT_FALSE(records->get(generate_file_id()).has_value());
  EXPECT_FALSE(records->get("../../etc/passwd").has_value());
  EXPECT_FALSE(records->remove("../x"));
}

TEST_F(RecordStoreTest, RemoveReportsPresence) {
  FileRecord record = make_record("alice", current_timestamp());
  records->put(record);
  EXPECT_TRUE(records->remove(record.id));
  EXPECT_FALSE(records->remove(record.id));
  EXPECT_FALSE(records->get(record.id).has_value());
}

TEST_F(RecordStoreTest, ListFiltersByOwnerOldestFirst) {
  FileRecord second = make_record("alice", "2024-03-01T10:00:00.000000Z");
  FileRecord first = make_record("alice", "2024-01-01T10:00:00.000000Z");
  FileRecord foreign = make_record("bob", "2024-02-01T10:00:00.000000Z");
  records->put(second);
  records->put(first);
  records->put(foreign);

  auto listed = records->list("alice");
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[0].id, first.id);
  EXPECT_EQ(listed[1].id, second.id);
  EXPECT_EQ(records->list("bob").size(), 1u);
  EXPECT_TRUE(records->list("carol").empty());
}

TEST_F(RecordStoreTest, CorruptRecordThrowsOnGetAndIsSkippedByList) {
  FileRecord good = make_record("alice", current_timestamp());
  records->put(good);

  std::string bad_id = generate_file_id();
  {
    std::ofstream file(root->path() / "records" / (bad_id + ".yaml"));
    file << "id: [unterminated\n";
  }

  EXPECT_THROW(records->get(bad_id), StorageError);
  auto listed = records->list("alice");
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0].id, good.id);
}

TEST(FileRecordTest, IdentifiersAndNames) {
  std::string id = generate_file_id();
  EXPECT_EQ(id.size(), 32u);
  EXPECT_NE(id, generate_file_id());

  std::string stored = make_stored_name("../../secret plans.txt");
  EXPECT_EQ(stored.size(), 17u + std::string("secret_plans.txt").size());
  EXPECT_EQ(stored.substr(16), "_secret_plans.txt");
  EXPECT_TRUE(is_safe_component(stored));
  EXPECT_NE(make_stored_name("a.txt"), make_stored_name("a.txt"));
}

TEST(FileRecordTest, TimestampIsIsoUtc) {
  std::string ts = current_timestamp();
  ASSERT_EQ(ts.size(), 27u);
  EXPECT_EQ(ts[4], '-');
  EXPECT_EQ(ts[10], 'T');
  EXPECT_EQ(ts[19], '.');
  EXPECT_EQ(ts.back(), 'Z');
}
