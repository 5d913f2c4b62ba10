#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "store/file_store.hpp"
#include "store/store_error.hpp"
#include "test_utils.hpp"

using namespace objstore::store;
using objstore::test::TempDirectory;
using objstore::test::list_files;
using objstore::test::read_file;
using objstore::test::write_file;

namespace {

const std::string kBucketA = "o1a 5 1stob\no2-a 12 2nd nice obj\no3-0a 7 3rd obj\n";
const std::string kBucketB = "obj1b 9 1st obj b\nob02b 8 2nd ob b\no3-0bb 19 3rd obj in bucket b\n";

} // namespace

class FileStoreTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDirectory> dir;
  objstore::logging::Logger logger;
  std::unique_ptr<FileStore> store;

  void SetUp() override {
    objstore::test::init_test_logging();
    dir = std::make_unique<TempDirectory>("file_store_test");
  }

  void TearDown() override {
    store.reset();
    dir.reset();
  }

  void open_store(std::uint32_t stripes = FileStore::kDefaultStripeCount) {
    store.reset();
    store = std::make_unique<FileStore>(dir->str(), logger, stripes);
  }

  std::filesystem::path bucket_file(const std::string& bucket) const {
    return *dir / (bucket + ".dat");
  }

  // Helper methods to reduce repetition
  void store_and_verify(const std::string& bucket, const std::string& object, const std::string& payload) {
    ASSERT_NO_THROW(store->store(payload, object, bucket)) << "Failed to store " << bucket << "/" << object;
    auto retrieved = store->retrieve(object, bucket);
    ASSERT_TRUE(retrieved.has_value()) << "Object should exist after storing: " << object;
    ASSERT_EQ(*retrieved, payload) << "Data mismatch for " << bucket << "/" << object;
  }

  void expect_chain_matches_file(const std::string& bucket) {
    const std::string content = read_file(bucket_file(bucket));
    std::uint64_t expected_offset = 0;
    for (const auto& record : store->layout(bucket)) {
      EXPECT_EQ(record.offset, expected_offset) << record.object_id;
      const std::string header = content.substr(record.offset, record.header_size);
      EXPECT_EQ(header, record.object_id + " " + std::to_string(record.payload_size));
      expected_offset = record.offset + record.header_size + record.payload_size + 2;
    }
    EXPECT_EQ(expected_offset, content.size());
  }
};

TEST_F(FileStoreTest, ScenarioCreateWritesSingleRecord) {
  open_store();
  EXPECT_FALSE(store->store("hello", "o1", "b1"));
  EXPECT_EQ(read_file(bucket_file("b1")), "o1 5 hello\n");
  EXPECT_EQ(store->retrieve("o1", "b1"), std::optional<std::string>("hello"));
}

TEST_F(FileStoreTest, ScenarioReplaceRewritesRecord) {
  open_store();
  store->store("hello", "o1", "b1");
  EXPECT_TRUE(store->store("hello2", "o1", "b1"));
  EXPECT_EQ(read_file(bucket_file("b1")), "o1 6 hello2\n");
}

TEST_F(FileStoreTest, ScenarioDeleteShiftsFollowingRecords) {
  open_store();
  store->store("a", "o1", "b");
  store->store("bbb", "o2", "b");
  EXPECT_TRUE(store->remove("o1", "b"));

  EXPECT_EQ(read_file(bucket_file("b")), "o2 3 bbb\n");
  const auto layout = store->layout("b");
  ASSERT_EQ(layout.size(), 1u);
  EXPECT_EQ(layout[0].object_id, "o2");
  EXPECT_EQ(layout[0].offset, 0u);
}

TEST_F(FileStoreTest, ScenarioDeleteLastRemovesBucket) {
  open_store();
  store->store("a", "o1", "b");
  store->store("bbb", "o2", "b");
  store->remove("o1", "b");

  EXPECT_TRUE(store->remove("o2", "b"));
  EXPECT_FALSE(std::filesystem::exists(bucket_file("b")));
  EXPECT_FALSE(store->has_bucket("b"));
  EXPECT_FALSE(store->retrieve("o2", "b").has_value());
  EXPECT_EQ(store->bucket_count(), 0u);
}

TEST_F(FileStoreTest, BasicOperations) {
  open_store();
  store_and_verify("docs", "readme", "Hello, Store!");
  store_and_verify("docs", "empty", "");
  store_and_verify("docs", "spaces", "a b c  d");
  store_and_verify("docs", "lines", "line1\nline2\n\n");

  EXPECT_FALSE(store->retrieve("missing", "docs").has_value());
  EXPECT_FALSE(store->retrieve("readme", "nobucket").has_value());
  expect_chain_matches_file("docs");
}

TEST_F(FileStoreTest, ReplaceKeepsPhysicalSlot) {
  write_file(bucket_file("bucket-a"), kBucketA);
  open_store();

  // Longer
  EXPECT_TRUE(store->store("second object, now much longer", "o2-a", "bucket-a"));
  EXPECT_EQ(read_file(bucket_file("bucket-a")),
            "o1a 5 1stob\no2-a 30 second object, now much longer\no3-0a 7 3rd obj\n");
  expect_chain_matches_file("bucket-a");

  // Shorter
  EXPECT_TRUE(store->store("x", "o2-a", "bucket-a"));
  EXPECT_EQ(read_file(bucket_file("bucket-a")), "o1a 5 1stob\no2-a 1 x\no3-0a 7 3rd obj\n");
  expect_chain_matches_file("bucket-a");

  // Same size
  EXPECT_TRUE(store->store("y", "o2-a", "bucket-a"));
  EXPECT_EQ(read_file(bucket_file("bucket-a")), "o1a 5 1stob\no2-a 1 y\no3-0a 7 3rd obj\n");

  const auto layout = store->layout("bucket-a");
  ASSERT_EQ(layout.size(), 3u);
  EXPECT_EQ(layout[0].object_id, "o1a");
  EXPECT_EQ(layout[1].object_id, "o2-a");
  EXPECT_EQ(layout[2].object_id, "o3-0a");
  EXPECT_EQ(layout[2].offset, 21u);
  EXPECT_EQ(store->retrieve("o3-0a", "bucket-a"), std::optional<std::string>("3rd obj"));
}

TEST_F(FileStoreTest, NewObjectIsAppended) {
  write_file(bucket_file("bucket-a"), kBucketA);
  open_store();

  EXPECT_FALSE(store->store("four", "o4", "bucket-a"));
  EXPECT_EQ(read_file(bucket_file("bucket-a")), kBucketA + "o4 4 four\n");
  EXPECT_EQ(store->layout("bucket-a").back().offset, kBucketA.size());
}

TEST_F(FileStoreTest, DeleteIsIdempotent) {
  open_store();
  store->store("a", "o1", "b");
  store->store("b", "o2", "b");

  EXPECT_TRUE(store->remove("o1", "b"));
  EXPECT_FALSE(store->remove("o1", "b"));
  EXPECT_FALSE(store->remove("o1", "unknown"));
  EXPECT_EQ(read_file(bucket_file("b")), "o2 1 b\n");
}

TEST_F(FileStoreTest, LoadsExistingBuckets) {
  write_file(bucket_file("bucket-a"), kBucketA);
  write_file(bucket_file("bucket-b"), kBucketB);
  open_store();

  EXPECT_EQ(store->bucket_count(), 2u);
  EXPECT_EQ(store->retrieve("o1a", "bucket-a"), std::optional<std::string>("1stob"));
  EXPECT_EQ(store->retrieve("o2-a", "bucket-a"), std::optional<std::string>("2nd nice obj"));
  EXPECT_EQ(store->retrieve("o3-0a", "bucket-a"), std::optional<std::string>("3rd obj"));
  EXPECT_EQ(store->retrieve("obj1b", "bucket-b"), std::optional<std::string>("1st obj b"));
  EXPECT_EQ(store->retrieve("ob02b", "bucket-b"), std::optional<std::string>("2nd ob b"));
  EXPECT_EQ(store->retrieve("o3-0bb", "bucket-b"), std::optional<std::string>("3rd obj in bucket b"));
  EXPECT_FALSE(store->retrieve("o1a", "bucket-b").has_value());
}

TEST_F(FileStoreTest, ReloadReproducesState) {
  open_store();
  store->store("alpha", "a", "one");
  store->store("beta beta", "b", "one");
  store->store("gamma\n", "c", "one");
  store->store("delta", "d", "two");
  store->store("BETA", "b", "one");
  store->remove("a", "one");

  const auto layout_one = store->layout("one");
  const auto layout_two = store->layout("two");

  open_store();
  EXPECT_EQ(store->bucket_count(), 2u);
  EXPECT_EQ(store->layout("one"), layout_one);
  EXPECT_EQ(store->layout("two"), layout_two);
  EXPECT_FALSE(store->retrieve("a", "one").has_value());
  EXPECT_EQ(store->retrieve("b", "one"), std::optional<std::string>("BETA"));
  EXPECT_EQ(store->retrieve("c", "one"), std::optional<std::string>("gamma\n"));
  EXPECT_EQ(store->retrieve("d", "two"), std::optional<std::string>("delta"));
}

TEST_F(FileStoreTest, BucketRecreatedAfterDeletingLastObject) {
  open_store();
  store->store("x", "o1", "b");
  store->remove("o1", "b");
  EXPECT_FALSE(store->has_bucket("b"));

  EXPECT_FALSE(store->store("y", "o1", "b"));
  EXPECT_TRUE(store->has_bucket("b"));
  EXPECT_EQ(read_file(bucket_file("b")), "o1 1 y\n");
}

TEST_F(FileStoreTest, NoTemporaryFilesRemain) {
  open_store();
  store->store("1", "a", "bkt");
  store->store("22", "b", "bkt");
  store->store("333", "a", "bkt");
  store->remove("b", "bkt");

  EXPECT_EQ(list_files(dir->get()), std::set<std::string>{"bkt.dat"});
}

TEST_F(FileStoreTest, StrayTemporaryFilesRemovedAtStartup) {
  write_file(bucket_file("bucket-a"), kBucketA);
  write_file(*dir / "bucket-a_00112233aabbccdd.tmp", "o1a 1 x\n");
  open_store();

  EXPECT_EQ(list_files(dir->get()), std::set<std::string>{"bucket-a.dat"});
  EXPECT_EQ(store->retrieve("o1a", "bucket-a"), std::optional<std::string>("1stob"));
}

TEST_F(FileStoreTest, UnrelatedTempFilesSurviveStartup) {
  write_file(*dir / "user-notes.tmp", "notes");
  write_file(*dir / "Build.Cache.tmp", "cache");
  open_store();
  store->store("1", "a", "bkt");

  EXPECT_TRUE(std::filesystem::exists(*dir / "user-notes.tmp"));
  EXPECT_TRUE(std::filesystem::exists(*dir / "Build.Cache.tmp"));
  EXPECT_EQ(read_file(*dir / "user-notes.tmp"), "notes");
}

TEST_F(FileStoreTest, RejectsInvalidIdentifiers) {
  open_store();
  EXPECT_THROW(store->store("x", "Bad", "b"), InvalidIdentifierError);
  EXPECT_THROW(store->store("x", "o", "../escape"), InvalidIdentifierError);
  EXPECT_THROW(store->retrieve("", "b"), InvalidIdentifierError);
  EXPECT_THROW(store->remove("o", "b b"), InvalidIdentifierError);
  EXPECT_EQ(list_files(dir->get()), std::set<std::string>{});
}

TEST_F(FileStoreTest, MissingStorageDirectoryIsConfigurationError) {
  const std::string missing = (*dir / "does-not-exist").string();
  EXPECT_THROW(FileStore(missing, logger), ConfigurationError);

  write_file(*dir / "plain-file", "x");
  EXPECT_THROW(FileStore((*dir / "plain-file").string(), logger), ConfigurationError);
}

TEST_F(FileStoreTest, CorruptBucketFileFailsStartup) {
  write_file(bucket_file("bucket-a"), kBucketA);
  write_file(bucket_file("broken"), "o1 10 short\n");
  EXPECT_THROW(open_store(), FormatError);
}

TEST_F(FileStoreTest, ExternallyTruncatedBucketFileIsNotOverwritten) {
  write_file(bucket_file("bucket-a"), kBucketA);
  open_store();

  const std::string truncated = kBucketA.substr(0, kBucketA.size() - 4);
  write_file(bucket_file("bucket-a"), truncated);

  EXPECT_THROW(store->store("new", "o1a", "bucket-a"), IOError);
  EXPECT_EQ(read_file(bucket_file("bucket-a")), truncated);
  EXPECT_EQ(list_files(dir->get()), std::set<std::string>{"bucket-a.dat"});
}

TEST_F(FileStoreTest, ExternallyRemovedBucketFileSurfacesIOError) {
  open_store();
  store->store("a", "o1", "b");
  store->store("b", "o2", "b");
  std::filesystem::remove(bucket_file("b"));

  EXPECT_THROW(store->retrieve("o1", "b"), IOError);
  EXPECT_THROW(store->store("c", "o3", "b"), IOError);
  // The index is untouched by the failed store
  EXPECT_EQ(store->layout("b").size(), 2u);
}

TEST_F(FileStoreTest, StripeAssignmentIsStable) {
  open_store(7);
  EXPECT_EQ(store->stripe_of("bucket-a"), StripeLockManager::hash("bucket-a") % 7);
  EXPECT_EQ(store->stripe_of("bucket-a"), store->stripe_of("bucket-a"));
}

TEST_F(FileStoreTest, ConcurrentWritersAcrossBuckets) {
  // Few stripes so unrelated buckets share locks
  open_store(3);

  const int thread_count = 8;
  const int objects_per_thread = 25;
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};

  for (int t = 0; t < thread_count; ++t) {
    threads.emplace_back([&, t]() {
      const std::string bucket = "bucket-" + std::to_string(t % 4);
      for (int i = 0; i < objects_per_thread; ++i) {
        const std::string object = "t" + std::to_string(t) + "-o" + std::to_string(i);
        const std::string payload = "payload " + object + std::string(static_cast<std::size_t>(i), '.');
        try {
          store->store(payload, object, bucket);
          if (store->retrieve(object, bucket) != std::optional<std::string>(payload)) {
            ++failures;
          }
        }
        catch (const std::exception& e) {
          ADD_FAILURE() << "Operation failed: " << e.what();
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(store->bucket_count(), 4u);
  for (int b = 0; b < 4; ++b) {
    const std::string bucket = "bucket-" + std::to_string(b);
    EXPECT_EQ(store->layout(bucket).size(), 2u * objects_per_thread);
    expect_chain_matches_file(bucket);
  }
}

TEST_F(FileStoreTest, ConcurrentCreateAndDeleteOfSameBucket) {
  open_store(2);

  std::atomic<bool> stop{false};
  std::thread deleter([&]() {
    while (!stop) {
      store->remove("obj", "churn");
    }
  });

  for (int i = 0; i < 200; ++i) {
    const std::string payload = "v" + std::to_string(i);
    ASSERT_NO_THROW(store->store(payload, "obj", "churn"));
    auto retrieved = store->retrieve("obj", "churn");
    if (retrieved) {
      EXPECT_EQ(retrieved->front(), 'v');
    }
  }
  stop = true;
  deleter.join();

  store->remove("obj", "churn");
  EXPECT_FALSE(store->has_bucket("churn"));
  EXPECT_FALSE(std::filesystem::exists(bucket_file("churn")));
}

TEST_F(FileStoreTest, ReadersSeeCompleteVersions) {
  open_store();
  const std::string first(1000, 'a');
  const std::string second(3000, 'b');
  store->store(first, "big", "rw");
  store->store("tail", "after", "rw");

  std::atomic<bool> stop{false};
  std::atomic<int> torn{0};
  std::thread reader([&]() {
    while (!stop) {
      auto value = store->retrieve("big", "rw");
      if (!value || (*value != first && *value != second)) {
        ++torn;
      }
      if (store->retrieve("after", "rw") != std::optional<std::string>("tail")) {
        ++torn;
      }
    }
  });

  for (int i = 0; i < 50; ++i) {
    store->store(i % 2 ? first : second, "big", "rw");
  }
  stop = true;
  reader.join();

  EXPECT_EQ(torn.load(), 0);
  expect_chain_matches_file("rw");
}
