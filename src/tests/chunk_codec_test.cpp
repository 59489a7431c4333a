#include <gtest/gtest.h>
#include <map>
#include <set>
#include <sstream>
#include "codec/chunk_codec.hpp"
#include "codec/digest.hpp"
#include "common/storage_error.hpp"
#include "test_utils.hpp"

using namespace chunkvault;
using namespace chunkvault::codec;

class ChunkCodecTest : public ::testing::Test {
protected:
  // In-memory chunk table filled by split's sink
  std::map<ChunkId, std::string> chunks;

  static void SetUpTestSuite() {
    init_test_logging();
  }

  SplitResult split_into_table(const ChunkCodec& codec, const std::string& data) {
    auto input = create_test_stream(data);
    return codec.split(*input, [this](const ChunkId& id, const std::string& bytes) {
      chunks[id] = bytes;
    });
  }

  ChunkReader table_reader() {
    return [this](const ChunkId& id) {
      auto it = chunks.find(id);
      if (it == chunks.end()) {
        throw ChunkNotFound(id);
      }
      return it->second;
    };
  }
};

TEST_F(ChunkCodecTest, SplitsTenBytesIntoThreeChunks) {
  ChunkCodec codec(4);
  SplitResult result = split_into_table(codec, "ABCDEFGHIJ");

  ASSERT_EQ(result.manifest.size(), 3u);
  EXPECT_EQ(result.total_size, 10u);
  EXPECT_EQ(chunks[result.manifest[0]], "ABCD");
  EXPECT_EQ(chunks[result.manifest[1]], "EFGH");
  EXPECT_EQ(chunks[result.manifest[2]], "IJ");
  EXPECT_EQ(result.checksum, "261305762671a58cae5b74990bcfc236c2336fb04a0fbac626166d9491d2884c");

  EXPECT_EQ(codec.reconstruct(result.manifest, table_reader()), "ABCDEFGHIJ");
}

TEST_F(ChunkCodecTest, EmptyInputYieldsEmptyManifest) {
  ChunkCodec codec(4);
  SplitResult result = split_into_table(codec, "");

  EXPECT_TRUE(result.manifest.empty());
  EXPECT_EQ(result.total_size, 0u);
  EXPECT_EQ(result.checksum, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(codec.reconstruct(result.manifest, table_reader()), "");
}

TEST_F(ChunkCodecTest, ExactMultipleHasNoTrailingEmptyChunk) {
  ChunkCodec codec(5);
  SplitResult result = split_into_table(codec, "0123456789");

  ASSERT_EQ(result.manifest.size(), 2u);
  EXPECT_EQ(chunks[result.manifest[1]], "56789");
}

TEST_F(ChunkCodecTest, RoundTripAcrossChunkSizes) {
  const std::string data = make_payload(10000);
  for (std::int64_t size : {1, 3, 64, 4096, 9999, 10000, 20000}) {
    chunks.clear();
    ChunkCodec codec(size);
    SplitResult result = split_into_table(codec, data);
    EXPECT_EQ(result.total_size, data.size()) << "chunk size " << size;
    EXPECT_EQ(codec.reconstruct(result.manifest, table_reader()), data) << "chunk size " << size;
  }
}

TEST_F(ChunkCodecTest, ChecksumIndependentOfChunkSize) {
  const std::string data = make_payload(5000, 11);
  const std::string expected = Sha256Digest::hex_of(data);

  for (std::int64_t size : {1, 7, 512, 5000, 1 << 20}) {
    ChunkCodec codec(size);
    auto input = create_test_stream(data);
    EXPECT_EQ(codec.split(*input).checksum, expected) << "chunk size " << size;
  }
}

TEST_F(ChunkCodecTest, HugeChunkSizeDoesNotPreallocate) {
  ChunkCodec codec(std::int64_t{1} << 50);
  SplitResult result = split_into_table(codec, "ABCDEFGHIJ");

  ASSERT_EQ(result.manifest.size(), 1u);
  EXPECT_EQ(result.total_size, 10u);
  EXPECT_EQ(chunks[result.manifest[0]], "ABCDEFGHIJ");
  EXPECT_EQ(result.checksum, "261305762671a58cae5b74990bcfc236c2336fb04a0fbac626166d9491d2884c");
}

TEST_F(ChunkCodecTest, ChunksLargerThanReadBlock) {
  ChunkCodec codec(200000);
  const std::string data = make_payload(450000, 5);
  SplitResult result = split_into_table(codec, data);

  ASSERT_EQ(result.manifest.size(), 3u);
  EXPECT_EQ(chunks[result.manifest[0]].size(), 200000u);
  EXPECT_EQ(chunks[result.manifest[1]].size(), 200000u);
  EXPECT_EQ(chunks[result.manifest[2]].size(), 50000u);
  EXPECT_EQ(codec.reconstruct(result.manifest, table_reader()), data);
}

TEST_F(ChunkCodecTest, IdentifiersAreFreshPerSplit) {
  ChunkCodec codec(2);
  SplitResult first = split_into_table(codec, "same content");
  SplitResult second = split_into_table(codec, "same content");

  EXPECT_EQ(first.checksum, second.checksum);
  std::set<ChunkId> ids(first.manifest.begin(), first.manifest.end());
  ids.insert(second.manifest.begin(), second.manifest.end());
  EXPECT_EQ(ids.size(), first.manifest.size() + second.manifest.size());
}

TEST_F(ChunkCodecTest, IdentifiersCarryOrdinalSuffix) {
  ChunkCodec codec(1);
  SplitResult result = split_into_table(codec, "xyz");

  for (std::size_t i = 0; i < result.manifest.size(); ++i) {
    const ChunkId& id = result.manifest[i];
    EXPECT_TRUE(ChunkCodec::is_valid_chunk_id(id)) << id;
    EXPECT_EQ(id.substr(id.find('_') + 1), std::to_string(i));
  }
}

TEST_F(ChunkCodecTest, RejectsNonPositiveChunkSize) {
  EXPECT_THROW(ChunkCodec(0), InvalidConfiguration);
  EXPECT_THROW(ChunkCodec(-4), InvalidConfiguration);
  EXPECT_NO_THROW(ChunkCodec(1));
}

TEST_F(ChunkCodecTest, ReconstructFailsOnMissingChunk) {
  ChunkCodec codec(4);
  SplitResult result = split_into_table(codec, "ABCDEFGHIJ");
  chunks.erase(result.manifest[1]);

  try {
    codec.reconstruct(result.manifest, table_reader());
    FAIL() << "Expected ChunkNotFound";
  } catch (const ChunkNotFound& e) {
    EXPECT_EQ(e.chunk_id(), result.manifest[1]);
  }
}

TEST_F(ChunkCodecTest, SinkFailureAbortsSplit) {
  ChunkCodec codec(2);
  auto input = create_test_stream("abcdefgh");
  int calls = 0;

  EXPECT_THROW(codec.split(*input, [&calls](const ChunkId&, const std::string&) {
    if (++calls == 2) {
      throw PrimaryWriteFailed("disk full");
    }
  }), PrimaryWriteFailed);
  EXPECT_EQ(calls, 2);
}

TEST_F(ChunkCodecTest, RejectsBadStream) {
  ChunkCodec codec(4);
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  EXPECT_THROW(codec.split(bad_stream), StorageError);
}

TEST_F(ChunkCodecTest, VerifyPresencePreservesOrder) {
  const ChunkManifest manifest = {"a", "b", "c", "d", "e"};
  const std::set<ChunkId> present = {"b", "d"};

  ChunkManifest missing = ChunkCodec::verify_presence(manifest, [&present](const ChunkId& id) {
    return present.count(id) > 0;
  });

  EXPECT_EQ(missing, (ChunkManifest{"a", "c", "e"}));
}

TEST_F(ChunkCodecTest, CancelledReconstructionThrows) {
  ChunkCodec codec(4);
  SplitResult result = split_into_table(codec, "ABCDEFGHIJ");

  CancellationToken token;
  std::size_t reads = 0;
  ChunkReader reader = [&](const ChunkId& id) {
    if (++reads == 2) {
      token.cancel();
    }
    return chunks.at(id);
  };

  EXPECT_THROW(codec.reconstruct(result.manifest, reader, &token), OperationCancelled);
  EXPECT_EQ(reads, 2u);
}

TEST_F(ChunkCodecTest, ChunkIdValidation) {
  EXPECT_TRUE(ChunkCodec::is_valid_chunk_id(std::string(32, 'a') + "_0"));
  EXPECT_TRUE(ChunkCodec::is_valid_chunk_id("0123456789abcdef0123456789abcdef_12"));
  EXPECT_FALSE(ChunkCodec::is_valid_chunk_id(""));
  EXPECT_FALSE(ChunkCodec::is_valid_chunk_id(std::string(32, 'a') + "_"));
  EXPECT_FALSE(ChunkCodec::is_valid_chunk_id(std::string(32, 'A') + "_0"));
  EXPECT_FALSE(ChunkCodec::is_valid_chunk_id(std::string(31, 'a') + "_0"));
  EXPECT_FALSE(ChunkCodec::is_valid_chunk_id("../" + std::string(29, 'a') + "_0"));
}
