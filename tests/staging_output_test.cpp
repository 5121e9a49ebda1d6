#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "StagingOutput.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

namespace rangefetch {
namespace {

Chunk chunkOf(size_t id, uint64_t start, uint64_t end) {
  Chunk chunk;
  chunk.id = id;
  chunk.start = start;
  chunk.end = end;
  return chunk;
}

TEST(StagingOutputTest, MergesPartsInCallOrderAndRemovesThem) {
  test::TempDir dir;
  StagingOutput output(dir.file("out.bin"));
  output.open();

  Chunk first = chunkOf(0, 0, 2);
  Chunk second = chunkOf(1, 3, 6);
  // Written out of order, merged in id order.
  output.writeChunk(second, "defg");
  output.writeChunk(first, "abc");
  EXPECT_TRUE(std::filesystem::exists(output.stagingPath(1)));

  output.mergeChunk(first);
  output.mergeChunk(second);
  EXPECT_EQ(output.bytesMerged(), 7u);
  EXPECT_FALSE(std::filesystem::exists(output.stagingPath(0)));
  EXPECT_FALSE(std::filesystem::exists(output.stagingPath(1)));

  output.finalize(7);
  EXPECT_EQ(test::readFile(dir.file("out.bin")), "abcdefg");
}

TEST(StagingOutputTest, RewriteReplacesEarlierAttempt) {
  test::TempDir dir;
  StagingOutput output(dir.file("out.bin"));
  output.open();
  Chunk chunk = chunkOf(0, 0, 3);
  output.writeChunk(chunk, "stale-and-long");
  output.writeChunk(chunk, "good");
  output.mergeChunk(chunk);
  output.finalize(4);
  EXPECT_EQ(test::readFile(dir.file("out.bin")), "good");
}

TEST(StagingOutputTest, MissingPartIsStagingError) {
  test::TempDir dir;
  StagingOutput output(dir.file("out.bin"));
  output.open();
  EXPECT_THROW(output.mergeChunk(chunkOf(0, 0, 9)), StagingError);
  EXPECT_EQ(output.bytesMerged(), 0u);
}

TEST(StagingOutputTest, ShortPartIsStagingError) {
  test::TempDir dir;
  StagingOutput output(dir.file("out.bin"));
  output.open();
  Chunk chunk = chunkOf(0, 0, 9);
  output.writeChunk(chunk, "short");
  EXPECT_THROW(output.mergeChunk(chunk), StagingError);
  EXPECT_EQ(output.bytesMerged(), 0u);
}

TEST(StagingOutputTest, FinalizeChecksSize) {
  test::TempDir dir;
  StagingOutput output(dir.file("out.bin"));
  output.open();
  Chunk chunk = chunkOf(0, 0, 1);
  output.writeChunk(chunk, "ok");
  output.mergeChunk(chunk);
  EXPECT_THROW(output.finalize(3), OutputError);
}

TEST(StagingOutputTest, OpenFailsInMissingDirectory) {
  test::TempDir dir;
  StagingOutput output(dir.file("missing/out.bin"));
  EXPECT_THROW(output.open(), PreconditionError);
}

TEST(StagingOutputTest, OpenTruncatesExistingFile) {
  test::TempDir dir;
  {
    std::ofstream old(dir.file("out.bin"));
    old << "previous contents";
  }
  StagingOutput output(dir.file("out.bin"));
  output.open();
  output.finalize(0);
  EXPECT_EQ(std::filesystem::file_size(dir.file("out.bin")), 0u);
}

TEST(StagingOutputTest, DiscardRemovesLeftoverParts) {
  test::TempDir dir;
  StagingOutput output(dir.file("out.bin"));
  output.open();
  std::vector<Chunk> chunks = {chunkOf(0, 0, 0), chunkOf(1, 1, 1),
                               chunkOf(2, 2, 2)};
  output.writeChunk(chunks[0], "a");
  output.writeChunk(chunks[2], "c");
  output.discardStaging(chunks);
  EXPECT_EQ(dir.countFilesContaining(".part"), 0u);
}

}  // namespace
}  // namespace rangefetch
