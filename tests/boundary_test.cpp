#include "chunkvault/boundary.hpp"
#include "chunkvault/errors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace chunkvault;

TEST(BoundaryTest, TotalChunksRoundsUp) {
    EXPECT_EQ(total_chunks(10000, 4096), 3u);
    EXPECT_EQ(total_chunks(8192, 4096), 2u);
    EXPECT_EQ(total_chunks(1, 4096), 1u);
    EXPECT_EQ(total_chunks(0, 4096), 0u);
}

TEST(BoundaryTest, ZeroChunkSizeIsRejected) {
    EXPECT_THROW(total_chunks(100, 0), std::invalid_argument);
}

TEST(BoundaryTest, UnevenFileHasShortLastChunk) {
    ChunkRange first = chunk_boundaries(10000, 4096, 1);
    ChunkRange second = chunk_boundaries(10000, 4096, 2);
    ChunkRange last = chunk_boundaries(10000, 4096, 3);

    EXPECT_EQ(first.start, 0u);
    EXPECT_EQ(first.size(), 4096u);
    EXPECT_EQ(second.start, 4096u);
    EXPECT_EQ(second.size(), 4096u);
    EXPECT_EQ(last.start, 8192u);
    EXPECT_EQ(last.end, 10000u);
    EXPECT_EQ(last.size(), 1808u);
}

TEST(BoundaryTest, ChunkSizeEqualToFileSizeGivesOneChunk) {
    EXPECT_EQ(total_chunks(4096, 4096), 1u);
    ChunkRange only = chunk_boundaries(4096, 4096, 1);
    EXPECT_EQ(only.start, 0u);
    EXPECT_EQ(only.end, 4096u);
    EXPECT_THROW(chunk_boundaries(4096, 4096, 2), ChunkError);
}

TEST(BoundaryTest, OutOfRangeIndexReportsKind) {
    try {
        chunk_boundaries(10000, 4096, 4);
        FAIL() << "expected ChunkError";
    } catch (const ChunkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CHUNK_INDEX_OUT_OF_RANGE);
    }

    EXPECT_THROW(chunk_boundaries(10000, 4096, 0), ChunkError);
    EXPECT_THROW(chunk_boundaries(10000, 4096, -1), ChunkError);
    EXPECT_THROW(chunk_boundaries(0, 4096, 1), ChunkError);
}

TEST(BoundaryTest, ChunkIdsArePaddedToThreeDigits) {
    EXPECT_EQ(make_chunk_id("movie", 1), "movie.chunk001.bin");
    EXPECT_EQ(make_chunk_id("movie", 42), "movie.chunk042.bin");
    EXPECT_EQ(make_chunk_id("movie", 1234), "movie.chunk1234.bin");
}
