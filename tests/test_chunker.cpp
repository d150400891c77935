#include <gtest/gtest.h>
#include <limits>
#include <vector>

#include "proto/chunker.hpp"
#include "util/constants.hpp"

using namespace proto;

static Bytes pattern(std::size_t n)
{
    Bytes b(n);
    for (std::size_t i = 0; i < n; ++i)
        b[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    return b;
}

static ChunkMap to_map(const std::vector<Chunk> &chunks)
{
    ChunkMap m;
    for (const auto &c : chunks)
        m[c.index] = c.payload;
    return m;
}

TEST(Chunker, RoundTripEdgeSizes)
{
    const std::size_t cs = constants::CHUNK_SIZE;
    for (std::size_t n : {std::size_t(0), std::size_t(1), cs - 1, cs, cs + 1, 3 * cs})
    {
        Bytes in     = pattern(n);
        auto  chunks = split(in, cs);
        ASSERT_EQ(chunks.size(), chunk_count(n, cs)) << "n=" << n;

        auto out = assemble(static_cast<std::uint32_t>(chunks.size()), to_map(chunks));
        ASSERT_TRUE(std::holds_alternative<Bytes>(out)) << "n=" << n;
        EXPECT_EQ(std::get<Bytes>(out), in) << "n=" << n;
    }
}

TEST(Chunker, CountAndLastChunkLength)
{
    const Bytes in     = pattern(150 * 1024);
    auto        chunks = split(in);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].payload.size(), 64u * 1024);
    EXPECT_EQ(chunks[1].payload.size(), 64u * 1024);
    EXPECT_EQ(chunks[2].payload.size(), 22u * 1024);
    for (std::uint32_t i = 0; i < chunks.size(); ++i)
        EXPECT_EQ(chunks[i].index, i);
}

TEST(Chunker, ExactMultipleHasNoTrailingEmptyChunk)
{
    auto chunks = split(pattern(2 * constants::CHUNK_SIZE));
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks.back().payload.size(), constants::CHUNK_SIZE);
}

TEST(Chunker, EmptyInput)
{
    EXPECT_TRUE(split({}).empty());
    EXPECT_EQ(chunk_count(0), 0u);

    auto out = assemble(0, {});
    ASSERT_TRUE(std::holds_alternative<Bytes>(out));
    EXPECT_TRUE(std::get<Bytes>(out).empty());
}

TEST(Chunker, CountDoesNotWrapForHugeSizes)
{
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    EXPECT_EQ(chunk_count(max, 1ull << 40), 16777216u);
    EXPECT_EQ(chunk_count(max - 5, 1ull << 40), 16777216u);
    EXPECT_EQ(chunk_count(constants::MAX_ASSET_SIZE), std::numeric_limits<std::uint32_t>::max());

    // beyond 32-bit indices: reported as 0
    EXPECT_EQ(chunk_count(constants::MAX_ASSET_SIZE + 1), 0u);
    EXPECT_EQ(chunk_count(max), 0u);
}

TEST(Chunker, SmallChunkSize)
{
    Bytes in     = {1, 2, 3, 4, 5, 6, 7};
    auto  chunks = split(in, 3);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].payload, (Bytes{7}));
}

TEST(Chunker, ZeroChunkSizeRejected)
{
    EXPECT_TRUE(split(pattern(10), 0).empty());
    EXPECT_EQ(chunk_count(10, 0), 0u);
}

TEST(Chunker, GapDetection)
{
    ChunkMap parts;
    parts[0] = {0xA};
    parts[1] = {0xB};
    parts[3] = {0xD};

    auto out = assemble(4, parts);
    ASSERT_TRUE(std::holds_alternative<MissingChunk>(out));
    EXPECT_EQ(std::get<MissingChunk>(out).index, 2u);
}

TEST(Chunker, FirstGapIsReported)
{
    ChunkMap parts;
    parts[2] = {0x2};

    auto out = assemble(3, parts);
    ASSERT_TRUE(std::holds_alternative<MissingChunk>(out));
    EXPECT_EQ(std::get<MissingChunk>(out).index, 0u);
}

TEST(Chunker, AssemblyIgnoresInsertionOrder)
{
    ChunkMap parts;
    parts[2] = {5, 6};
    parts[0] = {1, 2};
    parts[1] = {3, 4};

    auto out = assemble(3, parts);
    ASSERT_TRUE(std::holds_alternative<Bytes>(out));
    EXPECT_EQ(std::get<Bytes>(out), (Bytes{1, 2, 3, 4, 5, 6}));
}

TEST(Chunker, ExtraIndicesBeyondTotalIgnored)
{
    ChunkMap parts;
    parts[0] = {1};
    parts[1] = {2};
    parts[7] = {9};

    auto out = assemble(2, parts);
    ASSERT_TRUE(std::holds_alternative<Bytes>(out));
    EXPECT_EQ(std::get<Bytes>(out), (Bytes{1, 2}));
}
