#pragma once
#include <cstdint>
#include <map>
#include <variant>
#include <vector>

#include "util/constants.hpp"

/*
Broadcaster:
  asset bytes -> split(bytes, CHUNK_SIZE) -> chunks[0..N-1] (read-only after prepare)
Viewer:
  Chunk{index, payload} -> ChunkMap[index] = payload
  received == totalChunks -> assemble(totalChunks, map) -> bytes | MissingChunk{index}
*/

namespace proto
{

using Bytes = std::vector<std::uint8_t>;

struct Chunk
{
    std::uint32_t index{0};
    Bytes         payload;  // <= chunk size; only the last one may be shorter
};

using ChunkMap = std::map<std::uint32_t, Bytes>;

// Gap found while assembling: the first index with no payload
struct MissingChunk
{
    std::uint32_t index{0};
};

using AssembleResult = std::variant<Bytes, MissingChunk>;

// ceil(size / chunk_size); 0 for an empty asset, and also 0 when the count would not
// fit in 32 bits, so callers must check the size separately
std::uint32_t chunk_count(std::uint64_t size, std::size_t chunk_size = constants::CHUNK_SIZE);

// Deterministic split, indices 0..N-1, never emits a trailing empty chunk.
// Returns an empty list for chunk_size == 0 or when N would not fit in 32 bits.
std::vector<Chunk> split(const Bytes &bytes, std::size_t chunk_size = constants::CHUNK_SIZE);

// Concatenates indices 0..total-1 in order; fails fast on the first gap.
AssembleResult assemble(std::uint32_t total, const ChunkMap &parts);

}  // namespace proto
