#include <algorithm>
#include <cstdint>
#include <limits>

#include "proto/chunker.hpp"
#include "util/log.hpp"

namespace proto
{

std::uint32_t chunk_count(std::uint64_t size, std::size_t chunk_size)
{
    if (chunk_size == 0)
        return 0;
    // no rounding-up addition: it wraps for sizes near 2^64
    const std::uint64_t n = size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
    if (n > std::numeric_limits<std::uint32_t>::max())
        return 0;
    return static_cast<std::uint32_t>(n);
}

std::vector<Chunk> split(const Bytes &bytes, std::size_t chunk_size)
{
    if (chunk_size == 0)
    {
        LOG_ERROR("split: invalid chunk_size (0)");
        return {};
    }
    const std::uint64_t num_chunks =
        bytes.size() / chunk_size + (bytes.size() % chunk_size != 0 ? 1 : 0);
    if (num_chunks > std::numeric_limits<std::uint32_t>::max())
    {
        LOG_ERROR("split: asset too large (%zu bytes, needs %llu chunks)", bytes.size(),
                  (unsigned long long)num_chunks);
        return {};
    }

    std::vector<Chunk> out;
    out.reserve(static_cast<std::size_t>(num_chunks));
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        const std::size_t start = i * chunk_size;
        const std::size_t take  = std::min(chunk_size, bytes.size() - start);
        Chunk             c;
        c.index = static_cast<std::uint32_t>(i);
        c.payload.assign(bytes.begin() + start, bytes.begin() + start + take);
        out.push_back(std::move(c));
    }
    return out;
}

AssembleResult assemble(std::uint32_t total, const ChunkMap &parts)
{
    std::size_t bytes = 0;
    for (std::uint32_t i = 0; i < total; i++)
    {
        auto it = parts.find(i);
        if (it == parts.end())
        {
            LOG_DEBUG("assemble: missing chunk %u of %u", i, total);
            return MissingChunk{i};
        }
        bytes += it->second.size();
    }

    Bytes out;
    out.reserve(bytes);
    for (std::uint32_t i = 0; i < total; i++)
    {
        const auto &part = parts.at(i);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

}  // namespace proto
