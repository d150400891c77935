#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
// Wire constants shared by every peer. Changing any of these breaks compatibility.
inline constexpr std::size_t      CHUNK_SIZE   = 64 * 1024;
inline constexpr std::uint32_t    WIRE_VERSION = 1;
inline constexpr std::string_view TYPE_PREFIX  = "video-";

// Chunk indices are 32-bit, which caps the asset size
inline constexpr std::uint64_t MAX_ASSET_SIZE = std::uint64_t{UINT32_MAX} * CHUNK_SIZE;

// Largest payload handed to a transport in one message. A base64 chunk plus the JSON
// envelope is ~88 KiB, well under typical QUIC datagram/stream frame limits.
inline constexpr std::size_t MAX_MESSAGE_SIZE = 128 * 1024;

// Presence names and peer ids beyond this are truncated / rejected
inline constexpr std::size_t NAME_MAX = 64;

// Viewer announces its chunk set after every N received chunks
inline constexpr std::uint32_t HAVE_CHUNKS_EVERY = 10;

// Push mode sends the metadata twice, this far apart
inline constexpr std::chrono::milliseconds METADATA_HEDGE_DELAY{200};

inline constexpr std::string_view DEFAULT_NAME      = "chunkcast";
inline constexpr std::string_view DEFAULT_FILE_NAME = "video";
inline constexpr std::string_view DEFAULT_MIME_TYPE = "video/mp4";

}  // namespace constants
