#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace proto
{

using Bytes  = std::vector<std::uint8_t>;
using PeerId = std::string;

// Immutable description of one asset, announced by the broadcaster
struct AssetMetadata
{
    std::string           file_name;
    std::uint64_t         file_size{0};
    std::string           mime_type;
    std::uint32_t         total_chunks{0};
    std::optional<double> duration;

    bool operator==(const AssetMetadata &o) const
    {
        return file_name == o.file_name && file_size == o.file_size &&
               mime_type == o.mime_type && total_chunks == o.total_chunks &&
               duration == o.duration;
    }
};

// --- wire messages (all carry the declared origin) ---
struct RequestMetadata
{
    PeerId from;
};
struct Metadata
{
    PeerId        from;
    AssetMetadata meta;
};
struct RequestChunk
{
    PeerId        from;
    std::uint32_t index{0};
};
struct ChunkData
{
    PeerId        from;
    std::uint32_t index{0};
    Bytes         payload;
};
struct Presence
{
    PeerId      from;
    std::string name;
};
struct Signal
{
    PeerId from;
    Bytes  payload;  // opaque, e.g. higher-level signalling
};
struct HaveChunks
{
    PeerId                     from;
    std::vector<std::uint32_t> indices;
};

// --- local lifecycle events (never on the wire) ---
struct PeerUp
{
    PeerId id;
};
struct PeerDown
{
    PeerId id;
};
struct Error
{
    std::string message;
};

// Closed set, dispatched with std::visit. Lifecycle events are produced locally.
using Message = std::variant<RequestMetadata, Metadata, RequestChunk, ChunkData, Presence, Signal,
                             HaveChunks, PeerUp, PeerDown, Error>;

// std::visit helper: overloaded{[](const A &) {...}, [](const B &) {...}}
template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Declared origin; nullopt for lifecycle events
std::optional<PeerId> origin(const Message &m);

// Wire type string ("video-chunk", ...) or lifecycle name, for logs
const char *type_name(const Message &m);

// Extension based MIME type, "video/mp4" when unknown
std::string mime_type_for(const std::string &file_name);

}  // namespace proto
