#include <algorithm>
#include <cctype>

#include "proto/codec.hpp"
#include "proto/message.hpp"
#include "util/constants.hpp"

namespace proto
{

std::optional<PeerId> origin(const Message &m)
{
    return std::visit(overloaded{
                          [](const PeerUp &) -> std::optional<PeerId> { return std::nullopt; },
                          [](const PeerDown &) -> std::optional<PeerId> { return std::nullopt; },
                          [](const Error &) -> std::optional<PeerId> { return std::nullopt; },
                          [](const auto &wire) -> std::optional<PeerId> { return wire.from; },
                      },
                      m);
}

const char *type_name(const Message &m)
{
    return std::visit(overloaded{
                          [](const RequestMetadata &) { return T_REQUEST_METADATA.data(); },
                          [](const Metadata &) { return T_METADATA.data(); },
                          [](const RequestChunk &) { return T_REQUEST_CHUNK.data(); },
                          [](const ChunkData &) { return T_CHUNK.data(); },
                          [](const Presence &) { return T_PRESENCE.data(); },
                          [](const Signal &) { return T_SIGNAL.data(); },
                          [](const HaveChunks &) { return T_HAVE_CHUNKS.data(); },
                          [](const PeerUp &) { return "peer-connected"; },
                          [](const PeerDown &) { return "peer-disconnected"; },
                          [](const Error &) { return "error"; },
                      },
                      m);
}

std::string mime_type_for(const std::string &file_name)
{
    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos)
        return std::string(constants::DEFAULT_MIME_TYPE);

    std::string ext = file_name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == "mp4")
        return "video/mp4";
    if (ext == "webm")
        return "video/webm";
    if (ext == "mov")
        return "video/quicktime";
    if (ext == "avi")
        return "video/x-msvideo";
    if (ext == "mkv")
        return "video/x-matroska";
    return std::string(constants::DEFAULT_MIME_TYPE);
}

}  // namespace proto
