#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "proto/message.hpp"
#include "util/constants.hpp"

/*
Wire format: one UTF-8 JSON object per transport message.

  {"type":"video-request-metadata","from":"<id>","v":1}
  {"type":"video-metadata","from":"<id>","v":1,"fileName":"a.mp4","fileSize":153600,
   "mimeType":"video/mp4","totalChunks":3,"duration":12.5}
  {"type":"video-request-chunk","from":"<id>","v":1,"chunkIndex":2}
  {"type":"video-chunk","from":"<id>","v":1,"chunkIndex":2,"chunkData":"<base64>"}
  {"type":"video-presence","from":"<id>","v":1,"name":"cam-1"}
  {"type":"video-signal","from":"<id>","v":1,"data":"<base64>"}
  {"type":"video-have-chunks","from":"<id>","v":1,"availableChunks":[0,1,2]}

The type prefix is checked before anything else so unrelated traffic on a shared relay
topic costs one string compare. Decoding never throws.
*/

namespace proto
{

inline constexpr std::string_view T_REQUEST_METADATA = "video-request-metadata";
inline constexpr std::string_view T_METADATA         = "video-metadata";
inline constexpr std::string_view T_REQUEST_CHUNK    = "video-request-chunk";
inline constexpr std::string_view T_CHUNK            = "video-chunk";
inline constexpr std::string_view T_PRESENCE         = "video-presence";
inline constexpr std::string_view T_SIGNAL           = "video-signal";
inline constexpr std::string_view T_HAVE_CHUNKS      = "video-have-chunks";

// nullopt for lifecycle events, oversize chunk payloads, or encodings larger than
// max_size
std::optional<Bytes> encode(const Message &m,
                            std::size_t    max_size = constants::MAX_MESSAGE_SIZE);

// nullopt for anything that is not a well-formed chunkcast message
std::optional<Message> decode(const std::uint8_t *data, std::size_t len);
std::optional<Message> decode(const Bytes &bytes);

}  // namespace proto
