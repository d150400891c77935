#include <limits>
#include <nlohmann/json.hpp>
#include <string>

#include "crypto/encoding.hpp"
#include "proto/codec.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace proto
{

using json = nlohmann::json;

namespace
{

json envelope(std::string_view type, const PeerId &from)
{
    json j;
    j["type"] = std::string(type);
    j["from"] = from;
    j["v"]    = constants::WIRE_VERSION;
    return j;
}

bool get_u32(const json &j, const char *key, std::uint32_t &out)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned())
        return false;
    const auto v = it->get<std::uint64_t>();
    if (v > std::numeric_limits<std::uint32_t>::max())
        return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool get_string(const json &j, const char *key, std::string &out)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

// base64 string, or a JSON array of byte values (web dashboard format)
bool get_bytes(const json &j, const char *key, Bytes &out)
{
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (it->is_string())
    {
        auto raw = crypto::from_base64(it->get_ref<const std::string &>());
        if (!raw)
            return false;
        out = std::move(*raw);
        return true;
    }
    if (it->is_array())
    {
        out.clear();
        out.reserve(it->size());
        for (const auto &b : *it)
        {
            if (!b.is_number_unsigned() || b.get<std::uint64_t>() > 0xFF)
                return false;
            out.push_back(static_cast<std::uint8_t>(b.get<std::uint64_t>()));
        }
        return true;
    }
    return false;
}

std::optional<Message> decode_body(const std::string &type, const PeerId &from, const json &j)
{
    if (type == T_REQUEST_METADATA)
        return RequestMetadata{from};

    if (type == T_METADATA)
    {
        Metadata m{from, {}};
        auto     size = j.find("fileSize");
        if (size == j.end() || !size->is_number_unsigned())
            return std::nullopt;
        m.meta.file_size = size->get<std::uint64_t>();
        if (!get_u32(j, "totalChunks", m.meta.total_chunks))
            return std::nullopt;
        if (!get_string(j, "fileName", m.meta.file_name))
            m.meta.file_name = std::string(constants::DEFAULT_FILE_NAME);
        if (!get_string(j, "mimeType", m.meta.mime_type))
            m.meta.mime_type = std::string(constants::DEFAULT_MIME_TYPE);
        auto dur = j.find("duration");
        if (dur != j.end() && !dur->is_null())
        {
            if (!dur->is_number())
                return std::nullopt;
            m.meta.duration = dur->get<double>();
        }
        return m;
    }

    if (type == T_REQUEST_CHUNK)
    {
        RequestChunk r{from, 0};
        if (!get_u32(j, "chunkIndex", r.index))
            return std::nullopt;
        return r;
    }

    if (type == T_CHUNK)
    {
        ChunkData c{from, 0, {}};
        if (!get_u32(j, "chunkIndex", c.index) || !get_bytes(j, "chunkData", c.payload))
            return std::nullopt;
        if (c.payload.size() > constants::CHUNK_SIZE)
            return std::nullopt;
        return c;
    }

    if (type == T_PRESENCE)
    {
        Presence p{from, {}};
        (void)get_string(j, "name", p.name);  // optional
        if (p.name.size() > constants::NAME_MAX)
            p.name.resize(constants::NAME_MAX);
        return p;
    }

    if (type == T_SIGNAL)
    {
        Signal s{from, {}};
        if (!get_bytes(j, "data", s.payload))
            return std::nullopt;
        return s;
    }

    if (type == T_HAVE_CHUNKS)
    {
        HaveChunks h{from, {}};
        auto       it = j.find("availableChunks");
        if (it == j.end() || !it->is_array())
            return std::nullopt;
        h.indices.reserve(it->size());
        for (const auto &v : *it)
        {
            if (!v.is_number_unsigned() ||
                v.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max())
                return std::nullopt;
            h.indices.push_back(static_cast<std::uint32_t>(v.get<std::uint64_t>()));
        }
        return h;
    }

    // a video-* type we do not speak (newer peer, other app on the topic)
    return std::nullopt;
}

}  // namespace

std::optional<Bytes> encode(const Message &m, std::size_t max_size)
{
    std::optional<json> j = std::visit(
        overloaded{
            [](const RequestMetadata &r) -> std::optional<json> {
                return envelope(T_REQUEST_METADATA, r.from);
            },
            [](const Metadata &r) -> std::optional<json> {
                json j           = envelope(T_METADATA, r.from);
                j["fileName"]    = r.meta.file_name;
                j["fileSize"]    = r.meta.file_size;
                j["mimeType"]    = r.meta.mime_type;
                j["totalChunks"] = r.meta.total_chunks;
                if (r.meta.duration)
                    j["duration"] = *r.meta.duration;
                return j;
            },
            [](const RequestChunk &r) -> std::optional<json> {
                json j          = envelope(T_REQUEST_CHUNK, r.from);
                j["chunkIndex"] = r.index;
                return j;
            },
            [](const ChunkData &r) -> std::optional<json> {
                if (r.payload.size() > constants::CHUNK_SIZE)
                {
                    LOG_ERROR("encode: chunk %u payload too large (%zu > %zu)", r.index,
                              r.payload.size(), constants::CHUNK_SIZE);
                    return std::nullopt;
                }
                json j          = envelope(T_CHUNK, r.from);
                j["chunkIndex"] = r.index;
                j["chunkData"]  = crypto::to_base64(r.payload);
                return j;
            },
            [](const Presence &r) -> std::optional<json> {
                json j    = envelope(T_PRESENCE, r.from);
                j["name"] = r.name;
                return j;
            },
            [](const Signal &r) -> std::optional<json> {
                json j    = envelope(T_SIGNAL, r.from);
                j["data"] = crypto::to_base64(r.payload);
                return j;
            },
            [](const HaveChunks &r) -> std::optional<json> {
                json j               = envelope(T_HAVE_CHUNKS, r.from);
                j["availableChunks"] = r.indices;
                return j;
            },
            // lifecycle events never go on the wire
            [](const PeerUp &) -> std::optional<json> { return std::nullopt; },
            [](const PeerDown &) -> std::optional<json> { return std::nullopt; },
            [](const Error &) -> std::optional<json> { return std::nullopt; },
        },
        m);
    if (!j)
        return std::nullopt;

    // replace invalid UTF-8 in names/ids instead of throwing
    const std::string text = j->dump(-1, ' ', false, json::error_handler_t::replace);
    if (text.size() > max_size)
    {
        LOG_WARN("encode: %s is %zu bytes, exceeds transport limit %zu", type_name(m),
                 text.size(), max_size);
        return std::nullopt;
    }
    return Bytes(text.begin(), text.end());
}

std::optional<Message> decode(const std::uint8_t *data, std::size_t len)
{
    if (!data || len == 0)
        return std::nullopt;

    json j = json::parse(data, data + len, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;

    // discriminator first: foreign traffic stops here
    auto t = j.find("type");
    if (t == j.end() || !t->is_string())
        return std::nullopt;
    const std::string &type = t->get_ref<const std::string &>();
    if (type.compare(0, constants::TYPE_PREFIX.size(), constants::TYPE_PREFIX) != 0)
        return std::nullopt;

    try
    {
        auto v = j.find("v");
        if (v != j.end() && (!v->is_number_unsigned() ||
                             v->get<std::uint64_t>() != constants::WIRE_VERSION))
        {
            LOG_DEBUG("decode: unsupported wire version in %s", type.c_str());
            return std::nullopt;
        }

        PeerId from;
        if (!get_string(j, "from", from) || from.empty())
        {
            LOG_DEBUG("decode: %s without origin", type.c_str());
            return std::nullopt;
        }
        auto msg = decode_body(type, from, j);
        if (!msg)
            LOG_DEBUG("decode: malformed or unknown %s from %s", type.c_str(),
                      chunkcast::short_id(from).c_str());
        return msg;
    }
    catch (const json::exception &e)
    {
        LOG_DEBUG("decode: %s rejected (%s)", type.c_str(), e.what());
        return std::nullopt;
    }
}

std::optional<Message> decode(const Bytes &bytes)
{
    return decode(bytes.data(), bytes.size());
}

}  // namespace proto
