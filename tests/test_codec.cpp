#include <gtest/gtest.h>
#include <string>

#include "proto/codec.hpp"
#include "proto/message.hpp"
#include "util/constants.hpp"

using namespace proto;

static Bytes text(const std::string &s)
{
    return Bytes(s.begin(), s.end());
}

static std::string as_string(const Bytes &b)
{
    return std::string(b.begin(), b.end());
}

TEST(Codec, MetadataRoundTrip)
{
    AssetMetadata meta{"clip.webm", 153600, "video/webm", 3, 12.5};
    auto          wire = encode(Metadata{"peer-a", meta});
    ASSERT_TRUE(wire);

    const std::string s = as_string(*wire);
    EXPECT_NE(s.find("\"type\":\"video-metadata\""), std::string::npos);
    EXPECT_NE(s.find("\"fileName\":\"clip.webm\""), std::string::npos);
    EXPECT_NE(s.find("\"totalChunks\":3"), std::string::npos);

    auto back = decode(*wire);
    ASSERT_TRUE(back);
    auto *m = std::get_if<Metadata>(&*back);
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->from, "peer-a");
    EXPECT_EQ(m->meta, meta);
}

TEST(Codec, MetadataWithoutDurationOmitsField)
{
    auto wire = encode(Metadata{"p", {"a.mp4", 1, "video/mp4", 1, std::nullopt}});
    ASSERT_TRUE(wire);
    EXPECT_EQ(as_string(*wire).find("duration"), std::string::npos);
}

TEST(Codec, ChunkCarriesBase64Payload)
{
    Bytes payload = {0x00, 0xFF, 0x10, 0x80};
    auto  wire    = encode(ChunkData{"peer-b", 7, payload});
    ASSERT_TRUE(wire);
    EXPECT_NE(as_string(*wire).find("\"chunkData\":\"AP8QgA==\""), std::string::npos);

    auto back = decode(*wire);
    ASSERT_TRUE(back);
    auto *c = std::get_if<ChunkData>(&*back);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->index, 7u);
    EXPECT_EQ(c->payload, payload);
}

TEST(Codec, FullChunkFitsMessageLimit)
{
    Bytes payload(constants::CHUNK_SIZE, 0xAB);
    auto  wire = encode(ChunkData{std::string(64, 'f'), 0, payload});
    ASSERT_TRUE(wire);
    EXPECT_LE(wire->size(), constants::MAX_MESSAGE_SIZE);
}

TEST(Codec, EncodeRespectsSizeBound)
{
    Bytes payload(1000, 0x01);
    EXPECT_FALSE(encode(ChunkData{"p", 0, payload}, 500));
    EXPECT_FALSE(encode(ChunkData{"p", 0, Bytes(constants::CHUNK_SIZE + 1, 0)}));
}

TEST(Codec, LifecycleEventsAreNotEncoded)
{
    EXPECT_FALSE(encode(PeerUp{"x"}));
    EXPECT_FALSE(encode(PeerDown{"x"}));
    EXPECT_FALSE(encode(Error{"boom"}));
}

TEST(Codec, RequestsPresenceSignalHaveChunks)
{
    auto rm = decode(*encode(RequestMetadata{"v1"}));
    ASSERT_TRUE(rm && std::holds_alternative<RequestMetadata>(*rm));

    auto rc = decode(*encode(RequestChunk{"v1", 42}));
    ASSERT_TRUE(rc);
    EXPECT_EQ(std::get<RequestChunk>(*rc).index, 42u);

    auto pr = decode(*encode(Presence{"b", "cam-1"}));
    ASSERT_TRUE(pr);
    EXPECT_EQ(std::get<Presence>(*pr).name, "cam-1");

    auto sg = decode(*encode(Signal{"b", {1, 2, 3}}));
    ASSERT_TRUE(sg);
    EXPECT_EQ(std::get<Signal>(*sg).payload, (Bytes{1, 2, 3}));

    auto hc = decode(*encode(HaveChunks{"v2", {0, 1, 9}}));
    ASSERT_TRUE(hc);
    EXPECT_EQ(std::get<HaveChunks>(*hc).indices, (std::vector<std::uint32_t>{0, 1, 9}));
}

TEST(Codec, ForeignTrafficIsSkipped)
{
    EXPECT_FALSE(decode(text(R"({"type":"chat-message","from":"x","text":"hi"})")));
    EXPECT_FALSE(decode(text(R"({"from":"x"})")));
    EXPECT_FALSE(decode(text(R"({"type":5,"from":"x"})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-teleport","from":"x"})")));
}

TEST(Codec, MalformedInputNeverThrows)
{
    EXPECT_FALSE(decode(text("")));
    EXPECT_FALSE(decode(text("not json")));
    EXPECT_FALSE(decode(text("[1,2,3]")));
    EXPECT_FALSE(decode(text(R"({"type":"video-chunk","from":"x","chunkIndex":1)")));
    EXPECT_FALSE(decode(nullptr, 10));

    // wrong field types
    EXPECT_FALSE(decode(text(R"({"type":"video-request-chunk","from":"x","chunkIndex":"1"})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-request-chunk","from":"x","chunkIndex":-1})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-request-chunk","from":"x","chunkIndex":1.5})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-chunk","from":"x","chunkIndex":0,"chunkData":"%%%"})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-metadata","from":"x","fileSize":"big","totalChunks":1})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-metadata","from":"x","fileSize":10})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-have-chunks","from":"x","availableChunks":[1,"a"]})")));
}

TEST(Codec, OriginIsRequired)
{
    EXPECT_FALSE(decode(text(R"({"type":"video-request-metadata"})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-request-metadata","from":""})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-request-metadata","from":7})")));
}

TEST(Codec, WireVersion)
{
    EXPECT_TRUE(decode(text(R"({"type":"video-request-metadata","from":"x"})")));
    EXPECT_TRUE(decode(text(R"({"type":"video-request-metadata","from":"x","v":1})")));
    EXPECT_FALSE(decode(text(R"({"type":"video-request-metadata","from":"x","v":2})")));
}

TEST(Codec, MetadataDefaults)
{
    auto m = decode(text(R"({"type":"video-metadata","from":"b","fileSize":5,"totalChunks":1})"));
    ASSERT_TRUE(m);
    const auto &meta = std::get<Metadata>(*m).meta;
    EXPECT_EQ(meta.file_name, "video");
    EXPECT_EQ(meta.mime_type, "video/mp4");
    EXPECT_FALSE(meta.duration);
}

TEST(Codec, ChunkDataAsByteArray)
{
    auto m = decode(text(R"({"type":"video-chunk","from":"b","chunkIndex":2,"chunkData":[1,2,255]})"));
    ASSERT_TRUE(m);
    EXPECT_EQ(std::get<ChunkData>(*m).payload, (Bytes{1, 2, 255}));

    EXPECT_FALSE(decode(text(R"({"type":"video-chunk","from":"b","chunkIndex":2,"chunkData":[256]})")));
}

TEST(Codec, PresenceNameIsTruncated)
{
    auto m = decode(*encode(Presence{"b", std::string(200, 'n')}));
    ASSERT_TRUE(m);
    EXPECT_EQ(std::get<Presence>(*m).name.size(), constants::NAME_MAX);
}

TEST(Message, OriginAndTypeName)
{
    EXPECT_EQ(origin(Message{RequestChunk{"abc", 1}}), std::optional<PeerId>("abc"));
    EXPECT_FALSE(origin(Message{PeerUp{"abc"}}));
    EXPECT_STREQ(type_name(Message{ChunkData{}}), "video-chunk");
    EXPECT_STREQ(type_name(Message{PeerDown{}}), "peer-disconnected");
}

TEST(Message, MimeTypeFromExtension)
{
    EXPECT_EQ(mime_type_for("a.MP4"), "video/mp4");
    EXPECT_EQ(mime_type_for("a.webm"), "video/webm");
    EXPECT_EQ(mime_type_for("a.mov"), "video/quicktime");
    EXPECT_EQ(mime_type_for("a.mkv"), "video/x-matroska");
    EXPECT_EQ(mime_type_for("noext"), "video/mp4");
}
