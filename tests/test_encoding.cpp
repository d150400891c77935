#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#include "crypto/encoding.hpp"

TEST(Encoding, Base64KnownVectors)
{
    ASSERT_TRUE(crypto::ensure_sodium_init());
    const std::string         s = "foobar";
    std::vector<std::uint8_t> b(s.begin(), s.end());

    EXPECT_EQ(crypto::to_base64(b), "Zm9vYmFy");
    EXPECT_EQ(crypto::to_base64(b.data(), 4), "Zm9vYg==");
    EXPECT_EQ(crypto::to_base64(b.data(), 0), "");

    auto back = crypto::from_base64("Zm9vYg==");
    ASSERT_TRUE(back);
    EXPECT_EQ(std::string(back->begin(), back->end()), "foob");

    auto empty = crypto::from_base64("");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());
}

TEST(Encoding, Base64RejectsGarbage)
{
    EXPECT_FALSE(crypto::from_base64("not base64!"));
    EXPECT_FALSE(crypto::from_base64("Zm9vYg"));    // missing padding
    EXPECT_FALSE(crypto::from_base64("Zm9v_mFy"));  // url-safe alphabet
}

TEST(Encoding, Hex)
{
    const std::uint8_t raw[] = {0x00, 0x7f, 0xa5, 0xff};
    EXPECT_EQ(crypto::to_hex(raw, sizeof(raw)), "007fa5ff");
    EXPECT_EQ(crypto::to_hex(raw, 0), "");
}

TEST(Encoding, RandomPeerIdsAreDistinctHex)
{
    std::set<std::string> seen;
    for (int i = 0; i < 16; ++i)
    {
        auto id = crypto::random_peer_id();
        ASSERT_EQ(id.size(), 64u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 16u);
}
