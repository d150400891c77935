// tests/test_env.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

#include "app/session.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
        ::unsetenv(k);
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_Config, DefaultsWhenUnset)
{
    EnvGuard g1("CHUNKCAST_TOPOLOGY"), g2("CHUNKCAST_REQUEST_WINDOW"), g3("CHUNKCAST_MODE"),
        g4("CHUNKCAST_NAME");

    auto cfg = config::from_env();
    EXPECT_EQ(cfg.topology, transport::Topology::Relay);
    EXPECT_FALSE(cfg.push);
    EXPECT_FALSE(cfg.request_window);
    EXPECT_EQ(cfg.name, "chunkcast");
    EXPECT_EQ(cfg.metadata_interval.count(), 1000);
}

TEST(Env_Config, ReadsValidValues)
{
    EnvGuard g1("CHUNKCAST_TOPOLOGY"), g2("CHUNKCAST_REQUEST_WINDOW"), g3("CHUNKCAST_MODE"),
        g4("CHUNKCAST_REQUEST_INTERVAL_MS"), g5("CHUNKCAST_CHUNK_INTERVAL_MS");
    g1.set("Direct");
    g2.set("8");
    g3.set("push");
    g4.set("250");
    g5.set("0");

    auto cfg = config::from_env();
    EXPECT_EQ(cfg.topology, transport::Topology::Direct);
    EXPECT_EQ(cfg.request_window, std::optional<std::size_t>(8));
    EXPECT_EQ(cfg.push, std::optional<bool>(true));
    EXPECT_EQ(cfg.request_interval->count(), 250);
    EXPECT_EQ(cfg.chunk_interval.count(), 0);
}

TEST(Env_Config, InvalidValuesKeepDefaultAndWarn)
{
    EnvGuard g1("CHUNKCAST_REQUEST_WINDOW"), g2("CHUNKCAST_TOPOLOGY"),
        g3("CHUNKCAST_METADATA_ATTEMPTS");
    g1.set("0");
    g2.set("mesh");
    g3.set("12abc");

    chunkcast::set_log_level(chunkcast::Level::Info);
    testing::internal::CaptureStderr();
    auto        cfg = config::from_env();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_FALSE(cfg.request_window);
    EXPECT_FALSE(cfg.metadata_attempts);
    EXPECT_EQ(cfg.topology, transport::Topology::Relay);
    EXPECT_NE(err.find("CHUNKCAST_REQUEST_WINDOW"), std::string::npos);
    EXPECT_NE(err.find("CHUNKCAST_TOPOLOGY"), std::string::npos);
    EXPECT_NE(err.find("CHUNKCAST_METADATA_ATTEMPTS"), std::string::npos);
}

TEST(Env_Config, NameIsTruncated)
{
    EnvGuard g("CHUNKCAST_NAME");
    g.set(std::string(100, 'x'));
    auto cfg = config::from_env();
    EXPECT_EQ(cfg.name.size(), constants::NAME_MAX);
}

TEST(Config, ParseHelpers)
{
    std::uint64_t v = 0;
    EXPECT_TRUE(config::parse_uint("42", 1, 64, v));
    EXPECT_EQ(v, 42u);
    EXPECT_FALSE(config::parse_uint("65", 1, 64, v));
    EXPECT_FALSE(config::parse_uint("-1", 0, 64, v));
    EXPECT_FALSE(config::parse_uint("", 0, 64, v));
    EXPECT_FALSE(config::parse_uint(nullptr, 0, 64, v));

    bool push = true;
    EXPECT_TRUE(config::parse_mode("demand", push));
    EXPECT_FALSE(push);
    EXPECT_FALSE(config::parse_mode("broadcast", push));

    transport::Topology t = transport::Topology::Direct;
    EXPECT_TRUE(config::parse_topology("gossip", t));
    EXPECT_EQ(t, transport::Topology::Relay);
}

TEST(Config, TopologyDefaults)
{
    config::Config cfg;

    auto br = app::broadcaster_options(cfg, transport::Topology::Relay);
    EXPECT_TRUE(br.push);
    EXPECT_EQ(br.presence_interval.count(), 3000);
    auto bd = app::broadcaster_options(cfg, transport::Topology::Direct);
    EXPECT_FALSE(bd.push);
    EXPECT_EQ(bd.presence_interval.count(), 5000);

    auto vr = app::viewer_options(cfg, transport::Topology::Relay);
    EXPECT_EQ(vr.request_window, 5u);
    EXPECT_EQ(vr.request_interval.count(), 500);
    EXPECT_EQ(vr.metadata_attempts, 10u);
    EXPECT_FALSE(vr.wait_for_connect);
    EXPECT_TRUE(vr.serve_peers);

    auto vd = app::viewer_options(cfg, transport::Topology::Direct);
    EXPECT_EQ(vd.request_window, 3u);
    EXPECT_EQ(vd.request_interval.count(), 300);
    EXPECT_EQ(vd.metadata_attempts, 1u);
    EXPECT_TRUE(vd.wait_for_connect);
    EXPECT_FALSE(vd.serve_peers);

    cfg.push           = false;
    cfg.request_window = 7;
    EXPECT_FALSE(app::broadcaster_options(cfg, transport::Topology::Relay).push);
    EXPECT_EQ(app::viewer_options(cfg, transport::Topology::Direct).request_window, 7u);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace chunkcast;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);
    EXPECT_NE(out2.find("[ERROR]"), std::string::npos);

    // SYSTEM lines pass every threshold
    testing::internal::CaptureStderr();
    LOG_SYSTEM("system_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("system_visible"), std::string::npos);

    // unknown names fall back to info
    set_log_level_by_name("chatty");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_hidden");
    LOG_INFO("info_visible");
    std::string out4 = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out4.find("debug_hidden"), std::string::npos);
    EXPECT_NE(out4.find("info_visible"), std::string::npos);

    set_log_level(Level::Info);
}

TEST(LogLevel, ShortId)
{
    EXPECT_EQ(chunkcast::short_id("0123456789abcdef"), "01234567");
    EXPECT_EQ(chunkcast::short_id("abc"), "abc");
}

TEST(LogLevel, ParseIsCaseInsensitive)
{
    using chunkcast::Level;
    EXPECT_EQ(chunkcast::parse_level("Debug"), Level::Debug);
    EXPECT_EQ(chunkcast::parse_level("WARNING"), Level::Warning);
    EXPECT_EQ(chunkcast::parse_level("err"), Level::Error);
    EXPECT_FALSE(chunkcast::parse_level("system"));
    EXPECT_FALSE(chunkcast::parse_level(""));

    EXPECT_TRUE(chunkcast::set_log_level_by_name("warn"));
    EXPECT_EQ(chunkcast::log_level(), Level::Warning);
    EXPECT_FALSE(chunkcast::set_log_level_by_name("loud"));
    EXPECT_EQ(chunkcast::log_level(), Level::Info);
}

TEST(LogLevel, SinkReceivesFormattedLines)
{
    using namespace chunkcast;
    std::vector<std::pair<Level, std::string>> lines;
    set_log_level(Level::Info);
    set_log_sink([&](Level lv, const std::string &l) { lines.emplace_back(lv, l); });

    LOG_DEBUG("hidden");
    LOG_WARN("chunk %d of %d\n", 3, 7);

    config::Config cfg;
    cfg.log_level = "verbose";
    config::apply_log_level(cfg);
    set_log_sink(nullptr);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].first, Level::Warning);
    EXPECT_NE(lines[0].second.find("[WARN]"), std::string::npos);
    EXPECT_NE(lines[0].second.find("chunk 3 of 7"), std::string::npos);
    EXPECT_NE(lines[0].second.back(), '\n');
    EXPECT_NE(lines[1].second.find("verbose"), std::string::npos);
    EXPECT_EQ(log_level(), Level::Info);
}
