#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_uint(const char *s, std::uint64_t lo, std::uint64_t hi, std::uint64_t &out)
{
    if (!s || !*s || !std::isdigit(static_cast<unsigned char>(*s)))
        return false;
    errno                = 0;
    char              *p = nullptr;
    unsigned long long v = std::strtoull(s, &p, 10);
    if (errno != 0 || !p || *p != '\0')
        return false;
    if (v < lo || v > hi)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool parse_topology(const std::string &s, transport::Topology &out)
{
    const std::string v = to_lower(s);
    if (v == "relay" || v == "gossip")
    {
        out = transport::Topology::Relay;
        return true;
    }
    if (v == "direct")
    {
        out = transport::Topology::Direct;
        return true;
    }
    return false;
}

bool parse_mode(const std::string &s, bool &push)
{
    const std::string v = to_lower(s);
    if (v == "push")
    {
        push = true;
        return true;
    }
    if (v == "demand" || v == "pull")
    {
        push = false;
        return true;
    }
    return false;
}

// Reads an integer env var in [lo, hi]. Invalid values keep the default and warn.
static std::optional<std::uint64_t> env_uint(const char *key, std::uint64_t lo, std::uint64_t hi)
{
    const char *e = std::getenv(key);
    if (!e)
        return std::nullopt;
    std::uint64_t v = 0;
    if (!parse_uint(e, lo, hi, v))
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %llu..%llu)", key, e, (unsigned long long)lo,
                 (unsigned long long)hi);
        return std::nullopt;
    }
    return v;
}

Config from_env()
{
    Config cfg;

    if (const char *e = std::getenv("CHUNKCAST_LOG_LEVEL"); e && *e)
        cfg.log_level = e;

    if (const char *e = std::getenv("CHUNKCAST_TOPOLOGY"); e && *e)
    {
        if (!parse_topology(e, cfg.topology))
            LOG_WARN("Ignoring invalid CHUNKCAST_TOPOLOGY='%s' (expect relay|direct)", e);
    }

    if (const char *e = std::getenv("CHUNKCAST_MODE"); e && *e)
    {
        bool push = false;
        if (parse_mode(e, push))
            cfg.push = push;
        else
            LOG_WARN("Ignoring invalid CHUNKCAST_MODE='%s' (expect push|demand)", e);
    }

    if (auto v = env_uint("CHUNKCAST_REQUEST_WINDOW", 1, 64))
        cfg.request_window = static_cast<std::size_t>(*v);
    if (auto v = env_uint("CHUNKCAST_REQUEST_INTERVAL_MS", 10, 60000))
        cfg.request_interval = ms(*v);
    if (auto v = env_uint("CHUNKCAST_METADATA_ATTEMPTS", 1, 1000))
        cfg.metadata_attempts = static_cast<std::uint32_t>(*v);
    if (auto v = env_uint("CHUNKCAST_METADATA_INTERVAL_MS", 10, 60000))
        cfg.metadata_interval = ms(*v);
    if (auto v = env_uint("CHUNKCAST_PRESENCE_INTERVAL_MS", 100, 60000))
        cfg.presence_interval = ms(*v);
    if (auto v = env_uint("CHUNKCAST_CHUNK_INTERVAL_MS", 0, 10000))
        cfg.chunk_interval = ms(*v);

    if (const char *e = std::getenv("CHUNKCAST_NAME"); e && *e)
    {
        cfg.name = e;
        if (cfg.name.size() > constants::NAME_MAX)
        {
            LOG_WARN("CHUNKCAST_NAME truncated to %zu chars", constants::NAME_MAX);
            cfg.name.resize(constants::NAME_MAX);
        }
    }
    return cfg;
}

void apply_log_level(const Config &cfg)
{
    if (!chunkcast::set_log_level_by_name(cfg.log_level))
        LOG_WARN("Unknown log level '%s', using info", cfg.log_level.c_str());
}

void log_summary(const Config &cfg)
{
    auto opt_ms = [](const std::optional<ms> &v) -> long long {
        return v ? static_cast<long long>(v->count()) : -1;
    };
    LOG_SYSTEM("Config: topology=%s mode=%s window=%zu request_ms=%lld metadata=%u@%lldms "
               "presence_ms=%lld chunk_ms=%lld name=%s (-1/0 == topology default)",
               transport::topology_name(cfg.topology),
               cfg.push ? (*cfg.push ? "push" : "demand") : "default",
               cfg.request_window.value_or(0), opt_ms(cfg.request_interval),
               cfg.metadata_attempts.value_or(0), (long long)cfg.metadata_interval.count(),
               opt_ms(cfg.presence_interval), (long long)cfg.chunk_interval.count(),
               cfg.name.c_str());
}

}  // namespace config
