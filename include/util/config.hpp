#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "transport/itransport.hpp"

namespace config
{

using ms = std::chrono::milliseconds;

// Runtime knobs, read from CHUNKCAST_* environment variables. Unset optionals take the
// default of the selected topology when the session is bound.
struct Config
{
    std::string                  log_level = "info";
    transport::Topology          topology  = transport::Topology::Relay;
    std::optional<bool>          push;  // broadcaster streams every chunk unprompted
    std::optional<std::size_t>   request_window;
    std::optional<ms>            request_interval;
    std::optional<std::uint32_t> metadata_attempts;
    ms                           metadata_interval{1000};
    std::optional<ms>            presence_interval;
    ms                           chunk_interval{100};
    std::string                  name = "chunkcast";
};

Config from_env();

// Sets the global log threshold from cfg.log_level
void apply_log_level(const Config &cfg);

// Prints the effective configuration at SYSTEM level
void log_summary(const Config &cfg);

bool parse_topology(const std::string &s, transport::Topology &out);
bool parse_mode(const std::string &s, bool &push);  // "push" | "demand"

// Strict decimal parse within [lo, hi]
bool parse_uint(const char *s, std::uint64_t lo, std::uint64_t hi, std::uint64_t &out);

}  // namespace config
