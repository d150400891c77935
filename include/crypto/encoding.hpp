#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crypto
{

// libsodium must be initialised once per process before any other call
bool ensure_sodium_init();

// Standard (RFC 4648, padded) base64
std::string                              to_base64(const std::uint8_t *data, std::size_t len);
std::string                              to_base64(const std::vector<std::uint8_t> &bytes);
std::optional<std::vector<std::uint8_t>> from_base64(std::string_view text);

std::string to_hex(const std::uint8_t *data, std::size_t len);

// A fresh 32-byte random identity rendered as 64 lowercase hex chars
std::string random_peer_id();

}  // namespace crypto
