#include <array>
#include <sodium.h>

#include "crypto/encoding.hpp"
#include "util/log.hpp"

namespace crypto
{

constexpr int         B64_VARIANT = sodium_base64_VARIANT_ORIGINAL;
constexpr std::size_t ID_BYTES    = 32;

bool ensure_sodium_init()
{
    static bool ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::string to_base64(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();
    const std::size_t cap = sodium_base64_ENCODED_LEN(len, B64_VARIANT);  // includes NUL
    std::string       out(cap, '\0');
    sodium_bin2base64(out.data(), cap, data, len, B64_VARIANT);
    out.resize(cap - 1);
    return out;
}

std::string to_base64(const std::vector<std::uint8_t> &bytes)
{
    return to_base64(bytes.data(), bytes.size());
}

std::optional<std::vector<std::uint8_t>> from_base64(std::string_view text)
{
    ensure_sodium_init();
    std::vector<std::uint8_t> out(text.size() / 4 * 3 + 3);
    std::size_t               real_len = 0;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &real_len,
                          nullptr, B64_VARIANT) != 0)
    {
        return std::nullopt;
    }
    out.resize(real_len);
    return out;
}

std::string to_hex(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data, len);
    out.resize(len * 2);
    return out;
}

std::string random_peer_id()
{
    if (!ensure_sodium_init())
        LOG_WARN("sodium_init failed, identity quality may be reduced");
    std::array<std::uint8_t, ID_BYTES> raw{};
    randombytes_buf(raw.data(), raw.size());
    std::string id = to_hex(raw.data(), raw.size());
    sodium_memzero(raw.data(), raw.size());
    return id;
}

}  // namespace crypto
