#include <array>
#include <cctype>
#include <sodium.h>

#include "crypto/digest.hpp"
#include "util/log.hpp"

namespace crypto
{

static_assert(DIGEST_SIZE >= crypto_generichash_BYTES_MIN, "digest too short for BLAKE2b");
static_assert(DIGEST_SIZE <= crypto_generichash_BYTES_MAX, "digest too long for BLAKE2b");

bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::string SodiumDigest::hex(const std::uint8_t *data, std::size_t len) const
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return {};
    }

    std::array<unsigned char, DIGEST_SIZE> out{};
    // unkeyed BLAKE2b
    if (crypto_generichash(out.data(), out.size(), len ? data : nullptr,
                           static_cast<unsigned long long>(len), nullptr, 0) != 0)
    {
        LOG_ERROR("crypto_generichash failed (%zu bytes)", len);
        return {};
    }

    std::array<char, DIGEST_HEX_SIZE + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), out.data(), out.size());  // lowercase
    return std::string(hex.data(), DIGEST_HEX_SIZE);
}

std::string to_lower_hex(const std::string &s)
{
    std::string out = s;
    for (auto &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool is_hex_digest(const std::string &s)
{
    if (s.empty() || (s.size() % 2))
        return false;
    for (unsigned char c : s)
    {
        if (!std::isxdigit(c))
            return false;
    }
    return true;
}

}  // namespace crypto
