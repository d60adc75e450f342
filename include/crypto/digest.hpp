#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crypto
{

constexpr std::size_t DIGEST_SIZE     = 20;  // 160-bit, same width as the web sender's SHA-1
constexpr std::size_t DIGEST_HEX_SIZE = DIGEST_SIZE * 2;

// Integrity fingerprint of a whole buffer, rendered as lowercase hex.
class Digest
{
  public:
    virtual ~Digest() = default;

    virtual std::string hex(const std::uint8_t *data, std::size_t len) const = 0;

    std::string hex(const std::vector<std::uint8_t> &data) const
    {
        return hex(data.data(), data.size());
    }
};

// libsodium-based implementation (BLAKE2b, 20-byte output)
class SodiumDigest : public Digest
{
  public:
    using Digest::hex;
    std::string hex(const std::uint8_t *data, std::size_t len) const override;
};

// Lowercase copy, for case-insensitive digest comparison.
std::string to_lower_hex(const std::string &s);

bool is_hex_digest(const std::string &s);

// sodium_init() once per process; false if libsodium could not initialize.
bool ensure_sodium_init();

}  // namespace crypto
