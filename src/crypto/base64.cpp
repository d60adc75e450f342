#include <sodium.h>

#include "crypto/base64.hpp"
#include "crypto/digest.hpp"
#include "util/log.hpp"

namespace b64
{

static constexpr int VARIANT = sodium_base64_VARIANT_ORIGINAL;

std::string encode(const std::uint8_t *data, std::size_t len)
{
    if (len == 0)
        return {};
    if (!crypto::ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return {};
    }

    // ENCODED_LEN counts the trailing NUL
    std::string out(sodium_base64_ENCODED_LEN(len, VARIANT), '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, VARIANT);
    out.resize(out.size() - 1);
    return out;
}

std::optional<std::vector<std::uint8_t>> decode(std::string_view text)
{
    if (text.empty())
        return std::vector<std::uint8_t>{};
    if (!crypto::ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return std::nullopt;
    }

    std::vector<std::uint8_t> out(text.size() / 4 * 3 + 3);
    std::size_t               real_len = 0;
    const char               *end      = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), /*ignore=*/nullptr,
                          &real_len, &end, VARIANT) != 0)
    {
        return std::nullopt;
    }
    // libsodium stops quietly at the first foreign character when b64_end is given
    if (end != text.data() + text.size())
        return std::nullopt;

    out.resize(real_len);
    return out;
}

}  // namespace b64
