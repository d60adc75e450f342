#include <algorithm>
#include <cstdio>

#include "crypto/base64.hpp"
#include "proto/framer.hpp"
#include "proto/message.hpp"
#include "util/log.hpp"

namespace xfer
{

std::vector<std::string> chunk_data(const std::vector<std::uint8_t> &buffer, std::size_t chunk_size)
{
    if (chunk_size < 1)
    {
        LOG_ERROR("chunk_data: invalid chunk_size (%zu)", chunk_size);
        return {};
    }
    std::vector<std::string> out;
    if (buffer.empty())
        return out;

    const std::size_t num_chunks = (buffer.size() + chunk_size - 1) / chunk_size;
    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        std::size_t start = i * chunk_size;
        std::size_t take  = std::min(chunk_size, buffer.size() - start);
        out.push_back(b64::encode(buffer.data() + start, take));
    }
    return out;
}

std::vector<std::string> create_header(std::uint64_t chunk_count, const std::string &digest_hex)
{
    return {
        std::string(MESSAGE_BEGIN),
        std::string(HEADER_BEGIN),
        std::string(FIELD_LEN) + ":" + std::to_string(chunk_count),
        std::string(FIELD_HASH) + ":" + digest_hex,
        std::string(HEADER_END),
    };
}

std::string create_data_message(std::uint64_t seq, std::string_view b64_payload)
{
    if (seq > MAX_SEQUENCE)
    {
        LOG_ERROR("create_data_message: sequence %llu does not fit %zu digits",
                  static_cast<unsigned long long>(seq), SEQ_DIGITS);
        return {};
    }
    char prefix[SEQ_DIGITS + 2];
    std::snprintf(prefix, sizeof(prefix), "%010llu:", static_cast<unsigned long long>(seq));

    std::string out;
    out.reserve(SEQ_DIGITS + 1 + b64_payload.size());
    out.append(prefix, SEQ_DIGITS + 1);
    out.append(b64_payload.data(), b64_payload.size());
    return out;
}

std::vector<std::string> build_message_sequence(const std::vector<std::uint8_t> &buffer,
                                                std::size_t                      chunk_size,
                                                const crypto::Digest            &digest)
{
    // LEN must be positive on the receiving side, so an empty buffer has no valid framing
    if (buffer.empty())
    {
        LOG_ERROR("build_message_sequence: empty buffer");
        return {};
    }
    auto chunks = chunk_data(buffer, chunk_size);
    if (chunks.empty())
        return {};
    if (chunks.size() - 1 > MAX_SEQUENCE)
    {
        LOG_ERROR("build_message_sequence: buffer too large (%zu bytes, needs %zu chunks)",
                  buffer.size(), chunks.size());
        return {};
    }

    const std::string hash = digest.hex(buffer);
    if (hash.empty())
    {
        LOG_ERROR("build_message_sequence: digest failed");
        return {};
    }

    std::vector<std::string> out = create_header(chunks.size(), hash);
    out.reserve(out.size() + chunks.size() + 1);
    for (std::size_t i = 0; i < chunks.size(); i++)
        out.push_back(create_data_message(i, chunks[i]));
    out.emplace_back(MESSAGE_END);

    LOG_DEBUG("framed %zu bytes into %zu chunks (%zu messages)", buffer.size(), chunks.size(),
              out.size());
    return out;
}

}  // namespace xfer
