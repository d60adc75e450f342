#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/digest.hpp"

namespace xfer
{

// TX
// Split into spans of at most chunk_size bytes, each base64'd on its own.
// Empty buffer -> no chunks. chunk_size == 0 -> logged, empty result.
std::vector<std::string> chunk_data(const std::vector<std::uint8_t> &buffer, std::size_t chunk_size);

// [MESSAGE_BEGIN, HEADER_BEGIN, "LEN:<n>", "HASH:<hex>", HEADER_END]
std::vector<std::string> create_header(std::uint64_t chunk_count, const std::string &digest_hex);

// "<seq, 10 digits zero padded>:<payload>"; empty string if seq > MAX_SEQUENCE
std::string create_data_message(std::uint64_t seq, std::string_view b64_payload);

// Header block + data messages + MESSAGE_END, ready to render one code at a time.
// Empty on failure (empty buffer, bad chunk size, too many chunks, digest error).
std::vector<std::string> build_message_sequence(const std::vector<std::uint8_t> &buffer,
                                                std::size_t                      chunk_size,
                                                const crypto::Digest            &digest);

}  // namespace xfer
