#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "crypto/digest.hpp"
#include "proto/message.hpp"

namespace xfer
{

// Received chunks keyed by sequence. Dense arena (index == seq) once the chunk count is known
// and reasonable; ordered sparse map for chunks seen before the header and out-of-range ones.
class ChunkStore
{
  public:
    static constexpr std::uint64_t MAX_DENSE = 1u << 20;

    void clear();
    // Fix the expected count and move buffered in-range chunks into the arena.
    void set_total(std::uint64_t total);
    // false on duplicate (first copy wins)
    bool insert(std::uint64_t seq, std::string payload);
    bool contains(std::uint64_t seq) const;

    std::size_t   size() const { return dense_count_ + sparse_.size(); }
    std::uint64_t total() const { return total_; }
    std::size_t   out_of_range() const;
    // Ascending [0, total) minus present, at most `limit` entries
    std::vector<std::uint64_t> missing(std::size_t limit = MAX_DENSE) const;
    std::size_t                missing_count() const;
    // Hands every chunk over in ascending order and leaves the store empty.
    std::vector<Chunk> take_all();

  private:
    std::uint64_t                        total_{0};
    bool                                 dense_{false};
    std::vector<std::string>             parts_;  // size == total when dense
    std::vector<bool>                    have_;   // size == total when dense
    std::size_t                          dense_count_{0};
    std::map<std::uint64_t, std::string> sparse_;
};

// Sort by seq, base64-decode each payload, concatenate. Fails on the first payload that
// does not decode (its seq goes to *bad_seq); no partial output.
std::optional<std::vector<std::uint8_t>> reassemble(std::vector<Chunk> chunks,
                                                    std::uint64_t     *bad_seq = nullptr);

// Recompute and compare against expected_hex, case-insensitive.
bool verify(const std::vector<std::uint8_t> &buffer,
            const std::string               &expected_hex,
            const crypto::Digest            &digest);

}  // namespace xfer
