#include <algorithm>
#include <iterator>

#include "crypto/base64.hpp"
#include "proto/reassembler.hpp"
#include "util/log.hpp"

namespace xfer
{

void ChunkStore::clear()
{
    total_       = 0;
    dense_       = false;
    dense_count_ = 0;
    parts_.clear();
    have_.clear();
    sparse_.clear();
}

void ChunkStore::set_total(std::uint64_t total)
{
    total_ = total;
    if (total == 0 || total > MAX_DENSE)
    {
        // stay sparse: a garbled LEN must not turn into a huge allocation
        LOG_DEBUG("ChunkStore: %llu chunks, keeping sparse storage",
                  static_cast<unsigned long long>(total));
        return;
    }

    dense_ = true;
    parts_.assign(static_cast<std::size_t>(total), {});
    have_.assign(static_cast<std::size_t>(total), false);
    dense_count_ = 0;
    for (auto it = sparse_.begin(); it != sparse_.end();)
    {
        if (it->first < total)
        {
            parts_[it->first] = std::move(it->second);
            have_[it->first]  = true;
            dense_count_++;
            it = sparse_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

bool ChunkStore::insert(std::uint64_t seq, std::string payload)
{
    if (dense_ && seq < total_)
    {
        if (have_[seq])
            return false;
        parts_[seq] = std::move(payload);
        have_[seq]  = true;
        dense_count_++;
        return true;
    }
    return sparse_.emplace(seq, std::move(payload)).second;
}

bool ChunkStore::contains(std::uint64_t seq) const
{
    if (dense_ && seq < total_)
        return have_[seq];
    return sparse_.count(seq) != 0;
}

std::size_t ChunkStore::out_of_range() const
{
    if (total_ == 0)
        return 0;  // nothing is out of range before the header
    return static_cast<std::size_t>(
        std::distance(sparse_.lower_bound(total_), sparse_.end()));
}

std::vector<std::uint64_t> ChunkStore::missing(std::size_t limit) const
{
    std::vector<std::uint64_t> out;
    for (std::uint64_t i = 0; i < total_ && out.size() < limit; i++)
    {
        if (!contains(i))
            out.push_back(i);
    }
    return out;
}

std::size_t ChunkStore::missing_count() const
{
    const std::size_t in_range = size() - out_of_range();
    return static_cast<std::size_t>(total_ - std::min<std::uint64_t>(total_, in_range));
}

std::vector<Chunk> ChunkStore::take_all()
{
    std::vector<Chunk> out;
    out.reserve(size());
    // when dense, sparse_ only holds seq >= total, so this is already ascending
    for (std::size_t i = 0; i < parts_.size(); i++)
    {
        if (have_[i])
            out.push_back(Chunk{i, std::move(parts_[i])});
    }
    for (auto &kv : sparse_)
        out.push_back(Chunk{kv.first, std::move(kv.second)});
    clear();
    return out;
}

std::optional<std::vector<std::uint8_t>> reassemble(std::vector<Chunk> chunks,
                                                    std::uint64_t     *bad_seq)
{
    std::sort(chunks.begin(), chunks.end(),
              [](const Chunk &a, const Chunk &b) { return a.seq < b.seq; });

    std::size_t encoded = 0;
    for (const auto &c : chunks)
        encoded += c.payload.size();

    std::vector<std::uint8_t> out;
    out.reserve(encoded / 4 * 3);
    for (const auto &c : chunks)
    {
        auto part = b64::decode(c.payload);
        if (!part)
        {
            LOG_WARN("reassemble: chunk %llu is not valid base64",
                     static_cast<unsigned long long>(c.seq));
            if (bad_seq)
                *bad_seq = c.seq;
            return std::nullopt;
        }
        out.insert(out.end(), part->begin(), part->end());
    }
    return out;
}

bool verify(const std::vector<std::uint8_t> &buffer,
            const std::string               &expected_hex,
            const crypto::Digest            &digest)
{
    const std::string got = digest.hex(buffer);
    if (got.empty())
        return false;
    return crypto::to_lower_hex(got) == crypto::to_lower_hex(expected_hex);
}

}  // namespace xfer
