#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/digest.hpp"
#include "proto/message.hpp"
#include "proto/reassembler.hpp"

namespace app
{

enum class State
{
    Idle,
    HeaderCollect,
    Transferring,
    Completed,
    Failed
};

enum class Failure
{
    None,
    IncompleteHeader,   // HeaderEnd (or TransferEnd) without both LEN and HASH
    NoData,             // TransferEnd with zero chunks
    DecodeFailure,      // a stored payload is not base64
    IntegrityMismatch,  // buffer available but flagged unverified
};

struct Header
{
    std::uint64_t chunk_count{0};
    std::string   digest;  // lowercase hex
};

struct Progress
{
    State                        state{State::Idle};
    std::uint64_t                total_chunks{0};
    std::size_t                  received_chunks{0};
    std::vector<std::uint64_t>   missing_chunks;  // ascending, within [0, total_chunks)
    std::size_t                  missing_count{0};
    std::size_t                  out_of_range_chunks{0};
    std::optional<std::uint64_t> current_chunk;  // last inserted seq
    bool                         is_complete{false};
    std::optional<std::string>   digest;
    Failure                      failure{Failure::None};
};

struct Result
{
    std::vector<std::uint8_t> data;  // empty unless reassembly produced a buffer
    bool                      verified{false};
    Failure                   failure{Failure::None};
};

// Receiver state machine for one transfer at a time. Not thread-safe: callers serialize
// feed()/apply() (see ReceiverService). Failures end up in progress()/final_result(),
// nothing is thrown, and a TransferBegin always starts over.
class TransferSession
{
  public:
    explicit TransferSession(const crypto::Digest &digest);

    // classify + apply + snapshot
    Progress feed(std::string_view text);
    void     apply(const xfer::Message &m);

    Progress              progress() const;
    std::optional<Result> final_result() const;  // nullopt until Completed/Failed

    State                        state() const { return state_; }
    const std::optional<Header> &header() const { return header_; }
    void                         reset();  // back to Idle

  private:
    void restart();
    void on_header_field(const std::string &name, const std::string &value);
    void on_header_end();
    void on_chunk(const xfer::Chunk &c);
    void on_end();
    void finish(Failure f, std::vector<std::uint8_t> data, bool verified);
    Progress snapshot() const;

    const crypto::Digest        &digest_;
    State                        state_{State::Idle};
    std::optional<std::uint64_t> pending_len_;
    std::optional<std::string>   pending_hash_;
    std::optional<Header>        header_;
    xfer::ChunkStore             chunks_;
    std::optional<std::uint64_t> current_;
    std::optional<Result>        result_;
    Progress                     final_progress_;  // frozen when the chunks are handed over
};

const char *state_name(State s);
const char *failure_name(Failure f);

}  // namespace app
