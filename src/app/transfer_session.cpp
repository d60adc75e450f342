#include <cctype>
#include <utility>

#include "app/transfer_session.hpp"
#include "util/log.hpp"

namespace app
{

// positive decimal that fits the 10-digit sequence space
static std::optional<std::uint64_t> parse_chunk_count(const std::string &v)
{
    if (v.empty() || v.size() > xfer::SEQ_DIGITS + 1)
        return std::nullopt;
    std::uint64_t n = 0;
    for (unsigned char c : v)
    {
        if (!std::isdigit(c))
            return std::nullopt;
        n = n * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (n == 0 || n > xfer::MAX_SEQUENCE + 1)
        return std::nullopt;
    return n;
}

TransferSession::TransferSession(const crypto::Digest &digest) : digest_(digest) {}

Progress TransferSession::feed(std::string_view text)
{
    apply(xfer::classify(text));
    return progress();
}

void TransferSession::apply(const xfer::Message &m)
{
    using xfer::Kind;

    if (m.kind == Kind::Unrecognized)
    {
        // misreads and unrelated codes in view end up here
        LOG_DEBUG("ignoring unrecognized payload");
        return;
    }
    if (m.kind == Kind::TransferBegin)
    {
        if (state_ != State::Idle)
            LOG_INFO("TransferBegin in state %s, restarting", state_name(state_));
        restart();
        state_ = State::HeaderCollect;
        return;
    }

    switch (state_)
    {
        case State::Idle:
            LOG_DEBUG("Idle: ignoring %s", xfer::kind_name(m.kind));
            return;

        case State::HeaderCollect:
            switch (m.kind)
            {
                case Kind::HeaderField:
                    on_header_field(m.name, m.value);
                    return;
                case Kind::HeaderEnd:
                    on_header_end();
                    return;
                case Kind::DataChunk:
                    // early chunk: keep it, the header decides later whether it is in range
                    if (chunks_.insert(m.chunk.seq, m.chunk.payload))
                        current_ = m.chunk.seq;
                    return;
                case Kind::TransferEnd:
                    LOG_WARN("TransferEnd before the header was complete");
                    chunks_.clear();
                    current_.reset();
                    final_progress_ = snapshot();
                    finish(Failure::IncompleteHeader, {}, false);
                    return;
                default:
                    return;  // HeaderBegin is structural only
            }

        case State::Transferring:
            if (m.kind == Kind::DataChunk)
                on_chunk(m.chunk);
            else if (m.kind == Kind::TransferEnd)
                on_end();
            else
                LOG_DEBUG("Transferring: header is fixed, ignoring %s", xfer::kind_name(m.kind));
            return;

        case State::Completed:
        case State::Failed:
            return;
    }
}

void TransferSession::on_header_field(const std::string &name, const std::string &value)
{
    if (name == xfer::FIELD_LEN)
    {
        pending_len_ = parse_chunk_count(value);
        if (!pending_len_)
            LOG_WARN("invalid LEN '%s'", value.c_str());
        return;
    }
    if (name == xfer::FIELD_HASH)
    {
        if (value.empty())
        {
            LOG_WARN("empty HASH");
            pending_hash_.reset();
            return;
        }
        pending_hash_ = crypto::to_lower_hex(value);
    }
}

void TransferSession::on_header_end()
{
    if (!pending_len_ || !pending_hash_)
    {
        LOG_WARN("incomplete header (LEN %s, HASH %s)", pending_len_ ? "set" : "missing",
                 pending_hash_ ? "set" : "missing");
        // chunk size is unknown without a header, nothing collected so far can be trusted
        chunks_.clear();
        current_.reset();
        final_progress_ = snapshot();
        finish(Failure::IncompleteHeader, {}, false);
        return;
    }

    header_ = Header{*pending_len_, *pending_hash_};
    chunks_.set_total(header_->chunk_count);
    state_ = State::Transferring;
    LOG_INFO("header: %llu chunks, digest %s",
             static_cast<unsigned long long>(header_->chunk_count), header_->digest.c_str());
}

void TransferSession::on_chunk(const xfer::Chunk &c)
{
    if (!chunks_.insert(c.seq, c.payload))
    {
        LOG_DEBUG("duplicate chunk %llu", static_cast<unsigned long long>(c.seq));
        return;
    }
    current_ = c.seq;
    if (c.seq >= header_->chunk_count)
        LOG_WARN("chunk %llu is out of range (LEN %llu)", static_cast<unsigned long long>(c.seq),
                 static_cast<unsigned long long>(header_->chunk_count));
}

void TransferSession::on_end()
{
    // counts as they were before the store is emptied
    final_progress_ = snapshot();

    if (chunks_.size() == 0)
    {
        LOG_WARN("TransferEnd with no data");
        finish(Failure::NoData, {}, false);
        return;
    }
    if (final_progress_.missing_count > 0)
    {
        // the digest decides
        LOG_WARN("TransferEnd with %zu of %llu chunks missing, reassembling what is present",
                 final_progress_.missing_count,
                 static_cast<unsigned long long>(header_->chunk_count));
    }

    std::uint64_t bad_seq = 0;
    auto          data    = xfer::reassemble(chunks_.take_all(), &bad_seq);
    if (!data)
    {
        LOG_WARN("decode failure in chunk %llu", static_cast<unsigned long long>(bad_seq));
        finish(Failure::DecodeFailure, {}, false);
        return;
    }

    const bool ok = xfer::verify(*data, header_->digest, digest_);
    if (!ok)
        LOG_WARN("integrity check failed (%zu bytes)", data->size());
    finish(ok ? Failure::None : Failure::IntegrityMismatch, std::move(*data), ok);
}

void TransferSession::finish(Failure f, std::vector<std::uint8_t> data, bool verified)
{
    chunks_.clear();
    state_  = (f == Failure::None) ? State::Completed : State::Failed;
    result_ = Result{std::move(data), verified, f};

    final_progress_.state       = state_;
    final_progress_.failure     = f;
    final_progress_.is_complete = (state_ == State::Completed);
    LOG_INFO("transfer %s (%s)", state_name(state_), failure_name(f));
}

void TransferSession::restart()
{
    pending_len_.reset();
    pending_hash_.reset();
    header_.reset();
    chunks_.clear();
    current_.reset();
    result_.reset();
    final_progress_ = Progress{};
}

void TransferSession::reset()
{
    restart();
    state_ = State::Idle;
}

Progress TransferSession::snapshot() const
{
    Progress p;
    p.state               = state_;
    p.total_chunks        = header_ ? header_->chunk_count : 0;
    p.received_chunks     = chunks_.size();
    p.missing_chunks      = chunks_.missing();
    p.missing_count       = chunks_.missing_count();
    p.out_of_range_chunks = chunks_.out_of_range();
    p.current_chunk       = current_;
    p.is_complete         = (state_ == State::Completed);
    if (header_)
        p.digest = header_->digest;
    return p;
}

Progress TransferSession::progress() const
{
    if (state_ == State::Completed || state_ == State::Failed)
        return final_progress_;
    return snapshot();
}

std::optional<Result> TransferSession::final_result() const
{
    return result_;
}

const char *state_name(State s)
{
    switch (s)
    {
        case State::Idle:
            return "Idle";
        case State::HeaderCollect:
            return "HeaderCollect";
        case State::Transferring:
            return "Transferring";
        case State::Completed:
            return "Completed";
        case State::Failed:
            return "Failed";
    }
    return "?";
}

const char *failure_name(Failure f)
{
    switch (f)
    {
        case Failure::None:
            return "ok";
        case Failure::IncompleteHeader:
            return "incomplete header";
        case Failure::NoData:
            return "no data";
        case Failure::DecodeFailure:
            return "decode failure";
        case Failure::IntegrityMismatch:
            return "integrity mismatch";
    }
    return "?";
}

}  // namespace app
