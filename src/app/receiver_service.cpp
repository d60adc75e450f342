#include <utility>

#include "app/receiver_service.hpp"
#include "util/file_io.hpp"
#include "util/log.hpp"

namespace app
{

ReceiverService::ReceiverService(const crypto::Digest &digest, config::ReceiverConfig cfg)
    : session_(digest), cfg_(std::move(cfg))
{
}

bool ReceiverService::attach(channel::IChannel &ch, const channel::Settings &s)
{
    return ch.start(s, [this](const channel::Payload &p) { this->on_scan(p); });
}

Progress ReceiverService::on_scan(std::string_view text)
{
    std::lock_guard<std::mutex> lk(mu_);
    const Progress before = session_.progress();
    Progress       after  = session_.feed(text);
    report(before, after);

    if (after.state == State::Completed && before.state != State::Completed && cfg_.auto_save)
    {
        auto r = session_.final_result();
        if (r && storage::write_file(cfg_.output_name, r->data))
        {
            last_saved_ = cfg_.output_name;
            LOG_SYSTEM("[SAVED] %s (%zu bytes)", cfg_.output_name.c_str(), r->data.size());
        }
        else
        {
            LOG_ERROR("auto-save to %s failed", cfg_.output_name.c_str());
        }
    }
    return after;
}

// Operator-facing lines only on change, so a code held in front of the camera
// for a few seconds does not flood the log.
void ReceiverService::report(const Progress &before, const Progress &after)
{
    if (after.state == State::HeaderCollect && before.state != State::HeaderCollect)
    {
        LOG_SYSTEM("[BEGIN] new transfer");
        return;
    }
    if (after.state == State::Transferring &&
        (before.state != State::Transferring || after.received_chunks != before.received_chunks))
    {
        LOG_SYSTEM("[RECV] %zu/%llu chunks, %zu missing%s", after.received_chunks,
                   static_cast<unsigned long long>(after.total_chunks), after.missing_count,
                   after.out_of_range_chunks ? ", some out of range" : "");
        return;
    }
    if (after.state == State::Completed && before.state != State::Completed)
    {
        LOG_SYSTEM("[DONE] %zu chunks, digest verified", after.received_chunks);
        return;
    }
    if (after.state == State::Failed && before.state != State::Failed)
    {
        LOG_SYSTEM("[FAILED] %s", failure_name(after.failure));
    }
}

Progress ReceiverService::progress() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return session_.progress();
}

std::optional<Result> ReceiverService::final_result() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return session_.final_result();
}

void ReceiverService::reset()
{
    std::lock_guard<std::mutex> lk(mu_);
    session_.reset();
    last_saved_.clear();
}

bool ReceiverService::save(const std::string &path, bool allow_unverified) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        r = session_.final_result();
    if (!r)
    {
        LOG_WARN("save: transfer not finished");
        return false;
    }
    if (r->data.empty())
    {
        LOG_WARN("save: no buffer (%s)", failure_name(r->failure));
        return false;
    }
    if (!r->verified && !allow_unverified)
    {
        LOG_WARN("save: buffer is unverified, refusing without force");
        return false;
    }
    if (!storage::write_file(path, r->data))
        return false;

    last_saved_ = path;
    LOG_SYSTEM("[SAVED] %s (%zu bytes%s)", path.c_str(), r->data.size(),
               r->verified ? "" : ", UNVERIFIED");
    return true;
}

std::string ReceiverService::last_saved() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return last_saved_;
}

}  // namespace app
