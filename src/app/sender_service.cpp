#include <utility>

#include "app/sender_service.hpp"
#include "proto/framer.hpp"
#include "util/log.hpp"

namespace app
{

SenderService::SenderService(channel::IChannel    &ch,
                             const crypto::Digest &digest,
                             config::SenderConfig  cfg)
    : ch_(ch), digest_(digest), cfg_(cfg)
{
}

bool SenderService::prepare(FileData file)
{
    pause();
    std::lock_guard<std::mutex> lk(mu_);
    status_ = SendStatus::Preparing;
    index_  = 0;
    messages_.clear();
    file_ = std::move(file);

    if (file_.data.empty())
    {
        LOG_ERROR("prepare: %s is empty, nothing to send", file_.name.c_str());
        status_ = SendStatus::Error;
        return false;
    }

    messages_ = xfer::build_message_sequence(file_.data, cfg_.chunk_size, digest_);
    if (messages_.empty())
    {
        LOG_ERROR("prepare: framing %s failed", file_.name.c_str());
        status_ = SendStatus::Error;
        return false;
    }

    status_ = SendStatus::Sending;
    LOG_INFO("prepared %s: %zu bytes, %zu codes (chunk_size=%zu)", file_.name.c_str(),
             file_.data.size(), messages_.size(), cfg_.chunk_size);
    return true;
}

void SenderService::reset()
{
    pause();
    std::lock_guard<std::mutex> lk(mu_);
    file_ = FileData{};
    messages_.clear();
    index_  = 0;
    status_ = SendStatus::Idle;
}

std::string SenderService::current() const
{
    std::lock_guard<std::mutex> lk(mu_);
    if (index_ >= messages_.size())
        return {};
    return messages_[index_];
}

bool SenderService::next()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (messages_.empty())
        return false;
    if (index_ + 1 < messages_.size())
    {
        index_++;
        return true;
    }
    status_ = SendStatus::Completed;
    return false;
}

bool SenderService::prev()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (index_ == 0)
        return false;
    index_--;
    if (status_ == SendStatus::Completed)
        status_ = SendStatus::Sending;
    return true;
}

bool SenderService::transmit_current()
{
    const std::string msg = current();
    if (msg.empty())
    {
        LOG_WARN("transmit_current: nothing prepared");
        return false;
    }
    if (!ch_.send(msg))
    {
        LOG_ERROR("transmit_current: channel send failed at %zu", index());
        std::lock_guard<std::mutex> lk(mu_);
        status_ = SendStatus::Error;
        return false;
    }
    return true;
}

bool SenderService::play(std::chrono::milliseconds delay)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (messages_.empty())
        {
            LOG_WARN("play: nothing prepared");
            return false;
        }
        status_ = SendStatus::Sending;
    }
    paused_.store(false);

    if (!transmit_current())
        return false;

    while (true)
    {
        {
            std::unique_lock<std::mutex> lk(mu_);
            // pause() wakes us early
            cv_.wait_for(lk, delay, [this] { return paused_.load(); });
            if (paused_.load())
            {
                LOG_INFO("paused at %zu/%zu", index_ + 1, messages_.size());
                return true;
            }
            if (index_ + 1 >= messages_.size())
            {
                status_ = SendStatus::Completed;
                break;
            }
            index_++;
        }
        if (!transmit_current())
            return false;
    }

    paused_.store(true);
    LOG_INFO("sent all %zu codes", size());
    return true;
}

void SenderService::pause()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        paused_.store(true);
    }
    cv_.notify_all();
}

SendStatus SenderService::status() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return status_;
}

std::size_t SenderService::index() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return index_;
}

std::size_t SenderService::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return messages_.size();
}

std::vector<std::string> SenderService::messages() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return messages_;
}

const char *send_status_name(SendStatus s)
{
    switch (s)
    {
        case SendStatus::Idle:
            return "idle";
        case SendStatus::Preparing:
            return "preparing";
        case SendStatus::Sending:
            return "sending";
        case SendStatus::Completed:
            return "completed";
        case SendStatus::Error:
            return "error";
    }
    return "?";
}

}  // namespace app
