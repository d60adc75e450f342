#include "channel/loopback_channel.hpp"
#include "util/log.hpp"

namespace channel
{
// LoopbackChannel: hands each rendered payload straight to the scanner side, synchronously.
bool LoopbackChannel::start(const Settings &s, OnPayload on_rx)
{
    on_rx_       = std::move(on_rx);
    max_payload_ = s.max_payload;
    sent_        = 0;
    started_     = true;
    return true;
}

bool LoopbackChannel::send(const Payload &one_code)
{
    if (!started_ || !on_rx_)
        return false;
    if (max_payload_ != 0 && one_code.size() > max_payload_)
    {
        LOG_ERROR("payload of %zu bytes exceeds channel limit %zu", one_code.size(), max_payload_);
        return false;
    }
    sent_++;
    on_rx_(one_code);
    return true;
}

void LoopbackChannel::stop()
{
    started_ = false;
    on_rx_   = nullptr;
}

}  // namespace channel
