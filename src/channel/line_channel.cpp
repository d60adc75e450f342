#include <cerrno>
#include <cstring>

#include "channel/line_channel.hpp"
#include "util/log.hpp"

namespace channel
{

bool LineChannel::start(const Settings &s, OnPayload /*on_rx*/)
{
    if (!out_)
    {
        LOG_ERROR("LineChannel: no output stream");
        return false;
    }
    max_payload_ = s.max_payload;
    started_     = true;
    return true;
}

bool LineChannel::send(const Payload &one_code)
{
    if (!started_)
        return false;
    if (max_payload_ != 0 && one_code.size() > max_payload_)
    {
        LOG_ERROR("payload of %zu bytes exceeds channel limit %zu", one_code.size(), max_payload_);
        return false;
    }
    // a newline inside a payload would split it into two codes downstream
    if (one_code.find('\n') != std::string::npos)
    {
        LOG_ERROR("payload contains a newline");
        return false;
    }
    if (std::fwrite(one_code.data(), 1, one_code.size(), out_) != one_code.size() ||
        std::fputc('\n', out_) == EOF || std::fflush(out_) != 0)
    {
        LOG_ERROR("write failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

void LineChannel::stop()
{
    if (started_ && out_)
        std::fflush(out_);
    started_ = false;
}

}  // namespace channel
