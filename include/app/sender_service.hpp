#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "channel/ichannel.hpp"
#include "crypto/digest.hpp"
#include "util/config.hpp"

namespace app
{

enum class SendStatus
{
    Idle,
    Preparing,
    Sending,
    Completed,
    Error
};

struct FileData
{
    std::string               name;
    std::string               type;  // mime type if known, informational only
    std::vector<std::uint8_t> data;
};

// The sender's playlist: the framed message list plus a cursor the operator (or play())
// moves through. Each position is one code to show.
class SenderService
{
  public:
    SenderService(channel::IChannel &ch, const crypto::Digest &digest, config::SenderConfig cfg);
    ~SenderService() { pause(); }

    bool prepare(FileData file);
    void reset();

    std::string current() const;  // empty when nothing is prepared
    bool        next();            // false at the end (status becomes Completed)
    bool        prev();            // false at the start
    bool        transmit_current();

    // Auto-advance: send the current code, then one more every `delay` until the end or
    // until pause() is called from another thread. Resumes from the cursor.
    bool play(std::chrono::milliseconds delay);
    bool play() { return play(std::chrono::milliseconds(cfg_.delay_ms)); }
    void pause();

    SendStatus               status() const;
    std::size_t              index() const;
    std::size_t              size() const;
    std::vector<std::string> messages() const;
    const std::string       &file_name() const { return file_.name; }

  private:
    channel::IChannel       &ch_;
    const crypto::Digest    &digest_;
    config::SenderConfig     cfg_;
    FileData                 file_;
    mutable std::mutex       mu_;
    std::condition_variable  cv_;
    std::vector<std::string> messages_;
    std::size_t              index_{0};
    SendStatus               status_{SendStatus::Idle};
    std::atomic<bool>        paused_{true};
};

const char *send_status_name(SendStatus s);

}  // namespace app
