#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "app/transfer_session.hpp"
#include "channel/ichannel.hpp"
#include "crypto/digest.hpp"
#include "util/config.hpp"

namespace app
{

// Owns the receiving session and serializes scan events into it: a capture loop, a
// channel callback and control-socket clients may all call on_scan() concurrently.
class ReceiverService
{
  public:
    ReceiverService(const crypto::Digest &digest, config::ReceiverConfig cfg);

    // Route every payload the channel delivers into on_scan().
    bool attach(channel::IChannel &ch, const channel::Settings &s);

    Progress on_scan(std::string_view text);
    Progress progress() const;
    std::optional<Result> final_result() const;
    void                  reset();

    // Manual download. An unverified buffer is only written with allow_unverified.
    bool save(const std::string &path, bool allow_unverified) const;

    std::string last_saved() const;

  private:
    void report(const Progress &before, const Progress &after);

    mutable std::mutex     mu_;
    TransferSession        session_;
    config::ReceiverConfig cfg_;
    mutable std::string    last_saved_;
};

}  // namespace app
