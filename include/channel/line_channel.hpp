#pragma once
#include <cstdio>

#include "channel/ichannel.hpp"

namespace channel
{

// Writes each payload as one line to a stream, for an external QR renderer
// (`qrxferctl play file | some-qr-display`). Sending side only: on_rx is never called.
class LineChannel final : public IChannel
{
  public:
    explicit LineChannel(std::FILE *out) : out_(out) {}

    bool        start(const Settings &s, OnPayload on_rx) override;
    bool        send(const Payload &one_code) override;
    void        stop() override;
    std::string name() const override { return "line"; }
    bool        ready() const override { return started_; }

  private:
    std::FILE  *out_{nullptr};
    std::size_t max_payload_{0};
    bool        started_{false};
};

}  // namespace channel
