#pragma once
#include <cstddef>

#include "channel/ichannel.hpp"

namespace channel
{

class LoopbackChannel final : public IChannel
{
  public:
    bool        start(const Settings &s, OnPayload on_rx) override;
    bool        send(const Payload &one_code) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        ready() const override { return started_; }

    std::size_t sent() const { return sent_; }

  private:
    OnPayload   on_rx_{};
    std::size_t max_payload_{0};
    std::size_t sent_{0};
    bool        started_{false};
};

}  // namespace channel
