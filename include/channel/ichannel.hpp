#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace channel
{

// One QR code's worth of text
using Payload   = std::string;
using OnPayload = std::function<void(const Payload &)>;

struct Settings
{
    std::string name;               // "loopback" for tests and self-checks
    std::size_t max_payload = 2953;  // QR v40-L byte capacity
};

// One-way text channel: render on one side, scan on the other. No acknowledgements.
struct IChannel
{
    virtual bool        start(const Settings &s, OnPayload on_rx) = 0;
    virtual bool        send(const Payload &one_code)             = 0;
    virtual void        stop()                                    = 0;
    virtual std::string name() const { return ""; }
    virtual bool        ready() const = 0;
    virtual ~IChannel() = default;
};

}  // namespace channel
