#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace config
{

struct SenderConfig
{
    std::size_t chunk_size;
    unsigned    delay_ms;
};

struct ReceiverConfig
{
    std::string output_name;
    bool        auto_save;
};

// Strict decimal parse; nullopt on junk, sign, overflow or out of [lo, hi].
std::optional<unsigned long> parse_ulong(const char *s, unsigned long lo, unsigned long hi);

// Read QRXFER_* variables. Invalid values are logged and replaced by defaults.
SenderConfig   sender_from_env();
ReceiverConfig receiver_from_env();

}  // namespace config
