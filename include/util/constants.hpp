#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Sender defaults (same as the web sender: 30 byte chunks, 200 ms per code)
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 30;
inline constexpr std::size_t MAX_CHUNK_SIZE     = 2048;  // QR v40 byte mode tops out near 2.9k
inline constexpr unsigned    DEFAULT_DELAY_MS   = 200;

// Receiver defaults
inline constexpr std::string_view DEFAULT_OUTPUT_NAME = "received_file";

// Environment
inline constexpr const char *ENV_LOG_LEVEL  = "QRXFER_LOG_LEVEL";
inline constexpr const char *ENV_CTL_SOCK   = "QRXFER_CTL_SOCK";
inline constexpr const char *ENV_CHUNK_SIZE = "QRXFER_CHUNK_SIZE";
inline constexpr const char *ENV_DELAY_MS   = "QRXFER_DELAY_MS";
inline constexpr const char *ENV_OUTPUT     = "QRXFER_OUTPUT";
inline constexpr const char *ENV_AUTOSAVE   = "QRXFER_AUTOSAVE";

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv(ENV_CTL_SOCK); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/qrxfer/ctl.sock";
    LOG_DEBUG("Using default control socket %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
