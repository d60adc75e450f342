#pragma once
#include <string>

#include "app/receiver_service.hpp"

namespace ctl
{

// Control-socket line protocol understood by qrxferd:
//   SCAN <payload>   one decoded QR payload, verbatim after the first space
//   STATUS           log a progress line
//   RESET            drop the current transfer
//   SAVE <path>      write the verified buffer
//   SAVE! <path>     write the buffer even if unverified
//   QUIT             stop the daemon (handled by the ipc server)
// Returns false for unknown or malformed lines.
bool dispatch(app::ReceiverService &rx, const std::string &line);

}  // namespace ctl
