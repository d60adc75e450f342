#pragma once

namespace exitc
{

inline constexpr int ok          = 0;
inline constexpr int failure     = 1;  // generic runtime failure (daemon start, I/O)
inline constexpr int bad_args    = 2;
inline constexpr int no_server   = 3;  // control socket unreachable
inline constexpr int io_error    = 4;  // input file unreadable / output unwritable
inline constexpr int frame_error = 5;  // buffer could not be framed

}  // namespace exitc
