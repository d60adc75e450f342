#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ipc
{

inline constexpr std::size_t MAX_LINE = 64 * 1024;  // a QR payload is < 3 KiB

using OnLine = std::function<void(const std::string &)>;

// Blocks. Every '\n'-terminated line of every connection goes to on_line, in arrival order,
// one connection at a time. A line "QUIT" ends the server after its connection; the socket
// file is removed on the way out.
bool start_server(const std::string &sock_path, const OnLine &on_line);

// One connection, many lines (a scanner piping its decodes through).
bool send_lines(const std::string &sock_path, const std::vector<std::string> &lines);
bool send_line(const std::string &sock_path, const std::string &line);

std::string expand_user(const std::string &path);

}  // namespace ipc
