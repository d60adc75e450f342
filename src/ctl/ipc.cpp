#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        p(sock_path);
    fs::path        dir = p.parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
        // only tighten directories we created ourselves (not /tmp)
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
            LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(),
                     ec.message().c_str());
    }
    return true;
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Fills addr; false (errno set) if the path cannot be a socket address.
static bool make_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                 std::strlen(addr.sun_path) + 1);
    return true;
}

// Reads one connection to EOF, dispatching complete lines. Returns true if QUIT was seen.
static bool serve_connection(int fd, const OnLine &on_line)
{
    std::string pending;
    char        buf[4096];
    bool        quit = false;

    auto dispatch = [&](std::string line) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            return;
        if (on_line)
            on_line(line);
        if (line == "QUIT")
            quit = true;
    };

    while (!quit)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            pending.append(buf, static_cast<size_t>(n));
            std::size_t start = 0;
            std::size_t pos;
            while (!quit && (pos = pending.find('\n', start)) != std::string::npos)
            {
                dispatch(pending.substr(start, pos - start));
                start = pos + 1;
            }
            pending.erase(0, start);
            if (pending.size() > MAX_LINE)
            {
                LOG_WARN("line longer than %zu bytes, dropping connection", MAX_LINE);
                return quit;
            }
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (n == -1 && errno == EINTR)
            continue;

        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return quit;  // abort this connection, keep what was dispatched
    }

    // last line without a trailing newline
    if (!quit && !pending.empty())
        dispatch(std::move(pending));
    return quit;
}

bool start_server(const std::string &sock_path, const OnLine &on_line)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len))
        return false;

    // ensure parent directory exists (mkdir -p)
    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 4) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Listening on %s", sock_path.c_str());

    while (1)
    {
        int newfd = accept(fd, nullptr, nullptr);
        if (newfd == -1)
        {
            if (errno == EINTR)
                continue;
            int saved = errno;
            close(fd);
            unlink(sock_path.c_str());
            errno = saved;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            return false;
        }
        set_cloexec(newfd);

        const bool quit = serve_connection(newfd, on_line);
        close(newfd);
        if (quit)
            break;  // graceful shutdown
    }

    close(fd);
    unlink(sock_path.c_str());
    return true;
}

bool send_lines(const std::string &sock_path, const std::vector<std::string> &lines)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (lines.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Nothing to send");
        return false;
    }
    if (!make_addr(sock_path, addr, addr_len))
        return false;

    std::string out;
    for (const auto &l : lines)
    {
        if (l.find('\n') != std::string::npos)
        {
            errno = EINVAL;
            LOG_ERROR("line must not contain newline characters");
            return false;
        }
        out += l;
        out.push_back('\n');
    }

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("connect() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Sending %zu line(s), %zu bytes", lines.size(), out.size());
    const char *buf  = out.data();
    size_t      len  = out.size();
    size_t      sent = 0;
    while (sent < len)
    {
        ssize_t n = send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }

    close(fd);
    return true;
}

bool send_line(const std::string &sock_path, const std::string &line)
{
    // tolerate a caller-supplied terminator
    std::string l = line;
    if (!l.empty() && l.back() == '\n')
        l.pop_back();
    if (l.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line");
        return false;
    }
    return send_lines(sock_path, {l});
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

}  // namespace ipc
