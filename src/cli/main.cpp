#include <chrono>
#include <cstdio>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/sender_service.hpp"
#include "channel/line_channel.hpp"
#include "crypto/digest.hpp"
#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/file_io.hpp"
#include "util/log.hpp"

namespace
{

struct Options
{
    std::string          sock;
    config::SenderConfig sender;
    bool                 force = false;
};

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  qrxferctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Sender (codes go to stdout, one per line):\n"
                         "  frames <file> [--chunk-size N]\n"
                         "  play <file> [--chunk-size N] [--delay-ms N]\n"
                         "\n"
                         "Receiver (talks to qrxferd):\n"
                         "  scan <payload...>    forward one decoded payload\n"
                         "  scan -               forward every stdin line\n"
                         "  status\n"
                         "  reset\n"
                         "  save [--force] <path>\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    if (!ipc::send_line(sock, line))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return exitc::ok;
}

static int run_sender(const std::string &cmd, const std::string &path, const Options &opt)
{
    auto data = storage::read_file(path);
    if (!data)
    {
        std::fprintf(stderr, "error: cannot read %s\n", path.c_str());
        return exitc::io_error;
    }

    crypto::SodiumDigest digest;
    channel::LineChannel out(stdout);
    channel::Settings    s{};
    s.name = "line";
    if (!out.start(s, nullptr))
        return exitc::io_error;

    app::SenderService tx(out, digest, opt.sender);
    app::FileData      f;
    f.name = path;
    f.data = std::move(*data);
    if (!tx.prepare(std::move(f)))
    {
        std::fprintf(stderr, "error: cannot frame %s\n", path.c_str());
        return exitc::frame_error;
    }

    if (cmd == "play")
    {
        if (!tx.play(std::chrono::milliseconds(opt.sender.delay_ms)))
            return exitc::io_error;
    }
    else
    {
        // frames: everything at once
        do
        {
            if (!tx.transmit_current())
                return exitc::io_error;
        } while (tx.next());
    }
    out.stop();
    return exitc::ok;
}

static int scan_stdin(const std::string &sock)
{
    std::string line;
    std::size_t n = 0;
    while (std::getline(std::cin, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        int rc = send_one_line(sock, "SCAN " + line);
        if (rc != exitc::ok)
            return rc;
        n++;
    }
    LOG_DEBUG("forwarded %zu payloads", n);
    return exitc::ok;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const Options                                 &opt,
                   const std::function<int(const std::string &)> &send_line)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"frames",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return run_sender(cmd, args[1], opt);
         }},
        {"play",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return run_sender(cmd, args[1], opt);
         }},
        {"scan",
         [&]() -> int {
             if (args.size() < 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             if (args.size() == 2 && args[1] == "-")
                 return scan_stdin(opt.sock);
             // markers contain spaces, so the shell may have split them
             std::string text;
             for (size_t i = 1; i < args.size(); ++i)
             {
                 if (i > 1)
                     text.push_back(' ');
                 text += args[i];
             }
             return send_line("SCAN " + text);
         }},
        {"status", [&]() -> int { return send_line("STATUS"); }},
        {"reset", [&]() -> int { return send_line("RESET"); }},
        {"save",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line((opt.force ? "SAVE! " : "SAVE ") + args[1]);
         }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    qrxfer::init_log_from_env(constants::ENV_LOG_LEVEL);

    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    Options opt;
    opt.sender = config::sender_from_env();
    opt.sock   = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            opt.sock = ipc::expand_user(argv[++i]);
        }
        else if (a == "--chunk-size" && i + 1 < argc)
        {
            auto v = config::parse_ulong(argv[++i], 1, constants::MAX_CHUNK_SIZE);
            if (!v)
            {
                std::fprintf(stderr, "error: --chunk-size expects 1..%zu\n",
                             constants::MAX_CHUNK_SIZE);
                return exitc::bad_args;
            }
            opt.sender.chunk_size = static_cast<std::size_t>(*v);
        }
        else if (a == "--delay-ms" && i + 1 < argc)
        {
            auto v = config::parse_ulong(argv[++i], 0, 3600000);
            if (!v)
            {
                std::fprintf(stderr, "error: --delay-ms expects a number of milliseconds\n");
                return exitc::bad_args;
            }
            opt.sender.delay_ms = static_cast<unsigned>(*v);
        }
        else if (a == "--force")
        {
            opt.force = true;
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string &cmd    = args[0];
    auto               sender = [&](const std::string &line) -> int {
        return send_one_line(opt.sock, line);
    };

    int rc = run_cmd(cmd, args, opt, sender);
    return rc;
}
