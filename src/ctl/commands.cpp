#include "ctl/commands.hpp"
#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ctl
{

static void log_status(const app::Progress &p)
{
    LOG_SYSTEM("[STATUS] state=%s chunks=%zu/%llu missing=%zu out_of_range=%zu digest=%s",
               app::state_name(p.state), p.received_chunks,
               static_cast<unsigned long long>(p.total_chunks), p.missing_count,
               p.out_of_range_chunks, p.digest ? p.digest->c_str() : "(none)");
    if (p.state == app::State::Failed)
        LOG_SYSTEM("[STATUS] failure=%s", app::failure_name(p.failure));

    // a short list helps the operator find the codes to show again
    if (!p.missing_chunks.empty() && p.missing_chunks.size() <= 32)
    {
        std::string list;
        for (auto s : p.missing_chunks)
        {
            if (!list.empty())
                list.push_back(',');
            list += std::to_string(s);
        }
        LOG_SYSTEM("[STATUS] missing: %s", list.c_str());
    }
}

bool dispatch(app::ReceiverService &rx, const std::string &line)
{
    if (line.rfind("SCAN ", 0) == 0)
    {
        rx.on_scan(std::string_view(line).substr(5));
        return true;
    }
    if (line == "STATUS")
    {
        log_status(rx.progress());
        return true;
    }
    if (line == "RESET")
    {
        rx.reset();
        LOG_SYSTEM("[RESET] waiting for a new transfer");
        return true;
    }
    if (line.rfind("SAVE! ", 0) == 0 || line.rfind("SAVE ", 0) == 0)
    {
        const bool  force = line[4] == '!';
        std::string path  = line.substr(force ? 6 : 5);
        if (path.empty())
        {
            LOG_WARN("[SAVE] missing path");
            return false;
        }
        return rx.save(ipc::expand_user(path), force);
    }
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return true;
    }
    LOG_WARN("unknown control line: %.40s", line.c_str());
    return false;
}

}  // namespace ctl
