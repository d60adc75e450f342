#include <cstdlib>
#include <string>

#include "app/receiver_service.hpp"
#include "crypto/digest.hpp"
#include "ctl/commands.hpp"
#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

// qrxferd: receiving side. A scanner (or `qrxferctl scan`) pushes decoded payloads over the
// control socket; transfers are reassembled, verified and saved here.
int main()
{
    qrxfer::init_log_from_env(constants::ENV_LOG_LEVEL);

    if (!crypto::ensure_sodium_init())
    {
        LOG_ERROR("libsodium initialization failed");
        return exitc::failure;
    }

    config::ReceiverConfig cfg = config::receiver_from_env();
    cfg.output_name            = ipc::expand_user(cfg.output_name);
    LOG_SYSTEM("Config: output=%s autosave=%s", cfg.output_name.c_str(),
               cfg.auto_save ? "on" : "off");

    crypto::SodiumDigest digest;
    app::ReceiverService rx(digest, cfg);

    std::string sock = ipc::expand_user(constants::ctl_sock_path());
    LOG_SYSTEM("Listening on %s", sock.c_str());

    // ipc::start_server handles one connection at a time; ReceiverService locks anyway
    if (!ipc::start_server(sock, [&rx](const std::string &line) { (void)ctl::dispatch(rx, line); }))
    {
        LOG_ERROR("start_server failed");
        return exitc::failure;
    }
    return exitc::ok;
}
