#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

std::optional<unsigned long> parse_ulong(const char *s, unsigned long lo, unsigned long hi)
{
    if (!s || !*s || *s == '-' || *s == '+')
        return std::nullopt;
    errno           = 0;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s, &p, 10);
    if (errno == ERANGE || !p || *p != '\0')
        return std::nullopt;
    if (v < lo || v > hi)
        return std::nullopt;
    return v;
}

SenderConfig sender_from_env()
{
    SenderConfig cfg{constants::DEFAULT_CHUNK_SIZE, constants::DEFAULT_DELAY_MS};

    if (const char *e = std::getenv(constants::ENV_CHUNK_SIZE); e && *e)
    {
        if (auto v = parse_ulong(e, 1, constants::MAX_CHUNK_SIZE))
        {
            cfg.chunk_size = static_cast<std::size_t>(*v);
            LOG_INFO("Using chunk_size=%zu (from %s)", cfg.chunk_size, constants::ENV_CHUNK_SIZE);
        }
        else
        {
            LOG_WARN("Ignoring invalid %s='%s' (expect 1..%zu)", constants::ENV_CHUNK_SIZE, e,
                     constants::MAX_CHUNK_SIZE);
        }
    }

    if (const char *e = std::getenv(constants::ENV_DELAY_MS); e && *e)
    {
        // an hour per code is already absurd
        if (auto v = parse_ulong(e, 0, 3600000))
        {
            cfg.delay_ms = static_cast<unsigned>(*v);
            LOG_INFO("Using delay_ms=%u (from %s)", cfg.delay_ms, constants::ENV_DELAY_MS);
        }
        else
        {
            LOG_WARN("Ignoring invalid %s='%s'", constants::ENV_DELAY_MS, e);
        }
    }
    return cfg;
}

ReceiverConfig receiver_from_env()
{
    ReceiverConfig cfg{std::string(constants::DEFAULT_OUTPUT_NAME), true};

    if (const char *e = std::getenv(constants::ENV_OUTPUT); e && *e)
        cfg.output_name = e;

    if (const char *e = std::getenv(constants::ENV_AUTOSAVE); e && *e)
    {
        if (std::strcmp(e, "0") == 0)
            cfg.auto_save = false;
        else if (std::strcmp(e, "1") == 0)
            cfg.auto_save = true;
        else
            LOG_WARN("Ignoring invalid %s='%s' (expect 0 or 1)", constants::ENV_AUTOSAVE, e);
    }
    return cfg;
}

}  // namespace config
