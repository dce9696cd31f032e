#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <thread>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

std::optional<unsigned long> parse_ulong(const char *s, unsigned long lo, unsigned long hi)
{
    if (!s || !*s || *s == '-' || *s == '+')
        return std::nullopt;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s, &p, 10);
    if (!p || *p != '\0' || v < lo || v > hi)
        return std::nullopt;
    return v;
}

std::optional<bool> parse_bool(const char *s)
{
    if (!s)
        return std::nullopt;
    if (!std::strcmp(s, "1") || !strcasecmp(s, "on") || !strcasecmp(s, "true") ||
        !strcasecmp(s, "yes"))
        return true;
    if (!std::strcmp(s, "0") || !strcasecmp(s, "off") || !strcasecmp(s, "false") ||
        !strcasecmp(s, "no"))
        return false;
    return std::nullopt;
}

static void read_unsigned(const char *var, unsigned long lo, unsigned long hi, unsigned &dst)
{
    const char *e = std::getenv(var);
    if (!e)
        return;
    if (auto v = parse_ulong(e, lo, hi))
        dst = static_cast<unsigned>(*v);
    else
        LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", var, e, lo, hi);
}

static void read_flag(const char *var, bool &dst)
{
    const char *e = std::getenv(var);
    if (!e)
        return;
    if (auto v = parse_bool(e))
        dst = *v;
    else
        LOG_WARN("Ignoring invalid %s='%s' (expect on/off)", var, e);
}

Config config_from_env()
{
    Config c;

    if (const char *e = std::getenv("QRDRIVE_OUTPUT_TYPE"))
    {
        if (auto t = plan::parse_output_type(e))
            c.output_type = *t;
        else
            LOG_WARN("Ignoring invalid QRDRIVE_OUTPUT_TYPE='%s'", e);
    }
    if (const char *e = std::getenv("QRDRIVE_BYTESIZE"))
    {
        if (auto v = parse_ulong(e, 1, constants::MAX_CHUNK_BYTES))
            c.bytesize = static_cast<std::size_t>(*v);
        else
            LOG_WARN("Ignoring invalid QRDRIVE_BYTESIZE='%s' (expect 1..%zu)", e,
                     constants::MAX_CHUNK_BYTES);
    }
    if (const char *e = std::getenv("QRDRIVE_ECC"))
    {
        if (auto v = plan::parse_ecc(e))
            c.ecc = *v;
        else
            LOG_WARN("Ignoring invalid QRDRIVE_ECC='%s' (expect L, M or H)", e);
    }
    read_unsigned("QRDRIVE_PIXEL_DENSITY", 1, 100, c.pixel_density);
    read_unsigned("QRDRIVE_BORDER", 0, 40, c.border);

    const unsigned hw = std::thread::hardware_concurrency();
    c.workers         = hw == 0 ? 1 : hw;
    read_unsigned("QRDRIVE_WORKERS", 1, 256, c.workers);

    if (const char *e = std::getenv("QRDRIVE_DIR"); e && *e)
        c.dir = ipc::expand_user(e);
    read_flag("QRDRIVE_COMPRESS", c.compress);
    read_flag("QRDRIVE_FOREIGN", c.foreign);

    c.ctl_sock = ipc::expand_user(constants::ctl_sock_path());

    LOG_DEBUG("Config: type=%s ecc=%s px=%u border=%u dir=%s compress=%d foreign=%d workers=%u",
              plan::output_type_name(c.output_type), plan::ecc_name(c.ecc), c.pixel_density,
              c.border, c.dir.c_str(), (int)c.compress, (int)c.foreign, c.workers);
    return c;
}

}  // namespace config
