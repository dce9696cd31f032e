#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "plan/capacity.hpp"
#include "plan/presets.hpp"

namespace config
{

// Settings shared by qrdrive and qrdrived. Environment first, command-line flags
// layered on top by the callers.
struct Config
{
    plan::OutputType           output_type{plan::OutputType::Png};
    std::optional<std::size_t> bytesize;  // explicit chunk size, planner decides when unset
    plan::Ecc                  ecc{plan::Ecc::L};
    unsigned                   pixel_density{10};
    unsigned                   border{4};
    std::string                dir{"."};
    bool                       compress{false};
    bool                       foreign{false};
    unsigned                   workers{1};
    std::string                ctl_sock;
};

// QRDRIVE_OUTPUT_TYPE, QRDRIVE_BYTESIZE, QRDRIVE_ECC, QRDRIVE_PIXEL_DENSITY,
// QRDRIVE_BORDER, QRDRIVE_DIR, QRDRIVE_COMPRESS, QRDRIVE_FOREIGN, QRDRIVE_WORKERS,
// QRDRIVE_CTL_SOCK. Invalid values are logged and the default kept.
Config config_from_env();

// Decimal in [lo, hi]; nullopt on junk or out of range.
std::optional<unsigned long> parse_ulong(const char *s, unsigned long lo, unsigned long hi);

// 1/0, on/off, true/false, yes/no
std::optional<bool> parse_bool(const char *s);

}  // namespace config
