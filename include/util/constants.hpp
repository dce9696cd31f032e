#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Wire tags, in the order they appear on frame 0
inline constexpr std::string_view TEXT_ENCODED_MARKER = "b64:";
inline constexpr std::string_view COMPRESSED_MARKER   = ":z:";
inline constexpr std::string_view NAME_OPEN           = "::f::";
inline constexpr std::string_view NAME_CLOSE          = "::/f::";
inline constexpr std::string_view INDEX_OPEN          = "::c";
inline constexpr std::string_view INDEX_CLOSE         = "::";

// Name used when no filename source exists
inline constexpr std::string_view FALLBACK_FILENAME = "unknownfile.txt";

// Largest tier of the capacity table (40-L)
inline constexpr std::size_t MAX_CHUNK_BYTES       = 2953;
inline constexpr std::size_t DEFAULT_PIXEL_DENSITY = 10;
inline constexpr std::size_t DEFAULT_BORDER        = 4;

// Control socket path (Unix domain socket) for the live scan daemon
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("QRDRIVE_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/qrdrive/ctl.sock";
    LOG_DEBUG("Using default control socket %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
