#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <utility>

#include "scan/file_series.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

namespace scan
{

namespace
{
// index of "<basename>.<digits>[.<ext>]", nullopt for any other name
std::optional<std::size_t> series_index(const std::string &name, const std::string &basename,
                                        const std::string &ext)
{
    const std::string head = basename + ".";
    const std::string tail = ext.empty() ? std::string{} : "." + ext;
    if (name.size() <= head.size() + tail.size() || name.compare(0, head.size(), head) != 0 ||
        name.compare(name.size() - tail.size(), tail.size(), tail) != 0)
        return std::nullopt;

    const std::string digits = name.substr(head.size(), name.size() - head.size() - tail.size());
    if (digits.size() > 9)
        return std::nullopt;
    for (char c : digits)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
    }
    return static_cast<std::size_t>(std::strtoul(digits.c_str(), nullptr, 10));
}
}  // namespace

std::string series_path(const std::string &dir, const std::string &basename, std::size_t index,
                        const std::string &ext)
{
    std::string p = dir.empty() ? std::string{} : dir + "/";
    p += basename + "." + std::to_string(index);
    if (!ext.empty())
        p += "." + ext;
    return p;
}

std::vector<std::string> read_series(const std::string &dir, const std::string &basename,
                                     const std::string &ext)
{
    std::vector<std::pair<std::size_t, fs::path>> found;
    std::error_code                               ec;
    fs::directory_iterator it(dir.empty() ? fs::path(".") : fs::path(dir), ec);
    if (ec)
    {
        LOG_ERROR("cannot list %s: %s", dir.c_str(), ec.message().c_str());
        return {};
    }
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        if (!it->is_regular_file(ec))
            continue;
        auto idx = series_index(it->path().filename().string(), basename, ext);
        if (idx)
            found.emplace_back(*idx, it->path());
    }
    if (ec)
        LOG_WARN("listing %s stopped early: %s", dir.c_str(), ec.message().c_str());

    // "x.1" and "x.01" may both exist; the frame's own tag decides where it lands
    std::sort(found.begin(), found.end());

    std::vector<std::string> out;
    out.reserve(found.size());
    for (const auto &f : found)
    {
        std::string text;
        if (!read_text(f.second.string(), text))
        {
            LOG_WARN("cannot read %s, skipping", f.second.c_str());
            continue;
        }
        out.push_back(std::move(text));
    }
    LOG_DEBUG("read %zu file(s) of series %s", out.size(), basename.c_str());
    return out;
}

bool read_file(const std::string &path, std::vector<std::uint8_t> &out)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return !f.bad();
}

bool read_text(const std::string &path, std::string &out)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return !f.bad();
}

bool write_file(const std::string &path, const std::vector<std::uint8_t> &bytes)
{
    const std::string tmp = path + ".part";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f)
        {
            LOG_ERROR("cannot open %s for writing", tmp.c_str());
            return false;
        }
        f.write(reinterpret_cast<const char *>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
        f.close();
        if (!f)
        {
            LOG_ERROR("short write to %s", tmp.c_str());
            std::remove(tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0)
    {
        LOG_ERROR("cannot move %s into place", path.c_str());
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

}  // namespace scan
