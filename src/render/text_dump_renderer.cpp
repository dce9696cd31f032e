#include <cstdio>
#include <fstream>
#include <sstream>
#include <utility>

#include "render/page_layout.hpp"
#include "render/text_dump_renderer.hpp"
#include "scan/file_series.hpp"
#include "util/log.hpp"

namespace render
{

TextDumpRenderer::TextDumpRenderer(std::string dir) : dir_(std::move(dir)) {}

bool TextDumpRenderer::begin(const std::string &basename, std::size_t total)
{
    if (basename.empty())
    {
        LOG_ERROR("empty basename");
        return false;
    }
    basename_ = basename;
    total_    = total;
    written_.clear();
    return true;
}

bool TextDumpRenderer::write_whole(const std::string &path, const std::string &body)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        LOG_ERROR("cannot open %s for writing", path.c_str());
        return false;
    }
    written_.push_back(path);
    f.write(body.data(), static_cast<std::streamsize>(body.size()));
    f.close();
    if (!f)
    {
        LOG_ERROR("short write to %s", path.c_str());
        return false;
    }
    return true;
}

bool TextDumpRenderer::render_code(std::size_t index, const std::string &frame_text,
                                   const plan::LayoutPlan &layout, const StyleOptions &style)
{
    (void)layout;
    if (index >= total_)
    {
        LOG_ERROR("code %zu outside announced run of %zu", index, total_);
        return false;
    }
    const std::string path = scan::series_path(dir_, basename_, index, "txt");
    LOG_DEBUG("code %zu -> %s (%zu bytes, %s on %s)", index, path.c_str(), frame_text.size(),
              style.fill_color.c_str(), style.back_color.c_str());
    return write_whole(path, frame_text);
}

bool TextDumpRenderer::render_pages(const std::vector<std::string> &frames,
                                    const plan::LayoutPlan         &layout)
{
    diag::Error err;
    auto        geom = plan::geometry(layout, err);
    if (!geom)
    {
        LOG_ERROR("%s", err.detail.c_str());
        return false;
    }

    const auto placements = place(frames.size(), layout, *geom);
    std::ostringstream m;
    m << "# page " << layout.page_width << "x" << layout.page_height << " in, " << layout.columns
      << "x" << layout.rows << " codes per page\n";
    for (const auto &p : placements)
    {
        if (layout.text_side != plan::TextSide::None)
        {
            const std::size_t fits = text_capacity(p.text_w, p.text_h);
            if (frames[p.index].size() > fits)
            {
                LOG_ERROR("text of code %zu (%zu chars) does not fit its area (%zu chars)",
                          p.index, frames[p.index].size(), fits);
                return false;
            }
        }
        char line[160];
        std::snprintf(line, sizeof(line), "page=%zu row=%u col=%u index=%zu x=%.3f y=%.3f edge=%.3f\n",
                      p.page + 1, p.row, p.col, p.index, p.x, p.y, p.code_edge);
        m << line;
    }
    return write_whole(dir_ + "/" + basename_ + ".pages.txt", m.str());
}

void TextDumpRenderer::abort()
{
    for (const auto &path : written_)
    {
        if (std::remove(path.c_str()) != 0)
            LOG_WARN("could not remove %s", path.c_str());
    }
    written_.clear();
}

}  // namespace render
