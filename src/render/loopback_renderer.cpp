#include "render/loopback_renderer.hpp"

namespace render
{

bool LoopbackRenderer::begin(const std::string &basename, std::size_t total)
{
    basename_ = basename;
    codes_.assign(total, std::string{});
    pages_ = 0;
    return true;
}

bool LoopbackRenderer::render_code(std::size_t index, const std::string &frame_text,
                                   const plan::LayoutPlan &, const StyleOptions &)
{
    if (index >= codes_.size() || index == fail_at_)
        return false;
    codes_[index] = frame_text;
    return true;
}

bool LoopbackRenderer::render_pages(const std::vector<std::string> &frames,
                                    const plan::LayoutPlan         &layout)
{
    const std::size_t per_page = static_cast<std::size_t>(layout.columns) * layout.rows;
    if (per_page == 0)
        return false;
    pages_ = (frames.size() + per_page - 1) / per_page;
    return true;
}

void LoopbackRenderer::abort()
{
    codes_.clear();
    pages_ = 0;
}

}  // namespace render
