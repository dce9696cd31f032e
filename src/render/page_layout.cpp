#include <algorithm>
#include <cmath>
#include <vector>

#include "render/page_layout.hpp"

namespace render
{

std::vector<Placement> place(std::size_t count, const plan::LayoutPlan &layout,
                             const plan::Geometry &geom)
{
    std::vector<Placement> out;
    out.reserve(count);
    const std::size_t per_page = static_cast<std::size_t>(layout.columns) * layout.rows;
    if (per_page == 0)
        return out;

    // full cell before the text share was taken out
    const double full_w = geom.drawable_w / layout.columns;
    const double full_h = geom.drawable_h / layout.rows;
    const double edge   = std::max(0.0, std::min(geom.cell_w, geom.cell_h));

    for (std::size_t i = 0; i < count; ++i)
    {
        Placement p;
        const std::size_t slot = i % per_page;
        p.index     = i;
        p.page      = i / per_page;
        p.row       = static_cast<unsigned>(slot / layout.columns);
        p.col       = static_cast<unsigned>(slot % layout.columns);
        p.x         = layout.margin_left + p.col * (full_w + layout.margin_interior);
        p.y         = layout.margin_top + p.row * (full_h + layout.margin_interior);
        p.code_edge = edge;
        if (layout.text_side == plan::TextSide::Right)
        {
            p.text_w = full_w - geom.cell_w;
            p.text_h = full_h;
        }
        else if (layout.text_side == plan::TextSide::Below)
        {
            p.text_w = full_w;
            p.text_h = full_h - geom.cell_h;
        }
        out.push_back(p);
    }
    return out;
}

std::size_t text_capacity(double w, double h)
{
    if (w <= 0 || h <= 0)
        return 0;
    const double char_w = TEXT_FONT_PT * TEXT_CHAR_WIDTH / plan::RENDER_DPI;
    const double line_h = TEXT_FONT_PT * TEXT_LINE_HEIGHT / plan::RENDER_DPI;
    const auto   cols   = static_cast<std::size_t>(std::floor(w / char_w));
    const auto   lines  = static_cast<std::size_t>(std::floor(h / line_h));
    return cols * lines;
}

}  // namespace render
