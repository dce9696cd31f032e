#include <optional>
#include <string_view>

#include "plan/presets.hpp"

namespace plan
{

std::optional<OutputType> parse_output_type(std::string_view s)
{
    if (s == "png" || s == "PNG")
        return OutputType::Png;
    if (s == "letter")
        return OutputType::Letter;
    if (s == "index" || s == "index_card")
        return OutputType::IndexCard;
    if (s == "playing_card")
        return OutputType::PlayingCard;
    return std::nullopt;
}

const char *output_type_name(OutputType t)
{
    switch (t)
    {
        case OutputType::Png:
            return "png";
        case OutputType::Letter:
            return "letter";
        case OutputType::IndexCard:
            return "index_card";
        case OutputType::PlayingCard:
            return "playing_card";
    }
    return "?";
}

LayoutPlan make_layout(OutputType t,
                       unsigned   pixel_density,
                       unsigned   border_modules,
                       Ecc        ecc,
                       TextSide   text_side,
                       double     text_share)
{
    LayoutPlan l;
    l.pixel_density  = pixel_density;
    l.border_modules = border_modules;
    l.ecc            = ecc;
    l.text_side      = text_side;
    l.text_share     = text_side == TextSide::None ? 0.0 : text_share;

    switch (t)
    {
        case OutputType::Png:
        {
            // the "page" is the image of the largest code at this density
            const double edge = static_cast<double>(TIERS.front().modules + 2 * border_modules) *
                                static_cast<double>(pixel_density) / RENDER_DPI;
            l.page_width = l.page_height = edge;
            l.margin_left = l.margin_right = l.margin_top = l.margin_bottom = 0.0;
            l.margin_interior = 0.0;
            l.columns = l.rows = 1;
            l.paged            = false;
            if (l.text_share < 1.0 && text_side == TextSide::Right)
                l.page_width = edge / (1.0 - l.text_share);
            else if (l.text_share < 1.0 && text_side == TextSide::Below)
                l.page_height = edge / (1.0 - l.text_share);
            break;
        }
        case OutputType::Letter:
            l.page_width  = 8.5;
            l.page_height = 11.0;
            l.margin_left = l.margin_right = l.margin_top = l.margin_bottom = 0.5;
            l.margin_interior = 0.5;
            l.columns = l.rows = 2;
            break;
        case OutputType::IndexCard:
            l.page_width  = 3.0;
            l.page_height = 5.0;
            l.margin_left = l.margin_right = 0.25;
            l.margin_top = l.margin_bottom = 0.5;
            l.margin_interior = 0.25;
            l.columns = l.rows = 1;
            break;
        case OutputType::PlayingCard:
            l.page_width  = 2.5;
            l.page_height = 3.5;
            l.margin_left = l.margin_right = l.margin_top = l.margin_bottom = 0.25;
            l.margin_interior = 0.25;
            l.columns = l.rows = 1;
            break;
    }
    return l;
}

}  // namespace plan
