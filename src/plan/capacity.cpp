#include <algorithm>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>

#include "plan/capacity.hpp"
#include "util/log.hpp"

namespace plan
{

namespace
{
// share of the L capacity a tier keeps at each strength
double ecc_factor(Ecc ecc)
{
    switch (ecc)
    {
        case Ecc::L:
            return 1.0;
        case Ecc::M:
            return 0.75;
        case Ecc::H:
            return 0.4;
    }
    return 1.0;
}

std::string fmt_in(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3fin", v);
    return buf;
}
}  // namespace

std::size_t tier_bytes(const Tier &t, Ecc ecc)
{
    return static_cast<std::size_t>(std::floor(static_cast<double>(t.bytes_l) * ecc_factor(ecc)));
}

std::optional<Geometry> geometry(const LayoutPlan &l, diag::Error &err)
{
    if (!(l.page_width > 0) || !(l.page_height > 0))
    {
        diag::fail(err, diag::Code::PlanInvalidLayout, "page dimensions must be positive");
        return std::nullopt;
    }
    if (l.margin_left < 0 || l.margin_right < 0 || l.margin_top < 0 || l.margin_bottom < 0 ||
        l.margin_interior < 0)
    {
        diag::fail(err, diag::Code::PlanInvalidLayout, "margins must not be negative");
        return std::nullopt;
    }
    if (l.columns == 0 || l.rows == 0)
    {
        diag::fail(err, diag::Code::PlanInvalidLayout, "columns and rows must be at least 1");
        return std::nullopt;
    }
    if (l.text_side != TextSide::None && !(l.text_share >= 0.0 && l.text_share < 1.0))
    {
        diag::fail(err, diag::Code::PlanInvalidLayout, "text share must be in [0, 1)");
        return std::nullopt;
    }

    Geometry g;
    g.drawable_w = l.page_width - l.margin_left - l.margin_right -
                   static_cast<double>(l.columns - 1) * l.margin_interior;
    g.drawable_h = l.page_height - l.margin_top - l.margin_bottom -
                   static_cast<double>(l.rows - 1) * l.margin_interior;
    g.cell_w     = std::max(0.0, g.drawable_w / static_cast<double>(l.columns));
    g.cell_h     = std::max(0.0, g.drawable_h / static_cast<double>(l.rows));

    if (l.text_side == TextSide::Right)
        g.cell_w -= g.cell_w * l.text_share;
    else if (l.text_side == TextSide::Below)
        g.cell_h -= g.cell_h * l.text_share;

    // the quiet zone is drawn with the same modules as the data
    g.usable_edge = std::min(g.cell_w, g.cell_h) -
                    2.0 * static_cast<double>(l.border_modules) * MIN_MODULE_EDGE_IN;
    return g;
}

std::size_t safe_ceiling(const Geometry &g, Ecc ecc)
{
    for (const Tier &t : TIERS)
    {
        if (static_cast<double>(t.modules) * MIN_MODULE_EDGE_IN <= g.usable_edge)
            return tier_bytes(t, ecc);
    }
    return 0;
}

unsigned version_for_bytes(std::size_t bytes, Ecc ecc)
{
    for (auto it = TIERS.rbegin(); it != TIERS.rend(); ++it)
    {
        if (bytes <= tier_bytes(*it, ecc))
            return it->version;
    }
    return TIERS.front().version;
}

std::optional<Result> plan(const LayoutPlan          &layout,
                           std::optional<std::size_t> explicit_bytes,
                           bool                       override_safety,
                           diag::Error               &err)
{
    if (explicit_bytes && *explicit_bytes == 0)
    {
        diag::fail(err, diag::Code::PlanInvalidLayout, "explicit byte size must be positive");
        return std::nullopt;
    }
    auto g = geometry(layout, err);
    if (!g)
        return std::nullopt;

    Result r;
    r.geom    = *g;
    r.ceiling = safe_ceiling(*g, layout.ecc);

    // no single code carries more than the top tier, override or not
    const std::size_t hard_max = tier_bytes(TIERS.front(), layout.ecc);

    if (!explicit_bytes)
    {
        if (r.ceiling == 0)
        {
            diag::fail(err, diag::Code::PlanLayoutTooSmall,
                       "usable code edge " + fmt_in(g->usable_edge) + " is below " +
                           std::to_string(TIERS.back().modules) + " legible modules");
            return std::nullopt;
        }
        r.chunk_bytes = r.ceiling;
    }
    else if (*explicit_bytes <= r.ceiling)
    {
        r.chunk_bytes = *explicit_bytes;
    }
    else if (override_safety)
    {
        r.chunk_bytes = std::min(*explicit_bytes, hard_max);
        if (*explicit_bytes > hard_max)
        {
            diag::Warning c{diag::Code::ByteSizeClamped,
                            "byte size " + std::to_string(*explicit_bytes) +
                                " exceeds the largest code (" + std::to_string(hard_max) + ")",
                            hard_max, *explicit_bytes};
            LOG_WARN("%s", c.detail.c_str());
            r.warnings.push_back(std::move(c));
        }
        if (r.chunk_bytes > r.ceiling)
        {
            diag::Warning w{diag::Code::LegibilityRisk,
                            "byte size " + std::to_string(r.chunk_bytes) +
                                " exceeds legible ceiling " + std::to_string(r.ceiling) +
                                " for this layout",
                            r.ceiling, r.chunk_bytes};
            LOG_WARN("%s", w.detail.c_str());
            r.warnings.push_back(std::move(w));
        }
    }
    else
    {
        if (r.ceiling == 0)
        {
            diag::fail(err, diag::Code::PlanLayoutTooSmall,
                       "requested " + std::to_string(*explicit_bytes) +
                           " bytes but no code size is legible in " + fmt_in(g->usable_edge));
            err.actual = *explicit_bytes;
            return std::nullopt;
        }
        r.chunk_bytes = r.ceiling;
        diag::Warning w{diag::Code::ByteSizeClamped,
                        "byte size " + std::to_string(*explicit_bytes) + " clamped to " +
                            std::to_string(r.ceiling),
                        r.ceiling, *explicit_bytes};
        LOG_WARN("%s", w.detail.c_str());
        r.warnings.push_back(std::move(w));
    }

    r.version = version_for_bytes(r.chunk_bytes, layout.ecc);
    LOG_DEBUG("plan: cell=%.3fx%.3f usable=%.3f ceiling=%zu chunk=%zu version=%u", g->cell_w,
              g->cell_h, g->usable_edge, r.ceiling, r.chunk_bytes, r.version);
    return r;
}

std::optional<Ecc> parse_ecc(std::string_view s)
{
    if (s == "L" || s == "l")
        return Ecc::L;
    if (s == "M" || s == "m")
        return Ecc::M;
    if (s == "H" || s == "h")
        return Ecc::H;
    return std::nullopt;
}

const char *ecc_name(Ecc ecc)
{
    switch (ecc)
    {
        case Ecc::L:
            return "L";
        case Ecc::M:
            return "M";
        case Ecc::H:
            return "H";
    }
    return "?";
}

}  // namespace plan
