#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "util/diag.hpp"

namespace plan
{

enum class Ecc
{
    L,
    M,
    H
};

// Where inline text is drawn next to each code
enum class TextSide
{
    None,
    Right,
    Below
};

// Physical page description; lengths in inches.
struct LayoutPlan
{
    double   page_width{8.5};
    double   page_height{11.0};
    double   margin_left{0.5};
    double   margin_right{0.5};
    double   margin_top{0.5};
    double   margin_bottom{0.5};
    double   margin_interior{0.5};
    unsigned columns{1};
    unsigned rows{1};
    unsigned border_modules{4};
    unsigned pixel_density{10};  // pixels per module
    Ecc      ecc{Ecc::L};
    TextSide text_side{TextSide::None};
    double   text_share{0.0};  // fraction of the cell reserved for text, [0, 1)
    bool     paged{true};      // false: one image per code, no page document
};

struct Tier
{
    std::size_t bytes_l;  // capacity at strength L
    unsigned    version;
    unsigned    modules;  // 17 + 4 * version
};

// Ordered largest first.
inline constexpr std::array<Tier, 8> TIERS = {{
    {2953, 40, 177},
    {2303, 35, 157},
    {1732, 30, 137},
    {1273, 25, 117},
    {858, 20, 97},
    {520, 15, 77},
    {271, 10, 57},
    {106, 5, 37},
}};

inline constexpr double RENDER_DPI         = 72.0;         // PDF points per inch
inline constexpr double MIN_MODULE_EDGE_IN = 0.5 / 25.4;  // legibility floor, 0.5 mm

struct Geometry
{
    double drawable_w{0};
    double drawable_h{0};
    double cell_w{0};  // after text reservation
    double cell_h{0};
    double usable_edge{0};  // code edge left after a quiet zone of legible modules
};

struct Result
{
    std::size_t                chunk_bytes{0};
    std::size_t                ceiling{0};  // computed safe maximum
    unsigned                   version{0};  // smallest code version holding chunk_bytes
    Geometry                   geom;
    std::vector<diag::Warning> warnings;
};

std::optional<Geometry> geometry(const LayoutPlan &layout, diag::Error &err);

std::size_t tier_bytes(const Tier &t, Ecc ecc);

// Largest legible tier capacity for the layout, 0 if none fits.
std::size_t safe_ceiling(const Geometry &g, Ecc ecc);

std::optional<Result> plan(const LayoutPlan           &layout,
                           std::optional<std::size_t>  explicit_bytes,
                           bool                        override_safety,
                           diag::Error                &err);

// Smallest code version whose capacity at `ecc` holds `bytes`; 40 when nothing does.
unsigned version_for_bytes(std::size_t bytes, Ecc ecc);

std::optional<Ecc> parse_ecc(std::string_view s);
const char        *ecc_name(Ecc ecc);

}  // namespace plan
