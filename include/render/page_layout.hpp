#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "plan/capacity.hpp"

namespace render
{

// Inline text is set in a monospaced face at this size
inline constexpr double TEXT_FONT_PT     = 6.0;
inline constexpr double TEXT_CHAR_WIDTH  = 0.6;  // em fraction
inline constexpr double TEXT_LINE_HEIGHT = 1.2;  // em multiple

struct Placement
{
    std::size_t index{0};
    std::size_t page{0};
    unsigned    row{0};
    unsigned    col{0};
    double      x{0};  // top-left of the code cell, inches from the page's top-left
    double      y{0};
    double      code_edge{0};
    double      text_w{0};  // reserved text area, 0 when no inline text
    double      text_h{0};
};

// Place `count` codes row-major, `columns * rows` per page.
std::vector<Placement> place(std::size_t count, const plan::LayoutPlan &layout,
                             const plan::Geometry &geom);

// Characters of monospaced text that fit a w x h inch box.
std::size_t text_capacity(double w, double h);

}  // namespace render
