#pragma once
#include <optional>
#include <string_view>

#include "plan/capacity.hpp"

namespace plan
{

enum class OutputType
{
    Png,          // one image per code, no page document
    Letter,       // 8.5 x 11 in, 2 x 2 codes per page
    IndexCard,    // 3 x 5 in, one code per card
    PlayingCard,  // 2.5 x 3.5 in, one code per card
};

std::optional<OutputType> parse_output_type(std::string_view s);
const char               *output_type_name(OutputType t);

// Expand a named output type into the concrete layout the planner consumes.
LayoutPlan make_layout(OutputType t,
                       unsigned   pixel_density,
                       unsigned   border_modules,
                       Ecc        ecc,
                       TextSide   text_side  = TextSide::None,
                       double     text_share = 0.0);

}  // namespace plan
