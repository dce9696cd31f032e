#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "plan/capacity.hpp"

namespace render
{

// Cosmetics only; the core never interprets them.
struct StyleOptions
{
    std::string fill_color{"black"};
    std::string back_color{"white"};
};

// Boundary to whatever turns frame text into code images and pages.
struct IRenderer
{
    virtual bool begin(const std::string &basename, std::size_t total) = 0;
    virtual bool render_code(std::size_t               index,
                             const std::string        &frame_text,
                             const plan::LayoutPlan   &layout,
                             const StyleOptions       &style) = 0;
    // Called once with every frame in ascending order when the layout is paged.
    // Fails when inline text was requested and does not fit its reserved area.
    virtual bool        render_pages(const std::vector<std::string> &frames,
                                     const plan::LayoutPlan         &layout) = 0;
    // Drop everything produced since begin(); no partial output survives a failed run.
    virtual void        abort() {}
    virtual std::string name() const { return ""; }
    virtual ~IRenderer() = default;
};

}  // namespace render
