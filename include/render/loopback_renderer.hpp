#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "render/irenderer.hpp"

namespace render
{

// LoopbackRenderer: keeps frame texts in memory to test save -> load without files.
class LoopbackRenderer final : public IRenderer
{
  public:
    bool begin(const std::string &basename, std::size_t total) override;
    bool render_code(std::size_t             index,
                     const std::string      &frame_text,
                     const plan::LayoutPlan &layout,
                     const StyleOptions     &style) override;
    bool render_pages(const std::vector<std::string> &frames,
                      const plan::LayoutPlan         &layout) override;
    void abort() override;

    // fail render_code for this index, to exercise rollback
    void fail_at(std::size_t index) { fail_at_ = index; }

    const std::string              &basename() const { return basename_; }
    const std::vector<std::string> &codes() const { return codes_; }
    std::size_t                     pages() const { return pages_; }

  private:
    std::string              basename_;
    std::vector<std::string> codes_;
    std::size_t              pages_{0};
    std::size_t              fail_at_{static_cast<std::size_t>(-1)};
};

}  // namespace render
