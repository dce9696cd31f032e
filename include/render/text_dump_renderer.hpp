#pragma once
#include <string>
#include <vector>

#include "render/irenderer.hpp"

namespace render
{

// Writes each frame text to <dir>/<basename>.<index>.txt and, for paged layouts, a
// <basename>.pages.txt manifest with the placement of every code. Stands in for an
// image backend and doubles as the input of `qrdrive load`.
class TextDumpRenderer final : public IRenderer
{
  public:
    explicit TextDumpRenderer(std::string dir);

    bool        begin(const std::string &basename, std::size_t total) override;
    bool        render_code(std::size_t             index,
                            const std::string      &frame_text,
                            const plan::LayoutPlan &layout,
                            const StyleOptions     &style) override;
    bool        render_pages(const std::vector<std::string> &frames,
                             const plan::LayoutPlan         &layout) override;
    void        abort() override;
    std::string name() const override { return "text-dump"; }

    const std::vector<std::string> &written() const { return written_; }

  private:
    bool write_whole(const std::string &path, const std::string &body);

    std::string              dir_;
    std::string              basename_;
    std::size_t              total_{0};
    std::vector<std::string> written_;
};

}  // namespace render
