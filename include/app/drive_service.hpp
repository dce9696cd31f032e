#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "codec/pipeline.hpp"
#include "plan/capacity.hpp"
#include "proto/session.hpp"
#include "render/irenderer.hpp"
#include "util/diag.hpp"

namespace app
{

struct SaveOptions
{
    plan::LayoutPlan           layout;
    std::optional<std::size_t> bytesize;  // planner decides when unset
    bool                       force{false};
    bool                       compress{false};
    std::string                name_override;  // replaces the basename, extension kept
    render::StyleOptions       style;
    unsigned                   workers{1};
};

struct SaveReport
{
    std::string                filename;  // name carried by the stream
    std::size_t                codes{0};
    std::size_t                chunk_bytes{0};
    std::size_t                blob_bytes{0};
    unsigned                   version{0};  // code version for the longest frame
    codec::Flags               flags;
    std::vector<diag::Warning> warnings;
};

struct LoadOptions
{
    bool        foreign{false};
    std::string name_override;  // operator name; gets the embedded extension
};

struct LoadReport
{
    frame::Output              output;
    std::string                out_name;  // after the operator override
    std::size_t                frames{0};
    std::vector<diag::Warning> warnings;
};

// "report.pdf" -> ".pdf", "archive.tar.gz" -> ".gz", "README" -> ""
std::string extension_of(const std::string &name);

// Operator name with the extension of `original` unless it already ends with it.
std::string apply_name_override(const std::string &original, const std::string &override_name);

// Encode side: file bytes -> pipeline -> planner -> frames -> renderer.
class DriveService
{
  public:
    explicit DriveService(render::IRenderer &r) : renderer_(r) {}

    // Nothing survives in the renderer when this fails.
    std::optional<SaveReport> save(const std::vector<std::uint8_t> &raw,
                                   const std::string               &source_name,
                                   const SaveOptions               &opts,
                                   diag::Error                     &err);

  private:
    render::IRenderer &renderer_;
};

// Decode side: one session over already scanned frame texts.
std::optional<LoadReport> load_frames(const std::vector<std::string> &frames,
                                      const LoadOptions              &opts,
                                      diag::Error                    &err);

}  // namespace app
