#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Error and advisory taxonomy shared by the codec, frame and plan modules.
// Operations report fatal conditions through an `Error &` out-parameter and
// collect non-fatal advisories as `Warning` values in their result structs.

namespace diag
{

enum class Code
{
    None = 0,
    // fatal
    FrameMissingIndexTag,     // FrameError: no index tag anywhere in the text
    FrameBadFilename,         // FrameError: filename cannot be carried in a header
    ProtocolMissingHeader,    // ProtocolError: conforming frame 0 has no filename header
    ProtocolSessionFinalized, // ProtocolError: ingest after finalize
    ProtocolNoFilename,       // ProtocolError: finalize without any filename source
    IncompleteSequence,       // finalize with gaps
    PipelineCorruptEncoding,  // PipelineError: invalid text-safe symbol
    PipelineCorruptArchive,   // PipelineError: archive fails structurally
    PlanLayoutTooSmall,       // no tier is legible in the usable area
    PlanInvalidLayout,        // non-positive geometry or zero rows/columns
    RenderFailed,             // renderer refused a code or the page run
    IoFailed,                 // reading input or writing the recovered file
    // advisory
    DuplicateFrame,
    OutOfOrderFrame,
    ForeignFrame,
    DemotedHeader,  // header/markers on a non-zero index treated as payload
    LegibilityRisk,
    ByteSizeClamped,
};

struct Error
{
    Code                     code{Code::None};
    std::string              detail;
    std::vector<std::size_t> missing;  // IncompleteSequence only
    std::size_t              expected{0};
    std::size_t              actual{0};

    explicit operator bool() const { return code != Code::None; }
};

struct Warning
{
    Code        code{Code::None};
    std::string detail;
    std::size_t expected{0};
    std::size_t actual{0};
};

const char *to_string(Code c);
bool        is_fatal(Code c);

// Fills `err` and returns false, so call sites can `return diag::fail(...)`.
bool fail(Error &err, Code c, std::string detail);

// Short printable excerpt of untrusted frame text for error details.
std::string excerpt(const std::string &text, std::size_t max_len = 48);

// "0,3,7-9" style rendering of an index list.
std::string format_indices(const std::vector<std::size_t> &idx);

}  // namespace diag
