#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

#include "util/diag.hpp"

namespace diag
{

const char *to_string(Code c)
{
    switch (c)
    {
        case Code::None:
            return "None";
        case Code::FrameMissingIndexTag:
            return "FrameError(MissingIndexTag)";
        case Code::FrameBadFilename:
            return "FrameError(BadFilename)";
        case Code::ProtocolMissingHeader:
            return "ProtocolError(MissingHeader)";
        case Code::ProtocolSessionFinalized:
            return "ProtocolError(SessionFinalized)";
        case Code::ProtocolNoFilename:
            return "ProtocolError(NoFilename)";
        case Code::IncompleteSequence:
            return "IncompleteSequenceError";
        case Code::PipelineCorruptEncoding:
            return "PipelineError(CorruptEncoding)";
        case Code::PipelineCorruptArchive:
            return "PipelineError(CorruptArchive)";
        case Code::PlanLayoutTooSmall:
            return "PlanError(LayoutTooSmall)";
        case Code::PlanInvalidLayout:
            return "PlanError(InvalidLayout)";
        case Code::RenderFailed:
            return "RenderError";
        case Code::IoFailed:
            return "IoError";
        case Code::DuplicateFrame:
            return "DuplicateFrameWarning";
        case Code::OutOfOrderFrame:
            return "OutOfOrderWarning";
        case Code::ForeignFrame:
            return "ForeignFrameWarning";
        case Code::DemotedHeader:
            return "DemotedHeaderWarning";
        case Code::LegibilityRisk:
            return "LegibilityRiskWarning";
        case Code::ByteSizeClamped:
            return "ByteSizeClampedWarning";
    }
    return "?";
}

bool is_fatal(Code c)
{
    switch (c)
    {
        case Code::DuplicateFrame:
        case Code::OutOfOrderFrame:
        case Code::ForeignFrame:
        case Code::DemotedHeader:
        case Code::LegibilityRisk:
        case Code::ByteSizeClamped:
        case Code::None:
            return false;
        default:
            return true;
    }
}

bool fail(Error &err, Code c, std::string detail)
{
    err.code   = c;
    err.detail = std::move(detail);
    return false;
}

std::string excerpt(const std::string &text, std::size_t max_len)
{
    std::string out;
    out.reserve(std::min(text.size(), max_len) + 3);
    for (std::size_t i = 0; i < text.size() && i < max_len; ++i)
    {
        unsigned char c = static_cast<unsigned char>(text[i]);
        out.push_back(std::isprint(c) ? static_cast<char>(c) : '.');
    }
    if (text.size() > max_len)
        out += "...";
    return out;
}

std::string format_indices(const std::vector<std::size_t> &idx)
{
    // expects ascending input; collapses runs into a-b
    std::string out;
    std::size_t i = 0;
    while (i < idx.size())
    {
        std::size_t j = i;
        while (j + 1 < idx.size() && idx[j + 1] == idx[j] + 1)
            ++j;
        if (!out.empty())
            out.push_back(',');
        out += std::to_string(idx[i]);
        if (j > i)
            out += "-" + std::to_string(idx[j]);
        i = j + 1;
    }
    return out;
}

}  // namespace diag
