#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "app/drive_service.hpp"
#include "proto/frame.hpp"
#include "util/log.hpp"

namespace app
{

std::string extension_of(const std::string &name)
{
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
        return {};
    return name.substr(dot);
}

std::string apply_name_override(const std::string &original, const std::string &override_name)
{
    if (override_name.empty())
        return original;
    const std::string ext = extension_of(original);
    if (ext.empty() || (override_name.size() > ext.size() &&
                        override_name.compare(override_name.size() - ext.size(), ext.size(),
                                              ext) == 0))
        return override_name;
    return override_name + ext;
}

static std::string base_name(const std::string &path)
{
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::optional<SaveReport> DriveService::save(const std::vector<std::uint8_t> &raw,
                                             const std::string               &source_name,
                                             const SaveOptions               &opts,
                                             diag::Error                     &err)
{
    SaveReport rep;
    rep.filename = apply_name_override(base_name(source_name), opts.name_override);
    if (!frame::valid_filename(rep.filename))
    {
        diag::fail(err, diag::Code::FrameBadFilename,
                   "filename '" + rep.filename + "' cannot be carried in a frame header");
        LOG_ERROR("%s", err.detail.c_str());
        return std::nullopt;
    }

    auto planned = plan::plan(opts.layout, opts.bytesize, opts.force, err);
    if (!planned)
    {
        LOG_ERROR("%s", err.detail.c_str());
        return std::nullopt;
    }
    rep.chunk_bytes = planned->chunk_bytes;
    rep.warnings    = std::move(planned->warnings);
    for (const auto &w : rep.warnings)
        LOG_WARN("%s: %s", diag::to_string(w.code), w.detail.c_str());

    auto prepared = codec::prepare(raw, rep.filename, opts.compress, err);
    if (!prepared)
    {
        LOG_ERROR("%s", err.detail.c_str());
        return std::nullopt;
    }
    rep.flags      = prepared->flags;
    rep.blob_bytes = prepared->blob.size();

    // unencoded text keeps multi-byte sequences whole on each code
    auto chunks = frame::make_chunks(prepared->blob, rep.chunk_bytes, !rep.flags.was_text_encoded);
    auto frames = frame::serialize_all(chunks, rep.flags, rep.filename, opts.workers);
    rep.codes   = frames.size();

    std::size_t longest = 0;
    for (const auto &f : frames)
        longest = std::max(longest, f.size());
    rep.version = plan::version_for_bytes(longest, opts.layout.ecc);

    if (!renderer_.begin(rep.filename, frames.size()))
    {
        diag::fail(err, diag::Code::RenderFailed, "renderer refused the run");
        return std::nullopt;
    }
    for (std::size_t i = 0; i < frames.size(); ++i)
    {
        if (!renderer_.render_code(i, frames[i], opts.layout, opts.style))
        {
            renderer_.abort();
            diag::fail(err, diag::Code::RenderFailed,
                       "rendering code " + std::to_string(i) + " failed");
            LOG_ERROR("%s", err.detail.c_str());
            return std::nullopt;
        }
    }
    if (opts.layout.paged && !renderer_.render_pages(frames, opts.layout))
    {
        renderer_.abort();
        diag::fail(err, diag::Code::RenderFailed,
                   "codes and inline text do not fit the page layout");
        LOG_ERROR("%s", err.detail.c_str());
        return std::nullopt;
    }

    LOG_INFO("%s: %zu code(s), %zu bytes per code, version %u", rep.filename.c_str(), rep.codes,
             rep.chunk_bytes, rep.version);
    return rep;
}

std::optional<LoadReport> load_frames(const std::vector<std::string> &frames,
                                      const LoadOptions              &opts,
                                      diag::Error                    &err)
{
    LoadReport     rep;
    frame::Session session(opts.name_override);

    for (const auto &text : frames)
    {
        auto res = session.ingest(text, opts.foreign, err);
        if (!res)
            return std::nullopt;
        for (auto &w : res->warnings)
        {
            LOG_WARN("%s: %s", diag::to_string(w.code), w.detail.c_str());
            rep.warnings.push_back(std::move(w));
        }
    }
    rep.frames = session.arrivals();

    auto out = session.finalize(err);
    if (!out)
    {
        LOG_ERROR("%s", err.detail.c_str());
        return std::nullopt;
    }
    rep.out_name = out->filename_embedded ? apply_name_override(out->filename, opts.name_override)
                                          : out->filename;
    rep.output   = std::move(*out);
    return rep;
}

}  // namespace app
