#include <string>
#include <utility>
#include <vector>

#include "proto/session.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace frame
{

std::optional<std::string> sanitize_filename(std::string_view name)
{
    const std::size_t slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos)
        name.remove_prefix(slash + 1);
    if (name.empty() || name == "." || name == "..")
        return std::nullopt;
    std::string out;
    out.reserve(name.size());
    for (char c : name)
    {
        const unsigned char u = static_cast<unsigned char>(c);
        out.push_back(u < 0x20 || u == 0x7F ? '_' : c);
    }
    return out;
}

Session::Session(std::string fallback_filename) : fallback_(std::move(fallback_filename)) {}

std::optional<std::size_t> Session::highest_contiguous() const
{
    if (next_expected_ == 0)
        return std::nullopt;
    return next_expected_ - 1;
}

std::optional<std::size_t> Session::max_index() const
{
    if (parts_.empty())
        return std::nullopt;
    return parts_.rbegin()->first;
}

std::vector<std::size_t> Session::missing() const
{
    std::vector<std::size_t> out;
    if (parts_.empty())
        return out;
    std::size_t want = 0;
    for (const auto &kv : parts_)
    {
        while (want < kv.first)
            out.push_back(want++);
        want = kv.first + 1;
    }
    return out;
}

std::optional<IngestResult> Session::ingest(std::string_view text, bool is_foreign_stream,
                                            diag::Error &err)
{
    if (state_ == State::Finalized)
    {
        diag::fail(err, diag::Code::ProtocolSessionFinalized,
                   "session already finalized; start a new one");
        return std::nullopt;
    }

    IngestResult      res;
    const std::size_t arrival = arrivals_;

    auto parsed = parse(text, err);
    if (!parsed)
    {
        if (!is_foreign_stream)
        {
            LOG_WARN("rejecting frame #%zu: %s", arrival, err.detail.c_str());
            return std::nullopt;
        }
        // best effort: the whole scan is payload at its arrival position
        err = diag::Error{};
        parsed.emplace();
        parsed->index   = arrival;
        parsed->payload = std::string(text);
        res.warnings.push_back(
            {diag::Code::ForeignFrame,
             "untagged frame '" + diag::excerpt(parsed->payload) + "' placed at arrival index " +
                 std::to_string(arrival),
             arrival, arrival});
    }
    Parsed &p = *parsed;
    res.index = p.index;

    if (p.demoted)
    {
        res.warnings.push_back({diag::Code::DemotedHeader,
                                "front matter on frame " + std::to_string(p.index) +
                                    " kept as payload",
                                0, p.index});
    }

    if (parts_.count(p.index) != 0)
    {
        // first-seen wins
        arrivals_++;
        res.accepted = false;
        res.warnings.push_back({diag::Code::DuplicateFrame,
                                "frame " + std::to_string(p.index) + " already stored; discarded",
                                p.index, p.index});
        LOG_DEBUG("duplicate frame %zu discarded", p.index);
        return res;
    }

    if (p.index == 0)
    {
        if (!p.filename && !is_foreign_stream && !p.compressed && fallback_.empty())
        {
            diag::fail(err, diag::Code::ProtocolMissingHeader,
                       "frame 0 has no filename header: '" + diag::excerpt(std::string(text)) +
                           "'");
            LOG_WARN("%s", err.detail.c_str());
            return std::nullopt;
        }
        flags_.was_text_encoded = p.text_encoded;
        flags_.was_compressed   = p.compressed;
        flags_.name_in_archive  = p.compressed;
        if (p.filename)
        {
            filename_ = sanitize_filename(*p.filename);
            if (!filename_)
                LOG_WARN("ignoring unusable filename header '%s'", p.filename->c_str());
        }
    }

    arrivals_++;
    foreign_seen_ = foreign_seen_ || is_foreign_stream;
    if (p.index != next_expected_)
    {
        res.warnings.push_back({diag::Code::OutOfOrderFrame,
                                "expected frame " + std::to_string(next_expected_) + ", got " +
                                    std::to_string(p.index),
                                next_expected_, p.index});
    }

    bytes_ += p.payload.size();
    parts_.emplace(p.index, std::move(p.payload));
    state_ = State::Receiving;
    while (parts_.count(next_expected_) != 0)
        next_expected_++;

    res.accepted = true;
    return res;
}

std::optional<Output> Session::finalize(diag::Error &err)
{
    if (state_ == State::Finalized)
    {
        diag::fail(err, diag::Code::ProtocolSessionFinalized, "session already finalized");
        return std::nullopt;
    }
    if (parts_.empty())
    {
        diag::fail(err, diag::Code::IncompleteSequence, "no frames received");
        err.missing = {0};
        return std::nullopt;
    }

    auto gaps = missing();
    if (!gaps.empty())
    {
        diag::fail(err, diag::Code::IncompleteSequence,
                   "missing frames " + diag::format_indices(gaps) + " of 0-" +
                       std::to_string(*max_index()));
        err.missing  = std::move(gaps);
        err.expected = *max_index() + 1;
        err.actual   = parts_.size();
        return std::nullopt;
    }

    std::string blob;
    blob.reserve(bytes_);
    for (const auto &kv : parts_)
        blob += kv.second;

    auto rec = codec::recover(blob, flags_, filename_ ? *filename_ : std::string{}, err);
    if (!rec)
    {
        LOG_WARN("decode aborted: %s", err.detail.c_str());
        return std::nullopt;
    }

    Output out;
    out.bytes = std::move(rec->bytes);
    if (filename_)
    {
        out.filename          = *filename_;
        out.filename_embedded = true;
    }
    else if (auto archived = sanitize_filename(rec->archive_name))
    {
        out.filename          = *archived;
        out.filename_embedded = true;
    }
    else if (!fallback_.empty())
    {
        out.filename = fallback_;
    }
    else if (foreign_seen_)
    {
        out.filename = std::string(constants::FALLBACK_FILENAME);
        LOG_WARN("no filename source; using %s", out.filename.c_str());
    }
    else
    {
        diag::fail(err, diag::Code::ProtocolNoFilename,
                   "no filename in header or archive and none supplied by the operator");
        return std::nullopt;
    }

    state_ = State::Finalized;
    parts_.clear();
    return out;
}

}  // namespace frame
