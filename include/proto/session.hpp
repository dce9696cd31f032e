#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codec/pipeline.hpp"
#include "proto/frame.hpp"
#include "util/diag.hpp"

namespace frame
{

enum class State
{
    Empty,
    Receiving,
    Finalized  // terminal
};

struct IngestResult
{
    bool                       accepted{false};  // false only for duplicates
    std::size_t                index{0};
    std::vector<diag::Warning> warnings;
};

struct Output
{
    std::vector<std::uint8_t> bytes;
    std::string               filename;
    bool                      filename_embedded{false};  // from header or archive
};

// Reduce an untrusted name to a bare file name; nullopt when nothing usable remains.
std::optional<std::string> sanitize_filename(std::string_view name);

// One decode run. Frames may arrive in any order; the run ends only on an explicit
// finalize() since the wire format has no terminator.
class Session
{
  public:
    explicit Session(std::string fallback_filename = {});

    // Feed one scanned frame text. Duplicates and ordering anomalies come back as
    // warnings; malformed conforming input and post-finalize calls fail.
    std::optional<IngestResult> ingest(std::string_view text, bool is_foreign_stream,
                                       diag::Error &err);

    // Requires every index in [0, max_index()]; on success the session is spent.
    std::optional<Output> finalize(diag::Error &err);

    void set_fallback_filename(std::string name) { fallback_ = std::move(name); }

    State                      state() const { return state_; }
    std::size_t                received() const { return parts_.size(); }
    std::size_t                arrivals() const { return arrivals_; }
    std::size_t                payload_bytes() const { return bytes_; }
    std::optional<std::size_t> highest_contiguous() const;
    std::optional<std::size_t> max_index() const;
    std::vector<std::size_t>   missing() const;  // gaps in [0, max_index()]
    const codec::Flags        &flags() const { return flags_; }
    const std::optional<std::string> &header_filename() const { return filename_; }

  private:
    std::map<std::size_t, std::string> parts_;
    State                              state_{State::Empty};
    std::size_t                        arrivals_{0};
    std::size_t                        next_expected_{0};
    std::size_t                        bytes_{0};
    codec::Flags                       flags_{};
    std::optional<std::string>         filename_;
    std::string                        fallback_;
    bool                               foreign_seen_{false};
};

}  // namespace frame
