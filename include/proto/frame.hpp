#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codec/pipeline.hpp"
#include "util/diag.hpp"

/*
Wire format of one frame (text carried inside one code):

  [b64:][:z:][::f::<filename>::/f::]::c<i>::<payload-text>

  - markers and the filename header only ever appear on index 0
  - ::c<i>:: is mandatory, <i> is the zero-based decimal chunk index
  - payload text is appended verbatim, no escaping

TX:
  codec::prepare(raw) -> blob
    -> make_chunks(blob, chunk_bytes)
       -> serialize_all(chunks, flags, filename)  // frame texts, ascending index
          -> render::IRenderer

RX:
  scanner text -> parse(text) -> Session::ingest -> Session::finalize -> codec::recover
*/

namespace frame
{

// Index tag digits are bounded so the index always fits a size_t
inline constexpr std::size_t MAX_INDEX_DIGITS = 9;

struct Chunk
{
    std::size_t index{0};
    std::string payload;
};

struct Parsed
{
    std::size_t                index{0};
    bool                       text_encoded{false};
    bool                       compressed{false};
    std::optional<std::string> filename;
    std::string                payload;
    std::size_t                stray_prefix{0};  // bytes skipped before the index tag
    bool                       demoted{false};   // front matter kept as payload
};

// Slice a blob into ordered chunks of at most chunk_bytes. An empty blob still
// yields one empty chunk so index 0 can carry the header. With utf8_boundaries a
// chunk never ends inside a multi-byte sequence, which can take more than
// ceil(size / chunk_bytes) chunks.
std::vector<Chunk> make_chunks(const std::string &blob,
                               std::size_t        chunk_bytes,
                               bool               utf8_boundaries = false);

// Filenames must be non-empty and must not contain the header delimiters or path separators.
bool valid_filename(std::string_view name);

// Flags and filename are only written when c.index == 0.
std::string serialize(const Chunk &c, const codec::Flags &flags, const std::string &filename);

// Serialize every chunk, spreading the work over `workers` threads. The result is
// indexed by chunk position regardless of completion order.
std::vector<std::string> serialize_all(const std::vector<Chunk> &chunks,
                                       const codec::Flags       &flags,
                                       const std::string        &filename,
                                       unsigned                  workers = 1);

std::optional<Parsed> parse(std::string_view text, diag::Error &err);

}  // namespace frame
