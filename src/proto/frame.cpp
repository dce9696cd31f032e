#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "proto/frame.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace frame
{

namespace
{
using constants::COMPRESSED_MARKER;
using constants::INDEX_CLOSE;
using constants::INDEX_OPEN;
using constants::NAME_CLOSE;
using constants::NAME_OPEN;
using constants::TEXT_ENCODED_MARKER;

bool at(std::string_view text, std::size_t pos, std::string_view tok)
{
    return text.size() - pos >= tok.size() && text.compare(pos, tok.size(), tok) == 0;
}

bool is_utf8_continuation(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Matches ::c<digits>:: at pos; on success sets index and the payload offset.
bool index_tag_at(std::string_view text, std::size_t pos, std::size_t &index, std::size_t &end)
{
    if (!at(text, pos, INDEX_OPEN))
        return false;
    std::size_t p      = pos + INDEX_OPEN.size();
    std::size_t digits = 0;
    std::size_t value  = 0;
    while (p < text.size() && text[p] >= '0' && text[p] <= '9')
    {
        if (++digits > MAX_INDEX_DIGITS)
            return false;
        value = value * 10 + static_cast<std::size_t>(text[p] - '0');
        ++p;
    }
    if (digits == 0 || !at(text, p, INDEX_CLOSE))
        return false;
    index = value;
    end   = p + INDEX_CLOSE.size();
    return true;
}
}  // namespace

std::vector<Chunk> make_chunks(const std::string &blob,
                               std::size_t        chunk_bytes,
                               bool               utf8_boundaries)
{
    if (chunk_bytes < 1)
    {
        LOG_ERROR("make_chunks: invalid chunk_bytes (%zu)", chunk_bytes);
        return {};
    }
    std::vector<Chunk> out;
    if (blob.empty())
    {
        out.push_back(Chunk{0, {}});
        return out;
    }

    out.reserve((blob.size() + chunk_bytes - 1) / chunk_bytes);
    std::size_t start = 0;
    while (start < blob.size())
    {
        std::size_t take = std::min(chunk_bytes, blob.size() - start);
        if (utf8_boundaries && start + take < blob.size())
        {
            // back off to the lead byte of a split sequence
            std::size_t cut = take;
            while (cut > 0 && is_utf8_continuation(blob[start + cut]))
                --cut;
            if (cut > 0)
                take = cut;
        }
        out.push_back(Chunk{out.size(), blob.substr(start, take)});
        start += take;
    }
    return out;
}

bool valid_filename(std::string_view name)
{
    if (name.empty())
        return false;  // no header would be written
    if (name.find(':') != std::string_view::npos)
        return false;  // would collide with the header delimiters
    if (name.find('/') != std::string_view::npos || name.find('\0') != std::string_view::npos)
        return false;
    return name != "." && name != "..";
}

std::string serialize(const Chunk &c, const codec::Flags &flags, const std::string &filename)
{
    std::string out;
    out.reserve(c.payload.size() + filename.size() + 32);
    if (c.index == 0)
    {
        if (flags.was_text_encoded)
            out.append(TEXT_ENCODED_MARKER);
        if (flags.was_compressed)
            out.append(COMPRESSED_MARKER);
        if (!filename.empty())
        {
            out.append(NAME_OPEN);
            out.append(filename);
            out.append(NAME_CLOSE);
        }
    }
    out.append(INDEX_OPEN);
    out.append(std::to_string(c.index));
    out.append(INDEX_CLOSE);
    out.append(c.payload);
    return out;
}

std::vector<std::string> serialize_all(const std::vector<Chunk> &chunks,
                                       const codec::Flags       &flags,
                                       const std::string        &filename,
                                       unsigned                  workers)
{
    std::vector<std::string> out(chunks.size());
    const std::size_t        n = std::min<std::size_t>(std::max(workers, 1u), chunks.size());
    if (n <= 1)
    {
        for (std::size_t i = 0; i < chunks.size(); ++i)
            out[i] = serialize(chunks[i], flags, filename);
        return out;
    }

    // strided partition; every slot is written by exactly one thread
    std::vector<std::thread> pool;
    pool.reserve(n);
    for (std::size_t w = 0; w < n; ++w)
    {
        pool.emplace_back([&, w] {
            for (std::size_t i = w; i < chunks.size(); i += n)
                out[i] = serialize(chunks[i], flags, filename);
        });
    }
    for (auto &t : pool)
        t.join();
    LOG_DEBUG("serialized %zu frames on %zu workers", chunks.size(), n);
    return out;
}

std::optional<Parsed> parse(std::string_view text, diag::Error &err)
{
    Parsed      p;
    std::size_t pos = 0;

    if (at(text, pos, TEXT_ENCODED_MARKER))
    {
        p.text_encoded = true;
        pos += TEXT_ENCODED_MARKER.size();
    }
    if (at(text, pos, COMPRESSED_MARKER))
    {
        p.compressed = true;
        pos += COMPRESSED_MARKER.size();
    }
    if (at(text, pos, NAME_OPEN))
    {
        const std::size_t name_at = pos + NAME_OPEN.size();
        const std::size_t close   = text.find(NAME_CLOSE, name_at);
        if (close != std::string_view::npos)
        {
            p.filename = std::string(text.substr(name_at, close - name_at));
            pos        = close + NAME_CLOSE.size();
        }
    }

    // the tag is expected right here; otherwise continue forward to the first one
    const std::size_t front   = pos;
    std::size_t       index   = 0;
    std::size_t       payload = 0;
    std::size_t       tag_at  = pos;
    std::size_t       from    = pos;
    bool              found   = false;
    while (!found)
    {
        tag_at = text.find(INDEX_OPEN, from);
        if (tag_at == std::string_view::npos)
            break;
        found = index_tag_at(text, tag_at, index, payload);
        from  = tag_at + 1;
    }
    if (!found)
    {
        diag::fail(err, diag::Code::FrameMissingIndexTag,
                   "no index tag in frame '" + diag::excerpt(std::string(text)) + "'");
        return std::nullopt;
    }

    p.index        = index;
    p.stray_prefix = tag_at - front;
    if (index != 0)
    {
        // front matter on a non-zero index is not trusted
        const bool had_front = tag_at > 0;
        p.text_encoded       = false;
        p.compressed         = false;
        p.filename.reset();
        p.payload.reserve(tag_at + text.size() - payload);
        p.payload.append(text.substr(0, tag_at));
        p.payload.append(text.substr(payload));
        p.demoted = had_front;
        return p;
    }
    p.payload.reserve(p.stray_prefix + text.size() - payload);
    p.payload.append(text.substr(front, p.stray_prefix));
    p.payload.append(text.substr(payload));
    p.demoted = p.stray_prefix > 0;
    return p;
}

}  // namespace frame
