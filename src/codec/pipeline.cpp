#include <array>
#include <cstdint>
#include <cstring>
#include <sodium.h>
#include <string>
#include <utility>
#include <vector>
#include <zlib.h>

#include "codec/pipeline.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace codec
{

namespace
{
constexpr std::size_t kInflateChunk = 16 * 1024;
constexpr std::size_t kMaxArchiveName = 1024;
constexpr int         kGzipWindowBits = 15 + 16;  // +16 selects the gzip wrapper
constexpr int         kOsUnix         = 3;

bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

// Length of the UTF-8 sequence starting at p, 0 if malformed.
std::size_t utf8_seq_len(const std::uint8_t *p, std::size_t left)
{
    const std::uint8_t c = p[0];
    std::size_t        need;
    if (c < 0x80)
        return 1;
    else if (c >= 0xC2 && c <= 0xDF)
        need = 2;
    else if (c >= 0xE0 && c <= 0xEF)
        need = 3;
    else if (c >= 0xF0 && c <= 0xF4)
        need = 4;
    else
        return 0;
    if (left < need)
        return 0;
    for (std::size_t k = 1; k < need; ++k)
    {
        if ((p[k] & 0xC0) != 0x80)
            return 0;
    }
    // overlongs and surrogates
    if (c == 0xE0 && p[1] < 0xA0)
        return 0;
    if (c == 0xED && p[1] > 0x9F)
        return 0;
    if (c == 0xF0 && p[1] < 0x90)
        return 0;
    if (c == 0xF4 && p[1] > 0x8F)
        return 0;
    return need;
}
}  // namespace

bool is_text_safe(const std::uint8_t *data, std::size_t n)
{
    const std::string_view opener = constants::INDEX_OPEN;
    std::size_t            i      = 0;
    while (i < n)
    {
        const std::uint8_t c = data[i];
        if (c == 0)
            return false;
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\b')
            return false;
        if (c == 0x7F)
            return false;
        if (c == static_cast<std::uint8_t>(opener[0]) && i + opener.size() <= n &&
            std::memcmp(data + i, opener.data(), opener.size()) == 0)
            return false;
        const std::size_t len = utf8_seq_len(data + i, n - i);
        if (len == 0)
            return false;
        i += len;
    }
    return true;
}

std::string base64_encode(const std::uint8_t *data, std::size_t n)
{
    ensure_sodium_init();
    const std::size_t enc_len = sodium_base64_ENCODED_LEN(n, sodium_base64_VARIANT_ORIGINAL);
    std::string       out(enc_len, '\0');  // includes the terminating NUL
    sodium_bin2base64(&out[0], enc_len, data, n, sodium_base64_VARIANT_ORIGINAL);
    out.resize(enc_len - 1);
    return out;
}

bool base64_decode(const std::string &in, std::vector<std::uint8_t> &out)
{
    ensure_sodium_init();
    // scanners may hand over line breaks; they are never part of the alphabet
    out.resize(in.size() / 4 * 3 + 3);
    std::size_t real_len = 0;
    if (sodium_base642bin(out.data(), out.size(), in.c_str(), in.size(), "\r\n", &real_len,
                          nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        out.clear();
        return false;
    }
    out.resize(real_len);
    return true;
}

bool gzip_compress(const std::vector<std::uint8_t> &in,
                   const std::string               &name,
                   std::vector<std::uint8_t>       &out)
{
    z_stream zs{};
    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK)
    {
        LOG_ERROR("deflateInit2 failed: %s", zs.msg ? zs.msg : "?");
        return false;
    }

    // zlib keeps the pointer until the header is written
    std::vector<char> name_buf(name.begin(), name.end());
    name_buf.push_back('\0');
    gz_header hdr{};
    hdr.os   = kOsUnix;
    hdr.name = name.empty() ? Z_NULL : reinterpret_cast<Bytef *>(name_buf.data());
    if (deflateSetHeader(&zs, &hdr) != Z_OK)
    {
        LOG_ERROR("deflateSetHeader failed");
        deflateEnd(&zs);
        return false;
    }

    // bound + header name + gzip framing slack
    out.resize(deflateBound(&zs, static_cast<uLong>(in.size())) + name.size() + 32);
    zs.next_in   = const_cast<Bytef *>(in.data());
    zs.avail_in  = static_cast<uInt>(in.size());
    zs.next_out  = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&zs, Z_FINISH);
    if (rc != Z_STREAM_END)
    {
        LOG_ERROR("deflate did not finish (rc=%d)", rc);
        deflateEnd(&zs);
        out.clear();
        return false;
    }
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return true;
}

bool gzip_decompress(const std::vector<std::uint8_t> &in,
                     std::vector<std::uint8_t>       &out,
                     std::string                     &name)
{
    z_stream zs{};
    if (inflateInit2(&zs, kGzipWindowBits) != Z_OK)
    {
        LOG_ERROR("inflateInit2 failed: %s", zs.msg ? zs.msg : "?");
        return false;
    }

    std::array<Bytef, kMaxArchiveName> name_buf{};
    gz_header                          hdr{};
    hdr.name     = name_buf.data();
    hdr.name_max = static_cast<uInt>(name_buf.size() - 1);
    if (inflateGetHeader(&zs, &hdr) != Z_OK)
    {
        inflateEnd(&zs);
        return false;
    }

    zs.next_in  = const_cast<Bytef *>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());

    out.clear();
    std::array<Bytef, kInflateChunk> buf{};
    int                              rc = Z_OK;
    while (rc != Z_STREAM_END)
    {
        zs.next_out  = buf.data();
        zs.avail_out = static_cast<uInt>(buf.size());
        rc           = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END)
        {
            LOG_WARN("inflate failed (rc=%d): %s", rc, zs.msg ? zs.msg : "?");
            inflateEnd(&zs);
            out.clear();
            return false;
        }
        out.insert(out.end(), buf.data(), buf.data() + (buf.size() - zs.avail_out));
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0)
        {
            LOG_WARN("inflate: archive truncated after %zu bytes", out.size());
            inflateEnd(&zs);
            out.clear();
            return false;
        }
    }
    const bool trailing = zs.avail_in != 0;
    inflateEnd(&zs);
    if (trailing)
    {
        LOG_WARN("inflate: %u trailing bytes after archive end", zs.avail_in);
        out.clear();
        return false;
    }
    name.clear();
    if (hdr.done == 1 && hdr.name != Z_NULL)
        name.assign(reinterpret_cast<const char *>(name_buf.data()));
    return true;
}

std::optional<Prepared> prepare(const std::vector<std::uint8_t> &raw,
                                const std::string               &filename,
                                bool                             compress,
                                diag::Error                     &err)
{
    Prepared                         p;
    std::vector<std::uint8_t>        packed;
    const std::vector<std::uint8_t> *bytes = &raw;

    if (compress)
    {
        if (!gzip_compress(raw, filename, packed))
        {
            diag::fail(err, diag::Code::PipelineCorruptArchive, "gzip compression failed");
            return std::nullopt;
        }
        bytes                   = &packed;
        p.flags.was_compressed  = true;
        p.flags.name_in_archive = !filename.empty();
        LOG_DEBUG("compressed %zu -> %zu bytes", raw.size(), packed.size());
    }

    if (is_text_safe(bytes->data(), bytes->size()))
    {
        p.blob.assign(bytes->begin(), bytes->end());
    }
    else
    {
        p.blob                   = base64_encode(bytes->data(), bytes->size());
        p.flags.was_text_encoded = true;
        LOG_INFO("binary content: base64 encoding %zu bytes into %zu characters", bytes->size(),
                 p.blob.size());
    }
    return p;
}

std::optional<Recovered> recover(const std::string &blob,
                                 const Flags       &flags,
                                 const std::string &filename,
                                 diag::Error       &err)
{
    Recovered                 r;
    std::vector<std::uint8_t> bytes;

    if (flags.was_text_encoded)
    {
        if (!base64_decode(blob, bytes))
        {
            diag::fail(err, diag::Code::PipelineCorruptEncoding,
                       "invalid base64 symbol in blob of " + std::to_string(blob.size()) +
                           " characters");
            return std::nullopt;
        }
    }
    else
    {
        bytes.assign(blob.begin(), blob.end());
    }

    r.filename = filename;
    if (flags.was_compressed)
    {
        if (!gzip_decompress(bytes, r.bytes, r.archive_name))
        {
            diag::fail(err, diag::Code::PipelineCorruptArchive,
                       "gzip archive of " + std::to_string(bytes.size()) + " bytes is corrupt");
            return std::nullopt;
        }
        if (r.filename.empty())
            r.filename = r.archive_name;
    }
    else
    {
        r.bytes = std::move(bytes);
    }
    return r;
}

}  // namespace codec
