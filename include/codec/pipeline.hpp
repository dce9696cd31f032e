#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "util/diag.hpp"

/*
prepare:
  raw bytes
    -> [gzip(name=filename)]        if compress
    -> [base64]                     if not text-safe
    -> blob text + Flags

recover:
  blob text
    -> [base64 decode]              if flags.was_text_encoded
    -> [gunzip -> archive name]     if flags.was_compressed
    -> raw bytes
*/

namespace codec
{

struct Flags
{
    bool was_compressed{false};
    bool was_text_encoded{false};
    bool name_in_archive{false};  // filename recoverable from the blob alone
};

struct Prepared
{
    std::string blob;
    Flags       flags;
};

struct Recovered
{
    std::vector<std::uint8_t> bytes;
    std::string               filename;      // caller's name, else the archive's
    std::string               archive_name;  // FNAME of the gzip member, may be empty
};

std::optional<Prepared>  prepare(const std::vector<std::uint8_t> &raw,
                                 const std::string               &filename,
                                 bool                             compress,
                                 diag::Error                     &err);
std::optional<Recovered> recover(const std::string &blob,
                                 const Flags       &flags,
                                 const std::string &filename,
                                 diag::Error       &err);

// True when the bytes can travel unencoded inside a frame: valid UTF-8, no NUL,
// no control characters besides TAB/LF/CR/FF/BS, and no index-tag opener.
bool is_text_safe(const std::uint8_t *data, std::size_t n);

// libsodium base64 (original alphabet, padded)
std::string base64_encode(const std::uint8_t *data, std::size_t n);
bool        base64_decode(const std::string &in, std::vector<std::uint8_t> &out);

// zlib gzip member carrying `name` in the FNAME field
bool gzip_compress(const std::vector<std::uint8_t> &in,
                   const std::string               &name,
                   std::vector<std::uint8_t>       &out);
bool gzip_decompress(const std::vector<std::uint8_t> &in,
                     std::vector<std::uint8_t>       &out,
                     std::string                     &name);

}  // namespace codec
