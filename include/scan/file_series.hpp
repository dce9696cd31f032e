#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scan
{

// <dir>/<basename>.<index>.<ext>; dir may be empty for the working directory
std::string series_path(const std::string &dir, const std::string &basename, std::size_t index,
                        const std::string &ext);

// Texts of every <basename>.<digits>.<ext> in dir, ordered by index. Gaps are kept as gaps:
// a missing file surfaces when the session is finalized.
// Each file holds the decoded text of one code.
std::vector<std::string> read_series(const std::string &dir, const std::string &basename,
                                     const std::string &ext);

bool read_file(const std::string &path, std::vector<std::uint8_t> &out);
bool read_text(const std::string &path, std::string &out);

// Write through a temporary sibling and rename, so a failure leaves no partial file.
bool write_file(const std::string &path, const std::vector<std::uint8_t> &bytes);

}  // namespace scan
