#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace ipc
{

// Longest accepted command line; a FRAME line carries base64 of one code's text.
inline constexpr std::size_t MAX_LINE = 64 * 1024;

// Returns false to stop serving.
using LineHandler = std::function<bool(const std::string &)>;

// Serve one command line per connection until the handler returns false. Without a
// handler the server stops on "QUIT".
bool        start_server(const std::string &sock_path, const LineHandler &on_line);
bool        send_line(const std::string &sock_path, const std::string &line);
std::string expand_user(const std::string &path);

// Split "VERB rest" at the first space; rest is trimmed of surrounding blanks.
void split_command(const std::string &line, std::string &verb, std::string &rest);

}  // namespace ipc
