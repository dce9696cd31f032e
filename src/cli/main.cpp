#include <cctype>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "codec/pipeline.hpp"
#include "ctl/ipc.hpp"
#include "scan/file_series.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  qrdrivectl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  frame <text...>       push one scanned code\n"
                         "  frame-file <path>     push a file's contents as one scanned code\n"
                         "  nocode\n"
                         "  status\n"
                         "  foreign on|off\n"
                         "  name <file>\n"
                         "  done\n"
                         "  abort\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    if (line.size() >= ipc::MAX_LINE)
    {
        std::fprintf(stderr, "error: command longer than %zu bytes\n", ipc::MAX_LINE);
        return exitc::bad_args;
    }
    std::string out = line;
    out.push_back('\n');
    if (!ipc::send_line(sock, out))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return exitc::ok;
}

// Scanned text may hold newlines; it travels base64-encoded on the control line.
static std::string frame_line(const std::string &text)
{
    return "FRAME " + codec::base64_encode(reinterpret_cast<const std::uint8_t *>(text.data()),
                                           text.size());
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"frame",
         [&]() -> int {
             if (args.size() < 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string text;
             for (size_t i = 1; i < args.size(); ++i)
             {
                 if (i > 1)
                     text.push_back(' ');
                 text += args[i];
             }
             return send_line(frame_line(text));
         }},
        {"frame-file",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string text;
             if (!scan::read_text(args[1], text))
             {
                 std::fprintf(stderr, "error: cannot read %s\n", args[1].c_str());
                 return exitc::io_error;
             }
             if (text.empty())
             {
                 std::fprintf(stderr, "error: %s is empty\n", args[1].c_str());
                 return exitc::bad_args;
             }
             return send_line(frame_line(text));
         }},
        {"nocode", [&]() -> int { return send_line("NOCODE"); }},
        {"status", [&]() -> int { return send_line("STATUS"); }},
        {"foreign",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string v = to_lower(args[1]);
             if (v != "on" && v != "off")
             {
                 std::fprintf(stderr, "error: foreign expects 'on' or 'off'\n");
                 return exitc::bad_args;
             }
             return send_line("FOREIGN " + v);
         }},
        {"name",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line("NAME " + args[1]);
         }},
        {"done", [&]() -> int { return send_line("DONE"); }},
        {"abort", [&]() -> int { return send_line("ABORT"); }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    qrdrive::init_log_from_env();
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // QRDRIVE_CTL_SOCK is honoured by ctl_sock_path(); --sock overrides it
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string &cmd = args[0];
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    return run_cmd(cmd, args, sender);
}
