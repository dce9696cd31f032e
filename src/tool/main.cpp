#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "app/drive_service.hpp"
#include "plan/presets.hpp"
#include "render/text_dump_renderer.hpp"
#include "scan/file_series.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  qrdrive save <file> [options]\n"
                 "      --type png|letter|index_card|playing_card\n"
                 "      --bytesize <n>    bytes per code (clamped to the safe maximum)\n"
                 "      --force           keep --bytesize above the safe maximum\n"
                 "      --ecc L|M|H\n"
                 "      --px <n>          pixels per module\n"
                 "      --border <n>      quiet zone in modules\n"
                 "      --compress\n"
                 "      --name <name>     stored name, original extension kept\n"
                 "      --text-side right|below [--text-share <0..1>]\n"
                 "      --fill <color> --back <color>\n"
                 "      --dir <dir>       output directory\n"
                 "  qrdrive load <basename> [options]\n"
                 "      --ext <ext>       scanned text extension (default txt)\n"
                 "      --in <dir>        where the scans are (default .)\n"
                 "      --dir <dir>       output directory\n"
                 "      --name <name>     output name, embedded extension kept\n"
                 "      --foreign         accept codes without index tags\n"
                 "  qrdrive plan [--type ..] [--bytesize ..] [--force] [--ecc ..] [--px ..] "
                 "[--border ..]\n");
}

struct Args
{
    config::Config             cfg;
    std::string                target;
    bool                       force{false};
    std::string                name;
    std::string                ext{"txt"};
    std::string                in_dir{"."};
    plan::TextSide             text_side{plan::TextSide::None};
    double                     text_share{0.3};
    render::StyleOptions       style;
};

// Returns exitc::ok or exitc::bad_args.
static int parse_args(int argc, char **argv, int first, Args &a)
{
    for (int i = first; i < argc; ++i)
    {
        const std::string opt  = argv[i];
        const bool        more = i + 1 < argc;
        if (opt == "--force")
            a.force = true;
        else if (opt == "--compress")
            a.cfg.compress = true;
        else if (opt == "--foreign")
            a.cfg.foreign = true;
        else if (opt == "--type" && more)
        {
            auto t = plan::parse_output_type(argv[++i]);
            if (!t)
            {
                std::fprintf(stderr, "error: unknown output type %s\n", argv[i]);
                return exitc::bad_args;
            }
            a.cfg.output_type = *t;
        }
        else if (opt == "--bytesize" && more)
        {
            // no upper bound here: the planner clamps and reports
            auto v = config::parse_ulong(argv[++i], 1, 1000000);
            if (!v)
            {
                std::fprintf(stderr, "error: invalid --bytesize %s\n", argv[i]);
                return exitc::bad_args;
            }
            a.cfg.bytesize = static_cast<std::size_t>(*v);
        }
        else if (opt == "--ecc" && more)
        {
            auto e = plan::parse_ecc(argv[++i]);
            if (!e)
            {
                std::fprintf(stderr, "error: --ecc expects L, M or H\n");
                return exitc::bad_args;
            }
            a.cfg.ecc = *e;
        }
        else if ((opt == "--px" || opt == "--border") && more)
        {
            auto v = config::parse_ulong(argv[++i], opt == "--px" ? 1 : 0, 100);
            if (!v)
            {
                std::fprintf(stderr, "error: invalid %s %s\n", opt.c_str(), argv[i]);
                return exitc::bad_args;
            }
            (opt == "--px" ? a.cfg.pixel_density : a.cfg.border) = static_cast<unsigned>(*v);
        }
        else if (opt == "--text-side" && more)
        {
            const std::string s = argv[++i];
            if (s == "right")
                a.text_side = plan::TextSide::Right;
            else if (s == "below")
                a.text_side = plan::TextSide::Below;
            else
            {
                std::fprintf(stderr, "error: --text-side expects right or below\n");
                return exitc::bad_args;
            }
        }
        else if (opt == "--text-share" && more)
        {
            char  *end = nullptr;
            double v   = std::strtod(argv[++i], &end);
            if (!end || *end != '\0' || !(v > 0.0 && v < 1.0))
            {
                std::fprintf(stderr, "error: --text-share expects a value between 0 and 1\n");
                return exitc::bad_args;
            }
            a.text_share = v;
        }
        else if (opt == "--name" && more)
            a.name = argv[++i];
        else if (opt == "--ext" && more)
            a.ext = argv[++i];
        else if (opt == "--in" && more)
            a.in_dir = argv[++i];
        else if (opt == "--dir" && more)
            a.cfg.dir = argv[++i];
        else if (opt == "--fill" && more)
            a.style.fill_color = argv[++i];
        else if (opt == "--back" && more)
            a.style.back_color = argv[++i];
        else if (opt.rfind("--", 0) != 0 && a.target.empty())
            a.target = opt;
        else
        {
            std::fprintf(stderr, "error: unexpected argument %s\n", opt.c_str());
            return exitc::bad_args;
        }
    }
    return exitc::ok;
}

static plan::LayoutPlan layout_of(const Args &a)
{
    return plan::make_layout(a.cfg.output_type, a.cfg.pixel_density, a.cfg.border, a.cfg.ecc,
                             a.text_side, a.text_side == plan::TextSide::None ? 0.0 : a.text_share);
}

static void print_error(const diag::Error &err)
{
    std::fprintf(stderr, "error: %s: %s\n", diag::to_string(err.code), err.detail.c_str());
}

static int cmd_save(const Args &a)
{
    std::vector<std::uint8_t> raw;
    if (!scan::read_file(a.target, raw))
    {
        std::fprintf(stderr, "error: cannot read %s\n", a.target.c_str());
        return exitc::io_error;
    }

    app::SaveOptions opts;
    opts.layout        = layout_of(a);
    opts.bytesize      = a.cfg.bytesize;
    opts.force         = a.force;
    opts.compress      = a.cfg.compress;
    opts.name_override = a.name;
    opts.style         = a.style;
    opts.workers       = a.cfg.workers;

    render::TextDumpRenderer renderer(a.cfg.dir);
    app::DriveService        drive(renderer);
    diag::Error              err;
    auto                     rep = drive.save(raw, a.target, opts, err);
    if (!rep)
    {
        print_error(err);
        return err.code == diag::Code::RenderFailed ? exitc::io_error : exitc::failure;
    }
    for (const auto &w : rep->warnings)
        std::fprintf(stderr, "warning: %s: %s\n", diag::to_string(w.code), w.detail.c_str());
    std::printf("%s: %zu code(s) of %zu bytes (version %u%s%s) in %s\n", rep->filename.c_str(),
                rep->codes, rep->chunk_bytes, rep->version,
                rep->flags.was_compressed ? ", compressed" : "",
                rep->flags.was_text_encoded ? ", base64" : "", a.cfg.dir.c_str());
    return exitc::ok;
}

static int cmd_load(const Args &a)
{
    auto frames = scan::read_series(a.in_dir, a.target, a.ext);
    if (frames.empty())
    {
        std::fprintf(stderr, "error: no %s.<index>.%s in %s\n", a.target.c_str(), a.ext.c_str(),
                     a.in_dir.c_str());
        return exitc::io_error;
    }

    app::LoadOptions opts;
    opts.foreign       = a.cfg.foreign;
    opts.name_override = a.name;

    diag::Error err;
    auto        rep = app::load_frames(frames, opts, err);
    if (!rep)
    {
        print_error(err);
        if (err.code == diag::Code::IncompleteSequence)
        {
            std::fprintf(stderr, "missing: %s\n", diag::format_indices(err.missing).c_str());
            return exitc::incomplete;
        }
        return exitc::failure;
    }
    for (const auto &w : rep->warnings)
        std::fprintf(stderr, "warning: %s: %s\n", diag::to_string(w.code), w.detail.c_str());

    const std::string path = a.cfg.dir + "/" + rep->out_name;
    if (!scan::write_file(path, rep->output.bytes))
    {
        std::fprintf(stderr, "error: cannot write %s\n", path.c_str());
        return exitc::io_error;
    }
    std::printf("%s: %zu bytes from %zu code(s)\n", path.c_str(), rep->output.bytes.size(),
                rep->frames);
    return exitc::ok;
}

static int cmd_plan(const Args &a)
{
    diag::Error err;
    auto        res = plan::plan(layout_of(a), a.cfg.bytesize, a.force, err);
    if (!res)
    {
        print_error(err);
        return exitc::failure;
    }
    for (const auto &w : res->warnings)
        std::fprintf(stderr, "warning: %s: %s\n", diag::to_string(w.code), w.detail.c_str());
    std::printf("type=%s ecc=%s chunk_bytes=%zu ceiling=%zu version=%u usable_edge=%.3fin\n",
                plan::output_type_name(a.cfg.output_type), plan::ecc_name(a.cfg.ecc),
                res->chunk_bytes, res->ceiling, res->version, res->geom.usable_edge);
    return exitc::ok;
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
    const std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
    {
        print_usage();
        return exitc::ok;
    }

    Args a;
    a.cfg = config::config_from_env();
    if (int rc = parse_args(argc, argv, 2, a); rc != exitc::ok)
    {
        print_usage();
        return rc;
    }

    if (cmd == "plan")
        return cmd_plan(a);
    if (a.target.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (cmd == "save")
        return cmd_save(a);
    if (cmd == "load")
        return cmd_load(a);

    std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
    print_usage();
    return exitc::bad_args;
}
