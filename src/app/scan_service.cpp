#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "app/drive_service.hpp"
#include "app/scan_service.hpp"
#include "codec/pipeline.hpp"
#include "ctl/ipc.hpp"
#include "scan/file_series.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace app
{

ScanService::ScanService(std::string out_dir, bool foreign)
    : out_dir_(std::move(out_dir)), foreign_(foreign), session_(std::make_unique<frame::Session>())
{
}

void ScanService::reset()
{
    session_ = std::make_unique<frame::Session>(name_);
    pending_.reset();
}

bool ScanService::on_line(const std::string &line)
{
    std::string verb, rest;
    ipc::split_command(line, verb, rest);

    if (verb == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return false;
    }
    if (verb == "FRAME")
    {
        on_frame(rest);
        return true;
    }
    if (verb == "NOCODE")
    {
        LOG_DEBUG("no code in view");
        return true;
    }
    if (verb == "STATUS")
    {
        on_status();
        return true;
    }
    if (verb == "FOREIGN")
    {
        auto on = config::parse_bool(rest.c_str());
        if (!on)
        {
            LOG_WARN("[FOREIGN] expects on|off, got '%s'", rest.c_str());
            return true;
        }
        foreign_ = *on;
        LOG_SYSTEM("[FOREIGN] %s", foreign_ ? "on" : "off");
        return true;
    }
    if (verb == "NAME")
    {
        auto clean = frame::sanitize_filename(rest);
        if (!clean)
        {
            LOG_WARN("[NAME] unusable filename '%s'", rest.c_str());
            return true;
        }
        name_ = *clean;
        session_->set_fallback_filename(name_);
        LOG_SYSTEM("[NAME] %s", name_.c_str());
        return true;
    }
    if (verb == "DONE")
    {
        on_done();
        return true;
    }
    if (verb == "ABORT")
    {
        LOG_SYSTEM("[ABORT] discarded %zu frame(s)", session_->received());
        reset();
        return true;
    }
    LOG_WARN("unknown command '%s'", verb.c_str());
    return true;
}

void ScanService::on_frame(const std::string &b64)
{
    if (pending_)
    {
        LOG_SYSTEM("[FRAME] previous file not written yet; send DONE or ABORT");
        return;
    }
    std::vector<std::uint8_t> raw;
    if (b64.empty() || !codec::base64_decode(b64, raw))
    {
        LOG_WARN("[FRAME] payload is not base64");
        return;
    }
    const std::string text(raw.begin(), raw.end());

    diag::Error err;
    auto        res = session_->ingest(text, foreign_, err);
    if (!res)
    {
        LOG_SYSTEM("[REJECT] %s: %s", diag::to_string(err.code), err.detail.c_str());
        return;
    }
    for (const auto &w : res->warnings)
        LOG_SYSTEM("[WARN] %s: %s", diag::to_string(w.code), w.detail.c_str());
    if (res->accepted)
    {
        const auto top = session_->max_index();
        LOG_SYSTEM("[SCAN] code %zu stored (%zu of at least %zu)", res->index,
                   session_->received(), top ? *top + 1 : 0);
    }
}

void ScanService::on_status() const
{
    const auto top  = session_->max_index();
    const auto gaps = session_->missing();
    LOG_SYSTEM("[STATUS] received=%zu highest=%s missing=%s name=%s foreign=%s",
               session_->received(), top ? std::to_string(*top).c_str() : "-",
               gaps.empty() ? "none" : diag::format_indices(gaps).c_str(),
               session_->header_filename() ? session_->header_filename()->c_str()
                                           : (name_.empty() ? "-" : name_.c_str()),
               foreign_ ? "on" : "off");
}

void ScanService::on_done()
{
    if (!pending_)
    {
        diag::Error err;
        auto        out = session_->finalize(err);
        if (!out)
        {
            if (err.code == diag::Code::IncompleteSequence)
                LOG_SYSTEM("[MISSING] rescan %s", diag::format_indices(err.missing).c_str());
            else
                LOG_SYSTEM("[DONE] %s: %s", diag::to_string(err.code), err.detail.c_str());
            return;
        }
        pending_ = std::move(*out);
    }

    const std::string name =
        pending_->filename_embedded ? apply_name_override(pending_->filename, name_) : pending_->filename;
    const std::string path = out_dir_.empty() ? name : out_dir_ + "/" + name;
    if (!scan::write_file(path, pending_->bytes))
    {
        LOG_SYSTEM("[DONE] could not write %s; fix and send DONE again", path.c_str());
        return;
    }
    LOG_SYSTEM("[DONE] wrote %s (%zu bytes)", path.c_str(), pending_->bytes.size());
    last_written_ = path;
    name_.clear();
    reset();
}

}  // namespace app
