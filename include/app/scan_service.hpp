#pragma once
#include <memory>
#include <optional>
#include <string>

#include "proto/session.hpp"

namespace app
{

// Live decode run fed one control line at a time by qrdrived.
//
//   FRAME <base64 of the scanned text>   ingest one code
//   NOCODE                               scanner saw nothing, ignored
//   STATUS                               progress and missing indices
//   FOREIGN on|off                       accept untagged codes
//   NAME <file>                          operator filename
//   DONE                                 finalize and write the file
//   ABORT                                discard the run
//   QUIT                                 stop serving
class ScanService
{
  public:
    ScanService(std::string out_dir, bool foreign);

    // Returns false once the daemon should stop.
    bool on_line(const std::string &line);

    const frame::Session &session() const { return *session_; }
    bool                  foreign() const { return foreign_; }
    const std::string    &last_written() const { return last_written_; }

  private:
    void on_frame(const std::string &b64);
    void on_status() const;
    void on_done();
    void reset();

    std::string                     out_dir_;
    bool                            foreign_{false};
    std::string                     name_;
    std::unique_ptr<frame::Session> session_;
    std::optional<frame::Output>    pending_;  // finalized but not yet written
    std::string                     last_written_;
};

}  // namespace app
