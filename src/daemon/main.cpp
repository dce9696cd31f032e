#include <cstdlib>
#include <string>

#include "app/scan_service.hpp"
#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

int main()
{
    // log level from env var
    qrdrive::init_log_from_env();

    const config::Config cfg = config::config_from_env();
    LOG_SYSTEM("Config: dir=%s foreign=%s sock=%s", cfg.dir.c_str(), cfg.foreign ? "on" : "off",
               cfg.ctl_sock.c_str());

    app::ScanService scan(cfg.dir, cfg.foreign);

    // IPC server
    if (!ipc::start_server(cfg.ctl_sock,
                           [&scan](const std::string &line) { return scan.on_line(line); }))
    {
        LOG_ERROR("start_server failed");
        return exitc::failure;
    }
    return exitc::ok;
}
