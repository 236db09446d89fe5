#include <chrono>
#include <string>
#include <thread>

#include "platform_log.h"
#include "server_app.h"

namespace {

namespace pl = sendkey::platform::log;

constexpr char kLogTag[] = "main";

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = (argc > 1) ? argv[1] : "config.ini";

  std::string error;
  sendkey::server::ServerApp app;
  if (!app.Init(config_path, error)) {
    pl::Log(pl::Level::kError, kLogTag, error);
    return 1;
  }

  const auto& cfg = app.config();
  pl::Log(pl::Level::kInfo, kLogTag, "server initialized",
          {{"mode", cfg.mode == sendkey::server::StoreMode::kMemory
                        ? "memory"
                        : "mysql"},
           {"sweep_interval_sec",
            std::to_string(cfg.entries.sweep_interval_sec)}});
  while (true) {
    std::string tick_error;
    if (!app.RunOnce(tick_error) && !tick_error.empty()) {
      pl::Log(pl::Level::kError, kLogTag, tick_error);
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  return 0;
}
