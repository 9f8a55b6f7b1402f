// Entry point for the jam-to-section attribution batch.  It loads the
// configuration, connects to the store and runs every jam page through the
// matching cascade.
//
//   jamsection [config/settings.json] [--resume]

#include "core/BatchCoordinator.hpp"
#include "core/CoordinateProjector.hpp"
#include "infra/MySQLJamStore.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>

#include <cstring>
#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <string>
#include <unistd.h>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

static Settings load_settings(const std::string &path) {
  std::ifstream cfg(path);
  if (!cfg)
    throw ConfigError("cannot open " + path);
  json j;
  try {
    cfg >> j;
  } catch (const json::parse_error &e) {
    throw ConfigError(path + ": " + e.what());
  }
  return Settings::from_json(j);
}

int main(int argc, char **argv) {
  install_bt_handlers();

  std::string config_path = "config/settings.json";
  bool force_resume = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--resume") == 0)
      force_resume = true;
    else
      config_path = argv[i];
  }

  try {
    // ---------------------- Load configuration ----------------------------
    Settings settings = load_settings(config_path);
    if (force_resume)
      settings.batch.resume = true;
    std::cout << "[main] page size " << settings.batch.page_size
              << ", projection " << settings.projection.proj4 << std::endl;

    // ---------------------- Projection & store ----------------------------
    CoordinateProjector projector(settings.projection.proj4);
    const auto &db = settings.database;
    MySQLJamStore store(db.uri, db.user, db.password, db.schema);

    // ---------------------- Run -------------------------------------------
    BatchCoordinator coordinator(store, projector, settings.matching,
                                 settings.batch);
    BatchSummary summary = coordinator.run();
    std::cout << "[main] stored " << summary.pairs_written
              << " jam/section pair(s)" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
