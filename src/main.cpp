// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "app/application.hpp"
#include "app/config.hpp"
#include "util/logging.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  using namespace lanpeer;

  app::AppConfig config;
  std::string error;
  switch (app::ParseCommandLine(argc, argv, config, error)) {
  case app::ParseResult::HELP:
    std::cout << app::UsageString(argv[0]);
    return 0;
  case app::ParseResult::ERROR:
    std::cerr << "Error: " << error << "\n\n" << app::UsageString(argv[0]);
    return 1;
  case app::ParseResult::OK:
    break;
  }

  util::LogManager::Initialize(config.loglevel, !config.debuglogfile.empty(),
                               config.debuglogfile.empty() ? "debug.log" : config.debuglogfile);

  int rc = 0;
  try {
    app::Application application(config);
    if (!application.initialize()) {
      LOG_ERROR("Initialization failed");
      rc = 1;
    } else if (!application.start()) {
      LOG_ERROR("Startup failed");
      application.stop();
      rc = 1;
    } else {
      application.wait_for_shutdown();
    }
  } catch (const std::exception& e) {
    LOG_ERROR("Fatal error: {}", e.what());
    rc = 1;
  }

  util::LogManager::Shutdown();
  return rc;
}
