// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"
#include "app/config.hpp"
#include "app/version.hpp"
#include "util/logging.hpp"

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
  using namespace sniffer;

  try {
    app::AppConfig config;
    auto parsed = app::ParseCommandLine(argc, argv, config);
    switch (parsed.status) {
    case app::ParseStatus::Help:
      app::PrintUsage(argv[0]);
      return 0;
    case app::ParseStatus::Version:
      std::cout << GetFullVersionString() << std::endl;
      std::cout << GetCopyrightString() << std::endl;
      return 0;
    case app::ParseStatus::Error:
      std::cerr << "Error: " << parsed.error << "\n";
      std::cerr << "Run with --help for usage.\n";
      return 1;
    case app::ParseStatus::Ok:
      break;
    }

    util::LogManager::Initialize(config.log_level, config.log_file.has_value(),
                                 config.log_file ? config.log_file->string() : "session_sniffer.log");

    int exit_code = 1;
    {
      app::Application application(std::move(config));
      if (!application.initialize()) {
        LOG_APP_ERROR("Failed to initialize session sniffer");
        util::LogManager::Shutdown();
        return 1;
      }
      if (!application.start()) {
        LOG_APP_ERROR("Failed to start session sniffer");
        util::LogManager::Shutdown();
        return 1;
      }
      exit_code = application.wait_for_shutdown();
    }

    util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    util::LogManager::Shutdown();
    return 1;
  }
}
