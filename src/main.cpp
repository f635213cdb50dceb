#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <unistd.h>

#include "command_line_parser.hpp"
#include "connect_engine.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

std::string default_nickname() {
  char hostname[256] = {};
  if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
    return "packmesh";
  }
  return hostname;
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    auto root = std::filesystem::current_path();
    settings->set_settings_path(root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "packmesh");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      init_logging(false);
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    if(settings->get<std::string>("nickname").empty()) {
      std::string error;
      if(!settings->set_from_string("nickname", default_nickname(), error)) {
        print_err(nullptr, "Unable to set default nickname: {}", error);
      }
    }

    ConnectEngine::Options options;
    options.start_cli_thread = isatty(STDIN_FILENO) != 0;
    ConnectEngine engine(settings, options);
    auto logger = engine.logger();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    engine.run();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("packmesh-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
