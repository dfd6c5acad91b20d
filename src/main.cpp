#include <cpptrace/cpptrace.hpp>

#include <string>
#include <vector>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "lantern_node.hpp"
#include "lantern_shell.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();

    std::vector<std::string> load_errors;
    auto settings_path = SettingsManager::default_settings_path();
    if(!settings->load_from_file(settings_path, load_errors)) {
      for(const auto& error : load_errors) print_err(nullptr, "{}", error);
      return 1;
    }
    for(const auto& error : load_errors) print_err(nullptr, "{}", error);

    CommandLineParser parser("lantern");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      print_err(nullptr, "{}", error);
      parser.usage(*settings);
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    LogOptions log_options;
    log_options.verbose = settings->get<bool>("verbose");
    log_options.log_file = settings->get<std::string>("log_file");
    init_logging(log_options);

    LanternNode node(settings);
    try {
      node.start();
    } catch(const LanternError& e) {
      node.logger()->error("cannot start: {} ({})", e.what(), describe(e.code()));
      return 1;
    }

    LanternShell shell(node);
    shell.run();
    node.stop();
    return 0;
  } catch(const std::exception& e) {
    init_logging();
    Logger logger("lantern-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
