#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "share_node.hpp"

int main(int argc, char** argv){
  try {
    ShareNode::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.start_cli_thread = true;

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "sharenode");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      process_logger().print_err("{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    ShareNode node(settings, options);
    auto logger = node.logger();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    node.start();
    logger->print("Peer {} sharing on {}:{} (type 'help' for commands)",
                  node.peer_id(), node.advertise_address(), node.share_port());
    node.run();
    auto watched = node.stop();

    // Remember the watched directory for the next session.
    std::string error;
    if(!settings->set_from_string("share_dir", watched ? watched->string() : std::string(), error)) {
      logger->warn("Unable to record share_dir: {}", error);
    } else if(!settings->save()) {
      logger->error("Unable to persist settings to {}", settings->settings_path().string());
    }
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("sharenode-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
