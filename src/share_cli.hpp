#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "registry.hpp"
#include "settings_manager.hpp"
#include "share_node.hpp"
#include "sync_engine.hpp"
#include "transfer_client.hpp"
#include "utils.hpp"

// Line oriented console over a running ShareNode. Commands can also be fed
// directly through execute_command().
class ShareCLI {
public:
  // Reads commands from `in` when given, otherwise from stdin.
  ShareCLI(ShareNode& node, std::ostream& out = std::cout, std::istream* in = nullptr)
    : node_(node), out_(out), in_(in) {
    update_listener_ = node_.engine().add_update_listener([this](){ on_share_list_changed(); });
  }

  ~ShareCLI() {
    node_.engine().remove_update_listener(update_listener_);
    stop();
  }

  void start() {
    if(cli_thread_.joinable()) return;
    loop_ = std::make_shared<LoopState>();
    loop_->cli = this;
    loop_->in = in_;
    cli_thread_ = std::thread([loop = loop_](){
      run_loop(*loop);
      loop->finished = true;
    });
  }

  // Waits for a command in progress. A loop still blocked on input is
  // detached and exits without touching this console once the read returns.
  void stop() {
    if(!cli_thread_.joinable()) return;
    {
      std::lock_guard<std::recursive_mutex> lock(loop_->gate);
      loop_->cli = nullptr;
    }
    if(std::this_thread::get_id() == cli_thread_.get_id() || !loop_->finished) {
      cli_thread_.detach();
    } else {
      cli_thread_.join();
    }
  }

  // Runs one console command. Returns false for `quit`.
  bool execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return true;

    std::string args;
    std::getline(iss, args);
    trim(args);

    if(cmd == "share") {
      share_command(args);
    } else if(cmd == "unshare") {
      unshare_command(args);
    } else if(cmd == "exclude") {
      exclude_command(args);
    } else if(cmd == "dir") {
      dir_command(args);
    } else if(cmd == "list" || cmd == "ls" || cmd == "l") {
      list_command();
    } else if(cmd == "search" || cmd == "find") {
      search_command(args);
    } else if(cmd == "get") {
      get_command(args);
    } else if(cmd == "sync") {
      sync_command();
    } else if(cmd == "stats") {
      stats_command();
    } else if(cmd == "settings" || cmd == "s") {
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit") {
      write_line("Quitting...");
      node_.request_stop();
      return false;
    } else {
      print_help();
      write_line("Unknown command: " + cmd);
    }
    return true;
  }

private:
  // Shared with the input thread, which can outlive the console.
  struct LoopState {
    std::recursive_mutex gate;
    ShareCLI* cli = nullptr;  // cleared by stop()
    std::istream* in = nullptr;
    std::atomic<bool> finished{false};
  };

  static void run_loop(LoopState& loop) {
    for(;;) {
      {
        std::lock_guard<std::recursive_mutex> lock(loop.gate);
        if(!loop.cli) return;
#ifdef HAVE_READLINE
        if(loop.in) loop.cli->write_block("> ");
#else
        loop.cli->write_block("> ");
#endif
      }
      auto input = read_command_line(loop.in, "> ");
      std::lock_guard<std::recursive_mutex> lock(loop.gate);
      if(!loop.cli) return;
      if(!input) {
        // EOF ends the session like `quit`.
        loop.cli->node_.request_stop();
        return;
      }
      if(!loop.cli->execute_command(*input)) return;
    }
  }

  static std::optional<std::string> read_command_line(std::istream* in, const char* prompt) {
    std::string line;
    if(in) {
      if(!std::getline(*in, line)) return std::nullopt;
      return line;
    }
#ifdef HAVE_READLINE
    char* raw = readline(prompt);
    if(!raw) return std::nullopt;
    line = raw;
    if(!line.empty()) add_history(line.c_str());
    std::free(raw);
    return line;
#else
    (void)prompt;
    if(!std::getline(std::cin, line)) return std::nullopt;
    return line;
#endif
  }

  void share_command(const std::string& args) {
    if(args.empty()) {
      write_line("Usage: share <path>");
      return;
    }
    std::string error;
    auto result = node_.engine().add_file(args, error);
    switch(result) {
      case SyncEngine::AddResult::Added:
        write_line("Shared " + normalize_path(args).string());
        break;
      case SyncEngine::AddResult::NameConflict:
        write_line("Not shared: " + error);
        break;
      case SyncEngine::AddResult::Failed:
        write_line("Share failed: " + error);
        break;
    }
  }

  void unshare_command(const std::string& args) {
    if(args.empty()) {
      write_line("Usage: unshare <path>");
      return;
    }
    node_.engine().remove_file(args);
    write_line("Stopped sharing " + normalize_path(args).string());
  }

  void exclude_command(const std::string& args) {
    if(args.empty()) {
      write_line("Usage: exclude <path>");
      return;
    }
    node_.engine().exclude_file(args);
    write_line("Excluded " + normalize_path(args).string());
  }

  void dir_command(const std::string& args) {
    auto& engine = node_.engine();
    if(args.empty()) {
      auto dir = engine.watched_directory();
      write_line("Watched directory: " + (dir ? dir->string() : std::string("(none)")));
      return;
    }
    if(args == "none" || args == "-") {
      engine.set_watched_directory(std::nullopt);
      write_line("No directory is watched");
      return;
    }
    std::error_code ec;
    if(!std::filesystem::is_directory(args, ec)) {
      write_line("Not a directory: " + args);
      return;
    }
    engine.set_watched_directory(std::filesystem::path(args));
    write_line("Watching " + normalize_path(args).string());
  }

  void list_command() {
    auto entries = node_.engine().registrations().list();
    if(entries.empty()) {
      write_line("Nothing is registered.");
      return;
    }
    std::ostringstream oss;
    for(const auto& entry : entries) {
      oss << "  " << entry.id << "  " << entry.file_name() << "  " << entry.path.string() << "\n";
    }
    write_block(oss.str());
  }

  void search_command(const std::string& args) {
    try {
      auto results = node_.search(args);
      if(results.empty()) {
        write_line("No matches.");
        return;
      }
      std::ostringstream oss;
      for(const auto& item : results) {
        oss << "  " << item.id << "  " << item.file_name << "\n";
      }
      write_block(oss.str());
    } catch(const RegistryError& e) {
      write_line(std::string("Search failed: ") + e.what());
    }
  }

  void get_command(const std::string& args) {
    ListingId id = 0;
    try {
      std::size_t consumed = 0;
      id = std::stoll(args, &consumed);
      if(consumed != args.size()) throw std::invalid_argument(args);
    } catch(const std::exception&) {
      write_line("Usage: get <listing-id>");
      return;
    }
    auto result = node_.download(id);
    if(result.ok()) {
      write_line("Saved " + result.local_path.string() + " (" + std::to_string(result.received_bytes) +
                 " bytes, sha256 " + result.sha256 + ")");
    } else {
      write_line(std::string("Download ") + to_string(result.status) + ": " + result.error);
    }
  }

  void sync_command() {
    if(node_.engine().reconcile()) {
      write_line("Sync complete: " + std::to_string(node_.engine().registrations().size()) + " files registered");
    } else {
      write_line("A sync is already running; it will pick up pending changes.");
    }
  }

  void stats_command() {
    auto s = node_.stats();
    std::ostringstream oss;
    oss << "peer " << node_.peer_id() << " at " << node_.advertise_address() << ":" << node_.share_port() << "\n"
        << "  registered listings: " << s.registered_listings << "\n"
        << "  active transfers:    " << s.active_transfers << "\n"
        << "  sync passes:         " << s.completed_passes << "\n"
        << "  serving:             " << (s.serving ? "yes" : "no") << "\n";
    write_block(oss.str());
  }

  void handle_settings_command(const std::string& args) {
    auto settings = node_.settings();
    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      list_settings();
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      if(key.empty()) {
        write_line("Usage: settings get <key>");
        return;
      }
      auto resolved = settings->resolve_key(key);
      if(!resolved) {
        write_line("Unknown setting '" + key + "'.");
        return;
      }
      write_line(*resolved + " = " + settings->value_as_string(*resolved));
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      trim(value);
      if(key.empty() || value.empty()) {
        write_line("Usage: settings set <key> <value>");
        return;
      }
      auto resolved = settings->resolve_key(key);
      if(!resolved) {
        write_line("Unknown setting '" + key + "'.");
        return;
      }
      std::string error;
      if(settings->set_from_string(*resolved, value, error)) {
        write_line(*resolved + " = " + settings->value_as_string(*resolved));
      } else {
        write_line("Failed to set " + *resolved + ": " + error);
      }
      return;
    }

    if(action == "save") {
      if(settings->save()) {
        write_line("Saved settings to " + settings->settings_path().string());
      } else {
        write_line("Failed to save settings.");
      }
      return;
    }

    write_line("Unknown settings command.");
  }

  void list_settings() {
    auto settings = node_.settings();
    auto keys = settings->keys();
    std::sort(keys.begin(), keys.end());
    std::ostringstream oss;
    for(const auto& key : keys) {
      oss << key << " = " << settings->value_as_string(key) << "\n";
    }
    write_block(oss.str());
  }

  void on_share_list_changed() {
    bool notify = false;
    try {
      notify = node_.settings()->get<bool>("notify_changes");
    } catch(const std::exception&) {
      return;
    }
    if(!notify) return;
    write_line("[share list updated: " + std::to_string(node_.engine().registrations().size()) + " files]");
  }

  void print_help() {
    write_block(
      "Available commands:\n"
      "  help|h|?                          Show this help message\n"
      "  quit                              Disconnect and exit\n"
      "  share <path>                      Share a file\n"
      "  unshare <path>                    Stop sharing a file\n"
      "  exclude <path>                    Never share a file, even from the watched directory\n"
      "  dir [<path>|none]                 Show or change the watched directory\n"
      "  list|ls|l                         List this node's registered files\n"
      "  search <query>                    Search the registry\n"
      "  get <listing-id>                  Download a listing into download_dir\n"
      "  sync                              Run a sync pass now\n"
      "  stats                             Show node statistics\n"
      "  settings [list|get|set|save]      Manage runtime settings\n");
  }

  void write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << line << "\n";
    out_.flush();
  }

  void write_block(const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << text;
    out_.flush();
  }

  static void trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), s.end());
  }

  ShareNode& node_;
  std::ostream& out_;
  std::istream* in_;
  std::mutex out_mutex_;
  std::shared_ptr<LoopState> loop_;
  std::thread cli_thread_;
  SyncEngine::UpdateListenerHandle update_listener_ = 0;
};
