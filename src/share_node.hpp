#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "registry.hpp"
#include "transfer_client.hpp"

class SettingsManager;
class ShareCLI;
class SyncEngine;
class TransferServer;

class ShareNode {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    // Used instead of a RegistryClient built from the settings when set.
    std::shared_ptr<Registry> registry;
    bool start_cli_thread = false;
    bool handle_signals = true;
    // Console output; std::cout when null.
    std::ostream* console = nullptr;
    // Command input for the console thread; stdin when null.
    std::istream* console_input = nullptr;
  };

  struct Stats {
    std::size_t registered_listings = 0;
    std::size_t active_transfers = 0;
    std::size_t completed_passes = 0;
    bool serving = false;
  };

  ShareNode(std::shared_ptr<SettingsManager> settings, Options options);
  ~ShareNode();

  // Binds the transfer server and starts periodic synchronization. A bind
  // failure is logged and the node keeps running without serving files.
  void start();
  // Blocks until request_stop(), `quit` or SIGINT/SIGTERM.
  void run();
  void request_stop();
  // Stops synchronization, disconnects from the registry (best effort),
  // then shuts the server down. Returns the final watched directory.
  std::optional<std::filesystem::path> stop();

  TransferResult download(ListingId listing_id);
  // Throws RegistryError when the registry cannot answer.
  std::vector<ListingSummary> search(const std::string& query);

  void execute_command(const std::string& line);

  Stats stats() const;

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  SyncEngine& engine();
  const std::string& peer_id() const { return peer_id_; }
  const std::string& advertise_address() const { return advertise_address_; }
  uint16_t share_port() const { return share_port_; }
  std::filesystem::path download_directory() const;
  std::chrono::seconds sync_period() const { return sync_period_; }


private:
  std::shared_ptr<Registry> make_registry() const;
  std::chrono::seconds derive_sync_period();
  void ensure_workspace() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::unique_ptr<asio::signal_set> signals_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;

  std::shared_ptr<Registry> registry_;
  std::unique_ptr<SyncEngine> engine_;
  std::unique_ptr<TransferServer> server_;
  std::unique_ptr<ShareCLI> cli_;
  TransferClient client_;

  std::atomic<bool> started_{false};
  std::string peer_id_;
  std::string advertise_address_;
  uint16_t share_port_ = 0;
  std::chrono::seconds sync_period_{0};
};

// Address of the interface used for outbound traffic; 127.0.0.1 when there is
// no route.
std::string detect_outbound_address();
std::string default_peer_id();
