#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "registration_table.hpp"
#include "registry.hpp"

// Keeps the registry's listings for this node converged with what the user
// wants shared: the watched directory, files shared by hand, minus exclusions.
//
// Mutators may be called from any thread while a background pass runs. Passes
// are single-flight: a caller that finds one running returns at once and
// relies on the change-pending flag to make the running pass go around again.
class SyncEngine {
public:
  enum class AddResult { Added, NameConflict, Failed };

  struct Options {
    std::string owner_id;
    std::string owner_address;
    uint16_t owner_port = 0;
    std::optional<std::filesystem::path> watched_directory;
    std::size_t max_heartbeat_retries = 3;
  };

  using UpdateListener = std::function<void()>;
  using UpdateListenerHandle = std::size_t;

  SyncEngine(std::shared_ptr<Registry> registry,
             Options options,
             std::shared_ptr<Logger> logger = nullptr);
  ~SyncEngine();

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // First pass runs immediately, then every `period`.
  void start_monitoring(std::chrono::seconds period);
  // Cancels the schedule and waits for queued passes to drain.
  void stop();

  // nullopt stops directory based sharing. Never touches the registry itself.
  void set_watched_directory(std::optional<std::filesystem::path> directory);
  std::optional<std::filesystem::path> watched_directory() const;
  bool is_from_watched_directory(const std::filesystem::path& path) const;

  AddResult add_file(const std::filesystem::path& path, std::string& error);
  void remove_file(const std::filesystem::path& path);
  void exclude_file(const std::filesystem::path& path);

  // One reconcile invocation. Returns false when another pass held the guard.
  bool reconcile();
  // Queues a reconcile on the engine's executor.
  void trigger_reconcile();

  const RegistrationTable& registrations() const { return registrations_; }
  std::optional<std::filesystem::path> path_for_file_name(const std::string& file_name) const;
  std::vector<std::filesystem::path> shared_files() const;
  std::set<std::filesystem::path> user_shared_files() const;
  std::set<std::filesystem::path> excluded_files() const;
  std::size_t completed_passes() const { return completed_passes_.load(); }

  UpdateListenerHandle add_update_listener(UpdateListener listener);
  void remove_update_listener(UpdateListenerHandle handle);

  // The port is only known once the transfer server has bound.
  void set_owner_port(uint16_t port) { owner_port_ = port; }
  uint16_t owner_port() const { return owner_port_.load(); }

  const Options& options() const { return options_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  // Returns true when the heartbeat asks for an immediate full re-registration.
  bool run_pass(std::size_t& retries);
  std::set<std::filesystem::path> compute_desired_set();
  // Both return how many paths they could not register / did de-list.
  std::size_t register_arrivals(const std::set<std::filesystem::path>& desired);
  std::size_t unregister_departures(const std::set<std::filesystem::path>& desired);
  bool still_wanted(const std::filesystem::path& path) const;
  void prune_departing();
  void schedule_next(std::chrono::seconds period, std::chrono::seconds delay);
  void notify_listeners();

  Options options_;
  std::shared_ptr<Registry> registry_;
  std::shared_ptr<Logger> logger_;

  RegistrationTable registrations_;

  mutable std::mutex state_mutex_;
  std::optional<std::filesystem::path> watched_dir_;
  std::set<std::filesystem::path> user_shared_;
  std::set<std::filesystem::path> excluded_;
  std::set<std::filesystem::path> departing_; // left management with the old watched directory

  std::mutex sync_mutex_;                     // single-flight guard
  std::atomic<bool> change_pending_{false};
  std::atomic<std::size_t> completed_passes_{0};
  std::atomic<bool> stopped_{false};
  std::atomic<uint16_t> owner_port_{0};

  std::mutex listener_mutex_;
  std::unordered_map<UpdateListenerHandle, UpdateListener> listeners_;
  std::atomic<UpdateListenerHandle> next_listener_id_{1};

  asio::thread_pool pool_{2};
  std::mutex timer_mutex_;
  std::unique_ptr<asio::steady_timer> timer_;
};
