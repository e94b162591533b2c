#include "sync_engine.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

#include "utils.hpp"

namespace {

std::optional<std::filesystem::path> normalize_optional(const std::optional<std::filesystem::path>& path) {
  if(!path || path->empty()) return std::nullopt;
  return normalize_path(*path);
}

bool directory_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec) && !ec;
}

bool path_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

} // namespace

SyncEngine::SyncEngine(std::shared_ptr<Registry> registry,
                       Options options,
                       std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    registry_(std::move(registry)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-engine")) {
  if(!registry_) {
    throw std::invalid_argument("SyncEngine requires a registry");
  }
  watched_dir_ = normalize_optional(options_.watched_directory);
  owner_port_ = options_.owner_port;
}

SyncEngine::~SyncEngine() {
  stop();
}

void SyncEngine::start_monitoring(std::chrono::seconds period) {
  if(period.count() <= 0) {
    period = std::chrono::seconds(1);
  }
  logger_->info("Synchronizing shares every {}s", period.count());
  schedule_next(period, std::chrono::seconds(0));
}

void SyncEngine::schedule_next(std::chrono::seconds period, std::chrono::seconds delay) {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if(stopped_) return;
  if(!timer_) {
    timer_ = std::make_unique<asio::steady_timer>(pool_.get_executor());
  }
  timer_->expires_after(delay);
  timer_->async_wait([this, period](const std::error_code& ec){
    if(ec || stopped_) return;
    reconcile();
    schedule_next(period, period);
  });
}

void SyncEngine::stop() {
  if(stopped_.exchange(true)) return;
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if(timer_) timer_->cancel();
  }
  pool_.join();
  std::lock_guard<std::mutex> lock(timer_mutex_);
  timer_.reset();
}

void SyncEngine::trigger_reconcile() {
  if(stopped_) return;
  asio::post(pool_, [this](){
    reconcile();
  });
}

void SyncEngine::set_watched_directory(std::optional<std::filesystem::path> directory) {
  auto next = normalize_optional(directory);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    // Everything under the old directory leaves management; the next pass
    // de-lists whatever of it is still registered.
    if(watched_dir_) {
      for(const auto& path : list_directory_files(*watched_dir_, true)) {
        user_shared_.erase(path);
        excluded_.erase(path);
        departing_.insert(path);
      }
    }
    watched_dir_ = next;
    // Files excluded earlier become eligible again when their directory is chosen.
    if(watched_dir_) {
      for(const auto& path : list_directory_files(*watched_dir_)) {
        excluded_.erase(path);
        departing_.erase(path);
      }
    }
  }
  change_pending_.store(true);
  if(next) {
    logger_->info("New watched directory: {}. Synchronizing shared files...", next->string());
  } else {
    logger_->info("Watched directory unset. Synchronizing shared files...");
  }
  trigger_reconcile();
}

std::optional<std::filesystem::path> SyncEngine::watched_directory() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return watched_dir_;
}

bool SyncEngine::is_from_watched_directory(const std::filesystem::path& path) const {
  auto dir = watched_directory();
  if(!dir || path.empty()) return false;
  auto candidate = normalize_path(path);
  auto mismatch = std::mismatch(dir->begin(), dir->end(), candidate.begin(), candidate.end());
  return mismatch.first == dir->end();
}

SyncEngine::AddResult SyncEngine::add_file(const std::filesystem::path& raw_path, std::string& error) {
  error.clear();
  const auto path = normalize_path(raw_path);
  const auto file_name = path.filename().string();

  if(auto existing = registrations_.find_by_name(file_name)) {
    if(existing->path != path) {
      error = "a file named '" + file_name + "' is already shared from " + existing->path.string();
      logger_->warn("Not sharing {}: {}", path.string(), error);
      return AddResult::NameConflict;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    excluded_.erase(path);
    departing_.erase(path);
    user_shared_.insert(path);
    return AddResult::Added;
  }

  if(!is_readable_file(path)) {
    error = path.string() + " is not a readable regular file";
    logger_->warn("Not sharing {}", error);
    return AddResult::Failed;
  }

  ListingId id = 0;
  try {
    id = registry_->register_file(options_.owner_id, file_name,
                                  options_.owner_address, owner_port_.load());
  } catch(const NameConflictError& e) {
    error = e.what();
    logger_->warn("Registry refused duplicate name for {}: {}", path.string(), error);
    return AddResult::NameConflict;
  } catch(const RegistryError& e) {
    error = e.what();
    logger_->error("Register of {} failed: {}", path.string(), error);
    return AddResult::Failed;
  }

  if(!registrations_.try_insert(id, path)) {
    // A concurrent pass claimed the name first.
    error = "a file named '" + file_name + "' was registered concurrently";
    logger_->warn("Not sharing {}: {}", path.string(), error);
    try {
      registry_->unregister_file(id, options_.owner_id);
    } catch(const RegistryError& e) {
      logger_->error("Unable to withdraw duplicate listing {}: {}", id, e.what());
    }
    return AddResult::NameConflict;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    excluded_.erase(path);
    departing_.erase(path);
    user_shared_.insert(path);
  }
  logger_->info("Registered {} with the registry (listing {})", path.string(), id);
  notify_listeners();
  return AddResult::Added;
}

void SyncEngine::remove_file(const std::filesystem::path& raw_path) {
  const auto path = normalize_path(raw_path);
  auto registration = registrations_.find_by_path(path);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    user_shared_.erase(path);
    // A pass already running may still hold this path in its desired set.
    if(registration) departing_.insert(path);
  }
  change_pending_.store(true);
  if(registration) {
    registrations_.erase(registration->id);
    try {
      registry_->unregister_file(registration->id, options_.owner_id);
      logger_->info("De-listed {}", path.string());
    } catch(const RegistryError& e) {
      logger_->error("Immediate de-list of {} failed: {}", path.string(), e.what());
    }
  }
  notify_listeners();
}

void SyncEngine::exclude_file(const std::filesystem::path& raw_path) {
  const auto path = normalize_path(raw_path);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    excluded_.insert(path);
    user_shared_.erase(path);
  }
  remove_file(path);
}

bool SyncEngine::reconcile() {
  std::unique_lock<std::mutex> guard(sync_mutex_, std::try_to_lock);
  if(!guard.owns_lock()) {
    logger_->debug("Reconcile already in progress; leaving the change to it");
    return false;
  }

  std::size_t retries = 0;
  bool needs_retry = false;
  do {
    needs_retry = false;
    change_pending_.store(false);
    try {
      needs_retry = run_pass(retries);
    } catch(const RegistryUnavailableError& e) {
      logger_->error("Error contacting the registry: {}", e.what());
    } catch(const std::exception& e) {
      logger_->error("Share synchronization failed: {}", e.what());
    }
  } while(needs_retry || change_pending_.load());

  completed_passes_.fetch_add(1);
  guard.unlock();
  notify_listeners();
  return true;
}

bool SyncEngine::run_pass(std::size_t& retries) {
  auto desired = compute_desired_set();

  // Arrivals before departures so nothing desired is left unregistered.
  auto blocked = register_arrivals(desired);
  auto departed = unregister_departures(desired);
  if(blocked > 0 && departed > 0) {
    // Departures may have released names that blocked an arrival.
    register_arrivals(desired);
  }
  prune_departing();

  if(!registrations_.empty() && !registry_->heartbeat(options_.owner_id)) {
    logger_->warn("Registry lost this node's listings. Attempting immediate re-sync...");
    registrations_.clear();
    if(retries < options_.max_heartbeat_retries) {
      ++retries;
      return true;
    }
    logger_->error("Giving up re-registration after {} retries", retries);
  }
  return false;
}

std::set<std::filesystem::path> SyncEngine::compute_desired_set() {
  std::optional<std::filesystem::path> dir;
  std::set<std::filesystem::path> user_shared;
  std::set<std::filesystem::path> excluded;
  std::set<std::filesystem::path> departing;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(watched_dir_ && !directory_exists(*watched_dir_)) {
      logger_->warn("Watched directory {} no longer exists; directory sharing stopped",
                    watched_dir_->string());
      watched_dir_.reset();
    }
    for(auto it = user_shared_.begin(); it != user_shared_.end();) {
      if(path_exists(*it)) {
        ++it;
      } else {
        logger_->debug("Shared file {} vanished from disk", it->string());
        it = user_shared_.erase(it);
      }
    }
    dir = watched_dir_;
    user_shared = user_shared_;
    excluded = excluded_;
    departing = departing_;
  }

  std::set<std::filesystem::path> desired;
  if(dir) {
    auto files = list_directory_files(*dir);
    desired.insert(files.begin(), files.end());
  }
  desired.insert(user_shared.begin(), user_shared.end());
  for(const auto& path : registrations_.paths()) {
    desired.insert(path);
  }

  for(auto it = desired.begin(); it != desired.end();) {
    if(excluded.count(*it) || departing.count(*it) || !is_readable_file(*it)) {
      it = desired.erase(it);
    } else {
      ++it;
    }
  }
  return desired;
}

std::size_t SyncEngine::register_arrivals(const std::set<std::filesystem::path>& desired) {
  std::size_t blocked = 0;
  for(const auto& path : desired) {
    if(registrations_.contains_path(path)) continue;
    if(!still_wanted(path)) {
      logger_->debug("Skipping {}: removed while the pass was running", path.string());
      continue;
    }
    const auto file_name = path.filename().string();

    if(auto holder = registrations_.find_by_name(file_name)) {
      logger_->warn("Skipping {}: name already shared from {}", path.string(), holder->path.string());
      ++blocked;
      continue;
    }

    ListingId id = 0;
    try {
      id = registry_->register_file(options_.owner_id, file_name,
                                    options_.owner_address, owner_port_.load());
    } catch(const NameConflictError& e) {
      logger_->warn("Skipping {}: {}", path.string(), e.what());
      continue;
    } catch(const RegistryUnavailableError&) {
      throw;
    } catch(const RegistryError& e) {
      logger_->error("Register of {} failed: {}", path.string(), e.what());
      continue;
    }

    if(!registrations_.try_insert(id, path)) {
      logger_->warn("Skipping {}: name was claimed concurrently", path.string());
      try {
        registry_->unregister_file(id, options_.owner_id);
      } catch(const RegistryError& e) {
        logger_->error("Unable to withdraw duplicate listing {}: {}", id, e.what());
      }
      continue;
    }
    logger_->info("Registered {} with the registry (listing {})", path.string(), id);
  }
  return blocked;
}

std::size_t SyncEngine::unregister_departures(const std::set<std::filesystem::path>& desired) {
  std::size_t departed = 0;
  for(const auto& entry : registrations_.list()) {
    if(desired.count(entry.path) && is_readable_file(entry.path)) continue;
    try {
      registry_->unregister_file(entry.id, options_.owner_id);
    } catch(const RegistryUnavailableError&) {
      throw;
    } catch(const RegistryError& e) {
      // Keep the entry so a later pass retries instead of orphaning the listing.
      logger_->error("De-list of {} failed, will retry: {}", entry.path.string(), e.what());
      continue;
    }
    registrations_.erase(entry.id);
    ++departed;
    logger_->info("De-listed {}", entry.path.string());
  }
  return departed;
}

bool SyncEngine::still_wanted(const std::filesystem::path& path) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return !excluded_.count(path) && !departing_.count(path);
}

void SyncEngine::prune_departing() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  for(auto it = departing_.begin(); it != departing_.end();) {
    if(registrations_.contains_path(*it)) {
      ++it;
    } else {
      it = departing_.erase(it);
    }
  }
}

std::optional<std::filesystem::path> SyncEngine::path_for_file_name(const std::string& file_name) const {
  auto registration = registrations_.find_by_name(file_name);
  if(!registration) return std::nullopt;
  return registration->path;
}

std::vector<std::filesystem::path> SyncEngine::shared_files() const {
  auto paths = registrations_.paths();
  std::sort(paths.begin(), paths.end());
  return paths;
}

std::set<std::filesystem::path> SyncEngine::user_shared_files() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return user_shared_;
}

std::set<std::filesystem::path> SyncEngine::excluded_files() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return excluded_;
}

SyncEngine::UpdateListenerHandle SyncEngine::add_update_listener(UpdateListener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void SyncEngine::remove_update_listener(UpdateListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void SyncEngine::notify_listeners() {
  std::vector<UpdateListener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  for(auto& listener : snapshot) {
    try {
      listener();
    } catch(const std::exception& e) {
      logger_->error("Share update listener threw: {}", e.what());
    }
  }
}
