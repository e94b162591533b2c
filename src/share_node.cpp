#include "share_node.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "registry_client.hpp"
#include "settings_manager.hpp"
#include "share_cli.hpp"
#include "sync_engine.hpp"
#include "transfer_server.hpp"

namespace {
constexpr std::chrono::seconds kMinimumSyncPeriod{10};
} // namespace

std::string detect_outbound_address() {
  try {
    // A UDP connect only selects a route; nothing is sent.
    asio::io_context io;
    asio::ip::udp::socket socket(io);
    socket.connect(asio::ip::udp::endpoint(asio::ip::make_address("8.8.8.8"), 53));
    auto address = socket.local_endpoint().address();
    if(!address.is_unspecified()) {
      return address.to_string();
    }
  } catch(const std::exception& e) {
    process_logger().warn("Outbound interface detection failed: {}", e.what());
  }
  return "127.0.0.1";
}

std::string default_peer_id() {
  char hostname[256] = {};
  if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
    std::snprintf(hostname, sizeof(hostname), "%s", "UnknownHost");
  }
  std::stringstream ss;
  ss << hostname << "-" << getpid();
  return ss.str();
}

ShareNode::ShareNode(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("share-node")),
    client_(std::make_shared<Logger>("transfer-client")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

ShareNode::~ShareNode() {
  stop();
}

void ShareNode::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  if(ec) {
    logger_->warn("Unable to create workspace {}: {}", options_.workspace_root.string(), ec.message());
  }
}

std::shared_ptr<Registry> ShareNode::make_registry() const {
  if(options_.registry) return options_.registry;
  auto host = settings_->get<std::string>("registry_host");
  auto port = static_cast<uint16_t>(settings_->get<int>("registry_port"));
  auto timeout = std::chrono::milliseconds(settings_->get<int>("registry_timeout_ms"));
  return std::make_shared<RegistryClient>(host, port, timeout, std::make_shared<Logger>("registry"));
}

std::chrono::seconds ShareNode::derive_sync_period() {
  int configured = settings_->get<int>("sync_interval");
  if(configured > 0) {
    return std::chrono::seconds(configured);
  }
  int lease = kDefaultLeaseSeconds;
  try {
    lease = registry_->lease_seconds();
  } catch(const RegistryError& e) {
    logger_->warn("Lease query failed, assuming {}s: {}", kDefaultLeaseSeconds, e.what());
  }
  // Heartbeat well inside the lease so one late pass does not drop listings.
  auto period = std::chrono::seconds(static_cast<long long>(lease) * 3 / 4);
  return std::max(kMinimumSyncPeriod, period);
}

void ShareNode::start() {
  if(started_.exchange(true)) return;

  ensure_workspace();
  init(settings_->get<bool>("verbose"));

  peer_id_ = settings_->get<std::string>("peer_id");
  if(peer_id_.empty()) {
    peer_id_ = default_peer_id();
  }
  advertise_address_ = settings_->get<std::string>("advertise_ip");
  if(advertise_address_.empty()) {
    advertise_address_ = detect_outbound_address();
  }

  registry_ = make_registry();

  TransferServer::Options server_options;
  server_options.port = static_cast<unsigned short>(settings_->get<int>("share_port"));
  server_options.max_connections = static_cast<std::size_t>(settings_->get<int>("max_connections"));
  server_options.shutdown_grace = std::chrono::milliseconds(settings_->get<int>("shutdown_grace_ms"));

  SyncEngine::Options engine_options;
  engine_options.owner_id = peer_id_;
  engine_options.owner_address = advertise_address_;
  auto share_dir = settings_->get<std::string>("share_dir");
  if(!share_dir.empty()) {
    std::filesystem::path dir(share_dir);
    engine_options.watched_directory = dir.is_absolute() ? dir : options_.workspace_root / dir;
  }

  // The server only reads the engine's table, so the engine has to exist
  // first; the advertised port is only known after binding.
  engine_ = std::make_unique<SyncEngine>(registry_, engine_options, std::make_shared<Logger>("sync-engine"));
  server_ = std::make_unique<TransferServer>(engine_->registrations(), server_options,
                                             std::make_shared<Logger>("transfer-server"));
  if(server_->start()) {
    share_port_ = server_->port();
  } else {
    share_port_ = server_options.port;
    logger_->error("Files will not be served; peers cannot download from this node");
  }
  engine_->set_owner_port(share_port_);

  logger_->info("Peer {} advertising {}:{}", peer_id_, advertise_address_, share_port_);

  sync_period_ = derive_sync_period();
  engine_->start_monitoring(sync_period_);

  cli_ = std::make_unique<ShareCLI>(*this, options_.console ? *options_.console : std::cout,
                                   options_.console_input);
  if(options_.start_cli_thread) {
    cli_->start();
  }

  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger_->info("Signal {} received, shutting down", signal_number);
      request_stop();
    });
  }
}

void ShareNode::run() {
  if(!started_) start();
  work_.emplace(asio::make_work_guard(io_));
  io_.run();
}

void ShareNode::request_stop() {
  work_.reset();
  io_.stop();
}

std::optional<std::filesystem::path> ShareNode::stop() {
  if(!started_.exchange(false)) {
    return engine_ ? engine_->watched_directory() : std::nullopt;
  }

  if(cli_) {
    cli_->stop();
  }
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  request_stop();

  // No pass may register anything after the disconnect.
  if(engine_) {
    engine_->stop();
  }

  if(registry_) {
    try {
      registry_->disconnect(peer_id_);
      logger_->info("Disconnected {} from the registry", peer_id_);
    } catch(const RegistryError& e) {
      logger_->warn("Registry disconnect failed: {}", e.what());
    }
  }

  if(server_) {
    server_->stop();
  }
  if(!engine_) return std::nullopt;
  return engine_->watched_directory();
}

SyncEngine& ShareNode::engine() {
  if(!engine_) {
    throw std::logic_error("ShareNode::engine() called before start()");
  }
  return *engine_;
}

std::filesystem::path ShareNode::download_directory() const {
  std::filesystem::path dir(settings_->get<std::string>("download_dir"));
  if(dir.empty()) dir = "download";
  return dir.is_absolute() ? dir : options_.workspace_root / dir;
}

TransferResult ShareNode::download(ListingId listing_id) {
  TransferResult result;
  if(!registry_) {
    result.error = "node not started";
    return result;
  }
  OwnerInfo owner;
  try {
    owner = registry_->get_owner(listing_id);
  } catch(const RegistryError& e) {
    result.error = e.what();
    logger_->error("Owner lookup for listing {} failed: {}", listing_id, e.what());
    return result;
  }
  logger_->info("Fetching {} from {}:{}", owner.file_name, owner.address, owner.port);
  return client_.download(owner.address, owner.port, owner.file_name, download_directory());
}

std::vector<ListingSummary> ShareNode::search(const std::string& query) {
  if(!registry_) {
    throw RegistryError("node not started");
  }
  return registry_->search(query);
}

void ShareNode::execute_command(const std::string& line) {
  if(cli_) {
    cli_->execute_command(line);
  }
}

ShareNode::Stats ShareNode::stats() const {
  Stats s;
  if(engine_) {
    s.registered_listings = engine_->registrations().size();
    s.completed_passes = engine_->completed_passes();
  }
  if(server_) {
    s.active_transfers = server_->active_transfers();
    s.serving = server_->running();
  }
  return s;
}
