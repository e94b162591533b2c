#pragma once
#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "registry.hpp"

inline constexpr int kDefaultLeaseSeconds = 60;

// Registry reached over TCP: one connection per call carrying one JSON line
// each way.
//   request: {"op": "<call>", ...}\n
//   reply:   {"ok": true, ...}\n  or  {"ok": false, "error": "<code>", "message": "..."}\n
class RegistryClient : public Registry {
public:
  RegistryClient(std::string host,
                 uint16_t port,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
                 std::shared_ptr<Logger> logger = nullptr);

  ListingId register_file(const std::string& owner_id,
                          const std::string& file_name,
                          const std::string& owner_address,
                          uint16_t owner_port) override;
  void unregister_file(ListingId id, const std::string& owner_id) override;
  std::vector<ListingSummary> search(const std::string& query) override;
  OwnerInfo get_owner(ListingId id) override;
  // Falls back to kDefaultLeaseSeconds when the registry cannot be reached.
  int lease_seconds() override;
  bool heartbeat(const std::string& owner_id) override;
  void disconnect(const std::string& owner_id) override;

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

private:
  nlohmann::json call(const nlohmann::json& request);
  std::string exchange(const std::string& line);

  std::string host_;
  uint16_t port_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<Logger> logger_;
};

nlohmann::json make_registry_request(const std::string& op);
