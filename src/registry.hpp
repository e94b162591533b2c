#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "registration_table.hpp"

struct ListingSummary {
  ListingId id = 0;
  std::string file_name;
};

// Owner coordinates are only handed out per listing, right before a transfer.
struct OwnerInfo {
  std::string file_name;
  std::string address;
  uint16_t port = 0;
};

// The registry rejected or could not complete a call.
class RegistryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The owner already has a listing with this file name.
class NameConflictError : public RegistryError {
public:
  using RegistryError::RegistryError;
};

// Connection refused, timed out or dropped; the next pass retries.
class RegistryUnavailableError : public RegistryError {
public:
  using RegistryError::RegistryError;
};

// Remote authoritative record of which peer shares which file. It may forget
// listings at any time; heartbeat() returning false reports that it did.
class Registry {
public:
  virtual ~Registry() = default;

  virtual ListingId register_file(const std::string& owner_id,
                                  const std::string& file_name,
                                  const std::string& owner_address,
                                  uint16_t owner_port) = 0;
  // No-op when the listing is already gone.
  virtual void unregister_file(ListingId id, const std::string& owner_id) = 0;
  virtual std::vector<ListingSummary> search(const std::string& query) = 0;
  virtual OwnerInfo get_owner(ListingId id) = 0;
  virtual int lease_seconds() = 0;
  virtual bool heartbeat(const std::string& owner_id) = 0;
  virtual void disconnect(const std::string& owner_id) = 0;
};
