#include "registry_client.hpp"

#include <asio.hpp>

#include <istream>

using json = nlohmann::json;

nlohmann::json make_registry_request(const std::string& op) {
  json j;
  j["op"] = op;
  return j;
}

RegistryClient::RegistryClient(std::string host,
                               uint16_t port,
                               std::chrono::milliseconds timeout,
                               std::shared_ptr<Logger> logger)
  : host_(std::move(host)),
    port_(port),
    timeout_(timeout),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("registry")) {
}

std::string RegistryClient::exchange(const std::string& line) {
  using asio::ip::tcp;
  asio::io_context io;
  tcp::resolver resolver(io);
  tcp::socket socket(io);
  asio::streambuf reply_buf;
  std::error_code result_ec;
  bool done = false;

  auto finish = [&](const std::error_code& ec) {
    result_ec = ec;
    done = true;
  };

  resolver.async_resolve(host_, std::to_string(port_),
    [&](std::error_code ec, tcp::resolver::results_type results) {
      if(ec) { finish(ec); return; }
      asio::async_connect(socket, results,
        [&](std::error_code ec, const tcp::endpoint&) {
          if(ec) { finish(ec); return; }
          asio::async_write(socket, asio::buffer(line),
            [&](std::error_code ec, std::size_t) {
              if(ec) { finish(ec); return; }
              asio::async_read_until(socket, reply_buf, '\n',
                [&](std::error_code ec, std::size_t) { finish(ec); });
            });
        });
    });

  if(timeout_.count() > 0) {
    io.run_for(timeout_);
  } else {
    io.run();
  }

  if(!done) {
    std::error_code ignored;
    resolver.cancel();
    socket.close(ignored);
    io.restart();
    io.run();
    throw RegistryUnavailableError("registry " + host_ + ":" + std::to_string(port_) +
                                   " timed out after " + std::to_string(timeout_.count()) + " ms");
  }
  if(result_ec) {
    throw RegistryUnavailableError("registry " + host_ + ":" + std::to_string(port_) +
                                   " unavailable: " + result_ec.message());
  }

  std::istream is(&reply_buf);
  std::string reply;
  std::getline(is, reply);
  return reply;
}

json RegistryClient::call(const json& request) {
  const auto op = request.value("op", std::string());
  auto raw = exchange(request.dump() + "\n");
  json reply;
  try {
    reply = json::parse(raw);
  } catch(const std::exception& e) {
    throw RegistryError("malformed registry reply to '" + op + "': " + e.what());
  }
  if(!reply.is_object()) {
    throw RegistryError("malformed registry reply to '" + op + "'");
  }
  std::string code;
  std::string message;
  try {
    if(reply.value("ok", false)) {
      return reply;
    }
    code = reply.value("error", std::string("error"));
    message = reply.value("message", code);
  } catch(const json::exception& e) {
    throw RegistryError("malformed registry reply to '" + op + "': " + e.what());
  }
  if(code == "name_conflict") {
    throw NameConflictError(message);
  }
  throw RegistryError(op + " rejected: " + message);
}

ListingId RegistryClient::register_file(const std::string& owner_id,
                                        const std::string& file_name,
                                        const std::string& owner_address,
                                        uint16_t owner_port) {
  auto request = make_registry_request("register");
  request["owner_id"] = owner_id;
  request["file_name"] = file_name;
  request["owner_address"] = owner_address;
  request["owner_port"] = owner_port;
  auto reply = call(request);
  if(!reply.contains("id") || !reply["id"].is_number_integer()) {
    throw RegistryError("register reply carries no listing id");
  }
  return reply["id"].get<ListingId>();
}

void RegistryClient::unregister_file(ListingId id, const std::string& owner_id) {
  auto request = make_registry_request("unregister");
  request["id"] = id;
  request["owner_id"] = owner_id;
  call(request);
}

std::vector<ListingSummary> RegistryClient::search(const std::string& query) {
  auto request = make_registry_request("search");
  request["query"] = query;
  auto reply = call(request);
  std::vector<ListingSummary> out;
  try {
    for(const auto& item : reply.value("results", json::array())) {
      ListingSummary summary;
      summary.id = item.at("id").get<ListingId>();
      summary.file_name = item.at("file_name").get<std::string>();
      out.push_back(std::move(summary));
    }
  } catch(const json::exception& e) {
    throw RegistryError(std::string("malformed search result: ") + e.what());
  }
  return out;
}

OwnerInfo RegistryClient::get_owner(ListingId id) {
  auto request = make_registry_request("get_owner");
  request["id"] = id;
  auto reply = call(request);
  OwnerInfo info;
  try {
    info.file_name = reply.at("file_name").get<std::string>();
    info.address = reply.at("address").get<std::string>();
    info.port = reply.at("port").get<uint16_t>();
  } catch(const json::exception& e) {
    throw RegistryError(std::string("incomplete owner record: ") + e.what());
  }
  return info;
}

int RegistryClient::lease_seconds() {
  try {
    auto reply = call(make_registry_request("lease"));
    return reply.value("seconds", kDefaultLeaseSeconds);
  } catch(const json::exception& e) {
    logger_->warn("Malformed lease reply, assuming {}s: {}", kDefaultLeaseSeconds, e.what());
    return kDefaultLeaseSeconds;
  } catch(const RegistryError& e) {
    logger_->warn("Unable to read lease from registry, assuming {}s: {}", kDefaultLeaseSeconds, e.what());
    return kDefaultLeaseSeconds;
  }
}

bool RegistryClient::heartbeat(const std::string& owner_id) {
  auto request = make_registry_request("heartbeat");
  request["owner_id"] = owner_id;
  auto reply = call(request);
  const auto alive = reply.find("alive");
  if(alive == reply.end() || !alive->is_boolean()) {
    throw RegistryError("heartbeat reply carries no liveness flag");
  }
  return alive->get<bool>();
}

void RegistryClient::disconnect(const std::string& owner_id) {
  auto request = make_registry_request("disconnect");
  request["owner_id"] = owner_id;
  call(request);
}
