#include "kb_api/server.hpp"

#include <iostream>

#include "kb_core/errors.hpp"

namespace kb_api {

std::pair<std::string, int> parse_address(const std::string &address) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw kb_core::ConfigError("api_base_url must look like host:port, got '" + address + "'");
  }
  int port = 0;
  try {
    port = std::stoi(address.substr(colon + 1));
  } catch (const std::exception &) {
    throw kb_core::ConfigError("Invalid port in api_base_url '" + address + "'");
  }
  if (port <= 0 || port > 65535) {
    throw kb_core::ConfigError("Port out of range in api_base_url '" + address + "'");
  }
  return {address.substr(0, colon), port};
}

Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "Listening on " << host_ << ":" << port_ << std::endl;
  server_thread_future_ =
      std::async(std::launch::async, [this] { app_.port(port_).bindaddr(host_).run(); });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}
}  // namespace kb_api
