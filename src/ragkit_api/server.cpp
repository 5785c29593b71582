#include "ragkit_api/server.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace ragkit_api {

Server::Server(const std::string &host, int port, unsigned int threads)
    : host_(host), port_(port), threads_(threads) {
  if (threads_ == 0) {
    threads_ = std::max(2u, std::thread::hardware_concurrency());
  }
  app_.loglevel(crow::LogLevel::Warning);
}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  app_.bindaddr(host_).port(static_cast<uint16_t>(port_)).concurrency(threads_);
  run_future_ = app_.run_async();
  app_.wait_for_server_start();
  running_ = true;
  std::cout << "Server: accepting requests on " << address() << " with " << threads_
            << " threads" << std::endl;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  std::cout << "Server: stopping " << address() << std::endl;
  app_.stop();
  if (run_future_.valid()) {
    run_future_.get();
  }
  running_ = false;
}

}  // namespace ragkit_api
