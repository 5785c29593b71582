#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace ragkit_api {

/**
 * @brief Owns the Crow application and the thread it runs on.
 *
 * Routes are registered through app() before start(). A port of 0 asks the
 * OS for a free one; tests never start the server and drive app() through
 * handle_full instead.
 */
class Server {
 public:
  Server(const std::string &host, int port, unsigned int threads = 0);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Returns once Crow is accepting connections.
  void start();
  void stop();

  bool is_running() const {
    return running_;
  }
  std::string address() const {
    return host_ + ":" + std::to_string(port_);
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  unsigned int threads_;
  std::future<void> run_future_;
  bool running_ = false;
};

}  // namespace ragkit_api
