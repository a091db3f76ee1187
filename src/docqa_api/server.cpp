#include "docqa_api/server.hpp"

namespace docqa_api {
Server::Server(const std::string &host, int port, int threads, const std::string &cors_allow_origin)
    : host_(host), port_(port), threads_(threads), running_(false) {
  auto &cors = app_.get_middleware<crow::CORSHandler>();
  cors.global()
      .origin(cors_allow_origin)
      .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
      .headers("Content-Type");
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(port_).bindaddr(host_).concurrency(threads_).run();
  });
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
}  // namespace docqa_api
