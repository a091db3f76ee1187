#pragma once
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "server.hpp"

// Forward declarations
namespace docqa_core {
class RagService;
struct UploadedFile;
}  // namespace docqa_core

namespace docqa_api {

// The request itself is malformed; answered with 400
class RequestError : public std::exception {
 public:
  explicit RequestError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class Routes {
 public:
  explicit Routes(std::shared_ptr<docqa_core::RagService> rag_service);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_upload(const crow::request &req);
  crow::response handle_build(const crow::request &req);
  crow::response handle_ask(const crow::request &req);
  crow::response handle_reset(const crow::request &req);
  crow::response handle_status(const crow::request &req);

 private:
  std::shared_ptr<docqa_core::RagService> rag_service_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::vector<docqa_core::UploadedFile> extract_uploaded_files(const crow::request &req);
  std::string extract_question(const nlohmann::json &body);
  std::optional<int> extract_top_k(const nlohmann::json &body);
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  // Maps the exception currently being handled to an error response
  crow::response handle_exception(const std::string &operation);
};

}  // namespace docqa_api
