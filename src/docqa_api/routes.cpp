#include "docqa_api/routes.hpp"

#include <iostream>

#include "docqa_api/json_mapping.hpp"
#include "docqa_core/services/rag_service.hpp"

namespace docqa_api {
Routes::Routes(std::shared_ptr<docqa_core::RagService> rag_service)
    : rag_service_(std::move(rag_service)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/upload").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_upload(req);
  });

  CROW_ROUTE(app, "/build").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_build(req);
  });

  CROW_ROUTE(app, "/ask").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ask(req);
  });

  CROW_ROUTE(app, "/reset").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_reset(req);
  });

  CROW_ROUTE(app, "/status")
  ([this](const crow::request &req) { return handle_status(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response;
  response["status"] = "healthy";
  response["version"] = "0.1.0";
  return create_json_response(response);
}

crow::response Routes::handle_upload(const crow::request &req) {
  try {
    std::vector<docqa_core::UploadedFile> files = extract_uploaded_files(req);
    std::cout << "Upload of " << files.size() << " file(s)" << std::endl;
    docqa_core::UploadResult result = rag_service_->upload(files);
    return create_json_response(result);
  } catch (const std::exception &) {
    return handle_exception("upload");
  }
}

crow::response Routes::handle_build(const crow::request &req) {
  try {
    std::cout << "Build requested" << std::endl;
    docqa_core::BuildResult result = rag_service_->build();
    return create_json_response(result);
  } catch (const std::exception &) {
    return handle_exception("build");
  }
}

crow::response Routes::handle_ask(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string question = extract_question(body);
    std::optional<int> top_k = extract_top_k(body);

    std::cout << "Question: " << question << std::endl;
    docqa_core::AskResult result = rag_service_->ask(question, top_k);
    std::cout << "Answered with status " << docqa_core::to_string(result.status) << " and "
              << result.sources.size() << " sources" << std::endl;
    return create_json_response(result);
  } catch (const std::exception &) {
    return handle_exception("ask");
  }
}

crow::response Routes::handle_reset(const crow::request &req) {
  try {
    rag_service_->reset();
    nlohmann::json response;
    response["status"] = "ok";
    return create_json_response(response);
  } catch (const std::exception &) {
    return handle_exception("reset");
  }
}

crow::response Routes::handle_status(const crow::request &req) {
  try {
    return create_json_response(rag_service_->status());
  } catch (const std::exception &) {
    return handle_exception("status");
  }
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw RequestError("Invalid JSON in request body: " + std::string(e.what()));
  }
}

std::vector<docqa_core::UploadedFile> Routes::extract_uploaded_files(const crow::request &req) {
  const std::string content_type = req.get_header_value("Content-Type");
  if (content_type.rfind("multipart/form-data", 0) != 0) {
    throw RequestError("Upload must be sent as multipart/form-data");
  }

  crow::multipart::message message(req);
  std::vector<docqa_core::UploadedFile> files;
  for (const auto &part : message.parts) {
    const auto &disposition = part.get_header_object("Content-Disposition");
    auto name = disposition.params.find("name");
    auto filename = disposition.params.find("filename");
    if (name == disposition.params.end() || name->second != "files" ||
        filename == disposition.params.end()) {
      continue;
    }
    files.push_back({.file_name = filename->second, .content = part.body});
  }

  if (files.empty()) {
    throw RequestError("No files found in the 'files' field");
  }
  return files;
}

std::string Routes::extract_question(const nlohmann::json &body) {
  if (!body.is_object()) {
    throw RequestError("Request body must be a JSON object");
  }
  if (!body.contains("question") || body["question"].is_null()) {
    return "";
  }
  if (!body["question"].is_string()) {
    throw RequestError("'question' must be a string");
  }
  return body["question"].get<std::string>();
}

std::optional<int> Routes::extract_top_k(const nlohmann::json &body) {
  if (!body.contains("top_k") || body["top_k"].is_null()) {
    return std::nullopt;
  }
  if (!body["top_k"].is_number_integer()) {
    throw RequestError("'top_k' must be an integer");
  }
  // Values outside int are clamped later anyway
  const auto top_k = body["top_k"].get<long long>();
  if (top_k > 1000000) {
    return 1000000;
  }
  if (top_k < -1000000) {
    return -1000000;
  }
  return static_cast<int>(top_k);
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["status"] = "error";
  response["error"] = error;
  return response;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code, json_data.dump());
  response.set_header("Content-Type", "application/json");
  return response;
}

crow::response Routes::handle_exception(const std::string &operation) {
  try {
    throw;
  } catch (const RequestError &e) {
    std::cerr << "Bad " << operation << " request: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const docqa_core::EmbeddingProviderError &e) {
    std::cerr << "Embedding provider failed during " << operation << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const docqa_core::CompletionProviderError &e) {
    std::cerr << "Completion provider failed during " << operation << ": " << e.what()
              << std::endl;
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const docqa_core::DimensionMismatch &e) {
    // The embedding model no longer matches the indexed vectors
    std::cerr << "Embedding dimension mismatch during " << operation << ": " << e.what()
              << std::endl;
    return create_json_response(
        create_error_response(std::string(e.what()) +
                              ". The embedding model changed since the index was built; "
                              "reset and rebuild the index."),
        502);
  } catch (const docqa_core::ContentExtractorError &e) {
    std::cerr << "Unreadable document in " << operation << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in " << operation << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

}  // namespace docqa_api
