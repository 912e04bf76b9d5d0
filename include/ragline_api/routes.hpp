#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "ragline_core/errors.hpp"
#include "ragline_core/rag_engine.hpp"
#include "server.hpp"

namespace ragline_api {

class Routes {
 public:
  explicit Routes(std::shared_ptr<ragline_core::RagEngine> engine);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

  // Route handlers. Public so they can be exercised without a listening socket.
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_answer(const crow::request &req);
  crow::response handle_list_indexes(const crow::request &req);
  crow::response handle_save_index(const crow::request &req, const std::string &handle);
  crow::response handle_load_index(const crow::request &req);
  crow::response handle_unload_index(const crow::request &req, const std::string &handle);

  // HTTP status for a failure of the given kind.
  static int status_for(ragline_core::ErrorKind kind);

  /**
   * @brief Builds a MetadataFilter from {"equals": {field: value},
   *        "ranges": {field: [min, max]}}. Missing or null means no filter.
   * @throw std::invalid_argument for a malformed filter object.
   */
  static ragline_core::MetadataFilter parse_filter(const nlohmann::json &filter_json);

 private:
  std::shared_ptr<ragline_core::RagEngine> engine_;

  nlohmann::json parse_json_body(const std::string &body);
  std::string require_string(const nlohmann::json &body, const std::string &key);
  nlohmann::json fragments_to_json(const ragline_core::RetrievalResult &fragments);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error, const std::string &kind);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);

  // Runs a handler body and maps the exceptions it throws to error responses.
  template <typename Handler>
  crow::response guarded(const char *name, Handler &&handler);
};

}  // namespace ragline_api
