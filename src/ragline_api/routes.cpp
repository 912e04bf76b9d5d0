#include "ragline_api/routes.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "ragline_core/db/index_repository.hpp"

namespace ragline_api {

Routes::Routes(std::shared_ptr<ragline_core::RagEngine> engine) : engine_(std::move(engine)) {
  if (!engine_) {
    throw std::invalid_argument("Routes requires an engine");
  }
}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/answer").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_answer(req);
  });

  CROW_ROUTE(app, "/indexes")
  ([this](const crow::request &req) { return handle_list_indexes(req); });

  CROW_ROUTE(app, "/indexes/<string>/save")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &handle) {
        return handle_save_index(req, handle);
      });

  CROW_ROUTE(app, "/indexes/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &handle) {
        return handle_unload_index(req, handle);
      });

  CROW_ROUTE(app, "/indexes/load").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_load_index(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

int Routes::status_for(ragline_core::ErrorKind kind) {
  switch (kind) {
    case ragline_core::ErrorKind::EmbeddingUnavailable:
    case ragline_core::ErrorKind::GenerationUnavailable:
      return 503;
    case ragline_core::ErrorKind::IndexFailure:
      return 500;
    default:
      return 400;
  }
}

template <typename Handler>
crow::response Routes::guarded(const char *name, Handler &&handler) {
  try {
    return handler();
  } catch (const ragline_core::IngestionError &e) {
    std::cerr << "Exception in " << name << ": " << e.what() << std::endl;
    nlohmann::json error_response =
        create_error_response(e.what(), ragline_core::to_string(e.cause_kind()));
    error_response["stage"] = ragline_core::to_string(e.stage());
    error_response["completed"] = e.completed();
    error_response["requested"] = e.requested();
    // Committed batches stay queryable under this handle.
    if (const auto *partial = dynamic_cast<const ragline_core::PartialIngestionError *>(&e)) {
      error_response["index"] = partial->handle();
    }
    return create_json_response(error_response, status_for(e.cause_kind()));
  } catch (const ragline_core::RaglineError &e) {
    std::cerr << "Exception in " << name << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what(), ragline_core::to_string(e.kind())),
                                status_for(e.kind()));
  } catch (const std::out_of_range &e) {
    return create_json_response(create_error_response(e.what(), "NotFound"), 404);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what(), "BadRequest"), 400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what(), "BadRequest"), 400);
  } catch (const ragline_core::IndexRepositoryError &e) {
    std::cerr << "Exception in " << name << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what(), "Storage"), 500);
  } catch (const std::exception &e) {
    std::cerr << "Exception in " << name << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what(), "Internal"), 500);
  }
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("ragline API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_ingest(const crow::request &req) {
  return guarded("handle_ingest", [&] {
    nlohmann::json body = parse_json_body(req.body);
    ragline_core::IndexHandle handle;
    if (body.contains("file_path")) {
      std::string file_path = require_string(body, "file_path");
      std::cout << "Ingesting file: " << file_path << std::endl;
      handle = engine_->ingest(std::filesystem::path(file_path));
    } else if (body.contains("segments")) {
      std::vector<ragline_core::RawSegment> segments;
      for (const auto &segment_json : body.at("segments")) {
        ragline_core::RawSegment segment;
        segment.text = segment_json.at("text").get<std::string>();
        segment.source_metadata =
            segment_json.value("metadata", ragline_core::Metadata{});
        segments.push_back(std::move(segment));
      }
      std::cout << "Ingesting " << segments.size() << " segments" << std::endl;
      handle = engine_->ingest(segments);
    } else {
      throw std::invalid_argument("Request needs either 'file_path' or 'segments'");
    }

    nlohmann::json response = create_success_response("Ingestion completed");
    response["data"]["index"] = handle;
    response["data"]["fragments"] = engine_->get(handle)->size();
    return create_json_response(response);
  });
}

crow::response Routes::handle_query(const crow::request &req) {
  return guarded("handle_query", [&] {
    nlohmann::json body = parse_json_body(req.body);
    std::string handle = require_string(body, "index");
    std::string question = require_string(body, "question");
    int top_k = body.value("top_k", engine_->options().answering.top_k);
    ragline_core::MetadataFilter filter = parse_filter(body.value("filter", nlohmann::json{}));

    std::cout << "Query on " << handle << " with top_k: " << top_k << std::endl;
    ragline_core::RetrievalResult results = engine_->query(handle, question, top_k, filter);

    nlohmann::json response = create_success_response("Query completed");
    response["data"]["fragments"] = fragments_to_json(results);
    return create_json_response(response);
  });
}

crow::response Routes::handle_answer(const crow::request &req) {
  return guarded("handle_answer", [&] {
    nlohmann::json body = parse_json_body(req.body);
    std::string handle = require_string(body, "index");
    std::string question = require_string(body, "question");
    ragline_core::MetadataFilter filter = parse_filter(body.value("filter", nlohmann::json{}));

    std::cout << "Answering on " << handle << std::endl;
    ragline_core::AnswerResult result = engine_->answer(handle, question, filter);

    nlohmann::json response = create_success_response("Answer generated");
    response["data"]["answer"] = result.answer;
    response["data"]["sources"] = fragments_to_json(result.sources);
    return create_json_response(response);
  });
}

crow::response Routes::handle_list_indexes(const crow::request &req) {
  return guarded("handle_list_indexes", [&] {
    nlohmann::json indexes = nlohmann::json::array();
    for (const auto &summary : engine_->list()) {
      nlohmann::json index_json;
      index_json["index"] = summary.handle;
      index_json["backend"] = ragline_core::to_string(summary.kind);
      index_json["metric"] = ragline_core::to_string(summary.metric);
      index_json["dimension"] = summary.dimension;
      index_json["size"] = summary.size;
      index_json["origin"] = summary.origin;
      indexes.push_back(index_json);
    }
    nlohmann::json response = create_success_response("Indexes retrieved successfully");
    response["data"]["indexes"] = indexes;
    response["data"]["count"] = indexes.size();
    return create_json_response(response);
  });
}

crow::response Routes::handle_save_index(const crow::request &req, const std::string &handle) {
  return guarded("handle_save_index", [&] {
    nlohmann::json body = parse_json_body(req.body);
    std::string path = require_string(body, "path");
    engine_->save(handle, path);
    nlohmann::json response = create_success_response("Index saved");
    response["data"]["index"] = handle;
    response["data"]["path"] = path;
    return create_json_response(response);
  });
}

crow::response Routes::handle_load_index(const crow::request &req) {
  return guarded("handle_load_index", [&] {
    nlohmann::json body = parse_json_body(req.body);
    std::string path = require_string(body, "path");
    ragline_core::IndexHandle handle = engine_->load(path);
    nlohmann::json response = create_success_response("Index loaded");
    response["data"]["index"] = handle;
    response["data"]["fragments"] = engine_->get(handle)->size();
    return create_json_response(response);
  });
}

crow::response Routes::handle_unload_index(const crow::request &req, const std::string &handle) {
  return guarded("handle_unload_index", [&] {
    engine_->unload(handle);
    nlohmann::json response = create_success_response("Index unloaded");
    response["data"]["index"] = handle;
    return create_json_response(response);
  });
}

ragline_core::MetadataFilter Routes::parse_filter(const nlohmann::json &filter_json) {
  ragline_core::MetadataFilter filter;
  if (filter_json.is_null()) {
    return filter;
  }
  if (!filter_json.is_object()) {
    throw std::invalid_argument("'filter' must be an object");
  }
  if (filter_json.contains("equals")) {
    for (const auto &[field, value] : filter_json.at("equals").items()) {
      if (!value.is_string()) {
        throw std::invalid_argument("filter.equals." + field + " must be a string");
      }
      filter.where_equals(field, value.get<std::string>());
    }
  }
  if (filter_json.contains("ranges")) {
    for (const auto &[field, bounds] : filter_json.at("ranges").items()) {
      if (!bounds.is_array() || bounds.size() != 2 || !bounds[0].is_number() ||
          !bounds[1].is_number()) {
        throw std::invalid_argument("filter.ranges." + field + " must be [min, max]");
      }
      filter.where_between(field, bounds[0].get<double>(), bounds[1].get<double>());
    }
  }
  return filter;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

std::string Routes::require_string(const nlohmann::json &body, const std::string &key) {
  if (!body.contains(key) || !body.at(key).is_string() || body.at(key).get<std::string>().empty()) {
    throw std::invalid_argument("Missing or empty '" + key + "'");
  }
  return body.at(key).get<std::string>();
}

nlohmann::json Routes::fragments_to_json(const ragline_core::RetrievalResult &fragments) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto &retrieved : fragments) {
    nlohmann::json result_json;
    result_json["id"] = retrieved.fragment.id;
    result_json["text"] = retrieved.fragment.text;
    result_json["metadata"] = retrieved.fragment.source_metadata;
    result_json["distance"] = retrieved.distance;
    results.push_back(result_json);
  }
  return results;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.empty()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error, const std::string &kind) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  response["kind"] = kind;
  return response;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code, json_data.dump());
  response.set_header("Content-Type", "application/json");
  return response;
}

}  // namespace ragline_api
