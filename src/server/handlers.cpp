#include <picstash/server/handlers.hpp>

#include <drogon/drogon.h>
#include <drogon/MultiPart.h>
#include <json/json.h>
#include <openssl/crypto.h>
#include <trantor/utils/Logger.h>

#include <filesystem>
#include <memory>
#include <sstream>

namespace picstash::server {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

drogon::HttpResponsePtr MakeJsonResponse(const Json::Value& json,
                                         drogon::HttpStatusCode code) {
  auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
  resp->setStatusCode(code);
  return resp;
}

drogon::HttpResponsePtr MakeBadRequest(const std::string& message) {
  Json::Value error;
  error["error"] = "invalid_argument";
  error["message"] = message;
  error["code"] = 400;
  return MakeJsonResponse(error, drogon::k400BadRequest);
}

drogon::HttpResponsePtr MakeUnauthorized() {
  Json::Value error;
  error["error"] = "unauthorized";
  return MakeJsonResponse(error, drogon::k401Unauthorized);
}

// Drogon only fills getJsonObject() for application/json; fall back to
// parsing the raw body so clients that omit the header still work.
std::shared_ptr<Json::Value> ParseJsonBody(const drogon::HttpRequestPtr& req) {
  auto json = req->getJsonObject();
  if (json) return json;

  Json::Value parsed;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::string body_str(req->body());
  std::istringstream stream(body_str);
  if (Json::parseFromStream(builder, stream, &parsed, &errors)) {
    return std::make_shared<Json::Value>(parsed);
  }
  return nullptr;
}

// Reads a JSON array of strings; non-string elements become "" so that they
// fail identifier sanitising downstream.
std::shared_ptr<Json::Value> RequireJsonArray(const drogon::HttpRequestPtr& req,
                                              const Callback& callback) {
  auto json = ParseJsonBody(req);
  if (!json || !json->isArray()) {
    callback(MakeBadRequest("Request body must be a JSON array"));
    return nullptr;
  }
  return json;
}

std::string StringOrEmpty(const Json::Value& v) {
  return v.isString() ? v.asString() : std::string();
}

}  // namespace

// --- Error Response Helper ---

int HttpStatusFor(const Status& status) {
  switch (status.code()) {
    case Status::Code::kOk:
      return 200;
    case Status::Code::kNotFound:
      return 404;
    case Status::Code::kInvalidArgument:
    case Status::Code::kInvalidExtension:
      return 400;
    case Status::Code::kRegistryUnavailable:
    case Status::Code::kAllocationExhausted:
    // Never escapes the allocator; treat like a busy registry if it does.
    case Status::Code::kDuplicateCandidate:
      return 503;
    case Status::Code::kObjectStoreWriteFailed:
    case Status::Code::kIOError:
    case Status::Code::kCorruption:
      return 500;
  }
  return 500;
}

drogon::HttpResponsePtr MakeErrorResponse(const Status& status,
                                          const std::string& context) {
  const int http_code = HttpStatusFor(status);

  Json::Value json;
  json["error"] = std::string(Status::CodeName(status.code()));
  json["code"] = http_code;
  json["message"] = context + ": " + status.ToString();

  return MakeJsonResponse(json, static_cast<drogon::HttpStatusCode>(http_code));
}

bool IsAuthorized(const drogon::HttpRequestPtr& req, const std::string& secret) {
  if (secret.empty()) return false;

  std::string presented = req->getHeader("Authorization");
  static const std::string kBearer = "Bearer ";
  if (presented.compare(0, kBearer.size(), kBearer) == 0) {
    presented.erase(0, kBearer.size());
  }

  if (presented.size() != secret.size()) return false;
  return CRYPTO_memcmp(presented.data(), secret.data(), secret.size()) == 0;
}

// --- Handler Registration ---

void RegisterHandlers(ImageService* service, const Config& config) {
  auto& app = drogon::app();
  const std::string secret = config.auth.secret;
  const uint64_t default_grace = config.service.sweep_grace_seconds;

  if (secret.empty()) {
    LOG_WARN << "No upload secret configured; authenticated endpoints will reject all requests";
  }

  // ==========================================================================
  // Upload
  // ==========================================================================

  // POST /api/upload - multipart/form-data, one or more files
  app.registerHandler(
      "/api/upload",
      [service, secret](const drogon::HttpRequestPtr& req, Callback&& callback) {
        if (!IsAuthorized(req, secret)) {
          callback(MakeUnauthorized());
          return;
        }

        drogon::MultiPartParser parser;
        if (parser.parse(req) != 0 || parser.getFiles().empty()) {
          callback(MakeBadRequest("Expected multipart/form-data with at least one file"));
          return;
        }

        // Files are stored in request order; a failure stops the batch and
        // earlier files stay stored.
        Json::Value filenames(Json::arrayValue);
        for (const auto& file : parser.getFiles()) {
          const std::string name = file.getFileName();
          const std::string ext = std::filesystem::path(name).extension().string();

          UploadResult result;
          auto status = service->Upload(ext, file.fileContent(), &result);
          if (!status.ok()) {
            callback(MakeErrorResponse(status, "Upload failed for '" + name + "'"));
            return;
          }
          filenames.append(result.filename);
        }

        callback(MakeJsonResponse(filenames, drogon::k201Created));
      },
      {drogon::Post});

  // ==========================================================================
  // Attribution
  // ==========================================================================

  // POST /api/sources - ["id", ...] -> [source | null, ...]
  app.registerHandler(
      "/api/sources",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback) {
        auto json = RequireJsonArray(req, callback);
        if (!json) return;

        std::vector<std::string> ids;
        ids.reserve(json->size());
        for (const auto& v : *json) {
          ids.push_back(StringOrEmpty(v));
        }

        std::vector<std::optional<std::string>> sources;
        auto status = service->GetSources(ids, &sources);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "GetSources failed"));
          return;
        }

        Json::Value out(Json::arrayValue);
        for (const auto& source : sources) {
          out.append(source ? Json::Value(*source) : Json::Value(Json::nullValue));
        }
        callback(MakeJsonResponse(out, drogon::k200OK));
      },
      {drogon::Post});

  // PUT /api/sources - [{"id": ..., "source": ...}, ...]
  app.registerHandler(
      "/api/sources",
      [service, secret](const drogon::HttpRequestPtr& req, Callback&& callback) {
        if (!IsAuthorized(req, secret)) {
          callback(MakeUnauthorized());
          return;
        }
        auto json = RequireJsonArray(req, callback);
        if (!json) return;

        Json::Value out(Json::arrayValue);
        for (const auto& item : *json) {
          Json::Value result;
          result["previous"] = Json::nullValue;

          const std::string id = item.isObject() ? StringOrEmpty(item["id"]) : std::string();
          result["id"] = id;

          // A missing or null source clears attribution.
          const Json::Value& source = item.isObject() ? item["source"] : Json::Value::nullSingleton();
          if (!item.isObject() || !(source.isNull() || source.isString())) {
            result["status"] = "invalid";
            out.append(result);
            continue;
          }

          std::string previous;
          auto status = service->SetSource(id, source.isString() ? source.asString() : "",
                                           &previous);
          if (status.ok()) {
            result["status"] = "updated";
            if (!previous.empty()) result["previous"] = previous;
          } else if (status.IsNotFound()) {
            result["status"] = "not_found";
          } else if (status.IsInvalidArgument()) {
            result["status"] = "invalid";
          } else {
            callback(MakeErrorResponse(status, "SetSource failed for id '" + id + "'"));
            return;
          }
          out.append(result);
        }

        callback(MakeJsonResponse(out, drogon::k200OK));
      },
      {drogon::Put});

  // ==========================================================================
  // Deletion
  // ==========================================================================

  // DELETE /api/images - ["id", ...] -> per-item status
  app.registerHandler(
      "/api/images",
      [service, secret](const drogon::HttpRequestPtr& req, Callback&& callback) {
        if (!IsAuthorized(req, secret)) {
          callback(MakeUnauthorized());
          return;
        }
        auto json = RequireJsonArray(req, callback);
        if (!json) return;

        Json::Value out(Json::arrayValue);
        for (const auto& v : *json) {
          const std::string id = StringOrEmpty(v);
          Json::Value result;
          result["id"] = id;

          auto status = service->Delete(id);
          if (status.ok()) {
            result["status"] = "deleted";
          } else if (status.IsNotFound()) {
            result["status"] = "not_found";
          } else if (status.IsInvalidArgument()) {
            result["status"] = "invalid";
          } else {
            callback(MakeErrorResponse(status, "Delete failed for id '" + id + "'"));
            return;
          }
          out.append(result);
        }

        callback(MakeJsonResponse(out, drogon::k200OK));
      },
      {drogon::Delete});

  // DELETE /api/images/{id}
  app.registerHandler(
      "/api/images/{id}",
      [service, secret](const drogon::HttpRequestPtr& req, Callback&& callback,
                        const std::string& id) {
        if (!IsAuthorized(req, secret)) {
          callback(MakeUnauthorized());
          return;
        }

        auto status = service->Delete(id);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "Delete failed for id '" + id + "'"));
          return;
        }

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k204NoContent);
        callback(resp);
      },
      {drogon::Delete});

  // ==========================================================================
  // Serving
  // ==========================================================================

  // GET /images/{filename}
  app.registerHandler(
      "/images/{filename}",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback,
                const std::string& filename) {
        std::string id;
        std::string ext;
        auto status = ParseFilename(filename, &id, &ext);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "Bad image name '" + filename + "'"));
          return;
        }

        if (!service->objects()->Exists(id, ext)) {
          callback(MakeErrorResponse(Status::NotFound(filename), "No such image"));
          return;
        }
        callback(drogon::HttpResponse::newFileResponse(service->objects()->PathFor(id, ext)));
      },
      {drogon::Get});

  // GET /source/{id} - redirect to the attributed source, else serve the file
  app.registerHandler(
      "/source/{id}",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback,
                const std::string& id) {
        Resolution resolution;
        auto status = service->ResolveSource(id, &resolution);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "ResolveSource failed for id '" + id + "'"));
          return;
        }

        switch (resolution.kind) {
          case Resolution::Kind::kRedirect:
            callback(drogon::HttpResponse::newRedirectionResponse(resolution.target,
                                                                  drogon::k302Found));
            return;
          case Resolution::Kind::kServeLocal:
            callback(drogon::HttpResponse::newFileResponse(resolution.target));
            return;
          case Resolution::Kind::kNotFound:
            break;
        }
        callback(MakeErrorResponse(Status::NotFound(id), "No such image"));
      },
      {drogon::Get});

  // ==========================================================================
  // Status-code counters
  // ==========================================================================

  // GET /api/metrics - [{"statusCode": n, "count": c}, ...]
  app.registerHandler(
      "/api/metrics",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback) {
        std::vector<StatusCount> counts;
        auto status = service->registry()->ListStatusCounts(&counts);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "ListStatusCounts failed"));
          return;
        }

        Json::Value out(Json::arrayValue);
        for (const auto& c : counts) {
          Json::Value row;
          row["statusCode"] = c.status_code;
          row["count"] = static_cast<Json::UInt64>(c.count);
          out.append(row);
        }
        callback(MakeJsonResponse(out, drogon::k200OK));
      },
      {drogon::Get});

  // ==========================================================================
  // Admin Endpoints
  // ==========================================================================

  // POST /api/admin/sweep - optional {"grace_seconds": n}
  app.registerHandler(
      "/api/admin/sweep",
      [service, secret, default_grace](const drogon::HttpRequestPtr& req, Callback&& callback) {
        if (!IsAuthorized(req, secret)) {
          callback(MakeUnauthorized());
          return;
        }

        uint64_t grace = default_grace;
        if (!req->body().empty()) {
          auto json = ParseJsonBody(req);
          if (!json || !json->isObject()) {
            callback(MakeBadRequest("Request body must be a JSON object"));
            return;
          }
          if (json->isMember("grace_seconds")) {
            const Json::Value& g = (*json)["grace_seconds"];
            if (!g.isUInt64() || g.asUInt64() < kMinSweepGraceSeconds) {
              callback(MakeBadRequest("grace_seconds must be an integer of at least " +
                                      std::to_string(kMinSweepGraceSeconds)));
              return;
            }
            grace = g.asUInt64();
          }
        }

        SweepStats stats;
        auto status = service->Sweep(grace, &stats);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "Sweep failed"));
          return;
        }

        Json::Value json;
        json["status"] = "ok";
        json["records_scanned"] = static_cast<Json::UInt64>(stats.records_scanned);
        json["objects_scanned"] = static_cast<Json::UInt64>(stats.objects_scanned);
        json["orphan_records_removed"] = static_cast<Json::UInt64>(stats.orphan_records_removed);
        json["orphan_objects_removed"] = static_cast<Json::UInt64>(stats.orphan_objects_removed);
        callback(MakeJsonResponse(json, drogon::k200OK));
      },
      {drogon::Post});

  // ==========================================================================
  // Health Endpoints
  // ==========================================================================

  // GET /health - Liveness check
  app.registerHandler(
      "/health",
      [](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Json::Value json;
        json["status"] = "healthy";
        callback(MakeJsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});

  // GET /health/ready - Readiness check with record count
  app.registerHandler(
      "/health/ready",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback) {
        uint64_t records = 0;
        auto status = service->registry()->Count(&records);

        Json::Value json;
        if (status.ok()) {
          json["status"] = "healthy";
          json["records"] = static_cast<Json::UInt64>(records);
          callback(MakeJsonResponse(json, drogon::k200OK));
        } else {
          json["status"] = "unhealthy";
          json["error"] = status.ToString();
          callback(MakeJsonResponse(json, drogon::k503ServiceUnavailable));
        }
      },
      {drogon::Get});
}

}  // namespace picstash::server
