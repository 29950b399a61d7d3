#pragma once

#include <picstash/image_service.hpp>
#include <picstash/server/config.hpp>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpResponse.h>

#include <string>

namespace picstash::server {

/** HTTP status for a non-OK Status. */
int HttpStatusFor(const Status& status);

/**
 * Create an error response from a picstash status.
 * Body: {"error": <code name>, "code": <http status>, "message": "<context>: <status>"}.
 */
drogon::HttpResponsePtr MakeErrorResponse(const Status& status,
                                          const std::string& context);

/**
 * True if the request carries `secret` in its Authorization header, either
 * bare or as "Bearer <secret>". Always false for an empty secret.
 */
bool IsAuthorized(const drogon::HttpRequestPtr& req, const std::string& secret);

/**
 * Register upload, metadata, serving, admin and health handlers with the
 * Drogon app. Uses lambda handlers capturing the service pointer, which must
 * outlive the app.
 */
void RegisterHandlers(ImageService* service, const Config& config);

}  // namespace picstash::server
