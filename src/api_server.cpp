#include "api_server.hpp"
#include "json_utils.hpp"
#include "path_sanitizer.hpp"

#include <filesystem>

namespace arbundle {

APIServer::APIServer(const ServerConfig& config,
                     std::shared_ptr<IRemoteFetcher> fetcher,
                     SsrfGuard::HostResolver resolver)
    : config(config),
      registry(config),
      lifecycle(config, registry),
      ssrfGuard(config.fetch, std::move(resolver)),
      fetcher(std::move(fetcher)),
      imageProxy(config, ssrfGuard, this->fetcher),
      archiveService(config, registry, lifecycle)
{
    app.get_middleware<SecurityHeadersMiddleware>().setConfig(&config);
    app.get_middleware<RateLimitMiddleware>().setConfig(&config);
    setupRoutes();
    CROW_LOG_INFO << "APIServer initialized, sandboxes under " << registry.getTempRoot().string();
}

APIServer::~APIServer() {
    lifecycle.stop();
}

void APIServer::setupRoutes() {
    CROW_LOG_INFO << "Setting up routes...";

    CROW_ROUTE(app, "/api/session")
        .methods("POST"_method)
        ([this]() {
            return startSession();
        });

    CROW_ROUTE(app, "/api/create-zip")
        .methods("POST"_method)
        ([this](const crow::request& req) {
            return createArchive(req);
        });

    CROW_ROUTE(app, "/api/upload-image")
        .methods("POST"_method)
        ([this](const crow::request& req) {
            return uploadImage(req);
        });

    CROW_ROUTE(app, "/api/proxy-image")
        .methods("GET"_method)
        ([this](const crow::request& req) {
            return proxyImage(req);
        });

    CROW_ROUTE(app, "/download/<string>/<string>")
        .methods("GET"_method)
        ([this](const crow::request& req, crow::response& res, std::string session_id, std::string filename) {
            downloadFile(res, session_id, filename);
        });

    CROW_CATCHALL_ROUTE(app)
        ([](crow::response& res) {
            res = Error::NotFound("Not found").toHttpResponse();
            res.end();
        });

    CROW_LOG_INFO << "Routes set up completed";
}

void APIServer::run() {
    lifecycle.start();
    CROW_LOG_INFO << "Server listening on " << config.bind_address << ":" << config.http_port;
    app.bindaddr(config.bind_address)
       .port(config.http_port)
       .multithreaded()
       .run();
}

void APIServer::stop() {
    app.stop();
    lifecycle.stop();
}

crow::response APIServer::startSession() {
    try {
        std::string session_id = registry.issue();
        auto sandbox = registry.ensureOutputDirectory(session_id);
        if (!sandbox) {
            sandbox.error().log("session");
            return sandbox.error().toHttpResponse();
        }

        CROW_LOG_INFO << "Session started: " << session_id.substr(0, 8) << "...";

        crow::json::wvalue body;
        body["success"] = true;
        body["sessionId"] = session_id;
        return jsonResponse(200, std::move(body));
    } catch (const std::exception& e) {
        return internalError("session", e);
    }
}

crow::response APIServer::createArchive(const crow::request& req) {
    try {
        if (req.body.size() > config.limits.max_body_bytes) {
            Error error = Error::TooLarge("Payload too large",
                                          "request body of " + std::to_string(req.body.size()) + " bytes");
            error.log("create-zip");
            return error.toHttpResponse();
        }

        auto body = crow::json::load(req.body);
        if (!body || !JsonUtils::isObject(body)) {
            return Error::Validation("Invalid JSON body").toHttpResponse();
        }

        auto session_id = JsonUtils::extractOptionalString(body, "sessionId");
        if (!session_id || !SessionRegistry::isValidSessionId(*session_id)) {
            return Error::Validation("Invalid session ID").toHttpResponse();
        }

        if (!body.has("files") || !JsonUtils::isArray(body["files"]) || body["files"].size() == 0) {
            return Error::Validation("Invalid files array").toHttpResponse();
        }

        // Entries without content decode as null and are skipped, or written as "null" for json
        static const crow::json::rvalue null_content = crow::json::load("null");

        std::vector<FileDescriptor> files;
        files.reserve(body["files"].size());
        for (const auto& item : body["files"]) {
            FileDescriptor descriptor{"", ContentEncoding::Raw, null_content};
            if (JsonUtils::isObject(item)) {
                descriptor.path = JsonUtils::extractOptionalString(item, "path").value_or("");
                descriptor.encoding = PayloadDecoder::parseEncoding(
                    JsonUtils::extractOptionalString(item, "type").value_or(""));
                if (item.has("content")) {
                    descriptor.content = item["content"];
                }
            }
            files.push_back(std::move(descriptor));
        }

        auto result = archiveService.createArchive(*session_id, files);
        if (!result) {
            return result.error().toHttpResponse();
        }

        crow::json::wvalue response;
        response["success"] = true;
        response["downloadUrl"] = result->download_url;
        response["filesWritten"] = result->files_written;
        response["filesSkipped"] = result->files_skipped;
        return jsonResponse(200, std::move(response));
    } catch (const std::exception& e) {
        return internalError("create-zip", e);
    }
}

crow::response APIServer::uploadImage(const crow::request& req) {
    try {
        if (req.body.size() > config.limits.max_body_bytes) {
            return Error::TooLarge("Payload too large").toHttpResponse();
        }

        std::string content_type = req.get_header_value("Content-Type");
        if (content_type.rfind("multipart/form-data", 0) != 0) {
            return Error::Validation("Expected multipart/form-data").toHttpResponse();
        }

        crow::multipart::message message(req);

        std::string session_id;
        std::vector<const crow::multipart::part*> images;
        for (const auto& part : message.parts) {
            const auto& disposition = part.get_header_object("Content-Disposition");
            auto name = disposition.params.find("name");
            auto filename = disposition.params.find("filename");

            if (filename != disposition.params.end()) {
                images.push_back(&part);
            } else if (name != disposition.params.end() && name->second == "sessionId") {
                session_id = part.body;
            }
        }

        if (images.empty()) {
            return Error::Validation("No images uploaded").toHttpResponse();
        }
        if (images.size() > config.limits.max_upload_files) {
            return Error::Validation("Too many files",
                                     std::to_string(images.size()) + " image parts").toHttpResponse();
        }

        if (session_id.empty()) {
            session_id = registry.issue();
        } else if (!SessionRegistry::isValidSessionId(session_id)) {
            return Error::Validation("Invalid session ID").toHttpResponse();
        }

        crow::json::wvalue response;
        response["success"] = true;
        response["sessionId"] = session_id;

        std::vector<crow::json::wvalue> stored_files;
        for (const auto* part : images) {
            const auto& disposition = part->get_header_object("Content-Disposition");
            std::string filename = disposition.params.at("filename");
            std::string declared_type = part->get_header_object("Content-Type").value;

            auto stored = archiveService.storeUploadedImage(session_id, filename, declared_type, part->body);
            if (!stored) {
                stored.error().log("upload-image");
                return stored.error().toHttpResponse();
            }

            crow::json::wvalue entry;
            entry["path"] = stored->relative_path;
            entry["type"] = stored->mime_type;
            entry["size"] = stored->size;
            stored_files.push_back(std::move(entry));
        }
        response["files"] = std::move(stored_files);
        return jsonResponse(200, std::move(response));
    } catch (const std::exception& e) {
        return internalError("upload-image", e);
    }
}

crow::response APIServer::proxyImage(const crow::request& req) {
    try {
        const char* url = req.url_params.get("url");
        if (!url || std::string(url).empty()) {
            return Error::Validation("URL parameter is required").toHttpResponse();
        }

        auto image = imageProxy.fetchImage(url);
        if (!image) {
            image.error().log("proxy-image");
            return image.error().toHttpResponse();
        }

        crow::response res(200);
        res.body = std::move(image->bytes);
        res.set_header("Content-Type", image->mime_type);
        res.set_header("Cache-Control", "public, max-age=" + std::to_string(config.fetch.cache_max_age));
        return res;
    } catch (const std::exception& e) {
        return internalError("proxy-image", e);
    }
}

void APIServer::downloadFile(crow::response& res, const std::string& session_id, const std::string& filename) {
    try {
        if (!SessionRegistry::isValidSessionId(session_id)) {
            res = Error::Validation("Invalid session ID").toHttpResponse();
            res.end();
            return;
        }
        if (!PathSanitizer::IsValidFilename(filename)) {
            res = Error::Validation("Invalid filename").toHttpResponse();
            res.end();
            return;
        }
        // Only the published archive is downloadable; staging files share its directory
        if (filename != config.archive_name) {
            res = Error::NotFound("File not found").toHttpResponse();
            res.end();
            return;
        }

        auto sandbox = registry.sandboxPathFor(session_id);
        if (!sandbox) {
            res = sandbox.error().toHttpResponse();
            res.end();
            return;
        }

        std::filesystem::path file_path = *sandbox / filename;
        if (!PathSanitizer::ContainIn(*sandbox, file_path)) {
            Error error = Error::Validation("Invalid path", "download escaped sandbox: " + file_path.string());
            error.log("download");
            res = error.toHttpResponse();
            res.end();
            return;
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(file_path, ec)) {
            res = Error::NotFound("File not found").toHttpResponse();
            res.end();
            return;
        }

        res.set_static_file_info_unsafe(file_path.string());
        if (!res.is_static_type()) {
            res = Error::NotFound("File not found").toHttpResponse();
            res.end();
            return;
        }
        res.set_header("Content-Disposition", "attachment; filename=\"" + filename + "\"");

        // Every download (re)starts the deletion clock. Crow streams the file
        // after this handler returns and has no completion hook.
        lifecycle.scheduleDeletion(session_id);
        CROW_LOG_INFO << "Download of " << filename << " for session " << session_id.substr(0, 8)
                      << "..., deletion in " << config.cleanup_delay.count() << "s";
        res.end();
    } catch (const std::exception& e) {
        res = internalError("download", e);
        res.end();
    }
}

crow::response APIServer::jsonResponse(int code, crow::json::wvalue&& body) {
    return crow::response(code, std::move(body));
}

crow::response APIServer::internalError(const std::string& context, const std::exception& e) {
    Error error = Error::Internal("Internal server error", e.what());
    error.log(context);
    return error.toHttpResponse();
}

} // namespace arbundle
