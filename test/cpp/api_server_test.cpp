#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>

#include "api_server.hpp"
#include "test_utils.hpp"

using namespace arbundle;
using namespace arbundle::test;
using Catch::Matchers::ContainsSubstring;

namespace {

struct ServerFixture {
    TempDirectory temp{"arbundle_api"};
    ServerConfig config;
    std::shared_ptr<FakeRemoteFetcher> fetcher = std::make_shared<FakeRemoteFetcher>();
    std::unique_ptr<APIServer> server;

    ServerFixture() {
        config = createTestConfig(temp.fsPath());
        config.fetch.allowed_domains.insert("images.example.com");
        server = std::make_unique<APIServer>(config, fetcher, fixedResolver("93.184.216.34"));
    }

    crow::request jsonRequest(const std::string& body) const {
        crow::request req;
        req.method = crow::HTTPMethod::Post;
        req.url = "/api/create-zip";
        req.body = body;
        req.add_header("Content-Type", "application/json");
        return req;
    }

    crow::request proxyRequest(const std::string& encoded_url) const {
        crow::request req;
        req.url = "/api/proxy-image";
        req.url_params = crow::query_string("/api/proxy-image?url=" + encoded_url);
        return req;
    }

    std::string startSession() {
        auto res = server->startSession();
        auto body = crow::json::load(res.body);
        return std::string(body["sessionId"].s());
    }
};

std::string multipartBody(const std::string& boundary,
                          const std::string& session_id,
                          const std::vector<std::tuple<std::string, std::string, std::string>>& images) {
    std::string body;
    if (!session_id.empty()) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"sessionId\"\r\n\r\n";
        body += session_id + "\r\n";
    }
    for (const auto& [filename, type, bytes] : images) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"images\"; filename=\"" + filename + "\"\r\n";
        body += "Content-Type: " + type + "\r\n\r\n";
        body += bytes + "\r\n";
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

} // namespace

TEST_CASE("APIServer: session start", "[api_server]") {
    ServerFixture fixture;
    auto res = fixture.server->startSession();

    REQUIRE(res.code == 200);
    auto body = crow::json::load(res.body);
    REQUIRE(body);
    REQUIRE(body["success"].b());

    std::string id(body["sessionId"].s());
    REQUIRE(SessionRegistry::isValidSessionId(id));
    REQUIRE(std::filesystem::is_directory(fixture.temp.fsPath() / id / "output"));
}

TEST_CASE("APIServer: create archive", "[api_server]") {
    ServerFixture fixture;
    std::string id = fixture.startSession();

    SECTION("Successful batch") {
        auto req = fixture.jsonRequest(R"({"sessionId": ")" + id + R"(", "files": [
            {"path": "a/b.json", "type": "json", "content": {"x": 1}},
            {"path": "../../etc/passwd", "type": "text", "content": "root"}
        ]})");
        auto res = fixture.server->createArchive(req);

        REQUIRE(res.code == 200);
        auto body = crow::json::load(res.body);
        REQUIRE(body["success"].b());
        REQUIRE(std::string(body["downloadUrl"].s()) == "/download/" + id + "/ar_output.zip");
        REQUIRE(body["filesWritten"].i() == 1);
        REQUIRE(body["filesSkipped"].i() == 1);

        auto entries = readArchive(fixture.temp.fsPath() / id / "ar_output.zip");
        REQUIRE(entries["a/b.json"] == "{\n  \"x\": 1\n}");
        REQUIRE_FALSE(std::filesystem::exists(fixture.temp.fsPath() / "etc"));
    }

    SECTION("Malformed entries count as skipped") {
        auto req = fixture.jsonRequest(R"({"sessionId": ")" + id + R"(", "files": [
            "not an object", {"type": "text"}, {"path": "ok.json", "content": "{}"}
        ]})");
        auto res = fixture.server->createArchive(req);
        REQUIRE(res.code == 200);
        auto body = crow::json::load(res.body);
        REQUIRE(body["filesWritten"].i() == 1);
        REQUIRE(body["filesSkipped"].i() == 2);
    }

    SECTION("Invalid JSON") {
        auto res = fixture.server->createArchive(fixture.jsonRequest("{not json"));
        REQUIRE(res.code == 400);
    }

    SECTION("Invalid session identifier") {
        auto res = fixture.server->createArchive(
            fixture.jsonRequest(R"({"sessionId": "../x", "files": [{"path": "a.json", "content": "{}"}]})"));
        REQUIRE(res.code == 400);
        REQUIRE_THAT(res.body, ContainsSubstring("Invalid session ID"));
        REQUIRE_FALSE(std::filesystem::exists(fixture.temp.fsPath() / "x"));
    }

    SECTION("Missing or empty files array") {
        REQUIRE(fixture.server->createArchive(fixture.jsonRequest(R"({"sessionId": ")" + id + R"("})")).code == 400);
        REQUIRE(fixture.server->createArchive(
                    fixture.jsonRequest(R"({"sessionId": ")" + id + R"(", "files": []})")).code == 400);
        REQUIRE(fixture.server->createArchive(
                    fixture.jsonRequest(R"({"sessionId": ")" + id + R"(", "files": "x"})")).code == 400);
    }

    SECTION("Oversized bodies answer 413") {
        fixture.config.limits.max_body_bytes = 64;
        auto res = fixture.server->createArchive(fixture.jsonRequest(std::string(65, ' ')));
        REQUIRE(res.code == 413);
    }
}

TEST_CASE("APIServer: image upload", "[api_server]") {
    ServerFixture fixture;
    std::string id = fixture.startSession();
    const std::string boundary = "arbundle-boundary-7f3a";

    auto uploadRequest = [&](const std::string& body) {
        crow::request req;
        req.method = crow::HTTPMethod::Post;
        req.url = "/api/upload-image";
        req.body = body;
        req.add_header("Content-Type", "multipart/form-data; boundary=" + boundary);
        return req;
    };

    SECTION("Valid images are stored") {
        auto res = fixture.server->uploadImage(uploadRequest(multipartBody(boundary, id, {
            {"a.png", "image/png", pngBytes()},
            {"b.jpg", "image/jpeg", jpegBytes()},
        })));

        REQUIRE(res.code == 200);
        auto body = crow::json::load(res.body);
        REQUIRE(std::string(body["sessionId"].s()) == id);
        REQUIRE(body["files"].size() == 2);
        REQUIRE(readFile(fixture.temp.fsPath() / id / "output" / "images" / "a.png") == pngBytes());
    }

    SECTION("Disguised files are rejected") {
        auto res = fixture.server->uploadImage(uploadRequest(multipartBody(boundary, id, {
            {"a.png", "image/png", "<script>alert(1)</script>"},
        })));
        REQUIRE(res.code == 400);
        REQUIRE_THAT(res.body, ContainsSubstring("Invalid image file"));
    }

    SECTION("Too many files") {
        fixture.config.limits.max_upload_files = 1;
        auto res = fixture.server->uploadImage(uploadRequest(multipartBody(boundary, id, {
            {"a.png", "image/png", pngBytes()},
            {"b.png", "image/png", pngBytes()},
        })));
        REQUIRE(res.code == 400);
    }

    SECTION("A session is issued when none is given") {
        auto res = fixture.server->uploadImage(uploadRequest(multipartBody(boundary, "", {
            {"a.png", "image/png", pngBytes()},
        })));
        REQUIRE(res.code == 200);
        auto body = crow::json::load(res.body);
        REQUIRE(SessionRegistry::isValidSessionId(std::string(body["sessionId"].s())));
    }

    SECTION("Non-multipart bodies are rejected") {
        crow::request req;
        req.body = "{}";
        req.add_header("Content-Type", "application/json");
        REQUIRE(fixture.server->uploadImage(req).code == 400);
    }
}

TEST_CASE("APIServer: image proxy", "[api_server]") {
    ServerFixture fixture;

    SECTION("Success carries the detected type and cache policy") {
        fixture.fetcher->enqueue(200, pngBytes(), {{"content-type", "application/octet-stream"}});
        auto res = fixture.server->proxyImage(fixture.proxyRequest("https%3A%2F%2Fimages.example.com%2Fa.png"));

        REQUIRE(res.code == 200);
        REQUIRE(res.body == pngBytes());
        REQUIRE(res.get_header_value("Content-Type") == "image/png");
        REQUIRE(res.get_header_value("Cache-Control") == "public, max-age=3600");
    }

    SECTION("Missing url parameter") {
        crow::request req;
        req.url = "/api/proxy-image";
        auto res = fixture.server->proxyImage(req);
        REQUIRE(res.code == 400);
    }

    SECTION("Metadata endpoint is refused without an outbound request") {
        auto res = fixture.server->proxyImage(fixture.proxyRequest("https%3A%2F%2F169.254.169.254%2F"));
        REQUIRE(res.code == 403);
        REQUIRE(fixture.fetcher->requests.empty());
    }

    SECTION("Upstream status is mirrored") {
        fixture.fetcher->enqueue(403, "denied");
        auto res = fixture.server->proxyImage(fixture.proxyRequest("https%3A%2F%2Fimages.example.com%2Fa.png"));
        REQUIRE(res.code == 403);
        REQUIRE_THAT(res.body, ContainsSubstring("Failed to fetch image"));
    }

    SECTION("Timeouts answer 408") {
        fixture.fetcher->enqueueError(Error::Timeout("Request timeout"));
        auto res = fixture.server->proxyImage(fixture.proxyRequest("https%3A%2F%2Fimages.example.com%2Fa.png"));
        REQUIRE(res.code == 408);
    }
}

TEST_CASE("APIServer: download", "[api_server]") {
    ServerFixture fixture;
    std::string id = fixture.startSession();
    fixture.temp.writeFile(id + "/ar_output.zip", "PK\x05\x06" + std::string(18, '\0'));

    SECTION("Existing archive is served and its deletion scheduled") {
        crow::response res;
        fixture.server->downloadFile(res, id, "ar_output.zip");

        REQUIRE(res.code == 200);
        REQUIRE(res.is_static_type());
        REQUIRE(res.get_header_value("Content-Disposition") == "attachment; filename=\"ar_output.zip\"");
        REQUIRE(fixture.server->getLifecycle().isDeletionScheduled(id));
    }

    SECTION("Malformed identifiers and filenames") {
        crow::response bad_id;
        fixture.server->downloadFile(bad_id, "..", "ar_output.zip");
        REQUIRE(bad_id.code == 400);

        crow::response bad_name;
        fixture.server->downloadFile(bad_name, id, "..");
        REQUIRE(bad_name.code == 400);

        crow::response encoded;
        fixture.server->downloadFile(encoded, id, "%2e%2e");
        REQUIRE(encoded.code == 400);

        REQUIRE_FALSE(fixture.server->getLifecycle().isDeletionScheduled(id));
    }

    SECTION("Missing files answer 404") {
        crow::response missing;
        fixture.server->downloadFile(missing, id, "other.zip");
        REQUIRE(missing.code == 404);

        crow::response directory;
        fixture.server->downloadFile(directory, id, "output");
        REQUIRE(directory.code == 404);

        crow::response unknown_session;
        fixture.server->downloadFile(unknown_session, std::string(64, 'a'), "ar_output.zip");
        REQUIRE(unknown_session.code == 404);

        REQUIRE_FALSE(fixture.server->getLifecycle().isDeletionScheduled(id));
    }

    SECTION("Archives still being built are not served") {
        fixture.temp.writeFile(id + "/ar_output.zip.partial", "PK\x03\x04truncated");

        crow::response partial;
        fixture.server->downloadFile(partial, id, "ar_output.zip.partial");
        REQUIRE(partial.code == 404);
        REQUIRE_FALSE(partial.is_static_type());
        REQUIRE_FALSE(fixture.server->getLifecycle().isDeletionScheduled(id));
    }
}

TEST_CASE("APIServer: routing", "[api_server]") {
    ServerFixture fixture;
    auto& app = fixture.server->getApp();
    app.validate();

    SECTION("Unknown routes answer a JSON 404") {
        crow::request req;
        req.url = "/etc/passwd";
        crow::response res;
        app.handle_full(req, res);

        REQUIRE(res.code == 404);
        REQUIRE_THAT(res.body, ContainsSubstring("\"category\":\"NotFound\""));
    }

    SECTION("Session route is wired") {
        crow::request req;
        req.url = "/api/session";
        req.method = crow::HTTPMethod::Post;
        crow::response res;
        app.handle_full(req, res);

        REQUIRE(res.code == 200);
        REQUIRE_THAT(res.body, ContainsSubstring("sessionId"));
    }
}
