#include "session_registry.hpp"

#include <crow/logging.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <system_error>

namespace arbundle {

SessionRegistry::SessionRegistry(const ServerConfig& config)
    : config_(config), temp_root_(std::filesystem::absolute(config.temp_root).lexically_normal()) {
}

std::string SessionRegistry::issue() const {
    std::array<unsigned char, SESSION_ID_BYTES> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        unsigned long err = ERR_get_error();
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        throw std::runtime_error(std::string("Failed to generate session identifier: ") + buf);
    }

    static const char hex_digits[] = "0123456789abcdef";
    std::string session_id;
    session_id.reserve(SESSION_ID_LENGTH);
    for (unsigned char byte : bytes) {
        session_id += hex_digits[byte >> 4];
        session_id += hex_digits[byte & 0x0F];
    }
    return session_id;
}

bool SessionRegistry::isValidSessionId(const std::string& session_id) {
    if (session_id.size() != SESSION_ID_LENGTH) {
        return false;
    }
    return std::all_of(session_id.begin(), session_id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

Result<std::filesystem::path> SessionRegistry::sandboxPathFor(const std::string& session_id) const {
    if (!isValidSessionId(session_id)) {
        return Error::Validation("Invalid session ID",
                                 "session id of length " + std::to_string(session_id.size()) + " rejected");
    }
    return temp_root_ / session_id;
}

Result<std::filesystem::path> SessionRegistry::outputPathFor(const std::string& session_id) const {
    auto sandbox = sandboxPathFor(session_id);
    if (!sandbox) {
        return std::move(sandbox.error());
    }
    return *sandbox / config_.output_dir_name;
}

Result<std::filesystem::path> SessionRegistry::archivePathFor(const std::string& session_id) const {
    auto sandbox = sandboxPathFor(session_id);
    if (!sandbox) {
        return std::move(sandbox.error());
    }
    return *sandbox / config_.archive_name;
}

Result<std::filesystem::path> SessionRegistry::ensureSandbox(const std::string& session_id) const {
    auto sandbox = sandboxPathFor(session_id);
    if (!sandbox) {
        return std::move(sandbox.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(*sandbox, ec);
    if (ec) {
        return Error::Storage("Internal server error",
                              "cannot create sandbox " + sandbox->string() + ": " + ec.message());
    }
    return std::move(*sandbox);
}

Result<std::filesystem::path> SessionRegistry::ensureOutputDirectory(const std::string& session_id) const {
    auto output = outputPathFor(session_id);
    if (!output) {
        return std::move(output.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(*output, ec);
    if (ec) {
        return Error::Storage("Internal server error",
                              "cannot create output directory " + output->string() + ": " + ec.message());
    }
    CROW_LOG_DEBUG << "Output directory ready for session " << session_id;
    return std::move(*output);
}

bool SessionRegistry::sandboxExists(const std::string& session_id) const {
    auto sandbox = sandboxPathFor(session_id);
    if (!sandbox) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_directory(*sandbox, ec);
}

} // namespace arbundle
