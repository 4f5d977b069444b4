#pragma once

#include <filesystem>
#include <string>

#include "error.hpp"
#include "server_config.hpp"

namespace arbundle {

/**
 * Issues and validates session identifiers and maps them to sandbox
 * directories below the configured temp root.
 *
 * A session identifier is 32 random bytes rendered as 64 lowercase hex
 * characters. It is the only capability granting access to its sandbox,
 * and the sandbox directory is the only record of the session.
 */
class SessionRegistry {
public:
    static constexpr std::size_t SESSION_ID_BYTES = 32;
    static constexpr std::size_t SESSION_ID_LENGTH = SESSION_ID_BYTES * 2;

    explicit SessionRegistry(const ServerConfig& config);

    /**
     * Produce a fresh identifier from the OpenSSL CSPRNG.
     * @throws std::runtime_error if the CSPRNG cannot deliver bytes
     */
    std::string issue() const;

    /**
     * Pure format check, never touches the filesystem.
     */
    static bool isValidSessionId(const std::string& session_id);

    /**
     * <temp_root>/<session_id>, or a Validation error for malformed ids.
     */
    Result<std::filesystem::path> sandboxPathFor(const std::string& session_id) const;
    Result<std::filesystem::path> outputPathFor(const std::string& session_id) const;
    Result<std::filesystem::path> archivePathFor(const std::string& session_id) const;

    /**
     * Create the sandbox (and its output directory) if absent. Idempotent.
     */
    Result<std::filesystem::path> ensureSandbox(const std::string& session_id) const;
    Result<std::filesystem::path> ensureOutputDirectory(const std::string& session_id) const;

    bool sandboxExists(const std::string& session_id) const;

    const std::filesystem::path& getTempRoot() const { return temp_root_; }

private:
    const ServerConfig& config_;
    std::filesystem::path temp_root_;
};

} // namespace arbundle
