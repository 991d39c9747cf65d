#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace segread {

enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue
};

struct ConfigErrorInfo {
    ConfigError error;
    std::string message;
};

struct ReaderConfig {
    int64_t max_chunk_size = 2 * 1024 * 1024;          // 2MB per ReadSegment
    std::chrono::seconds request_timeout{10};
    uint16_t admin_gateway_port = 9999;
    std::string auth_token;                             // Sent as the delegation token
    bool tls_enabled = false;
    std::filesystem::path trust_store;                  // PEM bundle, empty = system default
    bool show_progress = true;

    // Apply recognized keys; unknown keys are ignored so one file can be
    // shared with other admin tools.
    std::expected<void, ConfigErrorInfo> apply(const std::map<std::string, std::string>& props);

    std::expected<void, ConfigErrorInfo> load_file(const std::filesystem::path& path);

    // SEGREAD_AUTH_TOKEN
    void apply_environment();

    std::expected<void, ConfigErrorInfo> validate() const;
};

// Parses "key=value" lines; '#' and '!' start comments.
std::expected<std::map<std::string, std::string>, ConfigErrorInfo> parse_properties(std::string_view text);

namespace config_keys {
inline constexpr const char* kAdminGatewayPort = "pravegaservice.admin.gateway.port";
inline constexpr const char* kReadBufferSize = "cli.read.buffer.size";
inline constexpr const char* kRequestTimeoutSeconds = "cli.read.request.timeout.seconds";
inline constexpr const char* kAuthToken = "cli.security.auth.token";
inline constexpr const char* kTlsEnable = "cli.security.tls.enable";
inline constexpr const char* kTrustStore = "cli.security.tls.trustStore.location";
} // namespace config_keys

} // namespace segread
