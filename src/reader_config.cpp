#include "reader_config.hpp"
#include "range_requester.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace segread {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

template<typename T>
std::expected<T, ConfigErrorInfo> parse_number(const std::string& key, std::string_view value) {
    T out{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
            std::format("{}: '{}' is not a valid number", key, value)});
    }
    return out;
}

std::expected<bool, ConfigErrorInfo> parse_bool(const std::string& key, std::string_view value) {
    std::string lower(value);
    std::ranges::transform(lower, lower.begin(), ::tolower);
    if (lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "0") return false;
    return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
        std::format("{}: '{}' is not a boolean", key, value)});
}

} // namespace

std::expected<std::map<std::string, std::string>, ConfigErrorInfo> parse_properties(std::string_view text) {
    std::map<std::string, std::string> props;
    size_t line_no = 0;
    while (!text.empty()) {
        auto eol = text.find('\n');
        auto line = trim(text.substr(0, eol));
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        ++line_no;

        if (line.empty() || line.front() == '#' || line.front() == '!') continue;

        auto sep = line.find_first_of("=:");
        if (sep == std::string_view::npos) {
            return std::unexpected(ConfigErrorInfo{ConfigError::ParseError,
                std::format("line {}: expected key=value", line_no)});
        }
        auto key = trim(line.substr(0, sep));
        if (key.empty()) {
            return std::unexpected(ConfigErrorInfo{ConfigError::ParseError,
                std::format("line {}: empty key", line_no)});
        }
        props[std::string(key)] = std::string(trim(line.substr(sep + 1)));
    }
    return props;
}

std::expected<void, ConfigErrorInfo> ReaderConfig::apply(const std::map<std::string, std::string>& props) {
    for (const auto& [key, value] : props) {
        if (key == config_keys::kAdminGatewayPort) {
            auto port = parse_number<uint16_t>(key, value);
            if (!port) return std::unexpected(port.error());
            admin_gateway_port = *port;
        } else if (key == config_keys::kReadBufferSize) {
            auto size = parse_number<int64_t>(key, value);
            if (!size) return std::unexpected(size.error());
            max_chunk_size = *size;
        } else if (key == config_keys::kRequestTimeoutSeconds) {
            auto secs = parse_number<int64_t>(key, value);
            if (!secs) return std::unexpected(secs.error());
            request_timeout = std::chrono::seconds(*secs);
        } else if (key == config_keys::kAuthToken) {
            auth_token = value;
        } else if (key == config_keys::kTlsEnable) {
            auto flag = parse_bool(key, value);
            if (!flag) return std::unexpected(flag.error());
            tls_enabled = *flag;
        } else if (key == config_keys::kTrustStore) {
            trust_store = value;
        }
    }
    return {};
}

std::expected<void, ConfigErrorInfo> ReaderConfig::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(ConfigErrorInfo{ConfigError::FileNotFound,
            std::format("Cannot open config file {}", path.string())});
    }
    std::ostringstream oss;
    oss << file.rdbuf();

    auto props = parse_properties(oss.str());
    if (!props) {
        return std::unexpected(ConfigErrorInfo{props.error().error,
            std::format("{}: {}", path.string(), props.error().message)});
    }
    return apply(*props);
}

void ReaderConfig::apply_environment() {
    if (const char* token = std::getenv("SEGREAD_AUTH_TOKEN"); token && *token) {
        auth_token = token;
    }
}

std::expected<void, ConfigErrorInfo> ReaderConfig::validate() const {
    if (max_chunk_size <= 0 || max_chunk_size > std::numeric_limits<int32_t>::max()) {
        return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
            std::format("Chunk size must be between 1 and {} bytes, got {}",
                std::numeric_limits<int32_t>::max(), max_chunk_size)});
    }
    auto max_timeout = std::chrono::duration_cast<std::chrono::seconds>(kMaxRequestTimeout);
    if (request_timeout.count() <= 0 || request_timeout > max_timeout) {
        return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
            std::format("Request timeout must be between 1 and {} seconds, got {}s",
                max_timeout.count(), request_timeout.count())});
    }
    if (admin_gateway_port == 0) {
        return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue, "Admin gateway port cannot be 0"});
    }
    return {};
}

} // namespace segread
