#include "read_segment_command.hpp"
#include "compact_log.hpp"
#include "segment_store_client.hpp"
#include "tls_socket.hpp"
#include <charconv>
#include <format>

namespace segread {

namespace {

template<typename T>
std::expected<T, CliErrorInfo> parse_integer(std::string_view name, std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::unexpected(CliErrorInfo{CliError::InvalidNumber,
            std::format("{} must be an integer, got '{}'", name, text)});
    }
    return value;
}

} // namespace

std::expected<CommandLine, CliErrorInfo> parse_command_line(const std::vector<std::string>& argv) {
    CommandLine cl;
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& a = argv[i];
        if (!a.starts_with("--")) {
            if (cl.command.empty()) cl.command = a;
            else cl.args.push_back(a);
            continue;
        }

        auto value = [&]() -> std::expected<std::string, CliErrorInfo> {
            if (i + 1 >= argv.size()) {
                return std::unexpected(CliErrorInfo{CliError::MissingArgument, std::format("{} requires a value", a)});
            }
            return argv[++i];
        };

        if (a == "--tls") { cl.options.tls = true; continue; }
        if (a == "--quiet") { cl.options.quiet = true; continue; }
        if (a == "--verbose") { cl.options.verbose = true; continue; }

        if (a != "--config" && a != "--token" && a != "--timeout" && a != "--chunk-size"
            && a != "--port" && a != "--truststore") {
            return std::unexpected(CliErrorInfo{CliError::UnknownOption, std::format("Unknown option {}", a)});
        }
        auto v = value();
        if (!v) return std::unexpected(v.error());

        if (a == "--config") {
            cl.options.config_file = *v;
        } else if (a == "--token") {
            cl.options.token = *v;
        } else if (a == "--truststore") {
            cl.options.trust_store = *v;
        } else if (a == "--timeout") {
            auto n = parse_integer<int64_t>(a, *v);
            if (!n) return std::unexpected(n.error());
            cl.options.timeout_seconds = *n;
        } else if (a == "--chunk-size") {
            auto n = parse_integer<int64_t>(a, *v);
            if (!n) return std::unexpected(n.error());
            cl.options.chunk_size = *n;
        } else {
            auto n = parse_integer<uint16_t>(a, *v);
            if (!n) return std::unexpected(n.error());
            cl.options.port = *n;
        }
    }
    return cl;
}

std::expected<ReaderConfig, ConfigErrorInfo> build_config(const CommandOptions& options) {
    ReaderConfig config;
    if (options.config_file) {
        if (auto loaded = config.load_file(*options.config_file); !loaded) {
            return std::unexpected(loaded.error());
        }
    }
    config.apply_environment();

    if (options.token) config.auth_token = *options.token;
    if (options.timeout_seconds) config.request_timeout = std::chrono::seconds(*options.timeout_seconds);
    if (options.chunk_size) config.max_chunk_size = *options.chunk_size;
    if (options.port) config.admin_gateway_port = *options.port;
    if (options.tls) config.tls_enabled = true;
    if (options.trust_store) config.trust_store = *options.trust_store;
    if (options.quiet) config.show_progress = false;

    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

ReadSegmentCommand::ReadSegmentCommand(ReaderConfig config)
    : config_(std::move(config)) {}

std::expected<ReadSegmentArgs, CliErrorInfo> ReadSegmentCommand::parse(const std::vector<std::string>& args) {
    if (args.size() < kArgCount) {
        return std::unexpected(CliErrorInfo{CliError::MissingArgument,
            std::format("{} expects {} arguments, got {}", kName, kArgCount, args.size())});
    }
    if (args.size() > kArgCount) {
        return std::unexpected(CliErrorInfo{CliError::TooManyArguments,
            std::format("{} expects {} arguments, got {}", kName, kArgCount, args.size())});
    }

    auto offset = parse_integer<int64_t>("offset", args[1]);
    if (!offset) return std::unexpected(offset.error());
    auto length = parse_integer<int64_t>("length", args[2]);
    if (!length) return std::unexpected(length.error());

    return ReadSegmentArgs{args[0], *offset, *length, args[3], args[4]};
}

std::expected<DownloadResult, DownloadErrorInfo> ReadSegmentCommand::execute(const ReadSegmentArgs& args) {
    auto endpoint = parse_endpoint(args.endpoint, config_.admin_gateway_port);
    if (!endpoint) {
        return std::unexpected(DownloadErrorInfo{DownloadError::InvalidArgument, endpoint.error().message,
            args.segment, args.offset});
    }

    std::unique_ptr<ISocket> socket;
    if (config_.tls_enabled) socket = std::make_unique<TlsSocket>(config_.trust_store);
    else socket = std::make_unique<Socket>();

    compact::Log::debug("Using segment store {}:{} ({})", endpoint->host, endpoint->port,
        config_.tls_enabled ? "TLS" : "plaintext");
    SegmentStoreClient client(std::move(*endpoint), config_.auth_token, std::move(socket));
    return execute(args, client);
}

std::expected<DownloadResult, DownloadErrorInfo> ReadSegmentCommand::execute(
    const ReadSegmentArgs& args, IRangeRequester& requester)
{
    if (auto valid = config_.validate(); !valid) {
        return std::unexpected(DownloadErrorInfo{DownloadError::InvalidArgument, valid.error().message,
            args.segment, args.offset});
    }

    DownloadConfig download_config{config_.max_chunk_size,
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.request_timeout)};
    ChunkedDownloader downloader(requester, download_config);

    ProgressCallback on_progress;
    ProgressReporter reporter;
    if (config_.show_progress) {
        on_progress = [&reporter](const DownloadProgress& p) {
            compact::Writer::progress(reporter.render(p));
        };
    }

    auto result = downloader.download(args.segment, args.offset, args.length, args.file, on_progress);
    if (!result) return result;

    // Confirmation is part of the command's output, not a log line
    compact::Writer::print(std::format("The segment data has been successfully written into {}\n", args.file.string()));
    return result;
}

} // namespace segread
