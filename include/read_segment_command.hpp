#pragma once

#include "chunked_downloader.hpp"
#include "reader_config.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace segread {

enum class CliError {
    MissingArgument,
    TooManyArguments,
    InvalidNumber,
    UnknownOption
};

struct CliErrorInfo {
    CliError error;
    std::string message;
};

struct CommandOptions {
    std::optional<std::filesystem::path> config_file;
    std::optional<std::string> token;
    std::optional<int64_t> timeout_seconds;
    std::optional<int64_t> chunk_size;
    std::optional<uint16_t> port;
    std::optional<std::filesystem::path> trust_store;
    bool tls = false;
    bool quiet = false;
    bool verbose = false;
};

struct CommandLine {
    std::string command;
    std::vector<std::string> args;
    CommandOptions options;
};

// Splits "--option value" pairs from positional arguments. Arguments that
// merely start with a single '-' (such as "-5") stay positional.
std::expected<CommandLine, CliErrorInfo> parse_command_line(const std::vector<std::string>& argv);

// Defaults, then the config file, then the environment, then options.
std::expected<ReaderConfig, ConfigErrorInfo> build_config(const CommandOptions& options);

struct ReadSegmentArgs {
    std::string segment;
    int64_t offset = 0;
    int64_t length = 0;
    std::string endpoint;
    std::filesystem::path file;
};

// read-segment <qualified-segment-name> <offset> <length> <segmentstore-endpoint> <file-name>
class ReadSegmentCommand {
public:
    static constexpr size_t kArgCount = 5;
    static constexpr const char* kName = "read-segment";

    explicit ReadSegmentCommand(ReaderConfig config);

    static std::expected<ReadSegmentArgs, CliErrorInfo> parse(const std::vector<std::string>& args);

    // Connects to the endpoint named in args
    std::expected<DownloadResult, DownloadErrorInfo> execute(const ReadSegmentArgs& args);
    std::expected<DownloadResult, DownloadErrorInfo> execute(const ReadSegmentArgs& args, IRangeRequester& requester);

private:
    ReaderConfig config_;
};

} // namespace segread
