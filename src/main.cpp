#include "compact_log.hpp"
#include "read_segment_command.hpp"
#include <chrono>
#include <format>
#include <iostream>
#include <string>
#include <vector>

using namespace segread;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    CommandLine cl;
    ReadSegmentArgs read_args;
    ReaderConfig config;
    int exit_code = 0;
    bool show_usage = false;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    DownloadResult result;
};

void print_usage(const char* program_name) {
    std::cout << "Segment range reader (C++23)\n\n"
              << "Usage: " << program_name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  read-segment <qualified-segment-name> <offset> <length> <segmentstore-endpoint> <file-name>\n"
              << "        Read a range from a given segment into the given file.\n"
              << "        qualified-segment-name  Fully qualified segment name (e.g., scope/stream/0.#epoch.0)\n"
              << "        offset                  Starting point of the read within the segment\n"
              << "        length                  Number of bytes to read\n"
              << "        segmentstore-endpoint   host[:port] of the segment store admin gateway\n"
              << "        file-name               File to write into; must not exist\n"
              << "  help                           Show this message\n\n"
              << "Options:\n"
              << "  --config <file>              Properties file with reader settings\n"
              << "  --token <token>              Delegation token (or SEGREAD_AUTH_TOKEN)\n"
              << "  --timeout <seconds>          Per-request timeout (default 10)\n"
              << "  --chunk-size <bytes>         Maximum bytes per request (default 2097152)\n"
              << "  --port <port>                Admin gateway port when the endpoint has none (default 9999)\n"
              << "  --tls                        Connect over TLS\n"
              << "  --truststore <pem>           CA bundle used to verify the segment store\n"
              << "  --quiet                      No progress output\n"
              << "  --verbose                    Debug logging\n";
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (ctx.argc < 2) {
                    ctx.exit_code = 1;
                    ctx.show_usage = true;
                    state = FSMState::Error;
                } else {
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                auto cl = parse_command_line(std::vector<std::string>(ctx.argv + 1, ctx.argv + ctx.argc));
                if (!cl) {
                    ctx.exit_code = 1;
                    ctx.error_message = cl.error().message;
                    ctx.show_usage = true;
                    state = FSMState::Error;
                    break;
                }
                ctx.cl = std::move(*cl);
                state = FSMState::PreCommand;
                break;
            }
            case FSMState::PreCommand: {
                if (ctx.cl.command == "help" || ctx.cl.command.empty()) {
                    print_usage(ctx.argv[0]);
                    state = FSMState::Done;
                    break;
                }
                if (ctx.cl.command != ReadSegmentCommand::kName) {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown command: " + ctx.cl.command;
                    ctx.show_usage = true;
                    state = FSMState::Error;
                    break;
                }

                if (ctx.cl.options.verbose) compact::Log::set_level(compact::Level::Debug);
                else if (ctx.cl.options.quiet) compact::Log::set_level(compact::Level::Warn);

                // Arguments are checked before any network or file activity
                auto args = ReadSegmentCommand::parse(ctx.cl.args);
                if (!args) {
                    ctx.exit_code = 1;
                    ctx.error_message = args.error().message;
                    ctx.show_usage = args.error().error != CliError::InvalidNumber;
                    state = FSMState::Error;
                    break;
                }
                ctx.read_args = std::move(*args);

                auto config = build_config(ctx.cl.options);
                if (!config) {
                    ctx.exit_code = 1;
                    ctx.error_message = config.error().message;
                    state = FSMState::Error;
                    break;
                }
                ctx.config = std::move(*config);
                compact::Log::debug("PreCommand checks passed for '{}'", ctx.cl.command);
                state = FSMState::RunCommand;
                break;
            }
            case FSMState::RunCommand: {
                ReadSegmentCommand command(ctx.config);
                auto res = command.execute(ctx.read_args);
                if (!res) {
                    ctx.exit_code = 1;
                    ctx.error_message = std::format("{}: {}", to_string(res.error().error), res.error().message);
                    state = FSMState::Error;
                    break;
                }
                ctx.result = *res;
                state = FSMState::PostCommand;
                break;
            }
            case FSMState::PostCommand:
                ctx.end_time = std::chrono::steady_clock::now();
                {
                    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ctx.end_time - ctx.start_time).count();
                    compact::Log::debug("{} bytes in {} requests, elapsed: {} ms",
                        ctx.result.bytes_written, ctx.result.requests_issued, ms);
                }
                state = FSMState::Done;
                break;
            case FSMState::Error:
                if (!ctx.error_message.empty()) compact::Log::error("{}", ctx.error_message);
                if (ctx.show_usage) print_usage(ctx.argv[0]);
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
