/**
 * @file main.cpp
 * @brief chsync-upload: mirror a local folder into a Telegram channel
 *
 * Run with:
 *   CHSYNC_BOT_TOKEN=... ./build/chsync-upload --folder ./docs --channel @mychannel
 *   ./build/chsync-upload --folder ./docs --channel @mychannel --update
 *   ./build/chsync-upload --status
 *
 * Exit codes: 0 success, 1 failure, 2 usage error, 130 cancelled.
 */

#include "chsync/core/cancellation.hpp"
#include "chsync/core/config.hpp"
#include "chsync/events/components.hpp"
#include "chsync/events/event_bus.hpp"
#include "chsync/events/observer.hpp"
#include "chsync/network/http_client.hpp"
#include "chsync/remote/index_client.hpp"
#include "chsync/remote/retry_policy.hpp"
#include "chsync/sync/orchestrator.hpp"
#include "chsync/sync/worker.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>

using namespace chsync;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

// Global token for signal handling
CancellationToken* g_token = nullptr;

void signal_handler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_token != nullptr) {
        g_token->cancel();
    }
}

struct CliOptions {
    std::string folder;
    std::string channel;
    std::string token;
    std::string server;
    std::string config_path;
    bool update = false;
    bool status = false;
    bool verbose = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --folder <path>     Local folder to upload\n";
    std::cout << "  --channel <id>      Destination channel (@name or -100XXXXXXXXXX)\n";
    std::cout << "  --token <token>     Bot token (default: CHSYNC_BOT_TOKEN)\n";
    std::cout << "  --update            Upload only what changed since the last run\n";
    std::cout << "  --status            Show what the index server knows about this bot\n";
    std::cout << "  --server <url>      Index server base URL\n";
    std::cout << "  --config <file>     JSON settings file\n";
    std::cout << "  --verbose           Debug logging\n";
    std::cout << "  --help              Show this help\n";
}

// Returns nullopt and prints the problem when argv is malformed
std::optional<CliOptions> parse_arguments(int argc, char* argv[], bool& help_requested) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto take_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            help_requested = true;
            return options;
        } else if (arg == "--folder") {
            if (!take_value(options.folder)) return std::nullopt;
        } else if (arg == "--channel") {
            if (!take_value(options.channel)) return std::nullopt;
        } else if (arg == "--token") {
            if (!take_value(options.token)) return std::nullopt;
        } else if (arg == "--server") {
            if (!take_value(options.server)) return std::nullopt;
        } else if (arg == "--config") {
            if (!take_value(options.config_path)) return std::nullopt;
        } else if (arg == "--update") {
            options.update = true;
        } else if (arg == "--status") {
            options.status = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else {
            spdlog::error("Unknown option: {}", arg);
            return std::nullopt;
        }
    }
    return options;
}

int show_status(const Settings& settings, const CancellationToken& token) {
    network::HttpClient transport;
    remote::SteadySleeper sleeper;
    remote::RetryPolicy retry(settings.retry, sleeper, token);
    remote::IndexClient index(transport, retry, settings);

    auto status = index.fetch_status(settings.credential);
    transport.close();
    if (status.is_error()) {
        if (status.error().kind == remote::ErrorKind::NotFound) {
            spdlog::warn("This bot is not registered with the index server");
            return kExitFailure;
        }
        spdlog::error("Cannot fetch status: {}", status.error().describe());
        return status.error().kind == remote::ErrorKind::Cancelled ? kExitCancelled : kExitFailure;
    }

    const auto& info = status.value();
    spdlog::info("Bot: {} ({})", info.bot_username, info.bot_id);
    spdlog::info("Status: {}", info.status);
    spdlog::info("Owner registered: {}", info.owner_registered ? "yes" : "no");
    spdlog::info("Metadata stored: {}", info.metadata ? "yes" : "no");
    return kExitSuccess;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    bool help_requested = false;
    auto parsed = parse_arguments(argc, argv, help_requested);
    if (!parsed) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (help_requested) {
        print_usage(argv[0]);
        return kExitSuccess;
    }
    const auto& options = *parsed;

    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    // Settings: defaults, then file, then environment, then flags
    Settings settings;
    if (!options.config_path.empty()) {
        auto loaded = Settings::load_file(options.config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return kExitUsage;
        }
        settings = std::move(loaded.value());
    }
    settings.apply_environment();
    if (!options.token.empty()) {
        settings.credential = options.token;
    }
    if (!options.server.empty()) {
        settings.index_server_url = options.server;
    }

    auto valid = settings.validate();
    if (valid.is_error()) {
        spdlog::error("Invalid settings: {}", valid.error());
        return kExitUsage;
    }

    if (!is_valid_credential(settings.credential)) {
        spdlog::error("Missing or malformed bot token. Use --token or CHSYNC_BOT_TOKEN");
        return kExitUsage;
    }

    CancellationToken token;
    g_token = &token;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (options.status) {
        return show_status(settings, token);
    }

    if (options.folder.empty() || options.channel.empty()) {
        spdlog::error("--folder and --channel are required");
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (!is_valid_destination_id(options.channel)) {
        spdlog::error("Invalid channel ID format. Use @channelname or -100XXXXXXXXXX");
        return kExitUsage;
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);
    events::BusObserver observer(bus);

    network::HttpClient transfer_transport;
    network::HttpClient index_transport;
    remote::SteadySleeper sleeper;

    sync::UploadOrchestrator orchestrator(transfer_transport, index_transport, settings, observer, token, sleeper);
    sync::UploadWorker worker(orchestrator);

    sync::UploadRequest request;
    request.credential = settings.credential;
    request.destination_id = options.channel;
    request.root = options.folder;
    request.mode = options.update ? sync::UploadMode::Update : sync::UploadMode::Fresh;

    spdlog::info("Uploading {} to {}{}", options.folder, options.channel, options.update ? " (update)" : "");

    auto started = worker.start(request);
    if (started.is_error()) {
        spdlog::error("{}", started.error());
        return kExitFailure;
    }

    auto finished = worker.wait();
    g_token = nullptr;
    if (finished.is_error()) {
        spdlog::error("{}", finished.error());
        return kExitFailure;
    }

    if (options.verbose) {
        metrics.print_stats();
    }

    const auto& result = finished.value();
    switch (result.outcome) {
        case sync::RunOutcome::Succeeded:
            return kExitSuccess;
        case sync::RunOutcome::Cancelled:
            return kExitCancelled;
        case sync::RunOutcome::Failed:
            break;
    }
    return kExitFailure;
}
