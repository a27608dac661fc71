#include "chunkup/config/config.hpp"
#include "chunkup/core/logging.hpp"
#include "chunkup/events/components.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/network/http_upload_api.hpp"
#include "chunkup/upload/coordinator.hpp"
#include "chunkup/upload/session_store.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;

using chunkup::upload::FinalizeResult;
using chunkup::upload::ProgressUpdate;
using chunkup::upload::SessionCoordinator;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [argument]\n"
              << "Commands:\n"
              << "  upload <file>        Start a new upload\n"
              << "  resume <session>     Continue an interrupted upload\n"
              << "  cancel <session>     Cancel an upload\n"
              << "  status <session>     Show local and server state\n"
              << "  list                 List journaled sessions\n"
              << "Options:\n"
              << "  -c, --config <file>     JSON client config\n"
              << "  -s, --server <h:p>      Server endpoint (default 127.0.0.1:8080)\n"
              << "  -j, --journal <dir>     Session journal directory\n"
              << "  -w, --workers <n>       Concurrent chunk uploads\n"
              << "  -a, --attempts <n>      Attempts per chunk\n"
              << "      --chunk-size <n>    Chunk size hint in bytes\n"
              << "      --no-push           Do not open the progress event channel\n"
              << "  -l, --log-level <lvl>   trace|debug|info|warn|error\n";
}

/**
 * @brief Interrupts the active run on SIGINT/SIGTERM
 *
 * The session is left Resuming and journaled, so `resume <session>`
 * picks it up later.
 */
class InterruptGuard {
public:
    explicit InterruptGuard(SessionCoordinator& coordinator)
        : coordinator_(coordinator), signals_(io_context_, SIGINT, SIGTERM) {
        signals_.async_wait([this](boost::system::error_code ec, int) {
            if (ec) {
                return;
            }
            std::lock_guard lock(mutex_);
            if (!session_id_.empty()) {
                spdlog::warn("Interrupting upload {}", session_id_);
                auto result = coordinator_.interrupt(session_id_);
                if (result.is_error()) {
                    spdlog::warn("Interrupt failed: {}", chunkup::describe(result.error()));
                }
            }
        });
        thread_ = std::thread([this]() { io_context_.run(); });
    }

    ~InterruptGuard() {
        boost::system::error_code ignored;
        signals_.cancel(ignored);
        io_context_.stop();
        thread_.join();
    }

    void watch(const std::string& session_id) {
        std::lock_guard lock(mutex_);
        session_id_ = session_id;
    }

private:
    SessionCoordinator& coordinator_;
    asio::io_context io_context_;
    asio::signal_set signals_;
    std::thread thread_;
    std::mutex mutex_;
    std::string session_id_;
};

void print_progress(const ProgressUpdate& update) {
    std::cout << "\rchunk " << update.index << " acked: "
              << update.uploaded_count << "/" << update.total_count << std::flush;
    if (update.uploaded_count == update.total_count) {
        std::cout << "\n";
    }
}

int report(const std::string& session_id, const chunkup::Result<FinalizeResult>& result) {
    if (result.is_ok()) {
        std::cout << "\nUpload complete\n"
                  << "  session:  " << session_id << "\n"
                  << "  artifact: " << result.value().artifact_id << "\n"
                  << "  bytes:    " << result.value().total_bytes.value_or(0) << "\n"
                  << "  hash:     " << result.value().content_hash << "\n";
        return 0;
    }

    const auto& error = result.error();
    std::cerr << "\n" << chunkup::describe(error) << "\n";
    if (error.code == chunkup::ErrorCode::Interrupted || chunkup::is_transient(error)) {
        std::cerr << "Resume with: resume " << session_id << "\n";
    }
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> config_path;
    std::optional<std::string> server;
    std::optional<fs::path> journal;
    std::optional<std::size_t> workers;
    std::optional<std::uint32_t> attempts;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::string> log_level;
    bool no_push = false;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = fs::path(argv[++i]);
            } else if ((arg == "-s" || arg == "--server") && i + 1 < argc) {
                server = argv[++i];
            } else if ((arg == "-j" || arg == "--journal") && i + 1 < argc) {
                journal = fs::path(argv[++i]);
            } else if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
                workers = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if ((arg == "-a" || arg == "--attempts") && i + 1 < argc) {
                attempts = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--chunk-size" && i + 1 < argc) {
                chunk_size = std::stoull(argv[++i]);
            } else if (arg == "--no-push") {
                no_push = true;
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                log_level = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 2;
            } else {
                positional.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
        return 2;
    }

    if (positional.empty() || (positional[0] != "list" && positional.size() != 2)) {
        print_usage(argv[0]);
        return 2;
    }
    const std::string& command = positional[0];

    chunkup::config::ClientConfig config;
    if (config_path) {
        auto loaded = chunkup::config::load_client_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("Failed to load config: {}", chunkup::describe(loaded.error()));
            return 1;
        }
        config = std::move(loaded.value());
    }
    if (server) config.server = *server;
    if (journal) config.journal_dir = *journal;
    if (workers && *workers > 0) config.upload.scheduler.worker_count = *workers;
    if (attempts && *attempts > 0) config.upload.retry.max_attempts = *attempts;
    if (chunk_size) config.upload.chunk_size_hint = *chunk_size;
    if (log_level) config.log_level = *log_level;
    if (no_push) config.push_notifications = false;

    auto logging = chunkup::configure_logging(config.log_level);
    if (logging.is_error()) {
        spdlog::error("{}", chunkup::describe(logging.error()));
        return 1;
    }

    auto endpoint = chunkup::network::Endpoint::parse(config.server);
    if (endpoint.is_error()) {
        spdlog::error("{}", chunkup::describe(endpoint.error()));
        return 2;
    }

    chunkup::events::EventBus event_bus;
    chunkup::events::LoggerComponent logger(event_bus);
    chunkup::events::MetricsComponent metrics(event_bus);

    chunkup::network::HttpUploadApi api(endpoint.value(), config.request_timeout);
    chunkup::upload::SessionStore store(config.journal_dir);
    SessionCoordinator coordinator(api, store, event_bus);
    if (config.push_notifications) {
        coordinator.set_channel_connector(chunkup::network::http_channel_connector(endpoint.value()));
    }

    if (command == "list") {
        for (const auto& id : store.list()) {
            auto session = coordinator.find(id);
            if (session.is_ok()) {
                auto snapshot = session.value()->snapshot();
                std::cout << id << "  " << chunkup::upload::to_string(snapshot.status) << "  "
                          << snapshot.uploaded_chunks.size() << "/" << snapshot.total_chunks
                          << "  " << snapshot.file.name << "\n";
            } else {
                std::cout << id << "  (unreadable: " << session.error().message << ")\n";
            }
        }
        return 0;
    }

    const std::string& target = positional[1];

    if (command == "upload") {
        auto session = coordinator.initialize_file(target, config.upload);
        if (session.is_error()) {
            std::cerr << chunkup::describe(session.error()) << "\n";
            return 1;
        }
        const std::string session_id = session.value()->session_id();
        std::cout << "Session " << session_id << ": " << session.value()->total_chunks()
                  << " chunks of " << session.value()->chunk_size() << " bytes\n";

        InterruptGuard guard(coordinator);
        guard.watch(session_id);
        auto result = coordinator.upload(session_id, print_progress);
        metrics.print_stats();
        return report(session_id, result);
    }

    if (command == "resume") {
        InterruptGuard guard(coordinator);
        guard.watch(target);
        auto result = coordinator.resume(target, print_progress);
        metrics.print_stats();
        return report(target, result);
    }

    if (command == "cancel") {
        auto result = coordinator.cancel(target);
        if (result.is_error()) {
            std::cerr << chunkup::describe(result.error()) << "\n";
            return 1;
        }
        std::cout << "Session " << target << " cancelled\n";
        return 0;
    }

    if (command == "status") {
        int exit_code = 1;
        auto local = coordinator.find(target);
        if (local.is_ok()) {
            auto snapshot = local.value()->snapshot();
            std::cout << "local:  " << chunkup::upload::to_string(snapshot.status) << ", "
                      << snapshot.uploaded_chunks.size() << "/" << snapshot.total_chunks << " chunks\n";
            for (const auto& record : snapshot.errors) {
                std::cout << "        error " << chunkup::to_string(record.code) << ": " << record.message << "\n";
            }
            exit_code = 0;
        } else {
            std::cout << "local:  " << local.error().message << "\n";
        }

        auto remote = api.status(target);
        if (remote.is_ok()) {
            const auto& status = remote.value();
            auto held = chunkup::upload::accepted_chunks(status);
            std::cout << "server: " << chunkup::upload::to_string(status.state) << ", ";
            if (held.is_ok()) {
                std::cout << held.value().size() << "/" << status.total_chunks << " chunks";
            } else {
                std::cout << held.error().message;
            }
            if (status.artifact_id) {
                std::cout << ", artifact " << *status.artifact_id;
            }
            std::cout << "\n";
            exit_code = 0;
        } else {
            std::cout << "server: " << chunkup::describe(remote.error()) << "\n";
        }
        return exit_code;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 2;
}
