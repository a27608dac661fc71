#include "chunkup/config/config.hpp"
#include "chunkup/core/logging.hpp"
#include "chunkup/events/components.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/events.hpp"
#include "chunkup/network/http_router.hpp"
#include "chunkup/network/http_server_asio.hpp"
#include "chunkup/server/http_endpoints.hpp"
#include "chunkup/server/upload_server.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using chunkup::network::HttpContext;
using chunkup::network::HttpMethodUtils;
using chunkup::network::HttpResponse;
using chunkup::network::HttpRouter;
using chunkup::network::HttpServerAsio;

namespace asio = boost::asio;
namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config <file>     JSON server config\n"
              << "  -a, --address <addr>    Bind address (default 0.0.0.0)\n"
              << "  -p, --port <port>       Listen port (default 8080)\n"
              << "  -d, --data <dir>        Data root holding staging/ and artifacts/\n"
              << "  -t, --threads <n>       Event loop threads (default 4)\n"
              << "  -l, --log-level <lvl>   trace|debug|info|warn|error\n";
}

void schedule_sweep(asio::steady_timer& timer, std::chrono::seconds interval,
                    chunkup::server::UploadServer& server) {
    timer.expires_after(interval);
    timer.async_wait([&timer, interval, &server](boost::system::error_code ec) {
        if (ec) {
            return;
        }
        auto swept = server.sweep();
        if (swept > 0) {
            spdlog::info("Sweep expired or removed {} session(s)", swept);
        }
        schedule_sweep(timer, interval, server);
    });
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> config_path;
    std::optional<std::string> address;
    std::optional<uint16_t> port;
    std::optional<fs::path> data_root;
    std::optional<std::size_t> threads;
    std::optional<std::string> log_level;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = fs::path(argv[++i]);
            } else if ((arg == "-a" || arg == "--address") && i + 1 < argc) {
                address = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
                data_root = fs::path(argv[++i]);
            } else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
                threads = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                log_level = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        return 2;
    }

    chunkup::config::ServerConfig config;
    if (config_path) {
        auto loaded = chunkup::config::load_server_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("Failed to load config: {}", chunkup::describe(loaded.error()));
            return 1;
        }
        config = std::move(loaded.value());
    }
    if (address) config.address = *address;
    if (port) config.port = *port;
    if (threads && *threads > 0) config.threads = *threads;
    if (log_level) config.log_level = *log_level;
    if (data_root) {
        config.storage.staging_root = *data_root / "staging";
        config.storage.artifact_root = *data_root / "artifacts";
    }

    auto logging = chunkup::configure_logging(config.log_level);
    if (logging.is_error()) {
        spdlog::error("{}", chunkup::describe(logging.error()));
        return 1;
    }

    std::error_code fs_error;
    fs::create_directories(config.storage.staging_root, fs_error);
    if (!fs_error) {
        fs::create_directories(config.storage.artifact_root, fs_error);
    }
    if (fs_error) {
        spdlog::error("Cannot create data directories: {}", fs_error.message());
        return 1;
    }

    chunkup::events::EventBus event_bus;
    chunkup::events::LoggerComponent logger(event_bus);
    chunkup::events::MetricsComponent metrics(event_bus);

    chunkup::server::UploadServer upload_server(config.storage, event_bus);

    HttpRouter router;
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::debug("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });
    chunkup::server::register_upload_routes(router, upload_server);

    asio::io_context io_context;
    std::optional<HttpServerAsio> http_server;
    try {
        http_server.emplace(io_context, config.address, config.port,
                            config.storage.max_chunk_size + 64 * 1024);
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to listen on {}:{}: {}", config.address, config.port, e.what());
        return 1;
    }
    http_server->set_handler([&router](const chunkup::network::HttpRequest& request) {
        return router.handle_request(request);
    });

    asio::steady_timer sweep_timer(io_context);
    schedule_sweep(sweep_timer, config.sweep_interval, upload_server);

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](boost::system::error_code ec, int signal_number) {
        if (ec) {
            return;
        }
        event_bus.emit(chunkup::events::ServerShuttingDownEvent{"signal " + std::to_string(signal_number)});
        http_server->stop();
        sweep_timer.cancel();
        io_context.stop();
    });

    event_bus.emit(chunkup::events::ServerStartedEvent{http_server->port()});

    std::vector<std::thread> workers;
    for (std::size_t i = 1; i < config.threads; ++i) {
        workers.emplace_back([&io_context]() { io_context.run(); });
    }
    io_context.run();
    for (auto& worker : workers) {
        worker.join();
    }

    metrics.print_stats();
    return 0;
}
