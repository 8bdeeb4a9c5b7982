#include "fastbu/fastbu.hpp"
#include <elio/runtime/scheduler.hpp>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};
std::atomic<int> g_exit_code{0};

void signal_handler(int) {
    g_running = false;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file (TOML)\n"
              << "      --host <addr>      Address advertised to peers (default: 127.0.0.1)\n"
              << "      --port <port>      Cluster port (default: 7946)\n"
              << "      --api-port <port>  HTTP API port (default: 3031)\n"
              << "      --node-id <id>     Node id (default: host:port)\n"
              << "  -s, --seed <addr>      Seed node cluster address (host:port), repeatable\n"
              << "  -d, --data-dir <path>  Storage directory (default: cache_storage)\n"
              << "      --log-level <lvl>  debug, info, warn or error\n"
              << "  -h, --help             Show this help\n"
              << "  -v, --version          Show version\n";
}

void print_version() {
    std::cout << "fastbu version " << fastbu::Version::string() << "\n"
              << "Distributed disk-backed key-value cache\n";
}

uint16_t parse_port(const std::string& value) {
    unsigned long port = std::stoul(value);
    if (port == 0 || port > 65535) {
        throw std::out_of_range("port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

}  // namespace

int main(int argc, char* argv[]) {
    fastbu::Config config;
    std::string config_file;

    // Options that take a value; the file is loaded first and these override it
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        }

        bool takes_value = arg == "-c" || arg == "--config" || arg == "--host" ||
            arg == "--port" || arg == "--api-port" || arg == "--node-id" ||
            arg == "-s" || arg == "--seed" || arg == "-d" || arg == "--data-dir" ||
            arg == "--log-level";
        if (!takes_value) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return 1;
        }

        if (arg == "-c" || arg == "--config") {
            config_file = argv[++i];
        } else {
            overrides.emplace_back(arg, argv[++i]);
        }
    }

    try {
        if (!config_file.empty()) {
            config = fastbu::Config::load(config_file);
        }

        bool seeds_overridden = false;
        for (const auto& [opt, value] : overrides) {
            if (opt == "--host") {
                config.node.host = value;
            } else if (opt == "--port") {
                config.node.port = parse_port(value);
            } else if (opt == "--api-port") {
                config.node.api_port = parse_port(value);
            } else if (opt == "--node-id") {
                config.node.id = value;
            } else if (opt == "-s" || opt == "--seed") {
                if (!seeds_overridden) {
                    config.cluster.seeds.clear();
                    seeds_overridden = true;
                }
                config.cluster.seeds.push_back(value);
            } else if (opt == "-d" || opt == "--data-dir") {
                config.storage.path = value;
            } else if (opt == "--log-level") {
                if (!fastbu::Logger::parse_level(value, config.log_level)) {
                    throw std::runtime_error("unknown log level: " + value);
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid configuration: " << status.message() << "\n";
        return 1;
    }

    fastbu::Logger::set_level(config.log_level);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    FASTBU_LOG_INFO("Starting fastbu " << fastbu::Version::string()
                    << " as " << config.node.effective_id());
    FASTBU_LOG_INFO("  Cluster port: " << config.node.port
                    << ", API port: " << config.node.api_port);
    FASTBU_LOG_INFO("  Storage: " << config.storage.path.string());
    if (!config.cluster.seeds.empty()) {
        std::string seeds;
        for (const auto& seed : config.cluster.seeds) {
            seeds += " " + seed;
        }
        FASTBU_LOG_INFO("  Seeds:" << seeds);
    }

    try {
        size_t num_threads = config.perf.worker_threads;
        if (num_threads == 0) {
            num_threads = std::thread::hardware_concurrency();
            if (num_threads == 0) num_threads = 4;
        }

        elio::runtime::scheduler sched(num_threads);

        fastbu::FastbuServer server(config);

        sched.set_io_context(&server.io_context());
        sched.start();

        auto startup_task = [&server, &sched]() -> elio::coro::task<void> {
            auto status = co_await server.start(sched);
            if (!status) {
                FASTBU_LOG_ERROR("Failed to start server: " << status.to_string());
                g_exit_code = 1;
                g_running = false;
            } else {
                FASTBU_LOG_INFO("fastbu node started");
            }
        };

        auto task = startup_task();
        sched.spawn(task.release());

        while (g_running && sched.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        FASTBU_LOG_INFO("Shutting down...");

        auto shutdown_task = [&server]() -> elio::coro::task<void> {
            co_await server.stop();
        };

        if (sched.is_running()) {
            auto stop_task = shutdown_task();
            sched.spawn(stop_task.release());

            // Wait briefly for shutdown to complete
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        sched.shutdown();

        FASTBU_LOG_INFO("fastbu node stopped");

    } catch (const std::exception& e) {
        FASTBU_LOG_ERROR("Fatal error: " << e.what());
        return 1;
    }

    return g_exit_code;
}

// FastbuServer implementation

namespace fastbu {

FastbuServer::FastbuServer(const Config& config)
    : config_(config)
    , io_ctx_()
{
    engine_ = std::make_unique<CacheEngine>(config_.storage);
    cluster_ = std::make_unique<Cluster>(config_, io_ctx_);
    coordinator_ = std::make_unique<RequestCoordinator>(*engine_, *cluster_, config_.cluster);

    // Requests forwarded by peers are served by the coordinator
    cluster_->set_forward_handler([this](protocol::Message msg) {
        return coordinator_->handle_forwarded(std::move(msg));
    });

    metrics_collector_ = std::make_unique<MetricsCollector>();
    metrics_collector_->set_engine(engine_.get());
    metrics_collector_->set_coordinator(coordinator_.get());
    metrics_collector_->set_cluster(cluster_.get());

    http_handler_ = std::make_unique<HttpHandler>(*coordinator_, *engine_, *cluster_);
    http_handler_->set_metrics_collector(metrics_collector_.get());
    http_server_ = std::make_unique<HttpServer>(config_.node, config_.http, *http_handler_);
}

FastbuServer::~FastbuServer() = default;

elio::coro::task<Status> FastbuServer::start(elio::runtime::scheduler& sched) {
    running_ = true;

    auto status = engine_->start();
    if (!status) {
        co_return status;
    }

    status = co_await cluster_->start(sched);
    if (!status) {
        co_return status;
    }

    status = co_await http_server_->start(io_ctx_, sched);
    if (!status) {
        co_return status;
    }

    co_return Status::make_ok();
}

elio::coro::task<void> FastbuServer::stop() {
    running_ = false;

    co_await http_server_->stop();
    co_await cluster_->stop();

    if (engine_->started()) {
        auto status = engine_->checkpoint();
        if (!status) {
            FASTBU_LOG_WARN("Index checkpoint at shutdown failed: " << status.to_string());
        }
    }
}

}  // namespace fastbu
