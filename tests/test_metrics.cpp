#include <catch2/catch_test_macros.hpp>
#include "fastbu/metrics.hpp"
#include "fastbu/cache_engine.hpp"
#include <filesystem>
#include <random>
#include <thread>
#include <vector>

using namespace fastbu;

TEST_CASE("Counter operations", "[metrics]") {
    Counter counter;

    SECTION("Initial value is zero") {
        REQUIRE(counter.get() == 0);
    }

    SECTION("Increment") {
        counter.inc();
        counter.inc(10);
        REQUIRE(counter.get() == 11);
    }

    SECTION("Mirrored value") {
        counter.set(42);
        REQUIRE(counter.get() == 42);
        counter.reset();
        REQUIRE(counter.get() == 0);
    }

    SECTION("Thread safety") {
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&counter]() {
                for (int j = 0; j < 1000; ++j) {
                    counter.inc();
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(counter.get() == 8000);
    }
}

TEST_CASE("Gauge operations", "[metrics]") {
    Gauge gauge;
    REQUIRE(gauge.get() == 0.0);

    gauge.set(10.0);
    gauge.inc(5.0);
    REQUIRE(gauge.get() == 15.0);
    gauge.dec(3.0);
    REQUIRE(gauge.get() == 12.0);
}

TEST_CASE("LatencyHistogram operations", "[metrics]") {
    LatencyHistogram histogram;

    SECTION("Initial state") {
        auto snap = histogram.snapshot();
        REQUIRE(snap.count == 0);
        REQUIRE(snap.sum == 0.0);
    }

    SECTION("Buckets are cumulative") {
        histogram.observe(0.05);
        histogram.observe(0.5);
        histogram.observe(5.0);
        histogram.observe(20000.0);  // Only in +Inf

        auto snap = histogram.snapshot();
        REQUIRE(snap.count == 4);

        bool found_1ms_bucket = false;
        for (const auto& [bound, count] : snap.buckets) {
            if (bound == 1.0) {
                REQUIRE(count == 2);
                found_1ms_bucket = true;
            }
        }
        REQUIRE(found_1ms_bucket);
        REQUIRE(snap.buckets.back().second == 4);
    }

    SECTION("Reset") {
        histogram.observe(1.0);
        histogram.reset();
        auto snap = histogram.snapshot();
        REQUIRE(snap.count == 0);
        REQUIRE(snap.sum == 0.0);
    }
}

TEST_CASE("LatencyTimer RAII", "[metrics]") {
    LatencyHistogram histogram;
    {
        FASTBU_TIME_OPERATION(histogram);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    auto snap = histogram.snapshot();
    REQUIRE(snap.count == 1);
    REQUIRE(snap.sum >= 10.0);
}

TEST_CASE("MetricsCollector export", "[metrics]") {
    MetricsCollector collector;

    SECTION("Prometheus format") {
        std::string output = collector.export_prometheus();

        REQUIRE(output.find("fastbu_cache_hits_total") != std::string::npos);
        REQUIRE(output.find("fastbu_route_forwarded_total") != std::string::npos);
        REQUIRE(output.find("fastbu_cluster_nodes_alive") != std::string::npos);
        REQUIRE(output.find("fastbu_get_latency_ms_bucket{le=\"+Inf\"}") != std::string::npos);
        REQUIRE(output.find("fastbu_uptime_seconds") != std::string::npos);

        REQUIRE(output.find("# HELP") != std::string::npos);
        REQUIRE(output.find("# TYPE fastbu_cache_hits_total counter") != std::string::npos);
    }

    SECTION("JSON format") {
        std::string output = collector.export_json();

        REQUIRE(output.find("\"cache\"") != std::string::npos);
        REQUIRE(output.find("\"routing\"") != std::string::npos);
        REQUIRE(output.find("\"cluster\"") != std::string::npos);
        REQUIRE(output.find("\"uptime_seconds\"") != std::string::npos);
    }
}

TEST_CASE("MetricsCollector pulls engine statistics", "[metrics]") {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("fastbu_metrics_test_" + std::to_string(rd()));

    {
        StorageConfig config;
        config.path = dir;
        config.sync_writes = false;
        CacheEngine engine(config);
        REQUIRE(engine.start().ok());

        std::string value = "abc";
        REQUIRE(engine.set(CacheKey("k"), ByteBuffer(value.begin(), value.end())).ok());
        REQUIRE(engine.get(CacheKey("k")).is_hit());

        MetricsCollector collector;
        collector.set_engine(&engine);
        collector.collect();

        REQUIRE(metrics().cache_sets_total.get() == 1);
        REQUIRE(metrics().cache_hits_total.get() == 1);
        REQUIRE(metrics().bytes_written_total.get() == 3);
        REQUIRE(metrics().cache_entries.get() == 1.0);
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
