#include "leastrecent/capacity.hpp"
#include "leastrecent/lru_cache.hpp"
#include "leastrecent/settings.hpp"
#include <iostream>
#include <vector>
#include <string>
#include <random>
#include <chrono>
#include <cstdint>
#include <cxxopts.hpp>

struct BenchConfig {
    std::size_t capacity = 1024;
    std::uint64_t num_ops = 1000000;
    std::uint32_t num_keys = 4096;
    double get_ratio = 0.8;
    std::uint32_t seed = 1234;
    bool verbose = false;
};

struct Stats {
    std::uint64_t num_sets = 0;
    std::uint64_t num_gets = 0;
    std::uint64_t cache_hits = 0;
    std::uint64_t evictions = 0;
};

std::vector<std::string> generate_keys(std::uint32_t count) {
    std::vector<std::string> keys;
    keys.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        keys.push_back("key:" + std::to_string(i));
    }
    return keys;
}

// Skewed toward low indices so a cache smaller than the key pool still hits.
std::uint32_t pick_key(std::mt19937& rng, std::uint32_t num_keys) {
    std::exponential_distribution<double> dist(4.0 / num_keys);
    auto k = static_cast<std::uint64_t>(dist(rng));
    return static_cast<std::uint32_t>(k % num_keys);
}

void run_workload(leastrecent::LRUCache<std::string, std::uint64_t>& cache,
                  const BenchConfig& cfg,
                  const std::vector<std::string>& keys,
                  Stats& stats) {
    std::mt19937 rng(cfg.seed);
    std::uniform_real_distribution<> op_dist(0.0, 1.0);

    for (std::uint64_t i = 0; i < cfg.num_ops; ++i) {
        const auto& key = keys[pick_key(rng, cfg.num_keys)];

        if (op_dist(rng) < cfg.get_ratio) {
            stats.num_gets++;
            if (cache.Get(key)) {
                stats.cache_hits++;
            }
        } else {
            stats.num_sets++;
            cache.Set(key, i);
        }
    }
}

int main(int argc, char** argv) {
    cxxopts::Options options("least_recent_bench", "Benchmark tool for LRUCache");
    options.add_options()
        ("c,capacity", "Cache capacity (entries)", cxxopts::value<std::string>()->default_value(
            leastrecent::GetEnv("LEAST_RECENT_BENCH_CAPACITY", "1024")))
        ("n,ops", "Total number of operations", cxxopts::value<std::uint64_t>()->default_value("1000000"))
        ("k,keys", "Size of the key pool", cxxopts::value<std::uint32_t>()->default_value("4096"))
        ("g,get-ratio", "Ratio of GET operations (0.0 to 1.0)", cxxopts::value<double>()->default_value("0.8"))
        ("s,seed", "Random seed", cxxopts::value<std::uint32_t>()->default_value("1234"))
        ("v,verbose", "Dump the final cache head", cxxopts::value<bool>()->default_value(
            leastrecent::GetEnvBool("LEAST_RECENT_BENCH_VERBOSE", false) ? "true" : "false"))
        ("h,help", "Print usage");

    BenchConfig cfg;
    leastrecent::Options cache_options;
    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        cfg.capacity = leastrecent::ParseCapacity(result["capacity"].as<std::string>());
        cfg.num_ops = result["ops"].as<std::uint64_t>();
        cfg.num_keys = result["keys"].as<std::uint32_t>();
        cfg.get_ratio = result["get-ratio"].as<double>();
        cfg.seed = result["seed"].as<std::uint32_t>();
        cfg.verbose = result["verbose"].as<bool>();
        leastrecent::ApplyOptionDefaults(cache_options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (cfg.num_keys == 0) {
        std::cerr << "Error: --keys must be positive" << std::endl;
        return 1;
    }

    std::cout << "--- Benchmark Configuration ---" << std::endl;
    std::cout << "Capacity: " << cfg.capacity << std::endl;
    std::cout << "Total Ops: " << cfg.num_ops << std::endl;
    std::cout << "Key Pool: " << cfg.num_keys << std::endl;
    std::cout << "GET Ratio: " << cfg.get_ratio << std::endl;
    std::cout << "Seed: " << cfg.seed << std::endl;
    std::cout << "Handler Policy: " << leastrecent::ToString(*cache_options.handler_failure_policy) << std::endl;
    std::cout << "-----------------------------" << std::endl;

    const auto keys = generate_keys(cfg.num_keys);
    leastrecent::LRUCache<std::string, std::uint64_t> cache(cfg.capacity, cache_options);

    Stats stats;
    auto subscription = cache.OnEvicted([&stats](const std::string&, const std::uint64_t&) {
        stats.evictions++;
    });

    auto start_time = std::chrono::high_resolution_clock::now();
    run_workload(cache, cfg, keys, stats);
    auto end_time = std::chrono::high_resolution_clock::now();
    double total_duration_s = std::chrono::duration<double>(end_time - start_time).count();

    subscription.Unsubscribe();

    double hit_rate = (stats.num_gets > 0) ? (double)stats.cache_hits / stats.num_gets * 100.0 : 0.0;
    double ops_per_sec = (total_duration_s > 0) ? cfg.num_ops / total_duration_s : 0.0;

    std::cout << "----------- Results -----------" << std::endl;
    std::cout << "Total duration: " << total_duration_s << " s" << std::endl;
    std::cout << "Operations per second: " << ops_per_sec << std::endl;
    std::cout << "GET operations: " << stats.num_gets << std::endl;
    std::cout << "SET operations: " << stats.num_sets << std::endl;
    std::cout << "Cache hit rate: " << hit_rate << " %" << std::endl;
    std::cout << "Evictions: " << stats.evictions << std::endl;
    std::cout << "Final size: " << cache.Size() << " / " << cache.Capacity() << std::endl;
    std::cout << "Link footprint: " << cache.Footprint() << " bytes" << std::endl;
    std::cout << "-----------------------------" << std::endl;

    if (cfg.verbose) {
        auto entries = cache.Entries();
        for (int i = 0; i < 10; ++i) {
            auto entry = entries.Next();
            if (!entry) break;
            std::cout << "> " << entry->first << ": " << entry->second << std::endl;
        }
    }

    if (!cache.Validate()) {
        std::cerr << "Error: cache invariants violated after workload" << std::endl;
        return 2;
    }

    return 0;
}
