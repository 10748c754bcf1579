#include "montecarlo/mc_runner.hpp"
#include "montecarlo/sim_rng.hpp"
#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace gacha::mc {

MCRunner::MCRunner(const GachaConfig& config, const RunOptions& options)
    : config_(config),
      options_(options),
      num_runs_(options.num_runs > 0 ? options.num_runs : config.num_lifetimes),
      base_seed_(options.override_seed ? options.base_seed : config.base_seed),
      simulator_(config) {}

int32_t MCRunner::seed_for(int run_index) const {
    return static_cast<int32_t>(static_cast<uint32_t>(base_seed_) +
                                static_cast<uint32_t>(run_index));
}

void MCRunner::run_range(int begin, int end, Aggregator& agg,
                         const std::function<void()>& on_done) const {
    SimRNG rng;
    for (int i = begin; i < end; i++) {
        rng.setSeed(seed_for(i));
        agg.add_result(simulator_.run(rng));
        if (on_done) on_done();
    }
}

Aggregator MCRunner::run(const ProgressCallback& on_progress) const {
    const int threads = std::max(1, std::min(options_.threads, num_runs_));

    if (options_.verbose) {
        std::cerr << "Running " << num_runs_ << " lifetimes (seed=" << base_seed_
                  << ", threads=" << threads << ")...\n";
    }

    // ── Single-threaded ──
    if (threads == 1) {
        Aggregator agg(config_);
        int completed = 0;
        run_range(0, num_runs_, agg, [&]() {
            completed++;
            if (on_progress) on_progress(completed, num_runs_);
        });
        return agg;
    }

    // ── Contiguous chunks, one per worker ──
    std::vector<Aggregator> partials(threads, Aggregator(config_));
    std::vector<std::exception_ptr> errors(threads);
    std::mutex progress_mutex;
    int completed = 0;

    auto report = [&]() {
        std::lock_guard<std::mutex> lock(progress_mutex);
        completed++;
        if (on_progress) on_progress(completed, num_runs_);
    };

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (int w = 0; w < threads; w++) {
        int begin = static_cast<int>(static_cast<long long>(num_runs_) * w / threads);
        int end = static_cast<int>(static_cast<long long>(num_runs_) * (w + 1) / threads);
        workers.emplace_back([&, w, begin, end]() {
            try {
                run_range(begin, end, partials[w], report);
            } catch (...) {
                errors[w] = std::current_exception();
            }
        });
    }
    for (auto& t : workers) t.join();

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    Aggregator agg = std::move(partials[0]);
    for (int w = 1; w < threads; w++) {
        agg.merge(partials[w]);
    }

    if (options_.verbose) {
        std::cerr << "Merged " << threads << " worker aggregates ("
                  << agg.runs_added() << " lifetimes)\n";
    }
    return agg;
}

} // namespace gacha::mc
