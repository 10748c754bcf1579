/**
 * gacha_sim — Headless gachapon depletion Monte Carlo.
 *
 * Reads a machine configuration JSON, simulates N machine lifetimes from
 * full to empty, and prints the depletion report (text by default, JSON
 * with --json).
 *
 * Usage:
 *   gacha_sim --config <path> [--runs N] [--seed S] [--threads T]
 *             [--output <path>] [--json] [--samples] [--verbose] [--progress]
 */

#include "montecarlo/config_loader.hpp"
#include "montecarlo/errors.hpp"
#include "montecarlo/mc_runner.hpp"
#include "montecarlo/report.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --config <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>    Machine configuration JSON (required)\n"
              << "  --runs N           Number of lifetimes (default: from config)\n"
              << "  --seed S           Base RNG seed (default: from config)\n"
              << "  --threads T        Worker threads (default: 1)\n"
              << "  --output <path>    Output file (default: stdout)\n"
              << "  --json             Write the JSON report instead of text\n"
              << "  --samples          JSON: include raw per-run rate samples\n"
              << "  --verbose          Progress to stderr\n"
              << "  --progress         JSON-Lines progress to stderr\n"
              << "  --help             Show this message\n";
}

struct CliOptions {
    std::string config_path;
    std::string output_path;        // empty = stdout
    bool json = false;
    bool samples = false;
    bool progress = false;
    bool runs_given = false;
    gacha::mc::RunOptions run;
};

static void write_report(const CliOptions& cli,
                         const gacha::mc::AggregateSummary& summary,
                         const std::vector<gacha::mc::SignificanceReport>& tests,
                         int base_seed, std::ostream& out) {
    if (cli.json) {
        gacha::mc::write_results_json(summary, tests, base_seed, cli.samples, out);
    } else {
        gacha::mc::write_text_report(summary, tests, out);
    }
}

int main(int argc, char* argv[]) {
    CliOptions cli;

    // Parse CLI arguments
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                cli.config_path = argv[++i];
            } else if (arg == "--runs" && i + 1 < argc) {
                cli.run.num_runs = std::stoi(argv[++i]);
                cli.runs_given = true;
            } else if (arg == "--seed" && i + 1 < argc) {
                cli.run.base_seed = std::stoi(argv[++i]);
                cli.run.override_seed = true;
            } else if (arg == "--threads" && i + 1 < argc) {
                cli.run.threads = std::stoi(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                cli.output_path = argv[++i];
            } else if (arg == "--json") {
                cli.json = true;
            } else if (arg == "--samples") {
                cli.samples = true;
            } else if (arg == "--verbose" || arg == "-v") {
                cli.run.verbose = true;
            } else if (arg == "--progress") {
                cli.progress = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (cli.config_path.empty()) {
        std::cerr << "Error: --config is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // Load and validate configuration
    gacha::mc::GachaConfig config;
    try {
        config = gacha::mc::ConfigLoader::load_file(cli.config_path);
    } catch (const gacha::mc::ConfigurationError& e) {
        std::cerr << "Error loading config: " << e.what() << "\n";
        return 1;
    }

    if (cli.runs_given && cli.run.num_runs <= 0) {
        std::cerr << "Error: --runs must be positive, got " << cli.run.num_runs << "\n";
        return 1;
    }
    if (cli.run.threads < 1) {
        std::cerr << "Error: --threads must be at least 1, got " << cli.run.threads << "\n";
        return 1;
    }

    gacha::mc::MCRunner runner(config, cli.run);

    if (cli.run.verbose) {
        std::cerr << "=== Gachapon MC ===\n"
                  << "Config: " << cli.config_path << "\n"
                  << "Items: " << config.item_count() << "\n"
                  << "Capsules: " << config.initial_total() << "\n"
                  << "Runs: " << runner.num_runs() << "\n"
                  << "Base seed: " << runner.base_seed() << "\n"
                  << "Threads: " << cli.run.threads << "\n"
                  << "Output: " << (cli.output_path.empty() ? "stdout" : cli.output_path)
                  << "\n\n";
    }

    gacha::mc::MCRunner::ProgressCallback progress_cb = nullptr;
    if (cli.progress) {
        const int step = std::max(1, runner.num_runs() / 100);
        progress_cb = [step](int completed, int total) {
            if (completed % step != 0 && completed != total) return;
            std::cerr << "{\"type\":\"run_complete\",\"run\":" << completed
                      << ",\"total\":" << total << "}\n" << std::flush;
        };
    }

    auto t_start = std::chrono::high_resolution_clock::now();

    gacha::mc::AggregateSummary summary;
    std::vector<gacha::mc::SignificanceReport> tests;
    try {
        gacha::mc::Aggregator agg = runner.run(progress_cb);
        summary = agg.finalize(runner.num_runs());
        tests = gacha::mc::run_significance_tests(config, summary);
    } catch (const gacha::mc::InsufficientDataError& e) {
        std::cerr << "Not enough data: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: simulation failed: " << e.what() << "\n";
        return 1;
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    if (cli.run.verbose) {
        std::cerr << "\nCompleted " << summary.run_count << " lifetimes in "
                  << elapsed << "s\n";
    }

    // Write output
    if (cli.output_path.empty()) {
        write_report(cli, summary, tests, runner.base_seed(), std::cout);
    } else {
        std::ofstream out(cli.output_path);
        if (!out.is_open()) {
            std::cerr << "Error: cannot open output file: " << cli.output_path << "\n";
            return 1;
        }
        write_report(cli, summary, tests, runner.base_seed(), out);
        if (cli.run.verbose) {
            std::cerr << "Report written to: " << cli.output_path << "\n";
        }
    }

    if (cli.progress) {
        std::cerr << "{\"type\":\"done\",\"runs\":" << summary.run_count
                  << ",\"elapsed\":" << elapsed << "}\n" << std::flush;
    }

    return 0;
}
