#include "linecraft/CurveError.hpp"
#include "linecraft/JobRunner.hpp"
#include "linecraft/JsonUtils.hpp"
#include "linecraft/ReportUtils.hpp"
#include "linecraft/Settings.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace fs = std::filesystem;
using namespace linecraft;

static const char* SETTINGS_FILE = "linecraft_settings.json";

// Settings file next to the job: cwd, executable directory, build directory.
// Nothing found means the shipped defaults.
static AnalysisSettings load_global_settings(bool verbose)
{
    std::vector<std::string> search_paths = {
        SETTINGS_FILE,
        []() {
            std::error_code ec;
            auto exe_path = fs::canonical("/proc/self/exe", ec);
            if (ec) return std::string(SETTINGS_FILE);
            return (exe_path.parent_path() / SETTINGS_FILE).string();
        }(),
        std::string("../") + SETTINGS_FILE
    };

    for (const auto& path : search_paths) {
        if (fs::exists(path)) {
            AnalysisSettings s = load_settings(path);
            if (verbose) std::cout << "Loaded settings from: " << path << std::endl;
            return s;
        }
    }
    if (verbose) std::cout << "No " << SETTINGS_FILE << " found, using defaults\n";
    return AnalysisSettings{};
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("linecraft", "Frequency response curve analysis");
        opts.add_options()
            ("job", "Job description JSON", cxxopts::value<std::string>())
            ("settings", "Settings JSON (default: search linecraft_settings.json)",
                cxxopts::value<std::string>())
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("out", "Result JSON, - for stdout", cxxopts::value<std::string>()->default_value("-"))
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("job")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        // progress goes to stdout only when the result does not
        const std::string out_path = cli["out"].as<std::string>();
        const bool verbose = out_path != "-";

        AnalysisSettings settings = cli.count("settings")
            ? load_settings(cli["settings"].as<std::string>())
            : load_global_settings(verbose);

        auto job = load_json(cli["job"].as<std::string>());
        expand_env(job);

        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = std::thread::hardware_concurrency();
        if (nthreads <= 0) nthreads = 1;

#ifdef _OPENMP
        omp_set_num_threads(nthreads);
#endif
        Eigen::setNbThreads(nthreads);

        auto result = run_job(job, settings, static_cast<unsigned>(nthreads), verbose);
        write_json(out_path, result);

    } catch (const CurveError& e) {
        std::cerr << "Error (" << to_string(e.kind()) << "): " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cerr << "Took: " << duration << " ms\n";

    return 0;
}
