// File: SuitabilityOverlay.cpp
#include "OverlayCommon.h"
#include "GridStore.hpp"
#include "RunConfig.hpp"
#include "OverlayPipeline.hpp"
#include "ArtifactExporter.hpp"

#include <omp.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace suitgeo;

namespace {

    void printUsage(const char* argv0) {
        std::cerr << "Usage: " << argv0 << " <run.xml> [--threads N] [--quiet]\n"
            << "  <run.xml>     overlay run document (<overlay_run>)\n"
            << "  --threads N   number of OpenMP threads (default: OpenMP runtime default)\n"
            << "  --quiet       do not echo pipeline stage messages" << std::endl;
    }

    struct CliOptions {
        std::string runFile;
        int threads = 0;
        bool quiet = false;
    };

    bool parseArgs(int argc, char** argv, CliOptions& opts) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--threads") {
                if (i + 1 >= argc) {
                    std::cerr << "Error: --threads needs a value." << std::endl;
                    return false;
                }
                char* end = nullptr;
                long n = std::strtol(argv[++i], &end, 10);
                if (*end != '\0' || n < 1) {
                    std::cerr << "Error: --threads expects a positive integer, got '" << argv[i] << "'." << std::endl;
                    return false;
                }
                opts.threads = static_cast<int>(n);
            }
            else if (arg == "--quiet") {
                opts.quiet = true;
            }
            else if (arg == "-h" || arg == "--help") {
                return false;
            }
            else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Error: Unknown option '" << arg << "'." << std::endl;
                return false;
            }
            else if (opts.runFile.empty()) {
                opts.runFile = arg;
            }
            else {
                std::cerr << "Error: Only one run document may be given." << std::endl;
                return false;
            }
        }
        return !opts.runFile.empty();
    }

} // anonymous namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }
    if (opts.threads > 0) {
        omp_set_num_threads(opts.threads);
    }

    auto t_start = std::chrono::high_resolution_clock::now();
    try {
        // --- Configuration ---
        std::cout << "--- Loading Run Document ---" << std::endl;
        RunDocument run = loadRunDocument(opts.runFile);
        run.request.config.verbose = !opts.quiet;

        AsciiGridStore store = AsciiGridStore::fromCatalogFile(run.catalog_path);

        // --- Overlay ---
        std::cout << "\n--- Overlay Processing (" << omp_get_max_threads() << " threads) ---" << std::endl;
        OverlayResult result = runOverlay(store, run.request);

        // --- Artifacts ---
        std::cout << "\n--- Writing Artifacts ---" << std::endl;
        ArtifactSet artifacts = exportArtifacts(result, run.request, run.output);

        auto t_end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = t_end - t_start;

        const OverlayDiagnostics& d = result.diagnostics;
        std::cout << "\n--- Summary ---" << std::endl;
        std::cout << "  Run: " << artifacts.run_id << std::endl;
        std::cout << "  Frame: " << d.frame.width << "x" << d.frame.height << " cells of " << d.frame.cell_size << std::endl;
        std::cout << "  Rescaled [" << d.source_min << "," << d.source_max << "] -> [" << d.target_min << "," << d.target_max << "]" << std::endl;
        std::cout << "  Excluded cells: " << d.excluded_cells << ", influenced cells: " << d.influenced_cells << std::endl;
        std::cout << "  Artifacts: " << artifacts.files.size() << ", total time " << elapsed.count() << " s" << std::endl;
    }
    catch (const OverlayError& e) {
        std::cerr << "Error (SuitabilityOverlay): " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
