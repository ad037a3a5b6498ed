#include <iostream>
#include <CLI/CLI.hpp>
#include "fusion_engine.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"signalfuse - Fuse code measurements into risk and health scores"};

        FusionEngineOptions options;
        std::string configPath;
        bool verbose = false;
        unsigned int numThreads = std::thread::hardware_concurrency();
        double damping = 0.85;
        double floorPagerank = 0.005;
        double floorBlastRadius = 5.0;
        double floorCognitiveLoad = 3.0;
        double floorLines = 100.0;
        int windowWeeks = 4;

        // Required snapshot
        app.add_option("-i,--input", options.inputFile, "Snapshot JSON file (required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-o,--output", options.outputFile, "Report file (default: print to stdout)");

        app.add_option("-c,--config", configPath, "JSON configuration file")
            ->check(CLI::ExistingFile);

        auto threadsOpt = app.add_option("--threads", numThreads,
                                         "Number of worker threads (default: number of CPU cores)")
            ->check(CLI::Range(1u, 64u));

        app.add_flag("-v,--verbose", verbose, "Enable verbose output");
        app.add_flag("-t,--timing", options.showTiming, "Show detailed timing information");
        app.add_option("--top", options.topN, "Entries in the top-N rankings (default: 10)")
            ->check(CLI::Range(1, 1000));

        // Tunables, applied on top of the config file
        auto tuning = app.add_option_group("Tuning");
        auto dampingOpt = tuning->add_option("--damping", damping, "PageRank damping factor (default: 0.85)")
            ->check(CLI::Range(0.0, 1.0));
        auto floorPagerankOpt = tuning->add_option("--floor-pagerank", floorPagerank,
                                                   "Percentile floor for pagerank (default: 0.005)");
        auto floorBlastOpt = tuning->add_option("--floor-blast-radius", floorBlastRadius,
                                                "Percentile floor for blast_radius_size (default: 5)");
        auto floorLoadOpt = tuning->add_option("--floor-cognitive-load", floorCognitiveLoad,
                                               "Percentile floor for cognitive_load (default: 3.0)");
        auto floorLinesOpt = tuning->add_option("--floor-lines", floorLines,
                                                "Percentile floor for lines (default: 100)");
        auto windowOpt = tuning->add_option("--window-weeks", windowWeeks,
                                            "Churn window length in weeks (default: 4)")
            ->check(CLI::Range(1, 520));

        // Parse command line arguments
        CLI11_PARSE(app, argc, argv);

        if (!configPath.empty()) {
            options.config = FusionConfig::fromFile(configPath);
        }

        FusionConfig& config = options.config;
        if (verbose) {
            config.execution.verbose = true;
        }
        if (threadsOpt->count() > 0) {
            config.execution.numThreads = numThreads;
        }
        if (dampingOpt->count() > 0) {
            config.graph.damping = damping;
        }
        if (floorPagerankOpt->count() > 0) {
            config.normalization.floors["pagerank"] = floorPagerank;
        }
        if (floorBlastOpt->count() > 0) {
            config.normalization.floors["blast_radius_size"] = floorBlastRadius;
        }
        if (floorLoadOpt->count() > 0) {
            config.normalization.floors["cognitive_load"] = floorCognitiveLoad;
        }
        if (floorLinesOpt->count() > 0) {
            config.normalization.floors["lines"] = floorLines;
        }
        if (windowOpt->count() > 0) {
            config.temporal.windowWeeks = windowWeeks;
        }

        FusionEngine engine(options);
        if (!engine.run()) {
            std::cerr << "Error: Run was cancelled" << std::endl;
            return 1;
        }

        if (options.outputFile.empty()) {
            std::cout << engine.getReport() << std::endl;
        }

        if (config.execution.verbose) {
            std::cout << engine.getSummary() << std::endl;
        }

        if (options.showTiming) {
            std::cout << engine.getTimingInfo() << std::endl;
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
