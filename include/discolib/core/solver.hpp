/**
 * discolib - Command line driver
 * Parses arguments, loads the configuration and dispatches subcommands
 */

#pragma once

#include "discolib/core/data.hpp"
#include "discolib/core/catalog.hpp"

#include <CLI/CLI.hpp>

namespace discolib {

    /**
    * @brief Main driver class - orchestrates discovery and optimization runs
    */
    class DiscoSolver {
    public:
        // init() result meaning "arguments accepted, go on with run()"
        static constexpr int CONTINUE = -1;

        DiscoSolver();

        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------

        /**
         * Method: init
         * Description: Parse the command line and the YAML configuration.
         *              Returns CONTINUE on success, otherwise the process exit code.
         */
        int init(int argc, char* argv[]);

        // Execute the selected subcommand; returns the process exit code
        int run();

    private:
        void setupOptions();
        void applyOverrides();
        unsigned int resolveSeed() const;

        int runDiscover();
        int runOptimize();
        int runCatalog();

        // -------------------------------------------------------------------------
        // MEMBER VARIABLES
        // -------------------------------------------------------------------------
        CLI::App app_{"discolib - algorithm discovery and parameter tuning"};
        CLI::App* discoverCmd_ = nullptr;
        CLI::App* optimizeCmd_ = nullptr;
        CLI::App* catalogCmd_ = nullptr;

        std::string configPath_;
        bool debug_ = false;
        long long seed_ = -1;

        // discover
        std::string category_;
        long long inputSize_ = 1000;
        int runs_ = 1;
        double epsilon_ = -1.0;
        std::string rewardMode_ = "none";
        std::string discoveryCsv_;

        // optimize
        std::string objectiveName_ = "quadratic";
        int generations_ = -1;
        int population_ = -1;
        int threads_ = -1;
        std::string convergenceCsv_;
        std::string resultsCsv_;

        core::TRunData runData_;
        core::AlgorithmCatalog catalog_;
    };

} // namespace discolib
