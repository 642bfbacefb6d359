#include "discolib/core/solver.hpp"
#include "discolib/core/method.hpp"
#include "discolib/core/discovery.hpp"
#include "discolib/core/iproblem.hpp"
#include "discolib/mh/optimizer.hpp"
#include "discolib/utils/io.hpp"

#include <CLI/CLI.hpp>

namespace discolib {

    DiscoSolver::DiscoSolver() {
        setupOptions();
    }

    void DiscoSolver::setupOptions() {
        app_.add_option("-c,--config", configPath_, "Path to YAML configuration file")->check(CLI::ExistingFile);
        app_.add_flag("-d,--debug", debug_, "Print progress information");
        app_.add_option("-s,--seed", seed_, "RNG Seed (default: random)");
        app_.require_subcommand(1);

        // discover
        discoverCmd_ = app_.add_subcommand("discover", "Select an algorithm for a problem category");
        discoverCmd_->add_option("category", category_, "Problem category (sorting, searching, dp, graph)")->required();
        discoverCmd_->add_option("-n,--size", inputSize_, "Input size")->default_val(1000)->check(CLI::NonNegativeNumber);
        discoverCmd_->add_option("-r,--runs", runs_, "Number of discovery requests")->default_val(1)->check(CLI::PositiveNumber);
        discoverCmd_->add_option("-e,--epsilon", epsilon_, "Exploration rate (overrides the configuration)")->check(CLI::Range(0.0, 1.0));
        discoverCmd_->add_option("--reward", rewardMode_, "Reward signal fed back to the policy")
            ->default_val("none")->check(CLI::IsMember({"none", "complexity"}));
        discoverCmd_->add_option("--csv", discoveryCsv_, "Append the discovery records to a csv file");

        // optimize
        optimizeCmd_ = app_.add_subcommand("optimize", "Tune the parameters of a built-in objective");
        optimizeCmd_->add_option("-o,--objective", objectiveName_, "Objective to maximize")
            ->default_val("quadratic")->check(CLI::IsMember(core::objectiveNames()));
        optimizeCmd_->add_option("-g,--generations", generations_, "Number of generations")->check(CLI::NonNegativeNumber);
        optimizeCmd_->add_option("-p,--population", population_, "Population size")->check(CLI::PositiveNumber);
        optimizeCmd_->add_option("-t,--threads", threads_, "Threads used to evaluate offspring")->check(CLI::PositiveNumber);
        optimizeCmd_->add_option("--csv", convergenceCsv_, "Write the convergence history to a csv file");
        optimizeCmd_->add_option("--results", resultsCsv_, "Append the best parameters to a csv file");

        // catalog
        catalogCmd_ = app_.add_subcommand("catalog", "List categories, algorithms and complexity labels");
    }

    int DiscoSolver::init(int argc, char* argv[]) {
        try {
            app_.parse(argc, argv);

            if (!configPath_.empty()) core::readRunDataYaml(configPath_, runData_);
            applyOverrides();

            catalog_ = runData_.catalogPath.empty() ? core::DefaultCatalog()
                                                    : core::LoadCatalogYaml(runData_.catalogPath);
            return CONTINUE;
        } catch (const CLI::ParseError &e) {
            return app_.exit(e);
        } catch (const std::exception &e) {
            std::cerr << "Initialization Error: " << e.what() << std::endl;
            return 1;
        }
    }

    void DiscoSolver::applyOverrides() {
        if (debug_) runData_.debug = 1;
        runData_.ga.debug = runData_.debug;

        if (epsilon_ >= 0.0)   runData_.ql.epsilon = epsilon_;
        if (generations_ >= 0) runData_.ga.generations = generations_;
        if (population_ > 0)   runData_.ga.populationSize = population_;
        if (threads_ > 0)      runData_.ga.threads = threads_;
    }

    unsigned int DiscoSolver::resolveSeed() const {
        return (seed_ < 0)
            ? (unsigned int)std::chrono::steady_clock::now().time_since_epoch().count()
            : (unsigned int)seed_;
    }

    int DiscoSolver::run() {
        try {
            if (discoverCmd_->parsed()) return runDiscover();
            if (optimizeCmd_->parsed()) return runOptimize();
            if (catalogCmd_->parsed())  return runCatalog();
        } catch (const std::exception &e) {
            std::cerr << "\nError: " << e.what() << std::endl;
            return 1;
        }
        return 1;
    }

    // -----------------------------------------------------------------------------
    // discover
    // -----------------------------------------------------------------------------
    int DiscoSolver::runDiscover() {
        core::DiscoveryAgent agent(catalog_, runData_.ql, resolveSeed());

        core::DiscoveryAgent::Evaluator evaluator;
        if (rewardMode_ == "complexity") {
            evaluator = [this](const std::string &algorithm) {
                return core::ComplexityReward(catalog_.ComplexityOf(category_, algorithm));
            };
        }

        std::cout << "Discovering algorithm for: " << category_ << " (input_size=" << inputSize_ << ")\nRuns: ";

        for (int run = 0; run < runs_; run++) {
            core::TDiscoveryOutcome outcome = agent.Discover(category_, inputSize_, evaluator);

            if (outcome.status == core::DiscoveryStatus::UnknownCategory) {
                std::cerr << "\nERROR: Unknown problem type: " << category_ << std::endl;
                return 1;
            }
            if (outcome.status == core::DiscoveryStatus::NoAlgorithms) {
                std::cerr << "\nERROR: No algorithms configured for: " << category_ << std::endl;
                return 1;
            }

            if (runData_.debug) utils::WriteDiscoveryScreen(outcome.record);
            else std::cout << (run + 1) << " " << std::flush;
        }

        std::vector<core::TDiscoveryRecord> history = agent.History((std::size_t)runs_);
        std::cout << "\n\n=== LAST DISCOVERY ===";
        utils::WriteDiscoveryScreen(history.back());

        std::optional<std::string> best = agent.Recommend(category_, inputSize_);
        std::cout << "\nRecommended algorithm: " << best.value_or("(no data)") << std::endl;

        if (runData_.debug) agent.Policy().PrintPolicy(std::cout);

        if (!discoveryCsv_.empty()) utils::WriteDiscoveries(discoveryCsv_, history);
        return 0;
    }

    // -----------------------------------------------------------------------------
    // optimize
    // -----------------------------------------------------------------------------
    int DiscoSolver::runOptimize() {
        std::shared_ptr<core::IObjective> objective = core::createObjective(objectiveName_);

        // configured bounds override the objective defaults
        core::TMutationBounds bounds = objective->bounds();
        for (const auto &[name, b] : runData_.mutation) bounds[name] = b;

        mh::ParameterOptimizer optimizer(objective->name(), objective->initialParameters(), runData_.ga, resolveSeed());

        core::Log(runData_.debug, "Optimizing " + objective->name() + " with "
                  + std::to_string(runData_.ga.populationSize) + " genomes over "
                  + std::to_string(runData_.ga.generations) + " generations");

        double start_time = core::get_time_in_seconds();
        core::TOptimizationResult result = optimizer.Optimize(
            [&objective](const core::TParameters &params) { return objective->evaluate(params); }, bounds);
        double end_time = core::get_time_in_seconds();

        std::cout << "\n=== FINAL RESULT ===";
        utils::WriteOptimizationScreen(result, (float)(end_time - start_time));

        if (!convergenceCsv_.empty()) utils::WriteConvergence(convergenceCsv_, result);
        if (!resultsCsv_.empty()) {
            utils::CsvResultSink sink(std::string(), resultsCsv_);
            sink.OnOptimization(result);
        }
        return 0;
    }

    // -----------------------------------------------------------------------------
    // catalog
    // -----------------------------------------------------------------------------
    int DiscoSolver::runCatalog() {
        for (const auto &category : catalog_.Categories()) {
            std::cout << category << ":\n";
            for (const auto &algorithm : catalog_.AlgorithmsFor(category)) {
                core::TComplexity c = catalog_.ComplexityOf(category, algorithm);
                std::cout << "   " << std::left << std::setw(16) << algorithm
                          << " time " << std::setw(14) << c.time << " space " << c.space << "\n";
            }
        }
        std::cout << std::flush;
        return 0;
    }

} // namespace discolib
