#pragma once

#include "discolib/core/common.hpp"

namespace discolib::core {

    // Parameter name -> numeric value of a tunable algorithm parameter
    using TParameters = std::map<std::string, double>;

    // Externally supplied objective; the optimizer maximizes it
    using FitnessFunction = std::function<double(const TParameters&)>;

    //--------------------------------------------------------------------------
    // Struct: TGenome
    // Description: Named parameter set under evolutionary search
    //--------------------------------------------------------------------------
    struct TGenome
    {
        TParameters genes;                      // parameter mapping (owned, copied by value)
        std::optional<double> fitness;          // unset until evaluated

        TGenome() = default;
        explicit TGenome(TParameters g) : genes(std::move(g)) {}

        double Fitness() const {
            return fitness.value_or(-std::numeric_limits<double>::infinity());
        }
    };

    using TPopulation = std::vector<TGenome>;

    //--------------------------------------------------------------------------
    // Struct: TMutationBound
    // Description: Gaussian noise scale and clamp interval of one parameter
    //--------------------------------------------------------------------------
    struct TMutationBound
    {
        double std = 0.1;
        double min = 0.0;
        double max = 100.0;
    };

    using TMutationBounds = std::map<std::string, TMutationBound>;

    //--------------------------------------------------------------------------
    // Struct: TGAConfig
    // Description: Control parameters of the genetic algorithm
    //--------------------------------------------------------------------------
    struct TGAConfig
    {
        int populationSize = 50;                // N, constant across generations
        int generations = 100;                  // G, fixed stop condition
        double mutationRate = 0.1;              // probability that a child is mutated
        double crossoverRate = 0.8;             // probability of crossover vs. cloning
        int tournamentSize = 3;                 // sample size of tournament selection
        int threads = 1;                        // OpenMP workers used to evaluate children
        int debug = 0;                          // print per-generation progress
    };

    //--------------------------------------------------------------------------
    // Struct: TQLConfig
    // Description: Control parameters of the Q-Learning policy
    //--------------------------------------------------------------------------
    struct TQLConfig
    {
        double learningRate = 0.1;              // alpha
        double discountFactor = 0.95;           // gamma
        double epsilon = 0.1;                   // exploration probability
    };

    //--------------------------------------------------------------------------
    // Struct: TQ
    // Description: Entry of the Q-Learning quality table
    //--------------------------------------------------------------------------
    struct TQ
    {
        double q = 0.0;     // Q-value (learned quality)
        int k = 0;          // number of updates applied to this entry
    };

    //--------------------------------------------------------------------------
    // Struct: TComplexity
    // Description: Asymptotic labels of a catalog algorithm
    //--------------------------------------------------------------------------
    struct TComplexity
    {
        std::string time = "Unknown";
        std::string space = "Unknown";
        bool known = false;
    };

    //--------------------------------------------------------------------------
    // Struct: TDiscoveryRecord
    // Description: Immutable fact produced by one algorithm selection
    //--------------------------------------------------------------------------
    struct TDiscoveryRecord
    {
        std::string category;
        long long inputSize = 0;
        std::string state;                      // Q-table key the choice was made in
        std::string selectedAlgorithm;
        std::string timeComplexity;
        std::string spaceComplexity;
        std::optional<double> fitnessScore;     // only when measured feedback exists
        double timestamp = 0.0;                 // seconds since epoch
    };

    enum class DiscoveryStatus { Ok, UnknownCategory, NoAlgorithms };

    struct TDiscoveryOutcome
    {
        DiscoveryStatus status = DiscoveryStatus::Ok;
        TDiscoveryRecord record;                // meaningful only when status == Ok

        bool ok() const { return status == DiscoveryStatus::Ok; }
    };

    //--------------------------------------------------------------------------
    // Struct: TOptimizationResult
    // Description: Outcome of one genetic algorithm run
    //--------------------------------------------------------------------------
    struct TOptimizationResult
    {
        std::string algorithm;
        TGenome best;
        double bestFitness = -std::numeric_limits<double>::infinity();
        std::vector<double> bestFitnessHistory;     // one entry per generation
        std::vector<double> avgFitnessHistory;
    };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Configuration of the command line driver
    //--------------------------------------------------------------------------
    struct TRunData
    {
        TQLConfig ql;
        TGAConfig ga;
        TMutationBounds mutation;               // overrides the objective bounds
        std::string catalogPath;                // empty -> built-in catalog
        int debug = 0;                          // 0 - quiet; 1 - print progress
    };

} // namespace discolib::core
