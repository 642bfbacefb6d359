#pragma once

#include "discolib/core/data.hpp"

namespace discolib::mh {

    /**
     * @brief Generational genetic algorithm over named parameter sets
     *
     * Tournament selection, uniform crossover, Gaussian mutation with
     * clamping and single-genome elitism. The population size stays fixed
     * for every generation and the run stops after a fixed number of
     * generations.
     */
    class GeneticAlgorithm {
        public:
            explicit GeneticAlgorithm(const core::TGAConfig& config = core::TGAConfig{},
                                      unsigned int seed = std::random_device{}());

            /**
             * Method: Evolve
             * Description: Search process of the Genetic Algorithm.
             *              Returns the fittest genome of the final population; the
             *              per-generation best/average fitness is kept in the result.
             * Throws: NoTemplatesError for an empty template list; any exception
             *         raised by fitnessFn abandons the run and is rethrown.
             */
            core::TOptimizationResult Evolve(const std::vector<core::TParameters>& templates,
                                             const core::FitnessFunction& fitnessFn,
                                             const core::TMutationBounds& bounds = {});

            // -------------------------------------------------------------------------
            // OPERATORS
            // -------------------------------------------------------------------------
            const core::TGenome& Selection(const core::TPopulation& pop);
            core::TGenome Crossover(const core::TGenome& parent1, const core::TGenome& parent2);
            void Mutate(core::TGenome& child, const core::TMutationBounds& bounds);

            const core::TGAConfig& Config() const { return config_; }

        private:
            core::TGenome Reproduce(const core::TPopulation& pop, const core::TMutationBounds& bounds);
            void EvaluateOffspring(core::TPopulation& next, std::size_t from, const core::FitnessFunction& fitnessFn) const;

            core::TGAConfig config_;
            std::mt19937 rng_;
    };

} // namespace discolib::mh
