#pragma once

#include "discolib/mh/ga.hpp"

namespace discolib::mh {

    /**
     * @brief Tunes the parameters of one named algorithm with the GA
     */
    class ParameterOptimizer {
        public:
            ParameterOptimizer(std::string algorithmName, core::TParameters initialParams,
                               const core::TGAConfig& config = core::TGAConfig{},
                               unsigned int seed = std::random_device{}());

            /**
             * Method: Optimize
             * Description: Evolve a population seeded from the initial parameters and
             *              return the best parameter set with its convergence history
             */
            core::TOptimizationResult Optimize(const core::FitnessFunction& fitnessFn,
                                               const core::TMutationBounds& bounds = {});

            const std::string& AlgorithmName() const { return algorithmName_; }

        private:
            std::string algorithmName_;
            core::TParameters initialParams_;
            GeneticAlgorithm ga_;
    };

} // namespace discolib::mh
