#pragma once

#include "discolib/core/data.hpp"

namespace discolib::core {

    /**
     * Method: CreatePopulation
     * Description: Build size genomes by sampling templates with replacement.
     *              Each genome receives its own copy of the template parameters
     *              and starts without fitness.
     * Throws: NoTemplatesError if templates is empty,
     *         std::invalid_argument if size is negative
     */
    TPopulation CreatePopulation(const std::vector<TParameters>& templates, int size, std::mt19937& rng);

    /**
     * Method: Evaluate
     * Description: Call the fitness function on the genome parameters and store
     *              the result. Exceptions thrown by fitnessFn reach the caller.
     */
    double Evaluate(TGenome& genome, const FitnessFunction& fitnessFn);

    // Fittest genome (first one on ties); pop must not be empty
    const TGenome& BestGenome(const TPopulation& pop);

    double MeanFitness(const TPopulation& pop);

} // namespace discolib::core
