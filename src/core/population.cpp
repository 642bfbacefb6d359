#include "discolib/core/population.hpp"
#include "discolib/core/method.hpp"
#include "discolib/core/errors.hpp"

namespace discolib::core {

    TPopulation CreatePopulation(const std::vector<TParameters>& templates, int size, std::mt19937& rng)
    {
        if (templates.empty()) throw NoTemplatesError();
        if (size < 0) throw std::invalid_argument("population size must not be negative");

        TPopulation pop;
        pop.reserve(size);

        for (int i = 0; i < size; i++) {
            int t = irandomico(rng, 0, (int)templates.size() - 1);
            pop.emplace_back(templates[t]);     // copies the template mapping
        }
        return pop;
    }

    double Evaluate(TGenome& genome, const FitnessFunction& fitnessFn)
    {
        double value = fitnessFn(genome.genes);
        genome.fitness = value;
        return value;
    }

    const TGenome& BestGenome(const TPopulation& pop)
    {
        if (pop.empty()) throw std::invalid_argument("best genome of an empty population");
        return *std::ranges::max_element(pop, [](const TGenome& a, const TGenome& b) {
            return a.Fitness() < b.Fitness();
        });
    }

    double MeanFitness(const TPopulation& pop)
    {
        if (pop.empty()) return 0.0;

        double sum = 0.0;
        for (const auto& g : pop) sum += g.Fitness();
        return sum / (double)pop.size();
    }

} // namespace discolib::core
