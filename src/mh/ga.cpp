#include "discolib/mh/ga.hpp"

#include "discolib/core/method.hpp"
#include "discolib/core/population.hpp"

#include <omp.h>
#include <exception>
#include <iterator>

namespace discolib::mh {

    using namespace discolib::core;

    static void CheckConfig(const TGAConfig& c)
    {
        if (c.populationSize < 1) throw std::invalid_argument("population size must be at least 1");
        if (c.generations < 0) throw std::invalid_argument("generation count must not be negative");
        if (!(c.mutationRate >= 0.0 && c.mutationRate <= 1.0)) throw std::invalid_argument("mutation rate must lie in [0, 1]");
        if (!(c.crossoverRate >= 0.0 && c.crossoverRate <= 1.0)) throw std::invalid_argument("crossover rate must lie in [0, 1]");
        if (c.tournamentSize < 1) throw std::invalid_argument("tournament size must be at least 1");
        if (c.threads < 1) throw std::invalid_argument("thread count must be at least 1");
    }

    static void CheckBounds(const TMutationBounds& bounds)
    {
        for (const auto& [name, b] : bounds) {
            if (b.min > b.max) throw std::invalid_argument("mutation bounds of '" + name + "' have min > max");
            if (b.std < 0.0) throw std::invalid_argument("mutation std of '" + name + "' is negative");
        }
    }

    GeneticAlgorithm::GeneticAlgorithm(const TGAConfig& config, unsigned int seed)
        : config_(config), rng_(seed)
    {
        CheckConfig(config_);
    }

    // -------------------------------------------------------------------------
    // Selection (Tournament)
    // -------------------------------------------------------------------------
    const TGenome& GeneticAlgorithm::Selection(const TPopulation& pop)
    {
        int sizePop = (int)pop.size();
        int best = -1;

        if (sizePop >= config_.tournamentSize) {
            // distinct contestants
            std::vector<int> idx(sizePop);
            std::iota(idx.begin(), idx.end(), 0);
            std::vector<int> contestants;
            std::sample(idx.begin(), idx.end(), std::back_inserter(contestants), config_.tournamentSize, rng_);

            for (int p : contestants) {
                if (best < 0 || pop[p].Fitness() > pop[best].Fitness()) best = p;
            }
        }
        else {
            // population smaller than the tournament: sample with replacement
            for (int t = 0; t < config_.tournamentSize; t++) {
                int p = irandomico(rng_, 0, sizePop - 1);
                if (best < 0 || pop[p].Fitness() > pop[best].Fitness()) best = p;
            }
        }

        return pop[best];
    }

    // -------------------------------------------------------------------------
    // Crossover (uniform, one parent per gene)
    // -------------------------------------------------------------------------
    TGenome GeneticAlgorithm::Crossover(const TGenome& parent1, const TGenome& parent2)
    {
        TGenome child;
        for (const auto& [key, value] : parent1.genes) {
            auto other = parent2.genes.find(key);
            if (other == parent2.genes.end()) continue;

            child.genes[key] = (randomico(rng_, 0, 1) < 0.5) ? value : other->second;
        }
        return child;
    }

    // -------------------------------------------------------------------------
    // Mutation (Gaussian noise, clamped)
    // -------------------------------------------------------------------------
    void GeneticAlgorithm::Mutate(TGenome& child, const TMutationBounds& bounds)
    {
        if (randomico(rng_, 0, 1) >= config_.mutationRate) return;

        for (auto& [key, value] : child.genes) {
            auto b = bounds.find(key);
            if (b == bounds.end()) continue;     // no bounds, never mutated

            value = std::clamp(value + gaussian(rng_, b->second.std), b->second.min, b->second.max);
        }
        child.fitness.reset();
    }

    TGenome GeneticAlgorithm::Reproduce(const TPopulation& pop, const TMutationBounds& bounds)
    {
        TGenome child;
        if (randomico(rng_, 0, 1) < config_.crossoverRate) {
            const TGenome& p1 = Selection(pop);
            const TGenome& p2 = Selection(pop);
            child = Crossover(p1, p2);
        }
        else {
            child = Selection(pop);
        }

        Mutate(child, bounds);
        return child;
    }

    void GeneticAlgorithm::EvaluateOffspring(TPopulation& next, std::size_t from, const FitnessFunction& fitnessFn) const
    {
        int n = (int)next.size();
        std::vector<std::exception_ptr> errors(n);

        // workers only call the fitness function; all randomness was drawn before
        #pragma omp parallel for num_threads(config_.threads) schedule(dynamic)
        for (int i = (int)from; i < n; i++) {
            try {
                Evaluate(next[i], fitnessFn);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }

        for (const auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
    }

    // -------------------------------------------------------------------------
    // Main Algorithm: GA
    // -------------------------------------------------------------------------
    TOptimizationResult GeneticAlgorithm::Evolve(const std::vector<TParameters>& templates,
                                                 const FitnessFunction& fitnessFn,
                                                 const TMutationBounds& bounds)
    {
        CheckBounds(bounds);

        const int sizePop = config_.populationSize;
        TOptimizationResult result;

        // initialize population
        TPopulation Pop = CreatePopulation(templates, sizePop, rng_);
        if (config_.threads > 1) {
            EvaluateOffspring(Pop, 0, fitnessFn);
        } else {
            for (auto& ind : Pop) Evaluate(ind, fitnessFn);
        }

        double start_time = get_time_in_seconds();

        // run the evolutionary process for a fixed number of generations
        for (int numGenerations = 0; numGenerations < config_.generations; numGenerations++)
        {
            const TGenome& bestInd = BestGenome(Pop);
            result.bestFitnessHistory.push_back(bestInd.Fitness());
            result.avgFitnessHistory.push_back(MeanFitness(Pop));

            if (config_.debug) {
                std::ostringstream msg;
                msg << "Generation " << numGenerations
                    << ": best " << std::setprecision(10) << bestInd.Fitness()
                    << " avg " << result.avgFitnessHistory.back()
                    << " [" << std::setprecision(3) << (get_time_in_seconds() - start_time) << "s]";
                Log(config_.debug, msg.str());
            }

            TPopulation PopNew;
            PopNew.reserve(sizePop);

            // elitism: the best genome survives unchanged
            PopNew.push_back(bestInd);

            while ((int)PopNew.size() < sizePop) {
                PopNew.push_back(Reproduce(Pop, bounds));

                if (config_.threads <= 1) Evaluate(PopNew.back(), fitnessFn);
            }

            if (config_.threads > 1) EvaluateOffspring(PopNew, 1, fitnessFn);

            // replace the population with offspring
            Pop = std::move(PopNew);
        }

        result.best = BestGenome(Pop);
        result.bestFitness = result.best.Fitness();
        return result;
    }

} // namespace discolib::mh
