#include "discolib/utils/io.hpp"

#include <cstdio>

namespace discolib::utils {

    using namespace discolib::core;

    static FILE *OpenAppend(const std::string &path, bool &isNew)
    {
        FILE *probe = fopen(path.c_str(), "r");
        isNew = (probe == nullptr);
        if (probe) fclose(probe);

        FILE *file = fopen(path.c_str(), "a");
        if (!file) {
            throw std::runtime_error("cannot open " + path + " for writing");
        }
        return file;
    }

    void WriteDiscoveryScreen(const TDiscoveryRecord &rec)
    {
        printf("\nProblem: %s | Input size: %lld | State: %s", rec.category.c_str(), rec.inputSize, rec.state.c_str());
        printf("\nAlgorithm: %s", rec.selectedAlgorithm.c_str());
        printf("\n   Time complexity: %s", rec.timeComplexity.c_str());
        printf("\n   Space complexity: %s", rec.spaceComplexity.c_str());
        if (rec.fitnessScore)
            printf("\n   Fitness score: %.4lf", *rec.fitnessScore);
        else
            printf("\n   Fitness score: not measured");
        printf("\n");
    }

    void WriteOptimizationScreen(const TOptimizationResult &result, float timeTotal)
    {
        printf("\n\nAlgorithm: %s", result.algorithm.c_str());
        printf("\nGenerations: %d", (int)result.bestFitnessHistory.size());
        printf("\nBest parameters: ");
        for (const auto &[name, value] : result.best.genes)
            printf("%s=%.5lf ", name.c_str(), value);

        printf("\nfitness: %.8lf", result.bestFitness);
        printf("\nTotal time: %.3f\n", timeTotal);
    }

    void WriteDiscoveries(const std::string &path, const std::vector<TDiscoveryRecord> &records)
    {
        bool isNew = false;
        FILE *file = OpenAppend(path, isNew);

        if (isNew)
            fprintf(file, "timestamp,category,input_size,state,algorithm,time_complexity,space_complexity,fitness_score\n");

        for (const auto &rec : records) {
            fprintf(file, "%.3lf,%s,%lld,%s,%s,\"%s\",\"%s\",", rec.timestamp, rec.category.c_str(), rec.inputSize,
                    rec.state.c_str(), rec.selectedAlgorithm.c_str(),
                    rec.timeComplexity.c_str(), rec.spaceComplexity.c_str());
            if (rec.fitnessScore) fprintf(file, "%lf", *rec.fitnessScore);
            fprintf(file, "\n");
        }

        fclose(file);
    }

    void WriteConvergence(const std::string &path, const TOptimizationResult &result)
    {
        FILE *file = fopen(path.c_str(), "w");
        if (!file) {
            throw std::runtime_error("cannot open " + path + " for writing");
        }

        fprintf(file, "generation,best_fitness,avg_fitness\n");
        for (size_t g = 0; g < result.bestFitnessHistory.size(); g++) {
            fprintf(file, "%d,%lf,%lf\n", (int)g, result.bestFitnessHistory[g], result.avgFitnessHistory[g]);
        }

        fclose(file);
    }

    // -----------------------------------------------------------------------------
    // CsvResultSink
    // -----------------------------------------------------------------------------

    CsvResultSink::CsvResultSink(std::string discoveryPath, std::string optimizationPath)
        : discoveryPath_(std::move(discoveryPath)), optimizationPath_(std::move(optimizationPath))
    {}

    void CsvResultSink::OnDiscovery(const TDiscoveryRecord &record)
    {
        WriteDiscoveries(discoveryPath_, {record});
    }

    void CsvResultSink::OnOptimization(const TOptimizationResult &result)
    {
        bool isNew = false;
        FILE *file = OpenAppend(optimizationPath_, isNew);

        if (isNew) fprintf(file, "algorithm,generations,best_fitness,parameters\n");

        fprintf(file, "%s,%d,%lf,", result.algorithm.c_str(), (int)result.bestFitnessHistory.size(), result.bestFitness);
        for (const auto &[name, value] : result.best.genes)
            fprintf(file, "%s=%lf ", name.c_str(), value);
        fprintf(file, "\n");

        fclose(file);
    }

} // namespace discolib::utils
