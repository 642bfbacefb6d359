#include "discolib/core/method.hpp"
#include "discolib/core/errors.hpp"

#include <omp.h>     // OpenMP
#include <yaml-cpp/yaml.h>

namespace discolib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    double randomico(std::mt19937 &rng, double min, double max)
    {
        return std::uniform_real_distribution<double>(min, max)(rng);
    }

    int irandomico(std::mt19937 &rng, int min, int max)
    {
        return std::uniform_int_distribution<int>(min, max)(rng);
    }

    double gaussian(std::mt19937 &rng, double stddev)
    {
        if (stddev <= 0.0) return 0.0;
        return std::normal_distribution<double>(0.0, stddev)(rng);
    }

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    double get_epoch_seconds() {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    }

    void Log(int debug, const std::string &msg)
    {
        if (!debug) return;

        #pragma omp critical(discolib_log)
        {
            std::cout << msg << std::endl;
        }
    }

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------

    template <typename T>
    static void ReadScalar(const YAML::Node &node, const char *key, T &out)
    {
        if (node[key]) out = node[key].as<T>();
    }

    static void LoadQLearning(const YAML::Node &node, TQLConfig &ql)
    {
        if (!node) return;
        if (!node.IsMap()) throw ConfigError("section 'qlearning' must be a map");

        ReadScalar(node, "learning_rate", ql.learningRate);
        ReadScalar(node, "discount_factor", ql.discountFactor);
        ReadScalar(node, "epsilon", ql.epsilon);
    }

    static void LoadGA(const YAML::Node &node, TGAConfig &ga)
    {
        if (!node) return;
        if (!node.IsMap()) throw ConfigError("section 'ga' must be a map");

        ReadScalar(node, "population_size", ga.populationSize);
        ReadScalar(node, "generations", ga.generations);
        ReadScalar(node, "mutation_rate", ga.mutationRate);
        ReadScalar(node, "crossover_rate", ga.crossoverRate);
        ReadScalar(node, "tournament_size", ga.tournamentSize);
        ReadScalar(node, "threads", ga.threads);
    }

    static void LoadMutation(const YAML::Node &node, TMutationBounds &bounds)
    {
        if (!node) return;
        if (!node.IsMap()) throw ConfigError("section 'mutation' must be a map of parameter -> {std, min, max}");

        for (const auto &entry : node) {
            const std::string name = entry.first.as<std::string>();
            const YAML::Node &bound = entry.second;
            if (!bound.IsMap()) throw ConfigError("mutation entry '" + name + "' must be a map");

            TMutationBound b;
            ReadScalar(bound, "std", b.std);
            ReadScalar(bound, "min", b.min);
            ReadScalar(bound, "max", b.max);
            bounds[name] = b;
        }
    }

    void readRunDataYaml(const std::string &paramFile, TRunData &runData)
    {
        try {
            YAML::Node config = YAML::LoadFile(paramFile);

            LoadQLearning(config["qlearning"], runData.ql);
            LoadGA(config["ga"], runData.ga);
            LoadMutation(config["mutation"], runData.mutation);

            if (config["catalog"]) runData.catalogPath = config["catalog"].as<std::string>();
            if (config["debug"]) runData.debug = config["debug"].as<int>();
            runData.ga.debug = runData.debug;

        } catch (const YAML::BadFile &) {
            throw ConfigError("cannot open YAML file: " + paramFile);
        } catch (const YAML::ParserException &e) {
            throw ConfigError(std::string("YAML syntax error: ") + e.what());
        } catch (const YAML::BadConversion &e) {
            throw ConfigError("invalid value in " + paramFile + ": " + e.what());
        }
    }

} // namespace discolib::core
