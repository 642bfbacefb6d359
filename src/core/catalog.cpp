#include "discolib/core/catalog.hpp"
#include "discolib/core/errors.hpp"

#include <yaml-cpp/yaml.h>

namespace discolib::core {

    // -----------------------------------------------------------------------------
    // Registration
    // -----------------------------------------------------------------------------

    void AlgorithmCatalog::AddCategory(const std::string& category)
    {
        if (FindCategory(category) == nullptr) {
            categories_.push_back(TCategory{category, {}});
        }
    }

    void AlgorithmCatalog::AddAlgorithm(const std::string& category, const std::string& algorithm,
                                        const std::string& time, const std::string& space)
    {
        AddCategory(category);

        auto it = std::ranges::find_if(categories_, [&](const TCategory& c) { return c.name == category; });
        auto& algorithms = it->algorithms;

        TComplexity complexity{time, space, true};
        auto found = std::ranges::find_if(algorithms, [&](const TAlgorithmEntry& a) { return a.name == algorithm; });
        if (found != algorithms.end()) {
            found->complexity = complexity;     // re-registration overrides the labels
        } else {
            algorithms.push_back(TAlgorithmEntry{algorithm, complexity});
        }
    }

    // -----------------------------------------------------------------------------
    // Lookup
    // -----------------------------------------------------------------------------

    const AlgorithmCatalog::TCategory* AlgorithmCatalog::FindCategory(const std::string& category) const
    {
        for (const auto& c : categories_) {
            if (c.name == category) return &c;
        }
        return nullptr;
    }

    std::vector<std::string> AlgorithmCatalog::AlgorithmsFor(const std::string& category) const
    {
        std::vector<std::string> names;
        const TCategory* c = FindCategory(category);
        if (c == nullptr) return names;

        names.reserve(c->algorithms.size());
        for (const auto& a : c->algorithms) names.push_back(a.name);
        return names;
    }

    TComplexity AlgorithmCatalog::ComplexityOf(const std::string& category, const std::string& algorithm) const
    {
        const TCategory* c = FindCategory(category);
        if (c != nullptr) {
            for (const auto& a : c->algorithms) {
                if (a.name == algorithm) return a.complexity;
            }
        }
        return TComplexity{};
    }

    bool AlgorithmCatalog::HasCategory(const std::string& category) const
    {
        return FindCategory(category) != nullptr;
    }

    std::vector<std::string> AlgorithmCatalog::Categories() const
    {
        std::vector<std::string> names;
        for (const auto& c : categories_) names.push_back(c.name);
        return names;
    }

    // -----------------------------------------------------------------------------
    // Built-in and YAML tables
    // -----------------------------------------------------------------------------

    AlgorithmCatalog DefaultCatalog()
    {
        AlgorithmCatalog catalog;

        catalog.AddAlgorithm("sorting", "quicksort",      "O(n log n)", "O(log n)");
        catalog.AddAlgorithm("sorting", "mergesort",      "O(n log n)", "O(n)");
        catalog.AddAlgorithm("sorting", "heapsort",       "O(n log n)", "O(1)");
        catalog.AddAlgorithm("sorting", "bubblesort",     "O(n^2)",     "O(1)");
        catalog.AddAlgorithm("sorting", "insertion_sort", "O(n^2)",     "O(1)");

        catalog.AddAlgorithm("searching", "binary_search", "O(log n)", "O(1)");
        catalog.AddAlgorithm("searching", "linear_search", "O(n)",     "O(1)");
        catalog.AddAlgorithm("searching", "hash_search",   "O(1)",     "O(n)");

        catalog.AddAlgorithm("dp", "fibonacci", "O(n)",  "O(n)");
        catalog.AddAlgorithm("dp", "knapsack",  "O(nW)", "O(nW)");
        catalog.AddAlgorithm("dp", "lcs",       "O(mn)", "O(mn)");

        catalog.AddAlgorithm("graph", "dfs",      "O(V+E)",      "O(V)");
        catalog.AddAlgorithm("graph", "bfs",      "O(V+E)",      "O(V)");
        catalog.AddAlgorithm("graph", "dijkstra", "O((V+E)logV)", "O(V)");

        return catalog;
    }

    AlgorithmCatalog LoadCatalogYaml(const std::string& path)
    {
        AlgorithmCatalog catalog;

        try {
            YAML::Node root = YAML::LoadFile(path);

            // Guard Clause: the table must be a map of categories
            if (!root.IsMap()) {
                throw ConfigError("catalog " + path + " must map categories to algorithms");
            }

            for (const auto& category : root) {
                const std::string name = category.first.as<std::string>();
                catalog.AddCategory(name);

                const YAML::Node& algorithms = category.second;
                if (!algorithms || algorithms.IsNull()) continue;       // category with zero algorithms
                if (!algorithms.IsMap()) {
                    throw ConfigError("category '" + name + "' must map algorithm names to {time, space}");
                }

                for (const auto& algorithm : algorithms) {
                    const std::string algorithmName = algorithm.first.as<std::string>();
                    const YAML::Node& labels = algorithm.second;
                    if (!labels.IsMap() || !labels["time"] || !labels["space"]) {
                        throw ConfigError("algorithm '" + name + "/" + algorithmName + "' needs {time, space} labels");
                    }
                    catalog.AddAlgorithm(name, algorithmName, labels["time"].as<std::string>(),
                                         labels["space"].as<std::string>());
                }
            }

        } catch (const YAML::BadFile &) {
            throw ConfigError("cannot open catalog file: " + path);
        } catch (const YAML::ParserException &e) {
            throw ConfigError(std::string("YAML syntax error in catalog: ") + e.what());
        } catch (const YAML::BadConversion &e) {
            throw ConfigError("invalid value in catalog " + path + ": " + e.what());
        }

        return catalog;
    }

    int ComplexityRank(const std::string& label)
    {
        static const std::map<std::string, int> ladder = {
            {"O(1)", 1}, {"O(log n)", 2}, {"O(n)", 3}, {"O(n log n)", 4},
            {"O(n^2)", 5}, {"O(n^3)", 6}, {"O(2^n)", 7}, {"O(n!)", 8}
        };

        auto it = ladder.find(label);
        return (it == ladder.end()) ? 3 : it->second;
    }

    double ComplexityReward(const TComplexity& complexity)
    {
        return 1.0 - (ComplexityRank(complexity.time) - 1) / 8.0;
    }

} // namespace discolib::core
