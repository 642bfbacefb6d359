#pragma once

#include "discolib/core/data.hpp"

namespace discolib::core {

    /**
     * @brief Static registry of candidate algorithms per problem category
     *
     * Categories and algorithms keep the order in which they were added, so
     * the legal action set handed to the policy is stable across runs.
     */
    class AlgorithmCatalog {
        public:
            struct TAlgorithmEntry {
                std::string name;
                TComplexity complexity;
            };

            AlgorithmCatalog() = default;

            // -------------------------------------------------------------------------
            // REGISTRATION
            // -------------------------------------------------------------------------
            void AddCategory(const std::string& category);
            void AddAlgorithm(const std::string& category, const std::string& algorithm,
                              const std::string& time, const std::string& space);

            // -------------------------------------------------------------------------
            // LOOKUP
            // -------------------------------------------------------------------------

            /**
             * Method: AlgorithmsFor
             * Description: Ordered algorithm names of a category. An empty result
             *              means the category is unknown or has no algorithms.
             */
            std::vector<std::string> AlgorithmsFor(const std::string& category) const;

            /**
             * Method: ComplexityOf
             * Description: Time/space labels of an algorithm; "Unknown" labels
             *              with known == false when the pair is not registered.
             */
            TComplexity ComplexityOf(const std::string& category, const std::string& algorithm) const;

            bool HasCategory(const std::string& category) const;
            std::vector<std::string> Categories() const;
            bool empty() const { return categories_.empty(); }

        private:
            struct TCategory {
                std::string name;
                std::vector<TAlgorithmEntry> algorithms;
            };

            const TCategory* FindCategory(const std::string& category) const;

            std::vector<TCategory> categories_;
    };

    /**
     * Method: DefaultCatalog
     * Description: Built-in table with the sorting, searching, dp and graph categories
     */
    AlgorithmCatalog DefaultCatalog();

    /**
     * Method: LoadCatalogYaml
     * Description: Read a catalog written as category -> algorithm -> {time, space}
     * Throws: ConfigError on unreadable or malformed files
     */
    AlgorithmCatalog LoadCatalogYaml(const std::string& path);

    /**
     * Method: ComplexityRank
     * Description: Order of a Big-O label from O(1) = 1 up to O(n!) = 8.
     *              Labels outside that ladder rank as O(n).
     */
    int ComplexityRank(const std::string& label);

    // Reward in (0, 1] that favours cheaper time complexity classes
    double ComplexityReward(const TComplexity& complexity);

} // namespace discolib::core
