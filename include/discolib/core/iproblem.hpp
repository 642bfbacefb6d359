#pragma once
#include "discolib/core/data.hpp"

namespace discolib::core {

    // Objective whose parameters are tuned by the genetic algorithm (maximized)
    class IObjective {
        public:
            virtual ~IObjective() = default;

            virtual std::string name() const = 0;

            virtual double evaluate(const TParameters& params) const = 0;

            // Starting point of the search
            virtual TParameters initialParameters() const = 0;

            // Search space of every tunable parameter
            virtual TMutationBounds bounds() const = 0;
        };

    /**
     * Method: createObjective
     * Description: Built-in objectives: "quadratic", "sphere" and "rastrigin"
     * Throws: ConfigError for an unknown name
     */
    std::shared_ptr<IObjective> createObjective(const std::string& name);

    std::vector<std::string> objectiveNames();

}
