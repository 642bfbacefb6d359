#pragma once

#include "discolib/core/data.hpp"

namespace discolib::core {

    /**
     * @brief Tabular Q-Learning policy over discrete (state, action) pairs
     *
     * Q-values live in one table keyed by (state, action) and are created with
     * value 0 the first time they are read. Selection and updates are
     * serialized by an internal mutex, so one policy may be shared by several
     * threads.
     */
    class QLearningPolicy {
        public:
            explicit QLearningPolicy(const TQLConfig& config = TQLConfig{}, unsigned int seed = std::random_device{}());

            QLearningPolicy(const QLearningPolicy&) = delete;
            QLearningPolicy& operator=(const QLearningPolicy&) = delete;

            /**
             * Method: SelectAction
             * Description: Choose an action based on epsilon-greedy policy. Ties
             *              between maximal actions are broken uniformly at random.
             *              Increments the visit counter of the state.
             * Throws: NoLegalActionsError when legalActions is empty
             */
            std::string SelectAction(const std::string& state, const std::vector<std::string>& legalActions);

            /**
             * Method: Update
             * Description: One-step Q-Learning update
             *              Q(s,a) += lf * (R + df * max_a' Q(s',a') - Q(s,a)).
             *              The max over an empty successor set is 0 (terminal state).
             * Throws: std::invalid_argument when reward is NaN or infinite; the
             *         table is left untouched
             */
            void Update(const std::string& state, const std::string& action, double reward,
                        const std::string& nextState, const std::vector<std::string>& nextActions);

            /**
             * Method: BestAction
             * Description: Action with the highest Q-value stored for the state,
             *              std::nullopt if nothing was ever stored for it
             */
            std::optional<std::string> BestAction(const std::string& state) const;

            double Value(const std::string& state, const std::string& action) const;
            int Visits(const std::string& state) const;
            std::size_t Size() const;

            // Forget every Q-value and visit counter
            void Reset();

            void PrintPolicy(std::ostream& out) const;

            const TQLConfig& Config() const { return config_; }
            void SetEpsilon(double epsilon);

        private:
            using TKey = std::pair<std::string, std::string>;

            TQ& Entry(const std::string& state, const std::string& action);
            double MaxQ(const std::string& state, const std::vector<std::string>& actions);

            TQLConfig config_;
            std::map<TKey, TQ> table_;                  // (state, action) -> Q entry
            std::map<std::string, int> visits_;         // state -> number of selections
            std::mt19937 rng_;
            mutable std::mutex mutex_;
    };

} // namespace discolib::core
