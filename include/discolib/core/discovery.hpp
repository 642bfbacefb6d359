#pragma once

#include "discolib/core/data.hpp"
#include "discolib/core/catalog.hpp"
#include "discolib/core/qlearning.hpp"
#include "discolib/core/isink.hpp"

namespace discolib::core {

    /**
     * @brief Picks an algorithm for a problem with the Q-Learning policy
     *
     * Owns the policy, the catalog it draws legal actions from and the
     * append-only history of past choices.
     */
    class DiscoveryAgent {
        public:
            // Measured quality of an algorithm, used as reward
            using Evaluator = std::function<double(const std::string& algorithm)>;

            explicit DiscoveryAgent(AlgorithmCatalog catalog = DefaultCatalog(),
                                    const TQLConfig& config = TQLConfig{},
                                    unsigned int seed = std::random_device{}());

            /**
             * Method: Discover
             * Description: Select an algorithm for (category, inputSize) and append
             *              the record to the history. When an evaluator is given its
             *              score is stored in the record and fed back as reward.
             *              Unknown categories and categories without algorithms
             *              return a status and leave the history untouched.
             *              A non-finite score throws std::invalid_argument and
             *              nothing is recorded.
             */
            TDiscoveryOutcome Discover(const std::string& category, long long inputSize,
                                       const Evaluator& evaluator = {});

            /**
             * Method: Feedback
             * Description: Reward measured after the selection. Each discovery is a
             *              one-step episode, so the update has no successor state.
             *              Returns false when the algorithm is not legal for the category.
             * Throws: std::invalid_argument for a NaN or infinite reward
             */
            bool Feedback(const std::string& category, long long inputSize,
                          const std::string& algorithm, double reward);

            std::optional<std::string> Recommend(const std::string& category, long long inputSize) const;

            // Most recent records, oldest first; limit 0 returns the whole history
            std::vector<TDiscoveryRecord> History(std::size_t limit = 10) const;
            std::size_t HistorySize() const;

            // Back to the initial, unlearned state
            void Reset();

            void SetSink(std::shared_ptr<IResultSink> sink) { sink_ = std::move(sink); }

            QLearningPolicy& Policy() { return policy_; }
            const QLearningPolicy& Policy() const { return policy_; }
            const AlgorithmCatalog& Catalog() const { return catalog_; }

            static int SizeBucket(long long inputSize);
            static std::string StateKey(const std::string& category, long long inputSize);

        private:
            AlgorithmCatalog catalog_;
            QLearningPolicy policy_;
            std::vector<TDiscoveryRecord> history_;
            std::shared_ptr<IResultSink> sink_;
            mutable std::mutex historyMutex_;
    };

} // namespace discolib::core
