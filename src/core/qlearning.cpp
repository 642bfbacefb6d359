#include "discolib/core/qlearning.hpp"
#include "discolib/core/method.hpp" // randomico() and irandomico()
#include "discolib/core/errors.hpp"

namespace discolib::core {

    static void CheckUnitInterval(double value, const char* name)
    {
        if (!(value >= 0.0 && value <= 1.0)) {
            throw std::invalid_argument(std::string(name) + " must lie in [0, 1]");
        }
    }

    QLearningPolicy::QLearningPolicy(const TQLConfig& config, unsigned int seed)
        : config_(config), rng_(seed)
    {
        CheckUnitInterval(config_.learningRate, "learning rate");
        CheckUnitInterval(config_.discountFactor, "discount factor");
        CheckUnitInterval(config_.epsilon, "epsilon");
    }

    void QLearningPolicy::SetEpsilon(double epsilon)
    {
        CheckUnitInterval(epsilon, "epsilon");
        std::lock_guard<std::mutex> lock(mutex_);
        config_.epsilon = epsilon;
    }

    // -----------------------------------------------------------------------------
    // Q-table access (callers hold the mutex)
    // -----------------------------------------------------------------------------

    TQ& QLearningPolicy::Entry(const std::string& state, const std::string& action)
    {
        // operator[] value-initializes, so unseen pairs start at q = 0
        return table_[TKey(state, action)];
    }

    double QLearningPolicy::MaxQ(const std::string& state, const std::vector<std::string>& actions)
    {
        if (actions.empty()) return 0.0;

        double maxQ = -std::numeric_limits<double>::infinity();
        for (const auto& a : actions) {
            maxQ = std::max(maxQ, Entry(state, a).q);
        }
        return maxQ;
    }

    // -----------------------------------------------------------------------------
    // Policy
    // -----------------------------------------------------------------------------

    std::string QLearningPolicy::SelectAction(const std::string& state, const std::vector<std::string>& legalActions)
    {
        if (legalActions.empty()) throw NoLegalActionsError(state);

        std::lock_guard<std::mutex> lock(mutex_);

        visits_[state]++;

        // epsilon-greedy policy
        if (randomico(rng_, 0, 1) < config_.epsilon) {
            // choose a randomly selected action
            return legalActions[irandomico(rng_, 0, (int)legalActions.size() - 1)];
        }

        // choose among the actions with highest Q value
        double maxQ = MaxQ(state, legalActions);

        std::vector<int> best;
        for (int i = 0; i < (int)legalActions.size(); i++) {
            if (Entry(state, legalActions[i]).q == maxQ) best.push_back(i);
        }

        // no comparable value (NaN entries): any legal action
        if (best.empty()) {
            return legalActions[irandomico(rng_, 0, (int)legalActions.size() - 1)];
        }

        return legalActions[best[irandomico(rng_, 0, (int)best.size() - 1)]];
    }

    void QLearningPolicy::Update(const std::string& state, const std::string& action, double reward,
                                 const std::string& nextState, const std::vector<std::string>& nextActions)
    {
        if (!std::isfinite(reward)) {
            throw std::invalid_argument("reward for " + state + "/" + action + " is not a finite number");
        }

        std::lock_guard<std::mutex> lock(mutex_);

        double maxNext = MaxQ(nextState, nextActions);

        TQ& entry = Entry(state, action);
        entry.q = entry.q + config_.learningRate * (reward + config_.discountFactor * maxNext - entry.q);
        entry.k++;
    }

    std::optional<std::string> QLearningPolicy::BestAction(const std::string& state) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<std::string> best;
        double maxQ = -std::numeric_limits<double>::infinity();

        // entries of one state are contiguous in the (state, action) ordering
        for (auto it = table_.lower_bound(TKey(state, std::string())); it != table_.end() && it->first.first == state; ++it) {
            if (!best || it->second.q > maxQ) {
                maxQ = it->second.q;
                best = it->first.second;
            }
        }
        return best;
    }

    double QLearningPolicy::Value(const std::string& state, const std::string& action) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = table_.find(TKey(state, action));
        return (it == table_.end()) ? 0.0 : it->second.q;
    }

    int QLearningPolicy::Visits(const std::string& state) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = visits_.find(state);
        return (it == visits_.end()) ? 0 : it->second;
    }

    std::size_t QLearningPolicy::Size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return table_.size();
    }

    void QLearningPolicy::Reset()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        table_.clear();
        visits_.clear();
    }

    void QLearningPolicy::PrintPolicy(std::ostream& out) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string current;
        bool first = true;
        for (const auto& [key, entry] : table_) {
            if (first || key.first != current) {
                current = key.first;
                first = false;

                auto v = visits_.find(current);
                out << "\nstate " << current << " (visits " << ((v == visits_.end()) ? 0 : v->second) << "):";
            }
            std::ostringstream value;
            value << std::fixed << std::setprecision(4) << entry.q;
            out << "\n\t" << key.second << " (" << value.str() << ", updates " << entry.k << ")";
        }
        out << std::endl;
    }

} // namespace discolib::core
