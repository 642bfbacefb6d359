#include "discolib/core/discovery.hpp"
#include "discolib/core/method.hpp"

namespace discolib::core {

    DiscoveryAgent::DiscoveryAgent(AlgorithmCatalog catalog, const TQLConfig& config, unsigned int seed)
        : catalog_(std::move(catalog)), policy_(config, seed)
    {}

    // -----------------------------------------------------------------------------
    // State discretization
    // -----------------------------------------------------------------------------

    int DiscoveryAgent::SizeBucket(long long inputSize)
    {
        int bucket = 0;
        while (inputSize >= 10) {
            inputSize /= 10;
            bucket++;
        }
        return bucket;
    }

    std::string DiscoveryAgent::StateKey(const std::string& category, long long inputSize)
    {
        return category + "_b" + std::to_string(SizeBucket(inputSize));
    }

    // -----------------------------------------------------------------------------
    // Discovery
    // -----------------------------------------------------------------------------

    TDiscoveryOutcome DiscoveryAgent::Discover(const std::string& category, long long inputSize,
                                               const Evaluator& evaluator)
    {
        TDiscoveryOutcome outcome;

        if (!catalog_.HasCategory(category)) {
            outcome.status = DiscoveryStatus::UnknownCategory;
            return outcome;
        }

        std::vector<std::string> actions = catalog_.AlgorithmsFor(category);
        if (actions.empty()) {
            outcome.status = DiscoveryStatus::NoAlgorithms;
            return outcome;
        }

        TDiscoveryRecord& rec = outcome.record;
        rec.category = category;
        rec.inputSize = inputSize;
        rec.state = StateKey(category, inputSize);
        rec.selectedAlgorithm = policy_.SelectAction(rec.state, actions);

        TComplexity complexity = catalog_.ComplexityOf(category, rec.selectedAlgorithm);
        rec.timeComplexity = complexity.time;
        rec.spaceComplexity = complexity.space;

        if (evaluator) {
            double score = evaluator(rec.selectedAlgorithm);
            rec.fitnessScore = score;
            policy_.Update(rec.state, rec.selectedAlgorithm, score, rec.state, {});
        }

        rec.timestamp = get_epoch_seconds();

        {
            std::lock_guard<std::mutex> lock(historyMutex_);
            history_.push_back(rec);
        }

        if (sink_) {
            try {
                sink_->OnDiscovery(rec);
            } catch (const std::exception& e) {
                std::cerr << "\nWARNING: result sink rejected discovery of " << rec.selectedAlgorithm
                          << ": " << e.what() << std::endl;
            }
        }

        return outcome;
    }

    bool DiscoveryAgent::Feedback(const std::string& category, long long inputSize,
                                  const std::string& algorithm, double reward)
    {
        std::vector<std::string> actions = catalog_.AlgorithmsFor(category);
        if (std::ranges::find(actions, algorithm) == actions.end()) return false;

        std::string state = StateKey(category, inputSize);
        policy_.Update(state, algorithm, reward, state, {});
        return true;
    }

    std::optional<std::string> DiscoveryAgent::Recommend(const std::string& category, long long inputSize) const
    {
        return policy_.BestAction(StateKey(category, inputSize));
    }

    // -----------------------------------------------------------------------------
    // History
    // -----------------------------------------------------------------------------

    std::vector<TDiscoveryRecord> DiscoveryAgent::History(std::size_t limit) const
    {
        std::lock_guard<std::mutex> lock(historyMutex_);

        std::size_t first = (limit > 0 && history_.size() > limit) ? history_.size() - limit : 0;
        return std::vector<TDiscoveryRecord>(history_.begin() + first, history_.end());
    }

    std::size_t DiscoveryAgent::HistorySize() const
    {
        std::lock_guard<std::mutex> lock(historyMutex_);
        return history_.size();
    }

    void DiscoveryAgent::Reset()
    {
        policy_.Reset();

        std::lock_guard<std::mutex> lock(historyMutex_);
        history_.clear();
    }

} // namespace discolib::core
