#include "discolib/mh/optimizer.hpp"

namespace discolib::mh {

    using namespace discolib::core;

    ParameterOptimizer::ParameterOptimizer(std::string algorithmName, TParameters initialParams,
                                           const TGAConfig& config, unsigned int seed)
        : algorithmName_(std::move(algorithmName)),
          initialParams_(std::move(initialParams)),
          ga_(config, seed)
    {}

    TOptimizationResult ParameterOptimizer::Optimize(const FitnessFunction& fitnessFn, const TMutationBounds& bounds)
    {
        TOptimizationResult result = ga_.Evolve({initialParams_}, fitnessFn, bounds);
        result.algorithm = algorithmName_;
        return result;
    }

} // namespace discolib::mh
