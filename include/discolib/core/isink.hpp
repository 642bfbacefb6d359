#pragma once
#include "discolib/core/data.hpp"

namespace discolib::core {

    // Durable destination of discovery and optimization results
    class IResultSink {
        public:
            virtual ~IResultSink() = default;

            virtual void OnDiscovery(const TDiscoveryRecord& record) = 0;
            virtual void OnOptimization(const TOptimizationResult& result) = 0;
    };

}
