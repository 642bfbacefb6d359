#pragma once

#include "discolib/core/data.hpp"
#include "discolib/core/isink.hpp"

namespace discolib::utils {

    /**
     * Outputs a discovery record to the screen.
     */
    void WriteDiscoveryScreen(const discolib::core::TDiscoveryRecord &rec);

    /**
     * Outputs the result of a GA run to the screen.
     */
    void WriteOptimizationScreen(const discolib::core::TOptimizationResult &result, float timeTotal);

    /**
     * Appends discovery records to a csv file (header written for new files).
     * Throws std::runtime_error when the file cannot be opened.
     */
    void WriteDiscoveries(const std::string &path, const std::vector<discolib::core::TDiscoveryRecord> &records);

    /**
     * Writes the per-generation best/average fitness of a run in a csv file.
     * Throws std::runtime_error when the file cannot be opened.
     */
    void WriteConvergence(const std::string &path, const discolib::core::TOptimizationResult &result);

    /**
     * Result sink that appends every record to csv files.
     */
    class CsvResultSink : public discolib::core::IResultSink {
        public:
            CsvResultSink(std::string discoveryPath, std::string optimizationPath);

            void OnDiscovery(const discolib::core::TDiscoveryRecord &record) override;
            void OnOptimization(const discolib::core::TOptimizationResult &result) override;

        private:
            std::string discoveryPath_;
            std::string optimizationPath_;
    };

} // namespace discolib::utils
