#pragma once

#include "discolib/core/data.hpp"

namespace discolib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    double randomico(std::mt19937 &rng, double min, double max);
    int irandomico(std::mt19937 &rng, int min, int max);
    double gaussian(std::mt19937 &rng, double stddev);

    double get_time_in_seconds();
    double get_epoch_seconds();

    /**
     * Method: Log
     * Description: Print a progress message on stdout when debug is enabled
     */
    void Log(int debug, const std::string &msg);

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------

    /**
     * Method: readRunDataYaml
     * Description: Fill runData from a YAML file with the sections
     *              qlearning, ga, mutation and catalog. Keys absent from the
     *              file keep their current value.
     * Throws: ConfigError when the file cannot be parsed or a value has the wrong type
     */
    void readRunDataYaml(const std::string &paramFile, TRunData &runData);

} // namespace discolib::core
