#pragma once

#include <stdexcept>
#include <string>

namespace discolib::core {

    // Base of every condition the library reports by exception
    class DiscoError : public std::runtime_error {
        public:
            explicit DiscoError(const std::string& what) : std::runtime_error(what) {}
    };

    // Selection requested with an empty legal action set
    class NoLegalActionsError : public DiscoError {
        public:
            explicit NoLegalActionsError(const std::string& state)
                : DiscoError("no legal actions for state '" + state + "'") {}
    };

    // Population cannot be initialized without parameter templates
    class NoTemplatesError : public DiscoError {
        public:
            NoTemplatesError() : DiscoError("no parameter templates to build a population from") {}
    };

    // Malformed configuration file or catalog table
    class ConfigError : public DiscoError {
        public:
            explicit ConfigError(const std::string& what) : DiscoError(what) {}
    };

} // namespace discolib::core
