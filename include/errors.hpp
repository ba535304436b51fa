// include/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace PageStitch
{

    // Persisted staging state exists but cannot be trusted (unparseable
    // manifest or chunk metadata, payload digest mismatch). Never treated as
    // a missing chunk; the operator has to re-run with --force.
    class StagingCorruptionError : public std::runtime_error
    {
    public:
        explicit StagingCorruptionError(const std::string &what)
            : std::runtime_error(what) {}
    };

    // The extraction service stopped at its output ceiling.
    class TruncatedOutputError : public std::runtime_error
    {
    public:
        explicit TruncatedOutputError(const std::string &what)
            : std::runtime_error(what) {}
    };

    // The extraction collaborator failed to produce a usable response.
    class ExtractionError : public std::runtime_error
    {
    public:
        explicit ExtractionError(const std::string &what)
            : std::runtime_error(what) {}
    };

} // namespace PageStitch
