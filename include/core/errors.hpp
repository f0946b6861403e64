/**
 * @file errors.hpp
 * @brief Exception types reported by the tradelab core.
 *
 * Every failure is raised synchronously at the offending call. Each type
 * derives from a standard exception so callers that only handle
 * std::invalid_argument or std::runtime_error keep working.
 */

#ifndef TRADELAB_CORE_ERRORS_HPP
#define TRADELAB_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tradelab
{

    /**
     * @brief Malformed simulation or analysis parameters.
     */
    class InvalidConfiguration : public std::invalid_argument
    {
    public:
        explicit InvalidConfiguration(const std::string &what)
            : std::invalid_argument(what) {}
    };

    /**
     * @brief A statistic was requested over an empty collection.
     */
    class EmptyInput : public std::invalid_argument
    {
    public:
        explicit EmptyInput(const std::string &what)
            : std::invalid_argument(what) {}
    };

    /**
     * @brief Input data contains NaN or infinite values.
     */
    class NonFiniteInput : public std::invalid_argument
    {
    public:
        explicit NonFiniteInput(const std::string &what)
            : std::invalid_argument(what) {}
    };

    /**
     * @brief The source collection is empty or too small for the request.
     */
    class InsufficientData : public std::runtime_error
    {
    public:
        explicit InsufficientData(const std::string &what)
            : std::runtime_error(what) {}
    };

    /** @brief A strategy name was registered twice. */
    class DuplicateName : public std::invalid_argument
    {
    public:
        explicit DuplicateName(const std::string &what)
            : std::invalid_argument(what) {}
    };

    /** @brief A strategy name was looked up but never registered. */
    class UnknownStrategy : public std::invalid_argument
    {
    public:
        explicit UnknownStrategy(const std::string &what)
            : std::invalid_argument(what) {}
    };

    /** @brief A comparison was requested before any strategy was added. */
    class EmptyRegistry : public std::runtime_error
    {
    public:
        explicit EmptyRegistry(const std::string &what)
            : std::runtime_error(what) {}
    };

    /**
     * @brief A simulation was aborted through its CancellationToken.
     *
     * Raised instead of returning a truncated SimulationRun.
     */
    class SimulationCancelled : public std::runtime_error
    {
    public:
        explicit SimulationCancelled(const std::string &what)
            : std::runtime_error(what) {}
    };

} // namespace tradelab

#endif // TRADELAB_CORE_ERRORS_HPP
