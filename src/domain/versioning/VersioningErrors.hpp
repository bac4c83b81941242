/**
 * @file VersioningErrors.hpp
 * @brief Exceptions raised by the versioning core.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace clausetrail::domain::versioning {

/** @brief A referenced version or comparison does not exist. */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief Request is well-formed but violates a domain rule. */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

/** @brief A long-running computation was cancelled or ran past its deadline. */
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what = "Operation cancelled")
        : std::runtime_error(what) {}
};

} // namespace clausetrail::domain::versioning
