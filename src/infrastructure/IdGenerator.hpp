/**
 * @file IdGenerator.hpp
 * @brief Random identifiers for versions, comparisons and changes.
 */

#pragma once
#include <string>

namespace clausetrail::infrastructure {

class IdGenerator {
public:
    /** @brief Returns a random RFC 4122 version 4 UUID in canonical text form. */
    static std::string uuid4();
};

} // namespace clausetrail::infrastructure
