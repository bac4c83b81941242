/**
 * @file IdGenerator.cpp
 * @brief Implementation of IdGenerator.
 */

#include "infrastructure/IdGenerator.hpp"
#include <random>

namespace clausetrail::infrastructure {

std::string IdGenerator::uuid4() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    std::string s;
    s.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) s += '-';
        int v = nibble(engine);
        if (i == 12) v = 4;                 // version
        if (i == 16) v = (v & 0x3) | 0x8;   // variant 10xx
        s += hex[v];
    }
    return s;
}

} // namespace clausetrail::infrastructure
