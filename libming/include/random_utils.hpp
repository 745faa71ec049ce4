/**
 * @file random_utils.hpp
 * @brief Thread-local random helpers for unique temporary file names.
 */

#ifndef MING_RANDOM_UTILS_HPP
#define MING_RANDOM_UTILS_HPP

#include <string>

namespace ming::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a random hexadecimal suffix for temporary names.
     */
    std::string random_suffix();

} // namespace ming::RandomUtils

#endif // MING_RANDOM_UTILS_HPP
