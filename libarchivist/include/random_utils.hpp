//
// Created by Giuseppe Francione on 02/12/25.
//

#ifndef ARCHIVIST_RANDOM_UTILS_HPP
#define ARCHIVIST_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers.
 *
 * Used to build unique temporary names for thumbnails that are written
 * next to their final location and renamed into place.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Random hexadecimal suffix for temporary file names.
     */
    std::string random_suffix();

} // namespace

#endif //ARCHIVIST_RANDOM_UTILS_HPP
