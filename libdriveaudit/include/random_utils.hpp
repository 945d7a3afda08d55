#ifndef DRIVEAUDIT_RANDOM_UTILS_HPP
#define DRIVEAUDIT_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random helpers for unique scratch directory names.
 */
namespace driveaudit::random_utils {

    /**
     * @brief Next value of the calling thread's generator.
     */
    unsigned long long next_u64();

    /**
     * @brief Sixteen lowercase hex digits, suitable as a name suffix.
     */
    std::string random_suffix();

} // namespace driveaudit::random_utils

#endif // DRIVEAUDIT_RANDOM_UTILS_HPP
