/**
 * @file work_area.hpp
 * @brief Scoped scratch directory for archive expansion.
 */

#ifndef DRIVEAUDIT_WORK_AREA_HPP
#define DRIVEAUDIT_WORK_AREA_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace driveaudit {

    /**
     * @brief Owns a unique temporary directory for the lifetime of one batch.
     *
     * The directory is created by the constructor and removed recursively by
     * the destructor, so it disappears on every exit path including a thrown
     * ResourceExhaustedError. The area also accounts the bytes materialized
     * into it against the batch byte budget.
     */
    class WorkArea {
    public:
        /**
         * @brief Create the directory "driveaudit-{random}" under @p parent.
         * @param byte_budget Maximum bytes that may be written into the area.
         * @param parent Parent directory; the system temp directory when empty.
         * @throws std::runtime_error if the directory can't be created.
         */
        explicit WorkArea(std::uint64_t byte_budget, const std::filesystem::path& parent = {});

        ~WorkArea();

        WorkArea(const WorkArea&) = delete;
        WorkArea& operator=(const WorkArea&) = delete;

        [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

        /**
         * @brief Create a fresh, uniquely named subdirectory.
         * @param prefix Short label used in the directory name (e.g. "zip").
         */
        std::filesystem::path make_subdir(std::string_view prefix);

        /**
         * @brief Account @p bytes against the budget. Thread-safe.
         * @param bytes Bytes about to be written.
         * @param file_name Input charged for the bytes, used in the error.
         * @throws ResourceExhaustedError when the budget would be exceeded.
         */
        void reserve(std::uint64_t bytes, const std::string& file_name);

        [[nodiscard]] std::uint64_t bytes_used() const noexcept { return used_.load(); }
        [[nodiscard]] std::uint64_t byte_budget() const noexcept { return budget_; }

    private:
        std::filesystem::path root_;       ///< Directory removed on destruction
        std::uint64_t budget_;             ///< Byte budget for the whole batch
        std::atomic<std::uint64_t> used_{0}; ///< Bytes reserved so far
        std::atomic<unsigned> next_id_{0}; ///< Counter for subdirectory names
    };

} // namespace driveaudit

#endif // DRIVEAUDIT_WORK_AREA_HPP
