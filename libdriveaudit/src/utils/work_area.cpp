#include "../../include/work_area.hpp"
#include "../../include/logger.hpp"
#include "../../include/parse_error.hpp"
#include "../../include/random_utils.hpp"
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace driveaudit {

    WorkArea::WorkArea(const std::uint64_t byte_budget, const fs::path& parent)
        : budget_(byte_budget) {
        std::error_code ec;
        const fs::path base = parent.empty() ? fs::temp_directory_path(ec) : parent;
        if (ec) {
            throw std::runtime_error("no temp directory available: " + ec.message());
        }
        root_ = base / ("driveaudit-" + random_utils::random_suffix());
        fs::create_directories(root_, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create work area: " + root_.string() + " (" + ec.message() + ")",
                "WorkArea");
            throw std::runtime_error("can't create work area " + root_.string());
        }
        Logger::log(LogLevel::Debug, "Created work area: " + root_.string(), "WorkArea");
    }

    WorkArea::~WorkArea() {
        std::error_code ec;
        fs::remove_all(root_, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove work area: " + root_.string() + " (" + ec.message() + ")", "WorkArea");
        } else {
            Logger::log(LogLevel::Debug, "Removed work area: " + root_.string(), "WorkArea");
        }
    }

    fs::path WorkArea::make_subdir(const std::string_view prefix) {
        const unsigned id = next_id_.fetch_add(1);
        fs::path dir = root_ / (std::string(prefix) + "_" + std::to_string(id));
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("can't create " + dir.string() + ": " + ec.message());
        }
        return dir;
    }

    void WorkArea::reserve(const std::uint64_t bytes, const std::string& file_name) {
        const std::uint64_t total = used_.fetch_add(bytes) + bytes;
        if (total > budget_) {
            throw ResourceExhaustedError(
                "batch byte budget of " + std::to_string(budget_) + " bytes exceeded while expanding " + file_name,
                file_name);
        }
    }

} // namespace driveaudit
