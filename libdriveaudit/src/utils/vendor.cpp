#include "../../include/vendor.hpp"
#include "../../include/string_utils.hpp"
#include <array>
#include <utility>

namespace driveaudit {

std::string derive_vendor(const std::string_view model) {
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 7> kPrefixes = {{
        {"ST", "Seagate"},
        {"WD", "Western Digital"},
        {"DT", "Toshiba"},
        {"MG", "Toshiba"},
        {"HUA", "Hitachi"},
        {"HUS", "Hitachi"},
        {"IBM", "IBM"},
    }};

    const std::string upper = to_upper_copy(trim(model));
    for (const auto& [prefix, vendor] : kPrefixes) {
        if (upper.starts_with(prefix)) {
            return std::string(vendor);
        }
    }
    return "Unknown";
}

std::string label_serial_of(const std::string_view serial) {
    return std::string(serial.substr(0, 8));
}

} // namespace driveaudit
