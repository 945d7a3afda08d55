#ifndef DRIVEAUDIT_VENDOR_HPP
#define DRIVEAUDIT_VENDOR_HPP

#include <string>
#include <string_view>

namespace driveaudit {

    /**
     * @brief Vendor name implied by a model number prefix.
     *
     * ST is Seagate, WD Western Digital, DT and MG Toshiba, HUA and HUS
     * Hitachi, IBM IBM. Anything else is "Unknown".
     */
    std::string derive_vendor(std::string_view model);

    /// The part of a serial printed on the drive label: its first 8 characters.
    std::string label_serial_of(std::string_view serial);

} // namespace driveaudit

#endif // DRIVEAUDIT_VENDOR_HPP
