/**
 * @file IOuiClassifier.hpp
 * @brief Interface for labelling MAC addresses by vendor prefix.
 */

#pragma once

#include <string>

namespace netsweep::core {

/**
 * @brief Maps a MAC address to a device category label.
 *
 * Implementations may consult a vendor (OUI) database. The label is
 * informational only.
 */
class IOuiClassifier {
public:
    virtual ~IOuiClassifier() = default;

    /**
     * @brief Classifies a MAC address.
     * @param macAddress Upper-case colon-separated address.
     * @return Category label such as "Desktop" or "Network".
     */
    [[nodiscard]] virtual std::string classify(const std::string& macAddress) const = 0;
};

} // namespace netsweep::core
