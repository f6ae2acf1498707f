#pragma once

#include "core/services/IOuiClassifier.hpp"

#include <array>

namespace netsweep::discovery {

/**
 * @brief Placeholder OUI classifier.
 *
 * This is NOT a vendor database lookup. The label is the sum of the three
 * OUI octets modulo the size of a fixed category list, so it is stable for a
 * given vendor prefix but carries no real meaning. Replace with a real OUI
 * table behind core::IOuiClassifier when one is available.
 */
class HashOuiClassifier : public core::IOuiClassifier {
public:
    static constexpr std::array<const char*, 5> CATEGORIES = {"Desktop", "Mobile", "IoT", "Server",
                                                              "Network"};

    /**
     * @return A label from CATEGORIES, or "Unknown" if the address is malformed.
     */
    [[nodiscard]] std::string classify(const std::string& macAddress) const override;
};

} // namespace netsweep::discovery
