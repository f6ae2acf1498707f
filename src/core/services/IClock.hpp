/**
 * @file IClock.hpp
 * @brief Injectable wall clock used for session idle accounting.
 */

#pragma once

#include <chrono>

namespace netsweep::core {

/**
 * @brief Source of the current time.
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual std::chrono::system_clock::time_point now() const = 0;
};

/**
 * @brief IClock backed by std::chrono::system_clock.
 */
class SystemClock : public IClock {
public:
    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace netsweep::core
