/**
 * @file DiscoveryError.hpp
 * @brief Exception hierarchy raised by the discovery engine.
 *
 * Callers receive either a structured result or one of these errors.
 * Validation rejects for VLANs are not errors; they are reported in the
 * result's invalid list.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace netsweep::core {

/**
 * @brief Base class for all engine-level failures.
 */
class DiscoveryError : public std::runtime_error {
public:
    explicit DiscoveryError(const std::string& message) : std::runtime_error(message) {}

    /**
     * @brief Short machine-readable error class name.
     * @return e.g. "ConnectError", "RequestTimeout".
     */
    [[nodiscard]] virtual std::string kind() const { return "DiscoveryError"; }
};

/**
 * @brief A transport session could not be established or was broken.
 *
 * Covers resolution failures, socket errors and ICMP rejections.
 */
class ConnectError : public DiscoveryError {
public:
    using DiscoveryError::DiscoveryError;
    [[nodiscard]] std::string kind() const override { return "ConnectError"; }
};

/**
 * @brief A get or walk exceeded its deadline.
 */
class RequestTimeout : public DiscoveryError {
public:
    using DiscoveryError::DiscoveryError;
    [[nodiscard]] std::string kind() const override { return "RequestTimeout"; }
};

/**
 * @brief The agent answered with a non-zero error-status for the whole request.
 */
class RequestError : public DiscoveryError {
public:
    RequestError(const std::string& message, int errorStatus, int errorIndex)
        : DiscoveryError(message), errorStatus_(errorStatus), errorIndex_(errorIndex) {}

    [[nodiscard]] std::string kind() const override { return "RequestError"; }
    [[nodiscard]] int errorStatus() const { return errorStatus_; }
    [[nodiscard]] int errorIndex() const { return errorIndex_; }

private:
    int errorStatus_;
    int errorIndex_;
};

/**
 * @brief A packet or varbind could not be decoded.
 *
 * Item-scoped inside the discovery algorithms: logged and skipped.
 */
class DecodeError : public DiscoveryError {
public:
    using DiscoveryError::DiscoveryError;
    [[nodiscard]] std::string kind() const override { return "DecodeError"; }
};

/**
 * @brief A session identifier is unknown or has expired.
 */
class SessionNotFound : public DiscoveryError {
public:
    using DiscoveryError::DiscoveryError;
    [[nodiscard]] std::string kind() const override { return "SessionNotFound"; }
};

/**
 * @brief Caller input (address, community, version, VLAN id) is invalid.
 */
class ValidationError : public DiscoveryError {
public:
    using DiscoveryError::DiscoveryError;
    [[nodiscard]] std::string kind() const override { return "ValidationError"; }
};

} // namespace netsweep::core
