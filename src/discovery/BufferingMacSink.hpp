#pragma once

#include "core/services/IMacResultSink.hpp"

#include <mutex>
#include <optional>
#include <vector>

namespace netsweep::discovery {

/**
 * @brief Collects a MAC sweep into a single list.
 *
 * Records keep per-VLAN order. Used when the caller has no streaming output.
 */
class BufferingMacSink : public core::IMacResultSink {
public:
    void onChunk(int vlanId, const std::vector<core::MacAddressRecord>& records) override;
    void onComplete(const core::MacSweepSummary& summary) override;

    [[nodiscard]] std::vector<core::MacAddressRecord> records() const;

    /**
     * @brief VLAN ids in the order their chunks arrived.
     */
    [[nodiscard]] std::vector<int> chunkOrder() const;

    [[nodiscard]] std::optional<core::MacSweepSummary> summary() const;

    [[nodiscard]] bool isComplete() const;

private:
    mutable std::mutex mutex_;
    std::vector<core::MacAddressRecord> records_;
    std::vector<int> chunkOrder_;
    std::optional<core::MacSweepSummary> summary_;
};

} // namespace netsweep::discovery
