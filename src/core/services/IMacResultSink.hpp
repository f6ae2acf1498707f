/**
 * @file IMacResultSink.hpp
 * @brief Push interface receiving MAC sweep results as they are produced.
 */

#pragma once

#include "core/types/MacAddressRecord.hpp"

#include <vector>

namespace netsweep::core {

/**
 * @brief Receives per-VLAN chunks and one terminal summary.
 *
 * onChunk() is called once per attempted VLAN, in sweep order, right after
 * that VLAN's walk finished (possibly with an empty list). onComplete() is
 * called exactly once after all chunks, even when every VLAN failed.
 */
class IMacResultSink {
public:
    virtual ~IMacResultSink() = default;

    /**
     * @brief Delivers the records learned on one VLAN.
     * @param vlanId VLAN that was walked.
     * @param records Records new to this sweep.
     */
    virtual void onChunk(int vlanId, const std::vector<MacAddressRecord>& records) = 0;

    /**
     * @brief Delivers the terminal summary.
     * @param summary Attempted VLANs, total count and failed VLANs.
     */
    virtual void onComplete(const MacSweepSummary& summary) = 0;
};

} // namespace netsweep::core
