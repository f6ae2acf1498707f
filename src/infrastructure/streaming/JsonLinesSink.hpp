#pragma once

#include "core/services/IMacResultSink.hpp"

#include <mutex>
#include <ostream>

namespace netsweep::infra {

/**
 * @brief Writes a MAC sweep as JSON lines.
 *
 * Each chunk becomes one {"type":"macAddresses",...} line and the summary
 * one {"type":"summary",...} line. The stream is flushed after every line
 * so a reader sees VLANs as they finish.
 */
class JsonLinesSink : public core::IMacResultSink {
public:
    explicit JsonLinesSink(std::ostream& out);

    void onChunk(int vlanId, const std::vector<core::MacAddressRecord>& records) override;
    void onComplete(const core::MacSweepSummary& summary) override;

private:
    std::mutex mutex_;
    std::ostream& out_;
};

} // namespace netsweep::infra
