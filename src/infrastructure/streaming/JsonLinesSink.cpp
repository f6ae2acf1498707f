#include "infrastructure/streaming/JsonLinesSink.hpp"

#include "infrastructure/streaming/JsonSerialization.hpp"

namespace netsweep::infra {

JsonLinesSink::JsonLinesSink(std::ostream& out) : out_(out) {}

void JsonLinesSink::onChunk(int vlanId, const std::vector<core::MacAddressRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << toJsonText(macChunkToJson(vlanId, records)) << '\n';
    out_.flush();
}

void JsonLinesSink::onComplete(const core::MacSweepSummary& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << toJsonText(macSummaryToJson(summary)) << '\n';
    out_.flush();
}

} // namespace netsweep::infra
