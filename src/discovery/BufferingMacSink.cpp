#include "discovery/BufferingMacSink.hpp"

namespace netsweep::discovery {

void BufferingMacSink::onChunk(int vlanId, const std::vector<core::MacAddressRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunkOrder_.push_back(vlanId);
    records_.insert(records_.end(), records.begin(), records.end());
}

void BufferingMacSink::onComplete(const core::MacSweepSummary& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    summary_ = summary;
}

std::vector<core::MacAddressRecord> BufferingMacSink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::vector<int> BufferingMacSink::chunkOrder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunkOrder_;
}

std::optional<core::MacSweepSummary> BufferingMacSink::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_;
}

bool BufferingMacSink::isComplete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_.has_value();
}

} // namespace netsweep::discovery
