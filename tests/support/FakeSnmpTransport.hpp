#pragma once

#include "core/services/ISnmpTransport.hpp"
#include "core/types/DiscoveryError.hpp"
#include "infrastructure/snmp/SnmpCodec.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace netsweep::testing {

struct OidLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return infra::SnmpCodec::compareOids(a, b) < 0;
    }
};

/**
 * @brief In-memory agent scripted with OID values and failure modes.
 */
struct FakeAgent {
    std::map<std::string, core::SnmpVarBind, OidLess> values;
    size_t batchSize{10};
    bool rejectCombinedGet{false};                     ///< v1 style noSuchName for multi-OID GETs
    std::map<std::string, size_t> timeoutAfterBatches; ///< root -> batches delivered before timing out
    std::set<std::string> brokenWalks;                 ///< roots whose walk fails with ConnectError
    std::map<std::string, size_t> refuseAfterBatches;  ///< root -> batches delivered before a ConnectError

    FakeAgent& setText(const std::string& oid, const std::string& text) {
        values[oid] = {oid, core::SnmpDataType::OctetString, text, std::nullopt};
        return *this;
    }

    FakeAgent& setOid(const std::string& oid, const std::string& value) {
        values[oid] = {oid, core::SnmpDataType::ObjectIdentifier, value, std::nullopt};
        return *this;
    }

    FakeAgent& setInt(const std::string& oid, int64_t value) {
        values[oid] = {oid, core::SnmpDataType::Integer, std::to_string(value), value};
        return *this;
    }

    FakeAgent& setMarker(const std::string& oid, core::SnmpDataType marker) {
        values[oid] = {oid, marker, "", std::nullopt};
        return *this;
    }
};

class FakeWalkStream : public core::IWalkStream {
public:
    FakeWalkStream(std::vector<core::SnmpVarBind> rows, size_t batchSize, std::optional<size_t> timeoutAfter,
                   bool broken, std::optional<size_t> refuseAfter = std::nullopt)
        : rows_(std::move(rows)), batchSize_(batchSize == 0 ? 1 : batchSize), timeoutAfter_(timeoutAfter),
          broken_(broken), refuseAfter_(refuseAfter) {}

    std::optional<std::vector<core::SnmpVarBind>> next() override {
        if (broken_) {
            throw core::ConnectError("Connection refused");
        }
        if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
            throw core::RequestTimeout("Walk deadline exceeded");
        }
        if (timeoutAfter_ && delivered_ >= *timeoutAfter_) {
            throw core::RequestTimeout("Request timed out");
        }
        if (refuseAfter_ && delivered_ >= *refuseAfter_) {
            throw core::ConnectError("Connection refused");
        }
        if (position_ >= rows_.size()) {
            return std::nullopt;
        }
        size_t end = std::min(rows_.size(), position_ + batchSize_);
        std::vector<core::SnmpVarBind> batch(rows_.begin() + static_cast<std::ptrdiff_t>(position_),
                                             rows_.begin() + static_cast<std::ptrdiff_t>(end));
        position_ = end;
        ++delivered_;
        return batch;
    }

    void setDeadline(std::chrono::steady_clock::time_point deadline) override { deadline_ = deadline; }

private:
    std::vector<core::SnmpVarBind> rows_;
    size_t batchSize_;
    std::optional<size_t> timeoutAfter_;
    bool broken_;
    std::optional<size_t> refuseAfter_;
    size_t position_{0};
    size_t delivered_{0};
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

class FakeSnmpTransport;

class FakeSession : public core::ISnmpSession {
public:
    FakeSession(core::SnmpTarget target, std::shared_ptr<const FakeAgent> agent, FakeSnmpTransport& owner)
        : target_(std::move(target)), agent_(std::move(agent)), owner_(owner) {}

    std::vector<core::SnmpVarBind> get(const std::vector<std::string>& oids) override;
    std::unique_ptr<core::IWalkStream> walk(const std::string& rootOid) override;
    void close() override;
    bool isOpen() const override { return open_; }
    const core::SnmpTarget& target() const override { return target_; }

private:
    core::SnmpTarget target_;
    std::shared_ptr<const FakeAgent> agent_;
    FakeSnmpTransport& owner_;
    bool open_{true};
};

/**
 * @brief Transport whose agents are keyed by community, optionally per address.
 *
 * Addresses without an agent behave like silent hosts: every request times out.
 */
class FakeSnmpTransport : public core::ISnmpTransport {
public:
    FakeAgent& agent(const std::string& community) { return agentAt("*", community); }

    FakeAgent& agentAt(const std::string& address, const std::string& community) {
        auto& slot = agents_[address + "|" + community];
        if (!slot) {
            slot = std::make_shared<FakeAgent>();
        }
        return *slot;
    }

    void refuseOpen(const std::string& community) { refused_.insert(community); }

    std::shared_ptr<core::ISnmpSession> open(const core::SnmpTarget& target) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            opened_.push_back(target);
        }
        if (refused_.count(target.community) > 0) {
            throw core::ConnectError("Failed to open session to " + target.address);
        }
        ++openCount_;
        return std::make_shared<FakeSession>(target, lookup(target), *this);
    }

    std::vector<core::SnmpTarget> openedTargets() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_;
    }

    std::vector<std::string> walkedRoots() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return walks_;
    }

    /** @brief Sessions opened and not yet closed. */
    int liveSessions() const { return openCount_.load() - closeCount_.load(); }

    void recordWalk(const std::string& root) {
        std::lock_guard<std::mutex> lock(mutex_);
        walks_.push_back(root);
    }

    void recordClose() { ++closeCount_; }

private:
    std::shared_ptr<const FakeAgent> lookup(const core::SnmpTarget& target) const {
        auto it = agents_.find(target.address + "|" + target.community);
        if (it == agents_.end()) {
            it = agents_.find("*|" + target.community);
        }
        return it == agents_.end() ? nullptr : it->second;
    }

    std::map<std::string, std::shared_ptr<FakeAgent>> agents_;
    std::set<std::string> refused_;
    mutable std::mutex mutex_;
    std::vector<core::SnmpTarget> opened_;
    std::vector<std::string> walks_;
    std::atomic<int> openCount_{0};
    std::atomic<int> closeCount_{0};
};

inline std::vector<core::SnmpVarBind> FakeSession::get(const std::vector<std::string>& oids) {
    if (!agent_) {
        throw core::RequestTimeout("Request to " + target_.address + " timed out");
    }

    std::vector<core::SnmpVarBind> result;
    for (size_t i = 0; i < oids.size(); ++i) {
        auto it = agent_->values.find(oids[i]);
        if (it != agent_->values.end()) {
            result.push_back(it->second);
            continue;
        }
        if (agent_->rejectCombinedGet || target_.version == core::SnmpVersion::V1) {
            throw core::RequestError("noSuchName", infra::SnmpCodec::ERR_NO_SUCH_NAME, static_cast<int>(i + 1));
        }
        result.push_back({oids[i], core::SnmpDataType::NoSuchObject, "", std::nullopt});
    }
    return result;
}

inline std::unique_ptr<core::IWalkStream> FakeSession::walk(const std::string& rootOid) {
    owner_.recordWalk(rootOid);
    if (!agent_) {
        return std::make_unique<FakeWalkStream>(std::vector<core::SnmpVarBind>{}, 1, size_t{0}, false);
    }

    std::vector<core::SnmpVarBind> rows;
    for (const auto& [oid, vb] : agent_->values) {
        if (oid != rootOid && infra::SnmpCodec::isOidPrefix(rootOid, oid)) {
            rows.push_back(vb);
        }
    }

    std::optional<size_t> timeoutAfter;
    if (auto it = agent_->timeoutAfterBatches.find(rootOid); it != agent_->timeoutAfterBatches.end()) {
        timeoutAfter = it->second;
    }
    std::optional<size_t> refuseAfter;
    if (auto it = agent_->refuseAfterBatches.find(rootOid); it != agent_->refuseAfterBatches.end()) {
        refuseAfter = it->second;
    }
    bool broken = agent_->brokenWalks.count(rootOid) > 0;
    return std::make_unique<FakeWalkStream>(std::move(rows), agent_->batchSize, timeoutAfter, broken, refuseAfter);
}

inline void FakeSession::close() {
    if (open_) {
        open_ = false;
        owner_.recordClose();
    }
}

} // namespace netsweep::testing
