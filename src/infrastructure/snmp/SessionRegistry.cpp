#include "infrastructure/snmp/SessionRegistry.hpp"

#include "core/types/DiscoveryError.hpp"
#include "core/types/Validation.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace netsweep::infra {

namespace {
constexpr const char* BASE36_DIGITS = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr int SESSION_SUFFIX_LENGTH = 8;
} // anonymous namespace

SessionRegistry::SessionRegistry(std::shared_ptr<core::ISnmpTransport> transport,
                                 std::shared_ptr<core::IClock> clock,
                                 SessionSettings settings)
    : transport_(std::move(transport)), clock_(std::move(clock)), settings_(settings),
      rng_(std::random_device{}()) {
    spdlog::debug("SessionRegistry initialized (idle TTL {} min, sweep every {} min)",
                  settings_.idleTtl.count(), settings_.sweepInterval.count());
}

SessionRegistry::~SessionRegistry() {
    stopReaper();

    std::map<std::string, Entry> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(sessions_);
    }
    for (auto& [id, entry] : remaining) {
        closeQuietly(id, *entry.session);
    }
}

std::string SessionRegistry::connect(const core::SnmpTarget& target) {
    core::requireValidTarget(target.address, target.community);

    auto session = transport_->open(target);

    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();
    std::string id = generateId(now);
    while (sessions_.count(id) > 0) {
        id = generateId(now);
    }

    Entry entry;
    entry.info.id = id;
    entry.info.target = target;
    entry.info.createdAt = now;
    entry.info.lastActivityAt = now;
    entry.session = std::move(session);
    sessions_.emplace(id, std::move(entry));

    spdlog::info("[SNMP] Session {} established with {} using SNMPv{}", id, target.address,
                 core::snmpVersionToString(target.version));
    return id;
}

std::shared_ptr<core::ISnmpSession> SessionRegistry::find(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return nullptr;
    }
    it->second.info.lastActivityAt = clock_->now();
    return it->second.session;
}

std::optional<SessionInfo> SessionRegistry::info(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

bool SessionRegistry::touch(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.info.lastActivityAt = clock_->now();
    return true;
}

bool SessionRegistry::disconnect(const std::string& sessionId) {
    std::shared_ptr<core::ISnmpSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second.session);
        sessions_.erase(it);
    }

    closeQuietly(sessionId, *session);
    spdlog::info("[SNMP] Session {} disconnected", sessionId);
    return true;
}

void SessionRegistry::reportTransportError(const std::string& sessionId, const std::string& message) {
    std::shared_ptr<core::ISnmpSession> session;
    std::string address;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return;
        }
        address = it->second.info.target.address;
        session = std::move(it->second.session);
        sessions_.erase(it);
    }

    spdlog::error("[SNMP] Transport error for {} (session {}): {}", address, sessionId, message);
    closeQuietly(sessionId, *session);
}

size_t SessionRegistry::sweepIdle() {
    std::vector<std::pair<std::string, std::shared_ptr<core::ISnmpSession>>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second.info.lastActivityAt > settings_.idleTtl) {
                expired.emplace_back(it->first, std::move(it->second.session));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& [id, session] : expired) {
        closeQuietly(id, *session);
        spdlog::info("[SNMP] Closed inactive session: {}", id);
    }
    return expired.size();
}

void SessionRegistry::startReaper(asio::io_context& ioContext) {
    if (reaperActive_.exchange(true)) {
        return;
    }
    timer_ = std::make_shared<asio::steady_timer>(ioContext);
    scheduleSweep();
    spdlog::debug("Session reaper started");
}

void SessionRegistry::stopReaper() {
    if (!reaperActive_.exchange(false)) {
        return;
    }
    if (timer_) {
        timer_->cancel();
    }
    spdlog::debug("Session reaper stopped");
}

size_t SessionRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionRegistry::scheduleSweep() {
    if (!reaperActive_) {
        return;
    }

    auto timer = timer_;
    timer->expires_after(settings_.sweepInterval);
    timer->async_wait([this, timer](const asio::error_code& ec) {
        if (ec || !reaperActive_) {
            return;
        }

        size_t evicted = sweepIdle();
        if (evicted > 0) {
            spdlog::debug("Session reaper evicted {} session(s)", evicted);
        }

        scheduleSweep();
    });
}

std::string SessionRegistry::generateId(std::chrono::system_clock::time_point now) {
    auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    std::uniform_int_distribution<int> digit(0, 35);
    std::string suffix;
    suffix.reserve(SESSION_SUFFIX_LENGTH);
    for (int i = 0; i < SESSION_SUFFIX_LENGTH; ++i) {
        suffix += BASE36_DIGITS[digit(rng_)];
    }

    return "snmp_" + std::to_string(epochMs) + "_" + suffix;
}

void SessionRegistry::closeQuietly(const std::string& sessionId, core::ISnmpSession& session) {
    try {
        session.close();
    } catch (const std::exception& e) {
        spdlog::error("[SNMP] Error closing session {}: {}", sessionId, e.what());
    }
}

} // namespace netsweep::infra
