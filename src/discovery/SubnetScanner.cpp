#include "discovery/SubnetScanner.hpp"

#include "core/types/DiscoveryError.hpp"
#include "core/types/Ipv4Range.hpp"
#include "core/types/Validation.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <future>
#include <semaphore>

namespace netsweep::discovery {

SubnetScanner::SubnetScanner(std::shared_ptr<DeviceIdentityResolver> resolver, infra::AsioContext& context,
                             ScanSettings settings)
    : resolver_(std::move(resolver)), context_(context), settings_(settings) {
    if (settings_.concurrency == 0) {
        settings_.concurrency = 1;
    }
}

std::vector<core::ScannedHost> SubnetScanner::scan(const std::string& cidr, const std::string& community,
                                                   core::SnmpVersion version,
                                                   const ProgressCallback& onProgress) {
    if (!core::isValidCommunity(community)) {
        throw core::ValidationError("Community string is required");
    }
    if (!context_.isRunning()) {
        throw std::runtime_error("Async context is not running");
    }

    auto range = core::Ipv4Range::parse(cidr);
    auto hosts = range.hosts(settings_.maxHosts);

    spdlog::info("[Scan] Scanning {} hosts of {} ({} at a time)", hosts.size(), cidr, settings_.concurrency);

    std::counting_semaphore<> slots(static_cast<std::ptrdiff_t>(settings_.concurrency));
    std::atomic<size_t> completed{0};
    std::vector<std::future<core::ScannedHost>> pending;
    pending.reserve(hosts.size());

    for (const auto& host : hosts) {
        core::SnmpTarget target;
        target.address = host;
        target.community = community;
        target.version = version;
        target.port = settings_.port;
        target.timeoutMs = settings_.timeoutMs;
        target.retries = 0;

        slots.acquire();
        pending.push_back(context_.submit([this, target, &slots, &completed, &onProgress, total = hosts.size()]() {
            auto result = scanHost(target);
            size_t done = ++completed;
            if (onProgress) {
                onProgress(done, total);
            }
            slots.release();
            return result;
        }));
    }

    std::vector<core::ScannedHost> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }

    size_t reachable = 0;
    for (const auto& r : results) {
        if (r.reachable) ++reachable;
    }
    spdlog::info("[Scan] {} of {} hosts in {} answered", reachable, results.size(), cidr);
    return results;
}

core::ScannedHost SubnetScanner::scanHost(const core::SnmpTarget& target) {
    core::ScannedHost result;
    result.address = target.address;
    try {
        result.device = resolver_->identify(target);
        result.reachable = true;
    } catch (const std::exception& e) {
        spdlog::debug("[Scan] {} did not answer: {}", target.address, e.what());
        result.error = e.what();
    }
    return result;
}

} // namespace netsweep::discovery
