/**
 * @file LeaseLockTable.h
 * @brief Time-bounded exclusive claims on named resources.
 *
 * Expiry is checked on access: every call first sweeps the rows whose expiry
 * is at or before now. There is no background timer.
 */
#ifndef AGENTCAD_APP_COORDINATION_LEASELOCKTABLE_H
#define AGENTCAD_APP_COORDINATION_LEASELOCKTABLE_H

#include "../../core/model/ModelTypes.h"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace agentcad::app::coordination {

/// Longest lease any caller may request
constexpr std::chrono::seconds kMaxLeaseTtl = std::chrono::hours(24 * 365);

struct ResourceKey {
    std::string type;
    std::string name;

    bool operator<(const ResourceKey& other) const {
        return std::tie(type, name) < std::tie(other.type, other.name);
    }
};

struct LeaseLock {
    ResourceKey resource;
    core::model::AgentID holder;
    std::string sessionId;
    core::model::Timestamp acquiredAt{};
    core::model::Timestamp expiresAt{};
};

struct LockResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    /// Granted lease, or the blocking one on AlreadyLocked
    std::optional<LeaseLock> lock;
    bool renewed = false;
};

class LeaseLockTable {
public:
    explicit LeaseLockTable(core::model::Clock clock = core::model::systemClock());

    /**
     * @brief Take or renew the lease on @p resource
     *
     * Fails with AlreadyLocked while another holder owns an unexpired lease,
     * and with InvalidRequest for a ttl outside (0, kMaxLeaseTtl].
     */
    LockResult acquire(const ResourceKey& resource,
                       const core::model::AgentID& holder,
                       const std::string& sessionId,
                       std::chrono::seconds ttl);

    /**
     * @brief Drop the lease if @p holder owns it
     * @return true if a lease was removed
     */
    bool release(const ResourceKey& resource, const core::model::AgentID& holder);

    /// Current unexpired lease on @p resource
    std::optional<LeaseLock> status(const ResourceKey& resource);

    std::vector<LeaseLock> active();

private:
    void sweepLocked(core::model::Timestamp now);

    core::model::Clock clock_;
    std::mutex mutex_;
    std::map<ResourceKey, LeaseLock> locks_;
};

/**
 * @brief Holds a lease for a scope and releases it on exit
 */
class ScopedLease {
public:
    ScopedLease(LeaseLockTable& table, ResourceKey resource, core::model::AgentID holder,
                const std::string& sessionId, std::chrono::seconds ttl);
    ~ScopedLease();

    ScopedLease(const ScopedLease&) = delete;
    ScopedLease& operator=(const ScopedLease&) = delete;

    const LockResult& result() const { return result_; }
    bool held() const { return result_.success; }

private:
    LeaseLockTable& table_;
    ResourceKey resource_;
    core::model::AgentID holder_;
    LockResult result_;
};

} // namespace agentcad::app::coordination

#endif // AGENTCAD_APP_COORDINATION_LEASELOCKTABLE_H
