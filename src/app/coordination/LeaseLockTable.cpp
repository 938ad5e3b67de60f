#include "LeaseLockTable.h"

#include <QLoggingCategory>

namespace agentcad::app::coordination {

Q_LOGGING_CATEGORY(logLocks, "agentcad.app.locks")

namespace {

QString describe(const ResourceKey& resource) {
    return QString::fromStdString(resource.type + "/" + resource.name);
}

} // namespace

LeaseLockTable::LeaseLockTable(core::model::Clock clock)
    : clock_(std::move(clock)) {
}

LockResult LeaseLockTable::acquire(const ResourceKey& resource,
                                   const core::model::AgentID& holder,
                                   const std::string& sessionId,
                                   std::chrono::seconds ttl) {
    LockResult result;
    if (resource.type.empty() || resource.name.empty() || holder.empty()) {
        result.error = core::model::ErrorKind::InvalidRequest;
        result.errorMessage = "Lock resource type, name and holder are required";
        return result;
    }
    if (ttl.count() <= 0 || ttl > kMaxLeaseTtl) {
        result.error = core::model::ErrorKind::InvalidRequest;
        result.errorMessage = "Lock ttl must be between 1 and " + std::to_string(kMaxLeaseTtl.count()) + " seconds";
        return result;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    const auto now = clock_();
    sweepLocked(now);

    auto it = locks_.find(resource);
    if (it != locks_.end() && it->second.holder != holder) {
        qCDebug(logLocks) << "acquire refused" << describe(resource)
                          << "holder=" << it->second.holder.c_str()
                          << "requester=" << holder.c_str();
        result.error = core::model::ErrorKind::AlreadyLocked;
        result.errorMessage = "Resource " + resource.type + "/" + resource.name
                              + " is locked by " + it->second.holder;
        result.lock = it->second;
        return result;
    }

    LeaseLock lock;
    lock.resource = resource;
    lock.holder = holder;
    lock.sessionId = sessionId;
    lock.acquiredAt = now;
    lock.expiresAt = now + ttl;

    result.renewed = it != locks_.end();
    locks_[resource] = lock;
    result.lock = lock;
    result.success = true;

    qCDebug(logLocks) << (result.renewed ? "renew" : "acquire") << describe(resource)
                      << "holder=" << holder.c_str() << "ttl=" << ttl.count();
    return result;
}

bool LeaseLockTable::release(const ResourceKey& resource, const core::model::AgentID& holder) {
    std::lock_guard<std::mutex> guard(mutex_);
    sweepLocked(clock_());

    auto it = locks_.find(resource);
    if (it == locks_.end() || it->second.holder != holder) {
        return false;
    }
    locks_.erase(it);
    qCDebug(logLocks) << "release" << describe(resource) << "holder=" << holder.c_str();
    return true;
}

std::optional<LeaseLock> LeaseLockTable::status(const ResourceKey& resource) {
    std::lock_guard<std::mutex> guard(mutex_);
    sweepLocked(clock_());

    auto it = locks_.find(resource);
    if (it == locks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<LeaseLock> LeaseLockTable::active() {
    std::lock_guard<std::mutex> guard(mutex_);
    sweepLocked(clock_());

    std::vector<LeaseLock> out;
    out.reserve(locks_.size());
    for (const auto& [key, lock] : locks_) {
        out.push_back(lock);
    }
    return out;
}

void LeaseLockTable::sweepLocked(core::model::Timestamp now) {
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.expiresAt <= now) {
            qCDebug(logLocks) << "expired" << describe(it->first) << "holder=" << it->second.holder.c_str();
            it = locks_.erase(it);
        } else {
            ++it;
        }
    }
}

//------------------------------------------------------------------------------
// ScopedLease
//------------------------------------------------------------------------------

ScopedLease::ScopedLease(LeaseLockTable& table, ResourceKey resource, core::model::AgentID holder,
                         const std::string& sessionId, std::chrono::seconds ttl)
    : table_(table)
    , resource_(std::move(resource))
    , holder_(std::move(holder)) {
    result_ = table_.acquire(resource_, holder_, sessionId, ttl);
}

ScopedLease::~ScopedLease() {
    if (result_.success && !result_.renewed) {
        table_.release(resource_, holder_);
    }
}

} // namespace agentcad::app::coordination
