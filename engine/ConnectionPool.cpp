// ConnectionPool implementation: budget accounting, per-job allocation and
// the acquire/release protocol.
#include "ConnectionPool.hpp"

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(mfPool, "mediaferry.pool")

using mediaferry::ConnectionState;

namespace {
constexpr std::chrono::milliseconds kWaitSlice{50};
}

// ---- Lease -----------------------------------------------------------------

mediaferry::TransportClient *ConnectionPool::Lease::client() const {
    return conn_ ? conn_->client.get() : nullptr;
}

quint64 ConnectionPool::Lease::connectionId() const {
    return conn_ ? conn_->id : 0;
}

bool ConnectionPool::Lease::draining() const {
    return conn_ && pool_->isDraining(conn_);
}

void ConnectionPool::Lease::invalidate() {
    if (conn_)
        pool_->invalidateConnection(conn_);
}

void ConnectionPool::Lease::release() {
    if (!conn_)
        return;
    Connection *c = conn_;
    conn_ = nullptr;
    pool_->releaseConnection(c);
    pool_ = nullptr;
}

// ---- ConnectionPool --------------------------------------------------------

ConnectionPool::ConnectionPool(const Limits &limits, Factory factory)
    : limits_(limits), factory_(std::move(factory)) {
    qCInfo(mfPool) << "pool created"
                   << "budget=" << limits_.globalBudget
                   << "minPerJob=" << limits_.minPerJob
                   << "maxPerJob=" << limits_.maxPerJob
                   << "maxActiveJobs=" << maxActiveJobs();
}

ConnectionPool::~ConnectionPool() {
    shutdown();
    Closing closing;
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto &kv : conns_)
        closing.push_back(std::move(kv.second));
    closed_ += conns_.size();
    conns_.clear();
}

int ConnectionPool::allocationFor(int globalBudget, int activeJobs, int minPerJob, int maxPerJob) {
    if (activeJobs <= 0)
        return 0;
    const int share = globalBudget / activeJobs;
    return std::clamp(share, minPerJob, std::max(minPerJob, maxPerJob));
}

int ConnectionPool::maxActiveJobs() const {
    return std::max(1, limits_.globalBudget / std::max(1, limits_.minPerJob));
}

bool ConnectionPool::tryRegisterJob(quint64 jobId, int *allocation) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        if (shutdown_ || static_cast<int>(jobs_.size()) >= maxActiveJobs())
            return false;
        jobs_.emplace(jobId, JobUsage{});
        resizeLocked();
        it = jobs_.find(jobId);
        qCInfo(mfPool) << "job admitted" << "jobId=" << jobId
                       << "activeJobs=" << jobs_.size()
                       << "perJobAllocation=" << perJob_;
    }
    if (allocation)
        *allocation = it->second.allocation;
    return true;
}

void ConnectionPool::unregisterJob(quint64 jobId) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end())
        return;
    jobs_.erase(it);
    // Leases still held by the job are not counted anymore; they return to
    // idle on release.
    resizeLocked();
    qCInfo(mfPool) << "job released" << "jobId=" << jobId
                   << "activeJobs=" << jobs_.size()
                   << "perJobAllocation=" << perJob_;
    cv_.notify_all();
}

bool ConnectionPool::isRegistered(quint64 jobId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return jobs_.count(jobId) > 0;
}

void ConnectionPool::resize() {
    std::lock_guard<std::mutex> lk(mtx_);
    resizeLocked();
    cv_.notify_all();
}

void ConnectionPool::resizeLocked() {
    const int n = static_cast<int>(jobs_.size());
    perJob_ = allocationFor(limits_.globalBudget, n, limits_.minPerJob, limits_.maxPerJob);
    for (auto &kv : jobs_) {
        const quint64 jobId = kv.first;
        kv.second.allocation = perJob_;
        int busy = 0;
        for (const auto &c : conns_) {
            if (c.second->jobId == jobId && c.second->state == ConnectionState::Busy)
                ++busy;
        }
        if (busy > perJob_) {
            int surplus = busy - perJob_;
            for (auto &c : conns_) {
                if (surplus == 0)
                    break;
                Connection &conn = *c.second;
                if (conn.jobId == jobId && conn.state == ConnectionState::Busy) {
                    conn.state = ConnectionState::Draining;
                    --surplus;
                }
            }
            qCInfo(mfPool) << "connections draining" << "jobId=" << jobId
                           << "busy=" << busy << "allocation=" << perJob_;
        } else if (busy < perJob_) {
            // Allocation grew back before the drain finished.
            int room = perJob_ - busy;
            for (auto &c : conns_) {
                if (room == 0)
                    break;
                Connection &conn = *c.second;
                if (conn.jobId == jobId && conn.state == ConnectionState::Draining &&
                    !conn.retire) {
                    conn.state = ConnectionState::Busy;
                    --room;
                }
            }
        }
    }
}

int ConnectionPool::allocationOf(quint64 jobId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(jobId);
    return it == jobs_.end() ? 0 : it->second.allocation;
}

ConnectionPool::Connection *ConnectionPool::findIdleLocked(const QString &userId) {
    Connection *best = nullptr;
    for (auto &kv : conns_) {
        Connection *c = kv.second.get();
        if (c->state != ConnectionState::Idle || c->retire || c->userId != userId)
            continue;
        // Most recently used first; it is the least likely to have gone stale.
        if (!best || c->lastUsed > best->lastUsed)
            best = c;
    }
    return best;
}

bool ConnectionPool::evictIdleLocked(const QString &keepUser, Closing &out) {
    Connection *victim = nullptr;
    for (auto &kv : conns_) {
        Connection *c = kv.second.get();
        if (c->state != ConnectionState::Idle || c->userId == keepUser)
            continue;
        if (!victim || c->lastUsed < victim->lastUsed)
            victim = c;
    }
    if (!victim)
        return false;
    qCInfo(mfPool) << "evicting idle connection" << "connId=" << victim->id
                   << "user=" << victim->userId << "for=" << keepUser;
    out.push_back(takeLocked(victim->id));
    return true;
}

void ConnectionPool::reapIdleLocked(Closing &out) {
    if (limits_.idleTimeoutMs <= 0)
        return;
    const auto cutoff = Clock::now() - std::chrono::milliseconds(limits_.idleTimeoutMs);
    std::vector<quint64> expired;
    for (const auto &kv : conns_) {
        const Connection &c = *kv.second;
        if (c.state == ConnectionState::Idle && c.lastUsed <= cutoff)
            expired.push_back(c.id);
    }
    for (quint64 id : expired)
        out.push_back(takeLocked(id));
    if (!expired.empty())
        qCInfo(mfPool) << "idle connections reaped" << "count=" << expired.size();
}

std::unique_ptr<ConnectionPool::Connection> ConnectionPool::takeLocked(quint64 connId) {
    auto it = conns_.find(connId);
    if (it == conns_.end())
        return nullptr;
    std::unique_ptr<Connection> c = std::move(it->second);
    conns_.erase(it);
    c->state = ConnectionState::Closed;
    ++closed_;
    return c;
}

ConnectionPool::Connection *
ConnectionPool::insertLocked(std::unique_ptr<mediaferry::TransportClient> client,
                             const QString &userId) {
    auto c = std::make_unique<Connection>();
    c->id = nextConnId_++;
    c->userId = userId;
    c->client = std::move(client);
    c->state = ConnectionState::Idle;
    c->lastUsed = Clock::now();
    Connection *raw = c.get();
    conns_.emplace(raw->id, std::move(c));
    ++opened_;
    peakTotal_ = std::max(peakTotal_, totalLocked());
    return raw;
}

ConnectionPool::Lease ConnectionPool::acquire(quint64 jobId, const QString &userId, int timeoutMs,
                                              const std::function<bool()> &shouldAbort,
                                              AcquireStatus *status, QString *why) {
    auto fail = [status, why](AcquireStatus st, const QString &msg) {
        if (status)
            *status = st;
        if (why)
            *why = msg;
        return Lease();
    };
    if (status)
        *status = AcquireStatus::Ok;

    const auto deadline = Clock::now() + std::chrono::milliseconds(std::max(0, timeoutMs));
    Closing closing;
    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
        if (shutdown_)
            return fail(AcquireStatus::ShuttingDown, QStringLiteral("connection pool is shut down"));
        if (shouldAbort && shouldAbort())
            return fail(AcquireStatus::Aborted, QStringLiteral("acquire aborted"));
        auto job = jobs_.find(jobId);
        if (job == jobs_.end())
            return fail(AcquireStatus::Aborted, QStringLiteral("job is not admitted"));

        reapIdleLocked(closing);
        const auto now = Clock::now();
        const bool backingOff = now < backoffUntil_;
        if (!backingOff && job->second.inUse < job->second.allocation) {
            if (Connection *c = findIdleLocked(userId)) {
                c->state = ConnectionState::Busy;
                c->jobId = jobId;
                c->lastUsed = now;
                ++job->second.inUse;
                job->second.peakInUse = std::max(job->second.peakInUse, job->second.inUse);
                return Lease(this, c);
            }
            if (totalLocked() >= limits_.globalBudget)
                evictIdleLocked(userId, closing);
            if (totalLocked() < limits_.globalBudget) {
                // Reserve the budget slot and the job's share, then open the
                // connection without holding the lock.
                ++opening_;
                ++job->second.inUse;
                job->second.peakInUse = std::max(job->second.peakInUse, job->second.inUse);
                peakTotal_ = std::max(peakTotal_, totalLocked());
                lk.unlock();
                mediaferry::TransportError err;
                std::unique_ptr<mediaferry::TransportClient> client;
                if (factory_)
                    client = factory_(userId, err);
                lk.lock();
                --opening_;
                auto j = jobs_.find(jobId);
                if (!client) {
                    if (j != jobs_.end() && j->second.inUse > 0)
                        --j->second.inUse;
                    cv_.notify_all();
                    const QString msg = QString::fromStdString(err.message);
                    qCWarning(mfPool) << "connection open failed" << "jobId=" << jobId
                                      << "user=" << userId
                                      << "kind=" << mediaferry::transportErrorKindName(err.kind)
                                      << "error=" << msg;
                    return fail(err.kind == mediaferry::TransportErrorKind::AuthRejected
                                    ? AcquireStatus::AuthRejected
                                    : AcquireStatus::ConnectFailed,
                                msg.isEmpty() ? QStringLiteral("could not open connection") : msg);
                }
                Connection *c = insertLocked(std::move(client), userId);
                qCInfo(mfPool) << "connection opened" << "connId=" << c->id << "user=" << userId
                               << "jobId=" << jobId << "total=" << conns_.size();
                if (shutdown_) {
                    closing.push_back(takeLocked(c->id));
                    return fail(AcquireStatus::ShuttingDown,
                                QStringLiteral("connection pool is shut down"));
                }
                if (j == jobs_.end()) {
                    // Job left while we were connecting; keep the connection.
                    cv_.notify_all();
                    return fail(AcquireStatus::Aborted, QStringLiteral("job is not admitted"));
                }
                c->state = j->second.inUse > j->second.allocation ? ConnectionState::Draining
                                                                  : ConnectionState::Busy;
                c->jobId = jobId;
                return Lease(this, c);
            }
        }
        if (now >= deadline) {
            qCWarning(mfPool) << "pool exhausted" << "jobId=" << jobId << "user=" << userId
                              << "timeoutMs=" << timeoutMs << "total=" << totalLocked()
                              << "inUse=" << job->second.inUse
                              << "allocation=" << job->second.allocation;
            return fail(AcquireStatus::PoolExhausted,
                        QStringLiteral("no connection available within %1 ms").arg(timeoutMs));
        }
        auto wakeAt = std::min(deadline, now + kWaitSlice);
        if (backingOff)
            wakeAt = std::min(wakeAt, backoffUntil_);
        cv_.wait_until(lk, wakeAt);
    }
}

void ConnectionPool::releaseConnection(Connection *conn) {
    Closing closing;
    std::lock_guard<std::mutex> lk(mtx_);
    auto j = jobs_.find(conn->jobId);
    if (j != jobs_.end() && j->second.inUse > 0)
        --j->second.inUse;
    conn->jobId = 0;
    if (conn->retire || shutdown_ || !conn->client || !conn->client->isConnected()) {
        qCInfo(mfPool) << "connection closed on release" << "connId=" << conn->id
                       << "user=" << conn->userId
                       << "state=" << mediaferry::connectionStateName(conn->state)
                       << "retired=" << conn->retire;
        closing.push_back(takeLocked(conn->id));
    } else {
        conn->state = ConnectionState::Idle;
        conn->lastUsed = Clock::now();
    }
    cv_.notify_all();
}

bool ConnectionPool::isDraining(const Connection *conn) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return conn->state == ConnectionState::Draining;
}

void ConnectionPool::invalidateConnection(Connection *conn) {
    std::lock_guard<std::mutex> lk(mtx_);
    conn->retire = true;
}

void ConnectionPool::invalidateUser(const QString &userId) {
    Closing closing;
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<quint64> idle;
    int draining = 0;
    for (auto &kv : conns_) {
        Connection &c = *kv.second;
        if (c.userId != userId)
            continue;
        if (c.state == ConnectionState::Idle) {
            idle.push_back(c.id);
        } else {
            c.retire = true;
            c.state = ConnectionState::Draining;
            ++draining;
        }
    }
    for (quint64 id : idle)
        closing.push_back(takeLocked(id));
    qCInfo(mfPool) << "user connections invalidated" << "user=" << userId
                   << "closedIdle=" << idle.size() << "draining=" << draining;
    cv_.notify_all();
}

void ConnectionPool::interruptJob(quint64 jobId) {
    std::lock_guard<std::mutex> lk(mtx_);
    int n = 0;
    for (auto &kv : conns_) {
        Connection &c = *kv.second;
        if (c.jobId != jobId || c.state == ConnectionState::Idle)
            continue;
        c.retire = true;
        if (c.client)
            c.client->interrupt();
        ++n;
    }
    if (n > 0)
        qCInfo(mfPool) << "job connections interrupted" << "jobId=" << jobId << "count=" << n;
    cv_.notify_all();
}

void ConnectionPool::applyBackoff(int ms) {
    if (ms <= 0)
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    const auto until = Clock::now() + std::chrono::milliseconds(ms);
    if (until > backoffUntil_)
        backoffUntil_ = until;
    ++backoffs_;
    qCWarning(mfPool) << "backend rejected requests; pool-wide backoff" << "ms=" << ms;
}

int ConnectionPool::backoffRemainingMs() const {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto now = Clock::now();
    if (now >= backoffUntil_)
        return 0;
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(backoffUntil_ - now).count() + 1);
}

bool ConnectionPool::waitOutBackoff(const std::function<bool()> &shouldAbort) {
    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
        if (shouldAbort && shouldAbort())
            return false;
        const auto now = Clock::now();
        if (now >= backoffUntil_ || shutdown_)
            return true;
        cv_.wait_until(lk, std::min(backoffUntil_, now + kWaitSlice));
    }
}

void ConnectionPool::wakeWaiters() {
    std::lock_guard<std::mutex> lk(mtx_);
    cv_.notify_all();
}

int ConnectionPool::reapIdle() {
    Closing closing;
    std::lock_guard<std::mutex> lk(mtx_);
    reapIdleLocked(closing);
    if (!closing.empty())
        cv_.notify_all();
    return static_cast<int>(closing.size());
}

bool ConnectionPool::startReaper() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (shutdown_ || limits_.idleTimeoutMs <= 0 || reaper_.joinable())
        return false;
    reaper_ = std::thread([this]() { reaperLoop(); });
    qCInfo(mfPool) << "idle reaper started" << "idleTimeoutMs=" << limits_.idleTimeoutMs;
    return true;
}

void ConnectionPool::reaperLoop() {
    const auto period =
        std::chrono::milliseconds(std::min(std::max(limits_.idleTimeoutMs / 2, 10), 1000));
    for (;;) {
        Closing closing;
        std::unique_lock<std::mutex> lk(mtx_);
        if (reaperCv_.wait_for(lk, period, [this]() { return shutdown_; }))
            return;
        reapIdleLocked(closing);
        if (!closing.empty())
            cv_.notify_all();
    }
}

int ConnectionPool::warmUp(const QString &userId, int count) {
    int opened = 0;
    for (int i = 0; i < count; ++i) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (shutdown_ || totalLocked() >= limits_.globalBudget)
                break;
            ++opening_;
            peakTotal_ = std::max(peakTotal_, totalLocked());
        }
        mediaferry::TransportError err;
        std::unique_ptr<mediaferry::TransportClient> client;
        if (factory_)
            client = factory_(userId, err);
        Closing closing;
        std::lock_guard<std::mutex> lk(mtx_);
        --opening_;
        if (!client) {
            qCWarning(mfPool) << "warm-up connection failed" << "user=" << userId
                              << "error=" << QString::fromStdString(err.message);
            cv_.notify_all();
            break;
        }
        Connection *c = insertLocked(std::move(client), userId);
        if (shutdown_) {
            closing.push_back(takeLocked(c->id));
            break;
        }
        ++opened;
        cv_.notify_all();
    }
    qCInfo(mfPool) << "warm-up" << "user=" << userId << "requested=" << count
                   << "opened=" << opened;
    return opened;
}

void ConnectionPool::shutdown() {
    {
        Closing closing;
        std::lock_guard<std::mutex> lk(mtx_);
        if (shutdown_)
            return;
        shutdown_ = true;
        std::vector<quint64> idle;
        for (const auto &kv : conns_) {
            if (kv.second->state == ConnectionState::Idle)
                idle.push_back(kv.first);
        }
        for (quint64 id : idle)
            closing.push_back(takeLocked(id));
        qCInfo(mfPool) << "pool shutdown" << "closedIdle=" << idle.size()
                       << "stillLeased=" << conns_.size();
        cv_.notify_all();
        reaperCv_.notify_all();
    }
    if (reaper_.joinable())
        reaper_.join();
}

ConnectionPool::Stats ConnectionPool::stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    Stats s;
    for (const auto &kv : conns_) {
        switch (kv.second->state) {
        case ConnectionState::Idle:
            ++s.idle;
            break;
        case ConnectionState::Busy:
            ++s.busy;
            break;
        case ConnectionState::Draining:
            ++s.draining;
            break;
        case ConnectionState::Closed:
            break;
        }
    }
    s.total = static_cast<int>(conns_.size());
    s.opening = opening_;
    s.peakTotal = peakTotal_;
    s.opened = opened_;
    s.closed = closed_;
    s.backoffsApplied = backoffs_;
    s.activeJobs = static_cast<int>(jobs_.size());
    s.perJobAllocation = perJob_;
    return s;
}

ConnectionPool::JobUsage ConnectionPool::jobUsage(quint64 jobId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(jobId);
    return it == jobs_.end() ? JobUsage{} : it->second;
}
