// Bounded pool of backend connections shared by all transfer jobs.
#pragma once
#include <QString>
#include <QtGlobal>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>
#include "mediaferry/TransportClient.hpp"

// The pool is the only cross-job shared state of the engine. One mutex and
// one condition variable guard it.
//
// Budget rules:
//  - connections (idle + busy + draining + being opened) never exceed
//    globalBudget;
//  - at most globalBudget / minPerJob jobs are admitted, each receiving
//    clamp(floor(globalBudget / activeJobs), minPerJob, maxPerJob)
//    connections, so the allocations never sum above the budget;
//  - a job never holds more leases than its allocation. When the allocation
//    shrinks, its surplus connections are marked Draining and go back to idle
//    once the worker releases them at a chunk boundary.
class ConnectionPool {
public:
    struct Limits {
        int globalBudget = 20;
        int minPerJob = 1;
        int maxPerJob = 8;
        int idleTimeoutMs = 60000;
    };

    enum class AcquireStatus { Ok, PoolExhausted, AuthRejected, ConnectFailed, Aborted, ShuttingDown };

    // Opens one connection for userId. Runs without the pool lock held.
    using Factory = std::function<std::unique_ptr<mediaferry::TransportClient>(
        const QString &userId, mediaferry::TransportError &err)>;

    struct Stats {
        int total = 0;
        int idle = 0;
        int busy = 0;
        int draining = 0;
        int opening = 0;
        int peakTotal = 0;
        quint64 opened = 0;
        quint64 closed = 0;
        quint64 backoffsApplied = 0;
        int activeJobs = 0;
        int perJobAllocation = 0;
    };

    struct JobUsage {
        int allocation = 0;
        int inUse = 0;
        int peakInUse = 0;
    };

private:
    struct Connection {
        ~Connection() {
            if (client)
                client->disconnect();
        }
        quint64 id = 0;
        QString userId;
        std::unique_ptr<mediaferry::TransportClient> client;
        mediaferry::ConnectionState state = mediaferry::ConnectionState::Idle;
        quint64 jobId = 0;
        bool retire = false; // close instead of returning to idle
        std::chrono::steady_clock::time_point lastUsed;
    };

public:
    // Move-only handle to a busy connection. Releases it on destruction.
    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }
        Lease(Lease &&other) noexcept { swap(other); }
        Lease &operator=(Lease &&other) noexcept {
            if (this != &other) {
                release();
                swap(other);
            }
            return *this;
        }
        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        explicit operator bool() const { return conn_ != nullptr; }
        mediaferry::TransportClient *client() const;
        quint64 connectionId() const;
        // The pool wants this connection back after the current chunk.
        bool draining() const;
        // The connection must not be reused (auth failure, interrupted call).
        void invalidate();
        void release();

    private:
        friend class ConnectionPool;
        Lease(ConnectionPool *pool, Connection *conn) : pool_(pool), conn_(conn) {}
        void swap(Lease &other) noexcept {
            std::swap(pool_, other.pool_);
            std::swap(conn_, other.conn_);
        }

        ConnectionPool *pool_ = nullptr;
        Connection *conn_ = nullptr;
    };

    ConnectionPool(const Limits &limits, Factory factory);
    ~ConnectionPool();
    ConnectionPool(const ConnectionPool &) = delete;
    ConnectionPool &operator=(const ConnectionPool &) = delete;

    static int allocationFor(int globalBudget, int activeJobs, int minPerJob, int maxPerJob);

    // Admission. Fails when the budget cannot give one more job minPerJob
    // connections; the caller keeps the job pending. Both calls resize().
    bool tryRegisterJob(quint64 jobId, int *allocation = nullptr);
    void unregisterJob(quint64 jobId);
    bool isRegistered(quint64 jobId) const;
    int maxActiveJobs() const;

    // Recomputes the per-job allocation from the active job count and marks
    // surplus busy connections Draining.
    void resize();
    int allocationOf(quint64 jobId) const;

    // Waits up to timeoutMs for a connection bound to userId. shouldAbort is
    // polled while waiting and must not take locks ordered before the pool.
    Lease acquire(quint64 jobId, const QString &userId, int timeoutMs,
                  const std::function<bool()> &shouldAbort, AcquireStatus *status,
                  QString *why = nullptr);

    // Backend invalidated the user's session: idle connections are closed,
    // busy ones drain and are closed when released.
    void invalidateUser(const QString &userId);

    // Interrupts the blocking calls of a job's connections; they are closed
    // on release.
    void interruptJob(quint64 jobId);

    // Pool-wide backoff after a rate-limit/quota rejection.
    void applyBackoff(int ms);
    int backoffRemainingMs() const;
    // Sleeps until the backoff expires. False when shouldAbort fired first.
    bool waitOutBackoff(const std::function<bool()> &shouldAbort);

    // Re-evaluates abort predicates of waiting acquirers.
    void wakeWaiters();

    // Closes idle connections unused for idleTimeoutMs. Returns the count.
    int reapIdle();
    // Starts a thread that reaps idle connections until shutdown(), so they
    // close even when no acquire follows. False when idleTimeoutMs is 0, the
    // pool is shut down or the thread already runs.
    bool startReaper();

    // Opens up to count idle connections for userId within the budget.
    int warmUp(const QString &userId, int count);

    // Refuses new acquisitions and closes idle connections; leased ones are
    // closed on release.
    void shutdown();

    Stats stats() const;
    JobUsage jobUsage(quint64 jobId) const;
    const Limits &limits() const { return limits_; }

private:
    using Clock = std::chrono::steady_clock;
    // Connections taken out of the pool are collected here and disconnected
    // once the caller has dropped the lock (declare before the lock guard).
    using Closing = std::vector<std::unique_ptr<Connection>>;

    void releaseConnection(Connection *conn);
    bool isDraining(const Connection *conn) const;
    void invalidateConnection(Connection *conn);

    void resizeLocked();
    int totalLocked() const { return static_cast<int>(conns_.size()) + opening_; }
    Connection *findIdleLocked(const QString &userId);
    bool evictIdleLocked(const QString &keepUser, Closing &out);
    void reapIdleLocked(Closing &out);
    void reaperLoop();
    std::unique_ptr<Connection> takeLocked(quint64 connId);
    Connection *insertLocked(std::unique_ptr<mediaferry::TransportClient> client,
                             const QString &userId);

    const Limits limits_;
    Factory factory_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable reaperCv_;
    std::thread reaper_;
    std::map<quint64, std::unique_ptr<Connection>> conns_;
    std::map<quint64, JobUsage> jobs_;
    int opening_ = 0;
    int perJob_ = 0;
    int peakTotal_ = 0;
    quint64 nextConnId_ = 1;
    quint64 opened_ = 0;
    quint64 closed_ = 0;
    quint64 backoffs_ = 0;
    Clock::time_point backoffUntil_{};
    bool shutdown_ = false;
};
