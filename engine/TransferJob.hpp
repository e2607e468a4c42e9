// One file transfer: a chunk scheduler plus the workers driving it over a
// slice of the connection pool.
#pragma once
#include <QString>
#include <QtGlobal>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>
#include "ConnectionPool.hpp"
#include "EngineConfig.hpp"
#include "mediaferry/ChunkScheduler.hpp"
#include "mediaferry/TransferTypes.hpp"

class QFile;

// Read-only view of a job, safe to hand to other threads.
struct JobSnapshot {
    quint64 id = 0;
    QString userId;
    mediaferry::Direction direction = mediaferry::Direction::Download;
    QString source;      // remote reference for downloads, local path for uploads
    QString destination; // local path for downloads, chat for uploads
    quint64 totalBytes = 0;
    quint64 chunkSize = 0;
    quint64 bytesDone = 0;
    int chunksTotal = 0;
    int chunksDone = 0;
    int chunksInFlight = 0;
    quint64 attempts = 0;
    bool planned = false;
    mediaferry::JobState state = mediaferry::JobState::Pending;
    mediaferry::TransferError error = mediaferry::TransferError::None;
    QString reason;
    int allocation = 0;
    int workers = 0;
    int connections = 0;     // workers currently holding a connection
    int peakConnections = 0;
    QString remoteRef;       // upload result ("chat/message_id")
    qint64 createdAtMs = 0;
    qint64 startedAtMs = 0;
    qint64 finishedAtMs = 0;
};

// State machine:
//   Pending -> Running -> {Completed | Failed | Cancelled}
//   Pending/Running -> Paused (session lost) -> Pending (new session)
//   Pending/Paused -> Cancelled
//
// Each worker thread holds one pooled connection and pulls chunks until the
// scheduler runs dry, its connection drains, or the job is stopped. State
// changes caused by workers are decided by the last worker to exit, so a
// job never reports Paused or a terminal state while a chunk is in flight.
class TransferJob {
public:
    // Implemented by the owner (TransferManager). Called from worker threads
    // without the job lock held.
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void jobStateChanged(TransferJob *job, mediaferry::JobState state) = 0;
        virtual void jobProgress(TransferJob *job, quint64 bytesDone, quint64 total) = 0;
        virtual void jobReauthRequired(TransferJob *job, const QString &reason) = 0;
        virtual void jobBackendRejected(TransferJob *job, int retryAfterMs) = 0;
    };

    struct Request {
        quint64 id = 0;
        QString userId;
        mediaferry::Direction direction = mediaferry::Direction::Download;
        mediaferry::FileReference remote; // download source
        mediaferry::UploadTarget target;  // upload destination
        QString localPath;                // download destination, upload source
        QString source;
        QString destination;
    };

    TransferJob(const Request &req, const EngineConfig &cfg, ConnectionPool *pool,
                Observer *observer);
    ~TransferJob();
    TransferJob(const TransferJob &) = delete;
    TransferJob &operator=(const TransferJob &) = delete;

    quint64 id() const { return req_.id; }
    const QString &userId() const { return req_.userId; }
    mediaferry::Direction direction() const { return req_.direction; }

    // Launches the lead worker once the pool admitted the job. False when the
    // job is no longer Pending (cancelled or paused meanwhile).
    bool start(int allocation);

    // New per-job allocation after a pool resize. Growth spawns workers;
    // shrinking is handled by the pool draining connections.
    void setAllocation(int allocation);

    // Stops workers at the next chunk boundary and parks the job in Paused.
    void pause(mediaferry::TransferError why, const QString &reason);

    // Paused -> Pending, or cancels a pause still in progress.
    bool resume();

    // Cooperative: in-flight chunks finish, then the job becomes Cancelled.
    // Refused once the result is being put in place.
    bool cancel();

    // Cancels even during finalize and interrupts blocking transport calls.
    void forceStop();

    // Joins every worker thread. Never call from a worker or an observer.
    void join();

    mediaferry::JobState state() const;
    bool hasWorkers() const;
    JobSnapshot snapshot() const;

private:
    void launchWorkerLocked();
    void spawnWorkersLocked();
    void relaunchLocked();
    bool requestCancel(bool evenWhileFinalizing);
    void runWorker(int slot);
    void workerExited(int slot);
    bool workRemains() const;
    bool stopRequested() const;

    bool prepare(ConnectionPool::Lease &lease);
    bool transferChunk(ConnectionPool::Lease &lease, QFile *local,
                       const mediaferry::ChunkRange &range, mediaferry::TransportError &err,
                       bool *localFailure);
    void finalize(ConnectionPool::Lease &lease);

    void fail(mediaferry::TransferError kind, const QString &reason);
    void requestReauth(const QString &reason);
    void backoffSleep(int failures);
    void notifyState(mediaferry::JobState state);

    QString partPath() const;

    const Request req_;
    const EngineConfig cfg_;
    ConnectionPool *pool_;
    Observer *observer_;
    mediaferry::ChunkScheduler scheduler_;

    mutable std::mutex mtx_; // protects everything below that is not atomic
    std::condition_variable stopCv_;
    mediaferry::JobState state_ = mediaferry::JobState::Pending;
    mediaferry::TransferError error_ = mediaferry::TransferError::None;
    QString reason_;
    mediaferry::TransferError failError_ = mediaferry::TransferError::None;
    QString failReason_;
    mediaferry::TransferError pauseError_ = mediaferry::TransferError::None;
    QString pauseReason_;
    bool resumeRequested_ = false;
    int liveWorkers_ = 0;
    int leasedWorkers_ = 0;
    int peakLeased_ = 0;
    std::vector<bool> slots_;
    std::vector<std::thread> threads_;
    QString remoteRef_;
    qint64 createdAtMs_ = 0;
    qint64 startedAtMs_ = 0;
    qint64 finishedAtMs_ = 0;

    std::atomic<int> allocation_{0};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<bool> pauseRequested_{false};
    std::atomic<bool> failed_{false};
    std::atomic<bool> finalizing_{false};
    std::atomic<bool> finalized_{false};
};
