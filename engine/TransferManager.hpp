// Entry point of the engine: admission, per-user sessions and the shared
// connection pool for all transfer jobs.
#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include "ConnectionPool.hpp"
#include "EngineConfig.hpp"
#include "ProgressReporter.hpp"
#include "TransferJob.hpp"
#include "mediaferry/TransportClient.hpp"

class SessionStore;

// Jobs are admitted in submission order while the pool can give each one
// minPerJob connections; the rest wait in the admission queue. A job paused
// by a session loss leaves the pool and is re-queued when the user logs in
// again.
//
// Threading: public methods may be called from any thread. Signals are
// emitted from the calling thread or from worker threads; connect with
// Qt::QueuedConnection when the receiver lives in a GUI thread.
class TransferManager : public QObject, private TransferJob::Observer {
    Q_OBJECT
public:
    // "prototype" is only used to create new connections of its kind.
    TransferManager(const EngineConfig &cfg, SessionStore *sessions,
                    std::shared_ptr<mediaferry::TransportClient> prototype,
                    QObject *parent = nullptr);
    ~TransferManager() override;

    // source: message link or "chat/message_id" for downloads, local file for
    // uploads. destination: local path for downloads, chat for uploads.
    // Returns the new job id, or 0 with err/why filled.
    quint64 submit(const QString &userId, mediaferry::Direction direction,
                   const QString &source, const QString &destination, QString *err,
                   mediaferry::TransferError *why = nullptr);

    std::optional<JobSnapshot> query(quint64 jobId) const;
    QVector<JobSnapshot> jobsSnapshot() const;

    // Cooperative; false for unknown or already finished jobs.
    bool cancel(quint64 jobId);

    // Blocks until the job is terminal and jobFinished has been emitted.
    // False on timeout or unknown id.
    bool waitForJob(quint64 jobId, int timeoutMs);
    // Blocks until pred(snapshot) holds.
    bool waitUntil(quint64 jobId, const std::function<bool(const JobSnapshot &)> &pred,
                   int timeoutMs);

    // Drops terminal jobs. Returns the number removed.
    int clearFinished();

    // Stops accepting work, cancels queued and paused jobs, and waits up to
    // timeoutMs for running ones before interrupting them. True when nothing
    // had to be interrupted.
    bool shutdown(int timeoutMs);

    ProgressReporter *progress();
    ConnectionPool *pool();
    const EngineConfig &config() const { return cfg_; }

signals:
    // Any state transition of a job.
    void jobChanged(quint64 jobId);
    // Exactly once per job.
    void jobFinished(quint64 jobId, bool ok, const QString &reason);
    void reauthRequired(const QString &userId, const QString &reason);
    void backendBackoff(int ms);

private slots:
    void onSessionInvalidated(const QString &userId, const QString &reason);
    void onSessionCreated(const QString &userId);

private:
    void jobStateChanged(TransferJob *job, mediaferry::JobState state) override;
    void jobProgress(TransferJob *job, quint64 bytesDone, quint64 total) override;
    void jobReauthRequired(TransferJob *job, const QString &reason) override;
    void jobBackendRejected(TransferJob *job, int retryAfterMs) override;

    void admitPending();
    void rebalance();
    std::shared_ptr<TransferJob> findJob(quint64 jobId) const;
    std::vector<std::shared_ptr<TransferJob>> jobsOfUser(const QString &userId) const;
    std::unique_ptr<mediaferry::TransportClient> openConnection(const QString &userId,
                                                                mediaferry::TransportError &err);

    const EngineConfig cfg_;
    SessionStore *sessions_;
    std::shared_ptr<mediaferry::TransportClient> prototype_;
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<ProgressReporter> progress_;

    mutable std::mutex mtx_; // protects jobs_, queue_, finished_, settled_, stopped_
    std::condition_variable cv_;
    std::map<quint64, std::shared_ptr<TransferJob>> jobs_;
    std::deque<quint64> queue_;
    std::set<quint64> finished_; // jobFinished already emitted
    std::set<quint64> settled_;  // terminal and fully reported
    bool stopped_ = false;
    bool cleanStop_ = true;
    quint64 nextId_ = 1;
    std::atomic<bool> shuttingDown_{false};
    std::mutex admitMutex_;      // serializes admission passes
    std::mutex connFactoryMutex_; // serializes prototype->newConnectionLike
};
