// Admission queue and job bookkeeping on top of the shared connection pool.
#include "TransferManager.hpp"
#include "SessionStore.hpp"
#include "mediaferry/MessageLink.hpp"
#include "mediaferry/RuntimeLogging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QUuid>

#include <algorithm>
#include <chrono>
#include <thread>

Q_LOGGING_CATEGORY(mfManager, "mediaferry.manager")

using mediaferry::Direction;
using mediaferry::JobState;
using mediaferry::TransferError;
using mediaferry::TransportErrorKind;

namespace {
constexpr int kConnectAttempts = 3;
constexpr int kWaitSliceMs = 50;
} // namespace

TransferManager::TransferManager(const EngineConfig &cfg, SessionStore *sessions,
                                 std::shared_ptr<mediaferry::TransportClient> prototype,
                                 QObject *parent)
    : QObject(parent), cfg_(normalizedConfig(cfg)), sessions_(sessions),
      prototype_(std::move(prototype)) {
    ConnectionPool::Limits limits;
    limits.globalBudget = cfg_.globalConnectionBudget;
    limits.minPerJob = cfg_.minPerJob;
    limits.maxPerJob = cfg_.maxPerJob;
    limits.idleTimeoutMs = cfg_.idleTimeoutMs;
    pool_ = std::make_unique<ConnectionPool>(
        limits, [this](const QString &userId, mediaferry::TransportError &err) {
            return openConnection(userId, err);
        });
    progress_ = std::make_unique<ProgressReporter>(cfg_.progressIntervalMs,
                                                   cfg_.progressQueueDepth);

    // Direct: job pauses must happen before the invalidating call returns.
    connect(sessions_, &SessionStore::sessionInvalidated, this,
            &TransferManager::onSessionInvalidated, Qt::DirectConnection);
    connect(sessions_, &SessionStore::sessionCreated, this,
            &TransferManager::onSessionCreated, Qt::DirectConnection);

    qCInfo(mfManager) << "engine ready" << "budget=" << cfg_.globalConnectionBudget
                      << "minPerJob=" << cfg_.minPerJob << "maxPerJob=" << cfg_.maxPerJob
                      << "maxActiveJobs=" << cfg_.maxActiveJobs()
                      << "chunkSize=" << cfg_.chunkSize;
}

TransferManager::~TransferManager() {
    shutdown(0);
}

ProgressReporter *TransferManager::progress() {
    return progress_.get();
}

ConnectionPool *TransferManager::pool() {
    return pool_.get();
}

quint64 TransferManager::submit(const QString &userId, Direction direction,
                                const QString &source, const QString &destination,
                                QString *err, TransferError *why) {
    auto reject = [&](TransferError kind, const QString &msg) -> quint64 {
        if (err)
            *err = msg;
        if (why)
            *why = kind;
        qCWarning(mfManager) << "submit rejected" << "user=" << userId
                             << "direction=" << mediaferry::directionName(direction)
                             << "error=" << mediaferry::transferErrorName(kind)
                             << "reason=" << msg;
        return 0;
    };

    if (shuttingDown_.load())
        return reject(TransferError::ShuttingDown, QStringLiteral("engine is shutting down"));

    SessionStore::Result sr;
    if (!sessions_->get(userId, &sr))
        return reject(TransferError::NoSession,
                      QStringLiteral("no valid session for user %1").arg(userId));

    TransferJob::Request req;
    req.userId = userId;
    req.direction = direction;
    req.source = source;
    req.destination = destination;

    if (direction == Direction::Download) {
        std::string perr;
        if (!mediaferry::parseFileReference(source.trimmed().toStdString(), req.remote, perr))
            return reject(TransferError::InvalidRequest,
                          QStringLiteral("invalid file reference: %1")
                              .arg(QString::fromStdString(perr)));
        if (destination.isEmpty())
            return reject(TransferError::InvalidRequest,
                          QStringLiteral("destination path is empty"));
        const QFileInfo dst(destination);
        if (dst.isDir())
            return reject(TransferError::InvalidRequest,
                          QStringLiteral("destination is a directory: %1").arg(destination));
        if (!dst.absoluteDir().exists())
            return reject(TransferError::LocalIo,
                          QStringLiteral("destination directory does not exist: %1")
                              .arg(dst.absolutePath()));
        req.localPath = dst.absoluteFilePath();
    } else {
        const QFileInfo src(source);
        if (!src.isFile())
            return reject(TransferError::LocalIo,
                          QStringLiteral("local file not found: %1").arg(source));
        const QString chat = destination.trimmed();
        if (chat.isEmpty())
            return reject(TransferError::InvalidRequest,
                          QStringLiteral("destination chat is empty"));
        req.localPath = src.absoluteFilePath();
        req.target.chat = chat.toStdString();
        req.target.file_name = src.fileName().toStdString();
        req.target.upload_id = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
    }

    std::shared_ptr<TransferJob> job;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopped_)
            return reject(TransferError::ShuttingDown, QStringLiteral("engine is shut down"));
        req.id = nextId_++;
        job = std::make_shared<TransferJob>(req, cfg_, pool_.get(), this);
        jobs_.emplace(req.id, job);
        queue_.push_back(req.id);
    }
    // The reporting and idle-reaping threads start with the first accepted job.
    progress_->start();
    pool_->startReaper();
    qCInfo(mfManager) << "job submitted" << "jobId=" << req.id << "user=" << userId
                      << "direction=" << mediaferry::directionName(direction)
                      << "source=" << source << "destination=" << destination;
    emit jobChanged(req.id);
    admitPending();
    return req.id;
}

void TransferManager::admitPending() {
    if (shuttingDown_.load())
        return;
    std::lock_guard<std::mutex> admit(admitMutex_);
    int admitted = 0;
    for (;;) {
        std::shared_ptr<TransferJob> job;
        quint64 id = 0;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            while (!queue_.empty()) {
                auto it = jobs_.find(queue_.front());
                if (it != jobs_.end() && it->second->state() == JobState::Pending &&
                    !it->second->hasWorkers() && !pool_->isRegistered(it->first))
                    break;
                queue_.pop_front();
            }
            if (queue_.empty())
                break;
            id = queue_.front();
            int allocation = 0;
            if (!pool_->tryRegisterJob(id, &allocation))
                break;
            queue_.pop_front();
            job = jobs_[id];
        }
        if (!job->start(pool_->allocationOf(id))) {
            pool_->unregisterJob(id);
            qCInfo(mfManager) << "job left the queue before start" << "jobId=" << id;
            continue;
        }
        ++admitted;
    }
    if (admitted > 0)
        rebalance();
}

void TransferManager::rebalance() {
    std::vector<std::shared_ptr<TransferJob>> active;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &kv : jobs_) {
            if (pool_->isRegistered(kv.first))
                active.push_back(kv.second);
        }
    }
    for (const auto &job : active)
        job->setAllocation(pool_->allocationOf(job->id()));
}

std::shared_ptr<TransferJob> TransferManager::findJob(quint64 jobId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(jobId);
    return it == jobs_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<TransferJob>> TransferManager::jobsOfUser(
    const QString &userId) const {
    std::vector<std::shared_ptr<TransferJob>> out;
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &kv : jobs_) {
        if (kv.second->userId() == userId)
            out.push_back(kv.second);
    }
    return out;
}

std::optional<JobSnapshot> TransferManager::query(quint64 jobId) const {
    auto job = findJob(jobId);
    if (!job)
        return std::nullopt;
    return job->snapshot();
}

QVector<JobSnapshot> TransferManager::jobsSnapshot() const {
    std::vector<std::shared_ptr<TransferJob>> all;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &kv : jobs_)
            all.push_back(kv.second);
    }
    QVector<JobSnapshot> out;
    out.reserve(static_cast<int>(all.size()));
    for (const auto &job : all)
        out.push_back(job->snapshot());
    return out;
}

bool TransferManager::cancel(quint64 jobId) {
    auto job = findJob(jobId);
    if (!job)
        return false;
    return job->cancel();
}

bool TransferManager::waitUntil(quint64 jobId,
                                const std::function<bool(const JobSnapshot &)> &pred,
                                int timeoutMs) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(0, timeoutMs));
    for (;;) {
        auto job = findJob(jobId);
        if (!job)
            return false;
        if (pred(job->snapshot()))
            return true;
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return false;
        const auto slice = std::min<std::chrono::steady_clock::duration>(
            deadline - now, std::chrono::milliseconds(kWaitSliceMs));
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, slice);
    }
}

bool TransferManager::waitForJob(quint64 jobId, int timeoutMs) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(0, timeoutMs));
    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
        if (jobs_.count(jobId) == 0)
            return false;
        if (settled_.count(jobId) > 0)
            return true;
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return false;
        cv_.wait_until(lk, std::min(deadline, now + std::chrono::milliseconds(kWaitSliceMs)));
    }
}

int TransferManager::clearFinished() {
    std::vector<std::shared_ptr<TransferJob>> removed;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (settled_.count(it->first) > 0) {
                removed.push_back(it->second);
                finished_.erase(it->first);
                settled_.erase(it->first);
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Destroyed here, outside the lock: a job's destructor joins its workers.
    const int n = static_cast<int>(removed.size());
    removed.clear();
    if (n > 0)
        qCInfo(mfManager) << "finished jobs cleared" << "count=" << n;
    return n;
}

bool TransferManager::shutdown(int timeoutMs) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopped_)
            return cleanStop_;
    }
    shuttingDown_ = true;
    qCInfo(mfManager) << "shutdown requested" << "timeoutMs=" << timeoutMs;

    std::vector<std::shared_ptr<TransferJob>> all;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        queue_.clear();
        for (const auto &kv : jobs_)
            all.push_back(kv.second);
    }
    for (const auto &job : all) {
        const JobState st = job->state();
        if (st == JobState::Pending || st == JobState::Paused)
            job->cancel();
    }

    auto anyRunning = [&all]() {
        for (const auto &job : all) {
            if (job->hasWorkers())
                return true;
        }
        return false;
    };
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(0, timeoutMs));
    while (anyRunning() && std::chrono::steady_clock::now() < deadline) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, std::chrono::milliseconds(kWaitSliceMs));
    }

    int forced = 0;
    for (const auto &job : all) {
        if (job->hasWorkers()) {
            ++forced;
            job->forceStop();
        }
    }
    for (const auto &job : all)
        job->join();

    pool_->shutdown();
    progress_->stop();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopped_ = true;
        cleanStop_ = forced == 0;
    }
    cv_.notify_all();
    const ConnectionPool::Stats st = pool_->stats();
    qCInfo(mfManager) << "shutdown complete" << "jobs=" << all.size() << "forced=" << forced
                      << "connectionsOpened=" << st.opened << "connectionsClosed=" << st.closed;
    return forced == 0;
}

void TransferManager::jobStateChanged(TransferJob *job, JobState state) {
    const quint64 id = job->id();
    const bool terminal = mediaferry::isTerminal(state);
    // Notifications from different threads may arrive out of order (a
    // resume can overtake the Paused report), so act on the current state.
    const JobState current = terminal ? state : job->state();
    const bool parked = terminal || current == JobState::Paused;
    if (parked)
        pool_->unregisterJob(id);

    bool emitFinished = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const bool queued = std::find(queue_.begin(), queue_.end(), id) != queue_.end();
        if (parked) {
            queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
        } else if (current == JobState::Pending && !queued && !job->hasWorkers() &&
                   !pool_->isRegistered(id)) {
            queue_.push_back(id);
        }
        if (terminal && finished_.insert(id).second)
            emitFinished = true;
    }

    if (emitFinished) {
        const JobSnapshot s = job->snapshot();
        progress_->post(id, s.bytesDone, s.totalBytes, true);
        qCInfo(mfManager) << "job finished" << "jobId=" << id
                          << "state=" << mediaferry::jobStateName(state)
                          << "bytes=" << s.bytesDone << "attempts=" << s.attempts
                          << "reason=" << s.reason;
        emit jobFinished(id, state == JobState::Completed, s.reason);
    }
    if (parked || current == JobState::Pending) {
        admitPending();
        rebalance();
    }
    emit jobChanged(id);
    if (emitFinished) {
        std::lock_guard<std::mutex> lk(mtx_);
        settled_.insert(id);
    }
    cv_.notify_all();
}

void TransferManager::jobProgress(TransferJob *job, quint64 bytesDone, quint64 total) {
    progress_->post(job->id(), bytesDone, total);
}

void TransferManager::jobReauthRequired(TransferJob *job, const QString &reason) {
    qCWarning(mfManager) << "backend rejected session" << "jobId=" << job->id()
                         << "user=" << job->userId() << "reason=" << reason;
    const SessionStore::Result r = sessions_->markInvalid(job->userId(), reason);
    if (!r.ok() && r.status != SessionStore::Status::NoSession)
        qCWarning(mfManager) << "could not mark session invalid" << "user=" << job->userId()
                             << "detail=" << r.detail;
}

void TransferManager::jobBackendRejected(TransferJob *job, int retryAfterMs) {
    qCWarning(mfManager) << "backend rate limit" << "jobId=" << job->id()
                         << "retryAfterMs=" << retryAfterMs;
    pool_->applyBackoff(retryAfterMs);
    emit backendBackoff(retryAfterMs);
}

void TransferManager::onSessionInvalidated(const QString &userId, const QString &reason) {
    pool_->invalidateUser(userId);
    int paused = 0;
    for (const auto &job : jobsOfUser(userId)) {
        const JobState st = job->state();
        if (mediaferry::isTerminal(st) || st == JobState::Paused)
            continue;
        job->pause(TransferError::ReauthRequired, reason);
        ++paused;
    }
    qCWarning(mfManager) << "reauth required" << "user=" << userId << "pausedJobs=" << paused
                         << "reason=" << reason;
    emit reauthRequired(userId, reason);
}

void TransferManager::onSessionCreated(const QString &userId) {
    // Connections opened with the previous token must not be reused.
    pool_->invalidateUser(userId);
    int resumed = 0;
    for (const auto &job : jobsOfUser(userId)) {
        if (job->resume())
            ++resumed;
    }
    if (resumed > 0)
        qCInfo(mfManager) << "jobs resumed after login" << "user=" << userId
                          << "count=" << resumed;
}

std::unique_ptr<mediaferry::TransportClient> TransferManager::openConnection(
    const QString &userId, mediaferry::TransportError &err) {
    SessionStore::Result why;
    const std::optional<Session> session = sessions_->get(userId, &why);
    if (!session) {
        err = {TransportErrorKind::AuthRejected,
               "no valid session for user " + userId.toStdString(), 0};
        return nullptr;
    }
    const SessionStore::Result touched = sessions_->touch(userId);
    if (!touched.ok())
        qCDebug(mfManager) << "session touch failed" << "user=" << userId
                           << "detail=" << touched.detail;

    mediaferry::BackendOptions opt;
    opt.endpoint = cfg_.endpoint.toStdString();
    opt.user_id = userId.toStdString();
    opt.session_token = session->token.toStdString();
    opt.chunk_timeout_ms = static_cast<std::uint32_t>(cfg_.chunkTimeoutMs);

    for (int attempt = 0; attempt < kConnectAttempts; ++attempt) {
        std::unique_ptr<mediaferry::TransportClient> client;
        {
            std::lock_guard<std::mutex> lk(connFactoryMutex_);
            err.clear();
            client = prototype_->newConnectionLike(opt, err);
        }
        if (client)
            return client;
        qCWarning(mfManager) << "connect failed" << "user=" << userId
                             << "token=" << QString::fromStdString(
                                                mediaferry::redactToken(opt.session_token))
                             << "attempt=" << (attempt + 1)
                             << "kind=" << mediaferry::transportErrorKindName(err.kind)
                             << "error=" << QString::fromStdString(err.message);
        if (err.kind == TransportErrorKind::AuthRejected || shuttingDown_.load())
            return nullptr;
        if (attempt + 1 < kConnectAttempts)
            std::this_thread::sleep_for(
                std::chrono::milliseconds(cfg_.connectRetryBaseMs << attempt));
    }
    if (err.ok())
        err = {TransportErrorKind::Fatal, "connection could not be opened", 0};
    return nullptr;
}
