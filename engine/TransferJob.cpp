// Worker threads of one transfer: acquire a pooled connection, pull chunks,
// retry with backoff, finalize, and settle the job state on exit.
#include "TransferJob.hpp"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>

Q_LOGGING_CATEGORY(mfJob, "mediaferry.job")

using mediaferry::Direction;
using mediaferry::JobState;
using mediaferry::TransferError;
using mediaferry::TransportErrorKind;

static QString qs(const std::string &s) {
    return QString::fromStdString(s);
}

TransferJob::TransferJob(const Request &req, const EngineConfig &cfg, ConnectionPool *pool,
                         Observer *observer)
    : req_(req), cfg_(cfg), pool_(pool), observer_(observer),
      createdAtMs_(QDateTime::currentMSecsSinceEpoch()) {}

TransferJob::~TransferJob() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        cancelRequested_ = true;
    }
    stopCv_.notify_all();
    if (pool_)
        pool_->wakeWaiters();
    join();
}

QString TransferJob::partPath() const {
    return req_.localPath + QStringLiteral(".part");
}

bool TransferJob::stopRequested() const {
    return cancelRequested_.load() || pauseRequested_.load() || failed_.load();
}

bool TransferJob::workRemains() const {
    if (!scheduler_.planned())
        return true;
    if (scheduler_.hasPending())
        return true;
    return scheduler_.isComplete() && !finalized_.load();
}

bool TransferJob::start(int allocation) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ != JobState::Pending || cancelRequested_.load() || liveWorkers_ > 0)
            return false;
        allocation_ = std::max(1, allocation);
        pauseRequested_ = false;
        resumeRequested_ = false;
        error_ = TransferError::None;
        reason_.clear();
        scheduler_.abandonInFlight();
        launchWorkerLocked();
        if (scheduler_.planned())
            spawnWorkersLocked();
    }
    qCInfo(mfJob) << "job started" << "jobId=" << id() << "user=" << req_.userId
                  << "direction=" << mediaferry::directionName(req_.direction)
                  << "allocation=" << allocation_.load();
    return true;
}

void TransferJob::setAllocation(int allocation) {
    allocation = std::max(1, allocation);
    std::lock_guard<std::mutex> lk(mtx_);
    const int prev = allocation_.exchange(allocation);
    if (prev == allocation)
        return;
    qCInfo(mfJob) << "allocation changed" << "jobId=" << id() << "from=" << prev
                  << "to=" << allocation;
    if (allocation > prev && liveWorkers_ > 0 && !stopRequested() && scheduler_.planned())
        spawnWorkersLocked();
}

void TransferJob::launchWorkerLocked() {
    std::size_t slot = 0;
    while (slot < slots_.size() && slots_[slot])
        ++slot;
    if (slot == slots_.size())
        slots_.push_back(true);
    else
        slots_[slot] = true;
    ++liveWorkers_;
    const int s = static_cast<int>(slot);
    threads_.emplace_back([this, s]() { runWorker(s); });
}

// Every worker left (drained or superseded) while chunks remain.
void TransferJob::relaunchLocked() {
    launchWorkerLocked();
    if (scheduler_.planned())
        spawnWorkersLocked();
    qCInfo(mfJob) << "workers relaunched" << "jobId=" << id() << "workers=" << liveWorkers_
                  << "allocation=" << allocation_.load();
}

void TransferJob::spawnWorkersLocked() {
    const int pending = static_cast<int>(scheduler_.pendingCount());
    const int want = std::min(allocation_.load(), liveWorkers_ + pending);
    while (liveWorkers_ < want)
        launchWorkerLocked();
}

void TransferJob::runWorker(int slot) {
    using Status = ConnectionPool::AcquireStatus;
    qCDebug(mfJob) << "worker started" << "jobId=" << id() << "slot=" << slot;

    ConnectionPool::Lease lease;
    bool holding = false;
    std::unique_ptr<QFile> local;
    int acquireFailures = 0;

    auto abortAcquire = [this, slot]() {
        return stopRequested() || slot >= allocation_.load() || !workRemains();
    };
    auto stopPred = [this]() { return stopRequested(); };
    auto dropLease = [&]() {
        if (!holding)
            return;
        lease.release();
        holding = false;
        std::lock_guard<std::mutex> lk(mtx_);
        --leasedWorkers_;
    };

    for (;;) {
        if (stopRequested())
            break;

        if (!lease) {
            Status st = Status::Ok;
            QString why;
            lease = pool_->acquire(id(), req_.userId, cfg_.acquireTimeoutMs, abortAcquire, &st,
                                   &why);
            if (!lease) {
                if (st == Status::ShuttingDown) {
                    fail(TransferError::ShuttingDown, QStringLiteral("engine is shutting down"));
                    break;
                }
                if (st == Status::Aborted) {
                    if (!stopRequested() && !pool_->isRegistered(id()))
                        fail(TransferError::InvalidRequest,
                             QStringLiteral("job is not admitted to the connection pool"));
                    break;
                }
                if (st == Status::AuthRejected) {
                    requestReauth(why);
                    break;
                }
                bool alone = false;
                {
                    std::lock_guard<std::mutex> lk(mtx_);
                    alone = leasedWorkers_ == 0;
                }
                if (!alone) {
                    // The job keeps going on the connections it already has.
                    qCInfo(mfJob) << "extra worker gave up on acquire" << "jobId=" << id()
                                  << "slot=" << slot << "reason=" << why;
                    break;
                }
                if (st == Status::PoolExhausted &&
                    ++acquireFailures <= cfg_.maxRetriesPerChunk) {
                    qCWarning(mfJob) << "pool exhausted; retrying acquire" << "jobId=" << id()
                                     << "attempt=" << acquireFailures;
                    continue;
                }
                fail(st == Status::PoolExhausted ? TransferError::PoolExhausted
                                                 : TransferError::ConnectFailed,
                     why);
                break;
            }
            acquireFailures = 0;
            holding = true;
            bool nowRunning = false;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                ++leasedWorkers_;
                peakLeased_ = std::max(peakLeased_, leasedWorkers_);
                if (state_ == JobState::Pending) {
                    state_ = JobState::Running;
                    if (startedAtMs_ == 0)
                        startedAtMs_ = QDateTime::currentMSecsSinceEpoch();
                    nowRunning = true;
                }
            }
            if (nowRunning)
                notifyState(JobState::Running);
        }

        if (lease.draining()) {
            qCInfo(mfJob) << "connection draining; worker exits" << "jobId=" << id()
                          << "slot=" << slot << "connId=" << lease.connectionId();
            break;
        }

        if (!scheduler_.planned()) {
            if (!prepare(lease))
                break;
            std::lock_guard<std::mutex> lk(mtx_);
            spawnWorkersLocked();
        }

        if (scheduler_.isComplete()) {
            if (!finalized_.load())
                finalize(lease);
            break;
        }

        if (!pool_->waitOutBackoff(stopPred))
            break;

        if (!local) {
            const bool download = req_.direction == Direction::Download;
            local = std::make_unique<QFile>(download ? partPath() : req_.localPath);
            if (!local->open(download ? QIODevice::ReadWrite : QIODevice::ReadOnly)) {
                fail(TransferError::LocalIo, QStringLiteral("cannot open %1: %2")
                                                 .arg(local->fileName(), local->errorString()));
                break;
            }
        }

        std::size_t index = 0;
        mediaferry::ChunkRange range;
        if (!scheduler_.next(index, range))
            break;

        mediaferry::TransportError err;
        bool localFailure = false;
        if (transferChunk(lease, local.get(), range, err, &localFailure)) {
            const bool last = scheduler_.markDone(index);
            observer_->jobProgress(this, scheduler_.bytesDone(), scheduler_.totalSize());
            if (last) {
                finalize(lease);
                break;
            }
            continue;
        }

        const QString msg = qs(err.message);
        if (localFailure) {
            scheduler_.abandon(index);
            fail(TransferError::LocalIo, msg);
            break;
        }
        if (err.kind == TransportErrorKind::Interrupted) {
            // Not reusable; pick up a fresh connection unless we are stopping.
            scheduler_.abandon(index);
            lease.invalidate();
            dropLease();
            continue;
        }
        if (err.kind == TransportErrorKind::AuthRejected) {
            scheduler_.abandon(index);
            lease.invalidate();
            requestReauth(msg);
            break;
        }
        if (err.kind == TransportErrorKind::RateLimited) {
            scheduler_.abandon(index);
            const int waitMs = err.retry_after_ms > 0 ? static_cast<int>(err.retry_after_ms)
                                                      : cfg_.rejectBackoffMs;
            observer_->jobBackendRejected(this, waitMs);
            continue;
        }
        if (err.kind == TransportErrorKind::NotFound) {
            scheduler_.abandon(index);
            fail(TransferError::NotFound, msg);
            break;
        }

        const bool exhausted = scheduler_.markFailed(index);
        const int failures = scheduler_.chunk(index).failures;
        if (exhausted) {
            fail(TransferError::ChunkExhausted,
                 QStringLiteral("chunk at offset %1 failed %2 times: %3")
                     .arg(range.offset)
                     .arg(failures)
                     .arg(msg));
            break;
        }
        qCWarning(mfJob) << "chunk attempt failed; retrying" << "jobId=" << id()
                         << "offset=" << range.offset << "failures=" << failures
                         << "kind=" << mediaferry::transportErrorKindName(err.kind)
                         << "error=" << msg;
        if (err.kind == TransportErrorKind::Timeout || err.kind == TransportErrorKind::Fatal) {
            lease.invalidate();
            dropLease();
        }
        backoffSleep(failures);
    }

    dropLease();
    local.reset();
    qCDebug(mfJob) << "worker finished" << "jobId=" << id() << "slot=" << slot;
    workerExited(slot);
}

bool TransferJob::prepare(ConnectionPool::Lease &lease) {
    auto stopPred = [this]() { return stopRequested(); };
    std::uint64_t total = 0;
    if (req_.direction == Direction::Download) {
        mediaferry::RemoteFileInfo info;
        int failures = 0;
        for (;;) {
            if (stopRequested())
                return false;
            mediaferry::TransportError err;
            if (lease.client()->stat(req_.remote, info, err))
                break;
            const QString msg = qs(err.message);
            switch (err.kind) {
            case TransportErrorKind::AuthRejected:
                lease.invalidate();
                requestReauth(msg);
                return false;
            case TransportErrorKind::NotFound:
                fail(TransferError::NotFound,
                     QStringLiteral("remote file not found: %1").arg(req_.source));
                return false;
            case TransportErrorKind::Interrupted:
                lease.invalidate();
                return false;
            case TransportErrorKind::RateLimited:
                observer_->jobBackendRejected(this, err.retry_after_ms > 0
                                                        ? static_cast<int>(err.retry_after_ms)
                                                        : cfg_.rejectBackoffMs);
                if (!pool_->waitOutBackoff(stopPred))
                    return false;
                continue;
            default:
                if (++failures > cfg_.maxRetriesPerChunk) {
                    fail(TransferError::ChunkExhausted,
                         QStringLiteral("metadata request failed %1 times: %2")
                             .arg(failures)
                             .arg(msg));
                    return false;
                }
                backoffSleep(failures);
                continue;
            }
        }
        total = info.size;
        QFile part(partPath());
        if (!part.open(QIODevice::WriteOnly | QIODevice::Truncate) ||
            !part.resize(static_cast<qint64>(total))) {
            fail(TransferError::LocalIo, QStringLiteral("cannot create %1: %2")
                                             .arg(part.fileName(), part.errorString()));
            return false;
        }
        part.close();
    } else {
        QFileInfo fi(req_.localPath);
        if (!fi.isFile()) {
            fail(TransferError::LocalIo,
                 QStringLiteral("local file not found: %1").arg(req_.localPath));
            return false;
        }
        total = static_cast<std::uint64_t>(fi.size());
    }

    std::string err;
    if (!scheduler_.plan(total, cfg_.chunkSize, cfg_.maxRetriesPerChunk, err)) {
        fail(TransferError::InvalidRequest, qs(err));
        return false;
    }
    qCInfo(mfJob) << "job planned" << "jobId=" << id() << "totalBytes=" << total
                  << "chunkSize=" << cfg_.chunkSize << "chunks=" << scheduler_.chunkCount();
    return true;
}

bool TransferJob::transferChunk(ConnectionPool::Lease &lease, QFile *local,
                                const mediaferry::ChunkRange &range,
                                mediaferry::TransportError &err, bool *localFailure) {
    mediaferry::TransportClient *client = lease.client();
    const qint64 len = static_cast<qint64>(range.length);
    if (req_.direction == Direction::Download) {
        std::vector<std::uint8_t> buf;
        if (!client->fetchChunk(req_.remote, range, buf, err))
            return false;
        if (buf.size() != range.length) {
            err = {TransportErrorKind::Transient,
                   "backend returned " + std::to_string(buf.size()) + " bytes for a " +
                       std::to_string(range.length) + " byte chunk",
                   0};
            return false;
        }
        if (!local->seek(static_cast<qint64>(range.offset)) ||
            local->write(reinterpret_cast<const char *>(buf.data()), len) != len ||
            !local->flush()) {
            *localFailure = true;
            err = {TransportErrorKind::Fatal,
                   "write to " + local->fileName().toStdString() +
                       " failed: " + local->errorString().toStdString(),
                   0};
            return false;
        }
        return true;
    }

    std::vector<std::uint8_t> buf(static_cast<std::size_t>(range.length));
    if (!local->seek(static_cast<qint64>(range.offset)) ||
        local->read(reinterpret_cast<char *>(buf.data()), len) != len) {
        *localFailure = true;
        err = {TransportErrorKind::Fatal,
               "read from " + local->fileName().toStdString() +
                   " failed: " + local->errorString().toStdString(),
               0};
        return false;
    }
    return client->pushChunk(req_.target, range, buf, err);
}

void TransferJob::finalize(ConnectionPool::Lease &lease) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (cancelRequested_.load() || finalizing_.exchange(true))
            return;
    }

    if (req_.direction == Direction::Download) {
        if (QFile::exists(req_.localPath) && !QFile::remove(req_.localPath)) {
            fail(TransferError::LocalIo, QStringLiteral("cannot replace %1").arg(req_.localPath));
            return;
        }
        if (!QFile::rename(partPath(), req_.localPath)) {
            fail(TransferError::LocalIo,
                 QStringLiteral("cannot move %1 into place").arg(partPath()));
            return;
        }
        finalized_ = true;
        qCInfo(mfJob) << "download finalized" << "jobId=" << id() << "path=" << req_.localPath;
        return;
    }

    auto stopPred = [this]() { return stopRequested(); };
    const std::vector<mediaferry::ChunkRange> parts = scheduler_.orderedParts();
    int failures = 0;
    for (;;) {
        if (cancelRequested_.load()) {
            finalizing_ = false;
            return;
        }
        mediaferry::TransportError err;
        mediaferry::FileReference out;
        if (lease.client()->finalizeUpload(req_.target, parts, out, err)) {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                remoteRef_ = qs(out.key());
            }
            finalized_ = true;
            qCInfo(mfJob) << "upload finalized" << "jobId=" << id() << "parts=" << parts.size()
                          << "remote=" << qs(out.key());
            return;
        }
        const QString msg = qs(err.message);
        switch (err.kind) {
        case TransportErrorKind::AuthRejected:
            lease.invalidate();
            finalizing_ = false;
            requestReauth(msg);
            return;
        case TransportErrorKind::Interrupted:
            lease.invalidate();
            finalizing_ = false;
            return;
        case TransportErrorKind::RateLimited:
            observer_->jobBackendRejected(this, err.retry_after_ms > 0
                                                    ? static_cast<int>(err.retry_after_ms)
                                                    : cfg_.rejectBackoffMs);
            if (!pool_->waitOutBackoff(stopPred)) {
                finalizing_ = false;
                return;
            }
            continue;
        default:
            break;
        }
        if (err.kind == TransportErrorKind::NotFound || ++failures > cfg_.maxRetriesPerChunk) {
            fail(TransferError::ChunkExhausted,
                 QStringLiteral("upload finalize failed: %1").arg(msg));
            return;
        }
        qCWarning(mfJob) << "upload finalize failed; retrying" << "jobId=" << id()
                         << "failures=" << failures << "error=" << msg;
        backoffSleep(failures);
    }
}

void TransferJob::workerExited(int slot) {
    JobState next = JobState::Pending;
    bool changed = false;
    bool removePart = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (slot >= 0 && static_cast<std::size_t>(slot) < slots_.size())
            slots_[static_cast<std::size_t>(slot)] = false;
        --liveWorkers_;
        if (liveWorkers_ > 0)
            return;

        next = state_;
        // Once the result is in place (renamed or committed remotely) the
        // job is Completed, whatever arrived afterwards.
        if (finalized_.load()) {
            next = JobState::Completed;
            error_ = TransferError::None;
            reason_.clear();
        } else if (cancelRequested_.load()) {
            next = JobState::Cancelled;
            error_ = TransferError::Cancelled;
            reason_ = QStringLiteral("cancelled by request");
            removePart = req_.direction == Direction::Download;
        } else if (failed_.load()) {
            next = JobState::Failed;
            error_ = failError_;
            reason_ = failReason_;
        } else if (pauseRequested_.load()) {
            if (resumeRequested_) {
                // A new session arrived before the pause settled.
                pauseRequested_ = false;
                resumeRequested_ = false;
                qCInfo(mfJob) << "pause superseded by resume; relaunching" << "jobId=" << id();
                relaunchLocked();
                return;
            }
            next = JobState::Paused;
            error_ = pauseError_;
            reason_ = pauseReason_;
        } else if (workRemains()) {
            relaunchLocked();
            return;
        } else {
            next = JobState::Failed;
            error_ = TransferError::ChunkTransferError;
            reason_ = QStringLiteral("transfer stopped with unfinished chunks");
        }
        if (next != state_) {
            state_ = next;
            changed = true;
            if (mediaferry::isTerminal(next))
                finishedAtMs_ = QDateTime::currentMSecsSinceEpoch();
        }
    }
    if (removePart)
        QFile::remove(partPath());
    if (changed)
        notifyState(next);
}

void TransferJob::fail(TransferError kind, const QString &reason) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (failed_.load())
            return;
        failError_ = kind;
        failReason_ = reason;
        failed_ = true;
    }
    qCWarning(mfJob) << "job failing" << "jobId=" << id()
                     << "error=" << mediaferry::transferErrorName(kind) << "reason=" << reason;
    stopCv_.notify_all();
    pool_->wakeWaiters();
}

void TransferJob::requestReauth(const QString &reason) {
    pause(TransferError::ReauthRequired, reason);
    observer_->jobReauthRequired(this, reason);
}

void TransferJob::pause(TransferError why, const QString &reason) {
    bool immediate = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (mediaferry::isTerminal(state_) || state_ == JobState::Paused)
            return;
        if (!pauseRequested_.load()) {
            pauseError_ = why;
            pauseReason_ = reason;
            pauseRequested_ = true;
        }
        resumeRequested_ = false;
        if (liveWorkers_ == 0) {
            state_ = JobState::Paused;
            error_ = pauseError_;
            reason_ = pauseReason_;
            immediate = true;
        }
    }
    qCInfo(mfJob) << "pause requested" << "jobId=" << id()
                  << "why=" << mediaferry::transferErrorName(why) << "reason=" << reason
                  << "immediate=" << immediate;
    stopCv_.notify_all();
    pool_->wakeWaiters();
    if (immediate)
        notifyState(JobState::Paused);
}

bool TransferJob::resume() {
    bool toPending = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (mediaferry::isTerminal(state_) || cancelRequested_.load())
            return false;
        if (state_ == JobState::Paused && liveWorkers_ == 0) {
            state_ = JobState::Pending;
            error_ = TransferError::None;
            reason_.clear();
            pauseRequested_ = false;
            toPending = true;
        } else if (pauseRequested_.load()) {
            resumeRequested_ = true;
        } else {
            return false;
        }
    }
    qCInfo(mfJob) << "resume requested" << "jobId=" << id() << "requeued=" << toPending;
    if (toPending)
        notifyState(JobState::Pending);
    return true;
}

bool TransferJob::cancel() {
    return requestCancel(false);
}

bool TransferJob::requestCancel(bool evenWhileFinalizing) {
    bool immediate = false;
    bool removePart = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (mediaferry::isTerminal(state_))
            return false;
        if (!evenWhileFinalizing && (finalizing_.load() || finalized_.load())) {
            qCInfo(mfJob) << "cancel refused; job is finalizing" << "jobId=" << id();
            return false;
        }
        cancelRequested_ = true;
        if (liveWorkers_ == 0) {
            state_ = JobState::Cancelled;
            error_ = TransferError::Cancelled;
            reason_ = QStringLiteral("cancelled by request");
            finishedAtMs_ = QDateTime::currentMSecsSinceEpoch();
            removePart = req_.direction == Direction::Download && scheduler_.planned();
            immediate = true;
        }
    }
    qCInfo(mfJob) << "cancel requested" << "jobId=" << id() << "immediate=" << immediate;
    stopCv_.notify_all();
    pool_->wakeWaiters();
    if (removePart)
        QFile::remove(partPath());
    if (immediate)
        notifyState(JobState::Cancelled);
    return true;
}

void TransferJob::forceStop() {
    requestCancel(true);
    pool_->interruptJob(id());
}

void TransferJob::join() {
    for (;;) {
        std::vector<std::thread> batch;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (threads_.empty() && liveWorkers_ == 0)
                return;
            batch.swap(threads_);
        }
        if (batch.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            continue;
        }
        for (auto &t : batch) {
            if (t.joinable())
                t.join();
        }
    }
}

void TransferJob::backoffSleep(int failures) {
    const qint64 cap = std::max(cfg_.maxRetryBackoffMs, cfg_.retryBackoffMs);
    qint64 ms = cfg_.retryBackoffMs;
    for (int i = 1; i < failures && ms < cap; ++i)
        ms *= 2;
    ms = std::min(ms, cap);
    if (ms <= 0)
        return;
    std::unique_lock<std::mutex> lk(mtx_);
    stopCv_.wait_for(lk, std::chrono::milliseconds(ms), [this]() { return stopRequested(); });
}

void TransferJob::notifyState(JobState state) {
    qCInfo(mfJob) << "job state" << "jobId=" << id() << "state=" << mediaferry::jobStateName(state);
    observer_->jobStateChanged(this, state);
}

JobState TransferJob::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

bool TransferJob::hasWorkers() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return liveWorkers_ > 0;
}

JobSnapshot TransferJob::snapshot() const {
    JobSnapshot s;
    s.id = req_.id;
    s.userId = req_.userId;
    s.direction = req_.direction;
    s.source = req_.source;
    s.destination = req_.destination;
    s.planned = scheduler_.planned();
    s.totalBytes = scheduler_.totalSize();
    s.chunkSize = s.planned ? scheduler_.chunkSize() : cfg_.chunkSize;
    s.bytesDone = scheduler_.bytesDone();
    s.chunksTotal = static_cast<int>(scheduler_.chunkCount());
    s.chunksDone = static_cast<int>(scheduler_.doneCount());
    s.chunksInFlight = static_cast<int>(scheduler_.inFlightCount());
    s.attempts = scheduler_.totalAttempts();
    s.allocation = allocation_.load();
    std::lock_guard<std::mutex> lk(mtx_);
    s.state = state_;
    s.error = error_;
    s.reason = reason_;
    s.workers = liveWorkers_;
    s.connections = leasedWorkers_;
    s.peakConnections = peakLeased_;
    s.remoteRef = remoteRef_;
    s.createdAtMs = createdAtMs_;
    s.startedAtMs = startedAtMs_;
    s.finishedAtMs = finishedAtMs_;
    return s;
}
