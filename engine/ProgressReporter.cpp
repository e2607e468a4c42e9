#include "ProgressReporter.hpp"

#include <QLoggingCategory>

#include <algorithm>
#include <vector>

Q_LOGGING_CATEGORY(mfProgress, "mediaferry.progress")

ProgressReporter::ProgressReporter(int minIntervalMs, int queueDepth, QObject *parent)
    : QObject(parent), minIntervalMs_(std::max(0, minIntervalMs)),
      queueDepth_(static_cast<std::size_t>(std::max(1, queueDepth))) {}

ProgressReporter::~ProgressReporter() {
    stop();
}

void ProgressReporter::setCallback(Callback cb) {
    std::lock_guard<std::mutex> lk(mtx_);
    callback_ = std::move(cb);
}

void ProgressReporter::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_)
        return;
    running_ = true;
    stopping_ = false;
    thread_ = std::thread([this]() { run(); });
    qCInfo(mfProgress) << "reporter started" << "minIntervalMs=" << minIntervalMs_
                       << "queueDepth=" << queueDepth_;
}

void ProgressReporter::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_)
            return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
    std::lock_guard<std::mutex> lk(mtx_);
    running_ = false;
    qCInfo(mfProgress) << "reporter stopped" << "delivered=" << delivered_
                       << "dropped=" << dropped_ << "throttled=" << throttled_;
}

bool ProgressReporter::running() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return running_ && !stopping_;
}

bool ProgressReporter::post(quint64 jobId, quint64 bytesDone, quint64 total, bool final) {
    const auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        JobQueue &jq = jobs_[jobId];
        if (!final && jq.anyAccepted &&
            now - jq.lastAccepted < std::chrono::milliseconds(minIntervalMs_)) {
            ++throttled_;
            return false;
        }
        jq.lastAccepted = now;
        jq.anyAccepted = true;
        jq.queue.push_back(Sample{bytesDone, total, now, final});
        if (jq.queue.size() > queueDepth_) {
            jq.queue.pop_front();
            ++dropped_;
        }
    }
    cv_.notify_one();
    return true;
}

void ProgressReporter::run() {
    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
        auto hasWork = [this]() {
            for (const auto &kv : jobs_) {
                if (!kv.second.queue.empty())
                    return true;
            }
            return false;
        };
        cv_.wait(lk, [&]() { return stopping_ || hasWork(); });
        if (!hasWork()) {
            if (stopping_)
                return;
            continue;
        }

        // One sample per job per round keeps a busy job from starving others.
        std::vector<Report> batch;
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            JobQueue &jq = it->second;
            if (!jq.queue.empty()) {
                const Sample s = jq.queue.front();
                jq.queue.pop_front();
                Report r;
                r.jobId = it->first;
                r.bytesDone = s.bytesDone;
                r.total = s.total;
                r.final = s.final;
                if (jq.anyDelivered && s.at > jq.lastAt && s.bytesDone >= jq.lastBytes) {
                    const double secs = std::chrono::duration<double>(s.at - jq.lastAt).count();
                    r.bytesPerSec = static_cast<double>(s.bytesDone - jq.lastBytes) / secs;
                }
                jq.lastBytes = s.bytesDone;
                jq.lastAt = s.at;
                jq.anyDelivered = true;
                jq.finished = s.final;
                batch.push_back(r);
            }
            if (jq.finished && jq.queue.empty())
                it = jobs_.erase(it);
            else
                ++it;
        }
        Callback cb = callback_;
        lk.unlock();
        for (const Report &r : batch) {
            if (cb)
                cb(r);
            emit progressed(r.jobId, r.bytesDone, r.total, r.bytesPerSec);
        }
        lk.lock();
        delivered_ += batch.size();
    }
}

quint64 ProgressReporter::delivered() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return delivered_;
}

quint64 ProgressReporter::dropped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dropped_;
}

quint64 ProgressReporter::throttled() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return throttled_;
}
