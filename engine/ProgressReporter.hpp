// Throttled progress delivery, decoupled from transfer workers.
#pragma once
#include <QObject>
#include <QtGlobal>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

// Workers post samples without blocking; a dedicated thread delivers them to
// the callback and the progressed() signal. Each job owns a bounded queue:
// when it is full the oldest sample is dropped. Samples closer than
// minIntervalMs to the previous accepted one are discarded, except final ones.
class ProgressReporter : public QObject {
    Q_OBJECT
public:
    struct Report {
        quint64 jobId = 0;
        quint64 bytesDone = 0;
        quint64 total = 0;
        double bytesPerSec = 0.0;
        bool final = false;
    };
    using Callback = std::function<void(const Report &)>;

    ProgressReporter(int minIntervalMs, int queueDepth, QObject *parent = nullptr);
    ~ProgressReporter() override;

    void setCallback(Callback cb);

    void start();
    // Delivers what is still queued, then joins the reporting thread.
    void stop();
    bool running() const;

    // Never blocks on delivery. Returns false when the sample was throttled.
    bool post(quint64 jobId, quint64 bytesDone, quint64 total, bool final = false);

    quint64 delivered() const;
    quint64 dropped() const;
    quint64 throttled() const;

signals:
    void progressed(quint64 jobId, quint64 bytesDone, quint64 total, double bytesPerSec);

private:
    using Clock = std::chrono::steady_clock;

    struct Sample {
        quint64 bytesDone = 0;
        quint64 total = 0;
        Clock::time_point at;
        bool final = false;
    };
    struct JobQueue {
        std::deque<Sample> queue;
        Clock::time_point lastAccepted{};
        bool anyAccepted = false;
        // Rate is measured between consecutive delivered samples.
        quint64 lastBytes = 0;
        Clock::time_point lastAt{};
        bool anyDelivered = false;
        bool finished = false;
    };

    void run();

    const int minIntervalMs_;
    const std::size_t queueDepth_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<quint64, JobQueue> jobs_;
    Callback callback_;
    std::thread thread_;
    bool running_ = false;
    bool stopping_ = false;
    quint64 delivered_ = 0;
    quint64 dropped_ = 0;
    quint64 throttled_ = 0;
};
