// Connection pool and progress reporter tests (run via CTest).
#include "ConnectionPool.hpp"
#include "ProgressReporter.hpp"
#include "mediaferry/MockTransportClient.hpp"

#include <QCoreApplication>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

using Status = ConnectionPool::AcquireStatus;

ConnectionPool::Factory mockFactory(const std::shared_ptr<mediaferry::MockBackend> &backend) {
    auto proto = std::make_shared<mediaferry::MockTransportClient>(backend);
    return [proto](const QString &userId, mediaferry::TransportError &err) {
        mediaferry::BackendOptions opt;
        opt.endpoint = "mock";
        opt.user_id = userId.toStdString();
        opt.session_token = "token-for-" + userId.toStdString();
        return proto->newConnectionLike(opt, err);
    };
}

ConnectionPool::Limits limits(int budget, int minPerJob, int maxPerJob, int idleMs = 60000) {
    ConnectionPool::Limits l;
    l.globalBudget = budget;
    l.minPerJob = minPerJob;
    l.maxPerJob = maxPerJob;
    l.idleTimeoutMs = idleMs;
    return l;
}

ConnectionPool::Lease take(ConnectionPool &pool, quint64 jobId, const QString &user,
                           Status *st, int timeoutMs = 200) {
    return pool.acquire(jobId, user, timeoutMs, nullptr, st);
}

void test_allocation_formula(TestContext &t) {
    t.check(ConnectionPool::allocationFor(10, 1, 1, 8) == 8, "single job is capped at max");
    t.check(ConnectionPool::allocationFor(10, 10, 1, 8) == 1, "ten jobs share ten connections");
    t.check(ConnectionPool::allocationFor(20, 3, 1, 8) == 6, "20 / 3 floors to 6");
    t.check(ConnectionPool::allocationFor(4, 1, 1, 8) == 4, "budget below max");
    t.check(ConnectionPool::allocationFor(10, 3, 2, 8) == 3, "min does not raise a fair share");
    t.check(ConnectionPool::allocationFor(10, 0, 1, 8) == 0, "no jobs, no allocation");
    for (int budget = 1; budget <= 32; ++budget) {
        for (int minPer = 1; minPer <= budget; ++minPer) {
            const int maxJobs = budget / minPer;
            for (int jobs = 1; jobs <= maxJobs; ++jobs) {
                const int a = ConnectionPool::allocationFor(budget, jobs, minPer, 8);
                if (a * jobs > budget || a < minPer)
                    t.check(false, "allocation breaks the budget: budget=" +
                                       std::to_string(budget) + " jobs=" + std::to_string(jobs));
            }
        }
    }
}

void test_admission_limit(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    ConnectionPool pool(limits(4, 2, 8), mockFactory(backend));
    t.check(pool.maxActiveJobs() == 2, "budget 4 / min 2 admits two jobs");
    int alloc = 0;
    t.check(pool.tryRegisterJob(1, &alloc) && alloc == 4, "first job gets the whole budget");
    t.check(pool.tryRegisterJob(2, &alloc) && alloc == 2, "second job halves the share");
    t.check(pool.allocationOf(1) == 2, "first job shrinks to 2");
    t.check(!pool.tryRegisterJob(3), "third job must wait");
    pool.unregisterJob(1);
    t.check(pool.tryRegisterJob(3), "third job is admitted once a slot frees");
    t.check(pool.stats().activeJobs == 2, "two active jobs");
}

void test_budget_and_reuse(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    ConnectionPool pool(limits(3, 1, 8), mockFactory(backend));
    t.check(pool.tryRegisterJob(1), "job admitted");
    Status st = Status::Ok;
    std::vector<ConnectionPool::Lease> leases;
    for (int i = 0; i < 3; ++i) {
        leases.push_back(take(pool, 1, QStringLiteral("alice"), &st));
        t.check(static_cast<bool>(leases.back()) && st == Status::Ok, "lease within budget");
    }
    auto extra = take(pool, 1, QStringLiteral("alice"), &st, 100);
    t.check(!extra && st == Status::PoolExhausted, "fourth lease should time out");
    ConnectionPool::Stats s = pool.stats();
    t.check(s.total == 3 && s.busy == 3 && s.opened == 3, "three busy connections");

    leases.pop_back();
    s = pool.stats();
    t.check(s.idle == 1 && s.busy == 2, "released lease goes back to idle");
    auto again = take(pool, 1, QStringLiteral("alice"), &st);
    t.check(static_cast<bool>(again), "idle connection is reused");
    t.check(pool.stats().opened == 3, "reuse does not open a new connection");
    t.check(pool.jobUsage(1).peakInUse == 3, "peak usage recorded");
    t.check(backend->connectionsOpened() == 3, "backend saw three connections");
}

void test_drain_on_resize(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    ConnectionPool pool(limits(4, 1, 8), mockFactory(backend));
    t.check(pool.tryRegisterJob(1), "job A admitted");
    Status st = Status::Ok;
    std::vector<ConnectionPool::Lease> a;
    for (int i = 0; i < 4; ++i)
        a.push_back(take(pool, 1, QStringLiteral("alice"), &st));
    t.check(pool.stats().busy == 4, "job A holds the whole budget");

    t.check(pool.tryRegisterJob(2), "job B admitted");
    t.check(pool.allocationOf(1) == 2 && pool.allocationOf(2) == 2, "budget split 2/2");
    int draining = 0;
    for (const auto &l : a)
        draining += l.draining() ? 1 : 0;
    t.check(draining == 2, "two of A's connections drain");
    t.check(pool.stats().draining == 2, "pool reports two draining");

    auto blocked = take(pool, 2, QStringLiteral("alice"), &st, 100);
    t.check(!blocked && st == Status::PoolExhausted,
            "B waits while the budget is still held by draining connections");

    for (auto &l : a) {
        if (l.draining())
            l.release();
    }
    auto b1 = take(pool, 2, QStringLiteral("alice"), &st);
    auto b2 = take(pool, 2, QStringLiteral("alice"), &st);
    t.check(b1 && b2, "B gets its share after the drain");
    const ConnectionPool::Stats s = pool.stats();
    t.check(s.opened == 4 && s.peakTotal <= 4, "drained connections are reused, budget kept");
    t.check(pool.jobUsage(1).inUse == 2 && pool.jobUsage(2).inUse == 2, "2 + 2 in use");
}

void test_other_user_idle_is_evicted(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    ConnectionPool pool(limits(2, 1, 8), mockFactory(backend));
    t.check(pool.warmUp(QStringLiteral("alice"), 2) == 2, "two warm connections for alice");
    t.check(pool.tryRegisterJob(7), "bob's job admitted");
    Status st = Status::Ok;
    auto l = take(pool, 7, QStringLiteral("bob"), &st);
    t.check(static_cast<bool>(l), "bob gets a connection by evicting alice's idle one");
    const ConnectionPool::Stats s = pool.stats();
    t.check(s.total == 2 && s.closed == 1, "one idle connection was closed");
}

void test_invalidate_user(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    ConnectionPool pool(limits(4, 1, 8), mockFactory(backend));
    t.check(pool.tryRegisterJob(1) && pool.tryRegisterJob(2), "two jobs admitted");
    Status st = Status::Ok;
    auto aliceBusy = take(pool, 1, QStringLiteral("alice"), &st);
    auto aliceIdle = take(pool, 1, QStringLiteral("alice"), &st);
    auto bob = take(pool, 2, QStringLiteral("bob"), &st);
    aliceIdle.release();

    pool.invalidateUser(QStringLiteral("alice"));
    ConnectionPool::Stats s = pool.stats();
    t.check(s.total == 2, "alice's idle connection is closed at once");
    t.check(aliceBusy.draining(), "alice's busy connection drains");
    aliceBusy.release();
    s = pool.stats();
    t.check(s.total == 1 && s.busy == 1, "alice's connection closes on release, bob keeps his");
}

void test_warm_up_and_reap(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    ConnectionPool pool(limits(3, 1, 8, 30), mockFactory(backend));
    t.check(pool.warmUp(QStringLiteral("alice"), 5) == 3, "warm-up stops at the budget");
    t.check(pool.stats().idle == 3, "warm connections are idle");
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    t.check(pool.reapIdle() == 3, "idle connections past the timeout are reaped");
    t.check(pool.stats().total == 0, "nothing left after reaping");

    ConnectionPool keep(limits(3, 1, 8, 0), mockFactory(backend));
    keep.warmUp(QStringLiteral("alice"), 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    t.check(keep.reapIdle() == 0, "idle timeout 0 never reaps");
    t.check(!keep.startReaper(), "no reaper without an idle timeout");
}

void test_idle_connections_close_without_activity(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    ConnectionPool pool(limits(4, 1, 8, 40), mockFactory(backend));
    t.check(pool.startReaper(), "reaper starts");
    t.check(!pool.startReaper(), "reaper starts once");
    t.check(pool.tryRegisterJob(1), "job registered");
    Status st = Status::Ok;
    {
        auto a = take(pool, 1, QStringLiteral("alice"), &st);
        auto b = take(pool, 1, QStringLiteral("alice"), &st);
        t.check(a && b, "two connections leased");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        t.check(pool.stats().total == 2, "leased connections are never reaped");
    }
    pool.unregisterJob(1);

    bool closed = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(1000);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pool.stats().total == 0) {
            closed = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    t.check(closed, "idle connections close after the timeout with no further acquire");
    t.check(pool.stats().closed == 2, "both connections counted as closed");
    pool.shutdown();
    t.check(!pool.startReaper(), "no reaper after shutdown");
}

void test_backoff(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    ConnectionPool pool(limits(2, 1, 8), mockFactory(backend));
    t.check(pool.backoffRemainingMs() == 0, "no backoff initially");
    pool.applyBackoff(150);
    t.check(pool.backoffRemainingMs() > 0, "backoff is active");
    t.check(!pool.waitOutBackoff([]() { return true; }), "abort predicate ends the wait");
    const auto start = std::chrono::steady_clock::now();
    t.check(pool.waitOutBackoff(nullptr), "wait completes");
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - start)
                            .count();
    t.check(waited >= 100, "wait lasts about the backoff");
    t.check(pool.stats().backoffsApplied == 1, "backoff counted");

    pool.tryRegisterJob(1);
    pool.applyBackoff(200);
    Status st = Status::Ok;
    auto l = take(pool, 1, QStringLiteral("alice"), &st, 50);
    t.check(!l && st == Status::PoolExhausted, "no connection is handed out during backoff");
}

void test_acquire_failures(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    backend->revokeToken("token-for-mallory");
    ConnectionPool pool(limits(2, 1, 8), mockFactory(backend));
    Status st = Status::Ok;
    auto none = take(pool, 9, QStringLiteral("alice"), &st);
    t.check(!none && st == Status::Aborted, "unregistered job is refused");

    pool.tryRegisterJob(1);
    QString why;
    auto rejected = pool.acquire(1, QStringLiteral("mallory"), 200, nullptr, &st, &why);
    t.check(!rejected && st == Status::AuthRejected, "revoked token maps to AuthRejected");
    t.check(!why.isEmpty(), "rejection carries a reason");
    t.check(pool.jobUsage(1).inUse == 0, "failed open releases the reservation");

    std::atomic<bool> stop{false};
    std::thread stopper([&stop, &pool]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop = true;
        pool.wakeWaiters();
    });
    auto l1 = take(pool, 1, QStringLiteral("alice"), &st);
    auto l2 = take(pool, 1, QStringLiteral("alice"), &st);
    auto waited = pool.acquire(1, QStringLiteral("alice"), 5000,
                               [&stop]() { return stop.load(); }, &st);
    stopper.join();
    t.check(!waited && st == Status::Aborted, "abort predicate ends a blocked acquire");

    pool.shutdown();
    auto after = take(pool, 1, QStringLiteral("alice"), &st);
    t.check(!after && st == Status::ShuttingDown, "shut down pool refuses leases");
    l1.release();
    t.check(pool.stats().total == 1, "leases returned after shutdown are closed");
}

void test_progress_throttle(TestContext &t) {
    ProgressReporter r(1000, 8);
    std::mutex m;
    std::vector<ProgressReporter::Report> got;
    r.setCallback([&](const ProgressReporter::Report &rep) {
        std::lock_guard<std::mutex> lk(m);
        got.push_back(rep);
    });
    r.start();
    t.check(r.post(1, 10, 100), "first sample accepted");
    t.check(!r.post(1, 20, 100), "sample inside the interval is throttled");
    t.check(r.post(2, 5, 100), "other jobs are throttled independently");
    t.check(r.post(1, 100, 100, true), "final sample is never throttled");
    r.stop();
    t.check(r.delivered() == 3 && r.throttled() == 1, "three delivered, one throttled");
    std::lock_guard<std::mutex> lk(m);
    bool sawFinal = false;
    for (const auto &rep : got)
        sawFinal = sawFinal || (rep.jobId == 1 && rep.final && rep.bytesDone == 100);
    t.check(sawFinal, "final sample delivered");
}

void test_progress_drops_oldest(TestContext &t) {
    ProgressReporter r(0, 3);
    std::mutex m;
    std::condition_variable cv;
    bool entered = false;
    bool release = false;
    std::vector<quint64> seen;
    r.setCallback([&](const ProgressReporter::Report &rep) {
        std::unique_lock<std::mutex> lk(m);
        seen.push_back(rep.bytesDone);
        entered = true;
        cv.notify_all();
        cv.wait(lk, [&]() { return release; });
    });
    r.start();
    r.post(1, 0, 100);
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(5), [&]() { return entered; });
    }
    for (quint64 i = 1; i <= 9; ++i)
        t.check(r.post(1, i * 10, 100), "posting never blocks");
    t.check(r.dropped() == 6, "queue of depth 3 drops the six oldest samples");
    {
        std::lock_guard<std::mutex> lk(m);
        release = true;
    }
    cv.notify_all();
    r.stop();
    t.check(r.delivered() == 4, "blocked sample plus the newest three delivered");
    std::lock_guard<std::mutex> lk(m);
    t.check(seen.size() == 4 && seen.back() == 90, "newest sample delivered last");
}

void test_progress_rate(TestContext &t) {
    ProgressReporter r(0, 8);
    std::mutex m;
    std::vector<ProgressReporter::Report> got;
    r.setCallback([&](const ProgressReporter::Report &rep) {
        std::lock_guard<std::mutex> lk(m);
        got.push_back(rep);
    });
    r.start();
    r.post(3, 0, 1000);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    r.post(3, 500, 1000, true);
    r.stop();
    std::lock_guard<std::mutex> lk(m);
    t.check(got.size() == 2, "two samples delivered");
    if (got.size() == 2) {
        t.check(got[0].bytesPerSec == 0.0, "first sample has no rate");
        t.check(got[1].bytesPerSec > 0.0 && got[1].bytesPerSec < 20000.0,
                "rate is measured between delivered samples");
    }
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_allocation_formula(t);
    test_admission_limit(t);
    test_budget_and_reuse(t);
    test_drain_on_resize(t);
    test_other_user_idle_is_evicted(t);
    test_invalidate_user(t);
    test_warm_up_and_reap(t);
    test_idle_connections_close_without_activity(t);
    test_backoff(t);
    test_acquire_failures(t);
    test_progress_throttle(t);
    test_progress_drops_oldest(t);
    test_progress_rate(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] mediaferry_pool_tests\n";
    return EXIT_SUCCESS;
}
