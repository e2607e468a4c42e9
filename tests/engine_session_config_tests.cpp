// Session store and engine settings tests (run via CTest).
#include "EngineConfig.hpp"
#include "SessionStore.hpp"

#include <QCoreApplication>
#include <QSettings>
#include <QTemporaryDir>

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const QString &haystack, const QString &needle, const std::string &msg) {
        check(haystack.contains(needle), msg);
    }
};

const QString kTokenA = QStringLiteral("alpha-token-0123456789");
const QString kTokenB = QStringLiteral("bravo-token-0123456789");

void test_config_defaults_and_round_trip(TestContext &t, const QTemporaryDir &dir) {
    const QString path = dir.filePath(QStringLiteral("engine.ini"));
    {
        QSettings s(path, QSettings::IniFormat);
        const EngineConfig c = loadEngineConfig(s);
        const EngineConfig d;
        t.check(c.chunkSize == d.chunkSize && c.globalConnectionBudget == d.globalConnectionBudget &&
                    c.maxPerJob == d.maxPerJob && c.endpoint.isEmpty(),
                "empty settings load the defaults");
        t.check(validateConfig(c), "defaults are valid");
        t.check(d.maxActiveJobs() == 20, "default budget admits 20 jobs");
    }
    {
        QSettings s(path, QSettings::IniFormat);
        EngineConfig c;
        c.chunkSize = 512 * 1024;
        c.globalConnectionBudget = 12;
        c.minPerJob = 2;
        c.maxPerJob = 6;
        c.maxRetriesPerChunk = 5;
        c.progressIntervalMs = 100;
        c.endpoint = QStringLiteral("/srv/backend");
        saveEngineConfig(s, c);
    }
    {
        QSettings s(path, QSettings::IniFormat);
        const EngineConfig c = loadEngineConfig(s);
        t.check(c.chunkSize == 512 * 1024, "chunk size persisted");
        t.check(c.globalConnectionBudget == 12 && c.minPerJob == 2 && c.maxPerJob == 6,
                "pool limits persisted");
        t.check(c.maxRetriesPerChunk == 5 && c.progressIntervalMs == 100,
                "retry and progress settings persisted");
        t.check(c.endpoint == QStringLiteral("/srv/backend"), "endpoint persisted");
        t.check(c.maxActiveJobs() == 6, "12 / 2 admits six jobs");
    }
}

void test_config_validation(TestContext &t) {
    QString why;
    EngineConfig c;
    c.chunkSize = 0;
    t.check(!validateConfig(c, &why), "zero chunk size is invalid");
    t.checkContains(why, QStringLiteral("chunk_size"), "reason names the field");

    c = EngineConfig{};
    c.minPerJob = 4;
    c.maxPerJob = 2;
    t.check(!validateConfig(c, &why), "max below min is invalid");
    t.checkContains(why, QStringLiteral("max_per_job"), "reason names max_per_job");

    c = EngineConfig{};
    c.globalConnectionBudget = 0;
    t.check(!validateConfig(c, &why), "empty budget is invalid");

    c = EngineConfig{};
    c.retryBackoffMs = 500;
    c.maxRetryBackoffMs = 100;
    t.check(!validateConfig(c, &why), "inverted backoff range is invalid");
}

void test_config_normalization(TestContext &t) {
    EngineConfig c;
    c.chunkSize = 0;
    c.globalConnectionBudget = -3;
    c.minPerJob = 0;
    c.maxPerJob = 0;
    c.maxRetriesPerChunk = -1;
    c.progressQueueDepth = 0;
    const EngineConfig n = normalizedConfig(c);
    t.check(n.chunkSize == EngineConfig{}.chunkSize, "zero chunk size falls back to default");
    t.check(n.globalConnectionBudget == 1 && n.minPerJob == 1 && n.maxPerJob == 1,
            "pool limits clamp to one");
    t.check(n.maxRetriesPerChunk == 0, "negative retries clamp to zero");
    t.check(n.progressQueueDepth == 1, "queue depth clamps to one");
    t.check(validateConfig(n), "normalized settings are valid");
}

void test_session_format_checks(TestContext &t, const QTemporaryDir &dir) {
    SessionStore store(dir.filePath(QStringLiteral("fmt.ini")));
    SessionStore::Result r = store.create(QStringLiteral("bad user"), kTokenA);
    t.check(r.status == SessionStore::Status::InvalidFormat, "spaces in user id rejected");
    r = store.create(QStringLiteral("alice"), QStringLiteral("short"));
    t.check(r.status == SessionStore::Status::InvalidFormat, "short token rejected");
    t.check(store.sessions().isEmpty(), "rejected sessions are not stored");
    t.check(SessionStore::validUserId(QStringLiteral("alice.b-1@x")), "typical user id accepted");
    t.check(!SessionStore::validToken(QStringLiteral("has spaces in the token")),
            "token with spaces rejected");
}

void test_session_lifecycle(TestContext &t, const QTemporaryDir &dir) {
    const QString path = dir.filePath(QStringLiteral("sessions.ini"));
    int created = 0;
    int invalidated = 0;
    QString lastReason;
    {
        SessionStore store(path);
        QObject::connect(&store, &SessionStore::sessionCreated,
                         [&created](const QString &) { ++created; });
        QObject::connect(&store, &SessionStore::sessionInvalidated,
                         [&](const QString &, const QString &reason) {
                             ++invalidated;
                             lastReason = reason;
                         });

        SessionStore::Result why;
        t.check(!store.get(QStringLiteral("alice"), &why) &&
                    why.status == SessionStore::Status::NoSession,
                "no session before login");
        t.check(store.create(QStringLiteral("alice"), kTokenA).ok(), "alice logs in");
        t.check(store.create(QStringLiteral("bob"), kTokenB).ok(), "bob logs in");
        t.check(created == 2, "two sessionCreated signals");
        const auto s = store.get(QStringLiteral("alice"));
        t.check(s && s->token == kTokenA && s->valid, "alice's session is readable");
        t.check(s && s->createdAtMs > 0 && s->lastUsedAtMs >= s->createdAtMs, "timestamps set");
        t.check(store.touch(QStringLiteral("alice")).ok(), "touch succeeds");
    }
    {
        SessionStore store(path);
        const QVector<Session> all = store.sessions();
        t.check(all.size() == 2, "sessions survive a restart");
        if (all.size() == 2)
            t.check(all[0].userId == QStringLiteral("alice") &&
                        all[1].userId == QStringLiteral("bob"),
                    "sessions are listed by user id");
        QObject::connect(&store, &SessionStore::sessionInvalidated,
                         [&](const QString &, const QString &reason) {
                             ++invalidated;
                             lastReason = reason;
                         });
        QObject::connect(&store, &SessionStore::sessionCreated,
                         [&created](const QString &) { ++created; });

        t.check(store.markInvalid(QStringLiteral("alice"), QStringLiteral("AUTH_KEY_UNREGISTERED"))
                    .ok(),
                "markInvalid succeeds");
        t.check(store.markInvalid(QStringLiteral("alice"), QStringLiteral("again")).ok(),
                "markInvalid is idempotent");
        t.check(invalidated == 1 && lastReason == QStringLiteral("AUTH_KEY_UNREGISTERED"),
                "invalidation is signalled once");
        SessionStore::Result why;
        t.check(!store.get(QStringLiteral("alice"), &why) &&
                    why.status == SessionStore::Status::NoSession,
                "invalid session is not handed out");
        t.check(store.touch(QStringLiteral("alice")).status == SessionStore::Status::NoSession,
                "invalid session cannot be touched");

        t.check(store.create(QStringLiteral("alice"), kTokenB).ok(), "alice logs in again");
        const auto s = store.get(QStringLiteral("alice"));
        t.check(s && s->token == kTokenB, "new token replaces the old one");

        t.check(store.logout(QStringLiteral("bob")).ok(), "bob logs out");
        t.check(invalidated == 2 && lastReason == QStringLiteral("logged out"),
                "logout of a valid session is signalled");
        t.check(store.logout(QStringLiteral("bob")).status == SessionStore::Status::NoSession,
                "second logout reports no session");
    }
    {
        SessionStore store(path);
        t.check(store.sessions().size() == 1, "logged out user is gone after restart");
        const auto s = store.get(QStringLiteral("alice"));
        t.check(s && s->token == kTokenB && s->valid, "re-login persisted");
    }
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QTemporaryDir dir;
    if (!dir.isValid()) {
        std::cerr << "[FAIL] cannot create temporary directory\n";
        return EXIT_FAILURE;
    }
    TestContext t;
    test_config_defaults_and_round_trip(t, dir);
    test_config_validation(t);
    test_config_normalization(t);
    test_session_format_checks(t, dir);
    test_session_lifecycle(t, dir);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] mediaferry_session_config_tests\n";
    return EXIT_SUCCESS;
}
