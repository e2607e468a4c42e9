// Per-user backend sessions, persisted across restarts.
#pragma once
#include <QHash>
#include <QObject>
#include <QSettings>
#include <QString>
#include <QVector>
#include <mutex>
#include <optional>

struct Session {
    QString userId;
    QString token;
    qint64 createdAtMs = 0;
    qint64 lastUsedAtMs = 0;
    bool valid = false;
};

// Session records live in an INI file (QSettings) keyed by user id:
//   Sessions/<user>/{token, createdAtMs, lastUsedAtMs, valid}
// At most one valid session per user; creating a new one replaces the old.
class SessionStore : public QObject {
    Q_OBJECT
public:
    enum class Status { Ok, NoSession, InvalidFormat, BackendError };
    struct Result {
        Status status = Status::Ok;
        QString detail;
        bool ok() const { return status == Status::Ok; }
    };

    explicit SessionStore(const QString &filePath, QObject *parent = nullptr);

    // Validates format, persists, and replaces any prior session of the user.
    Result create(const QString &userId, const QString &token);

    // The user's valid session, or nullopt with Status::NoSession.
    std::optional<Session> get(const QString &userId, Result *why = nullptr) const;

    // Bumps last_used_at.
    Result touch(const QString &userId);

    // Backend rejected the session. Emits sessionInvalidated once per session.
    Result markInvalid(const QString &userId, const QString &reason);

    // Explicit logout: drops the record entirely.
    Result logout(const QString &userId);

    QVector<Session> sessions() const;
    QString fileName() const;

    static bool validUserId(const QString &userId);
    static bool validToken(const QString &token);

signals:
    void sessionCreated(const QString &userId);
    void sessionInvalidated(const QString &userId, const QString &reason);

private:
    void load();
    Result persistLocked(const Session &s);

    mutable std::mutex mtx_; // protects settings_ and cache_
    QSettings settings_;
    QHash<QString, Session> cache_;
};
