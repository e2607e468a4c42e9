// SessionStore implementation: QSettings INI file with an in-memory cache.
#include "SessionStore.hpp"
#include "mediaferry/RuntimeLogging.hpp"

#include <QDateTime>
#include <QLoggingCategory>
#include <QRegularExpression>

#include <algorithm>

Q_LOGGING_CATEGORY(mfSession, "mediaferry.session")

static const char *kGroup = "Sessions";

static QString redacted(const QString &token) {
    return QString::fromStdString(mediaferry::redactToken(token.toStdString()));
}

SessionStore::SessionStore(const QString &filePath, QObject *parent)
    : QObject(parent), settings_(filePath, QSettings::IniFormat) {
    load();
}

bool SessionStore::validUserId(const QString &userId) {
    static const QRegularExpression re(QStringLiteral("^[A-Za-z0-9_.@-]{1,64}$"));
    return re.match(userId).hasMatch();
}

bool SessionStore::validToken(const QString &token) {
    static const QRegularExpression re(QStringLiteral("^[A-Za-z0-9_.:=+/-]{16,512}$"));
    return re.match(token).hasMatch();
}

void SessionStore::load() {
    std::lock_guard<std::mutex> lk(mtx_);
    cache_.clear();
    settings_.beginGroup(kGroup);
    const QStringList users = settings_.childGroups();
    for (const QString &user : users) {
        settings_.beginGroup(user);
        Session s;
        s.userId = user;
        s.token = settings_.value("token").toString();
        s.createdAtMs = settings_.value("createdAtMs", 0).toLongLong();
        s.lastUsedAtMs = settings_.value("lastUsedAtMs", 0).toLongLong();
        s.valid = settings_.value("valid", false).toBool();
        settings_.endGroup();
        if (!validUserId(user) || !validToken(s.token)) {
            qCWarning(mfSession) << "ignoring malformed session record" << "user=" << user;
            continue;
        }
        cache_.insert(user, s);
    }
    settings_.endGroup();
    qCInfo(mfSession) << "sessions loaded" << "count=" << cache_.size()
                      << "file=" << settings_.fileName();
}

SessionStore::Result SessionStore::persistLocked(const Session &s) {
    settings_.beginGroup(kGroup);
    settings_.beginGroup(s.userId);
    settings_.setValue("token", s.token);
    settings_.setValue("createdAtMs", s.createdAtMs);
    settings_.setValue("lastUsedAtMs", s.lastUsedAtMs);
    settings_.setValue("valid", s.valid);
    settings_.endGroup();
    settings_.endGroup();
    settings_.sync();
    if (settings_.status() != QSettings::NoError) {
        return {Status::BackendError,
                QStringLiteral("QSettings could not persist session for %1").arg(s.userId)};
    }
    return {};
}

SessionStore::Result SessionStore::create(const QString &userId, const QString &token) {
    if (!validUserId(userId))
        return {Status::InvalidFormat, QStringLiteral("invalid user id")};
    if (!validToken(token))
        return {Status::InvalidFormat, QStringLiteral("invalid session token format")};

    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    Result r;
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = cache_.find(userId);
        replaced = (it != cache_.end() && it->valid);
        Session s;
        s.userId = userId;
        s.token = token;
        s.createdAtMs = nowMs;
        s.lastUsedAtMs = nowMs;
        s.valid = true;
        r = persistLocked(s);
        if (!r.ok())
            return r;
        cache_.insert(userId, s);
    }
    qCInfo(mfSession) << "session created" << "user=" << userId
                      << "token=" << redacted(token) << "replacedPrevious=" << replaced;
    emit sessionCreated(userId);
    return r;
}

std::optional<Session> SessionStore::get(const QString &userId, Result *why) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = cache_.constFind(userId);
    if (it == cache_.constEnd()) {
        if (why)
            *why = {Status::NoSession, QStringLiteral("no session for %1").arg(userId)};
        return std::nullopt;
    }
    if (!it->valid) {
        if (why)
            *why = {Status::NoSession,
                    QStringLiteral("session for %1 was invalidated; log in again").arg(userId)};
        return std::nullopt;
    }
    if (why)
        *why = {};
    return *it;
}

SessionStore::Result SessionStore::touch(const QString &userId) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = cache_.find(userId);
    if (it == cache_.end() || !it->valid)
        return {Status::NoSession, QStringLiteral("no session for %1").arg(userId)};
    it->lastUsedAtMs = QDateTime::currentMSecsSinceEpoch();
    return persistLocked(*it);
}

SessionStore::Result SessionStore::markInvalid(const QString &userId, const QString &reason) {
    Result r;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = cache_.find(userId);
        if (it == cache_.end())
            return {Status::NoSession, QStringLiteral("no session for %1").arg(userId)};
        if (!it->valid)
            return r; // already invalidated by another connection
        it->valid = false;
        r = persistLocked(*it);
    }
    if (!r.ok())
        qCWarning(mfSession) << "invalidation not persisted" << "user=" << userId
                             << "detail=" << r.detail;
    qCWarning(mfSession) << "session invalidated" << "user=" << userId << "reason=" << reason;
    emit sessionInvalidated(userId, reason);
    return r;
}

SessionStore::Result SessionStore::logout(const QString &userId) {
    bool wasValid = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = cache_.find(userId);
        if (it == cache_.end())
            return {Status::NoSession, QStringLiteral("no session for %1").arg(userId)};
        wasValid = it->valid;
        cache_.erase(it);
        settings_.beginGroup(kGroup);
        settings_.remove(userId);
        settings_.endGroup();
        settings_.sync();
        if (settings_.status() != QSettings::NoError)
            return {Status::BackendError, QStringLiteral("QSettings could not remove session")};
    }
    qCInfo(mfSession) << "session logged out" << "user=" << userId;
    if (wasValid)
        emit sessionInvalidated(userId, QStringLiteral("logged out"));
    return {};
}

QVector<Session> SessionStore::sessions() const {
    std::lock_guard<std::mutex> lk(mtx_);
    QVector<Session> out;
    out.reserve(cache_.size());
    for (const Session &s : cache_)
        out.push_back(s);
    std::sort(out.begin(), out.end(),
              [](const Session &a, const Session &b) { return a.userId < b.userId; });
    return out;
}

QString SessionStore::fileName() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return settings_.fileName();
}
