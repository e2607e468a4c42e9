// Command-line front end: session management and single-file transfers
// against a directory-backed backend.
#include "EngineConfig.hpp"
#include "SessionStore.hpp"
#include "TransferManager.hpp"
#include "mediaferry/FormatUtils.hpp"
#include "mediaferry/LocalDirTransportClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>
#include <QTextStream>

#include <algorithm>
#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(mfCli, "mediaferry.cli")

namespace {

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream &err() {
    static QTextStream s(stderr);
    return s;
}

QString defaultSessionsFile() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dir.isEmpty())
        dir = QDir::homePath() + QStringLiteral("/.mediaferry");
    return dir + QStringLiteral("/sessions.ini");
}

QString sessionStatusText(SessionStore::Status st) {
    switch (st) {
    case SessionStore::Status::Ok:
        return QStringLiteral("ok");
    case SessionStore::Status::NoSession:
        return QStringLiteral("no session");
    case SessionStore::Status::InvalidFormat:
        return QStringLiteral("invalid format");
    case SessionStore::Status::BackendError:
        return QStringLiteral("storage error");
    }
    return QStringLiteral("unknown");
}

int runLogin(SessionStore &store, const QStringList &args) {
    if (args.size() != 3) {
        err() << "usage: mediaferry login <user> <token>\n";
        return 2;
    }
    const SessionStore::Result r = store.create(args.at(1), args.at(2));
    if (!r.ok()) {
        err() << "login failed (" << sessionStatusText(r.status) << "): " << r.detail << "\n";
        return 1;
    }
    out() << "session stored for " << args.at(1) << "\n";
    return 0;
}

int runLogout(SessionStore &store, const QStringList &args) {
    if (args.size() != 2) {
        err() << "usage: mediaferry logout <user>\n";
        return 2;
    }
    const SessionStore::Result r = store.logout(args.at(1));
    if (!r.ok()) {
        err() << "logout failed (" << sessionStatusText(r.status) << "): " << r.detail << "\n";
        return 1;
    }
    out() << "logged out " << args.at(1) << "\n";
    return 0;
}

int runSessions(const SessionStore &store) {
    const QVector<Session> all = store.sessions();
    if (all.isEmpty()) {
        out() << "no sessions in " << store.fileName() << "\n";
        return 0;
    }
    for (const Session &s : all) {
        out() << s.userId << "\t" << (s.valid ? "valid" : "invalid") << "\tlast used "
              << QDateTime::fromMSecsSinceEpoch(s.lastUsedAtMs).toString(Qt::ISODate) << "\n";
    }
    return 0;
}

int runTransfer(const EngineConfig &cfg, SessionStore &store, mediaferry::Direction direction,
                const QStringList &args) {
    const bool download = direction == mediaferry::Direction::Download;
    if (args.size() != 4) {
        err() << (download ? "usage: mediaferry download <user> <link> <destination>\n"
                           : "usage: mediaferry upload <user> <file> <chat>\n");
        return 2;
    }
    if (cfg.endpoint.isEmpty()) {
        err() << "no backend directory configured (use --backend)\n";
        return 2;
    }
    const QString user = args.at(1);

    TransferManager manager(cfg, &store, std::make_shared<mediaferry::LocalDirTransportClient>());
    manager.progress()->setCallback([](const ProgressReporter::Report &r) {
        const double pct = r.total ? 100.0 * static_cast<double>(r.bytesDone) /
                                         static_cast<double>(r.total)
                                   : 100.0;
        out() << QStringLiteral("\r%1 / %2  %3%  %4")
                     .arg(QString::fromStdString(
                              mediaferry::formatSize(static_cast<std::int64_t>(r.bytesDone))),
                          QString::fromStdString(
                              mediaferry::formatSize(static_cast<std::int64_t>(r.total))))
                     .arg(pct, 0, 'f', 1)
                     .arg(QString::fromStdString(mediaferry::formatRate(r.bytesPerSec)));
        if (r.final)
            out() << "\n";
        out().flush();
    });
    QObject::connect(&manager, &TransferManager::reauthRequired,
                     [](const QString &u, const QString &why) {
                         err() << "\nsession of " << u << " was rejected: " << why
                               << "\nrun 'mediaferry login' again to continue\n";
                         err().flush();
                     });

    // Open the first connections while the request is validated.
    const int warmed = manager.pool()->warmUp(user, std::min(cfg.minPerJob, cfg.maxPerJob));
    qCDebug(mfCli) << "connections warmed" << "user=" << user << "count=" << warmed;

    QString why;
    const quint64 id = manager.submit(user, direction, args.at(2), args.at(3), &why);
    if (id == 0) {
        err() << "transfer rejected: " << why << "\n";
        return 1;
    }

    // Paused jobs wait for a new login from another process; give up then.
    const bool settled = manager.waitUntil(
        id,
        [](const JobSnapshot &s) {
            return mediaferry::isTerminal(s.state) || s.state == mediaferry::JobState::Paused;
        },
        24 * 3600 * 1000);
    const std::optional<JobSnapshot> snap = manager.query(id);
    manager.shutdown(cfg.drainTimeoutMs);
    if (!settled || !snap) {
        err() << "transfer did not finish\n";
        return 1;
    }
    if (snap->state != mediaferry::JobState::Completed) {
        err() << "transfer " << mediaferry::jobStateName(snap->state) << " ("
              << mediaferry::transferErrorName(snap->error) << "): " << snap->reason << "\n";
        return 1;
    }
    const qint64 ms = std::max<qint64>(1, snap->finishedAtMs - snap->startedAtMs);
    out() << (download ? "saved " : "uploaded ")
          << QString::fromStdString(
                 mediaferry::formatSize(static_cast<std::int64_t>(snap->totalBytes)))
          << " in " << QString::fromStdString(mediaferry::formatDuration(ms / 1000))
          << " using up to " << snap->peakConnections << " connections";
    if (!download)
        out() << " as " << snap->remoteRef;
    out() << "\n";
    return 0;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("MediaFerry"));
    QCoreApplication::setApplicationName(QStringLiteral("mediaferry"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Parallel chunked media transfers.\n\n"
                       "Commands:\n"
                       "  login <user> <token>\n"
                       "  logout <user>\n"
                       "  sessions\n"
                       "  download <user> <link> <destination>\n"
                       "  upload <user> <file> <chat>"));
    parser.addHelpOption();
    const QCommandLineOption configOpt(QStringLiteral("config"),
                                       QStringLiteral("Engine settings file (INI)."),
                                       QStringLiteral("file"));
    const QCommandLineOption sessionsOpt(QStringLiteral("sessions"),
                                         QStringLiteral("Session store file (INI)."),
                                         QStringLiteral("file"));
    const QCommandLineOption backendOpt(QStringLiteral("backend"),
                                        QStringLiteral("Backend directory."),
                                        QStringLiteral("dir"));
    const QCommandLineOption connectionsOpt(QStringLiteral("connections"),
                                            QStringLiteral("Global connection budget."),
                                            QStringLiteral("n"));
    parser.addOption(configOpt);
    parser.addOption(sessionsOpt);
    parser.addOption(backendOpt);
    parser.addOption(connectionsOpt);
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        err() << parser.helpText();
        return 2;
    }

    std::unique_ptr<QSettings> settings =
        parser.isSet(configOpt)
            ? std::make_unique<QSettings>(parser.value(configOpt), QSettings::IniFormat)
            : std::make_unique<QSettings>(QStringLiteral("MediaFerry"),
                                          QStringLiteral("mediaferry"));
    EngineConfig cfg = loadEngineConfig(*settings);
    if (parser.isSet(backendOpt))
        cfg.endpoint = QDir(parser.value(backendOpt)).absolutePath();
    if (parser.isSet(connectionsOpt)) {
        bool ok = false;
        const int n = parser.value(connectionsOpt).toInt(&ok);
        if (!ok) {
            err() << "--connections expects a number\n";
            return 2;
        }
        cfg.globalConnectionBudget = n;
    }
    QString invalid;
    if (!validateConfig(cfg, &invalid)) {
        qCWarning(mfCli) << "invalid engine settings; using clamped values"
                         << "reason=" << invalid;
        cfg = normalizedConfig(cfg);
    }

    const QString sessionsFile =
        parser.isSet(sessionsOpt) ? parser.value(sessionsOpt) : defaultSessionsFile();
    QDir().mkpath(QFileInfo(sessionsFile).absolutePath());
    SessionStore store(sessionsFile);

    const QString cmd = args.at(0);
    qCInfo(mfCli) << "command" << cmd << "sessions=" << sessionsFile
                  << "backend=" << cfg.endpoint;
    if (cmd == QLatin1String("login"))
        return runLogin(store, args);
    if (cmd == QLatin1String("logout"))
        return runLogout(store, args);
    if (cmd == QLatin1String("sessions"))
        return runSessions(store);
    if (cmd == QLatin1String("download"))
        return runTransfer(cfg, store, mediaferry::Direction::Download, args);
    if (cmd == QLatin1String("upload"))
        return runTransfer(cfg, store, mediaferry::Direction::Upload, args);

    err() << "unknown command: " << cmd << "\n" << parser.helpText();
    return 2;
}
