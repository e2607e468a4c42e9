#include "EngineConfig.hpp"

#include <QLoggingCategory>
#include <QSettings>

#include <algorithm>

Q_LOGGING_CATEGORY(mfConfig, "mediaferry.config")

static constexpr quint64 kMaxChunkSize = 512ull * 1024 * 1024;

int EngineConfig::maxActiveJobs() const {
    if (minPerJob <= 0)
        return std::max(1, globalConnectionBudget);
    return std::max(1, globalConnectionBudget / minPerJob);
}

EngineConfig loadEngineConfig(QSettings &s) {
    EngineConfig d;
    EngineConfig c;
    c.chunkSize = s.value("Transfer/chunkSize", d.chunkSize).toULongLong();
    c.maxRetriesPerChunk = s.value("Transfer/maxRetriesPerChunk", d.maxRetriesPerChunk).toInt();
    c.retryBackoffMs = s.value("Transfer/retryBackoffMs", d.retryBackoffMs).toInt();
    c.maxRetryBackoffMs = s.value("Transfer/maxRetryBackoffMs", d.maxRetryBackoffMs).toInt();
    c.chunkTimeoutMs = s.value("Transfer/chunkTimeoutMs", d.chunkTimeoutMs).toInt();

    c.globalConnectionBudget = s.value("Pool/globalConnectionBudget", d.globalConnectionBudget).toInt();
    c.minPerJob = s.value("Pool/minPerJob", d.minPerJob).toInt();
    c.maxPerJob = s.value("Pool/maxPerJob", d.maxPerJob).toInt();
    c.acquireTimeoutMs = s.value("Pool/acquireTimeoutMs", d.acquireTimeoutMs).toInt();
    c.idleTimeoutMs = s.value("Pool/idleTimeoutMs", d.idleTimeoutMs).toInt();
    c.rejectBackoffMs = s.value("Pool/rejectBackoffMs", d.rejectBackoffMs).toInt();
    c.connectRetryBaseMs = s.value("Pool/connectRetryBaseMs", d.connectRetryBaseMs).toInt();

    c.progressIntervalMs = s.value("Progress/intervalMs", d.progressIntervalMs).toInt();
    c.progressQueueDepth = s.value("Progress/queueDepth", d.progressQueueDepth).toInt();

    c.drainTimeoutMs = s.value("Engine/drainTimeoutMs", d.drainTimeoutMs).toInt();
    c.endpoint = s.value("Backend/endpoint", d.endpoint).toString().trimmed();
    return c;
}

void saveEngineConfig(QSettings &s, const EngineConfig &c) {
    s.setValue("Transfer/chunkSize", c.chunkSize);
    s.setValue("Transfer/maxRetriesPerChunk", c.maxRetriesPerChunk);
    s.setValue("Transfer/retryBackoffMs", c.retryBackoffMs);
    s.setValue("Transfer/maxRetryBackoffMs", c.maxRetryBackoffMs);
    s.setValue("Transfer/chunkTimeoutMs", c.chunkTimeoutMs);
    s.setValue("Pool/globalConnectionBudget", c.globalConnectionBudget);
    s.setValue("Pool/minPerJob", c.minPerJob);
    s.setValue("Pool/maxPerJob", c.maxPerJob);
    s.setValue("Pool/acquireTimeoutMs", c.acquireTimeoutMs);
    s.setValue("Pool/idleTimeoutMs", c.idleTimeoutMs);
    s.setValue("Pool/rejectBackoffMs", c.rejectBackoffMs);
    s.setValue("Pool/connectRetryBaseMs", c.connectRetryBaseMs);
    s.setValue("Progress/intervalMs", c.progressIntervalMs);
    s.setValue("Progress/queueDepth", c.progressQueueDepth);
    s.setValue("Engine/drainTimeoutMs", c.drainTimeoutMs);
    s.setValue("Backend/endpoint", c.endpoint);
    s.sync();
    if (s.status() != QSettings::NoError)
        qCWarning(mfConfig) << "saveEngineConfig failed" << "file=" << s.fileName();
}

bool validateConfig(const EngineConfig &c, QString *why) {
    auto fail = [why](const QString &msg) {
        if (why)
            *why = msg;
        return false;
    };
    if (c.chunkSize == 0 || c.chunkSize > kMaxChunkSize)
        return fail(QStringLiteral("chunk_size must be between 1 byte and 512 MiB"));
    if (c.maxRetriesPerChunk < 0)
        return fail(QStringLiteral("max_retries_per_chunk must not be negative"));
    if (c.globalConnectionBudget < 1)
        return fail(QStringLiteral("global_connection_budget must be at least 1"));
    if (c.minPerJob < 1)
        return fail(QStringLiteral("min_per_job must be at least 1"));
    if (c.maxPerJob < c.minPerJob)
        return fail(QStringLiteral("max_per_job must be >= min_per_job"));
    if (c.minPerJob > c.globalConnectionBudget)
        return fail(QStringLiteral("min_per_job must not exceed global_connection_budget"));
    if (c.acquireTimeoutMs < 1 || c.chunkTimeoutMs < 1)
        return fail(QStringLiteral("timeouts must be positive"));
    if (c.retryBackoffMs < 0 || c.maxRetryBackoffMs < c.retryBackoffMs)
        return fail(QStringLiteral("retry backoff range is invalid"));
    if (c.progressQueueDepth < 1 || c.progressIntervalMs < 0)
        return fail(QStringLiteral("progress settings are invalid"));
    return true;
}

EngineConfig normalizedConfig(const EngineConfig &in) {
    EngineConfig c = in;
    auto clampInt = [](int &v, int lo, int hi, const char *name) {
        const int before = v;
        v = std::clamp(v, lo, hi);
        if (v != before)
            qCWarning(mfConfig) << "config value clamped"
                                << "key=" << name << "from=" << before << "to=" << v;
    };
    if (c.chunkSize == 0 || c.chunkSize > kMaxChunkSize) {
        const quint64 before = c.chunkSize;
        c.chunkSize = c.chunkSize == 0 ? EngineConfig{}.chunkSize : kMaxChunkSize;
        qCWarning(mfConfig) << "config value clamped"
                            << "key=chunk_size from=" << before << "to=" << c.chunkSize;
    }
    clampInt(c.maxRetriesPerChunk, 0, 100, "max_retries_per_chunk");
    clampInt(c.globalConnectionBudget, 1, 1024, "global_connection_budget");
    clampInt(c.minPerJob, 1, c.globalConnectionBudget, "min_per_job");
    clampInt(c.maxPerJob, c.minPerJob, 1024, "max_per_job");
    clampInt(c.acquireTimeoutMs, 1, 3600 * 1000, "acquire_timeout_ms");
    clampInt(c.chunkTimeoutMs, 1, 3600 * 1000, "chunk_timeout_ms");
    clampInt(c.retryBackoffMs, 0, 60 * 1000, "retry_backoff_ms");
    clampInt(c.maxRetryBackoffMs, c.retryBackoffMs, 10 * 60 * 1000, "max_retry_backoff_ms");
    clampInt(c.idleTimeoutMs, 0, 24 * 3600 * 1000, "idle_timeout_ms");
    clampInt(c.rejectBackoffMs, 0, 10 * 60 * 1000, "reject_backoff_ms");
    clampInt(c.connectRetryBaseMs, 0, 60 * 1000, "connect_retry_base_ms");
    clampInt(c.progressIntervalMs, 0, 60 * 1000, "progress_interval_ms");
    clampInt(c.progressQueueDepth, 1, 4096, "progress_queue_depth");
    clampInt(c.drainTimeoutMs, 0, 3600 * 1000, "drain_timeout_ms");
    return c;
}
