// Engine tunables, persisted with QSettings under Transfer/, Pool/,
// Progress/, Engine/ and Backend/ groups.
#pragma once
#include <QString>
#include <QtGlobal>

class QSettings;

struct EngineConfig {
    quint64 chunkSize = 1024 * 1024;
    int maxRetriesPerChunk = 3;
    int retryBackoffMs = 250;
    int maxRetryBackoffMs = 4000;
    int chunkTimeoutMs = 30000;

    int globalConnectionBudget = 20;
    int minPerJob = 1;
    int maxPerJob = 8;
    int acquireTimeoutMs = 5000;
    int idleTimeoutMs = 60000;
    int rejectBackoffMs = 2000;   // used when the backend gives no retry-after
    int connectRetryBaseMs = 500;

    int progressIntervalMs = 250;
    int progressQueueDepth = 32;

    int drainTimeoutMs = 10000;

    QString endpoint;

    // Most jobs that can run at once without breaking the budget.
    int maxActiveJobs() const;
};

EngineConfig loadEngineConfig(QSettings &s);
void saveEngineConfig(QSettings &s, const EngineConfig &cfg);

// Returns false and fills "why" with the first invalid field.
bool validateConfig(const EngineConfig &cfg, QString *why = nullptr);

// Clamps every field into its valid range, logging each adjustment.
EngineConfig normalizedConfig(const EngineConfig &cfg);
