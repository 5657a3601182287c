/**
 * @file transfersettings.h
 * @brief Tunables of the transfer engine, persisted with QSettings.
 */

#ifndef TRANSFERSETTINGS_H
#define TRANSFERSETTINGS_H

#include <QtGlobal>

#include "models/transferrequest.h"

class QSettings;

/**
 * @brief Engine configuration.
 *
 * Values live under the "transfers/" group. Out-of-range numbers are clamped
 * and unknown policy names fall back to the default, both with a warning.
 */
struct TransferSettings {
    static constexpr qint64 DefaultChunkSize = 1024 * 1024;
    static constexpr qint64 MinChunkSize = 4 * 1024;
    static constexpr qint64 MaxChunkSize = 64 * 1024 * 1024;
    static constexpr int DefaultMaxConcurrentJobs = 4;
    static constexpr int MaxConcurrentJobsLimit = 64;

    qint64 chunkSize = DefaultChunkSize;
    int maxConcurrentJobs = DefaultMaxConcurrentJobs;
    bool queueFileOperations = false;  ///< Run one job at a time
    ConflictPolicy defaultConflictPolicy = ConflictPolicy::AskEachTime;
    bool abortOnFirstError = false;
    bool preservePermissions = true;

    /// Worker count after applying queueFileOperations
    [[nodiscard]] int effectiveWorkerCount() const { return queueFileOperations ? 1 : maxConcurrentJobs; }

    [[nodiscard]] ErrorPolicy defaultErrorPolicy() const
    {
        return abortOnFirstError ? ErrorPolicy::AbortOnFirstError : ErrorPolicy::ContinueOnError;
    }

    /**
     * @brief Reads settings from @p settings, using defaults for missing keys.
     */
    static TransferSettings load(QSettings &settings);

    /**
     * @brief Reads settings from the application's default QSettings store.
     */
    static TransferSettings load();

    void save(QSettings &settings) const;
};

#endif // TRANSFERSETTINGS_H
