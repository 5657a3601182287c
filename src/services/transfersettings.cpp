#include "transfersettings.h"

#include <QDebug>
#include <QSettings>

TransferSettings TransferSettings::load(QSettings &settings)
{
    TransferSettings result;

    settings.beginGroup("transfers");

    const qint64 chunkSize = settings.value("chunkSize", DefaultChunkSize).toLongLong();
    result.chunkSize = qBound(MinChunkSize, chunkSize, MaxChunkSize);
    if (result.chunkSize != chunkSize) {
        qWarning() << "TransferSettings: chunkSize" << chunkSize << "out of range, using" << result.chunkSize;
    }

    const int maxJobs = settings.value("maxConcurrentJobs", DefaultMaxConcurrentJobs).toInt();
    result.maxConcurrentJobs = qBound(1, maxJobs, MaxConcurrentJobsLimit);
    if (result.maxConcurrentJobs != maxJobs) {
        qWarning() << "TransferSettings: maxConcurrentJobs" << maxJobs
                   << "out of range, using" << result.maxConcurrentJobs;
    }

    result.queueFileOperations = settings.value("queueFileOperations", false).toBool();

    const QString policy = settings.value("defaultConflictPolicy",
                                          QString::fromLatin1(conflictPolicyToString(result.defaultConflictPolicy)))
                               .toString();
    bool ok = false;
    const ConflictPolicy parsed = conflictPolicyFromString(policy, &ok);
    if (ok) {
        result.defaultConflictPolicy = parsed;
    } else {
        qWarning() << "TransferSettings: unknown conflict policy" << policy << "- using"
                   << conflictPolicyToString(result.defaultConflictPolicy);
    }

    result.abortOnFirstError = settings.value("abortOnFirstError", false).toBool();
    result.preservePermissions = settings.value("preservePermissions", true).toBool();

    settings.endGroup();
    return result;
}

TransferSettings TransferSettings::load()
{
    QSettings settings;
    return load(settings);
}

void TransferSettings::save(QSettings &settings) const
{
    settings.beginGroup("transfers");
    settings.setValue("chunkSize", chunkSize);
    settings.setValue("maxConcurrentJobs", maxConcurrentJobs);
    settings.setValue("queueFileOperations", queueFileOperations);
    settings.setValue("defaultConflictPolicy", QString::fromLatin1(conflictPolicyToString(defaultConflictPolicy)));
    settings.setValue("abortOnFirstError", abortOnFirstError);
    settings.setValue("preservePermissions", preservePermissions);
    settings.endGroup();
}
