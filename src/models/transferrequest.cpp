#include "transferrequest.h"

#include "utils/pathutils.h"

#include <QDir>

const char* operationTypeToString(OperationType type)
{
    switch (type) {
        case OperationType::Copy: return "Copy";
        case OperationType::Move: return "Move";
        case OperationType::Delete: return "Delete";
    }
    return "Unknown";
}

const char* conflictPolicyToString(ConflictPolicy policy)
{
    switch (policy) {
        case ConflictPolicy::Skip: return "skip";
        case ConflictPolicy::Overwrite: return "overwrite";
        case ConflictPolicy::Rename: return "rename";
        case ConflictPolicy::AskEachTime: return "ask";
    }
    return "unknown";
}

const char* conflictResolutionToString(ConflictResolution resolution)
{
    switch (resolution) {
        case ConflictResolution::Skip: return "Skip";
        case ConflictResolution::SkipAll: return "SkipAll";
        case ConflictResolution::Overwrite: return "Overwrite";
        case ConflictResolution::OverwriteAll: return "OverwriteAll";
        case ConflictResolution::Rename: return "Rename";
        case ConflictResolution::RenameAll: return "RenameAll";
        case ConflictResolution::Cancel: return "Cancel";
    }
    return "Unknown";
}

ConflictPolicy conflictPolicyFromString(const QString &text, bool *ok)
{
    const QString key = text.trimmed().toLower();
    if (ok) {
        *ok = true;
    }
    if (key == QLatin1String("skip")) {
        return ConflictPolicy::Skip;
    }
    if (key == QLatin1String("overwrite")) {
        return ConflictPolicy::Overwrite;
    }
    if (key == QLatin1String("rename")) {
        return ConflictPolicy::Rename;
    }
    if (key == QLatin1String("ask")) {
        return ConflictPolicy::AskEachTime;
    }
    if (ok) {
        *ok = false;
    }
    return ConflictPolicy::AskEachTime;
}

QStringList PaneContext::selectedPaths() const
{
    QStringList paths;
    paths.reserve(selection.size());
    const QDir dir(currentDirectory);
    for (const QString &entry : selection) {
        if (entry.isEmpty()) {
            continue;
        }
        paths.append(PathUtils::normalize(dir.absoluteFilePath(entry)));
    }
    return paths;
}

TransferRequest TransferRequest::copy(const QStringList &sources,
                                      const QString &destination,
                                      ConflictPolicy policy)
{
    TransferRequest request;
    request.operation = OperationType::Copy;
    request.sources = sources;
    request.destination = destination;
    request.conflictPolicy = policy;
    return request;
}

TransferRequest TransferRequest::move(const QStringList &sources,
                                      const QString &destination,
                                      ConflictPolicy policy)
{
    TransferRequest request = copy(sources, destination, policy);
    request.operation = OperationType::Move;
    return request;
}

TransferRequest TransferRequest::remove(const QStringList &sources)
{
    TransferRequest request;
    request.operation = OperationType::Delete;
    request.sources = sources;
    return request;
}

TransferRequest TransferRequest::fromPanes(OperationType operation,
                                           const PaneContext &source,
                                           const PaneContext &target,
                                           ConflictPolicy policy)
{
    TransferRequest request;
    request.operation = operation;
    request.sources = source.selectedPaths();
    if (operation != OperationType::Delete) {
        request.destination = PathUtils::normalize(target.currentDirectory);
    }
    request.conflictPolicy = policy;
    return request;
}
