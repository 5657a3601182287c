/**
 * @file test_transferengine.cpp
 * @brief Tests for TransferEngine running real jobs in a temporary directory.
 *
 * Tests verify:
 * - Copy, move and delete of files and directory trees
 * - Skip, Overwrite, Rename and AskEachTime conflict handling
 * - Paths reached through linked directories are recognised
 * - Cancellation never leaves partial files behind
 * - Overlapping submissions are rejected while a job is active
 * - Error policies, validation failures and cross-device moves
 * - Subscriber callbacks and engine signals
 */

#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <atomic>
#include <memory>

#include "mocks/mockfilesystem.h"
#include "services/transferengine.h"

class TestTransferEngine : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Copy
    void testCopySingleFile();
    void testCopyDirectoryTree();
    void testCopySymLink();
    void testSnapshotAtVisit();

    // Conflict policies
    void testSkipLeavesDestinationUntouched();
    void testRenameNeverOverwrites();
    void testOverwriteIsIdempotent();
    void testOverwriteMergesDirectories();
    void testAskEachTimeAsksForEveryConflict();
    void testAskEachTimeAllAnswers_data();
    void testAskEachTimeAllAnswers();
    void testOverwriteOntoItselfIsConflictError();
    void testAskEachTimeHoldsBackOnlyConflictingItem();
    void testDeferredMoveRemovesSourceDirectory();

    // Linked paths
    void testMoveThroughLinkedDirectoryIsRejected();
    void testOverwriteThroughLinkedDirectoryIsConflictError();
    void testOverwriteWithLinkToTargetIsConflictError();
    void testCopyIntoLinkedSubdirectoryIsRejected();
    void testLinkedDestinationOverlapsActiveJob();

    // Move
    void testMoveDirectory();
    void testCrossDeviceMoveCopiesThenDeletes();
    void testMoveFallsBackWhenRenameFails();
    void testMoveKeepsSourceOfFailedFile();

    // Delete
    void testDeleteTree();
    void testDeleteFailureKeepsParent();

    // Cancellation
    void testCancelLeavesNoPartialFiles();
    void testFailedReadLeavesNoPartialFile();
    void testCancelWhileAwaitingAnswer();
    void testCancelQueuedJob();

    // Scheduling
    void testOverlappingSubmissionRejected();

    // Error policies
    void testAbortOnFirstError();
    void testContinueOnError();

    // Validation
    void testValidationFailures();
    void testSourcesAreNormalized();

    // Observation
    void testSubscriberReceivesEvents();
    void testSubscribeAfterFinish();
    void testEngineSignals();
    void testRemoveFinished();

private:
    std::unique_ptr<TransferEngine> createEngine(const TransferSettings &settings = TransferSettings());
    QString path(const QString &relative) const { return QDir::cleanPath(tempDir_->path() + '/' + relative); }
    void writeFile(const QString &relative, const QByteArray &content);
    QByteArray readFile(const QString &relative) const;
    void makeDir(const QString &relative);
    void waitForQuestions(int expected);
    bool expectRejected(TransferEngine &engine, const TransferRequest &request, ValidationError::Reason reason);

    QTemporaryDir *tempDir_ = nullptr;
    std::shared_ptr<MockFileSystem> fs_;
    std::atomic_int questions_{0};
};

void TestTransferEngine::init()
{
    tempDir_ = new QTemporaryDir();
    QVERIFY(tempDir_->isValid());
    fs_ = std::make_shared<MockFileSystem>();
    questions_ = 0;

    makeDir("src");
    makeDir("dst");
}

void TestTransferEngine::cleanup()
{
    fs_.reset();
    delete tempDir_;
    tempDir_ = nullptr;
}

std::unique_ptr<TransferEngine> TestTransferEngine::createEngine(const TransferSettings &settings)
{
    auto engine = std::make_unique<TransferEngine>(fs_, settings);
    // Emitted on the worker thread; the counter is read from the test thread.
    connect(engine.get(), &TransferEngine::conflictResolutionNeeded,
            [this](quint64, const ConflictInfo &) { ++questions_; });
    return engine;
}

void TestTransferEngine::writeFile(const QString &relative, const QByteArray &content)
{
    QVERIFY(QDir().mkpath(QFileInfo(path(relative)).absolutePath()));
    QFile file(path(relative));
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(content), qint64(content.size()));
}

QByteArray TestTransferEngine::readFile(const QString &relative) const
{
    QFile file(path(relative));
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

void TestTransferEngine::makeDir(const QString &relative)
{
    QVERIFY(QDir().mkpath(path(relative)));
}

void TestTransferEngine::waitForQuestions(int expected)
{
    QTRY_COMPARE_WITH_TIMEOUT(questions_.load(), expected, 10000);
}

bool TestTransferEngine::expectRejected(TransferEngine &engine, const TransferRequest &request,
                                        ValidationError::Reason reason)
{
    ValidationError error;
    const JobHandle handle = engine.submit(request, &error);
    if (handle.isValid()) {
        qWarning() << "Request unexpectedly accepted:" << request.sources << request.destination;
        return false;
    }
    if (error.reason != reason) {
        qWarning() << "Expected" << validationReasonToString(reason) << "got"
                   << validationReasonToString(error.reason) << error.message;
        return false;
    }
    return !error.message.isEmpty();
}

// ========== Copy ==========

void TestTransferEngine::testCopySingleFile()
{
    writeFile("src/a.txt", "0123456789");
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy({path("src/a.txt")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    const ProgressSnapshot snapshot = engine->progress(job);
    QCOMPARE(snapshot.state, JobState::Completed);
    QCOMPARE(snapshot.bytesDone, qint64(10));
    QCOMPARE(snapshot.bytesTotal, qint64(10));
    QCOMPARE(snapshot.filesDone, 1);
    QCOMPARE(snapshot.filesTotal, 1);
    QCOMPARE(snapshot.errorCount, 0);
    QCOMPARE(snapshot.percent(), 100);

    QCOMPARE(readFile("dst/a.txt"), QByteArray("0123456789"));
    QCOMPARE(readFile("src/a.txt"), QByteArray("0123456789"));
}

void TestTransferEngine::testCopyDirectoryTree()
{
    writeFile("src/tree/a.txt", "aaa");
    writeFile("src/tree/.hidden", "h");
    writeFile("src/tree/sub/b.bin", QByteArray(10000, 'b'));
    makeDir("src/tree/empty");

    TransferSettings settings;
    settings.chunkSize = TransferSettings::MinChunkSize;
    auto engine = createEngine(settings);

    const JobHandle job = engine->submit(TransferRequest::copy({path("src/tree")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    const ProgressSnapshot snapshot = engine->progress(job);
    QCOMPARE(snapshot.state, JobState::Completed);
    QCOMPARE(snapshot.filesDone, 3);
    QCOMPARE(snapshot.bytesDone, qint64(10004));

    QCOMPARE(readFile("dst/tree/a.txt"), QByteArray("aaa"));
    QCOMPARE(readFile("dst/tree/.hidden"), QByteArray("h"));
    QCOMPARE(readFile("dst/tree/sub/b.bin"), QByteArray(10000, 'b'));
    QVERIFY(QFileInfo(path("dst/tree/empty")).isDir());
}

void TestTransferEngine::testCopySymLink()
{
    writeFile("src/target.txt", "t");
    QVERIFY(QFile::link(path("src/target.txt"), path("src/link")));
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy({path("src/link")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Completed);
    const FileStat stat = fs_->stat(path("dst/link"));
    QVERIFY(stat.isSymLink);
    QCOMPARE(stat.symLinkTarget, path("src/target.txt"));
}

void TestTransferEngine::testSnapshotAtVisit()
{
    writeFile("src/dir/a.txt", "a");
    const QString late = path("src/dir/z.txt");
    fs_->mockSetReadHook([late](const QString &) {
        QFile file(late);
        if (!file.exists() && file.open(QIODevice::WriteOnly)) {
            file.write("late");
        }
    });
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy({path("src/dir")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    // z.txt appeared after the directory was listed
    QCOMPARE(engine->progress(job).state, JobState::Completed);
    QVERIFY(QFile::exists(path("dst/dir/a.txt")));
    QVERIFY(!QFile::exists(path("dst/dir/z.txt")));
    QVERIFY(QFile::exists(late));
}

// ========== Conflict policies ==========

void TestTransferEngine::testSkipLeavesDestinationUntouched()
{
    writeFile("src/a.txt", "0123456789");
    writeFile("dst/a.txt", "existing!!");
    auto engine = createEngine();

    const JobHandle job = engine->submit(
        TransferRequest::copy({path("src/a.txt")}, path("dst"), ConflictPolicy::Skip));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    const ProgressSnapshot snapshot = engine->progress(job);
    QCOMPARE(snapshot.state, JobState::Completed);
    QCOMPARE(snapshot.bytesDone, qint64(0));
    QCOMPARE(snapshot.errorCount, 0);
    QVERIFY(engine->errors(job).isEmpty());
    QCOMPARE(readFile("dst/a.txt"), QByteArray("existing!!"));
    QCOMPARE(fs_->mockWriteRequests().size(), 0);
}

void TestTransferEngine::testRenameNeverOverwrites()
{
    writeFile("src/a.txt", "new");
    writeFile("dst/a.txt", "old");
    auto engine = createEngine();

    for (int i = 0; i < 2; ++i) {
        const JobHandle job = engine->submit(
            TransferRequest::copy({path("src/a.txt")}, path("dst"), ConflictPolicy::Rename));
        QVERIFY(job.isValid());
        QVERIFY(engine->waitForDone(10000));
        QCOMPARE(engine->progress(job).state, JobState::Completed);
    }

    QCOMPARE(readFile("dst/a.txt"), QByteArray("old"));
    QCOMPARE(readFile("dst/a (2).txt"), QByteArray("new"));
    QCOMPARE(readFile("dst/a (3).txt"), QByteArray("new"));
    QCOMPARE(QDir(path("dst")).entryList(QDir::Files).size(), 3);
}

void TestTransferEngine::testOverwriteIsIdempotent()
{
    writeFile("src/a.txt", "fresh content");
    writeFile("src/b.txt", "b");
    writeFile("dst/a.txt", "stale");
    auto engine = createEngine();

    for (int i = 0; i < 2; ++i) {
        const JobHandle job = engine->submit(TransferRequest::copy(
            {path("src/a.txt"), path("src/b.txt")}, path("dst"), ConflictPolicy::Overwrite));
        QVERIFY(job.isValid());
        QVERIFY(engine->waitForDone(10000));
        QCOMPARE(engine->progress(job).state, JobState::Completed);

        QCOMPARE(readFile("dst/a.txt"), QByteArray("fresh content"));
        QCOMPARE(readFile("dst/b.txt"), QByteArray("b"));
        QCOMPARE(QDir(path("dst")).entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden),
                 QStringList({"a.txt", "b.txt"}));
    }
}

void TestTransferEngine::testOverwriteMergesDirectories()
{
    writeFile("src/dir/a.txt", "new a");
    writeFile("dst/dir/a.txt", "old a");
    writeFile("dst/dir/keep.txt", "keep");
    auto engine = createEngine();

    const JobHandle job = engine->submit(
        TransferRequest::copy({path("src/dir")}, path("dst"), ConflictPolicy::Overwrite));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Completed);
    QCOMPARE(readFile("dst/dir/a.txt"), QByteArray("new a"));
    QCOMPARE(readFile("dst/dir/keep.txt"), QByteArray("keep"));
}

void TestTransferEngine::testAskEachTimeAsksForEveryConflict()
{
    writeFile("src/a.txt", "new a");
    writeFile("src/b.txt", "new b");
    writeFile("dst/a.txt", "old a");
    writeFile("dst/b.txt", "old b");
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy(
        {path("src/a.txt"), path("src/b.txt")}, path("dst"), ConflictPolicy::AskEachTime));
    QVERIFY(job.isValid());

    waitForQuestions(1);
    QVERIFY(engine->progress(job).awaitingAnswer);
    QVERIFY(engine->respondToConflict(job, ConflictResolution::Overwrite));

    waitForQuestions(2);
    QVERIFY(engine->respondToConflict(job, ConflictResolution::Rename));

    QVERIFY(engine->waitForDone(10000));
    QCOMPARE(engine->progress(job).state, JobState::Completed);
    QCOMPARE(readFile("dst/a.txt"), QByteArray("new a"));
    QCOMPARE(readFile("dst/b.txt"), QByteArray("old b"));
    QCOMPARE(readFile("dst/b (2).txt"), QByteArray("new b"));
}

void TestTransferEngine::testAskEachTimeAllAnswers_data()
{
    QTest::addColumn<int>("answer");
    QTest::addColumn<QString>("expectedA");
    QTest::addColumn<QString>("renamedA");

    QTest::newRow("skip all") << int(ConflictResolution::SkipAll) << "old" << "";
    QTest::newRow("overwrite all") << int(ConflictResolution::OverwriteAll) << "new" << "";
    QTest::newRow("rename all") << int(ConflictResolution::RenameAll) << "old" << "new";
}

void TestTransferEngine::testAskEachTimeAllAnswers()
{
    QFETCH(int, answer);
    QFETCH(QString, expectedA);
    QFETCH(QString, renamedA);

    QStringList sources;
    for (const QString &name : {"a.txt", "b.txt", "c.txt"}) {
        writeFile("src/" + name, "new");
        writeFile("dst/" + name, "old");
        sources.append(path("src/" + name));
    }
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy(sources, path("dst"), ConflictPolicy::AskEachTime));
    QVERIFY(job.isValid());

    waitForQuestions(1);
    QVERIFY(engine->respondToConflict(job, static_cast<ConflictResolution>(answer)));
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(questions_.load(), 1);
    QCOMPARE(engine->progress(job).state, JobState::Completed);
    for (const QString &name : {"a.txt", "b.txt", "c.txt"}) {
        QCOMPARE(QString::fromUtf8(readFile("dst/" + name)), expectedA);
    }
    QCOMPARE(QString::fromUtf8(readFile("dst/c (2).txt")), renamedA);
}

void TestTransferEngine::testOverwriteOntoItselfIsConflictError()
{
    writeFile("src/a.txt", "mine");
    auto engine = createEngine();

    const JobHandle job = engine->submit(
        TransferRequest::copy({path("src/a.txt")}, path("src"), ConflictPolicy::AskEachTime));
    QVERIFY(job.isValid());

    waitForQuestions(1);
    QVERIFY(engine->respondToConflict(job, ConflictResolution::Overwrite));
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Failed);
    const QList<TransferError> errors = engine->errors(job);
    QCOMPARE(errors.size(), 1);
    QCOMPARE(errors.first().kind, TransferError::Kind::Conflict);
    QCOMPARE(readFile("src/a.txt"), QByteArray("mine"));
}

void TestTransferEngine::testAskEachTimeHoldsBackOnlyConflictingItem()
{
    writeFile("src/a.txt", "new a");
    writeFile("src/b.txt", "new b");
    writeFile("dst/a.txt", "old a");
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy(
        {path("src/a.txt"), path("src/b.txt")}, path("dst"), ConflictPolicy::AskEachTime));
    QVERIFY(job.isValid());
    waitForQuestions(1);

    // Nobody answers; the other file is copied anyway
    QTRY_COMPARE_WITH_TIMEOUT(readFile("dst/b.txt"), QByteArray("new b"), 10000);
    const ProgressSnapshot waiting = engine->progress(job);
    QCOMPARE(waiting.state, JobState::Running);
    QVERIFY(waiting.awaitingAnswer);
    QCOMPARE(waiting.filesDone, 1);
    QCOMPARE(readFile("dst/a.txt"), QByteArray("old a"));

    QVERIFY(engine->respondToConflict(job, ConflictResolution::Overwrite));
    QVERIFY(engine->waitForDone(10000));

    const ProgressSnapshot done = engine->progress(job);
    QCOMPARE(done.state, JobState::Completed);
    QCOMPARE(done.filesDone, 2);
    QVERIFY(!done.awaitingAnswer);
    QCOMPARE(questions_.load(), 1);
    QCOMPARE(readFile("dst/a.txt"), QByteArray("new a"));
}

void TestTransferEngine::testDeferredMoveRemovesSourceDirectory()
{
    writeFile("src/dir/a.txt", "new a");
    writeFile("src/dir/b.txt", "b");
    writeFile("dst/dir/a.txt", "old a");
    fs_->mockSetSameDevice(false);
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::move(
        {path("src/dir")}, path("dst"), ConflictPolicy::AskEachTime));
    QVERIFY(job.isValid());

    // dst/dir itself conflicts; overwriting merges into it
    waitForQuestions(1);
    QVERIFY(engine->respondToConflict(job, ConflictResolution::Overwrite));

    // a.txt conflicts inside the merge while b.txt moves on
    waitForQuestions(2);
    QTRY_VERIFY_WITH_TIMEOUT(!QFile::exists(path("src/dir/b.txt")), 10000);
    QVERIFY(QFileInfo(path("src/dir")).isDir());
    QVERIFY(engine->respondToConflict(job, ConflictResolution::Overwrite));
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Completed);
    QCOMPARE(readFile("dst/dir/a.txt"), QByteArray("new a"));
    QCOMPARE(readFile("dst/dir/b.txt"), QByteArray("b"));
    QVERIFY(!QFileInfo::exists(path("src/dir")));
}

// ========== Linked paths ==========

void TestTransferEngine::testMoveThroughLinkedDirectoryIsRejected()
{
    writeFile("real/f.txt", "only copy");
    QVERIFY(QFile::link(path("real"), path("link")));
    auto engine = createEngine();

    QVERIFY(expectRejected(*engine,
                           TransferRequest::move({path("link/f.txt")}, path("real"), ConflictPolicy::Overwrite),
                           ValidationError::Reason::SameSourceAndDestination));
    QVERIFY(expectRejected(*engine,
                           TransferRequest::move({path("real/f.txt")}, path("link"), ConflictPolicy::Overwrite),
                           ValidationError::Reason::SameSourceAndDestination));

    QCOMPARE(readFile("real/f.txt"), QByteArray("only copy"));
    QVERIFY(fs_->mockRemoveRequests().isEmpty());
}

void TestTransferEngine::testOverwriteThroughLinkedDirectoryIsConflictError()
{
    writeFile("real/f.txt", "only copy");
    QVERIFY(QFile::link(path("real"), path("link")));
    fs_->mockSetSameDevice(false);
    auto engine = createEngine();

    const JobHandle job = engine->submit(
        TransferRequest::move({path("link/f.txt")}, path("real"), ConflictPolicy::AskEachTime));
    QVERIFY(job.isValid());
    waitForQuestions(1);
    QVERIFY(engine->respondToConflict(job, ConflictResolution::Overwrite));
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Failed);
    QCOMPARE(engine->errors(job).size(), 1);
    QCOMPARE(engine->errors(job).first().kind, TransferError::Kind::Conflict);
    QCOMPARE(readFile("real/f.txt"), QByteArray("only copy"));
    QVERIFY(fs_->mockRemoveRequests().isEmpty());
}

void TestTransferEngine::testOverwriteWithLinkToTargetIsConflictError()
{
    writeFile("dst/f.txt", "only copy");
    QVERIFY(QFile::link(path("dst/f.txt"), path("src/f.txt")));
    auto engine = createEngine();

    const JobHandle job = engine->submit(
        TransferRequest::copy({path("src/f.txt")}, path("dst"), ConflictPolicy::Overwrite));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Failed);
    QCOMPARE(engine->errors(job).first().kind, TransferError::Kind::Conflict);
    QCOMPARE(readFile("dst/f.txt"), QByteArray("only copy"));
    QVERIFY(!fs_->stat(path("dst/f.txt")).isSymLink);
}

void TestTransferEngine::testCopyIntoLinkedSubdirectoryIsRejected()
{
    writeFile("real/d/x.txt", "x");
    QVERIFY(QFile::link(path("real"), path("link")));
    auto engine = createEngine();

    QVERIFY(expectRejected(*engine, TransferRequest::copy({path("real/d")}, path("link/d")),
                           ValidationError::Reason::DestinationInsideSource));
    QVERIFY(expectRejected(*engine, TransferRequest::copy({path("link/d")}, path("real/d")),
                           ValidationError::Reason::DestinationInsideSource));
    QVERIFY(!QFileInfo::exists(path("real/d/d")));
}

void TestTransferEngine::testLinkedDestinationOverlapsActiveJob()
{
    writeFile("src/a.txt", "a");
    writeFile("src/b.txt", "b");
    writeFile("dst/a.txt", "old");
    QVERIFY(QFile::link(path("dst"), path("dst-link")));
    makeDir("elsewhere");
    auto engine = createEngine();

    // Its only item waits for an answer, which keeps the job running
    const JobHandle first = engine->submit(TransferRequest::copy({path("src/a.txt")}, path("dst")));
    QVERIFY(first.isValid());
    waitForQuestions(1);

    ValidationError error;
    QVERIFY(!engine->submit(TransferRequest::copy({path("src/b.txt")}, path("dst-link")), &error).isValid());
    QCOMPARE(error.reason, ValidationError::Reason::OverlappingJob);
    QCOMPARE(error.conflictingJobId, first.id());
    QVERIFY(expectRejected(*engine, TransferRequest::move({path("dst-link/a.txt")}, path("elsewhere")),
                           ValidationError::Reason::OverlappingJob));

    QVERIFY(engine->respondToConflict(first, ConflictResolution::Skip));
    QVERIFY(engine->waitForDone(10000));
    QVERIFY(!QFile::exists(path("dst/b.txt")));
}

// ========== Move ==========

void TestTransferEngine::testMoveDirectory()
{
    writeFile("src/photos/one.jpg", "1111");
    writeFile("src/photos/trip/two.jpg", "22");
    auto engine = createEngine();

    const JobHandle job = engine->submit(
        TransferRequest::move({path("src/photos")}, path("dst"), ConflictPolicy::Skip));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    const ProgressSnapshot snapshot = engine->progress(job);
    QCOMPARE(snapshot.state, JobState::Completed);
    QCOMPARE(snapshot.filesDone, 2);
    QCOMPARE(snapshot.bytesDone, qint64(6));
    QCOMPARE(readFile("dst/photos/one.jpg"), QByteArray("1111"));
    QCOMPARE(readFile("dst/photos/trip/two.jpg"), QByteArray("22"));
    QVERIFY(!QFileInfo::exists(path("src/photos")));
}

void TestTransferEngine::testCrossDeviceMoveCopiesThenDeletes()
{
    writeFile("src/dir/a.txt", "a");
    writeFile("src/dir/sub/b.txt", "bb");
    fs_->mockSetSameDevice(false);
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::move({path("src/dir")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Completed);
    QVERIFY(fs_->mockRenameRequests().isEmpty());
    QCOMPARE(readFile("dst/dir/a.txt"), QByteArray("a"));
    QCOMPARE(readFile("dst/dir/sub/b.txt"), QByteArray("bb"));
    QVERIFY(!QFileInfo::exists(path("src/dir")));
}

void TestTransferEngine::testMoveFallsBackWhenRenameFails()
{
    writeFile("src/a.txt", "content");
    fs_->mockSetSameDevice(true);
    fs_->mockFailAllRenames(true);
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::move({path("src/a.txt")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Completed);
    QCOMPARE(fs_->mockRenameRequests().size(), 1);
    QCOMPARE(readFile("dst/a.txt"), QByteArray("content"));
    QVERIFY(!QFile::exists(path("src/a.txt")));
}

void TestTransferEngine::testMoveKeepsSourceOfFailedFile()
{
    writeFile("src/dir/a.txt", "a");
    writeFile("src/dir/b.txt", "b");
    fs_->mockSetSameDevice(false);
    fs_->mockFailOpenForWrite(path("dst/dir/b.txt"));
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::move({path("src/dir")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Failed);
    QCOMPARE(engine->errors(job).size(), 1);
    QCOMPARE(engine->errors(job).first().path, path("dst/dir/b.txt"));

    QCOMPARE(readFile("dst/dir/a.txt"), QByteArray("a"));
    QVERIFY(!QFile::exists(path("src/dir/a.txt")));
    QVERIFY(!QFile::exists(path("dst/dir/b.txt")));
    QCOMPARE(readFile("src/dir/b.txt"), QByteArray("b"));
}

// ========== Delete ==========

void TestTransferEngine::testDeleteTree()
{
    writeFile("src/old/a.txt", "a");
    writeFile("src/old/deep/er/b.txt", "b");
    writeFile("src/loose.txt", "l");
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::remove({path("src/old"), path("src/loose.txt")}));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    const ProgressSnapshot snapshot = engine->progress(job);
    QCOMPARE(snapshot.state, JobState::Completed);
    QCOMPARE(snapshot.filesDone, 3);
    QCOMPARE(snapshot.filesTotal, 3);
    QVERIFY(!QFileInfo::exists(path("src/old")));
    QVERIFY(!QFileInfo::exists(path("src/loose.txt")));
    QVERIFY(QFileInfo(path("src")).isDir());
}

void TestTransferEngine::testDeleteFailureKeepsParent()
{
    writeFile("src/dir/a.txt", "a");
    writeFile("src/dir/b.txt", "b");
    fs_->mockFailRemove(path("src/dir/a.txt"));
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::remove({path("src/dir")}));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Failed);
    QCOMPARE(engine->errors(job).size(), 1);
    QVERIFY(QFile::exists(path("src/dir/a.txt")));
    QVERIFY(!QFile::exists(path("src/dir/b.txt")));
}

// ========== Cancellation ==========

void TestTransferEngine::testCancelLeavesNoPartialFiles()
{
    const QByteArray big(512 * 1024, 'x');
    writeFile("src/1-big.bin", big);
    writeFile("src/2-second.bin", "second");

    TransferSettings settings;
    settings.chunkSize = TransferSettings::MinChunkSize;
    auto engine = createEngine(settings);

    // Cancel as soon as the first file is opened; the checkpoint comes after it.
    TransferEngine *raw = engine.get();
    fs_->mockSetReadHook([raw](const QString &) { raw->cancelAll(); });

    const JobHandle job = engine->submit(
        TransferRequest::copy({path("src/1-big.bin"), path("src/2-second.bin")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Cancelled);
    QVERIFY(engine->errors(job).isEmpty());

    // Whatever is in the destination is complete
    const QStringList entries = QDir(path("dst")).entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden);
    QCOMPARE(entries, QStringList({"1-big.bin"}));
    QCOMPARE(readFile("dst/1-big.bin"), big);
}

void TestTransferEngine::testFailedReadLeavesNoPartialFile()
{
    writeFile("src/a.bin", QByteArray(64 * 1024, 'a'));
    writeFile("dst/a.bin", "previous");
    fs_->mockFailReadAfter(path("src/a.bin"), 20000);

    TransferSettings settings;
    settings.chunkSize = TransferSettings::MinChunkSize;
    auto engine = createEngine(settings);

    const JobHandle job = engine->submit(
        TransferRequest::copy({path("src/a.bin")}, path("dst"), ConflictPolicy::Overwrite));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    const ProgressSnapshot snapshot = engine->progress(job);
    QCOMPARE(snapshot.state, JobState::Failed);
    QCOMPARE(snapshot.bytesDone, qint64(0));
    QCOMPARE(snapshot.errorCount, 1);
    QCOMPARE(readFile("dst/a.bin"), QByteArray("previous"));
    QCOMPARE(QDir(path("dst")).entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden),
             QStringList({"a.bin"}));
}

void TestTransferEngine::testCancelWhileAwaitingAnswer()
{
    writeFile("src/a.txt", "new");
    writeFile("dst/a.txt", "old");
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy({path("src/a.txt")}, path("dst")));
    QVERIFY(job.isValid());
    waitForQuestions(1);

    QVERIFY(engine->cancel(job));
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Cancelled);
    QVERIFY(!engine->progress(job).awaitingAnswer);
    QCOMPARE(readFile("dst/a.txt"), QByteArray("old"));
    QVERIFY(!engine->cancel(job));
}

void TestTransferEngine::testCancelQueuedJob()
{
    writeFile("src/a.txt", "a");
    writeFile("src/b.txt", "b");
    writeFile("dst/a.txt", "old");
    makeDir("other");

    TransferSettings settings;
    settings.queueFileOperations = true;
    auto engine = createEngine(settings);
    QSignalSpy finishedSpy(engine.get(), &TransferEngine::jobFinished);

    // The first job occupies the only worker until it gets an answer
    const JobHandle first = engine->submit(TransferRequest::copy({path("src/a.txt")}, path("dst")));
    QVERIFY(first.isValid());
    waitForQuestions(1);

    const JobHandle second = engine->submit(TransferRequest::copy({path("src/b.txt")}, path("other")));
    QVERIFY(second.isValid());
    QCOMPARE(engine->progress(second).state, JobState::Queued);
    QCOMPARE(engine->activeJobCount(), 2);

    QVERIFY(engine->cancel(second));
    QCOMPARE(engine->progress(second).state, JobState::Cancelled);
    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(finishedSpy.at(0).at(0).toULongLong(), second.id());

    QVERIFY(engine->respondToConflict(first, ConflictResolution::Skip));
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(first).state, JobState::Completed);
    QCOMPARE(engine->progress(second).state, JobState::Cancelled);
    QVERIFY(!QFile::exists(path("other/b.txt")));
    QCOMPARE(finishedSpy.count(), 2);
}

// ========== Scheduling ==========

void TestTransferEngine::testOverlappingSubmissionRejected()
{
    writeFile("src/a.txt", "a");
    writeFile("src/b.txt", "b");
    writeFile("dst/a.txt", "old");
    makeDir("dst/sub");
    makeDir("elsewhere");
    auto engine = createEngine();

    // Its only item waits for an answer, which keeps the job running
    const JobHandle first = engine->submit(TransferRequest::copy({path("src/a.txt")}, path("dst")));
    QVERIFY(first.isValid());
    waitForQuestions(1);
    QCOMPARE(engine->progress(first).state, JobState::Running);

    ValidationError error;
    QVERIFY(!engine->submit(TransferRequest::copy({path("src/b.txt")}, path("dst")), &error).isValid());
    QCOMPARE(error.reason, ValidationError::Reason::OverlappingJob);
    QCOMPARE(error.conflictingJobId, first.id());

    QVERIFY(expectRejected(*engine, TransferRequest::copy({path("src/b.txt")}, path("dst/sub")),
                           ValidationError::Reason::OverlappingJob));
    QVERIFY(expectRejected(*engine, TransferRequest::remove({path("dst/a.txt")}),
                           ValidationError::Reason::OverlappingJob));
    QVERIFY(expectRejected(*engine, TransferRequest::move({path("dst")}, path("elsewhere")),
                           ValidationError::Reason::OverlappingJob));

    // Disjoint write sets run side by side
    const JobHandle disjoint = engine->submit(TransferRequest::copy({path("src/b.txt")}, path("elsewhere")));
    QVERIFY(disjoint.isValid());

    QVERIFY(engine->respondToConflict(first, ConflictResolution::Skip));
    QVERIFY(engine->waitForDone(10000));

    // Once the first job is done the destination is free again
    const JobHandle retry = engine->submit(TransferRequest::copy({path("src/b.txt")}, path("dst")));
    QVERIFY(retry.isValid());
    QVERIFY(engine->waitForDone(10000));
    QCOMPARE(engine->progress(retry).state, JobState::Completed);
    QCOMPARE(readFile("dst/b.txt"), QByteArray("b"));
}

// ========== Error policies ==========

void TestTransferEngine::testAbortOnFirstError()
{
    writeFile("src/a.txt", "a");
    writeFile("src/b.txt", "b");
    writeFile("src/c.txt", "c");
    fs_->mockFailOpenForWrite(path("dst/b.txt"));
    auto engine = createEngine();

    TransferRequest request = TransferRequest::copy(
        {path("src/a.txt"), path("src/b.txt"), path("src/c.txt")}, path("dst"));
    request.errorPolicy = ErrorPolicy::AbortOnFirstError;
    const JobHandle job = engine->submit(request);
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(engine->progress(job).state, JobState::Failed);
    QCOMPARE(engine->errors(job).size(), 1);
    QVERIFY(QFile::exists(path("dst/a.txt")));
    QVERIFY(!QFile::exists(path("dst/b.txt")));
    QVERIFY(!QFile::exists(path("dst/c.txt")));
}

void TestTransferEngine::testContinueOnError()
{
    writeFile("src/a.txt", "a");
    writeFile("src/b.txt", "b");
    writeFile("src/c.txt", "c");
    fs_->mockFailOpenForRead(path("src/b.txt"));
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy(
        {path("src/a.txt"), path("src/b.txt"), path("src/c.txt")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    const ProgressSnapshot snapshot = engine->progress(job);
    QCOMPARE(snapshot.state, JobState::Failed);
    QCOMPARE(snapshot.filesDone, 2);
    QCOMPARE(snapshot.filesTotal, 2);
    QCOMPARE(engine->errors(job).size(), 1);
    QCOMPARE(engine->errors(job).first().kind, TransferError::Kind::IO);
    QVERIFY(QFile::exists(path("dst/a.txt")));
    QVERIFY(!QFile::exists(path("dst/b.txt")));
    QVERIFY(QFile::exists(path("dst/c.txt")));
}

// ========== Validation ==========

void TestTransferEngine::testValidationFailures()
{
    writeFile("src/a.txt", "a");
    writeFile("src/dir/x.txt", "x");
    makeDir("src/dir/sub");
    makeDir("locked");
    makeDir("readonly-parent");
    writeFile("readonly-parent/f.txt", "f");
    fs_->mockSetWritable(path("locked"), false);
    fs_->mockSetWritable(path("readonly-parent"), false);
    auto engine = createEngine();

    QVERIFY(expectRejected(*engine, TransferRequest::copy({}, path("dst")),
                           ValidationError::Reason::EmptySources));
    QVERIFY(expectRejected(*engine, TransferRequest::copy({path("src/nope")}, path("dst")),
                           ValidationError::Reason::MissingSource));
    QVERIFY(expectRejected(*engine, TransferRequest::copy({path("src/a.txt")}, QString()),
                           ValidationError::Reason::MissingDestination));
    QVERIFY(expectRejected(*engine, TransferRequest::copy({path("src/a.txt")}, path("missing")),
                           ValidationError::Reason::MissingDestination));
    QVERIFY(expectRejected(*engine, TransferRequest::copy({path("src/dir")}, path("src/a.txt")),
                           ValidationError::Reason::DestinationNotDirectory));
    QVERIFY(expectRejected(*engine, TransferRequest::copy({path("src/a.txt")}, path("locked")),
                           ValidationError::Reason::DestinationNotWritable));
    QVERIFY(expectRejected(*engine, TransferRequest::copy({path("src/dir")}, path("src/dir/sub")),
                           ValidationError::Reason::DestinationInsideSource));
    QVERIFY(expectRejected(*engine, TransferRequest::move({path("src/dir")}, path("src/dir")),
                           ValidationError::Reason::DestinationInsideSource));
    QVERIFY(expectRejected(*engine,
                           TransferRequest::copy({path("src/a.txt")}, path("src"), ConflictPolicy::Overwrite),
                           ValidationError::Reason::SameSourceAndDestination));
    QVERIFY(expectRejected(*engine, TransferRequest::move({path("readonly-parent/f.txt")}, path("dst")),
                           ValidationError::Reason::SourceParentNotWritable));
    QVERIFY(expectRejected(*engine, TransferRequest::remove({path("readonly-parent/f.txt")}),
                           ValidationError::Reason::SourceParentNotWritable));

    // Nothing was scheduled
    QVERIFY(engine->jobs().isEmpty());
    QVERIFY(fs_->mockWriteRequests().isEmpty());
}

void TestTransferEngine::testSourcesAreNormalized()
{
    writeFile("src/a.txt", "a");
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy(
        {path("src/a.txt"), tempDir_->path() + "/src/./a.txt"}, tempDir_->path() + "/dst/"));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    const ProgressSnapshot snapshot = engine->progress(job);
    QCOMPARE(snapshot.state, JobState::Completed);
    QCOMPARE(snapshot.filesDone, 1);
    QCOMPARE(readFile("dst/a.txt"), QByteArray("a"));
}

// ========== Observation ==========

void TestTransferEngine::testSubscriberReceivesEvents()
{
    writeFile("src/a.txt", "a");
    writeFile("src/b.txt", "b");
    writeFile("src/c.txt", "c");
    writeFile("dst/a.txt", "old");
    makeDir("other");
    fs_->mockFailOpenForWrite(path("other/b.txt"));

    TransferSettings settings;
    settings.queueFileOperations = true;
    auto engine = createEngine(settings);

    // Hold the single worker so the second job cannot start before we subscribe
    const JobHandle blocker = engine->submit(TransferRequest::copy({path("src/a.txt")}, path("dst")));
    QVERIFY(blocker.isValid());
    waitForQuestions(1);

    const JobHandle job = engine->submit(
        TransferRequest::copy({path("src/b.txt"), path("src/c.txt")}, path("other")));
    QVERIFY(job.isValid());

    QMutex mutex;
    QList<JobEvent> events;
    QVERIFY(engine->subscribe(job, [&mutex, &events](const JobEvent &event) {
        QMutexLocker lock(&mutex);
        events.append(event);
    }));
    QVERIFY(!engine->subscribe(JobHandle(999), [](const JobEvent &) {}));

    QVERIFY(engine->respondToConflict(blocker, ConflictResolution::Skip));
    QVERIFY(engine->waitForDone(10000));

    QMutexLocker lock(&mutex);
    QVERIFY(events.size() >= 3);

    int failures = 0;
    int finished = 0;
    for (const JobEvent &event : events) {
        QCOMPARE(event.snapshot.jobId, job.id());
        if (event.type == JobEvent::Type::ItemFailed) {
            ++failures;
            QCOMPARE(event.error.path, path("other/b.txt"));
        } else if (event.type == JobEvent::Type::Finished) {
            ++finished;
        }
    }
    QCOMPARE(failures, 1);
    QCOMPARE(finished, 1);
    QCOMPARE(events.last().type, JobEvent::Type::Finished);
    QCOMPARE(events.last().snapshot.state, JobState::Failed);
    QCOMPARE(events.last().snapshot.filesDone, 1);
}

void TestTransferEngine::testSubscribeAfterFinish()
{
    writeFile("src/a.txt", "a");
    auto engine = createEngine();

    const JobHandle job = engine->submit(TransferRequest::copy({path("src/a.txt")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    // Delivered immediately on this thread
    QList<JobEvent> events;
    QVERIFY(engine->subscribe(job, [&events](const JobEvent &event) { events.append(event); }));
    QCOMPARE(events.size(), 1);
    QCOMPARE(events.first().type, JobEvent::Type::Finished);
    QCOMPARE(events.first().snapshot.state, JobState::Completed);
}

void TestTransferEngine::testEngineSignals()
{
    writeFile("src/a.txt", "a");
    auto engine = createEngine();
    QSignalSpy queuedSpy(engine.get(), &TransferEngine::jobQueued);
    QSignalSpy startedSpy(engine.get(), &TransferEngine::jobStarted);
    QSignalSpy progressSpy(engine.get(), &TransferEngine::jobProgress);
    QSignalSpy finishedSpy(engine.get(), &TransferEngine::jobFinished);
    QSignalSpy failedSpy(engine.get(), &TransferEngine::itemFailed);

    const JobHandle job = engine->submit(TransferRequest::copy({path("src/a.txt")}, path("dst")));
    QVERIFY(job.isValid());
    QVERIFY(engine->waitForDone(10000));

    QCOMPARE(queuedSpy.count(), 1);
    QCOMPARE(queuedSpy.at(0).at(0).toULongLong(), job.id());
    QCOMPARE(startedSpy.count(), 1);
    QVERIFY(progressSpy.count() > 0);
    QCOMPARE(failedSpy.count(), 0);
    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(finishedSpy.at(0).at(0).toULongLong(), job.id());
    QCOMPARE(finishedSpy.at(0).at(1).value<JobState>(), JobState::Completed);
}

void TestTransferEngine::testRemoveFinished()
{
    writeFile("src/a.txt", "a");
    auto engine = createEngine();

    const JobHandle first = engine->submit(TransferRequest::copy({path("src/a.txt")}, path("dst")));
    QVERIFY(first.isValid());
    QVERIFY(engine->waitForDone(10000));
    QCOMPARE(engine->jobs().size(), 1);
    QCOMPARE(engine->activeJobCount(), 0);

    QCOMPARE(engine->removeFinished(), 1);
    QVERIFY(engine->jobs().isEmpty());
    QVERIFY(!engine->progress(first).isValid());

    // Ids are never reused
    const JobHandle second = engine->submit(
        TransferRequest::copy({path("src/a.txt")}, path("dst"), ConflictPolicy::Overwrite));
    QVERIFY(second.isValid());
    QVERIFY(second.id() > first.id());
    QVERIFY(engine->waitForDone(10000));
}

QTEST_MAIN(TestTransferEngine)
#include "test_transferengine.moc"
