#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QElapsedTimer>
#include <QDir>
#include <QFileInfo>
#include <functional>
#include <memory>

#include "../src/log_manager.h"
#include "../src/session_controller.h"
#include "../src/user_prompter.h"
#include "fake_process_runner.h"

namespace {

const QString kEncoder = QStringLiteral("/fake/cjxl");
const QString kSanitizer = QStringLiteral("/fake/magick");

class FakePrompter : public UserPrompter {
public:
    QList<bool> confirmAnswers;
    QStringList questions;
    QStringList textAnswers;  // empty: the dialog is cancelled
    QStringList labels;
    std::function<void()> onConfirm;  // runs before the answer is given

    bool confirm(const QString& question) override
    {
        questions << question;
        if (onConfirm) onConfirm();
        return confirmAnswers.isEmpty() ? false : confirmAnswers.takeFirst();
    }

    bool promptText(const QString& label, const QString& initialValue, QString& value) override
    {
        Q_UNUSED(initialValue);
        labels << label;
        if (textAnswers.isEmpty()) return false;
        value = textAnswers.takeFirst();
        return true;
    }
};

ToolPaths fakeTools(bool withSanitizer = true)
{
    ToolPaths t;
    t.encoder = kEncoder;
    if (withSanitizer) t.sanitizer = kSanitizer;
    return t;
}

bool pollUntilFinished(SessionController& c, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        if (c.poll()) return true;
        QTest::qWait(10);
    }
    return false;
}

} // namespace

class TestSessionController : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testEncoderMissingRejected();
    void testEmptySelectionRejected();
    void testAlreadyActiveRejected();
    void testDeleteOriginalsDeclined();
    void testBatchWithFailuresRetryDeclined();
    void testSanitizeRetryAccepted();
    void testNoSanitizerWarns();
    void testTargetsUniqueWithinBatch();
    void testUnresolvableOutputDirectory();
    void testSeveralUnresolvableCounted();
    void testRetryIncludesPreviouslyUnqueueable();
    void testShutdownDiscardsQueuedTasks();
    void testReloadRejectedWhileActive();
    void testFailedFilter();
    void testEditQualityAndEffort();
    void testEditOutputDir();
    void testToggleDebugLogging();

private:
    void makeImages(const QStringList& names);
    std::unique_ptr<SessionController> makeController(const ToolPaths& tools, const ConverterSettings& settings = ConverterSettings());

    QTemporaryDir* m_dir = nullptr;
    std::shared_ptr<FakeProcessRunner> m_runner;
    FakePrompter m_prompter;
};

void TestSessionController::initTestCase()
{
    qRegisterMetaType<SessionController::MessageLevel>();
}

void TestSessionController::init()
{
    m_dir = new QTemporaryDir;
    QVERIFY(m_dir->isValid());
    m_runner = std::make_shared<FakeProcessRunner>();
    m_runner->sanitizerProgram = kSanitizer;
    m_prompter = FakePrompter();
    LogManager::instance().setLogFilePath(m_dir->filePath("debug.txt"));
}

void TestSessionController::cleanup()
{
    LogManager::instance().setFileLoggingEnabled(false);
    delete m_dir;
    m_dir = nullptr;
}

void TestSessionController::makeImages(const QStringList& names)
{
    for (const QString& n : names) QVERIFY(FakeProcessRunner::writeFile(m_dir->filePath(n), 4000));
}

std::unique_ptr<SessionController> TestSessionController::makeController(const ToolPaths& tools, const ConverterSettings& settings)
{
    std::unique_ptr<SessionController> c(new SessionController(m_dir->path(), settings, tools, m_runner, &m_prompter));
    c->setWorkerPollIntervalMs(20);
    return c;
}

void TestSessionController::testEncoderMissingRejected()
{
    makeImages({"a.png"});
    auto c = makeController(ToolPaths());
    c->selection().toggle(0);
    QVERIFY(!c->startBatch());
    QCOMPARE(c->lastMessage(), QString("cjxl command not found in PATH."));
    QVERIFY(c->lastMessageLevel() == SessionController::MessageLevel::Error);
    QVERIFY(!c->isWorkerRunning());
    QVERIFY(c->aggregator().record(0).status == ConversionStatus::Pending);
}

void TestSessionController::testEmptySelectionRejected()
{
    makeImages({"a.png"});
    auto c = makeController(fakeTools());
    QSignalSpy spy(c.get(), &SessionController::messagePosted);
    QVERIFY(!c->startBatch());
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("No files selected to convert."));
    QCOMPARE(c->pendingTaskCount(), 0);
}

void TestSessionController::testAlreadyActiveRejected()
{
    makeImages({"a.png", "b.png"});
    auto c = makeController(fakeTools());
    c->selection().selectAll(c->visibleIndices());
    QVERIFY(c->startBatch());
    QVERIFY(c->isBatchActive());
    // completion is only noticed by poll(), so the batch is still active here
    QVERIFY(!c->startBatch());
    QCOMPARE(c->lastMessage(), QString("A conversion is already in progress."));
    QVERIFY(pollUntilFinished(*c));
    QCOMPARE(c->aggregator().batch().successCount, 2);
}

void TestSessionController::testDeleteOriginalsDeclined()
{
    makeImages({"a.png"});
    ConverterSettings s;
    s.deleteOriginals = true;
    auto c = makeController(fakeTools(), s);
    c->selection().toggle(0);
    m_prompter.confirmAnswers << false;
    QVERIFY(!c->startBatch());
    QCOMPARE(m_prompter.questions, QStringList({"Delete originals is ON. Proceed? (y/n)"}));
    QCOMPARE(c->lastMessage(), QString("Conversion cancelled."));
    QVERIFY(!c->isBatchActive());
    QVERIFY(c->aggregator().record(0).status == ConversionStatus::Pending);
}

void TestSessionController::testBatchWithFailuresRetryDeclined()
{
    makeImages({"a.png", "b.png", "c.png", "d.png", "e.png"});
    m_runner->failInputs = {"b.png", "d.png"};
    auto c = makeController(fakeTools());
    c->selection().selectAll(c->visibleIndices());
    QVERIFY(c->startBatch());
    for (int i = 0; i < 5; ++i) QVERIFY(c->aggregator().record(i).status != ConversionStatus::Pending);

    m_prompter.confirmAnswers << false;
    QVERIFY(pollUntilFinished(*c));
    QVERIFY(!c->isBatchActive());
    QCOMPARE(c->aggregator().batch().successCount, 3);
    QCOMPARE(c->aggregator().batch().failedCount, 2);
    QCOMPARE(c->aggregator().failedIndices(), QSet<int>({1, 3}));
    QCOMPARE(m_prompter.questions, QStringList({"2 files failed. Sanitize & retry them now? (y/n)"}));
    QVERIFY(c->lastMessage().startsWith("Finished 5 files in "));
    QVERIFY(c->aggregator().lastSummary().startsWith("Finished: 5 files | Total Saved: "));
    QCOMPARE(c->aggregator().record(1).infoStr, QString("Error: bad input"));
    QCOMPARE(m_runner->callCount(kSanitizer), 0);

    // the next poll does not report completion again
    QVERIFY(!c->poll());
}

void TestSessionController::testSanitizeRetryAccepted()
{
    makeImages({"a.png", "b.png", "c.png", "d.png", "e.png"});
    m_runner->failInputs = {"b.png", "d.png"};
    auto c = makeController(fakeTools());
    c->selection().selectAll(c->visibleIndices());
    QVERIFY(c->startBatch());

    m_prompter.confirmAnswers << true;
    QVERIFY(pollUntilFinished(*c));
    // the retry batch started from inside poll()
    QVERIFY(c->isBatchActive());
    QCOMPARE(c->lastMessage(), QString("Re-queueing failed files for sanitized conversion..."));
    QCOMPARE(c->selection().selection(), QSet<int>({1, 3}));
    QCOMPARE(c->aggregator().batch().failedCount, 0);
    QCOMPARE(c->aggregator().batch().totalSelected, 5);

    QVERIFY(pollUntilFinished(*c));
    QVERIFY(!c->isBatchActive());
    QCOMPARE(c->aggregator().batch().successCount, 5);
    QCOMPARE(c->aggregator().batch().failedCount, 0);
    QVERIFY(c->aggregator().failedIndices().isEmpty());
    QCOMPARE(m_runner->callCount(kSanitizer), 2);
    QVERIFY(c->aggregator().record(1).status == ConversionStatus::Success);
    QCOMPARE(m_prompter.questions.size(), 1);
}

void TestSessionController::testNoSanitizerWarns()
{
    makeImages({"a.png", "b.png"});
    m_runner->failInputs = {"a.png"};
    auto c = makeController(fakeTools(false));
    c->selection().selectAll(c->visibleIndices());
    QVERIFY(c->startBatch());
    QVERIFY(pollUntilFinished(*c));
    QCOMPARE(c->lastMessage(), QString("Some files failed. Install ImageMagick to enable sanitize/retry."));
    QVERIFY(c->lastMessageLevel() == SessionController::MessageLevel::Warning);
    QVERIFY(m_prompter.questions.isEmpty());
}

void TestSessionController::testTargetsUniqueWithinBatch()
{
    makeImages({"photo.jpg", "photo.png", "other.gif"});
    auto c = makeController(fakeTools());
    // before queuing the row shows <stem>.jxl
    QCOMPARE(c->targetName(1), QString("photo.jxl"));
    QCOMPARE(c->targetName(2), QString("photo.jxl"));

    c->selection().selectAll(c->visibleIndices());
    QVERIFY(c->startBatch());
    QCOMPARE(c->targetName(0), QString("other.jxl"));
    QCOMPARE(c->targetName(1), QString("photo.jxl"));
    QCOMPARE(c->targetName(2), QString("photo-1.jxl"));
    QVERIFY(pollUntilFinished(*c));
    QVERIFY(QFileInfo::exists(m_dir->filePath("photo-1.jxl")));
}

void TestSessionController::testUnresolvableOutputDirectory()
{
    makeImages({"a.png"});
    QVERIFY(FakeProcessRunner::writeFile(m_dir->filePath("blocker"), 1));
    ConverterSettings s;
    s.outputDir = m_dir->filePath("blocker/out");
    auto c = makeController(fakeTools(), s);
    c->selection().toggle(0);
    QVERIFY(!c->startBatch());
    QVERIFY(!c->isBatchActive());
    QVERIFY(c->lastMessage().startsWith("Cannot create output directory: "));
    QVERIFY(c->aggregator().record(0).status == ConversionStatus::Failed);
    QVERIFY(c->aggregator().failedIndices().contains(0));
    QVERIFY(!c->isWorkerRunning());
}

void TestSessionController::testSeveralUnresolvableCounted()
{
    makeImages({"a.png", "b.png"});
    QVERIFY(FakeProcessRunner::writeFile(m_dir->filePath("blocker"), 1));
    ConverterSettings s;
    s.outputDir = m_dir->filePath("blocker/out");
    auto c = makeController(fakeTools(), s);
    c->selection().selectAll(c->visibleIndices());
    QVERIFY(!c->startBatch());
    QVERIFY(c->lastMessage().startsWith("2 files could not be queued: Cannot create output directory: "));
    QVERIFY(c->lastMessageLevel() == SessionController::MessageLevel::Error);
    QCOMPARE(c->aggregator().failedIndices(), QSet<int>({0, 1}));
}

void TestSessionController::testRetryIncludesPreviouslyUnqueueable()
{
    QVERIFY(QDir(m_dir->path()).mkpath("sub"));
    QVERIFY(QDir(m_dir->path()).mkpath("out"));
    makeImages({"a.png", "b.png", "sub/c.png"});
    // a file where the mirrored sub-directory should go
    const QString blocker = m_dir->filePath("out/sub");
    QVERIFY(FakeProcessRunner::writeFile(blocker, 1));
    m_runner->failInputs = {"a.png"};

    ConverterSettings s;
    s.recursive = true;
    s.outputDir = m_dir->filePath("out");
    auto c = makeController(fakeTools(), s);
    QCOMPARE(c->inventory().size(), 3);
    QCOMPARE(c->inventory().at(2).fileName, QString("c.png"));
    c->selection().selectAll(c->visibleIndices());
    QVERIFY(c->startBatch());
    QVERIFY(c->lastMessage().startsWith("Cannot create output directory: "));
    QVERIFY(c->lastMessageLevel() == SessionController::MessageLevel::Warning);
    QCOMPARE(c->aggregator().batch().totalSelected, 2);

    m_prompter.onConfirm = [blocker]() { QFile::remove(blocker); };
    m_prompter.confirmAnswers << true;
    QVERIFY(pollUntilFinished(*c));
    QCOMPARE(m_prompter.questions, QStringList({"2 files failed. Sanitize & retry them now? (y/n)"}));
    QVERIFY(c->isBatchActive());
    QCOMPARE(c->aggregator().batch().failedCount, 0);
    QCOMPARE(c->aggregator().batch().totalSelected, 3);

    QVERIFY(pollUntilFinished(*c));
    QVERIFY(!c->isBatchActive());
    QCOMPARE(c->aggregator().batch().successCount, 3);
    QCOMPARE(c->aggregator().batch().failedCount, 0);
    QCOMPARE(c->aggregator().batch().totalSelected, 3);
    QCOMPARE(c->pendingTaskCount(), 0);
    QVERIFY(c->aggregator().failedIndices().isEmpty());
    QVERIFY(c->aggregator().record(2).status == ConversionStatus::Success);
    QVERIFY(QFileInfo::exists(m_dir->filePath("out/sub/c.jxl")));
    QCOMPARE(m_runner->callCount(kSanitizer), 2);
}

void TestSessionController::testShutdownDiscardsQueuedTasks()
{
    makeImages({"a.png", "b.png", "c.png"});
    m_runner->blockInputs = {"a.png"};
    m_runner->blockMs = 1000;
    auto c = makeController(fakeTools());
    c->selection().selectAll(c->visibleIndices());
    QVERIFY(c->startBatch());
    QTRY_VERIFY_WITH_TIMEOUT(m_runner->blockedCount() == 1, 5000);
    QCOMPARE(c->pendingTaskCount(), 2);

    QElapsedTimer timer;
    timer.start();
    c->shutdown(5000);
    QVERIFY(timer.elapsed() < 5000);
    QVERIFY(!c->isWorkerRunning());
    QCOMPARE(c->pendingTaskCount(), 0);
    QCOMPARE(m_runner->callCount(kEncoder), 1);

    // only the task in flight reports; the discarded ones stay queued
    QVERIFY(!c->poll());
    QTest::qWait(100);
    QVERIFY(!c->poll());
    QVERIFY(c->aggregator().record(0).status == ConversionStatus::Success);
    QVERIFY(c->aggregator().record(1).status == ConversionStatus::Queued);
    QVERIFY(c->aggregator().record(2).status == ConversionStatus::Queued);
    QCOMPARE(c->aggregator().batch().successCount, 1);
    QCOMPARE(m_runner->callCount(kEncoder), 1);
}

void TestSessionController::testReloadRejectedWhileActive()
{
    makeImages({"a.png"});
    auto c = makeController(fakeTools());
    c->selection().toggle(0);
    QVERIFY(c->startBatch());
    QVERIFY(!c->reload());
    QCOMPARE(c->lastMessage(), QString("Cannot reload while a conversion is running."));
    QVERIFY(pollUntilFinished(*c));

    makeImages({"b.png"});
    QVERIFY(c->reload());
    QCOMPARE(c->inventory().size(), 2);
    QVERIFY(c->selection().isEmpty());
}

void TestSessionController::testFailedFilter()
{
    makeImages({"a.png", "b.png", "c.png"});
    m_runner->failInputs = {"b.png"};
    auto c = makeController(fakeTools());
    QVERIFY(!c->toggleFailedFilter());

    c->selection().selectAll(c->visibleIndices());
    QVERIFY(c->startBatch());
    QVERIFY(pollUntilFinished(*c));
    QVERIFY(c->hasFailures());
    QVERIFY(c->toggleFailedFilter());
    QCOMPARE(c->visibleIndices(), QVector<int>({1}));
    QVERIFY(c->toggleFailedFilter());
    QCOMPARE(c->visibleIndices().size(), 3);
}

void TestSessionController::testEditQualityAndEffort()
{
    makeImages({"a.png"});
    auto c = makeController(fakeTools());

    m_prompter.textAnswers << "55";
    c->editQuality();
    QCOMPARE(c->settings().quality, 55);
    QCOMPARE(c->lastMessage(), QString("Quality set to 55"));
    QCOMPARE(m_prompter.labels.last(), QString("Quality (1-100)"));

    m_prompter.textAnswers << "500";
    c->editQuality();
    QCOMPARE(c->settings().quality, 55);
    QCOMPARE(c->lastMessage(), QString("Quality must be between 1 and 100."));

    m_prompter.textAnswers << "-3";
    c->editEffort();
    QCOMPARE(c->settings().effort, 7);
    QCOMPARE(c->lastMessage(), QString("Effort must be between 1 and 9."));

    m_prompter.textAnswers << "3";
    c->editEffort();
    QCOMPARE(c->settings().effort, 3);

    // cancelled dialog changes nothing and says nothing
    c->clearMessage();
    c->editEffort();
    QCOMPARE(c->settings().effort, 3);
    QVERIFY(c->lastMessage().isEmpty());

    // the next batch carries the edited values
    m_runner->outputSize = 10;
    c->selection().toggle(0);
    QVERIFY(c->startBatch());
    QVERIFY(pollUntilFinished(*c));
    const auto calls = m_runner->calls();
    QCOMPARE(calls.size(), 1);
    QVERIFY(calls.at(0).args.contains("55"));
    QCOMPARE(calls.at(0).args.mid(2, 2), QStringList({"--effort", "3"}));
}

void TestSessionController::testEditOutputDir()
{
    makeImages({"a.png"});
    ConverterSettings s;
    s.outputDir = m_dir->filePath("converted");
    auto c = makeController(fakeTools(), s);

    m_prompter.textAnswers << "   ";
    c->editOutputDir();
    QVERIFY(c->settings().sameAsSource());
    QCOMPARE(c->lastMessage(), QString("Output set to same directory as source files."));

    const QString out = m_dir->filePath("elsewhere");
    m_prompter.textAnswers << out;
    c->editOutputDir();
    QCOMPARE(c->settings().outputDir, QDir::cleanPath(out));
    QCOMPARE(c->lastMessage(), QString("Output directory set to %1").arg(QDir::cleanPath(out)));
}

void TestSessionController::testToggleDebugLogging()
{
    makeImages({"a.png"});
    auto c = makeController(fakeTools());
    c->toggleDebugLogging();
    QCOMPARE(c->lastMessage(), QString("Debug logging ENABLED"));
    QVERIFY(LogManager::instance().isFileLoggingEnabled());
    c->toggleDebugLogging();
    QCOMPARE(c->lastMessage(), QString("Debug logging DISABLED"));
    QVERIFY(!LogManager::instance().isFileLoggingEnabled());
}

QTEST_MAIN(TestSessionController)
#include "test_session_controller.moc"
