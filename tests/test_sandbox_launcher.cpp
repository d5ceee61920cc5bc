#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QMutex>

#include "utils/TestUtils.hpp"
#include "../src/core/sandbox/SandboxContext.hpp"
#include "../src/core/sandbox/SandboxLauncher.hpp"

#include <atomic>
#include <csignal>

using namespace Evalbox;
using namespace Evalbox::Test;

namespace {

// Shared between a test and every executor its factory creates
struct ExecutorRecorder {
    QString script = "exit 0";
    bool failRun = false;
    bool failCleanup = false;
    bool privileged = false;

    std::atomic<int> created{0};
    std::atomic<int> cleanups{0};
    std::atomic<int> cleanedWhileRunning{0};

    QMutex mutex;
    SandboxCommand lastCommand;
    SandboxConfig lastConfig;
};

// Runs the script with /bin/sh instead of entering a sandbox
class FakeExecutor : public SandboxExecutor {
public:
    explicit FakeExecutor(std::shared_ptr<ExecutorRecorder> recorder) : recorder_(std::move(recorder)) {
        ++recorder_->created;
    }

    Expected<std::shared_ptr<ChildProcess>, LaunchError> run(const SandboxConfig& config,
                                                             const SandboxCommand& command) override {
        {
            QMutexLocker locker(&recorder_->mutex);
            recorder_->lastCommand = command;
            recorder_->lastConfig = config;
        }
        if (recorder_->failRun) {
            return makeUnexpected(LaunchError::SpawnFailed);
        }

        SpawnOptions options;
        options.program = "/bin/sh";
        options.arguments << "-c" << recorder_->script;
        options.stdio.stdinFd = -1;
        auto process = ChildProcess::spawn(options);
        if (!process) {
            return makeUnexpected(LaunchError::SpawnFailed);
        }
        process_ = process.value();
        return process_;
    }

    Expected<void, LaunchError> cleanup() override {
        ++recorder_->cleanups;
        if (process_ && process_->isRunning()) {
            ++recorder_->cleanedWhileRunning;
        }
        if (recorder_->failCleanup) {
            return makeUnexpected(LaunchError::CleanupFailed);
        }
        return {};
    }

    QString name() const override { return QStringLiteral("fake"); }
    bool isPrivileged() const override { return recorder_->privileged; }

private:
    std::shared_ptr<ExecutorRecorder> recorder_;
    std::shared_ptr<ChildProcess> process_;
};

} // namespace

class TestSandboxLauncher : public QObject {
    Q_OBJECT

private slots:
    void init() {
        root_ = TestUtils::createTempDirectory("launcher");
        QVERIFY(!root_.isEmpty());
        settings_ = TestUtils::createTestSettings(root_);
        install_ = TestUtils::createFakeInstall(root_ + "/install");
        recorder_ = std::make_shared<ExecutorRecorder>();
        options_ = LaunchOptions();
        options_.xvfb = false;
    }

    void testDefaultExecutorIsBubblewrap() {
        SandboxContext context(settings_);
        auto executor = context.createExecutor();
        QVERIFY(executor != nullptr);
        QCOMPARE(executor->name(), QString("bubblewrap"));
    }

    void testBlockingLaunch() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);
        QSignalSpy finished(&launcher, &SandboxLauncher::processFinished);
        recorder_->script = "sleep 0.1; exit 4";

        auto process = launcher.run(install_, {"-e", "1"}, options_);
        ASSERT_EXPECTED_VALUE(process);

        // already finished and cleaned up when run() returns
        QVERIFY(process.value()->exitStatus().has_value());
        QCOMPARE(process.value()->exitStatus()->exitCode, 4);
        QCOMPARE(recorder_->cleanups.load(), 1);
        QCOMPARE(recorder_->cleanedWhileRunning.load(), 0);

        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.first().at(0).toLongLong(), process.value()->pid());
        QCOMPARE(finished.first().at(1).toInt(), 4);

        QCOMPARE(recorder_->lastCommand.program, QString("/opt/julia/bin/julia"));
        QCOMPARE(recorder_->lastCommand.arguments, (QStringList{"-e", "1"}));
        QVERIFY(recorder_->lastConfig.persist);
    }

    void testDetachedLaunch() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);
        QSignalSpy finished(&launcher, &SandboxLauncher::processFinished);
        recorder_->script = "sleep 0.3; exit 2";
        options_.wait = false;

        auto process = launcher.run(install_, {}, options_);
        ASSERT_EXPECTED_VALUE(process);

        // returned before the process exited, cleanup has not run yet
        QVERIFY(process.value()->isRunning());
        QCOMPARE(recorder_->cleanups.load(), 0);

        QVERIFY(TestUtils::waitForCondition([this]() { return recorder_->cleanups.load() == 1; }));
        context.waitForSupervisions();

        QCOMPARE(recorder_->cleanups.load(), 1);
        QCOMPARE(recorder_->cleanedWhileRunning.load(), 0);
        QCOMPARE(process.value()->exitStatus()->exitCode, 2);
        QCOMPARE(context.pendingSupervisions(), 0);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.first().at(1).toInt(), 2);
    }

    void testManyDetachedLaunches() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);
        recorder_->script = "sleep 0.2";
        options_.wait = false;

        QList<std::shared_ptr<ChildProcess>> handles;
        for (int i = 0; i < 6; ++i) {
            auto process = launcher.run(install_, {}, options_);
            ASSERT_EXPECTED_VALUE(process);
            handles << process.value();
        }
        // the rootfs is derived once for all of them
        QCOMPARE(context.rootfsCache().buildCount(), 1);

        context.waitForSupervisions();
        QCOMPARE(recorder_->created.load(), 6);
        QCOMPARE(recorder_->cleanups.load(), 6);
        QCOMPARE(recorder_->cleanedWhileRunning.load(), 0);
        for (const auto& handle : handles) {
            QVERIFY(handle->exitStatus().has_value());
            QVERIFY(handle->exitStatus()->succeeded());
        }
    }

    void testExternallyKilledProcessIsStillCleanedUp() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);
        recorder_->script = "exec sleep 30";
        options_.wait = false;

        auto process = launcher.run(install_, {}, options_);
        ASSERT_EXPECTED_VALUE(process);
        ASSERT_EXPECTED_VALUE(process.value()->kill());

        context.waitForSupervisions();
        QCOMPARE(recorder_->cleanups.load(), 1);
        QCOMPARE(process.value()->exitStatus()->shellCode(), 128 + SIGKILL);
    }

    void testLaunchFailureStillCleansUp() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);
        recorder_->failRun = true;

        ASSERT_EXPECTED_ERROR(launcher.run(install_, {}, options_), SandboxError::LaunchFailed);
        QCOMPARE(recorder_->cleanups.load(), 1);
    }

    void testAssemblyFailureLaunchesNothing() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);

        ASSERT_EXPECTED_ERROR(launcher.run(root_ + "/missing", {}, options_), SandboxError::InstallDirInvalid);
        QCOMPARE(recorder_->created.load(), 0);
    }

    void testCleanupFailureIsReportedNotPropagated() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);
        QSignalSpy failed(&launcher, &SandboxLauncher::supervisionFailed);
        QSignalSpy finished(&launcher, &SandboxLauncher::processFinished);
        recorder_->failCleanup = true;
        recorder_->script = "sleep 0.1";
        options_.wait = false;

        auto process = launcher.run(install_, {}, options_);
        ASSERT_EXPECTED_VALUE(process);
        context.waitForSupervisions();

        QCOMPARE(recorder_->cleanups.load(), 1);
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.first().at(0).toLongLong(), process.value()->pid());
        // the exit is still reported
        QCOMPARE(finished.count(), 1);
    }

    void testBlockingCleanupFailureKeepsHandle() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);
        recorder_->failCleanup = true;

        auto process = launcher.run(install_, {}, options_);
        ASSERT_EXPECTED_VALUE(process);
        QCOMPARE(recorder_->cleanups.load(), 1);
        QVERIFY(process.value()->exitStatus()->succeeded());
    }

    void testPrivilegedExecutorStillRuns() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);
        recorder_->privileged = true;

        ASSERT_EXPECTED_VALUE(launcher.run(install_, {}, options_));
        QCOMPARE(recorder_->cleanups.load(), 1);
    }

    void testLaunchPreparedSandbox() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);

        PreparedSandbox prepared;
        prepared.command.program = "/bin/custom";
        prepared.config.persist = false;

        auto process = launcher.launch(prepared);
        ASSERT_EXPECTED_VALUE(process);
        QCOMPARE(recorder_->lastCommand.program, QString("/bin/custom"));
        QVERIFY(!recorder_->lastConfig.persist);
        QCOMPARE(recorder_->cleanups.load(), 1);
    }

    void testShutdownWaitsForSupervisionAndDisplay() {
        SandboxContext context(settings_);
        useFakeExecutor(context);
        SandboxLauncher launcher(context);
        recorder_->script = "sleep 0.3";
        options_.wait = false;
        options_.xvfb = true;

        auto process = launcher.run(install_, {}, options_);
        ASSERT_EXPECTED_VALUE(process);
        QVERIFY(context.displayServer().isRunning());
        QCOMPARE(recorder_->lastConfig.environment.value("DISPLAY"), settings_.display);

        context.shutdown();
        QVERIFY(context.isShutDown());
        QCOMPARE(recorder_->cleanups.load(), 1);
        QVERIFY(!context.displayServer().isRunning());

        // idempotent
        context.shutdown();
    }

private:
    void useFakeExecutor(SandboxContext& context) {
        std::shared_ptr<ExecutorRecorder> recorder = recorder_;
        context.setExecutorFactory([recorder]() -> std::unique_ptr<SandboxExecutor> {
            return std::make_unique<FakeExecutor>(recorder);
        });
    }

    QString root_;
    QString install_;
    Config::SandboxSettings settings_;
    LaunchOptions options_;
    std::shared_ptr<ExecutorRecorder> recorder_;
};

int runTestSandboxLauncher(int argc, char** argv) {
    TestSandboxLauncher test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_sandbox_launcher.moc"
