#include <QtTest/QtTest>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>

#include "utils/TestUtils.hpp"
#include "../src/core/sandbox/BubblewrapExecutor.hpp"

using namespace Evalbox;
using namespace Evalbox::Test;

class TestBubblewrapExecutor : public QObject {
    Q_OBJECT

private slots:
    void init() {
        root_ = TestUtils::createTempDirectory("bwrap");
        QVERIFY(!root_.isEmpty());
        // stands in for bwrap: records one argument per line
        fakeBwrap_ = TestUtils::createExecutableScript(root_ + "/bin", "bwrap",
            "printf '%s\\n' \"$@\" > \"$(dirname \"$0\")/args.txt\"\nexit 7");
    }

    void testArgumentLayout() {
        SandboxConfig config = sampleConfig();
        SandboxCommand command;
        command.program = "/opt/julia/bin/julia";
        command.arguments << "-e" << "1";

        const QStringList args = BubblewrapExecutor::buildArguments(config, command, "/scratch/persist-1");
        const QStringList expected{
            "--unshare-user", "--unshare-pid", "--unshare-ipc", "--unshare-uts", "--die-with-parent",
            "--uid", "1000", "--gid", "1000",
            "--overlay-src", "/images/rootfs",
            "--overlay", "/scratch/persist-1/upper", "/scratch/persist-1/work", "/",
            "--dev", "/dev", "--proc", "/proc",
            "--ro-bind", "/host/julia", "/opt/julia",
            "--bind", "/host/artifacts", "/opt/julia/artifacts",
            "--ro-bind", "/host/registries", "/usr/local/share/julia/registries",
            "--clearenv",
            "--setenv", "HOME", "/home/pkgeval",
            "--setenv", "PATH", "/usr/bin:/bin",
            "--chdir", "/home/pkgeval",
            "--", "/opt/julia/bin/julia", "-e", "1"
        };
        QCOMPARE(args, expected);
    }

    void testTmpfsOverlayWithoutPersistence() {
        SandboxCommand command;
        command.program = "/bin/true";

        const QStringList args = BubblewrapExecutor::buildArguments(sampleConfig(), command, QString());
        const int overlay = args.indexOf("--tmp-overlay");
        QVERIFY(overlay > 0);
        QCOMPARE(args.at(overlay + 1), QString("/"));
        QVERIFY(!args.contains("--overlay"));
    }

    void testReadWriteWinsOverReadOnly() {
        SandboxConfig config = sampleConfig();
        config.readWriteMounts.insert("/opt/julia", "/host/writable-julia");

        SandboxCommand command;
        command.program = "/bin/true";
        const QStringList args = BubblewrapExecutor::buildArguments(config, command, QString());

        const int bind = args.indexOf("/opt/julia");
        QVERIFY(bind > 1);
        QCOMPARE(args.at(bind - 2), QString("--bind"));
        QCOMPARE(args.at(bind - 1), QString("/host/writable-julia"));
        QCOMPARE(args.count("/opt/julia"), 1);
    }

    void testRunWithPersistence() {
        BubblewrapExecutor executor(fakeBwrap_, root_ + "/scratch");
        QCOMPARE(executor.name(), QString("bubblewrap"));
        QVERIFY(!executor.isPrivileged());

        SandboxConfig config = sampleConfig();
        config.stdio.stdinFd = -1;
        SandboxCommand command;
        command.program = "/opt/julia/bin/julia";

        auto process = executor.run(config, command);
        ASSERT_EXPECTED_VALUE(process);
        auto status = process.value()->wait();
        ASSERT_EXPECTED_VALUE(status);
        QCOMPARE(status->exitCode, 7);

        const QString persist = executor.persistDirectory();
        QVERIFY(persist.startsWith(root_ + "/scratch/persist-"));
        QVERIFY(QFileInfo(persist + "/upper").isDir());
        QVERIFY(QFileInfo(persist + "/work").isDir());

        const QStringList recorded = TestUtils::readLines(root_ + "/bin/args.txt");
        QCOMPARE(recorded, BubblewrapExecutor::buildArguments(config, command, persist));

        ASSERT_EXPECTED_VALUE(executor.cleanup());
        QVERIFY(!QFileInfo::exists(persist));
        QVERIFY(executor.persistDirectory().isEmpty());

        // second call is a no-op
        ASSERT_EXPECTED_VALUE(executor.cleanup());
    }

    void testRunWithoutPersistence() {
        BubblewrapExecutor executor(fakeBwrap_, root_ + "/scratch");
        SandboxConfig config = sampleConfig();
        config.persist = false;
        SandboxCommand command;
        command.program = "/bin/true";

        auto process = executor.run(config, command);
        ASSERT_EXPECTED_VALUE(process);
        ASSERT_EXPECTED_VALUE(process.value()->wait());
        QVERIFY(executor.persistDirectory().isEmpty());
        QVERIFY(TestUtils::readLines(root_ + "/bin/args.txt").contains("--tmp-overlay"));
        ASSERT_EXPECTED_VALUE(executor.cleanup());
    }

    void testPersistenceRemovedOnDestruction() {
        QString persist;
        {
            BubblewrapExecutor executor(fakeBwrap_, root_ + "/scratch");
            SandboxCommand command;
            command.program = "/bin/true";
            auto process = executor.run(sampleConfig(), command);
            ASSERT_EXPECTED_VALUE(process);
            ASSERT_EXPECTED_VALUE(process.value()->wait());
            persist = executor.persistDirectory();
            QVERIFY(QFileInfo::exists(persist));
        }
        QVERIFY(!QFileInfo::exists(persist));
    }

    void testProgramNotFound() {
        BubblewrapExecutor executor("evalbox-no-such-bwrap", root_ + "/scratch");
        SandboxCommand command;
        command.program = "/bin/true";
        ASSERT_EXPECTED_ERROR(executor.run(sampleConfig(), command), LaunchError::ProgramNotFound);
        QVERIFY(!executor.isPrivileged());
        ASSERT_EXPECTED_VALUE(executor.cleanup());
    }

private:
    SandboxConfig sampleConfig() const {
        SandboxConfig config;
        config.uid = 1000;
        config.gid = 1000;
        config.readOnlyMounts.insert("/", "/images/rootfs");
        config.readOnlyMounts.insert("/opt/julia", "/host/julia");
        config.readOnlyMounts.insert("/usr/local/share/julia/registries", "/host/registries");
        config.readWriteMounts.insert("/opt/julia/artifacts", "/host/artifacts");
        config.environment.insert("PATH", "/usr/bin:/bin");
        config.environment.insert("HOME", "/home/pkgeval");
        config.workingDirectory = "/home/pkgeval";
        return config;
    }

    QString root_;
    QString fakeBwrap_;
};

int runTestBubblewrapExecutor(int argc, char** argv) {
    TestBubblewrapExecutor test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_bubblewrap_executor.moc"
