#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QList>
#include <QtCore/QMap>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/sandbox/SandboxContext.hpp"
#include "core/sandbox/SandboxLauncher.hpp"

namespace {

// Parses KEY=VALUE pairs; false on the first malformed one
bool parseAssignments(const QStringList& values, QMap<QString, QString>& out) {
    for (const QString& value : values) {
        const int separator = value.indexOf('=');
        if (separator <= 0) {
            Evalbox::Logger::instance().error("Expected KEY=VALUE, got '{}'", value.toStdString());
            return false;
        }
        out.insert(value.left(separator), value.mid(separator + 1));
    }
    return true;
}

bool parseCpuList(const QString& value, QList<int>& cpus) {
    for (const QString& part : value.split(',', Qt::SkipEmptyParts)) {
        bool ok = false;
        const int cpu = part.trimmed().toInt(&ok);
        if (!ok || cpu < 0) {
            Evalbox::Logger::instance().error("Invalid CPU id '{}'", part.toStdString());
            return false;
        }
        cpus << cpu;
    }
    return !cpus.isEmpty();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("evalbox");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Evalbox");

    QCommandLineParser parser;
    parser.setApplicationDescription("Run an installed Julia runtime inside an unprivileged sandbox");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("install-dir", "Directory holding the runtime installation");
    parser.addPositionalArgument("args", "Arguments passed to the runtime (after --)", "[-- args...]");

    QCommandLineOption distroOption("distro", "Base image to derive the root filesystem from", "name", "debian");
    QCommandLineOption registriesOption("registries", "Host registries directory to expose read-only", "path");
    QCommandLineOption storageOption("storage", "Durable storage directory (holds artifacts)", "path");
    QCommandLineOption noXvfbOption("no-xvfb", "Do not provide a virtual display");
    QCommandLineOption cpusOption("cpus", "Restrict the runtime to these CPUs, e.g. 0,2,3", "list");
    QCommandLineOption envOption("env", "Extra environment variable (repeatable)", "KEY=VALUE");
    QCommandLineOption mountOption("mount", "Extra read-write mount (repeatable)", "DEST=SRC");
    QCommandLineOption detachOption("detach", "Launch without blocking and supervise in the background");
    QCommandLineOption verboseOption("verbose", "Log the full sandbox invocation");
    QCommandLineOption logFileOption("log-file", "Write logs to this file", "path");
    parser.addOptions({distroOption, registriesOption, storageOption, noXvfbOption, cpusOption,
                       envOption, mountOption, detachOption, verboseOption, logFileOption});
    parser.process(app);

    const bool verbose = parser.isSet(verboseOption);

    try {
        const QString logFile = parser.isSet(logFileOption)
            ? parser.value(logFileOption)
            : QDir(Evalbox::Config::instance().getDataPath()).filePath("evalbox.log");
        // stderr belongs to the runtime, keep our own output quiet unless asked
        Evalbox::Logger::instance().initialize(logFile.toStdString(),
            verbose ? Evalbox::Logger::Level::Debug : Evalbox::Logger::Level::Warn);
        Evalbox::Config::instance().initialize();

        const QStringList positional = parser.positionalArguments();
        if (positional.isEmpty()) {
            Evalbox::Logger::instance().error("Missing installation directory");
            parser.showHelp(2);
        }

        const Evalbox::Config::SandboxSettings settings =
            Evalbox::Config::instance().getSandboxSettings(parser.value(storageOption));

        Evalbox::LaunchOptions options;
        options.identity.distro = parser.value(distroOption);
        options.registriesPath = parser.value(registriesOption);
        options.xvfb = !parser.isSet(noXvfbOption);
        options.wait = !parser.isSet(detachOption);
        options.verbose = verbose;
        if (parser.isSet(cpusOption) && !parseCpuList(parser.value(cpusOption), options.cpus)) {
            return 2;
        }
        if (!parseAssignments(parser.values(envOption), options.environment)
            || !parseAssignments(parser.values(mountOption), options.mounts)) {
            return 2;
        }

        Evalbox::SandboxContext context(settings);
        Evalbox::SandboxLauncher launcher(context);

        auto process = launcher.run(positional.first(), positional.mid(1), options);
        if (!process) {
            Evalbox::Logger::instance().critical("Sandbox launch failed: {}", Evalbox::toString(process.error()));
            return 1;
        }

        // a detached launch is still supervised to completion before exiting
        context.waitForSupervisions();
        auto status = process.value()->exitStatus();
        context.shutdown();
        Evalbox::Config::instance().sync();

        if (!status) {
            Evalbox::Logger::instance().error("No exit status recorded for pid {}", process.value()->pid());
            return 1;
        }
        return status->shellCode();

    } catch (const std::exception& e) {
        Evalbox::Logger::instance().critical("Fatal error: {}", e.what());
        return 1;
    }
}
