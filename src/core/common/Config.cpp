#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QStringList>

namespace Evalbox {

namespace {

QString defaultDataPath() {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString defaultTempPath() {
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation) + "/Evalbox";
}

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    EVALBOX_INFO("Config initialized for {}/{} ({})",
                 organizationName.toStdString(), applicationName.toStdString(),
                 settings_->fileName().toStdString());
}

bool Config::isInitialized() const {
    return settings_ != nullptr;
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

void Config::setString(const QString& key, const QString& value) {
    setValue(key, value);
}

void Config::setInt(const QString& key, int value) {
    setValue(key, value);
}

void Config::setBool(const QString& key, bool value) {
    setValue(key, value);
}

Config::SandboxSettings Config::SandboxSettings::defaults() {
    SandboxSettings settings;
    settings.storagePath = defaultDataPath();
    settings.scratchPath = defaultTempPath();
    settings.imagesPath = settings.storagePath + "/rootfs";
    settings.registriesPath = QDir::homePath() + "/.julia/registries";
    return settings;
}

Config::SandboxSettings Config::getSandboxSettings(const QString& storagePath) const {
    const SandboxSettings defaults = SandboxSettings::defaults();

    SandboxSettings settings;
    settings.storagePath = storagePath.isEmpty()
        ? getString("sandbox/storagePath", defaults.storagePath)
        : storagePath;
    settings.scratchPath = getString("sandbox/scratchPath", defaults.scratchPath);
    settings.imagesPath = getString("sandbox/imagesPath", settings.storagePath + "/rootfs");
    settings.registriesPath = getString("sandbox/registriesPath", defaults.registriesPath);
    settings.resolverConfPath = getString("sandbox/resolverConfPath", defaults.resolverConfPath);

    settings.installMountPoint = getString("sandbox/installMountPoint", defaults.installMountPoint);
    settings.registriesMountPoint = getString("sandbox/registriesMountPoint", defaults.registriesMountPoint);
    settings.runtimeBinary = getString("sandbox/runtimeBinary", defaults.runtimeBinary);

    settings.executorProgram = getString("sandbox/executorProgram", defaults.executorProgram);
    settings.cpuAffinityProgram = getString("sandbox/cpuAffinityProgram", defaults.cpuAffinityProgram);

    settings.displayProgram = getString("display/program", defaults.displayProgram);
    settings.display = getString("display/display", defaults.display);
    settings.displayGeometry = getString("display/geometry", defaults.displayGeometry);
    settings.displaySocketPath = getString("display/socketPath", defaults.displaySocketPath);
    settings.displayStartupGraceMs = getInt("display/startupGraceMs", defaults.displayStartupGraceMs);

    settings.maxSupervisionThreads = getInt("sandbox/maxSupervisionThreads", defaults.maxSupervisionThreads);
    return settings;
}

void Config::setSandboxSettings(const SandboxSettings& settings) {
    setValue("sandbox/storagePath", settings.storagePath);
    setValue("sandbox/scratchPath", settings.scratchPath);
    setValue("sandbox/imagesPath", settings.imagesPath);
    setValue("sandbox/registriesPath", settings.registriesPath);
    setValue("sandbox/resolverConfPath", settings.resolverConfPath);

    setValue("sandbox/installMountPoint", settings.installMountPoint);
    setValue("sandbox/registriesMountPoint", settings.registriesMountPoint);
    setValue("sandbox/runtimeBinary", settings.runtimeBinary);

    setValue("sandbox/executorProgram", settings.executorProgram);
    setValue("sandbox/cpuAffinityProgram", settings.cpuAffinityProgram);

    setValue("display/program", settings.displayProgram);
    setValue("display/display", settings.display);
    setValue("display/geometry", settings.displayGeometry);
    setValue("display/socketPath", settings.displaySocketPath);
    setValue("display/startupGraceMs", settings.displayStartupGraceMs);

    setValue("sandbox/maxSupervisionThreads", settings.maxSupervisionThreads);
}

QString Config::getDataPath() const {
    return defaultDataPath();
}

QString Config::getTempPath() const {
    return defaultTempPath();
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    const SandboxSettings settings = getSandboxSettings();
    QStringList paths = {
        settings.storagePath,
        settings.scratchPath
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            EVALBOX_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Evalbox
