#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace Evalbox {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Evalbox",
                   const QString& applicationName = "evalbox");
    bool isInitialized() const;

    // General settings
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    // Typed convenience methods
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    void setString(const QString& key, const QString& value);
    void setInt(const QString& key, int value);
    void setBool(const QString& key, bool value);

    // Everything the sandbox context needs; defaults() gives the values used
    // when nothing is stored
    struct SandboxSettings {
        QString storagePath;        // durable, holds artifacts/
        QString scratchPath;        // derived rootfs copies and persistence dirs
        QString imagesPath;         // one base image directory per distro
        QString registriesPath;
        QString resolverConfPath = "/etc/resolv.conf";

        QString installMountPoint = "/opt/julia";
        QString registriesMountPoint = "/usr/local/share/julia/registries";
        QString runtimeBinary = "bin/julia";

        QString executorProgram = "bwrap";
        QString cpuAffinityProgram = "/usr/bin/taskset";

        QString displayProgram = "Xvfb";
        QString display = ":1";
        QString displayGeometry = "1024x768x16";
        QString displaySocketPath = "/tmp/.X11-unix";
        int displayStartupGraceMs = 1000;

        int maxSupervisionThreads = 64;

        static SandboxSettings defaults();
    };

    // A non-empty storagePath replaces the stored one; imagesPath then
    // follows it unless an images path is stored explicitly
    SandboxSettings getSandboxSettings(const QString& storagePath = QString()) const;
    void setSandboxSettings(const SandboxSettings& settings);

    // Paths
    QString getDataPath() const;
    QString getTempPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace Evalbox
