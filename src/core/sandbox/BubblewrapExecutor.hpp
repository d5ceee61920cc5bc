#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QTemporaryDir>
#include <memory>

#include "core/sandbox/SandboxExecutor.hpp"

namespace Evalbox {

/**
 * @brief Unprivileged user-namespace executor built on bubblewrap
 *
 * The root filesystem (the "/" read-only mount) is presented through an
 * overlay: with persist set its upper and work directories live in a
 * per-launch directory under the scratch path, otherwise bwrap keeps the
 * changes in a tmpfs. cleanup() deletes the per-launch directory.
 */
class BubblewrapExecutor : public SandboxExecutor {
public:
    explicit BubblewrapExecutor(const QString& program = "bwrap", const QString& scratchPath = QString());
    ~BubblewrapExecutor() override;

    Expected<std::shared_ptr<ChildProcess>, LaunchError> run(const SandboxConfig& config,
                                                             const SandboxCommand& command) override;
    Expected<void, LaunchError> cleanup() override;

    QString name() const override;
    bool isPrivileged() const override;

    // Empty until run() created it, and again after cleanup()
    QString persistDirectory() const;

    // bwrap arguments for the given launch; an empty persistDirectory selects a tmpfs overlay
    static QStringList buildArguments(const SandboxConfig& config, const SandboxCommand& command,
                                      const QString& persistDirectory);

private:
    QString resolveProgram() const;

    const QString program_;
    const QString scratchPath_;
    std::unique_ptr<QTemporaryDir> persistDir_;
    bool cleanedUp_ = false;
};

} // namespace Evalbox
