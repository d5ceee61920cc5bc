#include "SandboxTypes.hpp"

namespace Evalbox {

const char* toString(SandboxError error) {
    switch (error) {
        case SandboxError::InstallDirInvalid: return "installation directory is not usable";
        case SandboxError::RootfsFailed: return "root filesystem could not be prepared";
        case SandboxError::StorageFailed: return "storage directory could not be created";
        case SandboxError::DisplayFailed: return "display server could not be started";
        case SandboxError::LaunchFailed: return "sandboxed process could not be launched";
        case SandboxError::WaitFailed: return "sandboxed process could not be waited on";
    }
    return "unknown sandbox error";
}

MountTable mergeMounts(const MountTable& base, const MountTable& overrides) {
    MountTable merged = base;
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        merged.insert(it.key(), it.value());
    }
    return merged;
}

Environment mergeEnvironment(const Environment& base, const Environment& overrides) {
    Environment merged = base;
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        merged.insert(it.key(), it.value());
    }
    return merged;
}

} // namespace Evalbox
