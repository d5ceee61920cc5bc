#include "SandboxExecutor.hpp"

namespace Evalbox {

const char* toString(LaunchError error) {
    switch (error) {
        case LaunchError::ProgramNotFound: return "sandbox program not found";
        case LaunchError::PersistDirFailed: return "persistence directory could not be created";
        case LaunchError::SpawnFailed: return "sandbox process could not be spawned";
        case LaunchError::CleanupFailed: return "sandbox resources could not be released";
    }
    return "unknown launch error";
}

} // namespace Evalbox
