#pragma once

#include "core/sidecar/launch_outcome.h"

#include <QString>

#include <memory>

namespace fo {

class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    // Starts program with no arguments as a detached process that inherits
    // the environment and stdio. No handle is kept.
    virtual LaunchOutcome spawnDetached(const QString& program) = 0;

    static std::unique_ptr<ProcessSpawner> create();
};

// Names the cause of a failed spawn from what is on disk at program.
LaunchFailure classifySpawnFailure(const QString& program);

} // namespace fo
