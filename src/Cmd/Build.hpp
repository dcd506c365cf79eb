#pragma once

#include "../Cli.hpp"
#include "../DistGraph.hpp"
#include "../Environment.hpp"
#include "../Rustify/Result.hpp"

#include <span>

namespace distbuild {

extern const Subcmd BUILD_CMD;

// Runs the workspace build for one target and collects its binaries.
Result<void> buildGenericTarget(
    const DistGraph& graph, const Environment& ambient,
    const GenericBuildStep& step
);
// Runs an extra build and collects its artifacts into the dist dir.
Result<void> runExtraArtifactsBuild(
    const DistGraph& graph, const Environment& ambient,
    const ExtraBuildStep& step
);
Result<void> runBuildStep(
    const DistGraph& graph, const Environment& ambient, const BuildStep& step
);

// Plans and runs every step in order, stopping at the first failure.  An
// empty `targets` builds every target.
Result<void>
buildImpl(const DistGraph& graph, std::span<const TargetTriple> targets);

}  // namespace distbuild
