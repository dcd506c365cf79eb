#pragma once

#include "DistGraph.hpp"
#include "Rustify/Result.hpp"

#include <fmt/format.h>
#include <span>
#include <string>
#include <vector>

namespace distbuild {

// One step per target triple that has a binary needing a copy, ordered by
// triple.  Fails if there is such a binary but no build command.
Result<std::vector<GenericBuildStep>>
computeGenericBuilds(const DistGraph& graph);

std::vector<ExtraBuildStep> computeExtraBuilds(const DistGraph& graph);

// The full plan: generic steps (only the requested triples, if any were
// requested) followed by every extra step.
Result<std::vector<BuildStep>> computeBuildSteps(
    const DistGraph& graph, std::span<const TargetTriple> targets = {}
);

// Human-readable one-line description of a step.
std::string describeStep(const DistGraph& graph, const BuildStep& step);

}  // namespace distbuild
