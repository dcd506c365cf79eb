#pragma once

#include "DistGraph.hpp"
#include "Rustify/Result.hpp"

#include <filesystem>

namespace distbuild {

namespace fs = std::filesystem;

// Copies `from` over `to`.  The parent of `to` must already exist.
Result<void> copyFile(const fs::path& from, const fs::path& to);

// Checks that every binary the step promised was built, then copies each to
// its exe destinations.  Stops at the first missing binary.
Result<void>
reconcileBinaries(const DistGraph& graph, const GenericBuildStep& step);

// Same policy for loose artifacts; they land under `distDir` at their own
// relative path.
Result<void>
reconcileExtraArtifacts(const fs::path& distDir, const ExtraBuildStep& step);

}  // namespace distbuild
