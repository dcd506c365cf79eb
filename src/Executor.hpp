#pragma once

#include "Command.hpp"
#include "DistGraph.hpp"
#include "Environment.hpp"
#include "Harvest.hpp"
#include "Rustify/Result.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace distbuild {

// Composes the environment a build runs under.  Later layers win:
//   ambient < harvested variables < CFLAGS/CPPFLAGS/LDFLAGS
//           < CARGO_DIST_TARGET/CC/CXX (only with a target)
// An ambient CC or CXX is kept over the toolchain default.
Environment resolveBuildEnv(
    const Environment& ambient, const HarvestedEnv& harvested,
    std::optional<std::string_view> target
);

// Runs `command` with stdout captured and stderr passed through.  A non-zero
// exit is returned, not reported as an error; failing to start is.
Result<CommandOutput> runBuild(
    const DistGraph& graph, const Environment& ambient,
    std::span<const std::string> command,
    std::optional<std::string_view> target
);

}  // namespace distbuild
