#pragma once

#include "Rustify/Result.hpp"

namespace distbuild {

// Parses the command line and runs the requested command.  Errors are
// printed here; the caller only needs the outcome.
// NOLINTNEXTLINE(*-avoid-c-arrays)
Result<void, void> run(int argc, char* argv[]) noexcept;

}  // namespace distbuild
