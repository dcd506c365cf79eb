#pragma once

#include "Cli.hpp"

namespace distbuild {

extern const Subcmd BUILD_CMD;
extern const Subcmd HELP_CMD;
extern const Subcmd PLAN_CMD;
extern const Subcmd VERSION_CMD;

}  // namespace distbuild
