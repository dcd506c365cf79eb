#include "../Cli.hpp"
#include "../Cmd.hpp"
#include "../Rustify/Result.hpp"

namespace distbuild {

static Result<void> helpMain(CliArgsView args);

const Subcmd HELP_CMD =  //
    Subcmd{ "help" }
        .setDesc("Display help for a distbuild command")
        .setArg("COMMAND")
        .setMainFn(helpMain);

static Result<void>
helpMain(const CliArgsView args) {
  return getCli().printHelp(args);
}

}  // namespace distbuild
