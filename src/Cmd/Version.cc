#include "../Cli.hpp"
#include "../Cmd.hpp"
#include "../Diag.hpp"
#include "../Rustify/Result.hpp"

#include <fmt/core.h>
#include <spdlog/version.h>
#include <string_view>

#ifndef DISTBUILD_PKG_VERSION
#  error "DISTBUILD_PKG_VERSION is not defined"
#endif

#if defined(__GNUC__) && !defined(__clang__)
#  define COMPILER_VERSION "GCC " __VERSION__
#else
#  define COMPILER_VERSION __VERSION__
#endif

namespace distbuild {

static Result<void> versionMain(CliArgsView args);

const Subcmd VERSION_CMD =  //
    Subcmd{ "version" }
        .setDesc("Show version information")
        .setMainFn(versionMain);

static Result<void>
versionMain(const CliArgsView args) {
  // Parse args
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(Cli::handleGlobalOpts(itr, args.end(), "version"));
    if (control == Cli::Return) {
      return Ok();
    } else if (control == Cli::Continue) {
      continue;
    }
    return VERSION_CMD.noSuchArg(arg);
  }

  fmt::print("distbuild {}\n", DISTBUILD_PKG_VERSION);
  if (isVerbose()) {
    fmt::print(
        "release: {}\n"
        "compiler: {}\n"
        "fmt: {}.{}.{}\n"
        "spdlog: {}.{}.{}\n",
        DISTBUILD_PKG_VERSION, COMPILER_VERSION, FMT_VERSION / 10000,
        FMT_VERSION / 100 % 100, FMT_VERSION % 100, SPDLOG_VER_MAJOR,
        SPDLOG_VER_MINOR, SPDLOG_VER_PATCH
    );
  }
  return Ok();
}

}  // namespace distbuild
