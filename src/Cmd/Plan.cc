#include "../BuildPlan.hpp"
#include "../Cli.hpp"
#include "../Cmd.hpp"
#include "../Diag.hpp"
#include "../Harvest.hpp"
#include "../Rustify/Result.hpp"
#include "Common.hpp"

#include <fmt/core.h>
#include <string_view>
#include <vector>

namespace distbuild {

static Result<void> planMain(CliArgsView args);

const Subcmd PLAN_CMD =
    Subcmd{ "plan" }
        .setDesc("Print the build steps `build` would run, in order")
        .addOpt(Opt{ "--target" }
                    .setDesc("Only plan for this target triple (repeatable)")
                    .setPlaceholder("<TRIPLE>"))
        .setMainFn(planMain);

static Result<void>
planMain(const CliArgsView args) {
  // Parse args
  std::vector<TargetTriple> targets;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(Cli::handleGlobalOpts(itr, args.end(), "plan"));
    if (control == Cli::Return) {
      return Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "--target") {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      targets.emplace_back(*++itr);
    } else {
      return PLAN_CMD.noSuchArg(arg);
    }
  }

  const Manifest manifest = Try(loadManifest());
  // Planning never runs anything, so there is no tool to look for.
  const DistGraph graph = manifest.toDistGraph(Tools{});
  const std::vector<BuildStep> steps = Try(computeBuildSteps(graph, targets));
  if (steps.empty()) {
    Diag::info("Planned", "nothing to build");
    return Ok();
  }
  for (const BuildStep& step : steps) {
    fmt::print("{}\n", describeStep(graph, step));
  }
  return Ok();
}

}  // namespace distbuild
