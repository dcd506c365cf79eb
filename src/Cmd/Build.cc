#include "Build.hpp"

#include "../Artifacts.hpp"
#include "../BuildPlan.hpp"
#include "../Cli.hpp"
#include "../Command.hpp"
#include "../Diag.hpp"
#include "../Executor.hpp"
#include "../Harvest.hpp"
#include "Common.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

namespace distbuild {

static Result<void> buildMain(CliArgsView args);

const Subcmd BUILD_CMD =
    Subcmd{ "build" }
        .setDesc("Run the build steps and collect their artifacts")
        .addOpt(Opt{ "--target" }
                    .setDesc("Only build for this target triple (repeatable)")
                    .setPlaceholder("<TRIPLE>"))
        .setMainFn(buildMain);

// The build keeps stderr for itself; what it printed to stdout is shown
// afterwards so that it sits right above any complaint about its outputs.
static void
reportBuildOutput(const CommandOutput& output) {
  if (!output.exitStatus.success()) {
    Diag::warn("build exited non-zero: {}", output.exitStatus);
  }
  if (!output.stdOut.empty()) {
    fmt::print(stderr, "\nstdout:\n{}", output.stdOut);
    if (output.stdOut.back() != '\n') {
      fmt::print(stderr, "\n");
    }
  }
}

Result<void>
buildGenericTarget(
    const DistGraph& graph, const Environment& ambient,
    const GenericBuildStep& step
) {
  Diag::info(
      "Building", "{} via `{}`", step.targetTriple,
      fmt::join(step.buildCommand, " ")
  );

  const CommandOutput output =
      Try(runBuild(graph, ambient, step.buildCommand, step.targetTriple));
  reportBuildOutput(output);

  return reconcileBinaries(graph, step);
}

Result<void>
runExtraArtifactsBuild(
    const DistGraph& graph, const Environment& ambient,
    const ExtraBuildStep& step
) {
  Diag::info(
      "Building", "extra artifacts via `{}`", fmt::join(step.buildCommand, " ")
  );

  const CommandOutput output =
      Try(runBuild(graph, ambient, step.buildCommand, std::nullopt));
  reportBuildOutput(output);

  return reconcileExtraArtifacts(graph.distDir, step);
}

Result<void>
runBuildStep(
    const DistGraph& graph, const Environment& ambient, const BuildStep& step
) {
  return std::visit(
      [&](const auto& build) -> Result<void> {
        using T = std::decay_t<decltype(build)>;
        if constexpr (std::is_same_v<T, GenericBuildStep>) {
          return buildGenericTarget(graph, ambient, build);
        } else {
          return runExtraArtifactsBuild(graph, ambient, build);
        }
      },
      step
  );
}

Result<void>
buildImpl(const DistGraph& graph, const std::span<const TargetTriple> targets) {
  const auto start = std::chrono::steady_clock::now();

  const std::vector<BuildStep> steps =
      Try(computeBuildSteps(graph, targets));
  for (const TargetTriple& target : targets) {
    const bool planned = std::ranges::any_of(steps, [&](const BuildStep& s) {
      const auto* generic = std::get_if<GenericBuildStep>(&s);
      return generic != nullptr && generic->targetTriple == target;
    });
    if (!planned) {
      Diag::warn("no binaries to build for `{}`", target);
    }
  }
  if (steps.empty()) {
    Diag::info("Finished", "nothing to build");
    return Ok();
  }

  std::error_code ec;
  fs::create_directories(graph.distDir, ec);
  if (ec) {
    Bail(
        "failed to create dist dir `{}`: {}", graph.distDir.string(),
        ec.message()
    );
  }

  // One snapshot for the whole run; every step composes its own environment
  // on top of it.
  const Environment ambient = Environment::capture();
  for (const BuildStep& step : steps) {
    Diag::verbose("step: {}", describeStep(graph, step));
    Try(runBuildStep(graph, ambient, step));
  }

  const auto end = std::chrono::steady_clock::now();
  const std::chrono::duration<double> elapsed = end - start;
  Diag::info(
      "Finished", "{} build step(s) in {:.2f}s", steps.size(), elapsed.count()
  );
  return Ok();
}

static Result<void>
buildMain(const CliArgsView args) {
  // Parse args
  std::vector<TargetTriple> targets;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(Cli::handleGlobalOpts(itr, args.end(), "build"));
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
      return BUILD_CMD.noSuchArg(arg);
    }
  }

  const Manifest manifest = Try(loadManifest());
  const DistGraph graph = manifest.toDistGraph(Tools::discover());
  return buildImpl(graph, targets);
}

}  // namespace distbuild

#ifdef DISTBUILD_TEST

#  include "../Rustify/Tests.hpp"

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)

static Environment
testAmbient() {
  return Environment::capture().with(std::string(SKIP_BREWFILE_ENV), "1");
}

static DistGraph
singleBinaryGraph(std::vector<std::string> buildCommand) {
  DistGraph graph;
  graph.buildCommand = std::move(buildCommand);
  graph.distDir = "target/distrib";
  graph.binaries = { Binary{ .target = "x86_64-unknown-linux-gnu",
                             .fileName = "out/app",
                             .copyExeTo = { "target/distrib/app" },
                             .copySymbolsTo = {} } };
  return graph;
}

static GenericBuildStep
onlyStep(const DistGraph& graph) {
  const auto builds = computeGenericBuilds(graph).unwrap();
  assertEq(builds.size(), 1UL);
  return builds[0];
}

static void
testNonZeroExitWithArtifactsSucceeds() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeScript(
      "build.sh",
      "mkdir -p out\n"
      "printf '%s' \"$CARGO_DIST_TARGET\" > out/app\n"
      "echo 'linking app'\n"
      "exit 1\n"
  );
  fs::create_directories("target/distrib");

  const DistGraph graph = singleBinaryGraph({ "./build.sh" });
  assertTrue(
      buildGenericTarget(graph, testAmbient(), onlyStep(graph)).is_ok()
  );
  assertEq(readFile("target/distrib/app"), "x86_64-unknown-linux-gnu");

  pass();
}

static void
testMissingArtifactFails() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeScript("build.sh", "echo 'all good'\nexit 0\n");
  fs::create_directories("target/distrib");

  const DistGraph graph = singleBinaryGraph({ "./build.sh" });
  const auto res = buildGenericTarget(graph, testAmbient(), onlyStep(graph));
  assertTrue(res.is_err());
  assertEq(
      std::string(res.unwrap_err()->what()),
      "failed to find bin out/app -- did the build above have errors?"
  );
  assertFalse(fs::exists("target/distrib/app"));

  pass();
}

static void
testBuildOutputIsReported() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeScript("build.sh", "echo 'cc: error: foo.c'\nexit 1\n");
  fs::create_directories("target/distrib");

  const DistGraph graph = singleBinaryGraph({ "./build.sh" });
  const DiagLevel prevLevel = getDiagLevel();
  setDiagLevel(DiagLevel::Warn);
  StderrCapture capture(tmp / "stderr.txt");
  const auto res = buildGenericTarget(graph, testAmbient(), onlyStep(graph));
  const std::string err = capture.take();
  setDiagLevel(prevLevel);

  const std::size_t warning =
      err.find("build exited non-zero: exited with code 1");
  const std::size_t echoed = err.find("\nstdout:\ncc: error: foo.c\n");
  assertNe(warning, std::string::npos);
  assertNe(echoed, std::string::npos);
  assertTrue(warning < echoed);

  assertTrue(res.is_err());
  assertEq(
      std::string(res.unwrap_err()->what()),
      "failed to find bin out/app -- did the build above have errors?"
  );

  pass();
}

static void
testExecFailureSkipsReconcile() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  // The binary is there, but the build cannot even start.
  writeFile("out/app", "stale");
  fs::create_directories("target/distrib");

  const DistGraph graph = singleBinaryGraph({ "./no-such-build.sh" });
  const auto res = buildGenericTarget(graph, testAmbient(), onlyStep(graph));
  assertTrue(res.is_err());
  assertContains(
      res.unwrap_err()->what(),
      "failed to exec generic build: `./no-such-build.sh`"
  );
  assertFalse(fs::exists("target/distrib/app"));

  pass();
}

static void
testExtraArtifactsBuild() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeScript(
      "gen.sh",
      "mkdir -p docs\n"
      "echo '{}' > schema.json\n"
      "echo '<html/>' > docs/index.html\n"
  );
  fs::create_directories("target/distrib/docs");

  DistGraph graph;
  graph.distDir = "target/distrib";
  const ExtraBuildStep step{ .buildCommand = { "./gen.sh" },
                             .expectedArtifacts = { "schema.json",
                                                    "docs/index.html" } };
  assertTrue(runBuildStep(graph, testAmbient(), step).is_ok());
  assertEq(readFile("target/distrib/schema.json"), "{}\n");
  assertEq(readFile("target/distrib/docs/index.html"), "<html/>\n");

  pass();
}

static void
testBuildImplFiltersTargets() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeScript(
      "build.sh",
      "mkdir -p out/$CARGO_DIST_TARGET\n"
      "echo built > out/$CARGO_DIST_TARGET/app\n"
      "echo $CARGO_DIST_TARGET >> built-targets.txt\n"
  );

  DistGraph graph;
  graph.buildCommand = { "./build.sh" };
  graph.distDir = "target/distrib";
  for (const char* target :
       { "x86_64-unknown-linux-gnu", "x86_64-apple-darwin" }) {
    const fs::path dest =
        fs::path("target/distrib") / fmt::format("app-{}", target);
    graph.binaries.push_back(Binary{ .target = target,
                                     .fileName = fs::path("out") / target / "app",
                                     .copyExeTo = { dest },
                                     .copySymbolsTo = {} });
  }

  const std::vector<TargetTriple> wanted = { "x86_64-apple-darwin" };
  assertTrue(buildImpl(graph, wanted).is_ok());
  assertEq(readFile("built-targets.txt"), "x86_64-apple-darwin\n");
  assertTrue(fs::exists("target/distrib/app-x86_64-apple-darwin"));
  assertFalse(fs::exists("target/distrib/app-x86_64-unknown-linux-gnu"));

  fs::remove("built-targets.txt");
  assertTrue(buildImpl(graph, {}).is_ok());
  // Sorted by triple.
  assertEq(
      readFile("built-targets.txt"),
      "x86_64-apple-darwin\nx86_64-unknown-linux-gnu\n"
  );

  pass();
}

static void
testBuildImplStopsAtFirstFailure() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeScript("build.sh", "echo $CARGO_DIST_TARGET >> built-targets.txt\n");

  DistGraph graph;
  graph.buildCommand = { "./build.sh" };
  graph.distDir = "target/distrib";
  for (const char* target :
       { "aarch64-apple-darwin", "x86_64-apple-darwin" }) {
    graph.binaries.push_back(Binary{ .target = target,
                                     .fileName = "out/app",
                                     .copyExeTo = { "target/distrib/app" },
                                     .copySymbolsTo = {} });
  }

  const auto res = buildImpl(graph, {});
  assertTrue(res.is_err());
  assertContains(res.unwrap_err()->what(), "failed to find bin out/app");
  assertEq(readFile("built-targets.txt"), "aarch64-apple-darwin\n");

  // No build command at all: nothing runs.
  graph.buildCommand.reset();
  fs::remove("built-targets.txt");
  assertTrue(buildImpl(graph, {}).is_err());
  assertFalse(fs::exists("built-targets.txt"));

  pass();
}

static void
testEverySubcmdIsRegistered() {
  // The registry refers to each subcommand defined in its own source file.
  for (const std::string_view name : { "build", "help", "plan", "version" }) {
    assertTrue(getCli().hasSubcmd(name));
  }
  assertFalse(getCli().hasSubcmd("dist.toml"));

  pass();
}

}  // namespace tests

int
main() {
  distbuild::setColorMode("never");
  distbuild::setDiagLevel(distbuild::DiagLevel::Off);

  tests::testNonZeroExitWithArtifactsSucceeds();
  tests::testMissingArtifactFails();
  tests::testBuildOutputIsReported();
  tests::testExecFailureSkipsReconcile();
  tests::testExtraArtifactsBuild();
  tests::testBuildImplFiltersTargets();
  tests::testBuildImplStopsAtFirstFailure();
  tests::testEverySubcmdIsRegistered();
}

#endif
