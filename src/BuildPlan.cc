#include "BuildPlan.hpp"

#include "Rustify/Result.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <map>
#include <span>
#include <spdlog/spdlog.h>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace distbuild {

Result<std::vector<GenericBuildStep>>
computeGenericBuilds(const DistGraph& graph) {
  // For now every target with a binary that must be copied gets a full
  // workspace build.  std::map keeps the triples sorted.
  std::map<TargetTriple, std::vector<BinaryIdx>> targets;
  for (std::size_t i = 0; i < graph.binaries.size(); ++i) {
    const Binary& binary = graph.binaries[i];
    if (!binary.needsCopy()) {
      spdlog::trace(
          "{} ({}) has nowhere to go; not building it here",
          binary.fileName.string(), binary.target
      );
      continue;
    }
    targets[binary.target].push_back(BinaryIdx{ i });
  }

  if (targets.empty()) {
    return Ok(std::vector<GenericBuildStep>{});
  }
  Ensure(
      graph.buildCommand.has_value() && !graph.buildCommand->empty(),
      "a build command is mandatory for generic builds; set "
      "`dist.build-command` in the manifest"
  );

  std::vector<GenericBuildStep> builds;
  builds.reserve(targets.size());
  for (auto& [target, binaries] : targets) {
    builds.push_back(GenericBuildStep{ .targetTriple = target,
                                       .expectedBinaries = std::move(binaries),
                                       .buildCommand = *graph.buildCommand });
  }
  return Ok(std::move(builds));
}

std::vector<ExtraBuildStep>
computeExtraBuilds(const DistGraph& graph) {
  return graph.extraBuilds;
}

Result<std::vector<BuildStep>>
computeBuildSteps(
    const DistGraph& graph, const std::span<const TargetTriple> targets
) {
  std::vector<GenericBuildStep> generic = Try(computeGenericBuilds(graph));

  std::vector<BuildStep> steps;
  for (GenericBuildStep& build : generic) {
    if (!targets.empty()
        && std::ranges::find(targets, build.targetTriple) == targets.end()) {
      spdlog::debug("skipping {}: not requested", build.targetTriple);
      continue;
    }
    steps.emplace_back(std::move(build));
  }
  for (ExtraBuildStep& build : computeExtraBuilds(graph)) {
    steps.emplace_back(std::move(build));
  }
  return Ok(std::move(steps));
}

std::string
describeStep(const DistGraph& graph, const BuildStep& step) {
  return std::visit(
      [&](const auto& build) -> std::string {
        using T = std::decay_t<decltype(build)>;
        std::vector<std::string> outputs;
        if constexpr (std::is_same_v<T, GenericBuildStep>) {
          for (const BinaryIdx idx : build.expectedBinaries) {
            outputs.push_back(graph.binary(idx).fileName.string());
          }
          return fmt::format(
              "{}: {} (via `{}`)", build.targetTriple, fmt::join(outputs, ", "),
              fmt::join(build.buildCommand, " ")
          );
        } else {
          for (const fs::path& artifact : build.expectedArtifacts) {
            outputs.push_back(artifact.string());
          }
          return fmt::format(
              "extra artifacts: {} (via `{}`)", fmt::join(outputs, ", "),
              fmt::join(build.buildCommand, " ")
          );
        }
      },
      step
  );
}

}  // namespace distbuild

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)

static const std::vector<std::string> BUILD_COMMAND = { "make", "dist" };

static Binary
bin(TargetTriple target, fs::path fileName, std::vector<fs::path> exe,
    std::vector<fs::path> symbols = {}) {
  return Binary{ .target = std::move(target),
                 .fileName = std::move(fileName),
                 .copyExeTo = std::move(exe),
                 .copySymbolsTo = std::move(symbols) };
}

static std::vector<std::size_t>
indices(const GenericBuildStep& step) {
  std::vector<std::size_t> res;
  for (const BinaryIdx idx : step.expectedBinaries) {
    res.push_back(idx.value);
  }
  return res;
}

static void
testNoCopyDestinationsMeansNoSteps() {
  DistGraph graph;
  graph.binaries = {
    bin("x86_64-unknown-linux-gnu", "out/a", {}),
    bin("x86_64-apple-darwin", "out/b", {}),
  };

  // Even without a build command: nothing needs building.
  assertTrue(computeGenericBuilds(graph).unwrap().empty());

  graph.buildCommand = BUILD_COMMAND;
  assertTrue(computeGenericBuilds(graph).unwrap().empty());

  pass();
}

static void
testGroupsByTargetInSortedOrder() {
  DistGraph graph;
  graph.buildCommand = BUILD_COMMAND;
  graph.binaries = {
    bin("x86_64-unknown-linux-gnu", "out/app", { "dist/linux/app" }),
    bin("aarch64-apple-darwin", "out/app", { "dist/mac-arm/app" }),
    bin("x86_64-unknown-linux-gnu", "out/helper", { "dist/linux/helper" }),
    bin("x86_64-unknown-linux-gnu", "out/internal", {}),
    bin("x86_64-pc-windows-msvc", "out/app.exe", {}, { "dist/win/app.pdb" }),
  };

  const auto builds = computeGenericBuilds(graph).unwrap();
  assertEq(builds.size(), 3UL);

  assertEq(builds[0].targetTriple, "aarch64-apple-darwin");
  assertEq(indices(builds[0]), std::vector<std::size_t>{ 1 });

  // Symbol destinations alone are enough to need the build.
  assertEq(builds[1].targetTriple, "x86_64-pc-windows-msvc");
  assertEq(indices(builds[1]), std::vector<std::size_t>{ 4 });

  // Binaries keep their declaration order within a target, and the binary
  // without destinations is left out.
  assertEq(builds[2].targetTriple, "x86_64-unknown-linux-gnu");
  assertEq(indices(builds[2]), (std::vector<std::size_t>{ 0, 2 }));

  for (const GenericBuildStep& build : builds) {
    assertEq(build.buildCommand, BUILD_COMMAND);
    for (const BinaryIdx idx : build.expectedBinaries) {
      assertEq(graph.binary(idx).target, build.targetTriple);
    }
  }

  pass();
}

static void
testPlanningIsDeterministic() {
  DistGraph graph;
  graph.buildCommand = BUILD_COMMAND;
  for (const char* target :
       { "x86_64-unknown-linux-musl", "i686-pc-windows-msvc",
         "aarch64-unknown-linux-gnu", "x86_64-apple-darwin" }) {
    graph.binaries.push_back(bin(target, "out/app", { "dist/app" }));
  }

  const auto first = computeBuildSteps(graph).unwrap();
  const auto second = computeBuildSteps(graph).unwrap();
  assertEq(first.size(), 4UL);
  for (std::size_t i = 0; i < first.size(); ++i) {
    assertEq(describeStep(graph, first[i]), describeStep(graph, second[i]));
  }
  assertEq(
      std::get<GenericBuildStep>(first[0]).targetTriple,
      "aarch64-unknown-linux-gnu"
  );
  assertEq(
      std::get<GenericBuildStep>(first[3]).targetTriple,
      "x86_64-unknown-linux-musl"
  );

  pass();
}

static void
testMissingBuildCommandIsPreconditionFailure() {
  DistGraph graph;
  graph.binaries = { bin("x86_64-unknown-linux-gnu", "out/app", { "d/app" }) };

  const auto res = computeGenericBuilds(graph);
  assertTrue(res.is_err());
  assertContains(
      res.unwrap_err()->what(), "a build command is mandatory for generic builds"
  );
  assertTrue(computeBuildSteps(graph).is_err());

  graph.buildCommand = std::vector<std::string>{};
  assertTrue(computeGenericBuilds(graph).is_err());

  pass();
}

static void
testBuildStepsFilterAndExtras() {
  DistGraph graph;
  graph.buildCommand = BUILD_COMMAND;
  graph.binaries = {
    bin("x86_64-unknown-linux-gnu", "out/app", { "dist/linux/app" }),
    bin("x86_64-apple-darwin", "out/app", { "dist/mac/app" }),
  };
  graph.extraBuilds = { ExtraBuildStep{ .buildCommand = { "./gen.sh" },
                                        .expectedArtifacts = { "schema.json" } } };

  const auto all = computeBuildSteps(graph).unwrap();
  assertEq(all.size(), 3UL);
  assertTrue(std::holds_alternative<ExtraBuildStep>(all[2]));
  assertEq(
      describeStep(graph, all[0]),
      "x86_64-apple-darwin: out/app (via `make dist`)"
  );
  assertEq(
      describeStep(graph, all[2]),
      "extra artifacts: schema.json (via `./gen.sh`)"
  );

  const std::vector<TargetTriple> wanted = { "x86_64-unknown-linux-gnu" };
  const auto filtered = computeBuildSteps(graph, wanted).unwrap();
  assertEq(filtered.size(), 2UL);
  assertEq(
      std::get<GenericBuildStep>(filtered[0]).targetTriple,
      "x86_64-unknown-linux-gnu"
  );
  assertTrue(std::holds_alternative<ExtraBuildStep>(filtered[1]));

  pass();
}

}  // namespace tests

int
main() {
  tests::testNoCopyDestinationsMeansNoSteps();
  tests::testGroupsByTargetInSortedOrder();
  tests::testPlanningIsDeterministic();
  tests::testMissingBuildCommandIsPreconditionFailure();
  tests::testBuildStepsFilterAndExtras();
}

#endif
