#include "Artifacts.hpp"

#include "Diag.hpp"
#include "Rustify/Result.hpp"

#include <filesystem>
#include <spdlog/spdlog.h>
#include <system_error>

namespace distbuild {

static Result<void>
ensureBuilt(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    Bail(
        "failed to find bin {} -- did the build above have errors?",
        path.string()
    );
  }
  return Ok();
}

Result<void>
copyFile(const fs::path& from, const fs::path& to) {
  spdlog::debug("copying {} -> {}", from.string(), to.string());

  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    Bail(
        "failed to copy file {} -> {}: {}", from.string(), to.string(),
        ec.message()
    );
  }
  return Ok();
}

Result<void>
reconcileBinaries(const DistGraph& graph, const GenericBuildStep& step) {
  for (const BinaryIdx idx : step.expectedBinaries) {
    const Binary& binary = graph.binary(idx);
    Try(ensureBuilt(binary.fileName));

    for (const fs::path& dest : binary.copyExeTo) {
      Diag::verbose("Copying {} to {}", binary.fileName.string(), dest.string());
      Try(copyFile(binary.fileName, dest));
    }
    if (!binary.copySymbolsTo.empty()) {
      spdlog::debug(
          "{}: symbols are not collected from generic builds",
          binary.fileName.string()
      );
    }
  }
  return Ok();
}

Result<void>
reconcileExtraArtifacts(const fs::path& distDir, const ExtraBuildStep& step) {
  for (const fs::path& artifact : step.expectedArtifacts) {
    Try(ensureBuilt(artifact));

    const fs::path dest = distDir / artifact;
    Diag::verbose("Copying {} to {}", artifact.string(), dest.string());
    Try(copyFile(artifact, dest));
  }
  return Ok();
}

}  // namespace distbuild

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testCopyFile() {
  const TempDir tmp;
  writeFile(tmp / "src.bin", "payload");

  assertTrue(copyFile(tmp / "src.bin", tmp / "dst.bin").is_ok());
  assertEq(readFile(tmp / "dst.bin"), "payload");

  // An existing destination is replaced.
  writeFile(tmp / "src.bin", "newer payload");
  assertTrue(copyFile(tmp / "src.bin", tmp / "dst.bin").is_ok());
  assertEq(readFile(tmp / "dst.bin"), "newer payload");

  pass();
}

static void
testCopyFileFailures() {
  const TempDir tmp;
  writeFile(tmp / "src.bin", "payload");

  // Missing parents are not created.
  const fs::path dest = tmp / "no" / "such" / "dir" / "dst.bin";
  const auto res = copyFile(tmp / "src.bin", dest);
  assertTrue(res.is_err());
  const std::string msg = res.unwrap_err()->what();
  assertContains(msg, "failed to copy file ");
  assertContains(msg, (tmp / "src.bin").string());
  assertContains(msg, dest.string());
  assertFalse(fs::exists(tmp / "no"));

  assertTrue(copyFile(tmp / "missing.bin", tmp / "dst.bin").is_err());

  pass();
}

static void
testReconcileBinariesCopiesToEveryDestination() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeFile("out/app", "\x7f" "ELF app");
  for (const char* dir : { "dist/a", "dist/b", "dist/c" }) {
    fs::create_directories(dir);
  }

  DistGraph graph;
  graph.binaries = { Binary{
      .target = "x86_64-unknown-linux-gnu",
      .fileName = "out/app",
      .copyExeTo = { "dist/a/app", "dist/b/app", "dist/c/app-renamed" },
      .copySymbolsTo = { "dist/a/app.debug" },
  } };
  const GenericBuildStep step{ .targetTriple = "x86_64-unknown-linux-gnu",
                               .expectedBinaries = { BinaryIdx{ 0 } },
                               .buildCommand = { "make" } };

  assertTrue(reconcileBinaries(graph, step).is_ok());
  for (const char* dest :
       { "dist/a/app", "dist/b/app", "dist/c/app-renamed" }) {
    assertEq(readFile(dest), "\x7f" "ELF app");
  }
  // Symbol destinations are left alone.
  assertFalse(fs::exists("dist/a/app.debug"));

  pass();
}

static void
testReconcileBinariesMissing() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeFile("out/first", "1");
  fs::create_directories("dist");

  DistGraph graph;
  graph.binaries = {
    Binary{ .target = "t",
            .fileName = "out/first",
            .copyExeTo = { "dist/first" },
            .copySymbolsTo = {} },
    Binary{ .target = "t",
            .fileName = "out/second",
            .copyExeTo = { "dist/second" },
            .copySymbolsTo = {} },
  };
  const GenericBuildStep step{ .targetTriple = "t",
                               .expectedBinaries = { BinaryIdx{ 0 },
                                                     BinaryIdx{ 1 } },
                               .buildCommand = { "make" } };

  const auto res = reconcileBinaries(graph, step);
  assertTrue(res.is_err());
  assertEq(
      std::string(res.unwrap_err()->what()),
      "failed to find bin out/second -- did the build above have errors?"
  );
  // Binaries before the missing one were still delivered.
  assertEq(readFile("dist/first"), "1");

  pass();
}

static void
testReconcileExtraArtifacts() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeFile("schema.json", "{}");
  writeFile("docs/manual.html", "<html/>");
  fs::create_directories("target/distrib/docs");

  const ExtraBuildStep step{ .buildCommand = { "./gen.sh" },
                             .expectedArtifacts = { "schema.json",
                                                    "docs/manual.html" } };
  assertTrue(reconcileExtraArtifacts("target/distrib", step).is_ok());
  assertEq(readFile("target/distrib/schema.json"), "{}");
  assertEq(readFile("target/distrib/docs/manual.html"), "<html/>");

  const ExtraBuildStep missing{ .buildCommand = { "./gen.sh" },
                                .expectedArtifacts = { "openapi.yaml" } };
  const auto res = reconcileExtraArtifacts("target/distrib", missing);
  assertTrue(res.is_err());
  assertContains(res.unwrap_err()->what(), "failed to find bin openapi.yaml");

  pass();
}

}  // namespace tests

int
main() {
  tests::testCopyFile();
  tests::testCopyFileFailures();
  tests::testReconcileBinariesCopiesToEveryDestination();
  tests::testReconcileBinariesMissing();
  tests::testReconcileExtraArtifacts();
}

#endif
