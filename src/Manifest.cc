#include "Manifest.hpp"

#include "Rustify/Result.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace distbuild {

// toml11 prefixes its messages with "[error] " (colored when enabled) and
// ends them with a newline; Diag::error adds both back in its own way.
static std::string
trimTomlError(std::string what) {
  using std::string_view_literals::operator""sv;

  static constexpr std::size_t errorPrefixSize = "[error] "sv.size();
  static constexpr std::size_t colorErrorPrefixSize =
      "\033[31m\033[01m[error]\033[00m "sv.size();

  if (shouldColorStderr() && what.starts_with("\033[31m")) {
    what = what.substr(colorErrorPrefixSize);
  } else if (what.starts_with("[error] ")) {
    what = what.substr(errorPrefixSize);
  }
  if (!what.empty() && what.back() == '\n') {
    what.pop_back();
  }
  return what;
}

static void
syncTomlColor() noexcept {
  if (shouldColorStderr()) {
    toml::color::enable();
  } else {
    toml::color::disable();
  }
}

template <typename T, typename... Keys>
static Result<T>
tryFind(const toml::value& val, const Keys&... keys) noexcept {
  syncTomlColor();
  try {
    return Ok(toml::find<T>(val, keys...));
  } catch (const std::exception& e) {
    return Err(anyhow::anyhow(trimTomlError(e.what())));
  }
}

static bool
hasKey(const toml::value& val, const std::string& key) {
  return val.is_table() && val.as_table().contains(key);
}

static Result<std::vector<std::string>>
parseCommand(const toml::value& val, const char* key, std::string_view where) {
  std::vector<std::string> command =
      Try(tryFind<std::vector<std::string>>(val, key));
  Ensure(!command.empty(), "`{}.{}` must not be empty", where, key);
  Ensure(
      !command.front().empty(), "`{}.{}` must name a program", where, key
  );
  return Ok(std::move(command));
}

static std::vector<fs::path>
toPaths(const std::vector<std::string>& strs) {
  return { strs.begin(), strs.end() };
}

Result<DistConfig>
DistConfig::tryFromToml(const toml::value& val) noexcept {
  if (!hasKey(val, "dist")) {
    return Ok(DistConfig(std::nullopt, DEFAULT_DIST_DIR));
  }
  const toml::value& dist = val.at("dist");

  std::optional<std::vector<std::string>> buildCommand;
  if (hasKey(dist, "build-command")) {
    buildCommand = Try(parseCommand(dist, "build-command", "dist"));
  }

  std::string distDir = DEFAULT_DIST_DIR;
  if (hasKey(dist, "dist-dir")) {
    distDir = Try(tryFind<std::string>(dist, "dist-dir"));
    Ensure(!distDir.empty(), "`dist.dist-dir` must not be empty");
  }
  return Ok(DistConfig(std::move(buildCommand), std::move(distDir)));
}

// Absent means no destinations; a present value must be an array of strings.
static Result<std::vector<fs::path>>
parseCopyList(const toml::value& val, const std::string& key) {
  if (!hasKey(val, key)) {
    return Ok(std::vector<fs::path>{});
  }
  return Ok(toPaths(Try(tryFind<std::vector<std::string>>(val, key))));
}

static Result<Binary>
parseBinary(const toml::value& val, const std::size_t idx) {
  const std::string where = fmt::format("bin[{}]", idx);

  std::string target = Try(tryFind<std::string>(val, "target"));
  Ensure(!target.empty(), "`{}.target` must not be empty", where);
  const std::string fileName = Try(tryFind<std::string>(val, "file-name"));
  Ensure(!fileName.empty(), "`{}.file-name` must not be empty", where);

  std::vector<fs::path> copyExeTo = Try(parseCopyList(val, "copy-exe-to"));
  std::vector<fs::path> copySymbolsTo =
      Try(parseCopyList(val, "copy-symbols-to"));

  return Ok(Binary{ .target = std::move(target),
                    .fileName = fileName,
                    .copyExeTo = std::move(copyExeTo),
                    .copySymbolsTo = std::move(copySymbolsTo) });
}

static Result<ExtraBuildStep>
parseExtraArtifacts(const toml::value& val, const std::size_t idx) {
  const std::string where = fmt::format("extra-artifacts[{}]", idx);

  std::vector<std::string> build = Try(parseCommand(val, "build", where));
  const std::vector<std::string> declared =
      Try(tryFind<std::vector<std::string>>(val, "artifacts"));
  std::vector<fs::path> artifacts;
  for (const std::string& artifact : declared) {
    const fs::path path = artifact;
    Ensure(!artifact.empty(), "`{}.artifacts` has an empty path", where);
    Ensure(
        path.is_relative(), "`{}.artifacts` must be relative paths: `{}`",
        where, artifact
    );
    const bool escapes = std::ranges::any_of(path, [](const fs::path& part) {
      return part == "..";
    });
    Ensure(
        !escapes, "`{}.artifacts` must stay inside the dist dir: `{}`", where,
        artifact
    );
    artifacts.push_back(path);
  }
  return Ok(ExtraBuildStep{ .buildCommand = std::move(build),
                            .expectedArtifacts = std::move(artifacts) });
}

template <typename T, typename F>
static Result<std::vector<T>>
parseArrayOfTables(const toml::value& data, const char* key, F&& parseOne) {
  std::vector<T> parsed;
  if (!hasKey(data, key)) {
    return Ok(std::move(parsed));
  }

  const toml::array entries = Try(tryFind<toml::array>(data, key));
  parsed.reserve(entries.size());
  for (std::size_t i = 0; i < entries.size(); ++i) {
    Ensure(entries[i].is_table(), "`{}[{}]` must be a table", key, i);
    parsed.push_back(Try(parseOne(entries[i], i)));
  }
  return Ok(std::move(parsed));
}

Result<Manifest>
Manifest::tryParse(fs::path path, const bool findParents) noexcept {
  if (findParents) {
    path = Try(findPath(path.parent_path()));
  }
  spdlog::debug("Parsing manifest: {}", path.string());

  syncTomlColor();
  toml::value data;
  try {
    data = toml::parse(path);
  } catch (const std::exception& e) {
    return Err(anyhow::anyhow(trimTomlError(e.what())));
  }
  return withContext(
      tryFromToml(data, path), "invalid manifest: {}", path.string()
  );
}

Result<Manifest>
Manifest::tryFromToml(const toml::value& data, fs::path path) noexcept {
  DistConfig dist = Try(DistConfig::tryFromToml(data));
  std::vector<Binary> binaries =
      Try(parseArrayOfTables<Binary>(data, "bin", parseBinary));
  std::vector<ExtraBuildStep> extraArtifacts = Try(
      parseArrayOfTables<ExtraBuildStep>(
          data, "extra-artifacts", parseExtraArtifacts
      )
  );

  return Ok(Manifest(
      std::move(path), std::move(dist), std::move(binaries),
      std::move(extraArtifacts)
  ));
}

Result<fs::path>
Manifest::findPath(fs::path candidateDir) noexcept {
  const fs::path origCandDir = candidateDir;
  while (true) {
    const fs::path configPath = candidateDir / FILE_NAME;
    spdlog::trace("Finding manifest: {}", configPath.string());
    if (fs::exists(configPath)) {
      return Ok(configPath);
    }

    const fs::path parentPath = candidateDir.parent_path();
    if (candidateDir.has_parent_path() && parentPath != candidateDir) {
      candidateDir = parentPath;
    } else {
      break;
    }
  }

  Bail("{} not found in `{}` and its parents", FILE_NAME, origCandDir.string());
}

DistGraph
Manifest::toDistGraph(Tools tools) const {
  DistGraph graph;
  graph.binaries = binaries;
  graph.extraBuilds = extraArtifacts;
  graph.buildCommand = dist.buildCommand;
  graph.distDir = dist.distDir;
  graph.tools = std::move(tools);
  return graph;
}

}  // namespace distbuild

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

#  include <fmt/ranges.h>
#  include <toml11/fwd/literal_fwd.hpp>

namespace tests {

// NOLINTBEGIN
using namespace distbuild;
using namespace toml::literals::toml_literals;
// NOLINTEND

static void
testFullManifest() {
  const toml::value val = R"(
[dist]
build-command = ["make", "dist"]
dist-dir = "out/distrib"

[[bin]]
target = "x86_64-unknown-linux-gnu"
file-name = "build/app"
copy-exe-to = ["out/distrib/app-linux/app"]

[[bin]]
target = "x86_64-pc-windows-msvc"
file-name = "build/app.exe"
copy-exe-to = ["out/distrib/app-win/app.exe"]
copy-symbols-to = ["out/distrib/app-win/app.pdb"]

[[extra-artifacts]]
build = ["./gen-schema.sh", "--json"]
artifacts = ["schema.json", "docs/schema.html"]
)"_toml;

  const Manifest manifest = Manifest::tryFromToml(val, "dist.toml").unwrap();
  assertEq(manifest.path.string(), "dist.toml");
  assertTrue(manifest.dist.buildCommand.has_value());
  assertEq(
      *manifest.dist.buildCommand, (std::vector<std::string>{ "make", "dist" })
  );
  assertEq(manifest.dist.distDir.string(), "out/distrib");

  assertEq(manifest.binaries.size(), 2UL);
  assertEq(manifest.binaries[0].target, "x86_64-unknown-linux-gnu");
  assertEq(manifest.binaries[0].fileName.string(), "build/app");
  assertEq(manifest.binaries[0].copyExeTo.size(), 1UL);
  assertTrue(manifest.binaries[0].copySymbolsTo.empty());
  assertEq(
      manifest.binaries[1].copySymbolsTo[0].string(),
      "out/distrib/app-win/app.pdb"
  );

  assertEq(manifest.extraArtifacts.size(), 1UL);
  assertEq(
      manifest.extraArtifacts[0].buildCommand,
      (std::vector<std::string>{ "./gen-schema.sh", "--json" })
  );
  assertEq(
      manifest.extraArtifacts[0].expectedArtifacts[1].string(),
      "docs/schema.html"
  );

  pass();
}

static void
testDefaults() {
  const Manifest empty = Manifest::tryFromToml(""_toml).unwrap();
  assertFalse(empty.dist.buildCommand.has_value());
  assertEq(empty.dist.distDir.string(), DistConfig::DEFAULT_DIST_DIR);
  assertTrue(empty.binaries.empty());
  assertTrue(empty.extraArtifacts.empty());

  const toml::value val = R"(
[[bin]]
target = "aarch64-apple-darwin"
file-name = "app"
)"_toml;
  const Manifest noCopies = Manifest::tryFromToml(val).unwrap();
  assertEq(noCopies.binaries.size(), 1UL);
  assertFalse(noCopies.binaries[0].needsCopy());

  pass();
}

static void
testValidation() {
  {
    const toml::value val = R"(
[dist]
build-command = []
)"_toml;
    assertEq(
        std::string(Manifest::tryFromToml(val).unwrap_err()->what()),
        "`dist.build-command` must not be empty"
    );
  }
  {
    const toml::value val = R"(
[[bin]]
target = ""
file-name = "app"
)"_toml;
    assertEq(
        std::string(Manifest::tryFromToml(val).unwrap_err()->what()),
        "`bin[0].target` must not be empty"
    );
  }
  {
    const toml::value val = R"(
[[bin]]
target = "x86_64-apple-darwin"
file-name = "app"

[[bin]]
target = "x86_64-apple-darwin"
file-name = ""
)"_toml;
    assertEq(
        std::string(Manifest::tryFromToml(val).unwrap_err()->what()),
        "`bin[1].file-name` must not be empty"
    );
  }
  {
    const toml::value val = R"(
[[bin]]
file-name = "app"
)"_toml;
    assertTrue(Manifest::tryFromToml(val).is_err());
  }
  {
    const toml::value val = R"(
[[extra-artifacts]]
build = []
artifacts = ["a.txt"]
)"_toml;
    assertEq(
        std::string(Manifest::tryFromToml(val).unwrap_err()->what()),
        "`extra-artifacts[0].build` must not be empty"
    );
  }
  {
    const toml::value val = R"(
[[extra-artifacts]]
build = ["./gen.sh"]
artifacts = ["/etc/passwd"]
)"_toml;
    assertEq(
        std::string(Manifest::tryFromToml(val).unwrap_err()->what()),
        "`extra-artifacts[0].artifacts` must be relative paths: `/etc/passwd`"
    );
  }
  {
    const toml::value val = R"(
[[extra-artifacts]]
build = ["./gen.sh"]
artifacts = ["docs/../../outside.txt"]
)"_toml;
    assertEq(
        std::string(Manifest::tryFromToml(val).unwrap_err()->what()),
        "`extra-artifacts[0].artifacts` must stay inside the dist dir: "
        "`docs/../../outside.txt`"
    );
  }
  {
    // A single string where an array is expected must not silently mean
    // "no destinations".
    const toml::value val = R"(
[[bin]]
target = "x86_64-apple-darwin"
file-name = "app"
copy-exe-to = "target/distrib/app"
)"_toml;
    assertTrue(Manifest::tryFromToml(val).is_err());
  }
  {
    const toml::value val = R"(
[[bin]]
target = "x86_64-apple-darwin"
file-name = "app"
copy-symbols-to = [1, 2]
)"_toml;
    assertTrue(Manifest::tryFromToml(val).is_err());
  }
  {
    const toml::value val = R"(
[dist]
build-command = "make dist"
)"_toml;
    assertTrue(Manifest::tryFromToml(val).is_err());
  }

  pass();
}

static void
testToDistGraph() {
  const toml::value val = R"(
[dist]
build-command = ["make"]

[[bin]]
target = "x86_64-unknown-linux-gnu"
file-name = "app"
copy-exe-to = ["target/distrib/app"]

[[extra-artifacts]]
build = ["./gen.sh"]
artifacts = ["schema.json"]
)"_toml;
  const Manifest manifest = Manifest::tryFromToml(val).unwrap();
  const DistGraph graph =
      manifest.toDistGraph(Tools{ .brew = std::string("brew") });

  assertEq(graph.binaries.size(), 1UL);
  assertEq(graph.extraBuilds.size(), 1UL);
  assertEq(*graph.buildCommand, (std::vector<std::string>{ "make" }));
  assertEq(graph.distDir.string(), "target/distrib");
  assertEq(*graph.tools.brew, "brew");

  pass();
}

static void
testFindPath() {
  const TempDir tmp;
  writeFile(tmp / Manifest::FILE_NAME, "[dist]\n");
  fs::create_directories(tmp / "a" / "b");

  assertEq(
      Manifest::findPath(tmp / "a" / "b").unwrap(), tmp / Manifest::FILE_NAME
  );
  assertEq(Manifest::findPath(tmp.path()).unwrap(), tmp / Manifest::FILE_NAME);

  const TempDir other;
  assertContains(
      Manifest::findPath(other.path()).unwrap_err()->what(),
      "dist.toml not found in"
  );

  pass();
}

static void
testTryParse() {
  const TempDir tmp;
  writeFile(
      tmp / Manifest::FILE_NAME,
      "[dist]\nbuild-command = [\"make\"]\n\n"
      "[[bin]]\ntarget = \"x86_64-apple-darwin\"\nfile-name = \"app\"\n"
  );
  fs::create_directories(tmp / "sub");

  const Manifest manifest =
      Manifest::tryParse(tmp / "sub" / Manifest::FILE_NAME).unwrap();
  assertEq(manifest.path, tmp / Manifest::FILE_NAME);
  assertEq(manifest.binaries.size(), 1UL);

  // Exact path, not looking at parents.
  assertTrue(
      Manifest::tryParse(tmp / "sub" / Manifest::FILE_NAME, false).is_err()
  );

  writeFile(tmp / "broken" / Manifest::FILE_NAME, "[dist\n");
  assertTrue(
      Manifest::tryParse(tmp / "broken" / Manifest::FILE_NAME, false).is_err()
  );

  writeFile(
      tmp / "invalid" / Manifest::FILE_NAME, "[dist]\nbuild-command = []\n"
  );
  const auto invalid =
      Manifest::tryParse(tmp / "invalid" / Manifest::FILE_NAME, false);
  assertTrue(invalid.is_err());
  assertContains(invalid.unwrap_err()->what(), "invalid manifest: ");

  pass();
}

}  // namespace tests

int
main() {
  distbuild::setColorMode("never");

  tests::testFullManifest();
  tests::testDefaults();
  tests::testValidation();
  tests::testToDistGraph();
  tests::testFindPath();
  tests::testTryParse();
}

#endif
