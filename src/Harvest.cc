#include "Harvest.hpp"

#include "Algos.hpp"
#include "Command.hpp"
#include "Compiler.hpp"
#include "Rustify/Result.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace distbuild {

// Variables worth forwarding from the bundle environment; everything else it
// exports is Homebrew bookkeeping.
static constexpr std::array<std::string_view, 5> FORWARDED_VARS = {
  "PATH", "PKG_CONFIG_PATH", "PKG_CONFIG_LIBDIR", "CMAKE_INCLUDE_PATH",
  "CMAKE_LIBRARY_PATH",
};

Tools
Tools::discover() noexcept {
  Tools tools;
#if defined(__APPLE__)
  if (commandExists("brew")) {
    tools.brew = "brew";
  }
#endif
  return tools;
}

std::optional<Command>
brewEnvQuery(const Tools& tools) {
  if (!tools.brew.has_value()) {
    spdlog::trace("brew not available; no external environment");
    return std::nullopt;
  }
  if (!fs::exists(BREWFILE)) {
    spdlog::trace("no {} in {}", BREWFILE, fs::current_path().string());
    return std::nullopt;
  }
  // Let brew bundle print the environment it would run a command under.
  return Command(*tools.brew)
      .addArg("bundle")
      .addArg("exec")
      .addArg("--")
      .addArg("/usr/bin/env");
}

std::optional<std::string>
fetchEnv(const Command& query) noexcept {
  const Result<std::string> output = getCmdOutput(query, /*retry=*/1);
  if (output.is_err()) {
    spdlog::debug(
        "external environment unavailable: {}", output.unwrap_err()->what()
    );
    return std::nullopt;
  }
  if (output.unwrap().empty()) {
    spdlog::debug("`{}` printed nothing", query.toString());
    return std::nullopt;
  }
  return output.unwrap();
}

Result<EnvMap>
parseEnv(std::string_view output) {
  const std::size_t end = output.find_last_not_of(" \t\r\n");
  output = end == std::string_view::npos ? "" : output.substr(0, end + 1);

  EnvMap env;
  for (const std::string_view line : split(output, '\n')) {
    const auto pair = splitOnce(line, '=');
    if (!pair.has_value()) {
      Bail(
          "failed to parse environment variables: `{}` is not a KEY=VALUE pair",
          line
      );
    }
    env.insert_or_assign(std::string(pair->first), std::string(pair->second));
  }
  return Ok(std::move(env));
}

std::vector<EnvVar>
selectBrewEnv(const EnvMap& env) {
  std::vector<EnvVar> selected;
  for (const std::string_view name : FORWARDED_VARS) {
    if (const auto itr = env.find(name); itr != env.end()) {
      selected.emplace_back(itr->first, itr->second);
    }
  }
  return selected;
}

std::vector<std::pair<std::string, fs::path>>
formulasFromEnv(const EnvMap& env) {
  std::vector<std::pair<std::string, fs::path>> formulas;

  // HOMEBREW_DEPENDENCIES: comma-separated, the whole tree the Brewfile pulls
  // in.  HOMEBREW_OPT: the opt/ directory every formula is linked under.
  const auto deps = env.find("HOMEBREW_DEPENDENCIES");
  const auto opt = env.find("HOMEBREW_OPT");
  if (deps == env.end() || opt == env.end()) {
    return formulas;
  }

  for (const std::string_view dep : split(deps->second, ',')) {
    if (dep.empty()) {
      continue;
    }
    // Tapped formulae come as `owner/tap/name`; opt/ only uses `name`.
    const std::size_t slash = dep.find_last_of('/');
    const std::string_view shortName =
        slash == std::string_view::npos ? dep : dep.substr(slash + 1);
    formulas.emplace_back(std::string(dep), fs::path(opt->second) / shortName);
  }
  return formulas;
}

std::string
calculateCFlags(const EnvMap& env) {
  CFlags cflags;
  for (const auto& [formula, prefix] : formulasFromEnv(env)) {
    cflags.includeDirs.emplace_back(prefix / "include");
  }
  return cflags.toString();
}

std::string
calculateLdFlags(const EnvMap& env) {
  LdFlags ldflags;
  for (const auto& [formula, prefix] : formulasFromEnv(env)) {
    ldflags.libDirs.emplace_back(prefix / "lib");
  }
  return ldflags.toString();
}

Result<HarvestedEnv>
harvestEnv(const Environment& ambient, const std::optional<Command>& query) {
  if (ambient.contains(SKIP_BREWFILE_ENV)) {
    spdlog::debug("{} is set; skipping {}", SKIP_BREWFILE_ENV, BREWFILE);
    return Ok(HarvestedEnv{});
  }
  if (!query.has_value()) {
    return Ok(HarvestedEnv{});
  }

  const std::optional<std::string> output = fetchEnv(*query);
  if (!output.has_value()) {
    return Ok(HarvestedEnv{});
  }

  // Output that was produced but cannot be read is an error, unlike a
  // query that could not run.
  const EnvMap env = Try(parseEnv(*output));

  HarvestedEnv harvested;
  harvested.vars = selectBrewEnv(env);
  if (std::string cflags = calculateCFlags(env); !cflags.empty()) {
    harvested.cflags = std::move(cflags);
  }
  if (std::string ldflags = calculateLdFlags(env); !ldflags.empty()) {
    harvested.ldflags = std::move(ldflags);
  }
  spdlog::debug(
      "harvested {} variable(s) from `{}`", harvested.vars.size(),
      query->toString()
  );
  return Ok(std::move(harvested));
}

}  // namespace distbuild

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)

static constexpr std::string_view BREW_ENV_DUMP =
    "HOMEBREW_PREFIX=/opt/homebrew\n"
    "HOMEBREW_OPT=/opt/homebrew/opt\n"
    "HOMEBREW_DEPENDENCIES=openssl@3,homebrew/core/libpng,ca-certificates\n"
    "PATH=/opt/homebrew/bin:/usr/bin:/bin\n"
    "PKG_CONFIG_PATH=/opt/homebrew/opt/openssl@3/lib/pkgconfig\n"
    "CMAKE_INCLUDE_PATH=/opt/homebrew/include\n"
    "HOMEBREW_NO_AUTO_UPDATE=1\n"
    "EMPTY=\n";

static Command
printingQuery(const std::string_view text) {
  return Command("printf").addArg("%s").addArg(text);
}

static void
testParseEnv() {
  const EnvMap env = parseEnv(BREW_ENV_DUMP).unwrap();
  assertEq(env.size(), 8UL);
  assertEq(env.at("HOMEBREW_OPT"), "/opt/homebrew/opt");
  assertEq(env.at("EMPTY"), "");

  // Values may contain `=`; only the first one separates.
  assertEq(parseEnv("A=b=c").unwrap().at("A"), "b=c");
  // Trailing newlines are not an empty entry.
  assertEq(parseEnv("A=1\n\n\n").unwrap().size(), 1UL);

  pass();
}

static void
testParseEnvRejectsMalformedLines() {
  const auto res = parseEnv("A=1\nthis is not an assignment\nB=2");
  assertTrue(res.is_err());
  assertEq(
      std::string(res.unwrap_err()->what()),
      "failed to parse environment variables: `this is not an assignment` is "
      "not a KEY=VALUE pair"
  );

  assertTrue(parseEnv("A=1\n\nB=2").is_err());

  pass();
}

static void
testSelectBrewEnv() {
  const EnvMap env = parseEnv(BREW_ENV_DUMP).unwrap();
  const std::vector<EnvVar> selected = selectBrewEnv(env);
  assertEq(selected.size(), 3UL);
  assertEq(selected[0].first, "PATH");
  assertEq(selected[1].first, "PKG_CONFIG_PATH");
  assertEq(selected[2].first, "CMAKE_INCLUDE_PATH");
  assertEq(selected[2].second, "/opt/homebrew/include");

  assertTrue(selectBrewEnv(EnvMap{ { "HOMEBREW_PREFIX", "/x" } }).empty());

  pass();
}

static void
testCalculateFlags() {
  const EnvMap env = parseEnv(BREW_ENV_DUMP).unwrap();

  const auto formulas = formulasFromEnv(env);
  assertEq(formulas.size(), 3UL);
  assertEq(formulas[1].first, "homebrew/core/libpng");
  assertEq(formulas[1].second.string(), "/opt/homebrew/opt/libpng");

  assertEq(
      calculateCFlags(env),
      "-I/opt/homebrew/opt/openssl@3/include -I/opt/homebrew/opt/libpng/include "
      "-I/opt/homebrew/opt/ca-certificates/include"
  );
  assertEq(
      calculateLdFlags(env),
      "-L/opt/homebrew/opt/openssl@3/lib -L/opt/homebrew/opt/libpng/lib "
      "-L/opt/homebrew/opt/ca-certificates/lib"
  );

  // Without HOMEBREW_OPT there is no prefix to point at.
  const EnvMap noOpt{ { "HOMEBREW_DEPENDENCIES", "zlib" } };
  assertEq(calculateCFlags(noOpt), "");
  assertEq(calculateLdFlags(noOpt), "");

  pass();
}

static void
testHarvestEnv() {
  const HarvestedEnv harvested =
      harvestEnv(Environment{}, printingQuery(BREW_ENV_DUMP)).unwrap();
  assertEq(harvested.vars.size(), 3UL);
  assertTrue(harvested.cflags.has_value());
  assertContains(*harvested.cflags, "-I/opt/homebrew/opt/libpng/include");
  assertTrue(harvested.ldflags.has_value());
  assertContains(*harvested.ldflags, "-L/opt/homebrew/opt/openssl@3/lib");

  // No formulas: variables still flow, flags stay unset.
  const HarvestedEnv noDeps =
      harvestEnv(Environment{}, printingQuery("PATH=/bin\n")).unwrap();
  assertEq(noDeps.vars.size(), 1UL);
  assertFalse(noDeps.cflags.has_value());
  assertFalse(noDeps.ldflags.has_value());

  pass();
}

static void
testHarvestEnvSkippedBySentinel() {
  const Environment ambient{ { std::string(SKIP_BREWFILE_ENV), "1" } };
  const HarvestedEnv harvested =
      harvestEnv(ambient, printingQuery(BREW_ENV_DUMP)).unwrap();
  assertTrue(harvested.empty());

  // The sentinel wins even over output that would not parse.
  assertTrue(harvestEnv(ambient, printingQuery("garbage")).unwrap().empty());

  pass();
}

static void
testHarvestEnvDegradesGracefully() {
  // No query at all.
  assertTrue(harvestEnv(Environment{}, std::nullopt).unwrap().empty());
  // The tool is missing.
  assertTrue(
      harvestEnv(Environment{}, Command("distbuild-no-such-brew-xyz"))
          .unwrap()
          .empty()
  );
  // The tool fails.
  assertTrue(harvestEnv(
                 Environment{},
                 Command("sh").addArg("-c").addArg("echo PATH=/x; exit 1")
  )
                 .unwrap()
                 .empty());
  // The tool succeeds but says nothing.
  assertTrue(harvestEnv(Environment{}, Command("true")).unwrap().empty());

  // But output that was produced and is malformed is surfaced.
  assertTrue(harvestEnv(Environment{}, printingQuery("garbage")).is_err());

  pass();
}

static void
testBrewEnvQuery() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());

  assertFalse(brewEnvQuery(Tools{}).has_value());

  const Tools tools{ .brew = "/usr/local/bin/brew" };
  assertFalse(brewEnvQuery(tools).has_value());  // no Brewfile yet

  writeFile(tmp / BREWFILE, "brew \"openssl@3\"\n");
  const std::optional<Command> query = brewEnvQuery(tools);
  assertTrue(query.has_value());
  assertEq(
      query->toString(), "/usr/local/bin/brew bundle exec -- /usr/bin/env"
  );

  pass();
}

}  // namespace tests

int
main() {
  tests::testParseEnv();
  tests::testParseEnvRejectsMalformedLines();
  tests::testSelectBrewEnv();
  tests::testCalculateFlags();
  tests::testHarvestEnv();
  tests::testHarvestEnvSkippedBySentinel();
  tests::testHarvestEnvDegradesGracefully();
  tests::testBrewEnvQuery();
}

#endif
