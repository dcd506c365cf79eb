#include "Executor.hpp"

#include "Command.hpp"
#include "Compiler.hpp"
#include "Diag.hpp"
#include "Harvest.hpp"
#include "Rustify/Result.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <span>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace distbuild {

Environment
resolveBuildEnv(
    const Environment& ambient, const HarvestedEnv& harvested,
    const std::optional<std::string_view> target
) {
  Environment env = ambient.with(harvested.vars);

  // CPPFLAGS is strictly for the preprocessor, but many build systems read
  // either one, so both get the include directories.
  std::vector<EnvVar> flags;
  if (harvested.cflags.has_value()) {
    flags.emplace_back("CFLAGS", *harvested.cflags);
    flags.emplace_back("CPPFLAGS", *harvested.cflags);
  }
  if (harvested.ldflags.has_value()) {
    flags.emplace_back("LDFLAGS", *harvested.ldflags);
  }
  env = env.with(flags);

  if (!target.has_value()) {
    return env;
  }

  const PlatformFamily family = classifyTarget(*target);
  const Toolchain toolchain = defaultToolchain(family);
  if (family == PlatformFamily::Unknown) {
    spdlog::debug(
        "unrecognized target `{}`; defaulting to {}/{}", *target, toolchain.cc,
        toolchain.cxx
    );
  } else {
    spdlog::trace("{} is a {} target", *target, family);
  }

  const std::vector<EnvVar> targetVars = {
    { "CARGO_DIST_TARGET", std::string(*target) },
    { "CC", std::string(ambient.get("CC").value_or(toolchain.cc)) },
    { "CXX", std::string(ambient.get("CXX").value_or(toolchain.cxx)) },
  };
  return env.with(targetVars);
}

Result<CommandOutput>
runBuild(
    const DistGraph& graph, const Environment& ambient,
    const std::span<const std::string> command,
    const std::optional<std::string_view> target
) {
  const HarvestedEnv harvested =
      Try(harvestEnv(ambient, brewEnvQuery(graph.tools)));
  Environment env = resolveBuildEnv(ambient, harvested, target);

  // -vv shows what the build sees on top of the caller's environment.
  if (Diag::enabled(DiagLevel::VeryVerbose)) {
    for (const auto& [name, value] : env.entries()) {
      const auto prev = ambient.get(name);
      if (!prev.has_value() || *prev != value) {
        Diag::veryVerbose("env: {}={}", name, value);
      }
    }
  }

  Command cmd = Try(Command::fromArgv(command));
  cmd.setStdOutConfig(Command::IOConfig::Piped)
      .setStdErrConfig(Command::IOConfig::Inherit)
      .setEnvironment(std::move(env));

  spdlog::debug("exec: {}", cmd);
  const std::string cmdStr = fmt::format("{}", fmt::join(command, " "));
  const Child child = Try(withContext(
      cmd.spawn(), "failed to exec generic build: `{}`", cmdStr
  ));
  return withContext(
      child.waitWithOutput(), "failed to exec generic build: `{}`", cmdStr
  );
}

}  // namespace distbuild

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)

static HarvestedEnv
brewHarvest() {
  return HarvestedEnv{
    .vars = { { "PATH", "/opt/homebrew/bin:/usr/bin:/bin" },
              { "PKG_CONFIG_PATH", "/opt/homebrew/lib/pkgconfig" } },
    .cflags = "-I/opt/homebrew/opt/zlib/include",
    .ldflags = "-L/opt/homebrew/opt/zlib/lib",
  };
}

static void
testResolveBuildEnvLayers() {
  const Environment ambient{ { "PATH", "/usr/bin" }, { "HOME", "/home/me" } };
  const Environment env =
      resolveBuildEnv(ambient, brewHarvest(), "x86_64-unknown-linux-gnu");

  assertEq(*env.get("PATH"), "/opt/homebrew/bin:/usr/bin:/bin");
  assertEq(*env.get("HOME"), "/home/me");
  assertEq(*env.get("PKG_CONFIG_PATH"), "/opt/homebrew/lib/pkgconfig");
  assertEq(*env.get("CFLAGS"), "-I/opt/homebrew/opt/zlib/include");
  assertEq(*env.get("CPPFLAGS"), "-I/opt/homebrew/opt/zlib/include");
  assertEq(*env.get("LDFLAGS"), "-L/opt/homebrew/opt/zlib/lib");
  assertEq(*env.get("CARGO_DIST_TARGET"), "x86_64-unknown-linux-gnu");
  assertEq(*env.get("CC"), "gcc");
  assertEq(*env.get("CXX"), "g++");

  // The ambient snapshot is left as it was.
  assertEq(*ambient.get("PATH"), "/usr/bin");
  assertFalse(ambient.contains("CC"));

  pass();
}

static void
testResolveBuildEnvWithoutTarget() {
  const Environment ambient{ { "PATH", "/usr/bin" } };
  const Environment env = resolveBuildEnv(ambient, brewHarvest(), std::nullopt);

  assertTrue(env.contains("CFLAGS"));
  assertFalse(env.contains("CARGO_DIST_TARGET"));
  assertFalse(env.contains("CC"));
  assertFalse(env.contains("CXX"));

  // Nothing harvested: the ambient environment goes through untouched.
  assertEq(resolveBuildEnv(ambient, HarvestedEnv{}, std::nullopt), ambient);

  pass();
}

static void
testResolveBuildEnvCompilerOverrides() {
  const Environment ambient{ { "CC", "my-cc" }, { "CXX", "my-c++" } };
  for (const std::string_view target :
       { "x86_64-apple-darwin", "x86_64-pc-windows-msvc",
         "riscv64gc-unknown-none-elf" }) {
    const Environment env = resolveBuildEnv(ambient, HarvestedEnv{}, target);
    assertEq(*env.get("CC"), "my-cc");
    assertEq(*env.get("CXX"), "my-c++");
  }

  // Only CC is overridden; CXX falls back to the target's default.
  const Environment env = resolveBuildEnv(
      Environment{ { "CC", "my-cc" } }, HarvestedEnv{}, "aarch64-apple-darwin"
  );
  assertEq(*env.get("CC"), "my-cc");
  assertEq(*env.get("CXX"), "clang++");

  const Environment unknown =
      resolveBuildEnv(Environment{}, HarvestedEnv{}, "wasm32-wasi");
  assertEq(*unknown.get("CC"), "cc");
  assertEq(*unknown.get("CXX"), "c++");

  pass();
}

static void
testResolveBuildEnvSentinelMeansNoFlags() {
  const Environment ambient{
    { std::string(SKIP_BREWFILE_ENV), "1" },
    { "PATH", "/usr/bin" },
  };
  const Command query =
      Command("printf").addArg("%s").addArg(
          "HOMEBREW_OPT=/opt/homebrew/opt\nHOMEBREW_DEPENDENCIES=zlib\n"
          "PATH=/opt/homebrew/bin\n"
      );
  const HarvestedEnv harvested = harvestEnv(ambient, query).unwrap();
  const Environment env =
      resolveBuildEnv(ambient, harvested, "x86_64-apple-darwin");

  assertFalse(env.contains("CFLAGS"));
  assertFalse(env.contains("CPPFLAGS"));
  assertFalse(env.contains("LDFLAGS"));
  assertEq(*env.get("PATH"), "/usr/bin");

  pass();
}

static void
testRunBuildCapturesStdoutInResolvedEnv() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());
  writeScript(
      tmp / "build.sh",
      "echo \"target=$CARGO_DIST_TARGET cc=$CC\"\n"
      "echo \"secret=${DISTBUILD_TEST_SECRET:-unset}\"\n"
      "exit 2\n"
  );

  const Environment ambient = Environment::capture().with(
      std::string(SKIP_BREWFILE_ENV), "1"
  );
  const std::vector<std::string> command = { "./build.sh" };

  const CommandOutput out =
      runBuild(DistGraph{}, ambient, command, "x86_64-unknown-linux-gnu")
          .unwrap();
  assertFalse(out.exitStatus.success());
  assertEq(out.exitStatus.exitCode(), 2);
  assertContains(out.stdOut, "target=x86_64-unknown-linux-gnu");
  // Only the given environment reaches the child.
  assertContains(out.stdOut, "secret=unset");

  const CommandOutput withSecret =
      runBuild(
          DistGraph{}, ambient.with("DISTBUILD_TEST_SECRET", "42"), command,
          std::nullopt
      )
          .unwrap();
  assertContains(withSecret.stdOut, "secret=42");
  assertContains(withSecret.stdOut, "target= ");

  pass();
}

static void
testRunBuildExecFailure() {
  const TempDir tmp;
  const CurrentPathGuard guard(tmp.path());

  const std::vector<std::string> command = { "./does-not-exist", "--flag" };
  const auto res = runBuild(
      DistGraph{}, Environment::capture(), command, "x86_64-apple-darwin"
  );
  assertTrue(res.is_err());
  const std::string msg = res.unwrap_err()->what();
  assertContains(msg, "failed to exec generic build: `./does-not-exist --flag`");

  // Not executable.
  writeFile(tmp / "plain.txt", "echo hi\n");
  const std::vector<std::string> plain = { "./plain.txt" };
  assertTrue(
      runBuild(DistGraph{}, Environment::capture(), plain, std::nullopt)
          .is_err()
  );

  pass();
}

}  // namespace tests

int
main() {
  tests::testResolveBuildEnvLayers();
  tests::testResolveBuildEnvWithoutTarget();
  tests::testResolveBuildEnvCompilerOverrides();
  tests::testResolveBuildEnvSentinelMeansNoFlags();
  tests::testRunBuildCapturesStdoutInResolvedEnv();
  tests::testRunBuildExecFailure();
}

#endif
