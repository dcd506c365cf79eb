#include "Environment.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(__APPLE__)
#  include <crt_externs.h>
#  define DISTBUILD_ENVIRON (*_NSGetEnviron())  // NOLINT
#else
extern char** environ;  // NOLINT(readability-redundant-declaration)
#  define DISTBUILD_ENVIRON environ  // NOLINT
#endif

namespace distbuild {

Environment
Environment::capture() {
  VarMap vars;
  for (char** env = DISTBUILD_ENVIRON; env != nullptr && *env != nullptr;
       ++env) {
    const std::string_view entry(*env);
    const std::size_t eqPos = entry.find('=');
    if (eqPos == std::string_view::npos) {
      continue;
    }
    // First definition wins, as getenv(3) does.
    vars.emplace(entry.substr(0, eqPos), entry.substr(eqPos + 1));
  }
  return Environment(std::move(vars));
}

std::optional<std::string_view>
Environment::get(const std::string_view name) const {
  const auto itr = vars.find(name);
  if (itr == vars.end()) {
    return std::nullopt;
  }
  return itr->second;
}

bool
Environment::contains(const std::string_view name) const {
  return vars.find(name) != vars.end();
}

Environment
Environment::with(std::string name, std::string value) const {
  VarMap next = vars;
  next.insert_or_assign(std::move(name), std::move(value));
  return Environment(std::move(next));
}

Environment
Environment::with(const std::span<const EnvVar> overrides) const {
  VarMap next = vars;
  for (const auto& [name, value] : overrides) {
    next.insert_or_assign(name, value);
  }
  return Environment(std::move(next));
}

std::vector<std::string>
Environment::toEnvp() const {
  std::vector<std::string> envp;
  envp.reserve(vars.size());
  for (const auto& [name, value] : vars) {
    envp.emplace_back(name + '=' + value);
  }
  return envp;
}

}  // namespace distbuild

auto
fmt::formatter<distbuild::Environment>::format(
    const distbuild::Environment& v, format_context& ctx
) const -> format_context::iterator {
  return formatter<std::string>::format(
      fmt::format("{}", fmt::join(v.toEnvp(), " ")), ctx
  );
}

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

#  include <cstdlib>

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testCaptureReadsProcessEnvironment() {
  setenv("DISTBUILD_TEST_CAPTURE", "a=b=c", 1);
  const Environment env = Environment::capture();
  assertTrue(env.contains("DISTBUILD_TEST_CAPTURE"));
  // Only the first `=` separates the name from the value.
  assertEq(env.get("DISTBUILD_TEST_CAPTURE").value(), "a=b=c");
  unsetenv("DISTBUILD_TEST_CAPTURE");

  // A snapshot does not follow later changes to the process.
  assertTrue(env.contains("DISTBUILD_TEST_CAPTURE"));
  assertFalse(Environment::capture().contains("DISTBUILD_TEST_CAPTURE"));

  pass();
}

static void
testOverlaysDoNotMutate() {
  const Environment base{ { "CC", "gcc" }, { "PATH", "/usr/bin" } };
  const Environment next = base.with("CC", "clang");

  assertEq(base.get("CC").value(), "gcc");
  assertEq(next.get("CC").value(), "clang");
  assertEq(next.get("PATH").value(), "/usr/bin");

  const std::vector<EnvVar> overrides = { { "PATH", "/opt/bin" },
                                          { "LDFLAGS", "-L/opt/lib" } };
  const Environment layered = next.with(overrides);
  assertEq(layered.size(), 3UL);
  assertEq(layered.get("PATH").value(), "/opt/bin");
  assertEq(next.get("PATH").value(), "/usr/bin");
  assertFalse(next.contains("LDFLAGS"));

  pass();
}

static void
testToEnvp() {
  const Environment env{ { "B", "2" }, { "A", "1" }, { "EMPTY", "" } };
  const std::vector<std::string> envp = env.toEnvp();
  assertEq(envp.size(), 3UL);
  assertEq(envp[0], "A=1");
  assertEq(envp[1], "B=2");
  assertEq(envp[2], "EMPTY=");

  assertEq(fmt::format("{}", env), "A=1 B=2 EMPTY=");

  pass();
}

}  // namespace tests

int
main() {
  tests::testCaptureReadsProcessEnvironment();
  tests::testOverlaysDoNotMutate();
  tests::testToEnvp();
}

#endif
