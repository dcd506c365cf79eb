#include "Compiler.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <string>
#include <string_view>
#include <vector>

namespace distbuild {

std::string_view
toString(const PlatformFamily family) noexcept {
  switch (family) {
    case PlatformFamily::Darwin:
      return "darwin";
    case PlatformFamily::Linux:
      return "linux";
    case PlatformFamily::Windows:
      return "windows";
    case PlatformFamily::Unknown:
      return "unknown";
  }
  __builtin_unreachable();
}

std::string
CFlags::toString() const {
  return fmt::format("{}", fmt::join(includeDirs, " "));
}

std::string
LdFlags::toString() const {
  return fmt::format("{}", fmt::join(libDirs, " "));
}

}  // namespace distbuild

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testClassifyTarget() {
  static_assert(classifyTarget("x86_64-apple-darwin") == PlatformFamily::Darwin);
  static_assert(classifyTarget("aarch64-apple-darwin") == PlatformFamily::Darwin);
  static_assert(
      classifyTarget("x86_64-unknown-linux-gnu") == PlatformFamily::Linux
  );
  static_assert(
      classifyTarget("aarch64-unknown-linux-musl") == PlatformFamily::Linux
  );
  static_assert(
      classifyTarget("x86_64-pc-windows-msvc") == PlatformFamily::Windows
  );
  static_assert(
      classifyTarget("wasm32-unknown-unknown") == PlatformFamily::Unknown
  );
  static_assert(classifyTarget("") == PlatformFamily::Unknown);

  // Ties resolve by check order: darwin, then linux, then windows.
  static_assert(classifyTarget("darwin-linux") == PlatformFamily::Darwin);
  static_assert(classifyTarget("linux-windows") == PlatformFamily::Linux);

  pass();
}

static void
testResolveToolchain() {
  static_assert(
      resolveToolchain("x86_64-apple-darwin")
      == Toolchain{ .cc = "clang", .cxx = "clang++" }
  );
  static_assert(
      resolveToolchain("x86_64-unknown-linux-gnu")
      == Toolchain{ .cc = "gcc", .cxx = "g++" }
  );
  static_assert(
      resolveToolchain("x86_64-pc-windows-msvc")
      == Toolchain{ .cc = "cl.exe", .cxx = "cl.exe" }
  );
  static_assert(
      resolveToolchain("wasm32-unknown-unknown")
      == Toolchain{ .cc = "cc", .cxx = "c++" }
  );

  assertEq(fmt::format("{}", PlatformFamily::Unknown), "unknown");

  pass();
}

static void
testFlagsToString() {
  CFlags cflags;
  cflags.includeDirs.emplace_back("/opt/a/include");
  cflags.includeDirs.emplace_back("/opt/b/include");
  assertEq(cflags.toString(), "-I/opt/a/include -I/opt/b/include");
  assertEq(fmt::format("{}", cflags), "-I/opt/a/include -I/opt/b/include");
  assertFalse(cflags.empty());

  LdFlags ldflags;
  ldflags.libDirs.emplace_back("/opt/a/lib");
  assertEq(fmt::format("{}", ldflags), "-L/opt/a/lib");

  assertTrue(CFlags().empty());
  assertEq(CFlags().toString(), "");
  assertEq(LdFlags().toString(), "");

  pass();
}

}  // namespace tests

int
main() {
  tests::testClassifyTarget();
  tests::testResolveToolchain();
  tests::testFlagsToString();
}

#endif
