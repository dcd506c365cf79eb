#include "Algos.hpp"

#include "Command.hpp"
#include "Rustify/Result.hpp"

#include <chrono>
#include <cstddef>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace distbuild {

std::string
replaceAll(
    std::string str, const std::string_view from, const std::string_view to
) noexcept {
  if (from.empty()) {
    return str;  // If the substring to replace is empty, return the original
                 // string
  }

  std::size_t startPos = 0;
  while ((startPos = str.find(from, startPos)) != std::string::npos) {
    str.replace(startPos, from.length(), to);
    startPos += to.length();  // Move past the last replaced substring
  }
  return str;
}

std::vector<std::string_view>
split(std::string_view str, const char sep) {
  std::vector<std::string_view> parts;
  while (true) {
    const auto pair = splitOnce(str, sep);
    if (!pair.has_value()) {
      parts.push_back(str);
      return parts;
    }
    parts.push_back(pair->first);
    str = pair->second;
  }
}

Result<std::string>
getCmdOutput(const Command& cmd, const std::size_t retry) noexcept {
  spdlog::trace("Running `{}`", cmd.toString());

  ExitStatus exitStatus;
  std::string stdErr;
  int waitTime = 1;
  for (std::size_t i = 0; i < retry; ++i) {
    if (i > 0) {
      // Sleep for an exponential backoff.
      std::this_thread::sleep_for(std::chrono::seconds(waitTime));
      waitTime *= 2;
    }

    const auto cmdOut = Try(cmd.output());
    if (cmdOut.exitStatus.success()) {
      return Ok(cmdOut.stdOut);
    }
    exitStatus = cmdOut.exitStatus;
    stdErr = cmdOut.stdErr;
  }

  return Result<std::string>(
             Err(anyhow::anyhow("Command `{}` {}", cmd.toString(), exitStatus))
  )
      .with_context([stdErr = std::move(stdErr)] {
        return anyhow::anyhow(stdErr);
      });
}

bool
commandExists(const std::string_view cmd) noexcept {
  return Command("which")
      .addArg(cmd)
      .setStdOutConfig(Command::IOConfig::Null)
      .setStdErrConfig(Command::IOConfig::Null)
      .spawn()
      .and_then(&Child::wait)
      .map(&ExitStatus::success)
      .unwrap_or(false);
}

}  // namespace distbuild

#ifdef DISTBUILD_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace distbuild;  // NOLINT(build/namespaces,google-build-using-namespace)
using std::string_view_literals::operator""sv;

static void
testReplaceAll() {
  assertEq(replaceAll("a-b-c", "-", "+"), "a+b+c");
  assertEq(replaceAll("aaa", "a", "aa"), "aaaaaa");
  assertEq(replaceAll("abc", "", "x"), "abc");

  pass();
}

static void
testSplitOnce() {
  static_assert(splitOnce("CC=gcc", '=')->first == "CC"sv);
  static_assert(splitOnce("CC=gcc", '=')->second == "gcc"sv);
  static_assert(splitOnce("A=b=c", '=')->second == "b=c"sv);
  static_assert(splitOnce("EMPTY=", '=')->second.empty());
  static_assert(!splitOnce("no separator", '=').has_value());

  pass();
}

static void
testSplit() {
  const auto parts = split("a,b,,c", ',');
  assertEq(parts.size(), 4UL);
  assertEq(parts[0], "a");
  assertEq(parts[2], "");
  assertEq(parts[3], "c");

  assertEq(split("", ',').size(), 1UL);

  pass();
}

static void
testGetCmdOutput() {
  assertEq(
      getCmdOutput(Command("sh").addArg("-c").addArg("printf hello"), 1)
          .unwrap(),
      "hello"
  );

  const auto failed =
      getCmdOutput(Command("sh").addArg("-c").addArg("echo oops >&2; exit 2"), 1);
  assertTrue(failed.is_err());
  assertContains(failed.unwrap_err()->what(), "exited with code 2");

  pass();
}

static void
testCommandExists() {
  assertTrue(commandExists("sh"));
  assertFalse(commandExists("distbuild-no-such-program-xyz"));

  pass();
}

}  // namespace tests

int
main() {
  tests::testReplaceAll();
  tests::testSplitOnce();
  tests::testSplit();
  tests::testGetCmdOutput();
  tests::testCommandExists();
}

#endif
