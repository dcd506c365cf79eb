#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fcntl.h>
#include <fmt/core.h>
#include <fmt/std.h>
#include <fstream>
#include <iterator>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace tests {

namespace fs = std::filesystem;

inline constinit const std::string_view GREEN = "\033[32m";
inline constinit const std::string_view RED = "\033[31m";
inline constinit const std::string_view RESET = "\033[0m";

template <typename T, typename U>
concept Eq = requires(T lhs, U rhs) {
  { lhs == rhs } -> std::convertible_to<bool>;
};

template <typename T, typename U>
concept Ne = requires(T lhs, U rhs) {
  { lhs != rhs } -> std::convertible_to<bool>;
};

// src/Harvest.cc -> src/Harvest, ../../src/Cmd/Build.cc -> src/Cmd/Build
constexpr std::string_view
getModName(std::string_view file) noexcept {
  const std::size_t start = file.find("src/");
  const std::size_t end = file.find_last_of('.');
  if (start == std::string_view::npos || end == std::string_view::npos
      || end < start) {
    return file;
  }
  return file.substr(start, end - start);
}

constexpr std::string_view
prettifyFuncName(std::string_view func) noexcept {
  const std::size_t paren = func.find_last_of('(');
  if (paren == std::string_view::npos) {
    return func;
  }
  func = func.substr(0, paren);

  const std::size_t space = func.find_last_of(' ');
  if (space == std::string_view::npos) {
    return func;
  }
  return func.substr(space + 1);
}

inline void
pass(
    const std::source_location& loc = std::source_location::current()
) noexcept {
  fmt::print(
      "        test {}::{} ... {}ok{}\n", getModName(loc.file_name()),
      prettifyFuncName(loc.function_name()), GREEN, RESET
  );
}

[[noreturn]] inline void
error(const std::source_location& loc, const std::string_view msg) {
  fmt::print(
      stderr,
      "\n        test {}::{} ... {}FAILED{}\n\n"
      "'{}' failed at '{}', {}:{}\n",
      getModName(loc.file_name()), prettifyFuncName(loc.function_name()), RED,
      RESET, prettifyFuncName(loc.function_name()), msg, loc.file_name(),
      loc.line()
  );
  throw std::logic_error("test failed");
}

// Prefers the debug presentation (quoted strings) and falls back to the plain
// one for types without a debug format.
template <typename Lhs, typename Rhs>
inline std::string
comparisonFailure(const std::string_view op, Lhs&& lhs, Rhs&& rhs) {
  try {
    return fmt::format(
        fmt::runtime("assertion failed: `(left {} right)`\n"
                     "  left: `{:?}`\n"
                     " right: `{:?}`\n"),
        op, std::forward<Lhs>(lhs), std::forward<Rhs>(rhs)
    );
  } catch (const fmt::format_error&) {
    return fmt::format(
        fmt::runtime("assertion failed: `(left {} right)`\n"
                     "  left: `{}`\n"
                     " right: `{}`\n"),
        op, std::forward<Lhs>(lhs), std::forward<Rhs>(rhs)
    );
  }
}

inline void
assertTrue(
    const bool cond, const std::string_view msg = "",
    const std::source_location& loc = std::source_location::current()
) {
  if (!cond) {
    error(loc, msg.empty() ? "expected `true` but got `false`" : msg);
  }
}

inline void
assertFalse(
    const bool cond, const std::string_view msg = "",
    const std::source_location& loc = std::source_location::current()
) {
  if (cond) {
    error(loc, msg.empty() ? "expected `false` but got `true`" : msg);
  }
}

template <typename Lhs, typename Rhs>
  requires Eq<Lhs, Rhs> && fmt::is_formattable<Lhs>::value
           && fmt::is_formattable<Rhs>::value
inline void
assertEq(
    Lhs&& lhs, Rhs&& rhs, const std::string_view msg = "",
    const std::source_location& loc = std::source_location::current()
) {
  if (lhs == rhs) {
    return;
  }
  if (!msg.empty()) {
    error(loc, msg);
  }
  error(
      loc, comparisonFailure(
               "==", std::forward<Lhs>(lhs), std::forward<Rhs>(rhs)
           )
  );
}

template <typename Lhs, typename Rhs>
  requires Ne<Lhs, Rhs> && fmt::is_formattable<Lhs>::value
           && fmt::is_formattable<Rhs>::value
inline void
assertNe(
    Lhs&& lhs, Rhs&& rhs, const std::string_view msg = "",
    const std::source_location& loc = std::source_location::current()
) {
  if (lhs != rhs) {
    return;
  }
  if (!msg.empty()) {
    error(loc, msg);
  }
  error(
      loc, comparisonFailure(
               "!=", std::forward<Lhs>(lhs), std::forward<Rhs>(rhs)
           )
  );
}

inline void
assertContains(
    const std::string_view haystack, const std::string_view needle,
    const std::source_location& loc = std::source_location::current()
) {
  if (haystack.find(needle) != std::string_view::npos) {
    return;
  }
  error(
      loc, fmt::format(
               "assertion failed: `{:?}` does not contain `{:?}`", haystack,
               needle
           )
  );
}

//
// Filesystem fixtures
//

inline void
writeFile(
    const fs::path& path, const std::string_view content,
    const fs::perms perms = fs::perms::owner_read | fs::perms::owner_write
) {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << content;
  ofs.close();
  fs::permissions(path, perms);
}

inline void
writeScript(const fs::path& path, const std::string_view body) {
  writeFile(
      path, fmt::format("#!/bin/sh\n{}\n", body),
      fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read
  );
}

inline std::string
readFile(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return { std::istreambuf_iterator<char>(ifs),
           std::istreambuf_iterator<char>() };
}

// A fresh directory under the system temp dir, removed on destruction.
class TempDir {
  fs::path dir;

public:
  TempDir() {
    std::string tmpl =
        (fs::temp_directory_path() / "distbuild-test-XXXXXX").string();
    if (mkdtemp(tmpl.data()) == nullptr) {
      throw std::runtime_error("mkdtemp() failed");
    }
    dir = tmpl;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  TempDir(TempDir&&) noexcept = delete;
  TempDir& operator=(TempDir&&) noexcept = delete;
  ~TempDir() noexcept {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  const fs::path& path() const noexcept {
    return dir;
  }
  fs::path operator/(const fs::path& rel) const {
    return dir / rel;
  }
};

// Switches the current directory for the lifetime of the guard.
class CurrentPathGuard {
  fs::path prev;

public:
  explicit CurrentPathGuard(const fs::path& dir) : prev(fs::current_path()) {
    fs::current_path(dir);
  }
  CurrentPathGuard(const CurrentPathGuard&) = delete;
  CurrentPathGuard& operator=(const CurrentPathGuard&) = delete;
  CurrentPathGuard(CurrentPathGuard&&) noexcept = delete;
  CurrentPathGuard& operator=(CurrentPathGuard&&) noexcept = delete;
  ~CurrentPathGuard() noexcept {
    std::error_code ec;
    fs::current_path(prev, ec);
  }
};

// Sends everything written to stderr, including by child processes that
// inherit it, into a file until take() or destruction.
class StderrCapture {
  fs::path file;
  int savedFd = -1;

  void restore() noexcept {
    if (savedFd != -1) {
      std::fflush(stderr);
      dup2(savedFd, STDERR_FILENO);
      close(savedFd);
      savedFd = -1;
    }
  }

public:
  explicit StderrCapture(fs::path path) : file(std::move(path)) {
    std::fflush(stderr);
    savedFd = dup(STDERR_FILENO);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    const int fd = open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (savedFd == -1 || fd == -1) {
      throw std::runtime_error("failed to redirect stderr");
    }
    dup2(fd, STDERR_FILENO);
    close(fd);
  }
  StderrCapture(const StderrCapture&) = delete;
  StderrCapture& operator=(const StderrCapture&) = delete;
  StderrCapture(StderrCapture&&) noexcept = delete;
  StderrCapture& operator=(StderrCapture&&) noexcept = delete;
  ~StderrCapture() noexcept {
    restore();
  }

  // Stops capturing and returns what was written.
  std::string take() {
    restore();
    return readFile(file);
  }
};

}  // namespace tests
