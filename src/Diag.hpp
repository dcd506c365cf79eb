#pragma once

#include "TermColor.hpp"

#include <cstdint>
#include <cstdio>
#include <fmt/core.h>
#include <string>
#include <string_view>
#include <utility>

namespace distbuild {

enum class DiagLevel : uint8_t {
  Off = 0,  // --quiet, -q
  Error = 1,
  Warn = 2,
  Info = 3,         // default
  Verbose = 4,      // --verbose, -v
  VeryVerbose = 5,  // -vv
};

// User-facing status lines on stderr.  Developer-facing tracing goes through
// spdlog instead.
class Diag {
  DiagLevel level = DiagLevel::Info;

  constexpr Diag() noexcept = default;

public:
  // Diag is a singleton
  constexpr Diag(const Diag&) = delete;
  constexpr Diag& operator=(const Diag&) = delete;
  constexpr Diag(Diag&&) noexcept = delete;
  constexpr Diag& operator=(Diag&&) noexcept = delete;
  constexpr ~Diag() noexcept = default;

  static Diag& instance() noexcept {
    static Diag instance;
    return instance;
  }
  static void setLevel(DiagLevel level) noexcept {
    instance().level = level;
  }
  static DiagLevel getLevel() noexcept {
    return instance().level;
  }
  static bool enabled(DiagLevel level) noexcept {
    return level <= instance().level;
  }

  template <typename... Args>
  static void error(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (enabled(DiagLevel::Error)) {
      emit(
          Bold(Red("Error: ")).toErrStr(),
          fmt::format(fmt, std::forward<Args>(args)...)
      );
    }
  }
  template <typename... Args>
  static void warn(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (enabled(DiagLevel::Warn)) {
      emit(
          Bold(Yellow("Warning: ")).toErrStr(),
          fmt::format(fmt, std::forward<Args>(args)...)
      );
    }
  }
  // Right-aligned green header, e.g. "    Building x86_64-apple-darwin".
  template <typename... Args>
  static void info(
      const std::string_view header, fmt::format_string<Args...> fmt,
      Args&&... args
  ) noexcept {
    constexpr int infoHeaderMaxLength = 12;
    constexpr int infoHeaderEscapeSequenceOffset = 11;
    if (enabled(DiagLevel::Info)) {
      emit(
          fmt::format(
              "{:>{}} ", Bold(Green(header)).toErrStr(),
              shouldColorStderr()
                  ? infoHeaderMaxLength + infoHeaderEscapeSequenceOffset
                  : infoHeaderMaxLength
          ),
          fmt::format(fmt, std::forward<Args>(args)...)
      );
    }
  }
  template <typename... Args>
  static void
  verbose(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (enabled(DiagLevel::Verbose)) {
      emit("", fmt::format(fmt, std::forward<Args>(args)...));
    }
  }
  template <typename... Args>
  static void
  veryVerbose(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (enabled(DiagLevel::VeryVerbose)) {
      emit("", fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

private:
  static void emit(const std::string_view head, const std::string& body) {
    fmt::print(stderr, "{}{}\n", head, body);
  }
};

inline void
setDiagLevel(DiagLevel level) noexcept {
  Diag::setLevel(level);
}
inline DiagLevel
getDiagLevel() noexcept {
  return Diag::getLevel();
}

inline bool
isVerbose() noexcept {
  return getDiagLevel() >= DiagLevel::Verbose;
}
inline bool
isQuiet() noexcept {
  return getDiagLevel() == DiagLevel::Off;
}

}  // namespace distbuild
