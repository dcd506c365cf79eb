#pragma once

#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace distbuild {

namespace fs = std::filesystem;

//
// Toolchain defaults per target
//

enum class PlatformFamily : uint8_t {
  Darwin,
  Linux,
  Windows,
  Unknown,  // a triple none of the above recognizes
};

struct Toolchain {
  std::string_view cc;
  std::string_view cxx;

  constexpr bool operator==(const Toolchain&) const noexcept = default;
};

// First match wins, so a triple naming several platforms classifies by the
// earliest check below.
constexpr PlatformFamily
classifyTarget(const std::string_view triple) noexcept {
  if (triple.find("darwin") != std::string_view::npos) {
    return PlatformFamily::Darwin;
  } else if (triple.find("linux") != std::string_view::npos) {
    return PlatformFamily::Linux;
  } else if (triple.find("windows") != std::string_view::npos) {
    return PlatformFamily::Windows;
  }
  return PlatformFamily::Unknown;
}

constexpr Toolchain
defaultToolchain(const PlatformFamily family) noexcept {
  switch (family) {
    case PlatformFamily::Darwin:
      return { .cc = "clang", .cxx = "clang++" };
    case PlatformFamily::Linux:
      return { .cc = "gcc", .cxx = "g++" };
    case PlatformFamily::Windows:
      return { .cc = "cl.exe", .cxx = "cl.exe" };
    case PlatformFamily::Unknown:
      return { .cc = "cc", .cxx = "c++" };
  }
  __builtin_unreachable();
}

constexpr Toolchain
resolveToolchain(const std::string_view triple) noexcept {
  return defaultToolchain(classifyTarget(triple));
}

std::string_view toString(PlatformFamily family) noexcept;

//
// Flags handed to a foreign build through CFLAGS/CPPFLAGS/LDFLAGS
//

struct IncludeDir {
  fs::path dir;

  explicit IncludeDir(fs::path dir) noexcept : dir(std::move(dir)) {}
};

struct CFlags {
  std::vector<IncludeDir> includeDirs;  // -I<dir>

  bool empty() const noexcept {
    return includeDirs.empty();
  }
  // Space-separated.
  std::string toString() const;
};

struct LibDir {
  fs::path dir;

  explicit LibDir(fs::path dir) noexcept : dir(std::move(dir)) {}
};

struct LdFlags {
  std::vector<LibDir> libDirs;  // -L<dir>

  bool empty() const noexcept {
    return libDirs.empty();
  }
  std::string toString() const;
};

}  // namespace distbuild

template <>
struct fmt::formatter<distbuild::PlatformFamily> : formatter<std::string_view> {
  auto format(distbuild::PlatformFamily v, format_context& ctx) const
      -> format_context::iterator {
    return formatter<std::string_view>::format(distbuild::toString(v), ctx);
  }
};

template <>
struct fmt::formatter<distbuild::IncludeDir> {
  // NOLINTNEXTLINE(*-static)
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const distbuild::IncludeDir& id, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "-I{}", id.dir.string());
  }
};

template <>
struct fmt::formatter<distbuild::LibDir> {
  // NOLINTNEXTLINE(*-static)
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const distbuild::LibDir& ld, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "-L{}", ld.dir.string());
  }
};

template <>
struct fmt::formatter<distbuild::CFlags> : formatter<std::string> {
  auto format(const distbuild::CFlags& cf, format_context& ctx) const
      -> format_context::iterator {
    return formatter<std::string>::format(cf.toString(), ctx);
  }
};

template <>
struct fmt::formatter<distbuild::LdFlags> : formatter<std::string> {
  auto format(const distbuild::LdFlags& lf, format_context& ctx) const
      -> format_context::iterator {
    return formatter<std::string>::format(lf.toString(), ctx);
  }
};
