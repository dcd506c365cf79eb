#pragma once

#include "Rustify/Result.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace distbuild {

// Forward declarations
class Opt;
class Subcmd;
class Cli;

using CliArgsView = std::span<const std::string>;
// Kept in declaration order, which is also the order help lists them in.
using Opts = std::vector<Opt>;

// Defined in Driver.cc
const Cli& getCli() noexcept;

class Opt {
  friend class Subcmd;
  friend class Cli;

  std::string_view name;
  std::string_view shortName;
  std::string_view desc;
  std::string_view placeholder;
  bool isGlobal = false;
  bool isHidden = false;

public:
  constexpr explicit Opt(const std::string_view name) noexcept : name(name) {}

  constexpr Opt& setShort(const std::string_view shortName) noexcept {
    this->shortName = shortName;
    return *this;
  }
  constexpr Opt& setDesc(const std::string_view desc) noexcept {
    this->desc = desc;
    return *this;
  }
  constexpr Opt& setPlaceholder(const std::string_view placeholder) noexcept {
    this->placeholder = placeholder;
    return *this;
  }
  constexpr Opt& setGlobal(const bool isGlobal) noexcept {
    this->isGlobal = isGlobal;
    return *this;
  }
  constexpr Opt& setHidden(const bool isHidden) noexcept {
    this->isHidden = isHidden;
    return *this;
  }

  constexpr bool takesArg() const noexcept {
    return !placeholder.empty();
  }
  constexpr bool matches(const std::string_view arg) const noexcept {
    return arg == name || (!shortName.empty() && arg == shortName);
  }

private:
  /// Size of `-c, --color <WHEN>` without color.
  constexpr std::size_t leftSize(std::size_t maxShortSize) const noexcept {
    return 3 + maxShortSize + name.size() + placeholder.size();
  }

  std::string format(std::size_t maxShortSize, std::size_t maxOffset) const;
};

class Subcmd {
  friend class Cli;

  using MainFn = Result<void>(CliArgsView);

  std::string_view name;
  std::string_view desc;
  std::string_view argName;  // a single optional positional, if any
  std::string_view cmdName;
  Opts globalOpts;
  Opts localOpts;
  std::function<MainFn> mainFn;

public:
  explicit Subcmd(const std::string_view name) noexcept : name(name) {}

  Subcmd& setDesc(std::string_view desc) noexcept;
  Subcmd& setArg(std::string_view argName) noexcept;
  Subcmd& addOpt(Opt opt);
  Subcmd& setMainFn(std::function<MainFn> mainFn) noexcept;

  [[nodiscard]] AnyhowErr noSuchArg(std::string_view arg) const;
  [[nodiscard]] static AnyhowErr
  missingOptArgumentFor(std::string_view arg) noexcept;

private:
  std::string formatUsage(FILE* file) const;
  std::string formatHelp() const;
  std::string format(std::size_t maxOffset) const;
  std::size_t calcMaxShortSize() const noexcept;
  std::size_t calcMaxOffset(std::size_t maxShortSize) const noexcept;
};

class Cli {
  std::string_view name;
  std::string_view desc;
  std::map<std::string_view, Subcmd> subcmds;
  Opts globalOpts;
  Opts localOpts;

public:
  explicit Cli(const std::string_view name) noexcept : name(name) {}

  Cli& setDesc(std::string_view desc) noexcept;
  Cli& addSubcmd(Subcmd subcmd);
  Cli& addOpt(Opt opt);
  bool hasSubcmd(std::string_view subcmd) const noexcept;

  [[nodiscard]] AnyhowErr noSuchArg(std::string_view arg) const;
  [[nodiscard]] Result<void>
  exec(std::string_view subcmd, CliArgsView args) const;
  void printSubcmdHelp(std::string_view subcmd) const;
  [[nodiscard]] Result<void> printHelp(CliArgsView args) const;

  enum class ControlFlow : std::uint8_t {
    Return,
    Continue,
    Fallthrough,
  };
  using enum ControlFlow;

  // Options accepted anywhere on the command line: -v, -vv, -q, --color,
  // --manifest-path, and -h.
  [[nodiscard]] static Result<ControlFlow> handleGlobalOpts(
      CliArgsView::iterator& itr, CliArgsView::iterator end,
      std::string_view subcmd = ""
  );

  // NOLINTNEXTLINE(*-avoid-c-arrays)
  Result<void> parseArgs(int argc, char* argv[]) const noexcept;

  // "--color=always" => ["--color", "always"].  Public for tests.
  Result<std::vector<std::string>>
  expandOpts(std::span<const char* const> args) const;

private:
  Result<void> parseArgs(CliArgsView args) const noexcept;

  const Opt* findOpt(std::string_view name, const Subcmd* subcmd) const;
  std::size_t calcMaxShortSize() const noexcept;
  std::size_t calcMaxOffset(std::size_t maxShortSize) const noexcept;
  std::string formatAllSubcmds(std::size_t maxOffset) const;
  std::string formatCmdHelp() const;
};

}  // namespace distbuild
