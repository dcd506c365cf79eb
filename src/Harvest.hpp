#pragma once

#include "Command.hpp"
#include "Compiler.hpp"
#include "Environment.hpp"
#include "Rustify/Result.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace distbuild {

namespace fs = std::filesystem;

// Set in the ambient environment to skip the Homebrew lookup altogether.
inline constexpr std::string_view SKIP_BREWFILE_ENV = "DO_NOT_USE_BREWFILE";
inline constexpr std::string_view BREWFILE = "Brewfile";

// External tools the build may consult, discovered once per run.
struct Tools {
  std::optional<std::string> brew;

  static Tools discover() noexcept;
};

// Variables parsed from the external environment dump, sorted by name.
using EnvMap = std::map<std::string, std::string, std::less<>>;

struct HarvestedEnv {
  std::vector<EnvVar> vars;  // allow-listed, in allow-list order
  std::optional<std::string> cflags;
  std::optional<std::string> ldflags;

  bool empty() const noexcept {
    return vars.empty() && !cflags.has_value() && !ldflags.has_value();
  }
};

// `brew bundle exec -- /usr/bin/env`, if brew is known and a Brewfile sits in
// the current directory.
std::optional<Command> brewEnvQuery(const Tools& tools);

// Runs the query.  Any failure to produce output is not an error: it yields
// std::nullopt and the build goes on without a harvested environment.
std::optional<std::string> fetchEnv(const Command& query) noexcept;

Result<EnvMap> parseEnv(std::string_view output);
std::vector<EnvVar> selectBrewEnv(const EnvMap& env);
// (formula, opt prefix) pairs for every formula the Brewfile pulled in.
std::vector<std::pair<std::string, fs::path>>
formulasFromEnv(const EnvMap& env);
std::string calculateCFlags(const EnvMap& env);
std::string calculateLdFlags(const EnvMap& env);

Result<HarvestedEnv>
harvestEnv(const Environment& ambient, const std::optional<Command>& query);

}  // namespace distbuild
