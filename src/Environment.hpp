#pragma once

#include <cstddef>
#include <fmt/format.h>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace distbuild {

using EnvVar = std::pair<std::string, std::string>;

// An immutable set of environment variables.  Overlays return a new value and
// leave the receiver untouched; the process environment itself is only ever
// read, once, by capture().
class Environment {
public:
  using VarMap = std::map<std::string, std::string, std::less<>>;

private:
  VarMap vars;

  explicit Environment(VarMap vars) noexcept : vars(std::move(vars)) {}

public:
  Environment() noexcept = default;
  Environment(std::initializer_list<EnvVar> init)
      : vars(init.begin(), init.end()) {}

  // Snapshot of the current process environment.
  static Environment capture();

  std::optional<std::string_view> get(std::string_view name) const;
  bool contains(std::string_view name) const;
  std::size_t size() const noexcept {
    return vars.size();
  }
  const VarMap& entries() const noexcept {
    return vars;
  }

  Environment with(std::string name, std::string value) const;
  Environment with(std::span<const EnvVar> overrides) const;

  // KEY=VALUE strings in key order, suitable for an execve(2) envp.
  std::vector<std::string> toEnvp() const;

  bool operator==(const Environment& other) const = default;
};

}  // namespace distbuild

template <>
struct fmt::formatter<distbuild::Environment> : formatter<std::string> {
  auto format(const distbuild::Environment& v, format_context& ctx) const
      -> format_context::iterator;
};
