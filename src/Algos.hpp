#pragma once

#include "Command.hpp"
#include "Rustify/Result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace distbuild {

std::string replaceAll(
    std::string str, std::string_view from, std::string_view to
) noexcept;

// Splits at the first occurrence of `sep`, or returns std::nullopt if `sep`
// does not occur.
constexpr std::optional<std::pair<std::string_view, std::string_view>>
splitOnce(const std::string_view str, const char sep) noexcept {
  const std::size_t pos = str.find(sep);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  return std::make_pair(str.substr(0, pos), str.substr(pos + 1));
}

std::vector<std::string_view> split(std::string_view str, char sep);

Result<std::string>
getCmdOutput(const Command& cmd, std::size_t retry = 3) noexcept;
bool commandExists(std::string_view cmd) noexcept;

}  // namespace distbuild
