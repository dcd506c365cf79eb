#pragma once

#include <cstdint>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace distbuild {

void setColorMode(std::string_view str) noexcept;
bool shouldColor(const std::ostream& os) noexcept;
bool shouldColorStdout() noexcept;
bool shouldColorStderr() noexcept;

class ColorStr {
  std::vector<std::uint8_t> codes;
  mutable std::string str;
  mutable bool finalized = false;

public:
  ColorStr(const std::uint8_t code, std::string str) noexcept
      : str(std::move(str)) {
    codes.push_back(code);
  }

  template <typename S>
    requires(std::is_convertible_v<std::remove_cvref_t<S>, std::string_view>
             && !std::is_same_v<std::remove_cvref_t<S>, std::string>)
  ColorStr(const std::uint8_t code, S&& str) noexcept
      : ColorStr(code, std::string(std::string_view(std::forward<S>(str)))) {}

  ColorStr(const std::uint8_t code, ColorStr other) noexcept
      : codes(std::move(other.codes)), str(std::move(other.str)) {
    codes.push_back(code);
  }

  ColorStr(const ColorStr&) = delete;
  ColorStr& operator=(const ColorStr&) = delete;
  ColorStr(ColorStr&&) noexcept = default;
  ColorStr& operator=(ColorStr&&) noexcept = default;
  virtual ~ColorStr() noexcept = default;

  std::string toStr() const noexcept {
    finalize(std::cout);
    return str;
  }
  std::string toErrStr() const noexcept {
    finalize(std::cerr);
    return str;
  }

  void finalize(const std::ostream& os) const noexcept {
    if (!finalized && shouldColor(os)) {
      finalized = true;
      str = fmt::format("\033[{}m{}\033[0m", fmt::join(codes, ";"), str);
    }
  }
};

// One SGR attribute applied on top of a string or another ColorStr, e.g.
// Bold(Red("Error: ")).
template <std::uint8_t Code>
class Sgr : public ColorStr {
public:
  template <typename S>
    requires(!std::is_base_of_v<ColorStr, std::remove_cvref_t<S>>)
  explicit Sgr(S&& str) noexcept : ColorStr(Code, std::forward<S>(str)) {}

  explicit Sgr(ColorStr other) noexcept : ColorStr(Code, std::move(other)) {}
};

using Bold = Sgr<1>;
using Red = Sgr<31>;
using Green = Sgr<32>;
using Yellow = Sgr<33>;
using Cyan = Sgr<36>;

}  // namespace distbuild
