#pragma once

#include "Harvest.hpp"

#include <compare>
#include <cstddef>
#include <filesystem>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace distbuild {

namespace fs = std::filesystem;

// e.g. "x86_64-apple-darwin".  Ordered lexicographically so that everything
// keyed by it iterates deterministically.
using TargetTriple = std::string;

struct BinaryIdx {
  std::size_t value;

  auto operator<=>(const BinaryIdx&) const = default;
};

struct Binary {
  TargetTriple target;
  // Where the build leaves the binary, relative to the working directory.
  fs::path fileName;
  std::vector<fs::path> copyExeTo;
  std::vector<fs::path> copySymbolsTo;

  bool needsCopy() const noexcept {
    return !copyExeTo.empty() || !copySymbolsTo.empty();
  }
};

// One run of the workspace build command for one target.
struct GenericBuildStep {
  TargetTriple targetTriple;
  std::vector<BinaryIdx> expectedBinaries;
  std::vector<std::string> buildCommand;
};

// A build that produces loose artifacts rather than known binaries.
struct ExtraBuildStep {
  std::vector<std::string> buildCommand;
  std::vector<fs::path> expectedArtifacts;
};

using BuildStep = std::variant<GenericBuildStep, ExtraBuildStep>;

struct DistGraph {
  std::vector<Binary> binaries;
  std::vector<ExtraBuildStep> extraBuilds;
  std::optional<std::vector<std::string>> buildCommand;
  fs::path distDir;
  Tools tools;

  const Binary& binary(const BinaryIdx idx) const {
    return binaries.at(idx.value);
  }
};

}  // namespace distbuild

template <>
struct fmt::formatter<distbuild::BinaryIdx> : formatter<std::size_t> {
  auto format(distbuild::BinaryIdx v, format_context& ctx) const
      -> format_context::iterator {
    return formatter<std::size_t>::format(v.value, ctx);
  }
};
