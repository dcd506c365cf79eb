#pragma once

#include "DistGraph.hpp"
#include "Harvest.hpp"
#include "Rustify/Result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace distbuild {

namespace fs = std::filesystem;

struct DistConfig {
  static constexpr const char* DEFAULT_DIST_DIR = "target/distrib";

  const std::optional<std::vector<std::string>> buildCommand;
  const fs::path distDir;

  static Result<DistConfig> tryFromToml(const toml::value& val) noexcept;

private:
  DistConfig(
      std::optional<std::vector<std::string>> buildCommand, fs::path distDir
  ) noexcept
      : buildCommand(std::move(buildCommand)), distDir(std::move(distDir)) {}
};

class Manifest {
public:
  static constexpr const char* FILE_NAME = "dist.toml";

  const fs::path path;
  const DistConfig dist;
  const std::vector<Binary> binaries;
  const std::vector<ExtraBuildStep> extraArtifacts;

  static Result<Manifest> tryParse(
      fs::path path = fs::current_path() / FILE_NAME, bool findParents = true
  ) noexcept;
  static Result<Manifest>
  tryFromToml(const toml::value& data, fs::path path = "unknown") noexcept;

  static Result<fs::path>
  findPath(fs::path candidateDir = fs::current_path()) noexcept;

  DistGraph toDistGraph(Tools tools) const;

private:
  Manifest(
      fs::path path, DistConfig dist, std::vector<Binary> binaries,
      std::vector<ExtraBuildStep> extraArtifacts
  ) noexcept
      : path(std::move(path)), dist(std::move(dist)),
        binaries(std::move(binaries)),
        extraArtifacts(std::move(extraArtifacts)) {}
};

}  // namespace distbuild
