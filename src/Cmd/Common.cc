#include "Common.hpp"

#include "../Manifest.hpp"
#include "../Rustify/Result.hpp"

#include <filesystem>
#include <optional>
#include <utility>

namespace distbuild {

static std::optional<fs::path>&
manifestPath() noexcept {
  static std::optional<fs::path> path;
  return path;
}

void
setManifestPath(fs::path path) noexcept {
  manifestPath() = std::move(path);
}

const std::optional<fs::path>&
getManifestPath() noexcept {
  return manifestPath();
}

Result<Manifest>
loadManifest() {
  if (const auto& path = getManifestPath(); path.has_value()) {
    Ensure(
        fs::exists(*path), "manifest path `{}` does not exist", path->string()
    );
    return Manifest::tryParse(*path, /*findParents=*/false);
  }
  return Manifest::tryParse();
}

}  // namespace distbuild
