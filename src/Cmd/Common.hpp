#pragma once

#include "../Manifest.hpp"
#include "../Rustify/Result.hpp"

#include <filesystem>
#include <optional>

namespace distbuild {

namespace fs = std::filesystem;

// --manifest-path; without it the manifest is looked up from the current
// directory upwards.
void setManifestPath(fs::path path) noexcept;
const std::optional<fs::path>& getManifestPath() noexcept;

Result<Manifest> loadManifest();

}  // namespace distbuild
