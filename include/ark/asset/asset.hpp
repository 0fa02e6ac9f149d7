#pragma once

/// @file asset.hpp
/// @brief Asset descriptor: identity, path parts and resolved type.

#include <memory>
#include <string>
#include <string_view>

namespace ark::asset {

/// Type tag of an asset whose type could not be resolved.
inline constexpr std::string_view kUnknownAssetType = "unknown";

/// Describes one resource to load.
///
/// The path is split into directory (with trailing '/'), name and
/// extension; backslashes are treated as separators.  For
/// "models/hero.skin.glb": directory "models/", name "hero.skin",
/// extension ".glb", long extension ".skin.glb", key "models/hero.skin.glb".
///
/// The type starts as "unknown" unless given, and can be resolved once.
class Asset {
public:
    explicit Asset(std::string_view path, std::string type = std::string(kUnknownAssetType));

    /// Random UUID, unique per Asset object.
    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& directory() const noexcept { return directory_; }
    [[nodiscard]] const std::string& extension() const noexcept { return extension_; }

    /// Everything from the first dot of the file name (".tar.gz").
    [[nodiscard]] std::string longExtension() const;

    /// File name with extension.
    [[nodiscard]] std::string basename() const { return name_ + extension_; }

    /// Normalized path; requests for the same key share one Asset.
    [[nodiscard]] std::string key() const { return directory_ + basename(); }

    [[nodiscard]] const std::string& type() const noexcept { return type_; }
    [[nodiscard]] bool hasResolvedType() const noexcept { return type_ != kUnknownAssetType; }

    /// Set the type if it is still unknown.
    /// @return false if the type was already resolved (it is left unchanged).
    bool resolveType(std::string type);

    /// Same as key().
    [[nodiscard]] std::string toString() const { return key(); }

private:
    std::string id_;
    std::string name_;
    std::string directory_;
    std::string extension_;
    std::string type_;
};

} // namespace ark::asset
