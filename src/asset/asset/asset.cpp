#include "ark/asset/asset.hpp"

#include "ark/foundation/id_generator.hpp"

#include <algorithm>
#include <utility>

namespace ark::asset {

Asset::Asset(std::string_view path, std::string type)
    : id_(foundation::generateUuid()), type_(std::move(type)) {
    std::string normalized(path);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    const auto lastSlash = normalized.rfind('/');
    std::string base;
    if (lastSlash == std::string::npos) {
        base = normalized;
    } else {
        directory_ = normalized.substr(0, lastSlash + 1);
        base = normalized.substr(lastSlash + 1);
    }

    // A leading dot (".gitignore") is part of the name, not an extension.
    const auto lastDot = base.rfind('.');
    if (lastDot != std::string::npos && lastDot > 0) {
        name_ = base.substr(0, lastDot);
        extension_ = base.substr(lastDot);
    } else {
        name_ = base;
    }

    if (type_.empty()) {
        type_ = std::string(kUnknownAssetType);
    }
}

std::string Asset::longExtension() const {
    const auto base = basename();
    const auto firstDot = base.find('.');
    return firstDot == std::string::npos ? std::string{} : base.substr(firstDot);
}

bool Asset::resolveType(std::string type) {
    if (hasResolvedType()) {
        return false;
    }
    type_ = type.empty() ? std::string(kUnknownAssetType) : std::move(type);
    return true;
}

} // namespace ark::asset
