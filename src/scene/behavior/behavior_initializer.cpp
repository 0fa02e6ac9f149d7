/// @file behavior_initializer.cpp
/// @brief Property defaults and sibling dependency wiring.

#include "ark/scene/behavior_initializer.hpp"

#include "ark/foundation/kernel_logger.hpp"
#include "ark/scene/behavior.hpp"

namespace ark::scene {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

LogContext contextFor(const Behavior& behavior) {
    LogContext ctx;
    ctx.actorId = behavior.GetActor().Id();
    ctx.componentId = behavior.Id();
    ctx.extra["behavior"] = behavior.TypeName();
    return ctx;
}

} // namespace

BehaviorInitReport BehaviorInitializer::Initialize(Behavior& behavior) {
    BehaviorInitReport report;
    if (behavior.initialized_) {
        return report;
    }
    behavior.initialized_ = true;

    for (const auto& decl : behavior.declaredProperties_) {
        auto it = behavior.properties_.find(decl.name);
        if (it == behavior.properties_.end()) {
            behavior.properties_.emplace(decl.name, defaultPropertyValue(decl.type));
        } else if (propertyTypeOf(it->second) != decl.type) {
            auto ctx = contextFor(behavior);
            ctx.extra["property"] = decl.name;
            ctx.extra["expected"] = std::string(propertyTypeName(decl.type));
            ctx.extra["actual"] = std::string(propertyTypeName(propertyTypeOf(it->second)));
            ARK_LOG_CTX(LogLevel::Warning, LogCategory::Behavior,
                        "property type mismatch, using default", ctx);
            it->second = defaultPropertyValue(decl.type);
        }
        ++report.properties;
    }

    for (auto& dep : behavior.dependencies_) {
        if (dep.resolve(behavior)) {
            ++report.dependencies;
            continue;
        }
        report.missing.push_back(dep.key);
        auto ctx = contextFor(behavior);
        ctx.extra["dependency"] = dep.key;
        ARK_LOG_CTX(LogLevel::Warning, LogCategory::Behavior,
                    "required component not found on actor " + behavior.GetActor().Name(), ctx);
    }

    return report;
}

} // namespace ark::scene
