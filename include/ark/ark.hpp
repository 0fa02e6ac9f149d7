#pragma once

/// @file ark.hpp
/// @brief Umbrella header for the ark kernel.

#include "ark/core/result.hpp"
#include "ark/version.hpp"

#include "ark/foundation/config_manager.hpp"
#include "ark/foundation/error_code.hpp"
#include "ark/foundation/kernel_config.hpp"
#include "ark/foundation/kernel_error.hpp"
#include "ark/foundation/kernel_logger.hpp"
#include "ark/foundation/kernel_result.hpp"
#include "ark/foundation/signal.hpp"
#include "ark/foundation/task_queue.hpp"

#include "ark/scene/actor.hpp"
#include "ark/scene/actor_tree.hpp"
#include "ark/scene/behavior.hpp"
#include "ark/scene/component.hpp"
#include "ark/scene/scene_manager.hpp"

#include "ark/asset/asset.hpp"
#include "ark/asset/asset_manager.hpp"
#include "ark/asset/lazy_asset.hpp"

#include "ark/runtime/fixed_time_step.hpp"
#include "ark/runtime/frame_loop.hpp"
#include "ark/runtime/renderer.hpp"
#include "ark/runtime/scene.hpp"
#include "ark/runtime/timer.hpp"
#include "ark/runtime/world.hpp"
