#pragma once
/**
 * @file lft_service.hpp
 * @brief Layer 2: Service modules built on lft_base.
 *
 * Provides the logger, execution contexts, the hook registry, deadline-bounded
 * phase execution, shutdown broadcasting, the construction container and the
 * orchestrator that ties them together. Include this from applications.
 */
#include "lft_base.hpp"

#include "utils/container.hpp"
#include "utils/context.hpp"
#include "utils/deadline.hpp"
#include "utils/hook.hpp"
#include "utils/hook_registry.hpp"
#include "utils/logger.hpp"
#include "utils/orchestrator.hpp"
#include "utils/orchestrator_config.hpp"
#include "utils/shutdown_broadcaster.hpp"
#include "utils/signal_relay.hpp"
