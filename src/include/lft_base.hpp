#pragma once
/**
 * @file lft_base.hpp
 * @brief Layer 1: Basic modules built on lft_platform.
 *
 * Provides format_tools, debug_info, scope_guard, Result and Error.
 * Include this when you need formatting, debug utilities, RAII guards or the
 * error value types.
 */
#include "lft_platform.hpp"

// Standard library support required by format_tools, debug_info, and guards
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/debug_info.hpp"
#include "utils/error.hpp"
#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
