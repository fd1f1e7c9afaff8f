// tests/test_framework/test_entrypoint.h
#pragma once

#include <string>

#include <gtest/gtest.h>

/**
 * @file test_entrypoint.h
 * @brief Globals provided by the shared test main.
 */

/// Path of the running test executable (argv[0]).
extern std::string g_self_exe_path;
