/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace ps::log {
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace ps::log

#define PS_LOG_INFO(fmt, ...) ::ps::log::info(fmt, ##__VA_ARGS__)
#define PS_LOG_WARN(fmt, ...) ::ps::log::warn(fmt, ##__VA_ARGS__)
#define PS_LOG_ERROR(fmt, ...) ::ps::log::error(fmt, ##__VA_ARGS__)
