#pragma once

#include <exception>

namespace showlink {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitUsageError = 1;
inline constexpr int kExitConfigurationError = 2;
inline constexpr int kExitRuntimeError = 3;

int ExitCodeForException(const std::exception &error);

} // namespace showlink
