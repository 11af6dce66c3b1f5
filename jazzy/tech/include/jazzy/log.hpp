#pragma once

// Logging goes through spdlog. Call sites use the fmt syntax: log::debug("fd # {} closed", fd);
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace jazzy {

namespace log = spdlog;

}  // namespace jazzy
