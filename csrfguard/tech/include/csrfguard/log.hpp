#pragma once

// spdlog is consumed header only. The define stays local to the translation units including this
// header instead of being a public compile definition of the library targets.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace csrfguard {

// All logging goes through the spdlog default logger: log::debug, log::info, log::error...
namespace log = spdlog;

}  // namespace csrfguard
