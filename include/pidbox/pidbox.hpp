#pragma once

/**
 * @file pidbox.hpp
 * @brief Main header for the pidbox control-bus ping library
 *
 * Pulls in configuration, the transport interface with both broker
 * implementations, and result rendering.
 */

#include "config.hpp"
#include "errors.hpp"
#include "output.hpp"
#include "transport/amqp_transport.hpp"
#include "transport/redis_transport.hpp"
#include "transport/transport.hpp"

// Version information
#define PIDBOX_VERSION_MAJOR 1
#define PIDBOX_VERSION_MINOR 0
#define PIDBOX_VERSION_PATCH 0
#define PIDBOX_VERSION_STRING "1.0.0"

#ifndef PIDBOX_BUILD_TYPE
#define PIDBOX_BUILD_TYPE "unknown"
#endif

namespace pidbox {

/**
 * @brief Get pidbox version string
 */
inline const char* version() {
    return PIDBOX_VERSION_STRING;
}

inline const char* build_type() {
    return PIDBOX_BUILD_TYPE;
}

/**
 * @brief "<os>/<arch>" of the build
 */
inline const char* platform() {
#if defined(__linux__) && defined(__x86_64__)
    return "linux/amd64";
#elif defined(__linux__) && defined(__aarch64__)
    return "linux/arm64";
#elif defined(__APPLE__) && defined(__aarch64__)
    return "darwin/arm64";
#elif defined(__APPLE__)
    return "darwin/amd64";
#elif defined(__linux__)
    return "linux/unknown";
#else
    return "unknown";
#endif
}

} // namespace pidbox
