/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef RELEASE_H
#define RELEASE_H

#include <string>

#define IDLE_SHUTDOWN_VERSION_MAJOR 0
#define IDLE_SHUTDOWN_VERSION_MINOR 1
#define IDLE_SHUTDOWN_VERSION_PATCH 0
#define IDLE_SHUTDOWN_VERSION_TWEAK 0

#define IS__STRINGIFY(x) #x
#define IS_STRINGIFY(x) IS__STRINGIFY(x)

#define IDLE_SHUTDOWN_VERSION_STRING \
IS_STRINGIFY(IDLE_SHUTDOWN_VERSION_MAJOR) "." \
    IS_STRINGIFY(IDLE_SHUTDOWN_VERSION_MINOR) "." \
    IS_STRINGIFY(IDLE_SHUTDOWN_VERSION_PATCH) "." \
    IS_STRINGIFY(IDLE_SHUTDOWN_VERSION_TWEAK)

const std::string g_version_datetime = "20261019";

const std::string g_version = std::string("version ") + std::string(IDLE_SHUTDOWN_VERSION_STRING) + " - " + g_version_datetime;

#endif // RELEASE_H
