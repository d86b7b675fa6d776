/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <atomic>
#include <csignal>
#include <cstring>
#include <unistd.h>

#include <monitor.h>
#include <release.h>
#include <util.h>

//!
//! \brief Global config singleton for idle_shutdown.
//!
IdleShutdownConfig g_config;

//!
//! \brief Set by the SIGINT/SIGTERM handler. The monitor loop polls it during its sleep interval.
//!
std::atomic<bool> g_shutdown_requested = false;

//!
//! \brief Signal handler for SIGINT and SIGTERM. Only sets the shutdown request flag.
//! \param signum
//!
void HandleSignal(int signum)
{
    if (signum == SIGINT || signum == SIGTERM) {
        g_shutdown_requested.store(true);
    }
}

//!
//! \brief This is the main function for idle_shutdown. It takes one argument, the location of the config file.
//! \param argc
//! \param argv
//! \return exit code, 0 for normal (including when another instance is already running), non-zero otherwise.
//!
int main(int argc, char* argv[])
{
    std::optional<std::string> journal_stream = GetEnvVariable("JOURNAL_STREAM");
    if (journal_stream && !journal_stream->empty()) {
        // journald adds its own timestamps.
        g_log_timestamps.store(false);
    } else {
        g_log_timestamps.store(true);
    }

    // --- Configuration Loading ---
    //
    // We can safely use error_log and log before reading config.
    if (argc != 2) {
        error_log("%s: One argument must be specified for the location of the config file.",
                  __func__);
        return 1;
    }
    fs::path config_file_path(argv[1]);
    if (fs::exists(config_file_path) && fs::is_regular_file(config_file_path)) {
        log("INFO: %s: Using config from %s",
            __func__,
            config_file_path.string());
    } else {
        log("WARNING: %s: Argument invalid for config file \"%s\". Using defaults.",
            __func__,
            config_file_path.string());

        config_file_path = "";
    }

    try {
        g_config.ReadAndUpdateConfig(config_file_path);
    } catch (const std::exception& e) {
        error_log("%s: Failed to read/process config: %s",
                  __func__,
                  e.what());

        return 1;
    }

    // Populate g_debug from the config to avoid having to call the heavyweight GetArg in each log function call.
    g_debug = std::get<bool>(g_config.GetArg("debug"));

    IdleShutdown::MonitorSettings settings;

    try {
        settings = IdleShutdown::MonitorSettings::FromConfig(g_config);
    } catch (const std::bad_variant_access& e) {
        error_log("%s: Configuration value missing or has wrong type: %s",
                  __func__,
                  e.what());
        return 1;
    }

    if (!SetLogFile(settings.m_log_file_path)) {
        error_log("%s: Could not open log file %s. Logging to the console only.",
                  __func__,
                  settings.m_log_file_path.string());
    }

    // --- Signal Handling Setup ---
    struct sigaction action;
    memset(&action, 0, sizeof(struct sigaction));
    action.sa_handler = HandleSignal;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) == -1 || sigaction(SIGTERM, &action, nullptr) == -1) {
        error_log("%s: Failed to set signal handlers: %s",
                  __func__,
                  strerror(errno));
        return 1;
    }

    log("[START] idle_shutdown C++ program, %s, started, pid %i",
        g_version,
        getpid());

    int exit_code = IdleShutdown::RunMonitor(settings, g_shutdown_requested);

    debug_log("INFO: %s: Exiting with code %i.",
              __func__,
              exit_code);

    return exit_code;
}
