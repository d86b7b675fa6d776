/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef MONITOR_H
#define MONITOR_H

#include <atomic>
#include <functional>
#include <optional>

#include <activity_signal.h>
#include <idle_state.h>
#include <util.h>

//!
//! \brief The IdleShutdownConfig class. This specializes the Config class and implements the virtual method ProcessArgs()
//! for idle_shutdown.
//!
class IdleShutdownConfig : public Config
{
    //!
    //! \brief The is the ProcessArgs() implementation for idle_shutdown.
    //!
    void ProcessArgs() override;
};

namespace IdleShutdown {

//!
//! \brief The MonitorSettings struct holds the typed settings of one monitor run. The proc, utmp and uptime paths are
//! not exposed in the config file. They exist so tests can point the signals at fixture files.
//!
struct MonitorSettings
{
    int64_t m_idle_threshold_seconds = 3600;
    int m_sample_interval_seconds = 60;
    int64_t m_boot_grace_seconds = 600;

    size_t m_log_scan_lines = 500;

    //! Age below which a log entry counts as activity. Zero means use the idle threshold.
    int m_log_scan_window_seconds = 0;

    int m_log_recency_window_seconds = 300;
    int64_t m_network_activity_threshold_bytes = 1024;

    std::vector<std::string> m_enabled_signals = {"log_scan", "login_sessions"};

    fs::path m_access_log_path = "/var/log/nginx/access.log";
    int m_app_port = 8501;
    std::vector<std::string> m_network_interfaces = {"eth0", "ens5"};
    std::vector<std::string> m_probe_user_agents = ProbeFilter::DefaultUserAgents();
    std::vector<std::string> m_probe_client_prefixes = ProbeFilter::DefaultClientPrefixes();

    fs::path m_state_file_path = "/var/lib/idle_shutdown/idle_state.dat";
    fs::path m_lock_file_path = "/run/idle_shutdown.pid";
    fs::path m_log_file_path;

    std::string m_shutdown_command = "shutdown -h now";
    bool m_execute_shutdown = true;

    std::vector<fs::path> m_tcp_table_paths = {"/proc/net/tcp", "/proc/net/tcp6"};
    fs::path m_utmp_path = "/var/run/utmp";
    fs::path m_proc_net_dev_path = "/proc/net/dev";
    fs::path m_uptime_path = "/proc/uptime";

    //!
    //! \brief Builds the settings from a processed config.
    //! \param config
    //! \return MonitorSettings
    //! \throws std::bad_variant_access if the config holds a value of the wrong type.
    //!
    static MonitorSettings FromConfig(Config& config);
};

//!
//! \brief Constructs the activity signals named in m_enabled_signals. Unknown names are logged and skipped.
//! \param settings
//! \return ActivitySampler
//!
ActivitySampler BuildSampler(const MonitorSettings& settings);

//!
//! \brief Reads the host uptime from a /proc/uptime style file.
//! \param uptime_path
//! \return uptime in whole seconds, or std::nullopt if the file is missing or malformed.
//!
std::optional<int64_t> ReadUptimeSeconds(const fs::path& uptime_path);

//!
//! \brief Runs the shutdown command through the shell and waits for it.
//! \param command
//! \return exit status of the command, or -1 if it could not be run.
//!
int ExecuteShutdownCommand(const std::string& command);

//!
//! \brief The Monitor class is the decision loop. Each Step() samples activity, applies the boot grace period, advances
//! the idle timer and logs exactly one line. When the idle threshold is reached the shutdown command is issued in the
//! same Step() and the monitor becomes terminal.
//!
class Monitor
{
public:
    //!
    //! \brief The State enum. SHUTDOWN_TRIGGERED is terminal.
    //!
    enum State {
        ACTIVE,
        IDLE_PENDING,
        SHUTDOWN_TRIGGERED
    };

    typedef std::function<int(const std::string&)> ShutdownExecutor;

    Monitor(const MonitorSettings& settings, ActivitySampler sampler, ShutdownExecutor executor);

    explicit Monitor(const MonitorSettings& settings);

    //!
    //! \brief Logs the [CONFIG] line describing the effective settings.
    //!
    void LogConfig() const;

    //!
    //! \brief Performs one iteration of the loop. A tracked idle period that started before the host booted
    //! (now - uptime) is discarded before sampling.
    //! \param now Unix Epoch time in seconds.
    //! \param uptime host uptime in seconds, or std::nullopt if unknown.
    //! \return State after the iteration.
    //!
    State Step(int64_t now, std::optional<int64_t> uptime);

    //!
    //! \brief Loops over Step() until shutdown is triggered or shutdown_requested is set.
    //! \param shutdown_requested
    //! \return process exit code: 1 if the shutdown command failed, 0 otherwise.
    //!
    int Run(const std::atomic<bool>& shutdown_requested);

    State GetState() const;

    IdleStatus GetLastStatus() const;

    //!
    //! \brief Returns true if the shutdown command was issued and returned a non-zero status.
    //!
    bool ShutdownFailed() const;

    static std::string StateToString(const State& state);

    std::string StateToString() const;

private:
    void IssueShutdown(const IdleStatus& status);

    MonitorSettings m_settings;
    ActivitySampler m_sampler;
    ShutdownExecutor m_executor;
    IdleTimer m_timer;
    State m_state;
    IdleStatus m_last_status;
    bool m_shutdown_failed;
};

//!
//! \brief Claims the singleton lock and runs the monitor. If another instance holds the lock this returns 0 without
//! touching the idle state.
//! \param settings
//! \param shutdown_requested
//! \param executor shutdown executor, defaults to ExecuteShutdownCommand.
//! \return process exit code
//!
int RunMonitor(const MonitorSettings& settings,
               const std::atomic<bool>& shutdown_requested,
               Monitor::ShutdownExecutor executor = ExecuteShutdownCommand);

//!
//! \brief As RunMonitor above, but with a caller supplied sampler.
//!
int RunMonitor(const MonitorSettings& settings,
               const std::atomic<bool>& shutdown_requested,
               ActivitySampler sampler,
               Monitor::ShutdownExecutor executor);

} // namespace IdleShutdown

#endif // MONITOR_H
