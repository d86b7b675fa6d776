/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <monitor.h>
#include <process_lock.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sys/wait.h>
#include <thread>

//!
//! \brief Parses a boolean config parameter, falling back to the default with an error if the value is invalid.
//!
static bool ProcessBoolArg(const std::string& arg, const std::string& value, bool default_value)
{
    std::optional<bool> parsed = ParseStringToBool(value);

    if (!parsed) {
        error_log("%s: %s parameter in config file has invalid value: %s",
                  __func__,
                  arg,
                  value);

        return default_value;
    }

    return *parsed;
}

//!
//! \brief Parses an integer config parameter that must be at least min_value, falling back to the default with an
//! error otherwise.
//!
static int ProcessIntArg(const std::string& arg, const std::string& value, int default_value, int min_value)
{
    int result = default_value;

    try {
        result = ParseStringToInt(value);
    } catch (std::exception& e) {
        error_log("%s: %s parameter in config file has invalid value: %s",
                  __func__,
                  arg,
                  e.what());

        return default_value;
    }

    if (result < min_value) {
        error_log("%s: %s parameter in config file must be at least %i, but is %i. Using default %i.",
                  __func__,
                  arg,
                  min_value,
                  result,
                  default_value);

        return default_value;
    }

    return result;
}

void IdleShutdownConfig::ProcessArgs()
{
    // debug

    m_config.insert(std::make_pair("debug", ProcessBoolArg("debug", GetArgString("debug", "false"), false)));

    // idle_threshold_seconds

    m_config.insert(std::make_pair("idle_threshold_seconds",
                                   ProcessIntArg("idle_threshold_seconds",
                                                 GetArgString("idle_threshold_seconds", "3600"), 3600, 1)));

    // sample_interval_seconds

    m_config.insert(std::make_pair("sample_interval_seconds",
                                   ProcessIntArg("sample_interval_seconds",
                                                 GetArgString("sample_interval_seconds", "60"), 60, 1)));

    // boot_grace_seconds

    m_config.insert(std::make_pair("boot_grace_seconds",
                                   ProcessIntArg("boot_grace_seconds",
                                                 GetArgString("boot_grace_seconds", "600"), 600, 0)));

    // log_scan_lines

    m_config.insert(std::make_pair("log_scan_lines",
                                   ProcessIntArg("log_scan_lines",
                                                 GetArgString("log_scan_lines", "500"), 500, 1)));

    // log_scan_window_seconds (0 means the idle threshold is used)

    m_config.insert(std::make_pair("log_scan_window_seconds",
                                   ProcessIntArg("log_scan_window_seconds",
                                                 GetArgString("log_scan_window_seconds", "0"), 0, 0)));

    // log_recency_window_seconds

    m_config.insert(std::make_pair("log_recency_window_seconds",
                                   ProcessIntArg("log_recency_window_seconds",
                                                 GetArgString("log_recency_window_seconds", "300"), 300, 1)));

    // network_activity_threshold_bytes

    m_config.insert(std::make_pair("network_activity_threshold_bytes",
                                   ProcessIntArg("network_activity_threshold_bytes",
                                                 GetArgString("network_activity_threshold_bytes", "1024"), 1024, 0)));

    // enabled_signals

    std::vector<std::string> enabled_signals;

    for (const auto& signal : GetArgStrings("enabled_signals", {"log_scan", "login_sessions"})) {
        enabled_signals.push_back(ToLower(signal));
    }

    m_config.insert(std::make_pair("enabled_signals", enabled_signals));

    // access_log_path

    fs::path access_log_path;

    try {
        access_log_path = fs::path(GetArgString("access_log_path", "/var/log/nginx/access.log"));
    } catch (std::exception& e){
        error_log("%s: access_log_path parameter in config file has invalid value: %s",
                  __func__,
                  e.what());
    }

    m_config.insert(std::make_pair("access_log_path", access_log_path));

    // app_port

    int app_port = ProcessIntArg("app_port", GetArgString("app_port", "8501"), 8501, 1);

    if (app_port > 65535) {
        error_log("%s: app_port parameter in config file is out of range: %i. Using default 8501.",
                  __func__,
                  app_port);

        app_port = 8501;
    }

    m_config.insert(std::make_pair("app_port", app_port));

    // network_interfaces

    m_config.insert(std::make_pair("network_interfaces", GetArgStrings("network_interfaces", {"eth0", "ens5"})));

    // probe_user_agent

    m_config.insert(std::make_pair("probe_user_agent",
                                   GetArgStrings("probe_user_agent", IdleShutdown::ProbeFilter::DefaultUserAgents())));

    // probe_client_prefix

    m_config.insert(std::make_pair("probe_client_prefix",
                                   GetArgStrings("probe_client_prefix",
                                                 IdleShutdown::ProbeFilter::DefaultClientPrefixes())));

    // state_file_path

    m_config.insert(std::make_pair("state_file_path",
                                   fs::path(GetArgString("state_file_path", "/var/lib/idle_shutdown/idle_state.dat"))));

    // lock_file_path

    m_config.insert(std::make_pair("lock_file_path", fs::path(GetArgString("lock_file_path", "/run/idle_shutdown.pid"))));

    // log_file_path

    m_config.insert(std::make_pair("log_file_path", fs::path(GetArgString("log_file_path", ""))));

    // shutdown_command

    std::string shutdown_command = GetArgString("shutdown_command", "shutdown -h now");

    if (shutdown_command.empty()) {
        error_log("%s: shutdown_command parameter in config file is empty. Using default.",
                  __func__);

        shutdown_command = "shutdown -h now";
    }

    m_config.insert(std::make_pair("shutdown_command", shutdown_command));

    // execute_shutdown

    m_config.insert(std::make_pair("execute_shutdown",
                                   ProcessBoolArg("execute_shutdown", GetArgString("execute_shutdown", "true"), true)));
}

namespace IdleShutdown {

// Struct MonitorSettings

MonitorSettings MonitorSettings::FromConfig(Config& config)
{
    MonitorSettings settings;

    settings.m_idle_threshold_seconds = std::get<int>(config.GetArg("idle_threshold_seconds"));
    settings.m_sample_interval_seconds = std::get<int>(config.GetArg("sample_interval_seconds"));
    settings.m_boot_grace_seconds = std::get<int>(config.GetArg("boot_grace_seconds"));
    settings.m_log_scan_lines = static_cast<size_t>(std::get<int>(config.GetArg("log_scan_lines")));
    settings.m_log_scan_window_seconds = std::get<int>(config.GetArg("log_scan_window_seconds"));
    settings.m_log_recency_window_seconds = std::get<int>(config.GetArg("log_recency_window_seconds"));
    settings.m_network_activity_threshold_bytes = std::get<int>(config.GetArg("network_activity_threshold_bytes"));
    settings.m_enabled_signals = std::get<std::vector<std::string>>(config.GetArg("enabled_signals"));
    settings.m_access_log_path = std::get<fs::path>(config.GetArg("access_log_path"));
    settings.m_app_port = std::get<int>(config.GetArg("app_port"));
    settings.m_network_interfaces = std::get<std::vector<std::string>>(config.GetArg("network_interfaces"));
    settings.m_probe_user_agents = std::get<std::vector<std::string>>(config.GetArg("probe_user_agent"));
    settings.m_probe_client_prefixes = std::get<std::vector<std::string>>(config.GetArg("probe_client_prefix"));
    settings.m_state_file_path = std::get<fs::path>(config.GetArg("state_file_path"));
    settings.m_lock_file_path = std::get<fs::path>(config.GetArg("lock_file_path"));
    settings.m_log_file_path = std::get<fs::path>(config.GetArg("log_file_path"));
    settings.m_shutdown_command = std::get<std::string>(config.GetArg("shutdown_command"));
    settings.m_execute_shutdown = std::get<bool>(config.GetArg("execute_shutdown"));

    return settings;
}

ActivitySampler BuildSampler(const MonitorSettings& settings)
{
    ActivitySampler sampler;

    int log_scan_window_seconds = settings.m_log_scan_window_seconds > 0 ?
                                      settings.m_log_scan_window_seconds :
                                      static_cast<int>(settings.m_idle_threshold_seconds);

    for (const auto& name : settings.m_enabled_signals) {
        if (name == "log_recency") {
            sampler.AddSignal(std::make_unique<LogRecencySignal>(settings.m_access_log_path,
                                                                 settings.m_log_recency_window_seconds));
        } else if (name == "log_scan") {
            sampler.AddSignal(std::make_unique<LogScanSignal>(settings.m_access_log_path,
                                                              settings.m_log_scan_lines,
                                                              log_scan_window_seconds,
                                                              ProbeFilter(settings.m_probe_user_agents,
                                                                          settings.m_probe_client_prefixes)));
        } else if (name == "connections") {
            sampler.AddSignal(std::make_unique<ConnectionCountSignal>(settings.m_app_port,
                                                                      settings.m_tcp_table_paths));
        } else if (name == "login_sessions") {
            sampler.AddSignal(std::make_unique<LoginSessionSignal>(settings.m_utmp_path));
        } else if (name == "network_bytes") {
            sampler.AddSignal(std::make_unique<NetworkBytesSignal>(settings.m_network_interfaces,
                                                                   settings.m_network_activity_threshold_bytes,
                                                                   settings.m_proc_net_dev_path));
        } else {
            error_log("%s: Unknown activity signal \"%s\" in enabled_signals. Ignoring it.",
                      __func__,
                      name);
        }
    }

    if (sampler.Size() == 0) {
        log("WARNING: %s: No activity signals are enabled. Every sample will be treated as idle.",
            __func__);
    }

    return sampler;
}

std::optional<int64_t> ReadUptimeSeconds(const fs::path& uptime_path)
{
    std::ifstream uptime_file(uptime_path);

    if (!uptime_file.is_open()) {
        debug_log("INFO: %s: Could not open %s.",
                  __func__,
                  uptime_path.string());
        return std::nullopt;
    }

    double uptime = 0.0;

    if (!(uptime_file >> uptime) || uptime < 0.0) {
        error_log("%s: Could not parse uptime from %s.",
                  __func__,
                  uptime_path.string());
        return std::nullopt;
    }

    return static_cast<int64_t>(uptime);
}

int ExecuteShutdownCommand(const std::string& command)
{
    int status = std::system(command.c_str());

    if (status == -1) {
        return -1;
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    return -1;
}

// Class Monitor

Monitor::Monitor(const MonitorSettings& settings, ActivitySampler sampler, ShutdownExecutor executor)
    : m_settings(settings)
    , m_sampler(std::move(sampler))
    , m_executor(std::move(executor))
    , m_timer(IdleStateStore(settings.m_state_file_path), settings.m_idle_threshold_seconds)
    , m_state(ACTIVE)
    , m_last_status()
    , m_shutdown_failed(false)
{
    m_last_status.m_remaining = settings.m_idle_threshold_seconds;

    if (m_timer.Restore()) {
        m_state = IDLE_PENDING;

        log("INFO: %s: Resuming idle period that started at %s.",
            __func__,
            FormatISO8601DateTime(*m_timer.GetFirstIdleTimestamp()));
    }
}

Monitor::Monitor(const MonitorSettings& settings)
    : Monitor(settings, BuildSampler(settings), ExecuteShutdownCommand)
{}

void Monitor::LogConfig() const
{
    std::string signals;

    for (const auto& name : m_sampler.GetSignalNames()) {
        if (!signals.empty()) {
            signals += ",";
        }

        signals += name;
    }

    log("[CONFIG] threshold=%llds interval=%is boot_grace=%llds signals=%s state_file=%s execute_shutdown=%s",
        m_settings.m_idle_threshold_seconds,
        m_settings.m_sample_interval_seconds,
        m_settings.m_boot_grace_seconds,
        signals.empty() ? "none" : signals,
        m_settings.m_state_file_path.string(),
        m_settings.m_execute_shutdown ? "true" : "false");

    debug_log("INFO: %s: access_log_path=%s app_port=%i network_interfaces=%i shutdown_command='%s'",
              __func__,
              m_settings.m_access_log_path.string(),
              m_settings.m_app_port,
              m_settings.m_network_interfaces.size(),
              m_settings.m_shutdown_command);
}

Monitor::State Monitor::Step(int64_t now, std::optional<int64_t> uptime)
{
    if (m_state == SHUTDOWN_TRIGGERED) {
        return m_state;
    }

    if (uptime && *uptime < m_settings.m_boot_grace_seconds) {
        m_timer.Reset();
        m_state = ACTIVE;

        m_last_status = IdleStatus();
        m_last_status.m_remaining = m_settings.m_idle_threshold_seconds;

        log("[GRACE] Host uptime %llds is within the %llds boot grace period. Treating host as active. "
            "elapsed=%llds remaining=%llds",
            *uptime,
            m_settings.m_boot_grace_seconds,
            m_last_status.m_elapsed,
            m_last_status.m_remaining);

        return m_state;
    }

    // The state file outlives a reboot. An idle period that started before this boot is not carried over.
    std::optional<int64_t> first_idle_timestamp = m_timer.GetFirstIdleTimestamp();

    if (uptime && first_idle_timestamp && *first_idle_timestamp < now - *uptime) {
        log("INFO: %s: Discarding idle period that started at %s, before the host booted at %s.",
            __func__,
            FormatISO8601DateTime(*first_idle_timestamp),
            FormatISO8601DateTime(now - *uptime));

        m_timer.Reset();
        m_state = ACTIVE;
    }

    SampleResult sample = m_sampler.Sample(now);

    m_last_status = m_timer.Observe(sample.m_active, now);

    if (sample.m_active) {
        m_state = ACTIVE;

        log("[ACTIVE] Activity detected. Idle timer reset. elapsed=%llds remaining=%llds (%s)",
            m_last_status.m_elapsed,
            m_last_status.m_remaining,
            sample.Summary());
    } else if (m_last_status.m_triggered) {
        m_state = SHUTDOWN_TRIGGERED;

        IssueShutdown(m_last_status);
    } else {
        m_state = IDLE_PENDING;

        log("[IDLE] No activity. elapsed=%llds remaining=%llds (%s)",
            m_last_status.m_elapsed,
            m_last_status.m_remaining,
            sample.Summary());
    }

    return m_state;
}

void Monitor::IssueShutdown(const IdleStatus& status)
{
    if (!m_settings.m_execute_shutdown) {
        log("[SHUTDOWN] Idle limit reached. execute_shutdown is false, so the host will not be powered off. "
            "elapsed=%llds remaining=%llds",
            status.m_elapsed,
            status.m_remaining);
        return;
    }

    log("[SHUTDOWN] Idle limit reached. Powering off with \"%s\". elapsed=%llds remaining=%llds",
        m_settings.m_shutdown_command,
        status.m_elapsed,
        status.m_remaining);

    int result = m_executor(m_settings.m_shutdown_command);

    if (result != 0) {
        m_shutdown_failed = true;

        error_log("%s: Shutdown command \"%s\" failed with status %i.",
                  __func__,
                  m_settings.m_shutdown_command,
                  result);
    }
}

int Monitor::Run(const std::atomic<bool>& shutdown_requested)
{
    while (!shutdown_requested.load()) {
        State state = Step(GetUnixEpochTime(), ReadUptimeSeconds(m_settings.m_uptime_path));

        if (state == SHUTDOWN_TRIGGERED) {
            break;
        }

        // Sleep for the sample interval, but check for a shutdown request every 100 ms.
        auto wake_up_time = std::chrono::steady_clock::now() + std::chrono::seconds(m_settings.m_sample_interval_seconds);
        while (std::chrono::steady_clock::now() < wake_up_time) {
            if (shutdown_requested.load()) {
                debug_log("INFO: %s: Shutdown requested during sleep interval.",
                          __func__);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    if (m_state == SHUTDOWN_TRIGGERED) {
        return m_shutdown_failed ? 1 : 0;
    }

    log("INFO: %s: Shutdown requested. Exiting with idle state %s.",
        __func__,
        StateToString());

    return 0;
}

Monitor::State Monitor::GetState() const
{
    return m_state;
}

IdleStatus Monitor::GetLastStatus() const
{
    return m_last_status;
}

bool Monitor::ShutdownFailed() const
{
    return m_shutdown_failed;
}

std::string Monitor::StateToString(const State& state)
{
    std::string out;

    switch (state) {
    case ACTIVE:
        out = "active";
        break;
    case IDLE_PENDING:
        out = "idle_pending";
        break;
    case SHUTDOWN_TRIGGERED:
        out = "shutdown_triggered";
        break;
    }

    return out;
}

std::string Monitor::StateToString() const
{
    return StateToString(m_state);
}

int RunMonitor(const MonitorSettings& settings,
               const std::atomic<bool>& shutdown_requested,
               Monitor::ShutdownExecutor executor)
{
    return RunMonitor(settings, shutdown_requested, BuildSampler(settings), std::move(executor));
}

int RunMonitor(const MonitorSettings& settings,
               const std::atomic<bool>& shutdown_requested,
               ActivitySampler sampler,
               Monitor::ShutdownExecutor executor)
{
    ProcessLock lock(settings.m_lock_file_path);

    try {
        if (!lock.TryAcquire()) {
            std::optional<pid_t> holder = lock.GetHolderPid();

            log("INFO: %s: Another instance holds %s (pid %s). Nothing to do.",
                __func__,
                settings.m_lock_file_path.string(),
                holder ? ::ToString(*holder) : "unknown");

            return 0;
        }
    } catch (LockException& e) {
        error_log("%s: %s",
                  __func__,
                  e.what());

        return 1;
    }

    Monitor monitor(settings, std::move(sampler), std::move(executor));

    monitor.LogConfig();

    return monitor.Run(shutdown_requested);
}

} // namespace IdleShutdown
