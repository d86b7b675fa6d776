/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef ACTIVITY_SIGNAL_H
#define ACTIVITY_SIGNAL_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <util.h>

namespace IdleShutdown {

//!
//! \brief The SignalResult struct is the verdict of a single activity signal for a single sample.
//!
struct SignalResult
{
    //! Name of the signal that produced the result (e.g. "log_scan").
    std::string m_signal;

    //! True if the signal observed activity in this sample.
    bool m_active = false;

    //! Human readable explanation of the verdict, used in the log stream.
    std::string m_reason;
};

//!
//! \brief The SampleResult struct aggregates the per-signal results of one sample. m_active is the logical OR of
//! the individual results.
//!
struct SampleResult
{
    bool m_active = false;

    std::vector<SignalResult> m_results;

    //!
    //! \brief Returns a one line summary of the per-signal results in the form "name: reason; name: reason".
    //! \return summary string
    //!
    std::string Summary() const;
};

//!
//! \brief The ActivitySignal class is the interface implemented by each source of evidence about workspace usage.
//! Implementations must not throw out of Sample(). A missing or unreadable source is reported as inactive.
//!
class ActivitySignal
{
public:
    virtual ~ActivitySignal() = default;

    //!
    //! \brief Returns the configuration name of the signal.
    //!
    virtual std::string Name() const = 0;

    //!
    //! \brief Samples the signal.
    //! \param now Unix Epoch time in seconds of the sample.
    //! \return SignalResult verdict
    //!
    virtual SignalResult Sample(int64_t now) = 0;
};

//!
//! \brief Parses the bracketed common log format timestamp "dd/Mon/yyyy:HH:MM:SS +ZZZZ" (brackets optional).
//! \param timestamp_str
//! \return Unix Epoch time in seconds, or std::nullopt if the string is malformed.
//!
std::optional<int64_t> ParseCommonLogTimestamp(const std::string& timestamp_str);

//!
//! \brief The AccessLogEntry class holds the fields of one reverse-proxy access log line that matter for activity
//! detection. Lines are expected in the nginx "combined" format, optionally followed by a quoted X-Forwarded-For.
//!
class AccessLogEntry
{
public:
    std::string m_client_address;
    int64_t m_timestamp = 0;
    std::string m_request;
    std::string m_user_agent;
    std::string m_forwarded_for;

    //!
    //! \brief Parses a single access log line.
    //! \param line
    //! \return AccessLogEntry, or std::nullopt if the line has no client field or no valid bracketed timestamp.
    //!
    static std::optional<AccessLogEntry> Parse(const std::string& line);
};

//!
//! \brief The ProbeFilter class classifies access log entries that originate from infrastructure (load balancer health
//! checks, CDN edge fetches, loopback requests) rather than from a person using the workspace.
//!
class ProbeFilter
{
public:
    //! Constructs a filter with the default probe lists.
    ProbeFilter();

    //!
    //! \brief Constructs a filter from explicit lists.
    //! \param user_agents substrings matched case-insensitively against the user agent.
    //! \param client_prefixes prefixes matched against the client address.
    //!
    ProbeFilter(std::vector<std::string> user_agents, std::vector<std::string> client_prefixes);

    //!
    //! \brief Returns true if the entry is infrastructure traffic and must not count as activity.
    //!
    bool IsProbe(const AccessLogEntry& entry) const;

    static std::vector<std::string> DefaultUserAgents();

    static std::vector<std::string> DefaultClientPrefixes();

private:
    //! Lowercased user agent substrings.
    std::vector<std::string> m_user_agents;

    std::vector<std::string> m_client_prefixes;
};

//!
//! \brief Activity if the access log was modified within the recency window. Cheap, but any write to the log counts,
//! including health checks.
//!
class LogRecencySignal : public ActivitySignal
{
public:
    LogRecencySignal(fs::path access_log_path, int recency_window_seconds);

    std::string Name() const override;

    SignalResult Sample(int64_t now) override;

private:
    fs::path m_access_log_path;
    int m_recency_window_seconds;
};

//!
//! \brief Activity if any non-probe entry among the last N lines of the access log is younger than the scan window.
//! This is the preferred signal when an access log is available.
//!
class LogScanSignal : public ActivitySignal
{
public:
    LogScanSignal(fs::path access_log_path, size_t scan_lines, int window_seconds, ProbeFilter probe_filter);

    std::string Name() const override;

    SignalResult Sample(int64_t now) override;

private:
    fs::path m_access_log_path;
    size_t m_scan_lines;
    int m_window_seconds;
    ProbeFilter m_probe_filter;
};

//!
//! \brief Activity if there is at least one ESTABLISHED TCP connection on the application's listening port. This
//! cannot distinguish a lingering connection from active use, so it is only a corroborating signal.
//!
class ConnectionCountSignal : public ActivitySignal
{
public:
    ConnectionCountSignal(int app_port, std::vector<fs::path> tcp_table_paths);

    std::string Name() const override;

    SignalResult Sample(int64_t now) override;

    //!
    //! \brief Counts ESTABLISHED entries with the given local port in a /proc/net/tcp or /proc/net/tcp6 style table.
    //! \param tcp_table_path
    //! \param port
    //! \return count of connections
    //! \throws FileSystemException if the table cannot be opened.
    //!
    static int CountEstablished(const fs::path& tcp_table_path, int port);

private:
    int m_app_port;
    std::vector<fs::path> m_tcp_table_paths;
};

//!
//! \brief Activity if at least one interactive login session is recorded in the utmp database. Records whose owning
//! process no longer exists are ignored. This is a safety signal that prevents shutting down under an operator.
//!
class LoginSessionSignal : public ActivitySignal
{
public:
    explicit LoginSessionSignal(fs::path utmp_path);

    std::string Name() const override;

    SignalResult Sample(int64_t now) override;

    //!
    //! \brief Counts live USER_PROCESS records in the provided utmp file.
    //! \param utmp_path
    //! \return count of sessions
    //! \throws FileSystemException if the utmp database cannot be selected.
    //!
    static int CountLoginSessions(const fs::path& utmp_path);

private:
    fs::path m_utmp_path;
};

//!
//! \brief Activity if the cumulative RX + TX byte count of the monitored interfaces grew by more than the threshold
//! since the previous sample. Noisy, so it is intended as a fallback when no application log exists. The first sample
//! only establishes the baseline.
//!
class NetworkBytesSignal : public ActivitySignal
{
public:
    NetworkBytesSignal(std::vector<std::string> interfaces, int64_t threshold_bytes, fs::path proc_net_dev_path);

    std::string Name() const override;

    SignalResult Sample(int64_t now) override;

    //!
    //! \brief Sums RX and TX bytes of the listed interfaces from a /proc/net/dev style file.
    //! \param proc_net_dev_path
    //! \param interfaces
    //! \return total bytes, or std::nullopt if the file is missing or none of the interfaces is present.
    //!
    static std::optional<uint64_t> ReadInterfaceBytes(const fs::path& proc_net_dev_path,
                                                      const std::vector<std::string>& interfaces);

private:
    std::vector<std::string> m_interfaces;
    int64_t m_threshold_bytes;
    fs::path m_proc_net_dev_path;

    //! Byte total of the previous successful read. Unset until the baseline is established.
    std::optional<uint64_t> m_previous_bytes;
};

//!
//! \brief The ActivitySampler class composes the enabled signals. The aggregate verdict is active if any signal is
//! active. Every signal is sampled on every call so that each reason is logged and stateful signals advance.
//!
class ActivitySampler
{
public:
    ActivitySampler() = default;

    ActivitySampler(ActivitySampler&&) = default;
    ActivitySampler& operator=(ActivitySampler&&) = default;

    void AddSignal(std::unique_ptr<ActivitySignal> signal);

    size_t Size() const;

    //!
    //! \brief Names of the configured signals in sampling order.
    //!
    std::vector<std::string> GetSignalNames() const;

    //!
    //! \brief Samples all signals. An exception escaping a signal is logged and that signal is treated as inactive.
    //! \param now Unix Epoch time in seconds.
    //! \return SampleResult
    //!
    SampleResult Sample(int64_t now);

private:
    std::vector<std::unique_ptr<ActivitySignal>> m_signals;
};

} // namespace IdleShutdown

#endif // ACTIVITY_SIGNAL_H
