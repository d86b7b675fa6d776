/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <activity_signal.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <system_error>
#include <sys/stat.h>
#include <unistd.h>
#include <utmpx.h>

namespace IdleShutdown {

std::string SampleResult::Summary() const
{
    std::string out;

    for (const auto& result : m_results) {
        if (!out.empty()) {
            out += "; ";
        }

        out += result.m_signal + "=" + (result.m_active ? "active" : "inactive") + " (" + result.m_reason + ")";
    }

    if (out.empty()) {
        out = "no signals enabled";
    }

    return out;
}

std::optional<int64_t> ParseCommonLogTimestamp(const std::string& timestamp_str)
{
    static const char* const months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::string str = TrimString(timestamp_str, " []");

    int day = 0;
    int year = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int offset_hours = 0;
    int offset_minutes = 0;
    char month_str[4] = {};
    char sign = 0;
    int consumed = 0;

    if (std::sscanf(str.c_str(), "%2d/%3c/%4d:%2d:%2d:%2d %c%2d%2d%n",
                    &day, month_str, &year, &hour, &minute, &second,
                    &sign, &offset_hours, &offset_minutes, &consumed) != 9
        || static_cast<size_t>(consumed) != str.size()) {
        return std::nullopt;
    }

    int month = -1;

    for (int i = 0; i < 12; ++i) {
        if (std::strcmp(month_str, months[i]) == 0) {
            month = i;
            break;
        }
    }

    if (month < 0 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 || minute > 59
        || second < 0 || second > 60 || (sign != '+' && sign != '-')
        || offset_hours < 0 || offset_hours > 23 || offset_minutes < 0 || offset_minutes > 59) {
        return std::nullopt;
    }

    struct tm ts = {};
    ts.tm_year = year - 1900;
    ts.tm_mon = month;
    ts.tm_mday = day;
    ts.tm_hour = hour;
    ts.tm_min = minute;
    ts.tm_sec = second;

    int64_t local_time = static_cast<int64_t>(timegm(&ts));

    int64_t offset_seconds = offset_hours * 3600 + offset_minutes * 60;

    if (sign == '-') {
        offset_seconds = -offset_seconds;
    }

    return local_time - offset_seconds;
}

std::optional<AccessLogEntry> AccessLogEntry::Parse(const std::string& line)
{
    std::string trimmed = TrimString(line);

    std::string::size_type space_pos = trimmed.find(' ');

    if (trimmed.empty() || space_pos == std::string::npos || space_pos == 0) {
        return std::nullopt;
    }

    std::string::size_type open_pos = trimmed.find('[', space_pos);
    std::string::size_type close_pos = (open_pos == std::string::npos) ? std::string::npos : trimmed.find(']', open_pos);

    if (close_pos == std::string::npos) {
        return std::nullopt;
    }

    std::optional<int64_t> timestamp = ParseCommonLogTimestamp(trimmed.substr(open_pos + 1, close_pos - open_pos - 1));

    if (!timestamp) {
        return std::nullopt;
    }

    AccessLogEntry entry;
    entry.m_client_address = trimmed.substr(0, space_pos);
    entry.m_timestamp = *timestamp;

    // Quoted fields after the timestamp: request, referer, user agent and, if logged, X-Forwarded-For.
    std::vector<std::string> quoted_fields;
    std::string::size_type pos = close_pos + 1;

    while ((pos = trimmed.find('"', pos)) != std::string::npos) {
        std::string field;
        std::string::size_type i = pos + 1;
        bool closed = false;

        for (; i < trimmed.size(); ++i) {
            char c = trimmed[i];

            if (c == '\\' && i + 1 < trimmed.size()) {
                field += trimmed[++i];
            } else if (c == '"') {
                closed = true;
                break;
            } else {
                field += c;
            }
        }

        if (!closed) {
            break;
        }

        quoted_fields.push_back(field);
        pos = i + 1;
    }

    if (quoted_fields.size() > 0) {
        entry.m_request = quoted_fields[0];
    }

    if (quoted_fields.size() > 2) {
        entry.m_user_agent = quoted_fields[2];
    }

    if (quoted_fields.size() > 3) {
        entry.m_forwarded_for = quoted_fields[3];
    }

    return entry;
}

// Class ProbeFilter

ProbeFilter::ProbeFilter()
    : ProbeFilter(DefaultUserAgents(), DefaultClientPrefixes())
{}

ProbeFilter::ProbeFilter(std::vector<std::string> user_agents, std::vector<std::string> client_prefixes)
    : m_user_agents()
    , m_client_prefixes()
{
    for (const auto& user_agent : user_agents) {
        if (!user_agent.empty()) {
            m_user_agents.push_back(ToLower(user_agent));
        }
    }

    for (const auto& prefix : client_prefixes) {
        if (!prefix.empty()) {
            m_client_prefixes.push_back(ToLower(prefix));
        }
    }
}

std::vector<std::string> ProbeFilter::DefaultUserAgents()
{
    return {"ELB-HealthChecker", "Amazon CloudFront", "Amazon-Route53-Health-Check-Service"};
}

std::vector<std::string> ProbeFilter::DefaultClientPrefixes()
{
    return {"127.", "::1", "::ffff:127."};
}

bool ProbeFilter::IsProbe(const AccessLogEntry& entry) const
{
    std::string client = ToLower(entry.m_client_address);

    if (client == "localhost") {
        return true;
    }

    for (const auto& prefix : m_client_prefixes) {
        if (client.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }

    std::string user_agent = ToLower(entry.m_user_agent);

    for (const auto& probe_agent : m_user_agents) {
        if (user_agent.find(probe_agent) != std::string::npos) {
            return true;
        }
    }

    return false;
}

// Class LogRecencySignal

LogRecencySignal::LogRecencySignal(fs::path access_log_path, int recency_window_seconds)
    : m_access_log_path(std::move(access_log_path))
    , m_recency_window_seconds(recency_window_seconds)
{}

std::string LogRecencySignal::Name() const
{
    return "log_recency";
}

SignalResult LogRecencySignal::Sample(int64_t now)
{
    SignalResult result {Name(), false, {}};

    struct stat sbuf;

    if (stat(m_access_log_path.c_str(), &sbuf) != 0) {
        int stat_errno = errno;

        if (stat_errno == ENOENT) {
            result.m_reason = tfm::format("access log %s not found", m_access_log_path.string());
        } else {
            error_log("%s: Could not stat access log %s: %s",
                      __func__,
                      m_access_log_path.string(),
                      strerror(stat_errno));

            result.m_reason = tfm::format("could not stat access log: %s", strerror(stat_errno));
        }

        return result;
    }

    int64_t age = now - static_cast<int64_t>(sbuf.st_mtime);

    result.m_active = age < m_recency_window_seconds;
    result.m_reason = tfm::format("access log modified %llds ago, window %ds", age, m_recency_window_seconds);

    return result;
}

// Class LogScanSignal

LogScanSignal::LogScanSignal(fs::path access_log_path, size_t scan_lines, int window_seconds, ProbeFilter probe_filter)
    : m_access_log_path(std::move(access_log_path))
    , m_scan_lines(scan_lines)
    , m_window_seconds(window_seconds)
    , m_probe_filter(std::move(probe_filter))
{}

std::string LogScanSignal::Name() const
{
    return "log_scan";
}

SignalResult LogScanSignal::Sample(int64_t now)
{
    SignalResult result {Name(), false, {}};

    std::error_code ec;

    if (!fs::exists(m_access_log_path, ec)) {
        result.m_reason = tfm::format("access log %s not found", m_access_log_path.string());
        return result;
    }

    std::vector<std::string> lines;

    try {
        lines = ReadLastLines(m_access_log_path, m_scan_lines);
    } catch (FileSystemException& e) {
        error_log("%s: Skipping access log scan: %s",
                  __func__,
                  e.what());

        result.m_reason = "access log read error";
        return result;
    }

    int user_entries = 0;
    int probe_entries = 0;
    int unparsed_lines = 0;
    int64_t latest_user_timestamp = 0;

    for (const auto& line : lines) {
        std::optional<AccessLogEntry> entry = AccessLogEntry::Parse(line);

        if (!entry) {
            ++unparsed_lines;
            continue;
        }

        if (m_probe_filter.IsProbe(*entry)) {
            ++probe_entries;
            continue;
        }

        // Entries stamped in the future (clock skew) count as recent.
        if (now - entry->m_timestamp < m_window_seconds) {
            ++user_entries;
            latest_user_timestamp = std::max(latest_user_timestamp, entry->m_timestamp);
        }
    }

    debug_log("INFO: %s: scanned %u lines: %d recent user entries, %d probe entries, %d unparsed lines",
              __func__,
              lines.size(),
              user_entries,
              probe_entries,
              unparsed_lines);

    if (user_entries > 0) {
        result.m_active = true;
        result.m_reason = tfm::format("%d user requests within %ds, latest at %s",
                                    user_entries,
                                    m_window_seconds,
                                    FormatISO8601DateTime(latest_user_timestamp));
    } else {
        result.m_reason = tfm::format("no user requests within %ds in last %u lines, %d probe entries ignored",
                                    m_window_seconds,
                                    lines.size(),
                                    probe_entries);
    }

    return result;
}

// Class ConnectionCountSignal

ConnectionCountSignal::ConnectionCountSignal(int app_port, std::vector<fs::path> tcp_table_paths)
    : m_app_port(app_port)
    , m_tcp_table_paths(std::move(tcp_table_paths))
{}

std::string ConnectionCountSignal::Name() const
{
    return "connections";
}

int ConnectionCountSignal::CountEstablished(const fs::path& tcp_table_path, int port)
{
    // State code of TCP_ESTABLISHED in the kernel's socket tables.
    const std::string established = "01";

    std::ifstream table(tcp_table_path);

    if (!table.is_open()) {
        throw FileSystemException("Could not open TCP socket table.", tcp_table_path);
    }

    int count = 0;
    std::string line;

    // Header line.
    std::getline(table, line);

    while (std::getline(table, line)) {
        std::istringstream line_stream(line);
        std::string slot;
        std::string local_address;
        std::string remote_address;
        std::string state;

        if (!(line_stream >> slot >> local_address >> remote_address >> state)) {
            continue;
        }

        std::string::size_type colon_pos = local_address.rfind(':');

        if (colon_pos == std::string::npos) {
            continue;
        }

        const char* port_str = local_address.c_str() + colon_pos + 1;
        char* end = nullptr;
        long local_port = std::strtol(port_str, &end, 16);

        if (end == port_str || *end != '\0') {
            continue;
        }

        if (local_port == port && state == established) {
            ++count;
        }
    }

    return count;
}

SignalResult ConnectionCountSignal::Sample(int64_t)
{
    SignalResult result {Name(), false, {}};

    int count = 0;
    int tables_read = 0;

    for (const auto& table_path : m_tcp_table_paths) {
        std::error_code ec;

        // tcp6 is absent when IPv6 is disabled.
        if (!fs::exists(table_path, ec)) {
            continue;
        }

        try {
            count += CountEstablished(table_path, m_app_port);
            ++tables_read;
        } catch (FileSystemException& e) {
            error_log("%s: %s",
                      __func__,
                      e.what());
        }
    }

    if (tables_read == 0) {
        result.m_reason = "no TCP socket table available";
        return result;
    }

    result.m_active = count > 0;
    result.m_reason = tfm::format("%d established connections on port %d", count, m_app_port);

    return result;
}

// Class LoginSessionSignal

LoginSessionSignal::LoginSessionSignal(fs::path utmp_path)
    : m_utmp_path(std::move(utmp_path))
{}

std::string LoginSessionSignal::Name() const
{
    return "login_sessions";
}

int LoginSessionSignal::CountLoginSessions(const fs::path& utmp_path)
{
    if (utmpxname(utmp_path.c_str()) != 0) {
        throw FileSystemException("Could not select utmp database.", utmp_path);
    }

    int count = 0;

    setutxent();

    struct utmpx* entry = nullptr;

    while ((entry = getutxent()) != nullptr) {
        if (entry->ut_type != USER_PROCESS) {
            continue;
        }

        // Records left behind by a crashed login process are not sessions.
        if (entry->ut_pid > 0 && kill(entry->ut_pid, 0) != 0 && errno == ESRCH) {
            debug_log("INFO: %s: ignoring stale utmp record for %s (pid %i)",
                      __func__,
                      std::string(entry->ut_user, strnlen(entry->ut_user, sizeof(entry->ut_user))),
                      entry->ut_pid);
            continue;
        }

        ++count;
    }

    endutxent();

    return count;
}

SignalResult LoginSessionSignal::Sample(int64_t)
{
    SignalResult result {Name(), false, {}};

    std::error_code ec;

    if (!fs::exists(m_utmp_path, ec)) {
        result.m_reason = tfm::format("utmp database %s not found", m_utmp_path.string());
        return result;
    }

    int count = 0;

    try {
        count = CountLoginSessions(m_utmp_path);
    } catch (FileSystemException& e) {
        error_log("%s: %s",
                  __func__,
                  e.what());

        result.m_reason = "utmp read error";
        return result;
    }

    result.m_active = count > 0;
    result.m_reason = tfm::format("%d login sessions", count);

    return result;
}

// Class NetworkBytesSignal

NetworkBytesSignal::NetworkBytesSignal(std::vector<std::string> interfaces, int64_t threshold_bytes, fs::path proc_net_dev_path)
    : m_interfaces(std::move(interfaces))
    , m_threshold_bytes(threshold_bytes)
    , m_proc_net_dev_path(std::move(proc_net_dev_path))
    , m_previous_bytes()
{}

std::string NetworkBytesSignal::Name() const
{
    return "network_bytes";
}

std::optional<uint64_t> NetworkBytesSignal::ReadInterfaceBytes(const fs::path& proc_net_dev_path,
                                                               const std::vector<std::string>& interfaces)
{
    std::ifstream netstats(proc_net_dev_path);

    if (!netstats.is_open()) {
        return std::nullopt;
    }

    bool found = false;
    uint64_t total = 0;
    std::string line;

    while (std::getline(netstats, line)) {
        // The two header lines have no colon. Counters may follow the colon without a space.
        std::string::size_type colon_pos = line.find(':');

        if (colon_pos == std::string::npos) {
            continue;
        }

        std::string interface = TrimString(line.substr(0, colon_pos));

        if (std::find(interfaces.begin(), interfaces.end(), interface) == interfaces.end()) {
            continue;
        }

        // Field 0 is received bytes, field 8 is transmitted bytes.
        std::istringstream counters(line.substr(colon_pos + 1));
        uint64_t fields[9] = {};
        bool complete = true;

        for (auto& field : fields) {
            if (!(counters >> field)) {
                complete = false;
                break;
            }
        }

        if (!complete) {
            continue;
        }

        total += fields[0] + fields[8];
        found = true;
    }

    if (!found) {
        return std::nullopt;
    }

    return total;
}

SignalResult NetworkBytesSignal::Sample(int64_t)
{
    SignalResult result {Name(), false, {}};

    std::optional<uint64_t> bytes = ReadInterfaceBytes(m_proc_net_dev_path, m_interfaces);

    if (!bytes) {
        std::string interfaces;

        for (const auto& interface : m_interfaces) {
            interfaces += (interfaces.empty() ? "" : ",") + interface;
        }

        m_previous_bytes.reset();
        result.m_reason = tfm::format("interfaces %s not found in %s", interfaces, m_proc_net_dev_path.string());
        return result;
    }

    if (!m_previous_bytes) {
        m_previous_bytes = bytes;
        result.m_reason = tfm::format("baseline established at %llu bytes", *bytes);
        return result;
    }

    if (*bytes < *m_previous_bytes) {
        m_previous_bytes = bytes;
        result.m_reason = "byte counters decreased, baseline re-established";
        return result;
    }

    uint64_t delta = *bytes - *m_previous_bytes;
    m_previous_bytes = bytes;

    result.m_active = delta > static_cast<uint64_t>(std::max<int64_t>(m_threshold_bytes, 0));
    result.m_reason = tfm::format("%llu bytes since last sample, threshold %lld", delta, m_threshold_bytes);

    return result;
}

// Class ActivitySampler

void ActivitySampler::AddSignal(std::unique_ptr<ActivitySignal> signal)
{
    if (signal) {
        m_signals.push_back(std::move(signal));
    }
}

size_t ActivitySampler::Size() const
{
    return m_signals.size();
}

std::vector<std::string> ActivitySampler::GetSignalNames() const
{
    std::vector<std::string> names;

    for (const auto& signal : m_signals) {
        names.push_back(signal->Name());
    }

    return names;
}

SampleResult ActivitySampler::Sample(int64_t now)
{
    SampleResult sample;

    for (auto& signal : m_signals) {
        SignalResult result;

        try {
            result = signal->Sample(now);
        } catch (const std::exception& e) {
            error_log("%s: Signal %s failed and is treated as inactive: %s",
                      __func__,
                      signal->Name(),
                      e.what());

            result.m_active = false;
            result.m_reason = std::string("error: ") + e.what();
        }

        if (result.m_signal.empty()) {
            result.m_signal = signal->Name();
        }

        debug_log("INFO: %s: %s: %s (%s)",
                  __func__,
                  result.m_signal,
                  result.m_active ? "active" : "inactive",
                  result.m_reason);

        sample.m_active = sample.m_active || result.m_active;
        sample.m_results.push_back(std::move(result));
    }

    return sample;
}

} // namespace IdleShutdown
