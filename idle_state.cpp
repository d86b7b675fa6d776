/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <idle_state.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace IdleShutdown {

// Class IdleStateStore

IdleStateStore::IdleStateStore(fs::path state_file_path)
    : m_state_file_path(std::move(state_file_path))
{}

const fs::path& IdleStateStore::GetPath() const
{
    return m_state_file_path;
}

IdleState IdleStateStore::Load() const
{
    IdleState state;

    std::error_code ec;

    if (!fs::exists(m_state_file_path, ec)) {
        debug_log("INFO: %s: No idle state file at %s.",
                  __func__,
                  m_state_file_path.string());
        return state;
    }

    std::ifstream state_file(m_state_file_path);

    if (!state_file.is_open()) {
        error_log("%s: Could not open idle state file %s. Starting with no idle period.",
                  __func__,
                  m_state_file_path.string());
        return state;
    }

    std::string line;

    if (!std::getline(state_file, line) || TrimString(line).empty()) {
        return state;
    }

    try {
        int64_t timestamp = ParseStringtoInt64(TrimString(line));

        if (timestamp <= 0) {
            error_log("%s: Idle state file %s holds invalid timestamp %lld. Ignoring it.",
                      __func__,
                      m_state_file_path.string(),
                      timestamp);
            return state;
        }

        state.m_first_idle_timestamp = timestamp;
    } catch (const std::exception& e) {
        error_log("%s: Idle state file %s is corrupt (%s). Ignoring it.",
                  __func__,
                  m_state_file_path.string(),
                  e.what());
    }

    return state;
}

void IdleStateStore::Save(const IdleState& state) const
{
    if (!state.m_first_idle_timestamp) {
        Clear();
        return;
    }

    std::error_code ec;
    fs::path parent = m_state_file_path.parent_path();

    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);

        if (ec) {
            throw StateStoreException("Could not create idle state directory: " + ec.message(), parent);
        }
    }

    fs::path tmp_path = m_state_file_path;
    tmp_path += ".tmp";

    std::string contents = ::ToString(*state.m_first_idle_timestamp) + "\n";

    int fd = open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);

    if (fd == -1) {
        throw StateStoreException(std::string("Could not open temporary idle state file: ") + strerror(errno), tmp_path);
    }

    ssize_t written = write(fd, contents.data(), contents.size());
    int write_errno = errno;

    if (written != static_cast<ssize_t>(contents.size()) || fsync(fd) != 0) {
        if (written == static_cast<ssize_t>(contents.size())) {
            write_errno = errno;
        }

        close(fd);
        unlink(tmp_path.c_str());

        throw StateStoreException(std::string("Could not write idle state: ") + strerror(write_errno), tmp_path);
    }

    if (close(fd) != 0) {
        int close_errno = errno;
        unlink(tmp_path.c_str());

        throw StateStoreException(std::string("Could not close idle state file: ") + strerror(close_errno), tmp_path);
    }

    if (rename(tmp_path.c_str(), m_state_file_path.c_str()) != 0) {
        int rename_errno = errno;
        unlink(tmp_path.c_str());

        throw StateStoreException(std::string("Could not replace idle state file: ") + strerror(rename_errno),
                                  m_state_file_path);
    }
}

void IdleStateStore::Clear() const
{
    std::error_code ec;

    fs::remove(m_state_file_path, ec);

    if (ec) {
        throw StateStoreException("Could not remove idle state file: " + ec.message(), m_state_file_path);
    }
}

// Class IdleTimer

IdleTimer::IdleTimer(IdleStateStore store, int64_t threshold_seconds)
    : m_store(std::move(store))
    , m_threshold_seconds(threshold_seconds)
    , m_state()
{}

bool IdleTimer::Restore()
{
    m_state = m_store.Load();

    return m_state.m_first_idle_timestamp.has_value();
}

IdleStatus IdleTimer::Observe(bool active, int64_t now)
{
    IdleStatus status;

    if (active) {
        if (m_state.m_first_idle_timestamp) {
            m_state.m_first_idle_timestamp.reset();
            Persist();
        }

        status.m_remaining = m_threshold_seconds;
        return status;
    }

    if (!m_state.m_first_idle_timestamp) {
        m_state.m_first_idle_timestamp = now;
        Persist();
    } else if (*m_state.m_first_idle_timestamp > now) {
        // The wall clock stepped backwards. Restart the streak rather than carry a negative elapsed time.
        log("WARNING: %s: Stored idle start %s is in the future. Restarting the idle period.",
            __func__,
            FormatISO8601DateTime(*m_state.m_first_idle_timestamp));

        m_state.m_first_idle_timestamp = now;
        Persist();
    }

    status.m_elapsed = now - *m_state.m_first_idle_timestamp;
    status.m_remaining = std::max<int64_t>(0, m_threshold_seconds - status.m_elapsed);
    status.m_triggered = status.m_elapsed >= m_threshold_seconds;

    return status;
}

void IdleTimer::Reset()
{
    bool had_state = m_state.m_first_idle_timestamp.has_value();

    m_state.m_first_idle_timestamp.reset();

    try {
        m_store.Clear();
    } catch (StateStoreException& e) {
        error_log("%s: %s",
                  __func__,
                  e.what());
    }

    if (had_state) {
        debug_log("INFO: %s: Idle period cleared.",
                  __func__);
    }
}

std::optional<int64_t> IdleTimer::GetFirstIdleTimestamp() const
{
    return m_state.m_first_idle_timestamp;
}

int64_t IdleTimer::GetThreshold() const
{
    return m_threshold_seconds;
}

void IdleTimer::Persist()
{
    try {
        m_store.Save(m_state);
    } catch (StateStoreException& e) {
        error_log("%s: Idle state not persisted, continuing in memory: %s",
                  __func__,
                  e.what());
    }
}

// Status reporting

int ReportIdleState(const IdleStateStore& store, const std::string& format, int64_t now, std::ostream& out)
{
    IdleState state = store.Load();

    if (!state.m_first_idle_timestamp) {
        out << "no idle period tracked" << std::endl;
        return 2;
    }

    int64_t timestamp = *state.m_first_idle_timestamp;

    if (format == "iso") {
        std::string formatted_time = FormatISO8601DateTime(timestamp);

        if (formatted_time.empty()) {
            error_log("%s: Failed to format timestamp %lld", __func__, timestamp);
            return 5;
        }

        out << formatted_time << std::endl;
    } else if (format == "elapsed") {
        int64_t elapsed = now - timestamp;

        out << (elapsed > 0 ? elapsed : 0) << std::endl;
    } else {
        out << timestamp << std::endl;
    }

    return 0;
}

} // namespace IdleShutdown
