/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <process_lock.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace IdleShutdown {

ProcessLock::ProcessLock(fs::path lock_file_path)
    : m_lock_file_path(std::move(lock_file_path))
    , m_fd(-1)
    , m_acquired(false)
{}

ProcessLock::~ProcessLock()
{
    Release();
}

bool ProcessLock::TryAcquire()
{
    if (m_acquired) {
        return true;
    }

    m_holder_pid.reset();
    m_reclaimed_pid.reset();

    std::error_code ec;
    fs::path parent = m_lock_file_path.parent_path();

    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);

        if (ec) {
            throw LockException("Could not create lock directory: " + ec.message(), parent);
        }
    }

    m_fd = open(m_lock_file_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);

    if (m_fd == -1) {
        throw LockException(std::string("Could not open lock file: ") + strerror(errno), m_lock_file_path);
    }

    std::optional<pid_t> recorded_pid = ReadRecordedPid(m_fd);

    if (flock(m_fd, LOCK_EX | LOCK_NB) != 0) {
        int flock_errno = errno;

        if (flock_errno == EWOULDBLOCK) {
            m_holder_pid = recorded_pid;

            if (recorded_pid && !IsProcessAlive(*recorded_pid)) {
                // The lock can be inherited by a child of the recorded holder, so the lock still wins.
                log("WARNING: %s: Lock file %s is locked, but recorded pid %i is not running.",
                    __func__,
                    m_lock_file_path.string(),
                    *recorded_pid);
            }

            close(m_fd);
            m_fd = -1;

            return false;
        }

        if (flock_errno != ENOLCK) {
            close(m_fd);
            m_fd = -1;

            throw LockException(std::string("Could not lock file: ") + strerror(flock_errno), m_lock_file_path);
        }

        // Some filesystems do not support flock(). Fall back to the recorded pid liveness check.
        log("WARNING: %s: flock() not supported for %s. Falling back to pid check.",
            __func__,
            m_lock_file_path.string());

        if (recorded_pid && *recorded_pid != getpid() && IsProcessAlive(*recorded_pid)) {
            m_holder_pid = recorded_pid;

            close(m_fd);
            m_fd = -1;

            return false;
        }
    }

    if (recorded_pid && *recorded_pid != getpid() && !IsProcessAlive(*recorded_pid)) {
        m_reclaimed_pid = recorded_pid;

        log("INFO: %s: Reclaimed stale lock file %s from pid %i.",
            __func__,
            m_lock_file_path.string(),
            *recorded_pid);
    }

    if (!WriteOwnPid()) {
        int write_errno = errno;

        close(m_fd);
        m_fd = -1;

        throw LockException(std::string("Could not record pid in lock file: ") + strerror(write_errno),
                            m_lock_file_path);
    }

    m_acquired = true;

    debug_log("INFO: %s: Acquired lock %s, pid %i.",
              __func__,
              m_lock_file_path.string(),
              getpid());

    return true;
}

void ProcessLock::Release()
{
    if (m_fd == -1) {
        m_acquired = false;
        return;
    }

    if (m_acquired) {
        if (ftruncate(m_fd, 0) != 0) {
            error_log("%s: Could not clear lock file %s: %s",
                      __func__,
                      m_lock_file_path.string(),
                      strerror(errno));
        }

        flock(m_fd, LOCK_UN);
    }

    close(m_fd);
    m_fd = -1;
    m_acquired = false;
}

bool ProcessLock::IsAcquired() const
{
    return m_acquired;
}

std::optional<pid_t> ProcessLock::GetHolderPid() const
{
    return m_holder_pid;
}

std::optional<pid_t> ProcessLock::GetReclaimedPid() const
{
    return m_reclaimed_pid;
}

bool ProcessLock::IsProcessAlive(pid_t pid)
{
    if (pid <= 0) {
        return false;
    }

    if (kill(pid, 0) == 0) {
        return true;
    }

    // EPERM means the process exists but belongs to another user.
    return errno == EPERM;
}

std::optional<pid_t> ProcessLock::ReadRecordedPid(int fd) const
{
    char buffer[32] = {};

    ssize_t bytes = pread(fd, buffer, sizeof(buffer) - 1, 0);

    if (bytes <= 0) {
        return std::nullopt;
    }

    std::string contents = TrimString(std::string(buffer, static_cast<size_t>(bytes)));

    if (contents.empty()) {
        return std::nullopt;
    }

    try {
        int pid = ParseStringToInt(contents);

        if (pid > 0) {
            return static_cast<pid_t>(pid);
        }
    } catch (const std::exception& e) {
        log("WARNING: %s: Lock file %s has unreadable contents: %s",
            __func__,
            m_lock_file_path.string(),
            e.what());
    }

    return std::nullopt;
}

bool ProcessLock::WriteOwnPid()
{
    std::string contents = ::ToString(getpid()) + "\n";

    if (ftruncate(m_fd, 0) != 0) {
        return false;
    }

    ssize_t written = pwrite(m_fd, contents.data(), contents.size(), 0);

    return written == static_cast<ssize_t>(contents.size());
}

} // namespace IdleShutdown
