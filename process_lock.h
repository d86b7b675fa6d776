/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef PROCESS_LOCK_H
#define PROCESS_LOCK_H

#include <optional>
#include <sys/types.h>

#include <util.h>

namespace IdleShutdown {

//!
//! \brief The ProcessLock class guarantees that at most one monitor instance runs at a time. The lock is an flock()
//! on a PID file. The kernel drops the lock when the holder dies, so a crashed instance never blocks its successor.
//! The file also records the holder's pid for diagnostics. The lock is released on destruction.
//!
class ProcessLock
{
public:
    explicit ProcessLock(fs::path lock_file_path);

    ~ProcessLock();

    ProcessLock(const ProcessLock&) = delete;
    ProcessLock& operator=(const ProcessLock&) = delete;

    //!
    //! \brief Attempts to take the lock without blocking.
    //! \return true if the lock is now held by this object, false if another live instance holds it.
    //! \throws LockException if the lock file cannot be created or opened.
    //!
    bool TryAcquire();

    //!
    //! \brief Releases the lock if held. The lock file itself is left in place.
    //!
    void Release();

    bool IsAcquired() const;

    //!
    //! \brief Returns the pid recorded in the lock file when TryAcquire() last failed.
    //!
    std::optional<pid_t> GetHolderPid() const;

    //!
    //! \brief Returns the pid of a dead previous holder whose stale lock file was reclaimed by TryAcquire().
    //!
    std::optional<pid_t> GetReclaimedPid() const;

    //!
    //! \brief Returns true if a process with the given pid exists.
    //! \param pid
    //!
    static bool IsProcessAlive(pid_t pid);

private:
    std::optional<pid_t> ReadRecordedPid(int fd) const;

    bool WriteOwnPid();

    fs::path m_lock_file_path;
    int m_fd;
    bool m_acquired;
    std::optional<pid_t> m_holder_pid;
    std::optional<pid_t> m_reclaimed_pid;
};

} // namespace IdleShutdown

#endif // PROCESS_LOCK_H
