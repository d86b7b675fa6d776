/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef IDLE_STATE_H
#define IDLE_STATE_H

#include <cstdint>
#include <optional>

#include <util.h>

namespace IdleShutdown {

//!
//! \brief The IdleState class is the durable part of the idle session. m_first_idle_timestamp is the Unix Epoch time
//! at which the current unbroken idle streak began, and is unset while activity is being observed.
//!
class IdleState
{
public:
    std::optional<int64_t> m_first_idle_timestamp;
};

//!
//! \brief The IdleStatus struct is the result of one IdleTimer observation.
//!
struct IdleStatus
{
    //! Seconds of continuous idleness so far.
    int64_t m_elapsed = 0;

    //! Seconds left before the threshold is reached. Never negative.
    int64_t m_remaining = 0;

    //! True once m_elapsed has reached the threshold.
    bool m_triggered = false;
};

//!
//! \brief The IdleStateStore class persists IdleState to a single file as one decimal line. Saves are atomic
//! (temporary file, fsync, rename), so a reader never sees a partially written state.
//!
class IdleStateStore
{
public:
    explicit IdleStateStore(fs::path state_file_path);

    //!
    //! \brief Loads the state. A missing or empty file yields unset state. A corrupt file is logged and also yields
    //! unset state.
    //! \return IdleState
    //!
    IdleState Load() const;

    //!
    //! \brief Saves the state atomically. Saving unset state removes the file.
    //! \param state
    //! \throws StateStoreException on I/O failure.
    //!
    void Save(const IdleState& state) const;

    //!
    //! \brief Removes the state file. A missing file is not an error.
    //! \throws StateStoreException if the file exists and cannot be removed.
    //!
    void Clear() const;

    const fs::path& GetPath() const;

private:
    fs::path m_state_file_path;
};

//!
//! \brief The IdleTimer class tracks the current idle streak and keeps the IdleStateStore in sync with it, so that a
//! restarted process resumes the idle clock rather than starting again from zero. Persistence failures are logged
//! and the timer continues with its in-memory state.
//!
class IdleTimer
{
public:
    IdleTimer(IdleStateStore store, int64_t threshold_seconds);

    //!
    //! \brief Loads any persisted idle streak.
    //! \return true if a persisted streak was found.
    //!
    bool Restore();

    //!
    //! \brief Advances or clears the idle streak based on one sample.
    //! \param active aggregate activity verdict of the sample
    //! \param now Unix Epoch time in seconds of the sample
    //! \return IdleStatus
    //!
    IdleStatus Observe(bool active, int64_t now);

    //!
    //! \brief Clears the idle streak in memory and on disk.
    //!
    void Reset();

    std::optional<int64_t> GetFirstIdleTimestamp() const;

    int64_t GetThreshold() const;

private:
    void Persist();

    IdleStateStore m_store;
    int64_t m_threshold_seconds;
    IdleState m_state;
};

//!
//! \brief Writes the stored idle state to out for the idle_shutdown_status tool.
//! \param store
//! \param format "raw" for the Unix Epoch timestamp, "iso" for ISO8601 UTC, or "elapsed" for seconds idle as of now.
//! Any other value is treated as "raw".
//! \param now Unix Epoch time in seconds, used for "elapsed".
//! \param out
//! \return exit code: 0 if a timestamp was written, 2 if no idle period is tracked, 5 if formatting failed.
//!
int ReportIdleState(const IdleStateStore& store, const std::string& format, int64_t now, std::ostream& out);

} // namespace IdleShutdown

#endif // IDLE_STATE_H
