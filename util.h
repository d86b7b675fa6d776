/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef UTIL_H
#define UTIL_H

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <tinyformat.h>
#include <variant>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

extern std::atomic<bool> g_debug;
extern std::atomic<bool> g_log_timestamps;

//!
//! /brief Locale-independent version of std::to_string
//!
template <typename T>
std::string ToString(const T& t)
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << t;
    return oss.str();
}

//!
//! \brief Utility function to split string by the provided delimiter. Note that no trimming is done to remove white space.
//! \param s: the string to split
//! \param delim: the delimiter string
//! \return std::vector of string parts
//!
[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim);

//!
//! \brief Utility function to trim whitespace from the beginning and end of a string.
//! \param str: the string to trim
//! \param pattern: the pattern to trim, defaulting to " \f\n\r\t\v"
//! \return trimmed string
//!
[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v");

//!
//! \brief Utility function to remove enclosing single or double quotes from a string. This is especially useful when
//! dealing with quoted values in a config file.
//! \param str: the input string with potential quotes to remove
//! \return the string with any enclosing quotes removed
//!
[[nodiscard]] std::string StripQuotes(const std::string& str);

/**
 * Returns the lowercase equivalent of the given string.
 * This function is locale independent. It only converts uppercase
 * characters in the standard 7-bit ASCII range.
 *
 * @param[in] str   the string to convert to lowercase.
 * @returns         lowercased equivalent of str
 */
std::string ToLower(const std::string& str);

//!
//! \brief Returns number of seconds since the beginning of the Unix Epoch.
//! \return int64_t seconds.
//!
int64_t GetUnixEpochTime();

//!
//! \brief Formats input unix epoch time in human readable format.
//! \param int64_t seconds.
//! \return ISO8601 conformant datetime string.
//!
std::string FormatISO8601DateTime(int64_t time);

//!
//! \brief Directs log output to an append-only file in addition to stdout/stderr. An empty path closes any open
//! log file. This is used to keep a host-local record that survives journal rotation.
//! \param log_file_path
//! \return true if the file was opened (or the sink was cleared), false if the file could not be opened.
//!
bool SetLogFile(const fs::path& log_file_path);

//!
//! \brief Writes a fully formatted log line to the console stream and the log file sink, if one is set.
//! \param line
//! \param to_stderr selects std::cerr instead of std::cout for the console stream.
//!
void WriteLogLine(const std::string& line, bool to_stderr);

template <typename... Args>
//!
//! \brief Creates a string with fmt specifier and variadic args.
//! \param fmt specifier
//! \param args... variadic
//! \return formatted std::string
//!
static inline std::string LogPrintStr(const char* fmt, const Args&... args)
{
    std::string log_msg;

    if (g_log_timestamps.load(std::memory_order_relaxed)) {
        log_msg = FormatISO8601DateTime(GetUnixEpochTime()) + " ";
    }

    try {
        log_msg += tfm::format(fmt, args...);
    } catch (tinyformat::format_error& fmterr) {
        log_msg += "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
    }

    log_msg += "\n";

    return log_msg;
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout.
//! \param fmt
//! \param args
//!
void log(const char* fmt, const Args&... args)
{
    WriteLogLine(LogPrintStr(fmt, args...), false);
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout, conditioned on the debug setting.
//! \param fmt
//! \param args
//!
void debug_log(const char* fmt, const Args&... args)
{
    if (g_debug.load()) {
        log(fmt, args...);
    }
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cerr
//! \param fmt
//! \param args
//!
void error_log(const char* fmt, const Args&... args)
{
    std::string error_fmt = "ERROR: ";
    error_fmt += fmt;

    WriteLogLine(LogPrintStr(error_fmt.c_str(), args...), true);
}

//!
//! \brief Parses a base 10 integer. Surrounding whitespace is ignored, but any other character after the number
//! (such as a unit suffix in "1h") makes the whole value invalid.
//! \param str
//! \return parsed integer
//! \throws std::invalid_argument, std::out_of_range
//!
[[nodiscard]] int ParseStringToInt(const std::string& str);

[[nodiscard]] int64_t ParseStringtoInt64(const std::string& str);

//!
//! \brief Parses the config file boolean forms "1", "0", "true" and "false" (case insensitive).
//! \param str
//! \return parsed value, or std::nullopt if the string is not a recognized boolean.
//!
[[nodiscard]] std::optional<bool> ParseStringToBool(const std::string& str);

//!
//! \brief Reads up to the last n lines of a text file without reading the whole file. Lines are returned in file
//! order, without trailing newlines. A file shorter than n lines is returned in full.
//! \param file_path
//! \param n maximum number of lines
//! \return std::vector of lines
//! \throws FileSystemException if the file cannot be opened or read.
//!
std::vector<std::string> ReadLastLines(const fs::path& file_path, size_t n);

//!
//! \brief Safely get an enviroment variable value from the provided name
//! \param std::string of the name of the variable to retrieve
//! \return std::string of the value of the requested variable. std::nullopt if not found.
//!
std::optional<std::string> GetEnvVariable(const std::string& var_name);

//!
//! \brief The IdleShutdownException class is the root of the exceptions thrown by the idle_shutdown application.
//!
class IdleShutdownException : public std::exception
{
public:
    IdleShutdownException(const std::string& message) : m_message(message) {}
    IdleShutdownException(const char* message) : m_message(message) {}

    const char* what() const noexcept override {
        return m_message.c_str();
    }

protected:
    std::string m_message;
};

//! File system related exceptions
class FileSystemException : public IdleShutdownException
{
public:
    FileSystemException(const std::string& message, const std::filesystem::path& path)
        : IdleShutdownException(message + " Path: " + path.string()), m_path(path) {}

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

//! Idle state persistence exceptions
class StateStoreException : public FileSystemException
{
public:
    StateStoreException(const std::string& message, const std::filesystem::path& path)
        : FileSystemException(message, path) {}
};

//! Process lock exceptions
class LockException : public FileSystemException
{
public:
    LockException(const std::string& message, const std::filesystem::path& path)
        : FileSystemException(message, path) {}
};

typedef std::variant<bool, int, std::string, fs::path, std::vector<std::string>> config_variant;

//!
//! \brief The Config class is a singleton that stores program config read from the config file, with applied defaults if the
//! config file cannot be read, or a config parameter is not in the config file.
//!
class Config
{
public:
    //!
    //! \brief Constructor.
    //!
    Config();

    virtual ~Config() = default;

    //!
    //! \brief Reads and parses the config file provided by the argument and populates m_config_in, then calls private
    //! method ProcessArgs() to populate m_config.
    //! \param config_file
    //!
    void ReadAndUpdateConfig(const fs::path& config_file);

    //!
    //! \brief Provides the config_variant type value of the config parameter (argument).
    //! \param arg (key) to look up value.
    //! \return config_variant type value of the value of the config parameter (argument).
    //!
    config_variant GetArg(const std::string& arg);

protected:
    //!
    //! \brief Private version of GetArg that operates on m_config_in and also selects the provided default value
    //! if the arg is not found. This is how default values for parameters are established.
    //! \param arg (key) to look up value as string.
    //! \param default_value if arg is not found.
    //! \return string value found in lookup, default value if not found.
    //!
    std::string GetArgString(const std::string& arg, const std::string& default_value) const;

    //!
    //! \brief Multi-valued version of GetArgString. Every occurrence of the key in the config file contributes, and each
    //! occurrence may itself be a comma separated list. Empty elements are dropped.
    //! \param arg (key) to look up values.
    //! \param default_values used if the key does not appear at all.
    //! \return vector of values in file order.
    //!
    std::vector<std::string> GetArgStrings(const std::string& arg, const std::vector<std::string>& default_values) const;

    //!
    //! \brief Holds the processed parameter-values, which are strongly typed and in a config_variant union, and where
    //! default values are populated if not found in the config file (m_config_in).
    //!
    std::multimap<std::string, config_variant> m_config;

private:
    //!
    //! \brief Private helper method used by ReadAndUpdateConfig. Note this is pure virtual. It must be implemented
    //! in a specialization of a derived class for use by a specific application.
    //!
    virtual void ProcessArgs() = 0;

    //!
    //! \brief This is the mutex member that provides lock control for the config object.
    //!
    mutable std::mutex mtx_config;

    //!
    //! \brief Holds the raw parsed parameter-values from the config file.
    //!
    std::multimap<std::string, std::string> m_config_in;
};

#endif // UTIL_H
