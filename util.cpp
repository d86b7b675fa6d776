/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <util.h>
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

//!
//! \brief This to support early use of the log utility functions before the config is read to get the
//! debug flag.
//!
std::atomic<bool> g_debug = false;

//!
//! \brief The flag controls the logging of timestamps by the log functions. This is used to suppress
//! timestamp output when run under systemd, where the journal appends a high resolution timestamp.
//!
std::atomic<bool> g_log_timestamps = true;

//!
//! \brief Protects the log file sink and serializes console output so lines from the log file and console agree.
//!
static std::mutex g_mtx_log;

//!
//! \brief Optional append-only log file sink. Not open unless SetLogFile() succeeded with a non-empty path.
//!
static std::ofstream g_log_file;

[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim)
{
    size_t pos = 0;
    size_t end = 0;
    std::vector<std::string> elems;

    while((end = s.find(delim, pos)) != std::string::npos)
    {
        elems.push_back(s.substr(pos, end - pos));
        pos = end + delim.size();
    }

    // Append final value
    elems.push_back(s.substr(pos, end - pos));
    return elems;
}

[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern)
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

[[nodiscard]] std::string StripQuotes(const std::string& str)
{
    if (str.empty()) {
        return str;
    }

    std::string result = str;

    if (result.front() == '"' || result.front() == '\'') {
        result.erase(0, 1);
    }

    if (!result.empty() && (result.back() == '"' || result.back() == '\'')) {
        result.pop_back();
    }

    return result;
}

std::string ToLower(const std::string& str)
{
    std::string r;
    r.reserve(str.size());

    for (auto ch : str) {
        r += (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
    }

    return r;
}

int64_t GetUnixEpochTime()
{
    auto duration = std::chrono::system_clock::now().time_since_epoch();

    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

std::string FormatISO8601DateTime(int64_t time)
{
    struct tm ts;
    time_t time_val = time;
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }

    return tfm::format("%04i-%02i-%02iT%02i:%02i:%02iZ",
                       ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday, ts.tm_hour, ts.tm_min, ts.tm_sec);
}

bool SetLogFile(const fs::path& log_file_path)
{
    std::unique_lock<std::mutex> lock(g_mtx_log);

    if (g_log_file.is_open()) {
        g_log_file.close();
    }

    if (log_file_path.empty()) {
        return true;
    }

    g_log_file.clear();
    g_log_file.open(log_file_path, std::ios::out | std::ios::app);

    return g_log_file.is_open();
}

void WriteLogLine(const std::string& line, bool to_stderr)
{
    std::unique_lock<std::mutex> lock(g_mtx_log);

    if (to_stderr) {
        std::cerr << line;
    } else {
        std::cout << line << std::flush;
    }

    if (g_log_file.is_open()) {
        // The file sink always carries timestamps, because there is no journal to supply them.
        if (!g_log_timestamps.load(std::memory_order_relaxed)) {
            g_log_file << FormatISO8601DateTime(GetUnixEpochTime()) << " ";
        }

        g_log_file << line << std::flush;
    }
}

[[nodiscard]] int ParseStringToInt(const std::string& str)
{
    std::string trimmed = TrimString(str);
    size_t pos = 0;
    int result = 0;

    try {
        result = std::stoi(trimmed, &pos);
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }

    if (pos != trimmed.size()) {
        error_log("%s: Invalid argument: trailing characters in \"%s\"",
                  __func__,
                  str);
        throw std::invalid_argument("trailing characters in integer value: " + str);
    }

    return result;
}

[[nodiscard]] int64_t ParseStringtoInt64(const std::string& str)
{
    std::string trimmed = TrimString(str);
    size_t pos = 0;
    int64_t result = 0;

    try {
        result = static_cast<int64_t>(std::stoll(trimmed, &pos));
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }

    if (pos != trimmed.size()) {
        error_log("%s: Invalid argument: trailing characters in \"%s\"",
                  __func__,
                  str);
        throw std::invalid_argument("trailing characters in integer value: " + str);
    }

    return result;
}

[[nodiscard]] std::optional<bool> ParseStringToBool(const std::string& str)
{
    std::string lower = ToLower(TrimString(str));

    if (lower == "1" || lower == "true") {
        return true;
    } else if (lower == "0" || lower == "false") {
        return false;
    }

    return std::nullopt;
}

std::vector<std::string> ReadLastLines(const fs::path& file_path, size_t n)
{
    std::vector<std::string> lines;

    if (n == 0) {
        return lines;
    }

    std::ifstream file(file_path, std::ios::binary);

    if (!file.is_open()) {
        throw FileSystemException("Could not open file for reading.", file_path);
    }

    file.seekg(0, std::ios::end);
    std::streamoff file_size = file.tellg();

    if (file_size < 0) {
        throw FileSystemException("Could not determine file size.", file_path);
    }

    const std::streamoff chunk_size = 8192;
    std::streamoff pos = file_size;
    size_t newline_count = 0;
    std::string tail;

    // n complete lines are bounded by at most n + 1 newlines, counting the one terminating the last line.
    while (pos > 0 && newline_count <= n) {
        std::streamoff read_size = std::min(chunk_size, pos);
        pos -= read_size;

        std::string chunk(static_cast<size_t>(read_size), '\0');

        file.seekg(pos);

        if (!file.read(&chunk[0], read_size)) {
            // Typically the file was truncated (rotated) underneath us.
            throw FileSystemException("Error reading file.", file_path);
        }

        newline_count += static_cast<size_t>(std::count(chunk.begin(), chunk.end(), '\n'));
        tail.insert(0, chunk);
    }

    std::vector<std::string> all_lines = StringSplit(tail, "\n");

    if (!all_lines.empty() && all_lines.back().empty()) {
        all_lines.pop_back();
    }

    // If the scan stopped before the beginning of the file, the first element is a partial line.
    if (pos > 0 && !all_lines.empty()) {
        all_lines.erase(all_lines.begin());
    }

    size_t first = all_lines.size() > n ? all_lines.size() - n : 0;

    for (size_t i = first; i < all_lines.size(); ++i) {
        std::string& line = all_lines[i];

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        lines.push_back(std::move(line));
    }

    return lines;
}

std::optional<std::string> GetEnvVariable(const std::string& var_name)
{
    const char* value = std::getenv(var_name.c_str());

    if (value == nullptr) {
        return std::nullopt;
    }

    return std::string(value);
}

// Class Config

Config::Config()
{}

void Config::ReadAndUpdateConfig(const fs::path& config_file) {
    std::unique_lock<std::mutex> lock(mtx_config);

    std::multimap<std::string, std::string> config;

    std::ifstream file;

    if (!config_file.empty()) {
        file.open(config_file);
    }

    if (file.is_open()) {
        std::string line;
        while (std::getline(file, line)) {
            line = TrimString(line);

            // Skip empty lines and lines starting with '#'
            if (line.empty() || line[0] == '#') {
                continue;
            }

            // Split on the first '=' only, since values such as shell commands may contain '='.
            std::string::size_type equals_pos = line.find('=');

            if (equals_pos == std::string::npos || equals_pos == 0) {
                continue;
            }

            config.insert(std::make_pair(StripQuotes(TrimString(line.substr(0, equals_pos))),
                                         StripQuotes(TrimString(line.substr(equals_pos + 1)))));
        }
    } else if (!config_file.empty()) {
        error_log("%s: Could not open the config file, so defaults will be used: %s",
                  __func__,
                  config_file);
    }

    // Do this all at once so the result of the config read is essentially "atomic".
    m_config_in.swap(config);
    m_config.clear();

    // If the config file read failed, we will process args anyway, which will result in defaults being chosen.
    ProcessArgs();
}

config_variant Config::GetArg(const std::string& arg)
{
    std::unique_lock<std::mutex> lock(mtx_config);

    auto iter = m_config.find(arg);

    if (iter != m_config.end()) {
        return iter->second;
    } else {
        return std::string {};
    }
}

std::string Config::GetArgString(const std::string& arg, const std::string& default_value) const
{
    auto iter = m_config_in.find(arg);

    if (iter != m_config_in.end()) {
        return iter->second;
    } else {
        return default_value;
    }
}

std::vector<std::string> Config::GetArgStrings(const std::string& arg, const std::vector<std::string>& default_values) const
{
    auto range = m_config_in.equal_range(arg);

    if (range.first == range.second) {
        return default_values;
    }

    std::vector<std::string> values;

    for (auto iter = range.first; iter != range.second; ++iter) {
        for (const auto& element : StringSplit(iter->second, ",")) {
            std::string value = StripQuotes(TrimString(element));

            if (!value.empty()) {
                values.push_back(value);
            }
        }
    }

    return values;
}
