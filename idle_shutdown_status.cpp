/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <string>
#include <iostream>

#include "idle_state.h"
#include "util.h"

int main(int argc, char* argv[]) {
    // --- Argument Parsing ---
    if (argc < 2 || argc > 3) {
        error_log("%s: Usage: %s <state_file> [raw|iso|elapsed]",
                  __func__, (argc > 0 ? argv[0] : "idle_shutdown_status"));
        error_log("%s: state_file: Path of the idle state file (e.g., /var/lib/idle_shutdown/idle_state.dat)", __func__);
        error_log("%s: format (optional): 'raw' (default), 'iso' for UTC, or 'elapsed' for seconds idle", __func__);
        return 1;
    }

    fs::path state_file_path(argv[1]);
    std::string format = "raw";

    if (argc == 3) {
        format = ToLower(argv[2]);

        if (format != "raw" && format != "iso" && format != "elapsed") {
            // Use log for non-fatal warnings (stdout)
            log("WARN: %s: Unknown format '%s'. Defaulting to 'raw'.", __func__, argv[2]);
            format = "raw";
        }
    }

    // --- Output ---
    // Keep final output on std::cout for scripting.
    IdleShutdown::IdleStateStore store(state_file_path);

    return IdleShutdown::ReportIdleState(store, format, GetUnixEpochTime(), std::cout);
}
