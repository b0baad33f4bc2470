#ifndef ROTAP_PROCESS_HPP
#define ROTAP_PROCESS_HPP

#include <chrono>
#include <string>
#include <vector>

namespace rotap {

struct ProcessResult {
    int exit_code = -1;         // -1 if not exited normally (signal, spawn failure)
    std::string output;         // stdout + stderr, truncated at 64 KiB
    bool timed_out = false;

    bool ok() const { return !timed_out && exit_code == 0; }
};

/**
 * @brief Run a command with explicit argv, bypassing the shell entirely.
 *
 * Uses fork()+execvp(); no shell metacharacter interpretation. The child
 * is SIGKILLed and reaped once timeout expires, so callers are never
 * blocked longer than the timeout plus reaping time.
 *
 * @param argv    argv[0] = binary name, resolved through PATH
 * @param timeout upper bound for the whole run
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout);

} // namespace rotap

#endif // ROTAP_PROCESS_HPP
