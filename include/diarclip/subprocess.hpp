#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace diarclip {

struct ProcessResult {
    int exit_code = -1;       // exit status, or 128 + signal number
    std::vector<uint8_t> out; // captured stdout
    std::string err;          // captured stderr
};

// Run argv[0] (PATH lookup) with `input` on stdin and capture stdout and
// stderr. stdin is written and the outputs drained concurrently, so large
// payloads cannot deadlock on full pipes. A child that stops reading stdin
// early is not an error: SIGPIPE is blocked on the calling thread around
// each write only, and the process-wide signal disposition is untouched.
//
// Throws std::runtime_error if the process cannot be started (missing
// executable, fork/pipe failure). A non-zero exit is NOT an exception; the
// caller inspects exit_code.
ProcessResult run_process(const std::vector<std::string> &argv,
                          const std::vector<uint8_t> &input);

// Resolve an executable name against PATH ("" if not found). Names that
// contain a '/' are checked as paths.
std::string find_executable(const std::string &name);

} // namespace diarclip
