#pragma once
#include "process.hpp"
#include <algorithm>

namespace chitin {

class MockProcessRunner : public ProcessRunner {
public:
    ProcessResult next_result;
    std::vector<ProcessResult> result_queue;
    std::vector<std::vector<std::string>> calls;
    std::vector<StdioMode> modes;
    size_t chunk_size = 7; // output is streamed to the callback in small pieces
    int call_count = 0;

    ProcessResult run(const std::vector<std::string>& argv,
                      StdioMode mode,
                      const OutputCallback& on_output) override {
        call_count++;
        calls.push_back(argv);
        modes.push_back(mode);

        ProcessResult result = next_result;
        if (!result_queue.empty()) {
            result = result_queue.front();
            result_queue.erase(result_queue.begin());
        }

        if (mode == StdioMode::Inherit) {
            result.output.clear();
        } else if (on_output && result.spawned) {
            for (size_t pos = 0; pos < result.output.size(); pos += chunk_size) {
                size_t len = std::min(chunk_size, result.output.size() - pos);
                on_output(result.output.data() + pos, len);
            }
        }
        return result;
    }

    static ProcessResult exited(int code, const std::string& output = "") {
        ProcessResult r;
        r.spawned = true;
        r.exit_code = code;
        r.output = output;
        return r;
    }

    static ProcessResult spawn_failure(int err, const std::string& message) {
        ProcessResult r;
        r.spawned = false;
        r.exit_code = 127;
        r.spawn_errno = err;
        r.error = message;
        return r;
    }
};

} // namespace chitin
