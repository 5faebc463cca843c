#pragma once

#include <string>
#include <utility>

#include "eval/eval_types.hpp"

namespace evalbox::eval {

constexpr const char* kApplyPatchFail = ">>>>> Patch Apply Failed";
constexpr const char* kApplyPatchPass = ">>>>> Applied Patch";
constexpr const char* kResetFailed = ">>>>> Reset Failed";
constexpr const char* kTestsError = ">>>>> Tests Errored";
constexpr const char* kTestsTimeout = ">>>>> Tests Timed Out";
constexpr const char* kStartTestOutput = ">>>>> Start Test Output";
constexpr const char* kEndTestOutput = ">>>>> End Test Output";

// Maps test names to their pytest-style status lines.
TestStatusMap ParseLogPytest(const std::string& log);

// Returns {status map, found}. found is false for an unreadable log, a log carrying one of
// the failure markers, or a log with no recognizable status line.
std::pair<TestStatusMap, bool> GetLogsEval(const std::string& log_path);
std::pair<TestStatusMap, bool> GetLogsEvalFromText(const std::string& content);

}  // namespace evalbox::eval
