#include "eval/log_parser.hpp"

#include <sstream>
#include <vector>

#include "utils/common.hpp"

namespace evalbox::eval {
namespace {

const std::vector<std::pair<std::string, TestStatus>>& StatusWords() {
    static const std::vector<std::pair<std::string, TestStatus>> kWords = {
        {"PASSED", TestStatus::kPassed},
        {"FAILED", TestStatus::kFailed},
        {"SKIPPED", TestStatus::kSkipped},
        {"ERROR", TestStatus::kError},
        {"XFAIL", TestStatus::kXFail}
    };
    return kWords;
}

std::vector<std::string> SplitWhitespace(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string ExtractTestOutput(const std::string& content) {
    const auto start = content.find(kStartTestOutput);
    const auto end = content.find(kEndTestOutput);
    if (start == std::string::npos || end == std::string::npos || end < start) {
        return content;
    }
    const auto begin = start + std::string(kStartTestOutput).size();
    return content.substr(begin, end - begin);
}

}  // namespace

const char* ToString(TestStatus status) {
    switch (status) {
        case TestStatus::kPassed: return "PASSED";
        case TestStatus::kFailed: return "FAILED";
        case TestStatus::kSkipped: return "SKIPPED";
        case TestStatus::kError: return "ERROR";
        case TestStatus::kXFail: return "XFAIL";
    }
    return "UNKNOWN";
}

std::optional<TestStatus> ParseTestStatus(const std::string& value) {
    for (const auto& [word, status] : StatusWords()) {
        if (value == word) {
            return status;
        }
    }
    return std::nullopt;
}

TestStatusMap ParseLogPytest(const std::string& log) {
    TestStatusMap statuses;
    for (auto line : utils::SplitLines(log)) {
        line = utils::Trim(line);
        bool leading = false;
        bool trailing = false;
        for (const auto& entry : StatusWords()) {
            leading = leading || utils::StartsWith(line, entry.first);
            trailing = trailing || utils::EndsWith(line, entry.first);
        }
        if (!leading && !trailing) {
            continue;
        }
        const auto tokens = SplitWhitespace(line);
        if (tokens.size() <= 1) {
            continue;
        }
        if (leading) {
            // "STATUS test" or "FAILED test - message"
            if (const auto status = ParseTestStatus(tokens[0])) {
                statuses[tokens[1]] = *status;
            }
        } else if (const auto status = ParseTestStatus(tokens.back())) {
            statuses[tokens[0]] = *status;
        }
    }
    return statuses;
}

std::pair<TestStatusMap, bool> GetLogsEvalFromText(const std::string& content) {
    for (const char* marker : {kApplyPatchFail, kResetFailed, kTestsError, kTestsTimeout}) {
        if (content.find(marker) != std::string::npos) {
            return {{}, false};
        }
    }
    auto statuses = ParseLogPytest(ExtractTestOutput(content));
    const bool found = !statuses.empty();
    return {std::move(statuses), found};
}

std::pair<TestStatusMap, bool> GetLogsEval(const std::string& log_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(log_path, ec)) {
        return {{}, false};
    }
    return GetLogsEvalFromText(utils::ReadFile(log_path));
}

}  // namespace evalbox::eval
