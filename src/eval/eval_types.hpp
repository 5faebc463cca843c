#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace evalbox::eval {

enum class TestStatus {
    kPassed,
    kFailed,
    kSkipped,
    kError,
    kXFail
};

const char* ToString(TestStatus status);
std::optional<TestStatus> ParseTestStatus(const std::string& value);

using TestStatusMap = std::map<std::string, TestStatus>;

enum class EvalType {
    kPassAndFail,
    kFailOnly
};

enum class ResolvedStatus {
    kNo,
    kPartial,
    kFull
};

const char* ToString(ResolvedStatus status);

struct EvaluationRun {
    std::string instance_id;
    std::string repo;
    std::string version;
    std::optional<std::string> model_patch;
    // Script text, or the path of a script that already exists on disk.
    std::string eval_script;
    std::string test_cmd;
    // Empty means <work_dir>/eval.sh.
    std::string eval_file;
    std::string local_code_space = "/testbed";
    std::vector<std::string> fail_to_pass;
    std::vector<std::string> pass_to_pass;
    std::vector<std::string> fail_to_fail;
    std::vector<std::string> pass_to_fail;
};

struct TestBucket {
    std::vector<std::string> success;
    std::vector<std::string> failure;
};

struct TestsReport {
    TestBucket fail_to_pass;
    TestBucket pass_to_pass;
    TestBucket fail_to_fail;
    TestBucket pass_to_fail;
};

// Each flag is meaningful only when every flag above it is true.
struct EvalReport {
    std::string instance_id;
    bool patch_is_none = false;
    bool patch_exists = false;
    bool patch_successfully_applied = false;
    bool resolved = false;
    std::optional<TestsReport> tests_status;
};

}  // namespace evalbox::eval
