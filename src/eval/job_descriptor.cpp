#include "eval/job_descriptor.hpp"

#include "eval/evaluation_pipeline.hpp"
#include "eval/grading.hpp"
#include "utils/common.hpp"

namespace evalbox::eval {
namespace {

std::string ReadOptionalString(const nlohmann::json& details, const char* key) {
    if (!details.contains(key) || !details[key].is_string()) {
        return {};
    }
    return details[key].get<std::string>();
}

std::vector<std::string> ReadTestList(const nlohmann::json& details, const char* key) {
    if (!details.contains(key) || details[key].is_null()) {
        return {};
    }
    nlohmann::json value = details[key];
    if (value.is_string()) {
        value = nlohmann::json::parse(value.get<std::string>(), nullptr, false);
        if (value.is_discarded()) {
            throw EvaluationError(std::string(key) + " is not valid JSON");
        }
    }
    if (!value.is_array()) {
        throw EvaluationError(std::string(key) + " must be a list of test names");
    }
    std::vector<std::string> tests;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw EvaluationError(std::string(key) + " must be a list of test names");
        }
        tests.push_back(item.get<std::string>());
    }
    return tests;
}

}  // namespace

EvaluationRun ParseEvaluationRun(const nlohmann::json& details) {
    if (!details.is_object()) {
        throw EvaluationError("job descriptor must be a JSON object");
    }
    if (!details.contains("instance_id") || !details["instance_id"].is_string()) {
        throw EvaluationError("job descriptor is missing instance_id");
    }
    EvaluationRun run;
    run.instance_id = details["instance_id"].get<std::string>();
    run.repo = ReadOptionalString(details, "repo");
    run.version = ReadOptionalString(details, "version");
    if (details.contains("model_patch") && details["model_patch"].is_string()) {
        run.model_patch = details["model_patch"].get<std::string>();
    }
    run.eval_script = ReadOptionalString(details, "script");
    run.test_cmd = ReadOptionalString(details, "test_cmd");
    run.fail_to_pass = ReadTestList(details, "FAIL_TO_PASS");
    run.pass_to_pass = ReadTestList(details, "PASS_TO_PASS");
    run.fail_to_fail = ReadTestList(details, "FAIL_TO_FAIL");
    run.pass_to_fail = ReadTestList(details, "PASS_TO_FAIL");
    return run;
}

EvaluationRun LoadEvaluationRun(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw EvaluationError("job descriptor not found: " + path);
    }
    const auto details = nlohmann::json::parse(utils::ReadFile(path), nullptr, false);
    if (details.is_discarded()) {
        throw EvaluationError("job descriptor is not valid JSON: " + path);
    }
    return ParseEvaluationRun(details);
}

nlohmann::json ReportToJson(const EvalReport& report) {
    nlohmann::json entry = {
        {"patch_is_None", report.patch_is_none},
        {"patch_exists", report.patch_exists},
        {"patch_successfully_applied", report.patch_successfully_applied},
        {"resolved", report.resolved}
    };
    if (report.tests_status.has_value()) {
        entry["tests_status"] = TestsReportToJson(*report.tests_status);
    }
    return nlohmann::json{{report.instance_id, entry}};
}

}  // namespace evalbox::eval
