#pragma once

#include <set>
#include <string>
#include <vector>

#include "eval/eval_types.hpp"
#include "nlohmann/json.hpp"

namespace evalbox::eval {

// Repositories whose logs only reliably report failing tests.
const std::set<std::string>& FailOnlyRepos();

EvalType SelectEvalType(const std::string& repo);

bool TestPassed(const std::string& test, const TestStatusMap& statuses);
bool TestFailed(const std::string& test, const TestStatusMap& statuses);

// FAIL_TO_FAIL and PASS_TO_FAIL are reported but never affect resolution.
TestsReport GetEvalTestsReport(const TestStatusMap& statuses,
                               const std::vector<std::string>& fail_to_pass,
                               const std::vector<std::string>& pass_to_pass,
                               EvalType eval_type,
                               const std::vector<std::string>& fail_to_fail = {},
                               const std::vector<std::string>& pass_to_fail = {});

// success / (success + failure), 1 when the bucket is empty.
double ComputeRate(const TestBucket& bucket);

ResolvedStatus GetResolutionStatus(const TestsReport& report);

nlohmann::json TestsReportToJson(const TestsReport& report);

}  // namespace evalbox::eval
