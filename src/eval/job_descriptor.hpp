#pragma once

#include <string>

#include "eval/eval_types.hpp"
#include "nlohmann/json.hpp"

namespace evalbox::eval {

// Throws EvaluationError when instance_id is missing or a test list is malformed.
// FAIL_TO_PASS / PASS_TO_PASS may be arrays or JSON strings encoding arrays.
EvaluationRun ParseEvaluationRun(const nlohmann::json& details);

// Throws EvaluationError when the file cannot be read or parsed.
EvaluationRun LoadEvaluationRun(const std::string& path);

nlohmann::json ReportToJson(const EvalReport& report);

}  // namespace evalbox::eval
