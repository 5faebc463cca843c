#include "eval/evaluation_pipeline.hpp"

#include "eval/grading.hpp"
#include "eval/log_parser.hpp"
#include "utils/common.hpp"

namespace evalbox::eval {

EvaluationPipeline::EvaluationPipeline(RunContext& context, CommandRunner& runner)
    : context_(context)
    , runner_(runner) {}

EvalReport EvaluationPipeline::Run(const EvaluationRun& run) {
    auto& logger = context_.logger;
    logger.Info("[eval] Running instance " + run.instance_id + " via " + runner_.Name() + " runner");

    EvalReport report;
    report.instance_id = run.instance_id;
    if (!run.model_patch.has_value()) {
        logger.Info("[eval] Patch for " + run.instance_id + " is null, skipping evaluation");
        report.patch_is_none = true;
        return report;
    }

    std::error_code ec;
    std::filesystem::create_directories(context_.work_dir, ec);
    if (ec) {
        logger.Warn("[eval] Could not create work dir " + context_.work_dir.string() + ": " + ec.message());
    }

    try {
        ApplyPatch(run);
    } catch (const EvaluationError& ex) {
        logger.Error(std::string("[eval] ") + ex.what());
        report.patch_exists = true;
        return report;
    }

    const auto before_diff = CaptureDiff(run, "before");
    const auto eval_file = MaterializeScript(run);

    const auto outcome = runner_.Run("/bin/bash " + eval_file, context_.timeout);
    logger.Info("[eval] run eval script result: code=" + std::to_string(outcome.code));
    if (!utils::WriteFile(context_.TestOutputFile(), outcome.stdout_text)) {
        logger.Warn("[eval] Failed to write " + context_.TestOutputFile().string());
    }

    const auto after_diff = CaptureDiff(run, "after");
    if (after_diff != before_diff) {
        logger.Info("[eval] Git diff changed after running eval script");
    }

    logger.Info("[eval] Grading answer for " + run.instance_id + "...");
    report = GetEvalReport(run, context_.TestOutputFile().string(), context_.include_tests_status);
    logger.Info("[eval] Result for " + run.instance_id + ": resolved: " +
                (report.resolved ? "true" : "false"));
    return report;
}

void EvaluationPipeline::ApplyPatch(const EvaluationRun& run) {
    auto& logger = context_.logger;
    auto patch = run.model_patch.value_or("");
    if (!patch.empty() && patch.back() != '\n') {
        patch.push_back('\n');
    }
    const auto patch_file = context_.PatchFile().string();
    if (!utils::WriteFile(patch_file, patch)) {
        throw EvaluationError("Failed to write patch file " + patch_file);
    }

    const auto checkout = run.local_code_space;
    const auto strict = runner_.Run("cd " + checkout + " && git apply -v " + patch_file, context_.timeout);
    if (strict.Ok()) {
        logger.Info(std::string("[eval] ") + kApplyPatchPass + ":\n" + strict.stdout_text);
        return;
    }

    logger.Info("[eval] Failed to apply patch to container, trying again...");
    const auto fuzzy = runner_.Run(
        "cd " + checkout + " && patch --batch --fuzz=5 -p1 -i " + patch_file, context_.timeout);
    if (!fuzzy.Ok()) {
        logger.Info(std::string("[eval] ") + kApplyPatchFail + ":\n" +
                    (fuzzy.stderr_text.empty() ? fuzzy.stdout_text : fuzzy.stderr_text));
        throw EvaluationError("Failed to apply patch to container, try again.");
    }
    logger.Info(std::string("[eval] ") + kApplyPatchPass + ":\n" + fuzzy.stdout_text);
}

std::string EvaluationPipeline::MaterializeScript(const EvaluationRun& run) const {
    std::error_code ec;
    if (!run.eval_script.empty() && std::filesystem::is_regular_file(run.eval_script, ec)) {
        return run.eval_script;
    }
    const auto eval_file = run.eval_file.empty() ? context_.DefaultEvalFile().string() : run.eval_file;
    // Some base images need the UTF-8 locale spelled out.
    const auto script = utils::ReplaceAll(run.eval_script, "locale-gen", "locale-gen en_US.UTF-8");
    if (!utils::WriteFile(eval_file, script)) {
        context_.logger.Warn("[eval] Failed to write eval script " + eval_file);
    }
    return eval_file;
}

std::string EvaluationPipeline::CaptureDiff(const EvaluationRun& run, const char* label) {
    const auto outcome = runner_.Run("cd " + run.local_code_space + " && git diff", context_.timeout);
    context_.logger.Info(std::string("[eval] Git diff ") + label + " command status:" +
                         (outcome.Ok() ? "true" : "false") + ", output:" + outcome.stdout_text +
                         ", error:" + outcome.stderr_text);
    return outcome.stdout_text;
}

EvalReport GetEvalReport(const EvaluationRun& run,
                         const std::string& log_path,
                         bool include_tests_status) {
    EvalReport report;
    report.instance_id = run.instance_id;
    if (!run.model_patch.has_value()) {
        report.patch_is_none = true;
        return report;
    }
    report.patch_exists = true;

    const auto [statuses, found] = GetLogsEval(log_path);
    if (!found) {
        return report;
    }
    report.patch_successfully_applied = true;

    auto tests = GetEvalTestsReport(statuses, run.fail_to_pass, run.pass_to_pass, SelectEvalType(run.repo),
                                    run.fail_to_fail, run.pass_to_fail);
    report.resolved = GetResolutionStatus(tests) == ResolvedStatus::kFull;
    if (include_tests_status) {
        report.tests_status = std::move(tests);
    }
    return report;
}

}  // namespace evalbox::eval
