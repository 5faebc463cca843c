#pragma once

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "eval/command_runner.hpp"
#include "eval/eval_types.hpp"
#include "utils/logging.hpp"

namespace evalbox::eval {

class EvaluationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Per-run state handed to the pipeline; one instance per run.
struct RunContext {
    utils::Logger& logger;
    std::filesystem::path work_dir;
    std::chrono::seconds timeout{3600};
    bool include_tests_status = true;

    std::filesystem::path PatchFile() const { return work_dir / "patch.diff"; }
    std::filesystem::path DefaultEvalFile() const { return work_dir / "eval.sh"; }
    std::filesystem::path TestOutputFile() const { return work_dir / "test_output.txt"; }
    std::filesystem::path RunLogFile() const { return work_dir / "run_instance.log"; }
};

// apply -> diff -> write script -> execute -> grade, stopping early at a null patch or a
// patch that does not apply.
class EvaluationPipeline {
public:
    EvaluationPipeline(RunContext& context, CommandRunner& runner);

    EvalReport Run(const EvaluationRun& run);

    // Strict `git apply`, then `patch --fuzz=5`. Throws EvaluationError when both fail.
    void ApplyPatch(const EvaluationRun& run);

    // Returns the path the script runs from.
    std::string MaterializeScript(const EvaluationRun& run) const;

private:
    std::string CaptureDiff(const EvaluationRun& run, const char* label);

    RunContext& context_;
    CommandRunner& runner_;
};

// Grades the test log at log_path against the run's expected transitions.
EvalReport GetEvalReport(const EvaluationRun& run,
                         const std::string& log_path,
                         bool include_tests_status);

}  // namespace evalbox::eval
