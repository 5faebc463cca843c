#include "eval/reward_service.hpp"

#include <filesystem>
#include <stdexcept>

#include "utils/common.hpp"

namespace evalbox::eval {
namespace {

container::ContainerExecResult Failure(const std::string& message) {
    container::ContainerExecResult result;
    result.returncode = 1;
    result.stderr_text = message;
    return result;
}

}  // namespace

RewardService::RewardService(config::RewardConfig config,
                             container::ContainerClient& client,
                             std::shared_ptr<utils::Logger> logger)
    : config_(std::move(config))
    , client_(client)
    , logger_(logger ? std::move(logger) : utils::MakeStderrLogger()) {}

void RewardService::LoadDataset(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::runtime_error("dataset not found: " + path);
    }
    auto dataset = nlohmann::json::parse(utils::ReadFile(path), nullptr, false);
    if (dataset.is_discarded() || !dataset.is_object()) {
        throw std::runtime_error("dataset is not a JSON object: " + path);
    }
    SetDataset(std::move(dataset));
    logger_->Info("[reward] Loaded " + std::to_string(dataset_.size()) + " instances from " + path);
}

void RewardService::SetDataset(nlohmann::json dataset) {
    dataset_ = std::move(dataset);
}

std::string RewardService::DetailsPath() const {
    return (std::filesystem::path(config_.share_path) / "details.json").string();
}

std::string RewardService::EvaluatorDir() const {
    return (std::filesystem::path(config_.share_path) / "eval").string();
}

bool RewardService::StageEvaluator() {
    namespace fs = std::filesystem;
    const fs::path source(config_.evaluator_source);
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        logger_->Debug("[reward] No evaluator at " + source.string());
        return false;
    }
    fs::create_directories(config_.share_path, ec);
    const auto target = fs::path(config_.share_path) / source.filename();
    fs::rename(source, target, ec);
    if (ec) {
        // Different filesystems: copy, then drop the source.
        ec.clear();
        fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        if (ec) {
            logger_->Warn("[reward] Failed to stage evaluator into " + target.string() + ": " + ec.message());
            return false;
        }
        fs::remove_all(source, ec);
    }
    logger_->Info("[reward] Staged evaluator at " + target.string());
    return true;
}

container::ContainerExecResult RewardService::Evaluate(const std::string& instance_id,
                                                       const std::string& model_patch,
                                                       std::chrono::seconds timeout) {
    if (!dataset_.contains(instance_id) || dataset_[instance_id].is_null()) {
        return Failure("instance_id is not founded!");
    }
    const auto& entry = dataset_[instance_id];
    if (!entry.is_object() || !entry.contains("details")) {
        return Failure("details is empty!");
    }
    const auto& raw = entry["details"];
    if (raw.is_null() || (raw.is_string() && raw.get<std::string>().empty())
        || (raw.is_object() && raw.empty())) {
        return Failure("details is empty!");
    }

    nlohmann::json details = raw.is_string()
        ? nlohmann::json::parse(raw.get<std::string>(), nullptr, false)
        : raw;
    if (details.is_discarded() || !details.is_object()) {
        return Failure("details is not a valid JSON object!");
    }
    details["model_patch"] = model_patch;

    const auto details_path = DetailsPath();
    if (!utils::WriteFile(details_path, details.dump())) {
        return Failure("failed to write " + details_path);
    }
    logger_->Info("[reward] Evaluating " + instance_id + " with timeout " + std::to_string(timeout.count()) + "s");
    return client_.Execute(config_.evaluator_command, EvaluatorDir(), timeout);
}

}  // namespace evalbox::eval
