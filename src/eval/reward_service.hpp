#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "container/container_client.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace evalbox::eval {

// Looks up a dataset entry, writes its job descriptor with the caller's patch to the shared
// path and runs the evaluator inside the container.
class RewardService {
public:
    RewardService(config::RewardConfig config,
                  container::ContainerClient& client,
                  std::shared_ptr<utils::Logger> logger = nullptr);

    // Throws std::runtime_error when the file is missing or not a JSON object.
    void LoadDataset(const std::string& path);
    void SetDataset(nlohmann::json dataset);
    std::size_t DatasetSize() const { return dataset_.size(); }

    // Moves the evaluator directory into the share path. Returns false when there was
    // nothing to move or the move failed.
    bool StageEvaluator();

    container::ContainerExecResult Evaluate(const std::string& instance_id,
                                            const std::string& model_patch,
                                            std::chrono::seconds timeout);

    std::string DetailsPath() const;
    std::string EvaluatorDir() const;

private:
    config::RewardConfig config_;
    container::ContainerClient& client_;
    std::shared_ptr<utils::Logger> logger_;
    nlohmann::json dataset_ = nlohmann::json::object();
};

}  // namespace evalbox::eval
