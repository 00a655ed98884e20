// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "fs_maintenance/config/ScratchConfig.hpp"
#include "fs_maintenance/runtime/PathResolver.hpp"
#include "fs_maintenance/services/StaleSweeper.hpp"
#include "fs_maintenance/utils/Diagnostics.hpp"

namespace fs_maintenance {

// Periodically purges stale files from the configured scratch roots.
class ScratchSweeperNode : public rclcpp::Node {
public:
    ScratchSweeperNode()
        : rclcpp::Node("scratch_sweeper_node") {
        declareParameters();
        loadParameters();

        if (!validateConfiguration()) {
            return;
        }
        configured_ = true;

        resolver_ = std::make_unique<runtime::PathResolver>(config_);
        sweeper_ = std::make_unique<services::StaleSweeper>(
            *resolver_,
            [logger = get_logger()](const utils::Diagnostic& diagnostic) {
                RCLCPP_WARN(logger, "%s", utils::formatDiagnostic(diagnostic).c_str());
            });

        RCLCPP_INFO(get_logger(),
                    "Scratch sweeper initialized - Temp: %s, Tenant temp: %s, Interval: %d s",
                    resolver_->basePath(runtime::ScratchRootKind::Global).c_str(),
                    resolver_->basePath(runtime::ScratchRootKind::Tenant).c_str(),
                    sweep_interval_sec_);

        sweep();
        timer_ = this->create_wall_timer(std::chrono::seconds(sweep_interval_sec_), [this]() { sweep(); });
    }

    ~ScratchSweeperNode() override = default;

    bool configured() const {
        return configured_;
    }

private:
    void declareParameters() {
        this->declare_parameter("config_file", "");
        this->declare_parameter("app_root", "");
        this->declare_parameter("temp_directory", std::string(config::kDefaultTempDirectory));
        this->declare_parameter("tenant_path", std::string(config::kDefaultTenantPath));
        this->declare_parameter("sweep_interval_sec", 3600);
    }

    void loadParameters() {
        config_.app_root = this->get_parameter("app_root").as_string();
        config_.temp_directory = this->get_parameter("temp_directory").as_string();
        config_.tenant_path = this->get_parameter("tenant_path").as_string();
        sweep_interval_sec_ = static_cast<int>(this->get_parameter("sweep_interval_sec").as_int());

        const std::string config_path = this->get_parameter("config_file").as_string();
        if (!config_path.empty()) {
            try {
                config_ = config::loadScratchConfigFromYaml(config_path);
            } catch (const std::exception& e) {
                RCLCPP_ERROR(get_logger(), "Failed to load config file '%s': %s",
                             config_path.c_str(), e.what());
            }
        }
    }

    bool validateConfiguration() {
        bool valid = true;
        for (const auto& err : config_.validate()) {
            RCLCPP_ERROR(get_logger(), "%s", err.c_str());
            valid = false;
        }
        if (sweep_interval_sec_ <= 0) {
            RCLCPP_ERROR(get_logger(), "sweep_interval_sec must be greater than zero (current: %d)",
                         sweep_interval_sec_);
            valid = false;
        }
        return valid;
    }

    void sweep() {
        const auto summary = sweeper_->sweepStaleTempFiles();
        RCLCPP_INFO(get_logger(), "Swept %zu root(s): %zu of %zu file(s) deleted, %zu failure(s)",
                    summary.roots_swept, summary.files_deleted, summary.files_scanned, summary.failures);
    }

    config::ScratchConfig config_;
    bool configured_{false};
    int sweep_interval_sec_{3600};
    std::unique_ptr<runtime::PathResolver> resolver_;
    std::unique_ptr<services::StaleSweeper> sweeper_;
    rclcpp::TimerBase::SharedPtr timer_;
};

}  // namespace fs_maintenance

int main(int argc, char** argv) {
    rclcpp::init(argc, argv);
    int exit_code = 0;

    try {
        auto node = std::make_shared<fs_maintenance::ScratchSweeperNode>();
        if (node->configured()) {
            rclcpp::spin(node);
        } else {
            exit_code = 1;
        }
    } catch (const std::exception& e) {
        RCLCPP_ERROR(rclcpp::get_logger("scratch_sweeper_node"),
                     "Unhandled exception: %s", e.what());
        exit_code = 1;
    }

    rclcpp::shutdown();
    return exit_code;
}
