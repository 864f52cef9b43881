#ifndef FLOWBENCH_CORE_HPP
#define FLOWBENCH_CORE_HPP
/*
 * Training/validation glue around one scene flow model.
 * ---------------------------------------------------------------------------
 *  - Assemble the configured model, loss and metric accumulator from a RunConfig
 *    through the component registries.
 *  - training_step / validation_step / validation_epoch_end follow the usual
 *    step-and-epoch lifecycle. Epoch end gathers the metric over the process
 *    group, resets it on every rank and reports on rank 0 only.
 *  - Scalars are recorded through log() and echoed to the configured stream.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/save_load.hpp"
#include "data/data.hpp"
#include "distributed/distributed.hpp"
#include "evaluation/evaluation.hpp"
#include "loss/loss.hpp"
#include "metric/metric.hpp"
#include "model/model.hpp"
#include "optimizer/optimizer.hpp"

namespace Flowbench {
    namespace Core {
        // Serialises lines written by concurrent validation workers.
        inline std::mutex& log_mutex() {
            static std::mutex mutex;
            return mutex;
        }
    }

    struct WrapperOptions {
        std::ostream* stream{&std::cout};
        bool verbose{true};
        bool print_report{true};
        Evaluation::ReportOptions report{};
    };

    class ModelWrapper : public torch::nn::Module {
    public:
        ModelWrapper(Common::Config::RunConfig config, Distributed::ProcessGroupPtr group, WrapperOptions options = {})
            : config_(std::move(config)), group_(std::move(group)), options_(options), metric_(config_.metric) {
            if (!group_) {
                throw std::invalid_argument("ModelWrapper requires a process group.");
            }
            Model::Models().require(config_.model.name);
            model_ = register_module("model", Model::Models().create(config_.model.name, config_.model.args));
            if (config_.is_trainable) {
                if (!config_.loss_fn) {
                    throw std::runtime_error("Trainable run '" + config_.run_name() + "' has no loss_fn configured.");
                }
                loss_ = Loss::Losses().create(config_.loss_fn->name, config_.loss_fn->args);
                if (!model_->trainable()) {
                    throw std::invalid_argument("Model '" + config_.model.name + "' has no trainable parameters but is_trainable is set.");
                }
            }
            options_.report.stream = options_.stream;
        }

        [[nodiscard]] const Common::Config::RunConfig& config() const noexcept { return config_; }
        [[nodiscard]] Model::FlowModel& model() { return *model_; }
        [[nodiscard]] const Model::FlowModel& model() const { return *model_; }
        [[nodiscard]] Metric::BucketedErrorAccumulator& metric() noexcept { return metric_; }
        [[nodiscard]] const Metric::BucketedErrorAccumulator& metric() const noexcept { return metric_; }
        [[nodiscard]] Distributed::ProcessGroup& group() noexcept { return *group_; }
        [[nodiscard]] std::size_t global_rank() const { return group_->rank(); }
        [[nodiscard]] torch::Device device() const { return metric_.device(); }

        using torch::nn::Module::to;

        void to(torch::Device device, bool non_blocking = false) override {
            torch::nn::Module::to(device, non_blocking);
            metric_.to(device);
        }

        [[nodiscard]] std::unique_ptr<torch::optim::Adam> configure_optimizers() {
            Optimizer::AdamOptions adam{};
            adam.learning_rate = config_.learning_rate;
            return Optimizer::Adam(model_->parameters(), adam);
        }

        [[nodiscard]] torch::Tensor training_step(const Data::Batch& batch, std::size_t batch_idx) {
            (void)batch_idx;
            if (!loss_) {
                throw std::logic_error("training_step called on a run without a loss function.");
            }
            const auto input = batch.to(device());
            model_->train();
            const auto output = model_->forward(input, config_.train_forward_args);
            const auto terms = (*loss_)(input, output);
            const auto loss = terms.find("loss");
            if (loss == terms.end()) {
                throw std::runtime_error("Loss '" + loss_->name() + "' did not produce a 'loss' term.");
            }
            log("train/loss", loss->second.item<double>(), /*rank_zero_only=*/false);
            for (const auto& [name, value] : terms) {
                if (name != "loss") {
                    log("train/" + name, value.item<double>(), /*rank_zero_only=*/false);
                }
            }
            return loss->second;
        }

        void validation_step(const Data::Batch& batch, std::size_t batch_idx) {
            (void)batch_idx;
            torch::NoGradGuard no_grad;
            const auto input = batch.to(device());
            model_->eval();
            const auto output = model_->forward(input, config_.val_forward_args);

            if (!config_.has_labels) {
                return;
            }

            metric_.update_runtime(output.batch_delta_time, static_cast<std::int64_t>(input.size()));
            for (std::size_t i = 0; i < input.size(); ++i) {
                Evaluation::accumulate_sequence(metric_,
                                                input.samples[i],
                                                output.flow.at(i),
                                                output.pc0_valid_point_idxes.at(i),
                                                output.pc1_valid_point_idxes.at(i));
            }
        }

        // Collective: every rank must call it once per validation epoch.
        std::optional<Evaluation::ValidationReport> validation_epoch_end() {
            const auto before_gather = std::chrono::steady_clock::now();
            const auto global = Distributed::gather_and_reset(metric_, *group_);
            const auto after_gather = std::chrono::steady_clock::now();
            {
                std::ostringstream line;
                line << "[Flowbench] Rank " << group_->rank() << " gathers done in "
                     << std::chrono::duration<double>(after_gather - before_gather).count() << "s.";
                write_line(line.str());
            }

            if (!Distributed::is_reporting_rank(*group_)) {
                return std::nullopt;
            }
            if (!config_.has_labels) {
                write_line("[Flowbench] Run '" + config_.run_name() + "' has no labels, skipping the validation report.");
                return std::nullopt;
            }

            auto report = Evaluation::MakeReport(config_.run_name(), global, config_.metric);
            log("val/full/nonmover_epe", report.full_nonmover_epe, /*rank_zero_only=*/true);
            log("val/full/mover_epe", report.full_mover_epe, /*rank_zero_only=*/true);
            log("val/close/nonmover_epe", report.close_nonmover_epe, /*rank_zero_only=*/true);
            log("val/close/mover_epe", report.close_mover_epe, /*rank_zero_only=*/true);

            if (options_.print_report && options_.stream) {
                std::lock_guard<std::mutex> lock(Core::log_mutex());
                *options_.stream << "Validation Results:\n";
                Evaluation::Print(report, options_.report);
            }

            const auto path = Evaluation::SaveReport(report, config_.validation_results_dir);
            write_line("[Flowbench] Saved validation results to " + path.string());
            return report;
        }

        void log(const std::string& name, double value, bool rank_zero_only = false) {
            if (rank_zero_only && !Distributed::is_reporting_rank(*group_)) {
                return;
            }
            logged_[name] = value;
            if (options_.verbose) {
                std::ostringstream line;
                line << "[Flowbench] " << name << " = " << value;
                write_line(line.str());
            }
        }

        [[nodiscard]] const std::map<std::string, double>& logged() const noexcept { return logged_; }

        // <directory>/architecture.json + <directory>/parameters.binary
        void save_checkpoint(const std::filesystem::path& directory) const {
            namespace fs = std::filesystem;
            if (directory.empty()) {
                throw std::invalid_argument("ModelWrapper::save_checkpoint requires a non-empty directory path.");
            }
            fs::create_directories(directory);

            const auto architecture_path = directory / "architecture.json";
            const auto parameters_path = directory / "parameters.binary";

            Common::SaveLoad::PropertyTree architecture;
            architecture.put("run_name", config_.run_name());
            architecture.put("model.name", config_.model.name);
            architecture.add_child("model.args", config_.model.args);
            try {
                Common::SaveLoad::write_json_file(architecture_path, architecture);
            } catch (const std::exception& error) {
                throw std::runtime_error(std::string("Failed to write architecture description to '")
                                         + architecture_path.string() + "': " + error.what());
            }

            torch::serialize::OutputArchive archive;
            model_->save(archive);
            archive.save_to(parameters_path.string());
        }

        void load_checkpoint(const std::filesystem::path& directory) {
            namespace fs = std::filesystem;
            const auto architecture_path = directory / "architecture.json";
            const auto parameters_path = directory / "parameters.binary";
            if (!fs::exists(architecture_path)) {
                throw std::runtime_error(std::string("Architecture file not found at '") + architecture_path.string() + "'.");
            }
            if (!fs::exists(parameters_path)) {
                throw std::runtime_error(std::string("Parameter archive not found at '") + parameters_path.string() + "'.");
            }

            const auto architecture = Common::SaveLoad::read_json_file(architecture_path);
            const auto stored = Common::SaveLoad::Detail::get_string(architecture, "model.name", architecture_path.string());
            if (stored != config_.model.name) {
                throw std::runtime_error("Checkpoint '" + directory.string() + "' holds a '" + stored
                                         + "' model but the run configures '" + config_.model.name + "'.");
            }

            torch::serialize::InputArchive archive;
            try {
                archive.load_from(parameters_path.string(), device());
            } catch (const c10::Error& error) {
                throw std::runtime_error(std::string("Failed to open parameter archive '") + parameters_path.string()
                                         + "': " + error.what());
            }
            model_->load(archive);
            write_line("[Flowbench] Loaded checkpoint " + directory.string());
        }

    private:
        void write_line(const std::string& line) const {
            if (!options_.stream) {
                return;
            }
            std::lock_guard<std::mutex> lock(Core::log_mutex());
            *options_.stream << line << std::endl;
        }

        Common::Config::RunConfig config_;
        Distributed::ProcessGroupPtr group_;
        WrapperOptions options_;
        Metric::BucketedErrorAccumulator metric_;
        Model::FlowModelPtr model_{};
        Loss::LossFunctionPtr loss_{};
        std::map<std::string, double> logged_{};
    };
}

#endif // FLOWBENCH_CORE_HPP
