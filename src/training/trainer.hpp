#ifndef FLOWBENCH_TRAINING_TRAINER_HPP
#define FLOWBENCH_TRAINING_TRAINER_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../core.hpp"
#include "../data/data.hpp"
#include "../distributed/distributed.hpp"
#include "../evaluation/evaluation.hpp"

namespace Flowbench::Training {
    struct TrainerOptions {
        std::vector<torch::Device> devices{torch::Device(torch::kCPU)};
        std::filesystem::path checkpoint_dir{"checkpoints"};
        std::ostream* stream{&std::cout};
        bool verbose{true};
    };

    // Fails fast on names no registry knows, before any data or model is touched.
    inline void require_components(const Common::Config::RunConfig& config) {
        Model::Models().require(config.model.name);
        if (config.loss_fn) {
            Loss::Losses().require(config.loss_fn->name);
        }
        if (config.dataset) {
            Data::Datasets().require(config.dataset->name);
        }
        Data::Datasets().require(config.test_dataset.name);
    }

    [[nodiscard]] inline Data::Loader make_loader(const Data::DatasetPtr& dataset,
                                                  const Common::SaveLoad::PropertyTree& args,
                                                  std::size_t rank,
                                                  std::size_t world_size) {
        auto options = Data::LoaderFromTree(args);
        options.rank = rank;
        options.world_size = world_size;
        return Data::Loader(dataset, options);
    }

    // One validation epoch on this wrapper's shard. Collective through the wrapper's group.
    inline std::optional<Evaluation::ValidationReport> run_validation(ModelWrapper& wrapper, const Data::Loader& loader) {
        for (std::size_t index = 0; index < loader.num_batches(); ++index) {
            wrapper.validation_step(loader.batch(index), index);
        }
        return wrapper.validation_epoch_end();
    }

    class Trainer {
    public:
        explicit Trainer(TrainerOptions options = {}) : options_(std::move(options)) {
            if (options_.devices.empty()) {
                throw std::invalid_argument("Trainer requires at least one device.");
            }
        }

        [[nodiscard]] const TrainerOptions& options() const noexcept { return options_; }

        // Single-process training on the first device. Returns the last validation report.
        std::optional<Evaluation::ValidationReport> fit(ModelWrapper& wrapper,
                                                        const Data::DatasetPtr& train,
                                                        const Data::DatasetPtr& validation) {
            const auto& config = wrapper.config();
            if (!config.is_trainable) {
                throw std::invalid_argument("Run '" + config.run_name() + "' is not trainable.");
            }
            if (wrapper.group().world_size() != 1) {
                throw std::invalid_argument("Trainer::fit runs on a single process group.");
            }
            wrapper.to(options_.devices.front());
            auto optimizer = wrapper.configure_optimizers();
            auto train_loader = make_loader(train, config.dataloader, 0, 1);
            const auto validation_loader = make_loader(validation, config.test_dataloader, 0, 1);

            std::optional<Evaluation::ValidationReport> last_report{};
            std::size_t step = 0;
            for (std::size_t epoch = 0; epoch < config.epochs; ++epoch) {
                train_loader.set_epoch(epoch);
                for (std::size_t index = 0; index < train_loader.num_batches(); ++index) {
                    optimizer->zero_grad();
                    auto loss = wrapper.training_step(train_loader.batch(index), index);
                    loss.backward();
                    optimizer->step();
                    ++step;

                    if (config.save_every > 0 && step % config.save_every == 0) {
                        wrapper.save_checkpoint(options_.checkpoint_dir / ("step_" + std::to_string(step)));
                    }
                    if (config.validate_every > 0 && step % config.validate_every == 0) {
                        last_report = run_validation(wrapper, validation_loader);
                    }
                }
                write_line("[Flowbench] Epoch " + std::to_string(epoch + 1) + "/" + std::to_string(config.epochs)
                           + " finished after " + std::to_string(step) + " steps.");
                if (config.validate_every == 0) {
                    last_report = run_validation(wrapper, validation_loader);
                }
            }
            wrapper.save_checkpoint(options_.checkpoint_dir / "last");
            return last_report;
        }

        // One worker thread per device, each with its own wrapper replica, a LocalGroup handle and a
        // disjoint shard. The first worker failure is rethrown after every worker has been joined.
        std::optional<Evaluation::ValidationReport> validate(const Common::Config::RunConfig& config,
                                                             const Data::DatasetPtr& dataset,
                                                             const std::optional<std::filesystem::path>& checkpoint = std::nullopt) {
            require_components(config);
            const auto world_size = options_.devices.size();
            auto groups = Distributed::Local(world_size);

            std::mutex result_mutex;
            std::optional<Evaluation::ValidationReport> report{};
            std::exception_ptr first_failure{};

            auto worker = [&](std::size_t rank) {
                try {
                    WrapperOptions wrapper_options{};
                    wrapper_options.stream = options_.stream;
                    wrapper_options.verbose = options_.verbose;
                    ModelWrapper wrapper(config, groups[rank], wrapper_options);
                    wrapper.to(options_.devices[rank]);
                    if (checkpoint) {
                        wrapper.load_checkpoint(*checkpoint);
                    }
                    const auto loader = make_loader(dataset, config.test_dataloader, rank, world_size);
                    auto result = run_validation(wrapper, loader);
                    if (result) {
                        std::lock_guard<std::mutex> lock(result_mutex);
                        report = std::move(result);
                    }
                } catch (const std::exception& error) {
                    {
                        std::lock_guard<std::mutex> lock(result_mutex);
                        if (!first_failure) {
                            first_failure = std::current_exception();
                        }
                    }
                    groups[rank]->abort("rank " + std::to_string(rank) + " failed: " + error.what());
                }
            };

            std::vector<std::thread> threads;
            threads.reserve(world_size);
            for (std::size_t rank = 0; rank < world_size; ++rank) {
                threads.emplace_back(worker, rank);
            }
            for (auto& thread : threads) {
                thread.join();
            }
            if (first_failure) {
                std::rethrow_exception(first_failure);
            }
            return report;
        }

    private:
        void write_line(const std::string& line) const {
            if (!options_.stream || !options_.verbose) {
                return;
            }
            std::lock_guard<std::mutex> lock(Core::log_mutex());
            *options_.stream << line << std::endl;
        }

        TrainerOptions options_;
    };
}

#endif // FLOWBENCH_TRAINING_TRAINER_HPP
