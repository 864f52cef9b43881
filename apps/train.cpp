#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <Flowbench.h>

#include "cli.hpp"

int main(int argc, char** argv) {
    try {
        const auto command_line = Flowbench::Apps::parse_command_line(
            argc, argv, "Usage: flowbench_train <config> [--checkpoint DIR] [--gpus N] [--cpu]");
        if (!command_line) {
            return EXIT_SUCCESS;
        }

        const auto config = Flowbench::Common::Config::load_run_config(command_line->config);
        if (!config.is_trainable) {
            throw std::runtime_error("Run '" + config.run_name() + "' is not trainable; use flowbench_validate.");
        }
        Flowbench::Training::require_components(config);

        torch::manual_seed(Flowbench::Apps::kSeed);
        const auto train = Flowbench::Data::Datasets().create(config.dataset->name, config.dataset->args);
        const auto validation = Flowbench::Data::Datasets().create(config.test_dataset.name, config.test_dataset.args);
        std::cout << "[Flowbench] Train dataset length: " << train->size()
                  << ", val dataset length: " << validation->size() << std::endl;

        Flowbench::Training::TrainerOptions options{};
        options.devices = Flowbench::Apps::select_devices(*command_line);
        if (options.devices.size() > 1) {
            std::cout << "[Flowbench] Training uses the first of " << options.devices.size() << " devices." << std::endl;
        }
        options.checkpoint_dir = std::filesystem::path("checkpoints") / config.run_name();

        Flowbench::ModelWrapper wrapper(config, Flowbench::Distributed::Single());
        wrapper.to(options.devices.front());
        if (command_line->checkpoint) {
            wrapper.load_checkpoint(*command_line->checkpoint);
        }
        Flowbench::Training::Trainer trainer(options);
        (void)trainer.fit(wrapper, train, validation);
    } catch (const std::exception& error) {
        std::cerr << "flowbench_train: " << error.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
