#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>

#include <Flowbench.h>

#include "cli.hpp"

int main(int argc, char** argv) {
    try {
        const auto command_line = Flowbench::Apps::parse_command_line(
            argc, argv, "Usage: flowbench_validate <config> [--checkpoint DIR] [--gpus N] [--cpu]");
        if (!command_line) {
            return EXIT_SUCCESS;
        }

        const auto config = Flowbench::Common::Config::load_run_config(command_line->config);
        if (config.is_trainable && !command_line->checkpoint) {
            throw std::runtime_error("Must provide a checkpoint to validate trainable run '" + config.run_name() + "'.");
        }
        Flowbench::Training::require_components(config);

        torch::manual_seed(Flowbench::Apps::kSeed);
        const auto dataset = Flowbench::Data::Datasets().create(config.test_dataset.name, config.test_dataset.args);
        std::cout << "[Flowbench] Val dataset length: " << dataset->size() << std::endl;

        Flowbench::Training::TrainerOptions options{};
        options.devices = Flowbench::Apps::select_devices(*command_line);
        Flowbench::Training::Trainer trainer(options);
        (void)trainer.validate(config, dataset, command_line->checkpoint);
    } catch (const std::exception& error) {
        std::cerr << "flowbench_validate: " << error.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
