#ifndef FLOWBENCH_APPS_CLI_HPP
#define FLOWBENCH_APPS_CLI_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <torch/torch.h>

namespace Flowbench::Apps {
    inline constexpr std::uint64_t kSeed = 42069;

    struct CommandLine {
        std::filesystem::path config{};
        std::optional<std::filesystem::path> checkpoint{};
        int gpus{1};
        bool cpu{false};
    };

    // Returns std::nullopt when --help was printed.
    inline std::optional<CommandLine> parse_command_line(int argc, char** argv, const std::string& description) {
        namespace po = boost::program_options;
        CommandLine command_line{};
        std::string config;
        std::string checkpoint;

        po::options_description desc(description);
        desc.add_options()
            ("help,h", "Show this message")
            ("config", po::value<std::string>(&config)->required(), "Run config (JSON)")
            ("checkpoint", po::value<std::string>(&checkpoint), "Checkpoint directory to load")
            ("gpus", po::value<int>(&command_line.gpus)->default_value(command_line.gpus), "Number of devices (one worker each)")
            ("cpu", po::bool_switch(&command_line.cpu), "Run every worker on the CPU");
        po::positional_options_description positional;
        positional.add("config", 1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        if (vm.count("help") != 0) {
            std::cout << desc << std::endl;
            return std::nullopt;
        }
        po::notify(vm);

        command_line.config = config;
        if (!checkpoint.empty()) {
            command_line.checkpoint = checkpoint;
        }
        if (!std::filesystem::exists(command_line.config)) {
            throw std::runtime_error("Config file " + command_line.config.string() + " does not exist");
        }
        if (command_line.checkpoint && !std::filesystem::exists(*command_line.checkpoint)) {
            throw std::runtime_error("Checkpoint " + command_line.checkpoint->string() + " does not exist");
        }
        if (command_line.gpus < 1) {
            throw std::invalid_argument("--gpus must be at least 1.");
        }
        return command_line;
    }

    inline std::vector<torch::Device> select_devices(const CommandLine& command_line) {
        std::vector<torch::Device> devices;
        const auto count = static_cast<std::size_t>(command_line.gpus);
        if (command_line.cpu) {
            devices.assign(count, torch::Device(torch::kCPU));
            return devices;
        }
        if (!torch::cuda::is_available() || torch::cuda::device_count() < count) {
            throw std::runtime_error("Requested " + std::to_string(count) + " CUDA device(s) but "
                                     + std::to_string(torch::cuda::is_available() ? torch::cuda::device_count() : 0)
                                     + " are available. Pass --cpu to run on the CPU.");
        }
        for (std::size_t index = 0; index < count; ++index) {
            devices.emplace_back(torch::kCUDA, static_cast<c10::DeviceIndex>(index));
        }
        return devices;
    }
}

#endif // FLOWBENCH_APPS_CLI_HPP
