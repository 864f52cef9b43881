#ifndef FLOWBENCH_DATA_SAVED_HPP
#define FLOWBENCH_DATA_SAVED_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "dataset.hpp"

namespace Flowbench::Data::Details {
    struct SavedSequenceOptions {
        std::filesystem::path root{};
        std::string extension{".pt"};
    };

    // One LibTorch archive per sequence: "length", then pc_<t>, flowed_<t>, class_<t> per timestep.
    inline void write_saved_sequence(const std::filesystem::path& path, const SceneFlowSample& sample) {
        sample.validate();
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        torch::serialize::OutputArchive archive;
        archive.write("length", torch::tensor(static_cast<std::int64_t>(sample.sequence_length())));
        for (std::size_t t = 0; t < sample.sequence_length(); ++t) {
            const auto suffix = std::to_string(t);
            archive.write("pc_" + suffix, sample.pc_array_stack[t].to(torch::kCPU));
            if (sample.flowed_pc_array_stack[t].defined()) {
                archive.write("flowed_" + suffix, sample.flowed_pc_array_stack[t].to(torch::kCPU));
            }
            if (sample.pc_class_mask_stack[t].defined()) {
                archive.write("class_" + suffix, sample.pc_class_mask_stack[t].to(torch::kCPU));
            }
        }
        archive.save_to(path.string());
    }

    [[nodiscard]] inline SceneFlowSample read_saved_sequence(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Sequence file '" + path.string() + "' does not exist.");
        }
        torch::serialize::InputArchive archive;
        archive.load_from(path.string());

        torch::Tensor length;
        archive.read("length", length);
        const auto frames = length.item<std::int64_t>();
        if (frames < 0) {
            throw std::runtime_error("Sequence file '" + path.string() + "' has a negative length.");
        }

        SceneFlowSample sample{};
        for (std::int64_t t = 0; t < frames; ++t) {
            const auto suffix = std::to_string(t);
            torch::Tensor points;
            archive.read("pc_" + suffix, points);
            torch::Tensor flowed;
            (void)archive.try_read("flowed_" + suffix, flowed);
            torch::Tensor classes;
            (void)archive.try_read("class_" + suffix, classes);
            sample.pc_array_stack.push_back(points);
            sample.flowed_pc_array_stack.push_back(flowed);
            sample.pc_class_mask_stack.push_back(classes);
        }
        sample.validate();
        return sample;
    }

    // Sequences are visited in lexicographic file-name order.
    class SavedSequence final : public Dataset {
    public:
        explicit SavedSequence(SavedSequenceOptions options) : options_(std::move(options)) {
            if (!std::filesystem::is_directory(options_.root)) {
                throw std::runtime_error("SavedSequence root '" + options_.root.string() + "' is not a directory.");
            }
            for (const auto& entry : std::filesystem::directory_iterator(options_.root)) {
                if (entry.is_regular_file() && entry.path().extension() == options_.extension) {
                    files_.push_back(entry.path());
                }
            }
            std::sort(files_.begin(), files_.end());
        }

        [[nodiscard]] std::size_t size() const override { return files_.size(); }

        [[nodiscard]] SceneFlowSample get(std::size_t index) const override {
            if (index >= files_.size()) {
                throw std::out_of_range("SavedSequence index " + std::to_string(index) + " out of range ("
                                        + std::to_string(files_.size()) + " files).");
            }
            return read_saved_sequence(files_[index]);
        }

        [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept { return files_; }

    private:
        SavedSequenceOptions options_;
        std::vector<std::filesystem::path> files_{};
    };
}

#endif // FLOWBENCH_DATA_SAVED_HPP
