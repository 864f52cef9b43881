#ifndef FLOWBENCH_DATA_SYNTHETIC_HPP
#define FLOWBENCH_DATA_SYNTHETIC_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "dataset.hpp"

namespace Flowbench::Data::Details {
    struct SyntheticRigidOptions {
        std::size_t sequences{16};
        std::size_t sequence_length{2};
        std::size_t background_points{2048};
        std::size_t objects_per_scene{4};
        std::size_t points_per_object{128};
        std::vector<std::int64_t> object_categories{0, 17, 19};  // REGULAR_VEHICLE, PEDESTRIAN, BICYCLIST
        double scene_half_extent_meters{50.0};
        double object_half_extent_meters{1.5};
        double max_speed_meters_per_second{15.0};
        double frame_rate_hz{10.0};
        std::int64_t background_category{-1};
        std::uint64_t seed{0};
    };

    // Static ground clutter plus rigidly translating boxes. Sequence i is a pure function of (seed, i).
    class SyntheticRigid final : public Dataset {
    public:
        explicit SyntheticRigid(SyntheticRigidOptions options) : options_(std::move(options)) {
            if (options_.sequence_length < 2) {
                throw std::invalid_argument("SyntheticRigid requires sequence_length >= 2.");
            }
            if (options_.frame_rate_hz <= 0.0) {
                throw std::invalid_argument("SyntheticRigid requires a positive frame_rate_hz.");
            }
            if (options_.objects_per_scene > 0 && options_.object_categories.empty()) {
                throw std::invalid_argument("SyntheticRigid requires at least one object category when objects are generated.");
            }
        }

        [[nodiscard]] const SyntheticRigidOptions& options() const noexcept { return options_; }

        [[nodiscard]] std::size_t size() const override { return options_.sequences; }

        [[nodiscard]] SceneFlowSample get(std::size_t index) const override {
            if (index >= options_.sequences) {
                throw std::out_of_range("SyntheticRigid index " + std::to_string(index) + " out of range ("
                                        + std::to_string(options_.sequences) + " sequences).");
            }
            std::mt19937_64 engine(options_.seed * 0x9E3779B97F4A7C15ULL + index);
            std::uniform_real_distribution<float> ground(static_cast<float>(-options_.scene_half_extent_meters),
                                                         static_cast<float>(options_.scene_half_extent_meters));
            std::uniform_real_distribution<float> height(-0.2F, 0.2F);
            std::uniform_real_distribution<float> local(static_cast<float>(-options_.object_half_extent_meters),
                                                        static_cast<float>(options_.object_half_extent_meters));
            std::uniform_real_distribution<double> heading(0.0, 2.0 * std::numbers::pi);
            std::uniform_real_distribution<double> speed(0.0, options_.max_speed_meters_per_second);
            std::uniform_int_distribution<std::size_t> category(0, options_.object_categories.empty()
                                                                       ? 0
                                                                       : options_.object_categories.size() - 1);

            const auto total = options_.background_points + options_.objects_per_scene * options_.points_per_object;
            std::vector<float> base(total * 3);
            std::vector<float> step(total * 3, 0.0F);
            std::vector<std::int64_t> classes(total, options_.background_category);

            for (std::size_t p = 0; p < options_.background_points; ++p) {
                base[3 * p + 0] = ground(engine);
                base[3 * p + 1] = ground(engine);
                base[3 * p + 2] = height(engine);
            }

            std::size_t offset = options_.background_points;
            for (std::size_t object = 0; object < options_.objects_per_scene; ++object) {
                const float cx = ground(engine);
                const float cy = ground(engine);
                const double angle = heading(engine);
                const double meters_per_frame = speed(engine) / options_.frame_rate_hz;
                const auto dx = static_cast<float>(std::cos(angle) * meters_per_frame);
                const auto dy = static_cast<float>(std::sin(angle) * meters_per_frame);
                const auto id = options_.object_categories[category(engine)];
                for (std::size_t p = 0; p < options_.points_per_object; ++p, ++offset) {
                    base[3 * offset + 0] = cx + local(engine);
                    base[3 * offset + 1] = cy + local(engine);
                    base[3 * offset + 2] = 0.5F + local(engine);
                    step[3 * offset + 0] = dx;
                    step[3 * offset + 1] = dy;
                    classes[offset] = id;
                }
            }

            const auto n = static_cast<std::int64_t>(total);
            auto base_tensor = torch::from_blob(base.data(), {n, 3}, torch::kFloat32).clone();
            auto step_tensor = torch::from_blob(step.data(), {n, 3}, torch::kFloat32).clone();
            auto class_tensor = torch::from_blob(classes.data(), {n}, torch::kInt64).clone();

            SceneFlowSample sample{};
            for (std::size_t t = 0; t < options_.sequence_length; ++t) {
                auto points = base_tensor + step_tensor * static_cast<float>(t);
                sample.flowed_pc_array_stack.push_back(points + step_tensor);
                sample.pc_array_stack.push_back(std::move(points));
                sample.pc_class_mask_stack.push_back(class_tensor.clone());
            }
            return sample;
        }

    private:
        SyntheticRigidOptions options_;
    };
}

#endif // FLOWBENCH_DATA_SYNTHETIC_HPP
