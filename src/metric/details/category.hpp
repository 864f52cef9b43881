#ifndef FLOWBENCH_METRIC_CATEGORY_HPP
#define FLOWBENCH_METRIC_CATEGORY_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../../common/errors.hpp"

namespace Flowbench::Metric::Details {
    struct Category {
        std::int64_t id{};
        std::string name{};
    };

    // Ordered id -> name table. Index order follows insertion order and never changes.
    class CategoryTable {
    public:
        CategoryTable() = default;

        CategoryTable(std::vector<Category> categories, std::vector<std::int64_t> static_ids = {-1})
            : categories_(std::move(categories)) {
            if (categories_.empty()) {
                throw std::invalid_argument("Category table must contain at least one category.");
            }
            index_by_id_.reserve(categories_.size());
            for (std::size_t index = 0; index < categories_.size(); ++index) {
                if (!index_by_id_.emplace(categories_[index].id, index).second) {
                    throw std::invalid_argument("Duplicate category id " + std::to_string(categories_[index].id)
                                                + " in category table.");
                }
            }
            for (const auto id : static_ids) {
                if (index_by_id_.count(id) == 0) {
                    throw UnknownCategory(id);
                }
                static_ids_.insert(id);
            }
        }

        [[nodiscard]] std::size_t size() const noexcept { return categories_.size(); }
        [[nodiscard]] bool empty() const noexcept { return categories_.empty(); }
        [[nodiscard]] const std::vector<Category>& categories() const noexcept { return categories_; }

        [[nodiscard]] bool contains(std::int64_t id) const { return index_by_id_.count(id) != 0; }

        [[nodiscard]] std::size_t index_of(std::int64_t id) const {
            const auto it = index_by_id_.find(id);
            if (it == index_by_id_.end()) {
                throw UnknownCategory(id);
            }
            return it->second;
        }

        [[nodiscard]] const std::string& name_at(std::size_t index) const { return categories_.at(index).name; }
        [[nodiscard]] std::int64_t id_at(std::size_t index) const { return categories_.at(index).id; }

        [[nodiscard]] bool is_static(std::int64_t id) const { return static_ids_.count(id) != 0; }
        [[nodiscard]] bool is_static_index(std::size_t index) const { return is_static(id_at(index)); }

        [[nodiscard]] std::vector<std::int64_t> static_ids() const {
            std::vector<std::int64_t> ids(static_ids_.begin(), static_ids_.end());
            std::sort(ids.begin(), ids.end());
            return ids;
        }

        [[nodiscard]] std::vector<std::string> names() const {
            std::vector<std::string> result;
            result.reserve(categories_.size());
            for (const auto& category : categories_) {
                result.push_back(category.name);
            }
            return result;
        }

    private:
        std::vector<Category> categories_{};
        std::unordered_map<std::int64_t, std::size_t> index_by_id_{};
        std::unordered_set<std::int64_t> static_ids_{};
    };

    inline CategoryTable Argoverse2Categories() {
        return CategoryTable({
            {-1, "BACKGROUND"},
            {0, "ANIMAL"},
            {1, "ARTICULATED_BUS"},
            {2, "BICYCLE"},
            {3, "BICYCLIST"},
            {4, "BOLLARD"},
            {5, "BOX_TRUCK"},
            {6, "BUS"},
            {7, "CONSTRUCTION_BARREL"},
            {8, "CONSTRUCTION_CONE"},
            {9, "DOG"},
            {10, "LARGE_VEHICLE"},
            {11, "MESSAGE_BOARD_TRAILER"},
            {12, "MOBILE_PEDESTRIAN_CROSSING_SIGN"},
            {13, "MOTORCYCLE"},
            {14, "MOTORCYCLIST"},
            {15, "OFFICIAL_SIGNALER"},
            {16, "PEDESTRIAN"},
            {17, "RAILED_VEHICLE"},
            {18, "REGULAR_VEHICLE"},
            {19, "SCHOOL_BUS"},
            {20, "SIGN"},
            {21, "STOP_SIGN"},
            {22, "STROLLER"},
            {23, "TRAFFIC_LIGHT_TRAILER"},
            {24, "TRUCK"},
            {25, "TRUCK_CAB"},
            {26, "VEHICULAR_TRAILER"},
            {27, "WHEELCHAIR"},
            {28, "WHEELED_DEVICE"},
            {29, "WHEELED_RIDER"},
        });
    }
}

#endif // FLOWBENCH_METRIC_CATEGORY_HPP
