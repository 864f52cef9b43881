#ifndef FLOWBENCH_DATA_DATASET_HPP
#define FLOWBENCH_DATA_DATASET_HPP

#include <cstddef>
#include <memory>

#include "batch.hpp"

namespace Flowbench::Data::Details {
    class Dataset {
    public:
        virtual ~Dataset() = default;

        [[nodiscard]] virtual std::size_t size() const = 0;
        [[nodiscard]] virtual SceneFlowSample get(std::size_t index) const = 0;
    };

    using DatasetPtr = std::shared_ptr<const Dataset>;
}

#endif // FLOWBENCH_DATA_DATASET_HPP
