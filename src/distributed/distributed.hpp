#ifndef FLOWBENCH_DISTRIBUTED_HPP
#define FLOWBENCH_DISTRIBUTED_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include <cstddef>
#include <memory>
#include <vector>

#include "details/gather.hpp"
#include "details/group.hpp"
#include "details/local.hpp"

namespace Flowbench::Distributed {
    using ProcessGroup = Details::ProcessGroup;
    using ProcessGroupPtr = Details::ProcessGroupPtr;
    using SingleProcessGroup = Details::SingleProcessGroup;
    using LocalGroup = Details::LocalGroup;

    using Details::gather;
    using Details::gather_and_reset;
    using Details::is_reporting_rank;

    [[nodiscard]] inline auto Single() -> ProcessGroupPtr { return std::make_shared<SingleProcessGroup>(); }

    [[nodiscard]] inline auto Local(std::size_t world_size) -> std::vector<ProcessGroupPtr> {
        return LocalGroup::create(world_size);
    }
}

#endif // FLOWBENCH_DISTRIBUTED_HPP
