#ifndef FLOWBENCH_COMMON_ERRORS_HPP
#define FLOWBENCH_COMMON_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Flowbench {
    // Category id absent from the configured table. Indicates a config/data mismatch.
    class UnknownCategory : public std::out_of_range {
    public:
        explicit UnknownCategory(std::int64_t category_id)
            : std::out_of_range("Unknown category id " + std::to_string(category_id) + " (not in the configured category table)."),
              category_id_(category_id) {}

        [[nodiscard]] std::int64_t category_id() const noexcept { return category_id_; }

    private:
        std::int64_t category_id_;
    };

    class ShapeMismatch : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    class NoSamplesProcessed : public std::runtime_error {
    public:
        NoSamplesProcessed()
            : std::runtime_error("Cannot build a validation report: no samples were processed (total forward count is 0).") {}
    };

    // Raised instead of silently dropping a point when strict bucket ranges are requested.
    class BucketRangeViolation : public std::out_of_range {
    public:
        using std::out_of_range::out_of_range;
    };

    class UnknownComponent : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };
}

#endif // FLOWBENCH_COMMON_ERRORS_HPP
