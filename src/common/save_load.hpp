#ifndef FLOWBENCH_COMMON_SAVE_LOAD_HPP
#define FLOWBENCH_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <torch/torch.h>

namespace Flowbench::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        // Accepts "inf", "+inf", "-inf", "infinity" and "nan" on top of plain decimal notation.
        inline double parse_double(const std::string& text, const std::string& context) {
            const auto lowered = to_lower(text);
            if (lowered == "inf" || lowered == "+inf" || lowered == "infinity" || lowered == "+infinity") {
                return std::numeric_limits<double>::infinity();
            }
            if (lowered == "-inf" || lowered == "-infinity") {
                return -std::numeric_limits<double>::infinity();
            }
            if (lowered == "nan") {
                return std::numeric_limits<double>::quiet_NaN();
            }
            try {
                std::size_t consumed = 0;
                const double value = std::stod(text, &consumed);
                if (consumed != text.size()) {
                    throw std::invalid_argument(text);
                }
                return value;
            } catch (const std::logic_error&) {
                std::ostringstream message;
                message << "Invalid numeric value '" << text << "' in " << context;
                throw std::runtime_error(message.str());
            }
        }

        inline std::string format_double(double value) {
            if (std::isnan(value)) {
                return "nan";
            }
            if (std::isinf(value)) {
                return value > 0 ? "inf" : "-inf";
            }
            std::ostringstream stream;
            stream << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
            return stream.str();
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context) {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            if constexpr (std::is_floating_point_v<Numeric>) {
                const auto text = tree.get_optional<std::string>(key);
                if (!text) {
                    std::ostringstream message;
                    message << "Missing numeric field '" << key << "' in " << context;
                    throw std::runtime_error(message.str());
                }
                return static_cast<Numeric>(parse_double(*text, context + "." + key));
            } else {
                const auto value = tree.get_optional<Numeric>(key);
                if (!value) {
                    std::ostringstream message;
                    message << "Missing numeric field '" << key << "' in " << context;
                    throw std::runtime_error(message.str());
                }
                return *value;
            }
        }

        template <class Numeric>
        Numeric get_numeric_or(const PropertyTree& tree, const std::string& key, Numeric fallback, const std::string& context) {
            if (!tree.get_child_optional(key)) {
                return fallback;
            }
            return get_numeric<Numeric>(tree, key, context);
        }

        inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context) {
            const auto value = tree.get_optional<bool>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing boolean field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline bool get_boolean_or(const PropertyTree& tree, const std::string& key, bool fallback, const std::string& context) {
            if (!tree.get_child_optional(key)) {
                return fallback;
            }
            return get_boolean(tree, key, context);
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context) {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context) {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                if constexpr (std::is_floating_point_v<T>) {
                    values.push_back(static_cast<T>(parse_double(child.second.data(), context)));
                } else {
                    try {
                        values.push_back(child.second.get_value<T>());
                    } catch (const boost::property_tree::ptree_bad_data&) {
                        std::ostringstream message;
                        message << "Invalid array element in " << context;
                        throw std::runtime_error(message.str());
                    }
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values) {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                if constexpr (std::is_floating_point_v<T>) {
                    element.put("", format_double(static_cast<double>(value)));
                } else {
                    element.put("", value);
                }
                array.push_back({"", element});
            }
            return array;
        }

        inline void write_tensor_level(PropertyTree& node, const torch::Tensor& tensor) {
            if (tensor.dim() == 0) {
                if (tensor.is_floating_point()) {
                    node.put("", format_double(tensor.item<double>()));
                } else {
                    node.put("", tensor.item<std::int64_t>());
                }
                return;
            }
            for (std::int64_t i = 0; i < tensor.size(0); ++i) {
                PropertyTree child;
                write_tensor_level(child, tensor[i]);
                node.push_back({"", child});
            }
        }

        inline void read_tensor_level(const PropertyTree& node, std::size_t depth, std::vector<std::int64_t>& shape,
                                      std::vector<double>& values, const std::string& context) {
            if (node.empty()) {
                if (depth != shape.size()) {
                    throw std::runtime_error("Ragged nested array in " + context);
                }
                values.push_back(parse_double(node.data(), context));
                return;
            }
            const auto extent = static_cast<std::int64_t>(node.size());
            if (depth == shape.size()) {
                if (!values.empty()) {
                    throw std::runtime_error("Ragged nested array in " + context);
                }
                shape.push_back(extent);
            } else if (depth > shape.size() || shape[depth] != extent) {
                throw std::runtime_error("Ragged nested array in " + context);
            }
            for (const auto& child : node) {
                read_tensor_level(child.second, depth + 1, shape, values, context);
            }
        }
    }

    // Dense tensor as nested JSON arrays (outermost dimension first).
    inline PropertyTree write_tensor(const torch::Tensor& tensor) {
        PropertyTree tree;
        Detail::write_tensor_level(tree, tensor.detach().to(torch::kCPU).contiguous());
        return tree;
    }

    inline torch::Tensor read_tensor(const PropertyTree& tree, torch::ScalarType dtype, const std::string& context) {
        std::vector<std::int64_t> shape;
        std::vector<double> values;
        Detail::read_tensor_level(tree, 0, shape, values, context);
        auto flat = torch::tensor(values, torch::TensorOptions().dtype(torch::kFloat64));
        return flat.reshape(shape).to(dtype);
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree) {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("File '" + path.string() + "' does not exist.");
        }
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }
}
#endif // FLOWBENCH_COMMON_SAVE_LOAD_HPP
