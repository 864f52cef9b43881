#ifndef FLOWBENCH_COMMON_REGISTRY_HPP
#define FLOWBENCH_COMMON_REGISTRY_HPP

#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace Flowbench::Common {
    template <class Signature>
    class Registry;

    // Name -> factory table. Used to assemble models, losses and datasets from run configs.
    template <class Product, class... Args>
    class Registry<Product(Args...)> {
    public:
        using Factory = std::function<Product(Args...)>;

        explicit Registry(std::string kind) : kind_(std::move(kind)) {}

        void add(const std::string& name, Factory factory) {
            if (!factory) {
                throw std::invalid_argument("Cannot register an empty " + kind_ + " factory under '" + name + "'.");
            }
            if (!factories_.emplace(name, std::move(factory)).second) {
                throw std::invalid_argument("A " + kind_ + " named '" + name + "' is already registered.");
            }
        }

        [[nodiscard]] bool contains(const std::string& name) const { return factories_.count(name) != 0; }

        void require(const std::string& name) const {
            if (!contains(name)) {
                std::ostringstream message;
                message << "Unknown " << kind_ << " '" << name << "'. Registered: ";
                bool first = true;
                for (const auto& entry : factories_) {
                    message << (first ? "" : ", ") << entry.first;
                    first = false;
                }
                if (first) {
                    message << "(none)";
                }
                throw UnknownComponent(message.str());
            }
        }

        [[nodiscard]] Product create(const std::string& name, Args... args) const {
            require(name);
            return factories_.at(name)(std::forward<Args>(args)...);
        }

        [[nodiscard]] std::vector<std::string> names() const {
            std::vector<std::string> result;
            result.reserve(factories_.size());
            for (const auto& entry : factories_) {
                result.push_back(entry.first);
            }
            return result;
        }

        [[nodiscard]] const std::string& kind() const noexcept { return kind_; }

    private:
        std::string kind_;
        std::map<std::string, Factory> factories_{};
    };
}

#endif // FLOWBENCH_COMMON_REGISTRY_HPP
