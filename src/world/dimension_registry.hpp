#pragma once

#include "dimension.hpp"
#include "dimensions.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace strata::world {

// Registration is only allowed for concrete Dimension subclasses marked CustomDimension
template<typename T>
inline constexpr bool is_custom_dimension_class_v =
    std::is_base_of_v<Dimension, T> && std::is_base_of_v<CustomDimension, T> && !std::is_abstract_v<T>;

enum class RegisterError : uint8_t {
    None = 0,
    IdAlreadyBound = 1,
    InvalidDimensionClass = 2,
};

struct RegisterResult {
    int id = Dimension::ID_RESERVED;
    RegisterError error = RegisterError::None;

    bool ok() const { return error == RegisterError::None; }
    explicit operator bool() const { return ok(); }
};

using DimensionFactory = std::function<std::unique_ptr<Dimension>()>;

// Maps dimension ids to the implementation instantiated for them.
// Created once by the host and passed by reference; single writer, no locking.
class DimensionClassRegistry {
public:
    static constexpr int DEFAULT_ID_SEED = 1000;

    // Registers Overworld, Nether and TheEnd at their fixed ids
    explicit DimensionClassRegistry(int id_seed = DEFAULT_ID_SEED);

    // Registers T for `id`, or for the next free automatic id when `id` is empty.
    // Constructor arguments are copied into the factory.
    template<typename T, typename... Args>
    RegisterResult register_dimension(std::optional<int> id = std::nullopt, bool override_existing = false,
                                      Args&&... args) {
        if constexpr (!is_custom_dimension_class_v<T>) {
            return RegisterResult{Dimension::ID_RESERVED, RegisterError::InvalidDimensionClass};
        } else {
            return bind(id, override_existing, [... captured = std::forward<Args>(args)]() -> std::unique_ptr<Dimension> {
                return std::make_unique<T>(captured...);
            });
        }
    }

    // nullptr if nothing is registered under `id`
    std::unique_ptr<Dimension> create(int id) const;
    bool contains(int id) const { return classes_.find(id) != classes_.end(); }
    size_t size() const { return classes_.size(); }
    int next_auto_id() const { return next_id_; }

private:
    RegisterResult bind(std::optional<int> id, bool override_existing, DimensionFactory factory);

    std::unordered_map<int, DimensionFactory> classes_;
    int next_id_;
};

} // namespace strata::world
