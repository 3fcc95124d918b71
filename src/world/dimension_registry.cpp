#include "dimension_registry.hpp"
#include <algorithm>
#include <iostream>

namespace strata::world {

DimensionClassRegistry::DimensionClassRegistry(int id_seed)
    : next_id_(std::max(id_seed, Dimension::ID_THE_END + 1)) {
    classes_[Dimension::ID_OVERWORLD] = [] { return std::make_unique<Overworld>(); };
    classes_[Dimension::ID_NETHER] = [] { return std::make_unique<Nether>(); };
    classes_[Dimension::ID_THE_END] = [] { return std::make_unique<TheEnd>(); };
}

RegisterResult DimensionClassRegistry::bind(std::optional<int> id, bool override_existing,
                                            DimensionFactory factory) {
    if (id && *id == Dimension::ID_RESERVED) {
        id.reset();
    }

    int assigned;
    if (id) {
        if (contains(*id) && !override_existing) {
            return RegisterResult{Dimension::ID_RESERVED, RegisterError::IdAlreadyBound};
        }
        assigned = *id;
    } else {
        while (contains(next_id_)) {
            ++next_id_;
        }
        assigned = next_id_++;
    }

    classes_[assigned] = std::move(factory);
    std::cout << "[DimensionRegistry] Registered dimension class with id " << assigned << std::endl;
    return RegisterResult{assigned, RegisterError::None};
}

std::unique_ptr<Dimension> DimensionClassRegistry::create(int id) const {
    auto it = classes_.find(id);
    if (it == classes_.end()) {
        return nullptr;
    }
    return it->second();
}

} // namespace strata::world
