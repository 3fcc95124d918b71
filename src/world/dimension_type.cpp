#include "dimension_type.hpp"

namespace strata::world {

std::unordered_map<int, DimensionType>& DimensionTypeRegistry::table() {
    static std::unordered_map<int, DimensionType> types = [] {
        std::unordered_map<int, DimensionType> t;
        t.emplace(OVERWORLD, DimensionType(OVERWORLD, SkyColor::Blue, 256, 1.0f));
        t.emplace(NETHER, DimensionType(NETHER, SkyColor::Red, 128, 8.0f));
        t.emplace(THE_END, DimensionType(THE_END, SkyColor::PurpleStatic, 256, 1.0f));
        return t;
    }();
    return types;
}

const DimensionType& DimensionTypeRegistry::get(int type_id) {
    auto& types = table();
    auto it = types.find(type_id);
    if (it == types.end()) {
        throw InvalidDimensionType(type_id);
    }
    return it->second;
}

bool DimensionTypeRegistry::contains(int type_id) {
    return table().count(type_id) > 0;
}

bool DimensionTypeRegistry::add(int type_id, SkyColor sky_color, int max_build_height,
                                float distance_multiplier) {
    return table().emplace(type_id, DimensionType(type_id, sky_color, max_build_height,
                                                  distance_multiplier)).second;
}

} // namespace strata::world
