#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace strata::world {

enum class SkyColor : uint8_t {
    Blue = 0,
    Red = 1,
    PurpleStatic = 2,
};

// Immutable properties shared by every dimension of one kind
class DimensionType {
public:
    DimensionType(int id, SkyColor sky_color, int max_build_height, float distance_multiplier)
        : id_(id), sky_color_(sky_color), max_build_height_(max_build_height),
          distance_multiplier_(distance_multiplier) {}

    int id() const { return id_; }
    SkyColor sky_color() const { return sky_color_; }
    int max_build_height() const { return max_build_height_; }
    float distance_multiplier() const { return distance_multiplier_; }

private:
    int id_;
    SkyColor sky_color_;
    int max_build_height_;
    float distance_multiplier_;
};

// Unknown dimension type id. Always a caller bug.
class InvalidDimensionType : public std::invalid_argument {
public:
    explicit InvalidDimensionType(int type_id)
        : std::invalid_argument("Invalid dimension type ID " + std::to_string(type_id)),
          type_id_(type_id) {}

    int type_id() const { return type_id_; }

private:
    int type_id_;
};

// Append-only table of dimension types. Entries are never mutated or removed,
// so references returned by get() stay valid for the life of the process.
class DimensionTypeRegistry {
public:
    static constexpr int OVERWORLD = 0;
    static constexpr int NETHER = 1;
    static constexpr int THE_END = 2;

    // Throws InvalidDimensionType if the id is not registered
    static const DimensionType& get(int type_id);
    static bool contains(int type_id);

    // Returns false if the id is already taken
    static bool add(int type_id, SkyColor sky_color, int max_build_height, float distance_multiplier);

private:
    static std::unordered_map<int, DimensionType>& table();
};

} // namespace strata::world
