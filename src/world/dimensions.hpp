#pragma once

#include "dimension.hpp"
#include <optional>
#include <string>
#include <utility>

namespace strata::world {

class Overworld : public Dimension {
public:
    Overworld() : Dimension(DimensionTypeRegistry::OVERWORLD) {}
    std::string dimension_name() const override { return "Overworld"; }
};

class Nether : public Dimension {
public:
    Nether() : Dimension(DimensionTypeRegistry::NETHER) {}
    std::string dimension_name() const override { return "Nether"; }
};

class TheEnd : public Dimension {
public:
    TheEnd() : Dimension(DimensionTypeRegistry::THE_END) {}
    std::string dimension_name() const override { return "The End"; }
};

// Marker for dimension classes that may be registered at runtime
class CustomDimension {
public:
    virtual ~CustomDimension() = default;
};

// Custom dimension described entirely by configuration
class ConfiguredDimension : public Dimension, public CustomDimension {
public:
    ConfiguredDimension(std::string name, int type_id, std::optional<float> distance_multiplier = std::nullopt)
        : Dimension(type_id), name_(std::move(name)) {
        set_distance_multiplier(distance_multiplier);
    }

    std::string dimension_name() const override { return name_; }

private:
    std::string name_;
};

} // namespace strata::world
