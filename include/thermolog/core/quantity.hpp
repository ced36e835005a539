#pragma once

/**
 * @file quantity.hpp
 * @brief Unit-tagged numeric arrays with display label and property tag
 *
 * A Quantity holds either one value per sample or a single scalar that
 * broadcasts against arrays. Addition, subtraction and comparison
 * convert the right operand into the left operand's unit and require the
 * same dimension; multiplication and division generate a new unit.
 */

#include "thermolog/core/units.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace thermolog {

class Quantity {
public:
    /// Empty dimensionless array
    Quantity() = default;

    /// Array quantity
    Quantity(std::vector<double> values, Unit unit,
             std::string label = "", std::string property = "");

    /// Scalar quantity (broadcasts against arrays of any length)
    static Quantity scalar(double value, Unit unit,
                           std::string label = "", std::string property = "");

    // ===== ACCESS =====

    /// Number of stored values (1 for scalars)
    size_t size() const { return values_.size(); }

    bool empty() const { return values_.empty(); }

    bool is_scalar() const { return scalar_; }

    /// Read-only view of the magnitudes
    std::span<const double> values() const {
        return std::span<const double>(values_.data(), values_.size());
    }

    /// Magnitude at index i (a scalar answers every index)
    double operator[](size_t i) const { return scalar_ ? values_[0] : values_[i]; }

    const Unit& unit() const { return unit_; }
    const std::string& label() const { return label_; }
    const std::string& property() const { return property_; }

    // ===== CONVERSION =====

    /// Same values expressed in another unit; throws IncompatibleUnits
    Quantity to(const Unit& unit) const;

    /// Magnitudes expressed in another unit; throws IncompatibleUnits
    std::vector<double> magnitudes_in(const Unit& unit) const;

    /// Copy with a different label
    Quantity with_label(std::string label) const;

    /// Copy with a different physical-property tag
    Quantity with_property(std::string property) const;

    // ===== ARITHMETIC =====

    Quantity operator+(const Quantity& other) const;
    Quantity operator-(const Quantity& other) const;
    Quantity operator*(const Quantity& other) const;
    Quantity operator/(const Quantity& other) const;
    Quantity operator*(double factor) const;
    Quantity operator-() const;

    /// Element-wise this < other, other converted to this unit
    std::vector<bool> less_than(const Quantity& other) const;

    /// Exact equality of unit, values, label and property
    bool operator==(const Quantity& other) const;

private:
    /// Length of a binary operation result; throws on mismatch
    size_t result_length(const Quantity& other) const;

    std::vector<double> values_;
    Unit unit_ = Unit::dimensionless();
    std::string label_;
    std::string property_;
    bool scalar_ = false;
};

} // namespace thermolog
