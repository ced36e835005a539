#include "thermolog/core/quantity.hpp"
#include "thermolog/core/errors.hpp"
#include <string>

namespace thermolog {

Quantity::Quantity(std::vector<double> values, Unit unit,
                   std::string label, std::string property)
    : values_(std::move(values))
    , unit_(std::move(unit))
    , label_(std::move(label))
    , property_(std::move(property))
{}

Quantity Quantity::scalar(double value, Unit unit, std::string label, std::string property) {
    Quantity q({value}, std::move(unit), std::move(label), std::move(property));
    q.scalar_ = true;
    return q;
}

// ===== Conversion =====

Quantity Quantity::to(const Unit& unit) const {
    Quantity result = *this;
    result.values_ = magnitudes_in(unit);
    result.unit_ = unit;
    return result;
}

std::vector<double> Quantity::magnitudes_in(const Unit& unit) const {
    return convert(values(), unit_, unit);
}

Quantity Quantity::with_label(std::string label) const {
    Quantity result = *this;
    result.label_ = std::move(label);
    return result;
}

Quantity Quantity::with_property(std::string property) const {
    Quantity result = *this;
    result.property_ = std::move(property);
    return result;
}

// ===== Arithmetic =====

size_t Quantity::result_length(const Quantity& other) const {
    if (scalar_) return other.size();
    if (other.scalar_) return size();
    if (size() != other.size()) {
        throw IncompatibleUnits("length mismatch: " + std::to_string(size()) +
                                " vs " + std::to_string(other.size()));
    }
    return size();
}

Quantity Quantity::operator+(const Quantity& other) const {
    if (unit_.has_offset() || other.unit_.has_offset()) {
        throw IncompatibleUnits("addition of offset unit '" +
                                (unit_.has_offset() ? unit_.symbol : other.unit_.symbol) + "'");
    }
    const Quantity rhs = other.to(unit_);
    const size_t n = result_length(rhs);
    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = (*this)[i] + rhs[i];
    }
    Quantity result(std::move(out), unit_);
    result.scalar_ = scalar_ && other.scalar_;
    return result;
}

Quantity Quantity::operator-(const Quantity& other) const {
    return *this + (-other);
}

Quantity Quantity::operator*(const Quantity& other) const {
    Unit unit = multiply(unit_, other.unit_);
    const size_t n = result_length(other);
    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = (*this)[i] * other[i];
    }
    Quantity result(std::move(out), std::move(unit));
    result.scalar_ = scalar_ && other.scalar_;
    return result;
}

Quantity Quantity::operator/(const Quantity& other) const {
    Unit unit = divide(unit_, other.unit_);
    const size_t n = result_length(other);
    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = (*this)[i] / other[i];
    }
    Quantity result(std::move(out), std::move(unit));
    result.scalar_ = scalar_ && other.scalar_;
    return result;
}

Quantity Quantity::operator*(double factor) const {
    Quantity result = *this;
    for (auto& v : result.values_) {
        v *= factor;
    }
    result.label_.clear();
    result.property_.clear();
    return result;
}

Quantity Quantity::operator-() const {
    if (unit_.has_offset()) {
        throw IncompatibleUnits("negation of offset unit '" + unit_.symbol + "'");
    }
    return *this * -1.0;
}

std::vector<bool> Quantity::less_than(const Quantity& other) const {
    const Quantity rhs = other.to(unit_);
    const size_t n = result_length(rhs);
    std::vector<bool> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = (*this)[i] < rhs[i];
    }
    return out;
}

bool Quantity::operator==(const Quantity& other) const {
    return unit_ == other.unit_ && values_ == other.values_ &&
           label_ == other.label_ && property_ == other.property_ &&
           scalar_ == other.scalar_;
}

} // namespace thermolog
