#pragma once

#include "thermolog/thermo/property_adapter.hpp"
#include <string>

namespace thermolog {

/// Property adapter backed by CoolProp (PropsSI, PhaseSI, HAPropsSI)
class CoolPropAdapter : public IPropertyAdapter {
public:
    explicit CoolPropAdapter(std::string fluid);
    
    const std::string& fluid() const override { return fluid_; }
    
    /// @throws PropertyError if CoolProp rejects a finite state
    double enthalpy(double pressure_pa, double temperature_k) const override;
    double enthalpy_at_quality(double pressure_pa, double quality) const override;
    Phase phase(double pressure_pa, double temperature_k) const override;
    double humidity_ratio(double pressure_pa, double temperature_k,
                          double relative_humidity) const override;
    
private:
    std::string fluid_;
};

} // namespace thermolog
