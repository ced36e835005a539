#include "thermolog/thermo/coolprop_adapter.hpp"
#include "thermolog/core/errors.hpp"
#include <cmath>
#include <sstream>

#include "CoolProp.h"
#include "HumidAirProp.h"

namespace thermolog {

namespace {

double checked(double result, const std::string& output,
               const char* name1, double val1, const char* name2, double val2,
               const std::string& fluid) {
    if (!std::isfinite(result)) {
        std::ostringstream oss;
        oss << "CoolProp returned invalid result (NaN or Inf) for " << output
            << "(" << fluid << ") with inputs: "
            << name1 << "=" << val1 << ", " << name2 << "=" << val2;
        const std::string detail = CoolProp::get_global_param_string("errstring");
        if (!detail.empty()) {
            oss << ": " << detail;
        }
        throw PropertyError(oss.str());
    }
    return result;
}

} // namespace

CoolPropAdapter::CoolPropAdapter(std::string fluid)
    : fluid_(std::move(fluid))
{}

double CoolPropAdapter::enthalpy(double pressure_pa, double temperature_k) const {
    if (!std::isfinite(pressure_pa) || !std::isfinite(temperature_k)) {
        return std::nan("");
    }
    double h = CoolProp::PropsSI("H", "P", pressure_pa, "T", temperature_k, fluid_);
    return checked(h, "H", "P", pressure_pa, "T", temperature_k, fluid_);
}

double CoolPropAdapter::enthalpy_at_quality(double pressure_pa, double quality) const {
    if (!std::isfinite(pressure_pa)) {
        return std::nan("");
    }
    double h = CoolProp::PropsSI("H", "P", pressure_pa, "Q", quality, fluid_);
    return checked(h, "H", "P", pressure_pa, "Q", quality, fluid_);
}

Phase CoolPropAdapter::phase(double pressure_pa, double temperature_k) const {
    if (!std::isfinite(pressure_pa) || !std::isfinite(temperature_k)) {
        return Phase::UNKNOWN;
    }
    return parse_phase(CoolProp::PhaseSI("P", pressure_pa, "T", temperature_k, fluid_));
}

double CoolPropAdapter::humidity_ratio(double pressure_pa, double temperature_k,
                                       double relative_humidity) const {
    if (!std::isfinite(pressure_pa) || !std::isfinite(temperature_k) ||
        !std::isfinite(relative_humidity)) {
        return std::nan("");
    }
    double w = HumidAir::HAPropsSI("W", "P", pressure_pa, "T", temperature_k,
                                   "RH", relative_humidity);
    if (!std::isfinite(w)) {
        std::ostringstream oss;
        oss << "HumidAir returned invalid result (NaN or Inf) for W with inputs: "
            << "P=" << pressure_pa << ", T=" << temperature_k
            << ", RH=" << relative_humidity;
        throw PropertyError(oss.str());
    }
    return w;
}

} // namespace thermolog
