/// @file src/core/types.cpp
/// @brief OperatingState labels.

#include "cew/types.hpp"

namespace cew {

std::string_view to_string(OperatingState s) noexcept {
    switch (s) {
        case OperatingState::Off:                 return "off";
        case OperatingState::Idle:                return "idle";
        case OperatingState::Charge:              return "charge";
        case OperatingState::Discharge:           return "discharge";
        case OperatingState::DischargeAggressive: return "discharge_aggressive";
    }
    return "idle";
}

}  // namespace cew
