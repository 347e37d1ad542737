#pragma once

namespace hostpulse {
constexpr char kAgentVersion[] = "0.4.0";
}  // namespace hostpulse
