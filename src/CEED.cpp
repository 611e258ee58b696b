#include "CEED.hpp"

#include <algorithm>
#include <cctype>

namespace CEED {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

std::string toString(Subsystem s) {
    switch (s) {
        case Subsystem::SOLAR:       return "SOLAR";
        case Subsystem::MAGNETIC:    return "MAGNETIC";
        case Subsystem::ATMOSPHERIC: return "ATMOSPHERIC";
        case Subsystem::OCEANIC:     return "OCEANIC";
        case Subsystem::DEBRIS:      return "DEBRIS";
    }
    return "UNKNOWN";
}

std::string toString(Zone z) {
    switch (z) {
        case Zone::POLAR:        return "POLAR";
        case Zone::MID_LATITUDE: return "MID_LATITUDE";
        case Zone::EQUATORIAL:   return "EQUATORIAL";
        case Zone::OCEANIC:      return "OCEANIC";
    }
    return "UNKNOWN";
}

std::string toString(Phase p) {
    switch (p) {
        case Phase::STABLE:        return "STABLE";
        case Phase::STRESS:        return "STRESS";
        case Phase::COUPLING:      return "COUPLING";
        case Phase::AMPLIFICATION: return "AMPLIFICATION";
        case Phase::CASCADE:       return "CASCADE";
    }
    return "UNKNOWN";
}

std::string toString(ModulatorType m) {
    switch (m) {
        case ModulatorType::LUNAR:     return "LUNAR";
        case ModulatorType::PLANETARY: return "PLANETARY";
        case ModulatorType::SOLAR_AM:  return "SOLAR_AM";
        case ModulatorType::DEBRIS:    return "DEBRIS";
    }
    return "UNKNOWN";
}

std::string toString(RunStatus s) {
    switch (s) {
        case RunStatus::VALID:     return "VALID";
        case RunStatus::INVALID:   return "INVALID";
        case RunStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string configKey(Subsystem s) { return lower(toString(s)); }
std::string configKey(Zone z) { return lower(toString(z)); }
std::string configKey(ModulatorType m) { return lower(toString(m)); }

bool parseSubsystem(const std::string& name, Subsystem& out) {
    std::string n = lower(name);
    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        Subsystem s = static_cast<Subsystem>(i);
        if (n == configKey(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

bool parseModulatorType(const std::string& name, ModulatorType& out) {
    std::string n = lower(name);
    if (n == "lunar") { out = ModulatorType::LUNAR; return true; }
    if (n == "planetary") { out = ModulatorType::PLANETARY; return true; }
    if (n == "solar_am" || n == "solar_angular_momentum") {
        out = ModulatorType::SOLAR_AM;
        return true;
    }
    if (n == "debris") { out = ModulatorType::DEBRIS; return true; }
    return false;
}

bool parsePhase(const std::string& name, Phase& out) {
    std::string n = lower(name);
    for (size_t i = 0; i < NUM_PHASES; ++i) {
        Phase p = static_cast<Phase>(i);
        if (n == lower(toString(p))) {
            out = p;
            return true;
        }
    }
    return false;
}

} // namespace CEED
