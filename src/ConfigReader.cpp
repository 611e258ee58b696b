#include "ConfigReader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace CEED {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

const char* const KNOWN_SECTIONS[] = {
    "SIMULATION", "DECAY", "TOPOLOGY", "RETENTION", "RESONANCE", "MODULATORS",
    "NOISE", "PHASES", "RUNAWAY", "FORCING", "ENSEMBLE", "OUTPUT"};

const char* const DISTRIBUTION_PARAMS[] = {
    "alpha_base", "alpha_max", "kappa", "e_crit", "modulator_scale"};

} // namespace

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    parse(file);
    return true;
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream is(text);
    parse(is);
    return true;
}

void ConfigReader::parse(std::istream& is) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(is, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

std::uint64_t ConfigReader::getUInt64(const std::string& section, const std::string& key,
                                      std::uint64_t default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return static_cast<std::uint64_t>(std::stoull(val));
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as unsigned integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = lower(getString(section, key));
    if (val.empty()) return default_val;

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    for (const auto& token : split(val, ',')) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

std::vector<std::string> ConfigReader::getStringArray(const std::string& section,
                                                      const std::string& key) const {
    return split(getString(section, key), ',');
}

void ConfigReader::set(const std::string& section, const std::string& key,
                       const std::string& value) {
    data[section][key] = value;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Parsing
// =============================================================================

bool ConfigReader::readSubsystemArray(const std::string& section, const std::string& prefix,
                                      SubsystemArray& values) const {
    bool found = false;
    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        const std::string key = prefix + configKey(static_cast<Subsystem>(i));
        if (hasKey(section, key)) {
            values[i] = getDouble(section, key, values[i]);
            found = true;
        }
    }
    return found;
}

bool ConfigReader::parseRunConfig(RunConfig& config) const {
    bool any = false;
    for (const char* s : KNOWN_SECTIONS) {
        if (hasSection(s)) any = true;
    }

    // Simulation
    config.n_steps = getInt("SIMULATION", "n_steps", config.n_steps);
    config.dt_days = getDouble("SIMULATION", "dt_days", config.dt_days);
    readSubsystemArray("SIMULATION", "seed_", config.seed_energy);
    config.energy_floor = getDouble("SIMULATION", "energy_floor", config.energy_floor);
    config.zone_sum_tolerance = getDouble("SIMULATION", "zone_sum_tolerance",
                                          config.zone_sum_tolerance);

    // Decay
    readSubsystemArray("DECAY", "", config.decay);

    // Topology
    if (hasKey("TOPOLOGY", "zone_coupling")) {
        std::vector<double> flat = getDoubleArray("TOPOLOGY", "zone_coupling");
        if (flat.size() == NUM_ZONES * NUM_ZONES) {
            for (size_t i = 0; i < NUM_ZONES; ++i) {
                config.zone_coupling[i].assign(flat.begin() + i * NUM_ZONES,
                                               flat.begin() + (i + 1) * NUM_ZONES);
            }
        } else {
            // Keep the wrong shape so engine validation reports it
            config.zone_coupling.assign(1, flat);
        }
    }
    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        const std::string key = "weights_" + configKey(static_cast<Subsystem>(i));
        if (hasKey("TOPOLOGY", key)) {
            config.subsystem_weights[i] = getDoubleArray("TOPOLOGY", key);
        }
    }
    readSubsystemArray("TOPOLOGY", "forcing_gain_", config.forcing_gain);
    config.diffusion_rate = getDouble("TOPOLOGY", "diffusion_rate", config.diffusion_rate);

    // Retention
    config.alpha_base = getDouble("RETENTION", "alpha_base", config.alpha_base);
    config.alpha_max = getDouble("RETENTION", "alpha_max", config.alpha_max);
    config.p_half = getDouble("RETENTION", "p_half", config.p_half);
    config.retention_ceiling = getDouble("RETENTION", "ceiling", config.retention_ceiling);
    config.safety_factor = getDouble("RETENTION", "safety_factor", config.safety_factor);
    config.collapse_sharpness = getDouble("RETENTION", "collapse_sharpness",
                                          config.collapse_sharpness);

    // Resonance
    readSubsystemArray("RESONANCE", "beta_", config.resonance_beta);
    readSubsystemArray("RESONANCE", "period_", config.oscillation_period_days);
    readSubsystemArray("RESONANCE", "phase_", config.oscillation_phase_rad);

    // Modulators
    if (hasKey("MODULATORS", "enabled")) {
        config.modulators_enabled.clear();
        for (const auto& name : getStringArray("MODULATORS", "enabled")) {
            ModulatorType m;
            if (parseModulatorType(name, m)) {
                config.modulators_enabled.insert(m);
            } else if (lower(name) != "none") {
                std::cerr << "Warning: Unknown modulator '" << name << "' ignored" << std::endl;
            }
        }
    }
    config.modulator_scale = getDouble("MODULATORS", "scale", config.modulator_scale);
    config.lunar_sidereal.amplitude = getDouble("MODULATORS", "lunar_sidereal_amplitude",
                                                config.lunar_sidereal.amplitude);
    config.lunar_sidereal.period_days = getDouble("MODULATORS", "lunar_sidereal_period_days",
                                                  config.lunar_sidereal.period_days);
    config.lunar_nodal.amplitude = getDouble("MODULATORS", "lunar_nodal_amplitude",
                                             config.lunar_nodal.amplitude);
    config.lunar_nodal.period_days = getDouble("MODULATORS", "lunar_nodal_period_days",
                                               config.lunar_nodal.period_days);
    if (hasKey("MODULATORS", "solar_am_amplitudes") ||
        hasKey("MODULATORS", "solar_am_periods_years")) {
        std::vector<double> amps = getDoubleArray("MODULATORS", "solar_am_amplitudes");
        std::vector<double> years = getDoubleArray("MODULATORS", "solar_am_periods_years");
        if (amps.size() != years.size()) {
            std::cerr << "Warning: solar_am_amplitudes and solar_am_periods_years differ "
                      << "in length; solar angular momentum components unchanged" << std::endl;
        } else {
            config.solar_am_components.clear();
            for (size_t i = 0; i < amps.size(); ++i) {
                config.solar_am_components.push_back({amps[i], years[i] * 365.25, 0.0});
            }
        }
    }
    config.debris_gain = getDouble("MODULATORS", "debris_gain", config.debris_gain);
    config.debris_half_energy = getDouble("MODULATORS", "debris_half_energy",
                                          config.debris_half_energy);

    std::vector<PlanetaryBody> bodies = parsePlanetaryBodies();
    if (!bodies.empty()) {
        config.planetary_bodies = bodies;
    }

    // Noise
    config.noise_sigma = getDouble("NOISE", "sigma", config.noise_sigma);
    config.noise_cutoff_period_days = getDouble("NOISE", "cutoff_period_days",
                                                config.noise_cutoff_period_days);
    config.noise_clip_sigmas = getDouble("NOISE", "clip_sigmas", config.noise_clip_sigmas);
    if (hasKey("NOISE", "distribution")) {
        std::string dist = upper(getString("NOISE", "distribution"));
        if (dist == "GAUSSIAN" || dist == "NORMAL") {
            config.noise_distribution = NoiseDistribution::GAUSSIAN;
        } else if (dist == "UNIFORM") {
            config.noise_distribution = NoiseDistribution::UNIFORM;
        } else {
            std::cerr << "Warning: Unknown noise distribution '" << dist << "'" << std::endl;
        }
    }

    // Phases
    if (hasKey("PHASES", "thresholds")) {
        config.phase_thresholds = getDoubleArray("PHASES", "thresholds");
    }
    config.phase_hysteresis = getDouble("PHASES", "hysteresis", config.phase_hysteresis);

    // Runaway
    config.kappa = getDouble("RUNAWAY", "kappa", config.kappa);
    config.e_crit = getDouble("RUNAWAY", "e_crit", config.e_crit);
    if (hasKey("RUNAWAY", "e_crit_mode")) {
        std::string mode = upper(getString("RUNAWAY", "e_crit_mode"));
        if (mode == "CONSTANT") config.e_crit_mode = CriticalEnergyMode::CONSTANT;
        else if (mode == "SEASONAL") config.e_crit_mode = CriticalEnergyMode::SEASONAL;
        else if (mode == "TABULATED") config.e_crit_mode = CriticalEnergyMode::TABULATED;
        else std::cerr << "Warning: Unknown e_crit_mode '" << mode << "'" << std::endl;
    }
    config.e_crit_seasonal_amplitude = getDouble("RUNAWAY", "seasonal_amplitude",
                                                 config.e_crit_seasonal_amplitude);
    config.e_crit_seasonal_period_days = getDouble("RUNAWAY", "seasonal_period_days",
                                                   config.e_crit_seasonal_period_days);
    config.e_crit_drift_per_year = getDouble("RUNAWAY", "drift_per_year",
                                             config.e_crit_drift_per_year);
    if (hasKey("RUNAWAY", "e_crit_series")) {
        config.e_crit_series = getDoubleArray("RUNAWAY", "e_crit_series");
    }

    // Forcing
    if (hasKey("FORCING", "mode")) {
        std::string mode = upper(getString("FORCING", "mode"));
        if (mode == "SYNTHETIC") config.forcing_mode = ForcingMode::SYNTHETIC;
        else if (mode == "REPLAY") config.forcing_mode = ForcingMode::REPLAY;
        else std::cerr << "Warning: Unknown forcing mode '" << mode << "'" << std::endl;
    }
    config.replay_file = getString("FORCING", "replay_file", config.replay_file);
    SyntheticForcingParams& syn = config.synthetic;
    syn.solar_flux = getDouble("FORCING", "solar_flux", syn.solar_flux);
    syn.solar_cycle_amplitude = getDouble("FORCING", "solar_cycle_amplitude",
                                          syn.solar_cycle_amplitude);
    syn.solar_cycle_years = getDouble("FORCING", "solar_cycle_years", syn.solar_cycle_years);
    syn.geomagnetic_index = getDouble("FORCING", "geomagnetic_index", syn.geomagnetic_index);
    syn.geomagnetic_trend = getDouble("FORCING", "geomagnetic_trend", syn.geomagnetic_trend);
    syn.thermospheric_density = getDouble("FORCING", "thermospheric_density",
                                          syn.thermospheric_density);
    syn.density_trend = getDouble("FORCING", "density_trend", syn.density_trend);
    syn.ocean_circulation = getDouble("FORCING", "ocean_circulation", syn.ocean_circulation);
    syn.ocean_trend = getDouble("FORCING", "ocean_trend", syn.ocean_trend);
    syn.debris_energy = getDouble("FORCING", "debris_energy", syn.debris_energy);
    syn.debris_trend = getDouble("FORCING", "debris_trend", syn.debris_trend);

    // Output
    config.output_prefix = getString("OUTPUT", "prefix", config.output_prefix);
    config.verbose = getBool("OUTPUT", "verbose", config.verbose);

    return any;
}

std::vector<PlanetaryBody> ConfigReader::parsePlanetaryBodies() const {
    std::vector<PlanetaryBody> bodies;
    const std::string prefix = "PLANETARY_BODY_";

    for (const auto& section : getSectionsMatching(prefix)) {
        PlanetaryBody body;
        body.name = getString(section, "name", lower(section.substr(prefix.size())));
        body.amplitude = getDouble(section, "amplitude", 0.0);
        body.period_days = getDouble(section, "period_days", 0.0);
        body.phase_rad = getDouble(section, "phase", 0.0);
        bodies.push_back(body);
    }

    return bodies;
}

bool ConfigReader::parseDistribution(const std::string& key, ParameterDistribution& dist) const {
    if (!hasKey("ENSEMBLE", key)) return false;

    std::vector<std::string> parts = getStringArray("ENSEMBLE", key);
    if (parts.empty()) return false;

    const std::string type = upper(parts[0]);
    std::vector<double> values;
    for (size_t i = 1; i < parts.size(); ++i) {
        try {
            values.push_back(std::stod(parts[i]));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << parts[i] << "' in [ENSEMBLE] "
                      << key << std::endl;
            return false;
        }
    }

    if (type == "FIXED" && values.size() >= 1) {
        dist = ParameterDistribution(DistributionType::FIXED, values[0], values[0], values[0]);
        return true;
    }
    if ((type == "UNIFORM" || type == "NORMAL") && values.size() == 3) {
        dist = ParameterDistribution(type == "UNIFORM" ? DistributionType::UNIFORM
                                                       : DistributionType::NORMAL,
                                     values[0], values[1], values[2]);
        return true;
    }

    std::cerr << "Warning: Invalid distribution for [ENSEMBLE] " << key
              << " (expected FIXED, mean or UNIFORM|NORMAL, mean, low, high)" << std::endl;
    return false;
}

bool ConfigReader::parseEnsembleConfig(EnsembleConfig& config) const {
    config.size = getInt("ENSEMBLE", "size", config.size);
    config.rng_seed = getUInt64("ENSEMBLE", "rng_seed", config.rng_seed);
    config.max_concurrency = getInt("ENSEMBLE", "max_concurrency", config.max_concurrency);
    config.keep_trajectories = getBool("ENSEMBLE", "keep_trajectories",
                                       config.keep_trajectories);
    config.progress_every = getInt("OUTPUT", "progress_every", config.progress_every);

    parseDistribution("dist_alpha_base", config.alpha_base);
    parseDistribution("dist_alpha_max", config.alpha_max);
    parseDistribution("dist_kappa", config.kappa);
    parseDistribution("dist_e_crit", config.e_crit);
    parseDistribution("dist_modulator_scale", config.modulator_scale);

    // seed_overrides = index:seed, index:seed
    for (const auto& entry : getStringArray("ENSEMBLE", "seed_overrides")) {
        size_t colon = entry.find(':');
        if (colon == std::string::npos) {
            std::cerr << "Warning: Invalid seed override '" << entry << "'" << std::endl;
            continue;
        }
        try {
            int idx = std::stoi(entry.substr(0, colon));
            std::uint64_t seed = std::stoull(entry.substr(colon + 1));
            config.seed_overrides[idx] = seed;
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid seed override '" << entry << "'" << std::endl;
        }
    }

    return hasSection("ENSEMBLE");
}

// =============================================================================
// Template Generation
// =============================================================================

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write template: " << filename << std::endl;
        return false;
    }
    writeTemplate(file);
    return file.good();
}

void ConfigReader::writeTemplate(std::ostream& file) {
    file << "# CEED Configuration File\n";
    file << "# Time in days, energies in model units\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[SIMULATION]\n";
    file << "n_steps = 365\n";
    file << "dt_days = 1.0\n";
    file << "# Seed energies (baseline totals split over the core subsystems)\n";
    file << "seed_solar = 45.0\n";
    file << "seed_magnetic = 23.125\n";
    file << "seed_atmospheric = 29.5\n";
    file << "seed_oceanic = 27.5\n";
    file << "seed_debris = 0.0\n";
    file << "energy_floor = 0.0                   # 0 = pure geometric decay\n";
    file << "zone_sum_tolerance = 1.0e-9\n\n";

    file << "[DECAY]\n";
    file << "# Collisional decay per step, must lie in [0, 1)\n";
    file << "solar = 0.05\n";
    file << "magnetic = 0.02\n";
    file << "atmospheric = 0.08\n";
    file << "oceanic = 0.01\n";
    file << "debris = 0.10\n\n";

    file << "[TOPOLOGY]\n";
    file << "# 4x4 row-major: POLAR, MID_LATITUDE, EQUATORIAL, OCEANIC\n";
    file << "zone_coupling = 0.0, 0.3, 0.05, 0.1, "
            "0.3, 0.0, 0.3, 0.2, "
            "0.05, 0.3, 0.0, 0.2, "
            "0.1, 0.2, 0.2, 0.0\n";
    file << "weights_solar = 0.2, 0.3, 0.5, 0.0\n";
    file << "weights_magnetic = 0.6, 0.3, 0.1, 0.0\n";
    file << "weights_atmospheric = 0.25, 0.35, 0.3, 0.1\n";
    file << "weights_oceanic = 0.05, 0.1, 0.15, 0.7\n";
    file << "weights_debris = 0.1, 0.4, 0.5, 0.0\n";
    file << "forcing_gain_solar = 0.02\n";
    file << "forcing_gain_magnetic = -0.005          # geomagnetic activity drains storage\n";
    file << "forcing_gain_atmospheric = 0.04\n";
    file << "forcing_gain_oceanic = 0.01\n";
    file << "forcing_gain_debris = 0.01\n";
    file << "diffusion_rate = 0.1\n\n";

    file << "[RETENTION]\n";
    file << "alpha_base = 1.0\n";
    file << "alpha_max = 1.1\n";
    file << "p_half = 1.0\n";
    file << "ceiling = 100.0\n";
    file << "safety_factor = 2.0                  # values bounded by ceiling * safety_factor\n";
    file << "collapse_sharpness = 4.0\n\n";

    file << "[RESONANCE]\n";
    file << "beta_solar = 0.01\n";
    file << "beta_magnetic = 0.01\n";
    file << "beta_atmospheric = 0.01\n";
    file << "beta_oceanic = 0.01\n";
    file << "beta_debris = 0.01\n";
    file << "period_solar = 4017.75                 # 11 years\n";
    file << "period_magnetic = 27.27\n";
    file << "period_atmospheric = 365.25\n";
    file << "period_oceanic = 23741.25              # 65 years\n";
    file << "period_debris = 4017.75\n\n";

    file << "[MODULATORS]\n";
    file << "enabled = none                        # lunar, planetary, solar_am, debris\n";
    file << "scale = 1.0\n";
    file << "lunar_sidereal_amplitude = 0.1\n";
    file << "lunar_sidereal_period_days = 27.3\n";
    file << "lunar_nodal_amplitude = 0.05\n";
    file << "lunar_nodal_period_days = 206.0\n";
    file << "solar_am_amplitudes = 0.03, 0.02\n";
    file << "solar_am_periods_years = 179.0, 60.0\n";
    file << "debris_gain = 0.05\n";
    file << "debris_half_energy = 10.0\n\n";

    file << "[PLANETARY_BODY_VENUS]\n";
    file << "amplitude = 0.005\n";
    file << "period_days = 224.70\n";
    file << "phase = 0.0\n\n";

    file << "[PLANETARY_BODY_JUPITER]\n";
    file << "amplitude = 0.02\n";
    file << "period_days = 4332.59\n";
    file << "phase = 0.0\n\n";

    file << "[PLANETARY_BODY_SATURN]\n";
    file << "amplitude = 0.01\n";
    file << "period_days = 10759.22\n";
    file << "phase = 0.0\n\n";

    file << "[NOISE]\n";
    file << "sigma = 0.5\n";
    file << "cutoff_period_days = 30.0\n";
    file << "distribution = GAUSSIAN              # GAUSSIAN or UNIFORM\n";
    file << "clip_sigmas = 4.0\n\n";

    file << "[PHASES]\n";
    file << "thresholds = 120.0, 150.0, 200.0, 300.0\n";
    file << "hysteresis = 0.0\n\n";

    file << "[RUNAWAY]\n";
    file << "kappa = 0.001\n";
    file << "e_crit = 300.0\n";
    file << "e_crit_mode = CONSTANT               # CONSTANT, SEASONAL, TABULATED\n";
    file << "seasonal_amplitude = 0.05\n";
    file << "seasonal_period_days = 365.25\n";
    file << "drift_per_year = 0.0\n";
    file << "e_crit_series =\n\n";

    file << "[FORCING]\n";
    file << "mode = SYNTHETIC                     # SYNTHETIC or REPLAY\n";
    file << "replay_file =\n";
    file << "solar_flux = 1.8                     # F10.7 / 100\n";
    file << "solar_cycle_amplitude = 0.3\n";
    file << "solar_cycle_years = 11.0\n";
    file << "geomagnetic_index = 3.0              # Kp\n";
    file << "geomagnetic_trend = 0.1              # fraction per year\n";
    file << "thermospheric_density = 1.0\n";
    file << "density_trend = 0.05\n";
    file << "ocean_circulation = 1.0\n";
    file << "ocean_trend = 0.02\n";
    file << "debris_energy = 1.0\n";
    file << "debris_trend = 0.1\n\n";

    file << "[ENSEMBLE]\n";
    file << "size = 64\n";
    file << "rng_seed = 20250701\n";
    file << "max_concurrency = 1                  # threads per rank, 0 = all cores\n";
    file << "keep_trajectories = false\n";
    file << "# dist_<param> = FIXED, value | UNIFORM|NORMAL, mean, low, high\n";
    file << "dist_alpha_base = UNIFORM, 1.0, 0.98, 1.02\n";
    file << "dist_alpha_max = UNIFORM, 1.1, 1.05, 1.15\n";
    file << "dist_kappa = NORMAL, 0.001, 0.0005, 0.0015\n";
    file << "dist_e_crit = NORMAL, 300.0, 270.0, 330.0\n";
    file << "dist_modulator_scale = UNIFORM, 1.0, 0.8, 1.2\n";
    file << "# seed_overrides = 3:12345\n\n";

    file << "[OUTPUT]\n";
    file << "prefix = ceed_output\n";
    file << "verbose = false\n";
    file << "progress_every = 0\n";
}

// =============================================================================
// Utility Methods
// =============================================================================

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& pair : data) {
        if (pair.first.find(prefix) == 0) {
            result.push_back(pair.first);
        }
    }
    return result;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Values from the merged file override existing ones
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto error = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    if (!hasSection("SIMULATION")) {
        result.warnings.push_back("No [SIMULATION] section found - using defaults");
    }

    for (const auto& section : getSections()) {
        bool known = section.find("PLANETARY_BODY_") == 0;
        for (const char* s : KNOWN_SECTIONS) {
            if (section == s) known = true;
        }
        if (!known) {
            result.warnings.push_back("Unknown section [" + section + "] ignored");
        }
    }

    if (hasKey("SIMULATION", "dt_days") && !(getDouble("SIMULATION", "dt_days", 1.0) > 0.0)) {
        error("dt_days must be positive");
    }
    if (getInt("SIMULATION", "n_steps", 0) < 0) {
        error("n_steps must be non-negative");
    }

    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        const std::string key = configKey(static_cast<Subsystem>(i));
        if (hasKey("DECAY", key)) {
            double lambda = getDouble("DECAY", key, 0.0);
            if (!(lambda >= 0.0 && lambda < 1.0)) {
                error("Decay for " + key + " must lie in [0, 1)");
            }
        }
    }

    if (hasKey("TOPOLOGY", "zone_coupling") &&
        getDoubleArray("TOPOLOGY", "zone_coupling").size() != NUM_ZONES * NUM_ZONES) {
        error("zone_coupling must have 16 values");
    }
    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        const std::string key = "weights_" + configKey(static_cast<Subsystem>(i));
        if (hasKey("TOPOLOGY", key) && getDoubleArray("TOPOLOGY", key).size() != NUM_ZONES) {
            error(key + " must have 4 values");
        }
    }

    if (hasSection("RETENTION")) {
        double base = getDouble("RETENTION", "alpha_base", 1.0);
        double max = getDouble("RETENTION", "alpha_max", 1.1);
        if (base < 0.0 || base > max) {
            error("Retention requires 0 <= alpha_base <= alpha_max");
        }
        if (getDouble("RETENTION", "safety_factor", 2.0) <= 1.0) {
            error("safety_factor must be greater than 1");
        }
        if (getDouble("RETENTION", "ceiling", 100.0) <= 0.0) {
            error("Retention ceiling must be positive");
        }
    }

    for (const auto& name : getStringArray("MODULATORS", "enabled")) {
        ModulatorType m;
        if (!parseModulatorType(name, m) && lower(name) != "none") {
            error("Unknown modulator '" + name + "'");
        }
    }

    if (hasKey("PHASES", "thresholds")) {
        std::vector<double> t = getDoubleArray("PHASES", "thresholds");
        if (t.size() != NUM_THRESHOLDS) {
            error("[PHASES] thresholds needs exactly 4 values");
        } else if (!std::is_sorted(t.begin(), t.end()) ||
                   std::adjacent_find(t.begin(), t.end()) != t.end()) {
            error("[PHASES] thresholds must be strictly increasing");
        }
    }
    if (getDouble("PHASES", "hysteresis", 0.0) < 0.0) {
        error("[PHASES] hysteresis must be non-negative");
    }

    if (getDouble("NOISE", "sigma", 0.0) < 0.0) {
        error("[NOISE] sigma must be non-negative");
    }
    if (hasKey("NOISE", "distribution")) {
        std::string dist = upper(getString("NOISE", "distribution"));
        if (dist != "GAUSSIAN" && dist != "NORMAL" && dist != "UNIFORM") {
            error("Unknown noise distribution '" + dist + "'");
        }
    }

    if (getDouble("RUNAWAY", "kappa", 0.0) < 0.0) {
        error("[RUNAWAY] kappa must be non-negative");
    }
    if (hasKey("RUNAWAY", "e_crit_mode")) {
        std::string mode = upper(getString("RUNAWAY", "e_crit_mode"));
        if (mode != "CONSTANT" && mode != "SEASONAL" && mode != "TABULATED") {
            error("Unknown e_crit_mode '" + mode + "'");
        } else if (mode == "TABULATED" && getDoubleArray("RUNAWAY", "e_crit_series").empty()) {
            error("TABULATED e_crit_mode requires e_crit_series");
        }
    }

    if (hasKey("FORCING", "mode")) {
        std::string mode = upper(getString("FORCING", "mode"));
        if (mode != "SYNTHETIC" && mode != "REPLAY") {
            error("Unknown forcing mode '" + mode + "'");
        } else if (mode == "REPLAY" && getString("FORCING", "replay_file").empty()) {
            error("REPLAY forcing requires replay_file");
        }
    }

    if (hasSection("ENSEMBLE")) {
        if (getInt("ENSEMBLE", "size", 1) < 1) {
            error("[ENSEMBLE] size must be at least 1");
        }
        if (getInt("ENSEMBLE", "max_concurrency", 1) < 0) {
            error("[ENSEMBLE] max_concurrency must be non-negative");
        }
        for (const char* param : DISTRIBUTION_PARAMS) {
            const std::string key = std::string("dist_") + param;
            if (!hasKey("ENSEMBLE", key)) continue;
            ParameterDistribution dist;
            if (!parseDistribution(key, dist)) {
                error("Invalid distribution for " + key);
            } else if (dist.low > dist.high) {
                error("Distribution " + key + " has low > high");
            }
        }
    } else {
        result.warnings.push_back("No [ENSEMBLE] section found - using defaults");
    }

    return result;
}

} // namespace CEED
