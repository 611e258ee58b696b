#include "TrajectoryIO.hpp"
#include "MonteCarloDriver.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace CEED {
namespace TrajectoryIO {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> splitCSV(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) {
        fields.push_back(trim(item));
    }
    return fields;
}

template<typename Writer>
bool writeFile(const std::string& filename, Writer writer) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open file for writing: " << filename << std::endl;
        return false;
    }
    writer(file);
    return file.good();
}

} // namespace

// =============================================================================
// Trajectory export
// =============================================================================

void writeTrajectoryCSV(const Trajectory& trajectory, std::ostream& os) {
    os << "step,time_days";
    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        os << ",E_" << configKey(static_cast<Subsystem>(i));
    }
    for (size_t z = 0; z < NUM_ZONES; ++z) {
        os << ",Z_" << configKey(static_cast<Zone>(z));
    }
    os << ",E_total,phase,runaway_probability,e_crit,buffer_capacity\n";

    os << std::fixed << std::setprecision(17);
    for (const auto& p : trajectory.points()) {
        const EnergyState& s = p.state;
        os << s.step << "," << s.time_days;
        for (double e : s.subsystem_energy) os << "," << e;
        for (double z : s.zone_energy) os << "," << z;
        os << "," << s.totalEnergy()
           << "," << toString(p.phase)
           << "," << p.runaway_probability
           << "," << p.critical_energy
           << "," << s.buffer_capacity << "\n";
    }
}

bool writeTrajectoryCSV(const Trajectory& trajectory, const std::string& filename) {
    return writeFile(filename, [&](std::ostream& os) { writeTrajectoryCSV(trajectory, os); });
}

void writeRunLog(const Trajectory& trajectory, const RunConfig& config, std::ostream& os) {
    os << "# CEED run log\n";
    os << "status = " << toString(trajectory.status()) << "\n";
    os << "points = " << trajectory.size() << "\n";
    os << "n_steps = " << config.n_steps << "\n";
    os << "dt_days = " << config.dt_days << "\n";

    if (trajectory.status() == RunStatus::INVALID) {
        const DivergenceRecord& r = trajectory.divergence();
        os << "divergence_step = " << r.step << "\n";
        if (r.subsystem >= 0) {
            os << "divergence_subsystem = " << toString(static_cast<Subsystem>(r.subsystem)) << "\n";
        }
        if (r.zone >= 0) {
            os << "divergence_zone = " << toString(static_cast<Zone>(r.zone)) << "\n";
        }
        os << "divergence_value = " << r.value << "\n";
        os << "divergence_cause = " << r.describe() << "\n";
    } else if (trajectory.status() == RunStatus::CANCELLED) {
        os << "cancelled_step = " << trajectory.cancelledAtStep() << "\n";
    }

    if (!trajectory.empty()) {
        const TrajectoryPoint& last = trajectory.back();
        os << "final_step = " << last.state.step << "\n";
        os << "final_total_energy = " << last.state.totalEnergy() << "\n";
        os << "final_phase = " << toString(last.phase) << "\n";
        os << "final_runaway_probability = " << last.runaway_probability << "\n";
        os << "final_buffer_capacity = " << last.state.buffer_capacity << "\n";
        for (size_t k = 0; k < NUM_PHASES; ++k) {
            os << "occupancy_" << toString(static_cast<Phase>(k)) << " = "
               << last.state.phase_occupancy[k] << "\n";
        }
    }

    os << "modulators =";
    for (ModulatorType m : config.modulators_enabled) os << " " << configKey(m);
    os << "\n";
}

bool writeRunLog(const Trajectory& trajectory, const RunConfig& config,
                 const std::string& filename) {
    return writeFile(filename, [&](std::ostream& os) { writeRunLog(trajectory, config, os); });
}

// =============================================================================
// Ensemble export
// =============================================================================

void writeEnsembleBandsCSV(const EnsembleResult& result, std::ostream& os) {
    os << "step,time_days,mean,p5,p25,p50,p75,p95\n";
    os << std::fixed << std::setprecision(17);
    for (size_t s = 0; s < result.total_energy_bands.size(); ++s) {
        const PercentileBand& b = result.total_energy_bands[s];
        os << s << "," << s * result.dt_days
           << "," << b.mean << "," << b.p5 << "," << b.p25
           << "," << b.p50 << "," << b.p75 << "," << b.p95 << "\n";
    }
}

bool writeEnsembleBandsCSV(const EnsembleResult& result, const std::string& filename) {
    return writeFile(filename, [&](std::ostream& os) { writeEnsembleBandsCSV(result, os); });
}

void writeEnsembleSummary(const EnsembleResult& result, std::ostream& os) {
    os << "CEED ensemble summary\n";
    os << "=====================\n\n";
    os << "Members:   " << result.n_members << "\n";
    os << "Valid:     " << result.n_valid << "\n";
    os << "Invalid:   " << result.n_invalid << "\n";
    os << "Cancelled: " << result.n_cancelled << "\n";
    os << "Steps:     " << result.n_steps << " x " << result.dt_days << " d\n\n";

    os << std::fixed << std::setprecision(4);

    if (!result.total_energy_bands.empty()) {
        const PercentileBand& b = result.total_energy_bands.back();
        os << "Final total energy\n";
        os << "  mean " << b.mean << "  P5 " << b.p5 << "  P50 " << b.p50
           << "  P95 " << b.p95 << "\n\n";
    }

    os << "Phase crossings (days)\n";
    for (size_t p = 1; p < NUM_PHASES; ++p) {
        const PhaseCrossingStatistics& c = result.phase_crossing[p];
        os << "  " << std::left << std::setw(14) << toString(static_cast<Phase>(p))
           << std::right << " reached " << c.fraction_reached;
        if (c.count > 0) {
            os << "  mean " << c.mean_days << "  P10 " << c.p10_days
               << "  P50 " << c.p50_days << "  P90 " << c.p90_days;
        }
        os << "\n";
    }

    os << "\nFinal phase counts\n";
    for (size_t p = 0; p < NUM_PHASES; ++p) {
        os << "  " << std::left << std::setw(14) << toString(static_cast<Phase>(p))
           << std::right << " " << result.final_phase_counts[p] << "\n";
    }

    os << "\nThreshold exceedance (final state)\n";
    for (size_t k = 0; k < NUM_THRESHOLDS; ++k) {
        os << "  E_total >= " << result.thresholds[k] << ": "
           << result.threshold_exceedance[k] << "\n";
    }

    const SummaryStatistics& r = result.final_runaway;
    os << "\nFinal runaway probability\n";
    os << "  mean " << r.mean << "  median " << r.median
       << "  95% [" << r.ci_lower_95 << ", " << r.ci_upper_95 << "]"
       << "  std " << r.std_dev << "\n";
    os << "  histogram:";
    for (int c : result.runaway_histogram) os << " " << c;
    os << "\n";
}

bool writeEnsembleSummary(const EnsembleResult& result, const std::string& filename) {
    return writeFile(filename, [&](std::ostream& os) { writeEnsembleSummary(result, os); });
}

void writeMemberTable(const EnsembleResult& result, std::ostream& os) {
    os << "index,seed,status,alpha_base,alpha_max,kappa,e_crit,modulator_scale,"
          "final_total,final_phase,final_runaway,failure\n";
    os << std::setprecision(10);
    for (const auto& m : result.members) {
        os << m.index << "," << m.seed << "," << toString(m.status)
           << "," << m.params.alpha_base << "," << m.params.alpha_max
           << "," << m.params.kappa << "," << m.params.e_crit
           << "," << m.params.modulator_scale
           << "," << (m.total_energy.empty() ? 0.0 : m.total_energy.back())
           << "," << toString(m.final_phase)
           << "," << m.final_runaway
           << ",\"" << m.failure_cause << "\"\n";
    }
}

bool writeMemberTable(const EnsembleResult& result, const std::string& filename) {
    return writeFile(filename, [&](std::ostream& os) { writeMemberTable(result, os); });
}

bool writeRunOutputs(const Trajectory& trajectory, const RunConfig& config) {
    const std::string& prefix = config.output_prefix;
    bool ok = writeTrajectoryCSV(trajectory, prefix + "_trajectory.csv");
    ok = writeRunLog(trajectory, config, prefix + "_run.log") && ok;
    return ok;
}

bool writeEnsembleOutputs(const EnsembleResult& result, const std::string& prefix) {
    bool ok = writeEnsembleBandsCSV(result, prefix + "_bands.csv");
    ok = writeEnsembleSummary(result, prefix + "_summary.txt") && ok;
    ok = writeMemberTable(result, prefix + "_members.csv") && ok;
    for (const auto& entry : result.trajectories) {
        ok = writeTrajectoryCSV(entry.second,
                                prefix + "_member" + std::to_string(entry.first) + ".csv") && ok;
    }
    return ok;
}

// =============================================================================
// Forcing series import
// =============================================================================

std::vector<ForcingSample> parseForcingSeries(std::istream& is) {
    std::vector<ForcingSample> samples;
    std::vector<std::string> columns;
    std::string line;
    int line_number = 0;

    while (std::getline(is, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::vector<std::string> fields = splitCSV(line);
        if (columns.empty()) {
            columns = fields;
            for (const char* required : {"time_days", "solar_flux", "geomagnetic_index",
                                         "thermospheric_density", "ocean_circulation"}) {
                if (std::find(columns.begin(), columns.end(), required) == columns.end()) {
                    throw std::runtime_error(std::string("Forcing series missing column: ") +
                                             required);
                }
            }
            continue;
        }

        if (fields.size() != columns.size()) {
            throw std::runtime_error("Forcing series line " + std::to_string(line_number) +
                                     ": expected " + std::to_string(columns.size()) +
                                     " fields, got " + std::to_string(fields.size()));
        }

        ForcingSample s;
        for (size_t c = 0; c < columns.size(); ++c) {
            double v;
            try {
                v = std::stod(fields[c]);
            } catch (const std::exception&) {
                throw std::runtime_error("Forcing series line " + std::to_string(line_number) +
                                         ": invalid number '" + fields[c] + "'");
            }

            const std::string& col = columns[c];
            if (col == "time_days") s.time_days = v;
            else if (col == "solar_flux") s.solar_flux = v;
            else if (col == "geomagnetic_index") s.geomagnetic_index = v;
            else if (col == "thermospheric_density") s.thermospheric_density = v;
            else if (col == "ocean_circulation") s.ocean_circulation = v;
            else if (col == "debris_energy") s.debris_energy = v;
            else if (col.compare(0, 4, "mod_") == 0) s.modulation_terms[col.substr(4)] = v;
        }
        samples.push_back(std::move(s));
    }

    return samples;
}

std::vector<ForcingSample> loadForcingSeries(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open forcing series: " + filename);
    }
    return parseForcingSeries(file);
}

} // namespace TrajectoryIO
} // namespace CEED
