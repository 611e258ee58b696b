#ifndef TRAJECTORY_IO_HPP
#define TRAJECTORY_IO_HPP

#include "CEED.hpp"
#include "EnergyState.hpp"
#include "ForcingSource.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace CEED {

struct EnsembleResult;

/**
 * @brief Text export of runs and ensembles, and forcing-series import
 *
 * Trajectory CSV columns:
 *   step,time_days,E_solar,E_magnetic,E_atmospheric,E_oceanic,E_debris,
 *   Z_polar,Z_mid_latitude,Z_equatorial,Z_oceanic,E_total,phase,
 *   runaway_probability,e_crit,buffer_capacity
 *
 * Floating-point values are written in fixed notation with 17 digits so
 * identical runs produce byte-identical files.
 */
namespace TrajectoryIO {

void writeTrajectoryCSV(const Trajectory& trajectory, std::ostream& os);
bool writeTrajectoryCSV(const Trajectory& trajectory, const std::string& filename);

// key = value record of status, divergence cause and run parameters
void writeRunLog(const Trajectory& trajectory, const RunConfig& config, std::ostream& os);
bool writeRunLog(const Trajectory& trajectory, const RunConfig& config,
                 const std::string& filename);

void writeEnsembleBandsCSV(const EnsembleResult& result, std::ostream& os);
bool writeEnsembleBandsCSV(const EnsembleResult& result, const std::string& filename);

void writeEnsembleSummary(const EnsembleResult& result, std::ostream& os);
bool writeEnsembleSummary(const EnsembleResult& result, const std::string& filename);

void writeMemberTable(const EnsembleResult& result, std::ostream& os);
bool writeMemberTable(const EnsembleResult& result, const std::string& filename);

// <prefix>_trajectory.csv and <prefix>_run.log; false if either write fails
bool writeRunOutputs(const Trajectory& trajectory, const RunConfig& config);

/**
 * @brief Write <prefix>_bands.csv, _summary.txt, _members.csv and one
 * _member<i>.csv per kept trajectory
 *
 * Every file is attempted. Returns false if any of them failed.
 */
bool writeEnsembleOutputs(const EnsembleResult& result, const std::string& prefix);

/**
 * @brief Parse a forcing series
 *
 * Header line required; columns time_days, solar_flux, geomagnetic_index,
 * thermospheric_density, ocean_circulation, debris_energy (debris optional).
 * Additional columns named mod_<modulator> become modulation overrides.
 * Blank lines and lines starting with '#' are skipped.
 */
std::vector<ForcingSample> parseForcingSeries(std::istream& is);

// Throws std::runtime_error if the file cannot be opened or parsed
std::vector<ForcingSample> loadForcingSeries(const std::string& filename);

} // namespace TrajectoryIO

} // namespace CEED

#endif // TRAJECTORY_IO_HPP
