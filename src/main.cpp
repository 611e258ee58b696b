#include "CEED.hpp"
#include "ConfigReader.hpp"
#include "ConvergenceEngine.hpp"
#include "ForcingSource.hpp"
#include "MonteCarloDriver.hpp"
#include "TrajectoryIO.hpp"
#include <petsc.h>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

static char help[] = "CEED - Coupled Energy Evolution and Divergence simulator\n"
                    "Usage: ceed [options]\n\n"
                    "Options:\n"
                    "  -c <file>            Configuration file (.config)\n"
                    "  -o <prefix>          Output file prefix\n"
                    "  -mode <type>         single or ensemble (default: ensemble)\n"
                    "  -members <n>         Ensemble size\n"
                    "  -steps <n>           Number of time steps\n"
                    "  -seed <n>            Base seed (overrides [ENSEMBLE] rng_seed)\n"
                    "  -threads <n>         Worker threads per rank (0 = all cores)\n"
                    "  -forcing <file>      Replay a recorded forcing series\n"
                    "  -verbose             Report every failed member\n\n"
                    "Examples:\n"
                    "  # Ensemble forecast from a configuration file\n"
                    "  mpirun -np 4 ceed -c config/baseline.config -o output/baseline\n\n"
                    "  # Single deterministic run\n"
                    "  ceed -c config/baseline.config -mode single -seed 7\n\n"
                    "  # Generate template configuration\n"
                    "  ceed -generate_config my_config.config\n\n";

// Rank 0 writes; every rank learns whether the files were written
static PetscErrorCode shareWriteStatus(MPI_Comm comm, bool written_on_root, bool& written) {
    PetscErrorCode ierr;
    PetscFunctionBeginUser;

    int flag = written_on_root ? 1 : 0;
    ierr = MPI_Bcast(&flag, 1, MPI_INT, 0, comm); CHKERRMPI(ierr);
    written = flag != 0;

    PetscFunctionReturn(0);
}

static PetscErrorCode runSingle(MPI_Comm comm, int rank, const CEED::RunConfig& config,
                                std::uint64_t seed, bool& written) {
    PetscErrorCode ierr;
    PetscFunctionBeginUser;

    CEED::ConvergenceEngine engine(config);
    std::unique_ptr<CEED::ForcingSource> forcing = CEED::createForcingSource(config);

    double start_time = MPI_Wtime();
    CEED::Trajectory trajectory = engine.run(config.n_steps, *forcing, seed);
    double end_time = MPI_Wtime();

    const CEED::TrajectoryPoint& last = trajectory.back();
    ierr = PetscPrintf(comm, "Run %s after %d step(s) (%.3f s)\n",
                       CEED::toString(trajectory.status()).c_str(),
                       last.state.step, end_time - start_time); CHKERRQ(ierr);
    ierr = PetscPrintf(comm, "  Final total energy:   %.6f\n",
                       last.state.totalEnergy()); CHKERRQ(ierr);
    ierr = PetscPrintf(comm, "  Final phase:          %s\n",
                       CEED::toString(last.phase).c_str()); CHKERRQ(ierr);
    ierr = PetscPrintf(comm, "  Runaway probability:  %.6f\n",
                       last.runaway_probability); CHKERRQ(ierr);
    if (trajectory.status() == CEED::RunStatus::INVALID) {
        ierr = PetscPrintf(comm, "  Divergence:           %s\n",
                           trajectory.divergence().describe().c_str()); CHKERRQ(ierr);
    }

    bool ok = true;
    if (rank == 0) {
        ok = CEED::TrajectoryIO::writeRunOutputs(trajectory, config);
    }
    ierr = shareWriteStatus(comm, ok, written); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

static PetscErrorCode runEnsemble(MPI_Comm comm, int rank, const CEED::RunConfig& config,
                                  const CEED::EnsembleConfig& ensemble, bool& written) {
    PetscErrorCode ierr;
    PetscFunctionBeginUser;

    std::unique_ptr<CEED::ForcingSource> forcing = CEED::createForcingSource(config);
    CEED::MonteCarloDriver driver(comm, config, ensemble, *forcing);

    CEED::EnsembleResult result;
    ierr = driver.runEnsemble(ensemble.size, result); CHKERRQ(ierr);

    if (!result.total_energy_bands.empty()) {
        const CEED::PercentileBand& b = result.total_energy_bands.back();
        ierr = PetscPrintf(comm, "  Final total energy:   mean %.4f  P5 %.4f  P95 %.4f\n",
                           b.mean, b.p5, b.p95); CHKERRQ(ierr);
    }
    ierr = PetscPrintf(comm, "  Cascade reached by:   %.1f%% of valid members\n",
                       100.0 * result.phase_crossing[CEED::index(CEED::Phase::CASCADE)]
                           .fraction_reached); CHKERRQ(ierr);
    ierr = PetscPrintf(comm, "  Runaway probability:  mean %.4f  95%% [%.4f, %.4f]\n",
                       result.final_runaway.mean, result.final_runaway.ci_lower_95,
                       result.final_runaway.ci_upper_95); CHKERRQ(ierr);

    bool ok = true;
    if (rank == 0) {
        ok = CEED::TrajectoryIO::writeEnsembleOutputs(result, config.output_prefix);
    }
    ierr = shareWriteStatus(comm, ok, written); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                if (CEED::ConfigReader::generateTemplate(generate_config)) {
                    PetscPrintf(PETSC_COMM_SELF, "Configuration template written to: %s\n",
                                generate_config);
                }
            }
            ierr = PetscFinalize();
            return 0;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "";
        char forcing_file[PETSC_MAX_PATH_LEN] = "";
        char mode[64] = "ensemble";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool forcing_provided = PETSC_FALSE;
        PetscBool members_set = PETSC_FALSE, steps_set = PETSC_FALSE;
        PetscBool seed_set = PETSC_FALSE, threads_set = PETSC_FALSE;
        PetscBool verbose = PETSC_FALSE;
        PetscInt members = 0, steps = 0, seed = 0, threads = 0;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-forcing", forcing_file,
                                     sizeof(forcing_file), &forcing_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-mode", mode,
                                     sizeof(mode), nullptr); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-members", &members, &members_set); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-steps", &steps, &steps_set); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-seed", &seed, &seed_set); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-threads", &threads, &threads_set); CHKERRQ(ierr);
        ierr = PetscOptionsHasName(nullptr, nullptr, "-verbose", &verbose); CHKERRQ(ierr);

        const bool single = std::strcmp(mode, "single") == 0;
        if (!single && std::strcmp(mode, "ensemble") != 0) {
            PetscPrintf(comm, "Error: Unknown mode '%s' (expected single or ensemble)\n", mode);
            ierr = PetscFinalize();
            return 1;
        }

        CEED::RunConfig config;
        CEED::EnsembleConfig ensemble;

        if (config_provided) {
            CEED::ConfigReader reader;
            if (!reader.loadFile(config_file)) {
                PetscPrintf(comm, "Error: Cannot read configuration file %s\n", config_file);
                ierr = PetscFinalize();
                return 1;
            }

            CEED::ConfigReader::ValidationResult check = reader.validate();
            if (rank == 0) {
                for (const auto& w : check.warnings) {
                    PetscPrintf(PETSC_COMM_SELF, "Warning: %s\n", w.c_str());
                }
                for (const auto& e : check.errors) {
                    PetscPrintf(PETSC_COMM_SELF, "Error: %s\n", e.c_str());
                }
            }
            if (!check.valid) {
                ierr = PetscFinalize();
                return 1;
            }

            reader.parseRunConfig(config);
            reader.parseEnsembleConfig(ensemble);
        }

        // Command-line overrides
        if (output_provided) config.output_prefix = output_prefix;
        if (forcing_provided) {
            config.forcing_mode = CEED::ForcingMode::REPLAY;
            config.replay_file = forcing_file;
        }
        if (steps_set) config.n_steps = static_cast<int>(steps);
        if (members_set) ensemble.size = static_cast<int>(members);
        if (threads_set) ensemble.max_concurrency = static_cast<int>(threads);
        if (seed_set) ensemble.rng_seed = static_cast<std::uint64_t>(seed);
        if (verbose) config.verbose = true;

        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "  CEED - Coupled Energy Evolution and Divergence\n");
        PetscPrintf(comm, "  Version 1.0.0\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "\n");
        if (config_provided) {
            PetscPrintf(comm, "Config file:   %s\n", config_file);
        }
        PetscPrintf(comm, "Mode:          %s\n", mode);
        PetscPrintf(comm, "Steps:         %d x %g d\n", config.n_steps, config.dt_days);
        if (!single) {
            PetscPrintf(comm, "Members:       %d\n", ensemble.size);
        }
        PetscPrintf(comm, "Output prefix: %s\n", config.output_prefix.c_str());
        PetscPrintf(comm, "\n");

        try {
            bool written = false;
            if (single) {
                // [ENSEMBLE] rng_seed, or -seed when given
                ierr = runSingle(comm, rank, config, ensemble.rng_seed, written); CHKERRQ(ierr);
            } else {
                ierr = runEnsemble(comm, rank, config, ensemble, written); CHKERRQ(ierr);
            }

            if (!written) {
                PetscPrintf(comm, "\nError: Could not write output files to %s_*\n",
                            config.output_prefix.c_str());
                ierr = PetscFinalize();
                return 1;
            }

            PetscPrintf(comm, "\nOutput files written to: %s_*\n", config.output_prefix.c_str());
            PetscPrintf(comm, "============================================================\n");

        } catch (const CEED::ConfigurationError& e) {
            PetscPrintf(comm, "\nConfiguration error: %s\n", e.what());
            ierr = PetscFinalize();
            return 1;
        } catch (const CEED::EnsembleFailure& e) {
            PetscPrintf(comm, "\nEnsemble failed: %s\n", e.what());
            ierr = PetscFinalize();
            return 2;
        } catch (const std::exception& e) {
            PetscPrintf(comm, "\nError: %s\n", e.what());
            ierr = PetscFinalize();
            return 1;
        }
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return 0;
}
