/*
 *   afqmc_driver.h
 *
 *     Created on: Jun 14, 2025
 *
 */

#pragma once
#ifndef AFQMC_DRIVER_H
#define AFQMC_DRIVER_H

#include <chrono>
#include <memory>
#include <cstddef>
#include <boost/mpi/communicator.hpp>

#include "afqmc_params.hpp"
#include "square_lattice.h"
#include "hubbard.h"
#include "trial_wavefunction.h"
#include "population.h"
#include "population_controller.h"
#include "propagator.h"
#include "estimator_handle.h"
#include "random.h"

namespace AFQMC {

    // -----------------------------------------------  AFQMC::Driver  ----------------------------------------------------
    //
    //  Owner of all modules of one simulation, with the lifecycle
    //
    //      Driver(params, world)  ->  run()  ->  finalize() ,
    //
    //  run() performs nsteps propagation steps of the population, with re-orthonormalization every nstblz steps,
    //  population control every npop_control steps, measurements every nmeasure steps,
    //  and the update of the energy shift every nupdate_shift steps.
    //
    class Driver {
        public:
            enum class State { Uninitialized, Running, Completed, Finalized };

            using Lattice = ::Lattice::SquareLattice;
            using Hubbard = ::Model::Hubbard;
            using TrialWavefunction = ::Trial::Wavefunction;
            using EstimatorHandle = ::Estimator::Handle;
            using communicator = boost::mpi::communicator;

            Driver(const Params& params, const communicator& world);

            // the propagator refers to the model and trial owned by the driver
            Driver(const Driver&) = delete;
            Driver& operator=(const Driver&) = delete;

            // ------------------------------------------  Lifecycle  ------------------------------------------------------
            void run();
            void finalize();

            // --------------------------------------  Progress bar and timer  ---------------------------------------------
            // only the master process displays the progress bar
            static void show_progress_bar(bool show_progress_bar);
            static void progress_bar_format(unsigned int width, char complete, char incomplete);
            static void set_refresh_rate(unsigned int refresh_rate);

            // duration of run() in milliseconds
            double timer() const;

            // ---------------------------------------------  Interfaces  --------------------------------------------------
            State state() const { return this->m_state; }
            const Params& params() const { return this->m_params; }
            const Lattice& lattice() const { return this->m_lattice; }
            const Hubbard& model() const { return this->m_model; }
            const TrialWavefunction& trial() const { return this->m_trial; }
            const Population& population() const { return this->m_population; }
            const EstimatorHandle& handle() const { return this->m_handle; }
            const Utils::Random& rng() const { return this->m_rng; }

            double energy_shift() const { return this->m_eshift; }
            int steps_done() const { return this->m_nsteps_done; }
            int population_control_calls() const { return this->m_controller.calls(); }
            int measure_calls() const { return this->m_handle.measure_calls(); }
            std::size_t local_kills() const { return this->m_propagator->kills(); }

            // kills summed over all processes, a collective call after run()
            std::size_t total_kills() const { return this->m_total_kills; }

        private:
            // one step of the main loop
            void step(const int istep);

            static bool m_show_progress_bar;
            static unsigned int m_progress_bar_width;
            static unsigned int m_refresh_rate;
            static char m_progress_bar_complete_char, m_progress_bar_incomplete_char;

            Params m_params{};
            communicator m_world{};
            State m_state{State::Uninitialized};

            Lattice m_lattice{};
            Hubbard m_model{};
            TrialWavefunction m_trial{};
            Utils::Random m_rng{};
            std::unique_ptr<Propagator> m_propagator{};
            Population m_population{};
            PopulationController m_controller{};
            EstimatorHandle m_handle{};

            double m_eshift{};
            int m_nsteps_done{};
            std::size_t m_total_kills{};
            std::chrono::steady_clock::time_point m_begin_time{}, m_end_time{};
    };
}

#endif
