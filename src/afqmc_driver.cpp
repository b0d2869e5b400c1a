/*
 *   afqmc_driver.cpp
 *
 *     Created on: Jun 14, 2025
 *
 */

#include "afqmc_driver.h"

#include <iostream>
#include <stdexcept>
#include <functional>
#include <boost/format.hpp>
#include <boost/mpi.hpp>
#include <progresscpp/ProgressBar.hpp>

namespace AFQMC {

    // definitions of the static members
    bool Driver::m_show_progress_bar{true};
    unsigned int Driver::m_progress_bar_width{70};
    unsigned int Driver::m_refresh_rate{10};
    char Driver::m_progress_bar_complete_char{'='}, Driver::m_progress_bar_incomplete_char{' '};

    // set up whether to show the process bar or not
    void Driver::show_progress_bar(bool show_progress_bar) { Driver::m_show_progress_bar = show_progress_bar; }

    // set up the format of the progress bar
    void Driver::progress_bar_format(unsigned int width, char complete, char incomplete)
    {
        Driver::m_progress_bar_width = width;
        Driver::m_progress_bar_complete_char = complete;
        Driver::m_progress_bar_incomplete_char = incomplete;
    }

    // set up the rate of refreshing the progress bar
    void Driver::set_refresh_rate(unsigned int refresh_rate)
    {
        if (refresh_rate == 0) {
            throw std::invalid_argument("AFQMC::Driver::set_refresh_rate(): refresh rate should be positive.");
        }
        Driver::m_refresh_rate = refresh_rate;
    }

    double Driver::timer() const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(this->m_end_time - this->m_begin_time).count();
    }

    // ------------------------------------------------------------------------------------------
    //
    //                                     Construction
    //
    // ------------------------------------------------------------------------------------------
    Driver::Driver(const Params& params, const communicator& world)
        : m_params(params), m_world(world)
    {
        // the parameters may come from elsewhere than the parser
        auto positive = [](const int value, const char* name) {
            if (value <= 0) {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Driver::Driver(): '%s' should be positive, got %d.") % name % value)
                );
            }
        };
        positive(this->m_params.nx, "nx");
        positive(this->m_params.ny, "ny");
        positive(this->m_params.nwalkers, "nwalkers");
        positive(this->m_params.nmeasure, "nmeasure");
        positive(this->m_params.npop_control, "npop_control");
        positive(this->m_params.nstblz, "nstblz");
        positive(this->m_params.nupdate_shift, "nupdate_shift");
        if (this->m_params.nsteps < 0) {
            throw std::runtime_error("AFQMC::Driver::Driver(): negative number of steps 'nsteps'.");
        }
        if (!(this->m_params.energy_bound > 0.0)) {
            throw std::runtime_error("AFQMC::Driver::Driver(): 'energy_bound' should be positive.");
        }
        this->m_params.ns = this->m_params.nx * this->m_params.ny;
        if (this->m_params.nup > this->m_params.ns || this->m_params.ndown > this->m_params.ns) {
            throw std::runtime_error(
                boost::str(boost::format("AFQMC::Driver::Driver(): particle numbers (%d,%d) exceed the %d lattice sites.")
                    % this->m_params.nup % this->m_params.ndown % this->m_params.ns)
            );
        }

        // random stream of the current process
        const auto seed = this->m_params.has_rng_seed?
            Utils::Random::process_seed(this->m_world, this->m_params.rng_seed) :
            Utils::Random::process_seed(this->m_world);
        this->m_rng.set_seed(seed);

        // initialize the modules, NOTE: the orders are important.
        this->m_lattice.initialize(this->m_params);
        this->m_model.initialize(this->m_params, this->m_lattice);
        if (this->m_world.size() > 1) {
            this->m_trial.initialize_distributed(this->m_params, this->m_model, this->m_rng, this->m_world);
        }
        else {
            this->m_trial.initialize(this->m_params, this->m_model, this->m_rng);
        }
        this->m_handle.initialize(this->m_params);
        this->m_propagator = std::make_unique<Propagator>(this->m_model, this->m_trial,
                                                          this->m_params.energy_bound, this->m_params.nstblz,
                                                          weight_update_from_string(this->m_params.weight_update));
        this->m_population.initialize(this->m_params.nwalkers, this->m_trial, this->m_model, this->m_handle.history_capacity());

        this->m_eshift = this->m_trial.energy();
        this->m_state = State::Running;
    }

    // ------------------------------------------------------------------------------------------
    //
    //                                  Main loop of the simulation
    //
    // ------------------------------------------------------------------------------------------
    void Driver::run()
    {
        if (this->m_state != State::Running) {
            throw std::logic_error("AFQMC::Driver::run(): the simulation has already been run or was never initialized.");
        }

        const int master = 0;
        const bool show_bar = Driver::m_show_progress_bar && (this->m_world.rank() == master) && (this->m_params.nsteps > 0);

        // create the progress bar
        progresscpp::ProgressBar progressbar(this->m_params.nsteps,                // total loops
                                             Driver::m_progress_bar_width,          // bar width
                                             Driver::m_progress_bar_complete_char,  // complete character
                                             Driver::m_progress_bar_incomplete_char // incomplete character
                                            );
        // display the progress bar
        if (show_bar) { std::cout << ">> Propagating "; progressbar.display(); }

        this->m_begin_time = std::chrono::steady_clock::now();
        this->m_propagator->reset_kills();
        for (int istep = 1; istep <= this->m_params.nsteps; ++istep) {
            this->step(istep);

            // record the tick
            ++progressbar;
            if (show_bar && (istep % Driver::m_refresh_rate == 0)) {
                std::cout << ">> Propagating "; progressbar.display();
            }
        }
        this->m_end_time = std::chrono::steady_clock::now();

        // progress bar finish
        if (show_bar) { std::cout << ">> Propagating "; progressbar.done(); }

        this->m_total_kills = boost::mpi::all_reduce(this->m_world, this->m_propagator->kills(), std::plus<std::size_t>());
        this->m_state = State::Completed;
    }

    void Driver::step(const int istep)
    {
        // propagate every walker by one step
        for (auto& walker : this->m_population) {
            this->m_propagator->advance(walker, this->m_rng, this->m_eshift);
        }

        if (istep % this->m_params.nstblz == 0) {
            this->m_population.orthonormalize();
        }

        if (istep % this->m_params.npop_control == 0) {
            this->m_controller.reconfigure(this->m_population, this->m_rng, this->m_world);
        }

        if (istep % this->m_params.nmeasure == 0) {
            this->m_handle.measure(istep, this->m_population, this->m_model, this->m_lattice, this->m_world);
            this->m_handle.record_energy_shift(this->m_eshift);

            // estimators relying on the field history wait until the histories are completely filled
            const auto capacity = this->m_handle.history_capacity();
            if (capacity > 0 && static_cast<std::size_t>(istep) >= capacity) {
                if (this->m_handle.isBackPropagated()) {
                    this->m_handle.back_propagate(istep, this->m_population, *this->m_propagator,
                                                  this->m_model, this->m_lattice, this->m_world);
                }
                if (this->m_handle.isItcf()) {
                    this->m_handle.itcf(istep, this->m_population, *this->m_propagator,
                                        this->m_model, this->m_lattice, this->m_world);
                }
            }
        }

        if (istep % this->m_params.nupdate_shift == 0 && this->m_handle.measure_calls() > 0) {
            this->m_eshift = this->m_handle.latest_energy();
        }
        ++this->m_nsteps_done;
    }

    // ------------------------------------------------------------------------------------------
    //
    //                                        Finalization
    //
    // ------------------------------------------------------------------------------------------
    void Driver::finalize()
    {
        if (this->m_state != State::Completed) {
            throw std::logic_error("AFQMC::Driver::finalize(): the simulation has not been completed.");
        }
        this->m_handle.finalize(this->m_world);
        this->m_population.clear();
        this->m_rng = Utils::Random();
        this->m_state = State::Finalized;
    }
}
