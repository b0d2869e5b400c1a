/*
 *   afqmc_io.hpp
 *
 *     Created on: Jun 16, 2025
 *
 */

#pragma once
#ifndef AFQMC_IO_HPP
#define AFQMC_IO_HPP

#include <stdexcept>
#include <fstream>
#include <numeric>
#include <functional>
#include <string>
#include <vector>
#include <cmath>

#include <boost/format.hpp>
#include <boost/algorithm/string/join.hpp>
#include <xtensor/xstrided_view.hpp>
#include <xtensor/xcsv.hpp>
#include <xtensor/xnpy.hpp>

#include "afqmc_params.hpp"
#include "afqmc_driver.h"
#include "estimator_handle.h"
#include "square_lattice.h"
#include "observable.hpp"

namespace AFQMC {
    namespace IO {

        // ------------------------------------------------------------------------
        //
        //      Output AFQMC information: initialization and summary
        //
        // ------------------------------------------------------------------------
        template <typename _ostream>
        void print_initialization_info(_ostream& ostream, const AFQMC::Params& params, const Estimator::Handle& handle, std::size_t nproc)
        {
            if (!ostream) {
                throw std::runtime_error("AFQMC::IO::print_initialization_info(): ostream failed.");
            }

            // output formats
            boost::format fmt_param_str   ("%| 30s|%| 7s|%| 20s|\n");
            boost::format fmt_param_int   ("%| 30s|%| 7s|%| 20d|\n");
            boost::format fmt_param_double("%| 30s|%| 7s|%| 20.3f|\n");
            const std::string_view joiner = "->";
            auto bool2str = [](bool b) {if (b) return "True"; else return "False";};

            ostream << ">> Model: " << params.model_name << "\n\n"
                    << fmt_param_double % "Nearest hopping 't'" % joiner % params.t
                    << fmt_param_double % "On-site interaction 'U'" % joiner % params.u
                    << fmt_param_int % "Spin-up electrons 'nup'" % joiner % params.nup
                    << fmt_param_int % "Spin-down electrons 'ndown'" % joiner % params.ndown
                    << std::endl;

            ostream << ">> Lattice: SquareLattice\n\n"
                    << fmt_param_int % "Linear size 'nx'" % joiner % params.nx
                    << fmt_param_int % "Linear size 'ny'" % joiner % params.ny
                    << fmt_param_double % "Twist angle 'kx' (pi)" % joiner % params.ktwist[0]
                    << fmt_param_double % "Twist angle 'ky' (pi)" % joiner % params.ktwist[1]
                    << std::endl;

            ostream << ">> QMC Params: " << params.method << "\n\n"
                    << fmt_param_double % "Imag-time step 'dt'" % joiner % params.dt
                    << fmt_param_int % "Propagation steps" % joiner % params.nsteps
                    << fmt_param_int % "Walkers per processor" % joiner % params.nwalkers
                    << fmt_param_int % "Total walkers" % joiner % (params.nwalkers * nproc)
                    << fmt_param_int % "Population control pace" % joiner % params.npop_control
                    << fmt_param_int % "Stabilization pace" % joiner % params.nstblz
                    << fmt_param_int % "Energy shift update pace" % joiner % params.nupdate_shift
                    << fmt_param_int % "Equilibration steps" % joiner % params.nequilibrate
                    << std::endl;

            ostream << ">> Trial wavefunction: " << params.trial_name << "\n\n";
            if (params.trial_name == "UHF") {
                ostream << fmt_param_double % "Effective interaction 'ueff'" % joiner % params.ueff
                        << fmt_param_int % "Random starting points" % joiner % params.ninitial
                        << fmt_param_int % "Maximum iterations" % joiner % params.nconv
                        << fmt_param_double % "Mixing parameter 'alpha'" % joiner % params.alpha;
            }
            ostream << std::endl;

            ostream << ">> Propagator:\n\n"
                    << fmt_param_str % "Hubbard-Stratonovich" % joiner % params.hubbard_stratonovich
                    << fmt_param_str % "Weight update" % joiner % params.weight_update
                    << fmt_param_double % "Local energy bound" % joiner % params.energy_bound
                    << std::endl;

            ostream << ">> Estimator Params:\n\n"
                    << fmt_param_int % "Measurement pace" % joiner % params.nmeasure
                    << fmt_param_int % "Number of bins" % joiner % (params.nsteps / params.nmeasure)
                    << fmt_param_str % "Back propagation" % joiner % bool2str(handle.isBackPropagated())
                    << fmt_param_str % "Imag-time correlations" % joiner % bool2str(handle.isItcf());
            if (handle.isBackPropagated()) {
                ostream << fmt_param_int % "Back propagation steps" % joiner % handle.BackPropagationSteps();
            }
            if (handle.isItcf()) {
                ostream << fmt_param_str % "Stabilized ITCF" % joiner % bool2str(handle.isItcfStable())
                        << fmt_param_int % "Imag-time slices of ITCF" % joiner % handle.ItcfSlices();
            }
            const auto names = handle.names();
            ostream << fmt_param_str % "Observables" % joiner % boost::algorithm::join(names, ", ")
                    << std::endl;
        }

        template <typename _ostream>
        void print_afqmc_summary(_ostream& ostream, const AFQMC::Driver& driver)
        {
            if (!ostream) {
                throw std::runtime_error("AFQMC::IO::print_afqmc_summary(): ostream failed.");
            }

            // parse the time duration
            const double duration = static_cast<double>(driver.timer());
            const int day = std::floor(duration/86400000);
            const int hour = std::floor((duration/1000 - day*86400)/3600);
            const int minute = std::floor((duration/1000 - day*86400 - hour*3600)/60);
            const double sec = duration/1000 - 86400*day - 3600*hour - 60*minute;

            // print the time cost of the simulation
            if (day) { ostream << boost::format("\n>> The simulation finished in %d d %d h %d m %.2f s.\n") % day % hour % minute % sec << std::endl; }
            else if (hour) { ostream << boost::format("\n>> The simulation finished in %d h %d m %.2f s.\n") % hour % minute % sec << std::endl; }
            else if (minute) { ostream << boost::format("\n>> The simulation finished in %d m %.2f s.\n") % minute % sec << std::endl; }
            else { ostream << boost::format("\n>> The simulation finished in %.2f s.\n") % sec << std::endl; }

            // print the statistics of the walkers and the calls of the estimators
            ostream << boost::format(">> %d steps done, with %d population controls and %d measurements.\n")
                    % driver.steps_done() % driver.population_control_calls() % driver.measure_calls()
                    << boost::format(">> %d walkers killed in total.\n") % driver.total_kills() << std::endl;

            // print the final averages of the scalar observables
            boost::format fmt_result("%| 30s|%| 7s|%| 20.8f| +- %| -15.8f|(reblocked %.8f, %d bins)\n");
            const std::string_view joiner = "->";
            ostream << ">> Final estimates:\n\n";
            for (const auto& it : driver.handle().results()) {
                ostream << fmt_result % it.first % joiner % it.second.mean % it.second.error
                                      % it.second.blocking_error % it.second.count;
            }
            ostream << std::endl;
        }

        // ------------------------------------------------------------------------
        //
        //      Output measurements of observables
        //
        // ------------------------------------------------------------------------
        template <typename _ostream>
        void print_observable(_ostream& ostream, const Observable::ObservableReal& obs, bool show_header=true)
        {
            if (!ostream) {
                throw std::runtime_error("AFQMC::IO::print_observable(): ostream failed.");
            }

            using obs_index = std::size_t;
            using obs_shape = typename Observable::ObservableReal::obs_shape;
            const obs_shape shape = obs.obsShape();
            const obs_index dim = shape.size();
            const obs_index size = std::accumulate(shape.begin(), shape.end(), obs_index(1), std::multiplies<obs_index>());
            obs_shape accumulated = shape;

            boost::format fmt_index("%| 15d|");
            boost::format fmt_data ("%| 30.15f|%| 30.15f|%| 30.15f|");
            if (dim == 0) {
                // 0-dim observable is equivalent to a scalar
                if (show_header) { ostream << fmt_index % 1 << std::endl; }
                ostream << fmt_index % 0 << fmt_data % obs.mean()() % obs.stddev()() % obs.stderr()() << std::endl;
            }
            else {
                // observable with one and higher dimension
                for (auto it = accumulated.begin(); it != accumulated.end(); ++it) {
                    *it = std::accumulate(it+1, accumulated.end(), obs_index(1), std::multiplies<obs_index>());
                }
                const auto flatten_mean   = xt::flatten(obs.mean());
                const auto flatten_stddev = xt::flatten(obs.stddev());
                const auto flatten_stderr = xt::flatten(obs.stderr());
                if (show_header) {
                    // header info, i.e. dimensions of the observable
                    for (obs_index d = 0; d < dim; ++d) {
                        ostream << fmt_index % shape[d];
                    }
                    ostream << std::endl;
                }
                for (obs_index i = 0; i < size; ++i) {
                    for (obs_index d = 0; d < dim; ++d) {
                        ostream << fmt_index % ((i/accumulated[d])%shape[d]);
                    }
                    ostream << fmt_data % flatten_mean(i) % flatten_stddev(i) % flatten_stderr(i) << std::endl;
                }
            }
        }

        // raw bins of the observable, the first index being the bin and the second the step it was measured at
        template <typename _ostream>
        void print_observable_data(_ostream& ostream, const Observable::ObservableReal& obs, bool show_header=true)
        {
            if (!ostream) {
                throw std::runtime_error("AFQMC::IO::print_observable_data(): ostream failed.");
            }

            using data_index = std::size_t;
            using data_shape = typename Observable::ObservableReal::data_shape;
            const data_shape shape = obs.dataShape();
            const data_index dim = shape.size();
            const data_index bin_size = std::accumulate(shape.begin()+1, shape.end(), data_index(1), std::multiplies<data_index>());
            const data_index size = obs.counts() * bin_size;
            data_shape accumulated = shape;
            for (auto it = accumulated.begin(); it != accumulated.end(); ++it) {
                *it = std::accumulate(it+1, accumulated.end(), data_index(1), std::multiplies<data_index>());
            }
            const auto flatten_data = xt::flatten(obs.data());
            boost::format fmt_index("%| 15d|");
            boost::format fmt_data ("%| 30.15f|");
            if (show_header) {
                // header info, i.e. the number of filled bins and dimensions of the observable
                ostream << fmt_index % obs.counts();
                for (data_index d = 1; d < dim; ++d) {
                    ostream << fmt_index % shape[d];
                }
                ostream << std::endl;
            }
            for (data_index i = 0; i < size; ++i) {
                const data_index bin = i / accumulated[0];
                ostream << fmt_index % bin << fmt_index % obs.steps()[bin];
                for (data_index d = 1; d < dim; ++d) {
                    ostream << fmt_index % ((i/accumulated[d]) % shape[d]);
                }
                ostream << fmt_data % flatten_data(i) << std::endl;
            }
        }

        template <typename _Scalar>
        void save_observable_data_to_file(const Observable::Observable<_Scalar>& obs, std::string file, std::string fmt="npy")
        {
            if (fmt == "npy") {
                xt::dump_npy(file, obs.data());
            }
            else if (fmt == "csv") {
                std::ofstream ofile(file, std::ios::out|std::ios::trunc);
                if (!ofile.is_open()) {
                    throw std::runtime_error(
                        boost::str(boost::format("AFQMC::IO::save_observable_data_to_file(): fail to open '%s'.") % file)
                    );
                }
                xt::dump_csv(ofile, obs.data());
            }
            else {
                throw std::runtime_error("AFQMC::IO::save_observable_data_to_file(): invalid type of format.");
            }
        }

        // one line per measurement: step, mean weight, energy, kinetic, potential, alive fraction, and E_T
        template <typename _ostream>
        void print_estimates_series(_ostream& ostream, const Estimator::Handle& handle)
        {
            if (!ostream) {
                throw std::runtime_error("AFQMC::IO::print_estimates_series(): ostream failed.");
            }
            const std::vector<std::string> columns = {
                "MeanWeight", "Energy", "KineticEnergy", "PotentialEnergy", "AliveFraction", "EnergyShift"
            };
            boost::format fmt_header("%| 15s|");
            boost::format fmt_step("%| 15d|");
            boost::format fmt_data("%| 20.10f|");
            boost::format fmt_name("%| 20s|");

            ostream << fmt_header % "Step";
            for (const auto& name : columns) { ostream << fmt_name % name; }
            ostream << std::endl;

            const auto& energy = handle.find("Energy");
            for (std::size_t bin = 0; bin < energy.counts(); ++bin) {
                ostream << fmt_step % energy.steps()[bin];
                for (const auto& name : columns) {
                    if (name == "EnergyShift") {
                        ostream << fmt_data % handle.energy_shifts().at(bin);
                    }
                    else if (handle.is_found(name) && handle.find(name).counts() > bin) {
                        ostream << fmt_data % handle.find(name).data()(bin);
                    }
                    else {
                        ostream << fmt_name % "-";
                    }
                }
                ostream << std::endl;
            }
        }

        // ------------------------------------------------------------------------
        //
        //      Output other information
        //
        // ------------------------------------------------------------------------
        template <typename _ostream>
        void print_momentum_list(_ostream& ostream, const Lattice::SquareLattice& lattice)
        {
            if (!ostream) {
                throw std::runtime_error("AFQMC::IO::print_momentum_list(): ostream failed.");
            }
            boost::format fmt_info("%| 15d|%| 15d|%| 15d|");
            boost::format fmt_momentum("%| 15d|%| 30.15f|%| 30.15f|");
            ostream << fmt_info % lattice.ns() % lattice.nx() % lattice.ny() << std::endl;
            for (int k = 0; k < lattice.ns(); ++k) {
                const auto momentum = lattice.momentum(k);
                ostream << fmt_momentum % k % momentum(0) % momentum(1) << std::endl;
            }
        }

        template <typename _ostream>
        void print_imaginary_time_grids(_ostream& ostream, const AFQMC::Params& params)
        {
            if (!ostream) {
                throw std::runtime_error("AFQMC::IO::print_imaginary_time_grids(): ostream failed.");
            }
            // output the imaginary-time grids of the correlation functions
            boost::format fmt_tgrids_info("%| 15d|%| 30.8f|%| 30.8f|");
            boost::format fmt_tgrids("%| 15d|%| 30.8f|");
            ostream << fmt_tgrids_info % (params.nitcf+1) % (params.nitcf*params.dt) % params.dt << std::endl;
            for (int t = 0; t <= params.nitcf; ++t) {
                ostream << fmt_tgrids % t % static_cast<double>(t*params.dt) << std::endl;
            }
        }
    }
}

#endif
