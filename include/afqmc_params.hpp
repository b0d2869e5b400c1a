/*
 *   afqmc_params.hpp
 * 
 *     Created on: Jun 2, 2025
 * 
 */

#pragma once
#ifndef AFQMC_PARAMS_HPP
#define AFQMC_PARAMS_HPP

#include <set>
#include <array>
#include <string>
#include <cstdint>

namespace AFQMC {

    // --------------------------------------------  AFQMC::Params  -------------------------------------------------
    struct Params {
        // ---------------------------------  model  ----------------------------------------
        std::string model_name{};           // name of the lattice model, only 'Hubbard' supported
        int nx{};                           // lattice size along x
        int ny{};                           // lattice size along y
        int ns{};                           // total spatial sites, nx * ny
        double t{};                         // nearest-neighbor hopping
        double u{};                         // Hubbard on-site interaction
        std::array<double,2> ktwist{};      // twist angles of the boundary conditions (in units of pi)
        int nup{};                          // number of spin-up electrons
        int ndown{};                        // number of spin-down electrons

        // -------------------------------  qmc_options  ------------------------------------
        std::string method{};               // projection method, only 'CPMC' supported
        double dt{};                        // imaginary-time step
        int nsteps{};                       // total number of propagation steps
        int nmeasure{};                     // steps between two adjoining measurements
        int nwalkers{};                     // target number of walkers on each processor
        int npop_control{};                 // steps between two adjoining population controls
        int nstblz{};                       // steps between two adjoining re-orthonormalizations
        int nequilibrate{};                 // steps discarded from the final statistics
        int nupdate_shift{};                // steps between two adjoining updates of the energy shift
        bool has_rng_seed{};                // whether the base seed is given from the input
        std::uint64_t rng_seed{};           // base seed of the random streams

        // ----------------------------  trial_wavefunction  --------------------------------
        std::string trial_name{};           // 'free_electron' or 'UHF'
        double ueff{};                      // effective interaction of the UHF mean field
        int ninitial{};                     // number of random starting points of the UHF search
        int nconv{};                        // maximum number of self-consistent iterations
        double deps{};                      // convergence threshold of the UHF energy
        double alpha{};                     // mixing parameter of the UHF densities

        // --------------------------------  propagator  ------------------------------------
        std::string hubbard_stratonovich{}; // 'discrete' or 'continuous'
        std::string weight_update{};        // 'hybrid' or 'local_energy'
        double energy_bound{};              // local energies entering the weight are clipped to E_T +- bound

        // --------------------------------  estimates  -------------------------------------
        std::set<std::string> observable_list{};    // list of mixed observables to be measured
        int nback_prop{};                           // length of the back-propagation path, 0 for disabled
        bool is_itcf{};                             // whether to measure imaginary-time correlation functions
        bool itcf_stable{};                         // stabilized or direct evaluation of the ITCF
        double itcf_tmax{};                         // maximum imaginary time of the ITCF
        int nitcf{};                                // number of imaginary-time slices of the ITCF, tmax / dt
    };
}

#endif
