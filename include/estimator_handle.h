/*
 *   estimator_handle.h
 * 
 *     Created on: Jun 12, 2025
 * 
 */

#pragma once
#ifndef ESTIMATOR_HANDLE_H
#define ESTIMATOR_HANDLE_H

#include <map>
#include <array>
#include <vector>
#include <string>
#include <cstddef>
#include <Eigen/Core>
#include "observable_handle.h"

namespace AFQMC { struct Params; class Population; class Walker; class Propagator; }
namespace Model { class Hubbard; }
namespace Lattice { class SquareLattice; }
namespace boost { namespace mpi { class communicator; } }

namespace Estimator {

    // final estimate of a scalar observable
    struct Estimate {
        double mean{};
        double error{};             // standard error of the mean treating the bins as independent
        double blocking_error{};    // reblocked standard error
        std::size_t count{};        // number of bins entering the statistics
    };

    // ----------------------------------------------  Estimator::Handle  ----------------------------------------------------------
    //
    //  Registry of the estimators. Mixed estimators are measured at every call of measure(),
    //  the back-propagated estimators and the imaginary-time correlation functions (ITCF) are evaluated from the
    //  auxiliary-field history carried by every walker, which holds the newest nback_prop + nitcf steps.
    //
    class Handle : public Observable::Handle {
        private:
            using AfqmcParams = AFQMC::Params;
            using Population = AFQMC::Population;
            using Walker = AFQMC::Walker;
            using Propagator = AFQMC::Propagator;
            using Hubbard = ::Model::Hubbard;
            using Lattice = ::Lattice::SquareLattice;
            using communicator = boost::mpi::communicator;
            using Matrix = Eigen::MatrixXcd;
            using Orbitals = std::array<Matrix,2>;

            bool m_is_back_propagated{};        // whether to evaluate the back-propagated estimators
            bool m_is_itcf{};                   // whether to evaluate the imaginary-time correlation functions
            bool m_itcf_stable{};               // stabilized or direct evaluation of the ITCF

            int m_nback_prop{};                 // length of the back-propagation path
            int m_nitcf{};                      // number of imaginary-time slices of the ITCF
            int m_nstblz{};                     // steps between two adjoining re-orthonormalizations
            int m_nequilibrate{};               // steps discarded from the final statistics
            std::size_t m_nbin{};               // maximum number of bins, i.e. the number of measurements

            int m_nmeasure_calls{};
            int m_nback_prop_calls{};
            int m_nitcf_calls{};

            // per-walker intermediates of the current measurement
            std::vector<Orbitals> m_bp_gfs{};
            std::vector<char> m_bp_mask{};
            std::vector<std::vector<Orbitals>> m_itcf_gfs{};
            std::vector<char> m_itcf_mask{};

            // energy shift E_T in effect at every measurement
            std::vector<double> m_energy_shifts{};

        public:
            // -------------------------------------------  Interfaces  -----------------------------------------------------
            bool isBackPropagated() const { return this->m_is_back_propagated; }
            bool isItcf() const { return this->m_is_itcf; }
            bool isItcfStable() const { return this->m_itcf_stable; }
            int BackPropagationSteps() const { return this->m_nback_prop; }
            int ItcfSlices() const { return this->m_nitcf; }

            // number of retained history records per walker
            std::size_t history_capacity() const { return this->m_nback_prop + this->m_nitcf; }

            int measure_calls() const { return this->m_nmeasure_calls; }
            int back_propagation_calls() const { return this->m_nback_prop_calls; }
            int itcf_calls() const { return this->m_nitcf_calls; }

            const std::vector<Orbitals>& back_propagated_gfs() const { return this->m_bp_gfs; }
            bool has_back_propagated_gf(const std::size_t w) const { return w < this->m_bp_mask.size() && this->m_bp_mask[w]; }
            const std::vector<std::vector<Orbitals>>& itcf_gfs() const { return this->m_itcf_gfs; }
            bool has_itcf_gfs(const std::size_t w) const { return w < this->m_itcf_mask.size() && this->m_itcf_mask[w]; }

            // ----------------------------------------  Initialization  ---------------------------------------------------
            void initialize(const AfqmcParams& params);
            void initialize(const observable_name_list& list, const std::size_t nbin, const int ns,
                            const int nback_prop, const int nitcf, const bool itcf_stable,
                            const int nstblz, const int nequilibrate);

            // -----------------------------------  Measurements and statistics  --------------------------------------------
            // mixed estimators of the current population
            void measure(const int step, const Population& population, const Hubbard& model, const Lattice& lattice,
                         const communicator& world);

            // back-propagated estimators, requiring complete field histories
            void back_propagate(const int step, const Population& population, const Propagator& propagator,
                                const Hubbard& model, const Lattice& lattice, const communicator& world);

            // imaginary-time correlation functions, requiring complete field histories
            void itcf(const int step, const Population& population, const Propagator& propagator,
                      const Hubbard& model, const Lattice& lattice, const communicator& world);

            // back-propagated Green's functions G_BP = phi (Psi_L^+ phi)^-1 Psi_L^+ of a single walker,
            // phi being the orbitals nback_prop steps ago and Psi_L the trial state propagated backwards from now.
            static Orbitals compute_back_propagated_gf(const Walker& walker, const Propagator& propagator, const int nback_prop);

            // greater Green's functions G(tau_k) for k = 0, ..., nitcf of a single walker,
            // the time origin being the oldest retained step.
            static std::vector<Orbitals> compute_itcf_gfs(const Walker& walker, const Propagator& propagator, const Hubbard& model,
                                                          const int nitcf, const bool stable);

            // the latest bin of the mixed energy
            double latest_energy() const;

            void record_energy_shift(const double eshift) { this->m_energy_shifts.push_back(eshift); }
            const std::vector<double>& energy_shifts() const { return this->m_energy_shifts; }

            // final cross-process consistency check and statistical analysis
            void finalize(const communicator& world);

            // name -> estimate of every scalar observable
            std::map<std::string, Estimate> results() const;
    };
}

#endif
