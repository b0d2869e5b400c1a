/*
 *   propagator.h
 * 
 *     Created on: Jun 6, 2025
 * 
 */

#pragma once
#ifndef AFQMC_PROPAGATOR_H
#define AFQMC_PROPAGATOR_H

#include <vector>
#include <string>
#include <cstddef>
#include <Eigen/Core>
#include "walker.h"

namespace Model { class Hubbard; }
namespace Trial { class Wavefunction; }
namespace Utils { class Random; }

namespace AFQMC {

    // weight of a step: the product of the importance ratios ( hybrid ),
    // or exp( -dt ( E_L - E_T ) ) with the local energy clipped to E_T +- energy_bound ( local_energy ).
    enum class WeightUpdate { Hybrid, LocalEnergy };

    WeightUpdate weight_update_from_string(const std::string& name);
    std::string weight_update_to_string(WeightUpdate update);

    // ---------------------------------------------  AFQMC::Propagator  --------------------------------------------------
    //
    //  Importance-sampled, constrained propagation of a single walker by one step of the symmetric Trotter split
    //
    //      B(x) = exp(-dt K/2) V(x) exp(-dt K/2) ,
    //
    //  followed by the energy-shift factor exp(dt E_T).
    //  Walkers whose overlap ratio turns non-positive (constrained path), or whose overlap, weight or
    //  local energy turns non-finite, are killed. Finite local energies never kill a walker.
    //
    class Propagator {
        public:
            using Hubbard = Model::Hubbard;
            using TrialWavefunction = Trial::Wavefunction;
            using Fields = Eigen::VectorXd;

            Propagator(const Hubbard& model, const TrialWavefunction& trial, const double energy_bound, const int nstblz,
                       const WeightUpdate update = WeightUpdate::Hybrid);

            // -----------------------------------------  Propagations  -----------------------------------------------
            // advance the walker by one step, dead walkers are skipped
            void advance(Walker& walker, Utils::Random& rng, const double eshift);

            // apply the recorded step operator B(x), or its adjoint, to both spin sectors
            void multiply_B(Orbitals& phi, const Fields& fields) const;
            void multiply_adjB(Orbitals& psi, const Fields& fields) const;

            // forward-propagate the oldest retained orbitals through all retained fields,
            // which reproduces the current orbitals up to a right triangular factor.
            Orbitals replay(const Walker& walker) const;

            // propagate the trial state backwards with B^+ from the newest record down to the record 'first',
            // returning the left states at the slices first, first+1, ..., size of the history, i.e.
            //
            //      L_size = Psi_T ,    L_k = B_k^+ L_{k+1} ,
            //
            // re-orthonormalized every nstblz steps.
            std::vector<Orbitals> back_propagate(const Walker& walker, const std::size_t first) const;

            // ----------------------------------------------  Interfaces  ----------------------------------------------------
            double energy_bound() const { return this->m_energy_bound; }
            WeightUpdate weight_update() const { return this->m_weight_update; }

            // local energy clipped into the window [ E_T - energy_bound, E_T + energy_bound ]
            double bounded_local_energy(const double local_energy, const double eshift) const;

            int nstblz() const { return this->m_nstblz; }
            std::size_t kills() const { return this->m_nkills; }
            void reset_kills() { this->m_nkills = 0; }

        private:
            // one kinetic half step exp(-dt K/2), with the weight multiplied by the real part of the overlap ratio
            bool kinetic_half_step(Walker& walker) const;

            // discrete Ising fields sampled site by site from the overlap ratios, with rank-one updates of G
            bool discrete_interaction_step(Walker& walker, Utils::Random& rng, Fields& fields) const;

            // continuous Gaussian fields shifted by the force bias, with the phaseless approximation
            // cosine receives the phaseless factor max(0, cos arg(O_new/O_old))
            bool continuous_interaction_step(Walker& walker, Utils::Random& rng, Fields& fields, double& cosine) const;

            void kill(Walker& walker);

            const Hubbard& m_model;
            const TrialWavefunction& m_trial;
            double m_energy_bound{};
            int m_nstblz{};
            WeightUpdate m_weight_update{WeightUpdate::Hybrid};
            std::size_t m_nkills{};
    };
}

#endif
