/*
 *   walker.cpp
 * 
 *     Created on: Jun 5, 2025
 * 
 */

#include "walker.h"
#include "hubbard.h"
#include "trial_wavefunction.h"
#include "utils/stable_numerics.hpp"

namespace AFQMC {

    using StableNumerics = Utils::StableNumerics;

    void Walker::initialize(const TrialWavefunction& trial, const Hubbard& model, const std::size_t history_capacity)
    {
        this->m_phi = trial.orbitals();
        this->m_weight = 1.0;
        this->m_phase = Scalar(1.0, 0.0);
        this->m_history.reset(history_capacity);
        this->update_overlap(trial);
        this->update_local_energy(model);
    }

    void Walker::update_overlap(const TrialWavefunction& trial)
    {
        Matrix inv_ovlp;
        this->m_overlap = Scalar(1.0, 0.0);
        for (int spin = 0; spin < 2; ++spin) {
            this->m_overlap *= StableNumerics::compute_mixed_gf(this->m_phi[spin], trial.orbitals(spin), inv_ovlp, this->m_gf[spin]);
        }
    }

    void Walker::update_local_energy(const Hubbard& model)
    {
        this->m_kinetic = model.kinetic_energy(this->m_gf[0], this->m_gf[1]);
        this->m_potential = model.potential_energy(this->m_gf[0], this->m_gf[1]);
    }

    void Walker::orthonormalize()
    {
        for (int spin = 0; spin < 2; ++spin) {
            const Scalar det_r = StableNumerics::orthonormalize(this->m_phi[spin]);
            this->m_overlap /= det_r;
        }
    }

    void Walker::record(const Eigen::VectorXd& fields, const Orbitals& phi_before)
    {
        this->m_history.push(HistoryRecord{fields, phi_before});
    }
}
