/*
 *   walker.h
 * 
 *     Created on: Jun 5, 2025
 * 
 */

#pragma once
#ifndef AFQMC_WALKER_H
#define AFQMC_WALKER_H

#include <array>
#include <complex>
#include <cstddef>
#include <Eigen/Core>
#include <boost/serialization/access.hpp>
#include <boost/serialization/complex.hpp>
#include "utils/ring_buffer.hpp"
#include "utils/boost_serialization_eigen.hpp"

namespace Model { class Hubbard; }
namespace Trial { class Wavefunction; }

namespace AFQMC {

    using Matrix = Eigen::MatrixXcd;
    using Orbitals = std::array<Matrix,2>;

    // -------------------------------------------  AFQMC::HistoryRecord  ------------------------------------------------
    // auxiliary fields sampled in one propagation step, together with the orbitals right before the step
    struct HistoryRecord {
        Eigen::VectorXd fields{};
        Orbitals phi_before{};

        template <class Archive>
        void serialize(Archive& ar, const unsigned int version)
        {
            ar & fields;
            ar & phi_before;
        }
    };

    // ----------------------------------------------  AFQMC::Walker  ----------------------------------------------------
    //
    //  A Slater determinant |phi> = |phi_up> x |phi_dn> carrying the weight  W = weight * phase,
    //  together with the cached overlap <Psi_T|phi> and the mixed Green's functions
    //
    //      G_s = phi_s ( Psi_s^+ phi_s )^-1 Psi_s^+ ,    G_s(i,j) = <Psi_T| c^+(j,s) c(i,s) |phi> / <Psi_T|phi> .
    //
    class Walker {
        public:
            using Scalar = std::complex<double>;
            using Hubbard = Model::Hubbard;
            using TrialWavefunction = Trial::Wavefunction;
            using History = Utils::RingBuffer<HistoryRecord>;

            Walker() = default;

            // -------------------------------------------  Initializations  --------------------------------------------------
            // copy the trial orbitals, with weight 1 and phase 1
            void initialize(const TrialWavefunction& trial, const Hubbard& model, const std::size_t history_capacity);

            // ----------------------------------------------  Interfaces  ----------------------------------------------------
            Matrix& phi(const int spin) { return this->m_phi[spin]; }
            const Matrix& phi(const int spin) const { return this->m_phi[spin]; }
            const Orbitals& phi() const { return this->m_phi; }
            Matrix& gf(const int spin) { return this->m_gf[spin]; }
            const Matrix& gf(const int spin) const { return this->m_gf[spin]; }

            double& weight() { return this->m_weight; }
            double weight() const { return this->m_weight; }
            Scalar& phase() { return this->m_phase; }
            const Scalar phase() const { return this->m_phase; }
            const Scalar complex_weight() const { return this->m_weight * this->m_phase; }

            const Scalar overlap() const { return this->m_overlap; }
            const Scalar energy() const { return this->m_kinetic + this->m_potential; }
            const Scalar kinetic_energy() const { return this->m_kinetic; }
            const Scalar potential_energy() const { return this->m_potential; }

            const History& history() const { return this->m_history; }
            History& history() { return this->m_history; }

            bool is_alive() const { return this->m_weight > 0.0; }

            // ---------------------------------------------  Operations  -----------------------------------------------------
            // recompute the overlap and the mixed Green's functions from scratch
            void update_overlap(const TrialWavefunction& trial);

            // recompute the cached local energy from the current Green's functions
            void update_local_energy(const Hubbard& model);

            // QR re-orthonormalization of the orbitals, the Green's functions are unchanged
            // while the overlap is divided by det(R_up) det(R_dn).
            void orthonormalize();

            void kill() { this->m_weight = 0.0; }

            void record(const Eigen::VectorXd& fields, const Orbitals& phi_before);

        private:
            friend class boost::serialization::access;

            template <class Archive>
            void serialize(Archive& ar, const unsigned int version)
            {
                ar & this->m_phi;
                ar & this->m_gf;
                ar & this->m_weight;
                ar & this->m_phase;
                ar & this->m_overlap;
                ar & this->m_kinetic;
                ar & this->m_potential;
                ar & this->m_history;
            }

            Orbitals m_phi{};
            Orbitals m_gf{};

            double m_weight{1.0};
            Scalar m_phase{1.0, 0.0};
            Scalar m_overlap{1.0, 0.0};
            Scalar m_kinetic{};
            Scalar m_potential{};

            History m_history{};
    };
}

#endif
