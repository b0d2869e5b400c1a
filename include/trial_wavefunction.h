/*
 *   trial_wavefunction.h
 * 
 *     Created on: Jun 4, 2025
 * 
 */

#pragma once
#ifndef TRIAL_WAVEFUNCTION_H
#define TRIAL_WAVEFUNCTION_H

#include <array>
#include <string>
#include <complex>
#include <Eigen/Core>
#include <boost/serialization/access.hpp>
#include "utils/boost_serialization_eigen.hpp"

namespace AFQMC { struct Params; }
namespace Model { class Hubbard; }
namespace Utils { class Random; }
namespace boost { namespace mpi { class communicator; } }

namespace Trial {

    // ---------------------------------------------  Trial::Wavefunction  --------------------------------------------------
    // single Slater determinant |Psi_T> = |Psi_up> x |Psi_dn>, with N x N_s orthonormal orbitals for each spin.
    class Wavefunction {
        public:
            enum class Kind { FreeElectron, UHF };

            using AfqmcParams = AFQMC::Params;
            using Hubbard = Model::Hubbard;
            using Scalar = std::complex<double>;
            using Matrix = Eigen::MatrixXcd;
            using Orbitals = std::array<Matrix,2>;

            static Kind kind_from_string(const std::string& name);
            static std::string kind_to_string(Kind kind);

            // -------------------------------------------  Initializations  --------------------------------------------------
            // the random stream is consumed only by the UHF search
            void initialize(const AfqmcParams& params, const Hubbard& model, Utils::Random& rng);
            void initialize_free_electron(const Hubbard& model);
            void initialize_uhf(const Hubbard& model, double ueff, int ninitial, int nconv, double deps, double alpha, Utils::Random& rng);

            // build the trial on the master process and broadcast the orbitals to all others
            void initialize_distributed(const AfqmcParams& params, const Hubbard& model,
                                        Utils::Random& rng, const boost::mpi::communicator& world);

            // ----------------------------------------------  Interfaces  ----------------------------------------------------
            Kind kind() const { return this->m_kind; }
            const Matrix& orbitals(const int spin) const { return this->m_orbitals[spin]; }
            const Orbitals& orbitals() const { return this->m_orbitals; }

            // energy expectation <Psi_T|H|Psi_T> of the trial state
            double energy() const { return this->m_energy; }

            // converged mean-field energy of the UHF search (zero for free electrons)
            double mean_field_energy() const { return this->m_mean_field_energy; }

        private:
            friend class boost::serialization::access;

            template <class Archive>
            void serialize(Archive& ar, const unsigned int version)
            {
                ar & this->m_kind;
                ar & this->m_orbitals;
                ar & this->m_energy;
                ar & this->m_mean_field_energy;
            }

            void evaluate_energy(const Hubbard& model);

            Kind m_kind{Kind::FreeElectron};
            Orbitals m_orbitals{};
            double m_energy{};
            double m_mean_field_energy{};
    };
}

#endif
