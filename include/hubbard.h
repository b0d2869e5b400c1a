/*
 *   hubbard.h
 * 
 *     Created on: Jun 3, 2025
 * 
 */

#pragma once
#ifndef HUBBARD_H
#define HUBBARD_H

#include <Eigen/Core>
#include <complex>
#include <string>

namespace AFQMC { struct Params; }
namespace Lattice { class SquareLattice; }

namespace Model {

    // auxiliary-field decompositions of the on-site interaction exp( -dt U n_up n_dn )
    enum class HSScheme { Discrete, Continuous };

    HSScheme hs_scheme_from_string(const std::string& name);
    std::string hs_scheme_to_string(HSScheme scheme);

    // ---------------------------------------------  Model::Hubbard  --------------------------------------------------
    //
    //      H = K + U \sum_i n_up(i) n_dn(i) ,    K = -t \sum_<ij>,s ( exp(i theta_ij) c^+(i,s) c(j,s) + h.c. )
    //
    //  The Trotter-split step operator reads B(x) = exp(-dt K/2) V(x) exp(-dt K/2),
    //  where V(x) is diagonal with entries exp( alpha x_i s - dt U/2 ), s = +1 (-1) for spin up (down),
    //  and alpha = acosh( exp(dt U/2) ) for the discrete Ising fields x = +-1,
    //  or alpha = sqrt( dt U ) for the continuous Gaussian fields.
    //
    class Hubbard {
        protected:
            int m_ns{};
            int m_nup{};
            int m_ndown{};
            double m_dt{};

            // ------------------------------------------  Model parameters  --------------------------------------------------
            double m_t{};
            double m_u{};
            double m_alpha{};
            HSScheme m_scheme{HSScheme::Discrete};

            Eigen::MatrixXcd m_hopping_matrix{};
            Eigen::MatrixXcd m_expK_half{};
            Eigen::VectorXd m_single_particle_energies{};
            Eigen::MatrixXcd m_single_particle_orbitals{};

        public:
            using AfqmcParams = AFQMC::Params;
            using Lattice = Lattice::SquareLattice;
            using Scalar = std::complex<double>;
            using Matrix = Eigen::MatrixXcd;
            using Fields = Eigen::VectorXd;
            using refMatrix = Eigen::Ref<Eigen::MatrixXcd>;

            // -------------------------------------------  Initializations  --------------------------------------------------
            void initialize(const AfqmcParams& params, const Lattice& lattice);
            void initialize(const Lattice& lattice, double t, double u, double dt, int nup, int ndown, HSScheme scheme);

            // ----------------------------------------------  Interfaces  ----------------------------------------------------
            int ns() const { return this->m_ns; }
            int nup() const { return this->m_nup; }
            int ndown() const { return this->m_ndown; }
            int nelec(const int spin) const { return (spin == 0)? this->m_nup : this->m_ndown; }
            double t() const { return this->m_t; }
            double u() const { return this->m_u; }
            double dt() const { return this->m_dt; }
            double alpha() const { return this->m_alpha; }
            HSScheme scheme() const { return this->m_scheme; }

            const Matrix& hopping_matrix() const { return this->m_hopping_matrix; }
            const Matrix& expK_half() const { return this->m_expK_half; }

            // eigen-decomposition of K, in ascending order of energies
            const Eigen::VectorXd& single_particle_energies() const { return this->m_single_particle_energies; }
            const Matrix& single_particle_orbitals() const { return this->m_single_particle_orbitals; }

            // ground-state energy of the non-interacting system with the same filling
            double noninteracting_energy() const;

            static double spin_sign(const int spin) { return (spin == 0)? +1.0 : -1.0; }

            // diagonal entry of V(x) at a single site
            double expV(const double x, const int spin) const;

            // -------------------------------------------  Warpping methods  -------------------------------------------------
            void multiply_expK_half_from_left(refMatrix phi) const;
            void multiply_adj_expK_half_from_left(refMatrix phi) const;
            void multiply_expV_from_left(refMatrix phi, const Fields& fields, const int spin) const;
            void multiply_B_from_left(refMatrix phi, const Fields& fields, const int spin) const;
            void multiply_adjB_from_left(refMatrix psi, const Fields& fields, const int spin) const;

            // dense representation of the step operator B(x) of the given spin
            Matrix B_matrix(const Fields& fields, const int spin) const;

            // ---------------------------------------------  Local energy  ---------------------------------------------------
            // with the mixed Green's function G(i,j) = < c^+(j) c(i) >
            //
            //      E_K = \sum_s tr( K G_s ) ,    E_V = U \sum_i G_up(i,i) G_dn(i,i)
            //
            Scalar kinetic_energy(const Matrix& gfup, const Matrix& gfdn) const;
            Scalar potential_energy(const Matrix& gfup, const Matrix& gfdn) const;
    };
}

#endif
