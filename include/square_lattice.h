/*
 *   square_lattice.h
 * 
 *     Created on: Jun 3, 2025
 * 
 */

#pragma once
#ifndef SQUARE_LATTICE_H
#define SQUARE_LATTICE_H

#include <array>
#include <vector>
#include <complex>
#include <Eigen/Core>

namespace AFQMC { struct Params; }

namespace Lattice {

    // ------------------------------------------  Lattice::SquareLattice  ----------------------------------------------
    // nx * ny square lattice with twisted periodic boundary conditions,
    // site i sits at (x, y) = (i % nx, i / nx).
    class SquareLattice {
        protected:
            int m_nx{};
            int m_ny{};
            int m_ns{};
            std::array<double,2> m_ktwist{};

            Eigen::ArrayXXi m_nn_table{};
            Eigen::MatrixXcd m_nn_hoppings{};
            Eigen::ArrayXXd m_momentum_table{};
            Eigen::ArrayXXcd m_fourier_factor_table{};

        public:
            // --------------------------------------  Initializations  ------------------------------------------
            using AfqmcParams = AFQMC::Params;
            void initialize(const AfqmcParams& params);
            void initialize(int nx, int ny, const std::array<double,2>& ktwist);
            void initialize_nn_table();
            void initialize_nn_hoppings();
            void initialize_momentum_table();
            void initialize_fourier_factor_table();

            // ----------------------------------------  Interfaces  ---------------------------------------------
            int nx() const { return this->m_nx; }
            int ny() const { return this->m_ny; }
            int ns() const { return this->m_ns; }
            const std::array<double,2>& ktwist() const { return this->m_ktwist; }

            int nn(int i, int dir) const { return this->m_nn_table(i, dir); }

            // connectivity of the nearest-neighbor bonds, including the twist phases on the boundary bonds,
            // such that the hopping Hamiltonian reads K = -t * nn_hoppings().
            const Eigen::MatrixXcd& nn_hoppings() const { return this->m_nn_hoppings; }

            // lattice momentum k = (2 pi m + pi ktwist) / L of the n-th momentum point
            const Eigen::Array2d momentum(const int k) const { return this->m_momentum_table.row(k); }
            const std::complex<double> fourierFactor(const int i, const int k) const { return this->m_fourier_factor_table(i,k); }

            // tight-binding dispersion -2t (cos kx + cos ky)
            double dispersion(const int k, const double t) const;
    };
}

#endif
