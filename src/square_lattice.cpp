/*
 *   square_lattice.cpp
 * 
 *     Created on: Jun 3, 2025
 * 
 */

#include "square_lattice.h"
#include "afqmc_params.hpp"
#include <cmath>

namespace Lattice {

    void SquareLattice::initialize(const AfqmcParams& params)
    {
        this->initialize(params.nx, params.ny, params.ktwist);
    }

    void SquareLattice::initialize(int nx, int ny, const std::array<double,2>& ktwist)
    {
        this->m_nx = nx;
        this->m_ny = ny;
        this->m_ns = nx * ny;
        this->m_ktwist = ktwist;

        this->initialize_nn_table();
        this->initialize_nn_hoppings();
        this->initialize_momentum_table();
        this->initialize_fourier_factor_table();
    }

    void SquareLattice::initialize_nn_table()
    {
        // the coordination number for 2d square lattice is 4
        // correspondense between the table index and the displacement direction:
        // 0: (x+1, y)    1: (x, y+1)
        // 2: (x-1, y)    3: (x, y-1)
        this->m_nn_table.resize(this->m_ns, 4);
        this->m_nn_table.setZero();
        for (auto i = 0; i < this->m_ns; ++i) {
            const auto x = i % this->m_nx;
            const auto y = i / this->m_nx;
            this->m_nn_table(i,0) = ((x+1)%this->m_nx) + this->m_nx*y;
            this->m_nn_table(i,2) = ((x-1+this->m_nx)%this->m_nx) + this->m_nx*y;
            this->m_nn_table(i,1) = x + this->m_nx*((y+1)%this->m_ny);
            this->m_nn_table(i,3) = x + this->m_nx*((y-1+this->m_ny)%this->m_ny);
        }
    }

    void SquareLattice::initialize_nn_hoppings()
    {
        // hopping from i to its neighbor j = i + e_d, the bond crossing the boundary picks up the twist phase exp(i pi ktwist_d)
        const std::complex<double> id(0., 1.);
        const std::complex<double> phase_x = std::exp(id * M_PI * this->m_ktwist[0]);
        const std::complex<double> phase_y = std::exp(id * M_PI * this->m_ktwist[1]);

        this->m_nn_hoppings.resize(this->m_ns, this->m_ns);
        this->m_nn_hoppings.setZero();
        for (auto i = 0; i < this->m_ns; ++i) {
            const auto x = i % this->m_nx;
            const auto y = i / this->m_nx;

            // direction 0 for x+1 and 1 for y+1
            const auto xplus1 = this->nn(i,0);
            const auto yplus1 = this->nn(i,1);
            const std::complex<double> px = (x == this->m_nx-1) ? phase_x : 1.0;
            const std::complex<double> py = (y == this->m_ny-1) ? phase_y : 1.0;

            // plane waves exp(ikr) with k = (2 pi m + pi ktwist) / L diagonalize the hopping matrix
            this->m_nn_hoppings(i, xplus1) += px;
            this->m_nn_hoppings(xplus1, i) += std::conj(px);
            this->m_nn_hoppings(i, yplus1) += py;
            this->m_nn_hoppings(yplus1, i) += std::conj(py);
        }
    }

    void SquareLattice::initialize_momentum_table()
    {
        // the full brillouin zone, shifted by the twist
        this->m_momentum_table.resize(this->m_ns, 2);
        this->m_momentum_table.setZero();
        for (auto k = 0; k < this->m_ns; ++k) {
            const auto mx = k % this->m_nx;
            const auto my = k / this->m_nx;
            this->m_momentum_table(k,0) = (2*M_PI*mx + M_PI*this->m_ktwist[0]) / this->m_nx;
            this->m_momentum_table(k,1) = (2*M_PI*my + M_PI*this->m_ktwist[1]) / this->m_ny;
        }
    }

    void SquareLattice::initialize_fourier_factor_table()
    {
        // exp(-ikr) for lattice site r and momentum k
        this->m_fourier_factor_table.resize(this->m_ns, this->m_ns);
        this->m_fourier_factor_table.setZero();
        const std::complex<double> id(0., 1.);
        for (auto i = 0; i < this->m_ns; ++i) {
            const auto x = i % this->m_nx;
            const auto y = i / this->m_nx;
            for (auto k = 0; k < this->m_ns; ++k) {
                const double kx = this->m_momentum_table(k,0);
                const double ky = this->m_momentum_table(k,1);
                this->m_fourier_factor_table(i,k) = std::cos(x*kx+y*ky) - id * std::sin(x*kx+y*ky);
            }
        }
    }

    double SquareLattice::dispersion(const int k, const double t) const
    {
        // also valid for L = 1 and L = 2, where the bonds wrap onto the same sites
        return -2.0 * t * (std::cos(this->m_momentum_table(k,0)) + std::cos(this->m_momentum_table(k,1)));
    }
}
