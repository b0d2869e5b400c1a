/*
 *   hubbard.cpp
 * 
 *     Created on: Jun 3, 2025
 * 
 */

#include "hubbard.h"
#include "afqmc_params.hpp"
#include "square_lattice.h"

#include <cmath>
#include <stdexcept>
#include <boost/format.hpp>
#include <Eigen/Eigenvalues>
#include <unsupported/Eigen/MatrixFunctions>

namespace Model {

    HSScheme hs_scheme_from_string(const std::string& name)
    {
        if (name == "discrete") { return HSScheme::Discrete; }
        if (name == "continuous") { return HSScheme::Continuous; }
        throw std::runtime_error(
            boost::str(boost::format("Model::hs_scheme_from_string(): unsupported hubbard_stratonovich '%s'.") % name)
        );
    }

    std::string hs_scheme_to_string(HSScheme scheme)
    {
        return (scheme == HSScheme::Discrete)? "discrete" : "continuous";
    }

    void Hubbard::initialize(const AfqmcParams& params, const Lattice& lattice)
    {
        this->initialize(lattice, params.t, params.u, params.dt, params.nup, params.ndown,
                         hs_scheme_from_string(params.hubbard_stratonovich));
    }

    void Hubbard::initialize(const Lattice& lattice, double t, double u, double dt, int nup, int ndown, HSScheme scheme)
    {
        if (u < 0.0) {
            throw std::runtime_error("Model::Hubbard::initialize(): negative U is not supported.");
        }
        if (dt <= 0.0) {
            throw std::runtime_error("Model::Hubbard::initialize(): time step 'dt' should be positive.");
        }
        this->m_ns = lattice.ns();
        if (nup < 0 || ndown < 0 || nup > this->m_ns || ndown > this->m_ns) {
            throw std::runtime_error(
                boost::str(boost::format("Model::Hubbard::initialize(): particle numbers (%d,%d) exceed the %d lattice sites.")
                    % nup % ndown % this->m_ns)
            );
        }
        this->m_nup = nup;
        this->m_ndown = ndown;
        this->m_t = t;
        this->m_u = u;
        this->m_dt = dt;
        this->m_scheme = scheme;
        this->m_alpha = (scheme == HSScheme::Discrete)? std::acosh(std::exp(0.5*dt*u)) : std::sqrt(dt*u);

        this->m_hopping_matrix = -t * lattice.nn_hoppings();
        this->m_expK_half = (-0.5*dt*this->m_hopping_matrix).exp();

        Eigen::SelfAdjointEigenSolver<Matrix> solver(this->m_hopping_matrix);
        this->m_single_particle_energies = solver.eigenvalues();
        this->m_single_particle_orbitals = solver.eigenvectors();
    }

    double Hubbard::noninteracting_energy() const
    {
        return this->m_single_particle_energies.head(this->m_nup).sum()
             + this->m_single_particle_energies.head(this->m_ndown).sum();
    }

    double Hubbard::expV(const double x, const int spin) const
    {
        return std::exp(this->m_alpha * x * spin_sign(spin) - 0.5*this->m_dt*this->m_u);
    }

    // --------------------------------------------------------------------------------------------------------
    // 
    //                       Multiplications of the step operators
    //
    // --------------------------------------------------------------------------------------------------------

    void Hubbard::multiply_expK_half_from_left(refMatrix phi) const { phi = this->m_expK_half * phi; }

    void Hubbard::multiply_adj_expK_half_from_left(refMatrix phi) const
    {
        // K is Hermitian matrix
        this->multiply_expK_half_from_left(phi);
    }

    void Hubbard::multiply_expV_from_left(refMatrix phi, const Fields& fields, const int spin) const
    {
        for (auto i = 0; i < this->m_ns; ++i) {
            phi.row(i) *= this->expV(fields(i), spin);
        }
    }

    void Hubbard::multiply_B_from_left(refMatrix phi, const Fields& fields, const int spin) const
    {
        this->multiply_expK_half_from_left(phi);
        this->multiply_expV_from_left(phi, fields, spin);
        this->multiply_expK_half_from_left(phi);
    }

    void Hubbard::multiply_adjB_from_left(refMatrix psi, const Fields& fields, const int spin) const
    {
        // V(x) is real diagonal for real fields
        this->multiply_adj_expK_half_from_left(psi);
        this->multiply_expV_from_left(psi, fields, spin);
        this->multiply_adj_expK_half_from_left(psi);
    }

    Hubbard::Matrix Hubbard::B_matrix(const Fields& fields, const int spin) const
    {
        Matrix b = Matrix::Identity(this->m_ns, this->m_ns);
        this->multiply_B_from_left(b, fields, spin);
        return b;
    }

    // --------------------------------------------------------------------------------------------------------
    // 
    //                                     Local energy
    //
    // --------------------------------------------------------------------------------------------------------

    Hubbard::Scalar Hubbard::kinetic_energy(const Matrix& gfup, const Matrix& gfdn) const
    {
        return (this->m_hopping_matrix.cwiseProduct(gfup.transpose())).sum()
             + (this->m_hopping_matrix.cwiseProduct(gfdn.transpose())).sum();
    }

    Hubbard::Scalar Hubbard::potential_energy(const Matrix& gfup, const Matrix& gfdn) const
    {
        return this->m_u * (gfup.diagonal().array() * gfdn.diagonal().array()).sum();
    }
}
