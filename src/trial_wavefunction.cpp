/*
 *   trial_wavefunction.cpp
 * 
 *     Created on: Jun 4, 2025
 * 
 */

#include "trial_wavefunction.h"
#include "afqmc_params.hpp"
#include "hubbard.h"
#include "random.h"
#include "utils/stable_numerics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <boost/format.hpp>
#include <boost/mpi.hpp>
#include <boost/serialization/array.hpp>
#include <Eigen/Eigenvalues>

namespace Trial {

    using StableNumerics = Utils::StableNumerics;

    Wavefunction::Kind Wavefunction::kind_from_string(const std::string& name)
    {
        if (name == "free_electron") { return Kind::FreeElectron; }
        if (name == "UHF") { return Kind::UHF; }
        throw std::runtime_error(
            boost::str(boost::format("Trial::Wavefunction::kind_from_string(): unsupported trial wavefunction '%s'.") % name)
        );
    }

    std::string Wavefunction::kind_to_string(Kind kind)
    {
        return (kind == Kind::FreeElectron)? "free_electron" : "UHF";
    }

    void Wavefunction::initialize(const AfqmcParams& params, const Hubbard& model, Utils::Random& rng)
    {
        switch (kind_from_string(params.trial_name)) {
            case Kind::FreeElectron:
                this->initialize_free_electron(model);
                break;
            case Kind::UHF:
                this->initialize_uhf(model, params.ueff, params.ninitial, params.nconv, params.deps, params.alpha, rng);
                break;
        }
    }

    void Wavefunction::initialize_distributed(const AfqmcParams& params, const Hubbard& model,
                                              Utils::Random& rng, const boost::mpi::communicator& world)
    {
        const int master = 0;
        if (world.rank() == master) {
            this->initialize(params, model, rng);
        }
        boost::mpi::broadcast(world, *this, master);
    }

    void Wavefunction::initialize_free_electron(const Hubbard& model)
    {
        this->m_kind = Kind::FreeElectron;
        for (int spin = 0; spin < 2; ++spin) {
            this->m_orbitals[spin] = model.single_particle_orbitals().leftCols(model.nelec(spin));
        }
        this->m_mean_field_energy = model.noninteracting_energy();
        this->evaluate_energy(model);
    }

    // --------------------------------------------------------------------------------------------------------
    // 
    //                       Unrestricted Hartree-Fock, self-consistently solving
    //
    //      H_s = K + Ueff \sum_i n(i,s) < n(i,-s) >
    //
    // --------------------------------------------------------------------------------------------------------

    void Wavefunction::initialize_uhf(const Hubbard& model, double ueff, int ninitial, int nconv, double deps, double alpha, Utils::Random& rng)
    {
        this->m_kind = Kind::UHF;
        const int ns = model.ns();
        const Matrix& K = model.hopping_matrix();

        auto density = [](const Matrix& orb) -> Eigen::VectorXd {
            return (orb * orb.adjoint()).diagonal().real();
        };
        auto mean_field_energy = [&](const Orbitals& orb) -> double {
            const Matrix gup = orb[0] * orb[0].adjoint();
            const Matrix gdn = orb[1] * orb[1].adjoint();
            const double ek = (K.cwiseProduct(gup.transpose())).sum().real() + (K.cwiseProduct(gdn.transpose())).sum().real();
            return ek + ueff * (gup.diagonal().real().array() * gdn.diagonal().real().array()).sum();
        };

        bool is_found = false;
        double emin = std::numeric_limits<double>::max();
        Orbitals accepted{};

        // search over different random starting points
        for (int attempt = 0; attempt < ninitial; ++attempt) {
            Orbitals orb{};
            double eold = 0.0;
            for (int spin = 0; spin < 2; ++spin) {
                Eigen::MatrixXd random(ns, ns);
                for (int i = 0; i < ns; ++i) {
                    for (int j = 0; j < ns; ++j) {
                        random(i,j) = rng.uniform();
                    }
                }
                const Eigen::MatrixXd sym = 0.5 * (random + random.transpose());
                Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(sym);
                orb[spin] = solver.eigenvectors().leftCols(model.nelec(spin)).cast<Scalar>();
                eold += solver.eigenvalues().head(model.nelec(spin)).sum();
            }

            Eigen::VectorXd niup = density(orb[0]);
            Eigen::VectorXd nidn = density(orb[1]);
            Eigen::VectorXd niup_old = niup;
            Eigen::VectorXd nidn_old = nidn;

            for (int it = 0; it < nconv; ++it) {
                // diagonalize the mean-field hamiltonians
                const Matrix hup = K + Matrix((ueff * nidn).cast<Scalar>().asDiagonal());
                const Matrix hdn = K + Matrix((ueff * niup).cast<Scalar>().asDiagonal());
                Eigen::SelfAdjointEigenSolver<Matrix> solver_up(hup);
                Eigen::SelfAdjointEigenSolver<Matrix> solver_dn(hdn);
                orb[0] = solver_up.eigenvectors().leftCols(model.nup());
                orb[1] = solver_dn.eigenvectors().leftCols(model.ndown());
                niup = density(orb[0]);
                nidn = density(orb[1]);

                const double enew = mean_field_energy(orb);
                const double ediff = std::abs(enew - eold);
                const double nup_diff = (niup - niup_old).cwiseAbs().sum() / ns;
                const double ndn_diff = (nidn - nidn_old).cwiseAbs().sum() / ns;
                if (ediff < deps && nup_diff < std::sqrt(deps) && ndn_diff < std::sqrt(deps)) {
                    // global minimum search
                    if (!is_found || emin - enew > deps) {
                        is_found = true;
                        emin = enew;
                        accepted = orb;
                    }
                    break;
                }

                // mix the new and old densities
                const Eigen::VectorXd mixup = (1-alpha) * niup + alpha * niup_old;
                const Eigen::VectorXd mixdn = (1-alpha) * nidn + alpha * nidn_old;
                niup_old = niup;
                nidn_old = nidn;
                niup = mixup;
                nidn = mixdn;
                eold = enew;
            }
        }

        if (!is_found) {
            throw std::runtime_error(
                boost::str(boost::format("Trial::Wavefunction::initialize_uhf(): "
                "no self-consistent UHF solution found within %d iterations from %d starting points.") % nconv % ninitial)
            );
        }
        this->m_orbitals = accepted;
        this->m_mean_field_energy = emin;
        this->evaluate_energy(model);
    }

    void Wavefunction::evaluate_energy(const Hubbard& model)
    {
        std::array<Matrix,2> gf{};
        Matrix inv_ovlp;
        for (int spin = 0; spin < 2; ++spin) {
            StableNumerics::compute_mixed_gf(this->m_orbitals[spin], this->m_orbitals[spin], inv_ovlp, gf[spin]);
        }
        this->m_energy = (model.kinetic_energy(gf[0], gf[1]) + model.potential_energy(gf[0], gf[1])).real();
    }
}
