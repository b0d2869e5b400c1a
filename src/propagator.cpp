/*
 *   propagator.cpp
 * 
 *     Created on: Jun 6, 2025
 * 
 */

#include "propagator.h"
#include "hubbard.h"
#include "trial_wavefunction.h"
#include "random.h"
#include "utils/stable_numerics.hpp"

#include <cmath>
#include <complex>
#include <algorithm>
#include <stdexcept>
#include <boost/format.hpp>

namespace AFQMC {

    using StableNumerics = Utils::StableNumerics;
    using Scalar = std::complex<double>;

    namespace {
        bool is_finite(const Scalar& z) { return std::isfinite(z.real()) && std::isfinite(z.imag()); }
    }

    WeightUpdate weight_update_from_string(const std::string& name)
    {
        if (name == "hybrid") { return WeightUpdate::Hybrid; }
        if (name == "local_energy") { return WeightUpdate::LocalEnergy; }
        throw std::runtime_error(
            boost::str(boost::format("AFQMC::weight_update_from_string(): unsupported weight_update '%s'.") % name)
        );
    }

    std::string weight_update_to_string(WeightUpdate update)
    {
        return (update == WeightUpdate::Hybrid)? "hybrid" : "local_energy";
    }

    Propagator::Propagator(const Hubbard& model, const TrialWavefunction& trial, const double energy_bound, const int nstblz,
                           const WeightUpdate update)
        : m_model(model), m_trial(trial), m_energy_bound(energy_bound), m_nstblz(nstblz), m_weight_update(update)
    {
        if (nstblz < 1) {
            throw std::runtime_error("AFQMC::Propagator::Propagator(): 'nstblz' should be positive.");
        }
        if (!(energy_bound > 0.0)) {
            throw std::runtime_error("AFQMC::Propagator::Propagator(): 'energy_bound' should be positive.");
        }
    }

    double Propagator::bounded_local_energy(const double local_energy, const double eshift) const
    {
        return std::clamp(local_energy, eshift - this->m_energy_bound, eshift + this->m_energy_bound);
    }

    void Propagator::kill(Walker& walker)
    {
        walker.kill();
        ++this->m_nkills;
    }

    void Propagator::advance(Walker& walker, Utils::Random& rng, const double eshift)
    {
        if (!walker.is_alive()) { return; }

        const bool is_recording = (walker.history().capacity() > 0);
        const Orbitals phi_before = is_recording? walker.phi() : Orbitals{};
        const double weight_before = walker.weight();
        Fields fields(this->m_model.ns());
        double cosine = 1.0;

        if (!this->kinetic_half_step(walker)) { this->kill(walker); return; }

        const bool is_accepted = (this->m_model.scheme() == Model::HSScheme::Discrete)?
            this->discrete_interaction_step(walker, rng, fields) :
            this->continuous_interaction_step(walker, rng, fields, cosine);
        if (!is_accepted) { this->kill(walker); return; }

        if (!this->kinetic_half_step(walker)) { this->kill(walker); return; }

        walker.update_local_energy(this->m_model);
        const double local_energy = walker.energy().real();
        if (!std::isfinite(local_energy)) { this->kill(walker); return; }

        if (this->m_weight_update == WeightUpdate::LocalEnergy) {
            // the importance ratios accumulated above are replaced by the clipped local energy
            const double eloc = this->bounded_local_energy(local_energy, eshift);
            walker.weight() = weight_before * cosine * std::exp(-this->m_model.dt() * (eloc - eshift));
        }
        else {
            walker.weight() *= std::exp(this->m_model.dt() * eshift);
        }
        if (!std::isfinite(walker.weight())) { this->kill(walker); return; }

        if (is_recording) {
            walker.record(fields, phi_before);
        }
    }

    bool Propagator::kinetic_half_step(Walker& walker) const
    {
        const Scalar old_overlap = walker.overlap();
        for (int spin = 0; spin < 2; ++spin) {
            this->m_model.multiply_expK_half_from_left(walker.phi(spin));
        }
        walker.update_overlap(this->m_trial);

        const Scalar ratio = walker.overlap() / old_overlap;
        if (!is_finite(ratio) || ratio.real() <= 0.0) { return false; }
        walker.weight() *= ratio.real();
        return true;
    }

    bool Propagator::discrete_interaction_step(Walker& walker, Utils::Random& rng, Fields& fields) const
    {
        const int ns = this->m_model.ns();
        for (int i = 0; i < ns; ++i) {
            // overlap ratios r(x) = \prod_s [ 1 + ( b_s(x) - 1 ) G_s(i,i) ] for x = +1 and -1
            std::array<double,2> probs{};
            for (int n = 0; n < 2; ++n) {
                const double x = (n == 0)? +1.0 : -1.0;
                Scalar r(1.0, 0.0);
                for (int spin = 0; spin < 2; ++spin) {
                    r *= 1.0 + (this->m_model.expV(x, spin) - 1.0) * walker.gf(spin)(i,i);
                }
                probs[n] = 0.5 * std::max(r.real(), 0.0);
            }
            const double norm = probs[0] + probs[1];
            if (!std::isfinite(norm) || norm <= 0.0) { return false; }

            const double x = (rng.uniform() * norm < probs[0])? +1.0 : -1.0;
            fields(i) = x;
            walker.weight() *= norm;

            for (int spin = 0; spin < 2; ++spin) {
                Matrix& gf = walker.gf(spin);
                const double b = this->m_model.expV(x, spin);
                const double delta = b - 1.0;
                walker.phi(spin).row(i) *= b;

                // G' = G - delta / ( 1 + delta G(i,i) ) * ( G(:,i) - e_i ) G(i,:)
                const Scalar factor = delta / (1.0 + delta * gf(i,i));
                Eigen::VectorXcd col = gf.col(i);
                col(i) -= 1.0;
                const Eigen::RowVectorXcd row = gf.row(i);
                gf.noalias() -= factor * col * row;
            }
        }
        // refresh the overlap (and G) consistently with the updated orbitals
        walker.update_overlap(this->m_trial);
        return is_finite(walker.overlap());
    }

    bool Propagator::continuous_interaction_step(Walker& walker, Utils::Random& rng, Fields& fields, double& cosine) const
    {
        const int ns = this->m_model.ns();
        const double alpha = this->m_model.alpha();

        // force bias xbar(i) = alpha < n_up(i) - n_dn(i) >
        Fields xbar(ns);
        for (int i = 0; i < ns; ++i) {
            xbar(i) = alpha * (walker.gf(0)(i,i) - walker.gf(1)(i,i)).real();
            fields(i) = rng.normal() + xbar(i);
        }

        const Scalar old_overlap = walker.overlap();
        for (int spin = 0; spin < 2; ++spin) {
            this->m_model.multiply_expV_from_left(walker.phi(spin), fields, spin);
        }
        walker.update_overlap(this->m_trial);
        const Scalar ratio = walker.overlap() / old_overlap;
        if (!is_finite(ratio)) { return false; }

        // importance function and the phaseless projection
        const Scalar importance = ratio * std::exp(-fields.dot(xbar) + 0.5 * xbar.squaredNorm());
        const double magnitude = std::abs(importance);
        cosine = std::cos(std::arg(ratio));
        if (!std::isfinite(magnitude) || magnitude == 0.0 || cosine <= 0.0) { return false; }

        walker.weight() *= magnitude * cosine;
        walker.phase() *= importance / magnitude;
        return true;
    }

    void Propagator::multiply_B(Orbitals& phi, const Fields& fields) const
    {
        for (int spin = 0; spin < 2; ++spin) {
            this->m_model.multiply_B_from_left(phi[spin], fields, spin);
        }
    }

    void Propagator::multiply_adjB(Orbitals& psi, const Fields& fields) const
    {
        for (int spin = 0; spin < 2; ++spin) {
            this->m_model.multiply_adjB_from_left(psi[spin], fields, spin);
        }
    }

    Orbitals Propagator::replay(const Walker& walker) const
    {
        const auto& history = walker.history();
        if (history.empty()) {
            throw std::runtime_error("AFQMC::Propagator::replay(): empty field history.");
        }
        Orbitals phi = history.front().phi_before;
        for (std::size_t k = 0; k < history.size(); ++k) {
            this->multiply_B(phi, history[k].fields);
            if ((k+1) % this->m_nstblz == 0) {
                for (int spin = 0; spin < 2; ++spin) { StableNumerics::orthonormalize(phi[spin]); }
            }
        }
        return phi;
    }

    std::vector<Orbitals> Propagator::back_propagate(const Walker& walker, const std::size_t first) const
    {
        const auto& history = walker.history();
        if (first > history.size()) {
            throw std::out_of_range("AFQMC::Propagator::back_propagate(): back-propagation path exceeds the field history.");
        }

        std::vector<Orbitals> left(history.size() - first + 1);
        Orbitals psi = this->m_trial.orbitals();
        left.back() = psi;
        std::size_t nsteps = 0;
        for (std::size_t k = history.size(); k-- > first; ) {
            this->multiply_adjB(psi, history[k].fields);
            if (++nsteps % this->m_nstblz == 0) {
                for (int spin = 0; spin < 2; ++spin) { StableNumerics::orthonormalize(psi[spin]); }
            }
            left[k - first] = psi;
        }
        return left;
    }
}
