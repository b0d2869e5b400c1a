/*
 *   estimator_handle.cpp
 * 
 *     Created on: Jun 12, 2025
 * 
 */

#include "estimator_handle.h"
#include "observable.hpp"
#include "afqmc_params.hpp"
#include "population.h"
#include "population_controller.h"
#include "propagator.h"
#include "hubbard.h"
#include "square_lattice.h"
#include "utils/observable_gather.hpp"
#include "utils/stable_numerics.hpp"

#include <cmath>
#include <stdexcept>
#include <boost/format.hpp>
#include <boost/mpi.hpp>

namespace Estimator {

    using StableNumerics = Utils::StableNumerics;

    void Handle::initialize(const AfqmcParams& params)
    {
        const std::size_t nbin = (params.nmeasure > 0)? params.nsteps / params.nmeasure : 0;
        this->initialize(params.observable_list, nbin, params.ns,
                         params.nback_prop, params.nitcf, params.itcf_stable, params.nstblz, params.nequilibrate);
    }

    void Handle::initialize(const observable_name_list& list, const std::size_t nbin, const int ns,
                            const int nback_prop, const int nitcf, const bool itcf_stable,
                            const int nstblz, const int nequilibrate)
    {
        if (nback_prop < 0 || nitcf < 0) {
            throw std::runtime_error("Estimator::Handle::initialize(): negative length of the field history.");
        }
        this->m_nbin = nbin;
        this->m_nback_prop = nback_prop;
        this->m_nitcf = nitcf;
        this->m_itcf_stable = itcf_stable;
        this->m_nstblz = nstblz;
        this->m_nequilibrate = nequilibrate;
        this->m_is_back_propagated = (nback_prop > 0);
        this->m_is_itcf = (nitcf > 0);
        this->m_nmeasure_calls = 0;
        this->m_nback_prop_calls = 0;
        this->m_nitcf_calls = 0;
        this->m_energy_shifts.clear();
        this->m_energy_shifts.reserve(nbin);

        // the mixed energy is always measured since it drives the energy shift,
        // while the back-propagated and ITCF estimators come with their switches.
        observable_name_list full_list;
        for (const auto& obsname : list) {
            if (!Handle::check_validity(obsname)) {
                throw std::invalid_argument(
                    boost::str(boost::format("Estimator::Handle::initialize(): "
                    "received invalid observable '%s' from the input.") % obsname)
                );
            }
            if (Handle::is_mixed(obsname)) { full_list.insert(obsname); }
        }
        full_list.insert("Energy");
        if (this->m_is_back_propagated) {
            full_list.insert(Handle::allBackPropagatedObservables.begin(), Handle::allBackPropagatedObservables.end());
        }
        if (this->m_is_itcf) {
            full_list.insert(Handle::allItcfObservables.begin(), Handle::allItcfObservables.end());
        }

        // initialize Observable::Handle
        Observable::Handle::initialize(full_list);

        // ---------------------------------------------------
        //
        //      Set up dimensions for the observables
        //
        // ---------------------------------------------------
        const std::size_t nsite = ns;
        const std::size_t ntau = nitcf + 1;
        for (auto& it : this->m_obs_map) {
            // customize the dimension info for different observables
            // NOTE: empty input {} for 0-dimensional (scalar) observables
            const auto& obsname = it.first;
            auto& obs = it.second;
            if (obsname == "BackPropagatedOneRDM"         ) { obs->set_shape(this->m_nbin, {2, nsite, nsite}); }
            else if (obsname == "MomentumDistribution"    ) { obs->set_shape(this->m_nbin, {nsite}); }
            else if (obsname == "ImaginaryTimeGreenFunctions" ) { obs->set_shape(this->m_nbin, {ntau, 2, nsite, nsite}); }
            else if (obsname == "ImaginaryTimeGreenFunctionsK") { obs->set_shape(this->m_nbin, {ntau, nsite}); }
            else { obs->set_shape(this->m_nbin, {}); }
        }
    }

    // --------------------------------------------------------------------------------------------------------
    // 
    //                                    Mixed estimators
    //
    // --------------------------------------------------------------------------------------------------------

    void Handle::measure(const int step, const Population& population, const Hubbard& model, const Lattice& lattice,
                         const communicator& world)
    {
        const double total_weight = population.total_weight(world);
        if (!(total_weight > 0.0) || !std::isfinite(total_weight)) {
            throw AFQMC::PopulationCollapse(
                boost::str(boost::format("Estimator::Handle::measure(): "
                "population collapsed with total weight %g at step %d.") % total_weight % step)
            );
        }

        for (auto& obs : this->m_obs_list_mixed) {
            obs->clear_cache();
            obs->measure(population, *this, model, lattice);
            Utils::MPI::reduce_observable_cache(world, *obs);
            obs->normalize_cache();
            obs->push_cache_to_data(step);
        }
        ++this->m_nmeasure_calls;
    }

    // --------------------------------------------------------------------------------------------------------
    // 
    //                                Back-propagated estimators
    //
    // --------------------------------------------------------------------------------------------------------

    Handle::Orbitals Handle::compute_back_propagated_gf(const Walker& walker, const Propagator& propagator, const int nback_prop)
    {
        const auto& history = walker.history();
        if (nback_prop <= 0 || history.size() < static_cast<std::size_t>(nback_prop)) {
            throw std::runtime_error("Estimator::Handle::compute_back_propagated_gf(): incomplete field history.");
        }
        const std::size_t first = history.size() - nback_prop;
        const std::vector<Orbitals> left = propagator.back_propagate(walker, first);
        const Orbitals& right = history[first].phi_before;

        Orbitals gf;
        Matrix inv_ovlp;
        for (int spin = 0; spin < 2; ++spin) {
            StableNumerics::compute_mixed_gf(right[spin], left.front()[spin], inv_ovlp, gf[spin]);
        }
        return gf;
    }

    void Handle::back_propagate(const int step, const Population& population, const Propagator& propagator,
                                const Hubbard& model, const Lattice& lattice, const communicator& world)
    {
        if (!this->m_is_back_propagated) { return; }

        this->m_bp_gfs.assign(population.size(), Orbitals{});
        this->m_bp_mask.assign(population.size(), 0);
        for (std::size_t w = 0; w < population.size(); ++w) {
            const auto& walker = population[w];
            if (walker.is_alive() && walker.history().size() >= static_cast<std::size_t>(this->m_nback_prop)) {
                this->m_bp_gfs[w] = Handle::compute_back_propagated_gf(walker, propagator, this->m_nback_prop);
                this->m_bp_mask[w] = 1;
            }
        }

        for (auto& obs : this->m_obs_list_back_propagated) {
            obs->clear_cache();
            obs->measure(population, *this, model, lattice);
            Utils::MPI::reduce_observable_cache(world, *obs);
            obs->normalize_cache();
            obs->push_cache_to_data(step);
        }
        ++this->m_nback_prop_calls;

        // release the intermediates
        this->m_bp_gfs.clear();
        this->m_bp_mask.clear();
    }

    // --------------------------------------------------------------------------------------------------------
    // 
    //                          Imaginary-time correlation functions
    //
    //  With phi_k the orbitals at slice k (phi_0 the oldest retained orbitals) and L_k the trial state
    //  propagated backwards from the newest slice down to slice k, the equal-time Green's function
    //  G_kk = phi_k (L_k^+ phi_k)^-1 L_k^+ gives the greater Green's function
    //
    //      G(tau_k) = ( 1 - G_kk ) B(k,0) = B(k,0) ( 1 - G_00 ) ,    B(k,0) = B_{k-1} ... B_1 B_0 .
    //
    //  The direct evaluation G(tau_k) = B_{k-1} G(tau_{k-1}) loses accuracy for long imaginary times,
    //  the stable one recomputes G_kk from scratch and accumulates B(k,0) in the UDT form.
    //
    // --------------------------------------------------------------------------------------------------------

    std::vector<Handle::Orbitals> Handle::compute_itcf_gfs(const Walker& walker, const Propagator& propagator, const Hubbard& model,
                                                           const int nitcf, const bool stable)
    {
        const auto& history = walker.history();
        if (nitcf <= 0 || history.size() < static_cast<std::size_t>(nitcf)) {
            throw std::runtime_error("Estimator::Handle::compute_itcf_gfs(): incomplete field history.");
        }
        const int ns = model.ns();
        const Matrix identity = Matrix::Identity(ns, ns);
        const std::vector<Orbitals> left = propagator.back_propagate(walker, 0);

        // equal-time Green's functions at slice k
        Matrix inv_ovlp;
        auto equaltime_gf = [&](const std::size_t k, const int spin) -> Matrix {
            const Matrix& phi = (k < history.size())? history[k].phi_before[spin] : walker.phi(spin);
            Matrix gf;
            StableNumerics::compute_mixed_gf(phi, left[k][spin], inv_ovlp, gf);
            return gf;
        };

        std::vector<Orbitals> gfs(nitcf+1);
        for (int spin = 0; spin < 2; ++spin) {
            gfs[0][spin] = identity - equaltime_gf(0, spin);
        }

        if (!stable) {
            for (int k = 1; k <= nitcf; ++k) {
                for (int spin = 0; spin < 2; ++spin) {
                    gfs[k][spin] = gfs[k-1][spin];
                    model.multiply_B_from_left(gfs[k][spin], history[k-1].fields, spin);
                }
            }
            return gfs;
        }

        const int nstblz = propagator.nstblz();
        for (int spin = 0; spin < 2; ++spin) {
            // B(k,0) = chunk * UDT, where the chunk collects at most nstblz recent steps
            auto udt = StableNumerics::udt_identity(ns);
            Matrix chunk = identity;
            int nchunk = 0;
            for (int k = 1; k <= nitcf; ++k) {
                model.multiply_B_from_left(chunk, history[k-1].fields, spin);
                if (++nchunk == nstblz) {
                    StableNumerics::udt_multiply_from_left(chunk, udt);
                    chunk = identity;
                    nchunk = 0;
                }
                gfs[k][spin] = (identity - equaltime_gf(k, spin)) * chunk * StableNumerics::udt_to_matrix(udt);
            }
        }
        return gfs;
    }

    void Handle::itcf(const int step, const Population& population, const Propagator& propagator,
                      const Hubbard& model, const Lattice& lattice, const communicator& world)
    {
        if (!this->m_is_itcf) { return; }

        this->m_itcf_gfs.assign(population.size(), {});
        this->m_itcf_mask.assign(population.size(), 0);
        for (std::size_t w = 0; w < population.size(); ++w) {
            const auto& walker = population[w];
            if (walker.is_alive() && walker.history().size() >= this->history_capacity()) {
                this->m_itcf_gfs[w] = Handle::compute_itcf_gfs(walker, propagator, model, this->m_nitcf, this->m_itcf_stable);
                this->m_itcf_mask[w] = 1;
            }
        }

        for (auto& obs : this->m_obs_list_itcf) {
            obs->clear_cache();
            obs->measure(population, *this, model, lattice);
            Utils::MPI::reduce_observable_cache(world, *obs);
            obs->normalize_cache();
            obs->push_cache_to_data(step);
        }
        ++this->m_nitcf_calls;

        // release the intermediates
        this->m_itcf_gfs.clear();
        this->m_itcf_mask.clear();
    }

    // --------------------------------------------------------------------------------------------------------
    // 
    //                                  Statistical analysis
    //
    // --------------------------------------------------------------------------------------------------------

    double Handle::latest_energy() const
    {
        const auto& energy = this->find("Energy");
        if (energy.counts() == 0) {
            throw std::logic_error("Estimator::Handle::latest_energy(): no energy has been measured yet.");
        }
        return energy.data()(energy.counts()-1);
    }

    void Handle::finalize(const communicator& world)
    {
        for (auto& it : this->m_obs_map) {
            Utils::MPI::check_observable_counts(world, *it.second);
            it.second->analyse(this->m_nequilibrate);
        }
    }

    std::map<std::string, Estimate> Handle::results() const
    {
        std::map<std::string, Estimate> results;
        for (const auto& it : this->m_obs_map) {
            const auto& obs = *it.second;
            if (!obs.is_scalar()) { continue; }
            Estimate estimate;
            estimate.mean = obs.mean()();
            estimate.error = obs.stderr()();
            estimate.blocking_error = obs.blocking_error();
            estimate.count = obs.samples();
            results[it.first] = estimate;
        }
        return results;
    }
}
