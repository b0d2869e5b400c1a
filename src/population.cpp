/*
 *   population.cpp
 * 
 *     Created on: Jun 8, 2025
 * 
 */

#include "population.h"
#include "trial_wavefunction.h"
#include "hubbard.h"

#include <stdexcept>
#include <functional>
#include <boost/mpi.hpp>

namespace AFQMC {

    void Population::initialize(const int target_size, const TrialWavefunction& trial, const Hubbard& model, const std::size_t history_capacity)
    {
        if (target_size <= 0) {
            throw std::runtime_error("AFQMC::Population::initialize(): number of walkers should be positive.");
        }
        this->m_target_size = target_size;

        // the orbitals, overlap and local energy are identical for all walkers at the beginning
        Walker walker;
        walker.initialize(trial, model, history_capacity);
        this->m_walkers.assign(target_size, walker);
    }

    void Population::clear()
    {
        this->m_walkers.clear();
        this->m_walkers.shrink_to_fit();
    }

    double Population::local_weight() const
    {
        double weight = 0.0;
        for (const auto& walker : this->m_walkers) {
            weight += walker.weight();
        }
        return weight;
    }

    double Population::total_weight(const boost::mpi::communicator& world) const
    {
        double total = 0.0;
        boost::mpi::all_reduce(world, this->local_weight(), total, std::plus<double>());
        return total;
    }

    int Population::alive_count() const
    {
        int count = 0;
        for (const auto& walker : this->m_walkers) {
            if (walker.is_alive()) { ++count; }
        }
        return count;
    }

    std::vector<double> Population::weights() const
    {
        std::vector<double> weights;
        weights.reserve(this->m_walkers.size());
        for (const auto& walker : this->m_walkers) {
            weights.emplace_back(walker.weight());
        }
        return weights;
    }

    void Population::orthonormalize()
    {
        for (auto& walker : this->m_walkers) {
            if (walker.is_alive()) { walker.orthonormalize(); }
        }
    }

    void Population::replace(walker_list&& walkers)
    {
        this->m_walkers = std::move(walkers);
    }
}
