/*
 *   population.h
 * 
 *     Created on: Jun 8, 2025
 * 
 */

#pragma once
#ifndef AFQMC_POPULATION_H
#define AFQMC_POPULATION_H

#include <vector>
#include <cstddef>
#include "walker.h"

namespace boost { namespace mpi { class communicator; } }

namespace AFQMC {

    // ---------------------------------------------  AFQMC::Population  --------------------------------------------------
    // walkers owned by the current process, restored to exactly target_size walkers by every population control.
    class Population {
        public:
            using Hubbard = Model::Hubbard;
            using TrialWavefunction = Trial::Wavefunction;
            using walker_list = std::vector<Walker>;
            using iterator = walker_list::iterator;
            using const_iterator = walker_list::const_iterator;

            // -------------------------------------------  Initializations  --------------------------------------------------
            // seed target_size walkers from the trial wavefunction
            void initialize(const int target_size, const TrialWavefunction& trial, const Hubbard& model, const std::size_t history_capacity);

            // release all walkers
            void clear();

            // ----------------------------------------------  Interfaces  ----------------------------------------------------
            int target_size() const { return this->m_target_size; }
            std::size_t size() const { return this->m_walkers.size(); }
            bool empty() const { return this->m_walkers.empty(); }

            Walker& operator[](const std::size_t i) { return this->m_walkers[i]; }
            const Walker& operator[](const std::size_t i) const { return this->m_walkers[i]; }
            iterator begin() { return this->m_walkers.begin(); }
            iterator end() { return this->m_walkers.end(); }
            const_iterator begin() const { return this->m_walkers.begin(); }
            const_iterator end() const { return this->m_walkers.end(); }
            const walker_list& walkers() const { return this->m_walkers; }

            // sum of the (real, non-negative) walker weights on the current process, and over all processes
            double local_weight() const;
            double total_weight(const boost::mpi::communicator& world) const;

            // number of walkers with positive weights on the current process
            int alive_count() const;

            // weights of the local walkers in order
            std::vector<double> weights() const;

            // ---------------------------------------------  Operations  -----------------------------------------------------
            void orthonormalize();
            void replace(walker_list&& walkers);

        private:
            int m_target_size{};
            walker_list m_walkers{};
    };
}

#endif
