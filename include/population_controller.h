/*
 *   population_controller.h
 * 
 *     Created on: Jun 9, 2025
 * 
 */

#pragma once
#ifndef AFQMC_POPULATION_CONTROLLER_H
#define AFQMC_POPULATION_CONTROLLER_H

#include <vector>
#include <stdexcept>

namespace boost { namespace mpi { class communicator; } }
namespace Utils { class Random; }

namespace AFQMC {

    class Population;

    // raised identically on every process when the total walker weight vanishes or diverges
    class PopulationCollapse : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
    };

    // ----------------------------------------  AFQMC::PopulationController  -----------------------------------------------
    //
    //  Comb reconfiguration of the distributed population. With the total weight W over all processes
    //  and the global target M = target_size * nprocs, a comb of M teeth at positions (k + xi) W / M, k = 0, ..., M-1,
    //  is laid over the cumulative weights, where the offset xi in [0,1) is drawn on the master and broadcast.
    //  A walker receives as many copies as teeth falling into its weight interval, every copy carrying the weight W / M,
    //  so the total weight is conserved and E[copies] = weight * M / W.
    //  The M copies are dealt to the processes in consecutive blocks of target_size, migrating walkers where needed.
    //
    class PopulationController {
        public:
            // number of copies of each walker under the comb
            static std::vector<int> comb(const std::vector<double>& weights, const double xi, const int nteeth);

            void reconfigure(Population& population, Utils::Random& rng, const boost::mpi::communicator& world);

            int calls() const { return this->m_ncalls; }

        private:
            int m_ncalls{};
    };
}

#endif
