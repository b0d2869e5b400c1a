/*
 *   population_controller.cpp
 * 
 *     Created on: Jun 9, 2025
 * 
 */

#include "population_controller.h"
#include "population.h"
#include "random.h"

#include <cmath>
#include <numeric>
#include <algorithm>
#include <boost/format.hpp>
#include <boost/mpi.hpp>

namespace AFQMC {

    std::vector<int> PopulationController::comb(const std::vector<double>& weights, const double xi, const int nteeth)
    {
        const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
        if (!(total > 0.0) || !std::isfinite(total)) {
            throw PopulationCollapse(
                boost::str(boost::format("AFQMC::PopulationController::comb(): population collapsed with total weight %g.") % total)
            );
        }

        const double spacing = total / nteeth;
        std::vector<int> copies(weights.size(), 0);
        double cumulative = 0.0;
        int tooth = 0;
        int last_alive = -1;
        for (std::size_t i = 0; i < weights.size(); ++i) {
            cumulative += weights[i];
            if (weights[i] > 0.0) { last_alive = static_cast<int>(i); }
            while (tooth < nteeth && (tooth + xi) * spacing < cumulative) {
                ++copies[i];
                ++tooth;
            }
        }

        // teeth lost to rounding at the very end of the comb
        if (tooth < nteeth) {
            copies[last_alive] += nteeth - tooth;
        }
        return copies;
    }

    void PopulationController::reconfigure(Population& population, Utils::Random& rng, const boost::mpi::communicator& world)
    {
        ++this->m_ncalls;
        const int master = 0;
        const int rank = world.rank();
        const int nprocs = world.size();
        const int target = population.target_size();
        const int nteeth = target * nprocs;

        // global view of the walker weights, in the order of processes
        std::vector<std::vector<double>> gathered;
        boost::mpi::all_gather(world, population.weights(), gathered);

        std::vector<double> weights;
        std::vector<int> offsets(nprocs+1, 0);
        for (int proc = 0; proc < nprocs; ++proc) {
            weights.insert(weights.end(), gathered[proc].begin(), gathered[proc].end());
            offsets[proc+1] = offsets[proc] + gathered[proc].size();
        }
        const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
        if (!(total > 0.0) || !std::isfinite(total)) {
            throw PopulationCollapse(
                boost::str(boost::format("AFQMC::PopulationController::reconfigure(): "
                "population collapsed with total weight %g over %d walkers.") % total % weights.size())
            );
        }

        double xi = 0.0;
        if (rank == master) { xi = rng.uniform(); }
        boost::mpi::broadcast(world, xi, master);

        const std::vector<int> copies = PopulationController::comb(weights, xi, nteeth);

        // slot s of the new population is owned by process s / target at position s % target
        auto owner = [&](const int g) {
            return static_cast<int>(std::upper_bound(offsets.begin(), offsets.end(), g) - offsets.begin()) - 1;
        };

        Population::walker_list walkers(target);
        std::vector<boost::mpi::request> requests;
        int slot = 0;
        for (int g = 0; g < static_cast<int>(copies.size()); ++g) {
            const int src = owner(g);
            for (int c = 0; c < copies[g]; ++c, ++slot) {
                const int dst = slot / target;
                const int pos = slot % target;
                if (src == rank && dst == rank) {
                    walkers[pos] = population[g - offsets[rank]];
                }
                else if (dst == rank) {
                    requests.push_back(world.irecv(src, pos, walkers[pos]));
                }
                else if (src == rank) {
                    requests.push_back(world.isend(dst, pos, population[g - offsets[rank]]));
                }
            }
        }
        boost::mpi::wait_all(requests.begin(), requests.end());

        const double weight = total / nteeth;
        for (auto& walker : walkers) {
            walker.weight() = weight;
        }
        population.replace(std::move(walkers));
    }
}
