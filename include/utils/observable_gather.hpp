/*
 *   observable_gather.hpp
 * 
 *     Created on: Jun 12, 2025
 *   
 *   This file includes subroutines for reducing the per-measurement caches of Observable::Observable
 *   instances among a set of processors through MPI communication,
 *   and for checking that all processors collected the same number of bins.
 */

#pragma once
#ifndef UTILS_OBSERVABLE_GATHER_HPP
#define UTILS_OBSERVABLE_GATHER_HPP

#include <vector>
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <boost/mpi.hpp>
#include <boost/format.hpp>
#include "observable.hpp"

namespace Utils {
    namespace MPI {
        
        template <typename _Scalar> using observable = Observable::Observable<_Scalar>;
        using communicator = boost::mpi::communicator;

        // sum the numerator (cache) and the norm of the observable over all processors,
        // after which every processor holds the identical global values.
        template <typename _Scalar>
        void reduce_observable_cache(const communicator& world, observable<_Scalar>& obs)
        {
            std::vector<_Scalar> local(obs.cache().begin(), obs.cache().end());
            local.push_back(obs.norm());

            std::vector<_Scalar> global(local.size());
            boost::mpi::all_reduce(world, local.data(), static_cast<int>(local.size()), global.data(), std::plus<_Scalar>());

            std::copy(global.begin(), global.end()-1, obs.cache().begin());
            obs.norm() = global.back();
        }

        // the bins are filled collectively, so that the number of bins must agree among all processors
        template <typename _Scalar>
        void check_observable_counts(const communicator& world, const observable<_Scalar>& obs)
        {
            const std::size_t local = obs.counts();
            std::size_t min_count = 0, max_count = 0;
            boost::mpi::all_reduce(world, local, min_count, boost::mpi::minimum<std::size_t>());
            boost::mpi::all_reduce(world, local, max_count, boost::mpi::maximum<std::size_t>());
            if (min_count != max_count) {
                throw std::runtime_error(
                    boost::str(boost::format("Utils::MPI::check_observable_counts(): "
                    "inconsistent number of bins of '%s' among processors (%d to %d).") % obs.name() % min_count % max_count)
                );
            }
        }

    } // namespace MPI
} // namespace Utils

#endif // UTILS_OBSERVABLE_GATHER_HPP
