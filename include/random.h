/*
 *   random.h
 * 
 *     Created on: Jun 2, 2025
 * 
 */

#pragma once
#ifndef AFQMC_UTILS_RANDOM_H
#define AFQMC_UTILS_RANDOM_H

#include <random>
#include <cstdint>

namespace boost { namespace mpi { class communicator; } }

namespace Utils {

    // ---------------------------  Utils::Random, an explicit random stream owned by each process  --------------------------
    class Random {
        public:
            using engine_type = std::mt19937_64;
            using seed_type = std::uint64_t;

            Random() = default;
            explicit Random(const seed_type seed) { this->set_seed(seed); }

            // explicitly setup seeds for the random engine
            // e.g. set_seed(123) with fixed seed for debug usage
            // or set_seed(base+rank) to setup different seeds for different MPI processors
            void set_seed(const seed_type seed);
            const seed_type seed() const { return this->m_seed; }

            engine_type& engine() { return this->m_engine; }

            // draw a uniform number from [0,1) and a standard normal number respectively
            double uniform();
            double normal();

            // derive the seed of the current process as base + rank,
            // if no base seed is given, the master draws one from the clock and broadcasts it.
            static seed_type process_seed(const boost::mpi::communicator& world, const seed_type base);
            static seed_type process_seed(const boost::mpi::communicator& world);

        private:
            seed_type m_seed{0};
            engine_type m_engine{};
            std::uniform_real_distribution<double> m_uniform{0.0, 1.0};
            std::normal_distribution<double> m_normal{0.0, 1.0};
    };

} // namespace Utils

#endif // AFQMC_UTILS_RANDOM_H
