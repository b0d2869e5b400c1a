/*
 *   random.cpp
 * 
 *     Created on: Jun 2, 2025
 * 
 */

#include "random.h"
#include <chrono>
#include <boost/mpi.hpp>

namespace Utils {

    void Random::set_seed(const seed_type seed)
    {
        this->m_seed = seed;
        this->m_engine.seed(seed);
        this->m_uniform.reset();
        this->m_normal.reset();
    }

    double Random::uniform() { return this->m_uniform(this->m_engine); }

    double Random::normal() { return this->m_normal(this->m_engine); }

    Random::seed_type Random::process_seed(const boost::mpi::communicator& world, const seed_type base)
    {
        return base + static_cast<seed_type>(world.rank());
    }

    Random::seed_type Random::process_seed(const boost::mpi::communicator& world)
    {
        const int master = 0;
        seed_type base = 0;
        if (world.rank() == master) {
            base = static_cast<seed_type>(std::chrono::system_clock::now().time_since_epoch().count());
        }
        boost::mpi::broadcast(world, base, master);
        return Random::process_seed(world, base);
    }

} // namespace Utils
