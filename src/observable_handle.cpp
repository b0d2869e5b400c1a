/*
 *   observable_handle.cpp
 * 
 *     Created on: Jun 10, 2025
 * 
 */

#include "observable_handle.h"
#include "observable.hpp"
#include "observable_methods.hpp"
#include <stdexcept>
#include <boost/format.hpp>

namespace Observable {

    std::map<Handle::observable_name, Handle::metadata_type> Handle::m_metadata = {
        {"Energy",                          {"Mixed total energy",                          "mixed"          }},
        {"KineticEnergy",                   {"Mixed kinetic energy",                        "mixed"          }},
        {"PotentialEnergy",                 {"Mixed potential energy",                      "mixed"          }},
        {"MeanWeight",                      {"Mean walker weight",                          "mixed"          }},
        {"AliveFraction",                   {"Fraction of alive walkers",                   "mixed"          }},
        {"AveragePhase",                    {"Average walker phase",                        "mixed"          }},
        {"DoubleOccupancy",                 {"Mixed double occupancy",                      "mixed"          }},
        {"BackPropagatedEnergy",            {"Back-propagated total energy",                "back_propagated"}},
        {"BackPropagatedKineticEnergy",     {"Back-propagated kinetic energy",              "back_propagated"}},
        {"BackPropagatedPotentialEnergy",   {"Back-propagated potential energy",            "back_propagated"}},
        {"BackPropagatedOneRDM",            {"Back-propagated one-body density matrix",     "back_propagated"}},
        {"MomentumDistribution",            {"Back-propagated momentum distribution",       "back_propagated"}},
        {"ImaginaryTimeGreenFunctions",     {"Imaginary-time Green's functions",            "itcf"           }},
        {"ImaginaryTimeGreenFunctionsK",    {"Momentum-resolved imaginary-time Green's functions", "itcf"    }},
    };

    Handle::observable_name_list Handle::allMixedObservables = {
        "Energy",
        "KineticEnergy",
        "PotentialEnergy",
        "MeanWeight",
        "AliveFraction",
        "AveragePhase",
        "DoubleOccupancy",
    };

    Handle::observable_name_list Handle::allBackPropagatedObservables = {
        "BackPropagatedEnergy",
        "BackPropagatedKineticEnergy",
        "BackPropagatedPotentialEnergy",
        "BackPropagatedOneRDM",
        "MomentumDistribution",
    };

    Handle::observable_name_list Handle::allItcfObservables = {
        "ImaginaryTimeGreenFunctions",
        "ImaginaryTimeGreenFunctionsK",
    };

    Handle::observable_name_list Handle::allObservables = {
        "Energy",
        "KineticEnergy",
        "PotentialEnergy",
        "MeanWeight",
        "AliveFraction",
        "AveragePhase",
        "DoubleOccupancy",
        "BackPropagatedEnergy",
        "BackPropagatedKineticEnergy",
        "BackPropagatedPotentialEnergy",
        "BackPropagatedOneRDM",
        "MomentumDistribution",
        "ImaginaryTimeGreenFunctions",
        "ImaginaryTimeGreenFunctionsK",
    };

    bool Handle::check_validity(const observable_name name)
    {
        return (Handle::allObservables.find(name) != Handle::allObservables.end());
    }

    bool Handle::is_mixed(const Handle::observable_name name) {
        if (!Handle::check_validity(name)) {
            throw std::invalid_argument("Observable::Handle::is_mixed(): invalid observable name.");
        }
        return (Handle::m_metadata[name][1] == "mixed");
    }

    bool Handle::is_back_propagated(const Handle::observable_name name) {
        if (!Handle::check_validity(name)) {
            throw std::invalid_argument("Observable::Handle::is_back_propagated(): invalid observable name.");
        }
        return (Handle::m_metadata[name][1] == "back_propagated");
    }

    bool Handle::is_itcf(const Handle::observable_name name) {
        if (!Handle::check_validity(name)) {
            throw std::invalid_argument("Observable::Handle::is_itcf(): invalid observable name.");
        }
        return (Handle::m_metadata[name][1] == "itcf");
    }

    void Handle::initialize(const observable_name_list& list)
    {
        // release the pointers and clear the observable list/map (in case) 
        this->m_obs_map.clear();
        this->m_obs_list_mixed.clear();
        this->m_obs_list_back_propagated.clear();
        this->m_obs_list_itcf.clear();

        // redundant objects are automatically removed due to the input list type (std::set)
        // check the validity of the input
        for (const auto& obsname : list) {
            if (!this->check_validity(obsname)) {
                throw std::invalid_argument(
                    boost::str(boost::format("Observable::Handle::initialize(): "
                    "received invalid observable '%s' from the input.") % obsname)
                );
            }
        }

        // create instances for observables
        for (const auto& obsname : list) {
            ptr_observable ptrobs = std::make_shared<observable>();
            const auto obsdesc = Handle::m_metadata[obsname][0];
            ptrobs->set_name_and_desc(obsname, obsdesc);

            // link to methods
            if (obsname == "Energy"                       ) { ptrobs->link2method(Methods::measure_energy); }
            if (obsname == "KineticEnergy"                ) { ptrobs->link2method(Methods::measure_kinetic_energy); }
            if (obsname == "PotentialEnergy"              ) { ptrobs->link2method(Methods::measure_potential_energy); }
            if (obsname == "MeanWeight"                   ) { ptrobs->link2method(Methods::measure_mean_weight); }
            if (obsname == "AliveFraction"                ) { ptrobs->link2method(Methods::measure_alive_fraction); }
            if (obsname == "AveragePhase"                 ) { ptrobs->link2method(Methods::measure_average_phase); }
            if (obsname == "DoubleOccupancy"              ) { ptrobs->link2method(Methods::measure_double_occupancy); }
            if (obsname == "BackPropagatedEnergy"         ) { ptrobs->link2method(Methods::measure_back_propagated_energy); }
            if (obsname == "BackPropagatedKineticEnergy"  ) { ptrobs->link2method(Methods::measure_back_propagated_kinetic_energy); }
            if (obsname == "BackPropagatedPotentialEnergy") { ptrobs->link2method(Methods::measure_back_propagated_potential_energy); }
            if (obsname == "BackPropagatedOneRDM"         ) { ptrobs->link2method(Methods::measure_back_propagated_one_rdm); }
            if (obsname == "MomentumDistribution"         ) { ptrobs->link2method(Methods::measure_momentum_distribution); }
            if (obsname == "ImaginaryTimeGreenFunctions"  ) { ptrobs->link2method(Methods::measure_imaginary_time_green_functions); }
            if (obsname == "ImaginaryTimeGreenFunctionsK" ) { ptrobs->link2method(Methods::measure_imaginary_time_green_functions_k); }

            if (Handle::is_mixed(obsname)) { this->m_obs_list_mixed.emplace_back(ptrobs); }
            if (Handle::is_back_propagated(obsname)) { this->m_obs_list_back_propagated.emplace_back(ptrobs); }
            if (Handle::is_itcf(obsname)) { this->m_obs_list_itcf.emplace_back(ptrobs); }
            this->m_obs_map[obsname] = ptrobs;
        }
    }

    bool Handle::is_found(const Handle::observable_name name) const
    {
        return (this->m_obs_map.find(name) != this->m_obs_map.end());
    }

    const Handle::observable& Handle::find(const observable_name name) const
    {
        const auto it = this->m_obs_map.find(name);
        if (it == this->m_obs_map.end()) {
            throw std::invalid_argument(
                boost::str(boost::format("Observable::Handle::find(): no observable '%s' is being measured.") % name)
            );
        }
        return *(it->second);
    }

    Handle::observable_name_list Handle::names() const
    {
        observable_name_list names;
        for (const auto& it : this->m_obs_map) { names.insert(it.first); }
        return names;
    }
}
