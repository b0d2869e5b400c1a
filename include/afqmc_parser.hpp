/*
 *   afqmc_parser.hpp
 * 
 *     Created on: Jun 2, 2025
 * 
 */

#pragma once
#ifndef AFQMC_PARSER_HPP
#define AFQMC_PARSER_HPP

#include <string_view>
#include <string>
#include <stdexcept>
#include <vector>
#include <set>
#include <cmath>
#include <cstdint>
#include <algorithm>
#include <boost/format.hpp>
#include <toml++/toml.hpp>

#include "afqmc_params.hpp"
#include "observable_handle.h"

namespace AFQMC {
    namespace Parser {

        template <typename T>
        void range_check(const T val, const std::string name, const T lower_bound)
        {
            if (val < lower_bound) {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Parser::range_check<T>(): '%s' out of range.") % name)
                );
            }
        }

        template <typename T>
        void range_check(const T val, const std::string name, const T lower_bound, const T upper_bound)
        {
            if (val < lower_bound || val > upper_bound) {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Parser::range_check<T>(): '%s' out of range.") % name)
                );
            }
        }

        inline void parse_toml_table(const toml::table& config, AFQMC::Params& params)
        {
            // ------------------------------------------  model  ----------------------------------------------
            params.model_name = config["model"]["name"].value_or("Hubbard");
            params.t = config["model"]["t"].value_or(1.0);
            params.u = config["model"]["U"].value_or(4.0);
            params.nx = config["model"]["nx"].value_or(4);
            params.ny = config["model"]["ny"].value_or(4);
            params.ns = params.nx * params.ny;

            params.ktwist = {0.0, 0.0};
            if (auto ktwist = config["model"]["ktwist"]; ktwist) {
                const toml::array* ktwist_arr = ktwist.as_array();
                if (!ktwist_arr || ktwist_arr->size() != 2) {
                    throw std::runtime_error("AFQMC::Parser::parse_toml_config(): invalid input twist angles 'ktwist'.");
                }
                for (std::size_t d = 0; d < 2; ++d) {
                    const auto val = ktwist_arr->get(d)->value<double>();
                    if (!val) {
                        throw std::runtime_error("AFQMC::Parser::parse_toml_config(): invalid input twist angles 'ktwist'.");
                    }
                    params.ktwist[d] = *val;
                }
            }

            const auto nup = config["model"]["nup"].value<int>();
            const auto ndown = config["model"]["ndown"].value<int>();
            if (!nup || !ndown) {
                throw std::runtime_error("AFQMC::Parser::parse_toml_config(): "
                "particle numbers 'nup' and 'ndown' are required.");
            }
            params.nup = *nup;
            params.ndown = *ndown;

            // ---------------------------------------  qmc_options  -------------------------------------------
            params.method = config["qmc_options"]["method"].value_or("CPMC");
            params.dt = config["qmc_options"]["dt"].value_or(0.05);
            params.nsteps = config["qmc_options"]["nsteps"].value_or(1000);
            params.nmeasure = config["qmc_options"]["nmeasure"].value_or(10);
            params.nwalkers = config["qmc_options"]["nwalkers"].value_or(100);
            params.npop_control = config["qmc_options"]["npop_control"].value_or(10);
            params.nstblz = config["qmc_options"]["nstblz"].value_or(5);
            params.nequilibrate = config["qmc_options"]["nequilibrate"].value_or(0);
            params.nupdate_shift = config["qmc_options"]["nupdate_shift"].value_or(params.nmeasure);

            const auto rng_seed = config["qmc_options"]["rng_seed"].value<std::int64_t>();
            params.has_rng_seed = static_cast<bool>(rng_seed);
            if (rng_seed) {
                range_check(*rng_seed, "rng_seed", std::int64_t(0));
                params.rng_seed = static_cast<std::uint64_t>(*rng_seed);
            }

            // -----------------------------------  trial_wavefunction  ----------------------------------------
            params.trial_name = config["trial_wavefunction"]["name"].value_or("free_electron");
            params.ueff = config["trial_wavefunction"]["ueff"].value_or(0.4);
            params.ninitial = config["trial_wavefunction"]["ninitial"].value_or(10);
            params.nconv = config["trial_wavefunction"]["nconv"].value_or(5000);
            params.deps = config["trial_wavefunction"]["deps"].value_or(1e-8);
            params.alpha = config["trial_wavefunction"]["alpha"].value_or(0.5);

            // ---------------------------------------  propagator  --------------------------------------------
            params.hubbard_stratonovich = config["propagator"]["hubbard_stratonovich"].value_or("discrete");
            if (!(params.dt > 0.0)) {
                throw std::runtime_error("AFQMC::Parser::range_check<T>(): 'dt' out of range.");
            }
            params.weight_update = config["propagator"]["weight_update"].value_or("hybrid");
            params.energy_bound = config["propagator"]["energy_bound"].value_or(std::sqrt(2.0/params.dt));

            // ----------------------------------------  estimates  --------------------------------------------
            params.nback_prop = config["estimates"]["back_propagated"]["nback_prop"].value_or(0);
            params.itcf_stable = config["estimates"]["itcf"]["stable"].value_or(true);
            params.itcf_tmax = config["estimates"]["itcf"]["tmax"].value_or(0.0);
            params.is_itcf = (params.itcf_tmax > 0.0);
            params.nitcf = params.is_itcf ? static_cast<int>(std::lround(params.itcf_tmax / params.dt)) : 0;

            std::vector<std::string> observables;
            auto observable_node = config["estimates"]["observables"];
            if (!observable_node) {
                observables.emplace_back("all");
            }
            else if (observable_node.is_string()) {
                observables.emplace_back(observable_node.value_or(""));
            }
            else if (const toml::array* observable_arr = observable_node.as_array();
                     observable_arr && observable_arr->is_homogeneous<std::string>()) {
                observables.reserve(observable_arr->size());
                for (auto&& el : *observable_arr) {
                    observables.emplace_back(el.value_or(""));
                }
            }
            else {
                throw std::runtime_error("AFQMC::Parser::parse_toml_config(): invalid input observables.");
            }

            // deal with special keywords (all/All, none/None)
            bool is_all  = (std::find(observables.begin(), observables.end(), "all") != observables.end()
                         || std::find(observables.begin(), observables.end(), "All") != observables.end());
            bool is_none = (std::find(observables.begin(), observables.end(), "none") != observables.end()
                         || std::find(observables.begin(), observables.end(), "None") != observables.end());
            if ( is_all && !is_none) { params.observable_list = Observable::Handle::allMixedObservables; }
            if (!is_all &&  is_none) { params.observable_list = {}; }
            if (!is_all && !is_none) { params.observable_list = std::set<std::string>(observables.begin(), observables.end()); }
            if ( is_all &&  is_none) {
                throw std::runtime_error("AFQMC::Parser::parse_toml_config(): "
                "recieved conflict observable options 'all/All' and 'none/None'.");
            }

            // check the options and the range of input parameters
            if (params.model_name != "Hubbard") {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Parser::parse_toml_config(): unsupported model '%s'.") % params.model_name)
                );
            }
            if (params.method != "CPMC") {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Parser::parse_toml_config(): unsupported method '%s'.") % params.method)
                );
            }
            if (params.trial_name != "free_electron" && params.trial_name != "UHF") {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Parser::parse_toml_config(): unsupported trial wavefunction '%s'.") % params.trial_name)
                );
            }
            if (params.hubbard_stratonovich != "discrete" && params.hubbard_stratonovich != "continuous") {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Parser::parse_toml_config(): unsupported hubbard_stratonovich '%s'.")
                        % params.hubbard_stratonovich)
                );
            }
            if (params.weight_update != "hybrid" && params.weight_update != "local_energy") {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Parser::parse_toml_config(): unsupported weight_update '%s'.")
                        % params.weight_update)
                );
            }
            range_check(params.u, "U", 0.);
            range_check(params.nx, "nx", 1);
            range_check(params.ny, "ny", 1);
            range_check(params.nup, "nup", 0, params.ns);
            range_check(params.ndown, "ndown", 0, params.ns);
            range_check(params.nsteps, "nsteps", 0);
            range_check(params.nmeasure, "nmeasure", 1);
            range_check(params.nwalkers, "nwalkers", 1);
            range_check(params.npop_control, "npop_control", 1);
            range_check(params.nstblz, "nstblz", 1);
            range_check(params.nequilibrate, "nequilibrate", 0);
            range_check(params.nupdate_shift, "nupdate_shift", 1);
            range_check(params.ninitial, "ninitial", 1);
            range_check(params.nconv, "nconv", 1);
            range_check(params.deps, "deps", 0.);
            range_check(params.alpha, "alpha", 0., 1.);
            if (!(params.energy_bound > 0.0)) {
                throw std::runtime_error("AFQMC::Parser::range_check<T>(): 'energy_bound' out of range.");
            }
            range_check(params.nback_prop, "nback_prop", 0);
            range_check(params.itcf_tmax, "tmax", 0.);
        }

        // parse the configuration file
        inline void parse_toml_config(std::string_view toml_config, AFQMC::Params& params)
        {
            toml::table config;
            try { config = toml::parse_file(toml_config); }
            catch (const toml::parse_error& err) {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Parser::parse_toml_config(): parsing failed.\n%s") % err)
                );
            }
            parse_toml_table(config, params);
        }

        // parse the configuration from an in-memory document
        inline void parse_toml_string(std::string_view toml_text, AFQMC::Params& params)
        {
            toml::table config;
            try { config = toml::parse(toml_text); }
            catch (const toml::parse_error& err) {
                throw std::runtime_error(
                    boost::str(boost::format("AFQMC::Parser::parse_toml_string(): parsing failed.\n%s") % err)
                );
            }
            parse_toml_table(config, params);
        }
    }
}

#endif
