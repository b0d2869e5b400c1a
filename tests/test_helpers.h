/*
 *   test_helpers.h
 *
 *     Created on: Jun 18, 2025
 *
 */

#pragma once
#ifndef AFQMC_TEST_HELPERS_H
#define AFQMC_TEST_HELPERS_H

#include <string>
#include <boost/format.hpp>
#include "afqmc_params.hpp"
#include "afqmc_parser.hpp"

namespace AFQMC {
    namespace Testing {

        // parameters of a small half-filled 2x2 Hubbard cluster with the default time step 0.05,
        // extra toml lines are appended to the corresponding tables
        inline Params small_cluster(const std::string& qmc_options = "", const std::string& estimates = "",
                                    const std::string& model = "", const std::string& propagator = "")
        {
            const std::string config = boost::str(boost::format(
                "[model]\n"
                "name = \"Hubbard\"\n"
                "nx = 2\n"
                "ny = 2\n"
                "nup = 2\n"
                "ndown = 2\n"
                "%s\n"
                "[qmc_options]\n"
                "%s\n"
                "[trial_wavefunction]\n"
                "name = \"free_electron\"\n"
                "[propagator]\n"
                "%s\n"
                "[estimates]\n"
                "%s\n") % model % qmc_options % propagator % estimates);
            Params params;
            Parser::parse_toml_string(config, params);
            return params;
        }
    }
}

#endif
