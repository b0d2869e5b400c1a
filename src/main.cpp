/*
 *   main.cpp
 *
 *     Created on: Jun 15, 2025
 *
 */

#include <string>
#include <iostream>
#include <fstream>
#include <exception>
#include <map>
#include <cstdlib>
#include <unistd.h>

#include <mpi.h>
#include <boost/mpi.hpp>
#include <boost/format.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/program_options.hpp>

#include "afqmc_driver.h"
#include "afqmc_params.hpp"
#include "afqmc_parser.hpp"
#include "afqmc_io.hpp"
#include "estimator_handle.h"
#include "observable.hpp"

namespace {

    // file stems of the observable outputs
    std::string output_stem(const std::string& obsname)
    {
        static const std::map<std::string, std::string> stems = {
            {"Energy",                          "energy"},
            {"KineticEnergy",                   "kinetic"},
            {"PotentialEnergy",                 "potential"},
            {"MeanWeight",                      "weight"},
            {"AliveFraction",                   "alive"},
            {"AveragePhase",                    "phase"},
            {"DoubleOccupancy",                 "double_occu"},
            {"BackPropagatedEnergy",            "bp_energy"},
            {"BackPropagatedKineticEnergy",     "bp_kinetic"},
            {"BackPropagatedPotentialEnergy",   "bp_potential"},
            {"BackPropagatedOneRDM",            "bp_rdm"},
            {"MomentumDistribution",            "nk"},
            {"ImaginaryTimeGreenFunctions",     "gf"},
            {"ImaginaryTimeGreenFunctionsK",    "gfk"},
        };
        const auto it = stems.find(obsname);
        return (it != stems.end())? it->second : obsname;
    }

    int run_simulation(int argc, char* argv[], boost::mpi::environment& env, const boost::mpi::communicator& world)
    {
        const int master = 0;
        const int rank = world.rank();

        // -------------------------------------------------------------------------------------------------------------
        //                                               Program options
        // -------------------------------------------------------------------------------------------------------------
        std::string config;
        std::string output;

        boost::program_options::options_description opts("Program options");
        boost::program_options::variables_map vm;

        opts.add_options()
            ("help,h", "display this information.")
            ("config,c",
             boost::program_options::value<std::string>(&config)->default_value("./example/config.toml"),
             "path of the toml configuration file, default: ./example/config.toml.")
            ("output,o",
             boost::program_options::value<std::string>(&output)->default_value("./example"),
             "path of the folder where the program output are saved, default: ./example.");

        // parse the command line options
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, opts), vm);
        boost::program_options::notify(vm);

        // show the helping messages
        if (vm.count("help")) {
            if (rank == master) { std::cerr << argv[0] << "\n" << opts << std::endl; }
            return 0;
        }

        // initialize the output folder, i.e. create it if not exist
        if (rank == master) {
            if (access(output.c_str(), 0) != 0) {
                const std::string command = "mkdir -p " + output;
                if (system(command.c_str()) != 0) {
                    throw std::runtime_error(
                        boost::str(boost::format("main(): fail to creat folder at '%s'.") % output)
                    );
                }
            }
        }

        // -------------------------------------------------------------------------------------------------------------
        //                                        Output current date and time
        // -------------------------------------------------------------------------------------------------------------
        if (rank == master) {
            const auto current_time = boost::posix_time::second_clock::local_time();
            std::cout << boost::format(">> Current time: %s\n") % current_time << std::endl;
        }

        // -------------------------------------------------------------------------------------------------------------
        //                                        Output MPI and hardware info
        // -------------------------------------------------------------------------------------------------------------
        if (rank == master) {
            boost::format fmt_mpi(">> Distribute tasks to %s processors, with the master processor being %s.\n");
            std::cout << fmt_mpi % world.size() % env.processor_name() << std::endl;
        }

        // -------------------------------------------------------------------------------------------------------------
        //                                              AFQMC simulation
        // -------------------------------------------------------------------------------------------------------------
        // parse params from the configuration file
        AFQMC::Params params;
        AFQMC::Parser::parse_toml_config(config, params);

        // the driver builds lattice, model, trial wavefunction, walkers and estimators
        AFQMC::Driver driver(params, world);

        if (rank == master) {
            std::cout << ">> Initialization finished.\n\n"
                      << ">> The simulation is going to get started with parameters below:\n" << std::endl;
            AFQMC::IO::print_initialization_info(std::cout, driver.params(), driver.handle(), world.size());
            std::cout << boost::format(">> Trial energy: %.8f\n") % driver.trial().energy() << std::endl;

            if (params.nequilibrate >= params.nsteps) {
                std::cerr << boost::format(">> Warning: no measurement survives the equilibration of %d steps.\n")
                             % params.nequilibrate << std::endl;
            }
        }

        // set up progress bar
        AFQMC::Driver::show_progress_bar((rank == master));
        AFQMC::Driver::progress_bar_format(50, '=', ' ');
        AFQMC::Driver::set_refresh_rate(10);

        // ----------------------------------  Crucial steps of the simulation  ----------------------------------------
        driver.run();
        driver.finalize();

        // output the ending info
        if (rank == master) {
            AFQMC::IO::print_afqmc_summary(std::cout, driver);
            if (driver.total_kills() > 0) {
                std::cerr << boost::format(">> Warning: %d walkers were killed by vanishing overlaps or non-finite weights.\n")
                             % driver.total_kills() << std::endl;
            }
        }

        // ------------------------------------  Output measurement results  -------------------------------------------
        if (rank == master) {
            std::ofstream ofile;
            auto reopen = [](std::ofstream& ofile, std::string file, std::ios_base::openmode mode) {
                ofile.close();
                ofile.clear();
                ofile.open(file, mode);
            };

            const auto& handle = driver.handle();
            reopen(ofile, std::string(output+"/estimates.out"), std::ios::out|std::ios::trunc);
            AFQMC::IO::print_estimates_series(ofile, handle);

            for (const auto& obsname : handle.names()) {
                const auto& obs = handle.find(obsname);
                const std::string stem = output_stem(obsname);
                reopen(ofile, std::string(output+"/"+stem+".out"), std::ios::out|std::ios::trunc);
                AFQMC::IO::print_observable(ofile, obs, true);
                reopen(ofile, std::string(output+"/"+stem+".bins.out"), std::ios::out|std::ios::trunc);
                AFQMC::IO::print_observable_data(ofile, obs, true);
                if (!obs.is_scalar()) {
                    AFQMC::IO::save_observable_data_to_file(obs, std::string(output+"/"+stem+".npy"), "npy");
                }
            }

            // output momentum list and imaginary-time grids
            reopen(ofile, std::string(output+"/momenta.out"), std::ios::out|std::ios::trunc);
            AFQMC::IO::print_momentum_list(ofile, driver.lattice());

            if (handle.isItcf()) {
                reopen(ofile, std::string(output+"/tgrids.out"), std::ios::out|std::ios::trunc);
                AFQMC::IO::print_imaginary_time_grids(ofile, driver.params());
            }

            std::cout << boost::format(">> See the results under folder '%s'.") % output << std::endl;
        }
        return 0;
    }
}

int main(int argc, char* argv[]) {

    // -------------------------------------------------------------------------------------------------------------
    //                                         Initialize MPI environment
    // -------------------------------------------------------------------------------------------------------------
    boost::mpi::environment env(argc, argv);
    boost::mpi::communicator world;

    // an exception escaping on a single process would leave the others waiting in a collective call
    try {
        return run_simulation(argc, argv, env, world);
    }
    catch (const std::exception& e) {
        std::cerr << boost::format(">> Error on processor %d: %s") % world.rank() % e.what() << std::endl;
        world.abort(1);
    }
    return 1;
}
