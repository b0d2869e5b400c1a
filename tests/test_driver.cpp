/*
 *   test_driver.cpp
 *
 *     Created on: Jun 21, 2025
 *
 */

#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <boost/mpi/communicator.hpp>
#include "afqmc_driver.h"
#include "afqmc_params.hpp"
#include "test_helpers.h"

class DriverTest : public ::testing::Test {
    protected:
        static void SetUpTestSuite() { AFQMC::Driver::show_progress_bar(false); }

        boost::mpi::communicator world;
};

TEST_F(DriverTest, CadenceOfPopulationControlAndMeasurements) {
    const auto params = AFQMC::Testing::small_cluster(
        "nsteps = 1000\nnmeasure = 10\nnpop_control = 10\nnwalkers = 30\nrng_seed = 11");
    AFQMC::Driver driver(params, world);
    EXPECT_EQ(driver.state(), AFQMC::Driver::State::Running);
    EXPECT_EQ(driver.population().size(), 30u);
    EXPECT_NEAR(driver.energy_shift(), driver.trial().energy(), 1e-14);

    driver.run();
    EXPECT_EQ(driver.state(), AFQMC::Driver::State::Completed);
    EXPECT_EQ(driver.steps_done(), 1000);
    EXPECT_EQ(driver.population_control_calls(), 100);
    EXPECT_EQ(driver.measure_calls(), 100);
    EXPECT_EQ(driver.handle().find("Energy").counts(), 100u);
    EXPECT_EQ(driver.handle().energy_shifts().size(), 100u);
    EXPECT_EQ(driver.population().size(), 30u);

    // the shift follows the latest measured energy
    EXPECT_NEAR(driver.energy_shift(), driver.handle().latest_energy(), 1e-14);

    driver.finalize();
    EXPECT_EQ(driver.state(), AFQMC::Driver::State::Finalized);
    EXPECT_TRUE(driver.population().empty());
    const auto results = driver.handle().results();
    ASSERT_EQ(results.count("Energy"), 1u);
    EXPECT_EQ(results.at("Energy").count, 100u);
    EXPECT_TRUE(std::isfinite(results.at("Energy").mean));
    EXPECT_GT(results.at("Energy").error, 0.0);
}

TEST_F(DriverTest, DeterministicWithFixedSeed) {
    const auto params = AFQMC::Testing::small_cluster(
        "nsteps = 60\nnmeasure = 5\nnpop_control = 3\nnwalkers = 6\nrng_seed = 123");

    AFQMC::Driver first(params, world);
    first.run();
    AFQMC::Driver second(params, world);
    second.run();

    const auto& e1 = first.handle().find("Energy");
    const auto& e2 = second.handle().find("Energy");
    ASSERT_EQ(e1.counts(), 12u);
    ASSERT_EQ(e2.counts(), 12u);
    for (std::size_t bin = 0; bin < e1.counts(); ++bin) {
        EXPECT_EQ(e1.data()(bin), e2.data()(bin));
    }
    EXPECT_EQ(first.total_kills(), second.total_kills());
}

TEST_F(DriverTest, NoninteractingEnergyIsExact) {
    const auto params = AFQMC::Testing::small_cluster(
        "nsteps = 50\nnmeasure = 5\nnwalkers = 5\nrng_seed = 5",
        "",
        "U = 0.0\nktwist = [0.13, 0.27]");
    AFQMC::Driver driver(params, world);
    const double e0 = driver.model().noninteracting_energy();
    EXPECT_NEAR(driver.trial().energy(), e0, 1e-10);

    driver.run();
    driver.finalize();
    const auto& energy = driver.handle().find("Energy");
    ASSERT_EQ(energy.counts(), 10u);
    for (std::size_t bin = 0; bin < energy.counts(); ++bin) {
        EXPECT_NEAR(energy.data()(bin), e0, 1e-8);
    }
    EXPECT_NEAR(driver.handle().results().at("Energy").mean, e0, 1e-8);
    EXPECT_EQ(driver.total_kills(), 0u);
}

TEST_F(DriverTest, BackPropagationAndCorrelationFunctions) {
    const auto params = AFQMC::Testing::small_cluster(
        "nsteps = 40\nnmeasure = 10\nnwalkers = 4\nrng_seed = 9\nnequilibrate = 10",
        "observables = [\"DoubleOccupancy\"]\n"
        "[estimates.back_propagated]\nnback_prop = 4\n"
        "[estimates.itcf]\ntmax = 0.1\n");
    ASSERT_EQ(params.nitcf, 2);
    AFQMC::Driver driver(params, world);
    EXPECT_EQ(driver.handle().history_capacity(), 6u);

    driver.run();
    EXPECT_EQ(driver.handle().back_propagation_calls(), 4);
    EXPECT_EQ(driver.handle().itcf_calls(), 4);
    EXPECT_EQ(driver.handle().find("ImaginaryTimeGreenFunctionsK").counts(), 4u);

    driver.finalize();
    const auto results = driver.handle().results();
    ASSERT_EQ(results.count("BackPropagatedEnergy"), 1u);
    EXPECT_EQ(results.at("BackPropagatedEnergy").count, 3u);
    EXPECT_EQ(results.at("DoubleOccupancy").count, 3u);
    EXPECT_EQ(results.count("ImaginaryTimeGreenFunctions"), 0u);
}

TEST_F(DriverTest, PathologicalTimeStepCollapses) {
    const auto params = AFQMC::Testing::small_cluster("dt = 1e4\nnsteps = 20\nnmeasure = 5\nnwalkers = 4\nrng_seed = 1");
    AFQMC::Driver driver(params, world);
    EXPECT_THROW(driver.run(), AFQMC::PopulationCollapse);
}

TEST_F(DriverTest, LifecycleMisuse) {
    const auto params = AFQMC::Testing::small_cluster("nsteps = 10\nnmeasure = 5\nnwalkers = 2\nrng_seed = 2");
    AFQMC::Driver driver(params, world);
    EXPECT_THROW(driver.finalize(), std::logic_error);

    driver.run();
    EXPECT_THROW(driver.run(), std::logic_error);
    driver.finalize();
    EXPECT_THROW(driver.finalize(), std::logic_error);
    EXPECT_THROW(driver.run(), std::logic_error);
}

TEST_F(DriverTest, InvalidConfigurationRejected) {
    auto params = AFQMC::Testing::small_cluster("nwalkers = 2\nrng_seed = 2");
    params.nwalkers = 0;
    EXPECT_THROW(AFQMC::Driver(params, world), std::runtime_error);

    params.nwalkers = 2;
    params.nup = 5;
    EXPECT_THROW(AFQMC::Driver(params, world), std::runtime_error);

    params.nup = 2;
    params.trial_name = "Jastrow";
    EXPECT_THROW(AFQMC::Driver(params, world), std::runtime_error);
}
