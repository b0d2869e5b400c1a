/*
 *   test_population.cpp
 *
 *     Created on: Jun 20, 2025
 *
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <numeric>
#include <vector>
#include <boost/mpi/communicator.hpp>
#include "population.h"
#include "population_controller.h"
#include "hubbard.h"
#include "square_lattice.h"
#include "trial_wavefunction.h"
#include "random.h"

class PopulationTest : public ::testing::Test {
    protected:
        void SetUp() override
        {
            lattice.initialize(2, 2, {0.1, 0.2});
            model.initialize(lattice, 1.0, 4.0, 0.05, 1, 1, Model::HSScheme::Discrete);
            trial.initialize_free_electron(model);
        }

        Lattice::SquareLattice lattice;
        Model::Hubbard model;
        Trial::Wavefunction trial;
        boost::mpi::communicator world;
};

TEST_F(PopulationTest, SeededFromTrial) {
    AFQMC::Population population;
    population.initialize(6, trial, model, 3);
    ASSERT_EQ(population.size(), 6u);
    EXPECT_EQ(population.target_size(), 6);
    EXPECT_EQ(population.alive_count(), 6);
    EXPECT_DOUBLE_EQ(population.local_weight(), 6.0);
    EXPECT_DOUBLE_EQ(population.total_weight(world), 6.0 * world.size());
    for (const auto& walker : population) {
        EXPECT_EQ(walker.history().capacity(), 3u);
    }

    population[2].kill();
    EXPECT_EQ(population.alive_count(), 5);
    EXPECT_EQ(population.weights()[2], 0.0);

    population.clear();
    EXPECT_TRUE(population.empty());

    AFQMC::Population invalid;
    EXPECT_THROW(invalid.initialize(0, trial, model, 0), std::runtime_error);
}

TEST(CombTest, CopiesFollowWeights) {
    // teeth at (k + xi) for k = 0, 1, 2, 3 over the cumulative weights 1, 3, 4
    for (const double xi : {0.0, 0.3, 0.999}) {
        const auto copies = AFQMC::PopulationController::comb({1.0, 2.0, 1.0}, xi, 4);
        EXPECT_EQ(copies, (std::vector<int>{1, 2, 1}));
    }

    // dead walkers never receive a tooth, and the number of teeth is always conserved
    const std::vector<double> weights = {0.0, 0.7, 0.0, 2.2, 0.1, 0.0};
    for (const double xi : {0.0, 0.25, 0.5, 0.75, 0.9999}) {
        const auto copies = AFQMC::PopulationController::comb(weights, xi, 5);
        EXPECT_EQ(std::accumulate(copies.begin(), copies.end(), 0), 5);
        EXPECT_EQ(copies[0], 0);
        EXPECT_EQ(copies[2], 0);
        EXPECT_EQ(copies[5], 0);
    }
}

TEST(CombTest, UnbiasedOverTheOffset) {
    // averaging over a uniform grid of offsets integrates E[copies] = w M / W up to the grid spacing
    const std::vector<double> weights = {0.3, 1.7, 0.05, 0.0, 2.4, 0.55, 1.0};
    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    const int nteeth = 9;
    const int ngrid = 20000;

    std::vector<double> mean(weights.size(), 0.0);
    for (int n = 0; n < ngrid; ++n) {
        const double xi = (n + 0.5) / ngrid;
        const auto copies = AFQMC::PopulationController::comb(weights, xi, nteeth);
        for (std::size_t i = 0; i < weights.size(); ++i) { mean[i] += copies[i]; }
    }
    for (std::size_t i = 0; i < weights.size(); ++i) {
        EXPECT_NEAR(mean[i] / ngrid, weights[i] * nteeth / total, 1e-3);
    }
}

TEST(CombTest, UnbiasedStatistically) {
    const std::vector<double> weights = {0.2, 0.9, 1.3, 0.6};
    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    const int nteeth = 4;
    const int nsamples = 40000;
    Utils::Random rng(2025);

    std::vector<double> mean(weights.size(), 0.0);
    for (int n = 0; n < nsamples; ++n) {
        const auto copies = AFQMC::PopulationController::comb(weights, rng.uniform(), nteeth);
        for (std::size_t i = 0; i < weights.size(); ++i) { mean[i] += copies[i]; }
    }
    // copies differ from their expectation by less than one, so the error of the mean is below 1/sqrt(nsamples)
    for (std::size_t i = 0; i < weights.size(); ++i) {
        EXPECT_NEAR(mean[i] / nsamples, weights[i] * nteeth / total, 5.0 / std::sqrt(nsamples));
    }
}

TEST(CombTest, CollapsedPopulation) {
    EXPECT_THROW(AFQMC::PopulationController::comb({0.0, 0.0}, 0.5, 2), AFQMC::PopulationCollapse);
    EXPECT_THROW(AFQMC::PopulationController::comb({1.0, std::numeric_limits<double>::infinity()}, 0.5, 2),
                 AFQMC::PopulationCollapse);
    EXPECT_THROW(AFQMC::PopulationController::comb({1.0, std::nan("")}, 0.5, 2), AFQMC::PopulationCollapse);
}

TEST_F(PopulationTest, ReconfigurationRestoresSize) {
    AFQMC::Population population;
    population.initialize(5, trial, model, 0);

    // mark every walker by its phase and assign uneven weights
    const std::vector<double> weights = {0.5, 0.0, 2.0, 1.1, 0.4};
    for (std::size_t i = 0; i < population.size(); ++i) {
        population[i].weight() = weights[i];
        population[i].phase() = std::complex<double>(i, 0.0);
    }
    const double total = population.total_weight(world);

    Utils::Random rng(99);
    Utils::Random preview = rng;
    const double xi = preview.uniform();
    const auto expected = AFQMC::PopulationController::comb(weights, xi, 5);

    AFQMC::PopulationController controller;
    controller.reconfigure(population, rng, world);
    EXPECT_EQ(controller.calls(), 1);

    ASSERT_EQ(population.size(), 5u);
    EXPECT_NEAR(population.total_weight(world), total, 1e-12);
    std::vector<int> copies(weights.size(), 0);
    for (const auto& walker : population) {
        EXPECT_NEAR(walker.weight(), total / 5, 1e-14);
        ++copies[static_cast<std::size_t>(walker.phase().real())];
    }
    EXPECT_EQ(copies, expected);
    EXPECT_EQ(copies[1], 0);
}

TEST_F(PopulationTest, ReconfigurationOfDeadPopulationThrows) {
    AFQMC::Population population;
    population.initialize(3, trial, model, 0);
    for (auto& walker : population) { walker.kill(); }

    AFQMC::PopulationController controller;
    Utils::Random rng(1);
    EXPECT_THROW(controller.reconfigure(population, rng, world), AFQMC::PopulationCollapse);
}
