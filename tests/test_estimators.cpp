/*
 *   test_estimators.cpp
 *
 *     Created on: Jun 20, 2025
 *
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <vector>
#include <memory>
#include <stdexcept>
#include <boost/mpi/communicator.hpp>
#include "estimator_handle.h"
#include "observable.hpp"
#include "population.h"
#include "propagator.h"
#include "walker.h"
#include "hubbard.h"
#include "square_lattice.h"
#include "trial_wavefunction.h"
#include "random.h"
#include "utils/ring_buffer.hpp"
#include "utils/blocking.hpp"

// ---------------------------------------------  Ring buffer and blocking  ---------------------------------------------

TEST(RingBufferTest, OverwritesOldestEntries) {
    Utils::RingBuffer<int> buffer(3);
    EXPECT_TRUE(buffer.empty());
    for (int i = 1; i <= 5; ++i) { buffer.push(i); }
    ASSERT_TRUE(buffer.full());
    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.front(), 3);
    EXPECT_EQ(buffer[1], 4);
    EXPECT_EQ(buffer.back(), 5);

    buffer.push(6);
    EXPECT_EQ(buffer.front(), 4);
    EXPECT_EQ(buffer.back(), 6);
    EXPECT_THROW(buffer.at(3), std::out_of_range);

    Utils::RingBuffer<int> disabled(0);
    disabled.push(1);
    EXPECT_TRUE(disabled.empty());
    EXPECT_THROW(disabled.at(0), std::out_of_range);
}

TEST(BlockingTest, IndependentSamples) {
    Utils::Random rng(314);
    std::vector<double> samples(4096);
    for (auto& x : samples) { x = rng.normal(); }

    const auto stats = Utils::Blocking::reblock(samples);
    ASSERT_EQ(stats.size(), 12u);
    EXPECT_EQ(stats.front().block_size, 1u);
    EXPECT_EQ(stats.back().nblocks, 2u);

    // uncorrelated data need no blocking, the error is close to 1/sqrt(N)
    const double error = Utils::Blocking::standard_error(samples);
    EXPECT_NEAR(error, 1.0/64.0, 0.25/64.0);
}

TEST(BlockingTest, CorrelatedSamples) {
    // a strongly autocorrelated AR(1) series, whose naive error underestimates the true one
    Utils::Random rng(2718);
    std::vector<double> samples(1 << 14);
    double x = 0.0;
    for (auto& s : samples) {
        x = 0.95 * x + rng.normal();
        s = x;
    }
    const auto stats = Utils::Blocking::reblock(samples);
    const double naive = stats.front().error;
    const double reblocked = Utils::Blocking::standard_error(samples);
    EXPECT_GT(reblocked, 3.0 * naive);

    EXPECT_DOUBLE_EQ(Utils::Blocking::standard_error({1.0}), 0.0);
}

TEST(ObservableTest, StatisticsAfterEquilibration) {
    Observable::ObservableReal obs;
    obs.set_name_and_desc("Energy", "test");
    obs.set_shape(5, {});
    const std::vector<double> values = {100.0, 1.0, 2.0, 3.0, 4.0};
    for (std::size_t n = 0; n < values.size(); ++n) {
        obs.clear_cache();
        obs.cache()() = 2.0 * values[n];
        obs.norm() = 2.0;
        obs.normalize_cache();
        obs.push_cache_to_data(static_cast<int>(10*(n+1)));
    }
    EXPECT_EQ(obs.counts(), 5u);
    EXPECT_THROW(obs.push_cache_to_data(60), std::out_of_range);

    // the first bin, measured at step 10, is discarded
    obs.analyse(10);
    EXPECT_EQ(obs.samples(), 4u);
    EXPECT_NEAR(obs.mean()(), 2.5, 1e-14);
    EXPECT_NEAR(obs.stderr()(), std::sqrt(1.25/4.0), 1e-12);

    obs.clear_cache();
    EXPECT_THROW(obs.normalize_cache(), std::runtime_error);
}

// -------------------------------------------  Estimators on small clusters  -------------------------------------------

class EstimatorTest : public ::testing::Test {
    protected:
        void build(const double u, const double dt = 0.05)
        {
            lattice.initialize(4, 2, {0.2, 0.4});
            model.initialize(lattice, 1.0, u, dt, 3, 2, Model::HSScheme::Discrete);
            trial.initialize_free_electron(model);
            propagator = std::make_unique<AFQMC::Propagator>(model, trial, 100.0, 3);
        }

        // a walker propagated until its field history is complete
        AFQMC::Walker propagated_walker(const std::size_t capacity, const unsigned seed)
        {
            AFQMC::Walker walker;
            walker.initialize(trial, model, capacity);
            Utils::Random rng(seed);
            for (std::size_t step = 0; step < capacity + 2; ++step) {
                propagator->advance(walker, rng, trial.energy());
                if ((step+1) % 3 == 0) { walker.orthonormalize(); }
            }
            return walker;
        }

        Lattice::SquareLattice lattice;
        Model::Hubbard model;
        Trial::Wavefunction trial;
        std::unique_ptr<AFQMC::Propagator> propagator;
        boost::mpi::communicator world;
};

TEST_F(EstimatorTest, RegistryContents) {
    build(4.0);
    Estimator::Handle handle;
    handle.initialize({"DoubleOccupancy"}, 10, model.ns(), 4, 2, true, 3, 0);
    EXPECT_TRUE(handle.is_found("Energy"));
    EXPECT_TRUE(handle.is_found("DoubleOccupancy"));
    EXPECT_FALSE(handle.is_found("KineticEnergy"));
    EXPECT_TRUE(handle.is_found("BackPropagatedEnergy"));
    EXPECT_TRUE(handle.is_found("MomentumDistribution"));
    EXPECT_TRUE(handle.is_found("ImaginaryTimeGreenFunctionsK"));
    EXPECT_EQ(handle.history_capacity(), 6u);
    EXPECT_EQ(handle.find("ImaginaryTimeGreenFunctions").obsShape().size(), 4u);
    EXPECT_THROW(handle.find("KineticEnergy"), std::invalid_argument);

    Estimator::Handle invalid;
    EXPECT_THROW(invalid.initialize({"Magnetization"}, 10, model.ns(), 0, 0, true, 3, 0), std::invalid_argument);
}

TEST_F(EstimatorTest, MixedEstimatorsOfTrialPopulation) {
    build(4.0);
    AFQMC::Population population;
    population.initialize(4, trial, model, 0);
    population[1].weight() = 3.0;

    Estimator::Handle handle;
    handle.initialize({"KineticEnergy", "PotentialEnergy", "AliveFraction", "MeanWeight"}, 2, model.ns(), 0, 0, true, 3, 0);
    handle.measure(5, population, model, lattice, world);
    EXPECT_EQ(handle.measure_calls(), 1);

    // identical walkers give the trial energy whatever their weights
    EXPECT_NEAR(handle.latest_energy(), trial.energy(), 1e-10);
    EXPECT_NEAR(handle.find("KineticEnergy").data()(0) + handle.find("PotentialEnergy").data()(0), trial.energy(), 1e-10);
    EXPECT_NEAR(handle.find("AliveFraction").data()(0), 1.0, 1e-14);
    EXPECT_NEAR(handle.find("MeanWeight").data()(0), 1.5, 1e-14);
    EXPECT_EQ(handle.find("Energy").steps().front(), 5);

    for (auto& walker : population) { walker.kill(); }
    EXPECT_THROW(handle.measure(10, population, model, lattice, world), AFQMC::PopulationCollapse);
}

TEST_F(EstimatorTest, ItcfStableAgreesWithDirect) {
    build(4.0);
    const int nitcf = 2;
    const auto walker = propagated_walker(nitcf, 41);
    ASSERT_TRUE(walker.is_alive());

    const auto stable = Estimator::Handle::compute_itcf_gfs(walker, *propagator, model, nitcf, true);
    const auto direct = Estimator::Handle::compute_itcf_gfs(walker, *propagator, model, nitcf, false);
    ASSERT_EQ(stable.size(), 3u);
    ASSERT_EQ(direct.size(), 3u);
    for (int t = 0; t <= nitcf; ++t) {
        for (int spin = 0; spin < 2; ++spin) {
            EXPECT_LT((stable[t][spin] - direct[t][spin]).norm(), 1e-8 * (1.0 + direct[t][spin].norm()))
                << "tau index " << t << ", spin " << spin;
        }
    }

    // at tau = 0 the greater Green's function is 1 - G, with trace ns - N
    for (int spin = 0; spin < 2; ++spin) {
        EXPECT_NEAR(stable[0][spin].trace().real(), model.ns() - model.nelec(spin), 1e-8);
    }
}

TEST_F(EstimatorTest, ItcfStableAgreesWithDirectOverLongerTimes) {
    build(4.0);
    const int nitcf = 8;
    const auto walker = propagated_walker(nitcf, 43);
    ASSERT_TRUE(walker.is_alive());

    const auto stable = Estimator::Handle::compute_itcf_gfs(walker, *propagator, model, nitcf, true);
    const auto direct = Estimator::Handle::compute_itcf_gfs(walker, *propagator, model, nitcf, false);
    for (int t = 0; t <= nitcf; ++t) {
        for (int spin = 0; spin < 2; ++spin) {
            EXPECT_LT((stable[t][spin] - direct[t][spin]).norm(), 1e-7 * (1.0 + direct[t][spin].norm()));
        }
    }
}

TEST_F(EstimatorTest, ItcfDirectPathDriftsAtLongTimes) {
    // strong coupling and a coarse time step make the products B(k,0) badly conditioned
    build(8.0, 0.1);
    const int nitcf = 40;
    const auto walker = propagated_walker(nitcf, 59);
    ASSERT_TRUE(walker.is_alive());

    const auto stable = Estimator::Handle::compute_itcf_gfs(walker, *propagator, model, nitcf, true);
    const auto direct = Estimator::Handle::compute_itcf_gfs(walker, *propagator, model, nitcf, false);

    std::vector<double> deviation(nitcf+1, 0.0);
    for (int t = 0; t <= nitcf; ++t) {
        for (int spin = 0; spin < 2; ++spin) {
            const double diff = (stable[t][spin] - direct[t][spin]).norm();
            ASSERT_TRUE(std::isfinite(diff)) << "tau index " << t;
            deviation[t] = std::max(deviation[t], diff);
        }
    }

    // agreement at short imaginary times
    for (int t = 0; t <= 2; ++t) {
        for (int spin = 0; spin < 2; ++spin) {
            EXPECT_LT(deviation[t], 1e-8 * (1.0 + direct[t][spin].norm())) << "tau index " << t;
        }
    }

    // the deviation does not shrink towards tmax
    const auto max_over = [&](const int first, const int last) {
        return *std::max_element(deviation.begin()+first, deviation.begin()+last+1);
    };
    const double short_times = max_over(0, 2);
    const double first_half = max_over(0, nitcf/2);
    const double last_quarter = max_over(3*nitcf/4, nitcf);
    EXPECT_GT(last_quarter, 1e3 * std::max(short_times, 1e-14));
    EXPECT_GE(last_quarter, first_half);
}

TEST_F(EstimatorTest, BackPropagatedGreenFunctions) {
    build(4.0);
    const int nback_prop = 5;
    const auto walker = propagated_walker(nback_prop, 7);
    ASSERT_TRUE(walker.is_alive());

    const auto gf = Estimator::Handle::compute_back_propagated_gf(walker, *propagator, nback_prop);
    for (int spin = 0; spin < 2; ++spin) {
        EXPECT_LT((gf[spin] * gf[spin] - gf[spin]).norm(), 1e-8);
        EXPECT_NEAR(gf[spin].trace().real(), model.nelec(spin), 1e-8);
    }
    EXPECT_THROW(Estimator::Handle::compute_back_propagated_gf(walker, *propagator, nback_prop+1), std::runtime_error);
}

TEST_F(EstimatorTest, BackPropagationOfFreeElectrons) {
    build(0.0);
    const int nback_prop = 4;
    AFQMC::Population population;
    population.initialize(3, trial, model, nback_prop);
    Utils::Random rng(8);
    for (int step = 0; step < nback_prop; ++step) {
        for (auto& walker : population) {
            propagator->advance(walker, rng, model.noninteracting_energy());
        }
    }

    Estimator::Handle handle;
    handle.initialize({}, 1, model.ns(), nback_prop, 0, true, 3, 0);
    handle.back_propagate(nback_prop, population, *propagator, model, lattice, world);
    EXPECT_EQ(handle.back_propagation_calls(), 1);
    EXPECT_NEAR(handle.find("BackPropagatedEnergy").data()(0), model.noninteracting_energy(), 1e-10);
    EXPECT_NEAR(handle.find("BackPropagatedPotentialEnergy").data()(0), 0.0, 1e-12);

    // the momentum distribution of free electrons counts the occupied plane waves
    const auto& nk = handle.find("MomentumDistribution").data();
    double total = 0.0;
    for (int k = 0; k < model.ns(); ++k) { total += nk(0, k); }
    EXPECT_NEAR(total, static_cast<double>(model.nup() + model.ndown()), 1e-10);
}
