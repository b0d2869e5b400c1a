/*
 *   test_walker.cpp
 *
 *     Created on: Jun 19, 2025
 *
 */

#include <gtest/gtest.h>
#include <sstream>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include "walker.h"
#include "hubbard.h"
#include "square_lattice.h"
#include "trial_wavefunction.h"
#include "utils/stable_numerics.hpp"

class WalkerTest : public ::testing::Test {
    protected:
        void SetUp() override
        {
            lattice.initialize(3, 2, {0.1, 0.3});
            model.initialize(lattice, 1.0, 2.0, 0.05, 2, 3, Model::HSScheme::Discrete);
            trial.initialize_free_electron(model);
            walker.initialize(trial, model, 4);
        }

        Lattice::SquareLattice lattice;
        Model::Hubbard model;
        Trial::Wavefunction trial;
        AFQMC::Walker walker;
};

TEST_F(WalkerTest, InitializedFromTrial) {
    EXPECT_DOUBLE_EQ(walker.weight(), 1.0);
    EXPECT_NEAR(std::abs(walker.phase() - std::complex<double>(1.0, 0.0)), 0.0, 1e-14);
    EXPECT_NEAR(std::abs(walker.overlap() - std::complex<double>(1.0, 0.0)), 0.0, 1e-12);
    EXPECT_NEAR(walker.energy().real(), trial.energy(), 1e-12);
    EXPECT_TRUE(walker.is_alive());
    EXPECT_EQ(walker.history().capacity(), 4u);
    EXPECT_TRUE(walker.history().empty());

    // the mixed Green's function of a single determinant is a projector
    for (int spin = 0; spin < 2; ++spin) {
        const auto& gf = walker.gf(spin);
        EXPECT_LT((gf * gf - gf).norm(), 1e-12);
        EXPECT_NEAR(gf.trace().real(), model.nelec(spin), 1e-12);
    }
}

TEST_F(WalkerTest, OrthonormalizationKeepsGreenFunctions) {
    // distort the orbitals by an upper triangular factor
    for (int spin = 0; spin < 2; ++spin) {
        const auto ncols = walker.phi(spin).cols();
        Eigen::MatrixXcd r = Eigen::MatrixXcd::Random(ncols, ncols).triangularView<Eigen::Upper>();
        r.diagonal().array() += std::complex<double>(3.0, 0.5);
        walker.phi(spin) = walker.phi(spin) * r;
    }
    walker.update_overlap(trial);
    const AFQMC::Orbitals gf_before = {walker.gf(0), walker.gf(1)};

    walker.orthonormalize();
    const auto cached_overlap = walker.overlap();
    for (int spin = 0; spin < 2; ++spin) {
        const auto& phi = walker.phi(spin);
        const Eigen::MatrixXcd identity = Eigen::MatrixXcd::Identity(phi.cols(), phi.cols());
        EXPECT_LT((phi.adjoint() * phi - identity).norm(), 1e-12);
    }

    walker.update_overlap(trial);
    EXPECT_LT(std::abs(walker.overlap() - cached_overlap), 1e-10);
    for (int spin = 0; spin < 2; ++spin) {
        EXPECT_LT((walker.gf(spin) - gf_before[spin]).norm(), 1e-10);
    }
}

TEST_F(WalkerTest, HistoryKeepsNewestRecords) {
    for (int step = 0; step < 6; ++step) {
        walker.record(Eigen::VectorXd::Constant(model.ns(), step), walker.phi());
    }
    ASSERT_EQ(walker.history().size(), 4u);
    EXPECT_DOUBLE_EQ(walker.history().front().fields(0), 2.0);
    EXPECT_DOUBLE_EQ(walker.history().back().fields(0), 5.0);

    walker.kill();
    EXPECT_FALSE(walker.is_alive());
}

TEST_F(WalkerTest, SerializationForMigration) {
    walker.weight() = 0.75;
    walker.record(Eigen::VectorXd::Ones(model.ns()), walker.phi());

    std::stringstream buffer;
    {
        boost::archive::binary_oarchive oa(buffer);
        oa << walker;
    }
    AFQMC::Walker received;
    {
        boost::archive::binary_iarchive ia(buffer);
        ia >> received;
    }
    EXPECT_DOUBLE_EQ(received.weight(), 0.75);
    EXPECT_LT(std::abs(received.overlap() - walker.overlap()), 1e-14);
    EXPECT_LT((received.phi(1) - walker.phi(1)).norm(), 1e-14);
    ASSERT_EQ(received.history().size(), 1u);
    EXPECT_EQ(received.history().capacity(), 4u);
    EXPECT_DOUBLE_EQ(received.history().back().fields(0), 1.0);
}
