/*
 *   test_hubbard.cpp
 *
 *     Created on: Jun 18, 2025
 *
 */

#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <unsupported/Eigen/MatrixFunctions>
#include "hubbard.h"
#include "square_lattice.h"
#include "trial_wavefunction.h"
#include "random.h"

class HubbardTest : public ::testing::Test {
    protected:
        void SetUp() override
        {
            lattice.initialize(4, 2, {0.2, 0.4});
            model.initialize(lattice, 1.0, 4.0, 0.05, 3, 2, Model::HSScheme::Discrete);
        }

        Lattice::SquareLattice lattice;
        Model::Hubbard model;
};

TEST_F(HubbardTest, KineticPropagator) {
    const Eigen::MatrixXcd expK = (-model.dt() * model.hopping_matrix()).exp();
    EXPECT_LT((model.expK_half() * model.expK_half() - expK).norm(), 1e-12);
    EXPECT_LT((model.hopping_matrix() - model.hopping_matrix().adjoint()).norm(), 1e-14);
}

TEST_F(HubbardTest, DiscreteDecompositionReproducesInteraction) {
    EXPECT_NEAR(std::cosh(model.alpha()), std::exp(0.5*model.dt()*model.u()), 1e-12);

    // average over x = +-1 of V_up(x)^nup V_dn(x)^ndn equals exp(-dt U nup ndn) for all occupations
    for (int nup = 0; nup <= 1; ++nup) {
        for (int ndn = 0; ndn <= 1; ++ndn) {
            double sum = 0.0;
            for (const double x : {+1.0, -1.0}) {
                sum += 0.5 * std::pow(model.expV(x, 0), nup) * std::pow(model.expV(x, 1), ndn);
            }
            EXPECT_NEAR(sum, std::exp(-model.dt()*model.u()*nup*ndn), 1e-12);
        }
    }
}

TEST_F(HubbardTest, ContinuousCoupling) {
    Model::Hubbard continuous;
    continuous.initialize(lattice, 1.0, 4.0, 0.05, 3, 2, Model::HSScheme::Continuous);
    EXPECT_NEAR(continuous.alpha(), std::sqrt(0.05*4.0), 1e-14);
    EXPECT_EQ(Model::hs_scheme_from_string("continuous"), Model::HSScheme::Continuous);
    EXPECT_EQ(Model::hs_scheme_to_string(Model::HSScheme::Discrete), "discrete");
    EXPECT_THROW(Model::hs_scheme_from_string("gaussian"), std::runtime_error);
}

TEST_F(HubbardTest, StepOperatorMultiplications) {
    Utils::Random rng(11);
    Eigen::VectorXd fields(model.ns());
    for (int i = 0; i < model.ns(); ++i) { fields(i) = (rng.uniform() < 0.5)? +1.0 : -1.0; }
    const Eigen::MatrixXcd phi = Eigen::MatrixXcd::Random(model.ns(), 3);

    for (int spin = 0; spin < 2; ++spin) {
        const Eigen::MatrixXcd b = model.B_matrix(fields, spin);
        Eigen::MatrixXcd forward = phi;
        model.multiply_B_from_left(forward, fields, spin);
        EXPECT_LT((forward - b * phi).norm(), 1e-12);

        Eigen::MatrixXcd backward = phi;
        model.multiply_adjB_from_left(backward, fields, spin);
        EXPECT_LT((backward - b.adjoint() * phi).norm(), 1e-12);
    }
}

TEST_F(HubbardTest, LocalEnergyOfFreeElectrons) {
    Trial::Wavefunction trial;
    trial.initialize_free_electron(model);

    const Eigen::MatrixXcd gup = trial.orbitals(0) * trial.orbitals(0).adjoint();
    const Eigen::MatrixXcd gdn = trial.orbitals(1) * trial.orbitals(1).adjoint();
    EXPECT_NEAR(model.kinetic_energy(gup, gdn).real(), model.noninteracting_energy(), 1e-10);
    EXPECT_NEAR(model.kinetic_energy(gup, gdn).imag(), 0.0, 1e-10);

    const double potential = model.u() * (gup.diagonal().real().array() * gdn.diagonal().real().array()).sum();
    EXPECT_NEAR(model.potential_energy(gup, gdn).real(), potential, 1e-10);
    EXPECT_NEAR(trial.energy(), model.noninteracting_energy() + potential, 1e-10);
}

TEST_F(HubbardTest, InvalidParameters) {
    Model::Hubbard invalid;
    EXPECT_THROW(invalid.initialize(lattice, 1.0, -1.0, 0.05, 1, 1, Model::HSScheme::Discrete), std::runtime_error);
    EXPECT_THROW(invalid.initialize(lattice, 1.0, 4.0, 0.0, 1, 1, Model::HSScheme::Discrete), std::runtime_error);
    EXPECT_THROW(invalid.initialize(lattice, 1.0, 4.0, 0.05, 9, 1, Model::HSScheme::Discrete), std::runtime_error);
}

TEST_F(HubbardTest, UnrestrictedHartreeFockTrial) {
    Utils::Random rng(3);
    Trial::Wavefunction trial;
    trial.initialize_uhf(model, 0.4, 4, 5000, 1e-8, 0.5, rng);
    EXPECT_EQ(trial.kind(), Trial::Wavefunction::Kind::UHF);

    for (int spin = 0; spin < 2; ++spin) {
        const auto& orb = trial.orbitals(spin);
        ASSERT_EQ(orb.cols(), model.nelec(spin));
        const Eigen::MatrixXcd identity = Eigen::MatrixXcd::Identity(orb.cols(), orb.cols());
        EXPECT_LT((orb.adjoint() * orb - identity).norm(), 1e-10);
    }

    // a weak effective interaction keeps the self-consistent field close to free electrons
    EXPECT_TRUE(std::isfinite(trial.energy()));
    EXPECT_LT(trial.mean_field_energy(), model.noninteracting_energy() + 0.4 * model.nup() * model.ndown());
}

TEST_F(HubbardTest, UnrestrictedHartreeFockWithoutConvergenceThrows) {
    Utils::Random rng(3);
    Trial::Wavefunction trial;
    EXPECT_THROW(trial.initialize_uhf(model, 0.4, 2, 1, 1e-12, 0.5, rng), std::runtime_error);
    EXPECT_THROW(Trial::Wavefunction::kind_from_string("RHF"), std::runtime_error);
}
