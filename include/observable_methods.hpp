/*
 *   observable_methods.hpp
 * 
 *     Created on: Jun 11, 2025
 * 
 */

#pragma once
#ifndef OBSERVABLE_METHODS_HPP
#define OBSERVABLE_METHODS_HPP

#include <complex>
#include <Eigen/Core>
#include "observable.hpp"
#include "population.h"
#include "hubbard.h"
#include "square_lattice.h"
#include "estimator_handle.h"

namespace Observable {
    class Methods {
        public:
            using obs_struct = ObservableReal::obs_struct; // basically observables are real valued.
            using Population = AFQMC::Population;
            using EstimatorHandle = Estimator::Handle;
            using Hubbard = Model::Hubbard;
            using Lattice = Lattice::SquareLattice;
            using Matrix = Eigen::MatrixXcd;
            using Scalar = std::complex<double>;

            // NOTE: every estimator is the ratio of walker-weighted sums,
            //
            //      < O > = Re \sum_w W_w O_w / Re \sum_w W_w ,    W_w = weight_w * phase_w ,
            //
            // where the numerator is accumulated into the cache and the denominator into the norm.

            // -------------------------------------------  Mixed estimators  -------------------------------------------------

            static void measure_energy(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                for (const auto& walker : population) {
                    if (!walker.is_alive()) { continue; }
                    cache += (walker.complex_weight() * walker.energy()).real();
                    norm += walker.complex_weight().real();
                }
            }

            static void measure_kinetic_energy(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                for (const auto& walker : population) {
                    if (!walker.is_alive()) { continue; }
                    cache += (walker.complex_weight() * walker.kinetic_energy()).real();
                    norm += walker.complex_weight().real();
                }
            }

            static void measure_potential_energy(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                for (const auto& walker : population) {
                    if (!walker.is_alive()) { continue; }
                    cache += (walker.complex_weight() * walker.potential_energy()).real();
                    norm += walker.complex_weight().real();
                }
            }

            // the dead walkers (between two population controls) count in the following three
            static void measure_mean_weight(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                for (const auto& walker : population) {
                    cache += walker.weight();
                    norm += 1.0;
                }
            }

            static void measure_alive_fraction(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                for (const auto& walker : population) {
                    cache += walker.is_alive()? 1.0 : 0.0;
                    norm += 1.0;
                }
            }

            static void measure_average_phase(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                for (const auto& walker : population) {
                    cache += walker.weight() * walker.phase().real();
                    norm += walker.weight();
                }
            }

            /*
             *
             *  Double occupancy = 1/N \sum_i < n_up(i) n_dn(i) > = 1/N \sum_i G_up(i,i) G_dn(i,i)
             *
             */
            static void measure_double_occupancy(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                const int ns = model.ns();
                for (const auto& walker : population) {
                    if (!walker.is_alive()) { continue; }
                    const Scalar docc = (walker.gf(0).diagonal().array() * walker.gf(1).diagonal().array()).sum() / double(ns);
                    cache += (walker.complex_weight() * docc).real();
                    norm += walker.complex_weight().real();
                }
            }

            // ---------------------------------------  Back-propagated estimators  -------------------------------------------
            //
            //  G_BP = phi (Psi_L^+ phi)^-1 Psi_L^+ with the back-propagated left state Psi_L,
            //  evaluated by the handle for every walker with a complete field history.
            //

            static void measure_back_propagated_energy(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                const auto& gfs = handle.back_propagated_gfs();
                for (std::size_t w = 0; w < population.size(); ++w) {
                    if (!handle.has_back_propagated_gf(w)) { continue; }
                    const Scalar weight = population[w].complex_weight();
                    const Scalar energy = model.kinetic_energy(gfs[w][0], gfs[w][1]) + model.potential_energy(gfs[w][0], gfs[w][1]);
                    cache += (weight * energy).real();
                    norm += weight.real();
                }
            }

            static void measure_back_propagated_kinetic_energy(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                const auto& gfs = handle.back_propagated_gfs();
                for (std::size_t w = 0; w < population.size(); ++w) {
                    if (!handle.has_back_propagated_gf(w)) { continue; }
                    const Scalar weight = population[w].complex_weight();
                    cache += (weight * model.kinetic_energy(gfs[w][0], gfs[w][1])).real();
                    norm += weight.real();
                }
            }

            static void measure_back_propagated_potential_energy(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                const auto& gfs = handle.back_propagated_gfs();
                for (std::size_t w = 0; w < population.size(); ++w) {
                    if (!handle.has_back_propagated_gf(w)) { continue; }
                    const Scalar weight = population[w].complex_weight();
                    cache += (weight * model.potential_energy(gfs[w][0], gfs[w][1])).real();
                    norm += weight.real();
                }
            }

            /*
             *
             *  One-body density matrix rho_s(i,j) = < c^+(i,s) c(j,s) > = G_s(j,i)
             *
             */
            static void measure_back_propagated_one_rdm(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                const int ns = model.ns();
                const auto& gfs = handle.back_propagated_gfs();
                for (std::size_t w = 0; w < population.size(); ++w) {
                    if (!handle.has_back_propagated_gf(w)) { continue; }
                    const Scalar weight = population[w].complex_weight();
                    for (int spin = 0; spin < 2; ++spin) {
                        for (int i = 0; i < ns; ++i) {
                            for (int j = 0; j < ns; ++j) {
                                cache(spin, i, j) += (weight * gfs[w][spin](j,i)).real();
                            }
                        }
                    }
                    norm += weight.real();
                }
            }

            /*
             *
             *  Momentum distribution
             *
             *    n(k) = \sum_s < c^+(k,s) c(k,s) >
             *         = 1/N \sum_s \sum_{ij} exp( ik*(ri-rj) ) < c^+(i,s) c(j,s) >
             *         = 1/N \sum_s f^T G_s f^* ,    f(i) = exp( -ik*ri )
             *
             */
            static void measure_momentum_distribution(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                const int ns = model.ns();
                const auto& gfs = handle.back_propagated_gfs();
                for (std::size_t w = 0; w < population.size(); ++w) {
                    if (!handle.has_back_propagated_gf(w)) { continue; }
                    const Scalar weight = population[w].complex_weight();
                    for (int k = 0; k < ns; ++k) {
                        // fc = f^*, and fc.dot(v) = f^T v
                        Eigen::VectorXcd fc(ns);
                        for (int i = 0; i < ns; ++i) { fc(i) = std::conj(lattice.fourierFactor(i, k)); }
                        Scalar nk(0.0, 0.0);
                        for (int spin = 0; spin < 2; ++spin) {
                            nk += fc.dot(gfs[w][spin] * fc);
                        }
                        cache(k) += (weight * nk).real() / ns;
                    }
                    norm += weight.real();
                }
            }

            // ------------------------------------  Imaginary-time correlation functions  ------------------------------------

            /*
             *
             *  Greater Green's functions  G_s(tau,i,j) = < c(i,s,tau) c^+(j,s,0) >  for tau = 0, dt, ..., tmax
             *
             */
            static void measure_imaginary_time_green_functions(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                const int ns = model.ns();
                const auto& gfs = handle.itcf_gfs();
                for (std::size_t w = 0; w < population.size(); ++w) {
                    if (!handle.has_itcf_gfs(w)) { continue; }
                    const Scalar weight = population[w].complex_weight();
                    for (std::size_t t = 0; t < gfs[w].size(); ++t) {
                        for (int spin = 0; spin < 2; ++spin) {
                            for (int i = 0; i < ns; ++i) {
                                for (int j = 0; j < ns; ++j) {
                                    cache(t, spin, i, j) += (weight * gfs[w][t][spin](i,j)).real();
                                }
                            }
                        }
                    }
                    norm += weight.real();
                }
            }

            /*
             *
             *  Momentum-resolved greater Green's functions, averaged over spins
             *
             *    G(k,tau) = 1/(2N) \sum_s \sum_{ij} exp( -ik*(ri-rj) ) < c(i,s,tau) c^+(j,s,0) >
             *
             */
            static void measure_imaginary_time_green_functions_k(obs_struct& cache, double& norm, const Population& population,
                const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                const int ns = model.ns();
                const auto& gfs = handle.itcf_gfs();
                for (std::size_t w = 0; w < population.size(); ++w) {
                    if (!handle.has_itcf_gfs(w)) { continue; }
                    const Scalar weight = population[w].complex_weight();
                    for (int k = 0; k < ns; ++k) {
                        Eigen::VectorXcd fc(ns);
                        for (int i = 0; i < ns; ++i) { fc(i) = std::conj(lattice.fourierFactor(i, k)); }
                        for (std::size_t t = 0; t < gfs[w].size(); ++t) {
                            Scalar gk(0.0, 0.0);
                            for (int spin = 0; spin < 2; ++spin) {
                                gk += fc.dot(gfs[w][t][spin] * fc);
                            }
                            cache(t, k) += (weight * gk).real() / (2*ns);
                        }
                    }
                    norm += weight.real();
                }
            }
    };

}

#endif
