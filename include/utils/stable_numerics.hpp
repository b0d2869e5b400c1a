/*
 *   stable_numerics.hpp
 * 
 *     Created on: Jun 5, 2025
 * 
 *   This head file defines the static class Utils::StableNumerics,
 *   containing subroutines for the orthonormalization of walker orbitals,
 *   the evaluation of mixed Green's functions and overlaps,
 *   and the stabilized accumulation of long products of propagators (UDT decomposition).
 */

#pragma once
#ifndef AFQMC_UTILS_STABLE_NUMERICS_HPP
#define AFQMC_UTILS_STABLE_NUMERICS_HPP

#include <cmath>
#include <complex>
#include <cassert>
#include <stdexcept>
#include <Eigen/Core>
#include <Eigen/LU>
#include <Eigen/QR>

namespace Utils {

    // -------------------------------------------------  Utils::StableNumerics class  -------------------------------------------------------
    class StableNumerics {
        public:
            using Scalar = std::complex<double>;
            using Matrix = Eigen::MatrixXcd;
            using Vector = Eigen::VectorXd;

            // U * diag(D) * T representation of a (possibly ill-conditioned) square matrix,
            // where U is unitary, D collects the scales and T is well conditioned.
            struct UDT {
                Matrix U{};
                Vector D{};
                Matrix T{};
            };

            // Orthonormalize the columns of phi in place, phi = Q * R -> Q.
            // Returns det(R), i.e. the factor by which every overlap <psi|phi> is divided.
            static Scalar orthonormalize(Matrix& phi)
            {
                const auto ncols = phi.cols();
                if (ncols == 0) { return Scalar(1.0, 0.0); }

                Eigen::HouseholderQR<Matrix> qr(phi);
                const Matrix R = qr.matrixQR().topRows(ncols).triangularView<Eigen::Upper>();
                Scalar det_r(1.0, 0.0);
                for (Eigen::Index i = 0; i < ncols; ++i) {
                    det_r *= R(i,i);
                }
                phi = qr.householderQ() * Matrix::Identity(phi.rows(), ncols);
                return det_r;
            }


            // Compute the inverse overlap matrix (psi^H phi)^-1 and the mixed Green's function
            //
            //      G = phi * (psi^H phi)^-1 * psi^H ,    G(i,i) = <psi| n_i |phi> / <psi|phi>
            //
            // Returns the overlap det(psi^H phi).
            static Scalar compute_mixed_gf(const Matrix& phi, const Matrix& psi, Matrix& inv_ovlp, Matrix& gf)
            {
                assert(phi.rows() == psi.rows());
                assert(phi.cols() == psi.cols());
                const auto nsite = phi.rows();
                if (phi.cols() == 0) {
                    inv_ovlp.resize(0, 0);
                    gf = Matrix::Zero(nsite, nsite);
                    return Scalar(1.0, 0.0);
                }
                const Matrix ovlp = psi.adjoint() * phi;
                Eigen::PartialPivLU<Matrix> lu(ovlp);
                inv_ovlp = lu.inverse();
                gf = phi * inv_ovlp * psi.adjoint();
                return lu.determinant();
            }


            // UDT decomposition of the identity matrix of dimension n
            static UDT udt_identity(const Eigen::Index n)
            {
                UDT udt;
                udt.U = Matrix::Identity(n, n);
                udt.D = Vector::Ones(n);
                udt.T = Matrix::Identity(n, n);
                return udt;
            }

            // Multiply the UDT decomposition from the left by the dense matrix B and refactorize,
            //
            //      B * U D T = (B U D) T = Q R P^T T = Q * |diag R| * ( |diag R|^-1 R P^T T ) .
            //
            static void udt_multiply_from_left(const Matrix& B, UDT& udt)
            {
                assert(B.cols() == udt.U.rows());
                const Matrix M = (B * udt.U) * udt.D.asDiagonal();
                Eigen::ColPivHouseholderQR<Matrix> qr(M);
                const auto n = M.cols();
                const Matrix R = qr.matrixQR().triangularView<Eigen::Upper>();

                Vector d(n);
                for (Eigen::Index i = 0; i < n; ++i) {
                    d(i) = std::abs(R(i,i));
                    if (d(i) == 0.0) {
                        throw std::runtime_error("Utils::StableNumerics::udt_multiply_from_left(): singular matrix product.");
                    }
                }
                Matrix scaled_R = d.cwiseInverse().asDiagonal() * R;
                udt.T = scaled_R * qr.colsPermutation().transpose() * udt.T;
                udt.U = qr.householderQ();
                udt.D = d;
            }

            // Assemble the dense matrix U * diag(D) * T (only safe if the scales are moderate)
            static Matrix udt_to_matrix(const UDT& udt)
            {
                return udt.U * udt.D.asDiagonal() * udt.T;
            }
    };

} // namespace Utils

#endif // AFQMC_UTILS_STABLE_NUMERICS_HPP
