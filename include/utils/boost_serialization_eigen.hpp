/*
 *   boost_serialization_eigen.hpp
 * 
 *     Created on: Jun 6, 2025
 * 
 *   Serialization of dense Eigen matrices and vectors,
 *   used for transferring walkers and trial orbitals among processors.
 */

#pragma once
#ifndef AFQMC_BOOST_SERIALIZATION_EIGEN_HPP
#define AFQMC_BOOST_SERIALIZATION_EIGEN_HPP

#include <array>
#include <Eigen/Core>
#include <boost/serialization/split_free.hpp>
#include <boost/serialization/array_wrapper.hpp>
#include <boost/serialization/array.hpp>
#include <boost/serialization/complex.hpp>

namespace boost {
    namespace serialization {

        // ------------------------------  Eigen::Matrix  --------------------------------

        template<class Archive, class S, int R, int C, int O, int MR, int MC>
        void save(Archive& ar, const Eigen::Matrix<S, R, C, O, MR, MC>& mat, const unsigned int version) {
            Eigen::Index rows = mat.rows();
            Eigen::Index cols = mat.cols();
            ar & rows;
            ar & cols;
            ar & boost::serialization::make_array(mat.data(), mat.size());
        }

        template<class Archive, class S, int R, int C, int O, int MR, int MC>
        void load(Archive& ar, Eigen::Matrix<S, R, C, O, MR, MC>& mat, const unsigned int version) {
            Eigen::Index rows, cols;
            ar & rows;
            ar & cols;
            mat.resize(rows, cols);
            ar & boost::serialization::make_array(mat.data(), mat.size());
        }

        template<class Archive, class S, int R, int C, int O, int MR, int MC>
        void serialize(Archive& ar, Eigen::Matrix<S, R, C, O, MR, MC>& mat, const unsigned int version) {
            boost::serialization::split_free(ar, mat, version);
        }

    }  // namespace serialization
}  // namespace boost

#endif // AFQMC_BOOST_SERIALIZATION_EIGEN_HPP
