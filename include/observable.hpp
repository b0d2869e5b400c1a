/*
 *   observable.hpp
 * 
 *     Created on: Jun 10, 2025
 * 
 */

#pragma once
#ifndef OBSERVABLE_HPP
#define OBSERVABLE_HPP

#include <xtensor/xarray.hpp>
#include <xtensor/xmath.hpp>
#include <xtensor/xstrided_view.hpp>
#include <xtensor/xnoalias.hpp>
#include <xtensor/xio.hpp>

#include <cmath>
#include <string>
#include <vector>
#include <algorithm>
#include <functional>
#include <stdexcept>
#include "utils/blocking.hpp"

namespace Model { class Hubbard; }
namespace Lattice { class SquareLattice; }
namespace AFQMC { class Population; }
namespace Estimator { class Handle; }

namespace Observable {

    // -------------------------------------------  Observable::Observable<_scalar>  -------------------------------------------------
    //
    //  Ratio estimator of a walker-weighted average: for every measurement a numerator (cache) and a norm are
    //  accumulated over the local walkers, reduced over all processes, and their ratio is stored as one bin.
    //
    template <typename _scalar>
    class Observable
    {
        public:
            using data_struct = xt::xarray<_scalar>;
            using obs_struct = xt::xarray<_scalar>;
            using data_shape = typename xt::xarray<_scalar>::shape_type;
            using obs_shape = typename xt::xarray<_scalar>::shape_type;
            using cache_view = xt::xstrided_slice_vector;

            using Lattice = Lattice::SquareLattice;
            using Hubbard = Model::Hubbard;
            using Population = AFQMC::Population;
            using EstimatorHandle = Estimator::Handle;
            using measure_method = void (obs_struct&, _scalar&, const Population&, const EstimatorHandle&, const Hubbard&, const Lattice&);
        
        protected:
            // shape of data and observable
            std::size_t m_nbin{};
            obs_shape   m_obs_shape{};
            data_shape  m_data_shape{};
            
            // data structures
            data_struct m_data{};
            obs_struct m_mean{};
            obs_struct m_stddev{};
            obs_struct m_stderr{};
            obs_struct m_cache{};
            _scalar m_norm{};
            double m_blocking_error{};

            // name and description to the observable
            std::string m_name{};
            std::string m_desc{};
            std::size_t m_count{};
            std::size_t m_nsamples{};
            std::vector<int> m_steps{};

            // customized method for the observable measurement
            std::function<measure_method> m_method{};

        public:
            // --------------------------------------------  Interfaces  -----------------------------------------------------
            // number of filled bins, and the number of bins entering the statistics
            std::size_t counts() const { return this->m_count; }
            std::size_t samples() const { return this->m_nsamples; }
            const std::string name() const { return this->m_name; }
            const std::string description() const { return this->m_desc; }
            std::size_t nbin() const { return this->m_nbin; }
            const obs_shape obsShape() const { return this->m_obs_shape; }
            bool is_scalar() const { return this->m_obs_shape.empty(); }

            // access to the bin data, and the steps at which the bins were measured
            data_struct& data() { return this->m_data; }
            const data_struct& data() const { return this->m_data; }
            const data_shape& dataShape() const { return this->m_data_shape; }
            const std::vector<int>& steps() const { return this->m_steps; }

            // statistical mean value and error bar
            const obs_struct& mean() const { return this->m_mean; }
            const obs_struct& stddev() const { return this->m_stddev; }
            const obs_struct& stderr() const { return this->m_stderr; }
            double blocking_error() const { return this->m_blocking_error; }

            obs_struct& cache() { return this->m_cache; }
            const obs_struct& cache() const { return this->m_cache; }
            _scalar& norm() { return this->m_norm; }
            _scalar norm() const { return this->m_norm; }

            // ------------------------------------------  Setup functions  --------------------------------------------------
            void set_shape(const std::size_t nbin, const obs_shape& obs_shape)
            {
                this->m_nbin = nbin;
                this->m_obs_shape = obs_shape;

                std::vector<std::size_t> shape;
                shape.reserve(obs_shape.size()+1);
                shape.emplace_back(nbin);
                shape.insert(shape.end(), obs_shape.begin(), obs_shape.end());
                this->m_data_shape = shape;

                // shape the data structure
                xt::noalias(this->m_data) = xt::zeros<_scalar>(this->m_data_shape);
                this->clear_stats();
                this->clear_cache();
                this->m_count = 0;
                this->m_steps.clear();
                this->m_steps.reserve(nbin);
            }

            void set_name_and_desc(const std::string name, const std::string desc)
            {
                this->m_name = name;
                this->m_desc = desc;
            }
            
            void link2method(const std::function<measure_method>& method) { this->m_method = method; }

            // --------------------------------  Observable measurements and statistics  -------------------------------------
            // customized method for the measurement of observable ( core method )
            void measure(const Population& population, const EstimatorHandle& handle, const Hubbard& model, const Lattice& lattice)
            {
                this->m_method(this->m_cache, this->m_norm, population, handle, model, lattice);
            }
            
            // normalize the (reduced) cache data by the (reduced) norm
            void normalize_cache()
            {
                if (this->m_norm != _scalar(0)) {
                    this->m_cache /= this->m_norm;
                }
                else {
                    throw std::runtime_error(
                        "Observable::Observable<_scalar>::normalize_cache(): cache divided by zero."
                    );
                }
            }

            // store the cache observable into the next bin
            void push_cache_to_data(const int step)
            {
                if (this->m_count < this->m_nbin) {
                    cache_view view({static_cast<std::ptrdiff_t>(this->m_count)});
                    for (std::size_t i = 0; i < this->m_obs_shape.size(); ++i) {
                        view.push_back(xt::all());
                    }
                    xt::strided_view(this->m_data, view) = this->m_cache;
                    this->m_steps.push_back(step);
                    ++this->m_count;
                }
                else {
                    throw std::out_of_range(
                        "Observable::Observable<_scalar>::push_cache_to_data(): index of bin out of range."
                    );
                }
            }

            // perform the statistical analysis over the bins measured after the equilibration,
            // evaluating the mean, stddev, and stderr, and for scalar observables the reblocked error.
            void analyse(const int nequilibrate)
            {
                // clear previous statistical results
                this->clear_stats();

                const auto first = static_cast<std::size_t>(
                    std::upper_bound(this->m_steps.begin(), this->m_steps.end(), nequilibrate) - this->m_steps.begin()
                );
                this->m_nsamples = this->m_count - first;
                if (this->m_nsamples == 0) { return; }

                cache_view range({xt::range(static_cast<std::ptrdiff_t>(first), static_cast<std::ptrdiff_t>(this->m_count))});
                for (std::size_t i = 0; i < this->m_obs_shape.size(); ++i) {
                    range.push_back(xt::all());
                }
                const data_struct samples = xt::strided_view(this->m_data, range);

                // evaluate the mean, stddev, and stderr with respect to the first dimension (bins)
                xt::noalias(this->m_mean) = xt::mean(samples, {0});
                xt::noalias(this->m_stddev) = xt::stddev(samples, {0});
                xt::noalias(this->m_stderr) = this->m_stddev / std::sqrt(this->m_nsamples);

                if (this->is_scalar()) {
                    std::vector<double> series(samples.begin(), samples.end());
                    this->m_blocking_error = Utils::Blocking::standard_error(series);
                }
            }

            // clear the statistical data, preparing for a new measurement
            void clear_stats()
            {
                xt::noalias(this->m_mean) = xt::zeros<_scalar>(this->m_obs_shape);
                xt::noalias(this->m_stddev) = xt::zeros<_scalar>(this->m_obs_shape);
                xt::noalias(this->m_stderr) = xt::zeros<_scalar>(this->m_obs_shape);
                this->m_blocking_error = 0.0;
                this->m_nsamples = 0;
            }
            
            // clear the cache data
            void clear_cache()
            {
                xt::noalias(this->m_cache) = xt::zeros<_scalar>(this->m_obs_shape);
                this->m_norm = _scalar(0);
            }
    };

    // some aliases
    using ObservableReal = Observable<double>;
}

#endif
