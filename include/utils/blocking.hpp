/*
 *   blocking.hpp
 * 
 *     Created on: Jun 20, 2025
 * 
 *   Reblocking analysis (Flyvbjerg and Petersen) of serially correlated QMC time series.
 *   The optimal block length is chosen following the criterion of Lee et al.,
 *
 *      B^3 > 2 N ( stderr(B) / stderr(1) )^4 ,
 *
 *   where B is the block length and N the number of samples.
 */

#pragma once
#ifndef AFQMC_UTILS_BLOCKING_HPP
#define AFQMC_UTILS_BLOCKING_HPP

#include <cmath>
#include <vector>
#include <cstddef>

namespace Utils {

    // ------------------------------------------------  Utils::Blocking class  -------------------------------------------------------
    class Blocking {
        public:
            struct Block {
                std::size_t block_size{};       // number of original samples per block
                std::size_t nblocks{};          // number of blocks at this level
                double mean{};
                double error{};
                double error_of_error{};          // uncertainty of the error estimate itself
            };

            // repeatedly average neighbouring pairs of samples, stop when fewer than two blocks remain
            static std::vector<Block> reblock(const std::vector<double>& samples)
            {
                std::vector<Block> stats;
                std::vector<double> data = samples;
                std::size_t block_size = 1;
                while (data.size() >= 2) {
                    const double n = static_cast<double>(data.size());
                    double mean = 0.0;
                    for (const auto& x : data) { mean += x; }
                    mean /= n;
                    double var = 0.0;
                    for (const auto& x : data) { var += (x-mean)*(x-mean); }
                    var /= (n-1.0);

                    Block block;
                    block.block_size = block_size;
                    block.nblocks = data.size();
                    block.mean = mean;
                    block.error = std::sqrt(var/n);
                    block.error_of_error = block.error / std::sqrt(2.0*(n-1.0));
                    stats.push_back(block);

                    std::vector<double> coarse;
                    coarse.reserve(data.size()/2);
                    for (std::size_t i = 0; i+1 < data.size(); i += 2) {
                        coarse.push_back(0.5*(data[i]+data[i+1]));
                    }
                    data.swap(coarse);
                    block_size *= 2;
                }
                return stats;
            }

            // index of the optimal blocking level, or the last level if the criterion is never met
            static std::size_t optimal_block(const std::vector<Block>& stats, const std::size_t nsamples)
            {
                if (stats.empty()) { return 0; }
                const double se0 = stats.front().error;
                if (se0 == 0.0) { return 0; }
                for (std::size_t level = 0; level < stats.size(); ++level) {
                    const double b = static_cast<double>(stats[level].block_size);
                    const double ratio = stats[level].error / se0;
                    if (b*b*b > 2.0 * nsamples * std::pow(ratio, 4)) {
                        return level;
                    }
                }
                return stats.size()-1;
            }

            // reblocked standard error of the mean, falls back to zero for less than two samples
            static double standard_error(const std::vector<double>& samples)
            {
                const auto stats = Blocking::reblock(samples);
                if (stats.empty()) { return 0.0; }
                return stats[Blocking::optimal_block(stats, samples.size())].error;
            }
    };

} // namespace Utils

#endif // AFQMC_UTILS_BLOCKING_HPP
