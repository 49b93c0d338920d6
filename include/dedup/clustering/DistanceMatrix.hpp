/**
 * @file DistanceMatrix.hpp
 * @brief Square pairwise distance matrix over one sub-block
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_CLUSTERING_DISTANCEMATRIX_HPP
#define DEDUP_CLUSTERING_DISTANCEMATRIX_HPP

#include "../core/Types.hpp"
#include "../core/Errors.hpp"
#include <cmath>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Symmetric distance matrix with zero diagonal
 *
 * A new matrix has every off-diagonal entry set to UNREACHABLE_DISTANCE;
 * only compared pairs that pass the similarity threshold get a finite
 * distance. Storage is row-major.
 */
class DistanceMatrix {
public:
    DistanceMatrix() = default;

    explicit DistanceMatrix(size_t n)
        : n_(n)
        , data_(n * n, UNREACHABLE_DISTANCE) {
        for (size_t i = 0; i < n_; ++i) {
            data_[i * n_ + i] = 0.0;
        }
    }

    size_t size() const { return n_; }
    bool empty() const { return n_ == 0; }

    double at(size_t i, size_t j) const { return data_[i * n_ + j]; }
    double operator()(size_t i, size_t j) const { return at(i, j); }

    /**
     * @brief Set a symmetric entry
     */
    void set(size_t i, size_t j, double distance) {
        data_[i * n_ + j] = distance;
        data_[j * n_ + i] = distance;
    }

    /**
     * @brief Set a single entry (may break symmetry)
     */
    void setEntry(size_t i, size_t j, double distance) {
        data_[i * n_ + j] = distance;
    }

    bool isReachable(size_t i, size_t j) const {
        return std::isfinite(at(i, j));
    }

    /**
     * @brief Check the matrix is a valid precomputed metric input
     *
     * @throws ClusteringError on NaN or negative entries, a non-zero
     *         diagonal or asymmetry
     */
    void validate() const {
        for (size_t i = 0; i < n_; ++i) {
            if (at(i, i) != 0.0) {
                throw ClusteringError("Distance matrix diagonal must be zero (row " +
                                      std::to_string(i) + ")");
            }
            for (size_t j = 0; j < n_; ++j) {
                double d = at(i, j);
                if (std::isnan(d) || d < 0.0) {
                    throw ClusteringError("Distance matrix entry (" + std::to_string(i) + ", " +
                                          std::to_string(j) + ") is not a distance");
                }
                if (j > i && d != at(j, i)) {
                    throw ClusteringError("Distance matrix is not symmetric at (" +
                                          std::to_string(i) + ", " + std::to_string(j) + ")");
                }
            }
        }
    }

private:
    size_t n_ = 0;
    std::vector<double> data_;
};

} // namespace dedup

#endif // DEDUP_CLUSTERING_DISTANCEMATRIX_HPP
