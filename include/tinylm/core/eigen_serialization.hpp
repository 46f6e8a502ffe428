#pragma once

#include <cstdint>
#include <Eigen/Dense>
#include <cereal/cereal.hpp>

namespace cereal {

// Serialization for Eigen matrices (binary archives)
template <class Archive, typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
void save(Archive& archive, const Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>& matrix) {
    int64_t rows = matrix.rows();
    int64_t cols = matrix.cols();
    archive(rows, cols);
    archive(binary_data(matrix.data(), static_cast<std::size_t>(matrix.size()) * sizeof(Scalar)));
}

template <class Archive, typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
void load(Archive& archive, Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>& matrix) {
    int64_t rows = 0;
    int64_t cols = 0;
    archive(rows, cols);

    if (rows < 0 || cols < 0) {
        throw Exception("Corrupt matrix dimensions in archive");
    }
    matrix.resize(rows, cols);

    archive(binary_data(matrix.data(), static_cast<std::size_t>(matrix.size()) * sizeof(Scalar)));
}

} // namespace cereal
