#ifndef LEGISSIM_TYPEDEFS_H
#define LEGISSIM_TYPEDEFS_H

#include <concepts>
#include <Eigen/Dense>

typedef double float_type;

// rows = repetitions, cols = outcome fields
typedef Eigen::Matrix<float_type, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Mat2D;
typedef Eigen::Matrix<float_type, Eigen::Dynamic, 1> Col;
typedef Eigen::Matrix<float_type, 1, Eigen::Dynamic> Row;

template <typename T>
concept NumericType = std::integral<T> or std::floating_point<T>;

#endif // LEGISSIM_TYPEDEFS_H
