#ifndef NESTSAMP_TYPEDEFS_H
#define NESTSAMP_TYPEDEFS_H

#include <cstddef>
#include <Eigen/Dense>

typedef double float_type;

// a Row is about one point (its coordinates); a Col is about one feature across points
typedef Eigen::Matrix<float_type, Eigen::Dynamic, Eigen::Dynamic> Mat2D;
typedef Eigen::Matrix<float_type, Eigen::Dynamic, 1> Col;
typedef Eigen::Matrix<float_type, 1, Eigen::Dynamic> Row;

#endif // NESTSAMP_TYPEDEFS_H
