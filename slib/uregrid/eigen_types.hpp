#ifndef UREGRID_EIGEN_TYPES_HPP
#define UREGRID_EIGEN_TYPES_HPP

#include <Eigen/SparseCore>
#include <Eigen/Dense>

namespace uregrid {

// Types that will be used throughout as template arguments
typedef double val_type;

// -----------------------------------------
typedef Eigen::SparseMatrix<val_type, Eigen::RowMajor> EigenSparseMatrixT;
typedef Eigen::Triplet<val_type> EigenTripletT;
typedef Eigen::Matrix<val_type, Eigen::Dynamic, Eigen::Dynamic> EigenDenseMatrixT;
typedef Eigen::Matrix<val_type, Eigen::Dynamic, 1> EigenColVectorT;
// -----------------------------------------

}

#endif
