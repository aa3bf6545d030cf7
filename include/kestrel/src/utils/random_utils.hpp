/*
 * Copyright (C) 2026 Swift Navigation Inc.
 * Contact: Swift Navigation <dev@swiftnav.com>
 *
 * This source is subject to the license found in the file 'LICENSE' which must
 * be distributed together with this source. All other rights reserved.
 *
 * THIS CODE AND INFORMATION IS PROVIDED "AS IS" WITHOUT WARRANTY OF ANY KIND,
 * EITHER EXPRESSED OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND/OR FITNESS FOR A PARTICULAR PURPOSE.
 */

#ifndef KESTREL_RANDOM_UTILS_H
#define KESTREL_RANDOM_UTILS_H

namespace kestrel {

template <typename _Scalar, int _Rows, int _Cols, typename DistributionType,
          typename RandomNumberGenerator>
void random_fill(Eigen::Matrix<_Scalar, _Rows, _Cols> &matrix,
                 DistributionType &dist, RandomNumberGenerator &rng) {

  auto random_sample = [&]() { return dist(rng); };

  matrix = Eigen::Matrix<_Scalar, _Rows, _Cols>::NullaryExpr(
      matrix.rows(), matrix.cols(), random_sample);
}

template <typename _Scalar, int _Rows, int _Cols,
          typename RandomNumberGenerator>
void gaussian_fill(Eigen::Matrix<_Scalar, _Rows, _Cols> &matrix, double mean,
                   double sd, RandomNumberGenerator &rng) {
  std::normal_distribution<_Scalar> dist(mean, sd);
  random_fill(matrix, dist, rng);
}

template <typename _Scalar, int _Rows, int _Cols,
          typename RandomNumberGenerator>
void gaussian_fill(Eigen::Matrix<_Scalar, _Rows, _Cols> &matrix,
                   RandomNumberGenerator &rng) {
  gaussian_fill(matrix, 0., 1., rng);
}

/*
 * A random symmetric positive definite matrix, Q D Q^T, with a random
 * orthonormal Q and eigen values drawn from `eigen_value_distribution`.
 */
template <typename Distribution, typename RandomNumberGenerator>
inline Eigen::MatrixXd
random_covariance_matrix(Eigen::Index k, Distribution &eigen_value_distribution,
                         RandomNumberGenerator &gen) {

  Eigen::MatrixXd Q(k, k);
  gaussian_fill(Q, gen);
  Q = Q.colPivHouseholderQr().householderQ();

  Eigen::VectorXd diag(k);

  random_fill(diag, eigen_value_distribution, gen);

  return Q * diag.asDiagonal() * Q.transpose();
}

template <typename RandomNumberGenerator>
inline Eigen::MatrixXd random_covariance_matrix(Eigen::Index k,
                                                RandomNumberGenerator &gen) {
  // Bounded away from zero so the result can be safely factorized.
  std::uniform_real_distribution<double> distribution(0.5, 2.0);
  return random_covariance_matrix(k, distribution, gen);
}

/*
 * A random lower triangular matrix with a positive diagonal, ie a
 * valid Cholesky factor.
 */
template <typename RandomNumberGenerator>
inline Eigen::MatrixXd random_lower_triangular(Eigen::Index k,
                                               RandomNumberGenerator &gen) {
  Eigen::MatrixXd random(k, k);
  gaussian_fill(random, 0., 0.5, gen);
  Eigen::MatrixXd L = random.triangularView<Eigen::Lower>();
  L.diagonal() = (L.diagonal().array().abs() + 0.1).matrix();
  return L;
}

template <typename RandomNumberGenerator>
inline Eigen::VectorXd random_multivariate_normal(const Eigen::VectorXd &mean,
                                                  const Eigen::MatrixXd &cov,
                                                  RandomNumberGenerator &gen) {
  KESTREL_ASSERT(mean.size() == cov.rows());
  KESTREL_ASSERT(cov.rows() == cov.cols());

  Eigen::VectorXd sample(mean.size());
  gaussian_fill(sample, gen);

  sample = cov.llt().matrixL() * sample;

  sample += mean;

  return sample;
}

} // namespace kestrel

#endif
