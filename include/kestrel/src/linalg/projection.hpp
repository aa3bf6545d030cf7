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

#ifndef KESTREL_LINALG_PROJECTION_HPP_
#define KESTREL_LINALG_PROJECTION_HPP_

namespace kestrel {

inline ConditionalStatus cholesky(const Eigen::MatrixXd &K,
                                  Eigen::LLT<Eigen::MatrixXd> *llt,
                                  const std::string &name = "Kmm") {
  if (K.rows() != K.cols()) {
    return details::shape_mismatch(name + " columns", K.rows(), K.cols());
  }
  llt->compute(K);
  if (llt->info() != Eigen::Success) {
    return ConditionalStatus(CONDITIONAL_RETURN_CODE_FACTORIZATION_FAILED,
                             name + " is not positive definite");
  }
  return ConditionalStatus::success();
}

/*
 * Given K = L L^T computes,
 *
 *     A = L^-1 rhs
 *
 * by forward substitution.  Then A^T A = rhs^T K^-1 rhs which is the
 * part of the prior covariance explained by the inducing points.
 */
inline Eigen::MatrixXd sqrt_solve(const Eigen::LLT<Eigen::MatrixXd> &llt,
                                  const Eigen::MatrixXd &rhs) {
  return llt.matrixL().solve(rhs);
}

/*
 * Takes A = L^-1 rhs from sqrt_solve and finishes the solve,
 *
 *     L^-T A = K^-1 rhs
 */
inline Eigen::MatrixXd
sqrt_solve_transpose(const Eigen::LLT<Eigen::MatrixXd> &llt,
                     const Eigen::MatrixXd &A) {
  return llt.matrixU().solve(A);
}

/*
 * A projection matrix X has one column per (n, p) pair stored at
 * n * P + p.  This gives a view of the N columns belonging to output p.
 */
inline Eigen::Map<const Eigen::MatrixXd, 0, Eigen::OuterStride<>>
output_columns(const Eigen::MatrixXd &X, Eigen::Index p,
               Eigen::Index num_outputs) {
  KESTREL_ASSERT(p >= 0 && p < num_outputs);
  KESTREL_ASSERT(X.cols() % num_outputs == 0);
  return Eigen::Map<const Eigen::MatrixXd, 0, Eigen::OuterStride<>>(
      X.data() + p * X.rows(), X.rows(), X.cols() / num_outputs,
      Eigen::OuterStride<>(num_outputs * X.rows()));
}

/*
 * Given projections X_k (each rows_k x NP) computes
 *
 *     sum_k X_k^T X_k
 *
 * but only the parts of it needed for the requested structure.
 * Stacking all the X_k on top of each other and contracting over the
 * stacked axis gives the same thing, for example the interdomain
 * conditional contracts over both the latent and inducing axes.
 */
inline ConditionalCovariance
projection_covariance(const std::vector<Eigen::MatrixXd> &projections,
                      Eigen::Index num_points, Eigen::Index num_outputs,
                      bool full_cov, bool full_output_cov) {
  const Eigen::Index n_total = num_points * num_outputs;
  for (const auto &X : projections) {
    KESTREL_ASSERT(X.cols() == n_total);
  }

  if (full_cov && full_output_cov) {
    Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(n_total, n_total);
    for (const auto &X : projections) {
      cov.noalias() += X.transpose() * X;
    }
    return JointCovariance(cov, num_outputs);
  }

  if (full_cov) {
    std::vector<Eigen::MatrixXd> blocks;
    for (Eigen::Index p = 0; p < num_outputs; ++p) {
      Eigen::MatrixXd block = Eigen::MatrixXd::Zero(num_points, num_points);
      for (const auto &X : projections) {
        const auto X_p = output_columns(X, p, num_outputs);
        block.noalias() += X_p.transpose() * X_p;
      }
      blocks.emplace_back(block);
    }
    return InputCovariance(blocks);
  }

  if (full_output_cov) {
    std::vector<Eigen::MatrixXd> blocks;
    for (Eigen::Index n = 0; n < num_points; ++n) {
      Eigen::MatrixXd block = Eigen::MatrixXd::Zero(num_outputs, num_outputs);
      for (const auto &X : projections) {
        const auto X_n = X.middleCols(flat_index(n, 0, num_outputs),
                                      num_outputs);
        block.noalias() += X_n.transpose() * X_n;
      }
      blocks.emplace_back(block);
    }
    return OutputCovariance(blocks);
  }

  Eigen::RowVectorXd squared_norms = Eigen::RowVectorXd::Zero(n_total);
  for (const auto &X : projections) {
    squared_norms += X.colwise().squaredNorm();
  }
  return IndependentVariance(
      unflatten(squared_norms, num_points, num_outputs));
}

} // namespace kestrel

#endif /* KESTREL_LINALG_PROJECTION_HPP_ */
