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

#ifndef KESTREL_CONDITIONALS_BASE_CONDITIONAL_HPP_
#define KESTREL_CONDITIONALS_BASE_CONDITIONAL_HPP_

namespace kestrel {

namespace details {

inline ConditionalStatus check_base_conditional_inputs(
    const std::vector<Eigen::MatrixXd> &Kmn, const Eigen::MatrixXd &Kmm,
    const std::vector<Eigen::MatrixXd> &Knn, const Eigen::MatrixXd &function,
    const ConditionalOptions &options, const VariationalFactor *q_sqrt) {
  if (Kmn.empty()) {
    return shape_mismatch("Kmn batch size", 1, 0);
  }
  const Eigen::Index m = Kmm.rows();
  const Eigen::Index n = Kmn[0].cols();

  if (function.rows() != m) {
    return shape_mismatch("function rows", m, function.rows());
  }
  for (const auto &cross : Kmn) {
    if (cross.rows() != m) {
      return shape_mismatch("Kmn rows", m, cross.rows());
    }
    if (cross.cols() != n) {
      return shape_mismatch("Kmn columns", n, cross.cols());
    }
  }

  if (Knn.size() != 1 && Knn.size() != Kmn.size()) {
    return shape_mismatch("Knn batch size", cast::to_index(Kmn.size()),
                          cast::to_index(Knn.size()));
  }
  const Eigen::Index knn_cols = options.full_cov ? n : 1;
  for (const auto &prior : Knn) {
    if (prior.rows() != n) {
      return shape_mismatch("Knn rows", n, prior.rows());
    }
    if (prior.cols() != knn_cols) {
      return shape_mismatch("Knn columns", knn_cols, prior.cols());
    }
  }

  if (q_sqrt != nullptr) {
    return check_variational_factor(*q_sqrt, m, function.cols());
  }
  return ConditionalStatus::success();
}

} // namespace details

/*
 * Given inducing values g2 and query values g1 with,
 *
 *     p(g2) = N(0, Kmm)
 *     p(g1) = N(0, Knn)
 *     cov(g2, g1) = Kmn
 *
 * and a distribution over the inducing values,
 *
 *     q(g2) = N(function, q_sqrt q_sqrt^T)
 *
 * this computes the mean and (co)variance of
 *
 *     q(g1) = int p(g1|g2) q(g2) dg2
 *
 * for each of the R columns of `function`, which share Kmm, Kmn and Knn.
 *
 *   Kmn : B batch entries of M x N
 *   Kmm : M x M
 *   Knn : N x N (full_cov) or N x 1, either one shared by every batch
 *         entry or one per entry.
 *   function : M x R
 *   q_sqrt : optional, a DiagonalFactor (M x R) or a TriangularFactor
 *            (R of M x M).
 *
 * Each batch entry gets an N x R mean and either an InputCovariance
 * (R blocks of N x N) or an IndependentVariance (N x R).  Kmm is only
 * factorized once.
 */
inline BatchConditionalOutput
base_conditional(const std::vector<Eigen::MatrixXd> &Kmn,
                 const Eigen::MatrixXd &Kmm,
                 const std::vector<Eigen::MatrixXd> &Knn,
                 const Eigen::MatrixXd &function,
                 const ConditionalOptions &options = ConditionalOptions(),
                 const VariationalFactor *q_sqrt = nullptr) {
  const ConditionalStatus input_status = details::check_base_conditional_inputs(
      Kmn, Kmm, Knn, function, options, q_sqrt);
  if (!input_status.ok()) {
    return BatchConditionalOutput(input_status);
  }

  const Eigen::Index num_func = function.cols();
  const std::size_t num_func_size = cast::to_size(num_func);
  details::trace(options, "base_conditional",
                 {{"B", cast::to_index(Kmn.size())},
                  {"M", Kmm.rows()},
                  {"N", Kmn[0].cols()},
                  {"R", num_func}});

  Eigen::LLT<Eigen::MatrixXd> Kmm_llt;
  const ConditionalStatus factor_status = cholesky(Kmm, &Kmm_llt);
  if (!factor_status.ok()) {
    return BatchConditionalOutput(factor_status);
  }

  BatchConditionalOutput output(ConditionalStatus::success());
  for (std::size_t b = 0; b < Kmn.size(); ++b) {
    const Eigen::MatrixXd &prior = Knn.size() == 1 ? Knn[0] : Knn[b];

    Eigen::MatrixXd A = sqrt_solve(Kmm_llt, Kmn[b]);

    // The covariance which remains after conditioning, identical for
    // every column of `function`.
    std::vector<Eigen::MatrixXd> blocks;
    Eigen::MatrixXd variance;
    if (options.full_cov) {
      const Eigen::MatrixXd fvar = prior - A.transpose() * A;
      blocks.assign(num_func_size, fvar);
    } else {
      const Eigen::VectorXd fvar =
          prior.col(0) - A.colwise().squaredNorm().transpose();
      variance = fvar.replicate(1, num_func);
    }

    if (!options.white) {
      A = sqrt_solve_transpose(Kmm_llt, A);
    }

    output.means.emplace_back(A.transpose() * function);

    if (q_sqrt != nullptr) {
      for (std::size_t k = 0; k < num_func_size; ++k) {
        const Eigen::MatrixXd LTA = factor_transpose_product(*q_sqrt, k, A);
        if (options.full_cov) {
          blocks[k].noalias() += LTA.transpose() * LTA;
        } else {
          variance.col(cast::to_index(k)) +=
              LTA.colwise().squaredNorm().transpose();
        }
      }
    }

    if (options.full_cov) {
      output.covariances.emplace_back(InputCovariance(blocks));
    } else {
      output.covariances.emplace_back(IndependentVariance(variance));
    }
  }
  return output;
}

inline ConditionalOutput
base_conditional(const Eigen::MatrixXd &Kmn, const Eigen::MatrixXd &Kmm,
                 const Eigen::MatrixXd &Knn, const Eigen::MatrixXd &function,
                 const ConditionalOptions &options = ConditionalOptions(),
                 const VariationalFactor *q_sqrt = nullptr) {
  const std::vector<Eigen::MatrixXd> Kmn_batch = {Kmn};
  const std::vector<Eigen::MatrixXd> Knn_batch = {Knn};
  const auto batch_output =
      base_conditional(Kmn_batch, Kmm, Knn_batch, function, options, q_sqrt);
  return batch_output[0];
}

} // namespace kestrel

#endif /* KESTREL_CONDITIONALS_BASE_CONDITIONAL_HPP_ */
