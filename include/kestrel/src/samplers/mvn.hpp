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

#ifndef KESTREL_SAMPLERS_MVN_HPP_
#define KESTREL_SAMPLERS_MVN_HPP_

namespace kestrel {

constexpr double cDefaultJitter = 1e-6;

/*
 * Draws one sample from N independent D dimensional Gaussians with
 * means given by the rows of `mean` (N x D) and covariance either
 *
 *   IndependentVariance : N x D variances,
 *                         sample = mean + sqrt(cov) * eps
 *   OutputCovariance : N blocks of D x D,
 *                      sample_n = mean_n + chol(cov_n + jitter I) eps_n
 *
 * where eps is standard normal.  The jitter keeps the factorization of
 * nearly singular blocks well behaved.  Covariances across the N rows
 * (InputCovariance, JointCovariance) can't be sampled this way and are
 * rejected.
 */
template <typename RandomNumberGenerator>
inline ConditionalStatus
sample_mvn(const Eigen::MatrixXd &mean, const ConditionalCovariance &cov,
           RandomNumberGenerator &gen, Eigen::MatrixXd *sample,
           double jitter = cDefaultJitter) {
  const Eigen::Index n = mean.rows();
  const Eigen::Index d = mean.cols();

  if (!cov.is<IndependentVariance>() && !cov.is<OutputCovariance>()) {
    return ConditionalStatus(
        CONDITIONAL_RETURN_CODE_INVALID_COVARIANCE_STRUCTURE,
        "can't sample a " + structure_name(cov) +
            ", expected an independent_variance or output_covariance");
  }

  const ConditionalStatus cov_status = check_covariance(
      cov, n, d, false, cov.is<OutputCovariance>(), "cov");
  if (!cov_status.ok()) {
    return cov_status;
  }

  if (cov.is<OutputCovariance>()) {
    for (const auto &block : cov.get<OutputCovariance>().blocks) {
      if (block.rows() != d || block.cols() != d) {
        return details::shape_mismatch("cov block size", d,
                                       block.rows() != d ? block.rows()
                                                         : block.cols());
      }
    }
  }

  Eigen::MatrixXd eps(n, d);
  gaussian_fill(eps, gen);

  if (cov.is<IndependentVariance>()) {
    const Eigen::MatrixXd &variance = cov.get<IndependentVariance>().variance;
    *sample = mean + (variance.array().sqrt() * eps.array()).matrix();
    return ConditionalStatus::success();
  }

  const auto &blocks = cov.get<OutputCovariance>().blocks;
  const Eigen::MatrixXd jitter_matrix =
      jitter * Eigen::MatrixXd::Identity(d, d);
  Eigen::MatrixXd output(n, d);
  for (Eigen::Index i = 0; i < n; ++i) {
    Eigen::LLT<Eigen::MatrixXd> llt;
    const ConditionalStatus factor_status =
        cholesky(blocks[cast::to_size(i)] + jitter_matrix, &llt, "cov");
    if (!factor_status.ok()) {
      return factor_status;
    }
    output.row(i) =
        mean.row(i) + (llt.matrixL() * eps.row(i).transpose()).transpose();
  }
  *sample = output;
  return ConditionalStatus::success();
}

} // namespace kestrel

#endif /* KESTREL_SAMPLERS_MVN_HPP_ */
