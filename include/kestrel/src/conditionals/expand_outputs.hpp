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

#ifndef KESTREL_CONDITIONALS_EXPAND_OUTPUTS_HPP_
#define KESTREL_CONDITIONALS_EXPAND_OUTPUTS_HPP_

namespace kestrel {

/*
 * Takes the covariance of outputs which are known to be independent,
 * either an IndependentVariance (N x P, full_cov = false) or an
 * InputCovariance (P x N x N, full_cov = true), and lays it out with the
 * structure requested by full_output_cov:
 *
 *   full_cov  full_output_cov   output
 *   true      true              JointCovariance, zero across outputs
 *   false     true              OutputCovariance, diagonal blocks
 *   true      false             unchanged
 *   false     false             unchanged
 *
 * This cannot create correlations between outputs, it only changes
 * the layout.
 */
inline ConditionalStatus
expand_independent_outputs(const ConditionalCovariance &fvar, bool full_cov,
                           bool full_output_cov,
                           ConditionalCovariance *expanded) {
  if (!has_structure(fvar, full_cov, false)) {
    std::ostringstream oss;
    oss << "expected independent outputs with full_cov=" << full_cov
        << " but got a " << structure_name(fvar);
    return ConditionalStatus(
        CONDITIONAL_RETURN_CODE_INVALID_COVARIANCE_STRUCTURE, oss.str());
  }

  if (!full_output_cov) {
    *expanded = fvar;
    return ConditionalStatus::success();
  }

  const Eigen::Index n = num_points(fvar);
  const Eigen::Index p = num_outputs(fvar);

  if (full_cov) {
    const auto &blocks = fvar.get<InputCovariance>().blocks;
    Eigen::MatrixXd joint = Eigen::MatrixXd::Zero(n * p, n * p);
    for (Eigen::Index k = 0; k < p; ++k) {
      const Eigen::MatrixXd &block = blocks[cast::to_size(k)];
      if (block.rows() != n || block.cols() != n) {
        return details::shape_mismatch("fvar block size", n, block.rows());
      }
      for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
          joint(flat_index(i, k, p), flat_index(j, k, p)) = block(i, j);
        }
      }
    }
    *expanded = JointCovariance(joint, p);
    return ConditionalStatus::success();
  }

  const Eigen::MatrixXd &variance = fvar.get<IndependentVariance>().variance;
  std::vector<Eigen::MatrixXd> blocks;
  for (Eigen::Index i = 0; i < n; ++i) {
    blocks.emplace_back(variance.row(i).asDiagonal());
  }
  *expanded = OutputCovariance(blocks);
  return ConditionalStatus::success();
}

} // namespace kestrel

#endif /* KESTREL_CONDITIONALS_EXPAND_OUTPUTS_HPP_ */
