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

#ifndef KESTREL_CONDITIONALS_FULLY_CORRELATED_HPP_
#define KESTREL_CONDITIONALS_FULLY_CORRELATED_HPP_

namespace kestrel {

/*
 * Conditional for multi output processes in which all L * M inducing
 * values are correlated with each other, in both the prior and the
 * variational distribution, so they form one joint Gaussian of size LM.
 *
 *   Kmn : LM x NP, cov(u_i, f(x_n)_p) in column n * P + p.
 *   Kmm : LM x LM.
 *   Knn : prior covariance of the outputs with the structure requested
 *         by full_cov / full_output_cov, N and P are taken from it.
 *   f : LM x R, one column per replica.
 *   q_sqrt : optional, a TriangularFactor holding R factors of LM x LM.
 *
 * Returns an N x P mean and a covariance shaped like Knn for each of the
 * R replicas.
 *
 * Only the whitened representation and triangular q_sqrt are provided,
 * the unwhitened and diagonal cases fail with their own UNSUPPORTED_*
 * return codes.
 */
inline BatchConditionalOutput fully_correlated_conditional_repeat(
    const Eigen::MatrixXd &Kmn, const Eigen::MatrixXd &Kmm,
    const ConditionalCovariance &Knn, const Eigen::MatrixXd &f,
    const ConditionalOptions &options = ConditionalOptions(),
    const VariationalFactor *q_sqrt = nullptr) {

  const Eigen::Index m = Kmm.rows();
  const Eigen::Index n = num_points(Knn);
  const Eigen::Index p = num_outputs(Knn);
  const Eigen::Index num_func = f.cols();

  details::trace(options, "fully_correlated_conditional",
                 {{"LM", m}, {"N", n}, {"P", p}, {"R", num_func}});

  if (!options.white) {
    return BatchConditionalOutput(ConditionalStatus(
        CONDITIONAL_RETURN_CODE_UNSUPPORTED_UNWHITENED,
        "the unwhitened fully correlated conditional is not supported"));
  }

  if (q_sqrt != nullptr && q_sqrt->is<DiagonalFactor>()) {
    return BatchConditionalOutput(ConditionalStatus(
        CONDITIONAL_RETURN_CODE_UNSUPPORTED_DIAGONAL_Q_SQRT,
        "the fully correlated conditional does not support a diagonal "
        "q_sqrt"));
  }

  if (p == 0) {
    return BatchConditionalOutput(
        details::shape_mismatch("Knn outputs", 1, 0));
  }

  const ConditionalStatus knn_status = check_covariance(
      Knn, n, p, options.full_cov, options.full_output_cov, "Knn");
  if (!knn_status.ok()) {
    return BatchConditionalOutput(knn_status);
  }

  if (Kmn.rows() != m) {
    return BatchConditionalOutput(
        details::shape_mismatch("Kmn rows", m, Kmn.rows()));
  }
  if (Kmn.cols() != n * p) {
    return BatchConditionalOutput(
        details::shape_mismatch("Kmn columns", n * p, Kmn.cols()));
  }
  if (f.rows() != m) {
    return BatchConditionalOutput(
        details::shape_mismatch("f rows", m, f.rows()));
  }
  if (q_sqrt != nullptr) {
    const ConditionalStatus q_status =
        check_variational_factor(*q_sqrt, m, num_func);
    if (!q_status.ok()) {
      return BatchConditionalOutput(q_status);
    }
  }

  Eigen::LLT<Eigen::MatrixXd> Lm;
  const ConditionalStatus factor_status = cholesky(Kmm, &Lm);
  if (!factor_status.ok()) {
    return BatchConditionalOutput(factor_status);
  }

  const std::vector<Eigen::MatrixXd> A = {sqrt_solve(Lm, Kmn)};

  ConditionalCovariance fvar(Knn);
  const bool conditioned =
      accumulate(projection_covariance(A, n, p, options.full_cov,
                                       options.full_output_cov),
                 -1., &fvar);
  if (!conditioned) {
    return BatchConditionalOutput(ConditionalStatus(
        CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH, "Knn blocks are ragged"));
  }

  BatchConditionalOutput output(ConditionalStatus::success());
  for (Eigen::Index r = 0; r < num_func; ++r) {
    const Eigen::VectorXd flat_mean = A[0].transpose() * f.col(r);
    output.means.emplace_back(unflatten(flat_mean, n, p));

    ConditionalCovariance replica_fvar(fvar);
    if (q_sqrt != nullptr) {
      const std::vector<Eigen::MatrixXd> LTA = {
          factor_transpose_product(*q_sqrt, cast::to_size(r), A[0])};
      const bool added =
          accumulate(projection_covariance(LTA, n, p, options.full_cov,
                                           options.full_output_cov),
                     1., &replica_fvar);
      KESTREL_ASSERT(added);
    }
    output.covariances.emplace_back(replica_fvar);
  }
  return output;
}

/*
 * The single replica version of fully_correlated_conditional_repeat,
 * f is LM x 1 and q_sqrt (if provided) holds one factor.
 */
inline ConditionalOutput fully_correlated_conditional(
    const Eigen::MatrixXd &Kmn, const Eigen::MatrixXd &Kmm,
    const ConditionalCovariance &Knn, const Eigen::MatrixXd &f,
    const ConditionalOptions &options = ConditionalOptions(),
    const VariationalFactor *q_sqrt = nullptr) {
  const auto repeated =
      fully_correlated_conditional_repeat(Kmn, Kmm, Knn, f, options, q_sqrt);
  if (repeated.ok() && repeated.size() == 0) {
    return ConditionalOutput(details::shape_mismatch("f columns", 1, 0));
  }
  return repeated[0];
}

} // namespace kestrel

#endif /* KESTREL_CONDITIONALS_FULLY_CORRELATED_HPP_ */
