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

#ifndef KESTREL_CONDITIONALS_INDEPENDENT_INTERDOMAIN_HPP_
#define KESTREL_CONDITIONALS_INDEPENDENT_INTERDOMAIN_HPP_

namespace kestrel {

/*
 * Conditional for L independent latent processes, each with its own M
 * inducing values (which may live in a different domain than the
 * outputs), mixed into P outputs at N query points.
 *
 *   Kmn : L entries of M x NP, entry l holds cov(u_l, f(x_n)_p) in
 *         column n * P + p.
 *   Kmm : L entries of M x M.
 *   Knn : the prior covariance of the outputs with the structure
 *         requested by full_cov / full_output_cov, N and P are taken
 *         from it.
 *   f : M x L, the mean of the inducing values of each latent process.
 *   q_sqrt : optional, a DiagonalFactor (M x L) or a TriangularFactor
 *            (L of M x M).
 *
 * The mean is N x P, the covariance has the structure of Knn.
 */
inline ConditionalOutput independent_interdomain_conditional(
    const std::vector<Eigen::MatrixXd> &Kmn,
    const std::vector<Eigen::MatrixXd> &Kmm, const ConditionalCovariance &Knn,
    const Eigen::MatrixXd &f,
    const ConditionalOptions &options = ConditionalOptions(),
    const VariationalFactor *q_sqrt = nullptr) {

  const Eigen::Index num_latent = cast::to_index(Kmm.size());
  const Eigen::Index m = f.rows();
  const Eigen::Index n = num_points(Knn);
  const Eigen::Index p = num_outputs(Knn);

  details::trace(options, "independent_interdomain_conditional",
                 {{"M", m}, {"L", num_latent}, {"N", n}, {"P", p}});

  if (p == 0) {
    return ConditionalOutput(details::shape_mismatch("Knn outputs", 1, 0));
  }

  const ConditionalStatus knn_status = check_covariance(
      Knn, n, p, options.full_cov, options.full_output_cov, "Knn");
  if (!knn_status.ok()) {
    return ConditionalOutput(knn_status);
  }

  if (cast::to_index(Kmn.size()) != num_latent) {
    return ConditionalOutput(details::shape_mismatch(
        "Kmn latent processes", num_latent, cast::to_index(Kmn.size())));
  }
  if (f.cols() != num_latent) {
    return ConditionalOutput(
        details::shape_mismatch("f columns", num_latent, f.cols()));
  }
  for (std::size_t l = 0; l < Kmm.size(); ++l) {
    if (Kmm[l].rows() != m) {
      return ConditionalOutput(
          details::shape_mismatch("Kmm rows", m, Kmm[l].rows()));
    }
    if (Kmn[l].rows() != m) {
      return ConditionalOutput(
          details::shape_mismatch("Kmn rows", m, Kmn[l].rows()));
    }
    if (Kmn[l].cols() != n * p) {
      return ConditionalOutput(
          details::shape_mismatch("Kmn columns", n * p, Kmn[l].cols()));
    }
  }
  if (q_sqrt != nullptr) {
    const ConditionalStatus q_status =
        check_variational_factor(*q_sqrt, m, num_latent);
    if (!q_status.ok()) {
      return ConditionalOutput(q_status);
    }
  }

  std::vector<Eigen::LLT<Eigen::MatrixXd>> Lm(Kmm.size());
  std::vector<Eigen::MatrixXd> A;
  for (std::size_t l = 0; l < Kmm.size(); ++l) {
    const ConditionalStatus factor_status = cholesky(Kmm[l], &Lm[l]);
    if (!factor_status.ok()) {
      return ConditionalOutput(factor_status);
    }
    A.emplace_back(sqrt_solve(Lm[l], Kmn[l]));
  }

  ConditionalCovariance fvar(Knn);
  const bool conditioned =
      accumulate(projection_covariance(A, n, p, options.full_cov,
                                       options.full_output_cov),
                 -1., &fvar);
  if (!conditioned) {
    return ConditionalOutput(ConditionalStatus(
        CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH, "Knn blocks are ragged"));
  }

  if (!options.white) {
    for (std::size_t l = 0; l < A.size(); ++l) {
      A[l] = sqrt_solve_transpose(Lm[l], A[l]);
    }
  }

  Eigen::VectorXd flat_mean = Eigen::VectorXd::Zero(n * p);
  for (std::size_t l = 0; l < A.size(); ++l) {
    flat_mean.noalias() += A[l].transpose() * f.col(cast::to_index(l));
  }

  if (q_sqrt != nullptr) {
    std::vector<Eigen::MatrixXd> LTA;
    for (std::size_t l = 0; l < A.size(); ++l) {
      LTA.emplace_back(factor_transpose_product(*q_sqrt, l, A[l]));
    }
    const bool added =
        accumulate(projection_covariance(LTA, n, p, options.full_cov,
                                         options.full_output_cov),
                   1., &fvar);
    KESTREL_ASSERT(added);
  }

  return ConditionalOutput(unflatten(flat_mean, n, p), fvar);
}

} // namespace kestrel

#endif /* KESTREL_CONDITIONALS_INDEPENDENT_INTERDOMAIN_HPP_ */
