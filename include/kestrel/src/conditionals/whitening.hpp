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

#ifndef KESTREL_CONDITIONALS_WHITENING_HPP_
#define KESTREL_CONDITIONALS_WHITENING_HPP_

namespace kestrel {

/*
 * With Kmm = Lm Lm^T an unwhitened distribution over inducing values,
 *
 *     u ~ N(f, q_sqrt q_sqrt^T)
 *
 * is the same as u = Lm v with
 *
 *     v ~ N(Lm^-1 f, (Lm^-1 q_sqrt) (Lm^-1 q_sqrt)^T)
 *
 * The whitened factor Lm^-1 q_sqrt is lower triangular whether q_sqrt
 * was diagonal or triangular, so the result is always a TriangularFactor.
 *
 * Kmm holds either a single matrix shared by every column of `function`
 * or one matrix per column (the latent processes of the interdomain
 * conditional).
 */
inline ConditionalStatus
whiten_variational_parameters(const std::vector<Eigen::MatrixXd> &Kmm,
                              const Eigen::MatrixXd &function,
                              Eigen::MatrixXd *white_function,
                              const VariationalFactor *q_sqrt = nullptr,
                              VariationalFactor *white_q_sqrt = nullptr) {
  if (white_function == nullptr) {
    return ConditionalStatus(CONDITIONAL_RETURN_CODE_INVALID,
                             "no destination for the whitened function");
  }
  const Eigen::Index groups = function.cols();
  if (Kmm.size() != 1 && cast::to_index(Kmm.size()) != groups) {
    return details::shape_mismatch("Kmm count", groups,
                                   cast::to_index(Kmm.size()));
  }
  if (q_sqrt != nullptr) {
    if (white_q_sqrt == nullptr) {
      return ConditionalStatus(CONDITIONAL_RETURN_CODE_INVALID,
                               "no destination for the whitened q_sqrt");
    }
    const ConditionalStatus q_status =
        check_variational_factor(*q_sqrt, function.rows(), groups);
    if (!q_status.ok()) {
      return q_status;
    }
  }

  std::vector<Eigen::LLT<Eigen::MatrixXd>> Lm(Kmm.size());
  for (std::size_t i = 0; i < Kmm.size(); ++i) {
    if (Kmm[i].rows() != function.rows()) {
      return details::shape_mismatch("Kmm rows", function.rows(),
                                     Kmm[i].rows());
    }
    const ConditionalStatus factor_status = cholesky(Kmm[i], &Lm[i]);
    if (!factor_status.ok()) {
      return factor_status;
    }
  }

  const auto factor_for =
      [&](Eigen::Index k) -> const Eigen::LLT<Eigen::MatrixXd> & {
    return Lm.size() == 1 ? Lm[0] : Lm[cast::to_size(k)];
  };

  Eigen::MatrixXd whitened(function.rows(), groups);
  for (Eigen::Index k = 0; k < groups; ++k) {
    whitened.col(k) = sqrt_solve(factor_for(k), function.col(k));
  }

  if (q_sqrt != nullptr) {
    std::vector<Eigen::MatrixXd> factors;
    for (Eigen::Index k = 0; k < groups; ++k) {
      const Eigen::MatrixXd lower = q_sqrt->match(
          [&](const DiagonalFactor &q) -> Eigen::MatrixXd {
            return q.diagonal.col(k).asDiagonal();
          },
          [&](const TriangularFactor &q) -> Eigen::MatrixXd {
            return q.factors[cast::to_size(k)]
                .triangularView<Eigen::Lower>();
          });
      factors.emplace_back(sqrt_solve(factor_for(k), lower));
    }
    *white_q_sqrt = TriangularFactor(factors);
  }

  *white_function = whitened;
  return ConditionalStatus::success();
}

inline ConditionalStatus
whiten_variational_parameters(const Eigen::MatrixXd &Kmm,
                              const Eigen::MatrixXd &function,
                              Eigen::MatrixXd *white_function,
                              const VariationalFactor *q_sqrt = nullptr,
                              VariationalFactor *white_q_sqrt = nullptr) {
  const std::vector<Eigen::MatrixXd> shared = {Kmm};
  return whiten_variational_parameters(shared, function, white_function,
                                       q_sqrt, white_q_sqrt);
}

} // namespace kestrel

#endif /* KESTREL_CONDITIONALS_WHITENING_HPP_ */
