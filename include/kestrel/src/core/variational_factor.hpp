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

#ifndef KESTREL_CORE_VARIATIONAL_FACTOR_HPP_
#define KESTREL_CORE_VARIATIONAL_FACTOR_HPP_

namespace kestrel {

/*
 * The square root, q_sqrt, of the covariance of a variational
 * distribution over K groups of M inducing values,
 *
 *     q(u_k) = N(f_k, S_k)    S_k = q_sqrt_k q_sqrt_k^T
 *
 * where k indexes replicas (base_conditional and the fully correlated
 * conditional) or latent processes (the interdomain conditional).
 */

// S_k = diag(diagonal.col(k))^2, diagonal is M x K
struct DiagonalFactor {
  DiagonalFactor(){};

  DiagonalFactor(const Eigen::MatrixXd &diagonal_) : diagonal(diagonal_){};

  bool operator==(const DiagonalFactor &other) const {
    return diagonal == other.diagonal;
  }

  Eigen::MatrixXd diagonal;
};

// S_k = L_k L_k^T where L_k is the lower triangle of factors[k].
// Anything above the diagonal is ignored.
struct TriangularFactor {
  TriangularFactor(){};

  TriangularFactor(const std::vector<Eigen::MatrixXd> &factors_)
      : factors(factors_){};

  bool operator==(const TriangularFactor &other) const {
    return factors == other.factors;
  }

  std::vector<Eigen::MatrixXd> factors;
};

inline Eigen::Index num_groups(const VariationalFactor &q_sqrt) {
  return q_sqrt.match(
      [](const DiagonalFactor &q) { return q.diagonal.cols(); },
      [](const TriangularFactor &q) { return cast::to_index(q.factors.size()); });
}

inline Eigen::Index group_size(const VariationalFactor &q_sqrt) {
  return q_sqrt.match(
      [](const DiagonalFactor &q) { return q.diagonal.rows(); },
      [](const TriangularFactor &q) -> Eigen::Index {
        return q.factors.empty() ? 0 : q.factors[0].rows();
      });
}

/*
 * Checks that q_sqrt holds `groups` factors each covering `size`
 * inducing values.
 */
inline ConditionalStatus check_variational_factor(const VariationalFactor &q_sqrt,
                                                  Eigen::Index size,
                                                  Eigen::Index groups) {
  if (num_groups(q_sqrt) != groups) {
    return details::shape_mismatch("q_sqrt groups", groups,
                                   num_groups(q_sqrt));
  }
  if (q_sqrt.is<TriangularFactor>()) {
    for (const auto &factor : q_sqrt.get<TriangularFactor>().factors) {
      if (factor.rows() != size || factor.cols() != size) {
        return details::shape_mismatch("q_sqrt factor size", size,
                                       factor.rows());
      }
    }
  } else if (group_size(q_sqrt) != size) {
    return details::shape_mismatch("q_sqrt rows", size, group_size(q_sqrt));
  }
  return ConditionalStatus::success();
}

/*
 * Computes L_k^T A for the k-th factor, that is the matrix whose
 * product with itself, (L_k^T A)^T (L_k^T A) = A^T S_k A, is the
 * contribution of q_sqrt to the conditional covariance.
 */
inline Eigen::MatrixXd factor_transpose_product(const VariationalFactor &q_sqrt,
                                                std::size_t k,
                                                const Eigen::MatrixXd &A) {
  return q_sqrt.match(
      [&](const DiagonalFactor &q) -> Eigen::MatrixXd {
        KESTREL_ASSERT(q.diagonal.rows() == A.rows());
        return q.diagonal.col(cast::to_index(k)).asDiagonal() * A;
      },
      [&](const TriangularFactor &q) -> Eigen::MatrixXd {
        KESTREL_ASSERT(k < q.factors.size());
        KESTREL_ASSERT(q.factors[k].cols() == A.rows());
        return q.factors[k].triangularView<Eigen::Lower>().transpose() * A;
      });
}

/*
 * Builds a VariationalFactor from a dense row-major buffer, which is how
 * variational parameters typically arrive from elsewhere:
 *
 *   shape = {M, K}       a DiagonalFactor
 *   shape = {K, M, M}    a TriangularFactor
 *
 * any other rank is rejected.
 */
inline ConditionalStatus
make_variational_factor(const std::vector<Eigen::Index> &shape,
                        const Eigen::VectorXd &values,
                        VariationalFactor *q_sqrt) {
  if (shape.size() != 2 && shape.size() != 3) {
    std::ostringstream oss;
    oss << "Bad dimension for q_sqrt: " << shape.size();
    return ConditionalStatus(CONDITIONAL_RETURN_CODE_BAD_Q_SQRT_RANK,
                             oss.str());
  }

  Eigen::Index expected_size = 1;
  for (const auto &dim : shape) {
    if (dim < 0) {
      std::ostringstream oss;
      oss << "q_sqrt dimensions must be non-negative but got " << dim;
      return ConditionalStatus(CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH,
                               oss.str());
    }
    if (dim > 0 &&
        expected_size > std::numeric_limits<Eigen::Index>::max() / dim) {
      return ConditionalStatus(CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH,
                               "q_sqrt shape is too large");
    }
    expected_size *= dim;
  }

  if (values.size() != expected_size) {
    return details::shape_mismatch("q_sqrt values", expected_size,
                                   values.size());
  }

  using RowMajorMatrix =
      Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

  if (shape.size() == 2) {
    const Eigen::MatrixXd diagonal =
        Eigen::Map<const RowMajorMatrix>(values.data(), shape[0], shape[1]);
    *q_sqrt = DiagonalFactor(diagonal);
    return ConditionalStatus::success();
  }

  if (shape[1] != shape[2]) {
    return details::shape_mismatch("q_sqrt factor columns", shape[1],
                                   shape[2]);
  }

  const Eigen::Index m = shape[1];
  std::vector<Eigen::MatrixXd> factors;
  for (Eigen::Index k = 0; k < shape[0]; ++k) {
    factors.emplace_back(
        Eigen::Map<const RowMajorMatrix>(values.data() + k * m * m, m, m));
  }
  *q_sqrt = TriangularFactor(factors);
  return ConditionalStatus::success();
}

} // namespace kestrel

#endif /* KESTREL_CORE_VARIATIONAL_FACTOR_HPP_ */
