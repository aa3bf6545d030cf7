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

#ifndef KESTREL_CORE_COVARIANCE_HPP_
#define KESTREL_CORE_COVARIANCE_HPP_

namespace kestrel {

/*
 * A conditional over N query points and P outputs can describe its
 * (co)variance in four ways depending on whether correlations across
 * inputs (full_cov) and/or across outputs (full_output_cov) are kept:
 *
 *   full_cov  full_output_cov   structure              layout
 *   --------  ---------------   --------------------   ------------------
 *   false     false             IndependentVariance    N x P
 *   true      false             InputCovariance        P blocks of N x N
 *   false     true              OutputCovariance       N blocks of P x P
 *   true      true              JointCovariance        NP x NP
 *
 * Wherever the (n, p) pair is flattened into a single axis it is stored
 * at n * P + p, so each query point's outputs are contiguous.
 */
inline Eigen::Index flat_index(Eigen::Index n, Eigen::Index p,
                               Eigen::Index num_outputs) {
  return n * num_outputs + p;
}

/*
 * Reshapes a flattened NP vector into an N x P matrix.
 */
template <typename Derived>
inline Eigen::MatrixXd unflatten(const Eigen::DenseBase<Derived> &flat,
                                 Eigen::Index num_points,
                                 Eigen::Index num_outputs) {
  KESTREL_ASSERT(flat.size() == num_points * num_outputs);
  Eigen::MatrixXd output(num_points, num_outputs);
  for (Eigen::Index n = 0; n < num_points; ++n) {
    for (Eigen::Index p = 0; p < num_outputs; ++p) {
      output(n, p) = flat(flat_index(n, p, num_outputs));
    }
  }
  return output;
}

struct IndependentVariance {
  IndependentVariance(){};

  IndependentVariance(const Eigen::MatrixXd &variance_) : variance(variance_){};

  Eigen::Index num_points() const { return variance.rows(); }

  Eigen::Index num_outputs() const { return variance.cols(); }

  bool operator==(const IndependentVariance &other) const {
    return variance == other.variance;
  }

  // N x P
  Eigen::MatrixXd variance;
};

struct InputCovariance {
  InputCovariance(){};

  InputCovariance(const std::vector<Eigen::MatrixXd> &blocks_)
      : blocks(blocks_){};

  Eigen::Index num_points() const {
    return blocks.empty() ? 0 : blocks[0].rows();
  }

  Eigen::Index num_outputs() const { return cast::to_index(blocks.size()); }

  bool operator==(const InputCovariance &other) const {
    return blocks == other.blocks;
  }

  // P blocks of N x N
  std::vector<Eigen::MatrixXd> blocks;
};

struct OutputCovariance {
  OutputCovariance(){};

  OutputCovariance(const std::vector<Eigen::MatrixXd> &blocks_)
      : blocks(blocks_){};

  Eigen::Index num_points() const { return cast::to_index(blocks.size()); }

  Eigen::Index num_outputs() const {
    return blocks.empty() ? 0 : blocks[0].rows();
  }

  bool operator==(const OutputCovariance &other) const {
    return blocks == other.blocks;
  }

  // N blocks of P x P
  std::vector<Eigen::MatrixXd> blocks;
};

struct JointCovariance {
  JointCovariance() : covariance(), outputs(0){};

  JointCovariance(const Eigen::MatrixXd &covariance_, Eigen::Index outputs_)
      : covariance(covariance_), outputs(outputs_) {
    KESTREL_ASSERT(covariance.rows() == covariance.cols());
  };

  Eigen::Index num_points() const {
    return outputs > 0 ? covariance.rows() / outputs : 0;
  }

  Eigen::Index num_outputs() const { return outputs; }

  // The covariance between (n, p) and (m, q).
  double operator()(Eigen::Index n, Eigen::Index p, Eigen::Index m,
                    Eigen::Index q) const {
    return covariance(flat_index(n, p, outputs), flat_index(m, q, outputs));
  }

  bool operator==(const JointCovariance &other) const {
    return outputs == other.outputs && covariance == other.covariance;
  }

  // NP x NP
  Eigen::MatrixXd covariance;
  Eigen::Index outputs;
};

template <typename CovarianceType> struct covariance_flags {};

template <> struct covariance_flags<IndependentVariance> {
  static constexpr bool full_cov = false;
  static constexpr bool full_output_cov = false;
};

template <> struct covariance_flags<InputCovariance> {
  static constexpr bool full_cov = true;
  static constexpr bool full_output_cov = false;
};

template <> struct covariance_flags<OutputCovariance> {
  static constexpr bool full_cov = false;
  static constexpr bool full_output_cov = true;
};

template <> struct covariance_flags<JointCovariance> {
  static constexpr bool full_cov = true;
  static constexpr bool full_output_cov = true;
};

inline bool has_structure(const ConditionalCovariance &cov, bool full_cov,
                          bool full_output_cov) {
  return cov.match([&](const auto &c) {
    using CovType = typename std::decay<decltype(c)>::type;
    return covariance_flags<CovType>::full_cov == full_cov &&
           covariance_flags<CovType>::full_output_cov == full_output_cov;
  });
}

inline Eigen::Index num_points(const ConditionalCovariance &cov) {
  return cov.match([](const auto &c) { return c.num_points(); });
}

inline Eigen::Index num_outputs(const ConditionalCovariance &cov) {
  return cov.match([](const auto &c) { return c.num_outputs(); });
}

inline std::string structure_name(const ConditionalCovariance &cov) {
  return cov.match(
      [](const IndependentVariance &) -> std::string {
        return "independent_variance";
      },
      [](const InputCovariance &) -> std::string {
        return "input_covariance";
      },
      [](const OutputCovariance &) -> std::string {
        return "output_covariance";
      },
      [](const JointCovariance &) -> std::string {
        return "joint_covariance";
      });
}

/*
 * Makes sure `cov` (for example a prior Knn) has the requested
 * structure and covers N points and P outputs.
 */
inline ConditionalStatus check_covariance(const ConditionalCovariance &cov,
                                          Eigen::Index expected_points,
                                          Eigen::Index expected_outputs,
                                          bool full_cov, bool full_output_cov,
                                          const std::string &name) {
  if (!has_structure(cov, full_cov, full_output_cov)) {
    std::ostringstream oss;
    oss << name << " is a " << structure_name(cov)
        << " but full_cov=" << full_cov
        << " and full_output_cov=" << full_output_cov << " were requested";
    return ConditionalStatus(
        CONDITIONAL_RETURN_CODE_INVALID_COVARIANCE_STRUCTURE, oss.str());
  }
  if (num_points(cov) != expected_points) {
    return details::shape_mismatch(name + " points", expected_points,
                                   num_points(cov));
  }
  if (num_outputs(cov) != expected_outputs) {
    return details::shape_mismatch(name + " outputs", expected_outputs,
                                   num_outputs(cov));
  }
  return ConditionalStatus::success();
}

namespace details {

inline bool same_sizes(const std::vector<Eigen::MatrixXd> &xs,
                       const std::vector<Eigen::MatrixXd> &ys) {
  if (xs.size() != ys.size()) {
    return false;
  }
  for (std::size_t i = 0; i < xs.size(); ++i) {
    if (xs[i].rows() != ys[i].rows() || xs[i].cols() != ys[i].cols()) {
      return false;
    }
  }
  return true;
}

inline bool add_blocks(const std::vector<Eigen::MatrixXd> &term, double scale,
                       std::vector<Eigen::MatrixXd> *total) {
  if (!same_sizes(term, *total)) {
    return false;
  }
  for (std::size_t i = 0; i < term.size(); ++i) {
    (*total)[i] += scale * term[i];
  }
  return true;
}

} // namespace details

/*
 * Adds `scale * term` to `total` in place.  Both must share the same
 * structure and sizes, returns false (leaving `total` untouched) if
 * they don't.
 */
inline bool accumulate(const ConditionalCovariance &term, double scale,
                       ConditionalCovariance *total) {
  if (term.which() != total->which()) {
    return false;
  }

  if (total->is<IndependentVariance>()) {
    const Eigen::MatrixXd &x = term.get<IndependentVariance>().variance;
    Eigen::MatrixXd &t = total->get<IndependentVariance>().variance;
    if (x.rows() != t.rows() || x.cols() != t.cols()) {
      return false;
    }
    t += scale * x;
    return true;
  }

  if (total->is<InputCovariance>()) {
    return details::add_blocks(term.get<InputCovariance>().blocks, scale,
                               &total->get<InputCovariance>().blocks);
  }

  if (total->is<OutputCovariance>()) {
    return details::add_blocks(term.get<OutputCovariance>().blocks, scale,
                               &total->get<OutputCovariance>().blocks);
  }

  const JointCovariance &x = term.get<JointCovariance>();
  JointCovariance &t = total->get<JointCovariance>();
  if (x.outputs != t.outputs || x.covariance.rows() != t.covariance.rows()) {
    return false;
  }
  t.covariance += scale * x.covariance;
  return true;
}

} // namespace kestrel

#endif /* KESTREL_CORE_COVARIANCE_HPP_ */
