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

#ifndef KESTREL_CORE_CONDITIONAL_OUTPUT_HPP_
#define KESTREL_CORE_CONDITIONAL_OUTPUT_HPP_

namespace kestrel {

/*
 * Per call settings shared by all the conditionals.
 *
 *   full_cov : keep the covariance between query points.
 *   full_output_cov : keep the covariance between outputs, ignored by
 *       base_conditional whose replicas are always independent.
 *   white : the inducing values (and q_sqrt) are given in whitened
 *       coordinates, ie u = Lm v with v ~ N(f, q_sqrt q_sqrt^T).
 *   diagnostics : if set, a short trace of each call is written here.
 */
struct ConditionalOptions {
  ConditionalOptions()
      : full_cov(false), full_output_cov(false), white(false),
        diagnostics(nullptr){};

  ConditionalOptions(bool full_cov_, bool full_output_cov_, bool white_)
      : full_cov(full_cov_), full_output_cov(full_output_cov_), white(white_),
        diagnostics(nullptr){};

  bool full_cov;
  bool full_output_cov;
  bool white;
  std::ostream *diagnostics;
};

struct ConditionalOutput {

  ConditionalOutput() : status(), mean(), covariance(){};

  ConditionalOutput(const ConditionalStatus &status_)
      : status(status_), mean(), covariance(){};

  ConditionalOutput(const Eigen::MatrixXd &mean_,
                    const ConditionalCovariance &covariance_)
      : status(ConditionalStatus::success()), mean(mean_),
        covariance(covariance_){};

  bool ok() const { return status.ok(); }

  ConditionalStatus status;
  // N x P (or N x R for base_conditional)
  Eigen::MatrixXd mean;
  ConditionalCovariance covariance;
};

/*
 * One mean and covariance per entry of a leading axis, which is either
 * a batch axis (base_conditional) or the replica axis
 * (fully_correlated_conditional_repeat).
 */
struct BatchConditionalOutput {

  BatchConditionalOutput() : status(), means(), covariances(){};

  BatchConditionalOutput(const ConditionalStatus &status_)
      : status(status_), means(), covariances(){};

  bool ok() const { return status.ok(); }

  std::size_t size() const {
    KESTREL_ASSERT(means.size() == covariances.size());
    return means.size();
  }

  ConditionalOutput operator[](std::size_t i) const {
    if (!ok()) {
      return ConditionalOutput(status);
    }
    KESTREL_ASSERT(i < size());
    return ConditionalOutput(means[i], covariances[i]);
  }

  ConditionalStatus status;
  std::vector<Eigen::MatrixXd> means;
  std::vector<ConditionalCovariance> covariances;
};

namespace details {

inline void
trace(const ConditionalOptions &options, const std::string &name,
      const std::vector<std::pair<std::string, Eigen::Index>> &sizes) {
  if (options.diagnostics == nullptr) {
    return;
  }
  std::ostream &os = *options.diagnostics;
  os << name;
  for (const auto &pair : sizes) {
    os << " " << pair.first << "=" << pair.second;
  }
  os << " full_cov=" << options.full_cov
     << " full_output_cov=" << options.full_output_cov
     << " white=" << options.white << std::endl;
}

} // namespace details

} // namespace kestrel

#endif /* KESTREL_CORE_CONDITIONAL_OUTPUT_HPP_ */
