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

#ifndef KESTREL_CORE_STATUS_HPP_
#define KESTREL_CORE_STATUS_HPP_

namespace kestrel {

typedef enum conditional_return_code_e {
  CONDITIONAL_RETURN_CODE_INVALID = -1,
  CONDITIONAL_RETURN_CODE_SUCCESS,
  CONDITIONAL_RETURN_CODE_BAD_Q_SQRT_RANK,
  CONDITIONAL_RETURN_CODE_UNSUPPORTED_UNWHITENED,
  CONDITIONAL_RETURN_CODE_UNSUPPORTED_DIAGONAL_Q_SQRT,
  CONDITIONAL_RETURN_CODE_INVALID_COVARIANCE_STRUCTURE,
  CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH,
  CONDITIONAL_RETURN_CODE_FACTORIZATION_FAILED
} conditional_return_code_t;

inline std::string to_string(const conditional_return_code_t &return_code) {
  switch (return_code) {
  case CONDITIONAL_RETURN_CODE_INVALID:
    return "invalid";
  case CONDITIONAL_RETURN_CODE_SUCCESS:
    return "success";
  case CONDITIONAL_RETURN_CODE_BAD_Q_SQRT_RANK:
    return "bad_q_sqrt_rank";
  case CONDITIONAL_RETURN_CODE_UNSUPPORTED_UNWHITENED:
    return "unsupported_unwhitened";
  case CONDITIONAL_RETURN_CODE_UNSUPPORTED_DIAGONAL_Q_SQRT:
    return "unsupported_diagonal_q_sqrt";
  case CONDITIONAL_RETURN_CODE_INVALID_COVARIANCE_STRUCTURE:
    return "invalid_covariance_structure";
  case CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH:
    return "shape_mismatch";
  case CONDITIONAL_RETURN_CODE_FACTORIZATION_FAILED:
    return "factorization_failed";
  default:
    KESTREL_ASSERT(false);
    return "unknown return code";
  }
}

/*
 * The UNSUPPORTED_* codes mark computations which are deliberately not
 * provided (rather than inputs which are wrong), callers should not
 * expect them to start succeeding.
 */
inline bool is_unsupported(const conditional_return_code_t &return_code) {
  return return_code == CONDITIONAL_RETURN_CODE_UNSUPPORTED_UNWHITENED ||
         return_code == CONDITIONAL_RETURN_CODE_UNSUPPORTED_DIAGONAL_Q_SQRT;
}

struct ConditionalStatus {

  ConditionalStatus() : return_code(CONDITIONAL_RETURN_CODE_INVALID), message(){};

  ConditionalStatus(conditional_return_code_t return_code_,
                    const std::string &message_)
      : return_code(return_code_), message(message_){};

  static ConditionalStatus success() {
    return ConditionalStatus(CONDITIONAL_RETURN_CODE_SUCCESS, "");
  }

  bool ok() const { return return_code == CONDITIONAL_RETURN_CODE_SUCCESS; }

  bool operator==(const ConditionalStatus &other) const {
    return return_code == other.return_code && message == other.message;
  }

  conditional_return_code_t return_code;
  std::string message;
};

inline std::ostream &operator<<(std::ostream &os,
                                const ConditionalStatus &status) {
  os << to_string(status.return_code);
  if (!status.message.empty()) {
    os << ": " << status.message;
  }
  return os;
}

namespace details {

inline ConditionalStatus shape_mismatch(const std::string &what,
                                        Eigen::Index expected,
                                        Eigen::Index actual) {
  std::ostringstream oss;
  oss << what << " expected " << expected << " but got " << actual;
  return ConditionalStatus(CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH, oss.str());
}

} // namespace details

} // namespace kestrel

#endif /* KESTREL_CORE_STATUS_HPP_ */
