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

#include <gtest/gtest.h>

#include "test_utils.h"

namespace kestrel {

TEST(test_base_conditional, test_identity_prior_single_point_mass) {
  const Eigen::MatrixXd Kmm = Eigen::MatrixXd::Identity(2, 2);
  Eigen::MatrixXd Kmn(2, 3);
  Kmn << 0.1, 0.2, 0.3, 0.4, 0.5, 0.6;
  const Eigen::MatrixXd Knn = Eigen::VectorXd::Ones(3);
  Eigen::MatrixXd f(2, 1);
  f << 1., 0.;

  const ConditionalOptions options(false, false, true);
  const auto output = base_conditional(Kmn, Kmm, Knn, f, options);
  ASSERT_TRUE(output.ok()) << output.status;

  Eigen::MatrixXd expected_mean(3, 1);
  expected_mean << 0.1, 0.2, 0.3;
  EXPECT_LT((output.mean - expected_mean).cwiseAbs().maxCoeff(),
            cTestTolerance);

  ASSERT_TRUE(output.covariance.is<IndependentVariance>());
  Eigen::MatrixXd expected_variance(3, 1);
  expected_variance << 0.83, 0.71, 0.55;
  EXPECT_LT((output.covariance.get<IndependentVariance>().variance -
             expected_variance)
                .cwiseAbs()
                .maxCoeff(),
            cTestTolerance);

  // A zero q_sqrt adds nothing.
  const VariationalFactor zero_q_sqrt =
      DiagonalFactor(Eigen::MatrixXd::Zero(2, 1));
  const auto with_zero =
      base_conditional(Kmn, Kmm, Knn, f, options, &zero_q_sqrt);
  ASSERT_TRUE(with_zero.ok()) << with_zero.status;
  EXPECT_EQ(with_zero.mean, output.mean);
  expect_covariance_near(with_zero.covariance, output.covariance);
}

TEST(test_base_conditional, test_full_cov_diagonal_matches_variance) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(4, 6, 3, gen);
  const Eigen::MatrixXd Knn_diag = problem.Knn.diagonal();

  for (const bool white : {false, true}) {
    const auto full = base_conditional(problem.Kmn, problem.Kmm, problem.Knn,
                                       problem.function,
                                       ConditionalOptions(true, false, white),
                                       &problem.q_sqrt);
    const auto diag = base_conditional(problem.Kmn, problem.Kmm, Knn_diag,
                                       problem.function,
                                       ConditionalOptions(false, false, white),
                                       &problem.q_sqrt);
    ASSERT_TRUE(full.ok()) << full.status;
    ASSERT_TRUE(diag.ok()) << diag.status;

    EXPECT_LT((full.mean - diag.mean).cwiseAbs().maxCoeff(), cTestTolerance);
    ASSERT_EQ(full.mean.rows(), 6);
    ASSERT_EQ(full.mean.cols(), 3);

    const auto &blocks = full.covariance.get<InputCovariance>().blocks;
    const auto &variance = diag.covariance.get<IndependentVariance>().variance;
    ASSERT_EQ(blocks.size(), 3);
    for (std::size_t r = 0; r < blocks.size(); ++r) {
      expect_symmetric_psd(blocks[r]);
      EXPECT_LT((blocks[r].diagonal() -
                 variance.col(cast::to_index(r)))
                    .cwiseAbs()
                    .maxCoeff(),
                cTestTolerance);
    }
  }
}

TEST(test_base_conditional, test_without_q_sqrt_is_prior_conditional) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(3, 5, 2, gen);

  const ConditionalOptions options(true, false, false);
  const auto output = base_conditional(problem.Kmn, problem.Kmm, problem.Knn,
                                       problem.function, options);
  ASSERT_TRUE(output.ok()) << output.status;

  const Eigen::MatrixXd Kmm_inv_Kmn = problem.Kmm.ldlt().solve(problem.Kmn);
  const Eigen::MatrixXd expected_mean =
      Kmm_inv_Kmn.transpose() * problem.function;
  const Eigen::MatrixXd expected_cov =
      problem.Knn - problem.Kmn.transpose() * Kmm_inv_Kmn;

  EXPECT_LT((output.mean - expected_mean).cwiseAbs().maxCoeff(), 1e-8);
  for (const auto &block : output.covariance.get<InputCovariance>().blocks) {
    EXPECT_LT((block - expected_cov).cwiseAbs().maxCoeff(), 1e-8);
  }
}

TEST(test_base_conditional, test_unwhitened_matches_explicit_inverse) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(3, 4, 2, gen);

  const auto output = base_conditional(problem.Kmn, problem.Kmm, problem.Knn,
                                       problem.function,
                                       ConditionalOptions(true, false, false),
                                       &problem.q_sqrt);
  ASSERT_TRUE(output.ok()) << output.status;

  const Eigen::MatrixXd Kmm_inv = problem.Kmm.inverse();
  const auto &factors = problem.q_sqrt.get<TriangularFactor>().factors;
  const auto &blocks = output.covariance.get<InputCovariance>().blocks;
  for (std::size_t r = 0; r < factors.size(); ++r) {
    const Eigen::MatrixXd L = factors[r];
    const Eigen::MatrixXd S = L * L.transpose();
    const Eigen::MatrixXd expected = problem.Knn -
                                     problem.Kmn.transpose() * Kmm_inv *
                                         problem.Kmn +
                                     problem.Kmn.transpose() * Kmm_inv * S *
                                         Kmm_inv * problem.Kmn;
    EXPECT_LT((blocks[r] - expected).cwiseAbs().maxCoeff(), 1e-8);
  }
}

TEST(test_base_conditional, test_whitening_equivalence) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(4, 5, 2, gen);

  Eigen::MatrixXd diagonal(4, 2);
  gaussian_fill(diagonal, gen);
  const VariationalFactor diagonal_q_sqrt = DiagonalFactor(diagonal);

  for (const auto *q_sqrt : {&problem.q_sqrt, &diagonal_q_sqrt}) {
    Eigen::MatrixXd white_function;
    VariationalFactor white_q_sqrt;
    const auto whitened = whiten_variational_parameters(
        problem.Kmm, problem.function, &white_function, q_sqrt, &white_q_sqrt);
    ASSERT_TRUE(whitened.ok()) << whitened;
    EXPECT_TRUE(white_q_sqrt.is<TriangularFactor>());

    for (const bool full_cov : {false, true}) {
      const Eigen::MatrixXd Knn =
          full_cov ? problem.Knn : Eigen::MatrixXd(problem.Knn.diagonal());
      const auto unwhite = base_conditional(
          problem.Kmn, problem.Kmm, Knn, problem.function,
          ConditionalOptions(full_cov, false, false), q_sqrt);
      const auto white = base_conditional(
          problem.Kmn, problem.Kmm, Knn, white_function,
          ConditionalOptions(full_cov, false, true), &white_q_sqrt);
      ASSERT_TRUE(unwhite.ok()) << unwhite.status;
      ASSERT_TRUE(white.ok()) << white.status;

      EXPECT_LT((unwhite.mean - white.mean).cwiseAbs().maxCoeff(), 1e-8);
      expect_covariance_near(unwhite.covariance, white.covariance, 1e-8);
    }
  }
}

TEST(test_base_conditional, test_batch_matches_individual_calls) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(3, 4, 2, gen);

  std::vector<Eigen::MatrixXd> Kmn_batch;
  std::vector<Eigen::MatrixXd> Knn_batch;
  for (int b = 0; b < 3; ++b) {
    Eigen::MatrixXd Kmn(3, 4);
    gaussian_fill(Kmn, 0., 0.1, gen);
    Kmn_batch.push_back(Kmn);
    Knn_batch.push_back(random_covariance_matrix(4, gen) +
                        Kmn.transpose() * Kmn);
  }

  const ConditionalOptions options(true, false, true);
  const auto batch = base_conditional(Kmn_batch, problem.Kmm, Knn_batch,
                                      problem.function, options,
                                      &problem.q_sqrt);
  ASSERT_TRUE(batch.ok()) << batch.status;
  ASSERT_EQ(batch.size(), 3);

  for (std::size_t b = 0; b < Kmn_batch.size(); ++b) {
    const auto single =
        base_conditional(Kmn_batch[b], problem.Kmm, Knn_batch[b],
                         problem.function, options, &problem.q_sqrt);
    ASSERT_TRUE(single.ok()) << single.status;
    EXPECT_LT((batch.means[b] - single.mean).cwiseAbs().maxCoeff(),
              cTestTolerance);
    expect_covariance_near(batch.covariances[b], single.covariance);
  }
}

TEST(test_base_conditional, test_shared_prior_across_batch) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(3, 4, 1, gen);

  const std::vector<Eigen::MatrixXd> Kmn_batch = {problem.Kmn, problem.Kmn};
  const std::vector<Eigen::MatrixXd> Knn_shared = {problem.Knn.diagonal()};

  const auto batch = base_conditional(Kmn_batch, problem.Kmm, Knn_shared,
                                      problem.function);
  ASSERT_TRUE(batch.ok()) << batch.status;
  ASSERT_EQ(batch.size(), 2);
  EXPECT_EQ(batch.means[0], batch.means[1]);
  EXPECT_EQ(batch.covariances[0], batch.covariances[1]);
}

TEST(test_base_conditional, test_shape_mismatch) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(3, 4, 2, gen);

  const ConditionalOptions options(true, false, false);

  const Eigen::MatrixXd short_function = problem.function.topRows(2);
  auto output = base_conditional(problem.Kmn, problem.Kmm, problem.Knn,
                                 short_function, options);
  EXPECT_EQ(output.status.return_code, CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH);

  // Requesting full_cov with a diagonal prior.
  output = base_conditional(problem.Kmn, problem.Kmm,
                            Eigen::MatrixXd(problem.Knn.diagonal()),
                            problem.function, options);
  EXPECT_EQ(output.status.return_code, CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH);

  const VariationalFactor too_few =
      TriangularFactor({problem.q_sqrt.get<TriangularFactor>().factors[0]});
  output = base_conditional(problem.Kmn, problem.Kmm, problem.Knn,
                            problem.function, options, &too_few);
  EXPECT_EQ(output.status.return_code, CONDITIONAL_RETURN_CODE_SHAPE_MISMATCH);
  EXPECT_FALSE(output.status.message.empty());
}

TEST(test_base_conditional, test_indefinite_prior_fails_to_factorize) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(3, 4, 1, gen);

  const Eigen::MatrixXd indefinite = -problem.Kmm;
  const auto output =
      base_conditional(problem.Kmn, indefinite, problem.Knn, problem.function,
                       ConditionalOptions(true, false, false));
  EXPECT_FALSE(output.ok());
  EXPECT_EQ(output.status.return_code,
            CONDITIONAL_RETURN_CODE_FACTORIZATION_FAILED);
}

TEST(test_base_conditional, test_upper_triangle_of_q_sqrt_is_ignored) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(4, 3, 1, gen);

  std::vector<Eigen::MatrixXd> noisy =
      problem.q_sqrt.get<TriangularFactor>().factors;
  Eigen::MatrixXd upper(4, 4);
  gaussian_fill(upper, gen);
  noisy[0] += Eigen::MatrixXd(upper.triangularView<Eigen::StrictlyUpper>());
  const VariationalFactor noisy_q_sqrt = TriangularFactor(noisy);

  const ConditionalOptions options(true, false, false);
  const auto clean = base_conditional(problem.Kmn, problem.Kmm, problem.Knn,
                                      problem.function, options,
                                      &problem.q_sqrt);
  const auto masked = base_conditional(problem.Kmn, problem.Kmm, problem.Knn,
                                       problem.function, options,
                                       &noisy_q_sqrt);
  ASSERT_TRUE(clean.ok());
  ASSERT_TRUE(masked.ok());
  expect_covariance_near(clean.covariance, masked.covariance);
}

TEST(test_base_conditional, test_whitening_requires_destinations) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(3, 4, 2, gen);

  VariationalFactor white_q_sqrt;
  auto status = whiten_variational_parameters(
      problem.Kmm, problem.function, nullptr, &problem.q_sqrt, &white_q_sqrt);
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.return_code, CONDITIONAL_RETURN_CODE_INVALID);

  Eigen::MatrixXd white_function;
  status = whiten_variational_parameters(problem.Kmm, problem.function,
                                         &white_function, &problem.q_sqrt);
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.return_code, CONDITIONAL_RETURN_CODE_INVALID);

  status = whiten_variational_parameters(problem.Kmm, problem.function,
                                         &white_function);
  ASSERT_TRUE(status.ok()) << status;
  EXPECT_EQ(white_function.rows(), 3);
  EXPECT_EQ(white_function.cols(), 2);
}

TEST(test_base_conditional, test_diagnostics_trace) {
  std::default_random_engine gen(2012);
  const auto problem = make_single_output_problem(3, 4, 2, gen);

  std::ostringstream oss;
  ConditionalOptions options(true, false, true);
  options.diagnostics = &oss;
  const auto output = base_conditional(problem.Kmn, problem.Kmm, problem.Knn,
                                       problem.function, options);
  ASSERT_TRUE(output.ok());
  EXPECT_NE(oss.str().find("base_conditional"), std::string::npos);
  EXPECT_NE(oss.str().find("M=3"), std::string::npos);
  EXPECT_NE(oss.str().find("N=4"), std::string::npos);
}

} // namespace kestrel
