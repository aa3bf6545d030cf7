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

#include <cmath>
#include <gflags/gflags.h>
#include <iomanip>
#include <iostream>

#include <kestrel/Conditionals>
#include <kestrel/Samplers>

DEFINE_int32(m, 8, "number of inducing points per latent process.");
DEFINE_int32(n, 20, "number of query points.");
DEFINE_int32(seed, 2012, "seed for the random number generator.");
DEFINE_bool(white, true, "use the whitened representation.");
DEFINE_bool(full_output_cov, true,
            "keep the correlation between the two outputs.");
DEFINE_bool(verbose, false, "trace each conditional to stdout.");

namespace kestrel {

double squared_exponential(double x, double y, double length_scale) {
  const double d = (x - y) / length_scale;
  return std::exp(-0.5 * d * d);
}

Eigen::VectorXd linspace(Eigen::Index k, double low, double high) {
  return Eigen::VectorXd::LinSpaced(k, low, high);
}

/*
 * Two latent processes (a long and a short length scale) are mixed into
 * two outputs, f_p(x) = sum_l W(p, l) g_l(x).  The inducing values of
 * each latent process are fit to sin(z) and cos(z) with a little
 * uncertainty and the posterior over both outputs is sampled.
 */
int run_example() {
  const Eigen::Index m = static_cast<Eigen::Index>(FLAGS_m);
  const Eigen::Index n = static_cast<Eigen::Index>(FLAGS_n);
  const Eigen::Index num_latent = 2;
  const Eigen::Index num_outputs = 2;
  const double low = -5.;
  const double high = 5.;
  const std::vector<double> length_scales = {2., 0.7};

  Eigen::MatrixXd W(num_outputs, num_latent);
  W << 1., 0.5, -0.3, 1.;

  const Eigen::VectorXd z = linspace(m, low, high);
  const Eigen::VectorXd x = linspace(n, low - 1., high + 1.);

  std::vector<Eigen::MatrixXd> Kmm;
  std::vector<Eigen::MatrixXd> Kmn;
  Eigen::MatrixXd Knn = Eigen::MatrixXd::Zero(n * num_outputs, n * num_outputs);
  for (Eigen::Index l = 0; l < num_latent; ++l) {
    const double ls = length_scales[cast::to_size(l)];

    Eigen::MatrixXd K(m, m);
    for (Eigen::Index i = 0; i < m; ++i) {
      for (Eigen::Index j = 0; j < m; ++j) {
        K(i, j) = squared_exponential(z[i], z[j], ls);
      }
    }
    K.diagonal().array() += 1e-6;
    Kmm.push_back(K);

    Eigen::MatrixXd cross(m, n * num_outputs);
    for (Eigen::Index i = 0; i < m; ++i) {
      for (Eigen::Index j = 0; j < n; ++j) {
        for (Eigen::Index p = 0; p < num_outputs; ++p) {
          cross(i, flat_index(j, p, num_outputs)) =
              W(p, l) * squared_exponential(z[i], x[j], ls);
        }
      }
    }
    Kmn.push_back(cross);

    for (Eigen::Index i = 0; i < n; ++i) {
      for (Eigen::Index j = 0; j < n; ++j) {
        const double k = squared_exponential(x[i], x[j], ls);
        for (Eigen::Index p = 0; p < num_outputs; ++p) {
          for (Eigen::Index q = 0; q < num_outputs; ++q) {
            Knn(flat_index(i, p, num_outputs), flat_index(j, q, num_outputs)) +=
                W(p, l) * W(q, l) * k;
          }
        }
      }
    }
  }

  Eigen::MatrixXd f(m, num_latent);
  f.col(0) = z.array().sin().matrix();
  f.col(1) = z.array().cos().matrix();
  const VariationalFactor q_sqrt =
      DiagonalFactor(Eigen::MatrixXd::Constant(m, num_latent, 0.1));

  // The inducing values were specified in the original coordinates.
  Eigen::MatrixXd white_f;
  VariationalFactor white_q_sqrt;
  if (FLAGS_white) {
    const auto status =
        whiten_variational_parameters(Kmm, f, &white_f, &q_sqrt, &white_q_sqrt);
    if (!status.ok()) {
      std::cerr << "failed to whiten: " << status << std::endl;
      return 1;
    }
  }

  ConditionalCovariance prior;
  if (FLAGS_full_output_cov) {
    std::vector<Eigen::MatrixXd> blocks;
    for (Eigen::Index i = 0; i < n; ++i) {
      blocks.push_back(Knn.block(i * num_outputs, i * num_outputs, num_outputs,
                                 num_outputs));
    }
    prior = OutputCovariance(blocks);
  } else {
    Eigen::MatrixXd variance(n, num_outputs);
    for (Eigen::Index i = 0; i < n; ++i) {
      for (Eigen::Index p = 0; p < num_outputs; ++p) {
        const Eigen::Index k = flat_index(i, p, num_outputs);
        variance(i, p) = Knn(k, k);
      }
    }
    prior = IndependentVariance(variance);
  }

  ConditionalOptions options(false, FLAGS_full_output_cov, FLAGS_white);
  if (FLAGS_verbose) {
    options.diagnostics = &std::cout;
  }

  const auto output = independent_interdomain_conditional(
      Kmn, Kmm, prior, FLAGS_white ? white_f : f, options,
      FLAGS_white ? &white_q_sqrt : &q_sqrt);
  if (!output.ok()) {
    std::cerr << "conditional failed: " << output.status << std::endl;
    return 1;
  }

  std::default_random_engine gen(static_cast<unsigned>(FLAGS_seed));
  Eigen::MatrixXd sample;
  const auto sample_status =
      sample_mvn(output.mean, output.covariance, gen, &sample);
  if (!sample_status.ok()) {
    std::cerr << "sampling failed: " << sample_status << std::endl;
    return 1;
  }

  std::cout << std::setw(8) << "x";
  for (Eigen::Index p = 0; p < num_outputs; ++p) {
    std::cout << std::setw(10) << "mean_" + std::to_string(p)
              << std::setw(10) << "sample_" + std::to_string(p);
  }
  std::cout << std::endl;
  std::cout << std::fixed << std::setprecision(4);
  for (Eigen::Index i = 0; i < n; ++i) {
    std::cout << std::setw(8) << x[i];
    for (Eigen::Index p = 0; p < num_outputs; ++p) {
      std::cout << std::setw(10) << output.mean(i, p) << std::setw(10)
                << sample(i, p);
    }
    std::cout << std::endl;
  }
  return 0;
}

} // namespace kestrel

int main(int argc, char *argv[]) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (FLAGS_m <= 0 || FLAGS_n <= 0) {
    std::cerr << "both -m and -n must be positive" << std::endl;
    return 1;
  }

  return kestrel::run_example();
}
