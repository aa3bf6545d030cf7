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

#ifndef KESTREL_CORE_DECLARATIONS_H
#define KESTREL_CORE_DECLARATIONS_H

namespace mapbox {
namespace util {
template <typename... Ts> class variant;
}
} // namespace mapbox

using mapbox::util::variant;

namespace kestrel {

/*
 * Covariance structures
 */
struct IndependentVariance;
struct InputCovariance;
struct OutputCovariance;
struct JointCovariance;

using ConditionalCovariance = variant<IndependentVariance, InputCovariance,
                                      OutputCovariance, JointCovariance>;

/*
 * Variational parameters
 */
struct DiagonalFactor;
struct TriangularFactor;

using VariationalFactor = variant<DiagonalFactor, TriangularFactor>;

/*
 * Results
 */
struct ConditionalStatus;
struct ConditionalOptions;
struct ConditionalOutput;
struct BatchConditionalOutput;

} // namespace kestrel

#endif
