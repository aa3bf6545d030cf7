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

#ifndef INCLUDE_KESTREL_SRC_DETAILS_TYPECAST_HPP_
#define INCLUDE_KESTREL_SRC_DETAILS_TYPECAST_HPP_

namespace kestrel {

namespace cast {

// Shapes are carried as Eigen::Index while the leading axes live in
// std::vector, these make the hops between the two explicit.
constexpr std::size_t to_size(Eigen::Index input) {
  KESTREL_ASSERT(input >= 0);
  return static_cast<std::size_t>(input);
}

constexpr Eigen::Index to_index(std::size_t input) {
  KESTREL_ASSERT(input <= to_size(std::numeric_limits<Eigen::Index>::max()));
  return static_cast<Eigen::Index>(input);
}

} // namespace cast

} // namespace kestrel

#endif /* INCLUDE_KESTREL_SRC_DETAILS_TYPECAST_HPP_ */
