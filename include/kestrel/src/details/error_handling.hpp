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

#ifndef INCLUDE_KESTREL_SRC_DETAILS_ERROR_HANDLING_HPP_
#define INCLUDE_KESTREL_SRC_DETAILS_ERROR_HANDLING_HPP_

/*
 * assert() disappears in release builds, along with anything inside it,
 * so something like:
 *
 *   assert(llt.info() == Eigen::Success && check_sizes(x));
 *
 * silently stops evaluating check_sizes(x).  KESTREL_ASSERT always
 * evaluates its argument and only asserts in debug builds, which also
 * keeps the compiler from complaining about unused variables.
 *
 * This is reserved for internal invariants.  Anything a caller can get
 * wrong is reported through a ConditionalStatus instead.
 */
#ifdef NDEBUG
#define KESTREL_ASSERT(x)                                                      \
  do {                                                                         \
    (void)(x);                                                                 \
  } while (0)
#else
#include <assert.h>
#define KESTREL_ASSERT(x) assert((x))
#endif

#endif /* INCLUDE_KESTREL_SRC_DETAILS_ERROR_HANDLING_HPP_ */
