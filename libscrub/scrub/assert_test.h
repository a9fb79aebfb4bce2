/*
 * Include this file to use assert in test code. This will allow
 * the use of assert and ensure that NDEBUG is undefined (which
 * would cause spurious test passes).
 */

#ifndef SCRUB_ASSERT_TEST_H
#define SCRUB_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* SCRUB_ASSERT_TEST_H */
