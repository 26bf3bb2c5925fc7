/***
 * Name: test_exceptions_hierarchy
 * Purpose: Every runtime error kind is catchable through the common base and keeps its message.
 */
#include <gtest/gtest.h>
#include <string>
#include "pybuf/exceptions/buffer_error.h"
#include "pybuf/exceptions/config_error.h"
#include "pybuf/exceptions/index_error.h"
#include "pybuf/exceptions/type_error.h"
#include "pybuf/exceptions/value_error.h"

using namespace pybuf::exceptions;

template <typename E>
static std::string caught_as_base(const std::string& msg) {
  try {
    throw E(msg);
  } catch (const PybufException& e) {
    return e.what();
  }
}

TEST(Exceptions, CaughtThroughBase) {
  EXPECT_EQ(caught_as_base<BufferError>("exported"), "exported");
  EXPECT_EQ(caught_as_base<IndexError>("out of range"), "out of range");
  EXPECT_EQ(caught_as_base<TypeError>("not bytes-like"), "not bytes-like");
  EXPECT_EQ(caught_as_base<ValueError>("bad item"), "bad item");
  EXPECT_EQ(caught_as_base<ConfigError>("PYBUF_VALIDATE"), "PYBUF_VALIDATE");
}

TEST(Exceptions, StdExceptionInterop) {
  try {
    throw BufferError("cannot modify read-only memory");
  } catch (const std::exception& e) {
    EXPECT_STREQ(e.what(), "cannot modify read-only memory");
  }
}
