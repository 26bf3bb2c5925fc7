/***
 * Name: test_buffer_descriptor
 * Purpose: Descriptor factories, invariants, contiguity and index positions.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "buffer/BufferDescriptor.h"
#include "pybuf/exceptions/index_error.h"
#include "runtime/Config.h"

using namespace pybuf::buffer;
using pybuf::exceptions::IndexError;

TEST(BufferDescriptor, SimpleIsOneDimensionalBytes) {
  const auto d = BufferDescriptor::simple(6, false);
  EXPECT_EQ(d.len(), 6u);
  EXPECT_FALSE(d.readonly());
  EXPECT_EQ(d.itemsize(), 1u);
  EXPECT_EQ(d.format(), "B");
  ASSERT_EQ(d.ndim(), 1u);
  EXPECT_EQ(d.dims()[0], (DimDesc{6, 1, 0}));
  EXPECT_FALSE(d.checkInvariants().has_value());
}

TEST(BufferDescriptor, FormatDividesLengthByItemsize) {
  const auto d = BufferDescriptor::format(16, true, 4, "i");
  EXPECT_TRUE(d.readonly());
  EXPECT_EQ(d.format(), "i");
  ASSERT_EQ(d.ndim(), 1u);
  EXPECT_EQ(d.dims()[0], (DimDesc{4, 4, 0}));
  EXPECT_FALSE(d.checkInvariants().has_value());
}

TEST(BufferDescriptor, ShapeProductTimesItemsizeIsLen) {
  const std::vector<BufferDescriptor> samples = {
      BufferDescriptor::simple(0, true),
      BufferDescriptor::simple(9, false),
      BufferDescriptor::format(24, false, 8, "d"),
      BufferDescriptor(24, false, 2, "h", {{3, 8, 0}, {4, 2, 0}}),
      BufferDescriptor(12, true, 1, "B", {{2, 6, 0}, {3, 2, 0}, {2, 1, 0}}),
  };
  for (const auto& d : samples) {
    ASSERT_FALSE(d.checkInvariants().has_value());
    std::size_t product = 1;
    for (auto s : d.shape()) { product *= s; }
    EXPECT_EQ(product * d.itemsize(), d.len());
  }
}

TEST(BufferDescriptor, InvariantViolationsAreReported) {
  EXPECT_TRUE(BufferDescriptor(4, false, 0, "B", {{4, 1, 0}}).checkInvariants().has_value());
  EXPECT_TRUE(BufferDescriptor(0, false, 1, "B", {}).checkInvariants().has_value());
  EXPECT_TRUE(BufferDescriptor(4, false, 1, "B", {{4, 0, 0}}).checkInvariants().has_value());
  EXPECT_TRUE(BufferDescriptor(4, false, 1, "B", {{4, 1, -1}}).checkInvariants().has_value());
  auto mismatch = BufferDescriptor(5, false, 1, "B", {{2, 2, 0}, {2, 1, 0}}).checkInvariants();
  ASSERT_TRUE(mismatch.has_value());
  EXPECT_NE(mismatch->find("does not match len 5"), std::string::npos);
}

TEST(BufferDescriptorDeathTest, ValidateAbortsWhenChecksAreForced) {
  EXPECT_DEATH(
      {
        pybuf::rt::set_runtime_config(pybuf::rt::RuntimeConfig{0, pybuf::rt::ValidationMode::Always});
        BufferDescriptor(4, false, 1, "B", {{4, 0, 0}}).validate();
      },
      "invalid buffer descriptor: stride of dimension 0 is zero");
}

TEST(BufferDescriptor, ValidateIsSilentWhenChecksAreDisabled) {
  pybuf::rt::set_runtime_config(pybuf::rt::RuntimeConfig{0, pybuf::rt::ValidationMode::Never});
  const BufferDescriptor bad(4, false, 1, "B", {{4, 0, 0}});
  EXPECT_EQ(&bad.validate(), &bad);
  pybuf::rt::set_runtime_config(pybuf::rt::RuntimeConfig{});
}

TEST(BufferDescriptor, SimpleIsAlwaysContiguous) {
  for (std::size_t n : {0u, 1u, 2u, 7u, 4096u}) {
    EXPECT_TRUE(BufferDescriptor::simple(n, false).isContiguous());
    EXPECT_TRUE(BufferDescriptor::simple(n, true).isContiguous());
  }
}

TEST(BufferDescriptor, RowMajorContiguity) {
  const BufferDescriptor rowMajor(6, false, 1, "B", {{2, 3, 0}, {3, 1, 0}});
  EXPECT_TRUE(rowMajor.isContiguous());
  EXPECT_TRUE(rowMajor.isLastDimContiguous());

  const BufferDescriptor columnMajor(6, false, 1, "B", {{2, 1, 0}, {3, 2, 0}});
  EXPECT_FALSE(columnMajor.isContiguous());
  EXPECT_FALSE(columnMajor.isLastDimContiguous());

  // Extent-1 dimensions never break contiguity, whatever their stride.
  const BufferDescriptor padded(6, false, 2, "h", {{1, 100, 0}, {3, 2, 0}});
  EXPECT_TRUE(padded.isContiguous());

  const BufferDescriptor everyOther(3, false, 1, "B", {{3, 2, 0}});
  EXPECT_FALSE(everyOther.isContiguous());
}

TEST(BufferDescriptor, ZeroLengthIsContiguousEvenWithOddStrides) {
  const BufferDescriptor empty(0, false, 1, "B", {{0, 5, 0}, {3, 7, 0}});
  EXPECT_TRUE(empty.isContiguous());
  EXPECT_TRUE(empty.isZeroInShape());
}

TEST(BufferDescriptor, AsReadonlyLeavesOriginalUntouched) {
  const auto d = BufferDescriptor::simple(3, false);
  const auto ro = d.asReadonly();
  EXPECT_TRUE(ro.readonly());
  EXPECT_FALSE(d.readonly());
  EXPECT_TRUE(ro.sameShape(d));
  EXPECT_EQ(ro.dims(), d.dims());
}

TEST(BufferDescriptor, FastPositionIsStrideDotProductPlusSuboffsets) {
  const BufferDescriptor d(24, false, 2, "h", {{3, 8, 1}, {4, 2, 0}});
  EXPECT_EQ(d.fastPosition({0, 0}), 1);
  EXPECT_EQ(d.fastPosition({1, 0}), 9);
  EXPECT_EQ(d.fastPosition({2, 3}), 2 * 8 + 1 + 3 * 2);
}

TEST(BufferDescriptor, PositionWrapsNegativeIndices) {
  const BufferDescriptor d(6, false, 1, "B", {{2, 3, 0}, {3, 1, 0}});
  EXPECT_EQ(d.position({0, 0}), 0);
  EXPECT_EQ(d.position({1, 2}), 5);
  EXPECT_EQ(d.position({-1, -1}), 5);
  EXPECT_EQ(d.position({-2, -3}), 0);
  EXPECT_EQ(d.position({-1, 0}), d.fastPosition({1, 0}));
}

TEST(BufferDescriptor, PositionReversedViewUsesSuboffset) {
  // shape 4, stride -1, suboffset 3: index i lives at byte 3 - i
  const BufferDescriptor reversed(4, true, 1, "B", {{4, -1, 3}});
  EXPECT_EQ(reversed.position({0}), 3);
  EXPECT_EQ(reversed.position({3}), 0);
  EXPECT_EQ(reversed.position({-1}), 0);
}

TEST(BufferDescriptor, PositionOutOfRangeNamesDimensionAndIndex) {
  const BufferDescriptor d(6, false, 1, "B", {{2, 3, 0}, {3, 1, 0}});
  try {
    (void)d.position({0, 3});
    FAIL() << "expected IndexError";
  } catch (const IndexError& e) {
    EXPECT_STREQ(e.what(), "index out of bounds on dimension 2 (index 3)");
  }
  try {
    (void)d.position({-3, 0});
    FAIL() << "expected IndexError";
  } catch (const IndexError& e) {
    EXPECT_STREQ(e.what(), "index out of bounds on dimension 1 (index -3)");
  }
  EXPECT_THROW((void)d.position({2, 0}), IndexError);
}
