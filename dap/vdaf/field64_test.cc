/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "dap/vdaf/field64.h"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "dap/testing/testing.h"

namespace dap {
namespace vdaf {
namespace {

using ::testing::ElementsAre;

TEST(Field64Test, AdditionWrapsAtModulus) {
  EXPECT_EQ(AddMod(kModulus - 1, 1), 0);
  EXPECT_EQ(AddMod(kModulus - 1, 5), 4);
  EXPECT_EQ(AddMod(2, 3), 5);
}

TEST(Field64Test, SubtractionBorrowsModulus) {
  EXPECT_EQ(SubMod(0, 1), kModulus - 1);
  EXPECT_EQ(SubMod(7, 3), 4);
  EXPECT_EQ(AddMod(NegMod(42), 42), 0);
}

TEST(Field64Test, Multiplication) {
  EXPECT_EQ(MulMod(3, 4), 12);
  // (p - 1)^2 = 1 mod p.
  EXPECT_EQ(MulMod(kModulus - 1, kModulus - 1), 1);
  // 2^32 * 2^32 = 2^64 = 2^32 - 1 mod p.
  EXPECT_EQ(MulMod(uint64_t{1} << 32, uint64_t{1} << 32), 0xFFFFFFFFull);
}

TEST(Field64Test, RandomElementIsCanonical) {
  for (int i = 0; i < 100; ++i) {
    EXPECT_LT(RandomElement(), kModulus);
  }
}

TEST(Field64Test, VectorEncoding) {
  std::vector<FieldElement> v = {0, 1, kModulus - 1};
  std::string encoded = EncodeVector(v);
  EXPECT_EQ(encoded.size(), 3 * kEncodedElementSize);
  EXPECT_EQ(encoded[kEncodedElementSize], 1);
  EXPECT_THAT(DecodeVector(encoded), IsOkAndHolds(v));
}

TEST(Field64Test, DecodeRejectsBadInput) {
  EXPECT_THAT(DecodeVector("1234567"), IsCode(INVALID_ARGUMENT));
  EXPECT_THAT(DecodeVector(std::string(8, '\xff')), IsCode(INVALID_ARGUMENT));
}

TEST(Field64Test, AddVectors) {
  EXPECT_THAT(AddVectors({1, kModulus - 1}, {2, 2}),
              IsOkAndHolds(ElementsAre(3, 1)));
  EXPECT_THAT(AddVectors({1}, {1, 2}), IsCode(INVALID_ARGUMENT));
}

}  // namespace
}  // namespace vdaf
}  // namespace dap
