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

#include "dap/testing/testing.h"

#include <fstream>
#include <iterator>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/match.h"
#include "dap/protos/messages.pb.h"

namespace dap {
namespace {

using ::testing::Not;

TEST(TestingTest, TestName) { ASSERT_EQ(TestName(), "TestingTest_TestName"); }

TEST(TestingTest, TemporaryTestFileIsNamedAfterTheTest) {
  std::string path = TemporaryTestFile(".textproto");
  EXPECT_TRUE(absl::EndsWith(
      path, "/TestingTest_TemporaryTestFileIsNamedAfterTheTest.textproto"));
}

TEST(TestingTest, StatusMatchers) {
  EXPECT_THAT(absl::OkStatus(), IsOk());
  EXPECT_THAT(absl::NotFoundError("x"), IsCode(NOT_FOUND));
  EXPECT_THAT(absl::NotFoundError("x"), Not(IsCode(INTERNAL)));
  EXPECT_THAT(StatusOr<int>(absl::NotFoundError("x")), IsCode(NOT_FOUND));
  EXPECT_THAT(StatusOr<int>(3), IsOkAndHolds(3));
  EXPECT_THAT(StatusOr<int>(absl::InternalError("x")), Not(IsOk()));
}

TEST(TestingTest, WriteTemporaryTextProto) {
  Interval interval;
  interval.set_start(3600);
  std::string path = WriteTemporaryTextProto(interval);
  std::ifstream in(path);
  std::string contents((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
  EXPECT_EQ(contents, "start: 3600\n");
}

TEST(TestingTest, ParseTextProtoAndEqualsProto) {
  Interval parsed = PARSE_TEXT_PROTO("start: 3600 duration: 7200");
  Interval built;
  built.set_start(3600);
  built.set_duration(7200);
  EXPECT_THAT(parsed, EqualsProto(built));
  built.set_duration(1);
  EXPECT_THAT(parsed, Not(EqualsProto(built)));
}

}  // namespace
}  // namespace dap
