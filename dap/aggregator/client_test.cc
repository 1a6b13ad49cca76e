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

#include "dap/aggregator/client.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "dap/aggregator/collector.h"
#include "dap/aggregator/hpke_binding.h"
#include "dap/base/random_id.h"
#include "dap/hpke/hpke.h"
#include "dap/testing/testing.h"
#include "dap/vdaf/field64.h"

namespace dap {
namespace aggregator {
namespace {

using ::testing::SizeIs;

constexpr uint64_t kTime = 1700001234;

class ClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    task_ = PARSE_TEXT_PROTO(R"pb(
      version: DAP_VERSION_DRAFT03
      time_precision: 3600
      vdaf { type: SUM bits: 8 }
    )pb");
    for (uint32_t id : {1, 2}) {
      ASSERT_OK_AND_ASSIGN(hpke::HpkeReceiverConfig config,
                           hpke::HpkeReceiverConfig::Generate(id));
      configs_.push_back(std::move(config));
    }
    ASSERT_OK_AND_ASSIGN(hpke::HpkeReceiverConfig collector,
                         hpke::HpkeReceiverConfig::Generate(3));
    *task_.mutable_collector_hpke_config() = collector.config();
    std::vector<hpke::HpkeReceiverConfig> collector_configs;
    collector_configs.push_back(std::move(collector));
    collector_ = std::make_unique<hpke::HpkeReceiverConfigList>(
        std::move(collector_configs));
  }

  const hpke::HpkeReceiverConfig& leader() const { return configs_[0]; }
  const hpke::HpkeReceiverConfig& helper() const { return configs_[1]; }
  const hpke::HpkeReceiverConfigList& collector() const { return *collector_; }

  TaskConfig task_;
  std::string task_id_ = GenerateId();
  std::vector<hpke::HpkeReceiverConfig> configs_;
  std::unique_ptr<hpke::HpkeReceiverConfigList> collector_;
};

TEST_F(ClientTest, EncryptsOneShareToEachAggregator) {
  ASSERT_OK_AND_ASSIGN(
      Report report,
      ProduceReport(task_id_, task_, {leader().config(), helper().config()},
                    kTime, 200));
  EXPECT_EQ(report.task_id(), task_id_);
  EXPECT_EQ(report.metadata().id().size(), kReportIdLength);
  EXPECT_EQ(report.metadata().time(), kTime);
  ASSERT_THAT(report.encrypted_input_shares(), SizeIs(2));
  EXPECT_EQ(report.encrypted_input_shares(0).config_id(), 1);
  EXPECT_EQ(report.encrypted_input_shares(1).config_id(), 2);

  std::string aad =
      InputShareAad(task_id_, report.metadata(), report.public_share());
  EXPECT_OK(leader()
                .Decrypt(InputShareInfo(task_.version(), Role::kLeader), aad,
                         report.encrypted_input_shares(0))
                .status());
  EXPECT_OK(helper()
                .Decrypt(InputShareInfo(task_.version(), Role::kHelper), aad,
                         report.encrypted_input_shares(1))
                .status());
  // A share is bound to its receiver.
  EXPECT_FALSE(helper()
                   .Decrypt(InputShareInfo(task_.version(), Role::kLeader),
                            aad, report.encrypted_input_shares(1))
                   .ok());
}

TEST_F(ClientTest, RejectsWrongNumberOfConfigs) {
  EXPECT_THAT(ProduceReport(task_id_, task_, {leader().config()}, kTime, 1),
              IsCode(INVALID_ARGUMENT));
}

TEST_F(ClientTest, RejectsOutOfRangeMeasurement) {
  EXPECT_FALSE(ProduceReport(task_id_, task_,
                             {leader().config(), helper().config()}, kTime,
                             256)
                   .ok());
}

class CollectorTest : public ClientTest {
 protected:
  HpkeCiphertext EncryptShare(Role sender, uint64_t value) {
    absl::StatusOr<HpkeCiphertext> ciphertext = hpke::HpkeEncrypt(
        collector().primary(), AggregateShareInfo(task_.version(), sender),
        AggregateShareAad(task_id_, batch_sel_),
        vdaf::EncodeVector({value}));
    EXPECT_OK(ciphertext);
    return *ciphertext;
  }

  void SetUp() override {
    ClientTest::SetUp();
    batch_sel_.set_query_type(TIME_INTERVAL);
    batch_sel_.mutable_batch_interval()->set_start(1699999200);
    batch_sel_.mutable_batch_interval()->set_duration(3600);
  }

  BatchSelector batch_sel_;
};

TEST_F(CollectorTest, RecoversAggregate) {
  CollectResp resp;
  resp.set_report_count(3);
  *resp.add_encrypted_agg_shares() =
      EncryptShare(Role::kLeader, vdaf::SubMod(100, 37));
  *resp.add_encrypted_agg_shares() = EncryptShare(Role::kHelper, 37);
  ASSERT_OK_AND_ASSIGN(
      CollectResult result,
      ConsumeCollectResp(collector(), task_id_, task_, batch_sel_, resp));
  EXPECT_EQ(result.report_count, 3);
  EXPECT_EQ(result.aggregate, 100);
}

TEST_F(CollectorTest, RejectsSwappedShares) {
  CollectResp resp;
  resp.set_report_count(1);
  *resp.add_encrypted_agg_shares() = EncryptShare(Role::kHelper, 1);
  *resp.add_encrypted_agg_shares() = EncryptShare(Role::kLeader, 0);
  EXPECT_FALSE(
      ConsumeCollectResp(collector(), task_id_, task_, batch_sel_, resp).ok());
}

TEST_F(CollectorTest, RejectsMissingShare) {
  CollectResp resp;
  resp.set_report_count(1);
  *resp.add_encrypted_agg_shares() = EncryptShare(Role::kLeader, 1);
  EXPECT_THAT(
      ConsumeCollectResp(collector(), task_id_, task_, batch_sel_, resp),
      IsCode(INVALID_ARGUMENT));
}

}  // namespace
}  // namespace aggregator
}  // namespace dap
