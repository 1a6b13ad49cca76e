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

#include "dap/aggregator/leader.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "dap/aggregator/aggregator_config.h"
#include "dap/aggregator/client.h"
#include "dap/aggregator/in_memory_storage.h"
#include "dap/aggregator/task_config.h"
#include "dap/aggregator/testing/matchers.h"
#include "dap/aggregator/testing/mock_helper_transport.h"
#include "dap/aggregator/testing/test_env.h"
#include "dap/base/random_id.h"
#include "dap/testing/testing.h"

namespace dap {
namespace aggregator {
namespace {

using ::testing::_;
using ::testing::Invoke;
using ::testing::IsEmpty;
using ::testing::Return;
using ::testing::SizeIs;
using ::testing::StartsWith;

class LeaderTest : public ::testing::TestWithParam<DapVersion> {
 protected:
  void SetUp() override {
    ASSERT_OK_AND_ASSIGN(env_, DapTestEnv::Create(GetParam()));
  }

  DapRequest HpkeConfigRequest(absl::string_view query) const {
    DapRequest req;
    req.version = GetParam();
    req.url = absl::StrCat(DapTestEnv::kLeaderUrl, "hpke_config", query);
    return req;
  }

  DapRequest CollectRequest(absl::string_view task_id,
                            const BatchSelector& query) const {
    CollectReq collect_req;
    collect_req.set_task_id(std::string(task_id));
    *collect_req.mutable_query() = query;
    return env_->CollectorRequest(task_id, kMediaTypeCollectReq,
                                  collect_req.SerializeAsString());
  }

  DapRequest PollRequest(absl::string_view uri) const {
    DapRequest req = env_->CollectorRequest(task_id(), "", "");
    req.url = std::string(uri);
    return req;
  }

  BatchSelector Interval(uint64_t start, uint64_t duration) const {
    BatchSelector query;
    query.set_query_type(TIME_INTERVAL);
    query.mutable_batch_interval()->set_start(start);
    query.mutable_batch_interval()->set_duration(duration);
    return query;
  }

  BatchSelector CurrentWindow() const {
    return QueryForCurrentBatchWindow(env_->task(task_id()), env_->now());
  }

  uint64_t TruncatedNow() const {
    return TruncateTime(env_->task(task_id()), env_->now());
  }

  const std::string& task_id() const { return env_->time_interval_task_id(); }

  std::unique_ptr<DapTestEnv> env_;
};

TEST_P(LeaderTest, HpkeConfigNeedsKnownTask) {
  EXPECT_THAT(env_->leader().HandleHpkeConfig(HpkeConfigRequest("")),
              IsAbort(AbortKind::kMissingTaskId));
  EXPECT_THAT(env_->leader().HandleHpkeConfig(HpkeConfigRequest(
                  absl::StrCat("?task_id=", IdToBase64Url(GenerateId())))),
              IsAbort(AbortKind::kUnrecognizedTask));

  ASSERT_OK_AND_ASSIGN(
      DapResponse resp,
      env_->leader().HandleHpkeConfig(HpkeConfigRequest(
          absl::StrCat("?task_id=", IdToBase64Url(task_id())))));
  EXPECT_EQ(resp.media_type, kMediaTypeHpkeConfig);
  HpkeConfig config;
  ASSERT_TRUE(config.ParseFromString(resp.payload));
  EXPECT_THAT(config, EqualsProto(env_->leader().hpke_config()));
}

TEST_P(LeaderTest, HpkeConfigRejectsUnknownVersion) {
  DapRequest req =
      HpkeConfigRequest(absl::StrCat("?task_id=", IdToBase64Url(task_id())));
  req.version = DAP_VERSION_UNKNOWN;
  EXPECT_THAT(env_->leader().HandleHpkeConfig(req),
              IsAbort(AbortKind::kInvalidProtocolVersion));
}

TEST_P(LeaderTest, UploadQueuesReport) {
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(task_id(), 1));
  ASSERT_OK(env_->Upload(report));
  EXPECT_THAT(env_->leader_storage().reports().TasksWithPending(),
              IsOkAndHolds(::testing::ElementsAre(task_id())));
}

TEST_P(LeaderTest, UploadRejectsUnknownTask) {
  std::string zero_task_id(kIdLength, '\0');
  ASSERT_OK_AND_ASSIGN(
      Report report, env_->GenerateReport(zero_task_id, env_->task(task_id()),
                                          env_->now(), 1));
  EXPECT_THAT(env_->Upload(report), IsAbort(AbortKind::kUnrecognizedTask));
}

TEST_P(LeaderTest, UploadRejectsMissingShare) {
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(task_id(), 1));
  report.mutable_encrypted_input_shares()->RemoveLast();
  EXPECT_THAT(env_->Upload(report), IsAbort(AbortKind::kUnrecognizedMessage));
}

TEST_P(LeaderTest, UploadRejectsExpiredTask) {
  ASSERT_OK_AND_ASSIGN(Report report,
                       env_->GenerateReport(env_->expired_task_id(), 1));
  EXPECT_THAT(env_->Upload(report), IsAbort(AbortKind::kReportTooLate));
}

TEST_P(LeaderTest, UploadRejectsBadVersionAndMediaType) {
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(task_id(), 1));
  DapRequest req = env_->UploadRequest(report);
  req.version = DAP_VERSION_UNKNOWN;
  EXPECT_THAT(env_->leader().HandleUpload(req),
              IsAbort(AbortKind::kInvalidProtocolVersion));

  req = env_->UploadRequest(report);
  req.version = GetParam() == DAP_VERSION_DRAFT02 ? DAP_VERSION_DRAFT03
                                                  : DAP_VERSION_DRAFT02;
  EXPECT_THAT(env_->leader().HandleUpload(req),
              IsAbort(AbortKind::kInvalidProtocolVersion));

  req = env_->UploadRequest(report);
  req.media_type = "text/plain";
  EXPECT_THAT(env_->leader().HandleUpload(req),
              IsAbort(AbortKind::kUnrecognizedMessage));

  req = env_->UploadRequest(report);
  req.payload = "\xff\xff";
  EXPECT_THAT(env_->leader().HandleUpload(req),
              IsAbort(AbortKind::kUnrecognizedMessage));
}

TEST_P(LeaderTest, GetReportsDrainsTimeIntervalQueue) {
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(task_id(), 1));
  ASSERT_OK(env_->Upload(report));

  ReportSelector selector;
  selector.task_ids = {task_id()};
  ASSERT_OK_AND_ASSIGN(std::vector<ReportsForJob> first,
                       env_->leader().GetReports(selector));
  ASSERT_THAT(first, SizeIs(1));
  EXPECT_EQ(first[0].task_id, task_id());
  EXPECT_EQ(first[0].part_batch_sel.query_type(), TIME_INTERVAL);
  ASSERT_THAT(first[0].reports, SizeIs(1));
  EXPECT_THAT(first[0].reports[0], EqualsProto(report));

  ASSERT_OK_AND_ASSIGN(std::vector<ReportsForJob> second,
                       env_->leader().GetReports(selector));
  ASSERT_THAT(second, SizeIs(1));
  EXPECT_EQ(second[0].task_id, task_id());
  EXPECT_THAT(second[0].reports, IsEmpty());
}

TEST_P(LeaderTest, GetReportsSplitsFixedSizeBatches) {
  const std::string& fixed = env_->fixed_size_task_id();
  for (int i = 0; i < 3; ++i) {
    ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(fixed, 1));
    ASSERT_OK(env_->Upload(report));
  }
  ASSERT_OK_AND_ASSIGN(std::vector<ReportsForJob> jobs,
                       env_->leader().GetReports(ReportSelector{}));
  ASSERT_THAT(jobs, SizeIs(2));
  EXPECT_EQ(jobs[0].part_batch_sel.query_type(), FIXED_SIZE);
  EXPECT_THAT(jobs[0].reports, SizeIs(2));
  EXPECT_THAT(jobs[1].reports, SizeIs(1));
  EXPECT_NE(jobs[0].part_batch_sel.batch_id(), jobs[1].part_batch_sel.batch_id());
  EXPECT_THAT(env_->leader().CurrentBatchId(fixed),
              IsOkAndHolds(std::optional<std::string>(
                  jobs[1].part_batch_sel.batch_id())));
}

TEST_P(LeaderTest, AggregationDropsReplayedReports) {
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(task_id(), 1));
  ASSERT_OK(env_->Upload(report));
  ASSERT_OK(env_->Upload(report));
  EXPECT_THAT(env_->RunAggregation(), IsOkAndHolds(1));

  ASSERT_OK(env_->Upload(report));
  EXPECT_THAT(env_->RunAggregation(), IsOkAndHolds(0));
}

TEST_P(LeaderTest, CollectRequiresCollectorToken) {
  DapRequest req = CollectRequest(task_id(), CurrentWindow());
  req.sender_auth.reset();
  EXPECT_THAT(env_->leader().HandleCollect(req),
              IsAbort(AbortKind::kUnauthorizedRequest));
  req.sender_auth = BearerToken(std::string(DapTestEnv::kLeaderToken));
  EXPECT_THAT(env_->leader().HandleCollect(req),
              IsAbort(AbortKind::kUnauthorizedRequest));
}

TEST_P(LeaderTest, UnknownTaskIsUnauthorizedWithoutToken) {
  std::string unknown = GenerateId();
  DapRequest collect = CollectRequest(unknown, CurrentWindow());
  DapRequest poll = env_->CollectorRequest(unknown, "", "");
  poll.url = absl::StrCat(DapTestEnv::kLeaderUrl, "collect/task/",
                          IdToBase64Url(unknown), "/req/",
                          IdToBase64Url(GenerateId()));

  for (const std::optional<BearerToken>& auth :
       {std::optional<BearerToken>(),
        std::optional<BearerToken>(
            BearerToken(std::string(DapTestEnv::kLeaderToken)))}) {
    collect.sender_auth = auth;
    poll.sender_auth = auth;
    EXPECT_THAT(env_->leader().HandleCollect(collect),
                IsAbort(AbortKind::kUnauthorizedRequest));
    EXPECT_THAT(env_->leader().HandleCollectPoll(poll),
                IsAbort(AbortKind::kUnauthorizedRequest));
  }

  BearerToken collector_token(std::string(DapTestEnv::kCollectorToken));
  collect.sender_auth = collector_token;
  poll.sender_auth = collector_token;
  EXPECT_THAT(env_->leader().HandleCollect(collect),
              IsAbort(AbortKind::kUnrecognizedTask));
  EXPECT_THAT(env_->leader().HandleCollectPoll(poll),
              IsAbort(AbortKind::kUnrecognizedTask));
}

TEST_P(LeaderTest, TaskTokensReplaceAggregatorTokens) {
  const std::string& own = env_->own_tokens_task_id();
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(own, 1));
  ASSERT_OK(env_->Upload(report));
  // The Helper only accepts the task's Leader token.
  ASSERT_THAT(env_->RunAggregation(), IsOkAndHolds(1));

  DapRequest req = CollectRequest(
      own, QueryForCurrentBatchWindow(env_->task(own), env_->now()));
  EXPECT_THAT(env_->leader().HandleCollect(req),
              IsAbort(AbortKind::kUnauthorizedRequest));
  BearerToken task_token(std::string(DapTestEnv::kTaskCollectorToken));
  req.sender_auth = task_token;
  ASSERT_OK_AND_ASSIGN(std::string uri, env_->leader().HandleCollect(req));
  EXPECT_THAT(env_->leader().ProcessPendingCollectJobs(), IsOkAndHolds(1));

  DapRequest poll = env_->CollectorRequest(own, "", "");
  poll.url = uri;
  EXPECT_THAT(env_->leader().HandleCollectPoll(poll),
              IsAbort(AbortKind::kUnauthorizedRequest));
  poll.sender_auth = task_token;
  ASSERT_OK_AND_ASSIGN(CollectJobPoll result,
                       env_->leader().HandleCollectPoll(poll));
  EXPECT_EQ(result.status, CollectJobStatus::kDone);

  // A poll naming another task cannot reach this task's job.
  poll.task_id = task_id();
  poll.sender_auth = BearerToken(std::string(DapTestEnv::kCollectorToken));
  EXPECT_THAT(env_->leader().HandleCollectPoll(poll),
              IsAbort(AbortKind::kUnrecognizedMessage));
}

TEST_P(LeaderTest, CollectRejectsBadQueries) {
  BatchSelector fixed_size;
  fixed_size.set_query_type(FIXED_SIZE);
  fixed_size.set_batch_id(GenerateId());
  EXPECT_THAT(env_->leader().HandleCollect(CollectRequest(task_id(),
                                                          fixed_size)),
              IsAbort(AbortKind::kQueryMismatch));
  EXPECT_THAT(env_->leader().HandleCollect(
                  CollectRequest(env_->fixed_size_task_id(), fixed_size)),
              IsAbort(AbortKind::kBatchInvalid));
  EXPECT_THAT(env_->leader().HandleCollect(
                  CollectRequest(GenerateId(), CurrentWindow())),
              IsAbort(AbortKind::kUnrecognizedTask));
}

TEST_P(LeaderTest, CollectChecksIntervalBounds) {
  uint64_t max_duration = env_->leader().global_config().max_batch_duration();
  EXPECT_THAT(env_->leader().HandleCollect(CollectRequest(
                  task_id(), Interval(TruncatedNow(), max_duration + 3600))),
              IsBadRequest("batch interval too large"));
  EXPECT_THAT(env_->leader().HandleCollect(CollectRequest(
                  task_id(), Interval(TruncatedNow() - 2 * max_duration,
                                      3600))),
              IsBadRequest("batch interval too far into past"));
  EXPECT_THAT(env_->leader().HandleCollect(CollectRequest(
                  task_id(), Interval(TruncatedNow() + 2 * max_duration,
                                      3600))),
              IsBadRequest("batch interval too far into future"));

  ASSERT_OK_AND_ASSIGN(
      std::string uri,
      env_->leader().HandleCollect(CollectRequest(
          task_id(),
          Interval(TruncatedNow() - max_duration / 2, max_duration))));
  EXPECT_THAT(uri, StartsWith(absl::StrCat(DapTestEnv::kLeaderUrl,
                                           "collect/task/",
                                           IdToBase64Url(task_id()), "/req/")));
}

TEST_P(LeaderTest, CollectPollLifecycle) {
  std::string unknown_uri =
      absl::StrCat(DapTestEnv::kLeaderUrl, "collect/task/",
                   IdToBase64Url(task_id()), "/req/",
                   IdToBase64Url(GenerateId()));
  ASSERT_OK_AND_ASSIGN(CollectJobPoll poll,
                       env_->leader().HandleCollectPoll(PollRequest(
                           unknown_uri)));
  EXPECT_EQ(poll.status, CollectJobStatus::kUnknown);

  ASSERT_OK_AND_ASSIGN(std::string uri,
                       env_->leader().HandleCollect(
                           CollectRequest(task_id(), CurrentWindow())));
  ASSERT_OK_AND_ASSIGN(poll,
                       env_->leader().HandleCollectPoll(PollRequest(uri)));
  EXPECT_EQ(poll.status, CollectJobStatus::kPending);
  EXPECT_FALSE(poll.response.has_value());

  ASSERT_OK_AND_ASSIGN(std::vector<CollectJob> pending,
                       env_->leader().GetPendingCollectJobs());
  ASSERT_THAT(pending, SizeIs(1));
  CollectResp resp;
  resp.set_report_count(7);
  ASSERT_OK(env_->leader().FinishCollectJob(task_id(),
                                            pending[0].collect_id(), resp));
  ASSERT_OK_AND_ASSIGN(poll,
                       env_->leader().HandleCollectPoll(PollRequest(uri)));
  EXPECT_EQ(poll.status, CollectJobStatus::kDone);
  ASSERT_TRUE(poll.response.has_value());
  EXPECT_EQ(poll.response->report_count(), 7);
}

TEST_P(LeaderTest, CollectPollRejectsMalformedUri) {
  EXPECT_THAT(env_->leader().HandleCollectPoll(PollRequest(
                  absl::StrCat(DapTestEnv::kLeaderUrl, "collect"))),
              IsAbort(AbortKind::kUnrecognizedMessage));
  EXPECT_THAT(env_->leader().HandleCollectPoll(PollRequest(absl::StrCat(
                  DapTestEnv::kLeaderUrl, "collect/task/abc/req/def"))),
              IsAbort(AbortKind::kUnrecognizedMessage));
}

TEST_P(LeaderTest, CollectRejectsOverlap) {
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(task_id(), 1));
  ASSERT_OK(env_->Upload(report));
  ASSERT_THAT(env_->RunAggregation(), IsOkAndHolds(1));
  ASSERT_OK(env_->Collect(task_id(), CurrentWindow()).status());

  EXPECT_THAT(env_->leader().HandleCollect(
                  CollectRequest(task_id(), CurrentWindow())),
              IsAbort(AbortKind::kBatchOverlap));
  EXPECT_THAT(env_->leader().HandleCollect(CollectRequest(
                  task_id(), Interval(TruncatedNow() - 3600, 7200))),
              IsAbort(AbortKind::kBatchOverlap));
}

TEST_P(LeaderTest, UndersizedBatchStaysPending) {
  ASSERT_OK_AND_ASSIGN(std::string uri,
                       env_->leader().HandleCollect(
                           CollectRequest(task_id(), CurrentWindow())));
  EXPECT_THAT(env_->leader().ProcessPendingCollectJobs(), IsOkAndHolds(0));
  ASSERT_OK_AND_ASSIGN(CollectJobPoll poll,
                       env_->leader().HandleCollectPoll(PollRequest(uri)));
  EXPECT_EQ(poll.status, CollectJobStatus::kPending);

  // Once a report arrives the same job completes.
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(task_id(), 1));
  ASSERT_OK(env_->Upload(report));
  ASSERT_THAT(env_->RunAggregation(), IsOkAndHolds(1));
  EXPECT_THAT(env_->leader().ProcessPendingCollectJobs(), IsOkAndHolds(1));
}

TEST_P(LeaderTest, CollectRejectsOverlapWithPendingJob) {
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(task_id(), 1));
  ASSERT_OK(env_->Upload(report));
  ASSERT_THAT(env_->RunAggregation(), IsOkAndHolds(1));

  ASSERT_OK_AND_ASSIGN(std::string first,
                       env_->leader().HandleCollect(
                           CollectRequest(task_id(), CurrentWindow())));
  EXPECT_THAT(env_->leader().HandleCollect(CollectRequest(
                  task_id(), Interval(TruncatedNow() - 3600, 7200))),
              IsAbort(AbortKind::kBatchOverlap));
  // A disjoint window is still accepted.
  ASSERT_OK_AND_ASSIGN(std::string second,
                       env_->leader().HandleCollect(CollectRequest(
                           task_id(), Interval(TruncatedNow() - 3600, 3600))));

  // The first job completes; the disjoint one waits for reports.
  EXPECT_THAT(env_->leader().ProcessPendingCollectJobs(), IsOkAndHolds(1));
  ASSERT_OK_AND_ASSIGN(CollectJobPoll poll,
                       env_->leader().HandleCollectPoll(PollRequest(first)));
  EXPECT_EQ(poll.status, CollectJobStatus::kDone);
  ASSERT_OK_AND_ASSIGN(poll,
                       env_->leader().HandleCollectPoll(PollRequest(second)));
  EXPECT_EQ(poll.status, CollectJobStatus::kPending);
}

TEST_P(LeaderTest, CompletedJobsAreKeptWithoutRetention) {
  ASSERT_OK_AND_ASSIGN(Report report, env_->GenerateReport(task_id(), 1));
  ASSERT_OK(env_->Upload(report));
  ASSERT_THAT(env_->RunAggregation(), IsOkAndHolds(1));
  ASSERT_OK_AND_ASSIGN(std::string uri,
                       env_->leader().HandleCollect(
                           CollectRequest(task_id(), CurrentWindow())));
  ASSERT_THAT(env_->leader().ProcessPendingCollectJobs(), IsOkAndHolds(1));

  env_->clock().AdvanceTime(absl::Hours(24 * 365));
  EXPECT_THAT(env_->leader().EvictCompletedCollectJobs(), IsOkAndHolds(0));
  ASSERT_OK_AND_ASSIGN(CollectJobPoll poll,
                       env_->leader().HandleCollectPoll(PollRequest(uri)));
  EXPECT_EQ(poll.status, CollectJobStatus::kDone);
}

INSTANTIATE_TEST_SUITE_P(Versions, LeaderTest,
                         ::testing::Values(DAP_VERSION_DRAFT02,
                                           DAP_VERSION_DRAFT03));

// A Leader whose Helper is a mock.
class LeaderWithMockHelperTest : public ::testing::Test {
 protected:
  static constexpr uint64_t kRetention = 60;

  void SetUp() override {
    ASSERT_OK_AND_ASSIGN(env_, DapTestEnv::Create(DAP_VERSION_DRAFT02));
    AggregatorConfig config = env_->leader_config();
    config.mutable_global()->set_collect_job_retention(kRetention);
    ASSERT_OK(RegisterTasks(config, storage_.tasks()));
    ASSERT_OK_AND_ASSIGN(hpke::HpkeReceiverConfigList receivers,
                         LoadHpkeReceivers(config));
    leader_ = std::make_unique<Leader>(std::move(config), std::move(receivers),
                                       storage_.storage(), &helper_,
                                       &env_->clock());
  }

  absl::StatusOr<Report> GenerateReport(uint64_t measurement) {
    return ProduceReport(task_id(), env_->task(task_id()),
                         {leader_->hpke_config(), env_->helper().hpke_config()},
                         env_->now(), measurement);
  }

  absl::StatusOr<uint64_t> Aggregate(std::vector<Report> reports) {
    PartialBatchSelector part_batch_sel;
    part_batch_sel.set_query_type(TIME_INTERVAL);
    return leader_->RunAggregationJob(task_id(), part_batch_sel,
                                      std::move(reports));
  }

  const std::string& task_id() const { return env_->time_interval_task_id(); }

  std::unique_ptr<DapTestEnv> env_;
  InMemoryStorage storage_;
  ::testing::StrictMock<MockHelperTransport> helper_;
  std::unique_ptr<Leader> leader_;
};

TEST_F(LeaderWithMockHelperTest, SkipsHelperWhenNoReportSurvives) {
  ASSERT_OK_AND_ASSIGN(Report report, GenerateReport(1));
  ASSERT_OK(storage_.reports()
                .TryMarkProcessed(task_id(), report.metadata().id())
                .status());
  EXPECT_THAT(Aggregate({report}), IsOkAndHolds(0));
}

TEST_F(LeaderWithMockHelperTest, DropsReportsUndecryptableByLeader) {
  ASSERT_OK_AND_ASSIGN(Report report, GenerateReport(1));
  (*report.mutable_encrypted_input_shares(0)->mutable_payload())[0] ^= 0xff;
  EXPECT_THAT(Aggregate({report}), IsOkAndHolds(0));
}

TEST_F(LeaderWithMockHelperTest, SendsAuthenticatedRequestsToHelper) {
  ASSERT_OK_AND_ASSIGN(Report report, GenerateReport(1));
  DapRequest init;
  DapRequest cont;
  EXPECT_CALL(helper_, PostAggregate(_))
      .WillOnce(Invoke([&](const DapRequest& req) {
        init = req;
        AggregateInitializeReq init_req;
        EXPECT_TRUE(init_req.ParseFromString(req.payload));
        AggregateResp resp;
        for (const ReportShare& share : init_req.report_shares()) {
          Transition* transition = resp.add_transitions();
          transition->set_report_id(share.metadata().id());
          transition->set_failed(HPKE_DECRYPT_ERROR);
        }
        return absl::StatusOr<DapResponse>(DapResponse{
            std::string(kMediaTypeAggregateResp), resp.SerializeAsString()});
      }))
      .WillOnce(Invoke([&](const DapRequest& req) {
        cont = req;
        return absl::StatusOr<DapResponse>(
            DapResponse{std::string(kMediaTypeAggregateResp), ""});
      }));

  EXPECT_THAT(Aggregate({report}), IsOkAndHolds(0));
  EXPECT_EQ(init.url, absl::StrCat(DapTestEnv::kHelperUrl, "aggregate"));
  EXPECT_EQ(init.media_type, kMediaTypeAggregateInitReq);
  EXPECT_EQ(init.version, DAP_VERSION_DRAFT02);
  ASSERT_TRUE(init.sender_auth.has_value());
  EXPECT_EQ(init.sender_auth->value(), DapTestEnv::kLeaderToken);
  EXPECT_EQ(cont.media_type, kMediaTypeAggregateContReq);
  AggregateContinueReq cont_req;
  ASSERT_TRUE(cont_req.ParseFromString(cont.payload));
  EXPECT_THAT(cont_req.transitions(), IsEmpty());
}

TEST_F(LeaderWithMockHelperTest, PropagatesHelperAbort) {
  ASSERT_OK_AND_ASSIGN(Report report, GenerateReport(1));
  EXPECT_CALL(helper_, PostAggregate(_))
      .WillOnce(Return(Abort(AbortKind::kUnrecognizedTask)));
  EXPECT_THAT(Aggregate({report}), IsAbort(AbortKind::kUnrecognizedTask));
  // The Helper never saw the report, so it is not in the replay set.
  EXPECT_THAT(storage_.reports().IsProcessed(task_id(), report.metadata().id()),
              IsOkAndHolds(false));
}

TEST_F(LeaderWithMockHelperTest, MarksReportsProcessedOnCommit) {
  ON_CALL(helper_, PostAggregate(_))
      .WillByDefault(Invoke([&](const DapRequest& req) {
        return env_->helper().HandleAggregate(req);
      }));
  EXPECT_CALL(helper_, PostAggregate(_)).Times(2);
  ASSERT_OK_AND_ASSIGN(Report report, GenerateReport(1));
  ASSERT_OK_AND_ASSIGN(Report rejected, GenerateReport(1));
  (*rejected.mutable_encrypted_input_shares(1)->mutable_payload())[0] ^= 0xff;

  // The duplicate is dropped before the Helper sees it.
  EXPECT_THAT(Aggregate({report, report, rejected}), IsOkAndHolds(1));
  EXPECT_THAT(storage_.reports().IsProcessed(task_id(), report.metadata().id()),
              IsOkAndHolds(true));
  EXPECT_THAT(
      storage_.reports().IsProcessed(task_id(), rejected.metadata().id()),
      IsOkAndHolds(false));
}

TEST_F(LeaderWithMockHelperTest, RejectsMalformedHelperResponse) {
  ASSERT_OK_AND_ASSIGN(Report report, GenerateReport(1));
  EXPECT_CALL(helper_, PostAggregate(_))
      .WillOnce(Return(DapResponse{"text/plain", ""}));
  EXPECT_THAT(Aggregate({report}), IsAbort(AbortKind::kUnrecognizedMessage));
}

TEST_F(LeaderWithMockHelperTest, FailedCollectJobStaysPending) {
  ON_CALL(helper_, PostAggregate(_))
      .WillByDefault(Invoke([&](const DapRequest& req) {
        return env_->helper().HandleAggregate(req);
      }));
  EXPECT_CALL(helper_, PostAggregate(_)).Times(2);
  ASSERT_OK_AND_ASSIGN(Report report, GenerateReport(1));
  ASSERT_THAT(Aggregate({report}), IsOkAndHolds(1));

  CollectReq collect_req;
  collect_req.set_task_id(task_id());
  *collect_req.mutable_query() =
      QueryForCurrentBatchWindow(env_->task(task_id()), env_->now());
  ASSERT_OK(leader_
                ->HandleCollect(env_->CollectorRequest(
                    task_id(), kMediaTypeCollectReq,
                    collect_req.SerializeAsString()))
                .status());

  EXPECT_CALL(helper_, PostAggregateShare(_))
      .WillOnce(Return(absl::UnavailableError("helper down")))
      .WillOnce(Invoke([&](const DapRequest& req) {
        return env_->helper().HandleAggregateShare(req);
      }));
  EXPECT_THAT(leader_->ProcessPendingCollectJobs(), IsOkAndHolds(0));
  EXPECT_THAT(leader_->GetPendingCollectJobs(), IsOkAndHolds(SizeIs(1)));
  EXPECT_THAT(leader_->ProcessPendingCollectJobs(), IsOkAndHolds(1));
  EXPECT_THAT(leader_->GetPendingCollectJobs(), IsOkAndHolds(IsEmpty()));
}

TEST_F(LeaderWithMockHelperTest, HelperBatchOverlapFailsCollectJob) {
  ON_CALL(helper_, PostAggregate(_))
      .WillByDefault(Invoke([&](const DapRequest& req) {
        return env_->helper().HandleAggregate(req);
      }));
  EXPECT_CALL(helper_, PostAggregate(_)).Times(2);
  ASSERT_OK_AND_ASSIGN(Report report, GenerateReport(1));
  ASSERT_THAT(Aggregate({report}), IsOkAndHolds(1));

  CollectReq collect_req;
  collect_req.set_task_id(task_id());
  *collect_req.mutable_query() =
      QueryForCurrentBatchWindow(env_->task(task_id()), env_->now());
  ASSERT_OK(leader_
                ->HandleCollect(env_->CollectorRequest(
                    task_id(), kMediaTypeCollectReq,
                    collect_req.SerializeAsString()))
                .status());
  ASSERT_OK_AND_ASSIGN(std::vector<CollectJob> pending,
                       leader_->GetPendingCollectJobs());
  ASSERT_THAT(pending, SizeIs(1));

  // Driven once, then never retried.
  EXPECT_CALL(helper_, PostAggregateShare(_))
      .WillOnce(Return(Abort(AbortKind::kBatchOverlap, "already collected")));
  EXPECT_THAT(leader_->ProcessPendingCollectJobs(), IsOkAndHolds(0));
  EXPECT_THAT(leader_->GetPendingCollectJobs(), IsOkAndHolds(IsEmpty()));
  EXPECT_THAT(leader_->ProcessPendingCollectJobs(), IsOkAndHolds(0));

  absl::Status polled =
      leader_->PollCollectJob(task_id(), pending[0].collect_id()).status();
  EXPECT_THAT(polled, IsAbort(AbortKind::kBatchOverlap));
  EXPECT_EQ(polled.message(), "already collected");

  // Failed jobs are evicted like completed ones.
  env_->clock().AdvanceTime(absl::Seconds(kRetention + 1));
  EXPECT_THAT(leader_->EvictCompletedCollectJobs(), IsOkAndHolds(1));
}

TEST_F(LeaderWithMockHelperTest, FailCollectJobNeedsAnAbort) {
  EXPECT_THAT(leader_->FailCollectJob(task_id(), GenerateId(),
                                      absl::InternalError("disk on fire")),
              IsCode(INVALID_ARGUMENT));
}

TEST_F(LeaderWithMockHelperTest, EvictsCompletedJobsAfterRetention) {
  CollectReq collect_req;
  collect_req.set_task_id(task_id());
  *collect_req.mutable_query() =
      QueryForCurrentBatchWindow(env_->task(task_id()), env_->now());
  ASSERT_OK(leader_
                ->HandleCollect(env_->CollectorRequest(
                    task_id(), kMediaTypeCollectReq,
                    collect_req.SerializeAsString()))
                .status());
  ASSERT_OK_AND_ASSIGN(std::vector<CollectJob> pending,
                       leader_->GetPendingCollectJobs());
  ASSERT_THAT(pending, SizeIs(1));
  ASSERT_OK(leader_->FinishCollectJob(task_id(), pending[0].collect_id(),
                                      CollectResp()));

  env_->clock().AdvanceTime(absl::Seconds(kRetention));
  EXPECT_THAT(leader_->EvictCompletedCollectJobs(), IsOkAndHolds(0));
  env_->clock().AdvanceTime(absl::Seconds(1));
  EXPECT_THAT(leader_->EvictCompletedCollectJobs(), IsOkAndHolds(1));
  ASSERT_OK_AND_ASSIGN(
      CollectJobPoll poll,
      leader_->PollCollectJob(task_id(), pending[0].collect_id()));
  EXPECT_EQ(poll.status, CollectJobStatus::kUnknown);
}

}  // namespace
}  // namespace aggregator
}  // namespace dap
