#include <gtest/gtest.h>
#include <pyjudge/utils.h>
#include <pyjudge/submission.h>

#include "utils.h"

namespace {

Problem AddProblem() {
  Problem problem;
  problem.entry_point = "add";
  problem.reference_source = "def add(a, b):\n    return a + b\n";
  problem.test_cases = {{1, 2}, {3, 4}, {10, -5}};
  return problem;
}

} // namespace

TEST(ComposeVerdict, Terminals) {
  EXPECT_EQ(ComposeVerdict(Completed({Case(0, 3, 3), Case(1, 7, 7)})), Verdict::AC);
  EXPECT_EQ(ComposeVerdict(Completed({})), Verdict::AC);
  EXPECT_EQ(ComposeVerdict(Completed({Case(0, 3, 3), Case(1, 7, 8)})), Verdict::WA);
  EXPECT_EQ(ComposeVerdict(TimedOut(100)), Verdict::TLE);
  EXPECT_EQ(ComposeVerdict(Faulted(0, "ValueError: x")), Verdict::RF);
}

TEST(Problem, FromJson) {
  Problem problem = Problem::FromJson({
    {"functionName", "solve"},
    {"solutionFunction", "def solve(x):\n    return x\n"},
    {"inputs", "[[1], [\"a\"]]"},
  });
  EXPECT_EQ(problem.entry_point, "solve");
  ASSERT_EQ(problem.test_cases.size(), 2);
  EXPECT_EQ(problem.test_cases[1], nlohmann::json::array({"a"}));

  problem = Problem::FromJson({
    {"functionName", "solve"},
    {"solutionFunction", ""},
    {"inputs", {{1, 2}}},
  });
  EXPECT_EQ(problem.test_cases.size(), 1);
}

TEST(Problem, Malformed) {
  EXPECT_THROW(Problem::FromJson(nlohmann::json::array()), ProblemError);
  EXPECT_THROW(Problem::FromJson({{"solutionFunction", ""}}), ProblemError);
  EXPECT_THROW(Problem::FromJson({{"functionName", "f"}}), ProblemError);
  EXPECT_THROW(Problem::FromJson({{"functionName", "1f"}, {"solutionFunction", ""}}), ProblemError);
  EXPECT_THROW(Problem::FromJson({{"functionName", "f"}, {"solutionFunction", ""}, {"inputs", "[1"}}),
               ProblemError);
  EXPECT_THROW(Problem::FromJson({{"functionName", "f"}, {"solutionFunction", ""}, {"inputs", "[1, 2]"}}),
               ProblemError);
}

TEST(Judge, RejectsInvalidConfig) {
  auto sandbox = std::make_unique<FakeSandbox>(std::vector<ExecutionOutcome>{});
  EXPECT_THROW(Judge judge(JudgeConfig(), std::move(sandbox)), ConfigError);
}

TEST(GradeSubmission, BuildsOneStoppingJob) {
  auto sandbox = std::make_unique<FakeSandbox>(std::vector<ExecutionOutcome>{
      Completed({Case(0, 3, 3), Case(1, 7, 7), Case(2, 5, 5)}, 12)});
  FakeSandbox* fake = sandbox.get();
  Judge judge(TestConfig(700, 4), std::move(sandbox));
  GradeResult res = judge.GradeSubmission(AddProblem(), "def add(a, b): return b + a");

  ASSERT_EQ(fake->calls, 1);
  ASSERT_EQ(fake->jobs.size(), 1);
  const SandboxJob& job = fake->jobs[0];
  EXPECT_EQ(job.entry_point, "add");
  EXPECT_EQ(job.candidate_source, "def add(a, b): return b + a");
  EXPECT_EQ(job.cases.size(), 3);
  EXPECT_TRUE(job.stop_on_mismatch);
  EXPECT_TRUE(job.clear_logs_per_case);
  EXPECT_EQ(job.max_log_entries, 4);
  EXPECT_EQ(job.time_limit_ms, 700);

  EXPECT_EQ(res.verdict, Verdict::AC);
  nlohmann::json out = res.ToJson();
  EXPECT_EQ(out["success"], true);
  EXPECT_EQ(out["verdict"], "AC");
  EXPECT_EQ(out["status"], "Accepted");
  EXPECT_TRUE(out["failed"].is_null());
  EXPECT_EQ(out["time"], 12);
  EXPECT_EQ(out["limitExceeded"], false);
}

TEST(GradeSubmission, FirstMismatch) {
  Judge judge(TestConfig(), std::make_unique<FakeSandbox>(std::vector<ExecutionOutcome>{
      Completed({Case(0, 3, 3), Case(1, 7, -1)})}));
  GradeResult res = judge.GradeSubmission(AddProblem(), "");
  EXPECT_EQ(res.verdict, Verdict::WA);
  ASSERT_TRUE(res.failed);
  nlohmann::json failed = res.ToJson()["failed"];
  EXPECT_EQ(failed["testCase"], 2);
  EXPECT_EQ(failed["input"], nlohmann::json({3, 4}));
  EXPECT_EQ(failed["expected"], 7);
  EXPECT_EQ(failed["received"], -1);
  EXPECT_EQ(res.ToJson()["success"], false);
}

TEST(GradeSubmission, Timeout) {
  Judge judge(TestConfig(300), std::make_unique<FakeSandbox>(std::vector<ExecutionOutcome>{TimedOut(300)}));
  GradeResult res = judge.GradeSubmission(AddProblem(), "");
  EXPECT_EQ(res.verdict, Verdict::TLE);
  EXPECT_TRUE(res.limit_exceeded);
  EXPECT_EQ(res.time_ms, 301);
  EXPECT_FALSE(res.failed);
}

TEST(GradeSubmission, Fault) {
  Judge judge(TestConfig(), std::make_unique<FakeSandbox>(std::vector<ExecutionOutcome>{
      Faulted(1, "ZeroDivisionError: division by zero", "Traceback")}));
  GradeResult res = judge.GradeSubmission(AddProblem(), "");
  EXPECT_EQ(res.verdict, Verdict::RF);
  EXPECT_FALSE(res.failed);
  EXPECT_EQ(res.error_case, 2);
  EXPECT_EQ(res.error, "ZeroDivisionError: division by zero \n Traceback");
  EXPECT_EQ(res.ToJson()["status"], "Runtime Fault");

  Judge judge2(TestConfig(), std::make_unique<FakeSandbox>(std::vector<ExecutionOutcome>{
      Faulted(-1, "SyntaxError: invalid syntax")}));
  res = judge2.GradeSubmission(AddProblem(), "def");
  EXPECT_EQ(res.error_case, 0);
  EXPECT_EQ(res.error, "SyntaxError: invalid syntax");
}

TEST(GradeEachCase, OneJobPerCase) {
  ExecutionOutcome fault = Faulted(0, "ValueError: bad");
  auto sandbox = std::make_unique<FakeSandbox>(std::vector<ExecutionOutcome>{
      Completed({Case(0, 3, 3)}, 4), fault, TimedOut(2000)});
  FakeSandbox* fake = sandbox.get();
  Judge judge(TestConfig(), std::move(sandbox));
  std::vector<nlohmann::json> cases = {{1, 2}, {0, 0}, {5, 5}};
  std::vector<CaseReport> reports = judge.GradeEachCase(AddProblem(), "", cases);

  ASSERT_EQ(fake->calls, 1);
  ASSERT_EQ(fake->jobs.size(), 3);
  for (size_t i = 0; i < 3; i++) {
    ASSERT_EQ(fake->jobs[i].cases.size(), 1);
    EXPECT_EQ(fake->jobs[i].cases[0], cases[i]);
    EXPECT_FALSE(fake->jobs[i].stop_on_mismatch);
    EXPECT_FALSE(fake->jobs[i].clear_logs_per_case);
  }

  nlohmann::json out = CaseReportsToJson(reports);
  EXPECT_EQ(out["results"][0], 3);
  EXPECT_EQ(out["expecteds"][0], 3);
  EXPECT_EQ(out["errors"][0], "");
  EXPECT_EQ(out["errors"][1], "ValueError: bad");
  EXPECT_EQ(out["errors"][2], "");
  EXPECT_EQ(out["limitExceeded"], nlohmann::json({false, false, true}));
  EXPECT_EQ(out["times"][2], 2001);
  EXPECT_EQ(out["logs"].size(), 3);
}

TEST(GradeEachCase, RejectsNonListCase) {
  Judge judge(TestConfig(), std::make_unique<FakeSandbox>(std::vector<ExecutionOutcome>{}));
  EXPECT_THROW(judge.GradeEachCase(AddProblem(), "", {nlohmann::json(1)}), ProblemError);
}

TEST(Verdict, Names) {
  EXPECT_STREQ(VerdictToAbr(Verdict::TLE), "TLE");
  EXPECT_STREQ(VerdictToDesc(Verdict::WA), "Wrong Answer");
  EXPECT_EQ(AbrToVerdict("RF"), Verdict::RF);
  EXPECT_EQ(AbrToVerdict("CE"), Verdict::NUL);
  EXPECT_STREQ(TerminalName(Terminal::TIMED_OUT), "TIMED_OUT");
}
