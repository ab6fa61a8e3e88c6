#include <gtest/gtest.h>
#include <pyjudge/utils.h>

#include "example_problem.h"

namespace {

struct SubParam {
  int sub_id;
  Verdict verdict;
  std::string code;
};

std::string ParamName(const ::testing::TestParamInfo<SubParam>& info) {
  std::string ret = std::string("verdict_") + VerdictToAbr(info.param.verdict);
  if (info.param.sub_id > 0) ret += "_" + std::to_string(info.param.sub_id);
  return ret;
}

} // namespace

class ExampleProblemVerdict : public ExampleProblem, public testing::WithParamInterface<SubParam> {};
TEST_P(ExampleProblemVerdict, Ver) {
  auto& param = GetParam();
  SetUp(500);
  GradeResult res = judge->GradeSubmission(problem, param.code);
  EXPECT_EQ(res.verdict, param.verdict) << res.ToJson().dump();
  nlohmann::json out = res.ToJson();
  EXPECT_EQ(out["success"], param.verdict == Verdict::AC);
  EXPECT_EQ(out["limitExceeded"], param.verdict == Verdict::TLE);
  if (param.verdict == Verdict::TLE) EXPECT_EQ(out["time"], 501);
  if (param.verdict != Verdict::WA) EXPECT_TRUE(out["failed"].is_null());
  EXPECT_EQ(out["error"].get<std::string>().empty(), param.verdict != Verdict::RF);
}
INSTANTIATE_TEST_SUITE_P(OneSubmission, ExampleProblemVerdict,
    testing::Values(
      (SubParam){0, Verdict::AC, "def add(a, b):\n    return a + b\n"},
      (SubParam){1, Verdict::AC, "import functools, operator\n"
                                 "def add(*args):\n    return functools.reduce(operator.add, args)\n"},
      (SubParam){0, Verdict::WA, "def add(a, b):\n    return 0\n"},
      (SubParam){1, Verdict::WA, "def add(a, b):\n    return str(a + b)\n"},
      (SubParam){0, Verdict::TLE, "def add(a, b):\n    while True:\n        pass\n"},
      (SubParam){0, Verdict::RF, "def add(a, b):\n    raise ValueError('nope')\n"},
      (SubParam){1, Verdict::RF, "def add(a, b)\n    return a + b\n"},
      (SubParam){2, Verdict::RF, "import subprocess\ndef add(a, b):\n    return a + b\n"},
      (SubParam){3, Verdict::RF, "def add(a, b):\n    return add(a, b)\n"}
    ),
    ParamName);

TEST_F(ExampleProblem, FirstFailedCase) {
  GradeResult res = judge->GradeSubmission(problem, "def add(a, b):\n    return 0\n");
  nlohmann::json failed = res.ToJson()["failed"];
  EXPECT_EQ(failed["testCase"], 1);
  EXPECT_EQ(failed["input"], nlohmann::json({1, 2}));
  EXPECT_EQ(failed["expected"], 3);
  EXPECT_EQ(failed["received"], 0);
  // nothing after the first divergence is evaluated
  EXPECT_EQ(res.cases.size(), 1);
}

TEST_F(ExampleProblem, LaterFailedCase) {
  GradeResult res = judge->GradeSubmission(problem,
      "def add(a, b):\n    return a - b if a == 10 else a + b\n");
  EXPECT_EQ(res.verdict, Verdict::WA);
  ASSERT_TRUE(res.failed);
  EXPECT_EQ(res.failed->test_case, 3);
  EXPECT_EQ(res.failed->expected, 5);
  EXPECT_EQ(res.failed->received, 15);
  EXPECT_EQ(res.cases.size(), 3);
}

TEST_F(ExampleProblem, FaultCase) {
  GradeResult res = judge->GradeSubmission(problem,
      "def add(a, b):\n    if a == 3:\n        raise KeyError('x')\n    return a + b\n");
  EXPECT_EQ(res.verdict, Verdict::RF);
  EXPECT_EQ(res.error_case, 2);
  EXPECT_EQ(res.error.rfind("KeyError", 0), 0) << res.error;
}

TEST_F(ExampleProblem, LogsOfLastEvaluatedCase) {
  SetUp(2000, 2);
  GradeResult res = judge->GradeSubmission(problem,
      "def add(a, b):\n    print(a)\n    print(b)\n    print(a + b)\n    return a + b\n");
  EXPECT_EQ(res.verdict, Verdict::AC);
  EXPECT_EQ(res.logs, (std::vector<std::string>{"10", "-5"}));
}
