#include "gtest/gtest.h"
#include "sandbox/grader.hpp"
#include "test/sandbox_env.hpp"

using namespace std;
using namespace sandbox;

class GraderTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        pipeline = new runner(test_config());
    }

    static void TearDownTestCase() {
        delete pipeline;
        pipeline = nullptr;
    }

    static runner *pipeline;

    static test_case make_case(const string &name, const string &input, const string &expected, bool hidden = false) {
        test_case tc;
        tc.name = name;
        tc.input = input;
        tc.expected_output = expected;
        tc.hidden = hidden;
        return tc;
    }
};

runner *GraderTest::pipeline = nullptr;

TEST_F(GraderTest, ComparisonIgnoresTrailingWhitespace) {
    EXPECT_TRUE(outputs_match("1 2\n3\n", "1 2   \n3\n\n\n"));
    EXPECT_TRUE(outputs_match("a\r\nb", "a\nb\n"));
    EXPECT_FALSE(outputs_match("1 2\n", "1  2\n"));
    EXPECT_FALSE(outputs_match("a\n\nb\n", "a\nb\n"));
    EXPECT_EQ(normalize_output("x \t\ny\n\n"), "x\ny");
}

TEST_F(GraderTest, GradesEachCase) {
    grader g(*pipeline);
    vector<test_case> cases = {
        make_case("small", "2 3\n", "5\n"),
        make_case("large", "100 200\n", "300\n"),
        make_case("wrong", "1 1\n", "3\n"),
    };
    grading_report report = g.grade(make_request("a, b = map(int, input().split())\nprint(a + b)\n"), cases);

    ASSERT_EQ(report.results.size(), 3);
    EXPECT_EQ(report.total_count, 3);
    EXPECT_EQ(report.passed_count, 2);
    EXPECT_NEAR(report.score, 200.0 / 3, 1e-9);
    EXPECT_TRUE(report.results[0].passed);
    EXPECT_TRUE(report.results[1].passed);
    EXPECT_FALSE(report.results[2].passed);
    EXPECT_EQ(report.results[2].result.stdout_output, "2\n");
}

TEST_F(GraderTest, RejectedSubmissionFailsEveryCase) {
    grader g(*pipeline);
    vector<test_case> cases = {make_case("one", "", "1\n"), make_case("two", "", "2\n")};
    grading_report report = g.grade(make_request("import subprocess\nprint(1)\n"), cases);

    EXPECT_EQ(report.passed_count, 0);
    EXPECT_DOUBLE_EQ(report.score, 0);
    for (auto &res : report.results) {
        EXPECT_FALSE(res.passed);
        EXPECT_EQ(res.result.status, status(outcome::resource_denied{"subprocess"}));
    }
}

TEST_F(GraderTest, RuntimeErrorFailsCase) {
    grader g(*pipeline);
    grading_report report = g.grade(make_request("print(1)\n1/0\n"), {make_case("crash", "", "1\n")});
    ASSERT_EQ(report.results.size(), 1);
    EXPECT_FALSE(report.results[0].passed);
    EXPECT_EQ(report.results[0].result.status, status(outcome::runtime_error{}));
}

TEST_F(GraderTest, HiddenCasesOmitDetails) {
    grader g(*pipeline);
    vector<test_case> cases = {make_case("visible", "", "ok\n"), make_case("secret", "", "ok\n", true)};
    nlohmann::json j = g.grade(make_request("print('ok')"), cases);

    EXPECT_EQ(j["passed_count"], 2);
    EXPECT_EQ(j["score"], 100.0);
    EXPECT_EQ(j["results"][0]["expected_output"], "ok\n");
    EXPECT_EQ(j["results"][0]["actual_output"], "ok\n");
    EXPECT_FALSE(j["results"][1].contains("input"));
    EXPECT_FALSE(j["results"][1].contains("expected_output"));
    EXPECT_FALSE(j["results"][1].contains("actual_output"));
    EXPECT_EQ(j["results"][1]["passed"], true);
}

TEST_F(GraderTest, NoCasesScoresZero) {
    grader g(*pipeline);
    grading_report report = g.grade(make_request("print(1)"), {});
    EXPECT_EQ(report.total_count, 0);
    EXPECT_DOUBLE_EQ(report.score, 0);
}

TEST_F(GraderTest, ParsesTestCases) {
    auto j = nlohmann::json::parse(R"([{"name": "a", "input": "1", "expected_output": "2", "hidden": true}, {"expected_output": "3"}])");
    auto cases = j.get<vector<test_case>>();
    ASSERT_EQ(cases.size(), 2);
    EXPECT_EQ(cases[0].name, "a");
    EXPECT_TRUE(cases[0].hidden);
    EXPECT_EQ(cases[1].name, "Test");
    EXPECT_EQ(cases[1].input, "");
    EXPECT_FALSE(cases[1].hidden);
}
