#include <algorithm>
#include "gtest/gtest.h"
#include "sandbox/validator.hpp"
#include "test/sandbox_env.hpp"

using namespace std;
using namespace sandbox;

class ValidatorTest : public ::testing::Test {
protected:
    validator checker{rule_set::defaults()};

    vector<string> rule_ids(const validation_verdict &verdict) {
        vector<string> ids;
        for (auto &v : verdict.violations) ids.push_back(v.rule_id);
        return ids;
    }
};

TEST_F(ValidatorTest, AllowsPlainCode) {
    auto verdict = checker.validate(R"(
import math
from collections import Counter

def solve(n):
    return sum(i * i for i in range(n))

name = input()
print(solve(10), math.sqrt(16), Counter(name))
)");
    EXPECT_TRUE(verdict.allowed);
    EXPECT_TRUE(verdict.violations.empty());
}

TEST_F(ValidatorTest, AllowsEmptySource) {
    EXPECT_TRUE(checker.validate("").allowed);
}

TEST_F(ValidatorTest, RejectsDenylistedImport) {
    auto verdict = checker.validate("import os\nos.system('ls')\n");
    ASSERT_FALSE(verdict.allowed);
    ASSERT_EQ(verdict.violations.size(), 1);
    EXPECT_EQ(verdict.violations[0].rule_id, "os");
    EXPECT_EQ(verdict.violations[0].line, 1);
    EXPECT_EQ(verdict.violations[0].column, 1);
    EXPECT_EQ(verdict.violations[0].kind, violation_kind::IMPORT);
}

TEST_F(ValidatorTest, MatchesModuleNotAlias) {
    auto verdict = checker.validate("import subprocess as sp\nimport math as os\n");
    EXPECT_EQ(rule_ids(verdict), vector<string>({"subprocess"}));
}

TEST_F(ValidatorTest, MatchesRootOfDottedImport) {
    auto verdict = checker.validate("import os.path\nfrom urllib.request import urlopen\n");
    EXPECT_EQ(rule_ids(verdict), vector<string>({"os", "urllib"}));
}

TEST_F(ValidatorTest, ChecksNamesOfRelativeImport) {
    auto verdict = checker.validate("from . import socket\n");
    EXPECT_EQ(rule_ids(verdict), vector<string>({"socket"}));
}

TEST_F(ValidatorTest, AllowsFutureImport) {
    EXPECT_TRUE(checker.validate("from __future__ import annotations\nprint(1)\n").allowed);
}

TEST_F(ValidatorTest, RejectsDenylistedBuiltinCall) {
    auto verdict = checker.validate("x = 1\nprint(eval('1 + 1'))\n");
    ASSERT_EQ(verdict.violations.size(), 1);
    EXPECT_EQ(verdict.violations[0].rule_id, "eval");
    EXPECT_EQ(verdict.violations[0].line, 2);
    EXPECT_EQ(verdict.violations[0].column, 7);
    EXPECT_EQ(verdict.violations[0].kind, violation_kind::BUILTIN);
}

TEST_F(ValidatorTest, RejectsAliasedBuiltin) {
    auto verdict = checker.validate("f = exec\nf('print(1)')\n");
    EXPECT_EQ(rule_ids(verdict), vector<string>({"exec"}));
}

TEST_F(ValidatorTest, AllowsShadowingAssignment) {
    // 赋值给同名变量不是引用
    EXPECT_TRUE(checker.validate("def run():\n    pass\nrun()\n").allowed);
}

TEST_F(ValidatorTest, RejectsDunderAttributes) {
    auto verdict = checker.validate("x = ().__class__.__bases__[0].__subclasses__()\n");
    auto ids = rule_ids(verdict);
    sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, vector<string>({"__bases__", "__class__", "__subclasses__"}));
}

TEST_F(ValidatorTest, RejectsBuiltinsName) {
    auto verdict = checker.validate("b = __builtins__\n");
    EXPECT_EQ(rule_ids(verdict), vector<string>({"__builtins__"}));
}

TEST_F(ValidatorTest, RejectsBuiltinsReachedThroughBoundMethod) {
    // print.__self__ 就是 builtins 模块
    auto verdict = checker.validate("b = print.__self__; b.exec(\"import os\")\n");
    auto ids = rule_ids(verdict);
    sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, vector<string>({"__self__", "exec"}));

    verdict = checker.validate("print(print.__self__.open('/etc/hostname').read())\n");
    ids = rule_ids(verdict);
    sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, vector<string>({"__self__", "open"}));
}

TEST_F(ValidatorTest, RejectsFrameIntrospection) {
    auto verdict = checker.validate("(x for x in [1]).gi_frame.f_builtins[\"exec\"](\"print(1)\")\n");
    auto ids = rule_ids(verdict);
    sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, vector<string>({"f_builtins", "gi_frame"}));

    verdict = checker.validate(R"(
try:
    1 / 0
except Exception as e:
    g = e.__traceback__.tb_frame.f_back.f_globals
)");
    ids = rule_ids(verdict);
    sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, vector<string>({"f_back", "f_globals", "tb_frame"}));
}

TEST_F(ValidatorTest, RejectsFunctionAndReduceEscapes) {
    auto verdict = checker.validate(R"(
def f():
    pass
a = f.__closure__
b = [].append.__self__
c = (1).__reduce_ex__(2)
d = f.__call__.__func__
)");
    auto ids = rule_ids(verdict);
    sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, vector<string>({"__closure__", "__func__", "__reduce_ex__", "__self__"}));
}

TEST_F(ValidatorTest, RejectsDenylistedBuiltinAsAttribute) {
    auto verdict = checker.validate("import codecs\nx = codecs.open('/etc/passwd').read()\n");
    EXPECT_EQ(rule_ids(verdict), vector<string>({"open"}));
    EXPECT_EQ(verdict.violations[0].kind, violation_kind::BUILTIN);
    EXPECT_EQ(verdict.violations[0].line, 2);
}

TEST_F(ValidatorTest, AllowsRegexCompile) {
    EXPECT_TRUE(checker.validate("import re\np = re.compile('a+')\nprint(p.match('aa'))\n").allowed);
}

TEST_F(ValidatorTest, ReportsAllViolationsSorted) {
    auto verdict = checker.validate(R"(x = open('a')
import socket
import os; import sys
y = eval('1')
)");
    ASSERT_FALSE(verdict.allowed);
    EXPECT_EQ(rule_ids(verdict), vector<string>({"open", "socket", "os", "sys", "eval"}));
    for (size_t i = 1; i < verdict.violations.size(); ++i) {
        auto &a = verdict.violations[i - 1], &b = verdict.violations[i];
        EXPECT_TRUE(make_pair(a.line, a.column) <= make_pair(b.line, b.column));
    }
}

TEST_F(ValidatorTest, ReportsSyntaxError) {
    auto verdict = checker.validate("print('hello'\nx = \n");
    ASSERT_EQ(verdict.violations.size(), 1);
    EXPECT_EQ(verdict.violations[0].rule_id, rules::SYNTAX_ERROR);
    EXPECT_EQ(verdict.violations[0].kind, violation_kind::SYNTAX);
    EXPECT_GE(verdict.violations[0].line, 1);
    EXPECT_GE(verdict.violations[0].column, 1);
}

TEST_F(ValidatorTest, NullByteIsSyntaxError) {
    string source = "print(1)\nx = '";
    source.push_back('\0');
    source += "'\n";
    auto verdict = checker.validate(source);
    ASSERT_EQ(verdict.violations.size(), 1);
    EXPECT_EQ(verdict.violations[0].rule_id, rules::SYNTAX_ERROR);
    EXPECT_GE(verdict.violations[0].line, 1);
}

TEST_F(ValidatorTest, RejectsOversizedSource) {
    rule_set rules = rule_set::defaults();
    rules.max_source_bytes = 16;
    validator small(rules);
    auto verdict = small.validate("print('this source is longer than sixteen bytes')\n");
    ASSERT_EQ(verdict.violations.size(), 1);
    EXPECT_EQ(verdict.violations[0].rule_id, rules::SOURCE_TOO_LARGE);
    EXPECT_TRUE(small.validate("print(1)").allowed);
}

TEST_F(ValidatorTest, AllowlistRejectsUnlistedModules) {
    sandbox_config config = test_config();
    config.allowed_modules = {"math", "collections"};
    validator strict(rule_set::from_config(config));
    EXPECT_TRUE(strict.validate("import math\nfrom collections import deque\n").allowed);
    auto verdict = strict.validate("import json\n");
    EXPECT_EQ(rule_ids(verdict), vector<string>({"json"}));
}

TEST_F(ValidatorTest, ConfigExtendsDenylist) {
    sandbox_config config = test_config();
    config.denylisted_modules = {"random"};
    validator extended(rule_set::from_config(config));
    EXPECT_EQ(rule_ids(extended.validate("import random\nimport os\n")), vector<string>({"random", "os"}));
}

TEST_F(ValidatorTest, DeeplyNestedSourceNeverThrows) {
    string source = "x = " + string(5000, '[') + string(5000, ']') + "\n";
    validation_verdict verdict;
    ASSERT_NO_THROW(verdict = checker.validate(source));
    ASSERT_FALSE(verdict.allowed);
    ASSERT_EQ(verdict.violations.size(), 1);
    EXPECT_TRUE(verdict.violations[0].rule_id == rules::SYNTAX_ERROR ||
                verdict.violations[0].rule_id == rules::INTERNAL_ERROR);
}

TEST_F(ValidatorTest, IsDeterministic) {
    string source = "import os\nimport sys\nprint(eval('1'))\n";
    auto first = checker.validate(source);
    auto second = checker.validate(source);
    EXPECT_EQ(rule_ids(first), rule_ids(second));
}

TEST_F(ValidatorTest, VerdictJsonListsBlockedItems) {
    nlohmann::json j = checker.validate("import os\nexec('1')\n");
    EXPECT_EQ(j["allowed"], false);
    EXPECT_EQ(j["blocked_imports"], nlohmann::json({"os"}));
    EXPECT_EQ(j["blocked_operations"], nlohmann::json({"exec"}));
    EXPECT_EQ(j["violations"].size(), 2);
}
