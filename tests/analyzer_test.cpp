#include <algorithm>
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <pybind11/embed.h>

#include "src/server/security_analyzer.h"
#include "tests/test_harness.h"

using execgate::AnalysisReport;
using execgate::Denylist;
using execgate::SecurityAnalyzer;
using execgate_test::contains;
using execgate_test::expect;
using execgate_test::run_test;

namespace py = pybind11;

namespace {

bool IsSyntaxError(const AnalysisReport& report) {
    return !report.safe && report.issues.size() == 1 && contains(report.issues[0], "Syntax error: ");
}

bool HasIssue(const AnalysisReport& report, const std::string& issue) {
    return std::find(report.issues.begin(), report.issues.end(), issue) != report.issues.end();
}

const char kBroadProgram[] = R"PY(import math
from collections import defaultdict as dd, Counter

@staticmethod
def helper(a, b=2, *args, key=None, **kwargs) -> int:
    """Docstring."""
    total = a + b * 2 ** 3 // 4 % 5
    total += sum(x for x in args if x > 0)
    values = [i * i for i in range(10) if i % 2 == 0]
    mapping = {k: v for k, v in kwargs.items()}
    unique = {1, 2, 3}
    first, *rest = values or [0]
    label = f"total={total:>8} first={first!r} {mapping.get('a', 0)}"
    while total > 100:
        total -= 1
    else:
        pass
    try:
        value = values[1:3][::-1]
    except (IndexError, KeyError) as exc:
        raise ValueError("bad") from exc
    finally:
        del unique
    with ctx() as handle, other():
        pass
    lam = lambda y, z=1: y if y else z
    return (yield total) if key else not total

class Shape(object, metaclass=type):
    sides: int = 0
    async def area(self):
        async with lock:
            await self.compute()
        async for item in stream():
            print(item)

match command:
    case [x, *others]:
        pass
    case {"k": v} if v > 1:
        pass
    case Point(x=0) | None:
        pass
    case _:
        pass

if __name__ == "__main__":
    print(helper(1), math.pi)
)PY";

void test_hello_world_is_safe() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("print('Hello, World!')");
    expect(report.safe, "hello world must be safe");
    expect(report.issues.empty(), "hello world has no issues");
    expect(report.calls.count("print") == 1, "print call is discovered");
}

void test_dangerous_import() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("import os");
    expect(!report.safe, "import os is unsafe");
    expect(HasIssue(report, "Dangerous import detected: os"), "import os issue text");
    expect(report.imports.count("os") == 1, "os recorded as import");

    report = analyzer.Analyze("import os.path as p\nimport json");
    expect(HasIssue(report, "Dangerous import detected: os"), "dotted import checks the top-level module");
    expect(report.issues.size() == 1, "json is allowed");
}

void test_from_import_forms() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("from subprocess import run");
    expect(HasIssue(report, "Dangerous import detected: subprocess"), "from-import of a denylisted module");

    report = analyzer.Analyze("from builtins import open");
    expect(HasIssue(report, "Dangerous import detected: builtins"), "builtins module flagged");
    expect(HasIssue(report, "Dangerous function import: open from builtins"), "imported function flagged");

    report = analyzer.Analyze("from . import helpers\nfrom math import (sqrt,\n    floor,)");
    expect(report.safe, "relative and parenthesized imports of safe names pass");
}

void test_call_and_name_issues_in_level_order() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("eval('1 + 1')");
    expect(!report.safe, "eval is unsafe");
    expect(report.issues.size() == 2, "call and name are both reported");
    expect(report.issues[0] == "Dangerous function call detected: eval", "call issue comes first");
    expect(report.issues[1] == "Dangerous name access detected: eval", "name issue comes second");
}

void test_aliasing_is_caught() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("f = getattr\nf(object, 'x')");
    expect(!report.safe, "aliasing a denylisted builtin is unsafe");
    expect(HasIssue(report, "Dangerous name access detected: getattr"), "bare name reference flagged");
}

void test_attribute_escape_chain() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("().__class__.__bases__[0].__subclasses__()");
    expect(HasIssue(report, "Dangerous attribute access detected: __class__"), "__class__ flagged");
    expect(HasIssue(report, "Dangerous attribute access detected: __bases__"), "__bases__ flagged");
    expect(HasIssue(report, "Dangerous attribute access detected: __subclasses__"), "__subclasses__ flagged");
    expect(report.calls.count("__subclasses__") == 1, "dotted callee recorded by its final attribute");
}

void test_method_call_named_like_builtin() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("handle.open()");
    expect(HasIssue(report, "Dangerous function call detected: open"), "final attribute of a callee is checked");
}

void test_fstring_fields_are_analyzed() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("x = f\"value: {eval('2')}\"");
    expect(HasIssue(report, "Dangerous function call detected: eval"), "call hidden in an f-string is found");

    report = analyzer.Analyze("name = 'a'\nprint(f\"{name!r:>10} {{literal}} {name=}\")");
    expect(report.safe, "conversion, format spec, escapes and debug marker parse");
}

void test_syntax_errors() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("x = = 1");
    expect(!report.safe, "syntax error is unsafe");
    expect(report.issues.size() == 1, "single syntax issue");
    expect(report.issues[0] == "Syntax error: invalid syntax (line 1)", "syntax error text carries the line");

    report = analyzer.Analyze("print('unterminated");
    expect(contains(report.issues[0], "unterminated string literal"), "tokenizer error text");
    expect(contains(report.issues[0], "(line 1)"), "tokenizer error carries the line");

    report = analyzer.Analyze("if True:\nprint(1)");
    expect(contains(report.issues[0], "expected an indented block"), "missing block reported");

    report = analyzer.Analyze("values = (1, 2");
    expect(contains(report.issues[0], "was never closed"), "unclosed bracket reported");

    report = analyzer.Analyze("try:\n    pass\nx = 1");
    expect(report.issues[0] == "Syntax error: expected 'except' or 'finally' block (line 3)",
           "bare try reported at the following statement");

    report = analyzer.Analyze("def f():\n    return 1\n  x = 2");
    expect(contains(report.issues[0], "unindent does not match"), "inconsistent dedent reported");
}

void test_broad_grammar_parses() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze(kBroadProgram);
    if (!report.safe) {
        for (const auto& issue : report.issues) std::cerr << "  issue: " << issue << "\n";
    }
    expect(report.safe, "broad program is safe");
    expect(report.imports.count("math") == 1 && report.imports.count("collections") == 1, "imports recorded");
    // def x2, while, try, with, class x3, async def x2, async with, async for, match, if
    expect(report.complexity_score == 14, "complexity of broad program");
}

void test_complexity_weights() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze(
        "def f(x):\n"
        "    if x:\n"
        "        return 1\n"
        "    elif x is None:\n"
        "        return 2\n"
        "    for i in range(3):\n"
        "        pass\n"
        "class A:\n"
        "    pass\n");
    expect(report.safe, "complexity sample is safe");
    expect(report.complexity_score == 8, "def 2 + if 1 + elif 1 + for 1 + class 3");
}

void test_soft_keywords_as_names() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("match = 5\ntype = 'x'\nprint(match, type)");
    expect(report.safe, "match and type remain usable as names");
    expect(report.complexity_score == 0, "no match statement counted");
}

void test_denylist_extension() {
    Denylist denylist;
    expect(!denylist.IsDenylisted(Denylist::Category::kImport, "math"), "math allowed by default");
    denylist.Add(Denylist::Category::kImport, "math");
    denylist.Add(Denylist::Category::kFunction, "print");
    expect(denylist.IsDenylisted(Denylist::Category::kImport, "math"), "math added");
    expect(!denylist.IsDenylisted(Denylist::Category::kAttribute, "math"), "categories are independent");

    SecurityAnalyzer analyzer(denylist);
    AnalysisReport report = analyzer.Analyze("import math\nprint(math.pi)");
    expect(HasIssue(report, "Dangerous import detected: math"), "extended import list applies");
    expect(HasIssue(report, "Dangerous function call detected: print"), "extended function list applies");
}

void test_obfuscation_is_not_detected() {
    // Names built at runtime are outside what a structural check can see.
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("name = 'o' + 's'\nprint(name)");
    expect(report.safe, "string-built names pass the structural check");
}

void test_deep_nesting_is_rejected_not_fatal() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("x = " + std::string(3000, '-') + "1\n");
    expect(IsSyntaxError(report), "deep unary chain is reported as a parse failure");

    report = analyzer.Analyze("x = " + std::string(3000, '(') + "1" + std::string(3000, ')') + "\n");
    expect(IsSyntaxError(report), "deep parentheses are reported as a parse failure");
    expect(contains(report.issues[0], "too many nested parentheses"), "nesting limit named");

    report = analyzer.Analyze("x = " + std::string(24000, '-') + "1\n");
    expect(IsSyntaxError(report), "longer chains fail the same way");

    report = analyzer.Analyze("x = " + std::string(50, '-') + "1\n");
    expect(report.safe, "moderate nesting still parses");
}

void test_undecodable_source_is_a_syntax_error() {
    SecurityAnalyzer analyzer;
    AnalysisReport report = analyzer.Analyze("print('\xff')\n");
    expect(IsSyntaxError(report), "invalid UTF-8 is rejected");

    report = analyzer.Analyze(std::string("print(1)\0\n", 10));
    expect(IsSyntaxError(report), "embedded NUL is rejected");

    report = analyzer.Analyze("# -*- coding: latin-1 -*-\nprint('\xe9')\n");
    expect(report.safe, "coding declaration is honoured");
}

// The accepted grammar is exactly the one the linked interpreter compiles.
void test_grammar_matches_interpreter() {
    const char* samples[] = {
        "type X = eval\n",
        "print(f\"{\"a\"}\")\n",
        "def f[T](x): return x\n",
        "match point:\n    case (0, y):\n        pass\n",
        "print 'py2'\n",
        "x = 1 if y\n",
        "async def g():\n    return [i async for i in aiter()]\n",
        "with (open_a() as a, open_b() as b):\n    pass\n",
    };

    SecurityAnalyzer analyzer;
    py::gil_scoped_acquire gil;
    py::object compile = py::module_::import("builtins").attr("compile");
    py::object only_ast = py::module_::import("ast").attr("PyCF_ONLY_AST");
    for (const char* sample : samples) {
        bool compiles = true;
        try {
            compile(py::bytes(sample), "<sample>", "exec", only_ast);
        } catch (const py::error_already_set&) {
            compiles = false;
        }
        AnalysisReport report = analyzer.Analyze(sample);
        bool rejected = report.issues.size() == 1 && contains(report.issues[0], "Syntax error: ");
        expect(rejected == !compiles, std::string("analyzer and interpreter agree on: ") + sample);
    }
}

void test_concurrent_analysis() {
    SecurityAnalyzer analyzer;
    std::atomic<int> flagged{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&analyzer, &flagged]() {
            for (int i = 0; i < 50; ++i) {
                AnalysisReport report = analyzer.Analyze("import os\nprint(os.getcwd())\n");
                if (HasIssue(report, "Dangerous import detected: os")) flagged++;
            }
        });
    }
    for (auto& worker : workers) worker.join();
    expect(flagged == 200, "every concurrent analysis sees the import");
}

} // namespace

int main() {
    py::scoped_interpreter python(false);
    py::gil_scoped_release released;

    std::cout << "=== Security Analyzer Tests ===\n";
    run_test("hello world is safe", test_hello_world_is_safe);
    run_test("dangerous import", test_dangerous_import);
    run_test("from-import forms", test_from_import_forms);
    run_test("call and name issues in level order", test_call_and_name_issues_in_level_order);
    run_test("aliasing is caught", test_aliasing_is_caught);
    run_test("attribute escape chain", test_attribute_escape_chain);
    run_test("method call named like builtin", test_method_call_named_like_builtin);
    run_test("f-string fields are analyzed", test_fstring_fields_are_analyzed);
    run_test("syntax errors", test_syntax_errors);
    run_test("broad grammar parses", test_broad_grammar_parses);
    run_test("complexity weights", test_complexity_weights);
    run_test("soft keywords as names", test_soft_keywords_as_names);
    run_test("denylist extension", test_denylist_extension);
    run_test("obfuscation is not detected", test_obfuscation_is_not_detected);
    run_test("deep nesting is rejected, not fatal", test_deep_nesting_is_rejected_not_fatal);
    run_test("undecodable source is a syntax error", test_undecodable_source_is_a_syntax_error);
    run_test("grammar matches interpreter", test_grammar_matches_interpreter);
    run_test("concurrent analysis", test_concurrent_analysis);
    return execgate_test::finish();
}
