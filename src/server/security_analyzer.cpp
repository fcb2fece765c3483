#include "src/server/security_analyzer.h"
#include "src/server/logger.h"

#include <exception>
#include <utility>

#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace execgate {

namespace {

const char* const kDefaultImports[] = {
    "os", "sys", "subprocess", "shutil", "socket", "urllib", "urllib2", "urllib3",
    "requests", "http", "ftplib", "smtplib", "telnetlib", "pathlib", "glob", "tempfile",
    "shlex", "pickle", "marshal", "shelve", "dbm", "sqlite3", "ctypes", "multiprocessing",
    "threading", "asyncio", "concurrent", "importlib", "__builtin__", "builtins", "imp",
    "pkgutil", "modulefinder",
};

const char* const kDefaultFunctions[] = {
    "eval", "exec", "compile", "__import__", "open", "file", "input", "raw_input",
    "execfile", "reload", "getattr", "setattr", "delattr", "hasattr", "callable", "vars",
    "dir", "globals", "locals", "help", "copyright", "credits", "license", "quit", "exit",
};

const char* const kDefaultAttributes[] = {
    "__class__", "__bases__", "__subclasses__", "__mro__", "__globals__", "__dict__",
    "__code__", "__func__", "__self__", "__module__", "__qualname__", "__annotations__",
    "__closure__", "__defaults__", "__kwdefaults__",
};

std::string TopLevelModule(const std::string& dotted) {
    return dotted.substr(0, dotted.find('.'));
}

// Node classes of the `ast` module the walk distinguishes. `Match` and
// `TryStar` are looked up only when the interpreter has them.
struct AstTypes {
    explicit AstTypes(const py::module_& ast)
        : import_stmt(ast.attr("Import")),
          import_from(ast.attr("ImportFrom")),
          call(ast.attr("Call")),
          attribute(ast.attr("Attribute")),
          name(ast.attr("Name")),
          function_def(py::make_tuple(ast.attr("FunctionDef"), ast.attr("AsyncFunctionDef"))),
          class_def(ast.attr("ClassDef")) {
        py::list branching;
        for (const char* kind : {"If", "While", "For", "AsyncFor", "Try", "TryStar",
                                 "With", "AsyncWith", "Match"}) {
            if (py::hasattr(ast, kind)) branching.append(ast.attr(kind));
        }
        branch = py::tuple(branching);
    }

    py::object import_stmt;
    py::object import_from;
    py::object call;
    py::object attribute;
    py::object name;
    py::object function_def;
    py::object class_def;
    py::object branch;
};

std::string SyntaxErrorText(const py::error_already_set& e) {
    const py::object& error = e.value();
    std::string text = "Syntax error: ";
    if (!e.matches(PyExc_SyntaxError)) {
        // RecursionError or MemoryError from nesting past the parser's limits.
        text += py::str(e.type().attr("__name__")).cast<std::string>();
        std::string message = py::str(error).cast<std::string>();
        if (!message.empty()) text += ": " + message;
        return text;
    }
    py::object msg = error.attr("msg");
    text += msg.is_none() ? std::string("invalid syntax") : py::str(msg).cast<std::string>();
    py::object lineno = error.attr("lineno");
    if (!lineno.is_none()) text += " (line " + py::str(lineno).cast<std::string>() + ")";
    return text;
}

} // namespace

Denylist::Denylist() {
    for (const char* name : kDefaultImports) imports_.insert(name);
    for (const char* name : kDefaultFunctions) functions_.insert(name);
    for (const char* name : kDefaultAttributes) attributes_.insert(name);
}

bool Denylist::IsDenylisted(Category category, const std::string& name) const {
    const auto& names = SetFor(category);
    return names.find(name) != names.end();
}

void Denylist::Add(Category category, const std::string& name) {
    if (!name.empty()) SetFor(category).insert(name);
}

std::unordered_set<std::string>& Denylist::SetFor(Category category) {
    switch (category) {
        case Category::kImport: return imports_;
        case Category::kFunction: return functions_;
        case Category::kAttribute: break;
    }
    return attributes_;
}

const std::unordered_set<std::string>& Denylist::SetFor(Category category) const {
    switch (category) {
        case Category::kImport: return imports_;
        case Category::kFunction: return functions_;
        case Category::kAttribute: break;
    }
    return attributes_;
}

SecurityAnalyzer::SecurityAnalyzer(Denylist denylist) : denylist_(std::move(denylist)) {}

namespace {

void Visit(const py::handle& node, const AstTypes& types, const Denylist& denylist,
           AnalysisReport& report) {
    using Category = Denylist::Category;

    if (py::isinstance(node, types.import_stmt)) {
        for (const py::handle alias : node.attr("names")) {
            std::string top = TopLevelModule(alias.attr("name").cast<std::string>());
            report.imports.insert(top);
            if (denylist.IsDenylisted(Category::kImport, top)) {
                report.issues.push_back("Dangerous import detected: " + top);
            }
        }
    } else if (py::isinstance(node, types.import_from)) {
        // `from . import x` has no module.
        py::object module = node.attr("module");
        if (module.is_none()) return;
        std::string top = TopLevelModule(module.cast<std::string>());
        report.imports.insert(top);
        if (denylist.IsDenylisted(Category::kImport, top)) {
            report.issues.push_back("Dangerous import detected: " + top);
        }
        for (const py::handle alias : node.attr("names")) {
            std::string name = alias.attr("name").cast<std::string>();
            if (denylist.IsDenylisted(Category::kFunction, name)) {
                report.issues.push_back("Dangerous function import: " + name + " from " + top);
            }
        }
    } else if (py::isinstance(node, types.call)) {
        py::object callee = node.attr("func");
        std::string name;
        if (py::isinstance(callee, types.name)) {
            name = callee.attr("id").cast<std::string>();
        } else if (py::isinstance(callee, types.attribute)) {
            name = callee.attr("attr").cast<std::string>();
        }
        if (name.empty()) return;
        report.calls.insert(name);
        if (denylist.IsDenylisted(Category::kFunction, name)) {
            report.issues.push_back("Dangerous function call detected: " + name);
        }
    } else if (py::isinstance(node, types.attribute)) {
        std::string attr = node.attr("attr").cast<std::string>();
        report.attributes.insert(attr);
        if (denylist.IsDenylisted(Category::kAttribute, attr)) {
            report.issues.push_back("Dangerous attribute access detected: " + attr);
        }
    } else if (py::isinstance(node, types.name)) {
        std::string id = node.attr("id").cast<std::string>();
        if (denylist.IsDenylisted(Category::kFunction, id)) {
            report.issues.push_back("Dangerous name access detected: " + id);
        }
    } else if (py::isinstance(node, types.branch)) {
        report.complexity_score += 1;
    } else if (py::isinstance(node, types.function_def)) {
        report.complexity_score += 2;
    } else if (py::isinstance(node, types.class_def)) {
        report.complexity_score += 3;
    }
}

AnalysisReport Rejected(const std::string& issue) {
    AnalysisReport report;
    report.safe = false;
    report.issues.push_back(issue);
    return report;
}

} // namespace

AnalysisReport SecurityAnalyzer::Analyze(const std::string& source) const {
    if (!Py_IsInitialized()) {
        Logger::Error("Analyzer called without an initialized Python runtime");
        return Rejected("Syntax error: unable to parse source");
    }

    py::gil_scoped_acquire gil;
    AnalysisReport report;
    try {
        py::module_ ast = py::module_::import("ast");
        AstTypes types(ast);

        // Bytes, so that coding declarations and invalid UTF-8 are handled
        // the way the interpreter handles a source file.
        py::object tree;
        try {
            tree = ast.attr("parse")(py::bytes(source));
        } catch (const py::error_already_set& e) {
            return Rejected(SyntaxErrorText(e));
        }

        // ast.walk is breadth-first; issues come out in level order.
        for (const py::handle node : ast.attr("walk")(tree)) {
            Visit(node, types, denylist_, report);
        }
    } catch (const std::exception& e) {
        Logger::Error("Analyzer failed on submission: ", e.what());
        return Rejected("Syntax error: unable to parse source");
    }

    report.safe = report.issues.empty();
    if (!report.safe) {
        Logger::Debug("Analyzer flagged ", report.issues.size(), " issue(s)");
    }
    return report;
}

} // namespace execgate
