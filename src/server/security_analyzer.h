#pragma once

#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace execgate {

// Denylisted names, grouped by where they may appear in source.
class Denylist {
public:
    enum class Category {
        kImport,
        kFunction,
        kAttribute
    };

    // Built-in defaults.
    Denylist();

    bool IsDenylisted(Category category, const std::string& name) const;
    void Add(Category category, const std::string& name);

private:
    std::unordered_set<std::string>& SetFor(Category category);
    const std::unordered_set<std::string>& SetFor(Category category) const;

    std::unordered_set<std::string> imports_;
    std::unordered_set<std::string> functions_;
    std::unordered_set<std::string> attributes_;
};

struct AnalysisReport {
    bool safe = true;
    std::vector<std::string> issues;
    std::set<std::string> imports;
    std::set<std::string> calls;
    std::set<std::string> attributes;
    int complexity_score = 0;
};

// Structural check of Python source against a Denylist. Nothing is executed.
// The source is parsed by the embedded CPython's own `ast` module, so the
// accepted grammar is that of the linked interpreter. The interpreter must be
// initialized by the process (pybind11::scoped_interpreter) before Analyze is
// called; Analyze takes the GIL itself and may be called from any thread.
//
// This is a denylist, not a sandbox. It reduces risk but does not remove it:
// names assembled at runtime (string concatenation, bytes decoding, encoded
// payloads) and escape primitives that are not on the list pass unnoticed.
// Execution must still happen in an isolated, resource-limited process.
class SecurityAnalyzer {
public:
    explicit SecurityAnalyzer(Denylist denylist = Denylist());

    // Never throws. A parse failure yields safe=false with a single
    // "Syntax error: ..." issue.
    AnalysisReport Analyze(const std::string& source) const;

    const Denylist& denylist() const { return denylist_; }

private:
    Denylist denylist_;
};

} // namespace execgate
