// Source diagnostics shared by every parse stage
#pragma once
#include <deque>
#include <string>
#include <string_view>
#include <vector>
#include "cook/span.hpp"

namespace cook {

enum class Severity { Error, Warning };

struct Label { Span span; std::string text; };

struct Diagnostic {
    Severity severity = Severity::Error;
    std::string code;
    std::string message;
    std::vector<Label> labels;       // first label is the primary location
    std::vector<std::string> hints;
    std::vector<std::string> notes;  // secondary facts, e.g. suggestions

    Diagnostic& label(Span s, std::string text = {}){ labels.push_back(Label{s, std::move(text)}); return *this; }
    Diagnostic& hint(std::string h){ hints.push_back(std::move(h)); return *this; }
    Diagnostic& note(std::string n){ notes.push_back(std::move(n)); return *this; }

    bool is_error() const { return severity == Severity::Error; }
    Span primary_span() const { return labels.empty() ? Span{} : labels.front().span; }
};

inline Diagnostic make_error(std::string code, std::string message, Span at, std::string label_text = {}){
    Diagnostic d; d.severity = Severity::Error; d.code = std::move(code); d.message = std::move(message);
    d.label(at, std::move(label_text)); return d;
}
inline Diagnostic make_warning(std::string code, std::string message, Span at, std::string label_text = {}){
    Diagnostic d = make_error(std::move(code), std::move(message), at, std::move(label_text));
    d.severity = Severity::Warning; return d;
}

// Event queue written by one parse invocation, read once it finishes.
using DiagnosticQueue = std::deque<Diagnostic>;

struct DiagnosticReport {
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;

    void push(Diagnostic d){ if(d.is_error()) errors.push_back(std::move(d)); else warnings.push_back(std::move(d)); }
    bool has_errors() const { return !errors.empty(); }
    bool empty() const { return errors.empty() && warnings.empty(); }
    // Drains the queue keeping the emission order inside each severity.
    static DiagnosticReport from_queue(DiagnosticQueue& q);
};

// 1-based line and column (in bytes) of `offset` in `src`.
struct LineCol { int line = 1; int col = 1; };
LineCol line_col(std::string_view src, size_t offset);

// "3:14: error[E0101]: message" followed by hint/note lines.
std::string format_diagnostic(const Diagnostic& d, std::string_view src);

// "did you mean" helpers
int edit_distance(const std::string& a, const std::string& b);
std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist=2);
void append_suggestions(Diagnostic& d, const std::vector<std::string>& suggs, bool enabled = true);

} // namespace cook
