#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "control_flow.h"
#include "interpreter_limits.h"

// Turns normalized script lines into control-flow nodes. Every parse_* call starts at the
// header line and reports the index of the line holding the closing keyword.
class ControlFlowParser {
   public:
    explicit ControlFlowParser(const InterpreterLimits& limits);

    control_flow::Parsed<control_flow::IfStatement> parse_if(const control_flow::Lines& lines,
                                                             std::size_t start) const;
    control_flow::Parsed<control_flow::WhileLoop> parse_while(const control_flow::Lines& lines,
                                                              std::size_t start) const;
    control_flow::Parsed<control_flow::ForLoop> parse_for(const control_flow::Lines& lines,
                                                          std::size_t start) const;
    control_flow::Parsed<control_flow::CStyleForLoop> parse_c_style_for(
        const control_flow::Lines& lines, std::size_t start) const;
    control_flow::Parsed<control_flow::SelectMenu> parse_select(const control_flow::Lines& lines,
                                                                std::size_t start) const;
    control_flow::Parsed<control_flow::CaseStatement> parse_case(const control_flow::Lines& lines,
                                                                 std::size_t start) const;

    // Parses whichever construct starts at `start` and returns its end index.
    std::size_t parse_statement(const control_flow::Lines& lines, std::size_t start) const;

    // Recognises `;;&`, `;&` and `;;` at the end of a clause line, longest first. On a match
    // `body` receives the line without the terminator.
    static std::optional<control_flow::CaseTerminator> detect_terminator(const std::string& line,
                                                                         std::string& body);

    const InterpreterLimits& limits() const {
        return limits_;
    }

   private:
    // Collects a loop body up to its `done`, storing any redirection that follows `done`.
    std::size_t collect_do_body(const control_flow::Lines& lines, std::size_t from,
                                control_flow::Lines& body, std::string& redirection,
                                const char* construct) const;
    void append_body_line(control_flow::Lines& body, const std::string& line) const;

    InterpreterLimits limits_;
};
