#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace control_flow {

using Lines = std::vector<std::string>;

struct ElifClause {
    std::string condition;
    Lines body;
};

// `redirection` holds the text after the closing keyword, e.g. `< input` in `done < input`.
struct IfStatement {
    std::string condition;
    Lines then_body;
    std::vector<ElifClause> elif_clauses;
    std::optional<Lines> else_body;
    std::string redirection;
};

struct WhileLoop {
    std::string condition;
    Lines body;
    bool is_until = false;
    std::string redirection;
};

struct ForLoop {
    std::string variable;
    std::vector<std::string> items;
    Lines body;
    std::string redirection;
};

struct CStyleForLoop {
    std::optional<std::string> init;
    std::optional<std::string> condition;
    std::optional<std::string> update;
    Lines body;
    std::string redirection;
};

struct SelectMenu {
    std::string variable;
    std::vector<std::string> items;
    Lines body;
    std::string prompt = "#? ";
    std::string redirection;
};

enum class CaseTerminator : std::uint8_t {
    NORMAL,
    FALLTHROUGH,
    CONTINUE_TESTING
};

struct CaseClause {
    std::vector<std::string> patterns;
    Lines body;
    CaseTerminator terminator = CaseTerminator::NORMAL;
};

struct CaseStatement {
    std::string value;
    std::vector<CaseClause> cases;
    std::string redirection;
};

// A parsed node together with the index of the line holding its closing keyword.
template <typename Node>
struct Parsed {
    Node node;
    std::size_t end_index = 0;
};

enum class SignalKind : std::uint8_t {
    None,
    Break,
    Continue,
    Return
};

struct ControlSignal {
    SignalKind kind = SignalKind::None;
    int levels = 0;
    int code = 0;

    static ControlSignal none() {
        return {};
    }
    static ControlSignal break_levels(int n) {
        return {SignalKind::Break, n < 1 ? 1 : n, 0};
    }
    static ControlSignal continue_levels(int n) {
        return {SignalKind::Continue, n < 1 ? 1 : n, 0};
    }
    static ControlSignal return_code(int exit_code) {
        return {SignalKind::Return, 0, exit_code};
    }

    bool is_none() const {
        return kind == SignalKind::None;
    }
};

struct ExecOutcome {
    int exit_code = 0;
    ControlSignal signal;
};

}  // namespace control_flow
