/**
 * @file python_parser.hpp
 * @brief Statement-level syntax tree for Python source
 *
 * Groups the token stream into logical statements with nested blocks and
 * parses import statements into structured records. The tree is shallow by
 * design of its consumer: expressions stay as token ranges, which is what
 * the code validator walks. Structural syntax errors (missing ':', missing
 * or unexpected indentation, malformed imports, adjacent operands) are
 * detected here.
 *
 * @date 2025
 */

#pragma once

#include "codebox/parsers/python_tokenizer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace parsers {

/**
 * @enum StatementKind
 * @brief Category of a logical statement
 */
enum class StatementKind {
    SIMPLE,        ///< Expression, assignment, return, ...
    IMPORT,        ///< import a.b as c
    IMPORT_FROM,   ///< from a.b import c
    COMPOUND       ///< if/for/while/def/class/with/try/... header with a body
};

/**
 * @struct ImportedName
 * @brief One name bound by an import statement
 */
struct ImportedName {
    std::string name;     ///< Dotted module (import) or member name (from-import), "*" for star
    std::string alias;    ///< `as` alias, empty if none
    int line{1};
    int column{0};
};

/**
 * @struct ImportStatement
 * @brief Parsed import or from-import
 */
struct ImportStatement {
    bool is_from{false};               ///< from-import
    int relative_level{0};             ///< Number of leading dots (from-import only)
    std::string module;                ///< Source module (from-import only, may be empty if relative)
    std::vector<ImportedName> names;   ///< Bound names
};

/**
 * @struct Statement
 * @brief Logical statement node
 *
 * `first_token`/`end_token` delimit the statement's own tokens in the
 * module's token vector: the whole statement for simple ones, the header
 * through ':' for compound ones. Nested statements live in `body`.
 */
struct Statement {
    StatementKind kind{StatementKind::SIMPLE};
    std::string keyword;                    ///< Leading keyword of compound statements
    std::size_t first_token{0};             ///< Index of first token
    std::size_t end_token{0};               ///< One past the last token
    int line{1};
    int column{0};
    std::optional<ImportStatement> import;  ///< Set for IMPORT / IMPORT_FROM
    std::vector<Statement> body;            ///< Block of a compound statement
};

/**
 * @struct Module
 * @brief Parsed module: tokens plus top-level statements
 */
struct Module {
    std::vector<Token> tokens;
    std::vector<Statement> statements;
};

/**
 * @struct ParseResult
 * @brief Module tree or the first syntax error
 *
 * On error `module.tokens` still holds every token produced before the
 * failure point, so token-level checks can run on partial input.
 */
struct ParseResult {
    Module module;
    std::optional<SyntaxIssue> error;

    bool Ok() const { return !error.has_value(); }
};

/**
 * @class PythonParser
 * @brief Builds a statement tree from Python source
 *
 * **Usage Example**:
 * @code
 * auto parsed = PythonParser::Parse(code);
 * if (parsed.Ok()) {
 *     for (const auto& stmt : parsed.module.statements) {
 *         if (stmt.import) { ... }
 *     }
 * }
 * @endcode
 */
class PythonParser {
public:
    /**
     * @brief Tokenize and parse a module
     * @param source Python source code
     * @return Parse tree or error; never throws on malformed input
     */
    static ParseResult Parse(const std::string& source);

    /**
     * @brief Keywords that introduce a compound statement
     */
    static bool IsCompoundKeyword(const std::string& name);
};

} // namespace parsers
} // namespace codebox
