/**
 * @file python_tokenizer.hpp
 * @brief Lexical analysis of Python source submitted for execution
 *
 * Splits Python source into tokens with line/column positions, tracking
 * indentation (INDENT/DEDENT), implicit line joining inside brackets,
 * backslash continuations, comments, and all string literal forms
 * (prefixes, triple quotes, escapes). Lexical errors are reported as data,
 * never thrown to the caller.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace parsers {

/**
 * @enum TokenType
 * @brief Python token categories
 */
enum class TokenType {
    NAME,        ///< Identifier or keyword
    NUMBER,      ///< Numeric literal
    STRING,      ///< String or bytes literal (any prefix)
    OP,          ///< Operator or delimiter
    NEWLINE,     ///< End of a logical line
    INDENT,      ///< Indentation increase
    DEDENT,      ///< Indentation decrease
    ENDMARKER    ///< End of input
};

/**
 * @brief Token type name for diagnostics
 */
const char* TokenTypeToString(TokenType type);

/**
 * @struct Token
 * @brief A single lexical token
 *
 * Lines are 1-based, columns are 0-based byte offsets from the line start.
 */
struct Token {
    TokenType type{TokenType::OP};   ///< Token category
    std::string text;                ///< Source text (full literal for STRING)
    int line{1};                     ///< Line of the first character
    int column{0};                   ///< Column of the first character
    std::string prefix;              ///< STRING: lowercase prefix ("", "f", "rb", ...)
    std::string value;               ///< STRING: literal body without prefix and quotes

    bool Is(TokenType t, const char* s) const { return type == t && text == s; }
    bool IsOp(const char* s) const { return Is(TokenType::OP, s); }
    bool IsName(const char* s) const { return Is(TokenType::NAME, s); }
};

/**
 * @struct SyntaxIssue
 * @brief Position and message of the first lexical or syntax error
 */
struct SyntaxIssue {
    std::string message;
    int line{1};
    int column{0};
};

/**
 * @struct TokenizeResult
 * @brief Tokens produced up to the first error (if any)
 */
struct TokenizeResult {
    std::vector<Token> tokens;
    std::optional<SyntaxIssue> error;

    bool Ok() const { return !error.has_value(); }
};

/**
 * @class PythonTokenizer
 * @brief Converts Python source text into a token stream
 *
 * **Usage Example**:
 * @code
 * auto result = PythonTokenizer::Tokenize("x = [1,\n 2]\n");
 * if (!result.Ok()) {
 *     spdlog::warn("line {}: {}", result.error->line, result.error->message);
 * }
 * @endcode
 */
class PythonTokenizer {
public:
    /**
     * @brief Tokenize a complete module
     *
     * Line endings are normalized (CRLF and CR become LF) before scanning.
     * Stops at the first error; the returned tokens cover the input up to it.
     *
     * @param source Python source code
     * @return Tokens terminated by ENDMARKER, or an error
     */
    static TokenizeResult Tokenize(const std::string& source);

    /**
     * @brief Tokenize a single expression (used for f-string replacement fields)
     *
     * Newlines are treated as whitespace and no INDENT/DEDENT tokens are
     * produced. Positions are reported relative to `line`/`column`.
     */
    static TokenizeResult TokenizeExpression(const std::string& expression,
                                             int line, int column);

    /**
     * @brief Extract the replacement-field expressions of an f-string body
     *
     * `{{` and `}}` escapes are skipped; format specs and conversions
     * (`!r`, `:>10`) are stripped from each field.
     *
     * @param body STRING token value of an f-string
     * @return Expression texts in order of appearance
     */
    static std::vector<std::string> ExtractFStringFields(const std::string& body);

    /**
     * @brief Check whether a name is a reserved Python keyword
     */
    static bool IsKeyword(const std::string& name);
};

} // namespace parsers
} // namespace codebox
