/**
 * @file python_tokenizer.cpp
 * @brief Implementation of the Python tokenizer
 *
 * Single forward pass over the source. Indentation is measured only at the
 * start of a logical line outside brackets (tabs advance to the next multiple
 * of 8), blank and comment-only lines produce no tokens, and newlines inside
 * brackets are whitespace.
 *
 * **Recognized string prefixes**: r, u, f, b, br, rb, fr, rf (any case)
 *
 * @date 2025
 */

#include "codebox/parsers/python_tokenizer.hpp"

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <cstring>
#include <set>
#include <stdexcept>
#include <utility>

namespace codebox {
namespace parsers {

namespace {

class LexError : public std::runtime_error {
public:
    LexError(const std::string& message, int line, int column)
        : std::runtime_error(message), line_(line), column_(column) {}

    int Line() const { return line_; }
    int Column() const { return column_; }

private:
    int line_;
    int column_;
};

const std::set<std::string>& Keywords() {
    static const std::set<std::string> keywords{
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield"
    };
    return keywords;
}

const std::set<std::string>& StringPrefixes() {
    static const std::set<std::string> prefixes{
        "r", "u", "f", "b", "br", "rb", "fr", "rf"
    };
    return prefixes;
}

const char* const kThreeCharOps[] = {"**=", "//=", ">>=", "<<=", "..."};

const char* const kTwoCharOps[] = {
    "**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", "+=", "-=", "*=",
    "/=", "%=", "&=", "|=", "^=", "@=", ":="
};

constexpr const char* kOneCharOps = "+-*/%@&|^~<>()[]{},:;.=";

bool IsIdentifierStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool IsIdentifierChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::string ToLowerAscii(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

std::string NormalizeLineEndings(const std::string& source) {
    std::string normalized;
    normalized.reserve(source.size());
    for (std::size_t i = 0; i < source.size(); ++i) {
        if (source[i] == '\r') {
            normalized += '\n';
            if (i + 1 < source.size() && source[i + 1] == '\n') {
                ++i;
            }
        } else {
            normalized += source[i];
        }
    }
    return normalized;
}

char ClosingFor(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default: return '}';
    }
}

struct Bracket {
    char symbol;
    int line;
    int column;
};

// ============================================================================
// LEXER
// ============================================================================

class Lexer {
public:
    Lexer(std::string source, bool expression_mode, int base_line, int base_column)
        : src_(std::move(source)),
          expression_mode_(expression_mode),
          line_(base_line),
          base_line_(base_line),
          base_column_(base_column) {}

    void Run() {
        while (!AtEnd()) {
            if (at_line_start_ && brackets_.empty() && !expression_mode_) {
                HandleIndentation();
                if (AtEnd()) {
                    break;
                }
            }

            const char c = Peek();
            if (c == ' ' || c == '\t' || c == '\f') {
                ++pos_;
            } else if (c == '#') {
                while (!AtEnd() && Peek() != '\n') {
                    ++pos_;
                }
            } else if (c == '\n') {
                HandleNewline();
            } else if (c == '\\') {
                HandleContinuation();
            } else if (c == '"' || c == '\'') {
                ScanString("", pos_, line_, Column());
            } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                       (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
                ScanNumber();
            } else if (IsIdentifierStart(static_cast<unsigned char>(c))) {
                ScanName();
            } else {
                ScanOperator();
            }
        }
        Finish();
    }

    std::vector<Token>& Tokens() { return tokens_; }

private:
    char Peek(std::size_t offset = 0) const {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    bool AtEnd() const { return pos_ >= src_.size(); }

    int Column() const {
        const int column = static_cast<int>(pos_ - line_start_);
        return line_ == base_line_ ? column + base_column_ : column;
    }

    void Emit(Token token) {
        if (token.type != TokenType::NEWLINE && token.type != TokenType::INDENT &&
            token.type != TokenType::DEDENT) {
            line_has_tokens_ = true;
        }
        tokens_.push_back(std::move(token));
    }

    void Emit(TokenType type, std::string text, int line, int column) {
        Token token;
        token.type = type;
        token.text = std::move(text);
        token.line = line;
        token.column = column;
        Emit(std::move(token));
    }

    void StartNewLine() {
        ++line_;
        line_start_ = pos_;
    }

    void HandleIndentation() {
        int indent = 0;
        while (!AtEnd()) {
            const char c = Peek();
            if (c == ' ') {
                ++indent;
            } else if (c == '\t') {
                indent = (indent / 8 + 1) * 8;
            } else if (c == '\f') {
                indent = 0;
            } else {
                break;
            }
            ++pos_;
        }
        at_line_start_ = false;

        // Blank and comment-only lines do not affect indentation
        if (AtEnd() || Peek() == '#' || Peek() == '\n') {
            return;
        }

        if (indent > indents_.back()) {
            indents_.push_back(indent);
            Emit(TokenType::INDENT, "", line_, 0);
            return;
        }
        while (indent < indents_.back()) {
            indents_.pop_back();
            Emit(TokenType::DEDENT, "", line_, Column());
        }
        if (indent != indents_.back()) {
            throw LexError("unindent does not match any outer indentation level",
                           line_, Column());
        }
    }

    void HandleNewline() {
        if (brackets_.empty() && !expression_mode_) {
            if (line_has_tokens_) {
                Emit(TokenType::NEWLINE, "\n", line_, Column());
                line_has_tokens_ = false;
            }
            at_line_start_ = true;
        }
        ++pos_;
        StartNewLine();
    }

    void HandleContinuation() {
        if (Peek(1) != '\n') {
            throw LexError("unexpected character after line continuation character",
                           line_, Column());
        }
        pos_ += 2;
        StartNewLine();
    }

    void ScanName() {
        const std::size_t start = pos_;
        const int line = line_;
        const int column = Column();
        while (!AtEnd() && IsIdentifierChar(static_cast<unsigned char>(Peek()))) {
            ++pos_;
        }
        std::string text = src_.substr(start, pos_ - start);

        if ((Peek() == '"' || Peek() == '\'') &&
            StringPrefixes().count(ToLowerAscii(text)) > 0) {
            ScanString(ToLowerAscii(text), start, line, column);
            return;
        }
        Emit(TokenType::NAME, std::move(text), line, column);
    }

    void ScanNumber() {
        const std::size_t start = pos_;
        const int column = Column();
        const bool hex = Peek() == '0' && (Peek(1) == 'x' || Peek(1) == 'X');
        while (!AtEnd()) {
            const char c = Peek();
            const char prev = pos_ > start ? src_[pos_ - 1] : '\0';
            if (IsIdentifierChar(static_cast<unsigned char>(c)) || c == '.') {
                ++pos_;
            } else if ((c == '+' || c == '-') && (prev == 'e' || prev == 'E') && !hex) {
                ++pos_;
            } else {
                break;
            }
        }
        Emit(TokenType::NUMBER, src_.substr(start, pos_ - start), line_, column);
    }

    void ScanString(const std::string& prefix, std::size_t start, int line, int column) {
        const char quote = Peek();
        const bool triple = Peek(1) == quote && Peek(2) == quote;
        pos_ += triple ? 3 : 1;
        const std::size_t body_start = pos_;
        std::size_t body_end = body_start;

        while (true) {
            if (AtEnd()) {
                if (triple) {
                    throw LexError(fmt::format("unterminated triple-quoted string literal "
                                               "(detected at line {})", line_),
                                   line, column);
                }
                throw LexError(fmt::format("unterminated string literal (detected at line {})",
                                           line_),
                               line, column);
            }
            const char c = Peek();
            if (c == '\\') {
                ++pos_;
                if (!AtEnd()) {
                    if (Peek() == '\n') {
                        ++pos_;
                        StartNewLine();
                    } else {
                        ++pos_;
                    }
                }
                continue;
            }
            if (c == '\n') {
                if (!triple) {
                    throw LexError(fmt::format("unterminated string literal (detected at line {})",
                                               line_),
                                   line, column);
                }
                ++pos_;
                StartNewLine();
                continue;
            }
            if (c == quote) {
                if (!triple) {
                    body_end = pos_;
                    ++pos_;
                    break;
                }
                if (Peek(1) == quote && Peek(2) == quote) {
                    body_end = pos_;
                    pos_ += 3;
                    break;
                }
            }
            ++pos_;
        }

        Token token;
        token.type = TokenType::STRING;
        token.text = src_.substr(start, pos_ - start);
        token.line = line;
        token.column = column;
        token.prefix = prefix;
        token.value = src_.substr(body_start, body_end - body_start);
        Emit(std::move(token));
    }

    void ScanOperator() {
        const int column = Column();
        for (const char* op : kThreeCharOps) {
            if (src_.compare(pos_, 3, op) == 0) {
                pos_ += 3;
                Emit(TokenType::OP, op, line_, column);
                return;
            }
        }
        for (const char* op : kTwoCharOps) {
            if (src_.compare(pos_, 2, op) == 0) {
                pos_ += 2;
                Emit(TokenType::OP, op, line_, column);
                return;
            }
        }

        const char c = Peek();
        if (std::strchr(kOneCharOps, c) == nullptr) {
            if (c == '!') {
                throw LexError("invalid syntax", line_, column);
            }
            throw LexError(fmt::format("invalid character '{}' (0x{:02x})",
                                       std::isprint(static_cast<unsigned char>(c)) ? c : '?',
                                       static_cast<unsigned char>(c)),
                           line_, column);
        }

        if (c == '(' || c == '[' || c == '{') {
            brackets_.push_back(Bracket{c, line_, column});
        } else if (c == ')' || c == ']' || c == '}') {
            if (brackets_.empty()) {
                throw LexError(fmt::format("unmatched '{}'", c), line_, column);
            }
            const Bracket open = brackets_.back();
            if (ClosingFor(open.symbol) != c) {
                throw LexError(fmt::format("closing parenthesis '{}' does not match "
                                           "opening parenthesis '{}' on line {}",
                                           c, open.symbol, open.line),
                               line_, column);
            }
            brackets_.pop_back();
        }

        ++pos_;
        Emit(TokenType::OP, std::string(1, c), line_, column);
    }

    void Finish() {
        if (!brackets_.empty()) {
            const Bracket& open = brackets_.back();
            throw LexError(fmt::format("'{}' was never closed", open.symbol),
                           open.line, open.column);
        }
        if (!expression_mode_) {
            if (line_has_tokens_) {
                Emit(TokenType::NEWLINE, "", line_, Column());
            }
            while (indents_.size() > 1) {
                indents_.pop_back();
                Emit(TokenType::DEDENT, "", line_, 0);
            }
        }
        Emit(TokenType::ENDMARKER, "", line_, Column());
    }

    std::string src_;
    bool expression_mode_;
    std::size_t pos_{0};
    std::size_t line_start_{0};
    int line_;
    int base_line_;
    int base_column_;
    bool at_line_start_{true};
    bool line_has_tokens_{false};
    std::vector<int> indents_{0};
    std::vector<Bracket> brackets_;
    std::vector<Token> tokens_;
};

TokenizeResult RunLexer(Lexer& lexer) {
    TokenizeResult result;
    try {
        lexer.Run();
    } catch (const LexError& e) {
        result.error = SyntaxIssue{e.what(), e.Line(), e.Column()};
    }
    result.tokens = std::move(lexer.Tokens());
    return result;
}

// Position of the first top-level '!' conversion or ':' format spec, npos if none
std::size_t FindFieldSpecStart(const std::string& field) {
    int depth = 0;
    char in_quote = '\0';
    for (std::size_t i = 0; i < field.size(); ++i) {
        const char c = field[i];
        const char next = i + 1 < field.size() ? field[i + 1] : '\0';
        if (in_quote != '\0') {
            if (c == in_quote) in_quote = '\0';
            continue;
        }
        if (c == '\'' || c == '"') {
            in_quote = c;
        } else if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            --depth;
        } else if (depth == 0 && c == '!' && next != '=') {
            return i;
        } else if (depth == 0 && c == ':' && next != '=') {
            return i;
        }
    }
    return std::string::npos;
}

} // anonymous namespace

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

const char* TokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::NAME: return "NAME";
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::STRING: return "STRING";
        case TokenType::OP: return "OP";
        case TokenType::NEWLINE: return "NEWLINE";
        case TokenType::INDENT: return "INDENT";
        case TokenType::DEDENT: return "DEDENT";
        case TokenType::ENDMARKER: return "ENDMARKER";
    }
    return "UNKNOWN";
}

TokenizeResult PythonTokenizer::Tokenize(const std::string& source) {
    const auto nul = source.find('\0');
    if (nul != std::string::npos) {
        TokenizeResult result;
        int line = 1;
        for (std::size_t i = 0; i < nul; ++i) {
            if (source[i] == '\n') ++line;
        }
        result.error = SyntaxIssue{"source code cannot contain null bytes", line, 0};
        return result;
    }

    Lexer lexer(NormalizeLineEndings(source), false, 1, 0);
    return RunLexer(lexer);
}

TokenizeResult PythonTokenizer::TokenizeExpression(const std::string& expression,
                                                   int line, int column) {
    Lexer lexer(NormalizeLineEndings(expression), true, line, column);
    return RunLexer(lexer);
}

std::vector<std::string> PythonTokenizer::ExtractFStringFields(const std::string& body) {
    std::vector<std::string> fields;
    std::size_t i = 0;

    while (i < body.size()) {
        if (body[i] != '{') {
            ++i;
            continue;
        }
        if (i + 1 < body.size() && body[i + 1] == '{') {
            i += 2;
            continue;
        }

        const std::size_t start = ++i;
        int depth = 1;
        char in_quote = '\0';
        while (i < body.size() && depth > 0) {
            const char c = body[i];
            if (in_quote != '\0') {
                if (c == in_quote) in_quote = '\0';
            } else if (c == '\'' || c == '"') {
                in_quote = c;
            } else if (c == '{' || c == '(' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ')' || c == ']') {
                --depth;
            }
            ++i;
        }
        const std::size_t end = depth == 0 ? i - 1 : i;
        std::string field = body.substr(start, end - start);

        const std::size_t spec = FindFieldSpecStart(field);
        if (spec != std::string::npos) {
            // Nested replacement fields may live inside the format spec
            for (auto& nested : ExtractFStringFields(field.substr(spec + 1))) {
                fields.push_back(std::move(nested));
            }
            field.erase(spec);
        }
        while (!field.empty() && std::isspace(static_cast<unsigned char>(field.back()))) {
            field.pop_back();
        }
        if (field.size() >= 2 && field.back() == '=' &&
            std::strchr("=!<>", field[field.size() - 2]) == nullptr) {
            field.pop_back();  // self-documenting "{x=}"
        }
        fields.push_back(std::move(field));
    }

    return fields;
}

bool PythonTokenizer::IsKeyword(const std::string& name) {
    return Keywords().count(name) > 0;
}

} // namespace parsers
} // namespace codebox
