/**
 * @file python_parser.cpp
 * @brief Implementation of the Python statement parser
 *
 * Recursive descent over the token stream: one call per block, blocks open
 * after a compound header's ':' followed by NEWLINE INDENT and close at the
 * matching DEDENT. `match` and `case` are treated as keywords only when
 * their logical line ends with ':'.
 *
 * @date 2025
 */

#include "codebox/parsers/python_parser.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace codebox {
namespace parsers {

namespace {

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, const Token& at)
        : std::runtime_error(message), line_(at.line), column_(at.column) {}

    int Line() const { return line_; }
    int Column() const { return column_; }

private:
    int line_;
    int column_;
};

const std::set<std::string>& CompoundKeywords() {
    static const std::set<std::string> keywords{
        "if", "elif", "else", "for", "while", "def", "class", "with",
        "try", "except", "finally", "async"
    };
    return keywords;
}

bool IsSoftKeyword(const std::string& name) {
    return name == "match" || name == "case" || name == "type";
}

bool IsValueKeyword(const std::string& name) {
    return name == "True" || name == "False" || name == "None";
}

bool IsOperandName(const Token& token) {
    return token.type == TokenType::NAME &&
           (!PythonTokenizer::IsKeyword(token.text) || IsValueKeyword(token.text));
}

bool EndsOperand(const Token& token) {
    return IsOperandName(token) || token.type == TokenType::NUMBER ||
           token.type == TokenType::STRING || token.IsOp(")") || token.IsOp("]") ||
           token.IsOp("}");
}

bool StartsOperand(const Token& token) {
    return IsOperandName(token) || token.type == TokenType::NUMBER ||
           token.type == TokenType::STRING;
}

bool IsOpenBracket(const Token& token) {
    return token.IsOp("(") || token.IsOp("[") || token.IsOp("{");
}

bool IsCloseBracket(const Token& token) {
    return token.IsOp(")") || token.IsOp("]") || token.IsOp("}");
}

// ============================================================================
// PARSER
// ============================================================================

class Parser {
public:
    explicit Parser(const std::vector<Token>& tokens) : tokens_(tokens) {}

    std::vector<Statement> ParseModule() {
        return ParseBlock(true);
    }

private:
    const Token& At(std::size_t index) const {
        return tokens_[std::min(index, tokens_.size() - 1)];
    }

    const Token& Cur() const { return At(pos_); }

    std::vector<Statement> ParseBlock(bool top_level) {
        std::vector<Statement> block;
        while (true) {
            const Token& token = Cur();
            switch (token.type) {
                case TokenType::ENDMARKER:
                    return block;
                case TokenType::DEDENT:
                    if (top_level) {
                        throw ParseError("unexpected unindent", token);
                    }
                    ++pos_;
                    return block;
                case TokenType::INDENT:
                    throw ParseError("unexpected indent", token);
                case TokenType::NEWLINE:
                    ++pos_;
                    break;
                default:
                    if (IsCompoundStart(pos_)) {
                        block.push_back(ParseCompound());
                    } else {
                        ParseSimpleLine(block);
                    }
                    break;
            }
        }
    }

    std::size_t FindLineEnd(std::size_t start) const {
        std::size_t i = start;
        while (i < tokens_.size() && tokens_[i].type != TokenType::NEWLINE &&
               tokens_[i].type != TokenType::ENDMARKER) {
            ++i;
        }
        return i;
    }

    bool IsCompoundStart(std::size_t index) const {
        const Token& token = At(index);
        if (token.type != TokenType::NAME) {
            return false;
        }
        if (CompoundKeywords().count(token.text) > 0) {
            return true;
        }
        if (token.text == "match" || token.text == "case") {
            const std::size_t end = FindLineEnd(index);
            if (end <= index + 1 || !tokens_[end - 1].IsOp(":")) {
                return false;
            }
            const Token& subject = At(index + 1);
            return StartsOperand(subject) || IsOpenBracket(subject) ||
                   subject.IsOp("-") || subject.IsOp("*");
        }
        return false;
    }

    std::size_t FindHeaderColon(std::size_t start) const {
        int depth = 0;
        int pending_lambdas = 0;
        for (std::size_t i = start;; ++i) {
            const Token& token = At(i);
            if (token.type == TokenType::NEWLINE || token.type == TokenType::ENDMARKER) {
                throw ParseError(fmt::format("invalid syntax: expected ':' after '{}'",
                                             At(start).text),
                                 token);
            }
            if (IsOpenBracket(token)) {
                ++depth;
            } else if (IsCloseBracket(token)) {
                --depth;
            } else if (depth == 0 && token.IsName("lambda")) {
                ++pending_lambdas;
            } else if (depth == 0 && token.IsOp(":")) {
                if (pending_lambdas == 0) {
                    return i;
                }
                --pending_lambdas;
            }
        }
    }

    Statement ParseCompound() {
        Statement stmt;
        const Token& head = Cur();
        stmt.kind = StatementKind::COMPOUND;
        stmt.keyword = head.text;
        stmt.first_token = pos_;
        stmt.line = head.line;
        stmt.column = head.column;

        std::size_t name_index = pos_ + 1;
        std::string effective = head.text;
        if (head.text == "async") {
            const Token& next = At(pos_ + 1);
            if (!next.IsName("def") && !next.IsName("for") && !next.IsName("with")) {
                throw ParseError("invalid syntax: 'async' must precede def, for or with", next);
            }
            effective = next.text;
            ++name_index;
        }
        if (effective == "def" || effective == "class") {
            const Token& name = At(name_index);
            if (name.type != TokenType::NAME || PythonTokenizer::IsKeyword(name.text)) {
                throw ParseError(fmt::format("invalid syntax: expected a name after '{}'",
                                             effective),
                                 name);
            }
        }

        const std::size_t colon = FindHeaderColon(pos_);
        if ((effective == "else" || effective == "try" || effective == "finally") &&
            colon != pos_ + 1) {
            throw ParseError(fmt::format("invalid syntax: expected ':' after '{}'", effective),
                             At(pos_ + 1));
        }

        // The header keyword (and a soft keyword's subject) is checked separately
        CheckAdjacentOperands(pos_ + 1, colon);

        pos_ = colon + 1;
        stmt.end_token = pos_;

        if (Cur().type == TokenType::NEWLINE) {
            ++pos_;
            if (Cur().type != TokenType::INDENT) {
                throw ParseError(fmt::format("expected an indented block after '{}' "
                                             "statement on line {}",
                                             effective, stmt.line),
                                 Cur());
            }
            ++pos_;
            stmt.body = ParseBlock(false);
        } else {
            if (Cur().type == TokenType::NAME && CompoundKeywords().count(Cur().text) > 0) {
                throw ParseError("invalid syntax: compound statement in single-line body", Cur());
            }
            if (Cur().type == TokenType::ENDMARKER) {
                throw ParseError(fmt::format("expected an indented block after '{}' "
                                             "statement on line {}",
                                             effective, stmt.line),
                                 Cur());
            }
            ParseSimpleLine(stmt.body);
        }

        return stmt;
    }

    void ParseSimpleLine(std::vector<Statement>& block) {
        std::size_t start = pos_;
        int depth = 0;
        while (true) {
            const Token& token = Cur();
            if (token.type == TokenType::NEWLINE || token.type == TokenType::ENDMARKER) {
                if (pos_ > start) {
                    block.push_back(MakeSimple(start, pos_));
                }
                if (token.type == TokenType::NEWLINE) {
                    ++pos_;
                }
                return;
            }
            if (IsOpenBracket(token)) {
                ++depth;
            } else if (IsCloseBracket(token)) {
                --depth;
            } else if (depth == 0 && token.IsOp(";")) {
                if (pos_ == start) {
                    throw ParseError("invalid syntax", token);
                }
                block.push_back(MakeSimple(start, pos_));
                start = pos_ + 1;
            }
            ++pos_;
        }
    }

    Statement MakeSimple(std::size_t first, std::size_t end) {
        Statement stmt;
        const Token& head = tokens_[first];
        stmt.first_token = first;
        stmt.end_token = end;
        stmt.line = head.line;
        stmt.column = head.column;

        if (head.IsName("import")) {
            stmt.kind = StatementKind::IMPORT;
            stmt.import = ParseImport(first + 1, end);
        } else if (head.IsName("from")) {
            stmt.kind = StatementKind::IMPORT_FROM;
            stmt.import = ParseFromImport(first + 1, end);
        } else {
            const bool soft_head = head.type == TokenType::NAME && IsSoftKeyword(head.text) &&
                                   first + 1 < end && IsOperandName(tokens_[first + 1]);
            CheckAdjacentOperands(soft_head ? first + 1 : first, end);
        }
        return stmt;
    }

    void CheckAdjacentOperands(std::size_t first, std::size_t end) const {
        for (std::size_t i = first; i + 1 < end; ++i) {
            const Token& left = tokens_[i];
            const Token& right = tokens_[i + 1];
            if (left.type == TokenType::STRING && right.type == TokenType::STRING) {
                continue;  // implicit concatenation
            }
            if (EndsOperand(left) && StartsOperand(right)) {
                throw ParseError(fmt::format("invalid syntax near '{}'", right.text), right);
            }
        }
    }

    // ------------------------------------------------------------------------
    // Imports
    // ------------------------------------------------------------------------

    const Token& ExpectName(std::size_t& i, std::size_t end, const char* context) const {
        const Token& token = At(std::min(i, end));
        if (i >= end || token.type != TokenType::NAME ||
            PythonTokenizer::IsKeyword(token.text)) {
            throw ParseError(fmt::format("invalid syntax in {}: expected a name", context),
                             i >= end ? At(end > 0 ? end - 1 : 0) : token);
        }
        ++i;
        return token;
    }

    std::string ParseDotted(std::size_t& i, std::size_t end) const {
        std::string dotted = ExpectName(i, end, "import statement").text;
        while (i < end && tokens_[i].IsOp(".")) {
            ++i;
            dotted += "." + ExpectName(i, end, "import statement").text;
        }
        return dotted;
    }

    ImportStatement ParseImport(std::size_t i, std::size_t end) const {
        ImportStatement import;
        while (true) {
            ImportedName name;
            name.line = At(i).line;
            name.column = At(i).column;
            name.name = ParseDotted(i, end);
            if (i < end && tokens_[i].IsName("as")) {
                ++i;
                name.alias = ExpectName(i, end, "import statement").text;
            }
            import.names.push_back(std::move(name));
            if (i < end && tokens_[i].IsOp(",")) {
                ++i;
                continue;
            }
            break;
        }
        if (i != end) {
            throw ParseError("invalid syntax in import statement", tokens_[i]);
        }
        return import;
    }

    ImportStatement ParseFromImport(std::size_t i, std::size_t end) const {
        ImportStatement import;
        import.is_from = true;

        while (i < end && (tokens_[i].IsOp(".") || tokens_[i].IsOp("..."))) {
            import.relative_level += tokens_[i].IsOp(".") ? 1 : 3;
            ++i;
        }
        if (i < end && tokens_[i].type == TokenType::NAME && !tokens_[i].IsName("import")) {
            import.module = ParseDotted(i, end);
        }
        if (import.relative_level == 0 && import.module.empty()) {
            throw ParseError("invalid syntax in from-import: missing module", At(i));
        }
        if (i >= end || !tokens_[i].IsName("import")) {
            throw ParseError("invalid syntax in from-import: expected 'import'",
                             At(std::min(i, end - 1)));
        }
        ++i;

        if (i < end && tokens_[i].IsOp("*")) {
            ImportedName star;
            star.name = "*";
            star.line = tokens_[i].line;
            star.column = tokens_[i].column;
            import.names.push_back(std::move(star));
            ++i;
        } else {
            const bool parenthesized = i < end && tokens_[i].IsOp("(");
            if (parenthesized) {
                ++i;
            }
            while (true) {
                ImportedName name;
                name.line = At(i).line;
                name.column = At(i).column;
                name.name = ExpectName(i, end, "from-import").text;
                if (i < end && tokens_[i].IsName("as")) {
                    ++i;
                    name.alias = ExpectName(i, end, "from-import").text;
                }
                import.names.push_back(std::move(name));
                if (i < end && tokens_[i].IsOp(",")) {
                    ++i;
                    if (parenthesized && i < end && tokens_[i].IsOp(")")) {
                        break;  // trailing comma
                    }
                    continue;
                }
                break;
            }
            if (parenthesized) {
                if (i >= end || !tokens_[i].IsOp(")")) {
                    throw ParseError("invalid syntax in from-import: expected ')'",
                                     At(std::min(i, end - 1)));
                }
                ++i;
            }
        }

        if (i != end) {
            throw ParseError("invalid syntax in from-import", tokens_[i]);
        }
        return import;
    }

    const std::vector<Token>& tokens_;
    std::size_t pos_{0};
};

} // anonymous namespace

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

ParseResult PythonParser::Parse(const std::string& source) {
    ParseResult result;
    auto tokenized = PythonTokenizer::Tokenize(source);
    result.module.tokens = std::move(tokenized.tokens);

    if (!tokenized.Ok()) {
        result.error = tokenized.error;
        return result;
    }

    Parser parser(result.module.tokens);
    try {
        result.module.statements = parser.ParseModule();
    } catch (const ParseError& e) {
        result.error = SyntaxIssue{e.what(), e.Line(), e.Column()};
    }
    return result;
}

bool PythonParser::IsCompoundKeyword(const std::string& name) {
    return CompoundKeywords().count(name) > 0;
}

} // namespace parsers
} // namespace codebox
