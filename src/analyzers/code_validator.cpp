/**
 * @file code_validator.cpp
 * @brief Implementation of pre-execution code validation
 *
 * Validation runs in three passes:
 * 1. Size and emptiness gates on the raw text
 * 2. Tree walk over the parsed statements (imports, names, attributes,
 *    calls, string literals including f-string replacement fields)
 * 3. Line-oriented regex heuristics for obfuscated injection, which also
 *    run when the code does not parse
 *
 * **Never-permitted modules**:
 * - Process control: os, sys, subprocess, pty, signal, multiprocessing, ...
 * - Network: socket, ssl, http, urllib, requests, asyncio, ...
 * - Reflection and loading: inspect, importlib, builtins, ctypes, gc, ...
 * - Deserialization: pickle, marshal, shelve, dill, ...
 * - Raw file access: io, pathlib, shutil, tempfile, glob, ...
 *
 * @date 2025
 */

#include "codebox/analyzers/code_validator.hpp"
#include "codebox/parsers/python_parser.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <sstream>
#include <tuple>

namespace codebox {
namespace analyzers {

using parsers::ImportStatement;
using parsers::Statement;
using parsers::StatementKind;
using parsers::Token;
using parsers::TokenType;
using utils::StringUtils;

namespace {

const std::set<std::string>& NeverPermittedModules() {
    static const std::set<std::string> modules{
        // Process control
        "os", "sys", "subprocess", "pty", "pexpect", "signal", "resource",
        "multiprocessing", "posix", "nt", "_posixsubprocess", "sh", "commands",
        // Sockets and network
        "socket", "socketserver", "ssl", "select", "selectors", "asyncio",
        "http", "urllib", "urllib2", "urllib3", "requests", "httpx", "aiohttp",
        "ftplib", "smtplib", "telnetlib", "poplib", "imaplib", "xmlrpc",
        "webbrowser",
        // Reflection and dynamic loading
        "inspect", "importlib", "imp", "pkgutil", "builtins", "__builtin__",
        "ctypes", "cffi", "gc", "code", "codeop", "runpy", "sysconfig",
        "types", "traceback", "atexit",
        // Deserialization
        "pickle", "cPickle", "_pickle", "marshal", "shelve", "dill",
        "cloudpickle", "copyreg",
        // Raw file access
        "io", "pathlib", "shutil", "tempfile", "glob", "fileinput", "mmap",
        "fcntl", "zipimport"
    };
    return modules;
}

const std::set<std::string>& DenylistedBuiltins() {
    static const std::set<std::string> builtins{
        "eval", "exec", "compile", "execfile",
        "__import__", "__builtins__", "__loader__", "__spec__",
        "open", "input", "raw_input",
        "globals", "locals", "vars",
        "getattr", "setattr", "delattr",
        "breakpoint", "reload", "memoryview"
    };
    return builtins;
}

const std::set<std::string>& ReflectionAttributes() {
    static const std::set<std::string> attributes{
        "__class__", "__bases__", "__base__", "__mro__", "__subclasses__",
        "__globals__", "__code__", "__closure__", "__dict__", "__getattribute__",
        "__reduce__", "__reduce_ex__", "__builtins__", "__import__", "__loader__",
        "__spec__", "__self__", "__func__", "__init_subclass__",
        "f_globals", "f_locals", "f_builtins", "f_back", "f_code",
        "gi_frame", "gi_code", "cr_frame", "cr_code", "ag_frame",
        "tb_frame", "tb_next", "co_code"
    };
    return attributes;
}

struct InjectionPattern {
    std::regex pattern;
    std::string description;
};

const std::vector<InjectionPattern>& InjectionPatterns() {
    static const std::vector<InjectionPattern> patterns{
        {std::regex(R"(\b(exec|eval|compile)\s{0,16}\(\s{0,16}[\w.]{0,128}(b64decode|b32decode|b16decode|a85decode|b85decode|decodebytes|decodestring|unhexlify|fromhex|decompress|loads)\s{0,16}\()"),
         "Decoded payload passed to dynamic evaluation"},
        {std::regex(R"(\b(exec|eval)\s{0,16}\(\s{0,16}[\w.]{0,128}\s{0,16}\(?\s{0,16}b?['"][^'"]{0,512}['"]\s{0,16}\)?\s{0,16}\.\s{0,16}decode\s{0,16}\()"),
         "Decoded string literal passed to dynamic evaluation"},
        {std::regex(R"(\bgetattr\s{0,16}\(\s{0,16}__builtins__)"),
         "Attribute lookup on __builtins__"},
        {std::regex(R"(['"]rot[_-]?13['"])"),
         "rot13 codec used to hide a payload"}
    };
    return patterns;
}

constexpr std::size_t kMinHexEscapeRun = 8;
constexpr std::size_t kMinChrChainLength = 3;

bool IsHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::size_t SkipSpaces(const std::string& line, std::size_t pos) {
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    return pos;
}

// Start columns of runs of at least kMinHexEscapeRun consecutive `\xNN` escapes
std::vector<std::size_t> FindHexEscapeRuns(const std::string& line) {
    std::vector<std::size_t> runs;
    std::size_t pos = 0;
    while (pos < line.size()) {
        std::size_t end = pos;
        std::size_t count = 0;
        while (end + 4 <= line.size() && line[end] == '\\' && line[end + 1] == 'x' &&
               IsHexDigit(line[end + 2]) && IsHexDigit(line[end + 3])) {
            end += 4;
            ++count;
        }
        if (count >= kMinHexEscapeRun) {
            runs.push_back(pos);
        }
        pos = count > 0 ? end : pos + 1;
    }
    return runs;
}

// Parses `chr(<digits>)` at pos; returns the position after it, or npos
std::size_t MatchChrCall(const std::string& line, std::size_t pos) {
    if (line.compare(pos, 3, "chr") != 0 || (pos > 0 && IsIdentifierChar(line[pos - 1]))) {
        return std::string::npos;
    }
    pos = SkipSpaces(line, pos + 3);
    if (pos >= line.size() || line[pos] != '(') {
        return std::string::npos;
    }
    pos = SkipSpaces(line, pos + 1);
    const std::size_t digits = pos;
    while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    if (pos == digits) {
        return std::string::npos;
    }
    pos = SkipSpaces(line, pos);
    if (pos >= line.size() || line[pos] != ')') {
        return std::string::npos;
    }
    return pos + 1;
}

// Start columns of `chr(N) + chr(N) + chr(N)...` chains of kMinChrChainLength or more calls
std::vector<std::size_t> FindChrChains(const std::string& line) {
    std::vector<std::size_t> chains;
    std::size_t pos = line.find("chr");
    while (pos != std::string::npos) {
        std::size_t end = MatchChrCall(line, pos);
        std::size_t count = 0;
        std::size_t chain_end = pos + 3;
        while (end != std::string::npos) {
            ++count;
            chain_end = end;
            const std::size_t plus = SkipSpaces(line, end);
            if (plus >= line.size() || line[plus] != '+') {
                break;
            }
            end = MatchChrCall(line, SkipSpaces(line, plus + 1));
        }
        if (count >= kMinChrChainLength) {
            chains.push_back(pos);
        }
        pos = line.find("chr", chain_end);
    }
    return chains;
}

constexpr std::size_t kMinBase64LiteralLength = 64;

bool LooksLikeBase64(const std::string& value) {
    if (value.size() < kMinBase64LiteralLength) {
        return false;
    }
    bool has_digit = false;
    bool has_upper = false;
    bool has_lower = false;
    std::size_t padding = 0;
    for (char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return false;  // '=' only at the end
        }
        if (std::isdigit(uc)) {
            has_digit = true;
        } else if (std::isupper(uc)) {
            has_upper = true;
        } else if (std::islower(uc)) {
            has_lower = true;
        } else if (c != '+' && c != '/' && c != '-' && c != '_') {
            return false;
        }
    }
    return padding <= 2 && has_digit && has_upper && has_lower;
}

std::string TopLevelModule(const std::string& dotted) {
    return dotted.substr(0, dotted.find('.'));
}

// ============================================================================
// TREE WALKER
// ============================================================================

class Walker {
public:
    Walker(const parsers::Module& module,
           const std::set<std::string>& allowed_imports,
           bool warn_on_unbounded_loops,
           std::vector<Violation>& violations,
           std::vector<std::string>& warnings)
        : module_(module),
          allowed_imports_(allowed_imports),
          warn_on_unbounded_loops_(warn_on_unbounded_loops),
          violations_(violations),
          warnings_(warnings) {}

    void Run() {
        CollectAliases(module_.statements);
        WalkBlock(module_.statements);
    }

    // Token-level checks for input whose tree could not be built
    void RunTokensOnly() {
        CheckTokens(module_.tokens, 0, module_.tokens.size());
    }

private:
    void Report(RuleKind kind, std::string description, int line, int column) {
        violations_.push_back(Violation{kind, std::move(description), SourceLocation{line, column}});
    }

    void CollectAliases(const std::vector<Statement>& block) {
        for (const auto& stmt : block) {
            if (stmt.import) {
                const ImportStatement& import = *stmt.import;
                for (const auto& name : import.names) {
                    if (import.is_from) {
                        if (name.name != "*") {
                            aliases_[name.alias.empty() ? name.name : name.alias] =
                                import.module + "." + name.name;
                        }
                    } else if (name.alias.empty()) {
                        aliases_[TopLevelModule(name.name)] = TopLevelModule(name.name);
                    } else {
                        aliases_[name.alias] = name.name;
                    }
                }
            }
            CollectAliases(stmt.body);
        }
    }

    void WalkBlock(const std::vector<Statement>& block) {
        for (const auto& stmt : block) {
            if (stmt.import) {
                CheckImport(*stmt.import, stmt);
            } else {
                CheckTokens(module_.tokens, stmt.first_token, stmt.end_token);
            }
            if (stmt.kind == StatementKind::COMPOUND) {
                if (warn_on_unbounded_loops_ && stmt.keyword == "while") {
                    CheckUnboundedLoop(stmt);
                }
                WalkBlock(stmt.body);
            }
        }
    }

    void CheckImport(const ImportStatement& import, const Statement& stmt) {
        if (import.is_from) {
            if (import.relative_level > 0) {
                Report(RuleKind::IMPORT_NOT_ALLOWED,
                       "Relative import is not allowed", stmt.line, stmt.column);
                return;
            }
            CheckModule(import.module, stmt.line, stmt.column);
            return;
        }
        for (const auto& name : import.names) {
            CheckModule(name.name, name.line, name.column);
        }
    }

    void CheckModule(const std::string& module, int line, int column) {
        const std::string top = TopLevelModule(module);
        if (CodeValidator::IsNeverPermitted(top)) {
            Report(RuleKind::IMPORT_NOT_ALLOWED,
                   fmt::format("Import of '{}' is not allowed: module '{}' is denylisted "
                               "(process, network, reflection, deserialization or file access)",
                               module, top),
                   line, column);
        } else if (allowed_imports_.count(top) == 0) {
            Report(RuleKind::IMPORT_NOT_ALLOWED,
                   fmt::format("Import of '{}' is not allowed: module '{}' is not in the "
                               "allowed imports list",
                               module, top),
                   line, column);
        }
    }

    void CheckTokens(const std::vector<Token>& tokens, std::size_t first, std::size_t end) {
        int paren_depth = 0;
        for (std::size_t i = first; i < end; ++i) {
            const Token& token = tokens[i];
            if (token.IsOp("(")) {
                ++paren_depth;
            } else if (token.IsOp(")")) {
                --paren_depth;
            } else if (token.type == TokenType::NAME) {
                CheckName(tokens, i, first, end, paren_depth);
            } else if (token.type == TokenType::STRING) {
                CheckString(token);
            }
        }
    }

    void CheckName(const std::vector<Token>& tokens, std::size_t i,
                   std::size_t first, std::size_t end, int paren_depth) {
        const Token& token = tokens[i];
        const Token* prev = i > first ? &tokens[i - 1] : nullptr;
        const Token* next = i + 1 < end ? &tokens[i + 1] : nullptr;

        if (prev != nullptr && prev->IsOp(".")) {
            if (ReflectionAttributes().count(token.text) > 0) {
                Report(RuleKind::REFLECTION_ACCESS,
                       fmt::format("Access to internal attribute '{}'", token.text),
                       token.line, token.column);
            }
            return;
        }
        if (prev != nullptr && (prev->IsName("def") || prev->IsName("class"))) {
            return;
        }
        if (next != nullptr && next->IsOp("=") && paren_depth > 0) {
            return;  // keyword argument or parameter default
        }

        if (DenylistedBuiltins().count(token.text) > 0) {
            Report(RuleKind::DENYLISTED_BUILTIN,
                   fmt::format("Use of denylisted builtin '{}'", token.text),
                   token.line, token.column);
        }
        CheckInvocation(tokens, i, end);
    }

    void CheckInvocation(const std::vector<Token>& tokens, std::size_t i, std::size_t end) {
        const Token& root = tokens[i];
        auto alias = aliases_.find(root.text);
        const std::string resolved = alias != aliases_.end() ? alias->second : root.text;

        std::string dotted = resolved;
        std::size_t j = i + 1;
        while (j + 1 < end && tokens[j].IsOp(".") && tokens[j + 1].type == TokenType::NAME) {
            dotted += "." + tokens[j + 1].text;
            j += 2;
        }
        const bool called = j < end && tokens[j].IsOp("(");
        const bool is_member = dotted.find('.') != std::string::npos;

        if (called && is_member && CodeValidator::IsNeverPermitted(TopLevelModule(dotted))) {
            Report(RuleKind::DANGEROUS_INVOCATION,
                   fmt::format("Call to '{}' invokes denylisted module '{}'",
                               dotted, TopLevelModule(dotted)),
                   root.line, root.column);
        }
    }

    void CheckString(const Token& token) {
        const std::string body = StringUtils::Trim(token.value);
        if (ReflectionAttributes().count(body) > 0 ||
            (StringUtils::StartsWith(body, "__") && DenylistedBuiltins().count(body) > 0)) {
            Report(RuleKind::REFLECTION_ACCESS,
                   fmt::format("String literal names internal attribute '{}'", body),
                   token.line, token.column);
        }
        if (LooksLikeBase64(body)) {
            Report(RuleKind::INJECTION_PATTERN,
                   fmt::format("Long base64-like string literal ({} characters), possible "
                               "encoded payload", body.size()),
                   token.line, token.column);
        }

        if (token.prefix.find('f') == std::string::npos) {
            return;
        }
        for (const auto& field : parsers::PythonTokenizer::ExtractFStringFields(token.value)) {
            auto sub = parsers::PythonTokenizer::TokenizeExpression(field, token.line, token.column);
            if (!sub.Ok()) {
                Report(RuleKind::SYNTAX_ERROR,
                       fmt::format("Syntax error in f-string expression: {}", sub.error->message),
                       token.line, token.column);
                continue;
            }
            CheckTokens(sub.tokens, 0, sub.tokens.size());
        }
    }

    bool ContainsBreak(const std::vector<Statement>& block) const {
        for (const auto& stmt : block) {
            for (std::size_t i = stmt.first_token; i < stmt.end_token; ++i) {
                if (module_.tokens[i].IsName("break") || module_.tokens[i].IsName("return")) {
                    return true;
                }
            }
            if (ContainsBreak(stmt.body)) {
                return true;
            }
        }
        return false;
    }

    void CheckUnboundedLoop(const Statement& stmt) {
        const Token& condition = module_.tokens[stmt.first_token + 1];
        const bool constant_true = condition.IsName("True") ||
                                   (condition.type == TokenType::NUMBER && condition.text != "0");
        if (constant_true && stmt.end_token == stmt.first_token + 3 && !ContainsBreak(stmt.body)) {
            warnings_.push_back(fmt::format(
                "Unbounded 'while {}' loop at line {}: execution will be stopped by the timeout",
                condition.text, stmt.line));
        }
    }

    const parsers::Module& module_;
    const std::set<std::string>& allowed_imports_;
    bool warn_on_unbounded_loops_;
    std::vector<Violation>& violations_;
    std::vector<std::string>& warnings_;
    std::map<std::string, std::string> aliases_;
};

void ScanInjectionPatterns(const std::string& code, std::vector<Violation>& violations) {
    std::istringstream stream(code);
    std::string line;
    int line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        for (const auto& pattern : InjectionPatterns()) {
            auto begin = std::sregex_iterator(line.begin(), line.end(), pattern.pattern);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                violations.push_back(Violation{RuleKind::INJECTION_PATTERN, pattern.description,
                                               SourceLocation{line_number,
                                                              static_cast<int>(it->position())}});
            }
        }
        for (std::size_t column : FindChrChains(line)) {
            violations.push_back(Violation{RuleKind::INJECTION_PATTERN,
                                           "String assembled from character codes",
                                           SourceLocation{line_number, static_cast<int>(column)}});
        }
        for (std::size_t column : FindHexEscapeRuns(line)) {
            violations.push_back(Violation{RuleKind::INJECTION_PATTERN,
                                           "Run of hex escape sequences (possible encoded payload)",
                                           SourceLocation{line_number, static_cast<int>(column)}});
        }
    }
}

void SortAndDeduplicate(std::vector<Violation>& violations) {
    std::stable_sort(violations.begin(), violations.end(),
                     [](const Violation& a, const Violation& b) {
                         return std::tie(a.location.line, a.location.column) <
                                std::tie(b.location.line, b.location.column);
                     });
    auto last = std::unique(violations.begin(), violations.end(),
                            [](const Violation& a, const Violation& b) {
                                return a.kind == b.kind && a.description == b.description &&
                                       a.location.line == b.location.line &&
                                       a.location.column == b.location.column;
                            });
    violations.erase(last, violations.end());
}

} // anonymous namespace

// ============================================================================
// RESULT TYPES
// ============================================================================

std::string RuleKindToString(RuleKind kind) {
    switch (kind) {
        case RuleKind::EMPTY_CODE: return "empty_code";
        case RuleKind::CODE_TOO_LARGE: return "code_too_large";
        case RuleKind::SYNTAX_ERROR: return "syntax_error";
        case RuleKind::IMPORT_NOT_ALLOWED: return "import_not_allowed";
        case RuleKind::DENYLISTED_BUILTIN: return "denylisted_builtin";
        case RuleKind::REFLECTION_ACCESS: return "reflection_access";
        case RuleKind::DANGEROUS_INVOCATION: return "dangerous_invocation";
        case RuleKind::INJECTION_PATTERN: return "injection_pattern";
        case RuleKind::ANALYSIS_FAILED: return "analysis_failed";
    }
    return "unknown";
}

std::string Violation::ToString() const {
    return fmt::format("line {}, col {}: {}", location.line, location.column, description);
}

std::vector<std::string> ValidationResult::Errors() const {
    std::vector<std::string> errors;
    errors.reserve(violations_.size());
    for (const auto& violation : violations_) {
        errors.push_back(violation.ToString());
    }
    return errors;
}

bool ValidationResult::HasViolation(RuleKind kind) const {
    return std::any_of(violations_.begin(), violations_.end(),
                       [kind](const Violation& v) { return v.kind == kind; });
}

// ============================================================================
// CODE VALIDATOR
// ============================================================================

CodeValidator::CodeValidator() : CodeValidator(Config{}) {}

CodeValidator::CodeValidator(const Config& config) : config_(config) {
    for (const auto& entry : config_.allowed_imports) {
        const std::string module = StringUtils::Trim(entry);
        if (module.empty()) {
            continue;
        }
        if (IsNeverPermitted(TopLevelModule(module))) {
            dropped_imports_.push_back(module);
            spdlog::warn("Ignoring allowed import '{}': module is never permitted", module);
            continue;
        }
        allowed_imports_.insert(module);
    }
    spdlog::debug("Code validator initialized with {} allowed imports", allowed_imports_.size());
}

std::set<std::string> CodeValidator::DefaultAllowedImports() {
    return {
        "json", "math", "datetime", "statistics", "collections", "itertools",
        "functools", "typing", "pandas", "numpy", "re", "string", "textwrap",
        "decimal", "fractions", "random", "operator", "heapq", "bisect",
        "dataclasses", "enum"
    };
}

bool CodeValidator::IsNeverPermitted(const std::string& top_level_module) {
    return NeverPermittedModules().count(top_level_module) > 0;
}

ValidationResult CodeValidator::Validate(const std::string& code) const {
    std::vector<Violation> violations;
    std::vector<std::string> warnings;

    if (StringUtils::IsBlank(code)) {
        violations.push_back(Violation{RuleKind::EMPTY_CODE, "Empty code provided",
                                       SourceLocation{1, 0}});
        return ValidationResult(std::move(violations), std::move(warnings));
    }
    if (code.size() > config_.max_code_bytes) {
        violations.push_back(Violation{
            RuleKind::CODE_TOO_LARGE,
            fmt::format("Code is {} bytes, exceeding the {} byte limit",
                        code.size(), config_.max_code_bytes),
            SourceLocation{1, 0}});
        return ValidationResult(std::move(violations), std::move(warnings));
    }

    try {
        const auto parsed = parsers::PythonParser::Parse(code);
        Walker walker(parsed.module, allowed_imports_, config_.warn_on_unbounded_loops,
                      violations, warnings);
        if (parsed.Ok()) {
            walker.Run();
        } else {
            violations.push_back(Violation{
                RuleKind::SYNTAX_ERROR,
                "Syntax error: " + parsed.error->message,
                SourceLocation{parsed.error->line, parsed.error->column}});
            walker.RunTokensOnly();
        }
        ScanInjectionPatterns(code, violations);
    } catch (const std::exception& e) {
        spdlog::error("Code analysis failed: {}", e.what());
        violations.push_back(Violation{RuleKind::ANALYSIS_FAILED,
                                       std::string("Code could not be analyzed: ") + e.what(),
                                       SourceLocation{1, 0}});
    }

    SortAndDeduplicate(violations);
    spdlog::debug("Validated {} bytes: {} violation(s), {} warning(s)",
                  code.size(), violations.size(), warnings.size());
    return ValidationResult(std::move(violations), std::move(warnings));
}

ValidationResult Validate(const std::string& code, const std::set<std::string>& allowed_imports) {
    CodeValidator::Config config;
    config.allowed_imports = allowed_imports;
    return CodeValidator(config).Validate(code);
}

} // namespace analyzers
} // namespace codebox
