/**
 * @file code_validator.hpp
 * @brief Pre-execution static analysis of submitted Python code
 *
 * Parses code into a statement tree and rejects it when it imports modules
 * outside the allow-list, references builtins that give dynamic evaluation,
 * reflection or raw file/process access, reaches into object internals, or
 * matches obfuscated-injection heuristics. Every violation is reported with
 * its rule, description and source location; the analysis never throws.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace codebox {
namespace analyzers {

/**
 * @enum RuleKind
 * @brief Validation rule that produced a violation
 */
enum class RuleKind {
    EMPTY_CODE,             ///< Empty or whitespace-only submission
    CODE_TOO_LARGE,         ///< Submission exceeds the size cap
    SYNTAX_ERROR,           ///< Code does not parse
    IMPORT_NOT_ALLOWED,     ///< Import outside the allow-list (or never permitted)
    DENYLISTED_BUILTIN,     ///< Reference to a dangerous builtin name
    REFLECTION_ACCESS,      ///< Access to interpreter/object internals
    DANGEROUS_INVOCATION,   ///< Call into a never-permitted module
    INJECTION_PATTERN,      ///< Obfuscated payload heuristics
    ANALYSIS_FAILED         ///< Analyzer could not complete (fails closed)
};

/**
 * @brief Stable rule name ("import_not_allowed", ...)
 */
std::string RuleKindToString(RuleKind kind);

/**
 * @struct SourceLocation
 * @brief 1-based line, 0-based column
 */
struct SourceLocation {
    int line{1};
    int column{0};
};

/**
 * @struct Violation
 * @brief One failed rule
 */
struct Violation {
    RuleKind kind{RuleKind::SYNTAX_ERROR};   ///< Rule that fired
    std::string description;                 ///< Human-readable explanation
    SourceLocation location;                 ///< Offending construct

    /// "line L, col C: description"
    std::string ToString() const;
};

/**
 * @class ValidationResult
 * @brief Immutable outcome of validating one code string
 */
class ValidationResult {
public:
    ValidationResult(std::vector<Violation> violations, std::vector<std::string> warnings)
        : violations_(std::move(violations)), warnings_(std::move(warnings)) {}

    bool IsValid() const { return violations_.empty(); }
    const std::vector<Violation>& Violations() const { return violations_; }
    const std::vector<std::string>& Warnings() const { return warnings_; }

    /**
     * @brief Violations rendered as "line L, col C: description"
     */
    std::vector<std::string> Errors() const;

    /**
     * @brief True if any violation has the given rule kind
     */
    bool HasViolation(RuleKind kind) const;

private:
    std::vector<Violation> violations_;
    std::vector<std::string> warnings_;
};

/**
 * @class CodeValidator
 * @brief Static analyzer gating code before it reaches any backend
 *
 * **Rules**:
 * - Imports: the top-level package of every import must be allow-listed.
 *   Relative imports are rejected. Process-control, socket/network,
 *   reflection and deserialization modules are never permitted, even when
 *   configured.
 * - Builtins: eval, exec, compile, __import__, open, input, globals,
 *   locals, vars, getattr, setattr, delattr, breakpoint and similar.
 * - Reflection: dunder attributes such as __class__, __subclasses__,
 *   __globals__, __code__ and frame attributes.
 * - Dangerous invocation: calls such as os.system() through a never-permitted
 *   module or an alias of one.
 * - Injection heuristics: decoded payloads fed to eval/exec, long base64
 *   literals, hex-escape runs, chr() chains, rot13 codecs.
 *
 * **Thread Safety**: Validate() is const and safe to call concurrently.
 *
 * **Usage Example**:
 * @code
 * CodeValidator validator;
 * auto result = validator.Validate("import os\nos.system('ls')");
 * for (const auto& error : result.Errors()) {
 *     spdlog::info("rejected: {}", error);
 * }
 * @endcode
 */
class CodeValidator {
public:
    /**
     * @struct Config
     * @brief Code validator configuration
     */
    struct Config {
        std::set<std::string> allowed_imports = DefaultAllowedImports();  ///< Permitted top-level modules
        std::size_t max_code_bytes{100 * 1024};   ///< Reject larger submissions unparsed
        bool warn_on_unbounded_loops{true};       ///< Warn on `while True` without break
    };

    CodeValidator();
    explicit CodeValidator(const Config& config);

    /**
     * @brief Validate a code string
     *
     * Never throws: malformed input yields a SYNTAX_ERROR violation, and an
     * internal analyzer failure yields ANALYSIS_FAILED.
     *
     * @param code Python source
     * @return Validation result with all violations in source order
     */
    ValidationResult Validate(const std::string& code) const;

    /**
     * @brief Effective allow-list (configured entries minus never-permitted modules)
     */
    const std::set<std::string>& AllowedImports() const { return allowed_imports_; }

    /**
     * @brief Configured entries dropped because they are never permitted
     */
    const std::vector<std::string>& DroppedImports() const { return dropped_imports_; }

    /**
     * @brief Default allow-list of data/text/math modules
     */
    static std::set<std::string> DefaultAllowedImports();

    /**
     * @brief True for modules rejected regardless of configuration
     */
    static bool IsNeverPermitted(const std::string& top_level_module);

private:
    Config config_;
    std::set<std::string> allowed_imports_;
    std::vector<std::string> dropped_imports_;
};

/**
 * @brief Validate with a specific allow-list
 *
 * Convenience wrapper equivalent to CodeValidator({allowed_imports}).Validate(code).
 */
ValidationResult Validate(const std::string& code, const std::set<std::string>& allowed_imports);

} // namespace analyzers
} // namespace codebox
