// ==============================================================================
// SilverScript Contract Parser
// ==============================================================================
// Parses SilverScript source text into a ContractAst.
// Supports pragma lines, one contract with constructor parameters, helper and
// entrypoint functions, declarations, assignments, require, if/else and
// helper calls. Handles // and /* */ comments.
// ==============================================================================

#ifndef SILVERSCRIPT_LANG_CONTRACT_PARSER_HPP
#define SILVERSCRIPT_LANG_CONTRACT_PARSER_HPP

#include "ast.hpp"
#include <string>
#include <vector>

namespace sil {

// ==============================================================================
// Parser
// ==============================================================================

/**
 * @brief Recursive-descent parser for SilverScript
 *
 * Usage:
 *   ContractParser parser;
 *   ContractAst contract = parser.parse_string(source);
 *
 * @throws ParseError with the offending position or token range
 */
class ContractParser {
public:
    ContractAst parse_string(const std::string& source);
    ContractAst parse_file(const std::string& path);

private:
    // Token types
    enum class TokenType {
        IDENTIFIER, NUMBER, HEX, STRING,
        LBRACE, RBRACE, LPAREN, RPAREN, LBRACKET, RBRACKET,
        COMMA, SEMICOLON, DOT, CARET, ASSIGN,
        PLUS, MINUS, STAR, SLASH, PERCENT,
        BANG, LT, LE, GT, GE, EQ, NE, AND_AND, OR_OR,
        KEYWORD_PRAGMA, KEYWORD_CONTRACT, KEYWORD_FUNCTION,
        KEYWORD_ENTRYPOINT, KEYWORD_IF, KEYWORD_ELSE, KEYWORD_REQUIRE,
        KEYWORD_TRUE, KEYWORD_FALSE,
        END_OF_FILE
    };

    struct Token {
        TokenType type;
        std::string text;
        SourceSpan span;
    };

    // Tokenizer
    void tokenize(const std::string& source);
    void skip_whitespace_and_comments();
    Token read_token();
    Token read_number();
    Token read_string(char quote);
    Token read_word();
    char current() const;
    char lookahead(size_t offset) const;
    void advance_char();

    // Parser helpers
    const Token& peek(size_t offset = 0) const;
    Token advance();
    Token expect(TokenType type, const std::string& context);
    bool match(TokenType type);
    [[noreturn]] void error_at(const Token& token, const std::string& message) const;

    // Recursive descent parsing
    ContractAst parse_source_file();
    void parse_pragma();
    std::vector<Param> parse_param_list();
    Param parse_param();
    std::string parse_type_name_tokens(SourceSpan& span);
    FunctionAst parse_function();
    std::vector<Statement> parse_block();
    Statement parse_statement();
    Statement parse_require();
    Statement parse_if();

    Expr parse_expression();
    Expr parse_or();
    Expr parse_and();
    Expr parse_equality();
    Expr parse_comparison();
    Expr parse_additive();
    Expr parse_multiplicative();
    Expr parse_unary();
    Expr parse_primary();
    std::vector<Expr> parse_call_arguments();

    // State
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    const std::string* src_ = nullptr;
    size_t src_pos_ = 0;
    uint32_t line_ = 1;
    uint32_t col_ = 1;
};

/**
 * @brief Convenience wrapper: parse one contract from source text
 */
ContractAst parse_contract(const std::string& source);

}  // namespace sil

#endif  // SILVERSCRIPT_LANG_CONTRACT_PARSER_HPP
