// ==============================================================================
// SilverScript Contract Parser Implementation
// ==============================================================================

#include "contract_parser.hpp"
#include "error.hpp"
#include <fstream>
#include <limits>
#include <sstream>

namespace sil {

namespace {

// Common misspellings worth a hint in the error message
struct KeywordTypo {
    const char* wrong;
    const char* correct;
};

const KeywordTypo KEYWORD_TYPOS[] = {
    {"func", "function"},
    {"fn", "function"},
    {"entry", "entrypoint"},
    {"requires", "require"},
    {"assert", "require"},
    {"elif", "else if"},
    {"uint", "int"},
    {"boolean", "bool"},
};

std::string describe_token(const std::string& text) {
    if (text.empty()) {
        return "end of input";
    }
    for (const auto& typo : KEYWORD_TYPOS) {
        if (text == typo.wrong) {
            return format_suggestion(typo.wrong, typo.correct);
        }
    }
    return "'" + text + "'";
}

bool is_identifier_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_identifier_char(char c) {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_hex_digit(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

}  // namespace

// ==============================================================================
// Public API
// ==============================================================================

ContractAst ContractParser::parse_string(const std::string& source) {
    tokenize(source);
    pos_ = 0;
    return parse_source_file();
}

ContractAst ContractParser::parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FileError(path, "Could not open contract file");
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_string(ss.str());
}

ContractAst parse_contract(const std::string& source) {
    ContractParser parser;
    return parser.parse_string(source);
}

// ==============================================================================
// Tokenizer
// ==============================================================================

void ContractParser::tokenize(const std::string& source) {
    tokens_.clear();
    src_ = &source;
    src_pos_ = 0;
    line_ = 1;
    col_ = 1;

    while (src_pos_ < src_->size()) {
        skip_whitespace_and_comments();
        if (src_pos_ >= src_->size()) break;

        tokens_.push_back(read_token());
    }

    Token eof;
    eof.type = TokenType::END_OF_FILE;
    eof.span = SourceSpan::point(line_, col_);
    tokens_.push_back(eof);
    src_ = nullptr;
}

char ContractParser::current() const {
    return src_pos_ < src_->size() ? (*src_)[src_pos_] : '\0';
}

char ContractParser::lookahead(size_t offset) const {
    return src_pos_ + offset < src_->size() ? (*src_)[src_pos_ + offset] : '\0';
}

void ContractParser::advance_char() {
    if (current() == '\n') {
        line_++;
        col_ = 1;
    } else {
        col_++;
    }
    src_pos_++;
}

void ContractParser::skip_whitespace_and_comments() {
    while (src_pos_ < src_->size()) {
        char c = current();

        // Whitespace
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance_char();
            continue;
        }

        // Line comment
        if (c == '/' && lookahead(1) == '/') {
            while (src_pos_ < src_->size() && current() != '\n') {
                advance_char();
            }
            continue;
        }

        // Block comment
        if (c == '/' && lookahead(1) == '*') {
            SourceSpan start = SourceSpan::point(line_, col_);
            advance_char();
            advance_char();
            bool closed = false;
            while (src_pos_ < src_->size()) {
                if (current() == '*' && lookahead(1) == '/') {
                    advance_char();
                    advance_char();
                    closed = true;
                    break;
                }
                advance_char();
            }
            if (!closed) {
                throw ParseError(start, "Unterminated block comment");
            }
            continue;
        }

        break;
    }
}

ContractParser::Token ContractParser::read_token() {
    Token tok;
    uint32_t start_line = line_;
    uint32_t start_col = col_;
    char c = current();

    auto finish = [&](TokenType type, size_t length) {
        tok.type = type;
        tok.text = src_->substr(src_pos_, length);
        for (size_t i = 0; i < length; i++) {
            advance_char();
        }
        tok.span = SourceSpan{start_line, start_col, line_, col_};
        return tok;
    };

    // Two-character operators
    char next = lookahead(1);
    if (c == '<' && next == '=') return finish(TokenType::LE, 2);
    if (c == '>' && next == '=') return finish(TokenType::GE, 2);
    if (c == '=' && next == '=') return finish(TokenType::EQ, 2);
    if (c == '!' && next == '=') return finish(TokenType::NE, 2);
    if (c == '&' && next == '&') return finish(TokenType::AND_AND, 2);
    if (c == '|' && next == '|') return finish(TokenType::OR_OR, 2);

    switch (c) {
        case '{': return finish(TokenType::LBRACE, 1);
        case '}': return finish(TokenType::RBRACE, 1);
        case '(': return finish(TokenType::LPAREN, 1);
        case ')': return finish(TokenType::RPAREN, 1);
        case '[': return finish(TokenType::LBRACKET, 1);
        case ']': return finish(TokenType::RBRACKET, 1);
        case ',': return finish(TokenType::COMMA, 1);
        case ';': return finish(TokenType::SEMICOLON, 1);
        case '.': return finish(TokenType::DOT, 1);
        case '^': return finish(TokenType::CARET, 1);
        case '=': return finish(TokenType::ASSIGN, 1);
        case '+': return finish(TokenType::PLUS, 1);
        case '-': return finish(TokenType::MINUS, 1);
        case '*': return finish(TokenType::STAR, 1);
        case '/': return finish(TokenType::SLASH, 1);
        case '%': return finish(TokenType::PERCENT, 1);
        case '!': return finish(TokenType::BANG, 1);
        case '<': return finish(TokenType::LT, 1);
        case '>': return finish(TokenType::GT, 1);
        default: break;
    }

    if (c == '"' || c == '\'') {
        return read_string(c);
    }
    if (is_digit(c)) {
        return read_number();
    }
    if (is_identifier_start(c)) {
        return read_word();
    }

    throw ParseError(SourceSpan::point(line_, col_),
                     std::string("Unexpected character: '") + c + "'");
}

ContractParser::Token ContractParser::read_number() {
    Token tok;
    uint32_t start_line = line_;
    uint32_t start_col = col_;
    size_t start = src_pos_;

    // Hex literal: 0x...
    if (current() == '0' && (lookahead(1) == 'x' || lookahead(1) == 'X')) {
        advance_char();
        advance_char();
        while (is_hex_digit(current())) {
            advance_char();
        }
        tok.type = TokenType::HEX;
    } else {
        while (is_digit(current())) {
            advance_char();
        }
        tok.type = TokenType::NUMBER;
    }

    tok.text = src_->substr(start, src_pos_ - start);
    tok.span = SourceSpan{start_line, start_col, line_, col_};

    if (is_identifier_char(current())) {
        while (is_identifier_char(current())) {
            advance_char();
        }
        SourceSpan bad{start_line, start_col, line_, col_};
        throw ParseError(bad, "Malformed numeric literal '" +
                              src_->substr(start, src_pos_ - start) + "'");
    }
    if (tok.type == TokenType::HEX && (tok.text.size() - 2) % 2 != 0) {
        throw ParseError(tok.span, "Hex literal '" + tok.text + "' has an odd number of digits");
    }
    return tok;
}

ContractParser::Token ContractParser::read_string(char quote) {
    Token tok;
    uint32_t start_line = line_;
    uint32_t start_col = col_;
    advance_char();  // Opening quote

    std::string value;
    while (true) {
        if (src_pos_ >= src_->size() || current() == '\n') {
            throw ParseError(SourceSpan{start_line, start_col, line_, col_},
                             "Unterminated string literal");
        }
        char c = current();
        if (c == quote) {
            advance_char();
            break;
        }
        if (c == '\\') {
            advance_char();
            char esc = current();
            switch (esc) {
                case 'n':  value.push_back('\n'); break;
                case 't':  value.push_back('\t'); break;
                case '\\': value.push_back('\\'); break;
                case '"':  value.push_back('"'); break;
                case '\'': value.push_back('\''); break;
                default:
                    throw ParseError(SourceSpan::point(line_, col_),
                                     std::string("Unknown escape sequence '\\") + esc + "'");
            }
            advance_char();
            continue;
        }
        value.push_back(c);
        advance_char();
    }

    tok.type = TokenType::STRING;
    tok.text = value;
    tok.span = SourceSpan{start_line, start_col, line_, col_};
    return tok;
}

ContractParser::Token ContractParser::read_word() {
    Token tok;
    uint32_t start_line = line_;
    uint32_t start_col = col_;
    size_t start = src_pos_;
    while (is_identifier_char(current())) {
        advance_char();
    }
    tok.text = src_->substr(start, src_pos_ - start);
    tok.span = SourceSpan{start_line, start_col, line_, col_};

    // Check keywords
    if (tok.text == "pragma") tok.type = TokenType::KEYWORD_PRAGMA;
    else if (tok.text == "contract") tok.type = TokenType::KEYWORD_CONTRACT;
    else if (tok.text == "function") tok.type = TokenType::KEYWORD_FUNCTION;
    else if (tok.text == "entrypoint") tok.type = TokenType::KEYWORD_ENTRYPOINT;
    else if (tok.text == "if") tok.type = TokenType::KEYWORD_IF;
    else if (tok.text == "else") tok.type = TokenType::KEYWORD_ELSE;
    else if (tok.text == "require") tok.type = TokenType::KEYWORD_REQUIRE;
    else if (tok.text == "true") tok.type = TokenType::KEYWORD_TRUE;
    else if (tok.text == "false") tok.type = TokenType::KEYWORD_FALSE;
    else tok.type = TokenType::IDENTIFIER;

    return tok;
}

// ==============================================================================
// Parser Helpers
// ==============================================================================

const ContractParser::Token& ContractParser::peek(size_t offset) const {
    size_t index = pos_ + offset;
    if (index >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[index];
}

ContractParser::Token ContractParser::advance() {
    Token tok = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) pos_++;
    return tok;
}

ContractParser::Token ContractParser::expect(TokenType type, const std::string& context) {
    const Token& tok = peek();
    if (tok.type != type) {
        error_at(tok, "Expected " + context + ", got " + describe_token(tok.text));
    }
    return advance();
}

bool ContractParser::match(TokenType type) {
    if (peek().type == type) {
        advance();
        return true;
    }
    return false;
}

void ContractParser::error_at(const Token& token, const std::string& message) const {
    throw ParseError(token.span, message);
}

// ==============================================================================
// Declarations
// ==============================================================================

ContractAst ContractParser::parse_source_file() {
    while (peek().type == TokenType::KEYWORD_PRAGMA) {
        parse_pragma();
    }

    ContractAst contract;
    Token start = expect(TokenType::KEYWORD_CONTRACT, "'contract'");
    contract.name = expect(TokenType::IDENTIFIER, "contract name").text;
    contract.params = parse_param_list();
    expect(TokenType::LBRACE, "'{' to open the contract body");

    while (peek().type != TokenType::RBRACE) {
        if (peek().type == TokenType::END_OF_FILE) {
            error_at(peek(), "Expected '}' to close contract '" + contract.name + "'");
        }
        contract.functions.push_back(parse_function());
    }

    Token end = expect(TokenType::RBRACE, "'}'");
    contract.span = SourceSpan::cover(start.span, end.span);

    if (peek().type != TokenType::END_OF_FILE) {
        error_at(peek(), "Unexpected " + describe_token(peek().text) + " after contract body");
    }
    return contract;
}

void ContractParser::parse_pragma() {
    expect(TokenType::KEYWORD_PRAGMA, "'pragma'");
    Token name = expect(TokenType::IDENTIFIER, "pragma name");
    if (name.text != "silverscript") {
        error_at(name, "Unknown pragma " + describe_token(name.text) +
                       ", expected 'silverscript'");
    }
    // Version constraint such as ^0.1.0 or >=0.1 is accepted as-is
    while (peek().type != TokenType::SEMICOLON) {
        if (peek().type == TokenType::END_OF_FILE) {
            error_at(peek(), "Expected ';' after pragma");
        }
        advance();
    }
    advance();
}

std::vector<Param> ContractParser::parse_param_list() {
    std::vector<Param> params;
    expect(TokenType::LPAREN, "'(' to open the parameter list");
    if (match(TokenType::RPAREN)) {
        return params;
    }
    params.push_back(parse_param());
    while (match(TokenType::COMMA)) {
        params.push_back(parse_param());
    }
    expect(TokenType::RPAREN, "')' to close the parameter list");
    return params;
}

std::string ContractParser::parse_type_name_tokens(SourceSpan& span) {
    Token type = expect(TokenType::IDENTIFIER, "type name");
    span = type.span;
    std::string name = type.text;
    if (peek().type == TokenType::LBRACKET && peek(1).type == TokenType::RBRACKET) {
        advance();
        Token close = advance();
        span = SourceSpan::cover(type.span, close.span);
        name += "[]";
    }
    return name;
}

Param ContractParser::parse_param() {
    Param param;
    SourceSpan type_span;
    param.type_name = parse_type_name_tokens(type_span);
    Token name = expect(TokenType::IDENTIFIER, "parameter name");
    param.name = name.text;
    param.span = SourceSpan::cover(type_span, name.span);
    return param;
}

FunctionAst ContractParser::parse_function() {
    FunctionAst function;
    SourceSpan start = peek().span;

    if (match(TokenType::KEYWORD_ENTRYPOINT)) {
        function.entrypoint = true;
    }
    expect(TokenType::KEYWORD_FUNCTION, "'function'");
    Token name = expect(TokenType::IDENTIFIER, "function name");
    function.name = name.text;
    function.params = parse_param_list();
    function.span = SourceSpan::cover(start, tokens_[pos_ - 1].span);
    function.body = parse_block();
    return function;
}

// ==============================================================================
// Statements
// ==============================================================================

std::vector<Statement> ContractParser::parse_block() {
    std::vector<Statement> body;
    expect(TokenType::LBRACE, "'{' to open a block");
    while (peek().type != TokenType::RBRACE) {
        if (peek().type == TokenType::END_OF_FILE) {
            error_at(peek(), "Expected '}' to close the block");
        }
        body.push_back(parse_statement());
    }
    advance();
    return body;
}

Statement ContractParser::parse_statement() {
    switch (peek().type) {
        case TokenType::KEYWORD_REQUIRE:
            return parse_require();
        case TokenType::KEYWORD_IF:
            return parse_if();
        case TokenType::IDENTIFIER:
            break;
        default:
            error_at(peek(), "Expected a statement, got " + describe_token(peek().text));
    }

    Statement stmt;
    Token first = peek();

    if (peek(1).type == TokenType::IDENTIFIER ||
        (peek(1).type == TokenType::LBRACKET && peek(2).type == TokenType::RBRACKET)) {
        // Declaration: T name = expr;
        SourceSpan type_span;
        stmt.kind = StmtKind::VAR_DECL;
        stmt.type_name = parse_type_name_tokens(type_span);
        stmt.name = expect(TokenType::IDENTIFIER, "variable name").text;
        expect(TokenType::ASSIGN, "'=' in declaration of '" + stmt.name + "'");
        stmt.exprs.push_back(parse_expression());
    } else if (peek(1).type == TokenType::ASSIGN) {
        // Assignment: name = expr;
        stmt.kind = StmtKind::ASSIGN;
        stmt.name = advance().text;
        advance();
        stmt.exprs.push_back(parse_expression());
    } else if (peek(1).type == TokenType::LPAREN) {
        // Helper call: f(args);
        stmt.kind = StmtKind::CALL;
        stmt.name = advance().text;
        stmt.exprs = parse_call_arguments();
    } else {
        error_at(peek(1), "Expected declaration, assignment or call after " +
                          describe_token(first.text) + ", got " +
                          describe_token(peek(1).text));
    }

    Token end = expect(TokenType::SEMICOLON, "';' after statement");
    stmt.span = SourceSpan::cover(first.span, end.span);
    return stmt;
}

Statement ContractParser::parse_require() {
    Statement stmt;
    stmt.kind = StmtKind::REQUIRE;
    Token first = expect(TokenType::KEYWORD_REQUIRE, "'require'");
    expect(TokenType::LPAREN, "'(' after require");
    stmt.exprs.push_back(parse_expression());
    if (match(TokenType::COMMA)) {
        stmt.message = expect(TokenType::STRING, "message string").text;
    }
    expect(TokenType::RPAREN, "')' to close require");
    Token end = expect(TokenType::SEMICOLON, "';' after statement");
    stmt.span = SourceSpan::cover(first.span, end.span);
    return stmt;
}

Statement ContractParser::parse_if() {
    Statement stmt;
    stmt.kind = StmtKind::IF;
    Token first = expect(TokenType::KEYWORD_IF, "'if'");
    expect(TokenType::LPAREN, "'(' after if");
    stmt.exprs.push_back(parse_expression());
    Token close = expect(TokenType::RPAREN, "')' to close the condition");

    // The statement span covers the header only; bodies map themselves
    stmt.span = SourceSpan::cover(first.span, close.span);
    stmt.then_body = parse_block();

    if (match(TokenType::KEYWORD_ELSE)) {
        if (peek().type == TokenType::KEYWORD_IF) {
            stmt.else_body.push_back(parse_if());
        } else {
            stmt.else_body = parse_block();
        }
    }
    return stmt;
}

// ==============================================================================
// Expressions
// ==============================================================================

namespace {

Expr make_binary(BinaryOp op, Expr left, Expr right) {
    Expr e;
    e.kind = ExprKind::BINARY;
    e.binary_op = op;
    e.span = SourceSpan::cover(left.span, right.span);
    e.operands.push_back(std::move(left));
    e.operands.push_back(std::move(right));
    return e;
}

}  // namespace

Expr ContractParser::parse_expression() {
    return parse_or();
}

Expr ContractParser::parse_or() {
    Expr left = parse_and();
    while (match(TokenType::OR_OR)) {
        left = make_binary(BinaryOp::OR, std::move(left), parse_and());
    }
    return left;
}

Expr ContractParser::parse_and() {
    Expr left = parse_equality();
    while (match(TokenType::AND_AND)) {
        left = make_binary(BinaryOp::AND, std::move(left), parse_equality());
    }
    return left;
}

Expr ContractParser::parse_equality() {
    Expr left = parse_comparison();
    while (true) {
        if (match(TokenType::EQ)) {
            left = make_binary(BinaryOp::EQ, std::move(left), parse_comparison());
        } else if (match(TokenType::NE)) {
            left = make_binary(BinaryOp::NE, std::move(left), parse_comparison());
        } else {
            return left;
        }
    }
}

Expr ContractParser::parse_comparison() {
    Expr left = parse_additive();
    while (true) {
        BinaryOp op;
        switch (peek().type) {
            case TokenType::LT: op = BinaryOp::LT; break;
            case TokenType::LE: op = BinaryOp::LE; break;
            case TokenType::GT: op = BinaryOp::GT; break;
            case TokenType::GE: op = BinaryOp::GE; break;
            default: return left;
        }
        advance();
        left = make_binary(op, std::move(left), parse_additive());
    }
}

Expr ContractParser::parse_additive() {
    Expr left = parse_multiplicative();
    while (true) {
        if (match(TokenType::PLUS)) {
            left = make_binary(BinaryOp::ADD, std::move(left), parse_multiplicative());
        } else if (match(TokenType::MINUS)) {
            left = make_binary(BinaryOp::SUB, std::move(left), parse_multiplicative());
        } else {
            return left;
        }
    }
}

Expr ContractParser::parse_multiplicative() {
    Expr left = parse_unary();
    while (true) {
        BinaryOp op;
        switch (peek().type) {
            case TokenType::STAR:    op = BinaryOp::MUL; break;
            case TokenType::SLASH:   op = BinaryOp::DIV; break;
            case TokenType::PERCENT: op = BinaryOp::MOD; break;
            default: return left;
        }
        advance();
        left = make_binary(op, std::move(left), parse_unary());
    }
}

Expr ContractParser::parse_unary() {
    if (peek().type == TokenType::BANG || peek().type == TokenType::MINUS) {
        Token op = advance();
        Expr operand = parse_unary();
        Expr e;
        e.kind = ExprKind::UNARY;
        e.unary_op = (op.type == TokenType::BANG) ? UnaryOp::NOT : UnaryOp::NEGATE;
        e.span = SourceSpan::cover(op.span, operand.span);
        e.operands.push_back(std::move(operand));
        return e;
    }
    return parse_primary();
}

Expr ContractParser::parse_primary() {
    Token tok = peek();

    switch (tok.type) {
        case TokenType::NUMBER: {
            advance();
            // Digits only, so the only failure mode is overflow
            uint64_t value = 0;
            for (char c : tok.text) {
                uint64_t digit = static_cast<uint64_t>(c - '0');
                if (value > (static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) - digit) / 10) {
                    error_at(tok, "Integer literal '" + tok.text + "' is out of range");
                }
                value = value * 10 + digit;
            }
            return Expr::int_literal(static_cast<int64_t>(value), tok.span);
        }

        case TokenType::HEX: {
            advance();
            auto bytes = from_hex(tok.text);
            if (!bytes) {
                error_at(tok, "Malformed hex literal '" + tok.text + "'");
            }
            return Expr::bytes_literal(*bytes, tok.span);
        }

        case TokenType::STRING:
            advance();
            return Expr::string_literal(tok.text, tok.span);

        case TokenType::KEYWORD_TRUE:
            advance();
            return Expr::bool_literal(true, tok.span);

        case TokenType::KEYWORD_FALSE:
            advance();
            return Expr::bool_literal(false, tok.span);

        case TokenType::LPAREN: {
            advance();
            Expr inner = parse_expression();
            Token close = expect(TokenType::RPAREN, "')'");
            inner.span = SourceSpan::cover(tok.span, close.span);
            return inner;
        }

        case TokenType::IDENTIFIER: {
            advance();
            Expr e;
            e.text = tok.text;
            if (peek().type == TokenType::LPAREN) {
                e.kind = ExprKind::CALL;
                e.operands = parse_call_arguments();
                e.span = SourceSpan::cover(tok.span, tokens_[pos_ - 1].span);
            } else {
                e.kind = ExprKind::IDENTIFIER;
                e.span = tok.span;
            }
            return e;
        }

        default:
            error_at(tok, "Expected an expression, got " + describe_token(tok.text));
    }
}

std::vector<Expr> ContractParser::parse_call_arguments() {
    std::vector<Expr> args;
    expect(TokenType::LPAREN, "'(' to open the argument list");
    if (match(TokenType::RPAREN)) {
        return args;
    }
    args.push_back(parse_expression());
    while (match(TokenType::COMMA)) {
        args.push_back(parse_expression());
    }
    expect(TokenType::RPAREN, "')' to close the argument list");
    return args;
}

}  // namespace sil
