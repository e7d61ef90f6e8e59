// ==============================================================================
// SilverScript Compiler - Implementation
// ==============================================================================

#include "compiler.hpp"
#include "contract_parser.hpp"
#include "typed_args.hpp"
#include "script.hpp"
#include "error.hpp"
#include <map>
#include <set>

namespace sil {

// ==============================================================================
// Compiler Output
// ==============================================================================

std::vector<std::string> FunctionSignature::type_names() const {
    std::vector<std::string> names;
    names.reserve(params.size());
    for (const auto& param : params) {
        names.push_back(param.type_name);
    }
    return names;
}

const FunctionSignature* CompiledProgram::find_function(const std::string& name) const {
    for (const auto& signature : abi) {
        if (signature.name == name) {
            return &signature;
        }
    }
    return nullptr;
}

namespace {

// ==============================================================================
// Type Rules
// ==============================================================================

TypeRef make_type(BaseType base, size_t size = 0) {
    TypeRef type;
    type.base = base;
    type.size = size;
    return type;
}

const TypeRef INT_TYPE = make_type(BaseType::INT);
const TypeRef BOOL_TYPE = make_type(BaseType::BOOL);
const TypeRef STRING_TYPE = make_type(BaseType::STRING);
const TypeRef BYTES_TYPE = make_type(BaseType::BYTES);
const TypeRef SIG_TYPE = make_type(BaseType::SIG);
const TypeRef PUBKEY_TYPE = make_type(BaseType::PUBKEY);

// Known byte length of an expression type, if any
std::optional<size_t> static_length(const TypeRef& type) {
    if (type.base == BaseType::BYTES_N) return type.size;
    return fixed_byte_length(type);
}

/**
 * @brief Can a value of type `source` be stored in a slot of type `target`?
 *
 * Byte types convert when their lengths are known to agree, so a hex
 * literal of 32 bytes can initialise a pubkey, and every byte type widens
 * to plain bytes.
 */
bool is_assignable(const TypeRef& target, const TypeRef& source) {
    if (target == source) {
        return true;
    }
    if (!is_byte_like(target) || !is_byte_like(source) || source.base == BaseType::STRING) {
        return false;
    }

    auto length = static_length(source);
    switch (target.base) {
        case BaseType::BYTES:
            return true;
        case BaseType::BYTE:
        case BaseType::BYTES_N:
        case BaseType::PUBKEY:
            return length && length == static_length(target);
        case BaseType::SIG:
        case BaseType::DATASIG:
            return source.base == BaseType::SIG || source.base == BaseType::DATASIG ||
                   (length && (*length == 64 || *length == 65));
        default:
            return false;
    }
}

bool is_equatable(const TypeRef& a, const TypeRef& b) {
    if (a.base == BaseType::INT || b.base == BaseType::INT) {
        return a.base == b.base;
    }
    if (a.base == BaseType::BOOL || b.base == BaseType::BOOL) {
        return a.base == b.base;
    }
    return is_byte_like(a) && is_byte_like(b);
}

// ==============================================================================
// Builtins
// ==============================================================================

enum class ArgRule { INT, SIG, PUBKEY, ANY_BYTES };

struct BuiltinSpec {
    const char* name;
    std::vector<ArgRule> args;
    Opcode opcode;
    TypeRef result;
};

const std::vector<BuiltinSpec>& builtins() {
    static const std::vector<BuiltinSpec> specs = {
        {"checkSig", {ArgRule::SIG, ArgRule::PUBKEY}, Opcode::OP_CHECKSIG, BOOL_TYPE},
        {"sha256", {ArgRule::ANY_BYTES}, Opcode::OP_SHA256, make_type(BaseType::BYTES_N, 32)},
        {"abs", {ArgRule::INT}, Opcode::OP_ABS, INT_TYPE},
        {"min", {ArgRule::INT, ArgRule::INT}, Opcode::OP_MIN, INT_TYPE},
        {"max", {ArgRule::INT, ArgRule::INT}, Opcode::OP_MAX, INT_TYPE},
        {"within", {ArgRule::INT, ArgRule::INT, ArgRule::INT}, Opcode::OP_WITHIN, BOOL_TYPE},
    };
    return specs;
}

const BuiltinSpec* find_builtin(const std::string& name) {
    for (const auto& spec : builtins()) {
        if (name == spec.name) {
            return &spec;
        }
    }
    return nullptr;
}

bool satisfies(ArgRule rule, const TypeRef& type) {
    switch (rule) {
        case ArgRule::INT:       return type == INT_TYPE;
        case ArgRule::SIG:       return is_assignable(SIG_TYPE, type);
        case ArgRule::PUBKEY:    return is_assignable(PUBKEY_TYPE, type);
        case ArgRule::ANY_BYTES: return is_byte_like(type);
        default:                 return false;
    }
}

const char* arg_rule_to_string(ArgRule rule) {
    switch (rule) {
        case ArgRule::INT:       return "int";
        case ArgRule::SIG:       return "sig";
        case ArgRule::PUBKEY:    return "pubkey";
        case ArgRule::ANY_BYTES: return "bytes";
        default:                 return "?";
    }
}

/**
 * @brief Resolve a declared type name, rejecting unknown and array types
 */
TypeRef resolve_declared_type(const std::string& type_name, const SourceSpan& span) {
    auto type = parse_type_name(type_name);
    if (!type) {
        throw CompileError(span, "unknown type '" + type_name + "'");
    }
    if (type->is_array) {
        throw CompileError(span, "array type '" + type_name + "' is not supported");
    }
    return *type;
}

// ==============================================================================
// Lowering Context
// ==============================================================================

struct LocalVar {
    std::string name;
    TypeRef type;
    size_t slot = 0;
    size_t debug_index = 0;     // Index into the debug table's variables
};

struct FrameState {
    uint32_t frame_id = 0;
    uint32_t call_depth = 0;
    std::string function_name;
    std::vector<std::vector<LocalVar>> scopes;  // scopes[0] holds the parameters
    size_t debug_frame_index = 0;
};

struct Constant {
    TypeRef type;
    Bytes value;
};

/**
 * @brief Per-compilation state threaded through the lowering pass
 *
 * Holds the sequence and frame-id counters, so separate compilations never
 * share anything.
 */
class Lowering {
public:
    Lowering(const ContractAst& contract, const CompileOptions& options)
        : contract_(contract)
        , options_(options)
    {}

    CompiledProgram run(const std::vector<Expr>& constructor_args);

private:
    // Declarations
    void check_declarations();
    void bind_constants(const std::vector<Expr>& args, CompiledProgram& program);

    // Entrypoints
    void emit_dispatch(const std::vector<const FunctionAst*>& entries);
    void emit_entrypoint(const FunctionAst& function);

    // Statements
    void compile_block(const std::vector<Statement>& body, const SourceSpan& span);
    void compile_statement(const Statement& stmt);
    void compile_var_decl(const Statement& stmt);
    void compile_assign(const Statement& stmt);
    void compile_require(const Statement& stmt);
    void compile_if(const Statement& stmt);
    void compile_call(const Statement& stmt);

    // Expressions (each pushes exactly one item)
    TypeRef compile_expr(const Expr& expr);
    TypeRef compile_identifier(const Expr& expr);
    TypeRef compile_unary(const Expr& expr);
    TypeRef compile_binary(const Expr& expr);
    TypeRef compile_builtin_call(const Expr& expr);

    // Scopes
    void push_scope() { frames_.back().scopes.emplace_back(); }
    void pop_scope(const SourceSpan& span);
    const LocalVar* find_local(const std::string& name) const;
    void declare_variable(const std::string& name, const TypeRef& type,
                          VariableOrigin origin, size_t slot);

    // Emission
    void emit(Opcode op);
    void emit_int(int64_t value);
    void emit_data(const Bytes& data);
    void record_mapping(size_t offset);
    void emit_read_slot(size_t slot);
    void emit_store_slot(size_t slot);

    // Mapping context
    void begin_statement(const SourceSpan& span);
    void begin_synthetic(const SourceSpan& span, const std::string& label);
    void end_mapping() { mapping_active_ = false; }
    uint32_t last_sequence() const { return next_sequence_ - 1; }

    const ContractAst& contract_;
    CompileOptions options_;

    ScriptBuilder builder_;
    DebugTable table_;
    uint32_t next_sequence_ = 1;
    uint32_t next_frame_id_ = 1;

    std::map<std::string, Constant> constants_;
    std::map<std::string, const FunctionAst*> functions_;
    std::vector<FrameState> frames_;
    std::vector<std::string> call_chain_;
    size_t stack_depth_ = 0;   // Items on the main stack at this point

    // Mapping context for the next emitted instruction
    bool mapping_active_ = false;
    bool boundary_pending_ = false;
    MappingKind mapping_kind_ = MappingKind::EXPRESSION;
    std::string synthetic_label_;
    SourceSpan statement_span_;
    SourceSpan expr_span_;
};

// ==============================================================================
// Top Level
// ==============================================================================

CompiledProgram Lowering::run(const std::vector<Expr>& constructor_args) {
    CompiledProgram program;
    program.contract_name = contract_.name;

    check_declarations();
    program.abi = entrypoint_signatures(contract_);
    program.without_selector = (program.abi.size() == 1);
    bind_constants(constructor_args, program);

    std::vector<const FunctionAst*> entries = contract_.entrypoints();
    if (program.without_selector) {
        stack_depth_ = entries[0]->params.size();
        emit_entrypoint(*entries[0]);
    } else {
        emit_dispatch(entries);
    }

    program.bytecode = builder_.script();
    program.debug_info = std::move(table_);
    return program;
}

void Lowering::check_declarations() {
    std::set<std::string> seen;
    for (const auto& function : contract_.functions) {
        if (!seen.insert(function.name).second) {
            throw CompileError(function.span, "duplicate function name '" + function.name + "'");
        }
        if (find_builtin(function.name)) {
            throw CompileError(function.span, "function name '" + function.name +
                                              "' collides with a builtin");
        }
        functions_[function.name] = &function;

        std::set<std::string> param_names;
        for (const auto& param : function.params) {
            resolve_declared_type(param.type_name, param.span);
            if (!param_names.insert(param.name).second) {
                throw CompileError(param.span, "duplicate parameter '" + param.name +
                                               "' in function '" + function.name + "'");
            }
        }
    }

    std::set<std::string> ctor_names;
    for (const auto& param : contract_.params) {
        resolve_declared_type(param.type_name, param.span);
        if (!ctor_names.insert(param.name).second) {
            throw CompileError(param.span, "duplicate constructor parameter '" + param.name + "'");
        }
    }
}

void Lowering::bind_constants(const std::vector<Expr>& args, CompiledProgram& program) {
    if (args.size() != contract_.params.size()) {
        throw CompileError(contract_.span, build_error_message(
            "constructor expects ", contract_.params.size(), " arguments, got ", args.size()));
    }

    for (size_t i = 0; i < args.size(); i++) {
        const Param& param = contract_.params[i];
        TypeRef type = resolve_declared_type(param.type_name, param.span);

        Constant constant;
        constant.type = type;
        try {
            constant.value = encode_typed_value(type, args[i]);
        } catch (const InputError& e) {
            throw CompileError(param.span, "constructor argument '" + param.name + "': " +
                                           e.message());
        }

        DebugVariable variable;
        variable.name = param.name;
        variable.origin = VariableOrigin::CONSTANT;
        variable.type_name = param.type_name;
        variable.constant_value = constant.value;
        table_.add_variable(std::move(variable));

        constants_[param.name] = std::move(constant);
        program.constructor_params.push_back({param.name, param.type_name});
    }
}

// ==============================================================================
// Entrypoints
// ==============================================================================

void Lowering::emit_dispatch(const std::vector<const FunctionAst*>& entries) {
    // Input: <selector> <args...>. Bring the selector from the bottom to the top.
    end_mapping();
    emit(Opcode::OP_DEPTH);
    emit(Opcode::OP_1SUB);
    emit(Opcode::OP_ROLL);

    for (size_t i = 0; i < entries.size(); i++) {
        end_mapping();
        emit(Opcode::OP_DUP);
        emit_int(static_cast<int64_t>(i));
        emit(Opcode::OP_NUMEQUAL);
        emit(Opcode::OP_IF);
        emit(Opcode::OP_DROP);

        stack_depth_ = entries[i]->params.size();
        emit_entrypoint(*entries[i]);

        end_mapping();
        emit(Opcode::OP_ELSE);
    }

    // No selector matched
    emit(Opcode::OP_RETURN);
    for (size_t i = 0; i < entries.size(); i++) {
        emit(Opcode::OP_ENDIF);
    }
}

void Lowering::emit_entrypoint(const FunctionAst& function) {
    FrameState frame;
    frame.frame_id = 0;
    frame.call_depth = 0;
    frame.function_name = function.name;
    frame.debug_frame_index = table_.frames().size();

    DebugFrame debug_frame;
    debug_frame.frame_id = 0;
    debug_frame.function_name = function.name;
    debug_frame.call_depth = 0;
    debug_frame.first_sequence = next_sequence_;
    table_.add_frame(debug_frame);

    frames_.push_back(frame);
    call_chain_.push_back(function.name);
    push_scope();

    // Arguments already sit in slots 0..n-1
    for (size_t i = 0; i < function.params.size(); i++) {
        const Param& param = function.params[i];
        declare_variable(param.name, resolve_declared_type(param.type_name, param.span),
                         VariableOrigin::ARGUMENT, i);
    }

    compile_block(function.body, function.span);

    uint32_t last = last_sequence();
    table_.frame_at(frames_.back().debug_frame_index).last_sequence = last;
    for (const auto& param : frames_.back().scopes.front()) {
        table_.variable_at(param.debug_index).dead_after_sequence = last;
    }

    // Epilogue: clear the arguments and leave a single true value
    end_mapping();
    for (size_t i = 0; i < function.params.size(); i++) {
        emit(Opcode::OP_DROP);
    }
    emit(Opcode::OP_1);
    stack_depth_ = 0;

    call_chain_.pop_back();
    frames_.pop_back();
}

// ==============================================================================
// Statements
// ==============================================================================

void Lowering::compile_block(const std::vector<Statement>& body, const SourceSpan& span) {
    push_scope();
    for (const auto& stmt : body) {
        compile_statement(stmt);
    }
    pop_scope(span);
}

void Lowering::compile_statement(const Statement& stmt) {
    switch (stmt.kind) {
        case StmtKind::VAR_DECL: compile_var_decl(stmt); break;
        case StmtKind::ASSIGN:   compile_assign(stmt); break;
        case StmtKind::REQUIRE:  compile_require(stmt); break;
        case StmtKind::IF:       compile_if(stmt); break;
        case StmtKind::CALL:     compile_call(stmt); break;
        default:
            throw InternalError("unhandled statement kind");
    }
}

void Lowering::compile_var_decl(const Statement& stmt) {
    TypeRef type = resolve_declared_type(stmt.type_name, stmt.span);

    if (find_local(stmt.name)) {
        throw CompileError(stmt.span, "variable '" + stmt.name + "' is already declared");
    }
    if (constants_.count(stmt.name)) {
        throw CompileError(stmt.span, "variable '" + stmt.name +
                                      "' shadows a constructor parameter");
    }

    begin_statement(stmt.span);
    TypeRef value_type = compile_expr(stmt.exprs[0]);
    if (!is_assignable(type, value_type)) {
        throw CompileError(stmt.exprs[0].span, "cannot initialise '" + stmt.name + "' of type " +
                                               type.to_string() + " with a value of type " +
                                               value_type.to_string());
    }

    declare_variable(stmt.name, type, VariableOrigin::LOCAL, stack_depth_ - 1);
}

void Lowering::compile_assign(const Statement& stmt) {
    const LocalVar* target = find_local(stmt.name);
    if (!target) {
        if (constants_.count(stmt.name)) {
            throw CompileError(stmt.span, "cannot assign to constructor parameter '" +
                                          stmt.name + "'");
        }
        throw CompileError(stmt.span, "undefined variable '" + stmt.name + "'");
    }
    size_t slot = target->slot;
    TypeRef type = target->type;

    begin_statement(stmt.span);
    TypeRef value_type = compile_expr(stmt.exprs[0]);
    if (!is_assignable(type, value_type)) {
        throw CompileError(stmt.exprs[0].span, "cannot assign a value of type " +
                                               value_type.to_string() + " to '" + stmt.name +
                                               "' of type " + type.to_string());
    }

    expr_span_ = stmt.span;
    emit_store_slot(slot);
}

void Lowering::compile_require(const Statement& stmt) {
    begin_statement(stmt.span);
    TypeRef type = compile_expr(stmt.exprs[0]);
    if (type != BOOL_TYPE) {
        throw CompileError(stmt.exprs[0].span, "require condition must be bool, got " +
                                               type.to_string());
    }
    expr_span_ = stmt.span;
    emit(Opcode::OP_VERIFY);
    stack_depth_--;
}

void Lowering::compile_if(const Statement& stmt) {
    begin_statement(stmt.span);
    TypeRef type = compile_expr(stmt.exprs[0]);
    if (type != BOOL_TYPE) {
        throw CompileError(stmt.exprs[0].span, "if condition must be bool, got " +
                                               type.to_string());
    }
    expr_span_ = stmt.span;
    emit(Opcode::OP_IF);
    stack_depth_--;

    compile_block(stmt.then_body, stmt.span);

    if (!stmt.else_body.empty()) {
        begin_synthetic(stmt.span, "else");
        emit(Opcode::OP_ELSE);
        compile_block(stmt.else_body, stmt.span);
    }

    begin_synthetic(stmt.span, "endif");
    emit(Opcode::OP_ENDIF);
}

void Lowering::compile_call(const Statement& stmt) {
    if (find_builtin(stmt.name)) {
        throw CompileError(stmt.span, "builtin '" + stmt.name +
                                      "' returns a value and cannot be used as a statement");
    }
    auto it = functions_.find(stmt.name);
    if (it == functions_.end()) {
        throw CompileError(stmt.span, "undefined function '" + stmt.name + "'");
    }
    const FunctionAst& callee = *it->second;
    if (callee.entrypoint) {
        throw CompileError(stmt.span, "cannot call entrypoint function '" + stmt.name + "'");
    }
    for (const auto& active : call_chain_) {
        if (active == callee.name) {
            throw CompileError(stmt.span, "recursive call to '" + callee.name +
                                          "' cannot be inlined");
        }
    }
    if (frames_.size() > options_.max_inline_depth) {
        throw CompileError(stmt.span, build_error_message(
            "call to '", callee.name, "' exceeds the maximum inline depth of ",
            options_.max_inline_depth));
    }
    if (stmt.exprs.size() != callee.params.size()) {
        throw CompileError(stmt.span, build_error_message(
            "function '", callee.name, "' expects ", callee.params.size(),
            " arguments, got ", stmt.exprs.size()));
    }

    // Arguments are evaluated in the caller and become the callee's parameter slots
    begin_statement(stmt.span);
    size_t base_slot = stack_depth_;
    std::vector<TypeRef> param_types;
    for (size_t i = 0; i < callee.params.size(); i++) {
        const Param& param = callee.params[i];
        TypeRef param_type = resolve_declared_type(param.type_name, param.span);
        TypeRef arg_type = compile_expr(stmt.exprs[i]);
        if (!is_assignable(param_type, arg_type)) {
            throw CompileError(stmt.exprs[i].span, build_error_message(
                "argument ", i + 1, " of '", callee.name, "' expects ",
                param_type.to_string(), ", got ", arg_type.to_string()));
        }
        param_types.push_back(param_type);
    }

    const FrameState& caller = frames_.back();
    uint32_t caller_frame_id = caller.frame_id;

    FrameState frame;
    frame.frame_id = next_frame_id_++;
    frame.call_depth = caller.call_depth + 1;
    frame.function_name = callee.name;
    frame.debug_frame_index = table_.frames().size();

    DebugFrame debug_frame;
    debug_frame.frame_id = frame.frame_id;
    debug_frame.function_name = callee.name;
    debug_frame.parent_frame_id = caller_frame_id;
    debug_frame.call_depth = frame.call_depth;
    debug_frame.first_sequence = next_sequence_;
    table_.add_frame(debug_frame);

    frames_.push_back(frame);
    call_chain_.push_back(callee.name);
    push_scope();
    for (size_t i = 0; i < callee.params.size(); i++) {
        declare_variable(callee.params[i].name, param_types[i], VariableOrigin::ARGUMENT,
                         base_slot + i);
    }

    compile_block(callee.body, callee.span);
    table_.frame_at(frames_.back().debug_frame_index).last_sequence = last_sequence();

    std::vector<LocalVar> params = frames_.back().scopes.front();
    call_chain_.pop_back();
    frames_.pop_back();

    // Back in the caller: drop the callee's parameters
    begin_synthetic(stmt.span, "return");
    for (auto rit = params.rbegin(); rit != params.rend(); ++rit) {
        emit(Opcode::OP_DROP);
        stack_depth_--;
        table_.variable_at(rit->debug_index).dead_after_sequence = last_sequence();
    }
}

// ==============================================================================
// Expressions
// ==============================================================================

TypeRef Lowering::compile_expr(const Expr& expr) {
    SourceSpan saved = expr_span_;
    expr_span_ = expr.span;
    TypeRef result;

    switch (expr.kind) {
        case ExprKind::INT_LITERAL:
            emit_int(expr.int_value);
            stack_depth_++;
            result = INT_TYPE;
            break;

        case ExprKind::BOOL_LITERAL:
            emit(expr.bool_value ? Opcode::OP_1 : Opcode::OP_0);
            stack_depth_++;
            result = BOOL_TYPE;
            break;

        case ExprKind::BYTES_LITERAL:
            emit_data(expr.bytes_value);
            stack_depth_++;
            if (expr.bytes_value.empty() || expr.bytes_value.size() > 520) {
                result = BYTES_TYPE;
            } else {
                result = make_type(BaseType::BYTES_N, expr.bytes_value.size());
            }
            break;

        case ExprKind::STRING_LITERAL:
            emit_data(Bytes(expr.text.begin(), expr.text.end()));
            stack_depth_++;
            result = STRING_TYPE;
            break;

        case ExprKind::IDENTIFIER:
            result = compile_identifier(expr);
            break;

        case ExprKind::UNARY:
            result = compile_unary(expr);
            break;

        case ExprKind::BINARY:
            result = compile_binary(expr);
            break;

        case ExprKind::CALL:
            result = compile_builtin_call(expr);
            break;

        default:
            throw InternalError("unhandled expression kind");
    }

    expr_span_ = saved;
    return result;
}

TypeRef Lowering::compile_identifier(const Expr& expr) {
    if (const LocalVar* local = find_local(expr.text)) {
        emit_read_slot(local->slot);
        return local->type;
    }

    auto it = constants_.find(expr.text);
    if (it != constants_.end()) {
        // Constructor arguments are folded in place
        emit_data(it->second.value);
        stack_depth_++;
        return it->second.type;
    }

    if (functions_.count(expr.text) || find_builtin(expr.text)) {
        throw CompileError(expr.span, "function '" + expr.text + "' used as a value");
    }
    throw CompileError(expr.span, "undefined identifier '" + expr.text + "'");
}

TypeRef Lowering::compile_unary(const Expr& expr) {
    const Expr& operand = expr.operands[0];

    if (expr.unary_op == UnaryOp::NEGATE && operand.kind == ExprKind::INT_LITERAL) {
        emit_int(-operand.int_value);
        stack_depth_++;
        return INT_TYPE;
    }

    TypeRef type = compile_expr(operand);
    if (expr.unary_op == UnaryOp::NOT) {
        if (type != BOOL_TYPE) {
            throw CompileError(expr.span, "operator '!' expects bool, got " + type.to_string());
        }
        emit(Opcode::OP_NOT);
        return BOOL_TYPE;
    }

    if (type != INT_TYPE) {
        throw CompileError(expr.span, "operator '-' expects int, got " + type.to_string());
    }
    emit(Opcode::OP_NEGATE);
    return INT_TYPE;
}

TypeRef Lowering::compile_binary(const Expr& expr) {
    TypeRef left = compile_expr(expr.operands[0]);
    TypeRef right = compile_expr(expr.operands[1]);
    BinaryOp op = expr.binary_op;
    const char* op_text = binary_op_to_string(op);

    auto mismatch = [&]() {
        return CompileError(expr.span, std::string("operator '") + op_text +
                                       "' cannot be applied to " + left.to_string() +
                                       " and " + right.to_string());
    };

    // Both operands are consumed, one result is pushed
    stack_depth_--;

    switch (op) {
        case BinaryOp::ADD:
            if (left == INT_TYPE && right == INT_TYPE) {
                emit(Opcode::OP_ADD);
                return INT_TYPE;
            }
            if (left == STRING_TYPE && right == STRING_TYPE) {
                emit(Opcode::OP_CAT);
                return STRING_TYPE;
            }
            if (is_byte_like(left) && is_byte_like(right) &&
                left != STRING_TYPE && right != STRING_TYPE) {
                emit(Opcode::OP_CAT);
                auto l = static_length(left);
                auto r = static_length(right);
                if (l && r && *l + *r <= 520) {
                    return make_type(BaseType::BYTES_N, *l + *r);
                }
                return BYTES_TYPE;
            }
            throw mismatch();

        case BinaryOp::SUB:
        case BinaryOp::MUL:
        case BinaryOp::DIV:
        case BinaryOp::MOD:
        case BinaryOp::LT:
        case BinaryOp::LE:
        case BinaryOp::GT:
        case BinaryOp::GE: {
            if (left != INT_TYPE || right != INT_TYPE) {
                throw mismatch();
            }
            static const std::map<BinaryOp, Opcode> numeric = {
                {BinaryOp::SUB, Opcode::OP_SUB},
                {BinaryOp::MUL, Opcode::OP_MUL},
                {BinaryOp::DIV, Opcode::OP_DIV},
                {BinaryOp::MOD, Opcode::OP_MOD},
                {BinaryOp::LT, Opcode::OP_LESSTHAN},
                {BinaryOp::LE, Opcode::OP_LESSTHANOREQUAL},
                {BinaryOp::GT, Opcode::OP_GREATERTHAN},
                {BinaryOp::GE, Opcode::OP_GREATERTHANOREQUAL},
            };
            emit(numeric.at(op));
            bool comparison = (op == BinaryOp::LT || op == BinaryOp::LE ||
                               op == BinaryOp::GT || op == BinaryOp::GE);
            return comparison ? BOOL_TYPE : INT_TYPE;
        }

        case BinaryOp::EQ:
        case BinaryOp::NE:
            if (!is_equatable(left, right)) {
                throw mismatch();
            }
            if (left == INT_TYPE) {
                emit(op == BinaryOp::EQ ? Opcode::OP_NUMEQUAL : Opcode::OP_NUMNOTEQUAL);
            } else {
                emit(Opcode::OP_EQUAL);
                if (op == BinaryOp::NE) {
                    emit(Opcode::OP_NOT);
                }
            }
            return BOOL_TYPE;

        case BinaryOp::AND:
        case BinaryOp::OR:
            if (left != BOOL_TYPE || right != BOOL_TYPE) {
                throw mismatch();
            }
            emit(op == BinaryOp::AND ? Opcode::OP_BOOLAND : Opcode::OP_BOOLOR);
            return BOOL_TYPE;

        default:
            throw InternalError("unhandled binary operator");
    }
}

TypeRef Lowering::compile_builtin_call(const Expr& expr) {
    const BuiltinSpec* spec = find_builtin(expr.text);
    if (!spec) {
        if (functions_.count(expr.text)) {
            throw CompileError(expr.span, "function '" + expr.text +
                                          "' does not return a value and can only be called as a statement");
        }
        throw CompileError(expr.span, "undefined function '" + expr.text + "'");
    }
    if (expr.operands.size() != spec->args.size()) {
        throw CompileError(expr.span, build_error_message(
            "builtin '", spec->name, "' expects ", spec->args.size(),
            " arguments, got ", expr.operands.size()));
    }

    for (size_t i = 0; i < expr.operands.size(); i++) {
        TypeRef type = compile_expr(expr.operands[i]);
        if (!satisfies(spec->args[i], type)) {
            throw CompileError(expr.operands[i].span, build_error_message(
                "argument ", i + 1, " of '", spec->name, "' expects ",
                arg_rule_to_string(spec->args[i]), ", got ", type.to_string()));
        }
    }

    emit(spec->opcode);
    stack_depth_ = stack_depth_ - spec->args.size() + 1;
    return spec->result;
}

// ==============================================================================
// Scopes
// ==============================================================================

void Lowering::pop_scope(const SourceSpan& span) {
    std::vector<LocalVar> scope = std::move(frames_.back().scopes.back());
    frames_.back().scopes.pop_back();

    if (scope.empty()) {
        return;
    }

    // Block locals are the topmost items; drop them newest first
    begin_synthetic(span, "cleanup");
    for (auto rit = scope.rbegin(); rit != scope.rend(); ++rit) {
        emit(Opcode::OP_DROP);
        stack_depth_--;
        table_.variable_at(rit->debug_index).dead_after_sequence = last_sequence();
    }
}

const LocalVar* Lowering::find_local(const std::string& name) const {
    if (frames_.empty()) {
        return nullptr;
    }
    const auto& scopes = frames_.back().scopes;
    for (auto scope = scopes.rbegin(); scope != scopes.rend(); ++scope) {
        for (const auto& var : *scope) {
            if (var.name == name) {
                return &var;
            }
        }
    }
    return nullptr;
}

void Lowering::declare_variable(const std::string& name, const TypeRef& type,
                                VariableOrigin origin, size_t slot) {
    FrameState& frame = frames_.back();

    DebugVariable variable;
    variable.name = name;
    variable.origin = origin;
    variable.type_name = type.to_string();
    variable.frame_id = frame.frame_id;
    variable.live_after_sequence = last_sequence();
    variable.dead_after_sequence = last_sequence();
    variable.stack_slot = slot;

    LocalVar local;
    local.name = name;
    local.type = type;
    local.slot = slot;
    local.debug_index = table_.variables().size();
    table_.add_variable(std::move(variable));

    frame.scopes.back().push_back(local);
}

// ==============================================================================
// Emission
// ==============================================================================

void Lowering::begin_statement(const SourceSpan& span) {
    mapping_active_ = true;
    boundary_pending_ = true;
    mapping_kind_ = MappingKind::EXPRESSION;
    synthetic_label_.clear();
    statement_span_ = span;
    expr_span_ = span;
}

void Lowering::begin_synthetic(const SourceSpan& span, const std::string& label) {
    mapping_active_ = true;
    boundary_pending_ = false;
    mapping_kind_ = MappingKind::SYNTHETIC;
    synthetic_label_ = label;
    statement_span_ = span;
    expr_span_ = span;
}

void Lowering::record_mapping(size_t offset) {
    if (!mapping_active_ || frames_.empty()) {
        return;
    }

    const FrameState& frame = frames_.back();
    DebugMapping mapping;
    mapping.byte_offset = offset;
    mapping.sequence = next_sequence_++;
    mapping.frame_id = frame.frame_id;
    mapping.call_depth = frame.call_depth;

    if (boundary_pending_) {
        mapping.kind = MappingKind::STATEMENT;
        mapping.statement_boundary = true;
        mapping.span = statement_span_;
        boundary_pending_ = false;
    } else {
        mapping.kind = mapping_kind_;
        mapping.synthetic_label = synthetic_label_;
        mapping.span = (mapping_kind_ == MappingKind::SYNTHETIC) ? statement_span_ : expr_span_;
    }

    table_.add_mapping(std::move(mapping));
}

void Lowering::emit(Opcode op) {
    record_mapping(builder_.size());
    builder_.add_op(op);
}

void Lowering::emit_int(int64_t value) {
    record_mapping(builder_.size());
    builder_.add_int(value);
}

void Lowering::emit_data(const Bytes& data) {
    record_mapping(builder_.size());
    builder_.add_data(data);
}

void Lowering::emit_read_slot(size_t slot) {
    size_t depth = stack_depth_ - 1 - slot;
    if (depth == 0) {
        emit(Opcode::OP_DUP);
    } else if (depth == 1) {
        emit(Opcode::OP_OVER);
    } else {
        emit_int(static_cast<int64_t>(depth));
        emit(Opcode::OP_PICK);
    }
    stack_depth_++;
}

void Lowering::emit_store_slot(size_t slot) {
    // The new value is on top; the old one is `depth` items below it
    size_t depth = stack_depth_ - 1 - slot;
    size_t above = depth - 1;

    if (depth == 1) {
        emit(Opcode::OP_NIP);
    } else {
        emit_int(static_cast<int64_t>(depth));
        emit(Opcode::OP_ROLL);
        emit(Opcode::OP_DROP);
    }

    // Sink the new value below the items that were above the old one
    for (size_t i = 0; i < above; i++) {
        if (above == 1) {
            emit(Opcode::OP_SWAP);
        } else {
            emit_int(static_cast<int64_t>(above));
            emit(Opcode::OP_ROLL);
        }
    }
    stack_depth_--;
}

}  // namespace

// ==============================================================================
// Public API
// ==============================================================================

std::vector<FunctionSignature> entrypoint_signatures(const ContractAst& contract) {
    std::vector<const FunctionAst*> entries = contract.entrypoints();
    if (entries.empty()) {
        throw CompileError(contract.span, "contract has no entrypoint functions");
    }

    bool without_selector = (entries.size() == 1);
    std::vector<FunctionSignature> abi;
    for (size_t i = 0; i < entries.size(); i++) {
        FunctionSignature signature;
        signature.name = entries[i]->name;
        for (const auto& param : entries[i]->params) {
            signature.params.push_back({param.name, param.type_name});
        }
        if (!without_selector) {
            signature.selector_index = i;
        }
        abi.push_back(std::move(signature));
    }
    return abi;
}

CompiledProgram compile_contract(const ContractAst& contract,
                                 const std::vector<Expr>& constructor_args,
                                 const CompileOptions& options) {
    Lowering lowering(contract, options);
    return lowering.run(constructor_args);
}

CompiledProgram compile_source(const std::string& source,
                               const std::vector<Expr>& constructor_args,
                               const CompileOptions& options) {
    ContractAst contract = parse_contract(source);
    return compile_contract(contract, constructor_args, options);
}

}  // namespace sil
