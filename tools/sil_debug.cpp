// ==============================================================================
// sil-debug - SilverScript Debugger Command Line
// ==============================================================================
// Usage:
//   sil-debug <contract.sil> [--function f] [--ctor-arg v]... [--arg v]...
//             [--no-selector] [--mode outline|input|trace] [--out file]
//   sil-debug --mode keygen
//
// Modes:
//   outline  Contract name, constructor parameters and entrypoints
//   input    Hex of the unlocking input for one call
//   trace    Source-level and opcode-level step trace of one call (default)
//   keygen   A fresh key pair for signing arguments
//
// Diagnostics go to stderr; results go to stdout or the --out file.
// ==============================================================================

#include "trace_builder.hpp"
#include "value_formatter.hpp"
#include "error.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace sil;

namespace {

enum class Mode { OUTLINE, INPUT, TRACE, KEYGEN };

struct CliOptions {
    std::string contract_path;
    std::string out_path;
    Mode mode = Mode::TRACE;
    TraceRequest request;
};

void print_usage(std::ostream& os) {
    os << "Usage: sil-debug <contract.sil> [options]\n"
       << "       sil-debug --mode keygen\n"
       << "\n"
       << "Options:\n"
       << "  --function <name>   Entrypoint to call (default: the first one)\n"
       << "  --ctor-arg <value>  Constructor argument, repeat in order\n"
       << "  --arg <value>       Function argument, repeat in order\n"
       << "  --no-selector       Require a contract with a single entrypoint\n"
       << "  --mode <mode>       outline | input | trace | keygen (default: trace)\n"
       << "  --out <file>        Write the result to a file instead of stdout\n"
       << "  --max-steps <n>     Stop a trace after n instructions\n"
       << "  --help              Show this message\n"
       << "\n"
       << "A sig/datasig argument given as a 32-byte secret key is signed automatically.\n";
}

bool parse_mode(const std::string& text, Mode& mode) {
    if (text == "outline") { mode = Mode::OUTLINE; return true; }
    if (text == "input")   { mode = Mode::INPUT; return true; }
    if (text == "trace")   { mode = Mode::TRACE; return true; }
    if (text == "keygen")  { mode = Mode::KEYGEN; return true; }
    return false;
}

bool parse_count(const std::string& text, uint64_t& value) {
    if (text.empty()) return false;
    uint64_t result = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        result = result * 10 + static_cast<uint64_t>(c - '0');
    }
    value = result;
    return true;
}

/**
 * @brief Parse argv into options
 *
 * @return false (after printing a diagnostic) on a usage error
 */
bool parse_command_line(int argc, char** argv, CliOptions& opts, bool& show_help) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "error: " << arg << " requires a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            show_help = true;
            return true;
        } else if (arg == "--function") {
            if (!next_value(opts.request.function_name)) return false;
        } else if (arg == "--ctor-arg") {
            if (!next_value(value)) return false;
            opts.request.ctor_args.push_back(value);
        } else if (arg == "--arg") {
            if (!next_value(value)) return false;
            opts.request.args.push_back(value);
        } else if (arg == "--no-selector") {
            opts.request.expect_no_selector = true;
        } else if (arg == "--mode") {
            if (!next_value(value)) return false;
            if (!parse_mode(value, opts.mode)) {
                std::cerr << "error: unknown mode '" << value << "'\n";
                return false;
            }
        } else if (arg == "--out") {
            if (!next_value(opts.out_path)) return false;
        } else if (arg == "--max-steps") {
            if (!next_value(value)) return false;
            if (!parse_count(value, opts.request.session_options.max_steps)) {
                std::cerr << "error: invalid step count '" << value << "'\n";
                return false;
            }
        } else if (starts_with(arg, "--")) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            return false;
        } else if (opts.contract_path.empty()) {
            opts.contract_path = arg;
        } else {
            std::cerr << "error: unexpected argument '" << arg << "'\n";
            return false;
        }
    }

    if (opts.contract_path.empty() && opts.mode != Mode::KEYGEN) {
        std::cerr << "error: no contract file given\n";
        return false;
    }
    return true;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw FileError(path, "Could not open contract file");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// ==============================================================================
// Text Rendering
// ==============================================================================

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

std::string render_params(const std::vector<AbiParam>& params) {
    std::vector<std::string> parts;
    for (const auto& param : params) {
        parts.push_back(param.type_name + " " + param.name);
    }
    return join(parts);
}

std::string selector_text(const std::optional<size_t>& selector) {
    return selector ? std::to_string(*selector) : "none";
}

void render_outline(std::ostream& os, const ContractOutline& outline) {
    os << "contract " << outline.contract_name << "("
       << render_params(outline.constructor_params) << ")\n";
    os << "selector dispatch: " << (outline.without_selector ? "no" : "yes") << "\n";
    for (const auto& function : outline.functions) {
        os << "  [" << selector_text(function.selector_index) << "] "
           << function.name << "(" << render_params(function.params) << ")\n";
    }
}

void render_unlocking(std::ostream& os, const UnlockingResult& result) {
    os << "contract: " << result.contract_name << "\n"
       << "function: " << result.function_name << "\n"
       << "selector: " << selector_text(result.selector_index) << "\n"
       << "input (" << result.input_len << " bytes): " << result.input_hex << "\n";
}

void render_step(std::ostream& os, size_t number, const StepSnapshot& step,
                 const std::vector<std::string>& source_lines) {
    os << "#" << number << " pc=" << step.pc << " offset=" << step.byte_offset
       << " last=" << step.last_opcode.value_or("-");
    if (step.mapping) {
        os << " " << step.mapping->kind_label() << "@" << step.mapping->span.to_string()
           << " seq=" << *step.sequence << " frame=" << *step.frame_id
           << " depth=" << *step.call_depth;
    }
    if (!step.is_executing) {
        os << " (finished)";
    }
    os << "\n";

    if (!step.call_stack.empty()) {
        std::string chain;
        for (size_t i = 0; i < step.call_stack.size(); i++) {
            if (i > 0) chain += " > ";
            chain += step.call_stack[i];
        }
        os << "    in " << chain << "\n";
    }
    if (step.mapping) {
        LineNumber line = step.mapping->span.line;
        if (line >= 1 && line <= source_lines.size()) {
            os << "    | " << trim(source_lines[line - 1]) << "\n";
        }
    }
    for (const auto& var : step.vars) {
        os << "    " << var.origin << " " << var.type_name << " " << var.name
           << " = " << var.value << "\n";
    }
    os << "    stack " << format_stack(step.stacks.main);
    if (!step.stacks.alt.empty()) {
        os << " alt " << format_stack(step.stacks.alt);
    }
    os << "\n";
    if (step.error) {
        os << "    error: " << *step.error << "\n";
    }
}

void render_trace(std::ostream& os, const Trace& trace) {
    const TraceMeta& meta = trace.meta;
    os << "contract: " << meta.contract_name << "\n"
       << "function: " << meta.function_name
       << " (selector " << selector_text(meta.selector_index) << ")\n"
       << "constructor args: [" << join(meta.ctor_args) << "]\n"
       << "args: [" << join(meta.args) << "]\n"
       << "input (" << meta.input_len << " bytes): " << meta.input_hex << "\n"
       << "script: " << meta.script_len << " bytes, " << meta.opcode_count << " opcodes\n";

    std::vector<std::string> lines;
    std::istringstream stream(trace.source);
    for (std::string line; std::getline(stream, line);) {
        lines.push_back(line);
    }

    os << "\n== Source steps (" << meta.source_step_count << ") ==\n";
    for (size_t i = 0; i < trace.source_steps.size(); i++) {
        render_step(os, i, trace.source_steps[i], lines);
    }

    os << "\n== Opcodes ==\n";
    for (const auto& op : trace.opcodes) {
        os << "  " << op.index << "  " << segment_to_string(op.segment) << "+" << op.byte_offset
           << "  " << op.display;
        if (op.mapping) {
            os << "  ; " << op.mapping->kind_label() << " " << op.mapping->span.to_string();
        }
        os << "\n";
    }

    os << "\n== Opcode steps (" << meta.opcode_step_count << ") ==\n";
    for (size_t i = 0; i < trace.opcode_steps.size(); i++) {
        render_step(os, i, trace.opcode_steps[i], lines);
    }
}

void render_keys(std::ostream& os, const GeneratedKeys& keys) {
    os << "secret key:      0x" << keys.secret_key_hex << "\n"
       << "public key:      0x" << keys.public_key_hex << "\n"
       << "public key hash: 0x" << keys.public_key_hash_hex << "\n";
}

void run(const CliOptions& opts, std::ostream& os) {
    if (opts.mode == Mode::KEYGEN) {
        render_keys(os, generate_keys());
        return;
    }

    TraceRequest request = opts.request;
    request.source = read_file(opts.contract_path);

    switch (opts.mode) {
        case Mode::OUTLINE:
            render_outline(os, outline_contract(request.source));
            break;
        case Mode::INPUT:
            render_unlocking(os, build_unlocking_from_source(request));
            break;
        case Mode::TRACE:
        default:
            render_trace(os, build_trace_from_source(request));
            break;
    }
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    bool show_help = false;
    if (!parse_command_line(argc, argv, opts, show_help)) {
        print_usage(std::cerr);
        return 2;
    }
    if (show_help) {
        print_usage(std::cout);
        return 0;
    }

    try {
        if (opts.out_path.empty()) {
            run(opts, std::cout);
        } else {
            std::ofstream out(opts.out_path);
            if (!out) {
                throw FileError(opts.out_path, "Could not open output file");
            }
            run(opts, out);
        }
    } catch (const SilError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
