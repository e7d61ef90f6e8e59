// ==============================================================================
// Debug Information Table
// ==============================================================================
// The side table the compiler emits next to the bytecode. It maps locking
// script byte offsets back to source spans, and records which variables live
// in which stack slot over which range of sequence numbers so the debugger
// can rebuild source-level state at any execution point.
// ==============================================================================

#ifndef SILVERSCRIPT_COMPILER_DEBUG_INFO_HPP
#define SILVERSCRIPT_COMPILER_DEBUG_INFO_HPP

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sil {

// ==============================================================================
// Mappings
// ==============================================================================

enum class MappingKind {
    STATEMENT,      // First instruction of a source statement
    EXPRESSION,     // Any other instruction of a statement
    SYNTHETIC       // Compiler-generated helper (block cleanup, else/endif)
};

/**
 * @brief One mapped instruction of the locking script
 *
 * Sequence numbers start at 1 and strictly increase in emission order,
 * which is also byte-offset order.
 */
struct DebugMapping {
    size_t byte_offset = 0;
    uint32_t sequence = 0;
    uint32_t frame_id = 0;          // 0 = entrypoint body, 1.. = inlined calls
    uint32_t call_depth = 0;
    SourceSpan span;
    bool statement_boundary = false;
    MappingKind kind = MappingKind::EXPRESSION;
    std::string synthetic_label;    // Only for SYNTHETIC ("cleanup", "else", ...)

    /**
     * @brief Short label: "stmt", "expr" or "syn:<label>"
     */
    std::string kind_label() const;
};

// ==============================================================================
// Scope Metadata
// ==============================================================================

/**
 * @brief One concrete instance of a function body in the flattened bytecode
 *
 * Each entrypoint body is frame 0; every inlined call gets its own id.
 * The sequence range covers every mapped instruction inside the frame,
 * including frames inlined into it.
 */
struct DebugFrame {
    uint32_t frame_id = 0;
    std::string function_name;
    std::optional<uint32_t> parent_frame_id;
    uint32_t call_depth = 0;
    uint32_t first_sequence = 0;
    uint32_t last_sequence = 0;

    bool contains(uint32_t sequence) const {
        return sequence >= first_sequence && sequence <= last_sequence;
    }
};

enum class VariableOrigin {
    CONSTANT,   // Constructor parameter, folded into the bytecode
    ARGUMENT,   // Function parameter
    LOCAL       // Local declaration
};

/**
 * @brief Display label: "const", "arg" or "local"
 */
const char* variable_origin_to_string(VariableOrigin origin);

/**
 * @brief Where and when a variable can be read
 *
 * A non-constant variable is visible at (sequence s, frame f) when
 * frame_id == f and live_after_sequence < s <= dead_after_sequence.
 * Its value is the main stack item at stack_slot, counted from the bottom.
 * Constants are visible at every mapped point and carry their value.
 */
struct DebugVariable {
    std::string name;
    VariableOrigin origin = VariableOrigin::LOCAL;
    std::string type_name;
    uint32_t frame_id = 0;
    uint32_t live_after_sequence = 0;
    uint32_t dead_after_sequence = 0;
    std::optional<size_t> stack_slot;
    Bytes constant_value;

    bool is_visible_at(uint32_t sequence, uint32_t frame) const;
};

// ==============================================================================
// Debug Table Class
// ==============================================================================

class DebugTable {
public:
    DebugTable() = default;

    // Building (used by the compiler)
    void add_mapping(DebugMapping mapping);
    void add_frame(DebugFrame frame);
    void add_variable(DebugVariable variable);
    DebugFrame& frame_at(size_t index) { return frames_[index]; }
    DebugVariable& variable_at(size_t index) { return variables_[index]; }

    // Clear all data
    void clear();

    // Forward lookup: locking script byte offset -> mapping
    const DebugMapping* get_mapping_for_offset(size_t byte_offset) const;

    // Frame lookup; frame 0 is shared by entrypoints, so the sequence picks one
    const DebugFrame* get_frame(uint32_t frame_id, uint32_t sequence) const;

    // Variables visible at a point, in declaration order; empty outside every frame
    std::vector<const DebugVariable*> visible_variables(uint32_t sequence,
                                                        uint32_t frame_id) const;

    // Constructor constants only
    std::vector<const DebugVariable*> constants() const;

    // Function names of the frame chain ending at a frame, outermost first
    std::vector<std::string> frame_chain(uint32_t frame_id, uint32_t sequence) const;

    const std::vector<DebugMapping>& mappings() const { return mappings_; }
    const std::vector<DebugFrame>& frames() const { return frames_; }
    const std::vector<DebugVariable>& variables() const { return variables_; }

    bool empty() const { return mappings_.empty(); }

private:
    std::vector<DebugMapping> mappings_;
    std::vector<DebugFrame> frames_;
    std::vector<DebugVariable> variables_;

    // Byte offset -> mapping index (O(1) forward lookup)
    std::unordered_map<size_t, size_t> offset_to_mapping_;
};

}  // namespace sil

#endif  // SILVERSCRIPT_COMPILER_DEBUG_INFO_HPP
