// ==============================================================================
// Debug Information Table - Implementation
// ==============================================================================

#include "debug_info.hpp"
#include "error.hpp"
#include <algorithm>

namespace sil {

std::string DebugMapping::kind_label() const {
    switch (kind) {
        case MappingKind::STATEMENT:  return "stmt";
        case MappingKind::EXPRESSION: return "expr";
        case MappingKind::SYNTHETIC:  return "syn:" + synthetic_label;
        default:                      return "unknown";
    }
}

const char* variable_origin_to_string(VariableOrigin origin) {
    switch (origin) {
        case VariableOrigin::CONSTANT: return "const";
        case VariableOrigin::ARGUMENT: return "arg";
        case VariableOrigin::LOCAL:    return "local";
        default:                       return "unknown";
    }
}

bool DebugVariable::is_visible_at(uint32_t sequence, uint32_t frame) const {
    if (origin == VariableOrigin::CONSTANT) {
        return true;
    }
    return frame_id == frame &&
           live_after_sequence < sequence && sequence <= dead_after_sequence;
}

// ==============================================================================
// Building
// ==============================================================================

void DebugTable::add_mapping(DebugMapping mapping) {
    if (!mappings_.empty() && mapping.sequence <= mappings_.back().sequence) {
        throw InternalError(build_error_message(
            "debug mapping sequence ", mapping.sequence,
            " does not increase after ", mappings_.back().sequence));
    }
    offset_to_mapping_[mapping.byte_offset] = mappings_.size();
    mappings_.push_back(std::move(mapping));
}

void DebugTable::add_frame(DebugFrame frame) {
    frames_.push_back(std::move(frame));
}

void DebugTable::add_variable(DebugVariable variable) {
    variables_.push_back(std::move(variable));
}

void DebugTable::clear() {
    mappings_.clear();
    frames_.clear();
    variables_.clear();
    offset_to_mapping_.clear();
}

// ==============================================================================
// Query Methods
// ==============================================================================

const DebugMapping* DebugTable::get_mapping_for_offset(size_t byte_offset) const {
    auto it = offset_to_mapping_.find(byte_offset);
    if (it == offset_to_mapping_.end()) {
        return nullptr;
    }
    return &mappings_[it->second];
}

const DebugFrame* DebugTable::get_frame(uint32_t frame_id, uint32_t sequence) const {
    const DebugFrame* fallback = nullptr;
    for (const auto& frame : frames_) {
        if (frame.frame_id != frame_id) continue;
        if (frame.contains(sequence)) {
            return &frame;
        }
        if (!fallback) {
            fallback = &frame;
        }
    }
    return fallback;
}

std::vector<const DebugVariable*> DebugTable::visible_variables(uint32_t sequence,
                                                                uint32_t frame_id) const {
    std::vector<const DebugVariable*> result;

    // No frame covers this point, so there is no scope to report
    const DebugFrame* frame = get_frame(frame_id, sequence);
    if (!frame || !frame->contains(sequence)) {
        return result;
    }

    for (const auto& variable : variables_) {
        if (variable.is_visible_at(sequence, frame_id)) {
            result.push_back(&variable);
        }
    }
    return result;
}

std::vector<const DebugVariable*> DebugTable::constants() const {
    std::vector<const DebugVariable*> result;
    for (const auto& variable : variables_) {
        if (variable.origin == VariableOrigin::CONSTANT) {
            result.push_back(&variable);
        }
    }
    return result;
}

std::vector<std::string> DebugTable::frame_chain(uint32_t frame_id, uint32_t sequence) const {
    std::vector<std::string> chain;
    const DebugFrame* frame = get_frame(frame_id, sequence);

    // Parents are strictly shallower, so the walk terminates
    while (frame) {
        chain.push_back(frame->function_name);
        if (!frame->parent_frame_id) break;
        const DebugFrame* parent = get_frame(*frame->parent_frame_id, sequence);
        if (!parent || parent->call_depth >= frame->call_depth) break;
        frame = parent;
    }

    std::reverse(chain.begin(), chain.end());
    return chain;
}

}  // namespace sil
