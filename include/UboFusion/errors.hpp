#pragma once

#include <string_view>
namespace UboFusion {


enum class WriteError {
    NO_ERROR,

    WRONG_COMPONENT_COUNT,   // vec4 / mat4 source with the wrong number of numbers
    TOO_FEW_ELEMENTS,        // float array shorter than its count
    TOO_MANY_ELEMENTS,       // vec4 array longer than its count
    MISSING_VALUE,           // absent float array

    BUFFER_TOO_SMALL,
    SINK_OVERFLOW,
    LAYOUT_DRIFT
};

constexpr std::string_view error_to_string(WriteError e) {
    switch(e) {
    case WriteError::NO_ERROR: return "NO_ERROR"; break;
    case WriteError::WRONG_COMPONENT_COUNT: return "WRONG_COMPONENT_COUNT"; break;
    case WriteError::TOO_FEW_ELEMENTS: return "TOO_FEW_ELEMENTS"; break;
    case WriteError::TOO_MANY_ELEMENTS: return "TOO_MANY_ELEMENTS"; break;
    case WriteError::MISSING_VALUE: return "MISSING_VALUE"; break;
    case WriteError::BUFFER_TOO_SMALL: return "BUFFER_TOO_SMALL"; break;
    case WriteError::SINK_OVERFLOW: return "SINK_OVERFLOW"; break;
    case WriteError::LAYOUT_DRIFT: return "LAYOUT_DRIFT"; break;
    }
    return "N/A";
}


enum class DeclarationError {
    NO_ERROR,

    BLOCK_NOT_FOUND,
    UNKNOWN_TYPE,
    UNEXPECTED_TOKEN,
    UNTERMINATED_BLOCK,
    UNTERMINATED_COMMENT,
    UNSUPPORTED_LAYOUT,
    BAD_ARRAY_SIZE
};

constexpr std::string_view error_to_string(DeclarationError e) {
    switch(e) {
    case DeclarationError::NO_ERROR: return "NO_ERROR"; break;
    case DeclarationError::BLOCK_NOT_FOUND: return "BLOCK_NOT_FOUND"; break;
    case DeclarationError::UNKNOWN_TYPE: return "UNKNOWN_TYPE"; break;
    case DeclarationError::UNEXPECTED_TOKEN: return "UNEXPECTED_TOKEN"; break;
    case DeclarationError::UNTERMINATED_BLOCK: return "UNTERMINATED_BLOCK"; break;
    case DeclarationError::UNTERMINATED_COMMENT: return "UNTERMINATED_COMMENT"; break;
    case DeclarationError::UNSUPPORTED_LAYOUT: return "UNSUPPORTED_LAYOUT"; break;
    case DeclarationError::BAD_ARRAY_SIZE: return "BAD_ARRAY_SIZE"; break;
    }
    return "N/A";
}


// ============================================================================
// Layout comparison
// ============================================================================

enum class LayoutError {
    none,
    slot_count_mismatch,
    slot_size_mismatch,
    slot_offset_mismatch,
    declaration_error
};

constexpr std::string_view layout_error_to_string(LayoutError e) {
    switch(e) {
    case LayoutError::none                : return "none"; break;
    case LayoutError::slot_count_mismatch : return "slot_count_mismatch"; break;
    case LayoutError::slot_size_mismatch  : return "slot_size_mismatch"; break;
    case LayoutError::slot_offset_mismatch: return "slot_offset_mismatch"; break;
    case LayoutError::declaration_error   : return "declaration_error"; break;
    }
    return "N/A";
}


// ============================================================================
// Binding registry
// ============================================================================

enum class BindingError {
    none,
    frozen,
    duplicate_name,
    duplicate_slot,
    slot_out_of_range,
    invalid_size,
    unknown_binding,
    size_mismatch
};

constexpr std::string_view binding_error_to_string(BindingError e) {
    switch(e) {
    case BindingError::none             : return "none"; break;
    case BindingError::frozen           : return "frozen"; break;
    case BindingError::duplicate_name   : return "duplicate_name"; break;
    case BindingError::duplicate_slot   : return "duplicate_slot"; break;
    case BindingError::slot_out_of_range: return "slot_out_of_range"; break;
    case BindingError::invalid_size     : return "invalid_size"; break;
    case BindingError::unknown_binding  : return "unknown_binding"; break;
    case BindingError::size_mismatch    : return "size_mismatch"; break;
    }
    return "N/A";
}

} // namespace UboFusion
