#pragma once

/// @file declaration.hpp
/// @brief Parser for std140 uniform block declarations
///
/// Understands the subset of GLSL needed to read a uniform block out of a
/// shader source:
///
/// ```
/// block := [ 'layout' '(' qualifiers ')' ] 'uniform' IDENT '{' { entry } '}' [ IDENT ] ';'
/// entry := [ 'highp' | 'mediump' | 'lowp' ] TYPE IDENT [ '[' NUMBER ']' ] ';'
/// ```
///
/// Everything outside the selected block (other declarations, functions,
/// comments, preprocessor lines) is skipped. Offsets follow std140 base
/// alignment: scalars on 4, vec2 on 8, everything else (vec3, vec4, matrices,
/// arrays) on 16. Array elements are rounded up to 16. A vec3 takes 12 bytes
/// when a scalar packs into its last component and a full 16-byte slot
/// otherwise.

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "layout.hpp"

namespace UboFusion {

class DeclarationResult {
    DeclarationError m_error = DeclarationError::NO_ERROR;
    std::size_t m_line = 0;
    std::size_t m_column = 0;
    std::string_view m_token;
    std::string_view m_block;
    std::vector<SlotDescr> m_slots;
public:
    constexpr DeclarationResult(DeclarationError err, std::size_t line, std::size_t column,
                                std::string_view token, std::string_view block,
                                std::vector<SlotDescr> slots = {}):
        m_error(err), m_line(line), m_column(column), m_token(token), m_block(block), m_slots(std::move(slots))
    {}
    constexpr operator bool() const {
        return m_error == DeclarationError::NO_ERROR;
    }
    constexpr DeclarationError error() const {
        return m_error;
    }
    // 1-based position of the offending token
    constexpr std::size_t line() const {
        return m_line;
    }
    constexpr std::size_t column() const {
        return m_column;
    }
    constexpr std::string_view token() const {
        return m_token;
    }
    // Parsed block, or the requested one when it was not found
    constexpr std::string_view blockName() const {
        return m_block;
    }
    constexpr const std::vector<SlotDescr> & slots() const {
        return m_slots;
    }
    // End of the last slot, alignment gaps included
    constexpr std::size_t totalSize() const {
        return m_slots.empty() ? 0 : m_slots.back().offset + m_slots.back().size;
    }
};


namespace declaration {

enum class TokenKind {
    identifier,
    number,
    punct,
    end,
    bad_comment
};

struct Token {
    TokenKind        kind = TokenKind::end;
    std::string_view text;
    std::size_t      line = 1;
    std::size_t      column = 1;

    constexpr bool is(char c) const {
        return kind == TokenKind::punct && text.size() == 1 && text[0] == c;
    }
    constexpr bool is(std::string_view word) const {
        return kind == TokenKind::identifier && text == word;
    }
};

// size is the std140 footprint of one element, align its base alignment
struct GlslType {
    std::string_view name;
    SlotKind         kind;
    std::size_t      size;
    std::size_t      align;
};

inline constexpr GlslType glsl_types[] = {
    {"float", SlotKind::scalar, 4, 4},   {"int", SlotKind::scalar, 4, 4},
    {"uint", SlotKind::scalar, 4, 4},    {"bool", SlotKind::scalar, 4, 4},
    {"vec2", SlotKind::vec2, 8, 8},      {"ivec2", SlotKind::vec2, 8, 8},
    {"uvec2", SlotKind::vec2, 8, 8},     {"bvec2", SlotKind::vec2, 8, 8},
    {"vec3", SlotKind::vec3, 12, 16},    {"ivec3", SlotKind::vec3, 12, 16},
    {"uvec3", SlotKind::vec3, 12, 16},   {"bvec3", SlotKind::vec3, 12, 16},
    {"vec4", SlotKind::vec4, 16, 16},    {"ivec4", SlotKind::vec4, 16, 16},
    {"uvec4", SlotKind::vec4, 16, 16},   {"bvec4", SlotKind::vec4, 16, 16},
    {"mat2", SlotKind::mat2, 32, 16},    {"mat3", SlotKind::mat3, 48, 16},
    {"mat4", SlotKind::mat4, 64, 16},
};

constexpr std::size_t align_up(std::size_t offset, std::size_t align) {
    return (offset + align - 1) / align * align;
}

constexpr const GlslType * find_type(std::string_view name) {
    for(const auto & t : glsl_types) {
        if(t.name == name) return &t;
    }
    return nullptr;
}

constexpr bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}
constexpr bool is_digit(char c) {
    return c >= '0' && c <= '9';
}
constexpr bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}


class Lexer {
    std::string_view m_src;
    std::size_t m_pos = 0;
    std::size_t m_line = 1;
    std::size_t m_col = 1;
    std::size_t m_commentLine = 1;
    std::size_t m_commentCol = 1;

    constexpr bool at_end() const {
        return m_pos >= m_src.size();
    }
    constexpr char peek(std::size_t ahead = 0) const {
        return m_pos + ahead < m_src.size() ? m_src[m_pos + ahead] : '\0';
    }
    constexpr void advance() {
        if(m_src[m_pos] == '\n') {
            m_line ++;
            m_col = 1;
        } else {
            m_col ++;
        }
        m_pos ++;
    }

    // false on an unterminated block comment
    constexpr bool skip_trivia() {
        while(!at_end()) {
            const char c = peek();
            if(is_space(c)) {
                advance();
            } else if(c == '/' && peek(1) == '/') {
                while(!at_end() && peek() != '\n') advance();
            } else if(c == '/' && peek(1) == '*') {
                m_commentLine = m_line;
                m_commentCol = m_col;
                advance(); advance();
                while(!(peek() == '*' && peek(1) == '/')) {
                    if(at_end()) return false;
                    advance();
                }
                advance(); advance();
            } else if(c == '#') {
                while(!at_end() && peek() != '\n') advance();
            } else {
                return true;
            }
        }
        return true;
    }

public:
    constexpr explicit Lexer(std::string_view src): m_src(src) {}

    constexpr Token next() {
        if(!skip_trivia()) {
            return Token{TokenKind::bad_comment, "/*", m_commentLine, m_commentCol};
        }
        Token t;
        t.line = m_line;
        t.column = m_col;
        if(at_end()) {
            t.kind = TokenKind::end;
            return t;
        }
        const std::size_t begin = m_pos;
        const char c = peek();
        if(is_ident_start(c)) {
            while(!at_end() && (is_ident_start(peek()) || is_digit(peek()))) advance();
            t.kind = TokenKind::identifier;
        } else if(is_digit(c)) {
            while(!at_end() && (is_digit(peek()) || is_ident_start(peek()))) advance();
            t.kind = TokenKind::number;
        } else {
            advance();
            t.kind = TokenKind::punct;
        }
        t.text = m_src.substr(begin, m_pos - begin);
        return t;
    }
};


class Parser {
    Lexer m_lex;
    Token m_cur;
    std::string_view m_wanted;
    DeclarationError m_error = DeclarationError::NO_ERROR;
    Token m_errorToken;
    std::string_view m_block;
    std::vector<SlotDescr> m_slots;

    constexpr bool bump() {
        m_cur = m_lex.next();
        if(m_cur.kind == TokenKind::bad_comment) {
            return fail(DeclarationError::UNTERMINATED_COMMENT);
        }
        return true;
    }
    constexpr bool fail(DeclarationError e) {
        m_error = e;
        m_errorToken = m_cur;
        return false;
    }
    constexpr bool fail(DeclarationError e, const Token & at) {
        m_error = e;
        m_errorToken = at;
        return false;
    }
    constexpr bool expect(char c) {
        if(m_cur.kind == TokenKind::end) return fail(DeclarationError::UNTERMINATED_BLOCK);
        if(!m_cur.is(c)) return fail(DeclarationError::UNEXPECTED_TOKEN);
        return bump();
    }

    static constexpr bool parse_count(std::string_view digits, std::size_t & out) {
        if(digits.empty() || digits.size() > 9) return false;
        std::size_t v = 0;
        for(char c : digits) {
            if(!is_digit(c)) return false;
            v = v * 10 + static_cast<std::size_t>(c - '0');
        }
        out = v;
        return v > 0;
    }

    // layout( ... ): remembers the first qualifier that is not std140-compatible
    constexpr bool parse_layout(bool & unsupported, Token & where) {
        if(!bump()) return false;
        if(!m_cur.is('(')) return true;         // not a layout qualifier after all
        if(!bump()) return false;
        while(!m_cur.is(')')) {
            if(m_cur.kind == TokenKind::end) return fail(DeclarationError::UNEXPECTED_TOKEN);
            if(!unsupported && (m_cur.is("std430") || m_cur.is("packed") || m_cur.is("shared"))) {
                unsupported = true;
                where = m_cur;
            }
            if(!bump()) return false;
        }
        return bump();
    }

    constexpr bool skip_block_body() {
        std::size_t depth = 0;
        do {
            if(m_cur.kind == TokenKind::end) return fail(DeclarationError::UNTERMINATED_BLOCK);
            if(m_cur.is('{')) depth ++;
            if(m_cur.is('}')) depth --;
            if(!bump()) return false;
        } while(depth > 0);
        return true;
    }

    constexpr bool parse_entry(std::size_t & offset) {
        if(m_cur.is("highp") || m_cur.is("mediump") || m_cur.is("lowp")) {
            if(!bump()) return false;
        }
        if(m_cur.kind != TokenKind::identifier) return fail(DeclarationError::UNEXPECTED_TOKEN);
        const GlslType * type = find_type(m_cur.text);
        if(type == nullptr) return fail(DeclarationError::UNKNOWN_TYPE);
        if(!bump()) return false;

        if(m_cur.kind != TokenKind::identifier) return fail(DeclarationError::UNEXPECTED_TOKEN);
        SlotDescr slot;
        slot.name   = m_cur.text;
        slot.record = m_block;
        slot.kind   = type->kind;
        slot.size   = type->size;
        slot.source = SlotSource::declaration;
        std::size_t align = type->align;
        if(!bump()) return false;

        if(m_cur.is('[')) {
            if(!bump()) return false;
            std::size_t count = 0;
            if(m_cur.kind != TokenKind::number || !parse_count(m_cur.text, count)) {
                return fail(DeclarationError::BAD_ARRAY_SIZE);
            }
            if(!bump()) return false;
            if(!expect(']')) return false;
            slot.kind  = type->kind == SlotKind::vec4 ? SlotKind::vec4_array : SlotKind::array;
            slot.count = count;
            slot.size  = layout::detail::round_up_16(type->size) * count;
            align      = 16;
        }
        if(!expect(';')) return false;

        slot.offset = align_up(offset, align);
        close_vec3(slot.offset);
        offset = slot.offset + slot.size;
        m_slots.push_back(slot);
        return true;
    }

    // A trailing vec3 keeps the 12 bytes it needs when the next slot starts
    // right after them, and otherwise grows to its 16-byte slot.
    constexpr void close_vec3(std::size_t nextOffset) {
        if(m_slots.empty()) return;
        SlotDescr & last = m_slots.back();
        if(last.kind == SlotKind::vec3) {
            last.size = nextOffset - last.offset;
        }
    }

    constexpr bool parse_block_body() {
        if(!bump()) return false;   // '{'
        std::size_t offset = 0;
        while(!m_cur.is('}')) {
            if(m_cur.kind == TokenKind::end) return fail(DeclarationError::UNTERMINATED_BLOCK);
            if(!parse_entry(offset)) return false;
        }
        close_vec3(align_up(offset, 16));
        if(!bump()) return false;
        if(m_cur.kind == TokenKind::identifier) {   // instance name
            if(!bump()) return false;
        }
        if(m_cur.kind == TokenKind::end) return fail(DeclarationError::UNTERMINATED_BLOCK);
        if(!m_cur.is(';')) return fail(DeclarationError::UNEXPECTED_TOKEN);
        return true;
    }

    // m_cur is 'uniform'; found is set once the wanted block has been parsed
    constexpr bool parse_uniform(bool unsupported, const Token & layoutToken, bool & found) {
        if(!bump()) return false;
        if(m_cur.kind != TokenKind::identifier) return true;
        const Token name = m_cur;
        if(!bump()) return false;
        if(!m_cur.is('{')) return true;         // uniform sampler2D tex; and the like

        if(!m_wanted.empty() && name.text != m_wanted) {
            return skip_block_body();
        }
        m_block = name.text;
        if(unsupported) return fail(DeclarationError::UNSUPPORTED_LAYOUT, layoutToken);
        found = true;
        return parse_block_body();
    }

public:
    constexpr Parser(std::string_view text, std::string_view wanted):
        m_lex(text), m_wanted(wanted), m_block(wanted) {}

    constexpr DeclarationResult run() {
        bool found = false;
        bool ok = bump();
        while(ok && !found && m_cur.kind != TokenKind::end) {
            if(m_cur.is("layout")) {
                bool unsupported = false;
                Token layoutToken = m_cur;
                ok = parse_layout(unsupported, layoutToken);
                if(ok && m_cur.is("uniform")) {
                    ok = parse_uniform(unsupported, layoutToken, found);
                }
            } else if(m_cur.is("uniform")) {
                ok = parse_uniform(false, m_cur, found);
            } else {
                ok = bump();
            }
        }
        if(ok && !found) {
            fail(DeclarationError::BLOCK_NOT_FOUND);
        }
        if(m_error != DeclarationError::NO_ERROR) {
            return DeclarationResult(m_error, m_errorToken.line, m_errorToken.column, m_errorToken.text, m_block);
        }
        return DeclarationResult(DeclarationError::NO_ERROR, 0, 0, {}, m_block, std::move(m_slots));
    }
};

} // namespace declaration


/// Parses the uniform block named blockName out of text (the first uniform
/// block when blockName is empty) into its ordered std140 slots. Slot names
/// and the block name view into text, which must outlive the result.
constexpr DeclarationResult ParseDeclaration(std::string_view text, std::string_view blockName = {}) {
    declaration::Parser p(text, blockName);
    return p.run();
}

// The result would view into a destroyed string
template<class S>
    requires std::same_as<S, std::string>
DeclarationResult ParseDeclaration(S && text, std::string_view blockName = {}) = delete;

} // namespace UboFusion
