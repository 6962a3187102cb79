#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace UboFusion {

template <typename CharT, std::size_t N> struct ConstString
{
    // GLSL-style identifier: [A-Za-z_][A-Za-z0-9_]*
    constexpr bool isIdentifier() const {
        if(N == 0) return false;
        for(std::size_t i = 0; i < N; i ++) {
            const CharT c = m_data[i];
            const bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
            const bool digit = c >= '0' && c <= '9';
            if(!alpha && !(digit && i > 0)) return false;
        }
        return true;
    }
    constexpr ConstString(const CharT (&foo)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = foo[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

}
