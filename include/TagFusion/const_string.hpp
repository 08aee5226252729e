#pragma once
#include <cstdint>
#include <string_view>
#include <cstddef>

namespace TagFusion {

// Structural string usable as a non-type template parameter: case tags,
// field names and json keys are all spelled with it.
template <typename CharT, std::size_t N> struct ConstString
{
    constexpr ConstString(const CharT (&foo)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = foo[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;

    // false if the string carries control characters
    constexpr bool check() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32) return false;
        }
        return true;
    }
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
    constexpr bool operator==(std::string_view other) const {
        return toStringView() == other;
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

}
