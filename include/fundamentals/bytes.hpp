#pragma once
#include <concepts>
#include <bit>
#include <span>
#include <vector>
#include <string>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <ranges>
#include <algorithm>
#include <iterator>
#include <expected>

namespace bytes
{

using buffer_t = std::vector<std::byte>;

inline std::byte int2byte(uint8_t i)
{
    return static_cast<std::byte>(i);
}

// Network order is big-endian
constexpr auto endify(std::integral auto i)
{
    if constexpr(std::endian::native == std::endian::little)
    {
        return std::byteswap(i);
    }
    else
    {
        return i;
    }
}

// Caller guarantees from.size() >= sizeof(Ty)
template<std::integral Ty = uint16_t>
Ty to_int(std::span<const std::byte> from)
{
    Ty ret = 0;
    std::memcpy(std::addressof(ret), from.data(), sizeof(Ty));
    return endify(ret);
}

template<class To, std::integral From>
void from_int(std::span<To> to, From val)
{
    val = endify(val);
    std::memcpy(to.data(), std::addressof(val), sizeof(From));
}

template<std::integral From>
void append_int(buffer_t& to, From val)
{
    auto pos = to.size();
    to.resize(pos + sizeof(From));
    from_int<std::byte>(std::span{to}.subspan(pos), val);
}

inline buffer_t to_bytes(std::string_view sv)
{
    return sv |
        std::views::transform([](char ch){ return int2byte(static_cast<uint8_t>(ch)); }) |
        std::ranges::to<buffer_t>();
}

inline std::string to_string(std::span<const std::byte> sp)
{
    return std::string(reinterpret_cast<const char*>(sp.data()), sp.size());
}

inline void append(buffer_t& to, std::string_view sv)
{
    std::ranges::transform(sv, std::back_inserter(to),
                           [](char ch){ return int2byte(static_cast<uint8_t>(ch)); });
}

std::string to_hex(std::span<const std::byte> sp);
std::expected<buffer_t, std::string> from_hex(std::string_view hex);

inline namespace literals
{

inline buffer_t operator""_b(const char* c, size_t s)
{
    return to_bytes(std::string_view(c, s));
}

} // namespace literals

} // namespace bytes
