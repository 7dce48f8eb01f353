#include "tftp/datagram.hpp"
#include <algorithm>
#include <cctype>
#include <ranges>
#include <utility>

namespace tftp
{

using namespace bytes;

namespace {

std::string lower(std::string_view sv)
{
    std::string ret;
    ret.reserve(sv.size());
    std::ranges::transform(sv, std::back_inserter(ret),
                           [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return ret;
}

} // namespace

template<Opcode Op>
Request<Op>::Request(std::string filename, std::string_view mode)
    : fname(std::move(filename))
    , md(lower(mode))
{
}

template<Opcode Op>
result<Request<Op>> Request<Op>::parse(std::span<const std::byte> payload)
{
    // filename must be NUL-terminated, mode runs to the next NUL or the end
    auto fname_end = std::ranges::find(payload, std::byte{0});
    if (fname_end == payload.end())
    {
        return fail(errc::field_count);
    }

    auto rest = std::span(std::next(fname_end), payload.end());
    auto mode_end = std::ranges::find(rest, std::byte{0});

    return Request(to_string(std::span(payload.begin(), fname_end)),
                   to_string(std::span(rest.begin(), mode_end)));
}

template<Opcode Op>
payload_t Request<Op>::serialize() const
{
    payload_t ret;
    ret.reserve(4 + fname.size() + md.size());

    append_int(ret, std::to_underlying(Op));
    append(ret, fname);
    ret.push_back(std::byte{0});
    append(ret, md);
    ret.push_back(std::byte{0});
    return ret;
}

template class Request<Opcode::rrq>;
template class Request<Opcode::wrq>;

} // namespace tftp
