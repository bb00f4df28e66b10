#pragma once

#include <fmt/format.h>

#include <string>
#include <string_view>

// If this is included after Catch2, then instantiations of the stringify function template will
// be choosen over ours
#if defined(CATCH_TOSTRING_HPP_INCLUDED)
#error "Include this file before Catch2"
#else
// Show escaped strings in assertion output; captured program output is full of newlines
namespace Catch::Detail {

inline std::string stringify(std::string_view e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const std::string& e) {
    return fmt::format("{:?}", e);
}

} // namespace Catch::Detail
#endif

#include <catch2/catch_test_macros.hpp>                   // IWYU pragma: export
#include <catch2/catch_tostring.hpp>                      // IWYU pragma: export
#include <catch2/matchers/catch_matchers_string.hpp>      // IWYU pragma: export
#include <catch2/matchers/catch_matchers_vector.hpp>      // IWYU pragma: export

namespace Catch {

/// Engine enums and results print through their ``format_as`` overloads
template <typename T>
    requires requires(const T& t) { format_as(t); }
struct StringMaker<T>
{
    static std::string convert(const T& t) { return fmt::format("{}", format_as(t)); }
};

} // namespace Catch
