#pragma once
#ifndef S3DROP_API_BINDER_HPP_
#define S3DROP_API_BINDER_HPP_

#include <chrono>
#include <cstdint>
#include <system_error>
// string_view
#if __has_include(<string_view>)
#include <string_view>
namespace api{
using std::basic_string_view;
using std::string_view;
}
#elif __has_include(<experimental/string_view>)
#include <experimental/string_view>
namespace api{
using std::experimental::basic_string_view;
using std::experimental::string_view;
}
#else
#include "boost/utility/string_view.hpp"
namespace api{
using boost::basic_string_view;
using boost::string_view;
}
#endif

// end of string_view

// optional
#if __has_include(<optional>)
#include <optional>
namespace api{
using std::optional;
using std::nullopt;
using std::in_place;
}
#elif __has_include(<experimental/optional>)
#include <experimental/optional>
namespace api{
using std::experimental::optional;
using std::experimental::nullopt;
using std::experimental::in_place;
}
#else
#include "boost/optional.hpp"
namespace api{
using boost::optional;
constexpr auto nullopt = boost::none;
using boost::optional::in_place;
}
#endif
// end of optional

// variant
#if __has_include(<variant>)
#include <variant>
namespace api{
using std::variant;
using std::monostate;
using std::holds_alternative;
using std::get;
using std::get_if;
}
#else
#include "boost/variant.hpp"
namespace api{
using boost::variant;
using monostate = boost::blank;
template <typename T, typename... Ts>
bool holds_alternative(const boost::variant<Ts...>& v) noexcept
{
    return boost::get<T>(&v) != nullptr;
}
template <typename T, typename... Ts>
T* get_if(boost::variant<Ts...>* v) noexcept
{
    return boost::get<T>(v);
}
template <typename T, typename... Ts>
const T* get_if(const boost::variant<Ts...>* v) noexcept
{
    return boost::get<T>(v);
}
using boost::get;
}
#endif
// end of variant

// span
/*
#if __has_include(<span>)
#include <span>
namespace api{
using std::span;
using blob_span = span<std::uint8_t>;
}
#else
*/
#include <gsl/span>
namespace api{
using gsl::span;
using blob_span = span<std::uint8_t>;
using const_blob_span = span<const std::uint8_t>;
}
//#endif

// filesystem
#if __has_include(<filesystem>)
#include <filesystem>
namespace api{
namespace fs = std::filesystem;
using error_code = std::error_code;
using errc = std::errc;
}
#elif __has_include("boost/filesystem.hpp")
#include "boost/filesystem.hpp"
namespace api{
namespace fs = boost::filesystem;
using error_code = boost::system::error_code;
using errc = boost::system::errc::errc_t;
}
#endif

#ifdef _MSC_VER
#include <iso646.h>
#endif

#endif
