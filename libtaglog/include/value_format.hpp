//
// Created by Giuseppe Francione on 08/10/26.
//

/**
 * @file value_format.hpp
 * @brief Renders arbitrary values as "type - text" pairs for diagnostic dumps.
 */

#ifndef TAGLOG_VALUE_FORMAT_HPP
#define TAGLOG_VALUE_FORMAT_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace taglog {

/**
 * @brief Type name and text representation of a present value.
 */
struct ValueDescription {
    std::string type_name;
    std::string text;
};

/// One positional value of a show() call; empty when the value is absent.
using ShowField = std::optional<ValueDescription>;

namespace detail {

    /**
     * @brief Human readable form of a typeid() name.
     * Demangles on GCC/Clang, returns the name unchanged elsewhere.
     */
    std::string demangle(const char* name);

    template <typename T>
    struct is_optional : std::false_type {};
    template <typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template <typename T>
    struct is_smart_pointer : std::false_type {};
    template <typename T, typename D>
    struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type {};
    template <typename T>
    struct is_smart_pointer<std::shared_ptr<T>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_string_like_v =
        std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view> ||
        std::is_same_v<T, const char*> || std::is_same_v<T, char*> ||
        (std::is_array_v<T> && std::is_same_v<std::remove_cv_t<std::remove_extent_t<T>>, char>);

    template <typename T>
    concept Streamable = requires(std::ostream& os, const T& value) { os << value; };

} // namespace detail

/**
 * @brief Display name of a type.
 *
 * Fundamental types use their C++ spelling ("int", "double", "bool"),
 * every string flavour is reported as "string", anything else falls back to
 * the demangled typeid() name.
 */
template <typename T>
std::string type_name_of() {
    using U = std::remove_cv_t<T>;
    if constexpr (detail::is_string_like_v<U>) return "string";
    else if constexpr (std::is_same_v<U, bool>) return "bool";
    else if constexpr (std::is_same_v<U, char>) return "char";
    else if constexpr (std::is_same_v<U, signed char>) return "signed char";
    else if constexpr (std::is_same_v<U, unsigned char>) return "unsigned char";
    else if constexpr (std::is_same_v<U, short>) return "short";
    else if constexpr (std::is_same_v<U, unsigned short>) return "unsigned short";
    else if constexpr (std::is_same_v<U, int>) return "int";
    else if constexpr (std::is_same_v<U, unsigned int>) return "unsigned int";
    else if constexpr (std::is_same_v<U, long>) return "long";
    else if constexpr (std::is_same_v<U, unsigned long>) return "unsigned long";
    else if constexpr (std::is_same_v<U, long long>) return "long long";
    else if constexpr (std::is_same_v<U, unsigned long long>) return "unsigned long long";
    else if constexpr (std::is_same_v<U, float>) return "float";
    else if constexpr (std::is_same_v<U, double>) return "double";
    else if constexpr (std::is_same_v<U, long double>) return "long double";
    else return detail::demangle(typeid(U).name());
}

/**
 * @brief Text representation of a value.
 *
 * Uses operator<< when the type provides one (bool prints as true/false),
 * otherwise the type name, so any value can be rendered.
 */
template <typename T>
std::string to_text(const T& value) {
    if constexpr (detail::is_string_like_v<T>) {
        return std::string(std::string_view(value));
    } else if constexpr (detail::Streamable<T>) {
        std::ostringstream oss;
        oss << std::boolalpha << value;
        return oss.str();
    } else {
        return type_name_of<T>();
    }
}

/**
 * @brief Describe one positional value of a diagnostic dump.
 *
 * Absent values (nullptr, null pointers, empty optionals and smart
 * pointers) yield an empty ShowField. Pointers and wrappers are described by
 * the value they hold.
 */
template <typename T>
ShowField describe(const T& value) {
    if constexpr (std::is_null_pointer_v<T>) {
        return std::nullopt;
    } else if constexpr (std::is_same_v<T, const char*> || std::is_same_v<T, char*>) {
        if (value == nullptr) return std::nullopt;
        return ValueDescription{type_name_of<T>(), to_text(value)};
    } else if constexpr (std::is_pointer_v<T>) {
        if (value == nullptr) return std::nullopt;
        if constexpr (std::is_void_v<std::remove_cv_t<std::remove_pointer_t<T>>>) {
            return ValueDescription{"void*", to_text(value)};
        } else {
            return describe(*value);
        }
    } else if constexpr (detail::is_optional<T>::value || detail::is_smart_pointer<T>::value) {
        if (!value) return std::nullopt;
        return describe(*value);
    } else {
        return ValueDescription{type_name_of<T>(), to_text(value)};
    }
}

/**
 * @brief Render one field as "[index: null]" or "[index: type - text]".
 */
std::string render_field(std::size_t index, const ShowField& field);

} // namespace taglog

#endif // TAGLOG_VALUE_FORMAT_HPP
