//
// Created by Giuseppe Francione on 08/10/26.
//

#include "../../include/value_format.hpp"
#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace taglog {

namespace detail {

    std::string demangle(const char* name) {
#if defined(__GNUG__)
        int status = 0;
        const std::unique_ptr<char, void (*)(void*)> res{
            abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free};
        return status == 0 && res ? std::string(res.get()) : std::string(name);
#else
        return name;
#endif
    }

} // namespace detail

std::string render_field(const std::size_t index, const ShowField& field) {
    std::string out = "[" + std::to_string(index) + ": ";
    if (!field) {
        out += "null";
    } else {
        out += field->type_name;
        out += " - ";
        out += field->text;
    }
    out += ']';
    return out;
}

} // namespace taglog
