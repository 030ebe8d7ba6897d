/// @file types.cpp
/// @brief Define rendering for lumen_shader

#include <lumen/shader/types.hpp>

#include <sstream>
#include <type_traits>

namespace lumen_shader {

std::string define_value_string(const DefineValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "1" : "0";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream out;
            out << v;
            std::string text = out.str();
            if (text.find_first_of(".eEn") == std::string::npos) {
                text += ".0";
            }
            return text;
        } else {
            return v;
        }
    }, value);
}

std::string ShaderVariant::to_header() const {
    std::string result;
    for (const auto& [def_name, value] : defines) {
        result += "#define " + def_name + " " + define_value_string(value) + "\n";
    }
    return result;
}

} // namespace lumen_shader
