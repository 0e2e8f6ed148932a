#include "types/value.hpp"

#include "exttypes/instance.hpp"

#include <sstream>

namespace autojit::types {

auto Value::to_string() const -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return "None";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "True" : "False";
            } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t> ||
                                 std::is_same_v<T, uint64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                std::ostringstream ss;
                ss << v;
                return ss.str();
            } else if constexpr (std::is_same_v<T, PointerValue>) {
                std::ostringstream ss;
                ss << "<" << (v.is_void ? "void" : type_to_string(v.pointee)) << "* "
                   << v.address << ">";
                return ss.str();
            } else if constexpr (std::is_same_v<T, FunctionValue>) {
                return "<function " + v.signature.to_string() + ">";
            } else if constexpr (std::is_same_v<T, StructValue>) {
                return "<struct " + type_to_string(v.struct_type) + ">";
            } else if constexpr (std::is_same_v<T, ArrayValue>) {
                return "<array " + type_to_string(make_array(v.element, v.ndim)) + ">";
            } else if constexpr (std::is_same_v<T, ObjectValue>) {
                return "<object " + v.type_name + ">";
            } else if constexpr (std::is_same_v<T, InstanceValue>) {
                return v.instance ? "<" + v.instance->class_name() + " instance>"
                                  : std::string("<empty instance>");
            } else {
                return "<value>";
            }
        },
        data);
}

} // namespace autojit::types
