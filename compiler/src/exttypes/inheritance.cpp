#include "exttypes/inheritance.hpp"

#include "log/log.hpp"

namespace autojit::exttypes {

namespace {

auto field_desc(const AttributeField& f) -> std::string {
    return "'" + f.name + ": " + types::type_to_string(f.type) + "'";
}

} // namespace

Result<bool, JitError> verify(const AttributeStruct& base_struct,
                              const AttributeStruct& derived_struct, const VTableType& base_vtab,
                              const VTableType& derived_vtab) {
    const auto& base_name = base_struct.class_name();
    const auto& derived_name = derived_struct.class_name();

    const auto& bf = base_struct.fields();
    const auto& df = derived_struct.fields();
    if (bf.size() > df.size()) {
        return JitError::make(ErrorKind::LayoutIncompatible,
                              derived_name + " has fewer attributes than base class " + base_name);
    }
    for (size_t i = 0; i < bf.size(); ++i) {
        if (bf[i].name != df[i].name || !types::types_equal(bf[i].type, df[i].type)) {
            return JitError::make(ErrorKind::LayoutIncompatible,
                                  "attribute " + std::to_string(i) + " is " + field_desc(bf[i]) +
                                      " in " + base_name + " but " + field_desc(df[i]) + " in " +
                                      derived_name);
        }
    }

    const auto& bs = base_vtab.slots();
    const auto& ds = derived_vtab.slots();
    if (bs.size() > ds.size()) {
        return JitError::make(ErrorKind::LayoutIncompatible,
                              derived_name + " has fewer methods than base class " + base_name);
    }
    for (size_t i = 0; i < bs.size(); ++i) {
        if (bs[i].name != ds[i].name ||
            !signatures_equal_modulo_receiver(bs[i].signature, ds[i].signature)) {
            return JitError::make(ErrorKind::LayoutIncompatible,
                                  "method slot " + std::to_string(i) + " is '" + bs[i].name + " " +
                                      bs[i].signature.canonical() + "' in " + base_name +
                                      " but '" + ds[i].name + " " + ds[i].signature.canonical() +
                                      "' in " + derived_name);
        }
    }
    return true;
}

Result<bool, JitError> verify_bases(const std::vector<NativeBaseLayout>& bases,
                                    const AttributeStruct& derived_struct,
                                    const VTableType& derived_vtab) {
    for (size_t i = 0; i < bases.size(); ++i) {
        const auto& base = bases[i];
        auto result = verify(*base.attrs, derived_struct, *base.vtab, derived_vtab);
        if (is_ok(result))
            continue;

        AUTOJIT_LOG_DEBUG("exttypes", "base " << base.name << " rejected for "
                                              << derived_struct.class_name() << ": "
                                              << unwrap_err(result).message);
        if (i > 0) {
            return JitError::make(ErrorKind::LayoutIncompatible,
                                  "Multiple incompatible base classes found: " + bases[0].name +
                                      " and " + base.name)
                .with_note(unwrap_err(result).message);
        }
        return result;
    }
    return true;
}

} // namespace autojit::exttypes
