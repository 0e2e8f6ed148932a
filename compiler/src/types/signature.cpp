//! # Signature Implementation
//!
//! Construction, canonical spelling and the recursive-descent parser for the
//! signature string grammar.

#include "types/signature.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <sstream>
#include <unordered_map>

namespace autojit::types {

// ============================================================================
// Signature
// ============================================================================

Signature::Signature(TypePtr return_type, std::vector<TypePtr> args,
                     std::optional<std::string> name)
    : return_type_(std::move(return_type)), args_(std::move(args)), name_(std::move(name)) {}

auto Signature::is_concrete() const -> bool {
    if (contains_type_var(return_type_))
        return false;
    return std::none_of(args_.begin(), args_.end(),
                        [](const TypePtr& t) { return contains_type_var(t); });
}

auto Signature::with_return_type(TypePtr ret) const -> Signature {
    return Signature(std::move(ret), args_, name_);
}

auto Signature::with_args(std::vector<TypePtr> args) const -> Signature {
    return Signature(return_type_, std::move(args), name_);
}

auto Signature::with_name(std::optional<std::string> name) const -> Signature {
    return Signature(return_type_, args_, std::move(name));
}

auto Signature::args_key() const -> std::string {
    std::ostringstream ss;
    ss << "(";
    for (size_t i = 0; i < args_.size(); ++i) {
        if (i > 0)
            ss << ", ";
        ss << type_key(args_[i]);
    }
    ss << ")";
    return ss.str();
}

auto Signature::canonical() const -> std::string {
    return type_to_string(return_type_) + args_key();
}

auto Signature::to_string() const -> std::string {
    if (name_)
        return *name_ + " " + canonical();
    return canonical();
}

auto Signature::as_func_ptr_type() const -> TypePtr {
    return make_func_ptr(args_, return_type_);
}

auto Signature::operator==(const Signature& other) const -> bool {
    if (args_.size() != other.args_.size())
        return false;
    for (size_t i = 0; i < args_.size(); ++i) {
        if (!types_equal(args_[i], other.args_[i]))
            return false;
    }
    return types_equal(return_type_, other.return_type_);
}

auto SignatureHash::operator()(const Signature& sig) const -> size_t {
    return std::hash<std::string>{}(sig.canonical());
}

auto signature_from_type(const TypePtr& func_type, std::optional<std::string> name)
    -> Result<Signature, JitError> {
    if (!func_type || !func_type->is<FuncPtrType>()) {
        return JitError::make(ErrorKind::SignatureSyntax,
                              "expected a function type, got '" + type_to_string(func_type) + "'");
    }
    const auto& fn = func_type->as<FuncPtrType>();
    return Signature(fn.return_type, fn.params, std::move(name));
}

// ============================================================================
// Parser
// ============================================================================

namespace {

auto primitive_names() -> const std::unordered_map<std::string_view, PrimitiveKind>& {
    static const std::unordered_map<std::string_view, PrimitiveKind> names = {
        {"i1", PrimitiveKind::I8},        {"i2", PrimitiveKind::I16},
        {"i4", PrimitiveKind::I32},       {"i8", PrimitiveKind::I64},
        {"u1", PrimitiveKind::U8},        {"u2", PrimitiveKind::U16},
        {"u4", PrimitiveKind::U32},       {"u8", PrimitiveKind::U64},
        {"f4", PrimitiveKind::F32},       {"f8", PrimitiveKind::F64},
        {"b1", PrimitiveKind::Bool},      {"void", PrimitiveKind::Void},
        // C aliases (LP64)
        {"char", PrimitiveKind::I8},      {"short", PrimitiveKind::I16},
        {"int", PrimitiveKind::I32},      {"long", PrimitiveKind::I64},
        {"longlong", PrimitiveKind::I64}, {"uchar", PrimitiveKind::U8},
        {"ushort", PrimitiveKind::U16},   {"uint", PrimitiveKind::U32},
        {"ulong", PrimitiveKind::U64},    {"float", PrimitiveKind::F32},
        {"double", PrimitiveKind::F64},   {"bool", PrimitiveKind::Bool},
        // Sized aliases
        {"int8", PrimitiveKind::I8},      {"int16", PrimitiveKind::I16},
        {"int32", PrimitiveKind::I32},    {"int64", PrimitiveKind::I64},
        {"uint8", PrimitiveKind::U8},     {"uint16", PrimitiveKind::U16},
        {"uint32", PrimitiveKind::U32},   {"uint64", PrimitiveKind::U64},
        {"float32", PrimitiveKind::F32},  {"float64", PrimitiveKind::F64},
    };
    return names;
}

class SignatureParser {
public:
    explicit SignatureParser(std::string_view text) : text_(text) {}

    auto parse_signature() -> Result<Signature, JitError> {
        std::optional<std::string> name;

        // A leading identifier followed by another identifier is the name.
        skip_ws();
        size_t start = pos_;
        auto first = read_ident();
        if (!first.empty()) {
            skip_ws();
            if (pos_ < text_.size() && is_ident_start(text_[pos_])) {
                name = std::string(first);
            } else {
                pos_ = start;
            }
        } else {
            pos_ = start;
        }

        auto ret = parse_type(/*allow_func_ptr=*/false);
        if (is_err(ret))
            return unwrap_err(ret);

        auto args = parse_arg_list();
        if (is_err(args))
            return unwrap_err(args);

        skip_ws();
        if (pos_ != text_.size())
            return error("unexpected trailing input");

        return Signature(unwrap(ret), std::move(unwrap(args)), std::move(name));
    }

    auto parse_single_type() -> Result<TypePtr, JitError> {
        auto ty = parse_type(/*allow_func_ptr=*/true);
        if (is_err(ty))
            return ty;
        skip_ws();
        if (pos_ != text_.size())
            return error("unexpected trailing input");
        return ty;
    }

private:
    static auto is_ident_start(char c) -> bool {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    static auto is_ident_char(char c) -> bool {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])))
            ++pos_;
    }

    auto peek() -> char {
        skip_ws();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    auto accept(char c) -> bool {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    auto read_ident() -> std::string_view {
        skip_ws();
        size_t start = pos_;
        if (pos_ < text_.size() && is_ident_start(text_[pos_])) {
            while (pos_ < text_.size() && is_ident_char(text_[pos_]))
                ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    auto error(const std::string& what) const -> JitError {
        return JitError::make(ErrorKind::SignatureSyntax,
                              what + " at column " + std::to_string(pos_ + 1) + " in '" +
                                  std::string(text_) + "'");
    }

    auto parse_base() -> Result<TypePtr, JitError> {
        auto ident = read_ident();
        if (ident.empty())
            return error("expected a type name");

        const auto& names = primitive_names();
        auto it = names.find(ident);
        if (it != names.end())
            return make_primitive(it->second);
        if (ident == "object")
            return make_object();
        if (std::isupper(static_cast<unsigned char>(ident.front())))
            return make_type_var(std::string(ident));

        pos_ -= ident.size();
        return error("unknown type '" + std::string(ident) + "'");
    }

    auto parse_type(bool allow_func_ptr) -> Result<TypePtr, JitError> {
        auto base = parse_base();
        if (is_err(base))
            return base;
        TypePtr ty = unwrap(base);

        while (true) {
            char c = peek();
            if (c == '*') {
                ++pos_;
                ty = make_ptr(is_void(ty) ? nullptr : ty);
            } else if (c == '[') {
                ++pos_;
                size_t ndim = 0;
                do {
                    if (!accept(':'))
                        return error("expected ':' in array dimensions");
                    ++ndim;
                } while (accept(','));
                if (!accept(']'))
                    return error("expected ']'");
                ty = make_array(ty, ndim);
            } else if (c == '(' && allow_func_ptr) {
                auto params = parse_arg_list();
                if (is_err(params))
                    return unwrap_err(params);
                if (!accept('*'))
                    return error("expected '*' after function pointer arguments");
                ty = make_func_ptr(std::move(unwrap(params)), ty);
            } else {
                break;
            }
        }
        return ty;
    }

    auto parse_arg_list() -> Result<std::vector<TypePtr>, JitError> {
        if (!accept('('))
            return error("expected '('");

        std::vector<TypePtr> args;
        if (accept(')'))
            return args;

        do {
            auto arg = parse_type(/*allow_func_ptr=*/true);
            if (is_err(arg))
                return unwrap_err(arg);
            args.push_back(unwrap(arg));
        } while (accept(','));

        if (!accept(')'))
            return error("expected ')'");

        // C style "f8(void)" means no arguments.
        if (args.size() == 1 && is_void(args[0]))
            args.clear();
        for (const auto& arg : args) {
            if (is_void(arg))
                return error("'void' is not a valid argument type");
        }
        return args;
    }

    std::string_view text_;
    size_t pos_ = 0;
};

} // namespace

auto parse_signature(std::string_view text, std::optional<std::string> name_override)
    -> Result<Signature, JitError> {
    SignatureParser parser(text);
    auto result = parser.parse_signature();
    if (is_ok(result) && name_override) {
        return unwrap(result).with_name(std::move(name_override));
    }
    return result;
}

auto parse_type(std::string_view text) -> Result<TypePtr, JitError> {
    SignatureParser parser(text);
    return parser.parse_single_type();
}

} // namespace autojit::types
