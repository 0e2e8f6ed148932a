//! # Signature and Type Tests
//!
//! Signature grammar, canonical rendering, equality, and the semantic type
//! helpers (promotion, unification, native layout).

#include "types/signature.hpp"
#include "types/type.hpp"

#include <gtest/gtest.h>

using namespace autojit;
using namespace autojit::types;

namespace {

Signature parse_ok(std::string_view text) {
    auto parsed = parse_signature(text);
    EXPECT_TRUE(is_ok(parsed)) << (is_err(parsed) ? unwrap_err(parsed).to_string() : "");
    return is_ok(parsed) ? unwrap(parsed) : Signature();
}

JitError parse_fail(std::string_view text) {
    auto parsed = parse_signature(text);
    EXPECT_TRUE(is_err(parsed)) << "parsed: " << text;
    return is_err(parsed) ? unwrap_err(parsed) : JitError::make(ErrorKind::Compilation, "");
}

} // namespace

// ============================================================================
// Grammar
// ============================================================================

TEST(SignatureParseTest, NamedSignature) {
    auto sig = parse_ok("add i4(i4, i4)");

    ASSERT_TRUE(sig.name().has_value());
    EXPECT_EQ(*sig.name(), "add");
    EXPECT_TRUE(types_equal(sig.return_type(), make_i32()));
    ASSERT_EQ(sig.arity(), 2u);
    EXPECT_TRUE(types_equal(sig.args()[0], make_i32()));
    EXPECT_TRUE(types_equal(sig.args()[1], make_i32()));
    EXPECT_EQ(sig.to_string(), "add i4(i4, i4)");
}

TEST(SignatureParseTest, UnnamedSignature) {
    auto sig = parse_ok("f8(f8, i4)");

    EXPECT_FALSE(sig.name().has_value());
    EXPECT_EQ(sig.canonical(), "f8(f8, i4)");
}

TEST(SignatureParseTest, CAliasesNormalize) {
    EXPECT_EQ(parse_ok("double(int, long, uchar, bool)").canonical(), "f8(i4, i8, u1, b1)");
    EXPECT_EQ(parse_ok("float32(int16, uint64)").canonical(), "f4(i2, u8)");
}

TEST(SignatureParseTest, PointersAndArrays) {
    auto sig = parse_ok("scale void(f8[:, :], f8*, void*, i4[:])");

    EXPECT_EQ(sig.canonical(), "void(f8[:, :], f8*, void*, i4[:])");
    ASSERT_TRUE(sig.args()[0]->is<ArrayType>());
    EXPECT_EQ(sig.args()[0]->as<ArrayType>().ndim, 2u);
    ASSERT_TRUE(sig.args()[2]->is<PtrType>());
    EXPECT_EQ(sig.args()[2]->as<PtrType>().inner, nullptr);
}

TEST(SignatureParseTest, FunctionPointerArgument) {
    auto sig = parse_ok("apply f8(f8(f8)*, f8)");

    ASSERT_TRUE(sig.args()[0]->is<FuncPtrType>());
    EXPECT_EQ(type_to_string(sig.args()[0]), "f8(f8)*");
    EXPECT_EQ(sig.canonical(), "f8(f8(f8)*, f8)");
}

TEST(SignatureParseTest, VoidArgumentListIsEmpty) {
    EXPECT_EQ(parse_ok("i4(void)").arity(), 0u);
    EXPECT_EQ(parse_ok("i4()").arity(), 0u);
}

TEST(SignatureParseTest, UppercaseNamesAreTypeVariables) {
    auto sig = parse_ok("T(T, i4)");

    EXPECT_FALSE(sig.is_concrete());
    EXPECT_TRUE(sig.args()[0]->is<TypeVar>());
    EXPECT_EQ(sig.args()[0]->as<TypeVar>().name, "T");
}

TEST(SignatureParseTest, NameOverride) {
    auto parsed = parse_signature("add i4(i4, i4)", std::string("plus"));
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_EQ(*unwrap(parsed).name(), "plus");
}

TEST(SignatureParseTest, SyntaxErrors) {
    EXPECT_EQ(parse_fail("i4(i4").kind, ErrorKind::SignatureSyntax);
    EXPECT_EQ(parse_fail("i4 i4, i4)").kind, ErrorKind::SignatureSyntax);
    EXPECT_EQ(parse_fail("i4(i4) extra").kind, ErrorKind::SignatureSyntax);
    EXPECT_EQ(parse_fail("i4(void, i4)").kind, ErrorKind::SignatureSyntax);
    EXPECT_EQ(parse_fail("f8[:(f8)").kind, ErrorKind::SignatureSyntax);

    auto err = parse_fail("i4(i4, widget)");
    EXPECT_NE(err.message.find("unknown type 'widget'"), std::string::npos);
    EXPECT_NE(err.message.find("column 8"), std::string::npos);
}

TEST(SignatureParseTest, FunctionPointerNotAllowedAsReturn) {
    EXPECT_EQ(parse_fail("f8(f8)*(f8)").kind, ErrorKind::SignatureSyntax);
}

TEST(ParseTypeTest, SingleTypes) {
    auto ptr = parse_type("f8**");
    ASSERT_TRUE(is_ok(ptr));
    EXPECT_EQ(type_to_string(unwrap(ptr)), "f8**");

    auto fn = parse_type("void(i4, f8[:])*");
    ASSERT_TRUE(is_ok(fn));
    EXPECT_TRUE(unwrap(fn)->is<FuncPtrType>());

    EXPECT_TRUE(is_err(parse_type("i4 i4")));
}

// ============================================================================
// Equality and Derived Forms
// ============================================================================

TEST(SignatureTest, EqualityIgnoresName) {
    auto a = parse_ok("add i4(i4, i4)");
    auto b = parse_ok("plus i4(i4, i4)");
    auto c = parse_ok("i8(i4, i4)");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(SignatureHash{}(a), SignatureHash{}(b));
}

TEST(SignatureTest, MissingReturnType) {
    Signature sig(nullptr, {make_f64(), make_i32()});

    EXPECT_FALSE(sig.has_return_type());
    EXPECT_EQ(sig.args_key(), "(f8, i4)");
    EXPECT_EQ(sig.canonical(), "?(f8, i4)");
    EXPECT_TRUE(sig.with_return_type(make_f64()).has_return_type());
}

TEST(SignatureTest, FunctionTypeRoundTrip) {
    auto sig = parse_ok("f8(i4, f4)");
    auto back = signature_from_type(sig.as_func_ptr_type(), std::string("g"));

    ASSERT_TRUE(is_ok(back));
    EXPECT_EQ(unwrap(back), sig);
    EXPECT_EQ(*unwrap(back).name(), "g");

    EXPECT_TRUE(is_err(signature_from_type(make_f64())));
}

// ============================================================================
// Type Helpers
// ============================================================================

TEST(TypeTest, NumericPromotion) {
    EXPECT_EQ(type_to_string(promote_numeric(make_i32(), make_i64())), "i8");
    EXPECT_EQ(type_to_string(promote_numeric(make_i32(), make_f64())), "f8");
    EXPECT_EQ(type_to_string(promote_numeric(make_f32(), make_i32())), "f8");
    EXPECT_EQ(type_to_string(promote_numeric(make_f32(), make_primitive(PrimitiveKind::I16))),
              "f4");
    EXPECT_EQ(type_to_string(promote_numeric(make_i32(), make_primitive(PrimitiveKind::U32))),
              "i8");
    EXPECT_EQ(type_to_string(promote_numeric(make_i64(), make_u64())), "f8");
    EXPECT_EQ(promote_numeric(make_i32(), make_object()), nullptr);
}

TEST(TypeTest, UnifyBindsTypeVariables) {
    std::unordered_map<std::string, TypePtr> bindings;

    EXPECT_TRUE(unify(make_array(make_type_var("T"), 1), make_array(make_f64(), 1), bindings));
    ASSERT_EQ(bindings.count("T"), 1u);
    EXPECT_EQ(type_to_string(bindings["T"]), "f8");

    EXPECT_TRUE(unify(make_type_var("T"), make_f64(), bindings));
    EXPECT_FALSE(unify(make_type_var("T"), make_i32(), bindings));
    EXPECT_EQ(type_to_string(substitute_type(make_ptr(make_type_var("T")), bindings)), "f8*");
}

TEST(TypeTest, NativeLayout) {
    EXPECT_EQ(native_size(make_f64()), 8u);
    EXPECT_EQ(native_size(make_i32()), 4u);
    EXPECT_EQ(native_size(make_bool()), 1u);
    EXPECT_EQ(native_size(make_ptr(make_f64())), sizeof(void*));
    EXPECT_EQ(native_align(make_f64()), 8u);
}

TEST(TypeTest, ExtensionClassesCompareByIdentity) {
    auto first = make_extension_ref("P", 7);
    auto rebuilt = make_extension_ref("P", 8);
    EXPECT_TRUE(types_equal(first, make_extension_ref("P", 7)));
    EXPECT_FALSE(types_equal(first, rebuilt));

    // Display spelling hides the id; the key spelling keeps them apart.
    EXPECT_EQ(type_to_string(first), type_to_string(rebuilt));
    EXPECT_EQ(type_key(first), "instance(P#7)");
    EXPECT_NE(Signature(make_void(), {first}).args_key(),
              Signature(make_void(), {rebuilt}).args_key());
    EXPECT_EQ(Signature(make_f64(), {first, make_i32()}).canonical(), "f8(instance(P), i4)");
}
