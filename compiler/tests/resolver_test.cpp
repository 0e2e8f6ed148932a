//! # Type Resolver Tests
//!
//! Value-to-type mapping and the call-site resolution order.

#include "types/resolver.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace autojit;
using namespace autojit::types;

namespace {

Signature sig_of(std::string_view text) {
    return unwrap(parse_signature(text));
}

std::string resolved(const Result<Signature, JitError>& result) {
    if (is_err(result))
        return "error: " + unwrap_err(result).to_string();
    return unwrap(result).canonical();
}

} // namespace

// ============================================================================
// type_of
// ============================================================================

TEST(TypeOfTest, Scalars) {
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(true)))), "b1");
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(int32_t(3))))), "i4");
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(int64_t(3))))), "i8");
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(uint64_t(3))))), "u8");
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(1.5f)))), "f4");
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(1.5)))), "f8");
}

TEST(TypeOfTest, CompoundValues) {
    double data[4] = {};
    ArrayValue array{make_f64(), 2, data, {2, 2}};
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(array)))), "f8[:, :]");

    PointerValue ptr{make_i32(), nullptr, false};
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(ptr)))), "i4*");

    PointerValue void_ptr{nullptr, nullptr, true};
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(void_ptr)))), "void*");

    FunctionValue fn{sig_of("f8(f8)"), nullptr};
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(fn)))), "f8(f8)*");

    ObjectValue obj{std::make_shared<int>(1), "int"};
    EXPECT_EQ(type_to_string(unwrap(type_of(Value(obj)))), "object");
}

TEST(TypeOfTest, UnsupportedValues) {
    EXPECT_EQ(unwrap_err(type_of(Value())).kind, ErrorKind::UnsupportedValue);

    PointerValue untyped{nullptr, nullptr, false};
    EXPECT_EQ(unwrap_err(type_of(Value(untyped))).kind, ErrorKind::UnsupportedValue);

    ArrayValue no_element{nullptr, 1, nullptr, {}};
    EXPECT_EQ(unwrap_err(type_of(Value(no_element))).kind, ErrorKind::UnsupportedValue);
}

// ============================================================================
// resolve_argtypes
// ============================================================================

class ResolveArgtypesTest : public ::testing::Test {
protected:
    CallableShape shape{"f", {"a", "b"}, std::nullopt, {}};
};

TEST_F(ResolveArgtypesTest, ObservedTypes) {
    std::vector<Value> args{Value(int32_t(1)), Value(2.0)};

    auto sig = resolve_argtypes(shape, args, {});
    ASSERT_TRUE(is_ok(sig));
    EXPECT_FALSE(unwrap(sig).has_return_type());
    EXPECT_EQ(unwrap(sig).args_key(), "(i4, f8)");
}

TEST_F(ResolveArgtypesTest, KeywordArgumentsRejectedFirst) {
    // Wrong count and an unsupported value: the keyword check still wins.
    std::vector<Value> args{Value()};
    KeywordArgs kwargs{{"b", Value(int32_t(2))}};

    auto sig = resolve_argtypes(shape, args, kwargs);
    ASSERT_TRUE(is_err(sig));
    EXPECT_EQ(unwrap_err(sig).kind, ErrorKind::KeywordArgsUnsupported);
}

TEST_F(ResolveArgtypesTest, ArityCheckedBeforeValues) {
    std::vector<Value> args{Value(), Value(), Value()};

    auto sig = resolve_argtypes(shape, args, {});
    ASSERT_TRUE(is_err(sig));
    EXPECT_EQ(unwrap_err(sig).kind, ErrorKind::Arity);
    EXPECT_EQ(unwrap_err(sig).message, "f() takes exactly 2 arguments (3 given)");
}

TEST_F(ResolveArgtypesTest, UnsupportedValueAfterArity) {
    std::vector<Value> args{Value(int32_t(1)), Value()};

    auto sig = resolve_argtypes(shape, args, {});
    ASSERT_TRUE(is_err(sig));
    EXPECT_EQ(unwrap_err(sig).kind, ErrorKind::UnsupportedValue);
}

TEST_F(ResolveArgtypesTest, TemplateBindsVariables) {
    shape.template_signature = sig_of("T(T, i4)");
    std::vector<Value> args{Value(1.5), Value(int64_t(2))};

    // The concrete i4 position wins over the observed i8.
    EXPECT_EQ(resolved(resolve_argtypes(shape, args, {})), "f8(f8, i4)");
}

TEST_F(ResolveArgtypesTest, TemplateUnboundReturnIsLeftOpen) {
    shape.template_signature = sig_of("R(T, T)");
    std::vector<Value> args{Value(int32_t(1)), Value(int32_t(2))};

    auto sig = resolve_argtypes(shape, args, {});
    ASSERT_TRUE(is_ok(sig));
    EXPECT_FALSE(unwrap(sig).has_return_type());
    EXPECT_EQ(unwrap(sig).args_key(), "(i4, i4)");
}

TEST_F(ResolveArgtypesTest, TemplateConflictIsMismatch) {
    shape.template_signature = sig_of("T(T, T)");
    std::vector<Value> args{Value(int32_t(1)), Value(2.0)};

    auto sig = resolve_argtypes(shape, args, {});
    ASSERT_TRUE(is_err(sig));
    EXPECT_EQ(unwrap_err(sig).kind, ErrorKind::SignatureMismatch);
}

TEST_F(ResolveArgtypesTest, TemplateArrayElement) {
    shape.template_signature = sig_of("T(T[:], i8)");
    double data[3] = {};
    std::vector<Value> args{Value(ArrayValue{make_f64(), 1, data, {3}}), Value(int64_t(0))};

    EXPECT_EQ(resolved(resolve_argtypes(shape, args, {})), "f8(f8[:], i8)");
}

TEST_F(ResolveArgtypesTest, LocalsOverrideArguments) {
    shape.locals = {{"b", make_f64()}, {"unused", make_i32()}};
    std::vector<Value> args{Value(int32_t(1)), Value(int32_t(2))};

    auto sig = resolve_argtypes(shape, args, {});
    ASSERT_TRUE(is_ok(sig));
    EXPECT_EQ(unwrap(sig).args_key(), "(i4, f8)");
}

TEST(ResolveTemplateTest, ArityMismatch) {
    auto result = resolve_template({}, sig_of("T(T)"), {"a", "b"}, {make_i32(), make_i32()});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::SignatureMismatch);
}

TEST(SignatureFromValuesTest, CarriesReturnTypeAndName) {
    std::vector<Value> args{Value(1.0f), Value(true)};
    auto sig = signature_from_values(args, make_f32(), std::string("g"));

    ASSERT_TRUE(is_ok(sig));
    EXPECT_EQ(unwrap(sig).to_string(), "g f4(f4, b1)");
}
