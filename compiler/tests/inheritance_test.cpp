//! # Inheritance Verifier Tests
//!
//! Attribute struct layout, vtable prefix rules and base compatibility.

#include "exttypes/inheritance.hpp"

#include <gtest/gtest.h>

using namespace autojit;
using namespace autojit::exttypes;
using namespace autojit::types;

namespace {

Signature method_sig(const std::string& owner, TypePtr ret, std::vector<TypePtr> args = {}) {
    args.insert(args.begin(), make_extension_ref(owner));
    return Signature(std::move(ret), std::move(args));
}

AttributeStruct point_struct(const std::string& name) {
    AttributeStruct s(name);
    s.add_field("x", make_f64());
    s.add_field("y", make_f64());
    return s;
}

} // namespace

// ============================================================================
// AttributeStruct
// ============================================================================

TEST(AttributeStructTest, OffsetsFollowNaturalAlignment) {
    AttributeStruct s("Rec");
    EXPECT_TRUE(s.add_field("flag", make_bool()));
    EXPECT_TRUE(s.add_field("value", make_f64()));
    EXPECT_TRUE(s.add_field("count", make_i32()));

    ASSERT_EQ(s.fields().size(), 3u);
    EXPECT_EQ(s.fields()[0].offset, 0u);
    EXPECT_EQ(s.fields()[1].offset, 8u);
    EXPECT_EQ(s.fields()[2].offset, 16u);
    EXPECT_EQ(s.align(), 8u);
    EXPECT_EQ(s.size(), 24u);
    EXPECT_EQ(s.to_string(), "Rec{flag: b1, value: f8, count: i4}");
}

TEST(AttributeStructTest, DuplicateFieldRejected) {
    AttributeStruct s("Rec");
    EXPECT_TRUE(s.add_field("x", make_f64()));
    EXPECT_FALSE(s.add_field("x", make_i32()));
    EXPECT_EQ(s.fields().size(), 1u);
    EXPECT_TRUE(types_equal(s.find("x")->type, make_f64()));
    EXPECT_EQ(s.find("z"), nullptr);
}

TEST(AttributeStructTest, PrefixLaw) {
    AttributeStruct base("Base");
    base.add_field("x", make_f64());

    AttributeStruct child("Child");
    child.add_field("x", make_f64());
    child.add_field("y", make_i32());

    EXPECT_TRUE(base.is_prefix_of(base));
    EXPECT_TRUE(base.is_prefix_of(child));
    EXPECT_FALSE(child.is_prefix_of(base));

    AttributeStruct retyped("Other");
    retyped.add_field("x", make_i64());
    EXPECT_FALSE(base.is_prefix_of(retyped));

    AttributeStruct renamed("Other");
    renamed.add_field("w", make_f64());
    EXPECT_FALSE(base.is_prefix_of(renamed));
}

TEST(AttributeStructTest, StructTypeKeepsFieldOrder) {
    auto type = point_struct("Point").as_struct_type();
    EXPECT_EQ(native_size(type), 16u);
    EXPECT_EQ(native_align(type), 8u);
}

// ============================================================================
// VTableType
// ============================================================================

TEST(VTableTypeTest, SlotsKeepDeclarationOrder) {
    VTableType vtab;
    vtab.add_slot(VTableSlot{"area", method_sig("Shape", make_f64())});
    vtab.add_slot(VTableSlot{"scale", method_sig("Shape", make_void(), {make_f64()})});

    EXPECT_EQ(vtab.size(), 2u);
    EXPECT_EQ(vtab.index_of("area"), 0u);
    EXPECT_EQ(vtab.index_of("scale"), 1u);
    EXPECT_FALSE(vtab.index_of("missing").has_value());
}

TEST(VTableTypeTest, PrefixIgnoresReceiverClass) {
    VTableType base;
    base.add_slot(VTableSlot{"area", method_sig("Shape", make_f64())});

    VTableType derived;
    derived.add_slot(VTableSlot{"area", method_sig("Square", make_f64())});
    derived.add_slot(VTableSlot{"side", method_sig("Square", make_f64())});

    EXPECT_TRUE(base.is_prefix_of(derived));
    EXPECT_FALSE(derived.is_prefix_of(base));

    VTableType reordered;
    reordered.add_slot(VTableSlot{"side", method_sig("Square", make_f64())});
    reordered.add_slot(VTableSlot{"area", method_sig("Square", make_f64())});
    EXPECT_FALSE(base.is_prefix_of(reordered));
}

TEST(SignatureComparisonTest, ReceiverInsensitive) {
    EXPECT_TRUE(signatures_equal_modulo_receiver(method_sig("A", make_f64(), {make_i32()}),
                                                 method_sig("B", make_f64(), {make_i32()})));
    EXPECT_FALSE(signatures_equal_modulo_receiver(method_sig("A", make_f64(), {make_i32()}),
                                                  method_sig("B", make_f64(), {make_i64()})));
    EXPECT_FALSE(signatures_equal_modulo_receiver(method_sig("A", make_f64()),
                                                  method_sig("A", make_f32())));

    // Only a receiver position is exempt; a later extension argument is not.
    EXPECT_FALSE(signatures_equal_modulo_receiver(
        method_sig("A", make_void(), {make_extension_ref("A")}),
        method_sig("A", make_void(), {make_extension_ref("B")})));
}

// ============================================================================
// verify
// ============================================================================

TEST(VerifyTest, PrefixExtensionAccepted) {
    AttributeStruct base("Base");
    base.add_field("x", make_f64());
    VTableType base_vtab;
    base_vtab.add_slot(VTableSlot{"get", method_sig("Base", make_f64())});

    AttributeStruct child("Child");
    child.add_field("x", make_f64());
    child.add_field("y", make_i32());
    VTableType child_vtab;
    child_vtab.add_slot(VTableSlot{"get", method_sig("Child", make_f64())});
    child_vtab.add_slot(VTableSlot{"twice", method_sig("Child", make_f64())});

    EXPECT_TRUE(is_ok(verify(base, child, base_vtab, child_vtab)));
}

TEST(VerifyTest, FieldMismatchNamesBothClasses) {
    AttributeStruct base("Base");
    base.add_field("x", make_f64());
    AttributeStruct child("Child");
    child.add_field("x", make_i32());

    auto result = verify(base, child, VTableType{}, VTableType{});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::LayoutIncompatible);
    EXPECT_EQ(unwrap_err(result).message,
              "attribute 0 is 'x: f8' in Base but 'x: i4' in Child");
}

TEST(VerifyTest, FewerAttributesRejected) {
    auto base = point_struct("Base");
    AttributeStruct child("Child");
    child.add_field("x", make_f64());

    auto result = verify(base, child, VTableType{}, VTableType{});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::LayoutIncompatible);
}

TEST(VerifyTest, MethodSlotMismatch) {
    AttributeStruct base("Base");
    AttributeStruct child("Child");
    VTableType base_vtab;
    base_vtab.add_slot(VTableSlot{"get", method_sig("Base", make_f64())});
    VTableType child_vtab;
    child_vtab.add_slot(VTableSlot{"get", method_sig("Child", make_i64())});

    auto result = verify(base, child, base_vtab, child_vtab);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::LayoutIncompatible);
    EXPECT_NE(unwrap_err(result).message.find("method slot 0"), std::string::npos);

    VTableType empty;
    EXPECT_TRUE(is_err(verify(base, child, base_vtab, empty)));
}

// ============================================================================
// verify_bases
// ============================================================================

TEST(VerifyBasesTest, CompatibleBasesAccepted) {
    AttributeStruct a("A");
    a.add_field("x", make_f64());
    AttributeStruct b("B");
    b.add_field("x", make_f64());
    VTableType empty;

    AttributeStruct c("C");
    c.add_field("x", make_f64());
    c.add_field("z", make_i32());

    std::vector<NativeBaseLayout> bases{{"A", &a, &empty}, {"B", &b, &empty}};
    EXPECT_TRUE(is_ok(verify_bases(bases, c, empty)));
}

TEST(VerifyBasesTest, SecondIncompatibleBaseNamesBoth) {
    AttributeStruct a("A");
    a.add_field("x", make_f64());
    AttributeStruct b("B");
    b.add_field("x", make_i32());
    VTableType empty;

    // C extends A, so B's field 0 cannot line up.
    AttributeStruct c("C");
    c.add_field("x", make_f64());

    std::vector<NativeBaseLayout> bases{{"A", &a, &empty}, {"B", &b, &empty}};
    auto result = verify_bases(bases, c, empty);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::LayoutIncompatible);
    EXPECT_EQ(unwrap_err(result).message, "Multiple incompatible base classes found: A and B");
    ASSERT_EQ(unwrap_err(result).notes.size(), 1u);
}

TEST(VerifyBasesTest, PrimaryBaseErrorIsReportedAsIs) {
    AttributeStruct a("A");
    a.add_field("x", make_f64());
    VTableType empty;
    AttributeStruct c("C");
    c.add_field("x", make_i64());

    std::vector<NativeBaseLayout> bases{{"A", &a, &empty}};
    auto result = verify_bases(bases, c, empty);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message.rfind("attribute 0", 0), 0u);
}

TEST(VerifyBasesTest, NoBasesIsTriviallyCompatible) {
    AttributeStruct c("C");
    EXPECT_TRUE(is_ok(verify_bases({}, c, VTableType{})));
}
