/// @file tests/reflect/test_type_registry.cpp
/// @brief Tests for TypeRegistry registration rules and lookup.

#include "vdc/reflect.hpp"
#include "vdc/errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <type_traits>
#include <utility>

using namespace vdc;
using namespace vdc::reflect;

// ─── Definitions ──────────────────────────────────────────────────────────────

// Descriptors come from a registry only; the construction key is out of reach.
static_assert(!std::is_default_constructible_v<TypeDescriptor::Key>);
static_assert(!std::is_constructible_v<TypeDescriptor, std::string, TypeKind>);

TEST(TypeRegistry, DescriptorsAreOwnedAndStable) {
    TypeRegistry reg;
    const TypeDescriptor* first = &reg.define_interface("First");
    for (int i = 0; i < 64; ++i) {
        reg.define_class("C" + std::to_string(i));
    }
    EXPECT_EQ(reg.find("First"), first);
    EXPECT_EQ(first->name(), "First");
    EXPECT_EQ(reg.size(), 65u);
}

TEST(TypeRegistry, DefineClassLinksSuperclassAndInterfaces) {
    TypeRegistry reg;
    const auto& named = reg.define_interface("Named");
    const auto& base  = reg.define_class("Base");
    const auto& leaf  = reg.define_class("Leaf", "Base", {"Named"},
                                         {{"id", Visibility::Private}});

    EXPECT_EQ(leaf.name(), "Leaf");
    EXPECT_EQ(leaf.kind(), TypeKind::Class);
    EXPECT_EQ(leaf.superclass(), &base);
    ASSERT_EQ(leaf.interfaces().size(), 1u);
    EXPECT_EQ(leaf.interfaces()[0], &named);
    ASSERT_EQ(leaf.declared_fields().size(), 1u);
    EXPECT_EQ(leaf.declared_fields()[0].declaring_type, "Leaf");
    EXPECT_FALSE(leaf.declared_fields()[0].accessible);
}

TEST(TypeRegistry, InterfaceHasNoSuperclass) {
    TypeRegistry reg;
    reg.define_interface("A");
    const auto& b = reg.define_interface("B", {"A"});
    EXPECT_TRUE(b.is_interface());
    EXPECT_EQ(b.superclass(), nullptr);
    ASSERT_EQ(b.interfaces().size(), 1u);
    EXPECT_EQ(b.interfaces()[0]->name(), "A");
}

TEST(TypeRegistry, DuplicateNameThrows) {
    TypeRegistry reg;
    reg.define_class("Base");
    EXPECT_THROW(reg.define_class("Base"), InvalidArgument);
    EXPECT_THROW(reg.define_interface("Base"), InvalidArgument);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(TypeRegistry, BlankNameThrows) {
    TypeRegistry reg;
    EXPECT_THROW(reg.define_class(""), InvalidArgument);
    EXPECT_THROW(reg.define_interface("  "), InvalidArgument);
}

TEST(TypeRegistry, UnknownReferencesThrow) {
    TypeRegistry reg;
    EXPECT_THROW(reg.define_class("Leaf", "Missing"), InvalidArgument);
    EXPECT_THROW(reg.define_class("Leaf", "", {"Missing"}), InvalidArgument);
    EXPECT_THROW(reg.define_interface("I", {"Missing"}), InvalidArgument);
}

TEST(TypeRegistry, ClassCannotExtendInterface) {
    TypeRegistry reg;
    reg.define_interface("I");
    EXPECT_THROW(reg.define_class("C", "I"), InvalidArgument);
}

TEST(TypeRegistry, ClassCannotBeImplemented) {
    TypeRegistry reg;
    reg.define_class("Base");
    EXPECT_THROW(reg.define_class("C", "", {"Base"}), InvalidArgument);
    EXPECT_THROW(reg.define_interface("I", {"Base"}), InvalidArgument);
}

TEST(TypeRegistry, InterfaceListedTwiceThrows) {
    TypeRegistry reg;
    reg.define_interface("I");
    EXPECT_THROW(reg.define_class("C", "", {"I", "I"}), InvalidArgument);
}

TEST(TypeRegistry, InterfaceFieldsMustBePublic) {
    TypeRegistry reg;
    EXPECT_THROW(reg.define_interface("I", {}, {{"x", Visibility::Private}}),
                 InvalidArgument);
    reg.define_interface("J", {}, {{"x", Visibility::Public}});
    EXPECT_THROW(reg.add_field("J", {"y", Visibility::Protected}), InvalidArgument);
}

TEST(TypeRegistry, DuplicateFieldThrows) {
    TypeRegistry reg;
    EXPECT_THROW(reg.define_class("C", "", {},
                                  {{"x", Visibility::Public}, {"x", Visibility::Private}}),
                 InvalidArgument);
}

TEST(TypeRegistry, FailedDefinitionRegistersNothing) {
    TypeRegistry reg;
    EXPECT_THROW(reg.define_class("C", "", {"Missing"}), InvalidArgument);
    EXPECT_EQ(reg.find("C"), nullptr);
    EXPECT_EQ(reg.size(), 0u);
    // The name is still free.
    EXPECT_NO_THROW(reg.define_class("C"));
}

// ─── add_field ────────────────────────────────────────────────────────────────

TEST(TypeRegistry, AddFieldAppendsInOrder) {
    TypeRegistry reg;
    reg.define_class("C", "", {}, {{"a", Visibility::Public}});
    reg.add_field("C", {"b", Visibility::Package});

    const auto& fields = reg.get("C").declared_fields();
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0].name, "a");
    EXPECT_EQ(fields[1].name, "b");
    EXPECT_EQ(fields[1].visibility, Visibility::Package);
}

TEST(TypeRegistry, AddFieldToUnknownTypeThrows) {
    TypeRegistry reg;
    EXPECT_THROW(reg.add_field("Nope", {"a", Visibility::Public}), InvalidArgument);
}

// ─── Lookup ───────────────────────────────────────────────────────────────────

TEST(TypeRegistry, FindAndGet) {
    TypeRegistry reg;
    reg.define_class("C");
    EXPECT_NE(reg.find("C"), nullptr);
    EXPECT_EQ(reg.find("D"), nullptr);
    EXPECT_EQ(reg.get("C").name(), "C");
    EXPECT_THROW((void)reg.get("D"), InvalidArgument);
}

TEST(TypeRegistry, NamesInRegistrationOrder) {
    TypeRegistry reg;
    reg.define_interface("Z");
    reg.define_class("A", "", {"Z"});
    reg.define_class("M", "A");
    EXPECT_EQ(reg.names(), (std::vector<std::string>{"Z", "A", "M"}));
}

TEST(TypeRegistry, FindDeclaredFieldIgnoresInherited) {
    TypeRegistry reg;
    reg.define_class("Base", "", {}, {{"x", Visibility::Public}});
    const auto& leaf = reg.define_class("Leaf", "Base");
    EXPECT_EQ(leaf.find_declared_field("x"), nullptr);
    EXPECT_NE(reg.get("Base").find_declared_field("x"), nullptr);
}

TEST(TypeRegistry, DescriptorsSurviveMove) {
    TypeRegistry reg;
    reg.define_class("Base");
    const TypeDescriptor* base = reg.find("Base");
    const auto& leaf = reg.define_class("Leaf", "Base");

    TypeRegistry moved = std::move(reg);
    EXPECT_EQ(moved.find("Base"), base);
    EXPECT_EQ(moved.find("Leaf"), &leaf);
    EXPECT_EQ(moved.get("Leaf").superclass(), base);
}

TEST(TypeRegistry, ToStringKeywords) {
    EXPECT_STREQ(to_string(Visibility::Public), "public");
    EXPECT_STREQ(to_string(Visibility::Protected), "protected");
    EXPECT_STREQ(to_string(Visibility::Package), "package");
    EXPECT_STREQ(to_string(Visibility::Private), "private");
    EXPECT_STREQ(to_string(TypeKind::Class), "class");
    EXPECT_STREQ(to_string(TypeKind::Interface), "interface");
}
