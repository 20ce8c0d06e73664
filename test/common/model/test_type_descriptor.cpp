//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "model/type_descriptor.hpp"

#include "ber/ber_gtest_helpers.hpp"
#include "ber/ber_value.hpp"
#include "model/model_gtest_helpers.hpp"

#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstddef>

namespace
{

using namespace iecmms::common::model;  // NOLINT This our main concern here in the unit tests.

using iecmms::common::ber::BerValue;
using iecmms::common::ber::TagClass;
using iecmms::sdk::FunctionalConstraint;
using iecmms::sdk::TypeDescriptor;
using iecmms::sdk::TypeKind;
using iecmms::sdk::error::MalformedEncoding;
using testing::_;
using testing::ElementsAre;
using testing::IsEmpty;
using testing::IsNull;
using testing::NotNull;
using testing::SizeIs;
using testing::VariantWith;

namespace ber       = iecmms::common::ber;
namespace type_desc = iecmms::type_desc;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestTypeDescriptor : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestTypeDescriptor, parse_basic_types)
{
    const auto boolean = type_desc::parseOrFail(type_desc::boolean());
    ASSERT_THAT(boolean, NotNull());
    EXPECT_EQ(boolean->kind, TypeKind::Boolean);

    const auto integer = type_desc::parseOrFail(type_desc::integer(32));
    ASSERT_THAT(integer, NotNull());
    EXPECT_EQ(integer->kind, TypeKind::Integer);
    EXPECT_EQ(integer->size, 32);

    const auto natural = type_desc::parseOrFail(type_desc::unsignedInteger(16));
    ASSERT_THAT(natural, NotNull());
    EXPECT_EQ(natural->kind, TypeKind::Unsigned);
    EXPECT_EQ(natural->size, 16);

    const auto number = type_desc::parseOrFail(type_desc::floatingPoint(64, 11));
    ASSERT_THAT(number, NotNull());
    EXPECT_EQ(number->kind, TypeKind::Float);
    EXPECT_EQ(number->size, 64);
    EXPECT_EQ(number->exponent_width, 11);

    const auto text = type_desc::parseOrFail(type_desc::visibleString(-255));
    ASSERT_THAT(text, NotNull());
    EXPECT_EQ(text->kind, TypeKind::VisibleString);
    EXPECT_EQ(text->size, -255);

    const auto time = type_desc::parseOrFail(type_desc::utcTime());
    ASSERT_THAT(time, NotNull());
    EXPECT_EQ(time->kind, TypeKind::UtcTime);

    const auto unicode = type_desc::parseOrFail(ber::makeInteger(TagClass::ContextSpecific, 16, -64));
    ASSERT_THAT(unicode, NotNull());
    EXPECT_EQ(unicode->kind, TypeKind::MmsString);
}

TEST_F(TestTypeDescriptor, parse_binary_time)
{
    const auto with_date = type_desc::parseOrFail(ber::makeBoolean(TagClass::ContextSpecific, 12, true));
    ASSERT_THAT(with_date, NotNull());
    EXPECT_EQ(with_date->kind, TypeKind::OctetString);
    EXPECT_TRUE(with_date->binary_time);
    EXPECT_EQ(with_date->size, 6);

    const auto time_of_day = type_desc::parseOrFail(ber::makeBoolean(TagClass::ContextSpecific, 12, false));
    ASSERT_THAT(time_of_day, NotNull());
    EXPECT_EQ(time_of_day->size, 4);
}

TEST_F(TestTypeDescriptor, parse_structure_and_array)
{
    const auto type = type_desc::parseOrFail(type_desc::structure({
        {"mag", type_desc::structure({{"f", type_desc::floatingPoint()}})},
        {"hist", type_desc::array(3, type_desc::integer(16))},
    }));
    ASSERT_THAT(type, NotNull());
    EXPECT_EQ(type->kind, TypeKind::Structure);
    ASSERT_THAT(type->components, SizeIs(2));
    EXPECT_EQ(type->components[0].name, "mag");
    EXPECT_EQ(type->components[1].name, "hist");

    const auto* const mag = type->findComponent("mag");
    ASSERT_THAT(mag, NotNull());
    ASSERT_THAT(mag->type->findComponent("f"), NotNull());
    EXPECT_EQ(mag->type->findComponent("f")->type->kind, TypeKind::Float);

    const auto& hist = type->components[1].type;
    EXPECT_EQ(hist->kind, TypeKind::Array);
    EXPECT_EQ(hist->element_count, 3U);
    ASSERT_THAT(hist->element, NotNull());
    EXPECT_EQ(hist->element->kind, TypeKind::Integer);

    EXPECT_THAT(type->findComponent("unknown"), IsNull());
}

TEST_F(TestTypeDescriptor, parse_invalid)
{
    // unsupported alternatives (bcd, generalized time)
    EXPECT_THAT(parseTypeDescription(ber::makeInteger(TagClass::ContextSpecific, 13, 8)),
                VariantWith<MalformedEncoding>(_));
    EXPECT_THAT(parseTypeDescription(ber::makeNull(TagClass::ContextSpecific, 11)), VariantWith<MalformedEncoding>(_));
    // not a context specific choice
    EXPECT_THAT(parseTypeDescription(ber::makeNull(TagClass::Universal, 5)), VariantWith<MalformedEncoding>(_));
    // float with an unsupported format
    EXPECT_THAT(parseTypeDescription(type_desc::floatingPoint(48, 11)), VariantWith<MalformedEncoding>(_));
    // integer without size
    EXPECT_THAT(parseTypeDescription(ber::makeNull(TagClass::ContextSpecific, 5)), VariantWith<MalformedEncoding>(_));
    // array with negative count
    EXPECT_THAT(parseTypeDescription(type_desc::array(-1, type_desc::boolean())), VariantWith<MalformedEncoding>(_));
    // structure component without a name
    const auto unnamed = BerValue::sequenceOf({BerValue::contextOf(1, {type_desc::boolean()})});
    EXPECT_THAT(parseTypeDescription(BerValue::contextOf(2, {BerValue::contextOf(1, {unnamed})})),
                VariantWith<MalformedEncoding>(_));
    // malformed nested component
    EXPECT_THAT(parseTypeDescription(type_desc::structure({{"x", ber::makeNull(TagClass::ContextSpecific, 13)}})),
                VariantWith<MalformedEncoding>(_));
}

TEST_F(TestTypeDescriptor, parse_too_deep)
{
    auto description = type_desc::boolean();
    for (std::size_t i = 0; i < 70; ++i)
    {
        description = type_desc::array(1, description);
    }
    EXPECT_THAT(parseTypeDescription(description), VariantWith<MalformedEncoding>(_));
}

TEST_F(TestTypeDescriptor, find_descriptor)
{
    const auto ln_type = type_desc::parseOrFail(type_desc::someLogicalNodeType());
    ASSERT_THAT(ln_type, NotNull());

    const auto st_val = findDescriptor(ln_type, FunctionalConstraint::ST, {"Mod", "stVal"});
    ASSERT_THAT(st_val, NotNull());
    EXPECT_EQ(st_val->kind, TypeKind::Integer);

    const auto mod = findDescriptor(ln_type, FunctionalConstraint::ST, {"Mod"});
    ASSERT_THAT(mod, NotNull());
    EXPECT_EQ(mod->kind, TypeKind::Structure);

    const auto mag_f = findDescriptor(ln_type, FunctionalConstraint::MX, {"AnIn1", "mag", "f"});
    ASSERT_THAT(mag_f, NotNull());
    EXPECT_EQ(mag_f->kind, TypeKind::Float);

    const auto whole_fc = findDescriptor(ln_type, FunctionalConstraint::CF, {});
    ASSERT_THAT(whole_fc, NotNull());
    EXPECT_THAT(whole_fc->components, SizeIs(1));

    EXPECT_THAT(findDescriptor(ln_type, FunctionalConstraint::MX, {"Mod"}), IsNull());
    EXPECT_THAT(findDescriptor(ln_type, FunctionalConstraint::SP, {"Mod"}), IsNull());
    EXPECT_THAT(findDescriptor(ln_type, FunctionalConstraint::ST, {"Mod", "stVal", "x"}), IsNull());
    EXPECT_THAT(findDescriptor(nullptr, FunctionalConstraint::ST, {"Mod"}), IsNull());
}

TEST_F(TestTypeDescriptor, functional_constraints_of)
{
    const auto ln_type = type_desc::parseOrFail(type_desc::someLogicalNodeType());

    EXPECT_THAT(functionalConstraintsOf(ln_type, {"Mod"}),
                ElementsAre(FunctionalConstraint::ST, FunctionalConstraint::CF));
    EXPECT_THAT(functionalConstraintsOf(ln_type, {"Mod", "stVal"}), ElementsAre(FunctionalConstraint::ST));
    EXPECT_THAT(functionalConstraintsOf(ln_type, {"Mod", "ctlModel"}), ElementsAre(FunctionalConstraint::CF));
    EXPECT_THAT(functionalConstraintsOf(ln_type, {"Missing"}), IsEmpty());
    EXPECT_THAT(functionalConstraintsOf(nullptr, {"Mod"}), IsEmpty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
