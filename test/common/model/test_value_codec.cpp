//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "model/value_codec.hpp"

#include "ber/ber_codec.hpp"
#include "ber/ber_gtest_helpers.hpp"
#include "ber/ber_value.hpp"
#include "model/model_gtest_helpers.hpp"

#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace
{

using namespace iecmms::common::model;  // NOLINT This our main concern here in the unit tests.

using iecmms::bytes;
using iecmms::decodeOrFail;
using iecmms::common::ber::BerValue;
using iecmms::common::ber::TagClass;
using iecmms::sdk::Error;
using iecmms::sdk::TypeDescriptor;
using iecmms::sdk::TypedValue;
using testing::_;
using testing::ElementsAre;
using testing::Field;
using testing::HasSubstr;
using testing::VariantWith;

namespace ber       = iecmms::common::ber;
namespace error     = iecmms::sdk::error;
namespace type_desc = iecmms::type_desc;
namespace value     = iecmms::sdk::value;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestValueCodec : public testing::Test
{
protected:
    static ber::Bytes encodedOf(const EncodeValue::Var& result)
    {
        if (const auto* const data = cetl::get_if<BerValue>(&result))
        {
            return ber::encode(*data);
        }
        ADD_FAILURE() << "Encoding failed: " << cetl::get<error::TypeMismatch>(result).detail;
        return {};
    }

    static TypeDescriptor::Ptr modType()
    {
        return type_desc::parseOrFail(type_desc::structure({
            {"stVal", type_desc::integer(8)},
            {"q", type_desc::bitString(13)},
        }));
    }
};

// MARK: - Tests:

TEST_F(TestValueCodec, decode_data_primitives)
{
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x83, 0x01, 0xFF}))),
                VariantWith<TypedValue>(TypedValue{value::Boolean{true}}));
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x85, 0x01, 0x05}))),
                VariantWith<TypedValue>(TypedValue{value::Integer{5, 8}}));
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x85, 0x02, 0xFF, 0x00}))),
                VariantWith<TypedValue>(TypedValue{value::Integer{-256, 16}}));
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x86, 0x02, 0x00, 0xFF}))),
                VariantWith<TypedValue>(TypedValue{value::Unsigned{255, 8}}));
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x84, 0x02, 0x06, 0x40}))),
                VariantWith<TypedValue>(TypedValue{value::BitString{{false, true}}}));
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x89, 0x02, 0xCA, 0xFE}))),
                VariantWith<TypedValue>(TypedValue{value::OctetString{{0xCA, 0xFE}}}));
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x8A, 0x02, 0x6F, 0x6B}))),
                VariantWith<TypedValue>(TypedValue{value::VisibleString{"ok"}}));
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x90, 0x02, 0xC3, 0xA9}))),
                VariantWith<TypedValue>(TypedValue{value::MmsString{"\xC3\xA9"}}));
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x91, 0x08, 0x5F, 0x5E, 0x10, 0x00, 0x80, 0x00, 0x00, 0x0A}))),
                VariantWith<TypedValue>(TypedValue{value::UtcTime{0x5F5E1000, 0x800000, 0x0A}}));
}

TEST_F(TestValueCodec, decode_data_floats)
{
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x87, 0x05, 0x08, 0x41, 0x20, 0x00, 0x00}))),
                VariantWith<TypedValue>(TypedValue{value::Float{10.0, 32}}));
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x87, 0x09, 0x0B, 0x40, 0x24, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}))),
                VariantWith<TypedValue>(TypedValue{value::Float{10.0, 64}}));

    // exponent width does not match the size
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x87, 0x05, 0x0B, 0x41, 0x20, 0x00, 0x00}))),
                VariantWith<Error>(VariantWith<error::MalformedEncoding>(_)));
}

TEST_F(TestValueCodec, decode_data_constructed)
{
    const auto structure = decodeOrFail(bytes({0xA2, 0x06, 0x83, 0x01, 0x00, 0x85, 0x01, 0x01}));
    EXPECT_THAT(decodeData(structure),
                VariantWith<TypedValue>(TypedValue{value::Structure{
                    {TypedValue{value::Boolean{false}}, TypedValue{value::Integer{1, 8}}},
                    {},
                }}));

    const auto array = decodeOrFail(bytes({0xA1, 0x06, 0x85, 0x01, 0x01, 0x85, 0x01, 0x02}));
    EXPECT_THAT(decodeData(array),
                VariantWith<TypedValue>(TypedValue{value::Array{
                    {TypedValue{value::Integer{1, 8}}, TypedValue{value::Integer{2, 8}}},
                }}));

    // failures propagate from the members
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0xA1, 0x03, 0x88, 0x01, 0x00}))),
                VariantWith<Error>(VariantWith<error::MalformedEncoding>(_)));
}

TEST_F(TestValueCodec, decode_data_malformed)
{
    const auto is_malformed = VariantWith<Error>(VariantWith<error::MalformedEncoding>(_));

    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x91, 0x03, 0x00, 0x00, 0x00}))), is_malformed);
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x88, 0x01, 0x00}))), is_malformed);
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x85, 0x00}))), is_malformed);
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0x02, 0x01, 0x00}))), is_malformed);
    EXPECT_THAT(decodeData(decodeOrFail(bytes({0xA3, 0x00}))), is_malformed);
}

TEST_F(TestValueCodec, decode_value_with_descriptor)
{
    const auto int32 = type_desc::parseOrFail(type_desc::integer(32));
    EXPECT_THAT(decodeValue(*int32, decodeOrFail(bytes({0x85, 0x01, 0x05}))),
                VariantWith<TypedValue>(TypedValue{value::Integer{5, 32}}));

    const auto data = decodeOrFail(bytes({0xA2, 0x07, 0x85, 0x01, 0x01, 0x84, 0x02, 0x03, 0x00}));
    const auto mod  = decodeValue(*modType(), data);
    ASSERT_THAT(mod, VariantWith<TypedValue>(_));

    const auto* const structure = cetl::get<TypedValue>(mod).as<value::Structure>();
    ASSERT_NE(structure, nullptr);
    EXPECT_THAT(structure->names, ElementsAre("stVal", "q"));
    ASSERT_NE(structure->find("stVal"), nullptr);
    EXPECT_EQ(*structure->find("stVal"), TypedValue{value::Integer{1, 8}});
}

TEST_F(TestValueCodec, decode_value_mismatch)
{
    const auto is_mismatch = VariantWith<Error>(VariantWith<error::TypeMismatch>(_));

    const auto boolean = type_desc::parseOrFail(type_desc::boolean());
    EXPECT_THAT(decodeValue(*boolean, decodeOrFail(bytes({0x85, 0x01, 0x05}))), is_mismatch);

    // structure of a different arity
    EXPECT_THAT(decodeValue(*modType(), decodeOrFail(bytes({0xA2, 0x03, 0x85, 0x01, 0x01}))), is_mismatch);
    // member of a different type
    EXPECT_THAT(decodeValue(*modType(), decodeOrFail(bytes({0xA2, 0x06, 0x85, 0x01, 0x01, 0x83, 0x01, 0x00}))),
                is_mismatch);

    const auto array = type_desc::parseOrFail(type_desc::array(3, type_desc::integer(8)));
    EXPECT_THAT(decodeValue(*array, decodeOrFail(bytes({0xA1, 0x03, 0x85, 0x01, 0x01}))), is_mismatch);
}

TEST_F(TestValueCodec, encode_value_checks_ranges)
{
    const auto int8 = type_desc::parseOrFail(type_desc::integer(8));
    EXPECT_THAT(encodedOf(encodeValue(*int8, TypedValue{value::Integer{-128, 64}})), ElementsAre(0x85, 0x01, 0x80));
    EXPECT_THAT(encodeValue(*int8, TypedValue{value::Integer{200, 64}}),
                VariantWith<error::TypeMismatch>(Field(&error::TypeMismatch::detail, HasSubstr("exceeds 8 bits"))));

    const auto uint8 = type_desc::parseOrFail(type_desc::unsignedInteger(8));
    EXPECT_THAT(encodedOf(encodeValue(*uint8, TypedValue{value::Unsigned{255, 8}})),
                ElementsAre(0x86, 0x02, 0x00, 0xFF));
    EXPECT_THAT(encodeValue(*uint8, TypedValue{value::Unsigned{256, 16}}), VariantWith<error::TypeMismatch>(_));

    const auto quality = type_desc::parseOrFail(type_desc::bitString(13));
    EXPECT_THAT(encodeValue(*quality, TypedValue{value::BitString{{true, false}}}),
                VariantWith<error::TypeMismatch>(_));
    EXPECT_THAT(encodedOf(encodeValue(*quality, TypedValue{value::BitString{std::vector<bool>(13, false)}})),
                ElementsAre(0x84, 0x03, 0x03, 0x00, 0x00));

    const auto text = type_desc::parseOrFail(type_desc::visibleString(-5));
    EXPECT_THAT(encodedOf(encodeValue(*text, TypedValue{value::VisibleString{"ok"}})),
                ElementsAre(0x8A, 0x02, 0x6F, 0x6B));
    EXPECT_THAT(encodeValue(*text, TypedValue{value::VisibleString{"too long"}}), VariantWith<error::TypeMismatch>(_));
}

TEST_F(TestValueCodec, encode_value_of_declared_type)
{
    // floats follow the declared precision
    const auto single = type_desc::parseOrFail(type_desc::floatingPoint(32, 8));
    EXPECT_THAT(encodedOf(encodeValue(*single, TypedValue{value::Float{1.5, 64}})),
                ElementsAre(0x87, 0x05, 0x08, 0x3F, 0xC0, 0x00, 0x00));

    const auto binary_time = type_desc::parseOrFail(ber::makeBoolean(TagClass::ContextSpecific, 12, false));
    EXPECT_THAT(encodedOf(encodeValue(*binary_time, TypedValue{value::OctetString{{1, 2, 3, 4}}})),
                ElementsAre(0x8C, 0x04, 0x01, 0x02, 0x03, 0x04));

    EXPECT_THAT(encodeValue(*single, TypedValue{value::Boolean{true}}),
                VariantWith<error::TypeMismatch>(Field(&error::TypeMismatch::detail, HasSubstr("expected"))));
}

TEST_F(TestValueCodec, encode_value_structures)
{
    const value::Structure unnamed{{TypedValue{value::Integer{1, 8}}, TypedValue{value::BitString{{}}}}, {}};
    EXPECT_THAT(encodeValue(*modType(), TypedValue{unnamed}), VariantWith<error::TypeMismatch>(_));

    const value::Structure named{
        {TypedValue{value::Integer{1, 8}}, TypedValue{value::BitString{std::vector<bool>(13, false)}}},
        {"stVal", "q"},
    };
    EXPECT_THAT(encodedOf(encodeValue(*modType(), TypedValue{named})),
                ElementsAre(0xA2, 0x08, 0x85, 0x01, 0x01, 0x84, 0x03, 0x03, 0x00, 0x00));

    const value::Structure misnamed{named.members, {"stVal", "t"}};
    EXPECT_THAT(encodeValue(*modType(), TypedValue{misnamed}),
                VariantWith<error::TypeMismatch>(Field(&error::TypeMismatch::detail, HasSubstr("'q'"))));

    const value::Structure too_short{{TypedValue{value::Integer{1, 8}}}, {}};
    EXPECT_THAT(encodeValue(*modType(), TypedValue{too_short}), VariantWith<error::TypeMismatch>(_));

    const auto array = type_desc::parseOrFail(type_desc::array(2, type_desc::boolean()));
    EXPECT_THAT(encodeValue(*array, TypedValue{value::Array{{TypedValue{value::Boolean{true}}}}}),
                VariantWith<error::TypeMismatch>(_));
}

TEST_F(TestValueCodec, encode_data)
{
    EXPECT_THAT(ber::encode(encodeData(TypedValue{value::Integer{-1, 8}})), ElementsAre(0x85, 0x01, 0xFF));
    EXPECT_THAT(ber::encode(encodeData(TypedValue{value::Unsigned{128, 8}})), ElementsAre(0x86, 0x02, 0x00, 0x80));
    EXPECT_THAT(ber::encode(encodeData(TypedValue{value::Float{10.0, 64}})),
                ElementsAre(0x87, 0x09, 0x0B, 0x40, 0x24, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00));
    EXPECT_THAT(ber::encode(encodeData(TypedValue{value::UtcTime{0x5F5E1000, 0x800000, 0x0A}})),
                ElementsAre(0x91, 0x08, 0x5F, 0x5E, 0x10, 0x00, 0x80, 0x00, 0x00, 0x0A));
    EXPECT_THAT(ber::encode(encodeData(TypedValue{value::Array{{TypedValue{value::Boolean{true}}}}})),
                ElementsAre(0xA1, 0x03, 0x83, 0x01, 0xFF));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
