//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iso/acse.hpp"

#include "ber/ber_gtest_helpers.hpp"
#include "ber/ber_value.hpp"
#include "iso/iso_gtest_helpers.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace iecmms::common::iso::acse;  // NOLINT This our main concern here in the unit tests.

using iecmms::common::ber::TagClass;
using iecmms::sdk::ConnectError;
using iecmms::sdk::error::Connect;
using testing::AllOf;
using testing::ElementsAre;
using testing::Field;
using testing::HasSubstr;
using testing::NotNull;
using testing::Optional;
using testing::SizeIs;
using testing::VariantWith;

namespace ber       = iecmms::common::ber;
namespace iso_peer  = iecmms::iso_peer;
namespace universal = iecmms::common::ber::universal;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestAcse : public testing::Test
{
protected:
    static BerValue someInitiate()
    {
        return BerValue::contextOf(8, {ber::makeInteger(TagClass::ContextSpecific, 1, 16)});
    }
};

// MARK: - Tests:

TEST_F(TestAcse, build_aarq_without_password)
{
    const auto aarq = buildAarq(someInitiate(), "");
    EXPECT_TRUE(aarq.is(TagClass::Application, 0));
    EXPECT_TRUE(aarq.constructed);
    ASSERT_THAT(aarq.children, SizeIs(2));

    const auto* const context = aarq.findContext(1);
    ASSERT_THAT(context, NotNull());
    EXPECT_THAT(ber::decodeObjectIdentifier(context->children.at(0)), Optional(ElementsAre(1, 0, 9506, 2, 3)));

    const auto* const user_info = aarq.findContext(30);
    ASSERT_THAT(user_info, NotNull());
    const auto& external = user_info->children.at(0);
    EXPECT_TRUE(external.is(TagClass::Universal, universal::External));
    EXPECT_THAT(ber::decodeInteger(external.children.at(0)), Optional(3));
    EXPECT_TRUE(external.children.at(1).isContext(0));
    EXPECT_THAT(external.children.at(1).children, ElementsAre(someInitiate()));

    EXPECT_THAT(aarq.findContext(12), testing::IsNull());
}

TEST_F(TestAcse, build_aarq_with_password)
{
    const auto aarq = buildAarq(someInitiate(), "secret");
    ASSERT_THAT(aarq.children, SizeIs(5));

    const auto* const requirements = aarq.findContext(10);
    ASSERT_THAT(requirements, NotNull());
    EXPECT_THAT(ber::decodeBitString(*requirements), Optional(ElementsAre(true)));

    const auto* const mechanism = aarq.findContext(11);
    ASSERT_THAT(mechanism, NotNull());
    EXPECT_THAT(ber::decodeObjectIdentifier(*mechanism), Optional(ElementsAre(2, 2, 3, 1)));

    const auto* const auth_value = aarq.findContext(12);
    ASSERT_THAT(auth_value, NotNull());
    ASSERT_THAT(auth_value->children, SizeIs(1));
    EXPECT_TRUE(auth_value->children[0].isContext(0));
    EXPECT_THAT(ber::decodeString(auth_value->children[0]), Optional(std::string{"secret"}));

    // User information stays the last field.
    EXPECT_TRUE(aarq.children.back().isContext(30));
}

TEST_F(TestAcse, parse_accepted_aare)
{
    const auto initiate_response = BerValue::contextOf(9, {ber::makeInteger(TagClass::ContextSpecific, 1, 5)});
    EXPECT_THAT(parseAare(iso_peer::makeAare(0, initiate_response)), VariantWith<BerValue>(initiate_response));
}

TEST_F(TestAcse, parse_rejected_aare)
{
    EXPECT_THAT(parseAare(iso_peer::makeAare(1, {})),
                VariantWith<Connect>(AllOf(Field(&Connect::reason, ConnectError::AssociationRejected),
                                           Field(&Connect::detail, HasSubstr("result=1, diagnostic=2")))));
}

TEST_F(TestAcse, parse_malformed_aare)
{
    const auto is_rejected = VariantWith<Connect>(Field(&Connect::reason, ConnectError::AssociationRejected));

    // AARQ instead of AARE
    EXPECT_THAT(parseAare(buildAarq(someInitiate(), "")), is_rejected);

    // without result
    EXPECT_THAT(parseAare(BerValue::constructedOf(TagClass::Application, 1, {})), is_rejected);

    // accepted but without user information
    const auto no_user_info = BerValue::constructedOf(
        TagClass::Application,
        1,
        {BerValue::contextOf(2, {ber::makeInteger(TagClass::Universal, universal::Integer, 0)})});
    EXPECT_THAT(parseAare(no_user_info), is_rejected);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
