//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mms/initiate.hpp"

#include "ber/ber_codec.hpp"
#include "ber/ber_gtest_helpers.hpp"
#include "ber/ber_value.hpp"
#include "mms/mms_types.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace
{

using namespace iecmms::common::mms;  // NOLINT This our main concern here in the unit tests.

using iecmms::bytes;
using iecmms::decodeOrFail;
using iecmms::common::ber::TagClass;
using iecmms::sdk::Done;
using iecmms::sdk::Error;
using iecmms::sdk::ErrorClass;
using iecmms::sdk::Service;
using testing::_;
using testing::AllOf;
using testing::ElementsAre;
using testing::Field;
using testing::NotNull;
using testing::Optional;
using testing::SizeIs;
using testing::VariantWith;

namespace ber   = iecmms::common::ber;
namespace error = iecmms::sdk::error;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestMmsInitiate : public testing::Test
{
protected:
    static BerValue initiateResponse(const std::int64_t calling, const std::int64_t called, const bool with_detail)
    {
        std::vector<BerValue> fields{
            ber::makeInteger(TagClass::ContextSpecific, 1, calling),
            ber::makeInteger(TagClass::ContextSpecific, 2, called),
            ber::makeInteger(TagClass::ContextSpecific, 3, 4),
        };
        if (with_detail)
        {
            fields.push_back(BerValue::contextOf(4, {ber::makeInteger(TagClass::ContextSpecific, 0, 1)}));
        }
        return BerValue::contextOf(9, std::move(fields));
    }

    static std::vector<std::size_t> setBits(const std::vector<bool>& bits)
    {
        std::vector<std::size_t> result;
        for (std::size_t i = 0; i < bits.size(); ++i)
        {
            if (bits[i])
            {
                result.push_back(i);
            }
        }
        return result;
    }
};

// MARK: - Tests:

TEST_F(TestMmsInitiate, build_default_request)
{
    const auto request = buildInitiateRequest(InitiateRequest{});
    EXPECT_TRUE(request.isContext(8));
    ASSERT_THAT(request.children, SizeIs(5));

    EXPECT_THAT(ber::decodeInteger(request.children[0]), Optional(65000));
    EXPECT_THAT(ber::decodeInteger(request.children[1]), Optional(16));
    EXPECT_THAT(ber::decodeInteger(request.children[2]), Optional(16));
    EXPECT_THAT(ber::decodeInteger(request.children[3]), Optional(10));

    const auto* const detail = request.findContext(4);
    ASSERT_THAT(detail, NotNull());
    ASSERT_THAT(detail->children, SizeIs(3));
    EXPECT_THAT(ber::decodeInteger(detail->children[0]), Optional(1));
    EXPECT_THAT(ber::encode(detail->children[1]), ElementsAre(0x81, 0x03, 0x05, 0xF1, 0x00));

    const auto services = ber::decodeBitString(detail->children[2]);
    ASSERT_TRUE(services.has_value());
    EXPECT_THAT(*services, SizeIs(85));
    EXPECT_THAT(setBits(*services), ElementsAre(0, 1, 2, 4, 5, 6, 11, 12, 13, 79));
}

TEST_F(TestMmsInitiate, build_custom_request)
{
    InitiateRequest custom{};
    custom.max_serv_outstanding_calling = 5;
    custom.data_structure_nesting_level = 6;

    const auto request = buildInitiateRequest(custom);
    EXPECT_THAT(ber::decodeInteger(request.children[1]), Optional(5));
    EXPECT_THAT(ber::decodeInteger(request.children[3]), Optional(6));
}

TEST_F(TestMmsInitiate, parse_response)
{
    EXPECT_THAT(parseInitiateResponse(initiateResponse(5, 5, true)),
                VariantWith<InitiateResponse>(
                    AllOf(Field(&InitiateResponse::local_detail_called, 0),
                          Field(&InitiateResponse::max_serv_outstanding_calling, 5),
                          Field(&InitiateResponse::max_serv_outstanding_called, 5),
                          Field(&InitiateResponse::data_structure_nesting_level, 4),
                          Field(&InitiateResponse::version, 1))));

    auto with_local_detail = initiateResponse(1, 3, true);
    with_local_detail.children.insert(with_local_detail.children.begin(),
                                      ber::makeInteger(TagClass::ContextSpecific, 0, 32000));
    EXPECT_THAT(parseInitiateResponse(with_local_detail),
                VariantWith<InitiateResponse>(AllOf(Field(&InitiateResponse::local_detail_called, 32000),
                                                    Field(&InitiateResponse::max_serv_outstanding_called, 3))));
}

TEST_F(TestMmsInitiate, parse_invalid_response)
{
    const auto is_malformed = VariantWith<Error>(VariantWith<error::MalformedEncoding>(_));

    EXPECT_THAT(parseInitiateResponse(initiateResponse(0, 5, true)), is_malformed);
    EXPECT_THAT(parseInitiateResponse(initiateResponse(5, 40000, true)), is_malformed);
    EXPECT_THAT(parseInitiateResponse(initiateResponse(5, 5, false)), is_malformed);

    // detail without version
    auto no_version = initiateResponse(5, 5, false);
    no_version.children.push_back(BerValue::contextOf(4));
    EXPECT_THAT(parseInitiateResponse(no_version), is_malformed);

    // not an initiate response at all
    EXPECT_THAT(parseInitiateResponse(BerValue::contextOf(1)), is_malformed);
    EXPECT_THAT(parseInitiateResponse(BerValue::sequenceOf()), is_malformed);
}

TEST_F(TestMmsInitiate, parse_error_response)
{
    const auto initiate_error = decodeOrFail(bytes({0xAA, 0x05, 0xA0, 0x03, 0x88, 0x01, 0x03}));
    EXPECT_THAT(parseInitiateResponse(initiate_error),
                VariantWith<Error>(VariantWith<error::ServiceError>(
                    AllOf(Field(&error::ServiceError::service, Service::Initiate),
                          Field(&error::ServiceError::error_class, ErrorClass::Initiate),
                          Field(&error::ServiceError::code, 3)))));

    EXPECT_THAT(parseInitiateResponse(BerValue::contextOf(10)),
                VariantWith<Error>(VariantWith<error::MalformedEncoding>(_)));
}

TEST_F(TestMmsInitiate, conclude)
{
    EXPECT_THAT(ber::encode(buildConcludeRequest()), ElementsAre(0x8B, 0x00));

    EXPECT_THAT(parseConcludeResponse(decodeOrFail(bytes({0x8C, 0x00}))), VariantWith<Done>(_));

    const auto conclude_error = decodeOrFail(bytes({0xAD, 0x05, 0xA0, 0x03, 0x89, 0x01, 0x01}));
    EXPECT_THAT(parseConcludeResponse(conclude_error),
                VariantWith<Error>(VariantWith<error::ServiceError>(
                    AllOf(Field(&error::ServiceError::service, Service::Conclude),
                          Field(&error::ServiceError::error_class, ErrorClass::Conclude),
                          Field(&error::ServiceError::code, 1)))));

    EXPECT_THAT(parseConcludeResponse(BerValue::contextOf(1)),
                VariantWith<Error>(VariantWith<error::MalformedEncoding>(_)));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
