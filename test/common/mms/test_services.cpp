//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mms/services.hpp"

#include "ber/ber_codec.hpp"
#include "ber/ber_gtest_helpers.hpp"
#include "ber/ber_value.hpp"
#include "cetl_gtest_helpers.hpp"
#include "mms/mms_types.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{

using namespace iecmms::common::mms;  // NOLINT This our main concern here in the unit tests.

using iecmms::bytes;
using iecmms::decodeOrFail;
using iecmms::IsNullopt;
using iecmms::common::ber::TagClass;
using iecmms::sdk::DataAccessError;
using iecmms::sdk::error::MalformedEncoding;
using testing::_;
using testing::AllOf;
using testing::ElementsAre;
using testing::Field;
using testing::IsEmpty;
using testing::Optional;
using testing::SizeIs;
using testing::VariantWith;

namespace ber       = iecmms::common::ber;
namespace universal = iecmms::common::ber::universal;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestMmsServices : public testing::Test
{
protected:
    static ObjectName someVariable()
    {
        return ObjectName::domainSpecific("LD", "X");
    }

    static BerValue visible(const std::string& text)
    {
        return ber::makeString(TagClass::Universal, universal::VisibleString, text);
    }
};

// MARK: - Tests:

TEST_F(TestMmsServices, object_name)
{
    EXPECT_THAT(ber::encode(encodeObjectName(someVariable())),
                ElementsAre(0xA1, 0x06, 0x1A, 0x02, 0x4C, 0x44, 0x1A, 0x01, 0x58));
    EXPECT_THAT(ber::encode(encodeObjectName(ObjectName::vmdSpecific("ds"))), ElementsAre(0x80, 0x02, 0x64, 0x73));

    EXPECT_THAT(decodeObjectName(encodeObjectName(someVariable())), VariantWith<ObjectName>(someVariable()));
    EXPECT_THAT(decodeObjectName(decodeOrFail(bytes({0x82, 0x01, 0x41}))),
                VariantWith<ObjectName>(AllOf(Field(&ObjectName::scope, ObjectName::Scope::AaSpecific),
                                              Field(&ObjectName::item, "A"))));
}

TEST_F(TestMmsServices, object_name_invalid)
{
    // wrong number of identifiers
    EXPECT_THAT(decodeObjectName(BerValue::contextOf(1, {visible("LD")})), VariantWith<MalformedEncoding>(_));
    // identifiers must be visible strings
    EXPECT_THAT(decodeObjectName(BerValue::contextOf(1, {visible("LD"), ber::makeNull(TagClass::Universal, 5)})),
                VariantWith<MalformedEncoding>(_));
    // unknown scope
    EXPECT_THAT(decodeObjectName(ber::makeString(TagClass::ContextSpecific, 3, "A")),
                VariantWith<MalformedEncoding>(_));
    EXPECT_THAT(decodeObjectName(visible("A")), VariantWith<MalformedEncoding>(_));
}

TEST_F(TestMmsServices, variable_access)
{
    VariableAccess list;
    list.variables = {someVariable(), ObjectName::vmdSpecific("v")};
    const auto decoded_list = decodeVariableAccess(encodeVariableAccess(list));
    EXPECT_THAT(decoded_list,
                VariantWith<VariableAccess>(
                    AllOf(Field(&VariableAccess::variables, ElementsAre(someVariable(), ObjectName::vmdSpecific("v"))),
                          Field(&VariableAccess::list_name, IsNullopt()))));

    VariableAccess named;
    named.list_name = ObjectName::domainSpecific("LD", "LLN0$DS");
    EXPECT_THAT(decodeVariableAccess(encodeVariableAccess(named)),
                VariantWith<VariableAccess>(
                    AllOf(Field(&VariableAccess::variables, IsEmpty()),
                          Field(&VariableAccess::list_name, Optional(ObjectName::domainSpecific("LD", "LLN0$DS"))))));

    // alternate access is not supported
    EXPECT_THAT(decodeVariableAccess(BerValue::contextOf(0, {BerValue::sequenceOf({BerValue::contextOf(2)})})),
                VariantWith<MalformedEncoding>(_));
    EXPECT_THAT(decodeVariableAccess(BerValue::contextOf(5)), VariantWith<MalformedEncoding>(_));
}

TEST_F(TestMmsServices, access_results)
{
    const auto structure = BerValue::contextOf(2, {ber::makeInteger(TagClass::ContextSpecific, 5, 1)});
    const auto list      = BerValue::contextOf(1,
                                               {
                                                   ber::makeBoolean(TagClass::ContextSpecific, 3, true),
                                                   ber::makeInteger(TagClass::ContextSpecific, 0, 10),
                                                   ber::makeInteger(TagClass::ContextSpecific, 0, 42),
                                                   structure,
                                               });
    const auto results = decodeAccessResults(list);
    ASSERT_THAT(results, VariantWith<std::vector<AccessResult>>(SizeIs(4)));

    const auto& items = cetl::get<std::vector<AccessResult>>(results);
    EXPECT_THAT(items[0], VariantWith<BerValue>(ber::makeBoolean(TagClass::ContextSpecific, 3, true)));
    EXPECT_THAT(items[1], VariantWith<DataAccessError>(DataAccessError::ObjectNonExistent));
    EXPECT_THAT(items[2], VariantWith<DataAccessError>(DataAccessError::Unknown));
    EXPECT_THAT(items[3], VariantWith<BerValue>(structure));

    EXPECT_THAT(decodeAccessResults(BerValue::contextOf(1, {BerValue::context(0)})),
                VariantWith<MalformedEncoding>(_));
}

TEST_F(TestMmsServices, build_simple_requests)
{
    EXPECT_THAT(ber::encode(buildStatusRequest()), ElementsAre(0x80, 0x01, 0x00));
    EXPECT_THAT(ber::encode(buildIdentifyRequest()), ElementsAre(0x82, 0x00));
    EXPECT_THAT(ber::encode(buildGetNamedVariableListAttributesRequest(ObjectName::vmdSpecific("ds"))),
                ElementsAre(0xAC, 0x04, 0x80, 0x02, 0x64, 0x73));
    EXPECT_THAT(ber::encode(buildGetVariableAccessAttributesRequest(ObjectName::vmdSpecific("ds"))),
                ElementsAre(0xA6, 0x06, 0xA0, 0x04, 0x80, 0x02, 0x64, 0x73));
    EXPECT_THAT(ber::encode(buildDeleteNamedVariableListRequest(someVariable())),
                ElementsAre(0xAD, 0x0D, 0x80, 0x01, 0x00, 0xA1, 0x08,  //
                            0xA1, 0x06, 0x1A, 0x02, 0x4C, 0x44, 0x1A, 0x01, 0x58));
}

TEST_F(TestMmsServices, build_get_name_list_request)
{
    GetNameListRequest domains{};
    EXPECT_THAT(ber::encode(buildGetNameListRequest(domains)),
                ElementsAre(0xA1, 0x09, 0xA0, 0x03, 0x80, 0x01, 0x09, 0xA1, 0x02, 0x80, 0x00));

    GetNameListRequest variables{};
    variables.object_class   = ObjectClass::NamedVariable;
    variables.domain         = "LD";
    variables.continue_after = "X";
    EXPECT_THAT(ber::encode(buildGetNameListRequest(variables)),
                ElementsAre(0xA1, 0x0E,                          //
                            0xA0, 0x03, 0x80, 0x01, 0x00,        // objectClass
                            0xA1, 0x04, 0x81, 0x02, 0x4C, 0x44,  // domainSpecific
                            0x82, 0x01, 0x58));                  // continueAfter
}

TEST_F(TestMmsServices, build_read_request)
{
    ReadRequest request{};
    request.access.variables = {someVariable()};
    EXPECT_THAT(ber::encode(buildReadRequest(request)),
                ElementsAre(0xA4, 0x10, 0xA1, 0x0E, 0xA0, 0x0C, 0x30, 0x0A, 0xA0, 0x08,  //
                            0xA1, 0x06, 0x1A, 0x02, 0x4C, 0x44, 0x1A, 0x01, 0x58));

    ReadRequest by_list{};
    by_list.access.list_name          = ObjectName::vmdSpecific("ds");
    by_list.specification_with_result = true;
    EXPECT_THAT(ber::encode(buildReadRequest(by_list)),
                ElementsAre(0xA4, 0x0B, 0x80, 0x01, 0xFF, 0xA1, 0x06, 0xA1, 0x04, 0x80, 0x02, 0x64, 0x73));
}

TEST_F(TestMmsServices, build_write_request)
{
    WriteRequest request{};
    request.variables = {someVariable()};
    request.data      = {ber::makeBoolean(TagClass::ContextSpecific, 3, true)};

    const auto write = buildWriteRequest(request);
    EXPECT_TRUE(write.isContext(5));
    ASSERT_THAT(write.children, SizeIs(2));

    VariableAccess expected_access;
    expected_access.variables = {someVariable()};
    EXPECT_THAT(write.children[0], encodeVariableAccess(expected_access));
    EXPECT_TRUE(write.children[1].isContext(0));
    EXPECT_THAT(write.children[1].children, ElementsAre(ber::makeBoolean(TagClass::ContextSpecific, 3, true)));
}

TEST_F(TestMmsServices, build_define_named_variable_list_request)
{
    DefineNamedVariableListRequest request{};
    request.name    = ObjectName::domainSpecific("LD", "LLN0$DS");
    request.members = {someVariable(), ObjectName::domainSpecific("LD", "Y")};

    const auto define = buildDefineNamedVariableListRequest(request);
    EXPECT_TRUE(define.isContext(11));
    ASSERT_THAT(define.children, SizeIs(2));
    EXPECT_THAT(decodeObjectName(define.children[0]), VariantWith<ObjectName>(request.name));

    VariableAccess members;
    members.variables = request.members;
    EXPECT_THAT(define.children[1], encodeVariableAccess(members));
}

TEST_F(TestMmsServices, parse_status_and_identify)
{
    const auto status = BerValue::contextOf(0,
                                            {
                                                ber::makeInteger(TagClass::ContextSpecific, 0, 0),
                                                ber::makeInteger(TagClass::ContextSpecific, 1, 1),
                                            });
    EXPECT_THAT(parseStatusResponse(status),
                VariantWith<StatusResponse>(
                    AllOf(Field(&StatusResponse::logical, 0), Field(&StatusResponse::physical, 1))));
    EXPECT_THAT(parseStatusResponse(BerValue::contextOf(0)), VariantWith<MalformedEncoding>(_));

    const auto identify = BerValue::contextOf(2,
                                              {
                                                  ber::makeString(TagClass::ContextSpecific, 0, "ACME"),
                                                  ber::makeString(TagClass::ContextSpecific, 1, "IED-1"),
                                                  ber::makeString(TagClass::ContextSpecific, 2, "1.2"),
                                              });
    EXPECT_THAT(parseIdentifyResponse(identify),
                VariantWith<IdentifyResponse>(AllOf(Field(&IdentifyResponse::vendor, "ACME"),
                                                    Field(&IdentifyResponse::model, "IED-1"),
                                                    Field(&IdentifyResponse::revision, "1.2"))));
    EXPECT_THAT(parseIdentifyResponse(BerValue::contextOf(2, {ber::makeString(TagClass::ContextSpecific, 0, "ACME")})),
                VariantWith<MalformedEncoding>(_));
}

TEST_F(TestMmsServices, parse_get_name_list_response)
{
    const auto last = BerValue::contextOf(1,
                                          {
                                              BerValue::contextOf(0, {visible("LD0"), visible("LD1")}),
                                              ber::makeBoolean(TagClass::ContextSpecific, 1, false),
                                          });
    EXPECT_THAT(parseGetNameListResponse(last),
                VariantWith<GetNameListResponse>(
                    AllOf(Field(&GetNameListResponse::identifiers, ElementsAre("LD0", "LD1")),
                          Field(&GetNameListResponse::more_follows, false))));

    // `moreFollows` defaults to true
    EXPECT_THAT(parseGetNameListResponse(BerValue::contextOf(1, {BerValue::contextOf(0)})),
                VariantWith<GetNameListResponse>(AllOf(Field(&GetNameListResponse::identifiers, IsEmpty()),
                                                       Field(&GetNameListResponse::more_follows, true))));

    EXPECT_THAT(parseGetNameListResponse(BerValue::contextOf(1)), VariantWith<MalformedEncoding>(_));
    EXPECT_THAT(parseGetNameListResponse(
                    BerValue::contextOf(1, {BerValue::contextOf(0, {ber::makeInteger(TagClass::Universal, 2, 1)})})),
                VariantWith<MalformedEncoding>(_));
}

TEST_F(TestMmsServices, parse_read_response)
{
    const auto list     = BerValue::contextOf(1,
                                              {
                                                  ber::makeBoolean(TagClass::ContextSpecific, 3, false),
                                                  ber::makeInteger(TagClass::ContextSpecific, 0, 3),
                                              });
    const auto response = BerValue::contextOf(4, {list});
    const auto parsed = parseReadResponse(response);
    ASSERT_THAT(parsed, VariantWith<ReadResponse>(Field(&ReadResponse::access, IsNullopt())));
    const auto& results = cetl::get<ReadResponse>(parsed).results;
    ASSERT_THAT(results, SizeIs(2));
    EXPECT_THAT(results[0], VariantWith<BerValue>(ber::makeBoolean(TagClass::ContextSpecific, 3, false)));
    EXPECT_THAT(results[1], VariantWith<DataAccessError>(DataAccessError::ObjectAccessDenied));

    // with the variable access specification
    VariableAccess access;
    access.list_name = ObjectName::vmdSpecific("ds");
    const auto with_spec =
        BerValue::contextOf(4, {BerValue::contextOf(0, {encodeVariableAccess(access)}), BerValue::contextOf(1)});
    EXPECT_THAT(parseReadResponse(with_spec),
                VariantWith<ReadResponse>(
                    Field(&ReadResponse::access,
                          Optional(Field(&VariableAccess::list_name, Optional(ObjectName::vmdSpecific("ds")))))));

    EXPECT_THAT(parseReadResponse(BerValue::contextOf(4)), VariantWith<MalformedEncoding>(_));
    EXPECT_THAT(parseReadResponse(BerValue::contextOf(4, {BerValue::context(1)})), VariantWith<MalformedEncoding>(_));
}

TEST_F(TestMmsServices, parse_write_response)
{
    const auto response = decodeOrFail(bytes({0xA5, 0x05, 0x81, 0x00, 0x80, 0x01, 0x03}));
    EXPECT_THAT(parseWriteResponse(response),
                VariantWith<WriteResponse>(
                    Field(&WriteResponse::results,
                          ElementsAre(IsNullopt(), Optional(DataAccessError::ObjectAccessDenied)))));

    EXPECT_THAT(parseWriteResponse(decodeOrFail(bytes({0xA5, 0x02, 0x82, 0x00}))), VariantWith<MalformedEncoding>(_));
    EXPECT_THAT(parseWriteResponse(decodeOrFail(bytes({0xA5, 0x02, 0x80, 0x00}))), VariantWith<MalformedEncoding>(_));
}

TEST_F(TestMmsServices, parse_get_variable_access_attributes_response)
{
    const auto type     = ber::makeNull(TagClass::ContextSpecific, 3);
    const auto response = BerValue::contextOf(6,
                                              {
                                                  ber::makeBoolean(TagClass::ContextSpecific, 0, false),
                                                  BerValue::contextOf(2, {type}),
                                              });
    EXPECT_THAT(parseGetVariableAccessAttributesResponse(response),
                VariantWith<GetVariableAccessAttributesResponse>(
                    AllOf(Field(&GetVariableAccessAttributesResponse::deletable, false),
                          Field(&GetVariableAccessAttributesResponse::type_description, type))));

    EXPECT_THAT(parseGetVariableAccessAttributesResponse(BerValue::contextOf(6, {BerValue::contextOf(2)})),
                VariantWith<MalformedEncoding>(_));
}

TEST_F(TestMmsServices, parse_named_variable_list_responses)
{
    VariableAccess members;
    members.variables = {someVariable()};
    auto list         = encodeVariableAccess(members);
    list.tag_number   = 1;

    const auto attributes =
        BerValue::contextOf(12, {ber::makeBoolean(TagClass::ContextSpecific, 0, true), std::move(list)});
    EXPECT_THAT(parseGetNamedVariableListAttributesResponse(attributes),
                VariantWith<GetNamedVariableListAttributesResponse>(
                    AllOf(Field(&GetNamedVariableListAttributesResponse::deletable, true),
                          Field(&GetNamedVariableListAttributesResponse::members, ElementsAre(someVariable())))));
    EXPECT_THAT(parseGetNamedVariableListAttributesResponse(BerValue::contextOf(12)),
                VariantWith<MalformedEncoding>(_));

    const auto deleted = decodeOrFail(bytes({0xAD, 0x06, 0x80, 0x01, 0x01, 0x81, 0x01, 0x01}));
    EXPECT_THAT(parseDeleteNamedVariableListResponse(deleted),
                VariantWith<DeleteNamedVariableListResponse>(
                    AllOf(Field(&DeleteNamedVariableListResponse::matched, 1),
                          Field(&DeleteNamedVariableListResponse::deleted, 1))));
    EXPECT_THAT(parseDeleteNamedVariableListResponse(decodeOrFail(bytes({0xAD, 0x03, 0x80, 0x01, 0x01}))),
                VariantWith<MalformedEncoding>(_));
}

TEST_F(TestMmsServices, parse_information_report)
{
    VariableAccess access;
    access.list_name  = ObjectName::vmdSpecific("RPT");
    const auto data   = ber::makeString(TagClass::ContextSpecific, 10, "rpt1");
    const auto report = BerValue::contextOf(
        3,
        {BerValue::contextOf(0, {encodeVariableAccess(access), BerValue::contextOf(0, {data})})});

    const auto parsed = parseInformationReport(report);
    ASSERT_THAT(parsed,
                VariantWith<InformationReport>(
                    Field(&InformationReport::access,
                          Field(&VariableAccess::list_name, Optional(ObjectName::vmdSpecific("RPT"))))));
    EXPECT_THAT(cetl::get<InformationReport>(parsed).results, ElementsAre(VariantWith<BerValue>(data)));

    // not a report
    EXPECT_THAT(parseInformationReport(BerValue::contextOf(1, {BerValue::contextOf(0)})),
                VariantWith<MalformedEncoding>(_));
    // other unconfirmed service
    EXPECT_THAT(parseInformationReport(BerValue::contextOf(3, {BerValue::contextOf(1)})),
                VariantWith<MalformedEncoding>(_));
    // without results
    EXPECT_THAT(parseInformationReport(
                    BerValue::contextOf(3, {BerValue::contextOf(0, {encodeVariableAccess(access), data})})),
                VariantWith<MalformedEncoding>(_));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
