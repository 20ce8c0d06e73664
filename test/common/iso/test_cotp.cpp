//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iso/cotp.hpp"

#include "ber/ber_gtest_helpers.hpp"
#include "ber/ber_value.hpp"
#include "cetl_gtest_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <vector>

namespace
{

using namespace iecmms::common::iso::cotp;  // NOLINT This our main concern here in the unit tests.

using iecmms::bytes;
using iecmms::IsNullopt;
using iecmms::common::ber::Bytes;
using iecmms::common::ber::view;
using testing::_;
using testing::ElementsAre;
using testing::IsEmpty;
using testing::Optional;
using testing::SizeIs;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestCotp : public testing::Test
{
protected:
    static Tpdu parseOrFail(const Bytes& tpdu)
    {
        auto result = parseTpdu(view(tpdu));
        if (auto* const parsed = cetl::get_if<Tpdu>(&result))
        {
            return std::move(*parsed);
        }
        ADD_FAILURE() << "TPDU parse failure: " << cetl::get<int>(result);
        return Tpdu{};
    }
};

// MARK: - Tests:

TEST_F(TestCotp, wrap_tpkt)
{
    EXPECT_THAT(wrapTpkt(view(bytes({0x02, 0xF0, 0x80}))), ElementsAre(0x03, 0x00, 0x00, 0x07, 0x02, 0xF0, 0x80));
}

TEST_F(TestCotp, reassembler_waits_for_complete_tpkt)
{
    using Next = TpktReassembler::Next;

    TpktReassembler reassembler;
    EXPECT_THAT(reassembler.next(), VariantWith<Next::Success>(IsNullopt()));

    reassembler.feed(view(bytes({0x03, 0x00})));
    EXPECT_THAT(reassembler.next(), VariantWith<Next::Success>(IsNullopt()));

    reassembler.feed(view(bytes({0x00, 0x07, 0x02, 0xF0})));
    EXPECT_THAT(reassembler.next(), VariantWith<Next::Success>(IsNullopt()));

    // The last octet of the first TPKT together with a complete second one.
    reassembler.feed(view(bytes({0x80, 0x03, 0x00, 0x00, 0x08, 0x02, 0xF0, 0x80, 0xAA})));
    EXPECT_THAT(reassembler.next(), VariantWith<Next::Success>(Optional(ElementsAre(0x02, 0xF0, 0x80))));
    EXPECT_THAT(reassembler.next(), VariantWith<Next::Success>(Optional(ElementsAre(0x02, 0xF0, 0x80, 0xAA))));
    EXPECT_THAT(reassembler.next(), VariantWith<Next::Success>(IsNullopt()));
}

TEST_F(TestCotp, reassembler_rejects_invalid_framing)
{
    using Next = TpktReassembler::Next;

    {
        TpktReassembler reassembler;
        reassembler.feed(view(bytes({0x02, 0x00, 0x00, 0x07, 0x02, 0xF0, 0x80})));
        EXPECT_THAT(reassembler.next(), VariantWith<Next::Failure>(EPROTO));
    }
    {
        TpktReassembler reassembler;
        reassembler.feed(view(bytes({0x03, 0x01, 0x00, 0x07, 0x02, 0xF0, 0x80})));
        EXPECT_THAT(reassembler.next(), VariantWith<Next::Failure>(EPROTO));
    }
    {
        TpktReassembler reassembler;
        reassembler.feed(view(bytes({0x03, 0x00, 0x00, 0x04})));
        EXPECT_THAT(reassembler.next(), VariantWith<Next::Failure>(EPROTO));
    }
}

TEST_F(TestCotp, build_connection_request)
{
    EXPECT_THAT(buildConnectionRequest(ConnectParams{}),
                ElementsAre(0x11, 0xE0, 0x00, 0x00, 0x00, 0x01, 0x00,  // fixed part
                            0xC0, 0x01, 0x0D,                          // TPDU size
                            0xC1, 0x02, 0x00, 0x01,                    // calling TSAP
                            0xC2, 0x02, 0x00, 0x01));                  // called TSAP

    ConnectParams params;
    params.source_reference = 0x1234;
    params.tpdu_size_code   = 0x0A;
    params.called_tsap      = {0x00, 0x01, 0x00};
    const auto tpdu         = buildConnectionRequest(params);
    ASSERT_THAT(tpdu, SizeIs(19));
    EXPECT_THAT(tpdu[0], 18);
    EXPECT_THAT(tpdu[4], 0x12);
    EXPECT_THAT(tpdu[5], 0x34);
    EXPECT_THAT(tpdu[9], 0x0A);
}

TEST_F(TestCotp, parse_connection_confirm)
{
    const auto tpdu = parseOrFail(bytes({0x11, 0xD0, 0x00, 0x01, 0x00, 0x02, 0x00,  //
                                         0xC0, 0x01, 0x0A,
                                         0xC1, 0x02, 0x00, 0x01,
                                         0xC2, 0x02, 0x00, 0x01}));
    EXPECT_THAT(tpdu.type, Tpdu::Type::ConnectionConfirm);
    EXPECT_THAT(tpdu.tpdu_size_code, Optional(0x0A));

    const auto without_size = parseOrFail(bytes({0x06, 0xD0, 0x00, 0x01, 0x00, 0x02, 0x00}));
    EXPECT_THAT(without_size.type, Tpdu::Type::ConnectionConfirm);
    EXPECT_THAT(without_size.tpdu_size_code, IsNullopt());

    // parameter overruns the header
    EXPECT_THAT(parseTpdu(view(bytes({0x09, 0xD0, 0x00, 0x01, 0x00, 0x02, 0x00, 0xC0, 0x05, 0x0A}))),
                VariantWith<int>(EPROTO));
    // header shorter than the fixed part
    EXPECT_THAT(parseTpdu(view(bytes({0x04, 0xD0, 0x00, 0x01, 0x00}))), VariantWith<int>(EPROTO));
}

TEST_F(TestCotp, parse_data)
{
    const auto last = parseOrFail(bytes({0x02, 0xF0, 0x80, 0xAA, 0xBB}));
    EXPECT_THAT(last.type, Tpdu::Type::Data);
    EXPECT_TRUE(last.end_of_transmission);
    EXPECT_THAT(last.user_data, ElementsAre(0xAA, 0xBB));

    const auto more = parseOrFail(bytes({0x02, 0xF0, 0x00}));
    EXPECT_FALSE(more.end_of_transmission);
    EXPECT_THAT(more.user_data, IsEmpty());

    EXPECT_THAT(parseTpdu(view(bytes({0x03, 0xF0, 0x80, 0x00}))), VariantWith<int>(EPROTO));
}

TEST_F(TestCotp, parse_disconnect_and_error)
{
    const auto dr = parseOrFail(bytes({0x06, 0x80, 0x00, 0x01, 0x00, 0x02, 0x05}));
    EXPECT_THAT(dr.type, Tpdu::Type::DisconnectRequest);
    EXPECT_THAT(dr.reason, 5);

    const auto er = parseOrFail(bytes({0x04, 0x70, 0x00, 0x01, 0x00}));
    EXPECT_THAT(er.type, Tpdu::Type::Error);
}

TEST_F(TestCotp, parse_invalid)
{
    EXPECT_THAT(parseTpdu(view(bytes({0x02}))), VariantWith<int>(EPROTO));
    EXPECT_THAT(parseTpdu(view(bytes({0x05, 0xF0, 0x80}))), VariantWith<int>(EPROTO));
    EXPECT_THAT(parseTpdu(view(bytes({0x02, 0x50, 0x00}))), VariantWith<int>(EPROTO));
}

TEST_F(TestCotp, build_data_tpkts_segments_payload)
{
    const Bytes payload{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};

    const auto tpkts = buildDataTpkts(view(payload), 8);
    ASSERT_THAT(tpkts, SizeIs(2));
    EXPECT_THAT(tpkts[0], ElementsAre(0x03, 0x00, 0x00, 0x0C, 0x02, 0xF0, 0x00, 0, 1, 2, 3, 4));
    EXPECT_THAT(tpkts[1], ElementsAre(0x03, 0x00, 0x00, 0x0C, 0x02, 0xF0, 0x80, 5, 6, 7, 8, 9));

    // Reassembled user data is the original payload.
    TpktReassembler reassembler;
    for (const auto& tpkt : tpkts)
    {
        reassembler.feed(view(tpkt));
    }
    Bytes reassembled;
    for (int i = 0; i < 2; ++i)
    {
        auto next = reassembler.next();
        ASSERT_THAT(next, VariantWith<TpktReassembler::Next::Success>(Optional(_)));
        const auto tpdu = parseOrFail(*cetl::get<TpktReassembler::Next::Success>(next));
        reassembled.insert(reassembled.end(), tpdu.user_data.begin(), tpdu.user_data.end());
        EXPECT_THAT(tpdu.end_of_transmission, i == 1);
    }
    EXPECT_THAT(reassembled, testing::Eq(payload));
}

TEST_F(TestCotp, build_data_tpkts_single)
{
    EXPECT_THAT(buildDataTpkts(view(Bytes{}), 8192),
                ElementsAre(ElementsAre(0x03, 0x00, 0x00, 0x07, 0x02, 0xF0, 0x80)));

    const Bytes payload(5, 0xAA);
    EXPECT_THAT(buildDataTpkts(view(payload), 8), SizeIs(1));
}

TEST_F(TestCotp, tpdu_size)
{
    EXPECT_THAT(tpduSize(DefaultTpduSizeCode), 8192);
    EXPECT_THAT(tpduSize(0x0A), 1024);
    EXPECT_THAT(tpduSize(0x07), 128);
    EXPECT_THAT(tpduSize(0x01), 128);
    EXPECT_THAT(tpduSize(0x10), 8192);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
