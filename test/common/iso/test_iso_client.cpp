//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iso/iso_client.hpp"

#include "ber/ber_codec.hpp"
#include "ber/ber_gtest_helpers.hpp"
#include "ber/ber_value.hpp"
#include "cetl_gtest_helpers.hpp"  // NOLINT(misc-include-cleaner)
#include "io/byte_channel_mock.hpp"
#include "iso/cotp.hpp"
#include "iso/iso_gtest_helpers.hpp"
#include "iso/iso_link.hpp"
#include "iso/session_layer.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace
{

using namespace iecmms::common::iso;  // NOLINT This our main concern here in the unit tests.

using iecmms::bytes;
using iecmms::common::ber::BerValue;
using iecmms::common::ber::Bytes;
using iecmms::common::ber::TagClass;
using iecmms::common::ber::view;
using iecmms::common::io::ByteChannelMock;
using iecmms::sdk::ConnectError;
using iecmms::sdk::error::Connect;
using testing::_;
using testing::AnyNumber;
using testing::ElementsAre;
using testing::Field;
using testing::Invoke;
using testing::Return;
using testing::SizeIs;
using testing::StrictMock;
using testing::VariantWith;

namespace ber      = iecmms::common::ber;
namespace iso_peer = iecmms::iso_peer;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestIsoClient : public testing::Test
{
protected:
    void SetUp() override
    {
        EXPECT_CALL(channel_mock_, receive(_, _)).WillRepeatedly(Invoke(&channel_mock_, &ByteChannelMock::popInbound));
        EXPECT_CALL(channel_mock_, send(_)).WillRepeatedly(Return(0));
        EXPECT_CALL(channel_mock_, close()).Times(AnyNumber());

        link_ = IsoClient::make(std::make_unique<ByteChannelMock::Wrapper>(channel_mock_));
    }

    void TearDown() override
    {
        EXPECT_CALL(channel_mock_, deinit()).Times(1);
        link_.reset();
    }

    static BerValue initiateResponse()
    {
        return BerValue::contextOf(9, {ber::makeInteger(TagClass::ContextSpecific, 1, 5)});
    }

    static BerValue initiateRequest()
    {
        return BerValue::contextOf(8, {ber::makeInteger(TagClass::ContextSpecific, 1, 5)});
    }

    void scriptAccept(const std::uint8_t tpdu_size_code = 0x0A)
    {
        channel_mock_.inbound_.push_back(iso_peer::makeCcTpkt(tpdu_size_code));
        const auto cpa = iso_peer::makeCpa(iso_peer::makeAare(0, initiateResponse()));
        channel_mock_.inbound_.push_back(iso_peer::makeDtTpkt(iso_peer::makeSpdu(0x0E, cpa)));
    }

    IsoLink::Associate::Var associate(const std::string& password = "")
    {
        EXPECT_CALL(channel_mock_, connect("10.0.0.1:102", std::chrono::milliseconds{1000})).WillOnce(Return(0));
        return link_->associate({"10.0.0.1:102", password}, initiateRequest(), std::chrono::milliseconds{1000});
    }

    void associateOrFail(const std::uint8_t tpdu_size_code = 0x0A)
    {
        scriptAccept(tpdu_size_code);
        ASSERT_THAT(associate(), VariantWith<BerValue>(initiateResponse()));
        channel_mock_.sent_.clear();
    }

    // MARK: Data members:

    // NOLINTBEGIN
    StrictMock<ByteChannelMock> channel_mock_;
    IsoLink::Ptr                link_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestIsoClient, associate)
{
    scriptAccept();

    EXPECT_THAT(associate("secret"), VariantWith<BerValue>(initiateResponse()));

    auto& sent = channel_mock_.sent_;
    ASSERT_THAT(sent, SizeIs(2));
    EXPECT_THAT(sent[0], testing::Eq(cotp::wrapTpkt(view(cotp::buildConnectionRequest(cotp::ConnectParams{})))));

    // Second TPKT is a complete session connect.
    cotp::TpktReassembler reassembler;
    reassembler.feed(view(sent[1]));
    auto next = reassembler.next();
    ASSERT_THAT(next, VariantWith<cotp::TpktReassembler::Next::Success>(testing::Optional(_)));
    auto tpdu = cotp::parseTpdu(view(*cetl::get<cotp::TpktReassembler::Next::Success>(next)));
    ASSERT_THAT(tpdu, VariantWith<cotp::Tpdu>(Field(&cotp::Tpdu::end_of_transmission, true)));
    EXPECT_THAT(session_layer::parseSpdu(view(cetl::get<cotp::Tpdu>(tpdu).user_data)),
                VariantWith<session_layer::Spdu>(Field(&session_layer::Spdu::type, session_layer::SpduType::Connect)));
}

TEST_F(TestIsoClient, associate_connect_failures)
{
    EXPECT_CALL(channel_mock_, connect(_, _)).WillOnce(Return(ECONNREFUSED)).WillOnce(Return(ETIMEDOUT));

    EXPECT_THAT(link_->associate({"10.0.0.1", ""}, initiateRequest(), std::chrono::milliseconds{10}),
                VariantWith<Connect>(Field(&Connect::reason, ConnectError::Refused)));
    EXPECT_THAT(link_->associate({"10.0.0.1", ""}, initiateRequest(), std::chrono::milliseconds{10}),
                VariantWith<Connect>(Field(&Connect::reason, ConnectError::Timeout)));
    EXPECT_THAT(channel_mock_.sent_, SizeIs(0));
}

TEST_F(TestIsoClient, associate_transport_refused)
{
    // Disconnect request instead of the connection confirm.
    channel_mock_.inbound_.push_back(cotp::wrapTpkt(view(bytes({0x06, 0x80, 0x00, 0x01, 0x00, 0x02, 0x00}))));

    EXPECT_THAT(associate(), VariantWith<Connect>(Field(&Connect::reason, ConnectError::Refused)));
}

TEST_F(TestIsoClient, associate_receive_timeout)
{
    channel_mock_.inbound_failure_ = ETIMEDOUT;

    EXPECT_THAT(associate(), VariantWith<Connect>(Field(&Connect::reason, ConnectError::Timeout)));
}

TEST_F(TestIsoClient, associate_session_refused)
{
    channel_mock_.inbound_.push_back(iso_peer::makeCcTpkt(0x0A));
    channel_mock_.inbound_.push_back(iso_peer::makeDtTpkt(iso_peer::makeSpdu(0x0C, {})));

    EXPECT_THAT(associate(), VariantWith<Connect>(Field(&Connect::reason, ConnectError::AssociationRejected)));
}

TEST_F(TestIsoClient, associate_acse_rejected)
{
    channel_mock_.inbound_.push_back(iso_peer::makeCcTpkt(0x0A));
    const auto cpa = iso_peer::makeCpa(iso_peer::makeAare(1, {}));
    channel_mock_.inbound_.push_back(iso_peer::makeDtTpkt(iso_peer::makeSpdu(0x0E, cpa)));

    EXPECT_THAT(associate(), VariantWith<Connect>(Field(&Connect::reason, ConnectError::AssociationRejected)));
}

TEST_F(TestIsoClient, associate_transport_closed_by_peer)
{
    channel_mock_.inbound_.push_back(iso_peer::makeCcTpkt(0x0A));

    EXPECT_THAT(associate(), VariantWith<Connect>(Field(&Connect::reason, ConnectError::Refused)));
}

TEST_F(TestIsoClient, send_pdu)
{
    associateOrFail();

    const auto pdu = bytes({0xA0, 0x03, 0x02, 0x01, 0x01});
    EXPECT_THAT(link_->send(pdu), 0);
    EXPECT_THAT(channel_mock_.sent_, ElementsAre(iso_peer::makeDtTpkt(iso_peer::makeDataSpdu(pdu))));

    EXPECT_CALL(channel_mock_, send(_)).WillOnce(Return(ESHUTDOWN));
    EXPECT_THAT(link_->send(pdu), ESHUTDOWN);
}

TEST_F(TestIsoClient, send_segments_by_negotiated_tpdu_size)
{
    associateOrFail(0x07);

    const auto pdu = ber::encode(ber::makeOctets(TagClass::Universal, 4, Bytes(300, 0x11)));
    EXPECT_THAT(link_->send(pdu), 0);

    const auto& sent = channel_mock_.sent_;
    ASSERT_THAT(sent, SizeIs(3));
    for (const auto& tpkt : sent)
    {
        EXPECT_LE(tpkt.size(), 128 + cotp::TpktHeaderSize);
    }
    EXPECT_THAT(sent[0][6], 0x00);
    EXPECT_THAT(sent[2][6], 0x80);
}

TEST_F(TestIsoClient, receive_pdu)
{
    associateOrFail();

    const auto pdu  = bytes({0xA1, 0x03, 0x02, 0x01, 0x07});
    const auto tpkt = iso_peer::makeDtTpkt(iso_peer::makeDataSpdu(pdu));

    // Two PDUs, the second split over two reads.
    Bytes stream = tpkt;
    stream.insert(stream.end(), tpkt.begin(), tpkt.begin() + 5);
    channel_mock_.inbound_.push_back(stream);
    channel_mock_.inbound_.push_back(Bytes(tpkt.begin() + 5, tpkt.end()));

    EXPECT_THAT(link_->receive(), VariantWith<Bytes>(pdu));
    EXPECT_THAT(link_->receive(), VariantWith<Bytes>(pdu));
    EXPECT_THAT(link_->receive(), VariantWith<int>(ESHUTDOWN));
}

TEST_F(TestIsoClient, receive_segmented_tsdu)
{
    associateOrFail();

    const auto pdu  = bytes({0xA1, 0x03, 0x02, 0x01, 0x07});
    const auto spdu = iso_peer::makeDataSpdu(pdu);

    Bytes first{0x02, 0xF0, 0x00};
    first.insert(first.end(), spdu.begin(), spdu.begin() + 6);
    Bytes last{0x02, 0xF0, 0x80};
    last.insert(last.end(), spdu.begin() + 6, spdu.end());
    channel_mock_.inbound_.push_back(cotp::wrapTpkt(view(first)));
    channel_mock_.inbound_.push_back(cotp::wrapTpkt(view(last)));

    EXPECT_THAT(link_->receive(), VariantWith<Bytes>(pdu));
}

TEST_F(TestIsoClient, receive_release_and_errors)
{
    associateOrFail();

    // Unexpected (but well formed) SPDUs are skipped.
    const auto pdu = bytes({0xA1, 0x03, 0x02, 0x01, 0x07});
    channel_mock_.inbound_.push_back(iso_peer::makeDtTpkt(iso_peer::makeSpdu(0x0E, {})));
    channel_mock_.inbound_.push_back(iso_peer::makeDtTpkt(iso_peer::makeDataSpdu(pdu)));
    EXPECT_THAT(link_->receive(), VariantWith<Bytes>(pdu));

    // Finish from the peer.
    channel_mock_.inbound_.push_back(iso_peer::makeDtTpkt(iso_peer::makeSpdu(0x09, {})));
    EXPECT_THAT(link_->receive(), VariantWith<int>(ESHUTDOWN));

    // Transport disconnect.
    channel_mock_.inbound_.push_back(cotp::wrapTpkt(view(bytes({0x06, 0x80, 0x00, 0x01, 0x00, 0x02, 0x00}))));
    EXPECT_THAT(link_->receive(), VariantWith<int>(ESHUTDOWN));

    // Data transfer with a malformed presentation PDU.
    channel_mock_.inbound_.push_back(iso_peer::makeDtTpkt(bytes({0x01, 0x00, 0x01, 0x00, 0x30, 0x00})));
    EXPECT_THAT(link_->receive(), VariantWith<int>(EPROTO));
}

TEST_F(TestIsoClient, receive_framing_violation)
{
    associateOrFail();

    channel_mock_.inbound_.push_back(bytes({0x04, 0x00, 0x00, 0x07, 0x02, 0xF0, 0x80}));
    EXPECT_THAT(link_->receive(), VariantWith<int>(EPROTO));
}

TEST_F(TestIsoClient, abort)
{
    associateOrFail();

    EXPECT_CALL(channel_mock_, close()).Times(testing::AtLeast(1));
    link_->abort();

    EXPECT_THAT(channel_mock_.sent_,
                ElementsAre(ElementsAre(0x03, 0x00, 0x00, 0x0C, 0x02, 0xF0, 0x80, 0x19, 0x03, 0x11, 0x01, 0x03)));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
