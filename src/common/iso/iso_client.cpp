//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iso_client.hpp"

#include "acse.hpp"
#include "ber/ber_codec.hpp"
#include "cotp.hpp"
#include "io/byte_channel.hpp"
#include "iso_link.hpp"
#include "logging.hpp"
#include "presentation.hpp"
#include "session_layer.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace iecmms
{
namespace common
{
namespace iso
{
namespace
{

using ber::Bytes;
using ber::BytesView;

/// Upper bound of a reassembled transport service data unit.
constexpr std::size_t MaxTsduSize = 1U << 20U;

/// Class 0 TPDU size when the connection confirm does not carry one.
constexpr std::size_t DefaultTpduSize = 128;

class IsoClientImpl final : public IsoLink
{
    using Clock    = std::chrono::steady_clock;
    using Deadline = cetl::optional<Clock::time_point>;

public:
    explicit IsoClientImpl(io::ByteChannel::Ptr channel)
        : channel_{std::move(channel)}
        , logger_{getLogger("iso")}
        , max_tpdu_size_{DefaultTpduSize}
    {
        CETL_DEBUG_ASSERT(channel_, "");
    }

    IsoClientImpl(const IsoClientImpl&)                = delete;
    IsoClientImpl(IsoClientImpl&&) noexcept            = delete;
    IsoClientImpl& operator=(const IsoClientImpl&)     = delete;
    IsoClientImpl& operator=(IsoClientImpl&&) noexcept = delete;

    ~IsoClientImpl() override
    {
        channel_->close();
    }

    // MARK: IsoLink

    Associate::Var associate(const AssociateParams&          params,
                             const ber::BerValue&            initiate_request,
                             const std::chrono::milliseconds timeout) override
    {
        const auto deadline = Clock::now() + timeout;

        auto result = associateImpl(params, initiate_request, deadline, timeout);
        if (const auto* const failure = cetl::get_if<Associate::Failure>(&result))
        {
            logger_->warn("Association with '{}' failed: {} ({}).",
                          params.endpoint,
                          sdk::toString(failure->reason),
                          failure->detail);
            channel_->close();
        }
        return result;
    }

    int send(const Bytes& mms_pdu) override
    {
        const auto ppdu  = presentation::wrapUserData(ber::view(mms_pdu));
        const auto spdu  = session_layer::buildData(ber::view(ppdu));
        const auto tpkts = cotp::buildDataTpkts(ber::view(spdu), max_tpdu_size_);
        for (const auto& tpkt : tpkts)
        {
            if (const auto err = channel_->send(ber::view(tpkt)))
            {
                return err;
            }
        }
        return 0;
    }

    Receive::Var receive() override
    {
        for (;;)
        {
            auto tsdu_var = receiveTsdu(cetl::nullopt);
            if (const auto* const err = cetl::get_if<int>(&tsdu_var))
            {
                return *err;
            }
            const auto& tsdu = cetl::get<Bytes>(tsdu_var);

            auto spdu_var = session_layer::parseSpdu(ber::view(tsdu));
            if (const auto* const err = cetl::get_if<session_layer::ParseResult::Failure>(&spdu_var))
            {
                return *err;
            }
            const auto& spdu = cetl::get<session_layer::Spdu>(spdu_var);
            switch (spdu.type)
            {
            case session_layer::SpduType::GiveTokens: {
                auto user_data = presentation::extractUserData(ber::view(spdu.user_data));
                if (const auto* const failure = cetl::get_if<presentation::UserData::Failure>(&user_data))
                {
                    logger_->warn("Malformed presentation data: {}.", failure->detail);
                    return EPROTO;
                }
                return cetl::get<presentation::UserData::Success>(std::move(user_data));
            }
            case session_layer::SpduType::Finish:
            case session_layer::SpduType::Disconnect:
            case session_layer::SpduType::Abort: {
                logger_->debug("Session closed by peer (spdu=0x{:02X}).", static_cast<std::uint8_t>(spdu.type));
                return ESHUTDOWN;
            }
            default: {
                logger_->warn("Ignoring unexpected SPDU (spdu=0x{:02X}).", static_cast<std::uint8_t>(spdu.type));
                break;
            }
            }
        }
    }

    void abort() override
    {
        const auto spdu  = session_layer::buildAbort();
        const auto tpkts = cotp::buildDataTpkts(ber::view(spdu), max_tpdu_size_);
        for (const auto& tpkt : tpkts)
        {
            if (const auto err = channel_->send(ber::view(tpkt)))
            {
                logger_->debug("Failed to send session abort (err={}).", err);
                break;
            }
        }
        channel_->close();
    }

    void close() override
    {
        channel_->close();
    }

private:
    static sdk::error::Connect connectFailure(const int err)
    {
        switch (err)
        {
        case ETIMEDOUT:
            return {sdk::ConnectError::Timeout, "timed out"};
        case ECONNREFUSED:
            return {sdk::ConnectError::Refused, "connection refused"};
        default:
            return {sdk::ConnectError::Refused, std::strerror(err)};
        }
    }

    Associate::Var associateImpl(const AssociateParams&          params,
                                 const ber::BerValue&            initiate_request,
                                 const Clock::time_point         deadline,
                                 const std::chrono::milliseconds timeout)
    {
        if (const auto err = channel_->connect(params.endpoint, timeout))
        {
            return connectFailure(err);
        }
        logger_->debug("Connected to '{}'.", params.endpoint);

        // Transport connection.
        //
        const auto cr = cotp::buildConnectionRequest(cotp::ConnectParams{});
        if (const auto err = channel_->send(ber::view(cotp::wrapTpkt(ber::view(cr)))))
        {
            return connectFailure(err);
        }
        auto tpdu_var = receiveTpdu(deadline);
        if (const auto* const err = cetl::get_if<int>(&tpdu_var))
        {
            return connectFailure(*err);
        }
        const auto& tpdu = cetl::get<cotp::Tpdu>(tpdu_var);
        if (tpdu.type != cotp::Tpdu::Type::ConnectionConfirm)
        {
            return sdk::error::Connect{sdk::ConnectError::Refused, "transport connection refused"};
        }
        max_tpdu_size_ = tpdu.tpdu_size_code ? cotp::tpduSize(*tpdu.tpdu_size_code) : DefaultTpduSize;
        logger_->debug("Transport connected (tpdu_size={}).", max_tpdu_size_);

        // Session + presentation + ACSE connect.
        //
        const auto aarq  = acse::buildAarq(initiate_request, params.password);
        const auto cp    = presentation::buildConnectPpdu(aarq);
        const auto cn    = session_layer::buildConnect(ber::view(cp));
        const auto tpkts = cotp::buildDataTpkts(ber::view(cn), max_tpdu_size_);
        for (const auto& tpkt : tpkts)
        {
            if (const auto err = channel_->send(ber::view(tpkt)))
            {
                return connectFailure(err);
            }
        }

        auto tsdu_var = receiveTsdu(deadline);
        if (const auto* const err = cetl::get_if<int>(&tsdu_var))
        {
            if (*err == ESHUTDOWN)
            {
                return sdk::error::Connect{sdk::ConnectError::Refused, "transport disconnected"};
            }
            return connectFailure(*err);
        }
        auto spdu_var = session_layer::parseSpdu(ber::view(cetl::get<Bytes>(tsdu_var)));
        if (cetl::get_if<session_layer::ParseResult::Failure>(&spdu_var) != nullptr)
        {
            return sdk::error::Connect{sdk::ConnectError::AssociationRejected, "malformed session accept"};
        }
        const auto& spdu = cetl::get<session_layer::Spdu>(spdu_var);
        if (spdu.type == session_layer::SpduType::Refuse)
        {
            return sdk::error::Connect{sdk::ConnectError::AssociationRejected, "session connect refused"};
        }
        if (spdu.type != session_layer::SpduType::Accept)
        {
            return sdk::error::Connect{sdk::ConnectError::AssociationRejected, "unexpected session response"};
        }

        auto aare_var = presentation::parseConnectAccept(ber::view(spdu.user_data));
        if (const auto* const failure = cetl::get_if<presentation::ConnectAccept::Failure>(&aare_var))
        {
            return *failure;
        }
        return acse::parseAare(cetl::get<presentation::ConnectAccept::Success>(aare_var));
    }

    using TpduResult = cetl::variant<cotp::Tpdu, int>;
    using TsduResult = cetl::variant<Bytes, int>;

    TpduResult receiveTpdu(const Deadline deadline)
    {
        for (;;)
        {
            auto next = reassembler_.next();
            if (const auto* const err = cetl::get_if<cotp::TpktReassembler::Next::Failure>(&next))
            {
                return *err;
            }
            auto& maybe_tpdu = cetl::get<cotp::TpktReassembler::Next::Success>(next);
            if (maybe_tpdu)
            {
                auto parsed = cotp::parseTpdu(ber::view(*maybe_tpdu));
                if (const auto* const err = cetl::get_if<cotp::ParseResult::Failure>(&parsed))
                {
                    return *err;
                }
                return cetl::get<cotp::Tpdu>(std::move(parsed));
            }

            cetl::optional<std::chrono::milliseconds> timeout;
            if (deadline)
            {
                const auto now = Clock::now();
                if (now >= *deadline)
                {
                    return ETIMEDOUT;
                }
                timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now) +
                          std::chrono::milliseconds{1};
            }
            auto received = channel_->receive({buffer_.data(), buffer_.size()}, timeout);
            if (const auto* const err = cetl::get_if<io::ByteChannel::Receive::Failure>(&received))
            {
                return *err;
            }
            const auto size = cetl::get<io::ByteChannel::Receive::Success>(received);
            reassembler_.feed({buffer_.data(), size});
        }
    }

    /// Receives data TPDUs until the end of a TSDU.
    ///
    TsduResult receiveTsdu(const Deadline deadline)
    {
        Bytes tsdu;
        for (;;)
        {
            auto tpdu_var = receiveTpdu(deadline);
            if (const auto* const err = cetl::get_if<int>(&tpdu_var))
            {
                return *err;
            }
            auto& tpdu = cetl::get<cotp::Tpdu>(tpdu_var);
            switch (tpdu.type)
            {
            case cotp::Tpdu::Type::Data: {
                if ((tsdu.size() + tpdu.user_data.size()) > MaxTsduSize)
                {
                    logger_->warn("TSDU exceeds {} bytes.", MaxTsduSize);
                    return EPROTO;
                }
                tsdu.insert(tsdu.end(), tpdu.user_data.begin(), tpdu.user_data.end());
                if (tpdu.end_of_transmission)
                {
                    return tsdu;
                }
                break;
            }
            case cotp::Tpdu::Type::DisconnectRequest:
            case cotp::Tpdu::Type::Error: {
                logger_->debug("Transport disconnected by peer (reason={}).", tpdu.reason);
                return ESHUTDOWN;
            }
            default: {
                logger_->warn("Unexpected TPDU (code=0x{:02X}).", static_cast<std::uint8_t>(tpdu.type));
                return EPROTO;
            }
            }
        }
    }

    static constexpr std::size_t ReceiveBufferSize = 8192;

    io::ByteChannel::Ptr                        channel_;
    LoggerPtr                                   logger_;
    std::size_t                                 max_tpdu_size_;
    cotp::TpktReassembler                       reassembler_;
    std::array<std::uint8_t, ReceiveBufferSize> buffer_{};

};  // IsoClientImpl

}  // namespace

IsoLink::Ptr IsoClient::make(io::ByteChannel::Ptr channel)
{
    return std::make_unique<IsoClientImpl>(std::move(channel));
}

}  // namespace iso
}  // namespace common
}  // namespace iecmms
