//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "presentation.hpp"

#include "ber/ber_codec.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace iso
{
namespace presentation
{
namespace
{

using ber::TagClass;
namespace universal = ber::universal;

constexpr std::uint32_t FullyEncodedData = 1;  // [APPLICATION 1]

const std::vector<std::uint32_t>& berTransferSyntax()
{
    static const std::vector<std::uint32_t> oid{2, 1, 1};
    return oid;
}

BerValue makeContextDefinition(const std::int64_t id, const std::vector<std::uint32_t>& abstract_syntax)
{
    return BerValue::sequenceOf({
        ber::makeInteger(TagClass::Universal, universal::Integer, id),
        ber::makeObjectIdentifier(TagClass::Universal, universal::ObjectIdentifier, abstract_syntax),
        BerValue::sequenceOf(
            {ber::makeObjectIdentifier(TagClass::Universal, universal::ObjectIdentifier, berTransferSyntax())}),
    });
}

/// `PDV-list` with a single ASN.1 type of the given context.
///
BerValue makeFullyEncodedData(const std::int64_t context_id, BerValue apdu)
{
    return BerValue::constructedOf(TagClass::Application,
                                   FullyEncodedData,
                                   {BerValue::sequenceOf({
                                       ber::makeInteger(TagClass::Universal, universal::Integer, context_id),
                                       BerValue::contextOf(0, {std::move(apdu)}),
                                   })});
}

sdk::error::Connect rejected(std::string detail)
{
    return sdk::error::Connect{sdk::ConnectError::AssociationRejected, std::move(detail)};
}

}  // namespace

Bytes buildConnectPpdu(const BerValue& aarq)
{
    const Bytes selector{0x00, 0x00, 0x00, 0x01};

    const auto cp = BerValue::constructedOf(  //
        TagClass::Universal,
        17,  // SET
        {
            // mode-selector: normal mode
            BerValue::contextOf(0, {ber::makeInteger(TagClass::ContextSpecific, 0, 1)}),
            // normal-mode-parameters
            BerValue::contextOf(2,
                                {
                                    ber::makeOctets(TagClass::ContextSpecific, 1, selector),  // calling selector
                                    ber::makeOctets(TagClass::ContextSpecific, 2, selector),  // called selector
                                    BerValue::contextOf(4,
                                                        {
                                                            makeContextDefinition(AcseContextId, {2, 2, 1, 0, 1}),
                                                            makeContextDefinition(MmsContextId, {1, 0, 9506, 2, 1}),
                                                        }),
                                    makeFullyEncodedData(AcseContextId, aarq),
                                }),
        });
    return ber::encode(cp);
}

ConnectAccept::Var parseConnectAccept(const BytesView ppdu)
{
    auto decoded = ber::decode(ppdu);
    if (const auto* const failure = cetl::get_if<ber::DecodeResult::Failure>(&decoded))
    {
        return rejected("malformed presentation accept: " + failure->detail);
    }
    auto& cpa = cetl::get<ber::DecodeResult::Success>(decoded).value;

    // CPR-PPDU is a SEQUENCE, CPA-PPDU is a SET.
    if (!cpa.is(TagClass::Universal, 17) || !cpa.constructed)
    {
        return rejected("presentation connect rejected");
    }
    const auto* const params = cpa.findContext(2);
    if (params == nullptr)
    {
        return rejected("presentation accept without normal mode parameters");
    }

    if (const auto* const results = params->findContext(5))
    {
        for (const auto& result : results->children)
        {
            const auto* const code  = result.findContext(0);
            const auto        value = (code != nullptr) ? ber::decodeInteger(*code) : cetl::optional<std::int64_t>{};
            if (!value.has_value() || (*value != 0))
            {
                return rejected("presentation context not accepted");
            }
        }
    }

    const auto* const user_data = params->find(TagClass::Application, FullyEncodedData);
    if ((user_data == nullptr) || user_data->children.empty())
    {
        return rejected("presentation accept without user data");
    }
    const auto* const pdv = user_data->children.front().findContext(0);
    if ((pdv == nullptr) || pdv->children.empty())
    {
        return rejected("presentation accept without ACSE APDU");
    }
    return pdv->children.front();
}

Bytes wrapUserData(const BytesView mms_pdu)
{
    Bytes list;
    ber::encodeTo(ber::makeInteger(TagClass::Universal, universal::Integer, MmsContextId), list);
    const auto single_type = ber::wrap(TagClass::ContextSpecific, 0, mms_pdu);
    list.insert(list.end(), single_type.begin(), single_type.end());

    const auto sequence = ber::wrap(TagClass::Universal, universal::Sequence, ber::view(list));
    return ber::wrap(TagClass::Application, FullyEncodedData, ber::view(sequence));
}

UserData::Var extractUserData(const BytesView ppdu)
{
    // Walks the headers only; the MMS PDU is returned still encoded.
    BytesView rest = ppdu;
    const auto enter = [&rest](const TagClass cls, const std::uint32_t number) -> cetl::optional<std::string> {
        //
        auto header_var = ber::decodeHeader(rest);
        if (const auto* const failure = cetl::get_if<ber::DecodeHeaderResult::Failure>(&header_var))
        {
            return failure->detail;
        }
        const auto& header = cetl::get<ber::Header>(header_var);
        if ((header.tag_class != cls) || (header.tag_number != number) || !header.constructed)
        {
            return std::string{"unexpected presentation data tag"};
        }
        if (header.indefinite_length)
        {
            rest = BytesView{rest.data() + header.header_size, rest.size() - header.header_size};
            return cetl::nullopt;
        }
        if ((header.header_size + header.content_size) > rest.size())
        {
            return std::string{"truncated presentation data"};
        }
        rest = BytesView{rest.data() + header.header_size, header.content_size};
        return cetl::nullopt;
    };

    if (auto failure = enter(TagClass::Application, FullyEncodedData))
    {
        return sdk::error::MalformedEncoding{std::move(*failure)};
    }
    if (auto failure = enter(TagClass::Universal, universal::Sequence))
    {
        return sdk::error::MalformedEncoding{std::move(*failure)};
    }

    // Skip the presentation context identifier.
    auto id_var = ber::decodeHeader(rest);
    if (const auto* const failure = cetl::get_if<ber::DecodeHeaderResult::Failure>(&id_var))
    {
        return *failure;
    }
    const auto& id_header = cetl::get<ber::Header>(id_var);
    const auto  id_size   = id_header.header_size + id_header.content_size;
    if ((id_header.tag_class != TagClass::Universal) || (id_header.tag_number != universal::Integer) ||
        (id_size > rest.size()))
    {
        return sdk::error::MalformedEncoding{"invalid presentation context identifier"};
    }
    rest = BytesView{rest.data() + id_size, rest.size() - id_size};

    if (auto failure = enter(TagClass::ContextSpecific, 0))
    {
        return sdk::error::MalformedEncoding{std::move(*failure)};
    }
    if (rest.empty())
    {
        return sdk::error::MalformedEncoding{"empty presentation data"};
    }
    return Bytes{rest.begin(), rest.end()};
}

}  // namespace presentation
}  // namespace iso
}  // namespace common
}  // namespace iecmms
