//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "value_codec.hpp"

#include "ber/ber_codec.hpp"
#include "ber/ber_value.hpp"

#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace model
{
namespace
{

using ber::BerValue;
using ber::Bytes;
using ber::TagClass;
using sdk::TypeDescriptor;
using sdk::TypedValue;
using sdk::TypeKind;
namespace value = sdk::value;

/// Alternatives of the MMS `Data` choice.
///
enum class DataTag : std::uint8_t
{
    Array         = 1,
    Structure     = 2,
    Boolean       = 3,
    BitString     = 4,
    Integer       = 5,
    Unsigned      = 6,
    FloatingPoint = 7,
    OctetString   = 9,
    VisibleString = 10,
    BinaryTime    = 12,
    MmsString     = 16,
    UtcTime       = 17,
};

constexpr std::uint8_t SingleExponentWidth = 8;
constexpr std::uint8_t DoubleExponentWidth = 11;
constexpr std::uint8_t SingleBitWidth      = 32;
constexpr std::uint8_t DoubleBitWidth      = 64;
constexpr std::size_t  UtcTimeSize         = 8;

constexpr std::uint32_t tagOf(const DataTag tag) noexcept
{
    return static_cast<std::uint32_t>(tag);
}

sdk::error::MalformedEncoding malformed(const char* const what, const BerValue& data)
{
    return sdk::error::MalformedEncoding{fmt::format("{} (tag={})", what, data.describeTag())};
}

sdk::error::TypeMismatch mismatch(const TypeDescriptor& descriptor, const TypeKind actual)
{
    return sdk::error::TypeMismatch{
        fmt::format("expected {}, got {}", sdk::toString(descriptor.kind), sdk::toString(actual))};
}

DataTag dataTagOf(const TypeDescriptor& descriptor) noexcept
{
    switch (descriptor.kind)
    {
    case TypeKind::Boolean:
        return DataTag::Boolean;
    case TypeKind::Integer:
        return DataTag::Integer;
    case TypeKind::Unsigned:
        return DataTag::Unsigned;
    case TypeKind::Float:
        return DataTag::FloatingPoint;
    case TypeKind::BitString:
        return DataTag::BitString;
    case TypeKind::OctetString:
        return descriptor.binary_time ? DataTag::BinaryTime : DataTag::OctetString;
    case TypeKind::VisibleString:
        return DataTag::VisibleString;
    case TypeKind::MmsString:
        return DataTag::MmsString;
    case TypeKind::UtcTime:
        return DataTag::UtcTime;
    case TypeKind::Structure:
        return DataTag::Structure;
    case TypeKind::Array:
    default:
        return DataTag::Array;
    }
}

std::uint8_t widthOf(const std::size_t content_size) noexcept
{
    const auto bits = content_size * 8U;
    return static_cast<std::uint8_t>(std::min<std::size_t>(std::max<std::size_t>(bits, 8U), DoubleBitWidth));
}

std::uint64_t readBigEndian(const Bytes& content, const std::size_t offset, const std::size_t size)
{
    std::uint64_t result = 0;
    for (std::size_t i = 0; i < size; ++i)
    {
        result = (result << 8U) | content[offset + i];
    }
    return result;
}

void writeBigEndian(const std::uint64_t value, const std::size_t size, Bytes& out)
{
    for (std::size_t i = size; i > 0; --i)
    {
        out.push_back(static_cast<std::uint8_t>(value >> ((i - 1) * 8U)));
    }
}

// MARK: - Descriptor-free decoding

class DataDecoder final
{
public:
    DecodeValue::Var decode(const BerValue& data, const std::size_t depth) const
    {
        if (depth > ber::MaxDecodeDepth)
        {
            return malformed("data nested too deep", data);
        }
        if (data.tag_class != TagClass::ContextSpecific)
        {
            return malformed("invalid data", data);
        }
        if (data.constructed)
        {
            return decodeConstructed(data, depth);
        }

        switch (data.tag_number)
        {
        case tagOf(DataTag::Boolean): {
            const auto flag = ber::decodeBoolean(data);
            if (!flag.has_value())
            {
                return malformed("malformed boolean", data);
            }
            return TypedValue{value::Boolean{*flag}};
        }
        case tagOf(DataTag::BitString): {
            auto bits = ber::decodeBitString(data);
            if (!bits.has_value())
            {
                return malformed("malformed bit string", data);
            }
            return TypedValue{value::BitString{std::move(*bits)}};
        }
        case tagOf(DataTag::Integer): {
            const auto number = ber::decodeInteger(data);
            if (!number.has_value())
            {
                return malformed("malformed integer", data);
            }
            return TypedValue{value::Integer{*number, widthOf(data.content.size())}};
        }
        case tagOf(DataTag::Unsigned): {
            const auto number = ber::decodeUnsigned(data);
            if (!number.has_value())
            {
                return malformed("malformed unsigned", data);
            }
            const bool padded = (data.content.size() > 1) && (data.content.front() == 0);
            return TypedValue{value::Unsigned{*number, widthOf(data.content.size() - (padded ? 1 : 0))}};
        }
        case tagOf(DataTag::FloatingPoint): {
            return decodeFloat(data);
        }
        case tagOf(DataTag::OctetString):
        case tagOf(DataTag::BinaryTime): {
            return TypedValue{value::OctetString{data.content}};
        }
        case tagOf(DataTag::VisibleString): {
            return TypedValue{value::VisibleString{std::string{data.content.begin(), data.content.end()}}};
        }
        case tagOf(DataTag::MmsString): {
            return TypedValue{value::MmsString{std::string{data.content.begin(), data.content.end()}}};
        }
        case tagOf(DataTag::UtcTime): {
            if (data.content.size() != UtcTimeSize)
            {
                return malformed("malformed utc time", data);
            }
            return TypedValue{value::UtcTime{static_cast<std::uint32_t>(readBigEndian(data.content, 0, 4)),
                                             static_cast<std::uint32_t>(readBigEndian(data.content, 4, 3)),
                                             data.content[7]}};
        }
        default:
            return malformed("unsupported data", data);
        }
    }

private:
    DecodeValue::Var decodeConstructed(const BerValue& data, const std::size_t depth) const
    {
        if ((data.tag_number != tagOf(DataTag::Array)) && (data.tag_number != tagOf(DataTag::Structure)))
        {
            return malformed("unsupported data", data);
        }

        std::vector<TypedValue> items;
        items.reserve(data.children.size());
        for (const auto& child : data.children)
        {
            auto item = decode(child, depth + 1);
            if (auto* const failure = cetl::get_if<sdk::Error>(&item))
            {
                return std::move(*failure);
            }
            items.push_back(cetl::get<TypedValue>(std::move(item)));
        }

        if (data.tag_number == tagOf(DataTag::Array))
        {
            return TypedValue{value::Array{std::move(items)}};
        }
        return TypedValue{value::Structure{std::move(items), {}}};
    }

    static DecodeValue::Var decodeFloat(const BerValue& data)
    {
        const auto& content = data.content;
        if ((content.size() == 5) && (content[0] == SingleExponentWidth))
        {
            const auto bits = static_cast<std::uint32_t>(readBigEndian(content, 1, 4));
            float      number{};
            std::memcpy(&number, &bits, sizeof(number));
            return TypedValue{value::Float{number, SingleBitWidth}};
        }
        if ((content.size() == 9) && (content[0] == DoubleExponentWidth))
        {
            const auto bits = readBigEndian(content, 1, 8);
            double     number{};
            std::memcpy(&number, &bits, sizeof(number));
            return TypedValue{value::Float{number, DoubleBitWidth}};
        }
        return malformed("unsupported floating point format", data);
    }

};  // DataDecoder

// MARK: - Typed decoding

class ValueDecoder final
{
public:
    DecodeValue::Var decode(const TypeDescriptor& descriptor, const BerValue& data, const std::size_t depth) const
    {
        if (depth > ber::MaxDecodeDepth)
        {
            return malformed("data nested too deep", data);
        }
        const auto expected_tag = tagOf(dataTagOf(descriptor));
        if ((data.tag_class != TagClass::ContextSpecific) || (data.tag_number != expected_tag))
        {
            return sdk::error::TypeMismatch{
                fmt::format("expected {} data, got tag {}", sdk::toString(descriptor.kind), data.describeTag())};
        }

        switch (descriptor.kind)
        {
        case TypeKind::Structure:
            return decodeStructure(descriptor, data, depth);
        case TypeKind::Array:
            return decodeArray(descriptor, data, depth);
        default:
            break;
        }

        auto decoded = DataDecoder{}.decode(data, depth);
        if (auto* const typed = cetl::get_if<TypedValue>(&decoded))
        {
            // Declared widths win over the minimal encoded ones.
            if (auto* const integer = cetl::get_if<value::Integer>(&typed->var()))
            {
                integer->bit_width = static_cast<std::uint8_t>(descriptor.size);
            }
            else if (auto* const natural = cetl::get_if<value::Unsigned>(&typed->var()))
            {
                natural->bit_width = static_cast<std::uint8_t>(descriptor.size);
            }
        }
        return decoded;
    }

private:
    DecodeValue::Var decodeStructure(const TypeDescriptor& descriptor,
                                     const BerValue&       data,
                                     const std::size_t     depth) const
    {
        if (!data.constructed || (data.children.size() != descriptor.components.size()))
        {
            return sdk::error::TypeMismatch{fmt::format("expected structure of {} members, got {}",
                                                        descriptor.components.size(),
                                                        data.children.size())};
        }

        value::Structure structure;
        structure.members.reserve(data.children.size());
        structure.names.reserve(data.children.size());
        for (std::size_t i = 0; i < data.children.size(); ++i)
        {
            const auto& component = descriptor.components[i];
            auto        member    = decode(*component.type, data.children[i], depth + 1);
            if (auto* const failure = cetl::get_if<sdk::Error>(&member))
            {
                return std::move(*failure);
            }
            structure.members.push_back(cetl::get<TypedValue>(std::move(member)));
            structure.names.push_back(component.name);
        }
        return TypedValue{std::move(structure)};
    }

    DecodeValue::Var decodeArray(const TypeDescriptor& descriptor, const BerValue& data, const std::size_t depth) const
    {
        if (!data.constructed || (data.children.size() != descriptor.element_count))
        {
            return sdk::error::TypeMismatch{fmt::format("expected array of {} elements, got {}",
                                                        descriptor.element_count,
                                                        data.children.size())};
        }

        value::Array array;
        array.elements.reserve(data.children.size());
        for (const auto& child : data.children)
        {
            auto element = decode(*descriptor.element, child, depth + 1);
            if (auto* const failure = cetl::get_if<sdk::Error>(&element))
            {
                return std::move(*failure);
            }
            array.elements.push_back(cetl::get<TypedValue>(std::move(element)));
        }
        return TypedValue{std::move(array)};
    }

};  // ValueDecoder

// MARK: - Typed encoding

bool fitsSigned(const std::int64_t number, const std::int32_t bits) noexcept
{
    if ((bits <= 0) || (bits >= 64))  // NOLINT(*-magic-numbers)
    {
        return true;
    }
    const auto limit = std::int64_t{1} << static_cast<unsigned>(bits - 1);
    return (number >= -limit) && (number < limit);
}

bool fitsUnsigned(const std::uint64_t number, const std::int32_t bits) noexcept
{
    if ((bits <= 0) || (bits >= 64))  // NOLINT(*-magic-numbers)
    {
        return true;
    }
    return number < (std::uint64_t{1} << static_cast<unsigned>(bits));
}

/// Positive sizes are fixed, negative ones are upper bounds.
///
bool fitsBitCount(const std::size_t count, const std::int32_t size) noexcept
{
    if (size >= 0)
    {
        return count == static_cast<std::size_t>(size);
    }
    return count <= static_cast<std::size_t>(-static_cast<std::int64_t>(size));
}

/// String sizes are upper bounds (zero means unbounded).
///
bool fitsLength(const std::size_t length, const std::int32_t size) noexcept
{
    const auto bound = static_cast<std::size_t>((size < 0) ? -static_cast<std::int64_t>(size) : size);
    return (bound == 0) || (length <= bound);
}

class ValueEncoder final
{
public:
    EncodeValue::Var encode(const TypeDescriptor& descriptor, const TypedValue& typed) const
    {
        if (typed.kind() != descriptor.kind)
        {
            return mismatch(descriptor, typed.kind());
        }

        switch (descriptor.kind)
        {
        case TypeKind::Integer: {
            const auto& integer = *typed.as<value::Integer>();
            if (!fitsSigned(integer.value, descriptor.size))
            {
                return sdk::error::TypeMismatch{
                    fmt::format("integer {} exceeds {} bits", integer.value, descriptor.size)};
            }
            break;
        }
        case TypeKind::Unsigned: {
            const auto& natural = *typed.as<value::Unsigned>();
            if (!fitsUnsigned(natural.value, descriptor.size))
            {
                return sdk::error::TypeMismatch{
                    fmt::format("unsigned {} exceeds {} bits", natural.value, descriptor.size)};
            }
            break;
        }
        case TypeKind::Float: {
            auto number      = *typed.as<value::Float>();
            number.bit_width = (descriptor.size == DoubleBitWidth) ? DoubleBitWidth : SingleBitWidth;
            return encodeData(TypedValue{number});
        }
        case TypeKind::BitString: {
            const auto& bits = typed.as<value::BitString>()->bits;
            if (!fitsBitCount(bits.size(), descriptor.size))
            {
                return sdk::error::TypeMismatch{
                    fmt::format("bit string of {} bits does not fit size {}", bits.size(), descriptor.size)};
            }
            break;
        }
        case TypeKind::OctetString: {
            const auto& octets = typed.as<value::OctetString>()->octets;
            if (!fitsLength(octets.size(), descriptor.size))
            {
                return sdk::error::TypeMismatch{
                    fmt::format("octet string of {} octets exceeds {}", octets.size(), descriptor.size)};
            }
            if (descriptor.binary_time)
            {
                return BerValue::context(tagOf(DataTag::BinaryTime), octets);
            }
            break;
        }
        case TypeKind::VisibleString: {
            const auto& text = typed.as<value::VisibleString>()->text;
            if (!fitsLength(text.size(), descriptor.size))
            {
                return sdk::error::TypeMismatch{
                    fmt::format("string of {} characters exceeds {}", text.size(), descriptor.size)};
            }
            break;
        }
        case TypeKind::MmsString: {
            const auto& text = typed.as<value::MmsString>()->text;
            if (!fitsLength(text.size(), descriptor.size))
            {
                return sdk::error::TypeMismatch{
                    fmt::format("string of {} characters exceeds {}", text.size(), descriptor.size)};
            }
            break;
        }
        case TypeKind::Structure:
            return encodeStructure(descriptor, *typed.as<value::Structure>());
        case TypeKind::Array:
            return encodeArray(descriptor, *typed.as<value::Array>());
        case TypeKind::Boolean:
        case TypeKind::UtcTime:
        default:
            break;
        }
        return encodeData(typed);
    }

private:
    EncodeValue::Var encodeStructure(const TypeDescriptor& descriptor, const value::Structure& structure) const
    {
        if (structure.members.size() != descriptor.components.size())
        {
            return sdk::error::TypeMismatch{fmt::format("expected structure of {} members, got {}",
                                                        descriptor.components.size(),
                                                        structure.members.size())};
        }

        std::vector<BerValue> children;
        children.reserve(structure.members.size());
        for (std::size_t i = 0; i < structure.members.size(); ++i)
        {
            const auto& component = descriptor.components[i];
            if (!structure.names.empty() && (structure.names[i] != component.name))
            {
                return sdk::error::TypeMismatch{
                    fmt::format("expected member '{}', got '{}'", component.name, structure.names[i])};
            }
            auto child = encode(*component.type, structure.members[i]);
            if (auto* const failure = cetl::get_if<sdk::error::TypeMismatch>(&child))
            {
                failure->detail = component.name + ": " + failure->detail;
                return std::move(*failure);
            }
            children.push_back(cetl::get<BerValue>(std::move(child)));
        }
        return BerValue::contextOf(tagOf(DataTag::Structure), std::move(children));
    }

    EncodeValue::Var encodeArray(const TypeDescriptor& descriptor, const value::Array& array) const
    {
        if (array.elements.size() != descriptor.element_count)
        {
            return sdk::error::TypeMismatch{fmt::format("expected array of {} elements, got {}",
                                                        descriptor.element_count,
                                                        array.elements.size())};
        }

        std::vector<BerValue> children;
        children.reserve(array.elements.size());
        for (const auto& element : array.elements)
        {
            auto child = encode(*descriptor.element, element);
            if (auto* const failure = cetl::get_if<sdk::error::TypeMismatch>(&child))
            {
                return std::move(*failure);
            }
            children.push_back(cetl::get<BerValue>(std::move(child)));
        }
        return BerValue::contextOf(tagOf(DataTag::Array), std::move(children));
    }

};  // ValueEncoder

}  // namespace

DecodeValue::Var decodeValue(const TypeDescriptor& descriptor, const BerValue& data)
{
    return ValueDecoder{}.decode(descriptor, data, 0);
}

EncodeValue::Var encodeValue(const TypeDescriptor& descriptor, const TypedValue& value)
{
    return ValueEncoder{}.encode(descriptor, value);
}

DecodeValue::Var decodeData(const BerValue& data)
{
    return DataDecoder{}.decode(data, 0);
}

BerValue encodeData(const TypedValue& typed)
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [](const value::Boolean& boolean) {
                //
                return ber::makeBoolean(TagClass::ContextSpecific, tagOf(DataTag::Boolean), boolean.value);
            },
            [](const value::Integer& integer) {
                //
                return ber::makeInteger(TagClass::ContextSpecific, tagOf(DataTag::Integer), integer.value);
            },
            [](const value::Unsigned& natural) {
                //
                return ber::makeUnsigned(TagClass::ContextSpecific, tagOf(DataTag::Unsigned), natural.value);
            },
            [](const value::Float& number) {
                //
                Bytes content;
                if (number.bit_width == DoubleBitWidth)
                {
                    std::uint64_t bits{};
                    std::memcpy(&bits, &number.value, sizeof(bits));
                    content.push_back(DoubleExponentWidth);
                    writeBigEndian(bits, sizeof(bits), content);
                }
                else
                {
                    const auto    single = static_cast<float>(number.value);
                    std::uint32_t bits{};
                    std::memcpy(&bits, &single, sizeof(bits));
                    content.push_back(SingleExponentWidth);
                    writeBigEndian(bits, sizeof(bits), content);
                }
                return BerValue::context(tagOf(DataTag::FloatingPoint), std::move(content));
            },
            [](const value::BitString& bit_string) {
                //
                return ber::makeBitString(TagClass::ContextSpecific, tagOf(DataTag::BitString), bit_string.bits);
            },
            [](const value::OctetString& octets) {
                //
                return ber::makeOctets(TagClass::ContextSpecific, tagOf(DataTag::OctetString), octets.octets);
            },
            [](const value::VisibleString& text) {
                //
                return ber::makeString(TagClass::ContextSpecific, tagOf(DataTag::VisibleString), text.text);
            },
            [](const value::MmsString& text) {
                //
                return ber::makeString(TagClass::ContextSpecific, tagOf(DataTag::MmsString), text.text);
            },
            [](const value::UtcTime& time) {
                //
                Bytes content;
                writeBigEndian(time.seconds, 4, content);
                writeBigEndian(time.fraction, 3, content);
                content.push_back(time.quality);
                return BerValue::context(tagOf(DataTag::UtcTime), std::move(content));
            },
            [](const value::Structure& structure) {
                //
                std::vector<BerValue> children;
                children.reserve(structure.members.size());
                for (const auto& member : structure.members)
                {
                    children.push_back(encodeData(member));
                }
                return BerValue::contextOf(tagOf(DataTag::Structure), std::move(children));
            },
            [](const value::Array& array) {
                //
                std::vector<BerValue> children;
                children.reserve(array.elements.size());
                for (const auto& element : array.elements)
                {
                    children.push_back(encodeData(element));
                }
                return BerValue::contextOf(tagOf(DataTag::Array), std::move(children));
            }),
        typed.var());
}

}  // namespace model
}  // namespace common
}  // namespace iecmms
