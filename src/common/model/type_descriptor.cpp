//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "type_descriptor.hpp"

#include "ber/ber_codec.hpp"
#include "mms/mms_types.hpp"

#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
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
using ber::TagClass;
using sdk::TypeDescriptor;
using sdk::TypeKind;

/// Alternatives of the MMS `TypeDescription` choice.
///
enum class TypeTag : std::uint8_t
{
    Array           = 1,
    Structure       = 2,
    Boolean         = 3,
    BitString       = 4,
    Integer         = 5,
    Unsigned        = 6,
    FloatingPoint   = 7,
    OctetString     = 9,
    VisibleString   = 10,
    GeneralizedTime = 11,
    BinaryTime      = 12,
    Bcd             = 13,
    ObjectId        = 15,
    MmsString       = 16,
    UtcTime         = 17,
};

constexpr std::size_t MaxTypeDepth = ber::MaxDecodeDepth;

sdk::error::MalformedEncoding malformed(const char* const what, const BerValue& value)
{
    return sdk::error::MalformedEncoding{fmt::format("{} (tag={})", what, value.describeTag())};
}

cetl::optional<std::int32_t> decodeInt32(const BerValue* const value)
{
    if (value == nullptr)
    {
        return cetl::nullopt;
    }
    const auto decoded = ber::decodeInteger(*value);
    if (!decoded.has_value() || (*decoded < std::numeric_limits<std::int32_t>::min()) ||
        (*decoded > std::numeric_limits<std::int32_t>::max()))
    {
        return cetl::nullopt;
    }
    return static_cast<std::int32_t>(*decoded);
}

class TypeParser final
{
public:
    mms::Parsed<TypeDescriptor::Ptr> parse(const BerValue& description, const std::size_t depth)
    {
        if (depth > MaxTypeDepth)
        {
            return malformed("type description nested too deep", description);
        }
        if (description.tag_class != TagClass::ContextSpecific)
        {
            return malformed("invalid type description", description);
        }

        auto descriptor = std::make_shared<TypeDescriptor>();
        switch (description.tag_number)
        {
        case static_cast<std::uint32_t>(TypeTag::Array): {
            return parseArray(description, std::move(descriptor), depth);
        }
        case static_cast<std::uint32_t>(TypeTag::Structure): {
            return parseStructure(description, std::move(descriptor), depth);
        }
        case static_cast<std::uint32_t>(TypeTag::Boolean): {
            descriptor->kind = TypeKind::Boolean;
            break;
        }
        case static_cast<std::uint32_t>(TypeTag::FloatingPoint): {
            const auto format   = decodeInt32(description.children.size() == 2 ? &description.children[0] : nullptr);
            const auto exponent = decodeInt32(description.children.size() == 2 ? &description.children[1] : nullptr);
            if (!format.has_value() || !exponent.has_value() || ((*format != 32) && (*format != 64)))  // NOLINT
            {
                return malformed("unsupported floating point format", description);
            }
            descriptor->kind           = TypeKind::Float;
            descriptor->size           = *format;
            descriptor->exponent_width = static_cast<std::uint8_t>(*exponent);
            break;
        }
        case static_cast<std::uint32_t>(TypeTag::UtcTime): {
            descriptor->kind = TypeKind::UtcTime;
            break;
        }
        case static_cast<std::uint32_t>(TypeTag::BinaryTime): {
            // Time of day: 4 octets, or 6 when the date is included.
            const auto with_date    = ber::decodeBoolean(description).value_or(false);
            descriptor->kind        = TypeKind::OctetString;
            descriptor->size        = with_date ? 6 : 4;  // NOLINT(*-magic-numbers)
            descriptor->binary_time = true;
            break;
        }
        default: {
            const auto kind = sizedKind(description.tag_number);
            if (!kind.has_value())
            {
                return malformed("unsupported type description", description);
            }
            const auto size = decodeInt32(&description);
            if (!size.has_value())
            {
                return malformed("invalid type size", description);
            }
            descriptor->kind = *kind;
            descriptor->size = *size;
            break;
        }
        }
        return TypeDescriptor::Ptr{std::move(descriptor)};
    }

private:
    static cetl::optional<TypeKind> sizedKind(const std::uint32_t tag)
    {
        switch (tag)
        {
        case static_cast<std::uint32_t>(TypeTag::BitString):
            return TypeKind::BitString;
        case static_cast<std::uint32_t>(TypeTag::Integer):
            return TypeKind::Integer;
        case static_cast<std::uint32_t>(TypeTag::Unsigned):
            return TypeKind::Unsigned;
        case static_cast<std::uint32_t>(TypeTag::OctetString):
            return TypeKind::OctetString;
        case static_cast<std::uint32_t>(TypeTag::VisibleString):
            return TypeKind::VisibleString;
        case static_cast<std::uint32_t>(TypeTag::MmsString):
            return TypeKind::MmsString;
        default:
            return cetl::nullopt;
        }
    }

    mms::Parsed<TypeDescriptor::Ptr> parseArray(const BerValue&                 description,
                                                std::shared_ptr<TypeDescriptor> descriptor,
                                                const std::size_t               depth)
    {
        const auto        count        = decodeInt32(description.findContext(1));
        const auto* const element_spec = description.findContext(2);
        if (!count.has_value() || (*count < 0) || (element_spec == nullptr) || (element_spec->children.size() != 1))
        {
            return malformed("invalid array type description", description);
        }

        auto element = parse(element_spec->children.front(), depth + 1);
        if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&element))
        {
            return std::move(*failure);
        }
        descriptor->kind          = TypeKind::Array;
        descriptor->element_count = static_cast<std::uint32_t>(*count);
        descriptor->element       = cetl::get<TypeDescriptor::Ptr>(std::move(element));
        return TypeDescriptor::Ptr{std::move(descriptor)};
    }

    mms::Parsed<TypeDescriptor::Ptr> parseStructure(const BerValue&                 description,
                                                    std::shared_ptr<TypeDescriptor> descriptor,
                                                    const std::size_t               depth)
    {
        const auto* const components = description.findContext(1);
        if ((components == nullptr) || !components->constructed)
        {
            return malformed("invalid structure type description", description);
        }

        descriptor->kind = TypeKind::Structure;
        descriptor->components.reserve(components->children.size());
        for (const auto& component : components->children)
        {
            const auto* const name = component.findContext(0);
            const auto* const spec = component.findContext(1);
            if ((name == nullptr) || (spec == nullptr) || (spec->children.size() != 1))
            {
                return malformed("invalid structure component", component);
            }
            auto component_name = ber::decodeString(*name);
            if (!component_name.has_value())
            {
                return malformed("invalid structure component name", *name);
            }

            auto component_type = parse(spec->children.front(), depth + 1);
            if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&component_type))
            {
                return std::move(*failure);
            }
            descriptor->components.push_back(
                {std::move(*component_name), cetl::get<TypeDescriptor::Ptr>(std::move(component_type))});
        }
        return TypeDescriptor::Ptr{std::move(descriptor)};
    }

};  // TypeParser

}  // namespace

mms::Parsed<TypeDescriptor::Ptr> parseTypeDescription(const BerValue& description)
{
    TypeParser parser;
    return parser.parse(description, 0);
}

TypeDescriptor::Ptr findDescriptor(const TypeDescriptor::Ptr&      ln_type,
                                   const sdk::FunctionalConstraint fc,
                                   const std::vector<std::string>& names)
{
    if (!ln_type)
    {
        return nullptr;
    }
    const auto* const fc_component = ln_type->findComponent(sdk::toString(fc));
    if (fc_component == nullptr)
    {
        return nullptr;
    }

    auto current = fc_component->type;
    for (const auto& name : names)
    {
        if (!current || (current->kind != TypeKind::Structure))
        {
            return nullptr;
        }
        const auto* const component = current->findComponent(name);
        if (component == nullptr)
        {
            return nullptr;
        }
        current = component->type;
    }
    return current;
}

std::vector<sdk::FunctionalConstraint> functionalConstraintsOf(const TypeDescriptor::Ptr&      ln_type,
                                                               const std::vector<std::string>& names)
{
    std::vector<sdk::FunctionalConstraint> fcs;
    if (!ln_type)
    {
        return fcs;
    }
    for (const auto& component : ln_type->components)
    {
        const auto fc = sdk::parseFunctionalConstraint(component.name);
        if (fc.has_value() && findDescriptor(ln_type, *fc, names))
        {
            fcs.push_back(*fc);
        }
    }
    return fcs;
}

}  // namespace model
}  // namespace common
}  // namespace iecmms
