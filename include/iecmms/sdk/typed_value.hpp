//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_TYPED_VALUE_HPP_INCLUDED
#define IECMMS_SDK_TYPED_VALUE_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace iecmms
{
namespace sdk
{

/// Kinds of MMS data, in the same order as the alternatives of `TypedValue::Var`.
///
enum class TypeKind : std::uint8_t
{
    Boolean,
    Integer,
    Unsigned,
    Float,
    BitString,
    OctetString,
    VisibleString,
    MmsString,
    UtcTime,
    Structure,
    Array,

};  // TypeKind

const char* toString(const TypeKind kind) noexcept;

/// Mirror of the MMS `TypeDescription` of a variable, as reported by the server during discovery.
///
/// Descriptors are immutable once built and shared between the model nodes which refer to them.
///
struct TypeDescriptor final
{
    using Ptr = std::shared_ptr<const TypeDescriptor>;

    struct Component final
    {
        std::string name;
        Ptr         type;
    };

    TypeKind kind{TypeKind::Boolean};

    /// Bit width of integers and floats, number of bits of bit strings, or maximum length of strings.
    /// A negative value means "variable length, up to the absolute value".
    std::int32_t size{0};

    /// Exponent width of floating point numbers (8 for single, 11 for double precision).
    std::uint8_t exponent_width{0};

    /// Octet strings which carry an MMS `binary-time` (like the `EntryTime` of logs).
    bool binary_time{false};

    /// Structure components in declaration order.
    std::vector<Component> components;

    std::uint32_t element_count{0};
    Ptr           element;

    const Component* findComponent(const std::string& name) const
    {
        for (const auto& component : components)
        {
            if (component.name == name)
            {
                return &component;
            }
        }
        return nullptr;
    }

};  // TypeDescriptor

class TypedValue;

namespace value
{

struct Boolean final
{
    bool value;
};

struct Integer final
{
    std::int64_t value;
    std::uint8_t bit_width;
};

struct Unsigned final
{
    std::uint64_t value;
    std::uint8_t  bit_width;
};

struct Float final
{
    double       value;
    std::uint8_t bit_width;  // 32 or 64
};

struct BitString final
{
    std::vector<bool> bits;
};

struct OctetString final
{
    std::vector<std::uint8_t> octets;
};

struct VisibleString final
{
    std::string text;
};

/// UTF-8 `MMSString`.
struct MmsString final
{
    std::string text;
};

/// IEC 61850 UTC timestamp: seconds since the epoch, 24-bit binary fraction and time quality.
struct UtcTime final
{
    std::uint32_t seconds;
    std::uint32_t fraction;
    std::uint8_t  quality;
};

/// Ordered members, addressable positionally or by name (`names` is either empty or of the same size).
struct Structure final
{
    std::vector<TypedValue>  members;
    std::vector<std::string> names;

    const TypedValue* find(const std::string& name) const;
};

struct Array final
{
    std::vector<TypedValue> elements;
};

bool operator==(const Boolean& lhs, const Boolean& rhs);
bool operator==(const Integer& lhs, const Integer& rhs);
bool operator==(const Unsigned& lhs, const Unsigned& rhs);
bool operator==(const Float& lhs, const Float& rhs);
bool operator==(const BitString& lhs, const BitString& rhs);
bool operator==(const OctetString& lhs, const OctetString& rhs);
bool operator==(const VisibleString& lhs, const VisibleString& rhs);
bool operator==(const MmsString& lhs, const MmsString& rhs);
bool operator==(const UtcTime& lhs, const UtcTime& rhs);
bool operator==(const Structure& lhs, const Structure& rhs);
bool operator==(const Array& lhs, const Array& rhs);

}  // namespace value

/// Caller facing value of an MMS variable.
///
class TypedValue final
{
    template <typename T, typename... Alternatives>
    struct IsOneOf : std::false_type
    {};
    template <typename T, typename Head, typename... Tail>
    struct IsOneOf<T, Head, Tail...>
        : std::conditional_t<std::is_same<T, Head>::value, std::true_type, IsOneOf<T, Tail...>>
    {};

public:
    using Var = cetl::variant<value::Boolean,
                              value::Integer,
                              value::Unsigned,
                              value::Float,
                              value::BitString,
                              value::OctetString,
                              value::VisibleString,
                              value::MmsString,
                              value::UtcTime,
                              value::Structure,
                              value::Array>;

    template <typename T>
    using IsAlternative = IsOneOf<T,
                                  value::Boolean,
                                  value::Integer,
                                  value::Unsigned,
                                  value::Float,
                                  value::BitString,
                                  value::OctetString,
                                  value::VisibleString,
                                  value::MmsString,
                                  value::UtcTime,
                                  value::Structure,
                                  value::Array>;

    TypedValue()
        : var_{value::Boolean{false}}
    {
    }

    template <typename Alternative, typename = std::enable_if_t<IsAlternative<std::decay_t<Alternative>>::value>>
    TypedValue(Alternative&& alternative)  // NOLINT(*-explicit-constructor)
        : var_{std::forward<Alternative>(alternative)}
    {
    }

    TypeKind kind() const noexcept
    {
        return static_cast<TypeKind>(var_.index());
    }

    const Var& var() const noexcept
    {
        return var_;
    }

    Var& var() noexcept
    {
        return var_;
    }

    template <typename Alternative>
    const Alternative* as() const noexcept
    {
        return cetl::get_if<Alternative>(&var_);
    }

    /// Renders the value in a compact, human readable form (used by logs and the CLI).
    ///
    std::string toString() const;

private:
    Var var_;

};  // TypedValue

bool operator==(const TypedValue& lhs, const TypedValue& rhs);

inline bool operator!=(const TypedValue& lhs, const TypedValue& rhs)
{
    return !(lhs == rhs);
}

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_TYPED_VALUE_HPP_INCLUDED
