//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_MMS_MMS_TYPES_HPP_INCLUDED
#define IECMMS_COMMON_MMS_MMS_TYPES_HPP_INCLUDED

#include "ber/ber_value.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace mms
{

using ber::BerValue;

/// Result of decoding an MMS structure.
///
template <typename T>
using Parsed = cetl::variant<T, sdk::error::MalformedEncoding>;

/// MMS `ObjectName`.
///
struct ObjectName final
{
    enum class Scope : std::uint8_t
    {
        VmdSpecific    = 0,
        DomainSpecific = 1,
        AaSpecific     = 2,
    };

    Scope       scope{Scope::VmdSpecific};
    std::string domain;
    std::string item;

    static ObjectName vmdSpecific(std::string item)
    {
        return ObjectName{Scope::VmdSpecific, {}, std::move(item)};
    }
    static ObjectName domainSpecific(std::string domain, std::string item)
    {
        return ObjectName{Scope::DomainSpecific, std::move(domain), std::move(item)};
    }

};  // ObjectName

inline bool operator==(const ObjectName& lhs, const ObjectName& rhs)
{
    return (lhs.scope == rhs.scope) && (lhs.domain == rhs.domain) && (lhs.item == rhs.item);
}
inline bool operator!=(const ObjectName& lhs, const ObjectName& rhs)
{
    return !(lhs == rhs);
}

/// Outcome of one variable access: the `Data` on success.
///
using AccessResult = cetl::variant<BerValue, sdk::DataAccessError>;

// MARK: - Initiate / Conclude

struct InitiateRequest final
{
    std::int32_t local_detail_calling{65000};
    std::int16_t max_serv_outstanding_calling{16};
    std::int16_t max_serv_outstanding_called{16};
    std::int8_t  data_structure_nesting_level{10};
};

struct InitiateResponse final
{
    std::int32_t local_detail_called{0};
    std::int16_t max_serv_outstanding_calling{1};
    std::int16_t max_serv_outstanding_called{1};
    std::int8_t  data_structure_nesting_level{0};
    std::int16_t version{1};
};

// MARK: - Services

enum class ObjectClass : std::uint8_t
{
    NamedVariable     = 0,
    NamedVariableList = 2,
    Domain            = 9,
};

struct StatusResponse final
{
    std::int64_t logical;
    std::int64_t physical;
};

struct GetNameListRequest final
{
    ObjectClass object_class{ObjectClass::Domain};

    /// Domain of a domain specific scope; VMD specific scope when empty.
    cetl::optional<std::string> domain;
    cetl::optional<std::string> continue_after;
};

struct GetNameListResponse final
{
    std::vector<std::string> identifiers;
    bool                     more_follows{true};
};

struct IdentifyResponse final
{
    std::string vendor;
    std::string model;
    std::string revision;
};

/// `VariableAccessSpecification` - either a list of variables, or the name of a named variable list.
///
struct VariableAccess final
{
    std::vector<ObjectName>    variables;
    cetl::optional<ObjectName> list_name;
};

struct ReadRequest final
{
    VariableAccess access;
    bool           specification_with_result{false};
};

struct ReadResponse final
{
    cetl::optional<VariableAccess> access;
    std::vector<AccessResult>      results;
};

struct WriteRequest final
{
    std::vector<ObjectName> variables;
    std::vector<BerValue>   data;
};

struct WriteResponse final
{
    /// Per written variable: nothing on success.
    std::vector<cetl::optional<sdk::DataAccessError>> results;
};

struct GetVariableAccessAttributesResponse final
{
    bool     deletable{false};
    BerValue type_description;
};

struct GetNamedVariableListAttributesResponse final
{
    bool                    deletable{false};
    std::vector<ObjectName> members;
};

struct DefineNamedVariableListRequest final
{
    ObjectName              name;
    std::vector<ObjectName> members;
};

struct DeleteNamedVariableListResponse final
{
    std::uint32_t matched{0};
    std::uint32_t deleted{0};
};

struct InformationReport final
{
    VariableAccess            access;
    std::vector<AccessResult> results;
};

}  // namespace mms
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_MMS_MMS_TYPES_HPP_INCLUDED
