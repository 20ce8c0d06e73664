//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_MODEL_OBJECT_REFERENCE_HPP_INCLUDED
#define IECMMS_COMMON_MODEL_OBJECT_REFERENCE_HPP_INCLUDED

#include "mms/mms_types.hpp"

#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <vector>

namespace iecmms
{
namespace common
{
namespace model
{

/// Parsed IEC 61850 object reference `LD[/LN[.DO[.DA...]]][[FC]]`.
///
struct ObjectReference final
{
    std::string logical_device;

    /// Empty when the reference names a logical device only.
    std::string logical_node;

    /// Data object name followed by (sub)attribute names.
    std::vector<std::string> names;

    cetl::optional<sdk::FunctionalConstraint> fc;

    struct Parse
    {
        using Success = ObjectReference;
        using Failure = sdk::error::PathNotFound;
        using Var     = cetl::variant<Success, Failure>;
    };
    static Parse::Var parse(const std::string& reference);

    /// Name segments: LD, LN, DO, DA...
    ///
    std::vector<std::string> segments() const;

    /// Canonical rendering, e.g. `D1/LLN0.Mod.stVal[ST]`.
    ///
    std::string toString() const;

    /// The MMS domain specific variable name, e.g. (`D1`, `LLN0$ST$Mod$stVal`).
    ///
    mms::ObjectName toMmsName(const sdk::FunctionalConstraint with_fc) const;

    /// Parses an MMS variable name (like the members of a data set) back into a reference.
    ///
    static cetl::optional<ObjectReference> fromMmsName(const mms::ObjectName& name);

};  // ObjectReference

struct DataSetReference
{
    using Success = mms::ObjectName;
    using Failure = sdk::error::PathNotFound;
    using Var     = cetl::variant<Success, Failure>;
};
/// Parses a data set reference `LD/LN.DS` (or `LD/LN$DS`), or `@DS` for a VMD specific one.
///
DataSetReference::Var parseDataSetReference(const std::string& reference);

}  // namespace model
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_MODEL_OBJECT_REFERENCE_HPP_INCLUDED
