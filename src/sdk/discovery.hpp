//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_DISCOVERY_HPP_INCLUDED
#define IECMMS_SDK_DISCOVERY_HPP_INCLUDED

#include "logging.hpp"
#include "model/object_reference.hpp"
#include "sdk_helpers.hpp"

#include "iecmms/sdk/client.hpp"
#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace iecmms
{
namespace sdk
{

/// Lazily discovered data model of the connected server.
///
/// Logical devices and logical nodes are listed with GetNameList; each logical node is expanded
/// from one GetVariableAccessAttributes of its whole MMS variable. Requests are never issued while
/// the internal lock is held, so concurrent operations may discover the same node twice.
///
class Discovery final
{
public:
    explicit Discovery(Transact transact);

    Discovery(Discovery&&)                 = delete;
    Discovery(const Discovery&)            = delete;
    Discovery& operator=(Discovery&&)      = delete;
    Discovery& operator=(const Discovery&) = delete;

    ~Discovery() = default;

    /// Forgets everything discovered so far (the next association may be with another server).
    ///
    void reset();

    /// Gets the MMS type of a whole logical node, discovering the node if needed.
    ///
    Outcome<TypeDescriptor::Ptr> logicalNodeType(const std::string& logical_device, const std::string& logical_node);

    Client::Browse::Result   browse(const std::string& path);
    Client::Discover::Result discover(const std::string& path, const Client::Depth depth);
    Client::Discover::Result resolve(const std::string& path);

    /// Remembers the last value read (or written) at the node, if the node is already discovered.
    ///
    void storeValue(const common::model::ObjectReference& reference,
                    const FunctionalConstraint            fc,
                    const TypedValue&                     value);

private:
    Outcome<std::vector<std::string>> getNameList(const common::mms::ObjectClass     object_class,
                                                  const cetl::optional<std::string>& domain);

    cetl::optional<Error> expandServer();
    cetl::optional<Error> expandLogicalDevice(const std::string& logical_device);

    DataModelNode& logicalDeviceNode(const std::string& logical_device);

    Outcome<common::model::ObjectReference> parseReference(const std::string& path) const;

    const Transact                             transact_;
    common::LoggerPtr                          logger_;
    mutable std::mutex                         mutex_;
    DataModelNode                              root_;
    std::map<std::string, TypeDescriptor::Ptr> ln_types_;

};  // Discovery

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_DISCOVERY_HPP_INCLUDED
