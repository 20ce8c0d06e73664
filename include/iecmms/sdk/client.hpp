//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_CLIENT_HPP_INCLUDED
#define IECMMS_SDK_CLIENT_HPP_INCLUDED

#include "control.hpp"
#include "data_model.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "execution.hpp"
#include "report.hpp"
#include "typed_value.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace iecmms
{
namespace sdk
{

/// Configuration of a client connection.
///
struct ClientOptions final
{
    /// Server address as `host[:port]` (IPv6 hosts in brackets when a port is given). Port 102 by default.
    std::string endpoint;

    std::chrono::milliseconds association_timeout{std::chrono::seconds{10}};
    std::chrono::milliseconds request_timeout{std::chrono::seconds{5}};

    /// Upper bound of simultaneously pending requests (further limited by the negotiated MMS parameters).
    std::size_t max_pending_requests{16};

    /// ACSE password authentication (disabled when empty).
    std::string password;

};  // ClientOptions

/// Defines the client side facade of an IEC 61850 MMS connection.
///
/// Every operation returns a discriminated result which carries either the success payload or
/// the `Error` reported by the lower layers (unchanged). There are no automatic retries or reconnects.
///
class Client
{
public:
    using Ptr = std::shared_ptr<Client>;

    enum class State : std::uint8_t
    {
        Disconnected,
        Connecting,
        Associated,
    };

    /// Makes a new client which talks to the server over TCP.
    ///
    /// @param options The connection options.
    /// @param event_sink Optional observability sink. By default events are written to the `session` logger.
    ///
    CETL_NODISCARD static Ptr make(ClientOptions options, EventSink::Ptr event_sink = nullptr);

    Client(Client&&)                 = delete;
    Client(const Client&)            = delete;
    Client& operator=(Client&&)      = delete;
    Client& operator=(const Client&) = delete;

    virtual ~Client() = default;

    // MARK: Connection

    struct Connect final
    {
        using Success = Done;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Connects to the endpoint of the options, and performs the MMS association.
    ///
    virtual Connect::Result connect() = 0;
    virtual Connect::Result connect(const std::string& endpoint, const std::chrono::milliseconds timeout) = 0;

    struct Release final
    {
        using Success = Done;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Gracefully concludes the association and closes the connection.
    ///
    virtual Release::Result release() = 0;

    /// Closes the connection immediately. All pending operations fail with `ConnectionLost`.
    ///
    virtual void abort() = 0;

    CETL_NODISCARD virtual State state() const = 0;

    // MARK: Data access

    struct Read final
    {
        using Success = TypedValue;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Reads a data attribute (or a whole data object) with the given functional constraint.
    ///
    /// @param reference IEC 61850 object reference, like `D1/LLN0.Mod.stVal`.
    ///
    virtual SenderOf<Read::Result>::Ptr readAsync(const std::string&                               reference,
                                                  const FunctionalConstraint                       fc,
                                                  const cetl::optional<std::chrono::milliseconds> timeout) = 0;
    Read::Result read(const std::string& reference, const FunctionalConstraint fc);

    struct Write final
    {
        using Success = Done;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Writes a data attribute. The value must match the type discovered for the attribute.
    ///
    virtual SenderOf<Write::Result>::Ptr writeAsync(const std::string&                               reference,
                                                    const FunctionalConstraint                       fc,
                                                    TypedValue                                       value,
                                                    const cetl::optional<std::chrono::milliseconds> timeout) = 0;
    Write::Result write(const std::string& reference, const FunctionalConstraint fc, TypedValue value);

    /// Writes a data attribute whose functional constraint is either given as a `[FC]` suffix
    /// of the reference, or unique among the attributes of the discovered data object.
    ///
    virtual Write::Result write(const std::string& reference, TypedValue value) = 0;

    // MARK: Data model

    struct Browse final
    {
        using Success = std::vector<DataModelNode>;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Lists the direct children of a node (server when `path` is empty), discovering them if needed.
    ///
    virtual Browse::Result browse(const std::string& path) = 0;

    enum class Depth : std::uint8_t
    {
        Shallow,
        Full,
    };

    struct Discover final
    {
        using Success = DataModelNode;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Discovers the subtree rooted at `path` (the whole server when empty).
    ///
    /// `Shallow` walks only the node itself and its direct children; `Full` walks the whole subtree.
    ///
    virtual Discover::Result discover(const std::string& path, const Depth depth) = 0;

    /// Returns the (already discovered, or discovered now) node at `path`; fails with `PathNotFound`.
    ///
    virtual Discover::Result resolve(const std::string& path) = 0;

    // MARK: Control

    struct Control final
    {
        using Success = ControlResult;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Selects a select-before-operate (normal security) control object by reading its `SBO` attribute.
    ///
    virtual Control::Result controlSelect(const std::string& reference) = 0;

    /// Selects a select-before-operate (enhanced security) control object by writing its `SBOw` attribute.
    ///
    virtual Control::Result controlSelectWithValue(const std::string& reference, const ControlCommand& command) = 0;

    /// Operates a control object by writing its `Oper` attribute exactly once.
    ///
    /// Fails with `SelectionRequired` when the control model mandates selection and
    /// the server refused to operate because the object was not selected.
    ///
    virtual Control::Result controlOperate(const std::string&              reference,
                                           const ControlCommand&           command,
                                           const std::chrono::milliseconds timeout) = 0;

    /// Cancels a selection or a time activated operation by writing the `Cancel` attribute.
    ///
    virtual Control::Result controlCancel(const std::string& reference, const ControlCommand& command) = 0;

    /// Gets the latest control feedback received from the server (if any).
    ///
    CETL_NODISCARD virtual cetl::optional<LastApplError> lastApplError() const = 0;

    // MARK: Data sets

    using DataSetEntry = cetl::variant<TypedValue, DataAccessError>;

    struct ReadDataSet final
    {
        using Success = std::vector<DataSetEntry>;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Reads all members of a data set, e.g. `D1/LLN0.Events` (or `@Name` for VMD specific sets).
    ///
    virtual ReadDataSet::Result readDataSet(const std::string& reference) = 0;

    struct DataSetDirectory final
    {
        struct Success
        {
            bool                     deletable;
            std::vector<std::string> members;  // like `D1/LLN0.Mod.stVal[ST]`
        };
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    virtual DataSetDirectory::Result getDataSetDirectory(const std::string& reference) = 0;

    struct DataSetChange final
    {
        using Success = Done;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Creates a data set from member references (each with a `[FC]` suffix).
    ///
    virtual DataSetChange::Result createDataSet(const std::string&              reference,
                                                const std::vector<std::string>& members) = 0;
    virtual DataSetChange::Result deleteDataSet(const std::string& reference)           = 0;

    // MARK: Reporting

    struct GetReportControlBlock final
    {
        using Success = ReportControlBlock;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Reads all attributes of a report control block, e.g. `D1/LLN0.urcbA` (or `D1/LLN0.urcbA[RP]`).
    ///
    virtual GetReportControlBlock::Result getReportControlBlock(const std::string& reference) = 0;

    struct SetReportControlBlock final
    {
        using Success = Done;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Writes the given attributes of a report control block. Stops at the first failed write.
    ///
    virtual SetReportControlBlock::Result setReportControlBlock(const std::string&              reference,
                                                                const ReportControlBlockUpdate& update) = 0;

    /// Installs the handler of the reports with the given report id, replacing the previous one.
    ///
    /// An empty handler removes it. Reports without a handler are dropped.
    ///
    virtual void setReportHandler(const std::string& rpt_id, ReportHandler handler) = 0;

    // MARK: Server

    struct Identify final
    {
        struct Success
        {
            std::string vendor;
            std::string model;
            std::string revision;
        };
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    virtual Identify::Result identify() = 0;

    struct Status final
    {
        struct Success
        {
            std::int64_t logical;
            std::int64_t physical;
        };
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    virtual Status::Result status() = 0;

protected:
    Client() = default;

};  // Client

const char* toString(const Client::State state) noexcept;

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_CLIENT_HPP_INCLUDED
