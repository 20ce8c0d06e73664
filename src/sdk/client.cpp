//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iecmms/sdk/client.hpp"

#include "ber/ber_value.hpp"
#include "control_codec.hpp"
#include "discovery.hpp"
#include "io/tcp_channel.hpp"
#include "iso/iso_client.hpp"
#include "logging.hpp"
#include "mms/mms_types.hpp"
#include "mms/services.hpp"
#include "model/object_reference.hpp"
#include "model/type_descriptor.hpp"
#include "model/value_codec.hpp"
#include "report_codec.hpp"
#include "request_sender.hpp"
#include "sdk_factory.hpp"
#include "sdk_helpers.hpp"
#include "session/pending_table.hpp"
#include "session/session.hpp"

#include "iecmms/sdk/control.hpp"
#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/events.hpp"
#include "iecmms/sdk/execution.hpp"
#include "iecmms/sdk/report.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace sdk
{
namespace
{

using common::model::ObjectReference;
using common::session::Response;
using common::session::Session;

/// Resolved data attribute (or data object) of a read or write.
///
struct Target final
{
    ObjectReference      reference;
    FunctionalConstraint fc;
    TypeDescriptor::Ptr  type;
};

/// Per control object bookkeeping of this client.
///
struct ControlState final
{
    bool         selected{false};
    std::uint8_t ctl_num{0};
};

bool isSelectBeforeOperate(const ControlModel model)
{
    return (model == ControlModel::SboNormal) || (model == ControlModel::SboEnhanced);
}

Error asError(ObjectReference::Parse::Failure&& failure)
{
    return Error{std::move(failure)};
}

class ClientImpl final : public Client, public std::enable_shared_from_this<ClientImpl>
{
public:
    ClientImpl(ClientOptions options, Session::Ptr session)
        : options_{std::move(options)}
        , session_{std::move(session)}
        , logger_{common::getLogger("sdk")}
    {
        discovery_ = std::make_shared<Discovery>([this](const Service service, ber::BerValue request) {
            //
            return transact(service, std::move(request), options_.request_timeout);
        });

        session_->setUnconfirmedHandler([this](const ber::BerValue& pdu) {
            //
            onUnconfirmed(pdu);
        });
    }

    ClientImpl(ClientImpl&&)                 = delete;
    ClientImpl(const ClientImpl&)            = delete;
    ClientImpl& operator=(ClientImpl&&)      = delete;
    ClientImpl& operator=(const ClientImpl&) = delete;

    ~ClientImpl() override
    {
        session_->setUnconfirmedHandler(nullptr);
        session_->abort();
    }

    // MARK: Connection

    Connect::Result connect() override
    {
        return connect(options_.endpoint, options_.association_timeout);
    }

    Connect::Result connect(const std::string& endpoint, const std::chrono::milliseconds timeout) override
    {
        auto result = session_->connect(endpoint, timeout);
        if (cetl::get_if<Connect::Success>(&result) != nullptr)
        {
            discovery_->reset();

            const std::lock_guard<std::mutex> lock{mutex_};
            controls_.clear();
            last_appl_error_.reset();
        }
        return result;
    }

    Release::Result release() override
    {
        return session_->release(options_.request_timeout);
    }

    void abort() override
    {
        session_->abort();
    }

    State state() const override
    {
        return session_->state();
    }

    // MARK: Data access

    SenderOf<Read::Result>::Ptr readAsync(const std::string&                               reference,
                                          const FunctionalConstraint                       fc,
                                          const cetl::optional<std::chrono::milliseconds> timeout) override
    {
        std::weak_ptr<ClientImpl> weak_self = shared_from_this();
        const auto                effective = timeout.value_or(options_.request_timeout);
        return std::make_unique<RequestSender<Read::Result>>(  //
            Service::Read,
            session_,
            [weak_self, reference, fc, effective]() -> RequestSender<Read::Result>::Prepared {
                //
                if (auto self = weak_self.lock())
                {
                    return self->prepareRead(reference, fc, effective);
                }
                return Error{error::NotConnected{}};
            },
            logger_);
    }

    SenderOf<Write::Result>::Ptr writeAsync(const std::string&                               reference,
                                            const FunctionalConstraint                       fc,
                                            TypedValue                                       value,
                                            const cetl::optional<std::chrono::milliseconds> timeout) override
    {
        return makeWriteSender(reference, fc, std::move(value), timeout.value_or(options_.request_timeout));
    }

    Write::Result write(const std::string& reference, TypedValue value) override
    {
        return sync_wait<Write::Result>(
            makeWriteSender(reference, cetl::nullopt, std::move(value), options_.request_timeout));
    }

    // MARK: Data model

    Browse::Result browse(const std::string& path) override
    {
        return discovery_->browse(path);
    }

    Discover::Result discover(const std::string& path, const Depth depth) override
    {
        return discovery_->discover(path, depth);
    }

    Discover::Result resolve(const std::string& path) override
    {
        return discovery_->resolve(path);
    }

    // MARK: Control

    Control::Result controlSelect(const std::string& reference) override
    {
        auto prepared = prepareControl(reference);
        if (auto* const failure = cetl::get_if<Error>(&prepared))
        {
            return std::move(*failure);
        }
        const auto& control = cetl::get<ControlTarget>(prepared);
        if (control.model != ControlModel::SboNormal)
        {
            return error::TypeMismatch{fmt::format("'{}' is {}, select needs sbo-with-normal-security",
                                                   control.name,
                                                   toString(control.model))};
        }

        auto sbo_ref = control.reference;
        sbo_ref.names.push_back("SBO");
        const auto feedback_mark = feedbackCount();
        auto       sbo           = read(sbo_ref.toString(), FunctionalConstraint::CO);
        if (auto* const failure = cetl::get_if<Error>(&sbo))
        {
            return std::move(*failure);
        }

        const auto* const selected = cetl::get<TypedValue>(sbo).as<value::VisibleString>();
        if ((selected == nullptr) || selected->text.empty())
        {
            logger_->warn("Select of '{}' refused.", control.name);
            return error::SelectionRequired{control.name, addCauseSince(control, feedback_mark)};
        }

        const std::lock_guard<std::mutex> lock{mutex_};
        auto&                             state = controls_[control.name];
        state.selected                          = true;
        return ControlResult{control.name, control.model, state.ctl_num};
    }

    Control::Result controlSelectWithValue(const std::string& reference, const ControlCommand& command) override
    {
        auto prepared = prepareControl(reference);
        if (auto* const failure = cetl::get_if<Error>(&prepared))
        {
            return std::move(*failure);
        }
        const auto& control = cetl::get<ControlTarget>(prepared);
        if (control.model != ControlModel::SboEnhanced)
        {
            return error::TypeMismatch{fmt::format("'{}' is {}, select with value needs sbo-with-enhanced-security",
                                                   control.name,
                                                   toString(control.model))};
        }

        const auto ctl_num = currentCtlNum(control.name);
        auto       written = writeControl(control, "SBOw", command, ctl_num, options_.request_timeout);
        if (auto* const failure = cetl::get_if<Error>(&written))
        {
            return std::move(*failure);
        }

        const std::lock_guard<std::mutex> lock{mutex_};
        controls_[control.name].selected = true;
        return ControlResult{control.name, control.model, ctl_num};
    }

    Control::Result controlOperate(const std::string&              reference,
                                   const ControlCommand&           command,
                                   const std::chrono::milliseconds timeout) override
    {
        auto prepared = prepareControl(reference);
        if (auto* const failure = cetl::get_if<Error>(&prepared))
        {
            return std::move(*failure);
        }
        const auto& control = cetl::get<ControlTarget>(prepared);
        if (control.model == ControlModel::StatusOnly)
        {
            return error::TypeMismatch{fmt::format("'{}' is status-only", control.name)};
        }

        bool         was_selected = false;
        std::uint8_t ctl_num      = 0;
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            auto&                             state = controls_[control.name];
            was_selected                            = state.selected;
            ctl_num                                 = state.ctl_num++;
        }

        const auto feedback_mark = feedbackCount();
        auto       written       = writeControl(control, "Oper", command, ctl_num, timeout);
        if (auto* const failure = cetl::get_if<Error>(&written))
        {
            const auto* const access = cetl::get_if<error::DataAccess>(failure);
            if (isSelectBeforeOperate(control.model) && (access != nullptr))
            {
                const auto add_cause = addCauseSince(control, feedback_mark);
                const bool not_selected =
                    add_cause.has_value() &&
                    (*add_cause == static_cast<std::uint8_t>(ControlAddCause::ObjectNotSelected));
                // Other data access failures are returned as reported.
                const bool refused = !was_selected && (access->code == DataAccessError::ObjectAccessDenied);
                if (not_selected || refused)
                {
                    logger_->warn("Operate of '{}' refused, the object is not selected.", control.name);
                    setSelected(control.name, false);
                    return error::SelectionRequired{control.name, add_cause};
                }
            }
            return std::move(*failure);
        }

        setSelected(control.name, false);
        logger_->debug("Operated '{}' (model={}, ctl_num={}).", control.name, toString(control.model), ctl_num);
        return ControlResult{control.name, control.model, ctl_num};
    }

    Control::Result controlCancel(const std::string& reference, const ControlCommand& command) override
    {
        auto prepared = prepareControl(reference);
        if (auto* const failure = cetl::get_if<Error>(&prepared))
        {
            return std::move(*failure);
        }
        const auto& control = cetl::get<ControlTarget>(prepared);

        const auto ctl_num = currentCtlNum(control.name);
        auto       written = writeControl(control, "Cancel", command, ctl_num, options_.request_timeout);
        if (auto* const failure = cetl::get_if<Error>(&written))
        {
            return std::move(*failure);
        }

        setSelected(control.name, false);
        return ControlResult{control.name, control.model, ctl_num};
    }

    cetl::optional<LastApplError> lastApplError() const override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return last_appl_error_;
    }

    // MARK: Data sets

    ReadDataSet::Result readDataSet(const std::string& reference) override
    {
        auto name = common::model::parseDataSetReference(reference);
        if (auto* const failure = cetl::get_if<common::model::DataSetReference::Failure>(&name))
        {
            return Error{std::move(*failure)};
        }

        common::mms::ReadRequest request;
        request.access.list_name = cetl::get<common::mms::ObjectName>(name);

        auto response = transactAndParse<common::mms::ReadResponse>(  //
            makeTransact(),
            Service::Read,
            common::mms::buildReadRequest(request),
            common::mms::parseReadResponse);
        if (auto* const failure = cetl::get_if<Error>(&response))
        {
            return missingAsNotFound(std::move(*failure), reference);
        }

        ReadDataSet::Success entries;
        for (const auto& result : cetl::get<common::mms::ReadResponse>(response).results)
        {
            if (const auto* const code = cetl::get_if<DataAccessError>(&result))
            {
                entries.emplace_back(*code);
                continue;
            }
            auto decoded = common::model::decodeData(cetl::get<ber::BerValue>(result));
            if (auto* const failure = cetl::get_if<Error>(&decoded))
            {
                return std::move(*failure);
            }
            entries.emplace_back(cetl::get<TypedValue>(std::move(decoded)));
        }
        return entries;
    }

    DataSetDirectory::Result getDataSetDirectory(const std::string& reference) override
    {
        auto name = common::model::parseDataSetReference(reference);
        if (auto* const failure = cetl::get_if<common::model::DataSetReference::Failure>(&name))
        {
            return Error{std::move(*failure)};
        }

        auto response = transactAndParse<common::mms::GetNamedVariableListAttributesResponse>(  //
            makeTransact(),
            Service::GetNamedVariableListAttributes,
            common::mms::buildGetNamedVariableListAttributesRequest(cetl::get<common::mms::ObjectName>(name)),
            common::mms::parseGetNamedVariableListAttributesResponse);
        if (auto* const failure = cetl::get_if<Error>(&response))
        {
            return missingAsNotFound(std::move(*failure), reference);
        }
        const auto& attributes = cetl::get<common::mms::GetNamedVariableListAttributesResponse>(response);

        DataSetDirectory::Success directory{attributes.deletable, {}};
        directory.members.reserve(attributes.members.size());
        for (const auto& member : attributes.members)
        {
            if (const auto member_ref = ObjectReference::fromMmsName(member))
            {
                directory.members.push_back(member_ref->toString());
            }
            else if (member.scope == common::mms::ObjectName::Scope::DomainSpecific)
            {
                directory.members.push_back(member.domain + '/' + member.item);
            }
            else
            {
                directory.members.push_back('@' + member.item);
            }
        }
        return directory;
    }

    DataSetChange::Result createDataSet(const std::string&              reference,
                                        const std::vector<std::string>& members) override
    {
        auto name = common::model::parseDataSetReference(reference);
        if (auto* const failure = cetl::get_if<common::model::DataSetReference::Failure>(&name))
        {
            return Error{std::move(*failure)};
        }

        common::mms::DefineNamedVariableListRequest request;
        request.name = cetl::get<common::mms::ObjectName>(name);
        for (const auto& member : members)
        {
            auto parsed = ObjectReference::parse(member);
            if (auto* const failure = cetl::get_if<ObjectReference::Parse::Failure>(&parsed))
            {
                return asError(std::move(*failure));
            }
            const auto& member_ref = cetl::get<ObjectReference>(parsed);
            if (!member_ref.fc.has_value() || member_ref.logical_node.empty())
            {
                return error::PathNotFound{member};
            }
            request.members.push_back(member_ref.toMmsName(*member_ref.fc));
        }

        auto reply = transact(Service::DefineNamedVariableList,
                              common::mms::buildDefineNamedVariableListRequest(request),
                              options_.request_timeout);
        if (auto* const failure = cetl::get_if<Error>(&reply.response))
        {
            return std::move(*failure);
        }
        logger_->info("Created data set '{}' ({} members).", reference, members.size());
        return Done{};
    }

    DataSetChange::Result deleteDataSet(const std::string& reference) override
    {
        auto name = common::model::parseDataSetReference(reference);
        if (auto* const failure = cetl::get_if<common::model::DataSetReference::Failure>(&name))
        {
            return Error{std::move(*failure)};
        }

        const auto& list_name = cetl::get<common::mms::ObjectName>(name);
        auto        reply     = transact(Service::DeleteNamedVariableList,
                                         common::mms::buildDeleteNamedVariableListRequest(list_name),
                                         options_.request_timeout);
        if (auto* const failure = cetl::get_if<Error>(&reply.response))
        {
            return missingAsNotFound(std::move(*failure), reference);
        }
        auto deleted = fromParsed(
            common::mms::parseDeleteNamedVariableListResponse(cetl::get<ber::BerValue>(reply.response)));
        if (auto* const failure = cetl::get_if<Error>(&deleted))
        {
            return std::move(*failure);
        }

        const auto& counts = cetl::get<common::mms::DeleteNamedVariableListResponse>(deleted);
        if (counts.matched == 0)
        {
            return error::PathNotFound{reference};
        }
        if (counts.deleted == 0)
        {
            return error::DataAccess{DataAccessError::ObjectAccessDenied,
                                     Service::DeleteNamedVariableList,
                                     reply.invoke_id,
                                     0};
        }
        logger_->info("Deleted data set '{}'.", reference);
        return Done{};
    }

    // MARK: Reporting

    GetReportControlBlock::Result getReportControlBlock(const std::string& reference) override
    {
        auto resolved = resolveReportControl(reference);
        if (auto* const failure = cetl::get_if<Error>(&resolved))
        {
            return std::move(*failure);
        }
        const auto& target  = cetl::get<Target>(resolved);
        auto        rcb_ref = target.reference.toString();

        auto rcb = read(rcb_ref, target.fc);
        if (auto* const failure = cetl::get_if<Error>(&rcb))
        {
            return std::move(*failure);
        }
        return parseReportControlBlock(std::move(rcb_ref),
                                       target.fc == FunctionalConstraint::BR,
                                       cetl::get<TypedValue>(rcb));
    }

    SetReportControlBlock::Result setReportControlBlock(const std::string&              reference,
                                                        const ReportControlBlockUpdate& update) override
    {
        auto resolved = resolveReportControl(reference);
        if (auto* const failure = cetl::get_if<Error>(&resolved))
        {
            return std::move(*failure);
        }
        const auto& target = cetl::get<Target>(resolved);

        auto writes = buildReportControlWrites(*target.type, update);
        if (auto* const failure = cetl::get_if<Error>(&writes))
        {
            return std::move(*failure);
        }
        const auto& elements = cetl::get<std::vector<ReportControlWrite>>(writes);
        for (const auto& element : elements)
        {
            Target element_target{target.reference, target.fc, target.type->findComponent(element.name)->type};
            element_target.reference.names.push_back(element.name);

            auto written = writeTarget(std::move(element_target), element.value, options_.request_timeout);
            if (auto* const failure = cetl::get_if<Error>(&written))
            {
                logger_->warn("Setting '{}' of '{}' failed: {}.", element.name, reference, describe(*failure));
                return std::move(*failure);
            }
        }
        logger_->info("Updated report control block '{}' ({} attributes).", reference, elements.size());
        return Done{};
    }

    void setReportHandler(const std::string& rpt_id, ReportHandler handler) override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        if (handler)
        {
            report_handlers_[rpt_id] = std::move(handler);
        }
        else
        {
            report_handlers_.erase(rpt_id);
        }
    }

    // MARK: Server

    Identify::Result identify() override
    {
        auto response = transactAndParse<common::mms::IdentifyResponse>(  //
            makeTransact(),
            Service::Identify,
            common::mms::buildIdentifyRequest(),
            common::mms::parseIdentifyResponse);
        if (auto* const failure = cetl::get_if<Error>(&response))
        {
            return std::move(*failure);
        }
        auto& identity = cetl::get<common::mms::IdentifyResponse>(response);
        return Identify::Success{std::move(identity.vendor), std::move(identity.model), std::move(identity.revision)};
    }

    Status::Result status() override
    {
        auto response = transactAndParse<common::mms::StatusResponse>(  //
            makeTransact(),
            Service::Status,
            common::mms::buildStatusRequest(),
            common::mms::parseStatusResponse);
        if (auto* const failure = cetl::get_if<Error>(&response))
        {
            return std::move(*failure);
        }
        const auto& server_status = cetl::get<common::mms::StatusResponse>(response);
        return Status::Success{server_status.logical, server_status.physical};
    }

private:
    struct ControlTarget final
    {
        ObjectReference     reference;  // the controllable data object (without FC)
        std::string         name;       // canonical reference, like `D1/CSWI1.Pos`
        TypeDescriptor::Ptr ln_type;
        ControlModel        model;
    };

    Reply transact(const Service service, ber::BerValue request, const std::chrono::milliseconds timeout)
    {
        auto state    = std::make_shared<detail::StateOf<Reply>>();
        auto receiver = state->makeReceiver();

        auto sent = session_->sendRequest(  //
            service,
            std::move(request),
            timeout,
            [receiver](const std::uint32_t invoke_id, Response&& response) mutable {
                //
                receiver(Reply{invoke_id, std::move(response)});
            });
        if (auto* const failure = cetl::get_if<Session::Send::Failure>(&sent))
        {
            return Reply{0, std::move(*failure)};
        }

        state->wait();
        return state->get();
    }

    Transact makeTransact()
    {
        return [this](const Service service, ber::BerValue request) {
            //
            return transact(service, std::move(request), options_.request_timeout);
        };
    }

    static Error missingAsNotFound(Error&& failure, const std::string& reference)
    {
        if (isMissingObject(failure))
        {
            return error::PathNotFound{reference};
        }
        return std::move(failure);
    }

    /// Resolves a data attribute reference against the discovered type of its logical node.
    ///
    /// Without an explicit functional constraint (neither argument nor `[FC]` suffix)
    /// the attribute must exist under exactly one of them.
    ///
    Outcome<Target> resolveTarget(const std::string& reference, cetl::optional<FunctionalConstraint> fc)
    {
        auto parsed = ObjectReference::parse(reference);
        if (auto* const failure = cetl::get_if<ObjectReference::Parse::Failure>(&parsed))
        {
            return asError(std::move(*failure));
        }
        auto& ref = cetl::get<ObjectReference>(parsed);
        if (ref.logical_node.empty() || ref.names.empty())
        {
            return error::PathNotFound{reference};
        }
        if (ref.fc.has_value())
        {
            if (fc.has_value() && (*fc != *ref.fc))
            {
                return error::PathNotFound{reference};
            }
            fc = ref.fc;
        }

        auto ln_type = discovery_->logicalNodeType(ref.logical_device, ref.logical_node);
        if (auto* const failure = cetl::get_if<Error>(&ln_type))
        {
            if (cetl::get_if<error::PathNotFound>(failure) != nullptr)
            {
                return error::PathNotFound{reference};
            }
            return std::move(*failure);
        }
        const auto& type = cetl::get<TypeDescriptor::Ptr>(ln_type);

        if (!fc.has_value())
        {
            const auto candidates = common::model::functionalConstraintsOf(type, ref.names);
            if (candidates.size() != 1)
            {
                logger_->debug("'{}' exists under {} functional constraints.", reference, candidates.size());
                return error::PathNotFound{reference};
            }
            fc = candidates.front();
        }

        auto descriptor = common::model::findDescriptor(type, *fc, ref.names);
        if (!descriptor)
        {
            return error::PathNotFound{reference};
        }
        ref.fc = fc;
        return Target{std::move(ref), *fc, std::move(descriptor)};
    }

    RequestSender<Read::Result>::Prepared prepareRead(const std::string&              reference,
                                                      const FunctionalConstraint      fc,
                                                      const std::chrono::milliseconds timeout)
    {
        auto resolved = resolveTarget(reference, fc);
        if (auto* const failure = cetl::get_if<Error>(&resolved))
        {
            return std::move(*failure);
        }
        auto& target = cetl::get<Target>(resolved);

        common::mms::ReadRequest request;
        request.access.variables.push_back(target.reference.toMmsName(target.fc));

        std::weak_ptr<Discovery> weak_discovery = discovery_;
        return PreparedRequest<Read::Result>{
            Service::Read,
            common::mms::buildReadRequest(request),
            timeout,
            [target, weak_discovery](const std::uint32_t invoke_id, const ber::BerValue& response) -> Read::Result {
                //
                auto read = fromParsed(common::mms::parseReadResponse(response));
                if (auto* const failure = cetl::get_if<Error>(&read))
                {
                    return std::move(*failure);
                }
                const auto& results = cetl::get<common::mms::ReadResponse>(read).results;
                if (results.size() != 1)
                {
                    return error::MalformedEncoding{fmt::format("{} read results for 1 variable", results.size())};
                }
                if (const auto* const code = cetl::get_if<DataAccessError>(&results.front()))
                {
                    return error::DataAccess{*code, Service::Read, invoke_id, 0};
                }

                auto decoded = common::model::decodeValue(*target.type, cetl::get<ber::BerValue>(results.front()));
                if (auto* const failure = cetl::get_if<Error>(&decoded))
                {
                    return std::move(*failure);
                }
                auto& value = cetl::get<TypedValue>(decoded);
                if (auto discovery = weak_discovery.lock())
                {
                    discovery->storeValue(target.reference, target.fc, value);
                }
                return std::move(value);
            }};
    }

    SenderOf<Write::Result>::Ptr makeWriteSender(const std::string&                   reference,
                                                 cetl::optional<FunctionalConstraint> fc,
                                                 TypedValue                           value,
                                                 const std::chrono::milliseconds      timeout)
    {
        std::weak_ptr<ClientImpl> weak_self = shared_from_this();
        return std::make_unique<RequestSender<Write::Result>>(  //
            Service::Write,
            session_,
            [weak_self, reference, fc, value, timeout]() -> RequestSender<Write::Result>::Prepared {
                //
                auto self = weak_self.lock();
                if (!self)
                {
                    return Error{error::NotConnected{}};
                }
                auto resolved = self->resolveTarget(reference, fc);
                if (auto* const failure = cetl::get_if<Error>(&resolved))
                {
                    return std::move(*failure);
                }
                return self->prepareWrite(cetl::get<Target>(std::move(resolved)), value, timeout);
            },
            logger_);
    }

    RequestSender<Write::Result>::Prepared prepareWrite(Target                          target,
                                                        const TypedValue&               value,
                                                        const std::chrono::milliseconds timeout)
    {
        auto encoded = common::model::encodeValue(*target.type, value);
        if (auto* const failure = cetl::get_if<common::model::EncodeValue::Failure>(&encoded))
        {
            return Error{std::move(*failure)};
        }

        common::mms::WriteRequest request;
        request.variables.push_back(target.reference.toMmsName(target.fc));
        request.data.push_back(cetl::get<ber::BerValue>(std::move(encoded)));

        std::weak_ptr<Discovery> weak_discovery = discovery_;
        return PreparedRequest<Write::Result>{
            Service::Write,
            common::mms::buildWriteRequest(request),
            timeout,
            [target, value, weak_discovery](const std::uint32_t   invoke_id,
                                            const ber::BerValue& response) -> Write::Result {
                //
                auto written = fromParsed(common::mms::parseWriteResponse(response));
                if (auto* const failure = cetl::get_if<Error>(&written))
                {
                    return std::move(*failure);
                }
                const auto& results = cetl::get<common::mms::WriteResponse>(written).results;
                if (results.size() != 1)
                {
                    return error::MalformedEncoding{fmt::format("{} write results for 1 variable", results.size())};
                }
                if (results.front().has_value())
                {
                    return error::DataAccess{*results.front(), Service::Write, invoke_id, 0};
                }
                if (auto discovery = weak_discovery.lock())
                {
                    discovery->storeValue(target.reference, target.fc, value);
                }
                return Done{};
            }};
    }

    Outcome<ControlTarget> prepareControl(const std::string& reference)
    {
        auto parsed = ObjectReference::parse(reference);
        if (auto* const failure = cetl::get_if<ObjectReference::Parse::Failure>(&parsed))
        {
            return asError(std::move(*failure));
        }
        auto& ref = cetl::get<ObjectReference>(parsed);
        ref.fc    = cetl::nullopt;
        if (ref.logical_node.empty() || ref.names.empty())
        {
            return error::PathNotFound{reference};
        }

        auto ln_type = discovery_->logicalNodeType(ref.logical_device, ref.logical_node);
        if (auto* const failure = cetl::get_if<Error>(&ln_type))
        {
            return std::move(*failure);
        }

        auto ctl_model_ref = ref;
        ctl_model_ref.names.push_back("ctlModel");
        auto ctl_model = read(ctl_model_ref.toString(), FunctionalConstraint::CF);
        if (auto* const failure = cetl::get_if<Error>(&ctl_model))
        {
            return std::move(*failure);
        }

        const auto&  model_value = cetl::get<TypedValue>(ctl_model);
        std::int64_t model       = -1;
        if (const auto* const integer = model_value.as<value::Integer>())
        {
            model = integer->value;
        }
        else if (const auto* const natural = model_value.as<value::Unsigned>())
        {
            model = static_cast<std::int64_t>(natural->value);
        }
        if ((model < 0) || (model > static_cast<std::int64_t>(ControlModel::SboEnhanced)))
        {
            return error::TypeMismatch{fmt::format("unexpected ctlModel {}", model_value.toString())};
        }

        auto name = ref.toString();
        return ControlTarget{std::move(ref),
                             std::move(name),
                             cetl::get<TypeDescriptor::Ptr>(std::move(ln_type)),
                             static_cast<ControlModel>(model)};
    }

    /// Writes one of the `CO` attributes of a control object (`Oper`, `SBOw` or `Cancel`) exactly once.
    ///
    Write::Result writeControl(const ControlTarget&            control,
                               const char* const               attribute,
                               const ControlCommand&           command,
                               const std::uint8_t              ctl_num,
                               const std::chrono::milliseconds timeout)
    {
        Target target{control.reference, FunctionalConstraint::CO, nullptr};
        target.reference.names.push_back(attribute);
        target.reference.fc = FunctionalConstraint::CO;
        target.type         = common::model::findDescriptor(control.ln_type, target.fc, target.reference.names);
        if (!target.type)
        {
            return error::PathNotFound{target.reference.toString()};
        }

        auto built = buildControlValue(*target.type, command, ctl_num, toUtcTime(std::chrono::system_clock::now()));
        if (auto* const failure = cetl::get_if<Error>(&built))
        {
            return std::move(*failure);
        }

        return writeTarget(std::move(target), cetl::get<TypedValue>(built), timeout);
    }

    /// Writes an already resolved attribute exactly once.
    ///
    Write::Result writeTarget(Target target, const TypedValue& value, const std::chrono::milliseconds timeout)
    {
        auto prepared = prepareWrite(std::move(target), value, timeout);
        return sync_wait<Write::Result>(std::make_unique<RequestSender<Write::Result>>(  //
            Service::Write,
            session_,
            [&prepared]() { return std::move(prepared); },
            logger_));
    }

    /// Resolves a report control block: an `RP` or `BR` structure directly under its logical node.
    ///
    Outcome<Target> resolveReportControl(const std::string& reference)
    {
        auto resolved = resolveTarget(reference, cetl::nullopt);
        if (auto* const failure = cetl::get_if<Error>(&resolved))
        {
            return std::move(*failure);
        }
        auto&      target     = cetl::get<Target>(resolved);
        const bool is_control = (target.fc == FunctionalConstraint::RP) || (target.fc == FunctionalConstraint::BR);
        if (!is_control || (target.reference.names.size() != 1) || (target.type->kind != TypeKind::Structure))
        {
            return error::TypeMismatch{fmt::format("'{}' is not a report control block", reference)};
        }
        return std::move(target);
    }

    std::uint64_t feedbackCount() const
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return feedback_count_;
    }

    /// Gets the `AddCause` of control feedback about the object received after the given mark (if any).
    ///
    cetl::optional<std::uint8_t> addCauseSince(const ControlTarget& control, const std::uint64_t mark) const
    {
        const auto object_name = controlObjectName(control.reference.logical_device,
                                                   control.reference.logical_node,
                                                   control.reference.names);

        const std::lock_guard<std::mutex> lock{mutex_};
        if ((feedback_count_ == mark) || !last_appl_error_.has_value() ||
            (last_appl_error_->control_object.compare(0, object_name.size(), object_name) != 0))
        {
            return cetl::nullopt;
        }
        return static_cast<std::uint8_t>(last_appl_error_->add_cause);
    }

    std::uint8_t currentCtlNum(const std::string& name)
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return controls_[name].ctl_num;
    }

    void setSelected(const std::string& name, const bool selected)
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        controls_[name].selected = selected;
    }

    void onUnconfirmed(const ber::BerValue& pdu)
    {
        auto report = common::mms::parseInformationReport(pdu);
        if (const auto* const malformed = cetl::get_if<error::MalformedEncoding>(&report))
        {
            logger_->debug("Ignoring unconfirmed PDU ({}).", malformed->detail);
            return;
        }

        const auto& information = cetl::get<common::mms::InformationReport>(report);
        if (isReport(information))
        {
            onReport(information);
            return;
        }

        auto feedback = parseLastApplError(information);
        if (!feedback.has_value())
        {
            logger_->trace("Ignoring information report.");
            return;
        }

        logger_->info("LastApplError: object='{}', error={}, add_cause={}, ctl_num={}.",
                      feedback->control_object,
                      feedback->error,
                      toString(feedback->add_cause),
                      feedback->ctl_num);

        const std::lock_guard<std::mutex> lock{mutex_};
        last_appl_error_ = std::move(*feedback);
        ++feedback_count_;
    }

    void onReport(const common::mms::InformationReport& information)
    {
        auto parsed = parseReport(information);
        if (const auto* const failure = cetl::get_if<Error>(&parsed))
        {
            logger_->warn("Ignoring malformed report ({}).", describe(*failure));
            return;
        }
        const auto& report = cetl::get<Report>(parsed);

        ReportHandler handler;
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            const auto                        it = report_handlers_.find(report.rpt_id);
            if (it == report_handlers_.end())
            {
                logger_->debug("Dropping report '{}' without a handler.", report.rpt_id);
                return;
            }
            handler = it->second;
        }
        logger_->trace("Report '{}' with {} entries.", report.rpt_id, report.entries.size());
        handler(report);
    }

    const ClientOptions                  options_;
    const Session::Ptr                   session_;
    common::LoggerPtr                    logger_;
    std::shared_ptr<Discovery>           discovery_;
    mutable std::mutex                   mutex_;
    std::map<std::string, ControlState>  controls_;
    cetl::optional<LastApplError>        last_appl_error_;
    std::uint64_t                        feedback_count_{0};
    std::map<std::string, ReportHandler> report_handlers_;

};  // ClientImpl

}  // namespace

CETL_NODISCARD Client::Ptr Client::make(ClientOptions options, EventSink::Ptr event_sink)
{
    if (!event_sink)
    {
        event_sink = EventSink::makeLogging();
    }
    auto session = Session::make(
        options,
        [] {
            //
            return common::iso::IsoClient::make(common::io::TcpChannel::make());
        },
        std::move(event_sink));

    return Factory::makeClient(std::move(options), std::move(session));
}

Client::Read::Result Client::read(const std::string& reference, const FunctionalConstraint fc)
{
    return sync_wait<Read::Result>(readAsync(reference, fc, cetl::nullopt));
}

Client::Write::Result Client::write(const std::string& reference, const FunctionalConstraint fc, TypedValue value)
{
    return sync_wait<Write::Result>(writeAsync(reference, fc, std::move(value), cetl::nullopt));
}

const char* toString(const Client::State state) noexcept
{
    switch (state)
    {
    case Client::State::Disconnected:
        return "disconnected";
    case Client::State::Connecting:
        return "connecting";
    case Client::State::Associated:
        return "associated";
    default:
        return "?";
    }
}

CETL_NODISCARD Client::Ptr Factory::makeClient(ClientOptions options, common::session::Session::Ptr session)
{
    return std::make_shared<ClientImpl>(std::move(options), std::move(session));
}

}  // namespace sdk
}  // namespace iecmms
