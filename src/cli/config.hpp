//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_CLI_CONFIG_HPP_INCLUDED
#define IECMMS_CLI_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace iecmms
{
namespace cli
{

/// Read-only view of the `iecmms-cli` TOML configuration file.
///
/// ```toml
/// [connection]
/// endpoint = "192.168.1.10:102"
/// association_timeout_ms = 10000
/// request_timeout_ms = 5000
/// max_pending_requests = 16
/// password = ""
///
/// [logging]
/// file = "./iecmms-cli.log"
/// level = "info,session=debug"
/// flush_level = "warn"
/// ```
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Parses the given file. Throws on syntax errors (toml11 exceptions).
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    /// Makes a configuration without any entries (all getters return defaults).
    ///
    CETL_NODISCARD static Ptr makeEmpty();

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getEndpoint() const -> cetl::optional<std::string>                = 0;
    CETL_NODISCARD virtual auto getAssociationTimeoutMs() const -> cetl::optional<std::int64_t>  = 0;
    CETL_NODISCARD virtual auto getRequestTimeoutMs() const -> cetl::optional<std::int64_t>      = 0;
    CETL_NODISCARD virtual auto getMaxPendingRequests() const -> cetl::optional<std::int64_t>    = 0;
    CETL_NODISCARD virtual auto getPassword() const -> cetl::optional<std::string>                = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>             = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>            = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string>       = 0;

protected:
    Config() = default;

};  // Config

}  // namespace cli
}  // namespace iecmms

#endif  // IECMMS_CLI_CONFIG_HPP_INCLUDED
