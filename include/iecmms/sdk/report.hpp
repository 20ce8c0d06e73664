//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_REPORT_HPP_INCLUDED
#define IECMMS_SDK_REPORT_HPP_INCLUDED

#include "typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace iecmms
{
namespace sdk
{

/// Bits of the `OptFlds` attribute of a report control block, and of the received reports.
///
struct ReportOptions final
{
    enum : std::uint16_t
    {
        SeqNum             = 1U << 0U,
        TimeStamp          = 1U << 1U,
        ReasonForInclusion = 1U << 2U,
        DataSet            = 1U << 3U,
        DataReference      = 1U << 4U,
        BufferOverflow     = 1U << 5U,
        EntryId            = 1U << 6U,
        ConfRev            = 1U << 7U,
        Segmentation       = 1U << 8U,
    };
};

/// Bits of the `TrgOps` attribute of a report control block.
///
struct TriggerOptions final
{
    enum : std::uint8_t
    {
        DataChanged          = 1U << 0U,
        QualityChanged       = 1U << 1U,
        DataUpdate           = 1U << 2U,
        Integrity            = 1U << 3U,
        GeneralInterrogation = 1U << 4U,
    };
};

/// Bits of the reason code of a reported data set member.
///
struct ReasonForInclusion final
{
    enum : std::uint8_t
    {
        DataChange           = 1U << 0U,
        QualityChange        = 1U << 1U,
        DataUpdate           = 1U << 2U,
        Integrity            = 1U << 3U,
        GeneralInterrogation = 1U << 4U,
        ApplicationTrigger   = 1U << 5U,
    };
};

/// Current attributes of a buffered (`BR`) or unbuffered (`RP`) report control block.
///
struct ReportControlBlock final
{
    std::string reference;  // like `D1/LLN0.urcbA[RP]`
    bool        buffered{false};

    std::string   rpt_id;
    bool          rpt_ena{false};
    std::string   data_set;  // like `D1/LLN0.Events`, empty when unset
    std::uint32_t conf_rev{0};
    std::uint16_t opt_flds{0};
    std::uint32_t buf_tm{0};
    std::uint32_t sq_num{0};
    std::uint8_t  trg_ops{0};
    std::uint32_t intg_pd{0};
    bool          gi{false};

    /// Unbuffered control blocks only.
    cetl::optional<bool> resv;

    /// Buffered control blocks only.
    cetl::optional<bool>                      purge_buf;
    cetl::optional<std::vector<std::uint8_t>> entry_id;

};  // ReportControlBlock

/// Attributes to change in a report control block; only the given ones are written.
///
/// They are written one by one in a fixed order, with `RptEna` and then `GI` last,
/// so a single update can configure and enable the control block.
///
struct ReportControlBlockUpdate final
{
    cetl::optional<bool>                      resv;
    cetl::optional<std::string>               rpt_id;
    cetl::optional<std::string>               data_set;
    cetl::optional<std::vector<std::uint8_t>> entry_id;
    cetl::optional<std::uint16_t>             opt_flds;
    cetl::optional<std::uint32_t>             buf_tm;
    cetl::optional<std::uint8_t>              trg_ops;
    cetl::optional<std::uint32_t>             intg_pd;
    cetl::optional<bool>                      purge_buf;
    cetl::optional<bool>                      rpt_ena;
    cetl::optional<bool>                      gi;

};  // ReportControlBlockUpdate

/// Report received from the server. Optional fields are present as selected by `opt_flds`.
///
struct Report final
{
    struct Entry final
    {
        /// Position of the member in the data set.
        std::size_t index{0};

        cetl::optional<std::string> data_reference;
        TypedValue                  value;

        /// `ReasonForInclusion` bits (zero when the report carries no reason codes).
        std::uint8_t reason{0};
    };

    std::string   rpt_id;
    std::uint16_t opt_flds{0};

    cetl::optional<std::uint32_t>             seq_num;
    cetl::optional<std::uint64_t>             time_of_entry_ms;  // since the Unix epoch
    cetl::optional<std::string>               data_set;
    cetl::optional<bool>                      buffer_overflow;
    cetl::optional<std::vector<std::uint8_t>> entry_id;
    cetl::optional<std::uint32_t>             conf_rev;
    cetl::optional<std::uint32_t>             sub_seq_num;
    bool                                      more_segments_follow{false};

    std::vector<Entry> entries;

};  // Report

/// Receives the reports of one report id.
///
/// Called on the connection reader thread: it must return quickly, and must not wait for
/// other requests of the same client.
///
using ReportHandler = std::function<void(const Report& report)>;

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_REPORT_HPP_INCLUDED
