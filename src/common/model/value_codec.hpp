//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_MODEL_VALUE_CODEC_HPP_INCLUDED
#define IECMMS_COMMON_MODEL_VALUE_CODEC_HPP_INCLUDED

#include "ber/ber_value.hpp"

#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

namespace iecmms
{
namespace common
{
namespace model
{

struct DecodeValue
{
    using Success = sdk::TypedValue;
    using Failure = sdk::Error;  // `MalformedEncoding` or `TypeMismatch`
    using Var     = cetl::variant<Success, Failure>;
};

struct EncodeValue
{
    using Success = ber::BerValue;
    using Failure = sdk::error::TypeMismatch;
    using Var     = cetl::variant<Success, Failure>;
};

/// Converts an MMS `Data` element into a typed value, checking it against the discovered type.
///
/// Structure members get the component names of the descriptor.
///
DecodeValue::Var decodeValue(const sdk::TypeDescriptor& descriptor, const ber::BerValue& data);

/// Converts a typed value into an MMS `Data` element of the discovered type.
///
/// Fails if the alternative does not match the descriptor kind, or if the value does not fit it
/// (structure arity or member names, array length, integer range, bit string size, string length).
///
EncodeValue::Var encodeValue(const sdk::TypeDescriptor& descriptor, const sdk::TypedValue& value);

/// Converts an MMS `Data` element without a descriptor (for data set members and reports).
///
DecodeValue::Var decodeData(const ber::BerValue& data);

/// Converts a typed value into an MMS `Data` element without a descriptor.
///
ber::BerValue encodeData(const sdk::TypedValue& value);

}  // namespace model
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_MODEL_VALUE_CODEC_HPP_INCLUDED
