/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-message-pb-util.hpp
 * @brief Setters and JSON codec for the MessagePb envelope.
 *
 * The macros are thin wrappers over the generated protobuf setters of
 * proto/gsn-message.proto and keep the protocol handler free of
 * mutable_body() chains. The functions convert between MessagePb and the
 * newline free JSON text carried by the transport, and between the JSON value
 * of a broadcast and Gsn_Value, the canonical JSON text the core stores.
 *
 * Canonical text is what protobuf prints for a google.protobuf.Value, so two
 * values are equal exactly when their JSON values are equal: 5 and 5.0 both
 * become "5", "abc" becomes "\"abc\"". Numbers travel as doubles, integers
 * beyond 2^53 lose precision.
 */

#ifndef GSN_MESSAGE_PB_UTIL_HPP_
#define GSN_MESSAGE_PB_UTIL_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proto/gsn-message.pb.h"

#define GSN_MESSAGE_PB_SET_SRC(pb, val) ((pb).set_src((val)))

#define GSN_MESSAGE_PB_SET_DEST(pb, val) ((pb).set_dest((val)))

#define GSN_MESSAGE_PB_SET_TYPE(pb, val) ((pb).mutable_body()->set_type((val)))

#define GSN_MESSAGE_PB_SET_MSG_ID(pb, val)                                     \
  ((pb).mutable_body()->set_msg_id((val)))

#define GSN_MESSAGE_PB_SET_IN_REPLY_TO(pb, val)                                \
  ((pb).mutable_body()->set_in_reply_to((val)))

#define GSN_MESSAGE_PB_SET_ERROR(pb, error_code, error_text)                   \
  do {                                                                         \
    GSN_MESSAGE_PB_SET_TYPE(pb, "error");                                      \
    (pb).mutable_body()->set_code(static_cast<std::uint32_t>((error_code)));   \
    (pb).mutable_body()->set_text((error_text));                               \
  } while (false)

namespace gsn {

using Gsn_Value = std::string;

/**
 * Error codes of the harness protocol carried in an error body.
 */
enum class Gsn_ErrorCode : std::uint32_t {
  kTimeout = 0,
  kNotSupported = 10,
  kTemporarilyUnavailable = 11,
  kMalformedRequest = 12,
  kCrash = 13,
  kAbort = 14,
  kKeyDoesNotExist = 20,
  kKeyAlreadyExists = 21,
  kPreconditionFailed = 22,
  kTxnConflict = 30,
};

/**
 * @brief Parse one line of JSON into a MessagePb. Unknown fields are ignored.
 *
 * @return The envelope, or std::nullopt if the text is not a JSON envelope.
 */
auto decodeMessagePb(std::string_view line) -> std::optional<gsn::MessagePb>;

/**
 * @brief Whether json holds an integer literal that a double, the number type
 *        of google.protobuf.Value, can not represent exactly. Such a number
 *        would be decoded as a neighboring value (9007199254740993 becomes
 *        9007199254740992), so requests carrying one are refused. Text inside
 *        strings is not looked at.
 */
auto hasInexactInteger(std::string_view json) -> bool;

/**
 * @brief Print a MessagePb as one line of JSON with original field names.
 *
 * @throws std::runtime_error if protobuf refuses to print the message.
 */
auto encodeMessagePb(const gsn::MessagePb &pb) -> std::string;

/**
 * @brief Canonical text of a JSON value.
 *
 * @throws std::runtime_error if the value holds no kind.
 */
auto valuePbToValue(const google::protobuf::Value &value_pb) -> Gsn_Value;

/**
 * @brief Inverse of valuePbToValue().
 *
 * @throws std::runtime_error if value is not JSON text.
 */
auto valueToValuePb(const Gsn_Value &value) -> google::protobuf::Value;

/**
 * @brief Values carried by a body: message followed by every element of
 *        messages. Elements without a kind are skipped.
 */
auto messageBodyValues(const gsn::MessageBodyPb &body)
    -> std::vector<Gsn_Value>;

/**
 * @brief Store values in a body, a single value as message, otherwise (or
 *        always when as_list is set) as the messages array.
 */
void setMessageBodyValues(gsn::MessageBodyPb *body,
                          const std::vector<Gsn_Value> &values,
                          bool as_list = false);

} // namespace gsn

#endif // GSN_MESSAGE_PB_UTIL_HPP_
