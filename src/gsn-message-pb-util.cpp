/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-message-pb-util.cpp
 * @brief JSON codec for MessagePb built on protobuf's JSON mapping.
 */

#include "gsn-message-pb-util.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "proto/gsn-message.pb.h"

namespace gsn {

namespace {

auto jsonParseOptions() -> google::protobuf::util::JsonParseOptions {
  google::protobuf::util::JsonParseOptions options{};

  // the harness adds fields of its own (e.g. a top level "id")
  options.ignore_unknown_fields = true;

  return options;
}

auto jsonPrintOptions() -> google::protobuf::util::JsonPrintOptions {
  google::protobuf::util::JsonPrintOptions options{};

  options.add_whitespace = false;
  options.preserve_proto_field_names = true;

  return options;
}

// every integer up to 2^53 has an exact double
constexpr std::uint64_t kMaxExactInteger = 1ULL << 53;

auto isDigit(char c) -> bool {
  return 0 != std::isdigit(static_cast<unsigned char>(c));
}

auto isExactInteger(std::string_view digits) -> bool {
  std::uint64_t number{};

  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), number);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return false;
  }

  if (number <= kMaxExactInteger) {
    return true;
  }

  const auto approx = static_cast<double>(number);
  if (approx >= 18446744073709551616.0) {
    return false;
  }

  return static_cast<std::uint64_t>(approx) == number;
}

} // namespace

auto hasInexactInteger(std::string_view json) -> bool {
  size_t pos{};

  while (pos < json.size()) {
    if ('"' == json[pos]) {
      for (pos++; pos < json.size() && '"' != json[pos]; pos++) {
        if ('\\' == json[pos]) {
          pos++;
        }
      }

      pos++;
    } else if ('-' == json[pos] || isDigit(json[pos])) {
      if ('-' == json[pos]) {
        pos++;
      }

      const size_t start = pos;
      while (pos < json.size() && isDigit(json[pos])) {
        pos++;
      }

      const auto digits = json.substr(start, pos - start);
      const bool integral = pos >= json.size() ||
                            ('.' != json[pos] && 'e' != json[pos] &&
                             'E' != json[pos]);

      // fraction and exponent
      while (pos < json.size() &&
             (isDigit(json[pos]) || '.' == json[pos] || 'e' == json[pos] ||
              'E' == json[pos] || '+' == json[pos] || '-' == json[pos])) {
        pos++;
      }

      if (integral && !digits.empty() && !isExactInteger(digits)) {
        return true;
      }
    } else {
      pos++;
    }
  }

  return false;
}

auto decodeMessagePb(std::string_view line) -> std::optional<gsn::MessagePb> {
  gsn::MessagePb pb{};

  auto status = google::protobuf::util::JsonStringToMessage(
      google::protobuf::StringPiece{line.data(), line.size()}, &pb,
      jsonParseOptions());
  if (!status.ok()) {
    return {};
  }

  return pb;
}

auto encodeMessagePb(const gsn::MessagePb &pb) -> std::string {
  std::string json{};

  auto status =
      google::protobuf::util::MessageToJsonString(pb, &json, jsonPrintOptions());
  if (!status.ok()) {
    throw std::runtime_error("Error in encoding MessagePb: " +
                             status.ToString());
  }

  return json;
}

auto valuePbToValue(const google::protobuf::Value &value_pb) -> Gsn_Value {
  if (value_pb.kind_case() == google::protobuf::Value::KIND_NOT_SET) {
    throw std::runtime_error("Error in encoding value: no kind is set");
  }

  std::string json{};

  auto status = google::protobuf::util::MessageToJsonString(value_pb, &json,
                                                            jsonPrintOptions());
  if (!status.ok()) {
    throw std::runtime_error("Error in encoding value: " + status.ToString());
  }

  return json;
}

auto valueToValuePb(const Gsn_Value &value) -> google::protobuf::Value {
  google::protobuf::Value value_pb{};

  auto status =
      google::protobuf::util::JsonStringToMessage(value, &value_pb);
  if (!status.ok()) {
    throw std::runtime_error("Error in decoding value (" + value +
                             "): " + status.ToString());
  }

  return value_pb;
}

auto messageBodyValues(const gsn::MessageBodyPb &body)
    -> std::vector<Gsn_Value> {
  std::vector<Gsn_Value> values{};

  if (body.has_message() &&
      body.message().kind_case() != google::protobuf::Value::KIND_NOT_SET) {
    values.push_back(valuePbToValue(body.message()));
  }

  if (body.has_messages()) {
    for (const auto &value_pb : body.messages().values()) {
      if (value_pb.kind_case() != google::protobuf::Value::KIND_NOT_SET) {
        values.push_back(valuePbToValue(value_pb));
      }
    }
  }

  return values;
}

void setMessageBodyValues(gsn::MessageBodyPb *body,
                          const std::vector<Gsn_Value> &values, bool as_list) {
  if (!as_list && 1 == values.size()) {
    *body->mutable_message() = valueToValuePb(values.front());

    return;
  }

  auto *list = body->mutable_messages();
  for (const auto &value : values) {
    *list->add_values() = valueToValuePb(value);
  }
}

} // namespace gsn
