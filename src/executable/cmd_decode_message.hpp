/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <charconv>
#include <functional>
#include <iostream>
#include <optional>
#include <print>
#include <string_view>

#include <fmt/format.h>
#include <qtils/byte_vec.hpp>
#include <qtils/unhex.hpp>

#include "messaging/message_codec.hpp"
#include "utils/parsers.hpp"

/**
 * Prints the fields and the id of a message body, as the hub would see it
 * after receiving it from `sender` on `origin` domain.
 */
inline int cmdDecodeMessage(
    const std::function<std::optional<std::string_view>(size_t)> &getArg) {
  auto origin_arg = getArg(2);
  auto sender_arg = getArg(3);
  auto body_arg = getArg(4);
  if (not origin_arg or not sender_arg or not body_arg) {
    std::println(std::cerr,
                 "Usage: bridge_hub decode-message <origin-domain> <sender> "
                 "<body-hex>");
    return EXIT_FAILURE;
  }

  bridge::Domain origin = bridge::kInvalidDomain;
  auto [ptr, ec] = std::from_chars(
      origin_arg->data(), origin_arg->data() + origin_arg->size(), origin);
  if (ec != std::errc{} or ptr != origin_arg->data() + origin_arg->size()) {
    std::println(std::cerr, "Invalid origin domain: {}", *origin_arg);
    return EXIT_FAILURE;
  }

  auto sender = bridge::util::parseAddress(*sender_arg);
  if (not sender) {
    std::println(std::cerr, "Invalid sender address: {}", *sender_arg);
    return EXIT_FAILURE;
  }

  qtils::ByteVec body;
  if (not qtils::unhex0x(body, *body_arg, true).has_value()) {
    std::println(std::cerr, "Body is not a hex string");
    return EXIT_FAILURE;
  }

  auto id = bridge::messaging::computeMessageId(origin, *sender, body);
  std::println("id:        {}", fmt::format("{:0x}", id));

  auto message_res = bridge::messaging::decodeMessage(*sender, body);
  if (message_res.has_error()) {
    std::println(std::cerr,
                 "Can't decode message: {}",
                 message_res.error().message());
    return EXIT_FAILURE;
  }
  const auto &message = message_res.value();

  std::println("kind:      {}",
               message.kind == bridge::MessageKind::DEPOSIT ? "DEPOSIT"
                                                            : "RELEASE");
  std::println("origin:    {}", message.origin_domain);
  if (message.origin_domain != origin) {
    std::println("           differs from the transport origin {}; "
                 "the message would be rejected",
                 origin);
  }
  std::println("sender:    {}", fmt::format("{:0x}", message.sender));
  std::println("token:     {}", fmt::format("{:0x}", message.token));
  std::println("recipient: {}", fmt::format("{:0x}", message.recipient));
  std::println("amount:    {}", fmt::format("{}", message.amount));
  std::println("sequence:  {}", message.sequence);
  return EXIT_SUCCESS;
}
