#ifndef DELIVERY_DOT_HPP
#define DELIVERY_DOT_HPP

#include "TenantConfig.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// One message as the application hands it to us.
struct Outbound {
  std::string to;
  std::string subject;
  std::string content; // HTML

  std::optional<std::string> text; // plain text alternative

  std::string                correlation_id;
  std::optional<std::string> campaign_id;
};

// Outcome of one send attempt.
struct DeliveryResult {
  bool success{false};

  std::optional<std::string> message_id;
  std::optional<std::string> error;

  std::chrono::milliseconds delivery_time{0};

  std::optional<Provider>  provider_used;
  std::vector<std::string> warnings;

  // Connection reputation after an SMTP attempt.
  std::optional<int> reputation_score;

  // Set when the attempt was refused by the local rate limiter.
  std::optional<std::chrono::milliseconds> retry_after;
};

#endif // DELIVERY_DOT_HPP
