#include "utils/json_formatter.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(JsonFormatterTest, EventFromJsonReadsAllFields) {
  auto body = nlohmann::json::parse(R"({
    "event_type": "login_failure",
    "source_ip": "10.0.0.7",
    "user_id": "alice",
    "session_id": "s-1",
    "user_agent": "curl/8.0",
    "data": {"username": "alice"},
    "headers": {"X-Request-Id": "abc"}
  })");

  Event event = JsonFormatter::event_from_json(body);
  EXPECT_EQ(event.event_type, "login_failure");
  EXPECT_EQ(event.source_ip, "10.0.0.7");
  ASSERT_TRUE(event.user_id.has_value());
  EXPECT_EQ(*event.user_id, "alice");
  EXPECT_EQ(*event.session_id, "s-1");
  EXPECT_EQ(*event.user_agent, "curl/8.0");
  EXPECT_EQ(event.payload["username"], "alice");
  ASSERT_TRUE(event.headers.has_value());
  EXPECT_EQ(event.headers->at("X-Request-Id"), "abc");
}

TEST(JsonFormatterTest, EventFromJsonOptionalFieldsMayBeAbsent) {
  Event event = JsonFormatter::event_from_json({{"event_type", "page_view"}});
  EXPECT_EQ(event.source_ip, "");
  EXPECT_FALSE(event.user_id.has_value());
  EXPECT_TRUE(event.payload.is_object());
  EXPECT_TRUE(event.payload.empty());
}

TEST(JsonFormatterTest, EventFromJsonRejectsBadInput) {
  EXPECT_THROW(JsonFormatter::event_from_json(nlohmann::json::array()),
               std::invalid_argument);
  EXPECT_THROW(JsonFormatter::event_from_json({{"data", {{"a", 1}}}}),
               std::invalid_argument);
  EXPECT_THROW(JsonFormatter::event_from_json({{"event_type", ""}}),
               std::invalid_argument);
  EXPECT_THROW(
      JsonFormatter::event_from_json({{"event_type", "x"}, {"data", "text"}}),
      std::invalid_argument);
  EXPECT_THROW(
      JsonFormatter::event_from_json({{"event_type", "x"}, {"user_id", 42}}),
      std::invalid_argument);
}

TEST(JsonFormatterTest, IncidentUsesRiskSeverityAndPlaceholderLocation) {
  IncidentReport report;
  report.incident_id = "inc-0-1";
  report.timestamp_ms = 0;
  report.source_ip = "10.0.0.5";
  report.primary.attack_type = "BRUTE_FORCE";
  report.primary.severity = Severity::HIGH;
  report.risk.score = 1.0;
  report.risk.severity = Severity::CRITICAL;
  report.detection_count = 6;
  report.event_type = "login_failure";

  auto j = JsonFormatter::incident_to_json_object(report);
  EXPECT_EQ(j["severity"], "CRITICAL");
  EXPECT_EQ(j["detection_severity"], "HIGH");
  EXPECT_EQ(j["timestamp"], "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(j["city"], "...");
  EXPECT_TRUE(j["user_id"].is_null());
  EXPECT_FALSE(j.contains("update"));

  report.location = GeoLocation{"Berlin", "Germany", 52.52, 13.40};
  report.is_update = true;
  j = JsonFormatter::incident_to_json_object(report);
  EXPECT_EQ(j["city"], "Berlin");
  EXPECT_EQ(j["update"], true);
}

TEST(JsonFormatterTest, MonitorConfigFromJson) {
  auto config = JsonFormatter::monitor_config_from_json(
      {{"url", " shop.example "},
       {"check_content", true},
       {"expected_keywords", {"cart", 7}}},
      300);
  EXPECT_EQ(config.url, "shop.example");
  EXPECT_EQ(config.check_interval_seconds, 300u);
  EXPECT_TRUE(config.check_content);
  ASSERT_EQ(config.expected_keywords.size(), 1u);

  EXPECT_THROW(JsonFormatter::monitor_config_from_json({{"url", ""}}, 300),
               std::invalid_argument);
  EXPECT_THROW(JsonFormatter::monitor_config_from_json(
                   {{"url", "a.example"}, {"check_interval", -5}}, 300),
               std::invalid_argument);
}

TEST(JsonFormatterTest, EnvelopeAddsType) {
  auto envelope = JsonFormatter::make_envelope("website_health", {{"url", "u"}});
  EXPECT_EQ(envelope["type"], "website_health");
  EXPECT_EQ(envelope["url"], "u");

  EXPECT_EQ(JsonFormatter::make_envelope("simulation_status", nullptr),
            nlohmann::json({{"type", "simulation_status"}}));
}

TEST(JsonFormatterTest, MaskSensitiveFields) {
  nlohmann::json data = {{"password", "secret"},
                         {"card_number", "4111"},
                         {"account_number", "DE89370400440532013000"},
                         {"note", "keep me"}};
  auto masked = JsonFormatter::mask_sensitive_fields(
      data, {"password"}, {"account_number"});

  EXPECT_EQ(masked["password"], "[MASKED]");
  // Too short to reveal a suffix
  EXPECT_EQ(masked["card_number"], "4111");
  EXPECT_EQ(masked["account_number"], "DE89...[MASKED]");
  EXPECT_EQ(masked["note"], "keep me");

  EXPECT_EQ(JsonFormatter::mask_sensitive_fields("plain", {"password"}, {}),
            "plain");
}
