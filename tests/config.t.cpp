#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>

#include "../services/performer/include/config.hpp"

static EnvLookup envFrom(std::map<std::string, std::string> vars) {
  return [vars](const char *key) -> std::optional<std::string> {
    auto it = vars.find(key);
    if (it == vars.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

TEST(LoadConfig, defaults) {
  PerformerConfig cfg = load_config(envFrom({}));
  EXPECT_TRUE(cfg.dispatcher.credential.empty());
  EXPECT_TRUE(cfg.dispatcher.endpoint.empty());
  EXPECT_EQ(10000, cfg.dispatcher.timeout.count());
  EXPECT_EQ(64, cfg.dispatcher.max_output_tokens);
  EXPECT_DOUBLE_EQ(0.2, cfg.dispatcher.temperature);
  EXPECT_EQ(8080, cfg.server.port);
  EXPECT_EQ(5, cfg.server.connection_timeout_s);
  EXPECT_EQ(LogLevel::Info, cfg.log_level);
}

TEST(LoadConfig, readsEveryVariable) {
  PerformerConfig cfg = load_config(envFrom({
      {"AZURE_OPENAI_KEY", "k"},
      {"AZURE_OPENAI_ENDPOINT", "https://example.com/chat"},
      {"PERFORMER_TIMEOUT_MS", "2500"},
      {"PERFORMER_MAX_TOKENS", "128"},
      {"PERFORMER_TEMPERATURE", "0"},
      {"PERFORMER_PORT", "9090"},
      {"PERFORMER_CONNECTION_TIMEOUT_S", "30"},
      {"PERFORMER_LOG_LEVEL", "DEBUG"},
  }));
  EXPECT_EQ("k", cfg.dispatcher.credential);
  EXPECT_EQ("https://example.com/chat", cfg.dispatcher.endpoint);
  EXPECT_EQ(2500, cfg.dispatcher.timeout.count());
  EXPECT_EQ(128, cfg.dispatcher.max_output_tokens);
  EXPECT_DOUBLE_EQ(0.0, cfg.dispatcher.temperature);
  EXPECT_EQ(9090, cfg.server.port);
  EXPECT_EQ(30, cfg.server.connection_timeout_s);
  EXPECT_EQ(LogLevel::Debug, cfg.log_level);
}

TEST(LoadConfig, malformedNumbersAreErrors) {
  EXPECT_THROW(load_config(envFrom({{"PERFORMER_TIMEOUT_MS", "ten"}})), std::invalid_argument);
  EXPECT_THROW(load_config(envFrom({{"PERFORMER_TIMEOUT_MS", "10s"}})), std::invalid_argument);
  EXPECT_THROW(load_config(envFrom({{"PERFORMER_TIMEOUT_MS", "0"}})), std::invalid_argument);
  EXPECT_THROW(load_config(envFrom({{"PERFORMER_PORT", "70000"}})), std::invalid_argument);
  EXPECT_THROW(load_config(envFrom({{"PERFORMER_TEMPERATURE", "hot"}})), std::invalid_argument);
  EXPECT_THROW(load_config(envFrom({{"PERFORMER_TEMPERATURE", "3.5"}})), std::invalid_argument);
  EXPECT_THROW(load_config(envFrom({{"PERFORMER_LOG_LEVEL", "loud"}})), std::invalid_argument);
}

TEST(CheckDispatcherConfig, acceptsHttpsEndpoint) {
  DispatcherConfig cfg;
  cfg.credential = "k";
  cfg.endpoint = "https://example.openai.azure.com/openai/deployments/x/chat/completions?api-version=2024-02-01";
  EXPECT_FALSE(check_dispatcher_config(cfg).has_value());

  cfg.endpoint = "HTTPS://Example.com:8443";
  EXPECT_FALSE(check_dispatcher_config(cfg).has_value());
}

TEST(CheckDispatcherConfig, reportsFirstProblem) {
  DispatcherConfig cfg;
  auto err = check_dispatcher_config(cfg);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(ErrorCode::MissingCredential, err->code);

  cfg.credential = "k";
  err = check_dispatcher_config(cfg);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(ErrorCode::MissingEndpoint, err->code);

  cfg.endpoint = "http://example.com";
  err = check_dispatcher_config(cfg);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(ErrorCode::InsecureEndpoint, err->code);

  cfg.endpoint = "ftp://example.com";
  err = check_dispatcher_config(cfg);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(ErrorCode::InsecureEndpoint, err->code);

  cfg.endpoint = "https://";
  err = check_dispatcher_config(cfg);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(ErrorCode::MalformedEndpoint, err->code);

  cfg.endpoint = "https://:443/chat";
  err = check_dispatcher_config(cfg);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(ErrorCode::MalformedEndpoint, err->code);
  EXPECT_EQ(ErrorCategory::ConfigurationError, err->category());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
