// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <gtest/gtest.h>
#include <sstream>

TEST(config_test, parse_values) {
    ASSERT_EQ(std::get<std::string>(shardx::config::parse_value("\"abc\"")),
              "abc");
    ASSERT_EQ(std::get<std::string>(shardx::config::parse_value("\"42\"")),
              "42");
    ASSERT_EQ(std::get<size_t>(shardx::config::parse_value("42")), 42UL);
    ASSERT_DOUBLE_EQ(std::get<double>(shardx::config::parse_value("0.25")),
                     0.25);
    ASSERT_DOUBLE_EQ(std::get<double>(shardx::config::parse_value(".5")),
                     0.5);
    ASSERT_EQ(std::get<std::string>(shardx::config::parse_value("1.2.3")),
              "1.2.3");
    ASSERT_EQ(std::get<std::string>(shardx::config::parse_value("shard-1")),
              "shard-1");
    // Too large for an integer, kept as text
    ASSERT_EQ(std::get<std::string>(
                  shardx::config::parse_value("99999999999999999999999")),
              "99999999999999999999999");
}

TEST(config_test, parser_stream) {
    auto ss = std::istringstream(R"(
# comment
  name = "first shard"
count=3
ratio=1.5
level="warn"
count=4
)");
    auto cfg = shardx::config::parser(ss);
    ASSERT_TRUE(cfg.is_valid());
    ASSERT_EQ(cfg.get_string("name"), "first shard");
    // Later lines override earlier ones
    ASSERT_EQ(cfg.get_ulong("count"), 4UL);
    ASSERT_EQ(cfg.get_loglevel("level"), shardx::logging::log_level::warn);

    // Wrong type or missing key
    ASSERT_FALSE(cfg.get_ulong("name").has_value());
    ASSERT_FALSE(cfg.get_ulong("ratio").has_value());
    ASSERT_FALSE(cfg.get_string("count").has_value());
    ASSERT_FALSE(cfg.get_string("missing").has_value());
    ASSERT_FALSE(cfg.get_loglevel("name").has_value());
}

TEST(config_test, parser_invalid) {
    auto no_separator = std::istringstream("key\n");
    ASSERT_FALSE(shardx::config::parser(no_separator).is_valid());

    auto no_key = std::istringstream("=value\n");
    ASSERT_FALSE(shardx::config::parser(no_key).is_valid());

    ASSERT_FALSE(
        shardx::config::parser(std::string("/nonexistent/shardx.cfg"))
            .is_valid());
}

TEST(config_test, loglevel_names) {
    ASSERT_EQ(shardx::logging::parse_loglevel("trace"),
              shardx::logging::log_level::trace);
    ASSERT_EQ(shardx::logging::parse_loglevel("Error"),
              shardx::logging::log_level::error);
    ASSERT_EQ(shardx::logging::parse_loglevel("FATAL"),
              shardx::logging::log_level::fatal);
    ASSERT_FALSE(shardx::logging::parse_loglevel("verbose").has_value());
    ASSERT_EQ(shardx::logging::to_string(shardx::logging::log_level::warn),
              "WARN ");
}

TEST(config_test, log_filters_by_level) {
    auto out = std::stringstream();
    auto log = shardx::logging::log(shardx::logging::log_level::info);
    log.set_stream(&out);

    log.debug("hidden");
    log.info("shard", 1, "ready");
    log.warn("late");
    auto text = out.str();
    ASSERT_EQ(text.find("hidden"), std::string::npos);
    ASSERT_NE(text.find("[INFO ] shard 1 ready\n"), std::string::npos);
    ASSERT_NE(text.find("[WARN ] late\n"), std::string::npos);

    log.set_loglevel(shardx::logging::log_level::error);
    ASSERT_EQ(log.get_loglevel(), shardx::logging::log_level::error);
    log.warn("dropped");
    ASSERT_EQ(out.str().find("dropped"), std::string::npos);
}

TEST(config_test, log_file) {
    auto file = std::make_unique<std::stringstream>();
    auto* file_ptr = file.get();
    auto log = shardx::logging::log(shardx::logging::log_level::trace,
                                    false,
                                    std::move(file));
    log.trace("to file");
    ASSERT_NE(file_ptr->str().find("[TRACE] to file"), std::string::npos);
}
