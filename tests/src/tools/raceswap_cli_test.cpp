#include <gtest/gtest.h>
#include <raceswap/execution/program_config.hpp>
#include <raceswap/execution/vault_authority.hpp>
#include <raceswap/schema/primitives.hpp>
#include <raceswap/schema/program_instruction.hpp>
#include <raceswap/testing/common.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef RACESWAP_CLI_PATH
#define RACESWAP_CLI_PATH ""
#endif

namespace {

constexpr auto kAdmin = "4Nd1mBQtrMJVYVfKf2PJy9NZUZdTAsp7D4xWLs4gDB4T";
constexpr auto kTreasury = "7YttLkHDoNj9wyDur5pM1ejNaAvT9X4eqaYcHQqtj2G5";
constexpr auto kStranger = "9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

class raceswap_cli : public ::testing::Test {
 protected:
  void SetUp() override {
    cli_ = std::string{RACESWAP_CLI_PATH};
    if (cli_.empty() || !std::filesystem::exists(cli_)) {
      GTEST_SKIP() << "raceswap binary not available: " << cli_;
    }
    scratch_ = raceswap::testing::make_db_path("raceswap_cli");
    std::filesystem::create_directories(scratch_);
  }

  void TearDown() override {
    if (!scratch_.empty()) {
      raceswap::testing::remove_path(scratch_);
    }
  }

  std::pair<int, std::string> run(const std::string_view args) const {
    auto log_file = (std::filesystem::path{scratch_} / "cli.log").string();
    return run_capture(shell_quote(cli_) + " " + std::string{args} +
                       " --log-file " + shell_quote(log_file) + " 2>/dev/null");
  }

  std::string db_args() const {
    return "--db-path " +
           shell_quote((std::filesystem::path{scratch_} / "db").string());
  }

  std::string cli_;
  std::string scratch_;
};

}  // namespace

TEST_F(raceswap_cli, derive_prints_config_and_authority) {
  auto [exit_code, output] = run("derive");
  ASSERT_EQ(exit_code, 0) << output;

  auto program = raceswap::execution::make_mainnet_program_config();
  auto config = raceswap::execution::find_config_address(program.program_id);
  ASSERT_TRUE(config.has_value());
  auto authority = raceswap::execution::derived_authority::derive(
      config->address, program.program_id);
  ASSERT_TRUE(authority.has_value());

  EXPECT_NE(output.find("config: " + raceswap::schema::to_string(
                                         config->address)),
            std::string::npos);
  EXPECT_NE(output.find("authority: " + raceswap::schema::to_string(
                                            authority->address())),
            std::string::npos);
}

TEST_F(raceswap_cli, decode_prints_instruction_fields) {
  auto data = raceswap::schema::encode_instruction(
      raceswap::schema::update_config_t{.reflection_fee_bps = 300});
  auto [exit_code, output] =
      run("decode --hex " + raceswap::schema::to_hex(data));
  ASSERT_EQ(exit_code, 0) << output;
  EXPECT_NE(output.find("instruction: update_config"), std::string::npos);
  EXPECT_NE(output.find("reflection_fee_bps: 300"), std::string::npos);
  EXPECT_EQ(output.find("treasury_fee_bps"), std::string::npos);
}

TEST_F(raceswap_cli, decode_rejects_unknown_data) {
  auto [exit_code, output] = run("decode --hex 0102030405060708");
  EXPECT_EQ(exit_code, 1);
  EXPECT_NE(output.find("error: invalid instruction data"), std::string::npos);
}

TEST_F(raceswap_cli, unknown_encoding_is_fatal) {
  auto [exit_code, output] =
      run("decode --hex 0102030405060708 --encoding sideways");
  EXPECT_NE(exit_code, 0);
  EXPECT_TRUE(output.empty()) << output;

  auto log = std::ifstream{std::filesystem::path{scratch_} / "cli.log"};
  auto contents = std::string{std::istreambuf_iterator<char>{log},
                              std::istreambuf_iterator<char>{}};
  EXPECT_NE(contents.find("encoding must be one of full|indexed"),
            std::string::npos)
      << contents;
}

TEST_F(raceswap_cli, config_lifecycle_against_a_ledger) {
  auto missing = run("show-config " + db_args());
  EXPECT_EQ(missing.first, 1);

  auto init = run("init-config " + db_args() + " --payer " + kAdmin +
                  " --fund 1000000000 --authority " + kAdmin +
                  " --treasury-wallet " + kTreasury +
                  " --reflection-bps 150 --treasury-bps 20");
  ASSERT_EQ(init.first, 0) << init.second;
  EXPECT_NE(init.second.find("event: config_updated"), std::string::npos);

  auto shown = run("show-config " + db_args());
  ASSERT_EQ(shown.first, 0) << shown.second;
  EXPECT_NE(shown.second.find(std::string{"authority: "} + kAdmin),
            std::string::npos);
  EXPECT_NE(shown.second.find("reflection_fee_bps: 150"), std::string::npos);

  auto refused = run("update-config " + db_args() + " --authority " +
                     kStranger + " --treasury-bps 0");
  EXPECT_EQ(refused.first, 1);
  EXPECT_NE(refused.second.find("error: [raceswap:6002]"), std::string::npos);

  auto updated = run("update-config " + db_args() + " --authority " + kAdmin +
                     " --treasury-bps 35");
  ASSERT_EQ(updated.first, 0) << updated.second;

  auto after = run("show-config " + db_args());
  EXPECT_NE(after.second.find("treasury_fee_bps: 35"), std::string::npos);
  EXPECT_NE(after.second.find("reflection_fee_bps: 150"), std::string::npos);
}
