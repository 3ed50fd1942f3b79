#include <gtest/gtest.h>
#include <keystone/runtime/bank.hpp>
#include <keystone/schema/ids.hpp>
#include <keystone/testing/common.hpp>

#include <array>
#include <utility>
#include <vector>

namespace {

using keystone::schema::program_error;

const auto kCreatorProgram = keystone::testing::make_key(200);
constexpr auto kCreateLamports = uint64_t{5000};
constexpr auto kCreateSpace = uint64_t{16};

/// Test program: create accounts[1] funded by accounts[0]. A first data byte
/// of 0x01 makes it fail after the account was created.
keystone::schema::program_result creator_program(
    const keystone::schema::pubkey_t& program_id,
    keystone::execution::account_infos_t accounts,
    const keystone::schema::bytes_view_t& instruction_data,
    keystone::execution::host& host) {
  auto created = host.invoke_create_account(
      program_id,
      keystone::execution::create_account_t{.from = accounts[0],
                                            .to = accounts[1],
                                            .lamports = kCreateLamports,
                                            .space = kCreateSpace,
                                            .owner = program_id},
      {});
  if (!created.ok()) {
    return created;
  }
  if (!instruction_data.empty() && instruction_data[0] == 0x01) {
    return keystone::schema::make_failure(
        program_error::invalid_instruction_data, "failing after create");
  }
  return created;
}

keystone::runtime::instruction_t make_create(
    const keystone::schema::pubkey_t& from,
    const keystone::schema::pubkey_t& to,
    const bool from_signs = true,
    const bool to_signs = true) {
  auto instruction = keystone::runtime::instruction_t{};
  instruction.program_id = kCreatorProgram;
  instruction.accounts = {
      {.key = from, .is_signer = from_signs, .is_writable = true},
      {.key = to, .is_signer = to_signs, .is_writable = true}};
  return instruction;
}

class bank_test : public ::testing::Test {
 protected:
  void SetUp() override {
    bank_.register_program(kCreatorProgram, creator_program);
    bank_.airdrop(funder_, 100'000);
  }

  keystone::runtime::bank bank_;
  keystone::schema::pubkey_t funder_{keystone::testing::make_key(10)};
  keystone::schema::pubkey_t target_{keystone::testing::make_key(11)};
};

}  // namespace

TEST_F(bank_test, create_account_moves_lamports_and_assigns_owner) {
  auto result = bank_.process_instruction(make_create(funder_, target_));
  ASSERT_TRUE(result.ok()) << result.log;

  auto target = bank_.get_account(target_);
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->lamports, kCreateLamports);
  EXPECT_EQ(target->owner, kCreatorProgram);
  EXPECT_EQ(target->data, keystone::schema::bytes_t(kCreateSpace, 0x00));
  EXPECT_EQ(bank_.get_account(funder_)->lamports, 100'000 - kCreateLamports);
}

TEST_F(bank_test, create_account_requires_funding_signature) {
  auto result =
      bank_.process_instruction(make_create(funder_, target_, false, true));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, program_error::missing_required_signature);
  EXPECT_FALSE(bank_.get_account(target_).has_value());
}

TEST_F(bank_test, create_account_requires_target_authorization) {
  auto result =
      bank_.process_instruction(make_create(funder_, target_, true, false));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, program_error::missing_required_signature);
  EXPECT_FALSE(bank_.get_account(target_).has_value());
}

TEST_F(bank_test, create_account_rejects_funded_target) {
  bank_.airdrop(target_, 1);
  auto result = bank_.process_instruction(make_create(funder_, target_));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, program_error::account_already_in_use);
  EXPECT_EQ(bank_.get_account(target_)->lamports, 1u);
}

TEST_F(bank_test, create_account_rejects_underfunded_payer) {
  auto poor = keystone::testing::make_key(12);
  bank_.airdrop(poor, kCreateLamports - 1);
  auto result = bank_.process_instruction(make_create(poor, target_));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, program_error::insufficient_funds);
  EXPECT_EQ(bank_.get_account(poor)->lamports, kCreateLamports - 1);
}

TEST_F(bank_test, failed_instruction_discards_every_write) {
  auto before = bank_.accounts();
  auto instruction = make_create(funder_, target_);
  instruction.data = {0x01};
  auto result = bank_.process_instruction(instruction);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(bank_.accounts(), before);
}

TEST_F(bank_test, read_only_accounts_are_not_committed) {
  auto instruction = make_create(funder_, target_);
  instruction.accounts[0].is_writable = false;
  auto result = bank_.process_instruction(instruction);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, program_error::invalid_instruction_data);
  EXPECT_EQ(bank_.get_account(funder_)->lamports, 100'000u);
}

TEST_F(bank_test, rejects_duplicate_account_keys) {
  auto result = bank_.process_instruction(make_create(funder_, funder_));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, program_error::invalid_instruction_data);
}

TEST_F(bank_test, rejects_unregistered_program) {
  auto instruction = make_create(funder_, target_);
  instruction.program_id = keystone::testing::make_key(201);
  auto result = bank_.process_instruction(instruction);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, program_error::invalid_instruction_data);
}

TEST_F(bank_test, transaction_rolls_back_earlier_instructions) {
  auto before = bank_.accounts();
  auto second_target = keystone::testing::make_key(13);
  auto failing = make_create(funder_, second_target);
  failing.data = {0x01};
  auto instructions =
      std::vector<keystone::runtime::instruction_t>{make_create(funder_, target_),
                                                    failing};

  auto result = bank_.process_transaction(instructions);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(bank_.accounts(), before);
  EXPECT_FALSE(bank_.get_account(target_).has_value());
}

TEST_F(bank_test, transaction_commits_all_instructions_on_success) {
  auto second_target = keystone::testing::make_key(13);
  auto instructions = std::vector<keystone::runtime::instruction_t>{
      make_create(funder_, target_), make_create(funder_, second_target)};
  auto result = bank_.process_transaction(instructions);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_TRUE(bank_.get_account(target_).has_value());
  EXPECT_TRUE(bank_.get_account(second_target).has_value());
  EXPECT_EQ(bank_.get_account(funder_)->lamports,
            100'000 - (2 * kCreateLamports));
}

TEST_F(bank_test, rollback_discards_airdrop_with_failed_transaction) {
  auto checkpoint = bank_.checkpoint();
  bank_.airdrop(funder_, 50'000);
  bank_.airdrop(target_, 7);

  auto failing = make_create(funder_, keystone::testing::make_key(13));
  failing.data = {0x01};
  auto instructions = std::vector<keystone::runtime::instruction_t>{failing};
  ASSERT_FALSE(bank_.process_transaction(instructions).ok());
  EXPECT_EQ(bank_.get_account(funder_)->lamports, 150'000u);

  bank_.rollback(std::move(checkpoint));
  EXPECT_EQ(bank_.get_account(funder_)->lamports, 100'000u);
  EXPECT_FALSE(bank_.get_account(target_).has_value());
}

TEST(bank, rent_sysvar_is_owned_by_sysvar_program) {
  auto bank = keystone::runtime::bank{};
  bank.install_rent_sysvar();
  auto rent = bank.get_account(keystone::schema::kRentSysvarId);
  ASSERT_TRUE(rent.has_value());
  EXPECT_EQ(rent->owner, keystone::schema::kSysvarOwnerId);
  auto decoded = keystone::sysvar::try_decode_rent(
      keystone::schema::bytes_view_t{rent->data.data(), rent->data.size()});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, keystone::sysvar::rent_t{});
}
