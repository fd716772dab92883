#include <gtest/gtest.h>
#include <strongroom/execution/mutation.hpp>
#include <strongroom/schema/limits.hpp>
#include <strongroom/testing/common.hpp>

using namespace strongroom::schema;
using strongroom::execution::apply_mutation;
using strongroom::testing::make_hash;

namespace {

const auto kA = make_hash(0x10);
const auto kB = make_hash(0x20);
const auto kC = make_hash(0x30);
const auto kG = make_hash(0x40);
const auto kWallet = make_hash(0x60);
constexpr auto kDay = duration_milliseconds_t{24ull * 60 * 60 * 1000};

wallet_state_t make_wallet() {
  auto wallet = wallet_state_t{};
  auto error = apply_mutation(
      wallet, operation_params_t{wallet_init_t{.signers = {kA, kB, kC},
                                               .quorum = 2,
                                               .approval_timeout = kDay}});
  EXPECT_FALSE(error.has_value());
  return wallet;
}

balance_account_state_t make_balance_account(const wallet_state_t& wallet) {
  auto balance_account = balance_account_state_t{};
  auto error = apply_mutation(
      balance_account, kWallet, wallet,
      operation_params_t{balance_account_creation_t{
          .guid_hash = make_hash(1),
          .name_hash = make_hash(2),
          .whitelist_enabled = true,
          .whitelist = {whitelist_entry_t{.address = kA}}}});
  EXPECT_FALSE(error.has_value());
  return balance_account;
}

}  // namespace

TEST(mutation, wallet_init_sets_config) {
  auto wallet = make_wallet();
  EXPECT_EQ(wallet.signers.count, 3u);
  EXPECT_EQ(wallet.quorum, 2u);
  EXPECT_EQ(wallet.approval_timeout, kDay);
  EXPECT_EQ(wallet.revision, 1u);

  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_init_t{
                                       .signers = {kA},
                                       .quorum = 1,
                                       .approval_timeout = kDay}}),
            program_error_code::account_already_initialized);
}

TEST(mutation, wallet_init_rejects_bad_config) {
  auto wallet = wallet_state_t{};
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_init_t{
                                       .quorum = 1, .approval_timeout = kDay}}),
            program_error_code::invalid_threshold);

  wallet = wallet_state_t{};
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_init_t{
                                       .signers = {kA, kA},
                                       .quorum = 1,
                                       .approval_timeout = kDay}}),
            program_error_code::duplicate_signer);

  wallet = wallet_state_t{};
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_init_t{
                                       .signers = {kA, kB},
                                       .quorum = 3,
                                       .approval_timeout = kDay}}),
            program_error_code::invalid_threshold);

  wallet = wallet_state_t{};
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_init_t{
                                       .signers = {kA},
                                       .quorum = 1,
                                       .approval_timeout = 10}}),
            program_error_code::invalid_approval_timeout);

  wallet = wallet_state_t{};
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_init_t{
                                       .signers = {kA},
                                       .quorum = 1,
                                       .approval_timeout = kDay,
                                       .guardians = {kA},
                                       .guardian_quorum = 1}}),
            program_error_code::duplicate_signer);

  wallet = wallet_state_t{};
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_init_t{
                                       .signers = {kA},
                                       .quorum = 1,
                                       .approval_timeout = kDay,
                                       .guardians = {kG},
                                       .guardian_quorum = 0}}),
            program_error_code::invalid_threshold);

  auto too_many = std::vector<address_t>{};
  for (std::size_t i = 0; i <= kMaxSigners; ++i) {
    too_many.push_back(make_hash(static_cast<uint8_t>(i * 2)));
  }
  wallet = wallet_state_t{};
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_init_t{
                                       .signers = too_many,
                                       .quorum = 1,
                                       .approval_timeout = kDay}}),
            program_error_code::too_many_signers);
}

TEST(mutation, config_update_cannot_leave_quorum_unreachable) {
  auto wallet = make_wallet();
  auto before = wallet;
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_config_update_t{
                                       .signers = {kA, kB},
                                       .quorum = 3,
                                       .approval_timeout = kDay}}),
            program_error_code::invalid_threshold);

  wallet = before;
  EXPECT_FALSE(apply_mutation(wallet, operation_params_t{wallet_config_update_t{
                                          .signers = {kA, kB},
                                          .quorum = 2,
                                          .approval_timeout = kDay}})
                   .has_value());
  EXPECT_EQ(wallet.signers.count, 2u);
  EXPECT_FALSE(wallet.signers.contains(kC));
  EXPECT_EQ(wallet.revision, 2u);
}

TEST(mutation, config_update_without_change_is_rejected) {
  auto wallet = make_wallet();
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{wallet_config_update_t{
                                       .signers = {kC, kB, kA},
                                       .quorum = 2,
                                       .approval_timeout = kDay}}),
            program_error_code::invalid_update);
}

TEST(mutation, balance_account_create_validates) {
  auto wallet = make_wallet();
  auto balance_account = make_balance_account(wallet);
  EXPECT_EQ(balance_account.wallet, kWallet);
  EXPECT_TRUE(balance_account.active);
  EXPECT_EQ(balance_account.whitelist.count, 1u);
  EXPECT_EQ(balance_account.revision, 1u);

  EXPECT_EQ(apply_mutation(balance_account, kWallet, wallet,
                           operation_params_t{balance_account_creation_t{}}),
            program_error_code::account_already_initialized);

  auto fresh = balance_account_state_t{};
  EXPECT_EQ(apply_mutation(fresh, kWallet, wallet,
                           operation_params_t{balance_account_creation_t{
                               .asset = asset_ref_t{.kind = asset_kind_t::token}}}),
            program_error_code::asset_mismatch);

  fresh = balance_account_state_t{};
  EXPECT_EQ(apply_mutation(fresh, kWallet, wallet,
                           operation_params_t{balance_account_creation_t{
                               .policy = approval_policy_t{.transfer_quorum = 4}}}),
            program_error_code::invalid_threshold);

  fresh = balance_account_state_t{};
  EXPECT_EQ(apply_mutation(
                fresh, kWallet, wallet,
                operation_params_t{balance_account_creation_t{
                    .policy = approval_policy_t{.large_transfer_minimum = 10}}}),
            program_error_code::invalid_threshold);

  fresh = balance_account_state_t{};
  EXPECT_EQ(apply_mutation(fresh, kWallet, wallet,
                           operation_params_t{balance_account_creation_t{
                               .whitelist = {whitelist_entry_t{.address = kA},
                                             whitelist_entry_t{
                                                 .address = kA,
                                                 .name_hash = make_hash(9)}}}}),
            program_error_code::entry_exists);
}

TEST(mutation, balance_account_update_requires_matching_guid_and_change) {
  auto wallet = make_wallet();
  auto balance_account = make_balance_account(wallet);

  EXPECT_EQ(apply_mutation(balance_account, kWallet, wallet,
                           operation_params_t{balance_account_update_t{
                               .guid_hash = make_hash(7)}}),
            program_error_code::account_mismatch);

  EXPECT_EQ(apply_mutation(balance_account, kWallet, wallet,
                           operation_params_t{balance_account_update_t{
                               .guid_hash = make_hash(1),
                               .name_hash = make_hash(2)}}),
            program_error_code::invalid_update);

  EXPECT_FALSE(apply_mutation(balance_account, kWallet, wallet,
                              operation_params_t{balance_account_update_t{
                                  .guid_hash = make_hash(1),
                                  .name_hash = make_hash(3),
                                  .dapps_enabled = true}})
                   .has_value());
  EXPECT_EQ(balance_account.name_hash, make_hash(3));
  EXPECT_TRUE(balance_account.dapps_enabled);
  EXPECT_EQ(balance_account.revision, 2u);
}

TEST(mutation, whitelist_update_removes_before_adding) {
  auto wallet = make_wallet();
  auto balance_account = make_balance_account(wallet);

  EXPECT_FALSE(apply_mutation(
                   balance_account, kWallet, wallet,
                   operation_params_t{whitelist_update_t{
                       .guid_hash = make_hash(1),
                       .add = {whitelist_entry_t{.address = kA,
                                                 .name_hash = make_hash(5)},
                               whitelist_entry_t{.address = kB}},
                       .remove = {kA}}})
                   .has_value());
  EXPECT_EQ(balance_account.whitelist.count, 2u);
  auto renamed = balance_account.whitelist.find(
      kA, [](const whitelist_entry_t& entry) { return entry.address; });
  ASSERT_TRUE(renamed.has_value());
  EXPECT_EQ(renamed->name_hash, make_hash(5));

  EXPECT_EQ(apply_mutation(balance_account, kWallet, wallet,
                           operation_params_t{whitelist_update_t{
                               .guid_hash = make_hash(1), .remove = {kC}}}),
            program_error_code::entry_missing);
  EXPECT_EQ(apply_mutation(balance_account, kWallet, wallet,
                           operation_params_t{whitelist_update_t{
                               .guid_hash = make_hash(1)}}),
            program_error_code::invalid_update);
}

TEST(mutation, whitelist_update_status_only) {
  auto wallet = make_wallet();
  auto balance_account = make_balance_account(wallet);
  EXPECT_FALSE(apply_mutation(balance_account, kWallet, wallet,
                              operation_params_t{whitelist_update_t{
                                  .guid_hash = make_hash(1),
                                  .whitelist_enabled = false}})
                   .has_value());
  EXPECT_FALSE(balance_account.whitelist_enabled);
  EXPECT_EQ(balance_account.whitelist.count, 1u);
}

TEST(mutation, whitelist_update_respects_capacity) {
  auto wallet = make_wallet();
  auto balance_account = make_balance_account(wallet);
  auto update = whitelist_update_t{.guid_hash = make_hash(1)};
  for (std::size_t i = 0; i < kMaxWhitelistEntries; ++i) {
    update.add.push_back(
        whitelist_entry_t{.address = make_hash(static_cast<uint8_t>(100 + i))});
  }
  EXPECT_EQ(apply_mutation(balance_account, kWallet, wallet,
                           operation_params_t{update}),
            program_error_code::whitelist_full);
}

TEST(mutation, dapp_book_update) {
  auto dapp_book = dapp_book_state_t{.wallet = kWallet, .revision = 1};
  EXPECT_EQ(apply_mutation(dapp_book, operation_params_t{dapp_book_update_t{}}),
            program_error_code::invalid_update);

  EXPECT_FALSE(apply_mutation(dapp_book,
                              operation_params_t{dapp_book_update_t{
                                  .add = {dapp_entry_t{.program_id = kA}}}})
                   .has_value());
  EXPECT_EQ(dapp_book.entries.count, 1u);
  EXPECT_EQ(dapp_book.revision, 2u);

  EXPECT_EQ(apply_mutation(dapp_book, operation_params_t{dapp_book_update_t{
                                          .add = {dapp_entry_t{.program_id = kA}}}}),
            program_error_code::entry_exists);
  EXPECT_EQ(apply_mutation(dapp_book, operation_params_t{dapp_book_update_t{
                                          .remove = {kB}}}),
            program_error_code::entry_missing);
}

TEST(mutation, kind_must_match_record) {
  auto wallet = make_wallet();
  EXPECT_EQ(apply_mutation(wallet, operation_params_t{transfer_t{}}),
            program_error_code::invalid_instruction);
  auto dapp_book = dapp_book_state_t{};
  EXPECT_EQ(apply_mutation(dapp_book, operation_params_t{wallet_init_t{}}),
            program_error_code::invalid_instruction);
}
