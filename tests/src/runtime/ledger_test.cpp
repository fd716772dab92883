#include <gtest/gtest.h>
#include <strongroom/execution/operation_machine.hpp>
#include <strongroom/runtime/ledger.hpp>
#include <strongroom/schema/limits.hpp>
#include <strongroom/schema/record.hpp>
#include <strongroom/schema/transaction_error_code.hpp>
#include <strongroom/testing/ed25519.hpp>
#include <strongroom/testing/ledger_fixture.hpp>

#include <vector>

using namespace strongroom::schema;
using strongroom::testing::kTestProgramId;
using strongroom::testing::make_hash;

namespace {

const auto kA = make_hash(0x10);
const auto kB = make_hash(0x20);
const auto kD = make_hash(0x40);
const auto kWallet = make_hash(0x60);
const auto kDAppBook = make_hash(0x68);
const auto kBalanceAccount = make_hash(0x70);
const auto kProgram = make_hash(0x78);
const auto kProgramAccount = make_hash(0x7C);
const auto kGuid = make_hash(0x01);
constexpr auto kDay = duration_milliseconds_t{24ull * 60 * 60 * 1000};

uint32_t code(const transaction_error_code value) {
  return static_cast<uint32_t>(value);
}

account_meta_t writable(const address_t& key) {
  return account_meta_t{.key = key, .is_writable = true};
}

account_meta_t readonly(const address_t& key) {
  return account_meta_t{.key = key};
}

account_meta_t signer(const address_t& key) {
  return account_meta_t{.key = key, .is_signer = true};
}

// Wallet {A, B} / 2 with one native balance account, funded with 50'000.
class ledger_wallet : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& ledger = fixture.ledger();
    ledger.credit(kA, 10'000'000);

    auto init = fixture.submit(
        {kA, kWallet, kDAppBook},
        {fixture.create_account(kA, kWallet, kWalletAccountSize),
         fixture.create_account(kA, kDAppBook, kDAppBookAccountSize),
         fixture.wallet_instruction(
             instruction_t{wallet_init_t{.signers = {kA, kB},
                                         .quorum = 2,
                                         .approval_timeout = kDay}},
             {writable(kWallet), writable(kDAppBook), signer(kA)})});
    ASSERT_EQ(init.code, 0u) << init.log << " " << init.info;

    ASSERT_EQ(fixture.allocate(kA, kBalanceAccount, kBalanceAccountSize).code,
              0u);
    auto creation = operation_params_t{balance_account_creation_t{
        .guid_hash = kGuid, .name_hash = make_hash(2)}};
    ASSERT_EQ(run(operation(0), kA, creation, {writable(kBalanceAccount)}).code,
              0u);
    auto approved = vote(operation(0), kB, creation, {writable(kBalanceAccount)});
    ASSERT_EQ(approved.code, 0u) << approved.log << " " << approved.info;

    ASSERT_EQ(
        fixture.submit({kA}, {fixture.transfer_lamports(kA, kBalanceAccount,
                                                         50'000)})
            .code,
        0u);
  }

  static address_t operation(const uint8_t n) {
    return make_hash(static_cast<uint8_t>(0xA0 + n));
  }

  // Allocates the operation account and initiates in the same transaction.
  transaction_result_t run(const address_t& op,
                           const address_t& caller,
                           const operation_params_t& params,
                           std::vector<account_meta_t> tail) {
    auto metas = std::vector<account_meta_t>{writable(op), writable(kWallet),
                                             signer(caller)};
    metas.insert(std::end(metas), std::begin(tail), std::end(tail));
    auto instruction = std::visit(
        [](const auto& value) { return instruction_t{value}; }, params);
    return fixture.submit(
        {caller, op},
        {fixture.create_account(caller, op, kMultisigOpAccountSize),
         fixture.wallet_instruction(instruction, std::move(metas))});
  }

  transaction_result_t vote(const address_t& op,
                            const address_t& caller,
                            const operation_params_t& params,
                            std::vector<account_meta_t> tail) {
    auto metas = std::vector<account_meta_t>{writable(op), writable(kWallet),
                                             signer(caller)};
    metas.insert(std::end(metas), std::begin(tail), std::end(tail));
    return fixture.submit(
        {caller},
        {fixture.wallet_instruction(
            instruction_t{approve_t{
                .kind = kind_of(params),
                .params_hash = strongroom::execution::hash_params(params)}},
            std::move(metas))});
  }

  strongroom::testing::ledger_fixture fixture{"strongroom_ledger_wallet"};
};

}  // namespace

TEST_F(ledger_wallet, transfer_executes_after_second_approval) {
  auto& ledger = fixture.ledger();
  auto params = operation_params_t{
      transfer_t{.guid_hash = kGuid, .destination = kD, .amount = 1'234}};
  auto tail = std::vector<account_meta_t>{writable(kBalanceAccount),
                                          writable(kD)};

  auto started = run(operation(1), kA, params, tail);
  ASSERT_EQ(started.code, 0u) << started.log << " " << started.info;
  ASSERT_EQ(started.instruction_results.size(), 1u);
  EXPECT_EQ(started.instruction_results[0].status, operation_status_t::pending);
  EXPECT_EQ(ledger.account(kD).value_or(account_record_t{}).lamports, 0u);

  auto approved = vote(operation(1), kB, params, tail);
  ASSERT_EQ(approved.code, 0u) << approved.log << " " << approved.info;
  EXPECT_EQ(approved.instruction_results[0].status,
            operation_status_t::approved);

  auto destination = ledger.account(kD);
  ASSERT_TRUE(destination.has_value());
  EXPECT_EQ(destination->lamports, 1'234u);
  EXPECT_EQ(ledger.account(kBalanceAccount)->lamports, 1'000u + 50'000u - 1'234u);
  EXPECT_EQ(ledger.nonce(kB), 2u);
}

TEST_F(ledger_wallet, program_failure_rolls_back_the_transaction) {
  auto& ledger = fixture.ledger();
  auto height = ledger.height();
  auto nonce = ledger.nonce(kA);
  auto params = operation_params_t{
      transfer_t{.guid_hash = kGuid, .destination = kD, .amount = 0}};
  auto result = run(operation(1), kA, params,
                    {writable(kBalanceAccount), writable(kD)});

  EXPECT_EQ(result.code, code(transaction_error_code::instruction_failed));
  EXPECT_EQ(result.codespace, "strongroom.ledger");
  EXPECT_EQ(result.info, "invalid amount");
  ASSERT_EQ(result.instruction_results.size(), 1u);
  EXPECT_EQ(result.instruction_results[0].code,
            static_cast<uint32_t>(program_error_code::invalid_amount));

  EXPECT_FALSE(ledger.account(operation(1)).has_value());
  EXPECT_EQ(ledger.height(), height + 1);
  EXPECT_EQ(ledger.nonce(kA), nonce + 1);
}

TEST_F(ledger_wallet, expiry_follows_block_time) {
  auto& ledger = fixture.ledger();
  auto params = operation_params_t{
      transfer_t{.guid_hash = kGuid, .destination = kD, .amount = 10}};
  auto tail = std::vector<account_meta_t>{writable(kBalanceAccount),
                                          writable(kD)};
  ASSERT_EQ(run(operation(1), kA, params, tail).code, 0u);

  ledger.set_block_time(ledger.block_time() + kDay + 1);
  auto late = vote(operation(1), kB, params, tail);
  EXPECT_EQ(late.code, code(transaction_error_code::instruction_failed));
  EXPECT_EQ(late.instruction_results[0].code,
            static_cast<uint32_t>(program_error_code::operation_expired));

  auto reaped = fixture.submit(
      {kB},
      {fixture.wallet_instruction(
          instruction_t{reap_operation_t{.kind = operation_kind_t::transfer}},
          {writable(operation(1)), writable(kWallet), readonly(kB),
           writable(kBalanceAccount), writable(kD)})});
  ASSERT_EQ(reaped.code, 0u) << reaped.log << " " << reaped.info;

  auto initiator_lamports = ledger.account(kA)->lamports;
  auto closed = fixture.submit(
      {kA}, {fixture.wallet_instruction(instruction_t{close_operation_t{}},
                                        {writable(operation(1)), writable(kA)})});
  ASSERT_EQ(closed.code, 0u) << closed.log << " " << closed.info;
  EXPECT_EQ(ledger.account(kA)->lamports, initiator_lamports + 1'000u);
  EXPECT_EQ(ledger.account(operation(1))->lamports, 0u);
  EXPECT_EQ(ledger.account(kD).value_or(account_record_t{}).lamports, 0u);
}

TEST_F(ledger_wallet, dapp_transaction_invokes_registered_program) {
  auto& ledger = fixture.ledger();
  auto calls = std::vector<address_t>{};
  ledger.register_program(
      kProgram, [&](const address_t& authority,
                    strongroom::execution::accounts_t accounts,
                    const bytes_view_t& payload)
                    -> strongroom::execution::host_error_t {
        calls.push_back(authority);
        if (accounts.size() != 1 || payload.empty()) {
          return program_error_code::external_invocation_failed;
        }
        accounts[0].data[0] = payload[0];
        return std::nullopt;
      });
  ASSERT_EQ(fixture
                .submit({kA, kProgramAccount},
                        {fixture.create_account(kA, kProgramAccount, 8, 1'000,
                                                kProgram)})
                .code,
            0u);

  auto book_update = operation_params_t{
      dapp_book_update_t{.add = {dapp_entry_t{.program_id = kProgram}}}};
  ASSERT_EQ(run(operation(1), kA, book_update, {writable(kDAppBook)}).code, 0u);
  ASSERT_EQ(vote(operation(1), kB, book_update, {writable(kDAppBook)}).code, 0u);

  auto enable = operation_params_t{balance_account_update_t{
      .guid_hash = kGuid, .name_hash = make_hash(2), .dapps_enabled = true}};
  ASSERT_EQ(run(operation(2), kA, enable, {writable(kBalanceAccount)}).code, 0u);
  ASSERT_EQ(vote(operation(2), kB, enable, {writable(kBalanceAccount)}).code, 0u);

  auto transaction = operation_params_t{dapp_transaction_t{
      .guid_hash = kGuid,
      .program_id = kProgram,
      .payload = {0x2A},
      .accounts = {dapp_account_meta_t{.address = kProgramAccount,
                                       .is_writable = true}}}};
  auto tail = std::vector<account_meta_t>{
      writable(kBalanceAccount), readonly(kDAppBook), readonly(kProgram),
      writable(kProgramAccount)};
  ASSERT_EQ(run(operation(3), kA, transaction, tail).code, 0u);
  EXPECT_TRUE(calls.empty());

  auto result = vote(operation(3), kB, transaction, tail);
  ASSERT_EQ(result.code, 0u) << result.log << " " << result.info;
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0], kBalanceAccount);
  EXPECT_EQ(ledger.account(kProgramAccount)->data[0], 0x2A);
}

TEST(ledger, rejects_bad_envelopes_without_advancing) {
  auto fixture = strongroom::testing::ledger_fixture{};
  auto& ledger = fixture.ledger();
  ledger.credit(kA, 1'000);
  auto transfer = fixture.transfer_lamports(kA, kD, 1);

  auto stale = fixture.make_tx({kA}, {transfer});
  stale.nonce = 5;
  auto result = ledger.execute(stale);
  EXPECT_EQ(result.code, code(transaction_error_code::invalid_nonce));
  EXPECT_EQ(result.info, "expected 0");

  auto foreign = fixture.make_tx({kA}, {transfer});
  foreign.chain_id = make_hash(0x99);
  EXPECT_EQ(ledger.execute(foreign).code,
            code(transaction_error_code::invalid_chain_id));

  auto unsigned_tx = fixture.make_tx({kA}, {transfer});
  unsigned_tx.signatures.clear();
  EXPECT_EQ(ledger.execute(unsigned_tx).code,
            code(transaction_error_code::missing_signature));

  EXPECT_EQ(fixture.submit({kA, kA}, {transfer}).code,
            code(transaction_error_code::duplicate_account));
  EXPECT_EQ(fixture.submit({kA}, {}).code,
            code(transaction_error_code::invalid_transaction));

  auto garbage = bytes_t{0x01, 0x02};
  EXPECT_EQ(ledger.execute(bytes_view_t{garbage.data(), garbage.size()}).code,
            code(transaction_error_code::invalid_transaction));

  EXPECT_EQ(ledger.height(), 0u);
  EXPECT_EQ(ledger.nonce(kA), 0u);
  EXPECT_TRUE(is_zero(ledger.state_root()));
}

TEST(ledger, failed_instruction_still_consumes_nonce) {
  auto fixture = strongroom::testing::ledger_fixture{};
  auto& ledger = fixture.ledger();
  ledger.credit(kA, 1'000);

  auto result = fixture.submit(
      {kA}, {fixture.transfer_lamports(kA, kD, 100),
             strongroom::schema::ledger_instruction_t{.program_id = kProgram}});
  EXPECT_EQ(result.code, code(transaction_error_code::unknown_program));
  EXPECT_EQ(ledger.height(), 1u);
  EXPECT_EQ(ledger.nonce(kA), 1u);
  EXPECT_EQ(ledger.account(kA)->lamports, 1'000u);
  EXPECT_FALSE(ledger.account(kD).has_value());
  EXPECT_FALSE(is_zero(ledger.state_root()));
}

TEST(ledger, system_program_checks) {
  auto fixture = strongroom::testing::ledger_fixture{};
  auto& ledger = fixture.ledger();
  ledger.credit(kA, 1'000);

  EXPECT_EQ(fixture.submit({kA}, {fixture.transfer_lamports(kA, kD, 5'000)})
                .code,
            code(transaction_error_code::insufficient_funds));
  EXPECT_EQ(fixture.submit({kA, kB}, {fixture.create_account(kA, kB, 16, 2'000)})
                .code,
            code(transaction_error_code::insufficient_funds));

  auto unsigned_target = fixture.create_account(kA, kB, 16);
  unsigned_target.accounts[1].is_signer = false;
  EXPECT_EQ(fixture.submit({kA}, {unsigned_target}).code,
            code(transaction_error_code::invalid_system_instruction));

  ASSERT_EQ(fixture.allocate(kA, kB, 16).code, 0u);
  EXPECT_EQ(fixture.allocate(kA, kB, 16).code,
            code(transaction_error_code::account_in_use));
  auto created = ledger.account(kB);
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ(created->owner, kTestProgramId);
  EXPECT_EQ(created->data.size(), 16u);
  EXPECT_EQ(ledger.account(kA)->lamports, 0u);
}

TEST(ledger, signer_flag_requires_a_transaction_signature) {
  auto fixture = strongroom::testing::ledger_fixture{};
  fixture.ledger().credit(kA, 1'000);
  auto transfer = fixture.transfer_lamports(kA, kD, 1);
  auto result = fixture.submit({kB}, {transfer});
  EXPECT_EQ(result.code, code(transaction_error_code::missing_signature));
  EXPECT_EQ(fixture.ledger().nonce(kB), 1u);
  EXPECT_EQ(fixture.ledger().account(kA)->lamports, 1'000u);
}

TEST(ledger, external_programs_are_sandboxed) {
  auto fixture = strongroom::testing::ledger_fixture{};
  auto& ledger = fixture.ledger();
  ledger.credit(kA, 1'000);
  ledger.register_program(
      kProgram, [](const address_t&, strongroom::execution::accounts_t accounts,
                   const bytes_view_t& payload)
                    -> strongroom::execution::host_error_t {
        if (payload.empty()) {
          accounts[0].data.push_back(1);
        } else {
          accounts[0].lamports += payload[0];
        }
        return std::nullopt;
      });
  auto call = [&](const account_meta_t& meta, bytes_t payload) {
    return fixture.submit(
        {kA}, {ledger_instruction_t{.program_id = kProgram,
                                    .accounts = {meta},
                                    .data = std::move(payload)}});
  };

  EXPECT_EQ(call(readonly(kD), {}).code,
            code(transaction_error_code::readonly_account_modified));
  EXPECT_EQ(call(writable(kD), {}).code,
            code(transaction_error_code::unowned_account_modified));
  EXPECT_EQ(call(writable(kD), {7}).code,
            code(transaction_error_code::lamports_not_conserved));
  EXPECT_FALSE(ledger.account(kD).has_value());
}

TEST(ledger, state_is_deterministic_and_durable) {
  auto first = strongroom::testing::ledger_fixture{"strongroom_ledger_first"};
  auto second = strongroom::testing::ledger_fixture{"strongroom_ledger_second"};
  for (auto* fixture : {&first, &second}) {
    fixture->ledger().credit(kA, 1'000);
    ASSERT_EQ(
        fixture->submit({kA}, {fixture->transfer_lamports(kA, kD, 10)}).code,
        0u);
  }
  EXPECT_EQ(first.ledger().state_root(), second.ledger().state_root());

  auto root = first.ledger().state_root();
  ASSERT_EQ(
      first.submit({kA}, {first.transfer_lamports(kA, kD, 10)}).code, 0u);
  EXPECT_NE(first.ledger().state_root(), root);
  root = first.ledger().state_root();

  first.reopen();
  EXPECT_EQ(first.ledger().height(), 2u);
  EXPECT_EQ(first.ledger().state_root(), root);
  EXPECT_EQ(first.ledger().nonce(kA), 2u);
  EXPECT_EQ(first.ledger().account(kD)->lamports, 20u);
}

TEST(ledger, verifies_ed25519_signatures) {
  if (!strongroom::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto payer = strongroom::testing::ed25519_keypair::generate();
  ASSERT_TRUE(payer.has_value());

  auto fixture = strongroom::testing::ledger_fixture{};
  fixture.use_openssl_verifier();
  auto& ledger = fixture.ledger();
  ledger.credit(payer->public_key(), 500);

  auto tx = fixture.make_tx({payer->public_key()},
                            {fixture.transfer_lamports(payer->public_key(),
                                                       kD, 200)});
  auto payload = strongroom::runtime::make_signing_payload(tx);
  tx.signatures[0] = payer->sign(bytes_view_t{payload.data(), payload.size()});

  auto forged = tx;
  forged.instructions[0] = fixture.transfer_lamports(payer->public_key(), kD, 500);
  EXPECT_EQ(ledger.execute(forged).code,
            code(transaction_error_code::signature_verification_failed));

  auto result = ledger.execute(tx);
  ASSERT_EQ(result.code, 0u) << result.log << " " << result.info;
  EXPECT_EQ(ledger.account(kD)->lamports, 200u);
  EXPECT_EQ(ledger.nonce(payer->public_key()), 1u);
}

TEST_F(ledger_wallet, spl_transfer_moves_minted_tokens) {
  auto& ledger = fixture.ledger();
  const auto mint = make_hash(0x90);
  const auto token_account = make_hash(0x74);
  const auto token_guid = make_hash(0x03);

  ASSERT_EQ(fixture.allocate(kA, token_account, kBalanceAccountSize).code, 0u);
  auto creation = operation_params_t{balance_account_creation_t{
      .guid_hash = token_guid,
      .name_hash = make_hash(3),
      .asset = asset_ref_t{.kind = asset_kind_t::token, .mint = mint}}};
  ASSERT_EQ(run(operation(1), kA, creation, {writable(token_account)}).code,
            0u);
  ASSERT_EQ(vote(operation(1), kB, creation, {writable(token_account)}).code,
            0u);
  ledger.mint_tokens(token_account, mint, 900);

  auto params = operation_params_t{spl_transfer_t{
      .guid_hash = token_guid, .destination = kD, .mint = mint, .amount = 250}};
  auto tail =
      std::vector<account_meta_t>{writable(token_account), writable(kD)};
  auto started = run(operation(2), kA, params, tail);
  ASSERT_EQ(started.code, 0u) << started.log << " " << started.info;
  EXPECT_EQ(ledger.token_balance(kD, mint), 0u);

  auto root = ledger.state_root();
  auto approved = vote(operation(2), kB, params, tail);
  ASSERT_EQ(approved.code, 0u) << approved.log << " " << approved.info;
  EXPECT_EQ(approved.instruction_results[0].status,
            operation_status_t::approved);
  EXPECT_EQ(ledger.token_balance(token_account, mint), 650u);
  EXPECT_EQ(ledger.token_balance(kD, mint), 250u);
  EXPECT_NE(ledger.state_root(), root);

  auto overdraw = operation_params_t{spl_transfer_t{
      .guid_hash = token_guid, .destination = kD, .mint = mint, .amount = 651}};
  ASSERT_EQ(run(operation(3), kA, overdraw, tail).code, 0u);
  auto failed = vote(operation(3), kB, overdraw, tail);
  EXPECT_EQ(failed.code, code(transaction_error_code::instruction_failed));
  EXPECT_EQ(failed.info, "insufficient funds");
  EXPECT_EQ(ledger.token_balance(token_account, mint), 650u);
  EXPECT_EQ(ledger.token_balance(kD, mint), 250u);
}
