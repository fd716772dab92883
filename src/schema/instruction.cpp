#include <strongroom/schema/instruction.hpp>

namespace strongroom::schema {

std::optional<operation_params_t> to_operation_params(
    const instruction_t& instruction) {
  auto params = std::optional<operation_params_t>{};
  std::visit(
      overloaded{[&](const wallet_init_t& value) { params = value; },
                 [&](const wallet_config_update_t& value) { params = value; },
                 [&](const balance_account_creation_t& value) {
                   params = value;
                 },
                 [&](const balance_account_update_t& value) {
                   params = value;
                 },
                 [&](const whitelist_update_t& value) { params = value; },
                 [&](const transfer_t& value) { params = value; },
                 [&](const spl_transfer_t& value) { params = value; },
                 [&](const dapp_transaction_t& value) { params = value; },
                 [&](const dapp_book_update_t& value) { params = value; },
                 [&](const approve_t&) {}, [&](const disapprove_t&) {},
                 [&](const reap_operation_t&) {},
                 [&](const close_operation_t&) {}},
      instruction);
  return params;
}

}  // namespace strongroom::schema
