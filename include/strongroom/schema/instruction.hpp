#pragma once
#include <strongroom/schema/operation_params.hpp>
#include <strongroom/schema/vote_instruction.hpp>

#include <optional>
#include <variant>

// Schema type: instruction.
// Wire form of a program instruction. The first nine alternatives carry the
// params of the operation kind with the same index: `wallet_init_t` is the
// direct init_wallet instruction, the rest initiate a multisig operation.
namespace strongroom::schema {

using instruction_t = std::variant<wallet_init_t,
                                   wallet_config_update_t,
                                   balance_account_creation_t,
                                   balance_account_update_t,
                                   whitelist_update_t,
                                   transfer_t,
                                   spl_transfer_t,
                                   dapp_transaction_t,
                                   dapp_book_update_t,
                                   approve_t,
                                   disapprove_t,
                                   reap_operation_t,
                                   close_operation_t>;

inline constexpr auto kInstructionVersion = uint16_t{1};

inline uint16_t version_of(const instruction_t& instruction) {
  return std::visit([](const auto& value) { return value.version; },
                    instruction);
}

/// Params carried by an initiation instruction, std::nullopt otherwise.
std::optional<operation_params_t> to_operation_params(
    const instruction_t& instruction);

}  // namespace strongroom::schema
