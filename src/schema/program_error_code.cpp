#include <strongroom/schema/program_error_code.hpp>

namespace strongroom::schema {

std::string_view to_string(const program_error_code code) {
  switch (code) {
    case program_error_code::invalid_instruction:
      return "invalid instruction";
    case program_error_code::not_enough_account_keys:
      return "not enough account keys";
    case program_error_code::invalid_account_owner:
      return "account not owned by program";
    case program_error_code::invalid_account_kind:
      return "account holds a different record kind";
    case program_error_code::invalid_account_data:
      return "account data is malformed";
    case program_error_code::account_not_writable:
      return "account must be writable";
    case program_error_code::account_data_too_small:
      return "account data too small for record";
    case program_error_code::account_mismatch:
      return "account does not match the referenced record";
    case program_error_code::invalid_threshold:
      return "invalid approval threshold";
    case program_error_code::duplicate_signer:
      return "duplicate signer";
    case program_error_code::too_many_signers:
      return "too many signers";
    case program_error_code::invalid_approval_timeout:
      return "approval timeout out of range";
    case program_error_code::invalid_update:
      return "update has no effect or is inconsistent";
    case program_error_code::whitelist_full:
      return "whitelist full";
    case program_error_code::dapp_book_full:
      return "dapp book full";
    case program_error_code::entry_missing:
      return "entry not present";
    case program_error_code::entry_exists:
      return "entry already present";
    case program_error_code::asset_mismatch:
      return "asset does not match balance account";
    case program_error_code::invalid_amount:
      return "invalid amount";
    case program_error_code::params_hash_mismatch:
      return "params hash does not match operation";
    case program_error_code::wallet_init_not_proposable:
      return "wallet init is not a votable operation";
    case program_error_code::unsupported_instruction_version:
      return "unsupported instruction version";
    case program_error_code::missing_required_signature:
      return "missing required signature";
    case program_error_code::unauthorized_signer:
      return "caller is not an authorized signer";
    case program_error_code::duplicate_vote:
      return "signer already voted";
    case program_error_code::guardian_not_permitted:
      return "guardians may only vote on high-risk operations";
    case program_error_code::destination_not_whitelisted:
      return "destination not whitelisted";
    case program_error_code::program_not_whitelisted:
      return "program not in dapp book";
    case program_error_code::dapps_disabled:
      return "dapp transactions disabled for balance account";
    case program_error_code::account_already_initialized:
      return "account already initialized";
    case program_error_code::operation_not_pending:
      return "operation not pending";
    case program_error_code::operation_kind_mismatch:
      return "operation kind mismatch";
    case program_error_code::operation_not_expired:
      return "operation not expired";
    case program_error_code::operation_not_terminal:
      return "operation still pending";
    case program_error_code::concurrent_operation_not_allowed:
      return "another update of this record is pending";
    case program_error_code::balance_account_inactive:
      return "balance account inactive";
    case program_error_code::operation_expired:
      return "operation expired";
    case program_error_code::insufficient_funds:
      return "insufficient funds";
    case program_error_code::external_invocation_failed:
      return "external invocation failed";
  }
  return "unknown";
}

}  // namespace strongroom::schema
