#pragma once

#include <strongroom/execution/account_info.hpp>
#include <strongroom/execution/invoke_context.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/program_result.hpp>

namespace strongroom::execution {

/// Entry point of the wallet program.
///
/// Decodes a SCALE `instruction_t`, checks the supplied accounts (count,
/// ownership, record kind, signer and writable flags, links between the
/// records) and hands off to the operation machine. Any failed check returns
/// an error result without touching `accounts`.
strongroom::schema::program_result_t process_instruction(
    const invoke_context_t& context,
    accounts_t accounts,
    const strongroom::schema::bytes_view_t& instruction_data);

}  // namespace strongroom::execution
