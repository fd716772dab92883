#pragma once

#include <strongroom/execution/account_info.hpp>
#include <strongroom/schema/primitives.hpp>
#include <strongroom/schema/program_error_code.hpp>

#include <functional>
#include <optional>

namespace strongroom::execution {

using host_error_t = std::optional<strongroom::schema::program_error_code>;

/// Primitives the host ledger provides to the program. The program calls
/// them with a balance account as the authority; they return std::nullopt
/// on success.
struct host_services_t final {
  std::function<host_error_t(const strongroom::schema::address_t& from,
                             const strongroom::schema::address_t& to,
                             strongroom::schema::amount_t amount)>
      transfer_native;
  std::function<host_error_t(const strongroom::schema::address_t& from_owner,
                             const strongroom::schema::address_t& to_owner,
                             const strongroom::schema::address_t& mint,
                             strongroom::schema::amount_t amount)>
      transfer_token;
  std::function<host_error_t(const strongroom::schema::address_t& program,
                             const strongroom::schema::address_t& authority,
                             accounts_t accounts,
                             const strongroom::schema::bytes_view_t& payload)>
      invoke;
};

/// Per instruction context. There is no process wide "current wallet"; all
/// state reaches the program through this and the account list.
struct invoke_context_t final {
  strongroom::schema::address_t program_id{};
  strongroom::schema::timestamp_milliseconds_t now{};
  host_services_t& host;
};

}  // namespace strongroom::execution
