#include <strongroom/schema/encoding/scale/encoder.hpp>
#include <strongroom/schema/record.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>

namespace strongroom::schema {

namespace {

using encoder_t = strongroom::schema::encoding::encoder<
    strongroom::schema::encoding::scale_encoder_tag>;

struct record_header_t final {
  uint8_t kind;
  boost::endian::little_uint32_buf_t length;
};

static_assert(sizeof(record_header_t) == kRecordHeaderSize);

constexpr auto kSupportedVersion = uint16_t{1};

record_header_t read_header(const bytes_view_t& data) {
  auto header = record_header_t{};
  std::memcpy(&header, data.data(), sizeof(header));
  return header;
}

uint16_t read_version(const bytes_view_t& payload) {
  auto version = boost::endian::little_uint16_buf_t{};
  std::memcpy(&version, payload.data(), sizeof(version));
  return version.value();
}

}  // namespace

std::optional<record_kind_t> peek_record_kind(const bytes_view_t& data) {
  if (data.size() < kRecordHeaderSize) {
    return std::nullopt;
  }
  auto kind = data[0];
  if (kind > static_cast<uint8_t>(record_kind_t::multisig_op)) {
    return std::nullopt;
  }
  return static_cast<record_kind_t>(kind);
}

bool is_uninitialized(const bytes_view_t& data) {
  return peek_record_kind(data) == record_kind_t::uninitialized;
}

bool well_formed(const wallet_state_t& record) {
  return record.signers.well_formed() && record.guardians.well_formed();
}

bool well_formed(const balance_account_state_t& record) {
  return record.whitelist.well_formed();
}

bool well_formed(const dapp_book_state_t& record) {
  return record.entries.well_formed();
}

bool well_formed(const multisig_op_state_t& record) {
  if (!record.votes.well_formed()) {
    return false;
  }
  if (record.params.has_value() &&
      version_of(*record.params) != kSupportedVersion) {
    return false;
  }
  // One vote per voter; the set orders by voter first.
  auto votes = record.votes.entries();
  return std::adjacent_find(std::begin(votes), std::end(votes),
                            [](const auto& lhs, const auto& rhs) {
                              return lhs.voter == rhs.voter;
                            }) == std::end(votes);
}

template <typename T>
std::optional<program_error_code> load_record(const bytes_view_t& data,
                                              T& out) {
  auto kind = peek_record_kind(data);
  if (!kind.has_value()) {
    return program_error_code::invalid_account_data;
  }
  if (*kind != record_traits<T>::kind) {
    return program_error_code::invalid_account_kind;
  }

  auto header = read_header(data);
  auto length = static_cast<std::size_t>(header.length.value());
  if (length > data.size() - kRecordHeaderSize || length < sizeof(uint16_t)) {
    return program_error_code::invalid_account_data;
  }

  auto payload = data.subspan(kRecordHeaderSize, length);
  if (read_version(payload) != kSupportedVersion) {
    return program_error_code::invalid_account_data;
  }

  auto padding = data.subspan(kRecordHeaderSize + length);
  if (std::any_of(std::begin(padding), std::end(padding),
                  [](const uint8_t byte) { return byte != 0; })) {
    return program_error_code::invalid_account_data;
  }

  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<T>(payload);
  if (!decoded.has_value() || !well_formed(*decoded)) {
    return program_error_code::invalid_account_data;
  }
  out = std::move(*decoded);
  return std::nullopt;
}

template <typename T>
std::optional<program_error_code> encode_record(const T& record,
                                                const std::size_t capacity,
                                                bytes_t& out) {
  auto encoder = encoder_t{};
  auto payload = encoder.encode(record);
  if (capacity < kRecordHeaderSize ||
      payload.size() > capacity - kRecordHeaderSize) {
    return program_error_code::account_data_too_small;
  }

  auto header = record_header_t{};
  header.kind = static_cast<uint8_t>(record_traits<T>::kind);
  header.length = static_cast<uint32_t>(payload.size());

  out.assign(capacity, uint8_t{0});
  std::memcpy(out.data(), &header, sizeof(header));
  std::copy(std::begin(payload), std::end(payload),
            std::begin(out) + kRecordHeaderSize);
  return std::nullopt;
}

template <typename T>
std::optional<program_error_code> store_record(const T& record,
                                               std::span<uint8_t> data) {
  auto image = bytes_t{};
  if (auto error = encode_record(record, data.size(), image)) {
    return error;
  }
  std::copy(std::begin(image), std::end(image), std::begin(data));
  return std::nullopt;
}

template std::optional<program_error_code> load_record(const bytes_view_t&,
                                                       wallet_state_t&);
template std::optional<program_error_code> load_record(
    const bytes_view_t&,
    balance_account_state_t&);
template std::optional<program_error_code> load_record(const bytes_view_t&,
                                                       dapp_book_state_t&);
template std::optional<program_error_code> load_record(const bytes_view_t&,
                                                       multisig_op_state_t&);

template std::optional<program_error_code>
encode_record(const wallet_state_t&, std::size_t, bytes_t&);
template std::optional<program_error_code>
encode_record(const balance_account_state_t&, std::size_t, bytes_t&);
template std::optional<program_error_code>
encode_record(const dapp_book_state_t&, std::size_t, bytes_t&);
template std::optional<program_error_code>
encode_record(const multisig_op_state_t&, std::size_t, bytes_t&);

template std::optional<program_error_code> store_record(const wallet_state_t&,
                                                        std::span<uint8_t>);
template std::optional<program_error_code> store_record(
    const balance_account_state_t&,
    std::span<uint8_t>);
template std::optional<program_error_code> store_record(
    const dapp_book_state_t&,
    std::span<uint8_t>);
template std::optional<program_error_code> store_record(
    const multisig_op_state_t&,
    std::span<uint8_t>);

}  // namespace strongroom::schema
