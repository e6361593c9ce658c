#include <remit/authorization/registry.hpp>
#include <remit/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace remit::schema;

namespace {

constexpr auto kCodespace = std::string_view{"remit.registry"};

std::string principal_hex(const principal_t& principal) {
  return to_hex(bytes_view_t{principal.data(), principal.size()});
}

}  // namespace

namespace remit::authorization {

registry::registry(encoder_t& encoder,
                   storage_t& storage,
                   const principal_t& bootstrap_owner)
    : encoder_{encoder}, storage_{storage} {
  if (auto persisted = load_owner(encoder_, storage_)) {
    owner_ = *persisted;
    spdlog::debug("Loaded persisted owner {}", principal_hex(owner_));
    return;
  }
  owner_ = bootstrap_owner;
  auto key = key::make_owner_key();
  storage_.put(encoder_, make_bytes_view(key), owner_);
  spdlog::info("Bootstrapped owner {}", principal_hex(owner_));
}

std::optional<principal_t> registry::load_owner(encoder_t& encoder,
                                               const storage_t& storage) {
  auto key = key::make_owner_key();
  return storage.get<principal_t>(encoder, make_bytes_view(key));
}

operation_result_t registry::set_owner(const principal_t& caller,
                                       const principal_t& new_owner) {
  if (!is_owner(caller)) {
    return deny(caller, "set_owner");
  }
  auto key = key::make_owner_key();
  storage_.put(encoder_, make_bytes_view(key), new_owner);
  spdlog::info("Owner changed from {} to {}", principal_hex(owner_),
               principal_hex(new_owner));
  owner_ = new_owner;
  return {};
}

operation_result_t registry::add_signer(const principal_t& caller,
                                        const principal_t& signer) {
  if (!is_owner(caller)) {
    return deny(caller, "add_signer");
  }
  auto key = key::make_signer_key(signer);
  storage_.put(encoder_, make_bytes_view(key), true);
  spdlog::info("Authorized signer {}", principal_hex(signer));
  return {};
}

operation_result_t registry::remove_signer(const principal_t& caller,
                                           const principal_t& signer) {
  if (!is_owner(caller)) {
    return deny(caller, "remove_signer");
  }
  auto key = key::make_signer_key(signer);
  storage_.remove(make_bytes_view(key));
  spdlog::info("Revoked signer {}", principal_hex(signer));
  return {};
}

bool registry::is_authorized(const principal_t& identity) const {
  auto key = key::make_signer_key(identity);
  return storage_.get<bool>(encoder_, make_bytes_view(key)).value_or(false);
}

bool registry::is_owner(const principal_t& identity) const {
  return identity == owner_;
}

const principal_t& registry::owner() const {
  return owner_;
}

std::vector<principal_t> registry::signers() const {
  auto prefix = key::make_prefix_key(key::kSignerKeyPrefix);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));

  auto out = std::vector<principal_t>{};
  out.reserve(rows.size());
  for (const auto& [row_key, value] : rows) {
    auto flagged = encoder_.try_decode<bool>(make_bytes_view(value));
    if (row_key.size() < prefix.size() + principal_t{}.size() ||
        !flagged.value_or(false)) {
      continue;
    }
    auto signer = principal_t{};
    std::copy(std::end(row_key) - static_cast<std::ptrdiff_t>(signer.size()),
              std::end(row_key), std::begin(signer));
    out.push_back(signer);
  }
  return out;
}

operation_result_t registry::deny(const principal_t& caller,
                                  std::string_view operation) const {
  spdlog::warn("Rejected {} from non-owner {}", operation,
               principal_hex(caller));
  return make_error_result(error_code::unauthorized,
                           std::string{operation} + " requires the owner",
                           std::string{kCodespace});
}

}  // namespace remit::authorization
