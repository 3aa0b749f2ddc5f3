#pragma once

#include <system_error>

namespace synod {

enum class Errc {
  Rejected = 1,
  Timeout = 2,
  QuorumUnavailable = 3,
  PersistenceFailure = 4,
  StaleReply = 5,
  AgreementViolation = 6,
  Busy = 7,
};

const std::error_category& ErrorCategory();

std::error_code make_error_code(Errc e);

// Shortcuts

inline std::error_code QuorumUnavailable() {
  return make_error_code(Errc::QuorumUnavailable);
}

inline std::error_code PersistenceFailure() {
  return make_error_code(Errc::PersistenceFailure);
}

// Rejected / Timeout are retried locally by proposers
bool IsRetriableError(std::error_code error);

}  // namespace synod

namespace std {

template <>
struct is_error_code_enum<synod::Errc> : true_type {};

}  // namespace std
