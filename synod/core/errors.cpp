#include <synod/core/errors.hpp>

#include <string>

namespace synod {

namespace {

class SynodErrorCategory : public std::error_category {
 public:
  const char* name() const noexcept override {
    return "synod";
  }

  std::string message(int code) const override {
    switch (static_cast<Errc>(code)) {
      case Errc::Rejected:
        return "Rejected by acceptor";
      case Errc::Timeout:
        return "Round deadline expired";
      case Errc::QuorumUnavailable:
        return "Quorum unavailable";
      case Errc::PersistenceFailure:
        return "Acceptor state was not persisted";
      case Errc::StaleReply:
        return "Reply for an abandoned round";
      case Errc::AgreementViolation:
        return "Conflicting decisions";
      case Errc::Busy:
        return "Instance already has an active proposer";
    }
    return "Unknown synod error";
  }
};

}  // namespace

const std::error_category& ErrorCategory() {
  static const SynodErrorCategory category;
  return category;
}

std::error_code make_error_code(Errc e) {
  return {static_cast<int>(e), ErrorCategory()};
}

bool IsRetriableError(std::error_code error) {
  return error == Errc::Rejected || error == Errc::Timeout;
}

}  // namespace synod
