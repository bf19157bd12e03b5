#include "errors.hpp"
#include <string>

namespace fragcast {

namespace {

class FragcastCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "fragcast"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::record_too_large:
      return "record exceeds datagram length";
    case errc::message_too_large:
      return "message needs more pieces than a chunk can number";
    case errc::malformed_datagram:
      return "malformed datagram";
    default:
      return "unknown fragcast error";
    }
  }
};

} // namespace

const std::error_category &error_category() {
  static FragcastCategory cat;
  return cat;
}

} // namespace fragcast
