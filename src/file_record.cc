#include "declutter/file_record.hh"

namespace declutter {

inline namespace detail_v1 {

std::string_view to_string(const scan_error_t err) noexcept {
  switch (err) {
    case scan_error_t::none:
      return "";
    case scan_error_t::unreadable:
      return "unreadable";
    case scan_error_t::empty:
      return "empty";
  }
  return "unknown";
}

std::string_view to_string(const action_t act) noexcept {
  switch (act) {
    case action_t::keep:
      return "keep";
    case action_t::archive:
      return "archive";
    case action_t::remove:
      return "delete";
  }
  return "unknown";
}

}  // namespace detail_v1

}  // namespace declutter
