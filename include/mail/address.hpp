#ifndef MAILCHUNK_MAIL_ADDRESS_HPP
#define MAILCHUNK_MAIL_ADDRESS_HPP

#include <string>
#include <string_view>
#include <stdexcept>

namespace mailchunk {
namespace mail {

class AddressParseError : public std::runtime_error {
public:
  explicit AddressParseError(const std::string& message) : std::runtime_error(message) {}
};

struct Address {
  std::string user;
  std::string host;
  std::string display_name;
  // True for the "<>" reverse path
  bool null_path{false};

  // Parses "local@domain", "<local@domain>" or "Display Name <local@domain>".
  // Throws AddressParseError when the text does not hold a mailbox.
  static Address parse(std::string_view text);

  // Renders local@domain, or an empty string for the null path
  std::string to_string() const;
};

} // namespace mail
} // namespace mailchunk

#endif // MAILCHUNK_MAIL_ADDRESS_HPP
