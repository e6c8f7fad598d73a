#include "mail/address.hpp"
#include <algorithm>
#include <cctype>

namespace mailchunk {
namespace mail {

namespace {

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

bool is_atext(char c) {
  if (std::isalnum(static_cast<unsigned char>(c))) {
    return true;
  }
  static constexpr std::string_view specials = "!#$%&'*+-/=?^_`{|}~.";
  return specials.find(c) != std::string_view::npos;
}

void validate_local_part(std::string_view local) {
  if (local.empty()) {
    throw AddressParseError("Address: empty local part");
  }
  // Quoted local parts are accepted as-is
  if (local.size() >= 2 && local.front() == '"' && local.back() == '"') {
    return;
  }
  if (local.front() == '.' || local.back() == '.' ||
      local.find("..") != std::string_view::npos) {
    throw AddressParseError("Address: misplaced dot in local part");
  }
  if (!std::all_of(local.begin(), local.end(), is_atext)) {
    throw AddressParseError("Address: invalid character in local part");
  }
}

void validate_domain(std::string_view domain) {
  if (domain.empty()) {
    throw AddressParseError("Address: empty domain");
  }
  // Address literal, e.g. [192.0.2.1]
  if (domain.front() == '[') {
    if (domain.back() != ']') {
      throw AddressParseError("Address: unterminated address literal");
    }
    return;
  }
  if (domain.front() == '.' || domain.back() == '.' || domain.front() == '-' ||
      domain.find("..") != std::string_view::npos) {
    throw AddressParseError("Address: malformed domain");
  }
  for (char c : domain) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '.') {
      throw AddressParseError("Address: invalid character in domain");
    }
  }
}

} // namespace

Address Address::parse(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    throw AddressParseError("Address: empty address");
  }

  Address address;
  std::string_view mailbox = text;

  auto open = text.rfind('<');
  if (open != std::string_view::npos) {
    auto close = text.find('>', open);
    if (close == std::string_view::npos) {
      throw AddressParseError("Address: missing closing angle bracket");
    }
    std::string_view name = trim(text.substr(0, open));
    if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
      name = name.substr(1, name.size() - 2);
    }
    address.display_name = std::string(name);
    mailbox = trim(text.substr(open + 1, close - open - 1));
    if (mailbox.empty()) {
      address.null_path = true;
      return address;
    }
  }

  auto at = mailbox.rfind('@');
  if (at == std::string_view::npos) {
    throw AddressParseError("Address: missing @ in " + std::string(mailbox));
  }
  std::string_view local = mailbox.substr(0, at);
  std::string_view domain = mailbox.substr(at + 1);
  validate_local_part(local);
  validate_domain(domain);

  address.user = std::string(local);
  address.host = std::string(domain);
  return address;
}

std::string Address::to_string() const {
  if (null_path || (user.empty() && host.empty())) {
    return "";
  }
  return user + "@" + host;
}

} // namespace mail
} // namespace mailchunk
