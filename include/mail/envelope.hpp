#ifndef MAILCHUNK_MAIL_ENVELOPE_HPP
#define MAILCHUNK_MAIL_ENVELOPE_HPP

#include <any>
#include <string>
#include <unordered_map>
#include <vector>
#include "mail/address.hpp"
#include "mail/mime_part.hpp"

namespace mailchunk {
namespace mail {

// Keys of the metadata map shared between pipeline stages
inline constexpr const char* MIME_PARTS_KEY = "MimeParts";
inline constexpr const char* MESSAGE_ID_KEY = "messageID";

using Values = std::unordered_map<std::string, std::any>;

// A single SMTP transaction in flight
struct Envelope {
  Address mail_from;
  std::vector<Address> rcpt_to;
  std::string helo;
  std::string remote_ip;
  bool tls{false};
  std::string queued_id;
  Values values;

  // Returns the analyzer's part list, or nullptr when none was published
  PartListPtr mime_parts() const {
    auto it = values.find(MIME_PARTS_KEY);
    if (it == values.end()) {
      return nullptr;
    }
    if (auto parts = std::any_cast<PartListPtr>(&it->second)) {
      return *parts;
    }
    return nullptr;
  }
};

} // namespace mail
} // namespace mailchunk

#endif // MAILCHUNK_MAIL_ENVELOPE_HPP
