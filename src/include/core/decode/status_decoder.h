#pragma once

#include <core/model/status_snapshot.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tailkit::core {

// Raised for any deviation from the `status --json` contract. what() names
// the JSON path of the offending field.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parses the output of `tailscale status --json`.
//
// `Self` {PublicKey, HostName} and `Peer` {<key>: {HostName, Online,
// TailscaleIPs, OS}} are mandatory with exact-case names and exact JSON
// types. A single malformed peer rejects the whole document. Unknown fields
// are ignored.
StatusSnapshot DecodeStatus(std::string_view json_text);

} // namespace tailkit::core
