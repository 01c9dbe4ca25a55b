#pragma once

#include <stdexcept>
#include <string>

namespace warmpath {

/// The system random source failed.
class TokenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Number of random bytes behind an invitation token.
constexpr size_t kTokenBytes = 32;

/// Unguessable single-use token: kTokenBytes of CSPRNG output, hex encoded.
/// Throws TokenError if the random source is unavailable.
std::string generateToken();

/// Invitation id: "invite_" followed by 16 random hex characters.
std::string generateInviteId();

} // namespace warmpath
