#include "invite/token.hpp"
#include "util/text_util.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <vector>

namespace warmpath {

namespace {

std::string randomHex(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        unsigned long err = ERR_get_error();
        char msg[256];
        ERR_error_string_n(err, msg, sizeof(msg));
        throw TokenError(std::string("RAND_bytes failed: ") + msg);
    }
    return text::toHex(buf.data(), buf.size());
}

} // namespace

std::string generateToken() {
    return randomHex(kTokenBytes);
}

std::string generateInviteId() {
    return "invite_" + randomHex(8);
}

} // namespace warmpath
