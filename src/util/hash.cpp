#include "util/hash.hpp"
#include <mupdf/fitz.h>

namespace ds {

std::string short_hash(const std::string& key, size_t length) {
    static const char hex[] = "0123456789abcdef";

    fz_md5 state;
    unsigned char digest[16];
    fz_md5_init(&state);
    fz_md5_update(&state, reinterpret_cast<const unsigned char*>(key.data()), key.size());
    fz_md5_final(&state, digest);

    std::string out;
    out.reserve(32);
    for (unsigned char byte : digest) {
        out += hex[byte >> 4];
        out += hex[byte & 0x0F];
    }
    return out.substr(0, length);
}

} // namespace ds
