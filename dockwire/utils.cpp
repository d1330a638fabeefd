//
// Created by dc on 09/11/18.
//

#include <algorithm>

#include "utils.h"

namespace dockwire {

    std::string utils::urlencode(const strview &str) {
        std::string out;
        out.reserve(str.size()*3);
        for (auto ch: str) {
            auto c = (uint8_t) ch;
            bool unreserved = isalnum(c) || (c != 0 && strchr("-_.~", c) != nullptr);
            if (!unreserved) {
                static const char hexchars[] = "0123456789ABCDEF";
                out += '%';
                out += hexchars[(c&0xF0)>>4];
                out += hexchars[(c&0x0F)];
            }
            else {
                out += (char) c;
            }
        }

        return out;
    }

    void utils::base64::encode(OBuffer& ob, const uint8_t *data, size_t sz) {
        static const char B64[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        ob.reserve(2+((sz+2)/3*4));

        char *it = ob.end();
        for (size_t i = 0; i < sz; i += 3) {
            size_t left = std::min<size_t>(3, sz - i);
            // pack up to 3 input bytes into a 24 bit group
            uint32_t group = (uint32_t) data[i] << 16;
            if (left > 1) group |= (uint32_t) data[i+1] << 8;
            if (left > 2) group |= data[i+2];

            it[0] = B64[(group >> 18) & 0x3F];
            it[1] = B64[(group >> 12) & 0x3F];
            it[2] = left > 1? B64[(group >> 6) & 0x3F] : '=';
            it[3] = left > 2? B64[group & 0x3F] : '=';
            it += 4;
        }

        ob.seek(it - ob.end());
    }
}
