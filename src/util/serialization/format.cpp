// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

#include <algorithm>

namespace shardx {
    auto operator<<(serializer& ser, const buffer& b) -> serializer& {
        auto len = static_cast<uint64_t>(b.size());
        if(!(ser << len)) {
            return ser;
        }
        ser.write(b.data(), b.size());
        return ser;
    }

    auto operator>>(serializer& deser, buffer& b) -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }
        b.clear();
        // Read in chunks so a corrupt length can't force a huge allocation
        static constexpr uint64_t chunk_size = 4096;
        auto chunk = std::array<unsigned char, chunk_size>();
        while(len > 0) {
            auto n = std::min(len, chunk_size);
            if(!deser.read(chunk.data(), n)) {
                break;
            }
            b.append(chunk.data(), n);
            len -= n;
        }
        return deser;
    }

    auto operator<<(serializer& ser, const std::string& s) -> serializer& {
        auto len = static_cast<uint64_t>(s.size());
        if(!(ser << len)) {
            return ser;
        }
        ser.write(s.data(), s.size());
        return ser;
    }

    auto operator>>(serializer& deser, std::string& s) -> serializer& {
        auto buf = buffer();
        if(!(deser >> buf)) {
            return deser;
        }
        s.assign(static_cast<const char*>(buf.data()), buf.size());
        return deser;
    }
}
