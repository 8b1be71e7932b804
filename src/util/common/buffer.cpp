// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer.hpp"

#include <cstring>

namespace shardx {
    auto buffer::size() const -> size_t {
        return m_data.size();
    }

    auto buffer::data() -> void* {
        return m_data.data();
    }

    auto buffer::data() const -> const void* {
        return m_data.data();
    }

    auto buffer::data_at(size_t offset) -> void* {
        return &m_data.at(offset);
    }

    auto buffer::data_at(size_t offset) const -> const void* {
        return &m_data.at(offset);
    }

    void buffer::append(const void* data, size_t len) {
        if(len == 0) {
            return;
        }
        const auto orig_size = m_data.size();
        m_data.resize(orig_size + len);
        std::memcpy(&m_data[orig_size], data, len);
    }

    void buffer::clear() {
        m_data.clear();
    }

    auto buffer::operator==(const buffer& other) const -> bool {
        return m_data == other.m_data;
    }

    auto buffer::operator!=(const buffer& other) const -> bool {
        return !(*this == other);
    }

    auto buffer::c_ptr() const -> const unsigned char* {
        return reinterpret_cast<const unsigned char*>(m_data.data());
    }

    void buffer::extend(size_t len) {
        m_data.resize(m_data.size() + len);
    }
}
