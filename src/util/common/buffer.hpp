// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_COMMON_BUFFER_H_
#define SHARDX_SRC_COMMON_BUFFER_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shardx {
    /// Buffer to store and retrieve byte data.
    class buffer {
      public:
        buffer() = default;

        /// Returns the number of bytes contained in the buffer.
        /// \return the number of bytes.
        [[nodiscard]] auto size() const -> size_t;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return a pointer to the data.
        auto data() -> void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return a pointer to the data.
        [[nodiscard]] auto data() const -> const void*;

        /// Returns a raw pointer to the start of the buffer data at the given
        /// byte offset.
        /// \param offset the position to read from.
        /// \return a pointer to the data.
        auto data_at(size_t offset) -> void*;

        /// \copydoc data_at(size_t)
        [[nodiscard]] auto data_at(size_t offset) const -> const void*;

        /// Adds the given number of bytes from the given pointer to the end
        /// of the buffer.
        /// \param data pointer to the data to append.
        /// \param len number of bytes to append.
        void append(const void* data, size_t len);

        /// Removes any bytes from the buffer.
        void clear();

        auto operator==(const buffer& other) const -> bool;
        auto operator!=(const buffer& other) const -> bool;

        /// Returns a pointer to the data, cast to unsigned char*.
        /// \return the buffer data as an unsigned char pointer.
        [[nodiscard]] auto c_ptr() const -> const unsigned char*;

        /// Extends the size of the buffer by the given length, filling the
        /// new bytes with zero.
        /// \param len the number of bytes to add to the buffer.
        void extend(size_t len);

      private:
        std::vector<std::byte> m_data{};
    };
}

#endif
