// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_SERIALIZATION_SERIALIZER_H_
#define SHARDX_SRC_SERIALIZATION_SERIALIZER_H_

#include <cstddef>

namespace shardx {
    /// Interface for serializing objects into and out of raw bytes
    /// representations. Subclass to implement serialization to and from a
    /// specific storage medium.
    class serializer {
      public:
        serializer() = default;
        virtual ~serializer() = default;

        serializer(const serializer&) = delete;
        auto operator=(const serializer&) -> serializer& = delete;
        serializer(serializer&&) = delete;
        auto operator=(serializer&&) -> serializer& = delete;

        /// Indicates whether the last serialization operation succeeded.
        /// \return true if the last operation succeeded.
        virtual explicit operator bool() const = 0;

        /// Resets the cursor to the start of the storage medium and clears
        /// any error state.
        virtual void reset() = 0;

        /// Marks the serializer as having failed. Used by deserializers for
        /// values that were read successfully but are not valid.
        virtual void invalidate() = 0;

        /// Indicates whether the cursor is at the end of the storage medium.
        /// \return true if there are no more bytes to read.
        [[nodiscard]] virtual auto end_of_buffer() const -> bool = 0;

        /// Writes the given bytes to the storage medium.
        /// \param data pointer to the bytes to write.
        /// \param len number of bytes to write.
        /// \return true if the bytes were written successfully.
        virtual auto write(const void* data, size_t len) -> bool = 0;

        /// Reads the given number of bytes from the storage medium.
        /// \param data pointer to a buffer of at least len bytes.
        /// \param len number of bytes to read.
        /// \return true if the bytes were read successfully.
        virtual auto read(void* data, size_t len) -> bool = 0;
    };
}

#endif
