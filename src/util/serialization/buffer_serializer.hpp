// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_SERIALIZATION_BUFFER_SERIALIZER_H_
#define SHARDX_SRC_SERIALIZATION_BUFFER_SERIALIZER_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"

namespace shardx {
    /// Serializer implementation for \ref buffer. Writes append to the end of
    /// the buffer, reads consume bytes from the cursor position.
    class buffer_serializer final : public serializer {
      public:
        /// Constructor.
        /// \param pkt buffer to serialize into or out of. Must outlive the
        ///            serializer.
        explicit buffer_serializer(buffer& pkt);

        explicit operator bool() const final;

        void reset() final;
        void invalidate() final;
        [[nodiscard]] auto end_of_buffer() const -> bool final;

        auto write(const void* data, size_t len) -> bool final;
        auto read(void* data, size_t len) -> bool final;

      private:
        buffer& m_pkt;
        size_t m_cursor{0};
        bool m_valid{true};
    };
}

#endif
