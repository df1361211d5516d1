/**
 * @file io_stream.hh
 * @brief Read-only byte source used by the codecs
 * @ingroup sdk_io
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_IO_STREAM_HH
#define AUDIOCONV_SDK_IO_STREAM_HH

#include <audioconv/sdk/types.hh>
#include <audioconv/sdk/buffer.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>

#include <filesystem>
#include <memory>

namespace audioconv {

    enum class seek_origin : int {
        set = 0,
        cur = 1,
        end = 2
    };

    /**
     * @class io_stream
     * @brief Sequential reader over an encoded payload
     * @ingroup sdk_io
     *
     * Codecs parse headers field by field through this interface. The
     * pipeline feeds them in-memory payloads; load_file() reads whole files
     * through the same interface.
     *
     * @code
     * auto stream = io_from_memory(bytes);
     * uint32 riff_size;
     * stream->seek(4, seek_origin::set);
     * if (!read_u32le(stream.get(), &riff_size)) {
     *     // truncated header
     * }
     * @endcode
     */
    class AUDIOCONV_SDK_EXPORT io_stream {
        public:
            virtual ~io_stream();

            /**
             * @brief Copy up to @p size_bytes into @p dst
             * @return Bytes actually read; 0 at the end of the stream
             */
            virtual size_t read(void* dst, size_t size_bytes) = 0;

            /**
             * @brief Move the read position
             * @return New position, or -1 if it would fall outside [0, size]
             */
            virtual int64 seek(int64 offset, seek_origin whence) = 0;

            [[nodiscard]] virtual int64 tell() const = 0;
            [[nodiscard]] virtual int64 get_size() const = 0;

            [[nodiscard]] int64 remaining() const;
    };

    /**
     * @defgroup io_endian Little-endian field readers
     * @ingroup sdk_io
     * All return false on a short read and leave the output untouched.
     * @{
     */
    AUDIOCONV_SDK_EXPORT bool read_u8(io_stream* stream, uint8* value);
    AUDIOCONV_SDK_EXPORT bool read_u16le(io_stream* stream, uint16* value);
    AUDIOCONV_SDK_EXPORT bool read_u32le(io_stream* stream, uint32* value);
    /// Four bytes, not NUL terminated
    AUDIOCONV_SDK_EXPORT bool read_fourcc(io_stream* stream, char tag[4]);
    /** @} */

    /// Everything from the current position to the end
    AUDIOCONV_SDK_EXPORT buffer<uint8> read_all(io_stream* stream);

    /**
     * @brief Reader over a borrowed block of memory
     * @note The memory must outlive the stream
     */
    AUDIOCONV_SDK_EXPORT std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);
    AUDIOCONV_SDK_EXPORT std::unique_ptr<io_stream> io_from_memory(const buffer<uint8>& bytes);

    /**
     * @brief Reader over a file opened in binary mode
     * @return nullptr if the file cannot be opened
     */
    AUDIOCONV_SDK_EXPORT std::unique_ptr<io_stream> io_from_file(const std::filesystem::path& path);
}

#endif // AUDIOCONV_SDK_IO_STREAM_HH

/*
 * Copyright (C) 2025
 *
 * This file is part of audioconv.
 *
 * audioconv is free software: you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * audioconv is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with audioconv.  If not, see <http://www.gnu.org/licenses/>.
 */
