// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/io_stream.hh>
#include <audioconv/sdk/endian.hh>

#include <algorithm>
#include <cstring>
#include <fstream>

namespace audioconv {
    namespace {
        // Absolute position for a seek request, or -1 outside [0, size].
        int64 resolve_offset(int64 offset, seek_origin whence, int64 position, int64 size) {
            int64 base = 0;
            if (whence == seek_origin::cur) {
                base = position;
            } else if (whence == seek_origin::end) {
                base = size;
            }
            const int64 target = base + offset;
            return (target < 0 || target > size) ? -1 : target;
        }

        class memory_reader : public io_stream {
            public:
                memory_reader(const uint8* data, size_t size)
                    : m_data(data), m_size(static_cast<int64>(size)) {
                }

                size_t read(void* dst, size_t size_bytes) override {
                    const auto n = static_cast<size_t>(std::min<int64>(static_cast<int64>(size_bytes),
                                                                       m_size - m_pos));
                    if (n > 0) {
                        std::memcpy(dst, m_data + m_pos, n);
                        m_pos += static_cast<int64>(n);
                    }
                    return n;
                }

                int64 seek(int64 offset, seek_origin whence) override {
                    const auto target = resolve_offset(offset, whence, m_pos, m_size);
                    if (target >= 0) {
                        m_pos = target;
                    }
                    return target;
                }

                int64 tell() const override {
                    return m_pos;
                }

                int64 get_size() const override {
                    return m_size;
                }

            private:
                const uint8* m_data;
                int64 m_size;
                int64 m_pos = 0;
        };

        class file_reader : public io_stream {
            public:
                file_reader(std::ifstream file, int64 size)
                    : m_file(std::move(file)), m_size(size) {
                }

                size_t read(void* dst, size_t size_bytes) override {
                    m_file.read(static_cast<char*>(dst), static_cast<std::streamsize>(size_bytes));
                    const auto n = m_file.gcount();
                    // A short read sets eof/fail; later seeks must still work.
                    m_file.clear();
                    return static_cast<size_t>(n);
                }

                int64 seek(int64 offset, seek_origin whence) override {
                    const auto target = resolve_offset(offset, whence, tell(), m_size);
                    if (target < 0 || !m_file.seekg(target, std::ios::beg)) {
                        m_file.clear();
                        return -1;
                    }
                    return target;
                }

                int64 tell() const override {
                    return static_cast<int64>(m_file.tellg());
                }

                int64 get_size() const override {
                    return m_size;
                }

            private:
                mutable std::ifstream m_file;
                int64 m_size;
        };
    }

    io_stream::~io_stream() = default;

    int64 io_stream::remaining() const {
        return std::max<int64>(0, get_size() - tell());
    }

    bool read_u8(io_stream* stream, uint8* value) {
        return stream->read(value, 1) == 1;
    }

    bool read_u16le(io_stream* stream, uint16* value) {
        uint16 raw;
        if (stream->read(&raw, sizeof(raw)) != sizeof(raw)) {
            return false;
        }
        *value = swap16le(raw);
        return true;
    }

    bool read_u32le(io_stream* stream, uint32* value) {
        uint32 raw;
        if (stream->read(&raw, sizeof(raw)) != sizeof(raw)) {
            return false;
        }
        *value = swap32le(raw);
        return true;
    }

    bool read_fourcc(io_stream* stream, char tag[4]) {
        return stream->read(tag, 4) == 4;
    }

    buffer<uint8> read_all(io_stream* stream) {
        buffer<uint8> out(static_cast<size_t>(stream->remaining()));
        const auto got = out.empty() ? 0 : stream->read(out.data(), out.size());
        if (got < out.size()) {
            return out.slice(0, got);
        }
        return out;
    }

    std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes) {
        return std::make_unique<memory_reader>(static_cast<const uint8*>(mem), size_bytes);
    }

    std::unique_ptr<io_stream> io_from_memory(const buffer<uint8>& bytes) {
        return io_from_memory(bytes.data(), bytes.size());
    }

    std::unique_ptr<io_stream> io_from_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            return nullptr;
        }
        const auto size = static_cast<int64>(file.tellg());
        file.seekg(0, std::ios::beg);
        if (size < 0 || !file) {
            return nullptr;
        }
        return std::make_unique<file_reader>(std::move(file), size);
    }
}

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
