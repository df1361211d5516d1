/**
 * @file buffer.hh
 * @brief Lightweight owning buffer for audio data
 * @ingroup sdk
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <type_traits>
#include <stdexcept>
#include <utility>

namespace audioconv {
    /**
     * @class buffer
     * @brief RAII buffer container for sample and byte data
     * @tparam T Element type (must be trivially copyable)
     * @ingroup sdk
     *
     * A lightweight alternative to std::vector used for every sample set
     * and byte payload that flows through the conversion pipeline.
     *
     * - **No implicit copies**: the buffer is move-only; use clone() when
     *   an independent copy is really wanted. A stage that receives a
     *   buffer by value therefore owns it exclusively.
     * - **Zero-initialization**: all elements start as T{}
     * - **No capacity tracking**: size equals capacity
     *
     * @code
     * buffer<float> samples(1024);
     * for (auto& s : samples) {
     *     s = generate_sample();
     * }
     * buffer<float> next_stage = std::move(samples);
     * @endcode
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        /**
         * @brief Construct buffer with specified size
         * @param size Number of elements
         *
         * Allocates memory and zero-initializes all elements.
         */
        explicit buffer(std::size_t size = 0)
            : m_data(std::make_unique<T[]>(size)), m_size(size) {
            std::fill_n(m_data.get(), m_size, T{});
        }

        /**
         * @brief Construct buffer from a list of values
         */
        buffer(std::initializer_list<T> values)
            : m_data(std::make_unique<T[]>(values.size())), m_size(values.size()) {
            std::copy(values.begin(), values.end(), m_data.get());
        }

        buffer(buffer&& other) noexcept
            : m_data(std::move(other.m_data)), m_size(std::exchange(other.m_size, 0)) {
        }

        buffer& operator=(buffer&& other) noexcept {
            m_data = std::move(other.m_data);
            m_size = std::exchange(other.m_size, 0);
            return *this;
        }

        buffer(const buffer&) = delete;
        buffer& operator=(const buffer&) = delete;

        /**
         * @brief Make an independent deep copy
         */
        [[nodiscard]] buffer clone() const {
            buffer copy(m_size);
            if (m_size > 0) {
                std::memcpy(copy.m_data.get(), m_data.get(), sizeof(T) * m_size);
            }
            return copy;
        }

        /**
         * @brief Copy a sub-range [first, last) into a new buffer
         *
         * Bounds are clamped to the buffer; an empty or inverted range
         * yields an empty buffer.
         */
        [[nodiscard]] buffer slice(std::size_t first, std::size_t last) const {
            last = std::min(last, m_size);
            if (first >= last) {
                return buffer(0);
            }
            buffer out(last - first);
            std::memcpy(out.m_data.get(), m_data.get() + first, sizeof(T) * (last - first));
            return out;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return m_size;
        }

        [[nodiscard]] bool empty() const noexcept {
            return m_size == 0;
        }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @brief Bounds-checked element access
         * @throws std::out_of_range if pos >= size()
         */
        T& at(std::size_t pos) {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        const T& at(std::size_t pos) const {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        /**
         * @brief Reset buffer to new size
         *
         * Discards all existing data and allocates a new zero-initialized
         * buffer.
         */
        void reset(std::size_t new_size) {
            m_data = std::make_unique<T[]>(new_size);
            m_size = new_size;
            std::fill_n(m_data.get(), m_size, T{});
        }

        /**
         * @brief Resize buffer preserving data
         *
         * Preserves existing elements up to min(old_size, new_size).
         * New elements are zero-initialized.
         */
        void resize(std::size_t new_size) {
            auto new_data = std::make_unique<T[]>(new_size);
            if (m_size > 0 && new_size > 0) {
                std::memcpy(new_data.get(), m_data.get(), sizeof(T) * std::min(new_size, m_size));
            }
            if (new_size > m_size) {
                std::fill(new_data.get() + m_size, new_data.get() + new_size, T{});
            }
            m_data.swap(new_data);
            m_size = new_size;
        }

        void swap(buffer& other) noexcept {
            m_data.swap(other.m_data);
            std::swap(m_size, other.m_size);
        }

        /**
         * @warning No bounds checking
         */
        T& operator[](std::size_t pos) noexcept { return m_data[pos]; }
        const T& operator[](std::size_t pos) const noexcept { return m_data[pos]; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + size(); }
        const T* begin() const noexcept { return data(); }
        const T* end() const noexcept { return data() + size(); }

    private:
        std::unique_ptr<T[]> m_data;  ///< Buffer data
        std::size_t m_size;           ///< Number of elements
    };
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
