/**
 * @file codecs_registry.hh
 * @brief Lookup table from container to codec
 * @ingroup sdk_codecs
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <audioconv/sdk/export_audioconv_sdk.h>
#include <audioconv/sdk/audio_format.hh>
#include <memory>
#include <string>
#include <vector>

namespace audioconv {

    class codec;

    /**
     * @class codecs_registry
     * @brief Registry of available codecs, keyed by container
     * @ingroup sdk_codecs
     *
     * The registry owns one shared instance per codec. It is populated
     * once at startup and read-only afterwards; the conversion pipeline
     * receives it as a `std::shared_ptr<const codecs_registry>`.
     *
     * ## Usage Example
     *
     * @code
     * auto registry = std::make_shared<codecs_registry>();
     * registry->register_codec(std::make_shared<codec_wav>());
     *
     * auto wav = registry->find(container_id::wav);
     * auto same = registry->find_by_extension(".WAV");
     * @endcode
     *
     * ## Thread Safety
     *
     * - register_codec() and clear() are NOT thread-safe
     * - All const lookups are safe to call concurrently
     *
     * @see codec, register_all_codecs()
     */
    class AUDIOCONV_SDK_EXPORT codecs_registry {
    public:
        /**
         * @brief Register a codec
         * @param entry Codec instance, must not be null
         *
         * A later registration for the same container replaces the
         * earlier one.
         *
         * @note Not thread-safe - configure at startup
         */
        void register_codec(std::shared_ptr<const codec> entry);

        /**
         * @brief Codec for a container
         * @return The codec, or nullptr if none is registered
         */
        [[nodiscard]] std::shared_ptr<const codec> find(container_id container) const;

        /**
         * @brief Codec for a file extension
         * @param extension With or without leading dot, any case
         * @return The codec, or nullptr if no codec lists the extension
         */
        [[nodiscard]] std::shared_ptr<const codec> find_by_extension(const std::string& extension) const;

        /**
         * @brief Containers with a registered codec, in registration order
         */
        [[nodiscard]] std::vector<container_id> supported_formats() const;

        [[nodiscard]] size_t size() const;

        /**
         * @brief Remove all registered codecs
         *
         * @note Not thread-safe - don't call while lookups are running
         */
        void clear();

    private:
        std::vector<std::shared_ptr<const codec>> m_codecs;
    };

} // namespace audioconv

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
