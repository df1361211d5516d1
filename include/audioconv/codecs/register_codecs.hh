// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_CODECS_REGISTER_CODECS_HH
#define AUDIOCONV_CODECS_REGISTER_CODECS_HH

#include <audioconv/codecs/export_audioconv_codecs.h>
#include <memory>

namespace audioconv {
    class codecs_registry;

    /**
     * Register all available codecs with the provided registry.
     *
     * WAV is registered with a real encoder and decoder. FLAC and MP3 are
     * registered as placeholders that read and write the WAV layout.
     *
     * @param registry The registry to register codecs with
     */
    AUDIOCONV_CODECS_EXPORT void register_all_codecs(codecs_registry& registry);

    /**
     * Create a new registry with all codecs pre-registered.
     *
     * @return A shared pointer to a registry with all codecs registered
     */
    AUDIOCONV_CODECS_EXPORT std::shared_ptr<codecs_registry> create_registry_with_all_codecs();
}

#endif // AUDIOCONV_CODECS_REGISTER_CODECS_HH

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
