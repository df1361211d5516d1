// This is copyrighted software. More information is at the end of this file.
#include <audioconv/codecs/register_codecs.hh>
#include <audioconv/sdk/codecs_registry.hh>

#include <audioconv/codecs/codec_wav.hh>
#include <audioconv/codecs/codec_placeholder.hh>

namespace audioconv {

void register_all_codecs(codecs_registry& registry) {
    // WAV - canonical container
    registry.register_codec(std::make_shared<codec_wav>());

    // FLAC and MP3 share the WAV byte layout until real encoders exist
    registry.register_codec(codec_placeholder::create_flac());
    registry.register_codec(codec_placeholder::create_mp3());
}

std::shared_ptr<codecs_registry> create_registry_with_all_codecs() {
    auto registry = std::make_shared<codecs_registry>();
    register_all_codecs(*registry);
    return registry;
}

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
