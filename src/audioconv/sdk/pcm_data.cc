// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/pcm_data.hh>
#include <audioconv/error.hh>
#include <string>

namespace audioconv {
    pcm_data::pcm_data(channels_t channels, std::size_t frames) {
        m_channels.reserve(channels);
        for (channels_t ch = 0; ch < channels; ++ch) {
            m_channels.emplace_back(frames);
        }
    }

    pcm_data::pcm_data(std::vector<buffer<float>> channels)
        : m_channels(std::move(channels)) {
        for (std::size_t ch = 1; ch < m_channels.size(); ++ch) {
            if (m_channels[ch].size() != m_channels[0].size()) {
                throw validation_error("Channel " + std::to_string(ch) + " has " +
                                       std::to_string(m_channels[ch].size()) + " samples, expected " +
                                       std::to_string(m_channels[0].size()));
            }
        }
    }

    channels_t pcm_data::channel_count() const noexcept {
        return static_cast<channels_t>(m_channels.size());
    }

    std::size_t pcm_data::frames() const noexcept {
        return m_channels.empty() ? 0 : m_channels[0].size();
    }

    bool pcm_data::empty() const noexcept {
        return frames() == 0;
    }

    buffer<float>& pcm_data::channel(std::size_t index) {
        return m_channels.at(index);
    }

    const buffer<float>& pcm_data::channel(std::size_t index) const {
        return m_channels.at(index);
    }

    pcm_data pcm_data::clone() const {
        std::vector<buffer<float>> copies;
        copies.reserve(m_channels.size());
        for (const auto& ch : m_channels) {
            copies.push_back(ch.clone());
        }
        return pcm_data(std::move(copies));
    }

    std::vector<buffer<float>> pcm_data::release() && {
        return std::move(m_channels);
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
