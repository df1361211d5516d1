// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/codecs_registry.hh>
#include <audioconv/sdk/codec.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cctype>

namespace audioconv {

namespace {
    std::string normalize_extension(const std::string& ext) {
        std::string out;
        out.reserve(ext.size() + 1);
        if (ext.empty() || ext[0] != '.') {
            out.push_back('.');
        }
        for (char c : ext) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }
}

void codecs_registry::register_codec(std::shared_ptr<const codec> entry) {
    if (!entry) {
        THROW_RUNTIME("Attempt to register a null codec");
    }
    auto same_container = std::find_if(m_codecs.begin(), m_codecs.end(),
                                       [&](const std::shared_ptr<const codec>& c) {
                                           return c->get_container() == entry->get_container();
                                       });
    if (same_container != m_codecs.end()) {
        LOG_DEBUG("codecs_registry", "Replacing codec", (*same_container)->get_name(),
                  "with", entry->get_name());
        *same_container = std::move(entry);
        return;
    }
    LOG_DEBUG("codecs_registry", "Registered codec", entry->get_name());
    m_codecs.push_back(std::move(entry));
}

std::shared_ptr<const codec> codecs_registry::find(container_id container) const {
    for (const auto& c : m_codecs) {
        if (c->get_container() == container) {
            return c;
        }
    }
    return nullptr;
}

std::shared_ptr<const codec> codecs_registry::find_by_extension(const std::string& extension) const {
    const auto wanted = normalize_extension(extension);
    for (const auto& c : m_codecs) {
        for (const auto& ext : c->get_extensions()) {
            if (ext == wanted) {
                return c;
            }
        }
    }
    return nullptr;
}

std::vector<container_id> codecs_registry::supported_formats() const {
    std::vector<container_id> out;
    out.reserve(m_codecs.size());
    for (const auto& c : m_codecs) {
        out.push_back(c->get_container());
    }
    return out;
}

size_t codecs_registry::size() const {
    return m_codecs.size();
}

void codecs_registry::clear() {
    m_codecs.clear();
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
