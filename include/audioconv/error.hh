// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace audioconv {

/**
 * @brief Base exception class for all audioconv errors
 *
 * All audioconv-specific exceptions derive from this class, making it easy
 * to catch all audioconv errors with a single catch block.
 */
class audioconv_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief No codec is registered for the requested container
 *
 * Thrown when:
 * - The input or output container has no registry entry
 * - Format detection does not recognise a byte signature
 */
class unsupported_format_error : public audioconv_error {
public:
    using audioconv_error::audioconv_error;
};

/**
 * @brief Malformed or truncated input bytes
 *
 * Thrown when:
 * - A container tag is missing or wrong
 * - The header declares more data than the buffer holds
 * - The sample encoding is not supported by the codec
 */
class decode_error : public audioconv_error {
public:
    using audioconv_error::audioconv_error;
};

/**
 * @brief Internal fault while producing output bytes
 */
class encode_error : public audioconv_error {
public:
    using audioconv_error::audioconv_error;
};

/**
 * @brief Invalid option combination or out-of-range parameter
 *
 * Thrown when:
 * - A target channel count or sample rate is zero
 * - A bit depth is not one of 8, 16, 24, 32
 * - Trim or fade times are negative or inverted
 * - The target format exceeds the output codec's capabilities
 */
class validation_error : public audioconv_error {
public:
    using audioconv_error::audioconv_error;
};

/**
 * @brief Any other failure inside a processing stage
 */
class processing_error : public audioconv_error {
public:
    using audioconv_error::audioconv_error;
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
