// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/stage_outcome.hh>
#include <exception>

namespace audioconv {
    const char* error_kind_name(error_kind kind) {
        switch (kind) {
            case error_kind::none: return "none";
            case error_kind::unsupported_format: return "unsupported_format";
            case error_kind::decode_failure: return "decode_failure";
            case error_kind::encode_failure: return "encode_failure";
            case error_kind::validation_failure: return "validation_failure";
            case error_kind::generic_processing_failure: return "generic_processing_failure";
        }
        return "unknown";
    }

    conversion_error classify_current_exception(const std::string& stage) {
        try {
            throw;
        } catch (const unsupported_format_error& e) {
            return {error_kind::unsupported_format, stage, e.what()};
        } catch (const decode_error& e) {
            return {error_kind::decode_failure, stage, e.what()};
        } catch (const encode_error& e) {
            return {error_kind::encode_failure, stage, e.what()};
        } catch (const validation_error& e) {
            return {error_kind::validation_failure, stage, e.what()};
        } catch (const std::exception& e) {
            return {error_kind::generic_processing_failure, stage, e.what()};
        } catch (...) {
            return {error_kind::generic_processing_failure, stage, "unknown exception"};
        }
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
