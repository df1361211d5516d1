/**
 * @file stage_outcome.hh
 * @brief Value-or-error result threaded between pipeline stages
 * @ingroup sdk
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_STAGE_OUTCOME_HH
#define AUDIOCONV_SDK_STAGE_OUTCOME_HH

#include <audioconv/error.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>
#include <string>
#include <utility>
#include <variant>

namespace audioconv {
    /**
     * @enum error_kind
     * @brief Classification of a failed conversion
     *
     * One value per exception type in error.hh. Anything that is not an
     * audioconv_error is reported as generic_processing_failure.
     */
    enum class error_kind {
        none = 0,
        unsupported_format,
        decode_failure,
        encode_failure,
        validation_failure,
        generic_processing_failure
    };

    AUDIOCONV_SDK_EXPORT const char* error_kind_name(error_kind kind);

    /**
     * @struct conversion_error
     * @brief A failure together with the stage that produced it
     */
    struct conversion_error {
        error_kind kind = error_kind::generic_processing_failure;
        std::string stage;
        std::string message;
    };

    /**
     * @class stage_outcome
     * @brief Either the value a stage produced or the error that stopped it
     *
     * @code
     * stage_outcome<pcm_data> decoded = run_stage("decode", [&] {
     *     return codec->decode(bytes).samples;
     * });
     * if (!decoded) {
     *     report(decoded.error());
     * }
     * @endcode
     */
    template<typename T>
    class stage_outcome {
        public:
            stage_outcome(T value)
                : m_state(std::in_place_index<0>, std::move(value)) {
            }

            stage_outcome(conversion_error error)
                : m_state(std::in_place_index<1>, std::move(error)) {
            }

            [[nodiscard]] bool has_value() const noexcept {
                return m_state.index() == 0;
            }

            explicit operator bool() const noexcept {
                return has_value();
            }

            T& value() & {
                return std::get<0>(m_state);
            }

            T&& value() && {
                return std::get<0>(std::move(m_state));
            }

            [[nodiscard]] const conversion_error& error() const {
                return std::get<1>(m_state);
            }

            /**
             * @brief Feed the value into the next stage, or forward the error
             *
             * @p fn must return a stage_outcome. It is not called if this
             * outcome already carries an error.
             */
            template<typename Fn>
            auto and_then(Fn&& fn) && -> decltype(fn(std::declval<T>())) {
                if (!has_value()) {
                    return std::get<1>(std::move(m_state));
                }
                return fn(std::get<0>(std::move(m_state)));
            }

        private:
            std::variant<T, conversion_error> m_state;
    };

    /**
     * @brief Map an exception currently being handled to an error kind
     *
     * Must be called from inside a catch block.
     */
    AUDIOCONV_SDK_EXPORT conversion_error classify_current_exception(const std::string& stage);

    /**
     * @brief Run one stage, converting any exception into a conversion_error
     */
    template<typename Fn>
    auto run_stage(const std::string& stage, Fn&& fn) -> stage_outcome<decltype(fn())> {
        try {
            return fn();
        } catch (...) {
            return classify_current_exception(stage);
        }
    }
}

#endif // AUDIOCONV_SDK_STAGE_OUTCOME_HH

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
