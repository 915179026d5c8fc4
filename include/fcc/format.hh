/**
 * @file format.hh
 * @brief Configurable rendering of fourcc values
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <string>
#include <fcc/export_fcc.h>
#include <fcc/fourcc.hh>

namespace fcc {

    /**
     * @enum render_style
     * @brief How a fourcc is turned into text
     */
    enum class render_style {
        plain,   ///< The 4 raw bytes: RGBA
        quoted,  ///< The 4 raw bytes inside quotes: 'RGBA'
        escaped, ///< Quoted, bytes outside 0x20..0x7E written as \xNN: 'AB\x01\x0a'
        hex      ///< Big-endian integer value: 0x52474241
    };

    /**
     * @struct format_options
     * @brief Configuration options for format_fourcc()
     */
    struct format_options {
        /**
         * @brief Output style
         */
        render_style style = render_style::plain;

        /**
         * @brief Use A-F instead of a-f
         *
         * Applies to the hex style and to \x escapes.
         */
        bool uppercase_hex = false;

        /**
         * @brief Quote character for the quoted and escaped styles
         */
        char quote = '\'';
    };

    /**
     * @brief Render a fourcc as text
     * @param f Value to render
     * @param opts Rendering options
     * @return Rendered text
     *
     * Defined for every value, including ones that are not valid().
     */
    FCC_EXPORT std::string format_fourcc(const fourcc& f, const format_options& opts = {});

} // namespace fcc
