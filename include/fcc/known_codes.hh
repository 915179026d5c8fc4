/**
 * @file known_codes.hh
 * @brief Frequently used four-character codes
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <fcc/fourcc.hh>

namespace fcc::codes {
    // IFF container types
    inline constexpr fourcc FORM('F', 'O', 'R', 'M');
    inline constexpr fourcc LIST('L', 'I', 'S', 'T');
    inline constexpr fourcc CAT_('C', 'A', 'T', ' ');
    inline constexpr fourcc PROP('P', 'R', 'O', 'P');

    // RIFF container types
    inline constexpr fourcc RIFF('R', 'I', 'F', 'F');
    inline constexpr fourcc RIFX('R', 'I', 'F', 'X');
    inline constexpr fourcc RF64('R', 'F', '6', '4');

    // Format types
    inline constexpr fourcc WAVE('W', 'A', 'V', 'E');
    inline constexpr fourcc AVI_('A', 'V', 'I', ' ');
    inline constexpr fourcc AIFF('A', 'I', 'F', 'F');

    // Common chunks
    inline constexpr fourcc fmt_('f', 'm', 't', ' ');
    inline constexpr fourcc data('d', 'a', 't', 'a');
    inline constexpr fourcc JUNK('J', 'U', 'N', 'K');

    // Pixel formats
    inline constexpr fourcc RGBA('R', 'G', 'B', 'A');
    inline constexpr fourcc ARGB('A', 'R', 'G', 'B');
    inline constexpr fourcc YUY2('Y', 'U', 'Y', '2');
    inline constexpr fourcc NV12('N', 'V', '1', '2');
    inline constexpr fourcc I420('I', '4', '2', '0');

    // ISO BMFF boxes and sample entries
    inline constexpr fourcc ftyp('f', 't', 'y', 'p');
    inline constexpr fourcc moov('m', 'o', 'o', 'v');
    inline constexpr fourcc avc1('a', 'v', 'c', '1');
    inline constexpr fourcc hvc1('h', 'v', 'c', '1');
    inline constexpr fourcc mp4a('m', 'p', '4', 'a');
}
