#pragma once

#include <string>
#include <string_view>

namespace ChannelKey
{
    /**
     * Escapes every byte that is not printable (or is whitespace) as \xNN,
     * so caller supplied identifiers can be logged verbatim.
     */
    std::string makePrintableString(std::string_view input);
}
