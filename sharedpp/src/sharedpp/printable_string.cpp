#include <sharedpp/printable_string.hpp>

#include <algorithm>
#include <cctype>

namespace ChannelKey
{
    std::string makePrintableString(std::string_view input)
    {
        std::string result;
        result.reserve(input.size());
        std::for_each(input.begin(), input.end(), [&result](char c) {
            const auto byte = static_cast<unsigned char>(c);
            if (std::isprint(byte) && !std::isspace(byte))
                result.push_back(c);
            else
            {
                constexpr auto hexDigits = "0123456789ABCDEF";

                result.push_back('\\');
                result.push_back('x');
                result.push_back(hexDigits[byte >> 4]);
                result.push_back(hexDigits[byte & 0xF]);
            }
        });
        return result;
    }
}
