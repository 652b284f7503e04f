#include "Transport.hpp"

namespace http
{

std::string ResponseHead::headerValue(const std::string& name) const
{
    for (const auto& h : headers)
    {
        if (iequals(h.name, name))
            return h.value;
    }
    return {};
}

} // namespace http
