#pragma once

#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <string>
#include <string_view>

namespace Utility
{
    /**
     * @brief Name of an enumerator declared with BOOST_DEFINE_ENUM_CLASS or BOOST_DESCRIBE_ENUM.
     */
    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue, std::string_view fallback = "INVALID_ENUM_VALUE")
    {
        char const* result = nullptr;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &enumValue](auto desc) {
            if (enumValue == desc.value)
                result = desc.name;
        });

        if (result == nullptr)
            return std::string{fallback};
        return result;
    }
}
