#include <tokenpp/service.hpp>

namespace ChannelKey::Token
{
    namespace
    {
        template <typename... Alternatives>
        std::optional<std::string_view> findServiceName(std::uint16_t serviceType, std::variant<Alternatives...> const*)
        {
            std::optional<std::string_view> name;
            (void)((Alternatives::serviceType == serviceType ? (name = Alternatives::serviceName, true) : false) ||
                   ...);
            return name;
        }
    }
    //#####################################################################################################################
    std::uint16_t serviceTypeOf(Service const& service)
    {
        return std::visit(
            [](auto const& alternative) {
                return alternative.getServiceType();
            },
            service);
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string packService(Service const& service)
    {
        return std::visit(
            [](auto const& alternative) {
                return alternative.pack();
            },
            service);
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::optional<std::string_view> serviceTypeName(std::uint16_t serviceType)
    {
        return findServiceName(serviceType, static_cast<Service const*>(nullptr));
    }
    //#####################################################################################################################
}
